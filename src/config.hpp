#ifndef GATEWAY_CONFIG_HPP
#define GATEWAY_CONFIG_HPP

#include "logger.hpp"
#include "route_table.hpp"
#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace gateway {

class ConfigError : public std::runtime_error {
public:
    ConfigError(const std::string& source, int line, const std::string& message)
        : std::runtime_error(source + ":" + std::to_string(line) + ": " + message),
          source_(source), line_(line) {}

    const std::string& source() const { return source_; }
    int line() const { return line_; }

private:
    std::string source_;
    int line_;
};

struct GatewayConfig {
    std::string listenAddress;
    int listenPort;
    std::vector<std::string> serverNames;
    size_t maxBodySize;
    size_t maxHeaderSize;
    int clientTimeoutMs;
    int upstreamConnectTimeoutMs;
    int upstreamReadTimeoutMs;
    std::string errorLogPath;
    LogLevel errorLogLevel;
    std::string accessLogPath;
    bool accessLogEnabled;
    RuleSet rules;
    std::string source;

    GatewayConfig();
};

// The Foodgram routing table: backend on backend:7000, docs, media and
// the frontend bundle served from /static/.
GatewayConfig defaultConfig();

GatewayConfig loadConfigFile(const std::string& path);
GatewayConfig parseConfig(const std::string& text, const std::string& sourceName);

// "10M" -> 10485760, "512k", plain bytes. Returns false on bad input.
bool parseSize(const std::string& text, size_t& out);
// "60s", "500ms", "2m", plain seconds. Returns false on bad input.
bool parseDurationMs(const std::string& text, int& out);

} // namespace gateway

#endif // GATEWAY_CONFIG_HPP
