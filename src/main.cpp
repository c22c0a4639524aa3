#include "config.hpp"
#include "gateway_server.hpp"
#include "logger.hpp"
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>

namespace {

gateway::GatewayServer* g_server = nullptr;

void signalHandler(int signal) {
    if (g_server && (signal == SIGINT || signal == SIGTERM)) {
        g_server->stop();
    }
}

void printUsage(const char* argv0) {
    std::cerr
        << "Usage:\n"
        << "  " << argv0 << " [--config PATH] [--port N] [--check]\n\n"
        << "  --config PATH  load locations from an nginx-style file instead of the\n"
        << "                 built-in Foodgram routing table\n"
        << "  --port N       override the listen port (default 80)\n"
        << "  --check        validate the configuration and exit\n";
}

bool parsePort(const std::string& text, int& out) {
    if (text.empty() || text.size() > 5 || text.find_first_not_of("0123456789") != std::string::npos) {
        return false;
    }
    out = std::stoi(text);
    return out <= 65535;
}

} // namespace

int main(int argc, char* argv[]) {
    std::string configPath;
    int portOverride = -1;
    bool checkOnly = false;

    // Parse command line arguments
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        } else if (arg == "--port" && i + 1 < argc) {
            if (!parsePort(argv[++i], portOverride)) {
                std::cerr << "Invalid port: " << argv[i] << std::endl;
                return 1;
            }
        } else if (arg == "--check") {
            checkOnly = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else {
            printUsage(argv[0]);
            return 1;
        }
    }

    try {
        gateway::GatewayConfig config = configPath.empty()
            ? gateway::defaultConfig()
            : gateway::loadConfigFile(configPath);
        if (portOverride >= 0) {
            config.listenPort = portOverride;
        }

        if (checkOnly) {
            std::cout << "configuration " << config.source << " is ok ("
                      << config.rules.size() << " locations)" << std::endl;
            for (const gateway::Rule& rule : config.rules.rules()) {
                std::cout << "  " << rule.pathPrefix << " -> " << rule.describe() << std::endl;
            }
            return 0;
        }

        gateway::Logger::setLevel(config.errorLogLevel);
        gateway::Logger::openErrorLog(config.errorLogPath);
        if (!config.accessLogEnabled) {
            gateway::Logger::disableAccessLog();
        } else if (!config.accessLogPath.empty()) {
            gateway::Logger::openAccessLog(config.accessLogPath);
        }

        gateway::GatewayServer server(config);
        g_server = &server;

        // Set up signal handlers for graceful shutdown
        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);
        std::signal(SIGPIPE, SIG_IGN);

        server.start();
        g_server = nullptr;
        gateway::Logger::close();

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
