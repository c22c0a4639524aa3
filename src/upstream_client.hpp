#ifndef GATEWAY_UPSTREAM_CLIENT_HPP
#define GATEWAY_UPSTREAM_CLIENT_HPP

#include "http_message.hpp"
#include "route_table.hpp"
#include <cstddef>
#include <string>

namespace gateway {

struct UpstreamResult {
    bool responded;         // at least one response byte reached the client
    int statusCode;         // upstream status, or the error status to send
    size_t bytesRelayed;
    std::string error;

    UpstreamResult() : responded(false), statusCode(0), bytesRelayed(0) {}
};

// Replaces the matched location prefix with the upstream prefix and
// re-encodes the result; the query string is carried over.
std::string rewriteUpstreamUri(const Rule& rule, const HttpRequest& request);

// Expands $host, $http_host, $remote_addr, $scheme, $request_uri and
// $proxy_add_x_forwarded_for in a proxy_set_header value.
std::string expandProxyVariables(const std::string& value, const HttpRequest& request);

// Returns false and the offending name if value uses an unknown variable.
bool checkProxyVariables(const std::string& value, std::string& unknown);

// Request text sent upstream: HTTP/1.0, Host preserved, hop-by-hop headers
// dropped, body with an explicit Content-Length, Connection: close.
std::string buildUpstreamRequest(const Rule& rule, const HttpRequest& request);

class UpstreamClient {
public:
    UpstreamClient(int connectTimeoutMs, int readTimeoutMs);

    // Opens a fresh connection to the rule's upstream, sends the request
    // and streams the response to clientFd unmodified. Nothing is written
    // to the client when the result is not "responded"; the caller then
    // answers with result.statusCode (502 or 504).
    UpstreamResult forward(const Rule& rule, const HttpRequest& request, int clientFd) const;

private:
    int connectTimeoutMs_;
    int readTimeoutMs_;
};

} // namespace gateway

#endif // GATEWAY_UPSTREAM_CLIENT_HPP
