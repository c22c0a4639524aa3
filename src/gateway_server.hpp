#ifndef GATEWAY_GATEWAY_SERVER_HPP
#define GATEWAY_GATEWAY_SERVER_HPP

#include "config.hpp"
#include "http_message.hpp"
#include "request_reader.hpp"
#include "route_table.hpp"
#include "socket.hpp"
#include "upstream_client.hpp"
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <string>

namespace gateway {

class GatewayServer {
public:
    explicit GatewayServer(const GatewayConfig& config);
    ~GatewayServer();

    GatewayServer(const GatewayServer&) = delete;
    GatewayServer& operator=(const GatewayServer&) = delete;

    // Binds the listening socket; throws std::runtime_error on failure.
    void listen();
    // Accept loop; one thread per connection. Returns after stop() once
    // every in-flight connection has finished.
    void run();
    void start();
    // Safe to call from a signal handler or another thread.
    void stop();

    // Bound port, valid after listen(). Differs from the configured one
    // only when port 0 was requested.
    int port() const { return port_; }

    struct Stats {
        size_t totalRequests;
        size_t proxiedRequests;
        size_t staticRequests;
        size_t rejectedRequests;
        size_t upstreamErrors;
        size_t internalErrors;

        Stats() : totalRequests(0), proxiedRequests(0), staticRequests(0),
                  rejectedRequests(0), upstreamErrors(0), internalErrors(0) {}
    };

    Stats getStats() const;

private:
    GatewayConfig config_;
    PathRouter router_;
    UpstreamClient upstream_;
    RequestLimits limits_;
    Socket serverSocket_;
    int port_;
    std::atomic<bool> isRunning_;

    std::mutex connectionsMutex_;
    std::condition_variable connectionsDone_;
    size_t activeConnections_;

    mutable std::mutex statsMutex_;
    Stats stats_;

    void handleClient(int clientSocket);

    // Routes one parsed request and writes the response. Returns the
    // status sent to the client and adds the bytes written to bytesSent.
    int dispatch(const HttpRequest& request, int clientFd, size_t& bytesSent, std::string& target);

    size_t sendResponse(int clientFd, const HttpResponse& response, bool headOnly);
    void lingeringClose(int clientFd);
    void accessLog(const HttpRequest& request, int status, size_t bytes, const std::string& target);

    enum class Counter { Total, Proxied, Static, Rejected, UpstreamError, InternalError };
    void updateStats(Counter counter);
};

} // namespace gateway

#endif // GATEWAY_GATEWAY_SERVER_HPP
