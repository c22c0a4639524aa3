#include "gateway_server.hpp"
#include "logger.hpp"
#include "static_handler.hpp"
#include <poll.h>
#include <sys/socket.h>
#include <cerrno>
#include <chrono>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <thread>

namespace gateway {

namespace {

const int kAcceptPollMs = 200;
const int kLingerReadMs = 500;
const int kLingerTotalMs = 5000;

// Decrements the in-flight counter when a connection thread ends.
class ConnectionGuard {
public:
    ConnectionGuard(std::mutex& mutex, std::condition_variable& done, size_t& active)
        : mutex_(mutex), done_(done), active_(active) {}
    ~ConnectionGuard() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (--active_ == 0) {
            done_.notify_all();
        }
    }

    ConnectionGuard(const ConnectionGuard&) = delete;
    ConnectionGuard& operator=(const ConnectionGuard&) = delete;

private:
    std::mutex& mutex_;
    std::condition_variable& done_;
    size_t& active_;
};

std::string quoted(const std::string* value) {
    return "\"" + (value && !value->empty() ? *value : std::string("-")) + "\"";
}

} // namespace

GatewayServer::GatewayServer(const GatewayConfig& config)
    : config_(config),
      router_(config.rules),
      upstream_(config.upstreamConnectTimeoutMs, config.upstreamReadTimeoutMs),
      port_(config.listenPort),
      isRunning_(false),
      activeConnections_(0) {
    limits_.maxBodySize = config.maxBodySize;
    limits_.maxHeaderSize = config.maxHeaderSize;
    if (!router_.ruleSet().hasCatchAll()) {
        logWarn("no catch-all \"/\" location in " + config.source +
                "; unmatched paths will fail with 500");
    }
}

GatewayServer::~GatewayServer() {
    stop();
}

void GatewayServer::listen() {
    serverSocket_ = listenOn(config_.listenAddress, config_.listenPort, 128);
    port_ = localPort(serverSocket_.get());
    isRunning_ = true;
    logInfo("Gateway listening on port " + std::to_string(port_) + " with " +
            std::to_string(router_.ruleSet().size()) + " locations from " + config_.source);
    for (const Rule& rule : router_.ruleSet().rules()) {
        logDebug("  location " + rule.pathPrefix + " -> " + rule.describe());
    }
}

void GatewayServer::run() {
    if (!serverSocket_.valid()) {
        throw std::runtime_error("run() called before listen()");
    }

    while (isRunning_) {
        pollfd pfd{};
        pfd.fd = serverSocket_.get();
        pfd.events = POLLIN;
        int ready = ::poll(&pfd, 1, kAcceptPollMs);
        if (ready < 0) {
            if (errno == EINTR) continue;
            logError(errnoMessage("poll"));
            break;
        }
        if (ready == 0) {
            continue;
        }

        sockaddr_storage clientAddr;
        socklen_t clientLen = sizeof(clientAddr);
        int clientSocket = ::accept(serverSocket_.get(), reinterpret_cast<sockaddr*>(&clientAddr), &clientLen);
        if (clientSocket < 0) {
            if (isRunning_ && errno != EINTR && errno != EAGAIN) {
                logWarn(errnoMessage("Failed to accept connection"));
            }
            continue;
        }

        {
            std::lock_guard<std::mutex> lock(connectionsMutex_);
            ++activeConnections_;
        }
        try {
            // Handle each client in a separate thread
            std::thread(&GatewayServer::handleClient, this, clientSocket).detach();
        } catch (const std::system_error& e) {
            logError(std::string("Failed to start connection thread: ") + e.what());
            ::close(clientSocket);
            std::lock_guard<std::mutex> lock(connectionsMutex_);
            --activeConnections_;
        }
    }

    std::unique_lock<std::mutex> lock(connectionsMutex_);
    connectionsDone_.wait(lock, [this] { return activeConnections_ == 0; });
    lock.unlock();
    serverSocket_.close();
    logInfo("Gateway stopped");
}

void GatewayServer::start() {
    listen();
    run();
}

void GatewayServer::stop() {
    isRunning_ = false;
}

void GatewayServer::handleClient(int clientSocket) {
    ConnectionGuard guard(connectionsMutex_, connectionsDone_, activeConnections_);
    Socket client(clientSocket);

    HttpRequest request;
    try {
        setTimeouts(client.get(), config_.clientTimeoutMs);
        if (!readRequest(client.get(), limits_, request)) {
            return;
        }
    } catch (const HttpError& e) {
        updateStats(Counter::Total);
        updateStats(Counter::Rejected);
        logWarn("Rejected request from " + peerAddress(client.get()) + ": " + e.what());
        HttpResponse response = makeErrorResponse(e.status(), e.status() == 408 ? "" : e.what());
        size_t bytes = sendResponse(client.get(), response, false);
        request.remoteAddress = peerAddress(client.get());
        accessLog(request, e.status(), bytes, "-");
        lingeringClose(client.get());
        return;
    } catch (const std::exception& e) {
        logError("Error reading request: " + std::string(e.what()));
        return;
    }

    updateStats(Counter::Total);
    size_t bytesSent = 0;
    std::string target = "-";
    int status = 0;
    try {
        status = dispatch(request, client.get(), bytesSent, target);
    } catch (const std::exception& e) {
        logError("Error handling " + request.method + " " + request.target + ": " + e.what());
        updateStats(Counter::InternalError);
        if (bytesSent == 0) {
            status = 500;
            bytesSent += sendResponse(client.get(), makeErrorResponse(500, ""), request.method == "HEAD");
        }
    }
    accessLog(request, status, bytesSent, target);
}

int GatewayServer::dispatch(const HttpRequest& request, int clientFd, size_t& bytesSent, std::string& target) {
    bool headOnly = request.method == "HEAD";

    std::optional<std::string> redirect = router_.redirectFor(request.path);
    if (redirect) {
        std::string location = encodePath(*redirect);
        if (!request.query.empty()) {
            location += "?" + request.query;
        }
        bytesSent += sendResponse(clientFd, makeRedirect(301, location), headOnly);
        return 301;
    }

    const Rule* rule = nullptr;
    try {
        rule = &router_.route(request.path);
    } catch (const RouteNotFound& e) {
        logError(std::string(e.what()) + " (configuration has no catch-all location)");
        updateStats(Counter::InternalError);
        bytesSent += sendResponse(clientFd, makeErrorResponse(500, ""), headOnly);
        return 500;
    }
    target = rule->describe();

    if (rule->kind == RuleKind::Proxy) {
        updateStats(Counter::Proxied);
        UpstreamResult result = upstream_.forward(*rule, request, clientFd);
        bytesSent += result.bytesRelayed;
        if (result.responded) {
            return result.statusCode;
        }
        updateStats(Counter::UpstreamError);
        logError(result.error + " while proxying " + request.method + " " + request.target);
        bytesSent += sendResponse(clientFd, makeErrorResponse(result.statusCode, ""), headOnly);
        return result.statusCode;
    }

    updateStats(Counter::Static);
    HttpResponse response = serveStatic(*rule, request);
    bytesSent += sendResponse(clientFd, response, headOnly);
    return response.statusCode;
}

size_t GatewayServer::sendResponse(int clientFd, const HttpResponse& response, bool headOnly) {
    std::string data = headOnly ? response.head(response.body.size()) : response.toString();
    if (!sendAll(clientFd, data)) {
        logDebug(errnoMessage("Failed to send response to client"));
        return 0;
    }
    return data.size();
}

// Half-closes and drains unread request bytes so the client sees the
// error response instead of a reset.
void GatewayServer::lingeringClose(int clientFd) {
    if (::shutdown(clientFd, SHUT_WR) < 0) {
        return;
    }
    try {
        setTimeouts(clientFd, kLingerReadMs);
    } catch (const std::runtime_error& e) {
        logDebug(e.what());
        return;
    }
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(kLingerTotalMs);
    char buffer[8192];
    while (std::chrono::steady_clock::now() < deadline) {
        ssize_t n = recvSome(clientFd, buffer, sizeof(buffer));
        if (n <= 0) {
            break;
        }
    }
}

void GatewayServer::accessLog(const HttpRequest& request, int status, size_t bytes, const std::string& target) {
    std::ostringstream line;
    line << (request.remoteAddress.empty() ? "-" : request.remoteAddress) << " \"";
    if (request.method.empty()) {
        line << "-";
    } else {
        line << request.method << " " << request.target << " " << request.version;
    }
    line << "\" " << status << " " << bytes << " "
         << quoted(request.header("referer")) << " "
         << quoted(request.header("user-agent")) << " " << target;
    Logger::access(line.str());
}

void GatewayServer::updateStats(Counter counter) {
    std::lock_guard<std::mutex> lock(statsMutex_);
    switch (counter) {
        case Counter::Total:         stats_.totalRequests++; break;
        case Counter::Proxied:       stats_.proxiedRequests++; break;
        case Counter::Static:        stats_.staticRequests++; break;
        case Counter::Rejected:      stats_.rejectedRequests++; break;
        case Counter::UpstreamError: stats_.upstreamErrors++; break;
        case Counter::InternalError: stats_.internalErrors++; break;
    }
}

GatewayServer::Stats GatewayServer::getStats() const {
    std::lock_guard<std::mutex> lock(statsMutex_);
    return stats_;
}

} // namespace gateway
