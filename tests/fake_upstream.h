#ifndef GATEWAY_FAKE_UPSTREAM_H
#define GATEWAY_FAKE_UPSTREAM_H

#include "../src/socket.hpp"
#include <poll.h>
#include <sys/socket.h>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

// Loopback HTTP backend for tests. Records every request it receives and
// answers each one with a canned response after an optional delay.
class FakeUpstream {
public:
    explicit FakeUpstream(const std::string& response, int delayMs = 0)
        : response_(response), delayMs_(delayMs), running_(true) {
        listener_ = gateway::listenOn("127.0.0.1", 0, 16);
        port_ = gateway::localPort(listener_.get());
        thread_ = std::thread(&FakeUpstream::serve, this);
    }

    ~FakeUpstream() {
        running_ = false;
        thread_.join();
    }

    FakeUpstream(const FakeUpstream&) = delete;
    FakeUpstream& operator=(const FakeUpstream&) = delete;

    int port() const { return port_; }

    size_t requestCount() {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_.size();
    }

    std::string lastRequest() {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_.empty() ? "" : requests_.back();
    }

private:
    std::string response_;
    int delayMs_;
    std::atomic<bool> running_;
    gateway::Socket listener_;
    int port_;
    std::thread thread_;
    std::mutex mutex_;
    std::vector<std::string> requests_;

    void serve() {
        while (running_) {
            pollfd pfd{};
            pfd.fd = listener_.get();
            pfd.events = POLLIN;
            if (::poll(&pfd, 1, 50) <= 0) {
                continue;
            }
            gateway::Socket conn(::accept(listener_.get(), nullptr, nullptr));
            if (!conn.valid()) {
                continue;
            }
            gateway::setTimeouts(conn.get(), 2000);
            std::string request = readRequest(conn.get());
            {
                std::lock_guard<std::mutex> lock(mutex_);
                requests_.push_back(request);
            }
            if (delayMs_ > 0) {
                std::this_thread::sleep_for(std::chrono::milliseconds(delayMs_));
            }
            if (!response_.empty()) {
                gateway::sendAll(conn.get(), response_);
            }
        }
    }

    static std::string readRequest(int fd) {
        std::string data;
        char buffer[4096];
        size_t headEnd = std::string::npos;
        while (headEnd == std::string::npos) {
            ssize_t n = gateway::recvSome(fd, buffer, sizeof(buffer));
            if (n <= 0) {
                return data;
            }
            data.append(buffer, static_cast<size_t>(n));
            headEnd = data.find("\r\n\r\n");
        }
        size_t bodyLength = 0;
        size_t lengthPos = data.find("Content-Length: ");
        if (lengthPos != std::string::npos && lengthPos < headEnd) {
            bodyLength = std::strtoul(data.c_str() + lengthPos + 16, nullptr, 10);
        }
        while (data.size() < headEnd + 4 + bodyLength) {
            ssize_t n = gateway::recvSome(fd, buffer, sizeof(buffer));
            if (n <= 0) {
                break;
            }
            data.append(buffer, static_cast<size_t>(n));
        }
        return data;
    }
};

#endif // GATEWAY_FAKE_UPSTREAM_H
