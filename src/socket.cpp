#include "socket.hpp"
#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <cerrno>
#include <cstring>
#include <stdexcept>

namespace gateway {

std::string errnoMessage(const std::string& prefix) {
    return prefix + ": " + std::strerror(errno);
}

bool sendAll(int fd, const char* data, size_t len) {
    size_t total = 0;
    while (total < len) {
        ssize_t n = ::send(fd, data + total, len - total, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        if (n == 0) return false;
        total += static_cast<size_t>(n);
    }
    return true;
}

bool sendAll(int fd, const std::string& data) {
    return sendAll(fd, data.data(), data.size());
}

ssize_t recvSome(int fd, char* buffer, size_t len) {
    while (true) {
        ssize_t n = ::recv(fd, buffer, len, 0);
        if (n < 0 && errno == EINTR) continue;
        return n;
    }
}

void setTimeouts(int fd, int timeoutMs) {
    timeval tv{};
    tv.tv_sec = timeoutMs / 1000;
    tv.tv_usec = (timeoutMs % 1000) * 1000;
    if (::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0 ||
        ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) < 0) {
        throw std::runtime_error(errnoMessage("setsockopt"));
    }
}

Socket listenOn(const std::string& address, int port, int backlog) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_PASSIVE;

    const char* node = (address.empty() || address == "*") ? nullptr : address.c_str();
    std::string service = std::to_string(port);

    addrinfo* res = nullptr;
    int rc = ::getaddrinfo(node, service.c_str(), &hints, &res);
    if (rc != 0) {
        throw std::runtime_error(std::string("getaddrinfo: ") + gai_strerror(rc));
    }

    Socket sock;
    std::string lastError = "no usable address";
    // Prefer IPv4 so that "listen 80" behaves like nginx's default.
    for (int pass = 0; pass < 2 && !sock.valid(); ++pass) {
        for (addrinfo* p = res; p != nullptr; p = p->ai_next) {
            bool v4 = p->ai_family == AF_INET;
            if ((pass == 0) != v4) continue;

            Socket candidate(::socket(p->ai_family, p->ai_socktype, p->ai_protocol));
            if (!candidate.valid()) {
                lastError = errnoMessage("socket");
                continue;
            }
            int opt = 1;
            (void)::setsockopt(candidate.get(), SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));
            if (::bind(candidate.get(), p->ai_addr, p->ai_addrlen) < 0) {
                lastError = errnoMessage("bind to port " + service);
                continue;
            }
            if (::listen(candidate.get(), backlog) < 0) {
                lastError = errnoMessage("listen");
                continue;
            }
            sock = std::move(candidate);
            break;
        }
    }
    ::freeaddrinfo(res);

    if (!sock.valid()) {
        throw std::runtime_error(lastError);
    }
    return sock;
}

int localPort(int fd) {
    sockaddr_storage ss{};
    socklen_t len = sizeof(ss);
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&ss), &len) < 0) {
        throw std::runtime_error(errnoMessage("getsockname"));
    }
    if (ss.ss_family == AF_INET6) {
        return ntohs(reinterpret_cast<sockaddr_in6*>(&ss)->sin6_port);
    }
    return ntohs(reinterpret_cast<sockaddr_in*>(&ss)->sin_port);
}

Socket connectTo(const std::string& host, int port, int timeoutMs) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    std::string service = std::to_string(port);
    addrinfo* res = nullptr;
    int rc = ::getaddrinfo(host.c_str(), service.c_str(), &hints, &res);
    if (rc != 0) {
        throw std::runtime_error("failed to resolve " + host + ": " + gai_strerror(rc));
    }

    Socket sock;
    std::string lastError = "no address for " + host;
    for (addrinfo* p = res; p != nullptr; p = p->ai_next) {
        Socket candidate(::socket(p->ai_family, p->ai_socktype, p->ai_protocol));
        if (!candidate.valid()) {
            lastError = errnoMessage("socket");
            continue;
        }
        // SO_SNDTIMEO also bounds connect() on Linux.
        setTimeouts(candidate.get(), timeoutMs);
        if (::connect(candidate.get(), p->ai_addr, p->ai_addrlen) < 0) {
            lastError = errnoMessage("connect to " + host + ":" + service);
            continue;
        }
        sock = std::move(candidate);
        break;
    }
    ::freeaddrinfo(res);

    if (!sock.valid()) {
        throw std::runtime_error(lastError);
    }
    return sock;
}

std::string peerAddress(int fd) {
    sockaddr_storage ss{};
    socklen_t len = sizeof(ss);
    if (::getpeername(fd, reinterpret_cast<sockaddr*>(&ss), &len) < 0) {
        return "-";
    }
    char buf[INET6_ADDRSTRLEN] = {0};
    if (ss.ss_family == AF_INET6) {
        inet_ntop(AF_INET6, &reinterpret_cast<sockaddr_in6*>(&ss)->sin6_addr, buf, sizeof(buf));
    } else if (ss.ss_family == AF_INET) {
        inet_ntop(AF_INET, &reinterpret_cast<sockaddr_in*>(&ss)->sin_addr, buf, sizeof(buf));
    } else {
        return "-";
    }
    return buf;
}

} // namespace gateway
