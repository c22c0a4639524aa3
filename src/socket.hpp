#ifndef GATEWAY_SOCKET_HPP
#define GATEWAY_SOCKET_HPP

#include <string>
#include <cstddef>
#include <sys/types.h>
#include <unistd.h>

namespace gateway {

// RAII wrapper for socket
class Socket {
public:
    explicit Socket(int fd = -1) : fd_(fd) {}
    ~Socket() { close(); }

    Socket(const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;

    Socket(Socket&& other) noexcept : fd_(other.fd_) {
        other.fd_ = -1;
    }

    Socket& operator=(Socket&& other) noexcept {
        if (this != &other) {
            close();
            fd_ = other.fd_;
            other.fd_ = -1;
        }
        return *this;
    }

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }
    void close() {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

private:
    int fd_;
};

std::string errnoMessage(const std::string& prefix);

// Sends the whole buffer, retrying on EINTR and short writes.
// Returns false if the peer went away or the send timed out.
bool sendAll(int fd, const char* data, size_t len);
bool sendAll(int fd, const std::string& data);

// recv() that retries on EINTR. Returns -1 on error (errno preserved).
ssize_t recvSome(int fd, char* buffer, size_t len);

void setTimeouts(int fd, int timeoutMs);

// Binds and listens on address:port. Port 0 picks an ephemeral port.
Socket listenOn(const std::string& address, int port, int backlog);
int localPort(int fd);

// Resolves host with getaddrinfo and connects to the first reachable
// address. Throws std::runtime_error describing the last failure.
Socket connectTo(const std::string& host, int port, int timeoutMs);

std::string peerAddress(int fd);

} // namespace gateway

#endif // GATEWAY_SOCKET_HPP
