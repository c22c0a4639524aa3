#ifndef GATEWAY_REQUEST_READER_HPP
#define GATEWAY_REQUEST_READER_HPP

#include "http_message.hpp"
#include <cstddef>
#include <string>

namespace gateway {

struct RequestLimits {
    size_t maxHeaderSize;
    size_t maxBodySize;     // 0 disables the check

    RequestLimits() : maxHeaderSize(16 * 1024), maxBodySize(10 * 1024 * 1024) {}
};

// Incremental decoder for "Transfer-Encoding: chunked" request bodies.
// Throws HttpError(400) on syntax errors and HttpError(413) as soon as the
// decoded size would exceed the limit.
class ChunkedDecoder {
public:
    explicit ChunkedDecoder(size_t maxBodySize);

    // Consumes bytes up to the end of the chunked message and returns how
    // many were used. Anything after the terminating CRLF is left alone.
    size_t feed(const char* data, size_t len);

    bool done() const { return state_ == State::Done; }
    const std::string& body() const { return body_; }

private:
    enum class State {
        Size,
        Extension,
        SizeLf,
        Data,
        DataCr,
        DataLf,
        Trailer,
        TrailerLf,
        Done
    };

    size_t maxBodySize_;
    State state_;
    size_t chunkSize_;
    size_t sizeDigits_;
    size_t remaining_;
    size_t trailerLineLength_;
    std::string body_;
};

// Reads one request (head and body) from a connected client socket.
// The socket's receive timeout bounds every read; a timeout surfaces as
// HttpError(408). Returns false if the peer closed before sending anything.
bool readRequest(int fd, const RequestLimits& limits, HttpRequest& out);

} // namespace gateway

#endif // GATEWAY_REQUEST_READER_HPP
