#include "request_reader.hpp"
#include "socket.hpp"
#include <algorithm>
#include <cerrno>
#include <cctype>
#include <cstring>

namespace gateway {

namespace {

const size_t kReadChunk = 8192;

void throwReadFailure() {
    if (errno == EAGAIN || errno == EWOULDBLOCK) {
        throw HttpError(408, "client read timed out");
    }
    throw HttpError(400, errnoMessage("recv"));
}

bool parseContentLength(const std::string& value, size_t& out) {
    if (value.empty() || value.size() > 19) {
        return false;
    }
    size_t result = 0;
    for (char c : value) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
        result = result * 10 + static_cast<size_t>(c - '0');
    }
    out = result;
    return true;
}

} // namespace

ChunkedDecoder::ChunkedDecoder(size_t maxBodySize)
    : maxBodySize_(maxBodySize), state_(State::Size), chunkSize_(0), sizeDigits_(0),
      remaining_(0), trailerLineLength_(0) {
}

size_t ChunkedDecoder::feed(const char* data, size_t len) {
    size_t i = 0;
    while (i < len && state_ != State::Done) {
        char c = data[i];
        switch (state_) {
            case State::Size: {
                int digit = -1;
                if (c >= '0' && c <= '9') digit = c - '0';
                else if (c >= 'a' && c <= 'f') digit = c - 'a' + 10;
                else if (c >= 'A' && c <= 'F') digit = c - 'A' + 10;

                if (digit >= 0) {
                    if (++sizeDigits_ > 15) {
                        throw HttpError(413, "chunk size too large");
                    }
                    chunkSize_ = chunkSize_ * 16 + static_cast<size_t>(digit);
                } else if (sizeDigits_ == 0) {
                    throw HttpError(400, "invalid chunk size");
                } else if (c == ';' || c == ' ' || c == '\t') {
                    state_ = State::Extension;
                } else if (c == '\r') {
                    state_ = State::SizeLf;
                } else {
                    throw HttpError(400, "invalid chunk size");
                }
                ++i;
                break;
            }
            case State::Extension:
                if (c == '\r') {
                    state_ = State::SizeLf;
                }
                ++i;
                break;
            case State::SizeLf:
                if (c != '\n') {
                    throw HttpError(400, "missing LF after chunk size");
                }
                ++i;
                if (chunkSize_ == 0) {
                    state_ = State::Trailer;
                    trailerLineLength_ = 0;
                } else {
                    if (maxBodySize_ != 0 && body_.size() + chunkSize_ > maxBodySize_) {
                        throw HttpError(413, "chunked body exceeds limit");
                    }
                    remaining_ = chunkSize_;
                    state_ = State::Data;
                }
                break;
            case State::Data: {
                size_t take = std::min(remaining_, len - i);
                body_.append(data + i, take);
                remaining_ -= take;
                i += take;
                if (remaining_ == 0) {
                    state_ = State::DataCr;
                }
                break;
            }
            case State::DataCr:
                if (c != '\r') {
                    throw HttpError(400, "missing CR after chunk data");
                }
                state_ = State::DataLf;
                ++i;
                break;
            case State::DataLf:
                if (c != '\n') {
                    throw HttpError(400, "missing LF after chunk data");
                }
                state_ = State::Size;
                chunkSize_ = 0;
                sizeDigits_ = 0;
                ++i;
                break;
            case State::Trailer:
                if (c == '\r') {
                    state_ = State::TrailerLf;
                } else {
                    ++trailerLineLength_;
                }
                ++i;
                break;
            case State::TrailerLf:
                if (c != '\n') {
                    throw HttpError(400, "malformed chunked trailer");
                }
                ++i;
                if (trailerLineLength_ == 0) {
                    state_ = State::Done;
                } else {
                    trailerLineLength_ = 0;
                    state_ = State::Trailer;
                }
                break;
            case State::Done:
                break;
        }
    }
    return i;
}

bool readRequest(int fd, const RequestLimits& limits, HttpRequest& out) {
    std::string buffer;
    char chunk[kReadChunk];
    size_t headerEnd = std::string::npos;

    // Read until we get headers (empty line)
    while (headerEnd == std::string::npos) {
        ssize_t bytesRead = recvSome(fd, chunk, sizeof(chunk));
        if (bytesRead < 0) {
            if (buffer.empty() && errno != EAGAIN && errno != EWOULDBLOCK) {
                return false;
            }
            throwReadFailure();
        }
        if (bytesRead == 0) {
            if (buffer.empty()) {
                return false;
            }
            throw HttpError(400, "connection closed inside request head");
        }
        buffer.append(chunk, static_cast<size_t>(bytesRead));

        // Tolerate leading empty lines before the request line.
        size_t firstUsed = buffer.find_first_not_of("\r\n");
        if (firstUsed == std::string::npos) {
            buffer.clear();
            continue;
        }
        if (firstUsed > 0) {
            buffer.erase(0, firstUsed);
        }

        headerEnd = buffer.find("\r\n\r\n");
        if (headerEnd == std::string::npos && buffer.size() > limits.maxHeaderSize) {
            throw HttpError(431, "request head exceeds " + std::to_string(limits.maxHeaderSize) + " bytes");
        }
    }
    if (headerEnd > limits.maxHeaderSize) {
        throw HttpError(431, "request head exceeds " + std::to_string(limits.maxHeaderSize) + " bytes");
    }

    HttpRequest request = parseRequestHead(buffer.substr(0, headerEnd));
    std::string pending = buffer.substr(headerEnd + 4);

    const std::string* transferEncoding = request.header("transfer-encoding");
    const std::string* contentLengthValue = request.header("content-length");

    if (transferEncoding) {
        if (contentLengthValue) {
            throw HttpError(400, "both Content-Length and Transfer-Encoding present");
        }
        if (toLower(*transferEncoding) != "chunked") {
            throw HttpError(501, "unsupported transfer coding " + *transferEncoding);
        }

        ChunkedDecoder decoder(limits.maxBodySize);
        decoder.feed(pending.data(), pending.size());
        while (!decoder.done()) {
            ssize_t bytesRead = recvSome(fd, chunk, sizeof(chunk));
            if (bytesRead < 0) {
                throwReadFailure();
            }
            if (bytesRead == 0) {
                throw HttpError(400, "connection closed inside chunked body");
            }
            decoder.feed(chunk, static_cast<size_t>(bytesRead));
        }
        request.body = decoder.body();
    } else if (contentLengthValue) {
        size_t contentLength = 0;
        if (!parseContentLength(*contentLengthValue, contentLength)) {
            throw HttpError(400, "invalid Content-Length " + *contentLengthValue);
        }
        // Oversized bodies are rejected before a single body byte is read.
        if (limits.maxBodySize != 0 && contentLength > limits.maxBodySize) {
            throw HttpError(413, "body of " + std::to_string(contentLength) +
                            " bytes exceeds limit of " + std::to_string(limits.maxBodySize));
        }
        request.body = pending.substr(0, std::min(pending.size(), contentLength));
        while (request.body.size() < contentLength) {
            size_t want = std::min(sizeof(chunk), contentLength - request.body.size());
            ssize_t bytesRead = recvSome(fd, chunk, want);
            if (bytesRead < 0) {
                throwReadFailure();
            }
            if (bytesRead == 0) {
                throw HttpError(400, "connection closed inside request body");
            }
            request.body.append(chunk, static_cast<size_t>(bytesRead));
        }
    }

    request.remoteAddress = peerAddress(fd);
    out = std::move(request);
    return true;
}

} // namespace gateway
