#ifndef GATEWAY_HTTP_MESSAGE_HPP
#define GATEWAY_HTTP_MESSAGE_HPP

#include <ctime>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace gateway {

// Header lookups are case-insensitive. Request header names are stored
// lower-cased; response headers keep the spelling they were set with.
using HeaderList = std::vector<std::pair<std::string, std::string>>;

// Protocol-level failure that maps directly onto a response status.
class HttpError : public std::runtime_error {
public:
    HttpError(int status, const std::string& message)
        : std::runtime_error(message), status_(status) {}

    int status() const { return status_; }

private:
    int status_;
};

struct HttpRequest {
    std::string method;
    std::string target;     // as received on the request line
    std::string path;       // decoded and normalised, always starts with '/'
    std::string query;      // without the leading '?'
    std::string version;
    HeaderList headers;
    std::string body;
    std::string remoteAddress;

    const std::string* header(const std::string& name) const;
    bool hasHeader(const std::string& name) const { return header(name) != nullptr; }
    std::string headerOr(const std::string& name, const std::string& fallback) const;
};

struct HttpResponse {
    int statusCode;
    HeaderList headers;
    std::string body;

    HttpResponse() : statusCode(200) {}

    void setHeader(const std::string& name, const std::string& value);
    const std::string* header(const std::string& name) const;

    // Status line and headers, including the terminating blank line.
    // Content-Length is derived from contentLength when the caller has
    // not set one.
    std::string head(size_t contentLength) const;
    std::string toString() const;
};

std::string toLower(std::string s);
std::string trim(const std::string& s);

const char* statusText(int statusCode);
HttpResponse makeErrorResponse(int statusCode, const std::string& message);
HttpResponse makeRedirect(int statusCode, const std::string& location);

// Parses a request line plus header block (without the final CRLF CRLF).
// Throws HttpError on malformed input.
HttpRequest parseRequestHead(const std::string& head);

// Percent-decodes the path, merges slashes and resolves "." and "..".
// Returns false for invalid escapes, NUL bytes or paths above the root.
bool normalizePath(const std::string& raw, std::string& out);

// Re-encodes a decoded path for use on an upstream request line.
std::string encodePath(const std::string& path);

int extractStatusCode(const std::string& response);

std::string formatHttpDate(time_t t);
bool parseHttpDate(const std::string& text, time_t& out);

} // namespace gateway

#endif // GATEWAY_HTTP_MESSAGE_HPP
