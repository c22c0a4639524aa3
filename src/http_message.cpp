#include "http_message.hpp"
#include <algorithm>
#include <cctype>
#include <cstring>
#include <sstream>

namespace gateway {

namespace {

bool isTokenChar(char c) {
    if (std::isalnum(static_cast<unsigned char>(c))) return true;
    return std::strchr("!#$%&'*+-.^_`|~", c) != nullptr && c != '\0';
}

bool isToken(const std::string& s) {
    if (s.empty()) return false;
    return std::all_of(s.begin(), s.end(), isTokenChar);
}

// Control bytes other than HTAB, including a bare CR.
bool hasControlChar(const std::string& s) {
    return std::any_of(s.begin(), s.end(), [](char ch) {
        unsigned char c = static_cast<unsigned char>(ch);
        return (c < 0x20 && c != '\t') || c == 0x7f;
    });
}

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::vector<std::string> splitLines(const std::string& head) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start <= head.size()) {
        size_t end = head.find('\n', start);
        if (end == std::string::npos) end = head.size();
        std::string line = head.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(line);
        start = end + 1;
    }
    return lines;
}

const std::string* findHeader(const HeaderList& headers, const std::string& name) {
    std::string key = toLower(name);
    for (const auto& header : headers) {
        if (toLower(header.first) == key) {
            return &header.second;
        }
    }
    return nullptr;
}

} // namespace

const std::string* HttpRequest::header(const std::string& name) const {
    return findHeader(headers, name);
}

std::string HttpRequest::headerOr(const std::string& name, const std::string& fallback) const {
    const std::string* value = header(name);
    return value ? *value : fallback;
}

void HttpResponse::setHeader(const std::string& name, const std::string& value) {
    std::string key = toLower(name);
    for (auto& header : headers) {
        if (toLower(header.first) == key) {
            header.second = value;
            return;
        }
    }
    headers.emplace_back(name, value);
}

const std::string* HttpResponse::header(const std::string& name) const {
    return findHeader(headers, name);
}

std::string HttpResponse::head(size_t contentLength) const {
    std::ostringstream oss;
    oss << "HTTP/1.1 " << statusCode << " "
        << statusText(statusCode) << "\r\n";
    oss << "Server: foodgram-gateway\r\n";
    oss << "Date: " << formatHttpDate(std::time(nullptr)) << "\r\n";
    for (const auto& header : headers) {
        oss << header.first << ": " << header.second << "\r\n";
    }
    if (!header("content-length") && statusCode != 304) {
        oss << "Content-Length: " << contentLength << "\r\n";
    }
    oss << "Connection: close\r\n";
    oss << "\r\n";
    return oss.str();
}

std::string HttpResponse::toString() const {
    return head(body.size()) + body;
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s) {
    size_t first = s.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return "";
    }
    size_t last = s.find_last_not_of(" \t");
    return s.substr(first, last - first + 1);
}

const char* statusText(int statusCode) {
    switch (statusCode) {
        case 200: return "OK";
        case 204: return "No Content";
        case 301: return "Moved Permanently";
        case 302: return "Found";
        case 304: return "Not Modified";
        case 400: return "Bad Request";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 408: return "Request Timeout";
        case 411: return "Length Required";
        case 413: return "Payload Too Large";
        case 414: return "URI Too Long";
        case 431: return "Request Header Fields Too Large";
        case 500: return "Internal Server Error";
        case 501: return "Not Implemented";
        case 502: return "Bad Gateway";
        case 503: return "Service Unavailable";
        case 504: return "Gateway Timeout";
        case 505: return "HTTP Version Not Supported";
        default:  return "Unknown";
    }
}

HttpResponse makeErrorResponse(int statusCode, const std::string& message) {
    HttpResponse response;
    response.statusCode = statusCode;
    response.setHeader("Content-Type", "text/plain; charset=utf-8");
    response.body = std::to_string(statusCode) + " " + statusText(statusCode);
    if (!message.empty()) {
        response.body += ": " + message;
    }
    response.body += "\n";
    return response;
}

HttpResponse makeRedirect(int statusCode, const std::string& location) {
    HttpResponse response = makeErrorResponse(statusCode, "");
    response.setHeader("Location", location);
    return response;
}

HttpRequest parseRequestHead(const std::string& head) {
    std::vector<std::string> lines = splitLines(head);
    if (lines.empty() || lines[0].empty()) {
        throw HttpError(400, "empty request line");
    }

    HttpRequest request;

    // Request line: METHOD SP target SP version
    const std::string& requestLine = lines[0];
    size_t sp1 = requestLine.find(' ');
    size_t sp2 = sp1 == std::string::npos ? std::string::npos : requestLine.find(' ', sp1 + 1);
    if (sp1 == std::string::npos || sp2 == std::string::npos ||
        requestLine.find(' ', sp2 + 1) != std::string::npos) {
        throw HttpError(400, "malformed request line");
    }
    request.method = requestLine.substr(0, sp1);
    request.target = requestLine.substr(sp1 + 1, sp2 - sp1 - 1);
    request.version = requestLine.substr(sp2 + 1);

    if (!isToken(request.method)) {
        throw HttpError(400, "invalid method");
    }
    if (hasControlChar(request.target)) {
        throw HttpError(400, "control character in request target");
    }
    if (request.version != "HTTP/1.1" && request.version != "HTTP/1.0") {
        if (request.version.compare(0, 5, "HTTP/") == 0 && request.version.size() == 8 &&
            std::isdigit(static_cast<unsigned char>(request.version[5])) &&
            request.version[6] == '.' &&
            std::isdigit(static_cast<unsigned char>(request.version[7]))) {
            throw HttpError(505, "unsupported version " + request.version);
        }
        throw HttpError(400, "invalid version");
    }

    for (size_t i = 1; i < lines.size(); ++i) {
        const std::string& line = lines[i];
        if (line.empty()) {
            continue;
        }
        if (line[0] == ' ' || line[0] == '\t') {
            throw HttpError(400, "folded header line");
        }
        size_t colonPos = line.find(':');
        if (colonPos == std::string::npos) {
            throw HttpError(400, "header line without colon");
        }
        std::string key = line.substr(0, colonPos);
        if (!isToken(key)) {
            throw HttpError(400, "invalid header name");
        }
        std::string value = trim(line.substr(colonPos + 1));
        if (hasControlChar(value)) {
            throw HttpError(400, "control character in header " + key);
        }
        request.headers.emplace_back(toLower(key), value);
    }

    size_t hostCount = 0;
    const std::string* contentLength = nullptr;
    for (const auto& header : request.headers) {
        if (header.first == "host") ++hostCount;
        if (header.first == "content-length") {
            if (contentLength && *contentLength != header.second) {
                throw HttpError(400, "conflicting Content-Length headers");
            }
            contentLength = &header.second;
        }
    }
    if (hostCount > 1) {
        throw HttpError(400, "duplicate Host header");
    }

    // Absolute-form targets carry the authority; only the path is routed.
    std::string target = request.target;
    if (target.compare(0, 7, "http://") == 0 || target.compare(0, 8, "https://") == 0) {
        size_t authorityStart = target.find("://") + 3;
        size_t pathStart = target.find('/', authorityStart);
        std::string authority = target.substr(authorityStart,
            pathStart == std::string::npos ? std::string::npos : pathStart - authorityStart);
        if (hostCount == 0) {
            request.headers.emplace_back("host", authority);
            hostCount = 1;
        }
        target = pathStart == std::string::npos ? "/" : target.substr(pathStart);
    }
    if (target.empty() || target[0] != '/') {
        throw HttpError(400, "invalid request target");
    }
    if (hostCount == 0 && request.version == "HTTP/1.1") {
        throw HttpError(400, "missing Host header");
    }

    size_t queryPos = target.find('?');
    std::string rawPath = target.substr(0, queryPos);
    if (queryPos != std::string::npos) {
        request.query = target.substr(queryPos + 1);
    }
    size_t fragment = request.query.find('#');
    if (fragment != std::string::npos) {
        request.query.erase(fragment);
    }
    if (!normalizePath(rawPath, request.path)) {
        throw HttpError(400, "invalid path " + rawPath);
    }
    return request;
}

bool normalizePath(const std::string& raw, std::string& out) {
    std::string decoded;
    decoded.reserve(raw.size());
    for (size_t i = 0; i < raw.size(); ++i) {
        char c = raw[i];
        if (c == '%') {
            if (i + 2 >= raw.size()) return false;
            int hi = hexValue(raw[i + 1]);
            int lo = hexValue(raw[i + 2]);
            if (hi < 0 || lo < 0) return false;
            c = static_cast<char>(hi * 16 + lo);
            i += 2;
        }
        if (c == '\0') return false;
        decoded += c;
    }
    if (decoded.empty() || decoded[0] != '/') {
        return false;
    }

    std::vector<std::string> segments;
    size_t pos = 1;
    bool trailingSlash = false;
    while (pos <= decoded.size()) {
        size_t next = decoded.find('/', pos);
        if (next == std::string::npos) next = decoded.size();
        std::string segment = decoded.substr(pos, next - pos);
        bool last = next >= decoded.size();

        if (segment == "..") {
            if (segments.empty()) return false;
            segments.pop_back();
            trailingSlash = true;
        } else if (segment == "." || segment.empty()) {
            trailingSlash = true;
        } else {
            segments.push_back(segment);
            trailingSlash = false;
        }
        if (last) break;
        pos = next + 1;
    }

    out = "/";
    for (size_t i = 0; i < segments.size(); ++i) {
        out += segments[i];
        if (i + 1 < segments.size() || trailingSlash) {
            out += '/';
        }
    }
    return true;
}

std::string encodePath(const std::string& path) {
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    out.reserve(path.size());
    for (char ch : path) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (std::isalnum(c) || std::strchr("/-._~!$&'()*+,;=:@", ch) != nullptr) {
            out += ch;
        } else {
            out += '%';
            out += hex[c >> 4];
            out += hex[c & 0x0F];
        }
    }
    return out;
}

int extractStatusCode(const std::string& response) {
    // Format: "HTTP/1.1 200 OK\r\n..."
    size_t space1 = response.find(' ');
    if (space1 == std::string::npos || space1 + 4 > response.size()) {
        return 0;
    }
    int code = 0;
    for (size_t i = space1 + 1; i < space1 + 4; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(response[i]))) {
            return 0;
        }
        code = code * 10 + (response[i] - '0');
    }
    return code;
}

std::string formatHttpDate(time_t t) {
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[64];
    std::strftime(buf, sizeof(buf), "%a, %d %b %Y %H:%M:%S GMT", &tm);
    return buf;
}

bool parseHttpDate(const std::string& text, time_t& out) {
    std::tm tm{};
    const char* end = strptime(text.c_str(), "%a, %d %b %Y %H:%M:%S GMT", &tm);
    if (end == nullptr || *end != '\0') {
        return false;
    }
    out = timegm(&tm);
    return true;
}

} // namespace gateway
