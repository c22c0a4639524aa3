#include "upstream_client.hpp"
#include "logger.hpp"
#include "socket.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <set>
#include <sstream>
#include <stdexcept>

namespace gateway {

namespace {

const std::set<std::string> kHopByHop = {
    "connection", "keep-alive", "proxy-connection", "te", "trailer",
    "transfer-encoding", "upgrade", "proxy-authenticate", "proxy-authorization"
};

const char* const kVariables[] = {
    "proxy_add_x_forwarded_for", "remote_addr", "request_uri", "http_host", "scheme", "host"
};

std::string hostWithoutPort(const std::string& host) {
    std::string out = host;
    if (!out.empty() && out[0] == '[') {
        size_t close = out.find(']');
        return toLower(close == std::string::npos ? out : out.substr(0, close + 1));
    }
    size_t colon = out.find(':');
    if (colon != std::string::npos) {
        out.erase(colon);
    }
    return toLower(out);
}

std::string variableValue(const std::string& name, const HttpRequest& request) {
    if (name == "host") {
        return hostWithoutPort(request.headerOr("host", ""));
    }
    if (name == "http_host") {
        return request.headerOr("host", "");
    }
    if (name == "remote_addr") {
        return request.remoteAddress;
    }
    if (name == "scheme") {
        return "http";
    }
    if (name == "request_uri") {
        return request.target;
    }
    if (name == "proxy_add_x_forwarded_for") {
        const std::string* existing = request.header("x-forwarded-for");
        if (existing && !existing->empty()) {
            return *existing + ", " + request.remoteAddress;
        }
        return request.remoteAddress;
    }
    return "";
}

// Known variable name starting at value[pos], or empty.
std::string matchVariable(const std::string& value, size_t pos) {
    for (const char* name : kVariables) {
        std::string candidate(name);
        if (value.compare(pos, candidate.size(), candidate) == 0) {
            size_t end = pos + candidate.size();
            if (end >= value.size() ||
                !(std::isalnum(static_cast<unsigned char>(value[end])) || value[end] == '_')) {
                return candidate;
            }
        }
    }
    return "";
}

// Extra hop-by-hop names listed in the client's Connection header.
std::set<std::string> connectionTokens(const HttpRequest& request) {
    std::set<std::string> tokens;
    const std::string* connection = request.header("connection");
    if (!connection) {
        return tokens;
    }
    std::istringstream iss(*connection);
    std::string token;
    while (std::getline(iss, token, ',')) {
        token = toLower(trim(token));
        if (!token.empty()) {
            tokens.insert(token);
        }
    }
    return tokens;
}

} // namespace

std::string rewriteUpstreamUri(const Rule& rule, const HttpRequest& request) {
    std::string rest = request.path.size() > rule.pathPrefix.size()
        ? request.path.substr(rule.pathPrefix.size()) : "";
    std::string uri = encodePath(rule.proxy.upstreamPathPrefix + rest);
    if (uri.empty() || uri[0] != '/') {
        uri.insert(0, "/");
    }
    if (!request.query.empty()) {
        uri += "?" + request.query;
    }
    return uri;
}

std::string expandProxyVariables(const std::string& value, const HttpRequest& request) {
    std::string out;
    for (size_t i = 0; i < value.size(); ++i) {
        if (value[i] == '$') {
            std::string name = matchVariable(value, i + 1);
            if (!name.empty()) {
                out += variableValue(name, request);
                i += name.size();
                continue;
            }
        }
        out += value[i];
    }
    return out;
}

bool checkProxyVariables(const std::string& value, std::string& unknown) {
    for (size_t i = 0; i < value.size(); ++i) {
        if (value[i] != '$') continue;
        if (matchVariable(value, i + 1).empty()) {
            size_t end = i + 1;
            while (end < value.size() &&
                   (std::isalnum(static_cast<unsigned char>(value[end])) || value[end] == '_')) {
                ++end;
            }
            unknown = value.substr(i, end - i);
            return false;
        }
    }
    return true;
}

std::string buildUpstreamRequest(const Rule& rule, const HttpRequest& request) {
    const ProxyTarget& target = rule.proxy;
    std::set<std::string> skip = connectionTokens(request);
    skip.insert("host");
    skip.insert("content-length");

    std::ostringstream requestStream;
    requestStream << request.method << " " << rewriteUpstreamUri(rule, request) << " HTTP/1.0\r\n";

    // The client's Host goes upstream verbatim unless a rule overrides it.
    std::string host = request.headerOr("host", "");
    bool hostOverridden = false;
    for (const auto& setHeader : target.setHeaders) {
        if (toLower(setHeader.first) == "host") {
            host = expandProxyVariables(setHeader.second, request);
            hostOverridden = true;
        }
    }
    if (host.empty() && !hostOverridden) {
        host = target.upstreamHost;
        if (target.upstreamPort != 80) {
            host += ":" + std::to_string(target.upstreamPort);
        }
    }
    requestStream << "Host: " << host << "\r\n";

    for (const auto& setHeader : target.setHeaders) {
        std::string name = toLower(setHeader.first);
        if (name == "host") continue;
        skip.insert(name);
        std::string value = expandProxyVariables(setHeader.second, request);
        // An empty value removes the header, as in nginx.
        if (!value.empty()) {
            requestStream << setHeader.first << ": " << value << "\r\n";
        }
    }

    for (const auto& header : request.headers) {
        if (kHopByHop.count(header.first) || skip.count(header.first)) {
            continue;
        }
        requestStream << header.first << ": " << header.second << "\r\n";
    }

    bool hasBody = !request.body.empty() || request.hasHeader("content-length") ||
                   request.hasHeader("transfer-encoding");
    if (hasBody) {
        requestStream << "Content-Length: " << request.body.size() << "\r\n";
    }
    requestStream << "Connection: close\r\n";
    requestStream << "\r\n";
    requestStream << request.body;
    return requestStream.str();
}

UpstreamClient::UpstreamClient(int connectTimeoutMs, int readTimeoutMs)
    : connectTimeoutMs_(connectTimeoutMs), readTimeoutMs_(readTimeoutMs) {
}

UpstreamResult UpstreamClient::forward(const Rule& rule, const HttpRequest& request, int clientFd) const {
    UpstreamResult result;
    const ProxyTarget& target = rule.proxy;
    std::string upstreamName = target.upstreamHost + ":" + std::to_string(target.upstreamPort);

    Socket upstream;
    try {
        upstream = connectTo(target.upstreamHost, target.upstreamPort, connectTimeoutMs_);
        setTimeouts(upstream.get(), readTimeoutMs_);
    } catch (const std::runtime_error& e) {
        result.statusCode = 502;
        result.error = e.what();
        return result;
    }

    std::string requestStr = buildUpstreamRequest(rule, request);
    if (!sendAll(upstream.get(), requestStr)) {
        result.statusCode = 502;
        result.error = errnoMessage("send to " + upstreamName);
        return result;
    }

    std::string statusLine;
    char buffer[8192];
    while (true) {
        ssize_t bytesRead = recvSome(upstream.get(), buffer, sizeof(buffer));
        if (bytesRead < 0) {
            bool timedOut = errno == EAGAIN || errno == EWOULDBLOCK;
            if (!result.responded) {
                result.statusCode = timedOut ? 504 : 502;
                result.error = timedOut ? "upstream " + upstreamName + " timed out"
                                        : errnoMessage("recv from " + upstreamName);
            } else {
                result.error = timedOut ? "upstream timed out mid-response"
                                        : errnoMessage("recv from " + upstreamName);
            }
            break;
        }
        if (bytesRead == 0) {
            if (!result.responded) {
                result.statusCode = 502;
                result.error = "upstream " + upstreamName + " closed without a response";
            }
            break;
        }

        if (statusLine.size() < 16) {
            statusLine.append(buffer, std::min(static_cast<size_t>(bytesRead), 16 - statusLine.size()));
            result.statusCode = extractStatusCode(statusLine);
        }
        result.responded = true;
        if (!sendAll(clientFd, buffer, static_cast<size_t>(bytesRead))) {
            result.error = "client went away";
            break;
        }
        result.bytesRelayed += static_cast<size_t>(bytesRead);
    }

    if (!result.error.empty()) {
        logDebug("upstream " + upstreamName + ": " + result.error);
    }
    return result;
}

} // namespace gateway
