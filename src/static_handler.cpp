#include "static_handler.hpp"
#include <sys/stat.h>
#include <cerrno>
#include <fstream>
#include <sstream>

namespace gateway {

namespace {

enum class FileKind { Regular, Directory, Missing, Denied };

FileKind probe(const std::string& path, struct stat* info = nullptr) {
    struct stat st;
    if (stat(path.c_str(), &st) != 0) {
        return errno == EACCES ? FileKind::Denied : FileKind::Missing;
    }
    if (info) {
        *info = st;
    }
    if (S_ISREG(st.st_mode)) return FileKind::Regular;
    if (S_ISDIR(st.st_mode)) return FileKind::Directory;
    return FileKind::Missing;
}

// Joins without doubling or dropping the separator.
std::string joinPath(const std::string& dir, const std::string& rest) {
    if (rest.empty()) {
        return dir;
    }
    bool dirSlash = !dir.empty() && dir.back() == '/';
    bool restSlash = rest[0] == '/';
    if (dirSlash && restSlash) {
        return dir + rest.substr(1);
    }
    if (!dirSlash && !restSlash) {
        return dir + "/" + rest;
    }
    return dir + rest;
}

bool readFile(const std::string& path, std::string& out) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return false;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    out = buffer.str();
    return true;
}

std::string lowerExtension(const std::string& path) {
    size_t slash = path.find_last_of('/');
    size_t dot = path.find_last_of('.');
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
        return "";
    }
    return toLower(path.substr(dot + 1));
}

} // namespace

std::string mapToFilesystem(const Rule& rule, const std::string& path) {
    const StaticTarget& files = rule.files;
    if (files.isAlias) {
        std::string rest = path.size() > rule.pathPrefix.size() ? path.substr(rule.pathPrefix.size()) : "";
        return joinPath(files.rootOrAliasDir, rest);
    }
    return joinPath(files.rootOrAliasDir, path);
}

std::string fallbackPath(const StaticTarget& files) {
    if (files.fallbackFile.empty()) {
        return "";
    }
    return joinPath(files.rootOrAliasDir, files.fallbackFile);
}

StaticLookup resolveStaticFile(const Rule& rule, const std::string& path) {
    StaticLookup lookup;
    std::string candidate = mapToFilesystem(rule, path);
    bool trailingSlash = !path.empty() && path.back() == '/';
    bool denied = false;

    FileKind kind = probe(candidate);
    if (kind == FileKind::Regular && !trailingSlash) {
        lookup.outcome = StaticLookup::Outcome::File;
        lookup.fsPath = candidate;
        return lookup;
    }
    if (kind == FileKind::Directory) {
        if (!trailingSlash) {
            lookup.outcome = StaticLookup::Outcome::Redirect;
            lookup.fsPath = candidate;
            return lookup;
        }
        std::string index = joinPath(candidate, rule.files.indexFile);
        FileKind indexKind = probe(index);
        if (indexKind == FileKind::Regular) {
            lookup.outcome = StaticLookup::Outcome::File;
            lookup.fsPath = index;
            return lookup;
        }
        denied = indexKind == FileKind::Denied;
    }
    denied = denied || kind == FileKind::Denied;

    std::string fallback = fallbackPath(rule.files);
    if (!fallback.empty() && probe(fallback) == FileKind::Regular) {
        lookup.outcome = StaticLookup::Outcome::File;
        lookup.fsPath = fallback;
        return lookup;
    }

    lookup.outcome = denied ? StaticLookup::Outcome::Forbidden : StaticLookup::Outcome::NotFound;
    return lookup;
}

HttpResponse serveStatic(const Rule& rule, const HttpRequest& request) {
    bool isHead = request.method == "HEAD";
    if (request.method != "GET" && !isHead) {
        HttpResponse response = makeErrorResponse(405, request.method + " is not allowed here");
        response.setHeader("Allow", "GET, HEAD");
        return response;
    }

    StaticLookup lookup = resolveStaticFile(rule, request.path);
    switch (lookup.outcome) {
        case StaticLookup::Outcome::NotFound:
            return makeErrorResponse(404, "");
        case StaticLookup::Outcome::Forbidden:
            return makeErrorResponse(403, "");
        case StaticLookup::Outcome::Redirect: {
            std::string location = encodePath(request.path + "/");
            if (!request.query.empty()) {
                location += "?" + request.query;
            }
            return makeRedirect(301, location);
        }
        case StaticLookup::Outcome::File:
            break;
    }

    struct stat info;
    if (probe(lookup.fsPath, &info) != FileKind::Regular) {
        return makeErrorResponse(404, "");
    }

    HttpResponse response;
    response.setHeader("Content-Type", mimeTypeFor(lookup.fsPath));
    response.setHeader("Last-Modified", formatHttpDate(info.st_mtime));

    const std::string* since = request.header("if-modified-since");
    time_t sinceTime = 0;
    if (since && parseHttpDate(*since, sinceTime) && info.st_mtime <= sinceTime) {
        response.statusCode = 304;
        return response;
    }

    if (isHead) {
        response.setHeader("Content-Length", std::to_string(info.st_size));
        return response;
    }
    if (!readFile(lookup.fsPath, response.body)) {
        return makeErrorResponse(403, "");
    }
    return response;
}

std::string mimeTypeFor(const std::string& path) {
    std::string ext = lowerExtension(path);
    if (ext == "html" || ext == "htm") return "text/html; charset=utf-8";
    if (ext == "css") return "text/css; charset=utf-8";
    if (ext == "js" || ext == "mjs") return "application/javascript";
    if (ext == "json" || ext == "map") return "application/json";
    if (ext == "webmanifest") return "application/manifest+json";
    if (ext == "txt") return "text/plain; charset=utf-8";
    if (ext == "xml") return "application/xml";
    if (ext == "yaml" || ext == "yml") return "application/yaml";
    if (ext == "png") return "image/png";
    if (ext == "jpg" || ext == "jpeg") return "image/jpeg";
    if (ext == "gif") return "image/gif";
    if (ext == "webp") return "image/webp";
    if (ext == "svg") return "image/svg+xml";
    if (ext == "ico") return "image/x-icon";
    if (ext == "woff") return "font/woff";
    if (ext == "woff2") return "font/woff2";
    if (ext == "ttf") return "font/ttf";
    if (ext == "pdf") return "application/pdf";
    return "application/octet-stream";
}

} // namespace gateway
