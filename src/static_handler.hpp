#ifndef GATEWAY_STATIC_HANDLER_HPP
#define GATEWAY_STATIC_HANDLER_HPP

#include "http_message.hpp"
#include "route_table.hpp"
#include <string>

namespace gateway {

struct StaticLookup {
    enum class Outcome {
        File,           // fsPath names a regular file
        Redirect,       // directory requested without trailing slash
        NotFound,
        Forbidden
    };

    Outcome outcome;
    std::string fsPath;

    StaticLookup() : outcome(Outcome::NotFound) {}
};

// Filesystem path for a request path under a static rule: an alias
// replaces the matched prefix, a root has the whole path appended.
std::string mapToFilesystem(const Rule& rule, const std::string& path);

// Path of the rule's fallback document, or empty when none is configured.
std::string fallbackPath(const StaticTarget& files);

// Exact file, then "path/" with its index file, then the fallback.
StaticLookup resolveStaticFile(const Rule& rule, const std::string& path);

// GET/HEAD handling for a static rule: 200, 301, 304, 403, 404 or 405.
HttpResponse serveStatic(const Rule& rule, const HttpRequest& request);

std::string mimeTypeFor(const std::string& path);

} // namespace gateway

#endif // GATEWAY_STATIC_HANDLER_HPP
