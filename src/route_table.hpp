#ifndef GATEWAY_ROUTE_TABLE_HPP
#define GATEWAY_ROUTE_TABLE_HPP

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace gateway {

enum class RuleKind {
    Proxy,
    Static
};

struct ProxyTarget {
    std::string upstreamHost;
    int upstreamPort;
    std::string upstreamPathPrefix;
    // proxy_set_header directives; values may contain $host, $remote_addr,
    // $scheme, $request_uri and $proxy_add_x_forwarded_for.
    std::vector<std::pair<std::string, std::string>> setHeaders;

    ProxyTarget() : upstreamPort(80) {}
};

struct StaticTarget {
    std::string rootOrAliasDir;
    std::string fallbackFile;   // empty when the rule has no fallback
    std::string indexFile;
    bool isAlias;

    StaticTarget() : indexFile("index.html"), isAlias(false) {}
};

struct Rule {
    std::string pathPrefix;
    RuleKind kind;
    ProxyTarget proxy;      // valid when kind == Proxy
    StaticTarget files;     // valid when kind == Static

    Rule() : kind(RuleKind::Static) {}

    static Rule makeProxy(const std::string& prefix, const std::string& host, int port,
                          const std::string& upstreamPrefix);
    static Rule makeStatic(const std::string& prefix, const std::string& dir, bool isAlias,
                           const std::string& fallbackFile = "");

    // "proxy -> backend:7000/api/" or "alias /static/", for logs.
    std::string describe() const;
};

class RouteNotFound : public std::runtime_error {
public:
    explicit RouteNotFound(const std::string& path)
        : std::runtime_error("no route matches " + path) {}
};

// Ordered, immutable-after-build collection of rules in declaration order.
class RuleSet {
public:
    // Throws std::invalid_argument for an empty/relative or duplicate prefix.
    void add(Rule rule);

    const std::vector<Rule>& rules() const { return rules_; }
    size_t size() const { return rules_.size(); }
    bool empty() const { return rules_.empty(); }
    bool hasCatchAll() const;

private:
    std::vector<Rule> rules_;
};

// Longest-prefix matcher over a RuleSet. Stateless after construction, so
// one instance is shared by every connection thread without locking.
class PathRouter {
public:
    explicit PathRouter(RuleSet rules);

    // byPriority_ points into rules_.
    PathRouter(const PathRouter&) = delete;
    PathRouter& operator=(const PathRouter&) = delete;

    // Returns the single matching rule; the longest prefix wins and equal
    // lengths keep declaration order. Throws RouteNotFound.
    const Rule& route(const std::string& path) const;

    // "/admin" for a proxied "/admin/" location yields "/admin/".
    std::optional<std::string> redirectFor(const std::string& path) const;

    const RuleSet& ruleSet() const { return rules_; }

private:
    RuleSet rules_;
    std::vector<const Rule*> byPriority_;
};

} // namespace gateway

#endif // GATEWAY_ROUTE_TABLE_HPP
