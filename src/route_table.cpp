#include "route_table.hpp"
#include <algorithm>

namespace gateway {

Rule Rule::makeProxy(const std::string& prefix, const std::string& host, int port,
                     const std::string& upstreamPrefix) {
    Rule rule;
    rule.pathPrefix = prefix;
    rule.kind = RuleKind::Proxy;
    rule.proxy.upstreamHost = host;
    rule.proxy.upstreamPort = port;
    rule.proxy.upstreamPathPrefix = upstreamPrefix;
    return rule;
}

Rule Rule::makeStatic(const std::string& prefix, const std::string& dir, bool isAlias,
                      const std::string& fallbackFile) {
    Rule rule;
    rule.pathPrefix = prefix;
    rule.kind = RuleKind::Static;
    rule.files.rootOrAliasDir = dir;
    rule.files.isAlias = isAlias;
    rule.files.fallbackFile = fallbackFile;
    return rule;
}

std::string Rule::describe() const {
    if (kind == RuleKind::Proxy) {
        return "proxy -> " + proxy.upstreamHost + ":" + std::to_string(proxy.upstreamPort) +
               proxy.upstreamPathPrefix;
    }
    std::string out = (files.isAlias ? "alias " : "root ") + files.rootOrAliasDir;
    if (!files.fallbackFile.empty()) {
        out += " (fallback " + files.fallbackFile + ")";
    }
    return out;
}

void RuleSet::add(Rule rule) {
    if (rule.pathPrefix.empty() || rule.pathPrefix[0] != '/') {
        throw std::invalid_argument("location prefix must start with '/': \"" + rule.pathPrefix + "\"");
    }
    for (const Rule& existing : rules_) {
        if (existing.pathPrefix == rule.pathPrefix) {
            throw std::invalid_argument("duplicate location \"" + rule.pathPrefix + "\"");
        }
    }
    rules_.push_back(std::move(rule));
}

bool RuleSet::hasCatchAll() const {
    return std::any_of(rules_.begin(), rules_.end(),
                       [](const Rule& rule) { return rule.pathPrefix == "/"; });
}

PathRouter::PathRouter(RuleSet rules) : rules_(std::move(rules)) {
    for (const Rule& rule : rules_.rules()) {
        byPriority_.push_back(&rule);
    }
    std::stable_sort(byPriority_.begin(), byPriority_.end(),
                     [](const Rule* a, const Rule* b) {
                         return a->pathPrefix.size() > b->pathPrefix.size();
                     });
}

const Rule& PathRouter::route(const std::string& path) const {
    for (const Rule* rule : byPriority_) {
        const std::string& prefix = rule->pathPrefix;
        if (path.compare(0, prefix.size(), prefix) == 0) {
            return *rule;
        }
    }
    throw RouteNotFound(path);
}

std::optional<std::string> PathRouter::redirectFor(const std::string& path) const {
    for (const Rule* rule : byPriority_) {
        if (rule->kind != RuleKind::Proxy) continue;
        const std::string& prefix = rule->pathPrefix;
        if (prefix.size() > 1 && prefix.back() == '/' &&
            prefix.compare(0, prefix.size() - 1, path) == 0 && path.size() == prefix.size() - 1) {
            return prefix;
        }
    }
    return std::nullopt;
}

} // namespace gateway
