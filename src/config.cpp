#include "config.hpp"
#include "upstream_client.hpp"
#include <cctype>
#include <fstream>
#include <limits>
#include <sstream>

namespace gateway {

namespace {

const size_t kMiB = 1024 * 1024;

struct Token {
    enum Type { Word, LBrace, RBrace, Semi, End } type;
    std::string text;
    int line;
};

class Lexer {
public:
    Lexer(const std::string& src, const std::string& source)
        : src_(src), source_(source), pos_(0), line_(1) {}

    Token next() {
        skipSpaceAndComments();
        if (pos_ >= src_.size()) {
            return Token{Token::End, "", line_};
        }
        char ch = src_[pos_];
        if (ch == '{') { ++pos_; return Token{Token::LBrace, "{", line_}; }
        if (ch == '}') { ++pos_; return Token{Token::RBrace, "}", line_}; }
        if (ch == ';') { ++pos_; return Token{Token::Semi, ";", line_}; }
        if (ch == '"' || ch == '\'') {
            return quoted(ch);
        }
        int line = line_;
        std::string word;
        while (pos_ < src_.size()) {
            char c = src_[pos_];
            if (std::isspace(static_cast<unsigned char>(c)) || c == '{' || c == '}' ||
                c == ';' || c == '#') {
                break;
            }
            word += c;
            ++pos_;
        }
        return Token{Token::Word, word, line};
    }

private:
    const std::string& src_;
    std::string source_;
    size_t pos_;
    int line_;

    void skipSpaceAndComments() {
        while (pos_ < src_.size()) {
            char ch = src_[pos_];
            if (ch == '\n') {
                ++line_;
                ++pos_;
            } else if (std::isspace(static_cast<unsigned char>(ch))) {
                ++pos_;
            } else if (ch == '#') {
                while (pos_ < src_.size() && src_[pos_] != '\n') ++pos_;
            } else {
                break;
            }
        }
    }

    Token quoted(char quote) {
        int line = line_;
        ++pos_;
        std::string word;
        while (pos_ < src_.size() && src_[pos_] != quote) {
            if (src_[pos_] == '\n') ++line_;
            if (src_[pos_] == '\\' && pos_ + 1 < src_.size()) ++pos_;
            word += src_[pos_++];
        }
        if (pos_ >= src_.size()) {
            throw ConfigError(source_, line, "unterminated quoted string");
        }
        ++pos_;
        return Token{Token::Word, word, line};
    }
};

struct LocationBlock {
    std::string prefix;
    int line = 0;
    std::string proxyPass;
    std::vector<std::pair<std::string, std::string>> setHeaders;
    std::string root;
    std::string alias;
    std::vector<std::string> tryFiles;
    std::string index;
};

class Parser {
public:
    Parser(const std::string& text, const std::string& source)
        : lexer_(text, source), source_(source) {
        advance();
    }

    GatewayConfig parse() {
        GatewayConfig config;
        config.source = source_;
        bool seenServer = false;

        while (look_.type != Token::End) {
            if (look_.type != Token::Word || look_.text != "server") {
                fail("expected \"server\" block, got \"" + look_.text + "\"");
            }
            if (seenServer) {
                fail("only one server block is supported");
            }
            seenServer = true;
            advance();
            expect(Token::LBrace, "\"{\" after server");
            parseServer(config);
        }
        if (!seenServer) {
            throw ConfigError(source_, look_.line, "no server block found");
        }
        return config;
    }

private:
    Lexer lexer_;
    std::string source_;
    Token look_;

    void advance() { look_ = lexer_.next(); }

    [[noreturn]] void fail(const std::string& message) const {
        throw ConfigError(source_, look_.line, message);
    }

    void expect(Token::Type type, const std::string& what) {
        if (look_.type != type) {
            fail("expected " + what);
        }
        advance();
    }

    // Collects the arguments of a simple directive up to its ';'.
    std::vector<std::string> arguments(const std::string& directive, size_t minArgs, size_t maxArgs) {
        int line = look_.line;
        std::vector<std::string> args;
        while (look_.type == Token::Word) {
            args.push_back(look_.text);
            advance();
        }
        if (look_.type != Token::Semi) {
            fail("directive \"" + directive + "\" is not terminated by \";\"");
        }
        advance();
        if (args.size() < minArgs || args.size() > maxArgs) {
            throw ConfigError(source_, line, "invalid number of arguments in \"" + directive + "\"");
        }
        return args;
    }

    void parseServer(GatewayConfig& config) {
        std::vector<LocationBlock> locations;

        while (look_.type != Token::RBrace) {
            if (look_.type == Token::End) {
                fail("unexpected end of file, expecting \"}\"");
            }
            if (look_.type != Token::Word) {
                fail("unexpected \"" + look_.text + "\"");
            }
            std::string directive = look_.text;
            int line = look_.line;
            advance();

            if (directive == "location") {
                locations.push_back(parseLocation(line));
            } else if (directive == "listen") {
                std::vector<std::string> args = arguments(directive, 1, 2);
                parseListen(args[0], line, config);
            } else if (directive == "server_name") {
                config.serverNames = arguments(directive, 1, 16);
            } else if (directive == "client_max_body_size") {
                std::vector<std::string> args = arguments(directive, 1, 1);
                if (!parseSize(args[0], config.maxBodySize)) {
                    throw ConfigError(source_, line, "invalid size \"" + args[0] + "\"");
                }
            } else if (directive == "client_header_buffer_size") {
                std::vector<std::string> args = arguments(directive, 1, 1);
                if (!parseSize(args[0], config.maxHeaderSize) || config.maxHeaderSize == 0) {
                    throw ConfigError(source_, line, "invalid size \"" + args[0] + "\"");
                }
            } else if (directive == "client_timeout" || directive == "client_header_timeout" ||
                       directive == "client_body_timeout") {
                config.clientTimeoutMs = durationArgument(directive, line);
            } else if (directive == "proxy_connect_timeout") {
                config.upstreamConnectTimeoutMs = durationArgument(directive, line);
            } else if (directive == "proxy_read_timeout") {
                config.upstreamReadTimeoutMs = durationArgument(directive, line);
            } else if (directive == "error_log") {
                std::vector<std::string> args = arguments(directive, 1, 2);
                config.errorLogPath = args[0];
                if (args.size() == 2 && !parseLogLevel(args[1], config.errorLogLevel)) {
                    throw ConfigError(source_, line, "unknown log level \"" + args[1] + "\"");
                }
            } else if (directive == "access_log") {
                std::vector<std::string> args = arguments(directive, 1, 1);
                config.accessLogEnabled = args[0] != "off";
                config.accessLogPath = config.accessLogEnabled ? args[0] : "";
            } else {
                throw ConfigError(source_, line, "unknown directive \"" + directive + "\"");
            }
        }
        advance();

        if (locations.empty()) {
            fail("server block has no locations");
        }
        for (const LocationBlock& block : locations) {
            try {
                config.rules.add(buildRule(block));
            } catch (const std::invalid_argument& e) {
                throw ConfigError(source_, block.line, e.what());
            }
        }
    }

    int durationArgument(const std::string& directive, int line) {
        std::vector<std::string> args = arguments(directive, 1, 1);
        int value = 0;
        if (!parseDurationMs(args[0], value) || value <= 0) {
            throw ConfigError(source_, line, "invalid time \"" + args[0] + "\"");
        }
        return value;
    }

    void parseListen(const std::string& value, int line, GatewayConfig& config) {
        std::string address;
        std::string port = value;
        size_t colon = value.rfind(':');
        if (colon != std::string::npos) {
            address = value.substr(0, colon);
            port = value.substr(colon + 1);
            if (address.size() >= 2 && address.front() == '[' && address.back() == ']') {
                address = address.substr(1, address.size() - 2);
            }
        }
        if (port.empty() || port.size() > 5 ||
            port.find_first_not_of("0123456789") != std::string::npos) {
            throw ConfigError(source_, line, "invalid port in \"" + value + "\"");
        }
        int portNumber = std::stoi(port);
        if (portNumber > 65535) {
            throw ConfigError(source_, line, "invalid port in \"" + value + "\"");
        }
        config.listenAddress = address;
        config.listenPort = portNumber;
    }

    LocationBlock parseLocation(int line) {
        LocationBlock block;
        block.line = line;
        if (look_.type != Token::Word) {
            fail("location prefix expected");
        }
        if (look_.text == "=" || look_.text == "~" || look_.text == "~*" || look_.text == "^~" ||
            look_.text == "@") {
            fail("location modifier \"" + look_.text + "\" is not supported");
        }
        block.prefix = look_.text;
        advance();
        expect(Token::LBrace, "\"{\" after location prefix");

        while (look_.type != Token::RBrace) {
            if (look_.type == Token::End) {
                fail("unexpected end of file, expecting \"}\"");
            }
            if (look_.type != Token::Word) {
                fail("unexpected \"" + look_.text + "\"");
            }
            std::string directive = look_.text;
            int directiveLine = look_.line;
            advance();

            if (directive == "proxy_pass") {
                block.proxyPass = arguments(directive, 1, 1)[0];
            } else if (directive == "proxy_set_header") {
                std::vector<std::string> args = arguments(directive, 2, 2);
                block.setHeaders.emplace_back(args[0], args[1]);
            } else if (directive == "root") {
                block.root = arguments(directive, 1, 1)[0];
            } else if (directive == "alias") {
                block.alias = arguments(directive, 1, 1)[0];
            } else if (directive == "try_files") {
                block.tryFiles = arguments(directive, 2, 8);
            } else if (directive == "index") {
                block.index = arguments(directive, 1, 1)[0];
            } else {
                throw ConfigError(source_, directiveLine, "unknown directive \"" + directive + "\"");
            }
        }
        advance();
        return block;
    }

    Rule buildRule(const LocationBlock& block) {
        bool isProxy = !block.proxyPass.empty();
        bool isStatic = !block.root.empty() || !block.alias.empty();

        if (isProxy && isStatic) {
            throw ConfigError(source_, block.line,
                              "location \"" + block.prefix + "\" mixes proxy_pass with root/alias");
        }
        if (!isProxy && !isStatic) {
            throw ConfigError(source_, block.line,
                              "location \"" + block.prefix + "\" needs proxy_pass, root or alias");
        }

        if (isProxy) {
            if (!block.tryFiles.empty() || !block.index.empty()) {
                throw ConfigError(source_, block.line,
                                  "try_files/index are not allowed with proxy_pass");
            }
            Rule rule = proxyRule(block);
            for (const auto& setHeader : block.setHeaders) {
                std::string unknown;
                if (!checkProxyVariables(setHeader.second, unknown)) {
                    throw ConfigError(source_, block.line, "unknown variable \"" + unknown + "\"");
                }
            }
            rule.proxy.setHeaders = block.setHeaders;
            return rule;
        }

        if (!block.root.empty() && !block.alias.empty()) {
            throw ConfigError(source_, block.line, "\"alias\" and \"root\" are both specified");
        }
        if (!block.setHeaders.empty()) {
            throw ConfigError(source_, block.line, "proxy_set_header without proxy_pass");
        }
        bool isAlias = !block.alias.empty();
        Rule rule = Rule::makeStatic(block.prefix, isAlias ? block.alias : block.root, isAlias,
                                     fallbackFrom(block.tryFiles));
        if (!block.index.empty()) {
            rule.files.indexFile = block.index;
        }
        return rule;
    }

    Rule proxyRule(const LocationBlock& block) {
        const std::string scheme = "http://";
        const std::string& url = block.proxyPass;
        if (url.compare(0, scheme.size(), scheme) != 0) {
            throw ConfigError(source_, block.line, "proxy_pass must be an http:// URL: \"" + url + "\"");
        }
        size_t hostStart = scheme.size();
        size_t pathStart = url.find('/', hostStart);
        std::string authority = url.substr(hostStart,
            pathStart == std::string::npos ? std::string::npos : pathStart - hostStart);
        // Without a URI part the original path is passed through unchanged.
        std::string upstreamPrefix = pathStart == std::string::npos ? block.prefix : url.substr(pathStart);

        std::string host = authority;
        int port = 80;
        size_t colon = authority.rfind(':');
        if (colon != std::string::npos && authority.find(']', colon) == std::string::npos) {
            host = authority.substr(0, colon);
            std::string portText = authority.substr(colon + 1);
            if (portText.empty() || portText.size() > 5 ||
                portText.find_first_not_of("0123456789") != std::string::npos ||
                std::stoi(portText) == 0 || std::stoi(portText) > 65535) {
                throw ConfigError(source_, block.line, "invalid port in proxy_pass \"" + url + "\"");
            }
            port = std::stoi(portText);
        }
        if (host.size() >= 2 && host.front() == '[' && host.back() == ']') {
            host = host.substr(1, host.size() - 2);
        }
        if (host.empty()) {
            throw ConfigError(source_, block.line, "no host in proxy_pass \"" + url + "\"");
        }
        return Rule::makeProxy(block.prefix, host, port, upstreamPrefix);
    }

    // try_files $uri $uri/ /index.html   -> "index.html"
    // try_files $uri $uri/redoc.html     -> "redoc.html"
    // try_files $uri =404                -> no fallback
    static std::string fallbackFrom(const std::vector<std::string>& tryFiles) {
        if (tryFiles.empty()) {
            return "";
        }
        std::string last = tryFiles.back();
        if (last == "$uri" || last == "$uri/" || last[0] == '=') {
            return "";
        }
        if (last.compare(0, 5, "$uri/") == 0) {
            return last.substr(5);
        }
        size_t start = last.find_first_not_of('/');
        return start == std::string::npos ? "" : last.substr(start);
    }
};

} // namespace

GatewayConfig::GatewayConfig()
    : listenPort(80),
      maxBodySize(10 * kMiB),
      maxHeaderSize(16 * 1024),
      clientTimeoutMs(60000),
      upstreamConnectTimeoutMs(60000),
      upstreamReadTimeoutMs(60000),
      errorLogLevel(LogLevel::Info),
      accessLogEnabled(true),
      source("<built-in>") {
}

GatewayConfig defaultConfig() {
    GatewayConfig config;
    config.rules.add(Rule::makeProxy("/api/", "backend", 7000, "/api/"));
    config.rules.add(Rule::makeProxy("/admin/", "backend", 7000, "/admin/"));
    config.rules.add(Rule::makeProxy("/s/", "backend", 7000, "/s/"));
    config.rules.add(Rule::makeStatic("/api/docs/", "/usr/share/nginx/html", false, "redoc.html"));
    config.rules.add(Rule::makeStatic("/media/", "/var/www/foodgram/media/", true));
    config.rules.add(Rule::makeStatic("/", "/static/", true, "index.html"));
    return config;
}

GatewayConfig loadConfigFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError(path, 0, "cannot open configuration file");
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return parseConfig(buffer.str(), path);
}

GatewayConfig parseConfig(const std::string& text, const std::string& sourceName) {
    Parser parser(text, sourceName);
    return parser.parse();
}

bool parseSize(const std::string& text, size_t& out) {
    if (text.empty()) {
        return false;
    }
    size_t multiplier = 1;
    std::string digits = text;
    char suffix = static_cast<char>(std::tolower(static_cast<unsigned char>(text.back())));
    if (suffix == 'k') multiplier = 1024;
    else if (suffix == 'm') multiplier = kMiB;
    else if (suffix == 'g') multiplier = 1024 * kMiB;
    if (multiplier != 1) {
        digits.pop_back();
    }
    if (digits.empty() || digits.size() > 12 ||
        digits.find_first_not_of("0123456789") != std::string::npos) {
        return false;
    }
    out = static_cast<size_t>(std::stoull(digits)) * multiplier;
    return true;
}

bool parseDurationMs(const std::string& text, int& out) {
    std::string digits = text;
    long long multiplier = 1000;
    if (text.size() > 2 && text.compare(text.size() - 2, 2, "ms") == 0) {
        multiplier = 1;
        digits = text.substr(0, text.size() - 2);
    } else if (!text.empty() && text.back() == 's') {
        digits.pop_back();
    } else if (!text.empty() && text.back() == 'm') {
        multiplier = 60000;
        digits.pop_back();
    }
    if (digits.empty() || digits.size() > 7 ||
        digits.find_first_not_of("0123456789") != std::string::npos) {
        return false;
    }
    long long value = std::stoll(digits) * multiplier;
    if (value > std::numeric_limits<int>::max()) {
        return false;
    }
    out = static_cast<int>(value);
    return true;
}

} // namespace gateway
