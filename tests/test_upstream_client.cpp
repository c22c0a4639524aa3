/**
 * Upstream tests: URI rewriting, request building and response relaying
 * against a loopback backend.
 */

#include "test_framework.h"
#include "fake_upstream.h"
#include "../src/upstream_client.hpp"
#include <sys/socket.h>

using namespace gateway;

namespace {

const std::string kOkResponse =
    "HTTP/1.1 201 Created\r\nContent-Type: application/json\r\nContent-Length: 9\r\n\r\n{\"id\": 1}";

HttpRequest makeRequest(const std::string& head) {
    HttpRequest request = parseRequestHead(head);
    request.remoteAddress = "10.1.2.3";
    return request;
}

// Port with nothing listening on it.
int closedPort() {
    Socket probe = listenOn("127.0.0.1", 0, 1);
    return localPort(probe.get());
}

std::string drain(int fd) {
    std::string out;
    char buffer[4096];
    ssize_t n;
    while ((n = recvSome(fd, buffer, sizeof(buffer))) > 0) {
        out.append(buffer, static_cast<size_t>(n));
    }
    return out;
}

} // namespace

// ============================================
// URI rewriting
// ============================================

TEST(test_same_prefix_rewrite_is_identity) {
    Rule api = Rule::makeProxy("/api/", "backend", 7000, "/api/");
    ASSERT_EQ(rewriteUpstreamUri(api, makeRequest("GET /api/recipes/?limit=6 HTTP/1.1\r\nHost: a")),
              std::string("/api/recipes/?limit=6"));

    Rule admin = Rule::makeProxy("/admin/", "backend", 7000, "/admin/");
    ASSERT_EQ(rewriteUpstreamUri(admin, makeRequest("GET /admin/users HTTP/1.1\r\nHost: a")),
              std::string("/admin/users"));
}

TEST(test_prefix_replacement) {
    Rule rule = Rule::makeProxy("/v1/", "backend", 7000, "/api/");
    ASSERT_EQ(rewriteUpstreamUri(rule, makeRequest("GET /v1/users/me/ HTTP/1.1\r\nHost: a")),
              std::string("/api/users/me/"));

    Rule toRoot = Rule::makeProxy("/s/", "backend", 7000, "/");
    ASSERT_EQ(rewriteUpstreamUri(toRoot, makeRequest("GET /s/abc HTTP/1.1\r\nHost: a")),
              std::string("/abc"));
}

TEST(test_decoded_characters_are_reencoded) {
    Rule rule = Rule::makeProxy("/api/", "backend", 7000, "/api/");
    ASSERT_EQ(rewriteUpstreamUri(rule, makeRequest("GET /api/tags/a%20b HTTP/1.1\r\nHost: a")),
              std::string("/api/tags/a%20b"));
}

// ============================================
// Variables
// ============================================

TEST(test_expand_proxy_variables) {
    HttpRequest request = makeRequest("GET /api/x?y=1 HTTP/1.1\r\nHost: Example.com:8080\r\n"
                                      "X-Forwarded-For: 192.168.0.9");
    ASSERT_EQ(expandProxyVariables("$host", request), std::string("example.com"));
    ASSERT_EQ(expandProxyVariables("$http_host", request), std::string("Example.com:8080"));
    ASSERT_EQ(expandProxyVariables("$remote_addr", request), std::string("10.1.2.3"));
    ASSERT_EQ(expandProxyVariables("$scheme://$host$request_uri", request),
              std::string("http://example.com/api/x?y=1"));
    ASSERT_EQ(expandProxyVariables("$proxy_add_x_forwarded_for", request),
              std::string("192.168.0.9, 10.1.2.3"));
    ASSERT_EQ(expandProxyVariables("no variables", request), std::string("no variables"));
}

TEST(test_check_proxy_variables) {
    std::string unknown;
    ASSERT_TRUE(checkProxyVariables("$host:$remote_addr", unknown));
    ASSERT_FALSE(checkProxyVariables("$hostname", unknown));
    ASSERT_EQ(unknown, std::string("$hostname"));
}

// ============================================
// Request building
// ============================================

TEST(test_host_header_is_preserved) {
    Rule admin = Rule::makeProxy("/admin/", "backend", 7000, "/admin/");
    std::string text = buildUpstreamRequest(admin,
        makeRequest("GET /admin/users HTTP/1.1\r\nHost: example.com\r\nAccept: */*"));
    ASSERT_EQ(text.substr(0, text.find("\r\n")), std::string("GET /admin/users HTTP/1.0"));
    ASSERT_CONTAINS(text, "\r\nHost: example.com\r\n");
    ASSERT_TRUE(text.find("backend") == std::string::npos);
    ASSERT_CONTAINS(text, "\r\naccept: */*\r\n");
    ASSERT_CONTAINS(text, "Connection: close\r\n\r\n");
}

TEST(test_missing_host_uses_upstream_name) {
    Rule api = Rule::makeProxy("/api/", "backend", 7000, "/api/");
    std::string text = buildUpstreamRequest(api, makeRequest("GET /api/ HTTP/1.0"));
    ASSERT_CONTAINS(text, "\r\nHost: backend:7000\r\n");
}

TEST(test_set_headers_override_and_remove) {
    Rule api = Rule::makeProxy("/api/", "backend", 7000, "/api/");
    api.proxy.setHeaders.emplace_back("Host", "$host");
    api.proxy.setHeaders.emplace_back("X-Real-IP", "$remote_addr");
    api.proxy.setHeaders.emplace_back("Accept-Encoding", "");
    std::string text = buildUpstreamRequest(api,
        makeRequest("GET /api/ HTTP/1.1\r\nHost: Foodgram.org:443\r\nAccept-Encoding: gzip\r\n"
                    "X-Real-IP: spoofed"));
    ASSERT_CONTAINS(text, "\r\nHost: foodgram.org\r\n");
    ASSERT_CONTAINS(text, "\r\nX-Real-IP: 10.1.2.3\r\n");
    ASSERT_TRUE(text.find("spoofed") == std::string::npos);
    ASSERT_TRUE(text.find("gzip") == std::string::npos);
}

TEST(test_hop_by_hop_headers_are_dropped) {
    Rule api = Rule::makeProxy("/api/", "backend", 7000, "/api/");
    HttpRequest request = makeRequest(
        "POST /api/recipes/ HTTP/1.1\r\nHost: a\r\nConnection: keep-alive, X-Session\r\n"
        "Keep-Alive: timeout=5\r\nX-Session: secret\r\nUpgrade: websocket\r\n"
        "Transfer-Encoding: chunked\r\nAuthorization: Token abc");
    request.body = "{\"name\": \"cake\"}";

    std::string text = buildUpstreamRequest(api, request);
    ASSERT_TRUE(text.find("keep-alive") == std::string::npos);
    ASSERT_TRUE(text.find("secret") == std::string::npos);
    ASSERT_TRUE(text.find("websocket") == std::string::npos);
    ASSERT_TRUE(text.find("chunked") == std::string::npos);
    ASSERT_CONTAINS(text, "\r\nauthorization: Token abc\r\n");
    ASSERT_CONTAINS(text, "\r\nContent-Length: 16\r\n");
    ASSERT_EQ(text.substr(text.size() - 16), request.body);
}

TEST(test_empty_post_keeps_zero_length) {
    Rule api = Rule::makeProxy("/api/", "backend", 7000, "/api/");
    std::string text = buildUpstreamRequest(api,
        makeRequest("POST /api/auth/token/logout/ HTTP/1.1\r\nHost: a\r\nContent-Length: 0"));
    ASSERT_CONTAINS(text, "\r\nContent-Length: 0\r\n");

    std::string get = buildUpstreamRequest(api, makeRequest("GET /api/ HTTP/1.1\r\nHost: a"));
    ASSERT_TRUE(get.find("Content-Length") == std::string::npos);
}

// ============================================
// Forwarding
// ============================================

TEST(test_forward_relays_response) {
    FakeUpstream backend(kOkResponse);
    Rule api = Rule::makeProxy("/api/", "127.0.0.1", backend.port(), "/api/");
    UpstreamClient client(1000, 1000);

    int fds[2];
    ASSERT_EQ(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds), 0);
    Socket gatewaySide(fds[0]);
    Socket clientSide(fds[1]);

    UpstreamResult result = client.forward(api,
        makeRequest("GET /api/recipes/ HTTP/1.1\r\nHost: example.com"), gatewaySide.get());
    gatewaySide.close();

    ASSERT_TRUE(result.responded);
    ASSERT_EQ(result.statusCode, 201);
    ASSERT_EQ(result.bytesRelayed, kOkResponse.size());
    ASSERT_EQ(drain(clientSide.get()), kOkResponse);
    ASSERT_CONTAINS(backend.lastRequest(), "GET /api/recipes/ HTTP/1.0\r\n");
    ASSERT_CONTAINS(backend.lastRequest(), "Host: example.com\r\n");
}

TEST(test_unreachable_upstream_is_502) {
    Rule api = Rule::makeProxy("/api/", "127.0.0.1", closedPort(), "/api/");
    UpstreamClient client(1000, 1000);
    int fds[2];
    ASSERT_EQ(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds), 0);
    Socket gatewaySide(fds[0]);
    Socket clientSide(fds[1]);

    UpstreamResult result = client.forward(api, makeRequest("GET /api/ HTTP/1.1\r\nHost: a"),
                                           gatewaySide.get());
    ASSERT_FALSE(result.responded);
    ASSERT_EQ(result.statusCode, 502);
    ASSERT_EQ(result.bytesRelayed, static_cast<size_t>(0));
    ASSERT_FALSE(result.error.empty());
}

TEST(test_empty_upstream_reply_is_502) {
    FakeUpstream backend("");
    Rule api = Rule::makeProxy("/api/", "127.0.0.1", backend.port(), "/api/");
    UpstreamClient client(1000, 1000);
    int fds[2];
    ASSERT_EQ(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds), 0);
    Socket gatewaySide(fds[0]);
    Socket clientSide(fds[1]);

    UpstreamResult result = client.forward(api, makeRequest("GET /api/ HTTP/1.1\r\nHost: a"),
                                           gatewaySide.get());
    ASSERT_FALSE(result.responded);
    ASSERT_EQ(result.statusCode, 502);
}

TEST(test_slow_upstream_is_504) {
    FakeUpstream backend(kOkResponse, 800);
    Rule api = Rule::makeProxy("/api/", "127.0.0.1", backend.port(), "/api/");
    UpstreamClient client(1000, 200);
    int fds[2];
    ASSERT_EQ(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds), 0);
    Socket gatewaySide(fds[0]);
    Socket clientSide(fds[1]);

    UpstreamResult result = client.forward(api, makeRequest("GET /api/ HTTP/1.1\r\nHost: a"),
                                           gatewaySide.get());
    ASSERT_FALSE(result.responded);
    ASSERT_EQ(result.statusCode, 504);
}

int main() {
    std::cout << YELLOW << "URI Rewrite Tests:" << RESET << std::endl;
    RUN_TEST(test_same_prefix_rewrite_is_identity);
    RUN_TEST(test_prefix_replacement);
    RUN_TEST(test_decoded_characters_are_reencoded);

    std::cout << YELLOW << "Variable Tests:" << RESET << std::endl;
    RUN_TEST(test_expand_proxy_variables);
    RUN_TEST(test_check_proxy_variables);

    std::cout << YELLOW << "Upstream Request Tests:" << RESET << std::endl;
    RUN_TEST(test_host_header_is_preserved);
    RUN_TEST(test_missing_host_uses_upstream_name);
    RUN_TEST(test_set_headers_override_and_remove);
    RUN_TEST(test_hop_by_hop_headers_are_dropped);
    RUN_TEST(test_empty_post_keeps_zero_length);

    std::cout << YELLOW << "Forwarding Tests:" << RESET << std::endl;
    RUN_TEST(test_forward_relays_response);
    RUN_TEST(test_unreachable_upstream_is_502);
    RUN_TEST(test_empty_upstream_reply_is_502);
    RUN_TEST(test_slow_upstream_is_504);

    std::cout << std::endl;
    TestFramework::getInstance().printSummary();
    return TestFramework::getInstance().getExitCode();
}
