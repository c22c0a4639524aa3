/**
 * End-to-end tests: a gateway on an ephemeral port in front of a loopback
 * backend and a temporary static tree.
 */

#include "test_framework.h"
#include "fake_upstream.h"
#include "../src/gateway_server.hpp"
#include "../src/logger.hpp"
#include <sys/stat.h>
#include <cstdlib>
#include <fstream>
#include <memory>
#include <unistd.h>

using namespace gateway;

namespace {

const std::string kBackendResponse =
    "HTTP/1.1 200 OK\r\nContent-Type: application/json\r\nContent-Length: 13\r\n\r\n{\"backend\":1}";

std::unique_ptr<FakeUpstream> g_backend;
std::unique_ptr<GatewayServer> g_server;
std::string g_staticDir;

std::string exchange(const std::string& raw) {
    Socket conn = connectTo("127.0.0.1", g_server->port(), 2000);
    setTimeouts(conn.get(), 5000);
    sendAll(conn.get(), raw);
    std::string response;
    char buffer[8192];
    ssize_t n;
    while ((n = recvSome(conn.get(), buffer, sizeof(buffer))) > 0) {
        response.append(buffer, static_cast<size_t>(n));
    }
    return response;
}

int statusOf(const std::string& response) {
    return extractStatusCode(response);
}

std::string bodyOf(const std::string& response) {
    size_t end = response.find("\r\n\r\n");
    return end == std::string::npos ? "" : response.substr(end + 4);
}

// Port with nothing listening on it.
int closedPort() {
    Socket probe = listenOn("127.0.0.1", 0, 1);
    return localPort(probe.get());
}

bool setUpStaticTree() {
    char pattern[] = "/tmp/gateway_e2e_XXXXXX";
    if (!mkdtemp(pattern)) {
        return false;
    }
    g_staticDir = pattern;
    std::ofstream(g_staticDir + "/index.html") << "<html>foodgram</html>";
    mkdir((g_staticDir + "/media").c_str(), 0755);
    std::ofstream(g_staticDir + "/media/cake.txt") << "cake";
    return true;
}

void tearDownStaticTree() {
    unlink((g_staticDir + "/media/cake.txt").c_str());
    rmdir((g_staticDir + "/media").c_str());
    unlink((g_staticDir + "/index.html").c_str());
    rmdir(g_staticDir.c_str());
}

GatewayConfig testConfig() {
    GatewayConfig config;
    config.listenAddress = "127.0.0.1";
    config.listenPort = 0;
    config.clientTimeoutMs = 2000;
    config.upstreamConnectTimeoutMs = 1000;
    config.upstreamReadTimeoutMs = 2000;
    config.source = "test";

    int backend = g_backend->port();
    config.rules.add(Rule::makeProxy("/api/", "127.0.0.1", backend, "/api/"));
    config.rules.add(Rule::makeProxy("/admin/", "127.0.0.1", backend, "/admin/"));
    config.rules.add(Rule::makeProxy("/s/", "127.0.0.1", closedPort(), "/s/"));
    config.rules.add(Rule::makeStatic("/media/", g_staticDir + "/media/", true));
    config.rules.add(Rule::makeStatic("/", g_staticDir + "/", true, "index.html"));
    return config;
}

} // namespace

TEST(test_admin_request_keeps_client_host) {
    std::string response = exchange("GET /admin/users HTTP/1.1\r\nHost: example.com\r\n\r\n");
    ASSERT_EQ(statusOf(response), 200);
    ASSERT_EQ(bodyOf(response), std::string("{\"backend\":1}"));

    std::string upstream = g_backend->lastRequest();
    ASSERT_EQ(upstream.substr(0, upstream.find("\r\n")), std::string("GET /admin/users HTTP/1.0"));
    ASSERT_CONTAINS(upstream, "\r\nHost: example.com\r\n");
}

TEST(test_api_query_is_forwarded) {
    std::string response = exchange("GET /api/recipes/?limit=6&is_favorited=1 HTTP/1.1\r\nHost: a\r\n\r\n");
    ASSERT_EQ(statusOf(response), 200);
    ASSERT_CONTAINS(g_backend->lastRequest(), "GET /api/recipes/?limit=6&is_favorited=1 HTTP/1.0\r\n");
}

TEST(test_post_body_is_forwarded) {
    std::string response = exchange("POST /api/recipes/ HTTP/1.1\r\nHost: a\r\n"
                                    "Content-Type: application/json\r\nContent-Length: 14\r\n\r\n"
                                    "{\"name\":\"pie\"}");
    ASSERT_EQ(statusOf(response), 200);
    std::string upstream = g_backend->lastRequest();
    ASSERT_CONTAINS(upstream, "\r\nContent-Length: 14\r\n");
    ASSERT_EQ(bodyOf(upstream), std::string("{\"name\":\"pie\"}"));
}

TEST(test_oversized_body_never_reaches_backend) {
    size_t before = g_backend->requestCount();
    std::string response = exchange("POST /api/recipes/ HTTP/1.1\r\nHost: a\r\n"
                                    "Content-Length: 11534336\r\n\r\n");
    ASSERT_EQ(statusOf(response), 413);
    ASSERT_CONTAINS(response, "Connection: close\r\n");
    ASSERT_EQ(g_backend->requestCount(), before);
}

TEST(test_unreachable_backend_is_502) {
    std::string response = exchange("GET /s/3fa2c1 HTTP/1.1\r\nHost: a\r\n\r\n");
    ASSERT_EQ(statusOf(response), 502);
}

TEST(test_static_and_fallback) {
    std::string index = exchange("GET / HTTP/1.1\r\nHost: a\r\n\r\n");
    ASSERT_EQ(statusOf(index), 200);
    ASSERT_EQ(bodyOf(index), std::string("<html>foodgram</html>"));

    std::string spa = exchange("GET /recipes/7 HTTP/1.1\r\nHost: a\r\n\r\n");
    ASSERT_EQ(statusOf(spa), 200);
    ASSERT_EQ(bodyOf(spa), std::string("<html>foodgram</html>"));

    std::string media = exchange("GET /media/cake.txt HTTP/1.1\r\nHost: a\r\n\r\n");
    ASSERT_EQ(statusOf(media), 200);
    ASSERT_EQ(bodyOf(media), std::string("cake"));

    std::string missing = exchange("GET /media/none.jpg HTTP/1.1\r\nHost: a\r\n\r\n");
    ASSERT_EQ(statusOf(missing), 404);
}

TEST(test_head_request_has_no_body) {
    std::string response = exchange("HEAD /media/cake.txt HTTP/1.1\r\nHost: a\r\n\r\n");
    ASSERT_EQ(statusOf(response), 200);
    ASSERT_CONTAINS(response, "Content-Length: 4\r\n");
    ASSERT_EQ(bodyOf(response), std::string(""));
}

TEST(test_proxied_prefix_without_slash_redirects) {
    std::string response = exchange("GET /admin?next=1 HTTP/1.1\r\nHost: a\r\n\r\n");
    ASSERT_EQ(statusOf(response), 301);
    ASSERT_CONTAINS(response, "Location: /admin/?next=1\r\n");
}

TEST(test_bad_requests_are_rejected) {
    ASSERT_EQ(statusOf(exchange("NONSENSE\r\n\r\n")), 400);
    ASSERT_EQ(statusOf(exchange("GET / HTTP/1.1\r\n\r\n")), 400);
    ASSERT_EQ(statusOf(exchange("GET /../etc/passwd HTTP/1.1\r\nHost: a\r\n\r\n")), 400);
    ASSERT_EQ(statusOf(exchange("GET / HTTP/3.0\r\nHost: a\r\n\r\n")), 505);
}

TEST(test_stats_are_counted) {
    GatewayServer::Stats stats = g_server->getStats();
    ASSERT_TRUE(stats.totalRequests >= 10);
    ASSERT_TRUE(stats.proxiedRequests >= 4);
    ASSERT_TRUE(stats.staticRequests >= 4);
    ASSERT_TRUE(stats.rejectedRequests >= 5);
    ASSERT_TRUE(stats.upstreamErrors >= 1);
}

int main() {
    Logger::setLevel(LogLevel::Error);
    Logger::disableAccessLog();

    if (!setUpStaticTree()) {
        std::cerr << RED << "Cannot create temporary directory" << RESET << std::endl;
        return 1;
    }
    g_backend.reset(new FakeUpstream(kBackendResponse));
    g_server.reset(new GatewayServer(testConfig()));
    g_server->listen();
    std::thread serverThread([] { g_server->run(); });

    std::cout << YELLOW << "Proxy Tests:" << RESET << std::endl;
    RUN_TEST(test_admin_request_keeps_client_host);
    RUN_TEST(test_api_query_is_forwarded);
    RUN_TEST(test_post_body_is_forwarded);
    RUN_TEST(test_oversized_body_never_reaches_backend);
    RUN_TEST(test_unreachable_backend_is_502);

    std::cout << YELLOW << "Static Tests:" << RESET << std::endl;
    RUN_TEST(test_static_and_fallback);
    RUN_TEST(test_head_request_has_no_body);

    std::cout << YELLOW << "Protocol Tests:" << RESET << std::endl;
    RUN_TEST(test_proxied_prefix_without_slash_redirects);
    RUN_TEST(test_bad_requests_are_rejected);
    RUN_TEST(test_stats_are_counted);

    g_server->stop();
    serverThread.join();
    g_server.reset();
    g_backend.reset();
    tearDownStaticTree();

    std::cout << std::endl;
    TestFramework::getInstance().printSummary();
    return TestFramework::getInstance().getExitCode();
}
