#include <catch2/catch_all.hpp>
#include <algorithm>
#include <atomic>
#include <cctype>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
#include "network/PageFetcher.hpp"

using namespace LinkScope;

namespace {

std::string HttpResponse(int status, const std::string& reason, const std::string& body,
                         const std::string& extra_headers = "") {
    return "HTTP/1.1 " + std::to_string(status) + " " + reason + "\r\n"
           "Content-Type: text/html\r\n"
           "Content-Length: " + std::to_string(body.size()) + "\r\n"
           "Connection: close\r\n" + extra_headers + "\r\n" + body;
}

// Serves canned responses on 127.0.0.1, one request per connection, and records
// every request head it receives.
class LoopbackServer {
public:
    explicit LoopbackServer(std::map<std::string, std::string> routes) : routes_(std::move(routes)) {
        listen_fd_ = socket(AF_INET, SOCK_STREAM, 0);
        REQUIRE(listen_fd_ >= 0);
        int yes = 1;
        setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        REQUIRE(bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);
        REQUIRE(listen(listen_fd_, 8) == 0);

        socklen_t len = sizeof(addr);
        REQUIRE(getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &len) == 0);
        port_ = ntohs(addr.sin_port);

        worker_ = std::thread([this] { Serve(); });
    }

    ~LoopbackServer() {
        stop_ = true;
        if (worker_.joinable()) worker_.join();
        close(listen_fd_);
    }

    std::string Url(const std::string& path) const {
        return "http://127.0.0.1:" + std::to_string(port_) + path;
    }

    std::vector<std::string> Requests() {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

private:
    void Serve() {
        while (!stop_) {
            pollfd pfd{};
            pfd.fd = listen_fd_;
            pfd.events = POLLIN;
            if (poll(&pfd, 1, 50) <= 0) continue;

            int client = accept(listen_fd_, nullptr, nullptr);
            if (client < 0) continue;

            std::string request;
            char buf[4096];
            while (request.find("\r\n\r\n") == std::string::npos) {
                ssize_t n = recv(client, buf, sizeof(buf), 0);
                if (n <= 0) break;
                request.append(buf, static_cast<size_t>(n));
            }

            std::string path;
            auto first = request.find(' ');
            auto second = first == std::string::npos ? std::string::npos : request.find(' ', first + 1);
            if (second != std::string::npos) path = request.substr(first + 1, second - first - 1);
            {
                std::lock_guard<std::mutex> lock(mutex_);
                requests_.push_back(request);
            }

            auto route = routes_.find(path);
            const std::string response = route != routes_.end() ? route->second
                                                                : HttpResponse(404, "Not Found", "missing");
            size_t sent = 0;
            while (sent < response.size()) {
                ssize_t n = send(client, response.data() + sent, response.size() - sent, MSG_NOSIGNAL);
                if (n <= 0) break;
                sent += static_cast<size_t>(n);
            }
            close(client);
        }
    }

    std::map<std::string, std::string> routes_;
    int listen_fd_ = -1;
    int port_ = 0;
    std::atomic<bool> stop_{false};
    std::thread worker_;
    std::mutex mutex_;
    std::vector<std::string> requests_;
};

PageFetcher MakeFetcher(bool send_accept, long max_redirects = 10) {
    DnsResolver::Options dns;
    dns.primary = "127.0.0.1:53";
    dns.fallback = "127.0.0.1:53";
    dns.timeout_ms = 1000;

    PageFetcher::Options http;
    http.user_agent = "linkscope-test";
    http.accept = "text/html";
    http.send_accept = send_accept;
    http.connect_timeout_ms = 2000;
    http.timeout_ms = 5000;
    http.max_redirects = max_redirects;
    return PageFetcher(http, DnsResolver(dns));
}

std::string Lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return s;
}

const std::string kPage = "<html><body><a href=\"/x\">x</a></body></html>";

} // anonymous namespace

TEST_CASE("A 200 response is streamed into the sink") {
    LoopbackServer server({{"/page", HttpResponse(200, "OK", kPage)}});
    PageFetcher fetcher = MakeFetcher(true);

    std::string body;
    auto outcome = fetcher.Fetch(server.Url("/page"), [&body](const char* data, size_t size) {
        body.append(data, size);
    });

    REQUIRE(outcome.Ok());
    CHECK(outcome.status_code == 200);
    CHECK(body == kPage);
    CHECK(outcome.body_bytes == kPage.size());

    auto requests = server.Requests();
    REQUIRE(requests.size() == 1);
    CHECK(requests[0].rfind("GET /page HTTP/1.1\r\n", 0) == 0);
    CHECK(requests[0].find("\r\nAccept: text/html\r\n") != std::string::npos);
    CHECK(requests[0].find("\r\nUser-Agent: linkscope-test\r\n") != std::string::npos);
}

TEST_CASE("Non-200 responses are status failures") {
    LoopbackServer server({{"/empty-error", HttpResponse(500, "Internal Server Error", "")}});
    PageFetcher fetcher = MakeFetcher(true);

    std::string body;
    auto sink = [&body](const char* data, size_t size) { body.append(data, size); };

    auto missing = fetcher.Fetch(server.Url("/missing"), sink);
    CHECK(missing.failure == FetchFailure::Status);
    CHECK(missing.status_code == 404);
    CHECK(missing.error == "HTTP 404");

    auto empty = fetcher.Fetch(server.Url("/empty-error"), sink);
    CHECK(empty.failure == FetchFailure::Status);
    CHECK(empty.status_code == 500);

    CHECK(body.empty());
}

TEST_CASE("The Accept header is left out when disabled") {
    LoopbackServer server({{"/page", HttpResponse(200, "OK", kPage)}});
    PageFetcher fetcher = MakeFetcher(false);

    auto outcome = fetcher.Fetch(server.Url("/page"), [](const char*, size_t) {});
    REQUIRE(outcome.Ok());

    auto requests = server.Requests();
    REQUIRE(requests.size() == 1);
    CHECK(Lower(requests[0]).find("\r\naccept:") == std::string::npos);
}

TEST_CASE("Redirects are followed one hop at a time") {
    LoopbackServer server({
        {"/old", HttpResponse(302, "Found", "moved", "Location: /page\r\n")},
        {"/page", HttpResponse(200, "OK", kPage)},
        {"/loop", HttpResponse(301, "Moved Permanently", "", "Location: /loop\r\n")},
    });

    SECTION("redirect bodies are not passed on") {
        PageFetcher fetcher = MakeFetcher(true);
        std::string body;
        auto outcome = fetcher.Fetch(server.Url("/old"), [&body](const char* data, size_t size) {
            body.append(data, size);
        });
        REQUIRE(outcome.Ok());
        CHECK(body == kPage);

        auto requests = server.Requests();
        REQUIRE(requests.size() == 2);
        CHECK(requests[0].rfind("GET /old ", 0) == 0);
        CHECK(requests[1].rfind("GET /page ", 0) == 0);
    }

    SECTION("the redirect limit stops a loop") {
        PageFetcher fetcher = MakeFetcher(true, 2);
        auto outcome = fetcher.Fetch(server.Url("/loop"), [](const char*, size_t) {});
        CHECK(outcome.failure == FetchFailure::Other);
        CHECK(outcome.error == "stopped after 2 redirects");
        CHECK(server.Requests().size() == 3);
    }
}
