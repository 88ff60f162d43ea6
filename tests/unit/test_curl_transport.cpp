#include <algorithm>
#include <arpa/inet.h>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <mutex>
#include <netinet/in.h>
#include <poll.h>
#include <string>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>
#include <utility>
#include <gtest/gtest.h>
#include "core/errors/relay_errors.hpp"
#include "transport/curl_transport.hpp"

namespace {

using relay::core::errors::ErrorCategory;
using relay::core::errors::get_error;
using relay::core::errors::get_value;
using relay::core::errors::is_error;
using relay::transport::CurlTransport;
using relay::transport::OutboundCall;

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                   });
    return value;
}

// Accepts one connection on 127.0.0.1, records the raw request and answers
// with a canned reply. With an empty reply the connection is held open
// without answering until the server is destroyed.
class LoopbackServer {
public:
    explicit LoopbackServer(std::string reply) : reply_(std::move(reply)) {
        listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        const int one = 1;
        static_cast<void>(::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one)));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        bound_ = ::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0 &&
                 ::listen(listen_fd_, 4) == 0;

        socklen_t len = sizeof(addr);
        static_cast<void>(::getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &len));
        port_ = ntohs(addr.sin_port);

        worker_ = std::thread([this] { serve(); });
    }

    ~LoopbackServer() {
        stop_.store(true);
        worker_.join();
        ::close(listen_fd_);
    }

    bool ready() const { return bound_; }

    std::string url(const std::string& path) const {
        return "http://127.0.0.1:" + std::to_string(port_) + path;
    }

    std::string request() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return request_;
    }

private:
    // Waits for `fd` to become readable, giving up when the server stops.
    bool wait_readable(const int fd) const {
        while (!stop_.load()) {
            pollfd entry{fd, POLLIN, 0};
            const int rc = ::poll(&entry, 1, 20);
            if (rc > 0) {
                return true;
            }
            if (rc < 0) {
                return false;
            }
        }
        return false;
    }

    void serve() {
        if (!bound_ || !wait_readable(listen_fd_)) {
            return;
        }
        const int client = ::accept(listen_fd_, nullptr, nullptr);
        if (client < 0) {
            return;
        }

        std::string raw;
        std::size_t header_end = std::string::npos;
        std::size_t expected = 0;
        char buffer[4096];
        while (wait_readable(client)) {
            const ssize_t n = ::recv(client, buffer, sizeof(buffer), 0);
            if (n <= 0) {
                break;
            }
            raw.append(buffer, static_cast<std::size_t>(n));
            if (header_end == std::string::npos) {
                header_end = raw.find("\r\n\r\n");
                if (header_end != std::string::npos) {
                    const std::string head = lowercase(raw.substr(0, header_end));
                    const auto length_at = head.find("content-length:");
                    if (length_at != std::string::npos) {
                        expected = std::strtoul(head.c_str() + length_at + 15, nullptr, 10);
                    }
                }
            }
            if (header_end != std::string::npos && raw.size() >= header_end + 4 + expected) {
                break;
            }
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            request_ = raw;
        }

        if (reply_.empty()) {
            // Never answer; hold the connection until shutdown.
            while (!stop_.load()) {
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
            }
        } else {
            static_cast<void>(::send(client, reply_.data(), reply_.size(), MSG_NOSIGNAL));
        }
        ::close(client);
    }

    std::string reply_;
    int listen_fd_ = -1;
    bool bound_ = false;
    unsigned short port_ = 0;
    std::atomic_bool stop_{false};
    mutable std::mutex mutex_;
    std::string request_;
    std::thread worker_;
};

const char* kTeapotReply =
    "HTTP/1.1 418 I'm a teapot\r\n"
    "Content-Type: text/plain\r\n"
    "X-Multi: a\r\n"
    "X-Multi: b\r\n"
    "Content-Length: 5\r\n"
    "Connection: close\r\n"
    "\r\n"
    "hello";

class CurlTransportTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Loopback calls must not be routed through a proxy from the environment.
        ASSERT_EQ(setenv("NO_PROXY", "127.0.0.1,localhost", 1), 0);
        ASSERT_EQ(setenv("no_proxy", "127.0.0.1,localhost", 1), 0);
    }

    OutboundCall make_call(const std::string& method, const std::string& url,
                           const std::string& body = "") {
        OutboundCall call;
        call.method = method;
        call.url = url;
        call.body = body;
        call.timeout = std::chrono::milliseconds(5000);
        return call;
    }

    CurlTransport transport_;
};

TEST_F(CurlTransportTest, KeepsGetMethodWhenBodyPresent) {
    LoopbackServer server(kTeapotReply);
    ASSERT_TRUE(server.ready());

    auto result = transport_.call(make_call("GET", server.url("/search"), "q=1"));
    ASSERT_FALSE(is_error(result)) << get_error(result).message;

    const std::string seen = server.request();
    EXPECT_EQ(seen.rfind("GET /search HTTP/1.1\r\n", 0), 0u) << seen;
    EXPECT_EQ(seen.substr(seen.size() - 3), "q=1");
}

TEST_F(CurlTransportTest, SendsCustomMethodsVerbatim) {
    LoopbackServer put_server(kTeapotReply);
    ASSERT_TRUE(put_server.ready());
    auto put = transport_.call(make_call("PUT", put_server.url("/items/7"), "{\"n\":7}"));
    ASSERT_FALSE(is_error(put));
    EXPECT_EQ(put_server.request().rfind("PUT /items/7 HTTP/1.1\r\n", 0), 0u);

    LoopbackServer delete_server(kTeapotReply);
    ASSERT_TRUE(delete_server.ready());
    auto removed = transport_.call(make_call("DELETE", delete_server.url("/items/7")));
    ASSERT_FALSE(is_error(removed));
    EXPECT_EQ(delete_server.request().rfind("DELETE /items/7 HTTP/1.1\r\n", 0), 0u);
}

TEST_F(CurlTransportTest, CapturesStatusReasonHeadersAndBody) {
    LoopbackServer server(kTeapotReply);
    ASSERT_TRUE(server.ready());

    auto result = transport_.call(make_call("GET", server.url("/")));
    ASSERT_FALSE(is_error(result)) << get_error(result).message;
    const auto& response = get_value(result);

    EXPECT_EQ(response.status_code, 418);
    EXPECT_EQ(response.reason, "I'm a teapot");
    EXPECT_EQ(response.body, "hello");
    EXPECT_EQ(response.headers.at("Content-Type"), "text/plain");
    EXPECT_EQ(response.headers.at("X-Multi"), "a, b");
}

TEST_F(CurlTransportTest, StripsProxyHeaders) {
    LoopbackServer server(kTeapotReply);
    ASSERT_TRUE(server.ready());

    auto call = make_call("GET", server.url("/"));
    call.headers = {{"Proxy-Connection", "keep-alive"},
                    {"Proxy-Authorization", "Basic abc"},
                    {"X-Keep", "yes"}};
    auto result = transport_.call(call);
    ASSERT_FALSE(is_error(result));

    const std::string seen = lowercase(server.request());
    EXPECT_EQ(seen.find("proxy-connection"), std::string::npos);
    EXPECT_EQ(seen.find("proxy-authorization"), std::string::npos);
    EXPECT_NE(seen.find("x-keep: yes"), std::string::npos);
}

TEST_F(CurlTransportTest, ReportsTimeoutAsTransportError) {
    LoopbackServer server("");
    ASSERT_TRUE(server.ready());

    auto call = make_call("GET", server.url("/slow"));
    call.timeout = std::chrono::milliseconds(200);
    auto result = transport_.call(call);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Transport);
    EXPECT_EQ(get_error(result).code, "transport_timeout");
}

TEST_F(CurlTransportTest, ReportsRefusedConnectionAsTransportError) {
    unsigned short closed_port = 0;
    {
        LoopbackServer server(kTeapotReply);
        ASSERT_TRUE(server.ready());
        const std::string url = server.url("");
        closed_port = static_cast<unsigned short>(
            std::stoul(url.substr(url.rfind(':') + 1)));
    }

    auto result = transport_.call(
        make_call("GET", "http://127.0.0.1:" + std::to_string(closed_port) + "/"));
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Transport);
    EXPECT_EQ(get_error(result).code, "transport_failed");
}

TEST_F(CurlTransportTest, CallsSucceedAfterConnectionCacheReset) {
    LoopbackServer first(kTeapotReply);
    ASSERT_TRUE(first.ready());
    ASSERT_FALSE(is_error(transport_.call(make_call("GET", first.url("/")))));

    transport_.reset_connection_cache();

    LoopbackServer second(kTeapotReply);
    ASSERT_TRUE(second.ready());
    auto result = transport_.call(make_call("GET", second.url("/")));
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).status_code, 418);
}

}  // namespace
