#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <vector>
#include <gtest/gtest.h>
#include "agents/forwarder_agent.hpp"
#include "agents/interceptor_agent.hpp"
#include "core/config/exchange_id.hpp"
#include "core/errors/relay_errors.hpp"
#include "policy/security_gate.hpp"
#include "protocol/descriptor_codec.hpp"
#include "store/exchange_store.hpp"
#include "transport/outbound_transport.hpp"

namespace {

using relay::agents::ForwarderAgent;
using relay::agents::ForwarderOptions;
using relay::agents::InterceptorAgent;
using relay::agents::InterceptorOptions;
using relay::agents::InterceptState;
using relay::core::errors::is_error;
using relay::core::errors::Result;
using relay::protocol::CapturedCall;
using relay::protocol::InterceptOutcome;
using relay::protocol::ResponseDescriptor;
using relay::store::Channel;
using relay::store::ExchangeStore;
using relay::transport::OutboundCall;
using relay::transport::TransportResponse;

class TempWorkspace {
public:
    TempWorkspace()
        : path_(std::filesystem::current_path() /
                (".tmp_interceptor_" + relay::core::config::generate_exchange_id())) {
        std::filesystem::create_directories(path_);
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

class EchoTransport : public relay::transport::OutboundTransport {
public:
    Result<TransportResponse> call(const OutboundCall& request) override {
        TransportResponse response;
        response.status_code = 200;
        response.reason = "OK";
        response.headers = {{"Content-Type", "text/plain"}};
        response.body = request.method + " " + request.url;
        return response;
    }
};

// Answers the first published request by hand, letting the test corrupt the
// response before it lands in the responses directory.
class ManualResponder {
public:
    ManualResponder(const ExchangeStore& store,
                    std::function<std::string(const ResponseDescriptor&)> render)
        : store_(store), render_(std::move(render)),
          worker_([this] { respond(); }) {}

    ~ManualResponder() {
        stop_.store(true);
        worker_.join();
    }

private:
    void respond() {
        while (!stop_.load()) {
            const auto pending = store_.list_pending(Channel::Requests);
            if (!pending.empty()) {
                const std::string& id = *pending.begin();
                const auto response =
                    relay::protocol::encode_response(id, 200, "OK", {}, "payload", false);
                static_cast<void>(store_.publish(Channel::Responses, id, render_(response)));
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
    }

    const ExchangeStore& store_;
    std::function<std::string(const ResponseDescriptor&)> render_;
    std::atomic_bool stop_{false};
    std::thread worker_;
};

InterceptorOptions fast_options(std::chrono::milliseconds timeout) {
    InterceptorOptions options;
    options.response_timeout = timeout;
    options.poll_interval = std::chrono::milliseconds(10);
    return options;
}

CapturedCall make_call(const std::string& url) {
    CapturedCall call;
    call.method = "GET";
    call.url = url;
    call.headers = {{"Accept", "*/*"}};
    return call;
}

class InterceptorAgentTest : public ::testing::Test {
protected:
    InterceptorAgentTest() : store_(workspace_.path()) {
        EXPECT_FALSE(is_error(store_.ensure_layout()));
    }

    TempWorkspace workspace_;
    ExchangeStore store_;
};

TEST_F(InterceptorAgentTest, ResolvesThroughRunningForwarder) {
    EchoTransport transport;
    ForwarderOptions forwarder_options;
    forwarder_options.scan_interval = std::chrono::milliseconds(10);
    ForwarderAgent forwarder(store_, relay::policy::SecurityGate(), transport,
                             forwarder_options);
    auto stop = std::make_shared<std::atomic_bool>(false);
    std::thread forwarder_thread([&forwarder, stop] { forwarder.run(stop); });

    InterceptorAgent interceptor(store_, fast_options(std::chrono::seconds(10)));
    const auto result = interceptor.handle(make_call("https://example.com/page"));

    stop->store(true);
    forwarder_thread.join();

    EXPECT_EQ(result.outcome, InterceptOutcome::Resolved);
    EXPECT_EQ(result.status_code, 200);
    EXPECT_EQ(result.reason, "OK");
    EXPECT_EQ(result.body, "GET https://example.com/page");
    EXPECT_FALSE(store_.exists(Channel::Requests, result.exchange_id));
    EXPECT_FALSE(store_.exists(Channel::Responses, result.exchange_id));
}

TEST_F(InterceptorAgentTest, BlockedRequestIsRelayedAsForbidden) {
    EchoTransport transport;
    ForwarderOptions forwarder_options;
    forwarder_options.scan_interval = std::chrono::milliseconds(10);
    ForwarderAgent forwarder(store_, relay::policy::SecurityGate(), transport,
                             forwarder_options);
    auto stop = std::make_shared<std::atomic_bool>(false);
    std::thread forwarder_thread([&forwarder, stop] { forwarder.run(stop); });

    InterceptorAgent interceptor(store_, fast_options(std::chrono::seconds(10)));
    const auto result = interceptor.handle(make_call("http://phishing-site.net/login"));

    stop->store(true);
    forwarder_thread.join();

    EXPECT_EQ(result.outcome, InterceptOutcome::Resolved);
    EXPECT_EQ(result.status_code, 403);
    EXPECT_NE(result.body.find("Domain phishing-site.net is blocked"), std::string::npos);
}

TEST_F(InterceptorAgentTest, TimesOutWithoutForwarderAndCleansUp) {
    InterceptorAgent interceptor(store_, fast_options(std::chrono::milliseconds(100)));

    const auto started = std::chrono::steady_clock::now();
    const auto result = interceptor.handle(make_call("https://example.com/"));
    const auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_EQ(result.outcome, InterceptOutcome::TimedOut);
    EXPECT_EQ(result.status_code, 504);
    EXPECT_EQ(result.body, "Gateway Timeout: No response from relay");
    EXPECT_GE(elapsed, std::chrono::milliseconds(100));
    // Polling stops at the deadline: at most one poll interval plus scheduling slack.
    EXPECT_LT(elapsed, std::chrono::milliseconds(100 + 10 + 400));
    EXPECT_FALSE(store_.exists(Channel::Requests, result.exchange_id));
    EXPECT_TRUE(store_.list_pending(Channel::Requests).empty());
}

TEST_F(InterceptorAgentTest, RejectsResponseWithMismatchedDigest) {
    ManualResponder responder(store_, [](const ResponseDescriptor& response) {
        ResponseDescriptor tampered = response;
        tampered.body = "payload-altered";
        return relay::protocol::serialize(tampered);
    });

    InterceptorAgent interceptor(store_, fast_options(std::chrono::seconds(10)));
    const auto result = interceptor.handle(make_call("https://example.com/"));

    EXPECT_EQ(result.outcome, InterceptOutcome::Corrupted);
    EXPECT_EQ(result.status_code, 502);
    EXPECT_EQ(result.body, "Response integrity check failed");
    EXPECT_FALSE(store_.exists(Channel::Requests, result.exchange_id));
    EXPECT_FALSE(store_.exists(Channel::Responses, result.exchange_id));
}

TEST_F(InterceptorAgentTest, RejectsResponseNamingAnotherExchange) {
    ManualResponder responder(store_, [](const ResponseDescriptor& response) {
        ResponseDescriptor misrouted = response;
        misrouted.id = "some-other-exchange";
        return relay::protocol::serialize(misrouted);
    });

    InterceptorAgent interceptor(store_, fast_options(std::chrono::seconds(10)));
    const auto result = interceptor.handle(make_call("https://example.com/"));

    EXPECT_EQ(result.outcome, InterceptOutcome::Corrupted);
    EXPECT_EQ(result.status_code, 502);
    EXPECT_EQ(result.body, "Response processing error: exchange id mismatch");
    EXPECT_FALSE(store_.exists(Channel::Responses, result.exchange_id));
}

TEST_F(InterceptorAgentTest, RejectsUndecodableResponse) {
    ManualResponder responder(store_, [](const ResponseDescriptor&) {
        return std::string("{\"response\": {\"status_code\": 200}}");
    });

    InterceptorAgent interceptor(store_, fast_options(std::chrono::seconds(10)));
    const auto result = interceptor.handle(make_call("https://example.com/"));

    EXPECT_EQ(result.outcome, InterceptOutcome::Corrupted);
    EXPECT_EQ(result.status_code, 502);
    EXPECT_FALSE(store_.exists(Channel::Responses, result.exchange_id));
}

TEST_F(InterceptorAgentTest, CancelTokenEndsWaitWithUnavailable) {
    InterceptorAgent interceptor(store_, fast_options(std::chrono::seconds(30)));
    auto cancel = std::make_shared<std::atomic_bool>(false);
    std::thread canceller([cancel] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        cancel->store(true);
    });

    const auto result = interceptor.handle(make_call("https://example.com/"), cancel);
    canceller.join();

    EXPECT_EQ(result.outcome, InterceptOutcome::Cancelled);
    EXPECT_EQ(result.status_code, 503);
    EXPECT_FALSE(store_.exists(Channel::Requests, result.exchange_id));
}

TEST_F(InterceptorAgentTest, PublishFailureYieldsInternalError) {
    ExchangeStore missing(workspace_.path() / "not_there");
    InterceptorAgent interceptor(missing, fast_options(std::chrono::seconds(1)));

    const auto result = interceptor.handle(make_call("https://example.com/"));
    EXPECT_EQ(result.outcome, InterceptOutcome::Failed);
    EXPECT_EQ(result.status_code, 500);
    EXPECT_EQ(result.body.rfind("Proxy error: ", 0), 0u);
}

TEST_F(InterceptorAgentTest, ReportsStateTransitionsInOrder) {
    InterceptorAgent interceptor(store_, fast_options(std::chrono::milliseconds(30)));
    std::vector<InterceptState> states;
    interceptor.set_state_observer(
        [&states](const std::string&, const InterceptState state) {
            states.push_back(state);
        });

    static_cast<void>(interceptor.handle(make_call("https://example.com/")));

    const std::vector<InterceptState> expected = {
        InterceptState::Created, InterceptState::Published, InterceptState::Waiting,
        InterceptState::TimedOut, InterceptState::CleanedUp};
    EXPECT_EQ(states, expected);
}

TEST_F(InterceptorAgentTest, ConcurrentCallsUseDistinctExchanges) {
    InterceptorAgent interceptor(store_, fast_options(std::chrono::milliseconds(50)));
    relay::protocol::CaptureResult first;
    relay::protocol::CaptureResult second;

    std::thread a([&] { first = interceptor.handle(make_call("https://example.com/a")); });
    std::thread b([&] { second = interceptor.handle(make_call("https://example.com/b")); });
    a.join();
    b.join();

    EXPECT_NE(first.exchange_id, second.exchange_id);
    EXPECT_EQ(first.outcome, InterceptOutcome::TimedOut);
    EXPECT_EQ(second.outcome, InterceptOutcome::TimedOut);
}

}  // namespace
