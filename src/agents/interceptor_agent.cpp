#include "agents/interceptor_agent.hpp"

#include <algorithm>
#include <exception>
#include <utility>
#include "core/logging/logger.hpp"
#include "protocol/descriptor_codec.hpp"
#include "runtime/interruptible_wait.hpp"

namespace relay::agents {

using protocol::CaptureResult;
using protocol::InterceptOutcome;
using store::Channel;
using store::EventTag;

namespace {

CaptureResult synthesize(const std::string& exchange_id, const InterceptOutcome outcome,
                         const int status_code, const std::string& reason,
                         const std::string& body) {
    CaptureResult result;
    result.exchange_id = exchange_id;
    result.outcome = outcome;
    result.status_code = status_code;
    result.reason = reason;
    result.headers = {{"Content-Type", "text/plain"}};
    result.body = body;
    return result;
}

}  // namespace

InterceptorAgent::InterceptorAgent(store::ExchangeStore store,
                                   InterceptorOptions options)
    : store_(std::move(store)),
      event_log_(store_.root(), "interceptor"),
      options_(options) {}

void InterceptorAgent::set_state_observer(StateObserver observer) {
    observer_ = std::move(observer);
}

std::string InterceptorAgent::to_string(const InterceptState state) {
    switch (state) {
        case InterceptState::Created:
            return "created";
        case InterceptState::Published:
            return "published";
        case InterceptState::Waiting:
            return "waiting";
        case InterceptState::Resolved:
            return "resolved";
        case InterceptState::TimedOut:
            return "timed_out";
        case InterceptState::Corrupted:
            return "corrupted";
        case InterceptState::Cancelled:
            return "cancelled";
        case InterceptState::Failed:
            return "failed";
        case InterceptState::CleanedUp:
            return "cleaned_up";
        default:
            return "unknown";
    }
}

void InterceptorAgent::transition(const std::string& exchange_id,
                                  const InterceptState from,
                                  const InterceptState to) const {
    LOG_DEBUG("InterceptorAgent: exchange " + exchange_id + " transition " +
              to_string(from) + " -> " + to_string(to));
    if (observer_) {
        observer_(exchange_id, to);
    }
}

void InterceptorAgent::record(const EventTag tag, const std::string& exchange_id,
                              const std::string& detail) const {
    auto logged = event_log_.append(tag, exchange_id, detail);
    if (core::errors::is_error(logged)) {
        LOG_WARN("InterceptorAgent: event log unavailable: " +
                 core::errors::get_error(logged).message);
    }
}

void InterceptorAgent::cleanup(const std::string& exchange_id) const {
    const bool removed_response = store_.remove(Channel::Responses, exchange_id);
    const bool removed_request = store_.remove(Channel::Requests, exchange_id);
    LOG_DEBUG("InterceptorAgent: cleanup " + exchange_id +
              " response=" + (removed_response ? "deleted" : "absent") +
              " request=" + (removed_request ? "deleted" : "absent"));
}

CaptureResult InterceptorAgent::handle(
    const protocol::CapturedCall& call,
    std::shared_ptr<std::atomic_bool> cancel_token) const {
    InterceptState state = InterceptState::Created;
    std::string exchange_id;
    CaptureResult result;

    try {
        auto request =
            protocol::encode_request(call.method, call.url, call.headers, call.body);
        request.http_version = call.http_version;
        exchange_id = request.id;
        if (observer_) {
            observer_(exchange_id, state);
        }

        auto published = store_.publish(Channel::Requests, exchange_id,
                                        protocol::serialize(request));
        if (core::errors::is_error(published)) {
            const auto& err = core::errors::get_error(published);
            LOG_ERROR("InterceptorAgent: failed to publish " + exchange_id +
                      " [" + err.code + "]: " + err.message);
            transition(exchange_id, state, InterceptState::Failed);
            state = InterceptState::Failed;
            result = synthesize(exchange_id, InterceptOutcome::Failed,
                                protocol::status::kInternalError, "Error",
                                "Proxy error: " + err.message);
        } else {
            transition(exchange_id, state, InterceptState::Published);
            state = InterceptState::Published;
            LOG_INFO("InterceptorAgent: serialized request " + exchange_id + " (" +
                     call.method + " " + call.url + ")");
            record(EventTag::RequestStart, exchange_id, call.method + " " + call.url);

            transition(exchange_id, state, InterceptState::Waiting);
            state = InterceptState::Waiting;
            result = wait_for_response(exchange_id, cancel_token, state);
        }
    } catch (const std::exception& e) {
        LOG_ERROR("InterceptorAgent: error in request handler: " + std::string(e.what()));
        transition(exchange_id, state, InterceptState::Failed);
        state = InterceptState::Failed;
        result = synthesize(exchange_id, InterceptOutcome::Failed,
                            protocol::status::kInternalError, "Error",
                            "Proxy error: " + std::string(e.what()));
    }

    if (!exchange_id.empty()) {
        cleanup(exchange_id);
        if (result.outcome == InterceptOutcome::Resolved) {
            record(EventTag::RequestSuccess, exchange_id,
                   "status=" + std::to_string(result.status_code));
        } else {
            record(EventTag::RequestFailed, exchange_id,
                   protocol::to_string(result.outcome));
        }
        transition(exchange_id, state, InterceptState::CleanedUp);
    }
    return result;
}

CaptureResult InterceptorAgent::wait_for_response(
    const std::string& exchange_id,
    const std::shared_ptr<std::atomic_bool>& cancel_token,
    InterceptState& state) const {
    const auto deadline = std::chrono::steady_clock::now() + options_.response_timeout;

    while (true) {
        auto read = store_.try_read(Channel::Responses, exchange_id);
        if (core::errors::is_error(read)) {
            const auto& err = core::errors::get_error(read);
            LOG_ERROR("InterceptorAgent: error processing response " + exchange_id +
                      ": " + err.message);
            transition(exchange_id, state, InterceptState::Corrupted);
            state = InterceptState::Corrupted;
            return synthesize(exchange_id, InterceptOutcome::Corrupted,
                              protocol::status::kBadGateway, "Bad Gateway",
                              "Response processing error: " + err.message);
        }

        const auto& bytes = core::errors::get_value(read);
        if (bytes.has_value()) {
            auto decoded = protocol::decode_response(bytes.value());
            if (core::errors::is_error(decoded)) {
                const auto& err = core::errors::get_error(decoded);
                LOG_ERROR("InterceptorAgent: error processing response " +
                          exchange_id + " [" + err.code + "]: " + err.message);
                transition(exchange_id, state, InterceptState::Corrupted);
                state = InterceptState::Corrupted;
                return synthesize(exchange_id, InterceptOutcome::Corrupted,
                                  protocol::status::kBadGateway, "Bad Gateway",
                                  "Response processing error: " + err.message);
            }

            const auto& response = core::errors::get_value(decoded);
            if (response.id != exchange_id) {
                LOG_ERROR("InterceptorAgent: response file " + exchange_id +
                          " carries id " + response.id);
                transition(exchange_id, state, InterceptState::Corrupted);
                state = InterceptState::Corrupted;
                return synthesize(exchange_id, InterceptOutcome::Corrupted,
                                  protocol::status::kBadGateway, "Bad Gateway",
                                  "Response processing error: exchange id mismatch");
            }
            if (!protocol::verify_integrity(response)) {
                LOG_ERROR("InterceptorAgent: integrity check failed for " + exchange_id);
                transition(exchange_id, state, InterceptState::Corrupted);
                state = InterceptState::Corrupted;
                return synthesize(exchange_id, InterceptOutcome::Corrupted,
                                  protocol::status::kBadGateway, "Bad Gateway",
                                  "Response integrity check failed");
            }

            transition(exchange_id, state, InterceptState::Resolved);
            state = InterceptState::Resolved;
            LOG_INFO("InterceptorAgent: reconstructed response for " + exchange_id +
                     " (status " + std::to_string(response.status_code) + ")");

            CaptureResult result;
            result.exchange_id = exchange_id;
            result.outcome = InterceptOutcome::Resolved;
            result.status_code = response.status_code;
            result.reason = response.reason;
            result.headers = response.headers;
            result.body = response.body;
            return result;
        }

        if (cancel_token && cancel_token->load()) {
            LOG_WARN("InterceptorAgent: shutdown while waiting for " + exchange_id);
            transition(exchange_id, state, InterceptState::Cancelled);
            state = InterceptState::Cancelled;
            return synthesize(exchange_id, InterceptOutcome::Cancelled,
                              protocol::status::kUnavailable, "Service Unavailable",
                              "Relay shutting down");
        }

        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            LOG_ERROR("InterceptorAgent: timeout waiting for response " + exchange_id);
            transition(exchange_id, state, InterceptState::TimedOut);
            state = InterceptState::TimedOut;
            return synthesize(exchange_id, InterceptOutcome::TimedOut,
                              protocol::status::kGatewayTimeout, "Gateway Timeout",
                              "Gateway Timeout: No response from relay");
        }

        const auto remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        static_cast<void>(
            runtime::wait_for(std::min(options_.poll_interval, remaining), cancel_token));
    }
}

}  // namespace relay::agents
