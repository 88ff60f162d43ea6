#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include "protocol/capture_contract.hpp"
#include "store/event_log.hpp"
#include "store/exchange_store.hpp"

namespace relay::agents {

enum class InterceptState {
    Created,
    Published,
    Waiting,
    Resolved,
    TimedOut,
    Corrupted,
    Cancelled,
    Failed,
    CleanedUp
};

struct InterceptorOptions {
    std::chrono::milliseconds response_timeout{300000};
    std::chrono::milliseconds poll_interval{200};
};

// Runs one exchange per captured call: publish the request, wait for the
// forwarder's response, verify it and hand back something injectable.
// handle() keeps all per-exchange state on the stack, so one agent can
// serve many concurrent calls against the same store.
class InterceptorAgent {
public:
    using StateObserver =
        std::function<void(const std::string& exchange_id, InterceptState state)>;

    InterceptorAgent(store::ExchangeStore store, InterceptorOptions options = {});

    protocol::CaptureResult handle(
        const protocol::CapturedCall& call,
        std::shared_ptr<std::atomic_bool> cancel_token = nullptr) const;

    // Called on every state transition. Set before handling calls.
    void set_state_observer(StateObserver observer);

    static std::string to_string(InterceptState state);

private:
    void transition(const std::string& exchange_id, InterceptState from,
                    InterceptState to) const;
    protocol::CaptureResult wait_for_response(
        const std::string& exchange_id,
        const std::shared_ptr<std::atomic_bool>& cancel_token,
        InterceptState& state) const;
    void cleanup(const std::string& exchange_id) const;
    void record(store::EventTag tag, const std::string& exchange_id,
                const std::string& detail) const;

    store::ExchangeStore store_;
    store::EventLog event_log_;
    InterceptorOptions options_;
    StateObserver observer_;
};

}  // namespace relay::agents
