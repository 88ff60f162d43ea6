#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include "core/errors/relay_errors.hpp"
#include "policy/security_gate.hpp"
#include "protocol/descriptor_contract.hpp"
#include "store/event_log.hpp"
#include "store/exchange_store.hpp"
#include "transport/outbound_transport.hpp"

namespace relay::agents {

struct ForwarderOptions {
    std::chrono::milliseconds scan_interval{500};
    std::chrono::milliseconds transport_timeout{30000};
    std::chrono::seconds maintenance_interval{3600};
    std::chrono::seconds stale_response_age{3600};
};

enum class Disposition {
    Skipped,    // a response already exists
    Vanished,   // request disappeared before it could be read
    Forwarded,  // real outbound call made, response published
    Blocked,    // denied by the security gate, 403 published
    Failed      // malformed request or processing error, 502 published
};

struct CycleStats {
    std::size_t scanned = 0;
    std::size_t forwarded = 0;
    std::size_t blocked = 0;
    std::size_t failed = 0;
    std::size_t skipped = 0;
};

std::string to_string(Disposition disposition);

// Internet-side loop. Each cycle lists pending requests and resolves them
// one at a time; every published request ends with exactly one response
// unless the process dies mid-exchange.
class ForwarderAgent {
public:
    ForwarderAgent(store::ExchangeStore store, policy::SecurityGate gate,
                   transport::OutboundTransport& transport,
                   ForwarderOptions options = {});

    core::errors::Result<std::filesystem::path> prepare() const;

    // Blocks until the stop token is set.
    void run(std::shared_ptr<std::atomic_bool> stop_token);

    CycleStats run_cycle(const std::shared_ptr<std::atomic_bool>& stop_token = nullptr);

    Disposition process_request(const std::string& exchange_id);

    void run_maintenance();

    void add_blocked_domain(const std::string& domain);

    const policy::SecurityGate& security_gate() const { return gate_; }

private:
    Disposition forward(const std::string& exchange_id,
                        const protocol::RequestDescriptor& request);
    Disposition fail_exchange(const std::string& exchange_id, int status_code,
                              const std::string& message, Disposition disposition);
    bool publish_response(const protocol::ResponseDescriptor& response);
    void record(store::EventTag tag, const std::string& exchange_id,
                const std::string& detail) const;

    store::ExchangeStore store_;
    store::EventLog event_log_;
    policy::SecurityGate gate_;
    transport::OutboundTransport& transport_;
    ForwarderOptions options_;
};

}  // namespace relay::agents
