#include "agents/forwarder_agent.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <utility>
#include "core/logging/logger.hpp"
#include "protocol/descriptor_codec.hpp"
#include "runtime/interruptible_wait.hpp"

namespace relay::agents {

using protocol::RequestDescriptor;
using protocol::ResponseDescriptor;
using store::Channel;
using store::EventTag;

namespace {

bool is_hop_by_hop_proxy_header(std::string name) {
    std::transform(name.begin(), name.end(), name.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                   });
    return name == "proxy-connection" || name == "proxy-authorization";
}

}  // namespace

std::string to_string(const Disposition disposition) {
    switch (disposition) {
        case Disposition::Skipped:
            return "skipped";
        case Disposition::Vanished:
            return "vanished";
        case Disposition::Forwarded:
            return "forwarded";
        case Disposition::Blocked:
            return "blocked";
        case Disposition::Failed:
            return "failed";
        default:
            return "unknown";
    }
}

ForwarderAgent::ForwarderAgent(store::ExchangeStore store, policy::SecurityGate gate,
                               transport::OutboundTransport& transport,
                               ForwarderOptions options)
    : store_(std::move(store)),
      event_log_(store_.root(), "forwarder"),
      gate_(std::move(gate)),
      transport_(transport),
      options_(options) {}

core::errors::Result<std::filesystem::path> ForwarderAgent::prepare() const {
    return store_.ensure_layout();
}

void ForwarderAgent::add_blocked_domain(const std::string& domain) {
    gate_.add_blocked_domain(domain);
}

void ForwarderAgent::record(const EventTag tag, const std::string& exchange_id,
                            const std::string& detail) const {
    auto logged = event_log_.append(tag, exchange_id, detail);
    if (core::errors::is_error(logged)) {
        LOG_WARN("ForwarderAgent: event log unavailable: " +
                 core::errors::get_error(logged).message);
    }
}

void ForwarderAgent::run(std::shared_ptr<std::atomic_bool> stop_token) {
    LOG_INFO("ForwarderAgent: started");
    LOG_INFO("ForwarderAgent: monitoring " + store_.channel_dir(Channel::Requests).string());
    LOG_INFO("ForwarderAgent: writing to " + store_.channel_dir(Channel::Responses).string());

    auto last_maintenance = std::chrono::steady_clock::now();
    while (!(stop_token && stop_token->load())) {
        try {
            static_cast<void>(run_cycle(stop_token));
        } catch (const std::exception& e) {
            LOG_ERROR("ForwarderAgent: error in main loop: " + std::string(e.what()));
            static_cast<void>(runtime::wait_for(std::chrono::seconds(1), stop_token));
        }

        const auto now = std::chrono::steady_clock::now();
        if (now - last_maintenance >= options_.maintenance_interval) {
            run_maintenance();
            last_maintenance = now;
        }

        static_cast<void>(runtime::wait_for(options_.scan_interval, stop_token));
    }
    LOG_INFO("ForwarderAgent: shutting down");
}

CycleStats ForwarderAgent::run_cycle(
    const std::shared_ptr<std::atomic_bool>& stop_token) {
    CycleStats stats;
    const auto pending = store_.list_pending(Channel::Requests);
    if (pending.empty()) {
        return stats;
    }

    LOG_INFO("ForwarderAgent: found " + std::to_string(pending.size()) +
             " request files");
    record(EventTag::Scan, "", "pending=" + std::to_string(pending.size()));

    for (const auto& exchange_id : pending) {
        if (stop_token && stop_token->load()) {
            break;
        }
        ++stats.scanned;
        switch (process_request(exchange_id)) {
            case Disposition::Forwarded:
                ++stats.forwarded;
                break;
            case Disposition::Blocked:
                ++stats.blocked;
                break;
            case Disposition::Failed:
                ++stats.failed;
                break;
            case Disposition::Skipped:
            case Disposition::Vanished:
                ++stats.skipped;
                break;
        }
    }
    return stats;
}

Disposition ForwarderAgent::process_request(const std::string& exchange_id) {
    if (store_.exists(Channel::Responses, exchange_id)) {
        record(EventTag::RequestSkip, exchange_id, "response exists");
        return Disposition::Skipped;
    }

    try {
        auto read = store_.try_read(Channel::Requests, exchange_id);
        if (core::errors::is_error(read)) {
            return fail_exchange(exchange_id, protocol::status::kBadGateway,
                                 "Processing error: " +
                                     core::errors::get_error(read).message,
                                 Disposition::Failed);
        }
        const auto& bytes = core::errors::get_value(read);
        if (!bytes.has_value()) {
            LOG_DEBUG("ForwarderAgent: request " + exchange_id + " vanished before read");
            return Disposition::Vanished;
        }

        record(EventTag::RequestStart, exchange_id, "");
        LOG_INFO("ForwarderAgent: processing request " + exchange_id);

        auto decoded = protocol::decode_request(bytes.value());
        if (core::errors::is_error(decoded)) {
            const auto& err = core::errors::get_error(decoded);
            return fail_exchange(exchange_id, protocol::status::kBadGateway,
                                 "Processing error: " + err.message,
                                 Disposition::Failed);
        }
        const auto& request = core::errors::get_value(decoded);
        if (request.id != exchange_id) {
            LOG_WARN("ForwarderAgent: request file " + exchange_id +
                     " carries id " + request.id + "; answering by file name");
        }

        auto verdict = gate_.validate_request(request);
        if (core::errors::is_error(verdict)) {
            const auto& denial = core::errors::get_error(verdict);
            LOG_WARN("ForwarderAgent: request " + exchange_id +
                     " blocked: " + denial.message);
            return fail_exchange(exchange_id, protocol::status::kForbidden,
                                 "Blocked: " + denial.message, Disposition::Blocked);
        }

        return forward(exchange_id, request);
    } catch (const std::exception& e) {
        LOG_ERROR("ForwarderAgent: error processing " + exchange_id + ": " + e.what());
        return fail_exchange(exchange_id, protocol::status::kBadGateway,
                             "Processing error: " + std::string(e.what()),
                             Disposition::Failed);
    }
}

Disposition ForwarderAgent::forward(const std::string& exchange_id,
                                    const RequestDescriptor& request) {
    transport::OutboundCall call;
    call.method = request.method;
    call.url = request.url;
    call.body = request.body;
    call.timeout = options_.transport_timeout;
    for (const auto& [name, value] : request.headers) {
        if (!is_hop_by_hop_proxy_header(name)) {
            call.headers.emplace(name, value);
        }
    }

    LOG_INFO("ForwarderAgent: making request: " + request.method + " " + request.url);
    transport::TransportResponse upstream;
    bool transport_failed = false;
    auto outcome = transport_.call(call);
    if (core::errors::is_error(outcome)) {
        const auto& err = core::errors::get_error(outcome);
        LOG_ERROR("ForwarderAgent: HTTP request failed for " + exchange_id + ": " +
                  err.message);
        transport_failed = true;
        upstream.status_code = protocol::status::kBadGateway;
        upstream.reason = "Bad Gateway";
        upstream.headers = {{"Content-Type", "text/plain"}};
        upstream.body = "Request failed: " + err.message;
    } else {
        upstream = core::errors::get_value(outcome);
    }

    const auto filtered = gate_.filter_response(upstream.body);
    if (filtered.filtered) {
        LOG_WARN("ForwarderAgent: response content was filtered for " + exchange_id);
    }

    ResponseDescriptor response = protocol::encode_response(
        exchange_id, upstream.status_code, upstream.reason, upstream.headers,
        filtered.body, filtered.filtered);
    response.scan_results.suspicious_content = filtered.pattern_hits > 0;

    if (!publish_response(response)) {
        record(EventTag::RequestFailed, exchange_id, "response publish failed");
        return Disposition::Failed;
    }
    static_cast<void>(store_.remove(Channel::Requests, exchange_id));

    if (transport_failed) {
        record(EventTag::RequestFailed, exchange_id, upstream.body);
        return Disposition::Failed;
    }
    LOG_INFO("ForwarderAgent: response written for " + exchange_id);
    record(EventTag::RequestSuccess, exchange_id,
           "status=" + std::to_string(response.status_code));
    return Disposition::Forwarded;
}

Disposition ForwarderAgent::fail_exchange(const std::string& exchange_id,
                                          const int status_code,
                                          const std::string& message,
                                          const Disposition disposition) {
    try {
        ResponseDescriptor response = protocol::encode_response(
            exchange_id, status_code, "Error", {{"Content-Type", "text/plain"}},
            message, false);
        response.security_status = "error";
        if (publish_response(response)) {
            static_cast<void>(store_.remove(Channel::Requests, exchange_id));
        }
    } catch (const std::exception& e) {
        LOG_ERROR("ForwarderAgent: unable to write error response for " +
                  exchange_id + ": " + e.what());
    }
    record(EventTag::RequestFailed, exchange_id, message);
    return disposition;
}

bool ForwarderAgent::publish_response(const ResponseDescriptor& response) {
    // Re-checked right before writing so an existing response is never replaced.
    if (store_.exists(Channel::Responses, response.id)) {
        LOG_WARN("ForwarderAgent: response for " + response.id +
                 " appeared concurrently; keeping the existing one");
        return true;
    }

    auto published =
        store_.publish(Channel::Responses, response.id, protocol::serialize(response));
    if (core::errors::is_error(published)) {
        const auto& err = core::errors::get_error(published);
        LOG_ERROR("ForwarderAgent: failed to publish response " + response.id +
                  " [" + err.code + "]: " + err.message);
        return false;
    }
    return true;
}

void ForwarderAgent::run_maintenance() {
    LOG_INFO("ForwarderAgent: running periodic maintenance");
    transport_.reset_connection_cache();

    const auto purged =
        store_.purge_stale(Channel::Responses, options_.stale_response_age);
    if (!purged.empty()) {
        LOG_INFO("ForwarderAgent: purged " + std::to_string(purged.size()) +
                 " stale responses");
    }
    // Only temporary files from publishers that died mid-write. Pending
    // request descriptors are left for process_request to answer.
    static_cast<void>(store_.purge_stale(Channel::Requests, options_.stale_response_age,
                                         store::PurgeScope::TempOnly));
}

}  // namespace relay::agents
