#pragma once

#include <chrono>
#include <string>
#include "core/errors/relay_errors.hpp"
#include "protocol/descriptor_contract.hpp"

namespace relay::transport {

struct OutboundCall {
    std::string method;
    std::string url;
    protocol::Headers headers;
    std::string body;
    std::chrono::milliseconds timeout{30000};
};

struct TransportResponse {
    int status_code = 0;
    std::string reason;
    protocol::Headers headers;
    std::string body;
};

// The real network client used by the forwarder. A failed call is reported
// as an ErrorCategory::Transport error, never thrown.
class OutboundTransport {
public:
    virtual ~OutboundTransport() = default;

    virtual core::errors::Result<TransportResponse> call(const OutboundCall& request) = 0;

    // Drops cached name resolutions and pooled connections.
    virtual void reset_connection_cache() {}
};

}  // namespace relay::transport
