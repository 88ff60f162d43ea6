#pragma once
#include <string>
#include "protocol/descriptor_contract.hpp"

namespace relay::protocol {

    // What the capture engine hands over for one intercepted call.
    struct CapturedCall {
        std::string method;
        std::string url;
        Headers headers;
        std::string body;
        std::string http_version = kDefaultHttpVersion;
    };

    // How the exchange ended on the interceptor side.
    enum class InterceptOutcome {
        Resolved,   // verified response from the forwarder
        TimedOut,   // deadline elapsed, synthesized 504
        Corrupted,  // unreadable or digest mismatch, synthesized 502
        Cancelled,  // shutdown while waiting, synthesized 503
        Failed      // request could not be published, synthesized 500
    };

    // What the capture engine injects back into the client connection.
    // Synthesized errors have the same shape as relayed results.
    struct CaptureResult {
        std::string exchange_id;
        InterceptOutcome outcome = InterceptOutcome::Resolved;
        int status_code = 0;
        std::string reason;
        Headers headers;
        std::string body;
    };

    inline std::string to_string(const InterceptOutcome outcome) {
        switch (outcome) {
            case InterceptOutcome::Resolved:
                return "resolved";
            case InterceptOutcome::TimedOut:
                return "timed_out";
            case InterceptOutcome::Corrupted:
                return "corrupted";
            case InterceptOutcome::Cancelled:
                return "cancelled";
            case InterceptOutcome::Failed:
                return "failed";
            default:
                return "unknown";
        }
    }

} // namespace relay::protocol
