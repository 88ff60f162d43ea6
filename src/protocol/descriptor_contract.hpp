#pragma once
#include <chrono>
#include <map>
#include <string>
#include <variant>

namespace relay::protocol {

    using Headers = std::map<std::string, std::string>;
    using Timestamp = std::chrono::system_clock::time_point;

    inline constexpr const char* kProtocolVersion = "1.0.0";
    inline constexpr const char* kDefaultHttpVersion = "HTTP/1.1";

    // Placeholder scan verdicts carried in every response envelope.
    struct ScanResults {
        bool malware = false;
        bool suspicious_content = false;
    };

    // Written once by the interceptor, never mutated after publish.
    struct RequestDescriptor {
        std::string id;
        Timestamp created_at;
        std::string method;
        std::string url;
        Headers headers;
        std::string body;           // opaque bytes
        std::string content_hash;   // sha256 hex of body
        std::string version = kProtocolVersion;
        std::string http_version = kDefaultHttpVersion;
        std::string source_process = "capture_point";
    };

    // Written at most once per id by the forwarder.
    struct ResponseDescriptor {
        std::string id;
        Timestamp processed_at;
        int status_code = 0;
        std::string reason;
        Headers headers;
        std::string body;
        std::string response_hash;  // sha256 hex of body as published
        bool filtered = false;
        ScanResults scan_results;
        std::string security_status = "approved";
        std::string version = kProtocolVersion;
        std::string http_version = kDefaultHttpVersion;
    };

    using Descriptor = std::variant<RequestDescriptor, ResponseDescriptor>;

    // Status codes the relay synthesizes itself.
    namespace status {
        inline constexpr int kOk = 200;
        inline constexpr int kForbidden = 403;
        inline constexpr int kInternalError = 500;
        inline constexpr int kBadGateway = 502;
        inline constexpr int kUnavailable = 503;
        inline constexpr int kGatewayTimeout = 504;
    }  // namespace status

} // namespace relay::protocol
