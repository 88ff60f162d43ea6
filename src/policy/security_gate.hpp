#pragma once

#include <cstddef>
#include <optional>
#include <regex>
#include <set>
#include <string>
#include <utility>
#include <vector>
#include "core/errors/relay_errors.hpp"
#include "protocol/descriptor_contract.hpp"

namespace relay::policy {

inline constexpr const char* kOversizeMarker = "Response too large";

struct SecurityGateConfig {
    // Exact, case-insensitive host matches. Subdomains are not covered.
    std::set<std::string> blocked_domains = {
        "malicious-site.com",
        "phishing-site.net",
        "spam-domain.org"};
    // ECMAScript syntax, matched case-insensitively.
    std::vector<std::string> blocked_patterns = {
        R"(\b(password|token|secret|key)\b=)",
        R"(\b(admin|root|administrator)\b)"};
    std::size_t max_request_bytes = 1024 * 1024;
    std::size_t max_response_bytes = 10 * 1024 * 1024;
};

struct FilteredResponse {
    std::string body;
    bool filtered = false;
    std::size_t pattern_hits = 0;
};

class SecurityGate {
public:
    explicit SecurityGate(SecurityGateConfig config = {});

    // Value is "Request approved"; a denial is an ErrorCategory::Policy error
    // whose message is the human-readable reason.
    core::errors::Result<std::string> validate_request(
        const protocol::RequestDescriptor& request) const;

    // Only the size cap changes content. Pattern matches are counted and
    // logged but the body is passed through untouched.
    FilteredResponse filter_response(const std::string& body) const;

    void add_blocked_domain(const std::string& domain);

    // Returns false when the domain was not on the blocklist.
    bool remove_blocked_domain(const std::string& domain);

    core::errors::Result<std::string> add_blocked_pattern(const std::string& pattern);

    bool is_blocked_domain(const std::string& host) const;

    const SecurityGateConfig& config() const { return config_; }

    // Lowercased host of an absolute URL, or nullopt when it has none.
    static std::optional<std::string> extract_host(const std::string& url);

private:
    static std::string lowercase(std::string value);
    bool matches_any_pattern(const std::string& text) const;

    SecurityGateConfig config_;
    std::vector<std::pair<std::string, std::regex>> compiled_patterns_;
};

}  // namespace relay::policy
