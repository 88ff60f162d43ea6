#include "policy/security_gate.hpp"

#include <algorithm>
#include <cctype>
#include "core/logging/logger.hpp"

namespace relay::policy {

using core::errors::ErrorCategory;
using core::errors::RelayError;

namespace {

std::regex compile_pattern(const std::string& pattern) {
    return std::regex(pattern, std::regex::ECMAScript | std::regex::icase);
}

}  // namespace

SecurityGate::SecurityGate(SecurityGateConfig config)
    : config_(std::move(config)) {
    std::set<std::string> normalized;
    for (const auto& domain : config_.blocked_domains) {
        normalized.insert(lowercase(domain));
    }
    config_.blocked_domains = std::move(normalized);

    std::vector<std::string> accepted;
    for (const auto& pattern : config_.blocked_patterns) {
        try {
            compiled_patterns_.emplace_back(pattern, compile_pattern(pattern));
            accepted.push_back(pattern);
        } catch (const std::regex_error& e) {
            LOG_WARN("SecurityGate: ignoring invalid pattern '" + pattern +
                     "': " + e.what());
        }
    }
    config_.blocked_patterns = std::move(accepted);
}

std::string SecurityGate::lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                   });
    return value;
}

std::optional<std::string> SecurityGate::extract_host(const std::string& url) {
    std::size_t start = 0;
    const auto scheme_end = url.find("://");
    if (scheme_end != std::string::npos) {
        start = scheme_end + 3;
    } else if (url.rfind("//", 0) == 0) {
        start = 2;
    } else {
        return std::nullopt;
    }

    const auto authority_end = url.find_first_of("/?#", start);
    std::string authority = url.substr(
        start, authority_end == std::string::npos ? std::string::npos
                                                  : authority_end - start);

    const auto at = authority.rfind('@');
    if (at != std::string::npos) {
        authority = authority.substr(at + 1);
    }

    std::string host;
    if (!authority.empty() && authority[0] == '[') {
        const auto close = authority.find(']');
        if (close == std::string::npos) {
            return std::nullopt;
        }
        host = authority.substr(1, close - 1);
    } else {
        host = authority.substr(0, authority.find(':'));
    }

    if (host.empty()) {
        return std::nullopt;
    }
    return lowercase(host);
}

bool SecurityGate::is_blocked_domain(const std::string& host) const {
    return config_.blocked_domains.count(lowercase(host)) > 0;
}

bool SecurityGate::matches_any_pattern(const std::string& text) const {
    for (const auto& [source, pattern] : compiled_patterns_) {
        if (std::regex_search(text, pattern)) {
            LOG_WARN("SecurityGate: blocked pattern: " + source);
            return true;
        }
    }
    return false;
}

core::errors::Result<std::string> SecurityGate::validate_request(
    const protocol::RequestDescriptor& request) const {
    const auto host = extract_host(request.url);
    if (host.has_value() && is_blocked_domain(host.value())) {
        return RelayError{ErrorCategory::Policy,
                          "Domain " + host.value() + " is blocked",
                          "blocked_domain"};
    }

    if (request.body.size() > config_.max_request_bytes) {
        return RelayError{ErrorCategory::Policy,
                          "Request size " + std::to_string(request.body.size()) +
                              " exceeds limit",
                          "request_too_large"};
    }

    try {
        bool suspicious = matches_any_pattern(request.url);
        for (auto it = request.headers.begin();
             !suspicious && it != request.headers.end(); ++it) {
            suspicious = matches_any_pattern(it->second);
        }
        if (suspicious) {
            return RelayError{ErrorCategory::Policy, "Suspicious pattern detected",
                              "blocked_pattern"};
        }
    } catch (const std::regex_error& e) {
        return RelayError{ErrorCategory::Policy,
                          std::string("Pattern scan failed: ") + e.what(),
                          "pattern_scan_failed"};
    }

    return std::string("Request approved");
}

FilteredResponse SecurityGate::filter_response(const std::string& body) const {
    FilteredResponse result;
    if (body.size() > config_.max_response_bytes) {
        result.body = kOversizeMarker;
        result.filtered = true;
        return result;
    }

    result.body = body;
    for (const auto& [source, pattern] : compiled_patterns_) {
        try {
            if (std::regex_search(body, pattern)) {
                ++result.pattern_hits;
                LOG_WARN("SecurityGate: sensitive content in response matched: " +
                         source);
            }
        } catch (const std::regex_error& e) {
            LOG_WARN("SecurityGate: error during content filtering: " +
                     std::string(e.what()));
        }
    }
    return result;
}

void SecurityGate::add_blocked_domain(const std::string& domain) {
    const std::string normalized = lowercase(domain);
    if (normalized.empty()) {
        return;
    }
    config_.blocked_domains.insert(normalized);
    LOG_INFO("SecurityGate: added domain to blocklist: " + normalized);
}

bool SecurityGate::remove_blocked_domain(const std::string& domain) {
    const std::string normalized = lowercase(domain);
    if (config_.blocked_domains.erase(normalized) == 0) {
        return false;
    }
    LOG_INFO("SecurityGate: removed domain from blocklist: " + normalized);
    return true;
}

core::errors::Result<std::string> SecurityGate::add_blocked_pattern(
    const std::string& pattern) {
    if (pattern.empty()) {
        return RelayError{ErrorCategory::Input, "Pattern cannot be empty.",
                          "invalid_pattern"};
    }
    try {
        compiled_patterns_.emplace_back(pattern, compile_pattern(pattern));
    } catch (const std::regex_error& e) {
        return RelayError{ErrorCategory::Input,
                          "Invalid pattern '" + pattern + "': " + e.what(),
                          "invalid_pattern"};
    }
    config_.blocked_patterns.push_back(pattern);
    LOG_INFO("SecurityGate: added blocked pattern: " + pattern);
    return pattern;
}

}  // namespace relay::policy
