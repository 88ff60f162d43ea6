#include "app/relay_config.hpp"

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>
#include <nlohmann/json.hpp>

namespace relay::app {

using core::errors::ErrorCategory;
using core::errors::RelayError;
using nlohmann::json;

namespace {

RelayError invalid_config(const std::string& message) {
    return RelayError{ErrorCategory::Input, message, "invalid_config",
                      "Durations and sizes must be positive integers within bounds."};
}

// Reads an integer field in [1, max] if present. Returns false on a bad
// type or an out-of-range value.
bool read_positive(const json& doc, const char* key, const std::uint64_t max,
                   std::uint64_t& out) {
    const auto it = doc.find(key);
    if (it == doc.end()) {
        return true;
    }
    if (!it->is_number_unsigned() || it->get<std::uint64_t>() == 0 ||
        it->get<std::uint64_t>() > max) {
        return false;
    }
    out = it->get<std::uint64_t>();
    return true;
}

}  // namespace

std::filesystem::path default_shared_root() {
    if (const char* dir = std::getenv("RELAY_SHARED_DIR"); dir != nullptr && *dir != '\0') {
        return std::filesystem::path(dir);
    }
    const char* user = std::getenv("USER");
    return std::filesystem::path("/tmp") /
           ("shared_" + std::string(user != nullptr ? user : "unknown"));
}

RelayConfig default_config() {
    RelayConfig config;
    config.shared_root = default_shared_root();
    return config;
}

core::errors::Result<RelayConfig> apply_config_text(const std::string& text,
                                                    RelayConfig base) {
    const json doc = json::parse(text, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return invalid_config("Config file is not a JSON object.");
    }

    if (const auto it = doc.find("shared_dir"); it != doc.end()) {
        if (!it->is_string() || it->get<std::string>().empty()) {
            return invalid_config("shared_dir must be a non-empty string.");
        }
        base.shared_root = it->get<std::string>();
    }

    struct MillisField {
        const char* key;
        std::chrono::milliseconds* target;
    };
    for (const MillisField field : {MillisField{"response_timeout_ms", &base.response_timeout},
                                    MillisField{"poll_interval_ms", &base.poll_interval},
                                    MillisField{"scan_interval_ms", &base.scan_interval},
                                    MillisField{"transport_timeout_ms", &base.transport_timeout},
                                    MillisField{"read_backoff_ms", &base.read_retry.backoff}}) {
        std::uint64_t value = static_cast<std::uint64_t>(field.target->count());
        if (!read_positive(doc, field.key, kMaxDurationMs, value)) {
            return invalid_config(std::string("Invalid value for ") + field.key);
        }
        *field.target = std::chrono::milliseconds(value);
    }

    std::uint64_t maintenance = static_cast<std::uint64_t>(base.maintenance_interval.count());
    std::uint64_t stale_age = static_cast<std::uint64_t>(base.stale_response_age.count());
    if (!read_positive(doc, "maintenance_interval_s", kMaxDurationS, maintenance) ||
        !read_positive(doc, "stale_response_age_s", kMaxDurationS, stale_age)) {
        return invalid_config("Invalid maintenance_interval_s or stale_response_age_s");
    }
    base.maintenance_interval = std::chrono::seconds(maintenance);
    base.stale_response_age = std::chrono::seconds(stale_age);

    if (const auto it = doc.find("read_retries"); it != doc.end()) {
        if (!it->is_number_unsigned() || it->get<std::uint64_t>() > 100) {
            return invalid_config("read_retries must be an integer between 0 and 100.");
        }
        base.read_retry.max_retries = it->get<std::uint32_t>();
    }

    std::uint64_t max_request = base.gate.max_request_bytes;
    std::uint64_t max_response = base.gate.max_response_bytes;
    if (!read_positive(doc, "max_request_bytes", kMaxSizeBytes, max_request) ||
        !read_positive(doc, "max_response_bytes", kMaxSizeBytes, max_response)) {
        return invalid_config("Invalid max_request_bytes or max_response_bytes");
    }
    base.gate.max_request_bytes = static_cast<std::size_t>(max_request);
    base.gate.max_response_bytes = static_cast<std::size_t>(max_response);

    if (const auto it = doc.find("blocked_domains"); it != doc.end()) {
        if (!it->is_array()) {
            return invalid_config("blocked_domains must be an array of strings.");
        }
        for (const auto& domain : *it) {
            if (!domain.is_string()) {
                return invalid_config("blocked_domains must be an array of strings.");
            }
            base.gate.blocked_domains.insert(domain.get<std::string>());
        }
    }

    if (const auto it = doc.find("blocked_patterns"); it != doc.end()) {
        if (!it->is_array()) {
            return invalid_config("blocked_patterns must be an array of strings.");
        }
        for (const auto& pattern : *it) {
            if (!pattern.is_string()) {
                return invalid_config("blocked_patterns must be an array of strings.");
            }
            base.gate.blocked_patterns.push_back(pattern.get<std::string>());
        }
    }

    return base;
}

core::errors::Result<RelayConfig> load_config_file(const std::filesystem::path& file,
                                                   RelayConfig base) {
    std::ifstream in(file);
    if (!in.is_open()) {
        return RelayError{ErrorCategory::Input,
                          "Unable to open config file: " + file.string(),
                          "invalid_path"};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return apply_config_text(buffer.str(), std::move(base));
}

agents::InterceptorOptions interceptor_options(const RelayConfig& config) {
    agents::InterceptorOptions options;
    options.response_timeout = config.response_timeout;
    options.poll_interval = config.poll_interval;
    return options;
}

agents::ForwarderOptions forwarder_options(const RelayConfig& config) {
    agents::ForwarderOptions options;
    options.scan_interval = config.scan_interval;
    options.transport_timeout = config.transport_timeout;
    options.maintenance_interval = config.maintenance_interval;
    options.stale_response_age = config.stale_response_age;
    return options;
}

}  // namespace relay::app
