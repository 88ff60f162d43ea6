#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include "agents/forwarder_agent.hpp"
#include "agents/interceptor_agent.hpp"
#include "core/errors/relay_errors.hpp"
#include "policy/security_gate.hpp"
#include "store/exchange_store.hpp"

namespace relay::app {

// Upper bounds for numeric settings. They keep deadlines representable as
// steady_clock offsets.
inline constexpr std::uint64_t kMaxDurationMs = 24ULL * 60 * 60 * 1000;  // one day
inline constexpr std::uint64_t kMaxDurationS = 30ULL * 24 * 60 * 60;     // thirty days
inline constexpr std::uint64_t kMaxSizeBytes = 1ULL << 30;               // 1 GiB

struct RelayConfig {
    std::filesystem::path shared_root;
    std::chrono::milliseconds response_timeout{300000};
    std::chrono::milliseconds poll_interval{200};
    std::chrono::milliseconds scan_interval{500};
    std::chrono::milliseconds transport_timeout{30000};
    std::chrono::seconds maintenance_interval{3600};
    std::chrono::seconds stale_response_age{3600};
    store::ReadRetryPolicy read_retry;
    policy::SecurityGateConfig gate;
};

// $RELAY_SHARED_DIR, else /tmp/shared_$USER.
std::filesystem::path default_shared_root();

RelayConfig default_config();

// Overlays the keys present in a JSON document onto `base`. Unknown keys are
// ignored; blocked_domains and blocked_patterns extend the existing lists.
core::errors::Result<RelayConfig> apply_config_text(const std::string& text,
                                                    RelayConfig base);

core::errors::Result<RelayConfig> load_config_file(const std::filesystem::path& file,
                                                   RelayConfig base);

agents::InterceptorOptions interceptor_options(const RelayConfig& config);
agents::ForwarderOptions forwarder_options(const RelayConfig& config);

}  // namespace relay::app
