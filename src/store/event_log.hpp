#pragma once

#include <filesystem>
#include <mutex>
#include <string>
#include "core/errors/relay_errors.hpp"

namespace relay::store {

enum class EventTag {
    Scan,
    RequestStart,
    RequestSuccess,
    RequestFailed,
    RequestSkip
};

std::string to_string(EventTag tag);

// Append-only lifecycle log under <root>/logs/<agent>.log, one line per
// event: "<utc timestamp> <TAG> <id or -> <detail>".
class EventLog {
public:
    EventLog(std::filesystem::path shared_root, std::string agent_name);

    core::errors::Result<std::filesystem::path> append(
        EventTag tag, const std::string& exchange_id,
        const std::string& detail = "") const;

    std::filesystem::path log_path() const;

private:
    std::filesystem::path logs_dir_;
    std::string agent_name_;
    mutable std::mutex mutex_;
};

}  // namespace relay::store
