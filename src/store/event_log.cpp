#include "store/event_log.hpp"

#include <fstream>
#include <system_error>
#include <utility>
#include "protocol/descriptor_codec.hpp"

namespace relay::store {

using core::errors::ErrorCategory;
using core::errors::RelayError;

namespace {

std::string single_line(std::string text) {
    for (char& c : text) {
        if (c == '\n' || c == '\r') {
            c = ' ';
        }
    }
    return text;
}

}  // namespace

std::string to_string(const EventTag tag) {
    switch (tag) {
        case EventTag::Scan:
            return "SCAN";
        case EventTag::RequestStart:
            return "REQUEST_START";
        case EventTag::RequestSuccess:
            return "REQUEST_SUCCESS";
        case EventTag::RequestFailed:
            return "REQUEST_FAILED";
        case EventTag::RequestSkip:
            return "REQUEST_SKIP";
        default:
            return "UNKNOWN";
    }
}

EventLog::EventLog(std::filesystem::path shared_root, std::string agent_name)
    : logs_dir_(std::move(shared_root) / "logs"),
      agent_name_(std::move(agent_name)) {}

std::filesystem::path EventLog::log_path() const {
    return logs_dir_ / (agent_name_ + ".log");
}

core::errors::Result<std::filesystem::path> EventLog::append(
    const EventTag tag, const std::string& exchange_id,
    const std::string& detail) const {
    std::string line = protocol::format_timestamp(protocol::now_utc()) + " " +
                       to_string(tag) + " " +
                       (exchange_id.empty() ? "-" : exchange_id);
    if (!detail.empty()) {
        line += " " + single_line(detail);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;
    std::filesystem::create_directories(logs_dir_, ec);
    if (ec) {
        return RelayError{ErrorCategory::Storage,
                          "Unable to create logs directory: " + logs_dir_.string(),
                          "log_dir_create_failed"};
    }

    const auto path = log_path();
    std::ofstream out(path, std::ios::app);
    if (!out.is_open()) {
        return RelayError{ErrorCategory::Storage,
                          "Unable to open event log: " + path.string(),
                          "log_open_failed"};
    }

    out << line << "\n";
    if (!out.good()) {
        return RelayError{ErrorCategory::Storage,
                          "Unable to write event log: " + path.string(),
                          "log_write_failed"};
    }
    return path;
}

}  // namespace relay::store
