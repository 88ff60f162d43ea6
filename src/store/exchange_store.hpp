#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "core/errors/relay_errors.hpp"

namespace relay::store {

enum class Channel {
    Requests,
    Responses
};

// Bounds the re-reads of a descriptor that is visible but not yet readable.
struct ReadRetryPolicy {
    std::uint32_t max_retries = 3;
    std::chrono::milliseconds backoff{50};
};

enum class PurgeScope {
    DescriptorsAndTemp,
    TempOnly
};

struct StoreStatus {
    std::size_t pending_requests = 0;
    std::size_t responses = 0;
};

std::string to_string(Channel channel);

// File-backed exchange directories under a shared root:
//   <root>/requests/<id>.json, <root>/responses/<id>.json, <root>/logs/
// There is no cross-id locking. Per-id atomicity comes from publishing
// through a temporary file and a rename within the same directory.
class ExchangeStore {
public:
    explicit ExchangeStore(std::filesystem::path root,
                           ReadRetryPolicy retry_policy = {});

    core::errors::Result<std::filesystem::path> ensure_layout() const;

    core::errors::Result<std::filesystem::path> publish(
        Channel channel, const std::string& id, const std::string& bytes) const;

    // Absent when no descriptor exists (or it vanished mid-read). A
    // descriptor that stays empty or unparseable after the bounded retries
    // is reported as corrupt_descriptor.
    core::errors::Result<std::optional<std::string>> try_read(
        Channel channel, const std::string& id) const;

    // Snapshot only; may be stale by the time the caller acts on it.
    std::set<std::string> list_pending(Channel channel) const;

    bool exists(Channel channel, const std::string& id) const;

    // Best-effort. Returns true only when this call removed the file.
    bool remove(Channel channel, const std::string& id) const;

    // Deletes abandoned temporary files older than max_age and, unless the
    // scope is TempOnly, descriptors older than max_age. Returns purged ids.
    std::vector<std::string> purge_stale(
        Channel channel, std::chrono::seconds max_age,
        PurgeScope scope = PurgeScope::DescriptorsAndTemp) const;

    core::errors::Result<StoreStatus> status() const;

    std::filesystem::path channel_dir(Channel channel) const;
    std::filesystem::path descriptor_path(Channel channel,
                                          const std::string& id) const;
    const std::filesystem::path& root() const { return root_; }

    static bool is_valid_id(const std::string& id);

private:
    std::filesystem::path root_;
    ReadRetryPolicy retry_policy_;
};

}  // namespace relay::store
