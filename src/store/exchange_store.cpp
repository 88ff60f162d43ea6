#include "store/exchange_store.hpp"

#include <fstream>
#include <iterator>
#include <sstream>
#include <system_error>
#include <thread>
#include <utility>
#include <nlohmann/json.hpp>
#include "core/config/exchange_id.hpp"
#include "core/logging/logger.hpp"

namespace relay::store {

using core::errors::ErrorCategory;
using core::errors::RelayError;

namespace {

constexpr const char* kDescriptorSuffix = ".json";
constexpr const char* kTempSuffix = ".tmp";

bool ends_with(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool is_descriptor_name(const std::string& name) {
    return !name.empty() && name[0] != '.' && ends_with(name, kDescriptorSuffix);
}

bool is_temp_name(const std::string& name) {
    return !name.empty() && name[0] == '.' && ends_with(name, kTempSuffix);
}

std::string id_from_name(const std::string& name) {
    return name.substr(0, name.size() - std::string(kDescriptorSuffix).size());
}

// Distinct per writer so two processes publishing the same id never share a
// temporary file.
std::string temp_name_for(const std::string& id) {
    return "." + id + kDescriptorSuffix + "." +
           core::config::generate_exchange_id().substr(0, 8) + kTempSuffix;
}

std::optional<std::string> read_whole_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

RelayError invalid_id_error(const std::string& id) {
    return RelayError{ErrorCategory::Input, "Invalid exchange id: " + id,
                      "invalid_exchange_id"};
}

}  // namespace

std::string to_string(const Channel channel) {
    switch (channel) {
        case Channel::Requests:
            return "requests";
        case Channel::Responses:
            return "responses";
        default:
            return "unknown";
    }
}

ExchangeStore::ExchangeStore(std::filesystem::path root,
                             ReadRetryPolicy retry_policy)
    : root_(std::move(root)), retry_policy_(retry_policy) {}

bool ExchangeStore::is_valid_id(const std::string& id) {
    if (id.empty() || id[0] == '.') {
        return false;
    }
    for (const char c : id) {
        if (c == '/' || c == '\\' || c == '\0') {
            return false;
        }
    }
    return true;
}

std::filesystem::path ExchangeStore::channel_dir(const Channel channel) const {
    return root_ / to_string(channel);
}

std::filesystem::path ExchangeStore::descriptor_path(const Channel channel,
                                                     const std::string& id) const {
    return channel_dir(channel) / (id + kDescriptorSuffix);
}

core::errors::Result<std::filesystem::path> ExchangeStore::ensure_layout() const {
    std::error_code ec;
    for (const auto& dir : {channel_dir(Channel::Requests),
                            channel_dir(Channel::Responses), root_ / "logs"}) {
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            return RelayError{ErrorCategory::Storage,
                              "Unable to create exchange directory: " +
                                  dir.string() + " (" + ec.message() + ")",
                              "exchange_dir_create_failed",
                              "Check that the shared root is writable."};
        }
    }
    return root_;
}

core::errors::Result<std::filesystem::path> ExchangeStore::publish(
    const Channel channel, const std::string& id, const std::string& bytes) const {
    if (!is_valid_id(id)) {
        return invalid_id_error(id);
    }

    const auto dir = channel_dir(channel);
    const auto final_path = descriptor_path(channel, id);
    const auto temp_path = dir / temp_name_for(id);

    {
        std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return RelayError{ErrorCategory::Storage,
                              "Unable to open temporary descriptor: " +
                                  temp_path.string(),
                              "descriptor_open_failed"};
        }
        out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        out.close();
        if (out.fail()) {
            std::error_code cleanup_ec;
            std::filesystem::remove(temp_path, cleanup_ec);
            return RelayError{ErrorCategory::Storage,
                              "Unable to write descriptor: " + temp_path.string(),
                              "descriptor_write_failed"};
        }
    }

    std::error_code ec;
    std::filesystem::rename(temp_path, final_path, ec);
    if (ec) {
        std::error_code cleanup_ec;
        std::filesystem::remove(temp_path, cleanup_ec);
        return RelayError{ErrorCategory::Storage,
                          "Unable to publish descriptor: " + final_path.string() +
                              " (" + ec.message() + ")",
                          "descriptor_publish_failed"};
    }
    return final_path;
}

core::errors::Result<std::optional<std::string>> ExchangeStore::try_read(
    const Channel channel, const std::string& id) const {
    if (!is_valid_id(id)) {
        return invalid_id_error(id);
    }

    const auto path = descriptor_path(channel, id);
    for (std::uint32_t attempt = 0; attempt <= retry_policy_.max_retries; ++attempt) {
        std::error_code ec;
        if (!std::filesystem::exists(path, ec) || ec) {
            return std::optional<std::string>{};
        }

        auto content = read_whole_file(path);
        if (content.has_value() && !content->empty() &&
            nlohmann::json::accept(*content)) {
            return content;
        }

        if (attempt < retry_policy_.max_retries) {
            LOG_DEBUG("ExchangeStore: descriptor " + to_string(channel) + "/" + id +
                      " not readable yet, retry " + std::to_string(attempt + 1));
            std::this_thread::sleep_for(retry_policy_.backoff * (attempt + 1));
        }
    }

    std::error_code ec;
    if (!std::filesystem::exists(path, ec) || ec) {
        return std::optional<std::string>{};
    }
    return RelayError{ErrorCategory::Decode,
                      "Descriptor is empty or unparseable after " +
                          std::to_string(retry_policy_.max_retries) +
                          " retries: " + path.string(),
                      "corrupt_descriptor"};
}

std::set<std::string> ExchangeStore::list_pending(const Channel channel) const {
    std::set<std::string> ids;
    std::error_code ec;
    std::filesystem::directory_iterator it(channel_dir(channel), ec);
    if (ec) {
        LOG_WARN("ExchangeStore: cannot list " + channel_dir(channel).string() +
                 ": " + ec.message());
        return ids;
    }

    for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
        if (ec) {
            break;
        }
        const std::string name = it->path().filename().string();
        if (!is_descriptor_name(name)) {
            continue;
        }
        std::error_code type_ec;
        if (!it->is_regular_file(type_ec) || type_ec) {
            continue;
        }
        ids.insert(id_from_name(name));
    }
    return ids;
}

bool ExchangeStore::exists(const Channel channel, const std::string& id) const {
    if (!is_valid_id(id)) {
        return false;
    }
    std::error_code ec;
    return std::filesystem::exists(descriptor_path(channel, id), ec) && !ec;
}

bool ExchangeStore::remove(const Channel channel, const std::string& id) const {
    if (!is_valid_id(id)) {
        return false;
    }
    std::error_code ec;
    const bool removed = std::filesystem::remove(descriptor_path(channel, id), ec);
    if (ec) {
        LOG_DEBUG("ExchangeStore: remove " + to_string(channel) + "/" + id +
                  " failed: " + ec.message());
        return false;
    }
    return removed;
}

std::vector<std::string> ExchangeStore::purge_stale(
    const Channel channel, const std::chrono::seconds max_age,
    const PurgeScope scope) const {
    std::vector<std::string> purged;
    std::error_code ec;
    std::filesystem::directory_iterator it(channel_dir(channel), ec);
    if (ec) {
        return purged;
    }

    const auto now = std::filesystem::file_time_type::clock::now();
    for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
        if (ec) {
            break;
        }
        const std::string name = it->path().filename().string();
        const bool descriptor = is_descriptor_name(name);
        if (descriptor ? scope == PurgeScope::TempOnly : !is_temp_name(name)) {
            continue;
        }

        std::error_code time_ec;
        const auto modified = std::filesystem::last_write_time(it->path(), time_ec);
        if (time_ec || now - modified < max_age) {
            continue;
        }

        std::error_code remove_ec;
        if (std::filesystem::remove(it->path(), remove_ec) && !remove_ec &&
            descriptor) {
            purged.push_back(id_from_name(name));
        }
    }
    return purged;
}

core::errors::Result<StoreStatus> ExchangeStore::status() const {
    std::error_code ec;
    if (!std::filesystem::is_directory(root_, ec) || ec) {
        return RelayError{ErrorCategory::Input,
                          "Shared directory does not exist: " + root_.string(),
                          "invalid_shared_root",
                          "Start the forwarder or run fetch once to create it."};
    }

    StoreStatus status;
    status.pending_requests = list_pending(Channel::Requests).size();
    status.responses = list_pending(Channel::Responses).size();
    return status;
}

}  // namespace relay::store
