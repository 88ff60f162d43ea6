#include "cli_parser.hpp"
#include <charconv>
#include <cstdint>
#include <optional>
#include <system_error>
#include <vector>

namespace relay::app::cli {

    using namespace relay::core::errors;

    namespace {

    // 1. Raw Options Struct (Internal only)
    struct RawCliOptions {
        std::optional<std::string> shared_dir;
        std::optional<std::string> config_file;
        std::optional<std::string> timeout_ms;
        std::optional<std::string> poll_interval_ms;
        std::optional<std::string> max_request_bytes;
        std::optional<std::string> max_response_bytes;
        std::optional<std::string> url;
        std::optional<std::string> method;
        std::optional<std::string> data;
        std::vector<std::string> headers;
        std::vector<std::string> blocked_domains;
        bool verbose = false;
    };

    // Exception-free integer parsing
    Result<std::uint64_t> parse_positive(const std::string& text, const std::string& flag, std::uint64_t max) {
        std::uint64_t value = 0;
        const char* begin = text.data();
        const char* end = text.data() + text.size();
        auto [ptr, ec] = std::from_chars(begin, end, value);
        if (ec != std::errc() || ptr != end) {
            return RelayError{ErrorCategory::Input, "Invalid number for " + flag, "invalid_integer", "Provide a positive integer."};
        }
        if (value == 0 || value > max) {
            return RelayError{ErrorCategory::Input, flag + " out of bounds", "bounds_error", "Must be between 1 and " + std::to_string(max) + "."};
        }
        return value;
    }

    } // namespace

    Result<CliInvocation> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return RelayError{ErrorCategory::Input, "No command provided.", "missing_command", "Usage: fsrelay <forward|fetch|status> [options]"};
        }

        CliInvocation invocation;
        const std::string command = argv[1];
        if (command == "forward") {
            invocation.command = Command::Forward;
        } else if (command == "fetch") {
            invocation.command = Command::Fetch;
        } else if (command == "status") {
            invocation.command = Command::Status;
        } else {
            return RelayError{ErrorCategory::Input, "Unknown command: " + command, "unknown_command", "Supported commands: forward, fetch, status."};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) { // Start at 2 to skip program name and command
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        for (size_t i = 0; i < args.size(); ++i) {
            const std::string& flag = args[i];
            if (flag == "--verbose" || flag == "-v") {
                raw.verbose = true;
                continue;
            }
            if (i + 1 >= args.size()) {
                if (flag.rfind("--", 0) == 0) {
                    return RelayError{ErrorCategory::Input, "Missing value for " + flag, "missing_value"};
                }
                return RelayError{ErrorCategory::Input, "Unknown argument: " + flag, "unknown_argument"};
            }
            if (flag == "--shared-dir") raw.shared_dir = args[++i];
            else if (flag == "--config") raw.config_file = args[++i];
            else if (flag == "--timeout-ms") raw.timeout_ms = args[++i];
            else if (flag == "--poll-interval-ms") raw.poll_interval_ms = args[++i];
            else if (flag == "--max-request-bytes") raw.max_request_bytes = args[++i];
            else if (flag == "--max-response-bytes") raw.max_response_bytes = args[++i];
            else if (flag == "--block-domain") raw.blocked_domains.push_back(args[++i]);
            else if (flag == "--url") raw.url = args[++i];
            else if (flag == "--method") raw.method = args[++i];
            else if (flag == "--header") raw.headers.push_back(args[++i]);
            else if (flag == "--data") raw.data = args[++i];
            else {
                return RelayError{ErrorCategory::Input, "Unknown argument: " + flag, "unknown_argument"};
            }
        }

        // 3. Validator Phase: defaults, then config file, then flags
        invocation.verbose = raw.verbose;
        invocation.config = default_config();
        if (raw.config_file) {
            auto loaded = load_config_file(raw.config_file.value(), invocation.config);
            if (is_error(loaded)) {
                return get_error(loaded);
            }
            invocation.config = get_value(loaded);
        }

        if (raw.shared_dir) {
            if (raw.shared_dir->empty()) {
                return RelayError{ErrorCategory::Input, "--shared-dir cannot be empty", "invalid_path"};
            }
            invocation.config.shared_root = raw.shared_dir.value();
        }

        if (raw.timeout_ms) {
            auto parsed = parse_positive(raw.timeout_ms.value(), "--timeout-ms", kMaxDurationMs);
            if (is_error(parsed)) return get_error(parsed);
            invocation.config.response_timeout = std::chrono::milliseconds(get_value(parsed));
        }
        if (raw.poll_interval_ms) {
            auto parsed = parse_positive(raw.poll_interval_ms.value(), "--poll-interval-ms", kMaxDurationMs);
            if (is_error(parsed)) return get_error(parsed);
            invocation.config.poll_interval = std::chrono::milliseconds(get_value(parsed));
        }
        if (raw.max_request_bytes) {
            auto parsed = parse_positive(raw.max_request_bytes.value(), "--max-request-bytes", kMaxSizeBytes);
            if (is_error(parsed)) return get_error(parsed);
            invocation.config.gate.max_request_bytes = static_cast<std::size_t>(get_value(parsed));
        }
        if (raw.max_response_bytes) {
            auto parsed = parse_positive(raw.max_response_bytes.value(), "--max-response-bytes", kMaxSizeBytes);
            if (is_error(parsed)) return get_error(parsed);
            invocation.config.gate.max_response_bytes = static_cast<std::size_t>(get_value(parsed));
        }
        for (const auto& domain : raw.blocked_domains) {
            invocation.config.gate.blocked_domains.insert(domain);
        }

        if (invocation.command != Command::Fetch) {
            if (raw.url || raw.method || raw.data || !raw.headers.empty()) {
                return RelayError{ErrorCategory::Input, "Request flags are only valid for fetch", "conflicting_flags"};
            }
            return invocation;
        }

        if (!raw.url || raw.url->empty()) {
            return RelayError{ErrorCategory::Input, "Must provide --url", "missing_required_flag", "Usage: fsrelay fetch --url https://example.com/"};
        }
        invocation.fetch.url = raw.url.value();
        invocation.fetch.method = raw.method.value_or("GET");
        invocation.fetch.body = raw.data.value_or("");
        for (const auto& header : raw.headers) {
            const auto colon = header.find(':');
            if (colon == std::string::npos || colon == 0) {
                return RelayError{ErrorCategory::Input, "Invalid header: " + header, "invalid_header", "Use --header \"Name: value\"."};
            }
            std::string value = header.substr(colon + 1);
            const auto first = value.find_first_not_of(' ');
            value = first == std::string::npos ? "" : value.substr(first);
            invocation.fetch.headers[header.substr(0, colon)] = value;
        }

        return invocation;
    }

} // namespace relay::app::cli
