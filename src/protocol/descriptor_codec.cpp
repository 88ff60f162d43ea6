#include "protocol/descriptor_codec.hpp"

#include <cctype>
#include <cstdio>
#include <ctime>
#include <stdexcept>
#include <utility>
#include <nlohmann/json.hpp>
#include "core/config/exchange_id.hpp"
#include "core/crypto/digest.hpp"

namespace relay::protocol {

using core::errors::ErrorCategory;
using core::errors::RelayError;
using nlohmann::json;

namespace {

// Raised by the field readers below and converted to a RelayError at the
// decode() boundary.
struct DecodeFailure : std::runtime_error {
    DecodeFailure(std::string code_value, const std::string& message)
        : std::runtime_error(message), code(std::move(code_value)) {}
    std::string code;
};

const json& require_object(const json& parent, const char* key) {
    const auto it = parent.find(key);
    if (it == parent.end()) {
        throw DecodeFailure("missing_field", std::string("Missing required object: ") + key);
    }
    if (!it->is_object()) {
        throw DecodeFailure("invalid_field", std::string("Field is not an object: ") + key);
    }
    return *it;
}

std::string require_string(const json& parent, const char* key) {
    const auto it = parent.find(key);
    if (it == parent.end()) {
        throw DecodeFailure("missing_field", std::string("Missing required field: ") + key);
    }
    if (!it->is_string()) {
        throw DecodeFailure("invalid_field", std::string("Field is not a string: ") + key);
    }
    return it->get<std::string>();
}

std::string optional_string(const json& parent, const char* key,
                            const std::string& fallback) {
    const auto it = parent.find(key);
    if (it == parent.end() || !it->is_string()) {
        return fallback;
    }
    return it->get<std::string>();
}

bool optional_bool(const json& parent, const char* key, const bool fallback) {
    const auto it = parent.find(key);
    if (it == parent.end() || !it->is_boolean()) {
        return fallback;
    }
    return it->get<bool>();
}

Headers require_headers(const json& parent) {
    const json& raw = require_object(parent, "headers");
    Headers headers;
    for (auto it = raw.begin(); it != raw.end(); ++it) {
        if (!it.value().is_string()) {
            throw DecodeFailure("invalid_field", "Header value is not a string: " + it.key());
        }
        headers[it.key()] = it.value().get<std::string>();
    }
    return headers;
}

std::string require_content(const json& parent) {
    const std::string encoded = require_string(parent, "content");
    auto decoded = core::crypto::base64_decode(encoded);
    if (core::errors::is_error(decoded)) {
        throw DecodeFailure(core::errors::get_error(decoded).code,
                            core::errors::get_error(decoded).message);
    }
    return core::errors::get_value(decoded);
}

Timestamp require_timestamp(const json& parent, const char* key) {
    const std::string text = require_string(parent, key);
    auto parsed = parse_timestamp(text);
    if (core::errors::is_error(parsed)) {
        throw DecodeFailure("invalid_timestamp", core::errors::get_error(parsed).message);
    }
    return core::errors::get_value(parsed);
}

RequestDescriptor request_from_json(const json& envelope) {
    const json& metadata = require_object(envelope, "metadata");
    const json& request = require_object(envelope, "request");
    const json& security = require_object(envelope, "security");

    RequestDescriptor out;
    out.id = require_string(metadata, "request_id");
    if (out.id.empty()) {
        throw DecodeFailure("invalid_field", "request_id cannot be empty.");
    }
    out.created_at = require_timestamp(metadata, "timestamp");
    out.version = optional_string(metadata, "proxy_version", kProtocolVersion);
    out.source_process = optional_string(metadata, "source_process", "capture_point");
    out.method = require_string(request, "method");
    out.url = require_string(request, "url");
    out.headers = require_headers(request);
    out.body = require_content(request);
    out.http_version = optional_string(request, "http_version", kDefaultHttpVersion);
    out.content_hash = require_string(security, "content_hash");
    return out;
}

ResponseDescriptor response_from_json(const json& envelope) {
    const json& metadata = require_object(envelope, "metadata");
    const json& response = require_object(envelope, "response");
    const json& security = require_object(envelope, "security");

    ResponseDescriptor out;
    out.id = require_string(metadata, "request_id");
    if (out.id.empty()) {
        throw DecodeFailure("invalid_field", "request_id cannot be empty.");
    }
    out.processed_at = require_timestamp(metadata, "processed_at");
    out.version = optional_string(metadata, "processor_version", kProtocolVersion);
    out.security_status = optional_string(metadata, "security_status", "approved");

    const auto status_it = response.find("status_code");
    if (status_it == response.end()) {
        throw DecodeFailure("missing_field", "Missing required field: status_code");
    }
    if (!status_it->is_number_integer()) {
        throw DecodeFailure("invalid_field", "Field is not an integer: status_code");
    }
    out.status_code = status_it->get<int>();
    out.reason = require_string(response, "reason");
    out.headers = require_headers(response);
    out.body = require_content(response);
    out.http_version = optional_string(response, "http_version", kDefaultHttpVersion);

    out.response_hash = require_string(security, "response_hash");
    out.filtered = optional_bool(security, "content_filtered", false);
    const auto scan_it = security.find("scan_results");
    if (scan_it != security.end() && scan_it->is_object()) {
        out.scan_results.malware = optional_bool(*scan_it, "malware", false);
        out.scan_results.suspicious_content =
            optional_bool(*scan_it, "suspicious_content", false);
    }
    return out;
}

json headers_to_json(const Headers& headers) {
    json out = json::object();
    for (const auto& [name, value] : headers) {
        out[name] = value;
    }
    return out;
}

std::string dump(const json& envelope) {
    // Header values from a capture engine are not guaranteed to be UTF-8.
    return envelope.dump(2, ' ', false, json::error_handler_t::replace);
}

bool read_number(const std::string& text, std::size_t& pos, const std::size_t digits,
                 int& out) {
    if (pos + digits > text.size()) {
        return false;
    }
    int value = 0;
    for (std::size_t i = 0; i < digits; ++i) {
        const char c = text[pos + i];
        if (std::isdigit(static_cast<unsigned char>(c)) == 0) {
            return false;
        }
        value = value * 10 + (c - '0');
    }
    pos += digits;
    out = value;
    return true;
}

bool expect_char(const std::string& text, std::size_t& pos, const char c) {
    if (pos >= text.size() || text[pos] != c) {
        return false;
    }
    ++pos;
    return true;
}

}  // namespace

Timestamp now_utc() {
    return std::chrono::time_point_cast<std::chrono::microseconds>(
        std::chrono::system_clock::now());
}

std::string format_timestamp(const Timestamp ts) {
    const auto seconds = std::chrono::time_point_cast<std::chrono::seconds>(ts);
    auto micros =
        std::chrono::duration_cast<std::chrono::microseconds>(ts - seconds).count();
    if (micros < 0) {
        micros = 0;
    }

    const std::time_t raw = std::chrono::system_clock::to_time_t(seconds);
    std::tm utc{};
    gmtime_r(&raw, &utc);

    char date[32];
    std::strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &utc);
    char fraction[24];
    std::snprintf(fraction, sizeof(fraction), ".%06lld+00:00",
                  static_cast<long long>(micros));
    return std::string(date) + fraction;
}

core::errors::Result<Timestamp> parse_timestamp(const std::string& text) {
    const RelayError invalid{ErrorCategory::Decode,
                             "Unparseable timestamp: " + text,
                             "invalid_timestamp"};

    std::size_t pos = 0;
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    if (!read_number(text, pos, 4, year) || !expect_char(text, pos, '-') ||
        !read_number(text, pos, 2, month) || !expect_char(text, pos, '-') ||
        !read_number(text, pos, 2, day) ||
        !(expect_char(text, pos, 'T') || expect_char(text, pos, ' ')) ||
        !read_number(text, pos, 2, hour) || !expect_char(text, pos, ':') ||
        !read_number(text, pos, 2, minute) || !expect_char(text, pos, ':') ||
        !read_number(text, pos, 2, second)) {
        return invalid;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 ||
        minute > 59 || second > 60) {
        return invalid;
    }

    long long micros = 0;
    if (expect_char(text, pos, '.')) {
        int digits = 0;
        while (pos < text.size() &&
               std::isdigit(static_cast<unsigned char>(text[pos])) != 0) {
            if (digits < 6) {
                micros = micros * 10 + (text[pos] - '0');
            }
            ++digits;
            ++pos;
        }
        if (digits == 0) {
            return invalid;
        }
        for (int i = digits; i < 6; ++i) {
            micros *= 10;
        }
    }

    // Naive timestamps are rejected; the envelope always records UTC.
    int offset_seconds = 0;
    if (expect_char(text, pos, 'Z')) {
        offset_seconds = 0;
    } else if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
        const int sign = text[pos] == '-' ? -1 : 1;
        ++pos;
        int off_hours = 0, off_minutes = 0;
        if (!read_number(text, pos, 2, off_hours) || !expect_char(text, pos, ':') ||
            !read_number(text, pos, 2, off_minutes) || off_hours > 23 ||
            off_minutes > 59) {
            return invalid;
        }
        offset_seconds = sign * (off_hours * 3600 + off_minutes * 60);
    } else {
        return invalid;
    }
    if (pos != text.size()) {
        return invalid;
    }

    std::tm utc{};
    utc.tm_year = year - 1900;
    utc.tm_mon = month - 1;
    utc.tm_mday = day;
    utc.tm_hour = hour;
    utc.tm_min = minute;
    utc.tm_sec = second;
    const std::time_t epoch = timegm(&utc);
    if (epoch == static_cast<std::time_t>(-1)) {
        return invalid;
    }

    Timestamp ts = std::chrono::system_clock::from_time_t(epoch - offset_seconds);
    ts += std::chrono::microseconds(micros);
    return ts;
}

RequestDescriptor encode_request(const std::string& method, const std::string& url,
                                 const Headers& headers, const std::string& body) {
    RequestDescriptor out;
    out.id = core::config::generate_exchange_id();
    out.created_at = now_utc();
    out.method = method;
    out.url = url;
    out.headers = headers;
    out.body = body;
    out.content_hash = core::crypto::sha256_hex(body);
    return out;
}

ResponseDescriptor encode_response(const std::string& id, const int status_code,
                                   const std::string& reason,
                                   const Headers& headers,
                                   const std::string& body, const bool filtered) {
    ResponseDescriptor out;
    out.id = id;
    out.processed_at = now_utc();
    out.status_code = status_code;
    out.reason = reason;
    out.headers = headers;
    out.body = body;
    out.response_hash = core::crypto::sha256_hex(body);
    out.filtered = filtered;
    return out;
}

std::string serialize(const RequestDescriptor& request) {
    json envelope;
    envelope["metadata"] = {
        {"request_id", request.id},
        {"timestamp", format_timestamp(request.created_at)},
        {"source_process", request.source_process},
        {"proxy_version", request.version}};
    envelope["request"] = {
        {"method", request.method},
        {"url", request.url},
        {"headers", headers_to_json(request.headers)},
        {"content", core::crypto::base64_encode(request.body)},
        {"http_version", request.http_version}};
    envelope["security"] = {{"content_hash", request.content_hash}};
    return dump(envelope);
}

std::string serialize(const ResponseDescriptor& response) {
    json envelope;
    envelope["metadata"] = {
        {"request_id", response.id},
        {"processed_at", format_timestamp(response.processed_at)},
        {"processor_version", response.version},
        {"security_status", response.security_status}};
    envelope["response"] = {
        {"status_code", response.status_code},
        {"reason", response.reason},
        {"headers", headers_to_json(response.headers)},
        {"content", core::crypto::base64_encode(response.body)},
        {"http_version", response.http_version}};
    envelope["security"] = {
        {"content_filtered", response.filtered},
        {"response_hash", response.response_hash},
        {"scan_results",
         {{"malware", response.scan_results.malware},
          {"suspicious_content", response.scan_results.suspicious_content}}}};
    return dump(envelope);
}

core::errors::Result<Descriptor> decode(const std::string& bytes) {
    const json envelope = json::parse(bytes, nullptr, false);
    if (envelope.is_discarded() || !envelope.is_object()) {
        return RelayError{ErrorCategory::Decode,
                          "Descriptor is not a JSON object.",
                          "malformed_envelope"};
    }

    const bool has_request = envelope.contains("request");
    const bool has_response = envelope.contains("response");
    if (has_request == has_response) {
        return RelayError{ErrorCategory::Decode,
                          "Descriptor must contain exactly one of request or response.",
                          "unknown_envelope_kind"};
    }

    try {
        if (has_request) {
            return Descriptor{request_from_json(envelope)};
        }
        return Descriptor{response_from_json(envelope)};
    } catch (const DecodeFailure& e) {
        return RelayError{ErrorCategory::Decode, e.what(), e.code};
    } catch (const json::exception& e) {
        return RelayError{ErrorCategory::Decode,
                          std::string("Descriptor field error: ") + e.what(),
                          "invalid_field"};
    }
}

core::errors::Result<RequestDescriptor> decode_request(const std::string& bytes) {
    auto decoded = decode(bytes);
    if (core::errors::is_error(decoded)) {
        return core::errors::get_error(decoded);
    }
    const auto& descriptor = core::errors::get_value(decoded);
    if (!std::holds_alternative<RequestDescriptor>(descriptor)) {
        return RelayError{ErrorCategory::Decode,
                          "Expected a request descriptor, found a response.",
                          "unexpected_envelope_kind"};
    }
    return std::get<RequestDescriptor>(descriptor);
}

core::errors::Result<ResponseDescriptor> decode_response(const std::string& bytes) {
    auto decoded = decode(bytes);
    if (core::errors::is_error(decoded)) {
        return core::errors::get_error(decoded);
    }
    const auto& descriptor = core::errors::get_value(decoded);
    if (!std::holds_alternative<ResponseDescriptor>(descriptor)) {
        return RelayError{ErrorCategory::Decode,
                          "Expected a response descriptor, found a request.",
                          "unexpected_envelope_kind"};
    }
    return std::get<ResponseDescriptor>(descriptor);
}

bool verify_integrity(const ResponseDescriptor& response) {
    return core::crypto::sha256_hex(response.body) == response.response_hash;
}

}  // namespace relay::protocol
