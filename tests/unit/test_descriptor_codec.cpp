#include <chrono>
#include <string>
#include <variant>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/crypto/digest.hpp"
#include "core/errors/relay_errors.hpp"
#include "protocol/descriptor_codec.hpp"

namespace {

using relay::core::errors::ErrorCategory;
using relay::core::errors::get_error;
using relay::core::errors::get_value;
using relay::core::errors::is_error;
using relay::protocol::decode;
using relay::protocol::decode_request;
using relay::protocol::decode_response;
using relay::protocol::encode_request;
using relay::protocol::encode_response;
using relay::protocol::RequestDescriptor;
using relay::protocol::ResponseDescriptor;
using relay::protocol::serialize;
using nlohmann::json;

TEST(DescriptorCodecTest, RequestRoundTripPreservesFields) {
    const std::string body("{\"q\":1}\x00\xff", 9);
    const auto request = encode_request(
        "POST", "https://api.example.org/v1/items?page=2",
        {{"Content-Type", "application/json"}, {"Accept", "*/*"}}, body);

    auto decoded = decode_request(serialize(request));
    ASSERT_FALSE(is_error(decoded));
    const auto& copy = get_value(decoded);

    EXPECT_EQ(copy.id, request.id);
    EXPECT_EQ(copy.created_at, request.created_at);
    EXPECT_EQ(copy.method, "POST");
    EXPECT_EQ(copy.url, request.url);
    EXPECT_EQ(copy.headers, request.headers);
    EXPECT_EQ(copy.body, body);
    EXPECT_EQ(copy.content_hash, relay::core::crypto::sha256_hex(body));
    EXPECT_EQ(copy.version, relay::protocol::kProtocolVersion);
}

TEST(DescriptorCodecTest, ResponseRoundTripKeepsVerifiableDigest) {
    const auto response = encode_response("r1", 200, "OK",
                                          {{"content-type", "text/plain"}},
                                          "hello", false);
    EXPECT_EQ(response.response_hash,
              "2cf24dba5fb0a30e26e83b2ac5b9e29e1b161e5c1fa7425e73043362938b9824");

    auto decoded = decode_response(serialize(response));
    ASSERT_FALSE(is_error(decoded));
    const auto& copy = get_value(decoded);

    EXPECT_EQ(copy.id, "r1");
    EXPECT_EQ(copy.status_code, 200);
    EXPECT_EQ(copy.reason, "OK");
    EXPECT_EQ(copy.body, "hello");
    EXPECT_FALSE(copy.filtered);
    EXPECT_EQ(copy.processed_at, response.processed_at);
    EXPECT_TRUE(relay::protocol::verify_integrity(copy));
}

TEST(DescriptorCodecTest, EnvelopeUsesDocumentedLayout) {
    const auto request = encode_request("GET", "http://test.local/", {}, "");
    const auto envelope = json::parse(serialize(request));

    EXPECT_EQ(envelope.at("metadata").at("request_id").get<std::string>(), request.id);
    EXPECT_TRUE(envelope.at("metadata").contains("timestamp"));
    EXPECT_EQ(envelope.at("request").at("content").get<std::string>(), "");
    EXPECT_EQ(envelope.at("request").at("http_version").get<std::string>(), "HTTP/1.1");
    EXPECT_EQ(envelope.at("security").at("content_hash").get<std::string>(),
              relay::core::crypto::sha256_hex(""));

    const auto response = encode_response(request.id, 403, "Error", {}, "no", false);
    const auto response_envelope = json::parse(serialize(response));
    EXPECT_EQ(response_envelope.at("response").at("status_code").get<int>(), 403);
    EXPECT_FALSE(response_envelope.at("security").at("content_filtered").get<bool>());
    EXPECT_FALSE(
        response_envelope.at("security").at("scan_results").at("malware").get<bool>());
}

TEST(DescriptorCodecTest, DecodeDistinguishesKinds) {
    const auto request = encode_request("GET", "http://test.local/", {}, "");
    auto generic = decode(serialize(request));
    ASSERT_FALSE(is_error(generic));
    EXPECT_TRUE(std::holds_alternative<RequestDescriptor>(get_value(generic)));

    auto wrong_kind = decode_response(serialize(request));
    ASSERT_TRUE(is_error(wrong_kind));
    EXPECT_EQ(get_error(wrong_kind).code, "unexpected_envelope_kind");
}

TEST(DescriptorCodecTest, IgnoresUnknownFields) {
    const auto response = encode_response("r9", 201, "Created", {}, "made", false);
    auto envelope = json::parse(serialize(response));
    envelope["metadata"]["relay_hop"] = 3;
    envelope["extra_section"] = {{"anything", true}};
    envelope["response"]["trailers"] = json::array();

    auto decoded = decode_response(envelope.dump());
    ASSERT_FALSE(is_error(decoded));
    EXPECT_EQ(get_value(decoded).status_code, 201);
}

TEST(DescriptorCodecTest, FailsOnMissingRequiredField) {
    auto envelope = json::parse(serialize(encode_request("GET", "http://a/", {}, "")));
    envelope["request"].erase("url");

    auto decoded = decode(envelope.dump());
    ASSERT_TRUE(is_error(decoded));
    EXPECT_EQ(get_error(decoded).category, ErrorCategory::Decode);
    EXPECT_EQ(get_error(decoded).code, "missing_field");
}

TEST(DescriptorCodecTest, FailsOnMalformedBodyEncoding) {
    auto envelope = json::parse(serialize(encode_response("r2", 200, "OK", {}, "x", false)));
    envelope["response"]["content"] = "not*base64";

    auto decoded = decode(envelope.dump());
    ASSERT_TRUE(is_error(decoded));
    EXPECT_EQ(get_error(decoded).code, "invalid_base64");
}

TEST(DescriptorCodecTest, FailsOnUnparseableTimestamp) {
    auto envelope = json::parse(serialize(encode_request("GET", "http://a/", {}, "")));
    envelope["metadata"]["timestamp"] = "yesterday at noon";

    auto decoded = decode(envelope.dump());
    ASSERT_TRUE(is_error(decoded));
    EXPECT_EQ(get_error(decoded).code, "invalid_timestamp");
}

TEST(DescriptorCodecTest, FailsOnWrongFieldType) {
    auto envelope = json::parse(serialize(encode_response("r3", 200, "OK", {}, "x", false)));
    envelope["response"]["status_code"] = "200";

    auto decoded = decode(envelope.dump());
    ASSERT_TRUE(is_error(decoded));
    EXPECT_EQ(get_error(decoded).code, "invalid_field");
}

TEST(DescriptorCodecTest, FailsOnTruncatedJson) {
    const std::string bytes = serialize(encode_request("GET", "http://a/", {}, "abc"));
    auto decoded = decode(bytes.substr(0, bytes.size() / 2));
    ASSERT_TRUE(is_error(decoded));
    EXPECT_EQ(get_error(decoded).code, "malformed_envelope");
}

TEST(DescriptorCodecTest, DetectsDigestMismatch) {
    auto response = encode_response("r4", 200, "OK", {}, "untouched", false);
    response.body = "tampered";
    EXPECT_FALSE(relay::protocol::verify_integrity(response));
}

TEST(DescriptorCodecTest, ParsesForeignTimestampForms) {
    auto utc = relay::protocol::parse_timestamp("2024-03-01T12:00:00Z");
    auto offset = relay::protocol::parse_timestamp("2024-03-01T14:00:00.000000+02:00");
    auto no_fraction = relay::protocol::parse_timestamp("2024-03-01T12:00:00+00:00");
    ASSERT_FALSE(is_error(utc));
    ASSERT_FALSE(is_error(offset));
    ASSERT_FALSE(is_error(no_fraction));
    EXPECT_EQ(get_value(utc), get_value(offset));
    EXPECT_EQ(get_value(utc), get_value(no_fraction));

    EXPECT_TRUE(is_error(relay::protocol::parse_timestamp("2024-03-01T12:00:00")));
    EXPECT_TRUE(is_error(relay::protocol::parse_timestamp("2024-13-01T12:00:00Z")));
}

TEST(DescriptorCodecTest, FormatsMicrosecondUtcTimestamp) {
    const auto ts = std::chrono::system_clock::from_time_t(0) +
                    std::chrono::microseconds(1500);
    EXPECT_EQ(relay::protocol::format_timestamp(ts), "1970-01-01T00:00:00.001500+00:00");
}

}  // namespace
