#pragma once

#include <string>
#include "core/errors/relay_errors.hpp"
#include "protocol/descriptor_contract.hpp"

namespace relay::protocol {

// Builds a request with a fresh exchange id, the current UTC time and the
// body digest filled in.
RequestDescriptor encode_request(const std::string& method, const std::string& url,
                                 const Headers& headers, const std::string& body);

// `body` is the content as it will be published, i.e. after any response
// filtering. The recorded digest is computed over exactly these bytes.
ResponseDescriptor encode_response(const std::string& id, int status_code,
                                   const std::string& reason,
                                   const Headers& headers,
                                   const std::string& body, bool filtered);

std::string serialize(const RequestDescriptor& request);
std::string serialize(const ResponseDescriptor& response);

// Fails with ErrorCategory::Decode on malformed JSON, a missing or mistyped
// required field, bad base64 content or an unparseable timestamp. Unknown
// fields are ignored.
core::errors::Result<Descriptor> decode(const std::string& bytes);
core::errors::Result<RequestDescriptor> decode_request(const std::string& bytes);
core::errors::Result<ResponseDescriptor> decode_response(const std::string& bytes);

// True when the recorded digest matches a fresh digest of the body.
bool verify_integrity(const ResponseDescriptor& response);

Timestamp now_utc();
std::string format_timestamp(Timestamp ts);
core::errors::Result<Timestamp> parse_timestamp(const std::string& text);

}  // namespace relay::protocol
