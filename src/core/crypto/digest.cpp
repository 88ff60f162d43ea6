#include "core/crypto/digest.hpp"

#include <memory>
#include <stdexcept>
#include <vector>
#include <openssl/evp.h>

namespace relay::core::crypto {

using core::errors::ErrorCategory;
using core::errors::RelayError;

namespace {

struct EvpMdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

bool is_base64_char(const char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
           (c >= '0' && c <= '9') || c == '+' || c == '/';
}

}  // namespace

std::string sha256_hex(const std::string& data) {
    std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter> ctx(EVP_MD_CTX_new());
    if (!ctx) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("EVP_DigestInit_ex failed");
    }
    if (!data.empty() &&
        EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
        throw std::runtime_error("EVP_DigestUpdate failed");
    }

    unsigned char out[EVP_MAX_MD_SIZE];
    unsigned int out_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), out, &out_len) != 1) {
        throw std::runtime_error("EVP_DigestFinal_ex failed");
    }

    std::string hex;
    hex.reserve(out_len * 2);
    for (unsigned int i = 0; i < out_len; ++i) {
        hex.push_back("0123456789abcdef"[out[i] >> 4]);
        hex.push_back("0123456789abcdef"[out[i] & 0x0F]);
    }
    return hex;
}

std::string base64_encode(const std::string& data) {
    if (data.empty()) {
        return "";
    }
    // EVP_EncodeBlock writes a trailing NUL.
    std::vector<unsigned char> out(4 * ((data.size() + 2) / 3) + 1);
    const int written = EVP_EncodeBlock(
        out.data(), reinterpret_cast<const unsigned char*>(data.data()),
        static_cast<int>(data.size()));
    return std::string(reinterpret_cast<const char*>(out.data()),
                       static_cast<std::size_t>(written));
}

core::errors::Result<std::string> base64_decode(const std::string& encoded) {
    if (encoded.empty()) {
        return std::string();
    }
    if (encoded.size() % 4 != 0) {
        return RelayError{ErrorCategory::Decode,
                          "Base64 content length is not a multiple of 4.",
                          "invalid_base64"};
    }

    std::size_t padding = 0;
    for (std::size_t i = 0; i < encoded.size(); ++i) {
        const char c = encoded[i];
        if (c == '=') {
            if (i < encoded.size() - 2) {
                return RelayError{ErrorCategory::Decode,
                                  "Base64 padding in the middle of content.",
                                  "invalid_base64"};
            }
            ++padding;
            continue;
        }
        if (padding > 0 || !is_base64_char(c)) {
            return RelayError{ErrorCategory::Decode,
                              "Base64 content contains an invalid character.",
                              "invalid_base64"};
        }
    }

    std::vector<unsigned char> out(3 * (encoded.size() / 4));
    const int written = EVP_DecodeBlock(
        out.data(), reinterpret_cast<const unsigned char*>(encoded.data()),
        static_cast<int>(encoded.size()));
    if (written < 0 || static_cast<std::size_t>(written) < padding) {
        return RelayError{ErrorCategory::Decode,
                          "Base64 content could not be decoded.",
                          "invalid_base64"};
    }

    // EVP_DecodeBlock counts padding bytes as zero-valued output.
    return std::string(reinterpret_cast<const char*>(out.data()),
                       static_cast<std::size_t>(written) - padding);
}

}  // namespace relay::core::crypto
