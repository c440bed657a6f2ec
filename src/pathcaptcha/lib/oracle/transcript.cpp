// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2025, Lux Industries Inc
//
// Decryption Transcript Implementation

#include "oracle/transcript.h"
#include <openssl/evp.h>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace lux::pathcaptcha {
namespace oracle {

const char* const kDecryptionLabel = "PathCaptcha.Decryption";

// ============================================================================
// Hash256 Operations
// ============================================================================

std::string HashToHex(const Hash256& h) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < h.size(); ++i) {
        oss << std::setw(2) << static_cast<int>(h[i]);
    }
    return oss.str();
}

// ============================================================================
// Hash Functions
// ============================================================================

namespace hash {

Hash256 SHA3_256(const uint8_t* data, size_t len) {
    Hash256 result{};
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (ctx == nullptr) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }
    bool ok = EVP_DigestInit_ex(ctx, EVP_sha3_256(), nullptr) == 1 &&
              EVP_DigestUpdate(ctx, data, len) == 1 &&
              EVP_DigestFinal_ex(ctx, result.data(), nullptr) == 1;
    EVP_MD_CTX_free(ctx);
    if (!ok) {
        throw std::runtime_error("SHA3-256 digest failed");
    }
    return result;
}

Hash256 SHA3_256(const std::vector<uint8_t>& data) {
    return SHA3_256(data.data(), data.size());
}

} // namespace hash

// ============================================================================
// TranscriptBuilder Implementation
// ============================================================================

struct TranscriptBuilder::Impl {
    std::string protocol_label;
    std::vector<uint8_t> buffer;

    explicit Impl(const std::string& label) : protocol_label(label) {
        buffer.push_back(static_cast<uint8_t>(DomainTag::PROTOCOL_LABEL));
        AppendU64(static_cast<uint64_t>(protocol_label.size()));
        AppendBytes(reinterpret_cast<const uint8_t*>(protocol_label.data()), protocol_label.size());
    }

    void AppendBytes(const uint8_t* data, size_t len) {
        buffer.insert(buffer.end(), data, data + len);
    }

    // Little-endian
    void AppendU64(uint64_t val) {
        uint8_t bytes[8];
        for (int i = 0; i < 8; i++) {
            bytes[i] = static_cast<uint8_t>(val >> (8 * i));
        }
        AppendBytes(bytes, 8);
    }
};

TranscriptBuilder::TranscriptBuilder(const std::string& protocol_label)
    : impl_(std::make_unique<Impl>(protocol_label)) {}

TranscriptBuilder::~TranscriptBuilder() = default;

TranscriptBuilder::TranscriptBuilder(TranscriptBuilder&&) noexcept = default;
TranscriptBuilder& TranscriptBuilder::operator=(TranscriptBuilder&&) noexcept = default;

void TranscriptBuilder::AppendU64(DomainTag tag, uint64_t value) {
    impl_->buffer.push_back(static_cast<uint8_t>(tag));
    impl_->AppendU64(value);
}

Hash256 TranscriptBuilder::Digest() const {
    return hash::SHA3_256(impl_->buffer);
}

// ============================================================================
// Decryption Digest
// ============================================================================

Hash256 DecryptionDigest(uint64_t request_id, const std::vector<uint64_t>& cleartexts) {
    TranscriptBuilder tx(kDecryptionLabel);
    tx.AppendU64(DomainTag::REQUEST_ID, request_id);
    tx.AppendU64(DomainTag::CLEARTEXT_COUNT, cleartexts.size());
    for (uint64_t value : cleartexts) {
        tx.AppendU64(DomainTag::CLEARTEXT, value);
    }
    return tx.Digest();
}

} // namespace oracle
} // namespace lux::pathcaptcha
