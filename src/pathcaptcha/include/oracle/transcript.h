// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2025, Lux Industries Inc
//
// Decryption Transcript - domain-separated digest of an oracle response
//
// The oracle signs the digest, the result store recomputes it from the
// request id and cleartexts it was handed. Every field is prefixed with a
// one-byte domain tag and its length so distinct field sequences can never
// produce the same byte string.

#ifndef PATHCAPTCHA_ORACLE_TRANSCRIPT_H
#define PATHCAPTCHA_ORACLE_TRANSCRIPT_H

#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace lux::pathcaptcha {
namespace oracle {

// ============================================================================
// Hash Output Type (256-bit)
// ============================================================================

using Hash256 = std::array<uint8_t, 32>;

std::string HashToHex(const Hash256& h);

// ============================================================================
// Domain Separation Tags
// ============================================================================

enum class DomainTag : uint8_t {
    PROTOCOL_LABEL = 0x01,
    REQUEST_ID = 0x02,       // Oracle-issued request id
    CLEARTEXT_COUNT = 0x03,
    CLEARTEXT = 0x04,        // One decrypted value
};

// Label used for every decryption transcript
extern const char* const kDecryptionLabel;

// ============================================================================
// Transcript Builder
// ============================================================================

/**
 * @brief Accumulates tagged protocol fields and digests them with SHA3-256
 *
 * Usage:
 *   TranscriptBuilder tx(kDecryptionLabel);
 *   tx.AppendU64(DomainTag::REQUEST_ID, id);
 *   Hash256 digest = tx.Digest();
 */
class TranscriptBuilder {
public:
    explicit TranscriptBuilder(const std::string& protocol_label);
    ~TranscriptBuilder();

    // Non-copyable, movable
    TranscriptBuilder(const TranscriptBuilder&) = delete;
    TranscriptBuilder& operator=(const TranscriptBuilder&) = delete;
    TranscriptBuilder(TranscriptBuilder&&) noexcept;
    TranscriptBuilder& operator=(TranscriptBuilder&&) noexcept;

    void AppendU64(DomainTag tag, uint64_t value);

    /**
     * @brief SHA3-256 of everything appended so far
     *
     * Does not finalize; more fields may be appended afterwards.
     */
    Hash256 Digest() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/**
 * @brief Digest signed by the oracle for one response
 */
Hash256 DecryptionDigest(uint64_t request_id, const std::vector<uint64_t>& cleartexts);

namespace hash {

// SHA3-256 (OpenSSL EVP)
Hash256 SHA3_256(const uint8_t* data, size_t len);
Hash256 SHA3_256(const std::vector<uint8_t>& data);

} // namespace hash

} // namespace oracle
} // namespace lux::pathcaptcha

#endif // PATHCAPTCHA_ORACLE_TRANSCRIPT_H
