// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2025, Lux Industries Inc
//
// Ed25519 decryption proofs
//
// The oracle signs DecryptionDigest(requestId, cleartexts). Anyone holding the
// 32-byte raw public key can check the proof.

#ifndef PATHCAPTCHA_ORACLE_SIGNATURE_H
#define PATHCAPTCHA_ORACLE_SIGNATURE_H

#include "oracle/decryption_oracle.h"
#include "oracle/transcript.h"
#include <openssl/types.h>
#include <cstdint>
#include <memory>
#include <vector>

namespace lux::pathcaptcha {
namespace oracle {

constexpr size_t kEd25519PublicKeySize = 32;
constexpr size_t kEd25519SignatureSize = 64;

struct PKeyDeleter {
    void operator()(EVP_PKEY* key) const;
};
using PKeyPtr = std::unique_ptr<EVP_PKEY, PKeyDeleter>;

// ============================================================================
// Signer (oracle side)
// ============================================================================

class Ed25519Signer {
public:
    // Fresh random key pair
    Ed25519Signer();

    std::vector<uint8_t> Sign(const Hash256& digest) const;

    DecryptionProof SignDecryption(RequestId request_id, const Cleartexts& cleartexts) const;

    // Raw 32-byte public key
    std::vector<uint8_t> PublicKey() const;

private:
    PKeyPtr key_;
};

// ============================================================================
// Verifier (protocol side)
// ============================================================================

class SignatureProofVerifier : public ProofVerifier {
public:
    /**
     * @throws std::invalid_argument if the key is not a valid raw Ed25519 key
     */
    explicit SignatureProofVerifier(const std::vector<uint8_t>& public_key);

    bool Verify(
        RequestId request_id,
        const Cleartexts& cleartexts,
        const DecryptionProof& proof
    ) const override;

    bool VerifyDigest(const Hash256& digest, const std::vector<uint8_t>& signature) const;

    const std::vector<uint8_t>& PublicKey() const { return public_key_; }

private:
    std::vector<uint8_t> public_key_;
    PKeyPtr key_;
};

} // namespace oracle
} // namespace lux::pathcaptcha

#endif // PATHCAPTCHA_ORACLE_SIGNATURE_H
