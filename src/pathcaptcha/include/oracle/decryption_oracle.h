// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2025, Lux Industries Inc
//
// Decryption Oracle - external, asynchronous, untrusted for integrity
//
// Contract:
//   Request(ciphertexts, callback) -> requestId    returns immediately
//   callback(requestId, cleartexts, proof)          later, exactly once, on the
//                                                   oracle's own thread
//
// The cleartexts are only trusted after the proof verifies against
// (requestId, cleartexts) with the oracle's public verification key.

#ifndef PATHCAPTCHA_ORACLE_DECRYPTION_ORACLE_H
#define PATHCAPTCHA_ORACLE_DECRYPTION_ORACLE_H

#include "maze/types.h"
#include <cstdint>
#include <functional>
#include <vector>

namespace lux::pathcaptcha {
namespace oracle {

/**
 * @brief Authenticity proof attached to a decryption
 *
 * Opaque to the protocol beyond "verifiable against (requestId, cleartexts)".
 */
struct DecryptionProof {
    std::vector<uint8_t> signature;
};

using Cleartexts = std::vector<uint64_t>;

using DecryptionCallback = std::function<void(
    RequestId request_id,
    const Cleartexts& cleartexts,
    const DecryptionProof& proof
)>;

// ============================================================================
// Oracle Interface
// ============================================================================

class DecryptionOracle {
public:
    virtual ~DecryptionOracle() = default;

    /**
     * @brief Queue ciphertexts for decryption
     *
     * Never invokes the callback before returning.
     *
     * @return Oracle-issued request id, unique and never 0
     */
    virtual RequestId Request(
        const std::vector<EncryptedBit>& ciphertexts,
        DecryptionCallback callback
    ) = 0;

    // Keys present and requests accepted
    virtual bool IsAvailable() const = 0;
};

// ============================================================================
// Proof Verification
// ============================================================================

/**
 * @brief Public verification procedure of an oracle
 */
class ProofVerifier {
public:
    virtual ~ProofVerifier() = default;

    virtual bool Verify(
        RequestId request_id,
        const Cleartexts& cleartexts,
        const DecryptionProof& proof
    ) const = 0;
};

} // namespace oracle
} // namespace lux::pathcaptcha

#endif // PATHCAPTCHA_ORACLE_DECRYPTION_ORACLE_H
