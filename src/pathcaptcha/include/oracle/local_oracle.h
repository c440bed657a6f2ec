// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2025, Lux Industries Inc
//
// Local Decryption Oracle - in-process key owner
//
// Holds the BinFHE secret key, installs the evaluation keys into the shared
// context and answers decryption requests with an Ed25519-signed payload.
// Requests are queued; callbacks run later, either from ProcessPending() on
// the caller's thread or from worker threads started with Start().

#ifndef PATHCAPTCHA_ORACLE_LOCAL_ORACLE_H
#define PATHCAPTCHA_ORACLE_LOCAL_ORACLE_H

#include "algebra/binfhe_algebra.h"
#include "oracle/decryption_oracle.h"
#include "oracle/signature.h"
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <limits>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace lux::pathcaptcha {
namespace oracle {

class LocalDecryptionOracle : public DecryptionOracle {
public:
    /**
     * @brief Generate the secret key and evaluation keys
     *
     * Runs BTKeyGen on the algebra's context, so gates become available on
     * `algebra` once this returns.
     */
    explicit LocalDecryptionOracle(algebra::BinFheAlgebra& algebra);
    ~LocalDecryptionOracle() override;

    LocalDecryptionOracle(const LocalDecryptionOracle&) = delete;
    LocalDecryptionOracle& operator=(const LocalDecryptionOracle&) = delete;

    // ========================================================================
    // DecryptionOracle
    // ========================================================================

    /**
     * @throws std::invalid_argument on an empty list or a null ciphertext
     */
    RequestId Request(
        const std::vector<EncryptedBit>& ciphertexts,
        DecryptionCallback callback
    ) override;

    bool IsAvailable() const override;

    // ========================================================================
    // Keys
    // ========================================================================

    // Public encryption key for ciphertext producers
    const lbcrypto::LWEPublicKey& PublicKey() const { return pk_; }

    // Raw Ed25519 key that checks this oracle's proofs
    std::vector<uint8_t> VerificationKey() const { return signer_.PublicKey(); }

    std::shared_ptr<const ProofVerifier> Verifier() const;

    // ========================================================================
    // Delivery
    // ========================================================================

    /**
     * @brief Decrypt and deliver up to `max` queued requests on this thread
     * @return Number of requests handled
     */
    size_t ProcessPending(size_t max = std::numeric_limits<size_t>::max());

    // Spawn worker threads that drain the queue
    void Start(size_t workers = 1);

    // Join workers; queued requests stay queued
    void Stop();

    bool IsRunning() const { return !workers_.empty(); }
    size_t NumQueued() const;
    uint64_t NumDelivered() const { return delivered_.load(); }
    uint64_t NumCallbackFailures() const { return callback_failures_.load(); }

private:
    struct Job {
        RequestId request_id = kNoId;
        std::vector<EncryptedBit> ciphertexts;
        DecryptionCallback callback;
    };

    void WorkerLoop();
    void Deliver(Job& job);

    algebra::BinFheAlgebra& algebra_;
    lbcrypto::LWEPrivateKey sk_;
    lbcrypto::LWEPublicKey pk_;
    Ed25519Signer signer_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Job> queue_;
    RequestId next_request_id_ = 1;

    std::vector<std::thread> workers_;
    std::atomic<bool> shutdown_{false};
    std::atomic<uint64_t> delivered_{0};
    std::atomic<uint64_t> callback_failures_{0};
};

} // namespace oracle
} // namespace lux::pathcaptcha

#endif // PATHCAPTCHA_ORACLE_LOCAL_ORACLE_H
