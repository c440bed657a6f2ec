// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2025, Lux Industries Inc
//
// Local Decryption Oracle Implementation

#include "oracle/local_oracle.h"
#include "maze/errors.h"
#include <trantor/utils/Logger.h>
#include <stdexcept>

namespace lux::pathcaptcha {
namespace oracle {

LocalDecryptionOracle::LocalDecryptionOracle(algebra::BinFheAlgebra& algebra)
    : algebra_(algebra) {
    auto& cc = algebra_.GetContext();
    sk_ = cc.KeyGen();
    // PUB_ENCRYPT also generates the public key and the key-switching key
    cc.BTKeyGen(sk_, lbcrypto::PUB_ENCRYPT);
    pk_ = cc.GetPublicKey();
    if (!pk_) {
        throw std::runtime_error("BTKeyGen did not produce a public key");
    }
    LOG_INFO << "Decryption oracle ready (" << algebra_.Name() << ")";
}

LocalDecryptionOracle::~LocalDecryptionOracle() {
    Stop();
}

RequestId LocalDecryptionOracle::Request(
    const std::vector<EncryptedBit>& ciphertexts,
    DecryptionCallback callback
) {
    if (ciphertexts.empty()) {
        throw std::invalid_argument("Decryption request needs at least one ciphertext");
    }
    for (const auto& ct : ciphertexts) {
        if (!ct) {
            throw std::invalid_argument("Decryption request contains a null ciphertext");
        }
    }
    if (!callback) {
        throw std::invalid_argument("Decryption request needs a callback");
    }

    RequestId id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        id = next_request_id_++;
        queue_.push_back(Job{id, ciphertexts, std::move(callback)});
    }
    cv_.notify_one();
    LOG_DEBUG << "Oracle queued request " << id << " (" << ciphertexts.size() << " ciphertexts)";
    return id;
}

bool LocalDecryptionOracle::IsAvailable() const {
    return sk_ != nullptr && pk_ != nullptr && algebra_.IsReady();
}

std::shared_ptr<const ProofVerifier> LocalDecryptionOracle::Verifier() const {
    return std::make_shared<SignatureProofVerifier>(signer_.PublicKey());
}

size_t LocalDecryptionOracle::NumQueued() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

// ============================================================================
// Delivery
// ============================================================================

void LocalDecryptionOracle::Deliver(Job& job) {
    Cleartexts cleartexts;
    DecryptionProof proof;
    try {
        cleartexts.reserve(job.ciphertexts.size());
        for (const auto& ct : job.ciphertexts) {
            cleartexts.push_back(algebra_.DecryptBit(sk_, ct) ? 1 : 0);
        }
        proof = signer_.SignDecryption(job.request_id, cleartexts);
    } catch (const std::exception& e) {
        LOG_ERROR << "Oracle failed to decrypt request " << job.request_id << ": " << e.what();
        callback_failures_++;
        return;
    }

    try {
        job.callback(job.request_id, cleartexts, proof);
        delivered_++;
    } catch (const ProtocolError& e) {
        LOG_WARN << "Callback for request " << job.request_id << " rejected: " << e.what();
        callback_failures_++;
    } catch (const std::exception& e) {
        LOG_ERROR << "Callback for request " << job.request_id << " failed: " << e.what();
        callback_failures_++;
    }
}

size_t LocalDecryptionOracle::ProcessPending(size_t max) {
    size_t handled = 0;
    while (handled < max) {
        Job job;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (queue_.empty()) {
                break;
            }
            job = std::move(queue_.front());
            queue_.pop_front();
        }
        Deliver(job);
        handled++;
    }
    return handled;
}

// ============================================================================
// Worker Threads
// ============================================================================

void LocalDecryptionOracle::Start(size_t workers) {
    if (workers == 0) {
        throw std::invalid_argument("Oracle needs at least one worker");
    }
    if (!workers_.empty()) {
        return;  // Already running
    }
    shutdown_ = false;
    for (size_t i = 0; i < workers; ++i) {
        workers_.emplace_back(&LocalDecryptionOracle::WorkerLoop, this);
    }
    LOG_INFO << "Decryption oracle started with " << workers << " worker(s)";
}

void LocalDecryptionOracle::Stop() {
    if (workers_.empty()) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shutdown_ = true;
    }
    cv_.notify_all();
    for (auto& t : workers_) {
        if (t.joinable()) {
            t.join();
        }
    }
    workers_.clear();
    LOG_INFO << "Decryption oracle stopped (" << NumQueued() << " request(s) still queued)";
}

void LocalDecryptionOracle::WorkerLoop() {
    while (true) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] {
                return shutdown_ || !queue_.empty();
            });
            if (shutdown_) {
                break;
            }
            job = std::move(queue_.front());
            queue_.pop_front();
        }
        Deliver(job);
    }
}

} // namespace oracle
} // namespace lux::pathcaptcha
