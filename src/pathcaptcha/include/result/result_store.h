// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2025, Lux Industries Inc
//
// Result Store - turns an authenticated oracle response into a revealed verdict
//
// Tracks one VerificationResult per solution and the side table of oracle
// request ids. A verdict is written exactly once, and only after the proof
// attached to the response verifies.

#ifndef PATHCAPTCHA_RESULT_RESULT_STORE_H
#define PATHCAPTCHA_RESULT_RESULT_STORE_H

#include "maze/events.h"
#include "maze/types.h"
#include "oracle/decryption_oracle.h"
#include <map>
#include <memory>
#include <vector>

namespace lux::pathcaptcha {

class ResultStore {
public:
    ResultStore(std::shared_ptr<const oracle::ProofVerifier> verifier, EventBus* events = nullptr);

    // ========================================================================
    // Bookkeeping (driven by the registries and the engine)
    // ========================================================================

    // Unrevealed result for a new solution
    void Track(SolutionId solution_id, Timestamp submitted_at);

    bool IsTracked(SolutionId solution_id) const { return results_.count(solution_id) != 0; }

    /**
     * @brief Record an outstanding oracle request
     * @throws std::invalid_argument if the oracle reused a request id
     * @throws ProtocolError UNKNOWN_SOLUTION
     */
    void AddPending(RequestId request_id, SolutionId solution_id, Timestamp now);

    // Outstanding requests for a solution, oldest first
    std::vector<VerificationRequest> PendingFor(SolutionId solution_id) const;

    bool HasPendingFor(SolutionId solution_id) const;

    /**
     * @brief Stop accepting responses for one request
     * @return false if it was not pending
     */
    bool Abandon(RequestId request_id, Timestamp now);

    // Abandon every pending request of a solution; returns how many
    size_t AbandonAllFor(SolutionId solution_id, Timestamp now);

    // ========================================================================
    // Oracle Response
    // ========================================================================

    /**
     * @brief Verify and apply an oracle response
     *
     * Checks, in order: the request is known and not abandoned, the solution
     * is not yet revealed, the proof verifies, the payload is a single 0/1.
     * Any failure leaves all state untouched.
     *
     * @throws ProtocolError UNKNOWN_REQUEST, ALREADY_VERIFIED, INVALID_PROOF
     */
    VerificationResult Resolve(
        RequestId request_id,
        const oracle::Cleartexts& cleartexts,
        const oracle::DecryptionProof& proof,
        Timestamp now
    );

    // ========================================================================
    // Queries
    // ========================================================================

    // @throws ProtocolError UNKNOWN_SOLUTION
    VerificationResult GetResult(SolutionId solution_id) const;

    // @throws ProtocolError UNKNOWN_SOLUTION
    VerificationState StateOf(SolutionId solution_id) const;

    size_t PendingCount() const;

    // Fills pending/revealed/valid/invalid and the average resolve time
    void FillStatistics(VerifierStatistics& stats) const;

private:
    struct Entry {
        VerificationResult result;
        Timestamp submitted_at;
    };

    const Entry& GetEntry(SolutionId solution_id) const;

    std::shared_ptr<const oracle::ProofVerifier> verifier_;
    EventBus* events_;
    std::map<SolutionId, Entry> results_;
    std::map<RequestId, VerificationRequest> requests_;
};

} // namespace lux::pathcaptcha

#endif // PATHCAPTCHA_RESULT_RESULT_STORE_H
