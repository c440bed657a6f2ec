// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2025, Lux Industries Inc
//
// Verification Engine - evaluates the path circuit and hands the single
// encrypted verdict to the decryption oracle
//
// The engine never decrypts. Its only output is a pending entry in the
// result store keyed by the oracle's request id.

#ifndef PATHCAPTCHA_VERIFY_VERIFICATION_ENGINE_H
#define PATHCAPTCHA_VERIFY_VERIFICATION_ENGINE_H

#include "algebra/ciphertext_algebra.h"
#include "maze/events.h"
#include "maze/maze_registry.h"
#include "maze/solution_registry.h"
#include "oracle/decryption_oracle.h"
#include "result/result_store.h"
#include "verify/path_circuit.h"
#include <chrono>

namespace lux::pathcaptcha {
namespace verify {

struct EngineOptions {
    // Reject a request while another one for the same solution is pending
    bool single_flight = true;

    // Pending requests older than this are abandoned on re-request (0 = never)
    std::chrono::seconds pending_expiry{0};
};

class VerificationEngine {
public:
    /**
     * @param on_response Where oracle responses are routed (normally the
     *        facade's serialized Resolve)
     */
    VerificationEngine(
        algebra::CiphertextAlgebra& algebra,
        oracle::DecryptionOracle& oracle,
        const MazeRegistry& mazes,
        const SolutionRegistry& solutions,
        ResultStore& results,
        oracle::DecryptionCallback on_response,
        const EngineOptions& options = {},
        EventBus* events = nullptr
    );

    /**
     * @brief Evaluate a solution and request decryption of its verdict
     *
     * @return Oracle request id
     * @throws ProtocolError UNKNOWN_SOLUTION, ALREADY_VERIFIED, UNKNOWN_MAZE,
     *         ALREADY_PENDING
     */
    RequestId RequestVerification(SolutionId solution_id, Timestamp now);

    /**
     * @brief Abandon all pending requests of an unrevealed solution
     * @return Number of requests abandoned
     * @throws ProtocolError UNKNOWN_SOLUTION, ALREADY_VERIFIED
     */
    size_t AbandonVerification(SolutionId solution_id, Timestamp now);

    // Circuit statistics of the most recent evaluation
    const CircuitStats& LastStats() const { return last_stats_; }

    const EngineOptions& Options() const { return options_; }

private:
    size_t ExpireStale(SolutionId solution_id, Timestamp now);

    algebra::CiphertextAlgebra& algebra_;
    oracle::DecryptionOracle& oracle_;
    const MazeRegistry& mazes_;
    const SolutionRegistry& solutions_;
    ResultStore& results_;
    oracle::DecryptionCallback on_response_;
    EngineOptions options_;
    EventBus* events_;
    CircuitStats last_stats_;
};

} // namespace verify
} // namespace lux::pathcaptcha

#endif // PATHCAPTCHA_VERIFY_VERIFICATION_ENGINE_H
