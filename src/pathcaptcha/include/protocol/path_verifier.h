// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2025, Lux Industries Inc
//
// Path Verifier - serialized facade over the whole protocol
//
// Owns the registries, the result store, the engine and the event bus. Every
// operation runs under one lock, so no caller ever observes partial state.
// Oracle responses arrive through Resolve(), from whatever thread the oracle
// delivers on.
//
// Lifecycle:
//   CreateMaze -> SubmitSolution -> RequestVerification -> (oracle) Resolve
//   -> GetVerificationResult

#ifndef PATHCAPTCHA_PROTOCOL_PATH_VERIFIER_H
#define PATHCAPTCHA_PROTOCOL_PATH_VERIFIER_H

#include "algebra/ciphertext_algebra.h"
#include "maze/events.h"
#include "maze/maze_registry.h"
#include "maze/types.h"
#include "oracle/decryption_oracle.h"
#include "verify/path_circuit.h"
#include "verify/verification_engine.h"
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace lux::pathcaptcha {

using ClockFn = std::function<Timestamp()>;

class PathVerifier {
public:
    /**
     * @param algebra Evaluator for the path circuit
     * @param oracle Decryption oracle; must stop delivering before the
     *        verifier is destroyed
     * @param verifier Checks the oracle's proofs
     * @param clock Time source for timestamps and expiry
     */
    PathVerifier(
        algebra::CiphertextAlgebra& algebra,
        oracle::DecryptionOracle& oracle,
        std::shared_ptr<const oracle::ProofVerifier> verifier,
        const MazeLimits& limits = {},
        const verify::EngineOptions& options = {},
        ClockFn clock = &Clock::now
    );
    ~PathVerifier();

    PathVerifier(const PathVerifier&) = delete;
    PathVerifier& operator=(const PathVerifier&) = delete;

    // ========================================================================
    // Protocol Operations
    // ========================================================================

    MazeId CreateMaze(
        const std::vector<std::vector<EncryptedBit>>& grid,
        const EncryptedCoord& start,
        const EncryptedCoord& end,
        const MazeMetadata& metadata = {}
    );

    SolutionId SubmitSolution(
        MazeId maze_id,
        const std::vector<EncryptedCoord>& path,
        const std::string& submitter = ""
    );

    RequestId RequestVerification(SolutionId solution_id);

    /**
     * @brief Oracle callback entry point
     *
     * Attacker-controlled input: the payload is only trusted once the proof
     * verifies.
     */
    VerificationResult Resolve(
        RequestId request_id,
        const oracle::Cleartexts& cleartexts,
        const oracle::DecryptionProof& proof
    );

    size_t AbandonVerification(SolutionId solution_id);

    // ========================================================================
    // Queries
    // ========================================================================

    VerificationResult GetVerificationResult(SolutionId solution_id) const;
    VerificationState GetVerificationState(SolutionId solution_id) const;
    // Result and state read under one lock, so they always agree
    std::pair<VerificationResult, VerificationState> GetVerificationStatus(SolutionId solution_id) const;

    MazeSummary GetMaze(MazeId maze_id) const;
    std::vector<MazeId> ListMazes() const;
    std::vector<SolutionId> ListSolutions(MazeId maze_id) const;

    VerifierStatistics GetStatistics() const;

    // Evaluator has keys and the oracle accepts requests
    bool IsAvailable() const;

    verify::CircuitStats LastCircuitStats() const;

    // ========================================================================
    // Events
    // ========================================================================

    // Handlers run under the verifier lock and must not call back into it
    size_t Subscribe(EventHandler handler);
    void Unsubscribe(size_t token);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace lux::pathcaptcha

#endif // PATHCAPTCHA_PROTOCOL_PATH_VERIFIER_H
