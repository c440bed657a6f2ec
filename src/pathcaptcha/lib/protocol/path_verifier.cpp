// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2025, Lux Industries Inc
//
// Path Verifier Implementation

#include "protocol/path_verifier.h"
#include "maze/solution_registry.h"
#include "result/result_store.h"
#include <mutex>
#include <stdexcept>

namespace lux::pathcaptcha {

struct PathVerifier::Impl {
    algebra::CiphertextAlgebra& evaluator;
    oracle::DecryptionOracle& decryptor;
    ClockFn clock;

    mutable std::mutex mutex;
    EventBus events;
    ResultStore results;
    MazeRegistry mazes;
    SolutionRegistry solutions;
    verify::VerificationEngine engine;

    Impl(PathVerifier* owner,
         algebra::CiphertextAlgebra& alg,
         oracle::DecryptionOracle& orc,
         std::shared_ptr<const oracle::ProofVerifier> verifier,
         const MazeLimits& limits,
         const verify::EngineOptions& options,
         ClockFn clk)
        : evaluator(alg),
          decryptor(orc),
          clock(std::move(clk)),
          results(std::move(verifier), &events),
          mazes(limits, &events),
          solutions(mazes, results, &events),
          engine(evaluator, decryptor, mazes, solutions, results,
                 [owner](RequestId id, const oracle::Cleartexts& cleartexts,
                         const oracle::DecryptionProof& proof) {
                     owner->Resolve(id, cleartexts, proof);
                 },
                 options, &events) {
        if (!clock) {
            throw std::invalid_argument("PathVerifier needs a clock");
        }
    }
};

PathVerifier::PathVerifier(
    algebra::CiphertextAlgebra& algebra,
    oracle::DecryptionOracle& oracle,
    std::shared_ptr<const oracle::ProofVerifier> verifier,
    const MazeLimits& limits,
    const verify::EngineOptions& options,
    ClockFn clock
)
    : impl_(std::make_unique<Impl>(this, algebra, oracle, std::move(verifier),
                                   limits, options, std::move(clock))) {}

PathVerifier::~PathVerifier() = default;

// ============================================================================
// Protocol Operations
// ============================================================================

MazeId PathVerifier::CreateMaze(
    const std::vector<std::vector<EncryptedBit>>& grid,
    const EncryptedCoord& start,
    const EncryptedCoord& end,
    const MazeMetadata& metadata
) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->mazes.CreateMaze(grid, start, end, impl_->clock(), metadata);
}

SolutionId PathVerifier::SubmitSolution(
    MazeId maze_id,
    const std::vector<EncryptedCoord>& path,
    const std::string& submitter
) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->solutions.SubmitSolution(maze_id, path, impl_->clock(), submitter);
}

RequestId PathVerifier::RequestVerification(SolutionId solution_id) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->engine.RequestVerification(solution_id, impl_->clock());
}

VerificationResult PathVerifier::Resolve(
    RequestId request_id,
    const oracle::Cleartexts& cleartexts,
    const oracle::DecryptionProof& proof
) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->results.Resolve(request_id, cleartexts, proof, impl_->clock());
}

size_t PathVerifier::AbandonVerification(SolutionId solution_id) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->engine.AbandonVerification(solution_id, impl_->clock());
}

// ============================================================================
// Queries
// ============================================================================

VerificationResult PathVerifier::GetVerificationResult(SolutionId solution_id) const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->results.GetResult(solution_id);
}

VerificationState PathVerifier::GetVerificationState(SolutionId solution_id) const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->results.StateOf(solution_id);
}

std::pair<VerificationResult, VerificationState>
PathVerifier::GetVerificationStatus(SolutionId solution_id) const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return {impl_->results.GetResult(solution_id), impl_->results.StateOf(solution_id)};
}

MazeSummary PathVerifier::GetMaze(MazeId maze_id) const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    const EncryptedMaze& maze = impl_->mazes.Get(maze_id);

    MazeSummary summary;
    summary.id = maze.id;
    summary.rows = maze.rows;
    summary.cols = maze.cols;
    summary.created_at = maze.created_at;
    summary.metadata = maze.metadata;
    summary.num_solutions = impl_->solutions.ListForMaze(maze_id).size();
    return summary;
}

std::vector<MazeId> PathVerifier::ListMazes() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->mazes.Ids();
}

std::vector<SolutionId> PathVerifier::ListSolutions(MazeId maze_id) const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->solutions.ListForMaze(maze_id);
}

VerifierStatistics PathVerifier::GetStatistics() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    VerifierStatistics stats;
    stats.mazes = impl_->mazes.Size();
    stats.solutions = impl_->solutions.Size();
    impl_->results.FillStatistics(stats);
    return stats;
}

bool PathVerifier::IsAvailable() const {
    return impl_->evaluator.IsReady() && impl_->decryptor.IsAvailable();
}

verify::CircuitStats PathVerifier::LastCircuitStats() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->engine.LastStats();
}

// ============================================================================
// Events
// ============================================================================

size_t PathVerifier::Subscribe(EventHandler handler) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->events.Subscribe(std::move(handler));
}

void PathVerifier::Unsubscribe(size_t token) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->events.Unsubscribe(token);
}

} // namespace lux::pathcaptcha
