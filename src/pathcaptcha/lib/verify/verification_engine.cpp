// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2025, Lux Industries Inc
//
// Verification Engine Implementation

#include "verify/verification_engine.h"
#include "maze/errors.h"
#include <trantor/utils/Logger.h>
#include <stdexcept>
#include <string>

namespace lux::pathcaptcha {
namespace verify {

VerificationEngine::VerificationEngine(
    algebra::CiphertextAlgebra& algebra,
    oracle::DecryptionOracle& oracle,
    const MazeRegistry& mazes,
    const SolutionRegistry& solutions,
    ResultStore& results,
    oracle::DecryptionCallback on_response,
    const EngineOptions& options,
    EventBus* events
)
    : algebra_(algebra),
      oracle_(oracle),
      mazes_(mazes),
      solutions_(solutions),
      results_(results),
      on_response_(std::move(on_response)),
      options_(options),
      events_(events) {
    if (!on_response_) {
        throw std::invalid_argument("VerificationEngine needs a response handler");
    }
}

size_t VerificationEngine::ExpireStale(SolutionId solution_id, Timestamp now) {
    if (options_.pending_expiry.count() <= 0) {
        return 0;
    }
    size_t expired = 0;
    for (const auto& request : results_.PendingFor(solution_id)) {
        if (now - request.requested_at >= options_.pending_expiry) {
            LOG_WARN << "Request " << request.request_id << " for solution " << solution_id
                     << " expired";
            if (results_.Abandon(request.request_id, now)) {
                expired++;
            }
        }
    }
    return expired;
}

RequestId VerificationEngine::RequestVerification(SolutionId solution_id, Timestamp now) {
    const EncryptedSolution& solution = solutions_.Get(solution_id);

    if (results_.GetResult(solution_id).is_revealed) {
        throw ProtocolError(ErrorCode::ALREADY_VERIFIED, "solution " + std::to_string(solution_id));
    }
    const EncryptedMaze& maze = mazes_.Get(solution.maze_id);

    ExpireStale(solution_id, now);
    if (options_.single_flight && results_.HasPendingFor(solution_id)) {
        throw ProtocolError(ErrorCode::ALREADY_PENDING,
            "solution " + std::to_string(solution_id) + " has an outstanding request");
    }

    PathCircuit circuit(algebra_, maze);
    EncryptedBit is_valid = circuit.Evaluate(solution.path);
    last_stats_ = circuit.Stats();

    RequestId request_id = oracle_.Request({is_valid}, on_response_);
    results_.AddPending(request_id, solution_id, now);

    LOG_INFO << "Verification requested for solution " << solution_id
             << " (request " << request_id << ", " << last_stats_.gates << " gates)";
    LOG_DEBUG << "Circuit for solution " << solution_id << ": " << last_stats_.steps
              << " steps, " << last_stats_.lookups << " lookups, "
              << last_stats_.cells_scanned << " cells scanned";

    if (events_ != nullptr) {
        ProtocolEvent event{EventType::VERIFICATION_REQUESTED, now};
        event.maze_id = solution.maze_id;
        event.solution_id = solution_id;
        event.request_id = request_id;
        events_->Publish(event);
    }
    return request_id;
}

size_t VerificationEngine::AbandonVerification(SolutionId solution_id, Timestamp now) {
    solutions_.Get(solution_id);
    if (results_.GetResult(solution_id).is_revealed) {
        throw ProtocolError(ErrorCode::ALREADY_VERIFIED, "solution " + std::to_string(solution_id));
    }
    return results_.AbandonAllFor(solution_id, now);
}

} // namespace verify
} // namespace lux::pathcaptcha
