// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2025, Lux Industries Inc

#include "maze/solution_registry.h"
#include "maze/errors.h"
#include <trantor/utils/Logger.h>

namespace lux::pathcaptcha {

SolutionRegistry::SolutionRegistry(const MazeRegistry& mazes, ResultStore& results, EventBus* events)
    : mazes_(mazes), results_(results), events_(events) {}

SolutionId SolutionRegistry::SubmitSolution(
    MazeId maze_id,
    const std::vector<EncryptedCoord>& path,
    Timestamp now,
    const std::string& submitter
) {
    if (!mazes_.Contains(maze_id)) {
        throw ProtocolError(ErrorCode::UNKNOWN_MAZE, "maze " + std::to_string(maze_id));
    }
    if (path.empty()) {
        throw ProtocolError(ErrorCode::EMPTY_PATH, "path has no coordinates");
    }
    const uint32_t width = mazes_.Limits().coordinate_bits;
    for (size_t i = 0; i < path.size(); ++i) {
        if (!path[i].IsWellFormed(width)) {
            throw ProtocolError(ErrorCode::MALFORMED_CIPHERTEXT,
                "path[" + std::to_string(i) + "] is not a " + std::to_string(width) +
                "-bit encrypted coordinate");
        }
    }

    EncryptedSolution solution;
    solution.id = next_id_++;
    solution.maze_id = maze_id;
    solution.path = path;
    solution.submitted_at = now;
    solution.submitter = submitter;

    SolutionId id = solution.id;
    solutions_.emplace(id, std::move(solution));
    by_maze_[maze_id].push_back(id);
    results_.Track(id, now);

    LOG_INFO << "Solution " << id << " submitted for maze " << maze_id
             << " (" << path.size() << " steps)";

    if (events_ != nullptr) {
        ProtocolEvent event{EventType::SOLUTION_SUBMITTED, now};
        event.maze_id = maze_id;
        event.solution_id = id;
        events_->Publish(event);
    }
    return id;
}

const EncryptedSolution* SolutionRegistry::Find(SolutionId id) const {
    auto it = solutions_.find(id);
    return it == solutions_.end() ? nullptr : &it->second;
}

const EncryptedSolution& SolutionRegistry::Get(SolutionId id) const {
    const EncryptedSolution* solution = Find(id);
    if (solution == nullptr) {
        throw ProtocolError(ErrorCode::UNKNOWN_SOLUTION, "solution " + std::to_string(id));
    }
    return *solution;
}

std::vector<SolutionId> SolutionRegistry::ListForMaze(MazeId maze_id) const {
    if (!mazes_.Contains(maze_id)) {
        throw ProtocolError(ErrorCode::UNKNOWN_MAZE, "maze " + std::to_string(maze_id));
    }
    auto it = by_maze_.find(maze_id);
    return it == by_maze_.end() ? std::vector<SolutionId>{} : it->second;
}

} // namespace lux::pathcaptcha
