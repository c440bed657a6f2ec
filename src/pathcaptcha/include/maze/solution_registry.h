// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2025, Lux Industries Inc
//
// Solution Registry - encrypted path submissions against a maze

#ifndef PATHCAPTCHA_MAZE_SOLUTION_REGISTRY_H
#define PATHCAPTCHA_MAZE_SOLUTION_REGISTRY_H

#include "maze/events.h"
#include "maze/maze_registry.h"
#include "maze/types.h"
#include "result/result_store.h"
#include <map>
#include <string>
#include <vector>

namespace lux::pathcaptcha {

class SolutionRegistry {
public:
    SolutionRegistry(const MazeRegistry& mazes, ResultStore& results, EventBus* events = nullptr);

    /**
     * @brief Store an encrypted path and open an unrevealed result for it
     *
     * @param maze_id Maze the path claims to solve
     * @param path Coordinates in walk order
     * @return New solution id (sequential, starting at 1)
     * @throws ProtocolError UNKNOWN_MAZE, EMPTY_PATH, MALFORMED_CIPHERTEXT
     */
    SolutionId SubmitSolution(
        MazeId maze_id,
        const std::vector<EncryptedCoord>& path,
        Timestamp now,
        const std::string& submitter = ""
    );

    const EncryptedSolution* Find(SolutionId id) const;

    // @throws ProtocolError UNKNOWN_SOLUTION
    const EncryptedSolution& Get(SolutionId id) const;

    bool Contains(SolutionId id) const { return solutions_.count(id) != 0; }
    size_t Size() const { return solutions_.size(); }

    // Solutions submitted against a maze, in submission order
    std::vector<SolutionId> ListForMaze(MazeId maze_id) const;

private:
    const MazeRegistry& mazes_;
    ResultStore& results_;
    EventBus* events_;
    std::map<SolutionId, EncryptedSolution> solutions_;
    std::map<MazeId, std::vector<SolutionId>> by_maze_;
    SolutionId next_id_ = 1;
};

} // namespace lux::pathcaptcha

#endif // PATHCAPTCHA_MAZE_SOLUTION_REGISTRY_H
