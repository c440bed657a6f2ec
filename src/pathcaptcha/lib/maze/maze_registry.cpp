// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2025, Lux Industries Inc
//
// Maze Registry Implementation

#include "maze/maze_registry.h"
#include "maze/errors.h"
#include <trantor/utils/Logger.h>
#include <string>

namespace lux::pathcaptcha {

MazeRegistry::MazeRegistry(const MazeLimits& limits, EventBus* events)
    : limits_(limits), events_(events) {}

MazeId MazeRegistry::CreateMaze(
    const std::vector<std::vector<EncryptedBit>>& grid,
    const EncryptedCoord& start,
    const EncryptedCoord& end,
    Timestamp now,
    const MazeMetadata& metadata
) {
    if (grid.empty() || grid[0].empty()) {
        throw ProtocolError(ErrorCode::INVALID_DIMENSIONS, "grid is empty");
    }

    const size_t rows = grid.size();
    const size_t cols = grid[0].size();
    for (size_t r = 1; r < rows; ++r) {
        if (grid[r].size() != cols) {
            throw ProtocolError(ErrorCode::INVALID_DIMENSIONS,
                "row " + std::to_string(r) + " has " + std::to_string(grid[r].size()) +
                " cells, expected " + std::to_string(cols));
        }
    }
    if (rows > limits_.MaxDimension() || cols > limits_.MaxDimension()) {
        throw ProtocolError(ErrorCode::INVALID_DIMENSIONS,
            "grid " + std::to_string(rows) + "x" + std::to_string(cols) +
            " exceeds " + std::to_string(limits_.MaxDimension()) + " per side for " +
            std::to_string(limits_.coordinate_bits) + "-bit coordinates");
    }
    if (rows * cols > limits_.max_grid_cells) {
        throw ProtocolError(ErrorCode::INVALID_DIMENSIONS,
            "grid has " + std::to_string(rows * cols) + " cells, limit is " +
            std::to_string(limits_.max_grid_cells));
    }

    if (!start.IsWellFormed(limits_.coordinate_bits) || !end.IsWellFormed(limits_.coordinate_bits)) {
        throw ProtocolError(ErrorCode::MALFORMED_CIPHERTEXT,
            "start/end must be " + std::to_string(limits_.coordinate_bits) + "-bit encrypted coordinates");
    }

    EncryptedMaze maze;
    maze.rows = static_cast<uint32_t>(rows);
    maze.cols = static_cast<uint32_t>(cols);
    maze.grid.reserve(rows * cols);
    for (const auto& row : grid) {
        for (const auto& cell : row) {
            if (cell == nullptr) {
                throw ProtocolError(ErrorCode::MALFORMED_CIPHERTEXT, "null grid cell");
            }
            maze.grid.push_back(cell);
        }
    }
    maze.start = start;
    maze.end = end;
    maze.created_at = now;
    maze.metadata = metadata;

    // Validation done; commit
    maze.id = next_id_++;
    MazeId id = maze.id;
    mazes_.emplace(id, std::move(maze));

    LOG_INFO << "Created maze " << id << " (" << rows << "x" << cols
             << ", difficulty " << metadata.difficulty << ")";

    if (events_ != nullptr) {
        ProtocolEvent event{EventType::MAZE_CREATED, now};
        event.maze_id = id;
        events_->Publish(event);
    }
    return id;
}

const EncryptedMaze* MazeRegistry::Find(MazeId id) const {
    auto it = mazes_.find(id);
    return it == mazes_.end() ? nullptr : &it->second;
}

const EncryptedMaze& MazeRegistry::Get(MazeId id) const {
    const EncryptedMaze* maze = Find(id);
    if (maze == nullptr) {
        throw ProtocolError(ErrorCode::UNKNOWN_MAZE, "maze " + std::to_string(id));
    }
    return *maze;
}

std::vector<MazeId> MazeRegistry::Ids() const {
    std::vector<MazeId> ids;
    ids.reserve(mazes_.size());
    for (const auto& entry : mazes_) {
        ids.push_back(entry.first);
    }
    return ids;
}

} // namespace lux::pathcaptcha
