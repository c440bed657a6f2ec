// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2025, Lux Industries Inc
//
// Maze Registry - stores encrypted maze definitions

#ifndef PATHCAPTCHA_MAZE_MAZE_REGISTRY_H
#define PATHCAPTCHA_MAZE_MAZE_REGISTRY_H

#include "maze/events.h"
#include "maze/types.h"
#include <cstdint>
#include <map>
#include <vector>

namespace lux::pathcaptcha {

struct MazeLimits {
    uint32_t coordinate_bits = 8;
    size_t max_grid_cells = 4096;

    // Largest allowed row or column count. Every in-grid index stays strictly
    // below 2^bits - 1 so that a modular -1 delta never equals a real index
    // difference.
    uint64_t MaxDimension() const {
        return coordinate_bits >= 32 ? UINT32_MAX : (1ULL << coordinate_bits) - 1;
    }
};

class MazeRegistry {
public:
    explicit MazeRegistry(const MazeLimits& limits, EventBus* events = nullptr);

    /**
     * @brief Register an encrypted maze
     *
     * Only the shape of the input is checked; cell contents and the
     * start/end coordinates stay opaque.
     *
     * @param grid Row-major cells, each encrypting 0 (open) or 1 (wall)
     * @param start Encrypted start coordinate
     * @param end Encrypted end coordinate
     * @param now Creation timestamp
     * @param metadata Descriptive plaintext metadata
     * @return New maze id (sequential, starting at 1)
     * @throws ProtocolError INVALID_DIMENSIONS, MALFORMED_CIPHERTEXT
     */
    MazeId CreateMaze(
        const std::vector<std::vector<EncryptedBit>>& grid,
        const EncryptedCoord& start,
        const EncryptedCoord& end,
        Timestamp now,
        const MazeMetadata& metadata = {}
    );

    // nullptr if absent
    const EncryptedMaze* Find(MazeId id) const;

    // @throws ProtocolError UNKNOWN_MAZE
    const EncryptedMaze& Get(MazeId id) const;

    bool Contains(MazeId id) const { return mazes_.count(id) != 0; }
    size_t Size() const { return mazes_.size(); }
    std::vector<MazeId> Ids() const;

    const MazeLimits& Limits() const { return limits_; }

private:
    MazeLimits limits_;
    EventBus* events_;
    std::map<MazeId, EncryptedMaze> mazes_;
    MazeId next_id_ = 1;
};

} // namespace lux::pathcaptcha

#endif // PATHCAPTCHA_MAZE_MAZE_REGISTRY_H
