// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2025, Lux Industries Inc
//
// Encrypted data model for mazes, solutions and verification state
//
// Nothing in here is ever decrypted by the verifier. Plaintext fields are
// limited to identifiers, grid dimensions, timestamps and descriptive
// metadata supplied by the maze owner.

#ifndef PATHCAPTCHA_MAZE_TYPES_H
#define PATHCAPTCHA_MAZE_TYPES_H

#include "algebra/ciphertext_algebra.h"
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace lux::pathcaptcha {

using algebra::EncryptedBit;
using algebra::EncryptedWord;

// ============================================================================
// Identifiers and Time
// ============================================================================

using MazeId = uint64_t;
using SolutionId = uint64_t;
using RequestId = uint64_t;   // Issued by the decryption oracle

// 0 is never issued; it is the "not found" sentinel
constexpr uint64_t kNoId = 0;

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

// ============================================================================
// Encrypted Coordinates
// ============================================================================

/**
 * @brief Grid position with both components encrypted
 *
 * Both words carry the configured coordinate width.
 */
struct EncryptedCoord {
    EncryptedWord row;
    EncryptedWord col;

    bool IsWellFormed(uint32_t width) const {
        return row.IsWellFormed() && col.IsWellFormed() &&
               row.Width() == width && col.Width() == width;
    }
};

// ============================================================================
// Maze
// ============================================================================

struct MazeMetadata {
    uint32_t difficulty = 0;
    std::string description;
    std::string owner;
};

/**
 * @brief Encrypted maze definition
 *
 * grid is row-major, rows * cols cells, each encrypting 0 (open) or 1 (wall).
 * Immutable after creation.
 */
struct EncryptedMaze {
    MazeId id = kNoId;
    uint32_t rows = 0;
    uint32_t cols = 0;
    std::vector<EncryptedBit> grid;
    EncryptedCoord start;
    EncryptedCoord end;
    Timestamp created_at;
    MazeMetadata metadata;

    const EncryptedBit& Cell(uint32_t r, uint32_t c) const {
        return grid[static_cast<size_t>(r) * cols + c];
    }
    size_t NumCells() const { return static_cast<size_t>(rows) * cols; }
};

// Plaintext-safe view of a maze
struct MazeSummary {
    MazeId id = kNoId;
    uint32_t rows = 0;
    uint32_t cols = 0;
    Timestamp created_at;
    MazeMetadata metadata;
    size_t num_solutions = 0;
};

// ============================================================================
// Solution
// ============================================================================

struct EncryptedSolution {
    SolutionId id = kNoId;
    MazeId maze_id = kNoId;
    std::vector<EncryptedCoord> path;   // Claimed walk order, never empty
    Timestamp submitted_at;
    std::string submitter;
};

// ============================================================================
// Verification State
// ============================================================================

enum class RequestStatus : uint8_t {
    PENDING = 0,
    CONSUMED = 1,    // Resolved; kept so replays are recognized
    ABANDONED = 2,   // Given up by the caller or by expiry
};

struct VerificationRequest {
    RequestId request_id = kNoId;
    SolutionId solution_id = kNoId;
    Timestamp requested_at;
    RequestStatus status = RequestStatus::PENDING;
};

struct VerificationResult {
    SolutionId solution_id = kNoId;
    bool is_valid = false;      // Meaningful only when revealed
    bool is_revealed = false;
    Timestamp revealed_at;
};

// Per-solution state machine: SUBMITTED -> REQUEST_PENDING -> REVEALED
enum class VerificationState : uint8_t {
    SUBMITTED = 0,
    REQUEST_PENDING = 1,
    REVEALED = 2,
};

std::string VerificationStateName(VerificationState state);

// Dashboard counters
struct VerifierStatistics {
    size_t mazes = 0;
    size_t solutions = 0;
    size_t pending = 0;
    size_t revealed = 0;
    size_t valid = 0;
    size_t invalid = 0;
    double average_resolve_seconds = 0.0;
};

} // namespace lux::pathcaptcha

#endif // PATHCAPTCHA_MAZE_TYPES_H
