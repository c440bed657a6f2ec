// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2025, Lux Industries Inc
//
// Path Circuit - homomorphic validity predicate for an encrypted path
//
// isValid = start matches
//         AND end matches
//         AND every step moves exactly one axis by +-1
//         AND every visited cell is inside the grid and open
//
// Cell lookups are oblivious: every cell of the grid is touched for every
// visited coordinate, so the evaluation pattern is independent of the path.
//
// Cost per lookup with w-bit coordinates on an R x C grid:
//   indicators: (R + C) * (w - 1) gates
//   gather:     2 * R * C gates + 2 OR reductions

#ifndef PATHCAPTCHA_VERIFY_PATH_CIRCUIT_H
#define PATHCAPTCHA_VERIFY_PATH_CIRCUIT_H

#include "algebra/ciphertext_algebra.h"
#include "maze/types.h"
#include <cstdint>
#include <vector>

namespace lux::pathcaptcha {
namespace verify {

struct CircuitStats {
    size_t steps = 0;           // Consecutive pairs checked
    size_t lookups = 0;         // Oblivious cell reads
    size_t cells_scanned = 0;   // Grid cells touched across all lookups
    uint64_t gates = 0;         // Bootstrapped gates evaluated
};

class PathCircuit {
public:
    PathCircuit(algebra::CiphertextAlgebra& algebra, const EncryptedMaze& maze);

    // Both coordinates equal
    EncryptedBit CoordEquals(const EncryptedCoord& a, const EncryptedCoord& b);

    EncryptedBit StartMatches(const EncryptedCoord& first);
    EncryptedBit EndMatches(const EncryptedCoord& last);

    /**
     * @brief (|dr| = 1 AND dc = 0) XOR (dr = 0 AND |dc| = 1)
     *
     * Rejects diagonal and stationary steps.
     */
    EncryptedBit StepIsUnitMove(const EncryptedCoord& from, const EncryptedCoord& to);

    /**
     * @brief Oblivious read: encrypted 1 iff `at` is inside the grid and open
     */
    EncryptedBit CellIsOpen(const EncryptedCoord& at);

    /**
     * @brief Full predicate over a non-empty path
     * @throws std::invalid_argument on an empty path
     */
    EncryptedBit Evaluate(const std::vector<EncryptedCoord>& path);

    const CircuitStats& Stats() const { return stats_; }

private:
    algebra::CiphertextAlgebra& algebra_;
    const EncryptedMaze& maze_;
    CircuitStats stats_;
};

} // namespace verify
} // namespace lux::pathcaptcha

#endif // PATHCAPTCHA_VERIFY_PATH_CIRCUIT_H
