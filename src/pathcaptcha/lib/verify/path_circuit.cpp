// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2025, Lux Industries Inc
//
// Path Circuit Implementation

#include "verify/path_circuit.h"
#include <stdexcept>

namespace lux::pathcaptcha {
namespace verify {

PathCircuit::PathCircuit(algebra::CiphertextAlgebra& algebra, const EncryptedMaze& maze)
    : algebra_(algebra), maze_(maze) {}

EncryptedBit PathCircuit::CoordEquals(const EncryptedCoord& a, const EncryptedCoord& b) {
    return algebra_.And(algebra_.Eq(a.row, b.row), algebra_.Eq(a.col, b.col));
}

EncryptedBit PathCircuit::StartMatches(const EncryptedCoord& first) {
    return CoordEquals(first, maze_.start);
}

EncryptedBit PathCircuit::EndMatches(const EncryptedCoord& last) {
    return CoordEquals(last, maze_.end);
}

EncryptedBit PathCircuit::StepIsUnitMove(const EncryptedCoord& from, const EncryptedCoord& to) {
    stats_.steps++;

    EncryptedWord dr = algebra_.Sub(to.row, from.row);
    EncryptedWord dc = algebra_.Sub(to.col, from.col);

    EncryptedBit vertical = algebra_.And(algebra_.IsUnit(dr), algebra_.IsZero(dc));
    EncryptedBit horizontal = algebra_.And(algebra_.IsZero(dr), algebra_.IsUnit(dc));
    return algebra_.Xor(vertical, horizontal);
}

EncryptedBit PathCircuit::CellIsOpen(const EncryptedCoord& at) {
    stats_.lookups++;

    std::vector<EncryptedBit> row_hit;
    row_hit.reserve(maze_.rows);
    for (uint32_t r = 0; r < maze_.rows; ++r) {
        row_hit.push_back(algebra_.EqScalar(at.row, r));
    }
    std::vector<EncryptedBit> col_hit;
    col_hit.reserve(maze_.cols);
    for (uint32_t c = 0; c < maze_.cols; ++c) {
        col_hit.push_back(algebra_.EqScalar(at.col, c));
    }

    std::vector<EncryptedBit> selected;
    std::vector<EncryptedBit> walls;
    selected.reserve(maze_.NumCells());
    walls.reserve(maze_.NumCells());
    for (uint32_t r = 0; r < maze_.rows; ++r) {
        for (uint32_t c = 0; c < maze_.cols; ++c) {
            EncryptedBit indicator = algebra_.And(row_hit[r], col_hit[c]);
            walls.push_back(algebra_.And(indicator, maze_.Cell(r, c)));
            selected.push_back(indicator);
        }
    }
    stats_.cells_scanned += maze_.NumCells();

    // At most one indicator is set, so the ORs select a single cell
    EncryptedBit in_bounds = algebra_.OrAll(selected);
    EncryptedBit wall_hit = algebra_.OrAll(walls);
    return algebra_.And(in_bounds, algebra_.Not(wall_hit));
}

EncryptedBit PathCircuit::Evaluate(const std::vector<EncryptedCoord>& path) {
    if (path.empty()) {
        throw std::invalid_argument("PathCircuit: empty path");
    }
    const uint64_t gates_before = algebra_.GateCount();

    std::vector<EncryptedBit> terms;
    terms.reserve(2 * path.size() + 1);
    terms.push_back(StartMatches(path.front()));
    terms.push_back(EndMatches(path.back()));
    for (size_t i = 1; i < path.size(); ++i) {
        terms.push_back(StepIsUnitMove(path[i - 1], path[i]));
    }
    for (const auto& coord : path) {
        terms.push_back(CellIsOpen(coord));
    }
    EncryptedBit is_valid = algebra_.AndAll(terms);

    stats_.gates += algebra_.GateCount() - gates_before;
    return is_valid;
}

} // namespace verify
} // namespace lux::pathcaptcha
