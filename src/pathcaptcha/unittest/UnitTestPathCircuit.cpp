// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2025, Lux Industries Inc
//
// Path Circuit Tests
//
// Every sub-predicate is decrypted with the test's own secret key so the
// circuit can be checked piece by piece. 3-bit coordinates, TOY parameters.

#include "gtest/gtest.h"
#include "algebra/binfhe_algebra.h"
#include "verify/path_circuit.h"
#include "test_helpers.h"

#include <memory>
#include <stdexcept>

using namespace lbcrypto;
using namespace lux::pathcaptcha;
using lux::pathcaptcha::algebra::BinFheAlgebra;
using lux::pathcaptcha::test_util::Cell;
using lux::pathcaptcha::test_util::MazeEncoder;
using lux::pathcaptcha::verify::PathCircuit;

// ============================================================================
// Test Fixture
// ============================================================================

class PathCircuitTest : public ::testing::Test {
protected:
    static constexpr uint32_t kBits = 3;

    static void SetUpTestSuite() {
        algebra_ = std::make_unique<BinFheAlgebra>(TOY, GINX);
        sk_ = algebra_->GetContext().KeyGen();
        algebra_->GetContext().BTKeyGen(sk_);
    }

    static void TearDownTestSuite() {
        algebra_.reset();
        sk_.reset();
    }

    MazeEncoder Encoder() const {
        return MazeEncoder([](bool v) { return algebra_->EncryptBit(sk_, v); }, kBits);
    }

    EncryptedMaze MakeMaze(const std::vector<std::string>& layout, Cell start, Cell end) const {
        auto enc = Encoder();
        EncryptedMaze maze;
        maze.id = 1;
        maze.rows = static_cast<uint32_t>(layout.size());
        maze.cols = static_cast<uint32_t>(layout[0].size());
        for (const auto& row : enc.Grid(layout)) {
            maze.grid.insert(maze.grid.end(), row.begin(), row.end());
        }
        maze.start = enc.Coord(start);
        maze.end = enc.Coord(end);
        return maze;
    }

    bool Dec(const EncryptedBit& ct) const { return algebra_->DecryptBit(sk_, ct); }

    static std::unique_ptr<BinFheAlgebra> algebra_;
    static LWEPrivateKey sk_;
};

std::unique_ptr<BinFheAlgebra> PathCircuitTest::algebra_;
LWEPrivateKey PathCircuitTest::sk_;

// ============================================================================
// Endpoints
// ============================================================================

TEST_F(PathCircuitTest, StartAndEndMatch) {
    auto maze = MakeMaze({"...", "...", "..."}, {0, 0}, {2, 2});
    auto enc = Encoder();
    PathCircuit circuit(*algebra_, maze);

    EXPECT_TRUE(Dec(circuit.StartMatches(enc.Coord(0, 0))));
    EXPECT_FALSE(Dec(circuit.StartMatches(enc.Coord(0, 1))));
    EXPECT_FALSE(Dec(circuit.StartMatches(enc.Coord(2, 2))));
    EXPECT_TRUE(Dec(circuit.EndMatches(enc.Coord(2, 2))));
    EXPECT_FALSE(Dec(circuit.EndMatches(enc.Coord(2, 1))));
}

// ============================================================================
// Steps
// ============================================================================

TEST_F(PathCircuitTest, UnitMovesInAllFourDirections) {
    auto maze = MakeMaze({"...", "...", "..."}, {0, 0}, {2, 2});
    auto enc = Encoder();
    PathCircuit circuit(*algebra_, maze);
    auto center = enc.Coord(1, 1);

    EXPECT_TRUE(Dec(circuit.StepIsUnitMove(center, enc.Coord(0, 1))));
    EXPECT_TRUE(Dec(circuit.StepIsUnitMove(center, enc.Coord(2, 1))));
    EXPECT_TRUE(Dec(circuit.StepIsUnitMove(center, enc.Coord(1, 0))));
    EXPECT_TRUE(Dec(circuit.StepIsUnitMove(center, enc.Coord(1, 2))));
}

TEST_F(PathCircuitTest, RejectsDiagonalStationaryAndJumps) {
    auto maze = MakeMaze({"...", "...", "..."}, {0, 0}, {2, 2});
    auto enc = Encoder();
    PathCircuit circuit(*algebra_, maze);
    auto center = enc.Coord(1, 1);

    EXPECT_FALSE(Dec(circuit.StepIsUnitMove(center, enc.Coord(2, 2)))) << "diagonal";
    EXPECT_FALSE(Dec(circuit.StepIsUnitMove(center, enc.Coord(0, 0)))) << "diagonal";
    EXPECT_FALSE(Dec(circuit.StepIsUnitMove(center, enc.Coord(1, 1)))) << "stationary";
    EXPECT_FALSE(Dec(circuit.StepIsUnitMove(center, enc.Coord(1, 3)))) << "jump";
    EXPECT_FALSE(Dec(circuit.StepIsUnitMove(center, enc.Coord(3, 1)))) << "jump";
}

TEST_F(PathCircuitTest, ModularWrapIsCaughtByBoundsCheck) {
    // 0 -> 7 is a -1 delta modulo 8; the step test alone accepts it, the
    // cell lookup does not because row 7 lies outside the grid
    auto maze = MakeMaze({"...", "...", "..."}, {0, 0}, {0, 0});
    auto enc = Encoder();
    PathCircuit circuit(*algebra_, maze);

    EXPECT_TRUE(Dec(circuit.StepIsUnitMove(enc.Coord(0, 0), enc.Coord(7, 0))));
    EXPECT_FALSE(Dec(circuit.CellIsOpen(enc.Coord(7, 0))));
}

// ============================================================================
// Oblivious Cell Lookup
// ============================================================================

TEST_F(PathCircuitTest, CellLookupReadsWallsAndBounds) {
    auto maze = MakeMaze({"..#", "#..", "..."}, {0, 0}, {2, 2});
    auto enc = Encoder();
    PathCircuit circuit(*algebra_, maze);

    EXPECT_TRUE(Dec(circuit.CellIsOpen(enc.Coord(0, 0))));
    EXPECT_TRUE(Dec(circuit.CellIsOpen(enc.Coord(1, 2))));
    EXPECT_FALSE(Dec(circuit.CellIsOpen(enc.Coord(0, 2)))) << "wall";
    EXPECT_FALSE(Dec(circuit.CellIsOpen(enc.Coord(1, 0)))) << "wall";
    EXPECT_FALSE(Dec(circuit.CellIsOpen(enc.Coord(3, 0)))) << "row out of bounds";
    EXPECT_FALSE(Dec(circuit.CellIsOpen(enc.Coord(0, 5)))) << "column out of bounds";
}

TEST_F(PathCircuitTest, GatherSelectsOnlyTheAddressedCell) {
    // A single open cell surrounded by walls
    auto maze = MakeMaze({"###", "###", "#.#"}, {2, 1}, {2, 1});
    auto enc = Encoder();
    PathCircuit circuit(*algebra_, maze);

    EXPECT_TRUE(Dec(circuit.CellIsOpen(enc.Coord(2, 1))));
    EXPECT_FALSE(Dec(circuit.CellIsOpen(enc.Coord(2, 0))));
    EXPECT_FALSE(Dec(circuit.CellIsOpen(enc.Coord(1, 1))));
}

// ============================================================================
// Full Predicate
// ============================================================================

TEST_F(PathCircuitTest, OpenMazeValidPath) {
    auto maze = MakeMaze({"...", "...", "..."}, {0, 0}, {2, 2});
    PathCircuit circuit(*algebra_, maze);
    auto path = Encoder().Path({{0, 0}, {1, 0}, {2, 0}, {2, 1}, {2, 2}});

    EXPECT_TRUE(Dec(circuit.Evaluate(path)));

    const auto& stats = circuit.Stats();
    EXPECT_EQ(stats.steps, 4u);
    EXPECT_EQ(stats.lookups, 5u);
    EXPECT_EQ(stats.cells_scanned, 5u * 9u);
    EXPECT_GT(stats.gates, 0u);
}

TEST_F(PathCircuitTest, WallOnPathInvalidates) {
    auto maze = MakeMaze({"...", "#..", "..."}, {0, 0}, {2, 2});
    PathCircuit circuit(*algebra_, maze);
    auto path = Encoder().Path({{0, 0}, {1, 0}, {2, 0}, {2, 1}, {2, 2}});

    EXPECT_FALSE(Dec(circuit.Evaluate(path)));
}

TEST_F(PathCircuitTest, DiagonalShortcutInvalidates) {
    auto maze = MakeMaze({"...", "...", "..."}, {0, 0}, {2, 2});
    PathCircuit circuit(*algebra_, maze);
    auto path = Encoder().Path({{0, 0}, {1, 1}, {2, 2}});

    EXPECT_FALSE(Dec(circuit.Evaluate(path)));
}

TEST_F(PathCircuitTest, WrongEndpointsInvalidate) {
    auto maze = MakeMaze({"...", "...", "..."}, {0, 0}, {2, 2});
    PathCircuit circuit(*algebra_, maze);
    auto enc = Encoder();

    EXPECT_FALSE(Dec(circuit.Evaluate(enc.Path({{0, 1}, {1, 1}, {2, 1}, {2, 2}})))) << "start";
    EXPECT_FALSE(Dec(circuit.Evaluate(enc.Path({{0, 0}, {1, 0}, {2, 0}, {2, 1}})))) << "end";
}

TEST_F(PathCircuitTest, SingleCellPathWhenStartIsEnd) {
    auto maze = MakeMaze({"..", ".."}, {1, 0}, {1, 0});
    PathCircuit circuit(*algebra_, maze);
    EXPECT_TRUE(Dec(circuit.Evaluate(Encoder().Path({{1, 0}}))));
}

TEST_F(PathCircuitTest, EmptyPathRejected) {
    auto maze = MakeMaze({".."}, {0, 0}, {0, 1});
    PathCircuit circuit(*algebra_, maze);
    EXPECT_THROW(circuit.Evaluate({}), std::invalid_argument);
}
