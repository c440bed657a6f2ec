// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2025, Lux Industries Inc
//
// Maze / solution registry and event bus tests
//
// Only structure is checked here, so cells and coordinates are trivial
// ciphertexts from EvalConstant and no keys are generated.

#include "gtest/gtest.h"
#include "algebra/binfhe_algebra.h"
#include "maze/errors.h"
#include "maze/events.h"
#include "maze/maze_registry.h"
#include "maze/solution_registry.h"
#include "oracle/signature.h"
#include "result/result_store.h"
#include "test_helpers.h"

#include <memory>
#include <stdexcept>

using namespace lbcrypto;
using namespace lux::pathcaptcha;
using lux::pathcaptcha::algebra::BinFheAlgebra;
using lux::pathcaptcha::test_util::MazeEncoder;

// ============================================================================
// Test Fixture
// ============================================================================

class RegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        limits_.coordinate_bits = 3;
        limits_.max_grid_cells = 16;

        events_.Subscribe([this](const ProtocolEvent& e) { seen_.push_back(e); });
        results_ = std::make_unique<ResultStore>(
            std::make_shared<oracle::SignatureProofVerifier>(signer_.PublicKey()), &events_);
        mazes_ = std::make_unique<MazeRegistry>(limits_, &events_);
        solutions_ = std::make_unique<SolutionRegistry>(*mazes_, *results_, &events_);
    }

    MazeEncoder Encoder(uint32_t bits) {
        return MazeEncoder([this](bool v) { return algebra_.Constant(v); }, bits);
    }

    MazeId OpenMaze(size_t rows, size_t cols) {
        auto enc = Encoder(limits_.coordinate_bits);
        std::vector<std::string> layout(rows, std::string(cols, '.'));
        return mazes_->CreateMaze(enc.Grid(layout), enc.Coord(0, 0),
                                  enc.Coord(rows - 1, cols - 1), Clock::now());
    }

    BinFheAlgebra algebra_{TOY, GINX};
    oracle::Ed25519Signer signer_;
    MazeLimits limits_;
    EventBus events_;
    std::vector<ProtocolEvent> seen_;
    std::unique_ptr<ResultStore> results_;
    std::unique_ptr<MazeRegistry> mazes_;
    std::unique_ptr<SolutionRegistry> solutions_;
};

// ============================================================================
// Maze Registry
// ============================================================================

TEST_F(RegistryTest, MazeIdsAreSequentialFromOne) {
    EXPECT_EQ(OpenMaze(2, 2), 1u);
    EXPECT_EQ(OpenMaze(3, 1), 2u);
    EXPECT_EQ(mazes_->Size(), 2u);
    EXPECT_FALSE(mazes_->Contains(kNoId));
    EXPECT_EQ(mazes_->Find(3), nullptr);

    const EncryptedMaze& maze = mazes_->Get(2);
    EXPECT_EQ(maze.rows, 3u);
    EXPECT_EQ(maze.cols, 1u);
    EXPECT_EQ(maze.NumCells(), 3u);
    EXPECT_EQ(mazes_->Ids(), (std::vector<MazeId>{1, 2}));
}

TEST_F(RegistryTest, MazeCreationEmitsEvent) {
    MazeId id = OpenMaze(2, 2);
    ASSERT_EQ(seen_.size(), 1u);
    EXPECT_EQ(seen_[0].type, EventType::MAZE_CREATED);
    EXPECT_EQ(seen_[0].maze_id, id);
}

TEST_F(RegistryTest, MetadataIsStored) {
    auto enc = Encoder(3);
    MazeMetadata meta;
    meta.difficulty = 4;
    meta.description = "spiral";
    meta.owner = "alice";
    MazeId id = mazes_->CreateMaze(enc.Grid({"..", ".."}), enc.Coord(0, 0), enc.Coord(1, 1),
                                   Clock::now(), meta);
    EXPECT_EQ(mazes_->Get(id).metadata.difficulty, 4u);
    EXPECT_EQ(mazes_->Get(id).metadata.description, "spiral");
    EXPECT_EQ(mazes_->Get(id).metadata.owner, "alice");
}

TEST_F(RegistryTest, RejectsEmptyAndRaggedGrids) {
    auto enc = Encoder(3);
    auto start = enc.Coord(0, 0);

    EXPECT_PROTOCOL_ERROR(mazes_->CreateMaze({}, start, start, Clock::now()),
                          ErrorCode::INVALID_DIMENSIONS);
    EXPECT_PROTOCOL_ERROR(mazes_->CreateMaze(enc.Grid({"", ""}), start, start, Clock::now()),
                          ErrorCode::INVALID_DIMENSIONS);
    EXPECT_PROTOCOL_ERROR(mazes_->CreateMaze(enc.Grid({"...", ".."}), start, start, Clock::now()),
                          ErrorCode::INVALID_DIMENSIONS);
    EXPECT_EQ(mazes_->Size(), 0u);
    EXPECT_TRUE(seen_.empty());
}

TEST_F(RegistryTest, RejectsGridsTheCoordinateWidthCannotAddress) {
    // 3-bit coordinates allow at most 7 rows/cols
    auto enc = Encoder(3);
    auto start = enc.Coord(0, 0);
    limits_.max_grid_cells = 100;
    MazeRegistry wide(limits_);

    EXPECT_NO_THROW(wide.CreateMaze(enc.Grid({"......."}), start, start, Clock::now()));
    EXPECT_PROTOCOL_ERROR(wide.CreateMaze(enc.Grid({"........"}), start, start, Clock::now()),
                          ErrorCode::INVALID_DIMENSIONS);
}

TEST_F(RegistryTest, RejectsTooManyCells) {
    auto enc = Encoder(3);
    auto start = enc.Coord(0, 0);
    // 5 x 4 = 20 > 16
    std::vector<std::string> layout(5, "....");
    EXPECT_PROTOCOL_ERROR(mazes_->CreateMaze(enc.Grid(layout), start, start, Clock::now()),
                          ErrorCode::INVALID_DIMENSIONS);
}

TEST_F(RegistryTest, RejectsMalformedCiphertexts) {
    auto enc = Encoder(3);
    auto narrow = Encoder(2).Coord(0, 0);
    auto grid = enc.Grid({"..", ".."});

    EXPECT_PROTOCOL_ERROR(mazes_->CreateMaze(grid, narrow, enc.Coord(1, 1), Clock::now()),
                          ErrorCode::MALFORMED_CIPHERTEXT);

    auto holed = grid;
    holed[1][0] = nullptr;
    EXPECT_PROTOCOL_ERROR(mazes_->CreateMaze(holed, enc.Coord(0, 0), enc.Coord(1, 1), Clock::now()),
                          ErrorCode::MALFORMED_CIPHERTEXT);
    EXPECT_EQ(mazes_->Size(), 0u);
}

TEST_F(RegistryTest, UnknownMaze) {
    EXPECT_PROTOCOL_ERROR(mazes_->Get(99), ErrorCode::UNKNOWN_MAZE);
}

// ============================================================================
// Solution Registry
// ============================================================================

TEST_F(RegistryTest, SubmitOpensUnrevealedResult) {
    MazeId maze = OpenMaze(2, 2);
    auto enc = Encoder(3);
    seen_.clear();

    SolutionId id = solutions_->SubmitSolution(maze, enc.Path({{0, 0}, {0, 1}, {1, 1}}),
                                               Clock::now(), "bob");
    EXPECT_EQ(id, 1u);
    EXPECT_EQ(solutions_->Get(id).maze_id, maze);
    EXPECT_EQ(solutions_->Get(id).path.size(), 3u);
    EXPECT_EQ(solutions_->Get(id).submitter, "bob");

    VerificationResult result = results_->GetResult(id);
    EXPECT_FALSE(result.is_revealed);
    EXPECT_EQ(results_->StateOf(id), VerificationState::SUBMITTED);

    ASSERT_EQ(seen_.size(), 1u);
    EXPECT_EQ(seen_[0].type, EventType::SOLUTION_SUBMITTED);
    EXPECT_EQ(seen_[0].solution_id, id);
    EXPECT_EQ(seen_[0].maze_id, maze);
}

TEST_F(RegistryTest, SubmitAgainstUnknownMaze) {
    auto enc = Encoder(3);
    EXPECT_PROTOCOL_ERROR(solutions_->SubmitSolution(7, enc.Path({{0, 0}}), Clock::now()),
                          ErrorCode::UNKNOWN_MAZE);
    EXPECT_EQ(solutions_->Size(), 0u);
}

TEST_F(RegistryTest, SubmitEmptyPath) {
    MazeId maze = OpenMaze(2, 2);
    EXPECT_PROTOCOL_ERROR(solutions_->SubmitSolution(maze, {}, Clock::now()),
                          ErrorCode::EMPTY_PATH);
}

TEST_F(RegistryTest, SubmitMalformedCoordinate) {
    MazeId maze = OpenMaze(2, 2);
    auto path = Encoder(3).Path({{0, 0}, {0, 1}});
    path[1].col.bits.pop_back();
    EXPECT_PROTOCOL_ERROR(solutions_->SubmitSolution(maze, path, Clock::now()),
                          ErrorCode::MALFORMED_CIPHERTEXT);
    EXPECT_FALSE(results_->IsTracked(1));
}

TEST_F(RegistryTest, SolutionsListedPerMaze) {
    MazeId a = OpenMaze(2, 2);
    MazeId b = OpenMaze(2, 2);
    auto path = Encoder(3).Path({{0, 0}});

    SolutionId s1 = solutions_->SubmitSolution(a, path, Clock::now());
    SolutionId s2 = solutions_->SubmitSolution(b, path, Clock::now());
    SolutionId s3 = solutions_->SubmitSolution(a, path, Clock::now());

    EXPECT_EQ(solutions_->ListForMaze(a), (std::vector<SolutionId>{s1, s3}));
    EXPECT_EQ(solutions_->ListForMaze(b), (std::vector<SolutionId>{s2}));
    EXPECT_PROTOCOL_ERROR(solutions_->ListForMaze(9), ErrorCode::UNKNOWN_MAZE);
    EXPECT_PROTOCOL_ERROR(solutions_->Get(9), ErrorCode::UNKNOWN_SOLUTION);
}

// ============================================================================
// Event Bus and Errors
// ============================================================================

TEST(EventBusTest, FailingHandlerDoesNotStopOthers) {
    EventBus bus;
    int delivered = 0;
    bus.Subscribe([](const ProtocolEvent&) { throw std::runtime_error("observer down"); });
    size_t token = bus.Subscribe([&](const ProtocolEvent&) { delivered++; });

    bus.Publish(ProtocolEvent{EventType::MAZE_CREATED, Clock::now()});
    EXPECT_EQ(delivered, 1);

    bus.Unsubscribe(token);
    bus.Publish(ProtocolEvent{EventType::MAZE_CREATED, Clock::now()});
    EXPECT_EQ(delivered, 1);
    EXPECT_EQ(bus.NumSubscribers(), 1u);
}

TEST(ErrorTest, MessageCarriesCodeName) {
    ProtocolError e(ErrorCode::ALREADY_PENDING, "solution 3");
    EXPECT_EQ(e.Code(), ErrorCode::ALREADY_PENDING);
    EXPECT_EQ(std::string(e.what()), "AlreadyPending: solution 3");
    EXPECT_EQ(ErrorCodeName(ErrorCode::INVALID_PROOF), "InvalidProof");
    EXPECT_EQ(EventTypeName(EventType::VERIFICATION_COMPLETE), "verification-complete");
    EXPECT_EQ(VerificationStateName(VerificationState::REQUEST_PENDING), "pending");
}
