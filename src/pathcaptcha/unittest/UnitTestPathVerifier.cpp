// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2025, Lux Industries Inc
//
// Path Verifier End-to-End Tests
//
// Full protocol against the local oracle: encrypt with the oracle's public
// key, evaluate, decrypt through the oracle, verify the signed verdict.
//   - Valid path / wall / diagonal / out-of-bounds verdicts
//   - Replay, tampering and unknown requests
//   - Single-flight, expiry and explicit abandon
//   - Worker-thread delivery

#include "gtest/gtest.h"
#include "algebra/binfhe_algebra.h"
#include "maze/errors.h"
#include "oracle/local_oracle.h"
#include "protocol/path_verifier.h"
#include "test_helpers.h"

#include <algorithm>
#include <chrono>
#include <memory>
#include <thread>

using namespace lbcrypto;
using namespace lux::pathcaptcha;
using lux::pathcaptcha::algebra::BinFheAlgebra;
using lux::pathcaptcha::oracle::LocalDecryptionOracle;
using lux::pathcaptcha::test_util::CapturingOracle;
using lux::pathcaptcha::test_util::MazeEncoder;

// ============================================================================
// Test Fixture
// ============================================================================

class PathVerifierTest : public ::testing::Test {
protected:
    static constexpr uint32_t kBits = 3;

    static void SetUpTestSuite() {
        algebra_ = std::make_unique<BinFheAlgebra>(TOY, GINX);
        oracle_ = std::make_unique<LocalDecryptionOracle>(*algebra_);
    }

    static void TearDownTestSuite() {
        oracle_.reset();
        algebra_.reset();
    }

    void SetUp() override {
        now_ = Clock::now();
        Build(false, {});
    }

    void TearDown() override {
        // Deliver leftovers while the verifier they point at is still alive
        oracle_->Stop();
        oracle_->ProcessPending();
        verifier_.reset();
    }

    void Build(bool capture, const verify::EngineOptions& options) {
        oracle_->ProcessPending();
        verifier_.reset();
        capture_ = std::make_unique<CapturingOracle>(*oracle_);

        MazeLimits limits;
        limits.coordinate_bits = kBits;
        oracle::DecryptionOracle& target =
            capture ? static_cast<oracle::DecryptionOracle&>(*capture_) : *oracle_;
        verifier_ = std::make_unique<PathVerifier>(
            *algebra_, target, oracle_->Verifier(), limits, options,
            [this]() { return now_; });
        verifier_->Subscribe([this](const ProtocolEvent& e) { events_.push_back(e.type); });
    }

    MazeEncoder Encoder() const {
        const LWEPublicKey& pk = oracle_->PublicKey();
        return MazeEncoder([pk](bool v) { return algebra_->EncryptBit(pk, v); }, kBits);
    }

    // 3x3 maze from (0,0) to (2,2)
    MazeId CreateMaze(const std::vector<std::string>& layout) {
        auto enc = Encoder();
        return verifier_->CreateMaze(enc.Grid(layout), enc.Coord(0, 0), enc.Coord(2, 2));
    }

    SolutionId Submit(MazeId maze, const std::vector<test_util::Cell>& cells) {
        return verifier_->SubmitSolution(maze, Encoder().Path(cells));
    }

    // Request and deliver synchronously; returns the revealed verdict
    bool VerifyNow(SolutionId sid) {
        verifier_->RequestVerification(sid);
        oracle_->ProcessPending();
        VerificationResult result = verifier_->GetVerificationResult(sid);
        EXPECT_TRUE(result.is_revealed);
        return result.is_valid;
    }

    const std::vector<test_util::Cell> kLPath = {{0, 0}, {1, 0}, {2, 0}, {2, 1}, {2, 2}};

    static std::unique_ptr<BinFheAlgebra> algebra_;
    static std::unique_ptr<LocalDecryptionOracle> oracle_;

    std::unique_ptr<CapturingOracle> capture_;
    std::unique_ptr<PathVerifier> verifier_;
    std::vector<EventType> events_;
    Timestamp now_;
};

std::unique_ptr<BinFheAlgebra> PathVerifierTest::algebra_;
std::unique_ptr<LocalDecryptionOracle> PathVerifierTest::oracle_;

// ============================================================================
// Verdicts
// ============================================================================

TEST_F(PathVerifierTest, ValidPathThroughOpenMaze) {
    MazeId maze = CreateMaze({"...", "...", "..."});
    SolutionId sid = Submit(maze, kLPath);

    verifier_->RequestVerification(sid);
    EXPECT_EQ(verifier_->GetVerificationState(sid), VerificationState::REQUEST_PENDING);
    EXPECT_FALSE(verifier_->GetVerificationResult(sid).is_revealed);

    EXPECT_EQ(oracle_->ProcessPending(), 1u);
    VerificationResult result = verifier_->GetVerificationResult(sid);
    EXPECT_TRUE(result.is_revealed);
    EXPECT_TRUE(result.is_valid);
    EXPECT_EQ(verifier_->GetVerificationState(sid), VerificationState::REVEALED);

    EXPECT_EQ(events_, (std::vector<EventType>{
        EventType::MAZE_CREATED,
        EventType::SOLUTION_SUBMITTED,
        EventType::VERIFICATION_REQUESTED,
        EventType::VERIFICATION_COMPLETE,
    }));
}

TEST_F(PathVerifierTest, StatusPairsResultWithState) {
    MazeId maze = CreateMaze({"...", "...", "..."});
    SolutionId sid = Submit(maze, kLPath);

    auto status = verifier_->GetVerificationStatus(sid);
    EXPECT_FALSE(status.first.is_revealed);
    EXPECT_EQ(status.second, VerificationState::SUBMITTED);

    verifier_->RequestVerification(sid);
    status = verifier_->GetVerificationStatus(sid);
    EXPECT_FALSE(status.first.is_revealed);
    EXPECT_EQ(status.second, VerificationState::REQUEST_PENDING);

    EXPECT_EQ(oracle_->ProcessPending(), 1u);
    status = verifier_->GetVerificationStatus(sid);
    EXPECT_EQ(status.first.solution_id, sid);
    EXPECT_TRUE(status.first.is_revealed);
    EXPECT_TRUE(status.first.is_valid);
    EXPECT_EQ(status.second, VerificationState::REVEALED);

    EXPECT_PROTOCOL_ERROR(verifier_->GetVerificationStatus(sid + 100), ErrorCode::UNKNOWN_SOLUTION);
}

TEST_F(PathVerifierTest, WallOnPathIsInvalid) {
    MazeId maze = CreateMaze({"...", "#..", "..."});
    EXPECT_FALSE(VerifyNow(Submit(maze, kLPath)));
}

TEST_F(PathVerifierTest, DiagonalStepIsInvalid) {
    MazeId maze = CreateMaze({"...", "...", "..."});
    EXPECT_FALSE(VerifyNow(Submit(maze, {{0, 0}, {1, 1}, {2, 2}})));
}

TEST_F(PathVerifierTest, OutOfBoundsDetourIsInvalid) {
    // Row 7 is reachable from row 0 by a modular -1 step but lies outside the grid
    auto enc = Encoder();
    MazeId maze = verifier_->CreateMaze(enc.Grid({"...", "...", "..."}),
                                        enc.Coord(0, 0), enc.Coord(0, 0));
    EXPECT_FALSE(VerifyNow(Submit(maze, {{0, 0}, {7, 0}, {0, 0}})));
}

TEST_F(PathVerifierTest, CircuitStatisticsReported) {
    MazeId maze = CreateMaze({"...", "...", "..."});
    verifier_->RequestVerification(Submit(maze, kLPath));
    verify::CircuitStats stats = verifier_->LastCircuitStats();
    EXPECT_EQ(stats.lookups, 5u);
    EXPECT_EQ(stats.cells_scanned, 45u);
    EXPECT_GT(stats.gates, 0u);
}

// ============================================================================
// Oracle Responses
// ============================================================================

TEST_F(PathVerifierTest, RevealIsIdempotent) {
    Build(true, {});
    MazeId maze = CreateMaze({"...", "...", "..."});
    SolutionId sid = Submit(maze, kLPath);
    verifier_->RequestVerification(sid);
    oracle_->ProcessPending();
    ASSERT_EQ(capture_->responses.size(), 1u);
    auto response = capture_->responses[0];
    EXPECT_FALSE(verifier_->GetVerificationResult(sid).is_revealed);

    verifier_->Resolve(response.request_id, response.cleartexts, response.proof);
    EXPECT_TRUE(verifier_->GetVerificationResult(sid).is_valid);

    EXPECT_PROTOCOL_ERROR(
        verifier_->Resolve(response.request_id, response.cleartexts, response.proof),
        ErrorCode::ALREADY_VERIFIED);
    EXPECT_TRUE(verifier_->GetVerificationResult(sid).is_valid);
}

TEST_F(PathVerifierTest, TamperedVerdictRejected) {
    Build(true, {});
    MazeId maze = CreateMaze({"...", "#..", "..."});
    SolutionId sid = Submit(maze, kLPath);
    verifier_->RequestVerification(sid);
    oracle_->ProcessPending();
    ASSERT_EQ(capture_->responses.size(), 1u);
    auto response = capture_->responses[0];
    ASSERT_EQ(response.cleartexts, (oracle::Cleartexts{0}));

    // Flip the verdict to "valid" without re-signing
    EXPECT_PROTOCOL_ERROR(verifier_->Resolve(response.request_id, {1}, response.proof),
                          ErrorCode::INVALID_PROOF);
    EXPECT_FALSE(verifier_->GetVerificationResult(sid).is_revealed);
    EXPECT_EQ(verifier_->GetVerificationState(sid), VerificationState::REQUEST_PENDING);

    auto forged = response.proof;
    forged.signature.back() ^= 0x01;
    EXPECT_PROTOCOL_ERROR(verifier_->Resolve(response.request_id, response.cleartexts, forged),
                          ErrorCode::INVALID_PROOF);

    verifier_->Resolve(response.request_id, response.cleartexts, response.proof);
    VerificationResult result = verifier_->GetVerificationResult(sid);
    EXPECT_TRUE(result.is_revealed);
    EXPECT_FALSE(result.is_valid);
}

TEST_F(PathVerifierTest, UnknownIds) {
    EXPECT_PROTOCOL_ERROR(verifier_->SubmitSolution(42, Encoder().Path({{0, 0}})),
                          ErrorCode::UNKNOWN_MAZE);
    EXPECT_PROTOCOL_ERROR(verifier_->RequestVerification(42), ErrorCode::UNKNOWN_SOLUTION);
    EXPECT_PROTOCOL_ERROR(verifier_->GetVerificationResult(42), ErrorCode::UNKNOWN_SOLUTION);
    EXPECT_PROTOCOL_ERROR(verifier_->Resolve(12345, {1}, oracle::DecryptionProof{}),
                          ErrorCode::UNKNOWN_REQUEST);
    EXPECT_PROTOCOL_ERROR(verifier_->GetMaze(42), ErrorCode::UNKNOWN_MAZE);
}

// ============================================================================
// Re-request Policy
// ============================================================================

TEST_F(PathVerifierTest, SingleFlightAndAbandon) {
    MazeId maze = CreateMaze({"...", "...", "..."});
    SolutionId sid = Submit(maze, kLPath);

    verifier_->RequestVerification(sid);
    EXPECT_PROTOCOL_ERROR(verifier_->RequestVerification(sid), ErrorCode::ALREADY_PENDING);

    EXPECT_EQ(verifier_->AbandonVerification(sid), 1u);
    EXPECT_EQ(verifier_->GetVerificationState(sid), VerificationState::SUBMITTED);
    verifier_->RequestVerification(sid);

    // The abandoned request's callback is refused, the fresh one reveals
    uint64_t failures = oracle_->NumCallbackFailures();
    EXPECT_EQ(oracle_->ProcessPending(), 2u);
    EXPECT_EQ(oracle_->NumCallbackFailures(), failures + 1);
    EXPECT_TRUE(verifier_->GetVerificationResult(sid).is_valid);

    EXPECT_PROTOCOL_ERROR(verifier_->RequestVerification(sid), ErrorCode::ALREADY_VERIFIED);
    EXPECT_PROTOCOL_ERROR(verifier_->AbandonVerification(sid), ErrorCode::ALREADY_VERIFIED);
}

TEST_F(PathVerifierTest, StalePendingRequestExpires) {
    verify::EngineOptions options;
    options.pending_expiry = std::chrono::seconds(30);
    Build(false, options);

    MazeId maze = CreateMaze({"...", "...", "..."});
    SolutionId sid = Submit(maze, kLPath);
    verifier_->RequestVerification(sid);

    now_ += std::chrono::seconds(10);
    EXPECT_PROTOCOL_ERROR(verifier_->RequestVerification(sid), ErrorCode::ALREADY_PENDING);

    now_ += std::chrono::seconds(25);
    verifier_->RequestVerification(sid);
    EXPECT_EQ(verifier_->GetStatistics().pending, 1u);

    oracle_->ProcessPending();
    EXPECT_TRUE(verifier_->GetVerificationResult(sid).is_revealed);
    EXPECT_NE(std::find(events_.begin(), events_.end(), EventType::VERIFICATION_ABANDONED),
              events_.end());
}

TEST_F(PathVerifierTest, MultiFlightWhenSingleFlightDisabled) {
    verify::EngineOptions options;
    options.single_flight = false;
    Build(false, options);

    MazeId maze = CreateMaze({"...", "...", "..."});
    SolutionId sid = Submit(maze, kLPath);
    RequestId first = verifier_->RequestVerification(sid);
    RequestId second = verifier_->RequestVerification(sid);
    EXPECT_NE(first, second);
    EXPECT_EQ(verifier_->GetStatistics().pending, 2u);

    oracle_->ProcessPending();
    EXPECT_TRUE(verifier_->GetVerificationResult(sid).is_valid);
    EXPECT_EQ(verifier_->GetStatistics().pending, 0u);
}

// ============================================================================
// Asynchronous Delivery
// ============================================================================

TEST_F(PathVerifierTest, WorkerThreadsDeliverVerdict) {
    MazeId maze = CreateMaze({"...", "...", "..."});
    SolutionId valid = Submit(maze, kLPath);
    SolutionId diagonal = Submit(maze, {{0, 0}, {1, 1}, {2, 2}});

    oracle_->Start(2);
    verifier_->RequestVerification(valid);
    verifier_->RequestVerification(diagonal);

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(120);
    while (std::chrono::steady_clock::now() < deadline &&
           verifier_->GetStatistics().revealed < 2) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    oracle_->Stop();

    EXPECT_TRUE(verifier_->GetVerificationResult(valid).is_valid);
    EXPECT_TRUE(verifier_->GetVerificationResult(diagonal).is_revealed);
    EXPECT_FALSE(verifier_->GetVerificationResult(diagonal).is_valid);
}

// ============================================================================
// Queries
// ============================================================================

TEST_F(PathVerifierTest, QueriesAndStatistics) {
    EXPECT_TRUE(verifier_->IsAvailable());

    MazeMetadata meta;
    meta.difficulty = 2;
    meta.owner = "carol";
    auto enc = Encoder();
    MazeId maze = verifier_->CreateMaze(enc.Grid({"...", "...", "..."}),
                                        enc.Coord(0, 0), enc.Coord(2, 2), meta);
    SolutionId good = Submit(maze, kLPath);
    SolutionId bad = Submit(maze, {{0, 0}, {1, 1}, {2, 2}});

    now_ += std::chrono::seconds(6);
    VerifyNow(good);
    VerifyNow(bad);

    MazeSummary summary = verifier_->GetMaze(maze);
    EXPECT_EQ(summary.rows, 3u);
    EXPECT_EQ(summary.cols, 3u);
    EXPECT_EQ(summary.num_solutions, 2u);
    EXPECT_EQ(summary.metadata.owner, "carol");

    EXPECT_EQ(verifier_->ListMazes(), (std::vector<MazeId>{maze}));
    EXPECT_EQ(verifier_->ListSolutions(maze), (std::vector<SolutionId>{good, bad}));

    VerifierStatistics stats = verifier_->GetStatistics();
    EXPECT_EQ(stats.mazes, 1u);
    EXPECT_EQ(stats.solutions, 2u);
    EXPECT_EQ(stats.revealed, 2u);
    EXPECT_EQ(stats.valid, 1u);
    EXPECT_EQ(stats.invalid, 1u);
    EXPECT_EQ(stats.pending, 0u);
    EXPECT_DOUBLE_EQ(stats.average_resolve_seconds, 6.0);
}
