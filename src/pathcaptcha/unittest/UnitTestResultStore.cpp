// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2025, Lux Industries Inc
//
// Result store state machine tests
//
// Submitted -> RequestPending -> Revealed, driven by signed oracle payloads.

#include "gtest/gtest.h"
#include "maze/errors.h"
#include "oracle/signature.h"
#include "result/result_store.h"
#include "test_helpers.h"

#include <chrono>
#include <memory>
#include <stdexcept>

using namespace lux::pathcaptcha;
using namespace lux::pathcaptcha::oracle;

class ResultStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        t0_ = Clock::now();
        events_.Subscribe([this](const ProtocolEvent& e) { seen_.push_back(e); });
        store_ = std::make_unique<ResultStore>(
            std::make_shared<SignatureProofVerifier>(signer_.PublicKey()), &events_);
    }

    Timestamp At(int seconds) const { return t0_ + std::chrono::seconds(seconds); }

    // Track solution `sid` and open request `rid` for it
    void Open(SolutionId sid, RequestId rid) {
        if (!store_->IsTracked(sid)) {
            store_->Track(sid, t0_);
        }
        store_->AddPending(rid, sid, t0_);
    }

    DecryptionProof Sign(RequestId rid, const Cleartexts& cleartexts) {
        return signer_.SignDecryption(rid, cleartexts);
    }

    Ed25519Signer signer_;
    EventBus events_;
    std::vector<ProtocolEvent> seen_;
    std::unique_ptr<ResultStore> store_;
    Timestamp t0_;
};

// ============================================================================
// Happy Path
// ============================================================================

TEST_F(ResultStoreTest, ResolveRevealsExactlyOnce) {
    Open(1, 10);
    EXPECT_EQ(store_->StateOf(1), VerificationState::REQUEST_PENDING);
    EXPECT_FALSE(store_->GetResult(1).is_revealed);

    VerificationResult result = store_->Resolve(10, {1}, Sign(10, {1}), At(3));
    EXPECT_TRUE(result.is_revealed);
    EXPECT_TRUE(result.is_valid);
    EXPECT_EQ(store_->StateOf(1), VerificationState::REVEALED);
    EXPECT_EQ(store_->PendingCount(), 0u);

    ASSERT_FALSE(seen_.empty());
    EXPECT_EQ(seen_.back().type, EventType::VERIFICATION_COMPLETE);
    EXPECT_EQ(seen_.back().solution_id, 1u);
    EXPECT_EQ(seen_.back().request_id, 10u);
    EXPECT_TRUE(seen_.back().is_valid);

    // Replaying the identical, genuinely signed response
    EXPECT_PROTOCOL_ERROR(store_->Resolve(10, {1}, Sign(10, {1}), At(4)),
                          ErrorCode::ALREADY_VERIFIED);
    EXPECT_TRUE(store_->GetResult(1).is_valid);
}

TEST_F(ResultStoreTest, FalseVerdictIsRevealedToo) {
    Open(1, 10);
    VerificationResult result = store_->Resolve(10, {0}, Sign(10, {0}), At(1));
    EXPECT_TRUE(result.is_revealed);
    EXPECT_FALSE(result.is_valid);
}

TEST_F(ResultStoreTest, ContradictingReplayCannotFlipVerdict) {
    Open(1, 10);
    store_->Resolve(10, {0}, Sign(10, {0}), At(1));
    EXPECT_PROTOCOL_ERROR(store_->Resolve(10, {1}, Sign(10, {1}), At(2)),
                          ErrorCode::ALREADY_VERIFIED);
    EXPECT_FALSE(store_->GetResult(1).is_valid);
}

// ============================================================================
// Rejections
// ============================================================================

TEST_F(ResultStoreTest, UnknownRequest) {
    Open(1, 10);
    EXPECT_PROTOCOL_ERROR(store_->Resolve(11, {1}, Sign(11, {1}), At(1)),
                          ErrorCode::UNKNOWN_REQUEST);
    EXPECT_PROTOCOL_ERROR(store_->Resolve(kNoId, {1}, Sign(kNoId, {1}), At(1)),
                          ErrorCode::UNKNOWN_REQUEST);
}

TEST_F(ResultStoreTest, AbandonedRequestIsUnknown) {
    Open(1, 10);
    EXPECT_TRUE(store_->Abandon(10, At(1)));
    EXPECT_FALSE(store_->Abandon(10, At(1)));
    EXPECT_EQ(seen_.back().type, EventType::VERIFICATION_ABANDONED);
    EXPECT_EQ(store_->StateOf(1), VerificationState::SUBMITTED);

    EXPECT_PROTOCOL_ERROR(store_->Resolve(10, {1}, Sign(10, {1}), At(2)),
                          ErrorCode::UNKNOWN_REQUEST);
    EXPECT_FALSE(store_->GetResult(1).is_revealed);
}

TEST_F(ResultStoreTest, TamperedPayloadLeavesRequestPending) {
    Open(1, 10);
    DecryptionProof proof = Sign(10, {0});

    EXPECT_PROTOCOL_ERROR(store_->Resolve(10, {1}, proof, At(1)), ErrorCode::INVALID_PROOF);
    EXPECT_FALSE(store_->GetResult(1).is_revealed);
    EXPECT_EQ(store_->StateOf(1), VerificationState::REQUEST_PENDING);

    DecryptionProof forged = proof;
    forged.signature[10] ^= 0x01;
    EXPECT_PROTOCOL_ERROR(store_->Resolve(10, {0}, forged, At(1)), ErrorCode::INVALID_PROOF);

    // The genuine response still goes through afterwards
    VerificationResult result = store_->Resolve(10, {0}, proof, At(2));
    EXPECT_TRUE(result.is_revealed);
    EXPECT_FALSE(result.is_valid);
}

TEST_F(ResultStoreTest, ImpostorOracleRejected) {
    Open(1, 10);
    Ed25519Signer impostor;
    EXPECT_PROTOCOL_ERROR(store_->Resolve(10, {1}, impostor.SignDecryption(10, {1}), At(1)),
                          ErrorCode::INVALID_PROOF);
    EXPECT_EQ(store_->StateOf(1), VerificationState::REQUEST_PENDING);
}

TEST_F(ResultStoreTest, NonBooleanPayloadRejected) {
    Open(1, 10);
    EXPECT_PROTOCOL_ERROR(store_->Resolve(10, {2}, Sign(10, {2}), At(1)),
                          ErrorCode::INVALID_PROOF);
    EXPECT_PROTOCOL_ERROR(store_->Resolve(10, {1, 1}, Sign(10, {1, 1}), At(1)),
                          ErrorCode::INVALID_PROOF);
    EXPECT_PROTOCOL_ERROR(store_->Resolve(10, {}, Sign(10, {}), At(1)),
                          ErrorCode::INVALID_PROOF);
    EXPECT_EQ(store_->StateOf(1), VerificationState::REQUEST_PENDING);
}

TEST_F(ResultStoreTest, RevealedCheckPrecedesProofCheck) {
    Open(1, 10);
    store_->Resolve(10, {1}, Sign(10, {1}), At(1));
    EXPECT_PROTOCOL_ERROR(store_->Resolve(10, {1}, DecryptionProof{}, At(2)),
                          ErrorCode::ALREADY_VERIFIED);
}

TEST_F(ResultStoreTest, SiblingRequestsCloseOnReveal) {
    Open(1, 10);
    Open(1, 11);
    EXPECT_EQ(store_->PendingFor(1).size(), 2u);

    store_->Resolve(10, {1}, Sign(10, {1}), At(1));
    EXPECT_EQ(store_->PendingCount(), 0u);
    EXPECT_PROTOCOL_ERROR(store_->Resolve(11, {0}, Sign(11, {0}), At(2)),
                          ErrorCode::ALREADY_VERIFIED);
    EXPECT_TRUE(store_->GetResult(1).is_valid);
}

// ============================================================================
// Bookkeeping
// ============================================================================

TEST_F(ResultStoreTest, RequestIdsMustBeFresh) {
    Open(1, 10);
    EXPECT_THROW(store_->AddPending(10, 1, t0_), std::invalid_argument);
    EXPECT_THROW(store_->AddPending(kNoId, 1, t0_), std::invalid_argument);
    EXPECT_PROTOCOL_ERROR(store_->AddPending(12, 99, t0_), ErrorCode::UNKNOWN_SOLUTION);
}

TEST_F(ResultStoreTest, AbandonAllForSolution) {
    Open(1, 10);
    Open(1, 11);
    Open(2, 12);
    EXPECT_EQ(store_->AbandonAllFor(1, At(1)), 2u);
    EXPECT_FALSE(store_->HasPendingFor(1));
    EXPECT_TRUE(store_->HasPendingFor(2));
    EXPECT_EQ(store_->PendingCount(), 1u);
}

TEST_F(ResultStoreTest, UnknownSolutionQueries) {
    EXPECT_PROTOCOL_ERROR(store_->GetResult(5), ErrorCode::UNKNOWN_SOLUTION);
    EXPECT_PROTOCOL_ERROR(store_->StateOf(5), ErrorCode::UNKNOWN_SOLUTION);
}

TEST_F(ResultStoreTest, StatisticsAverageResolveTime) {
    Open(1, 10);
    Open(2, 11);
    Open(3, 12);
    store_->Resolve(10, {1}, Sign(10, {1}), At(4));
    store_->Resolve(11, {0}, Sign(11, {0}), At(2));

    VerifierStatistics stats;
    store_->FillStatistics(stats);
    EXPECT_EQ(stats.pending, 1u);
    EXPECT_EQ(stats.revealed, 2u);
    EXPECT_EQ(stats.valid, 1u);
    EXPECT_EQ(stats.invalid, 1u);
    EXPECT_DOUBLE_EQ(stats.average_resolve_seconds, 3.0);
}

TEST(ResultStoreConstruction, NeedsVerifier) {
    EXPECT_THROW(ResultStore store(nullptr), std::invalid_argument);
}
