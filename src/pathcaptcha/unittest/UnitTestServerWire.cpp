// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2025, Lux Industries Inc
//
// Server Wire Encoding Tests
//
// JSON request decoding and response encoding used by the HTTP endpoints.
// Ciphertexts travel as base64 of the BinFHE binary serialization.

#include "gtest/gtest.h"
#include "maze_controller.h"

#include <memory>
#include <stdexcept>

using namespace lbcrypto;
using namespace lux::pathcaptcha;
using namespace lux::pathcaptcha::algebra;
namespace wire = pathcaptcha_server::wire;

// ============================================================================
// Test Fixture
// ============================================================================

class ServerWireTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() {
        // Encrypt and decrypt only; no bootstrapping keys needed
        algebra_ = std::make_unique<BinFheAlgebra>(TOY, GINX);
        sk_ = algebra_->GetContext().KeyGen();
    }

    static void TearDownTestSuite() {
        algebra_.reset();
        sk_.reset();
    }

    Json::Value EncBit(bool v) {
        auto bytes = BinFheAlgebra::SerializeBit(algebra_->EncryptBit(sk_, v));
        return Json::Value(drogon::utils::base64Encode(bytes.data(), bytes.size()));
    }

    Json::Value EncWord(uint64_t v, uint32_t width) {
        Json::Value word(Json::arrayValue);
        for (uint32_t i = 0; i < width; ++i) {
            word.append(EncBit((v >> i) & 1));
        }
        return word;
    }

    bool Dec(const EncryptedBit& ct) { return algebra_->DecryptBit(sk_, ct); }

    uint64_t DecWord(const EncryptedWord& w) {
        uint64_t v = 0;
        for (size_t i = 0; i < w.Width(); ++i) {
            if (Dec(w.bits[i])) {
                v |= 1ULL << i;
            }
        }
        return v;
    }

    static std::unique_ptr<BinFheAlgebra> algebra_;
    static LWEPrivateKey sk_;
};

std::unique_ptr<BinFheAlgebra> ServerWireTest::algebra_;
LWEPrivateKey ServerWireTest::sk_;

// ============================================================================
// Status Mapping
// ============================================================================

TEST(ServerStatusTest, EveryErrorCodeMapsToStatus) {
    EXPECT_EQ(wire::statusFor(ErrorCode::INVALID_DIMENSIONS), drogon::k400BadRequest);
    EXPECT_EQ(wire::statusFor(ErrorCode::UNKNOWN_MAZE), drogon::k404NotFound);
    EXPECT_EQ(wire::statusFor(ErrorCode::EMPTY_PATH), drogon::k400BadRequest);
    EXPECT_EQ(wire::statusFor(ErrorCode::UNKNOWN_SOLUTION), drogon::k404NotFound);
    EXPECT_EQ(wire::statusFor(ErrorCode::ALREADY_VERIFIED), drogon::k409Conflict);
    EXPECT_EQ(wire::statusFor(ErrorCode::ALREADY_PENDING), drogon::k409Conflict);
    EXPECT_EQ(wire::statusFor(ErrorCode::UNKNOWN_REQUEST), drogon::k404NotFound);
    EXPECT_EQ(wire::statusFor(ErrorCode::INVALID_PROOF), drogon::k403Forbidden);
    EXPECT_EQ(wire::statusFor(ErrorCode::MALFORMED_CIPHERTEXT), drogon::k400BadRequest);
}

// ============================================================================
// Ciphertext Decoding
// ============================================================================

TEST_F(ServerWireTest, CoordinateRoundTrip) {
    Json::Value coord;
    coord["row"] = EncWord(5, 4);
    coord["col"] = EncWord(10, 4);

    EncryptedCoord decoded = wire::decodeCoord(coord);
    ASSERT_EQ(decoded.row.Width(), 4u);
    ASSERT_EQ(decoded.col.Width(), 4u);
    EXPECT_EQ(DecWord(decoded.row), 5u);
    EXPECT_EQ(DecWord(decoded.col), 10u);
}

TEST_F(ServerWireTest, GridRoundTrip) {
    const bool walls[2][3] = {{false, true, false}, {true, false, true}};
    Json::Value grid(Json::arrayValue);
    for (const auto& row : walls) {
        Json::Value cells(Json::arrayValue);
        for (bool wall : row) {
            cells.append(EncBit(wall));
        }
        grid.append(cells);
    }

    auto decoded = wire::decodeGrid(grid);
    ASSERT_EQ(decoded.size(), 2u);
    for (size_t r = 0; r < 2; ++r) {
        ASSERT_EQ(decoded[r].size(), 3u);
        for (size_t c = 0; c < 3; ++c) {
            EXPECT_EQ(Dec(decoded[r][c]), walls[r][c]) << "cell " << r << "," << c;
        }
    }
}

TEST_F(ServerWireTest, RejectsMalformedShapes) {
    Json::Value grid(Json::arrayValue);
    grid.append(EncBit(false));
    EXPECT_THROW(wire::decodeGrid(grid), std::invalid_argument);
    EXPECT_THROW(wire::decodeGrid(Json::Value("cells")), std::invalid_argument);

    Json::Value missingCol;
    missingCol["row"] = EncWord(1, 4);
    EXPECT_THROW(wire::decodeCoord(missingCol), std::invalid_argument);
    EXPECT_THROW(wire::decodeWord(EncBit(true)), std::invalid_argument);
    EXPECT_THROW(wire::decodePath(Json::Value(Json::objectValue)), std::invalid_argument);
}

TEST_F(ServerWireTest, RejectsUndecodableCiphertext) {
    EXPECT_THROW(wire::decodeBit(Json::Value(7)), std::invalid_argument);
    EXPECT_THROW(wire::decodeBit(Json::Value("bm90IGEgY2lwaGVydGV4dA==")), std::invalid_argument);
}

// ============================================================================
// Metadata
// ============================================================================

TEST(ServerMetadataTest, DecodesFields) {
    Json::Value v;
    v["difficulty"] = 255;
    v["description"] = "spiral";
    v["owner"] = "alice";
    MazeMetadata meta = wire::decodeMetadata(v);
    EXPECT_EQ(meta.difficulty, 255u);
    EXPECT_EQ(meta.description, "spiral");
    EXPECT_EQ(meta.owner, "alice");

    MazeMetadata empty = wire::decodeMetadata(Json::Value());
    EXPECT_EQ(empty.difficulty, 0u);
    EXPECT_TRUE(empty.owner.empty());
}

TEST(ServerMetadataTest, RejectsBadDifficulty) {
    auto withDifficulty = [](const Json::Value& d) {
        Json::Value v;
        v["difficulty"] = d;
        return v;
    };
    EXPECT_THROW(wire::decodeMetadata(withDifficulty("hard")), std::invalid_argument);
    EXPECT_THROW(wire::decodeMetadata(withDifficulty(-1)), std::invalid_argument);
    EXPECT_THROW(wire::decodeMetadata(withDifficulty(256)), std::invalid_argument);
    EXPECT_THROW(wire::decodeMetadata(withDifficulty(1.5)), std::invalid_argument);

    Json::Value owner;
    owner["owner"] = Json::Value(Json::arrayValue);
    EXPECT_THROW(wire::decodeMetadata(owner), std::invalid_argument);
    EXPECT_THROW(wire::decodeMetadata(Json::Value(3)), std::invalid_argument);
}

// ============================================================================
// Response Encoding
// ============================================================================

TEST(ServerResultTest, RevealedAtOnlyAfterReveal) {
    VerificationResult pending;
    pending.solution_id = 12;
    Json::Value out = wire::encodeResult(pending, VerificationState::REQUEST_PENDING);
    EXPECT_EQ(out["solution_id"].asUInt64(), 12u);
    EXPECT_EQ(out["state"].asString(), "pending");
    EXPECT_FALSE(out["is_revealed"].asBool());
    EXPECT_FALSE(out.isMember("revealed_at"));

    VerificationResult revealed;
    revealed.solution_id = 12;
    revealed.is_revealed = true;
    revealed.is_valid = true;
    revealed.revealed_at = Timestamp(std::chrono::seconds(1700000000));
    out = wire::encodeResult(revealed, VerificationState::REVEALED);
    EXPECT_EQ(out["state"].asString(), "revealed");
    EXPECT_TRUE(out["is_valid"].asBool());
    EXPECT_EQ(out["revealed_at"].asInt64(), 1700000000);
}
