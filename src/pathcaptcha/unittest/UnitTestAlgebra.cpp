// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2025, Lux Industries Inc
//
// Ciphertext Algebra Tests
//
// Gate truth tables and the word-level helpers the path circuit is built
// from, evaluated on real BinFHE ciphertexts (TOY parameters).

#include "gtest/gtest.h"
#include "algebra/binfhe_algebra.h"

#include <memory>
#include <stdexcept>

using namespace lbcrypto;
using namespace lux::pathcaptcha;
using namespace lux::pathcaptcha::algebra;

// ============================================================================
// Test Fixture
// ============================================================================

class AlgebraTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() {
        // TOY parameters keep bootstrapping fast; production uses STD128
        algebra_ = std::make_unique<BinFheAlgebra>(TOY, GINX);
        sk_ = algebra_->GetContext().KeyGen();
        algebra_->GetContext().BTKeyGen(sk_);
    }

    static void TearDownTestSuite() {
        algebra_.reset();
        sk_.reset();
    }

    EncryptedBit Enc(bool v) { return algebra_->EncryptBit(sk_, v); }
    bool Dec(const EncryptedBit& ct) { return algebra_->DecryptBit(sk_, ct); }

    EncryptedWord EncWord(uint64_t v, uint32_t width) {
        return algebra_->EncryptWord(sk_, v, width);
    }

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

std::unique_ptr<BinFheAlgebra> AlgebraTest::algebra_;
LWEPrivateKey AlgebraTest::sk_;

// ============================================================================
// Gates
// ============================================================================

TEST_F(AlgebraTest, GateTruthTables) {
    for (int a = 0; a <= 1; ++a) {
        for (int b = 0; b <= 1; ++b) {
            auto ca = Enc(a);
            auto cb = Enc(b);
            EXPECT_EQ(Dec(algebra_->And(ca, cb)), static_cast<bool>(a & b)) << a << " AND " << b;
            EXPECT_EQ(Dec(algebra_->Or(ca, cb)), static_cast<bool>(a | b)) << a << " OR " << b;
            EXPECT_EQ(Dec(algebra_->Xor(ca, cb)), static_cast<bool>(a ^ b)) << a << " XOR " << b;
            EXPECT_EQ(Dec(algebra_->Xnor(ca, cb)), a == b) << a << " XNOR " << b;
        }
        EXPECT_EQ(Dec(algebra_->Not(Enc(a))), a == 0);
    }
}

TEST_F(AlgebraTest, SameCiphertextOnBothInputs) {
    auto one = Enc(true);
    EXPECT_TRUE(Dec(algebra_->And(one, one)));
    EXPECT_FALSE(Dec(algebra_->Xor(one, one)));
    EXPECT_TRUE(Dec(algebra_->Xnor(one, one)));
}

TEST_F(AlgebraTest, ConstantsMixWithCiphertexts) {
    EXPECT_TRUE(Dec(algebra_->Constant(true)));
    EXPECT_FALSE(Dec(algebra_->Constant(false)));
    EXPECT_TRUE(Dec(algebra_->And(algebra_->Constant(true), Enc(true))));
    EXPECT_FALSE(Dec(algebra_->Or(algebra_->Constant(false), Enc(false))));
}

TEST_F(AlgebraTest, GateCountTracksBootstraps) {
    uint64_t before = algebra_->GateCount();
    algebra_->Not(Enc(true));
    EXPECT_EQ(algebra_->GateCount(), before);

    algebra_->And(Enc(true), Enc(false));
    EXPECT_EQ(algebra_->GateCount(), before + 1);
}

TEST_F(AlgebraTest, NullCiphertextRejected) {
    EXPECT_THROW(algebra_->And(Enc(true), nullptr), std::invalid_argument);
    EXPECT_THROW(algebra_->Not(nullptr), std::invalid_argument);
}

// ============================================================================
// Reductions
// ============================================================================

TEST_F(AlgebraTest, Reductions) {
    EXPECT_TRUE(Dec(algebra_->AndAll({})));
    EXPECT_FALSE(Dec(algebra_->OrAll({})));

    EXPECT_TRUE(Dec(algebra_->AndAll({Enc(true), Enc(true), Enc(true)})));
    EXPECT_FALSE(Dec(algebra_->AndAll({Enc(true), Enc(false), Enc(true)})));
    EXPECT_TRUE(Dec(algebra_->OrAll({Enc(false), Enc(false), Enc(true)})));
    EXPECT_FALSE(Dec(algebra_->OrAll({Enc(false), Enc(false)})));
}

// ============================================================================
// Word Operations
// ============================================================================

TEST_F(AlgebraTest, EqualityOfWords) {
    EXPECT_TRUE(Dec(algebra_->Eq(EncWord(5, 3), EncWord(5, 3))));
    EXPECT_FALSE(Dec(algebra_->Eq(EncWord(5, 3), EncWord(4, 3))));
    EXPECT_FALSE(Dec(algebra_->Eq(EncWord(0, 3), EncWord(7, 3))));
}

TEST_F(AlgebraTest, EqualityAgainstPublicConstant) {
    auto word = EncWord(5, 3);
    for (uint64_t v = 0; v < 8; ++v) {
        EXPECT_EQ(Dec(algebra_->EqScalar(word, v)), v == 5) << "value " << v;
    }
    // 13 = 0b1101 is 5 modulo 8 but not representable in 3 bits
    EXPECT_FALSE(Dec(algebra_->EqScalar(word, 13)));
}

TEST_F(AlgebraTest, SubtractionWrapsModuloWidth) {
    EXPECT_EQ(DecWord(algebra_->Sub(EncWord(5, 3), EncWord(2, 3))), 3u);
    EXPECT_EQ(DecWord(algebra_->Sub(EncWord(2, 3), EncWord(3, 3))), 7u);
    EXPECT_EQ(DecWord(algebra_->Sub(EncWord(0, 3), EncWord(7, 3))), 1u);
    EXPECT_EQ(DecWord(algebra_->Sub(EncWord(4, 3), EncWord(4, 3))), 0u);
}

TEST_F(AlgebraTest, SubtractionSingleBit) {
    EXPECT_EQ(DecWord(algebra_->Sub(EncWord(1, 1), EncWord(0, 1))), 1u);
    EXPECT_EQ(DecWord(algebra_->Sub(EncWord(0, 1), EncWord(1, 1))), 1u);
}

TEST_F(AlgebraTest, ZeroAndUnitDeltas) {
    for (uint64_t d = 0; d < 8; ++d) {
        auto word = EncWord(d, 3);
        EXPECT_EQ(Dec(algebra_->IsZero(word)), d == 0) << "d = " << d;
        EXPECT_EQ(Dec(algebra_->IsUnit(word)), d == 1 || d == 7) << "d = " << d;
    }
}

TEST_F(AlgebraTest, WidthMismatchRejected) {
    EXPECT_THROW(algebra_->Eq(EncWord(1, 2), EncWord(1, 3)), std::invalid_argument);
    EXPECT_THROW(algebra_->Sub(EncWord(1, 2), EncWord(1, 3)), std::invalid_argument);
    EXPECT_THROW(algebra_->IsZero(EncryptedWord{}), std::invalid_argument);
}

TEST_F(AlgebraTest, EncryptWordChecksWidth) {
    EXPECT_THROW(EncWord(8, 3), std::invalid_argument);
    EXPECT_THROW(EncWord(0, 0), std::invalid_argument);
    EXPECT_EQ(EncWord(6, 3).Width(), 3u);
}

// ============================================================================
// Serialization
// ============================================================================

TEST_F(AlgebraTest, SerializedCiphertextDecryptsTheSame) {
    auto ct = Enc(true);
    auto bytes = BinFheAlgebra::SerializeBit(ct);
    ASSERT_FALSE(bytes.empty());

    auto restored = BinFheAlgebra::DeserializeBit(bytes);
    EXPECT_TRUE(Dec(restored));
    EXPECT_FALSE(Dec(algebra_->Not(restored)));
}

TEST_F(AlgebraTest, GarbageCiphertextRejected) {
    std::vector<uint8_t> truncated;
    EXPECT_THROW(BinFheAlgebra::DeserializeBit(truncated), std::invalid_argument);
}

// ============================================================================
// Parameter Names
// ============================================================================

TEST(AlgebraParamNames, KnownAndUnknown) {
    EXPECT_EQ(ParamSetFromName("TOY"), TOY);
    EXPECT_EQ(ParamSetFromName("STD128"), STD128);
    EXPECT_EQ(MethodFromName("GINX"), GINX);
    EXPECT_EQ(MethodFromName("LMKCDEY"), LMKCDEY);
    EXPECT_THROW(ParamSetFromName("STD512"), std::invalid_argument);
    EXPECT_THROW(MethodFromName("CGGI"), std::invalid_argument);
}
