// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2025, Lux Industries Inc
//
// Decryption transcript and Ed25519 proof tests

#include "gtest/gtest.h"
#include "oracle/signature.h"
#include "oracle/transcript.h"

#include <stdexcept>

using namespace lux::pathcaptcha;
using namespace lux::pathcaptcha::oracle;

// ============================================================================
// Hash Utilities
// ============================================================================

TEST(TranscriptTest, Sha3KnownAnswer) {
    // SHA3-256("abc")
    Hash256 h = hash::SHA3_256(std::vector<uint8_t>{'a', 'b', 'c'});
    EXPECT_EQ(HashToHex(h), "3a985da74fe225b2045c172d6bd390bd855f086e3e9d525b46bfe24511431532");
}

// ============================================================================
// Transcript Builder
// ============================================================================

TEST(TranscriptTest, LabelSeparatesTranscripts) {
    TranscriptBuilder a("PathCaptcha.A");
    TranscriptBuilder b("PathCaptcha.B");
    EXPECT_NE(a.Digest(), b.Digest());
}

TEST(TranscriptTest, TagsSeparateIdenticalPayloads) {
    TranscriptBuilder a(kDecryptionLabel);
    TranscriptBuilder b(kDecryptionLabel);
    a.AppendU64(DomainTag::REQUEST_ID, 7);
    b.AppendU64(DomainTag::CLEARTEXT, 7);
    EXPECT_NE(a.Digest(), b.Digest());
}

TEST(TranscriptTest, DecryptionDigestBindsEveryField) {
    Hash256 base = DecryptionDigest(1, {1});
    EXPECT_EQ(base, DecryptionDigest(1, {1}));
    EXPECT_NE(base, DecryptionDigest(2, {1}));
    EXPECT_NE(base, DecryptionDigest(1, {0}));
    EXPECT_NE(base, DecryptionDigest(1, {1, 1}));
    EXPECT_NE(base, DecryptionDigest(1, {}));
}

// ============================================================================
// Ed25519 Proofs
// ============================================================================

TEST(SignatureTest, SignedDecryptionVerifies) {
    Ed25519Signer signer;
    SignatureProofVerifier verifier(signer.PublicKey());

    DecryptionProof proof = signer.SignDecryption(42, {1});
    EXPECT_EQ(proof.signature.size(), kEd25519SignatureSize);
    EXPECT_TRUE(verifier.Verify(42, {1}, proof));
}

TEST(SignatureTest, TamperedPayloadFails) {
    Ed25519Signer signer;
    SignatureProofVerifier verifier(signer.PublicKey());
    DecryptionProof proof = signer.SignDecryption(42, {1});

    EXPECT_FALSE(verifier.Verify(42, {0}, proof));
    EXPECT_FALSE(verifier.Verify(43, {1}, proof));

    DecryptionProof flipped = proof;
    flipped.signature[0] ^= 0x80;
    EXPECT_FALSE(verifier.Verify(42, {1}, flipped));

    DecryptionProof truncated = proof;
    truncated.signature.pop_back();
    EXPECT_FALSE(verifier.Verify(42, {1}, truncated));

    EXPECT_FALSE(verifier.Verify(42, {1}, DecryptionProof{}));
}

TEST(SignatureTest, OtherKeyFails) {
    Ed25519Signer signer;
    Ed25519Signer impostor;
    SignatureProofVerifier verifier(signer.PublicKey());

    EXPECT_FALSE(verifier.Verify(5, {0}, impostor.SignDecryption(5, {0})));
}

TEST(SignatureTest, PublicKeyShape) {
    Ed25519Signer signer;
    auto pub = signer.PublicKey();
    EXPECT_EQ(pub.size(), kEd25519PublicKeySize);

    Ed25519Signer other;
    EXPECT_NE(other.PublicKey(), pub);

    std::vector<uint8_t> short_key(31, 0);
    EXPECT_THROW(SignatureProofVerifier bad(short_key), std::invalid_argument);
}
