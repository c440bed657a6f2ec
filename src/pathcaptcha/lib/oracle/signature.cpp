// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2025, Lux Industries Inc

#include "oracle/signature.h"
#include <openssl/err.h>
#include <openssl/evp.h>
#include <stdexcept>
#include <string>

namespace lux::pathcaptcha {
namespace oracle {

namespace {

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

struct PKeyCtxDeleter {
    void operator()(EVP_PKEY_CTX* ctx) const { EVP_PKEY_CTX_free(ctx); }
};
using PKeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, PKeyCtxDeleter>;

[[noreturn]] void ThrowSsl(const char* what) {
    unsigned long err = ERR_get_error();
    char buf[256] = {0};
    if (err != 0) {
        ERR_error_string_n(err, buf, sizeof(buf));
    }
    throw std::runtime_error(std::string(what) + " failed: " + buf);
}

} // anonymous namespace

void PKeyDeleter::operator()(EVP_PKEY* key) const {
    EVP_PKEY_free(key);
}

// ============================================================================
// Ed25519Signer
// ============================================================================

Ed25519Signer::Ed25519Signer() {
    PKeyCtxPtr ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr));
    if (!ctx) {
        ThrowSsl("EVP_PKEY_CTX_new_id");
    }
    if (EVP_PKEY_keygen_init(ctx.get()) != 1) {
        ThrowSsl("EVP_PKEY_keygen_init");
    }
    EVP_PKEY* raw = nullptr;
    if (EVP_PKEY_keygen(ctx.get(), &raw) != 1) {
        ThrowSsl("EVP_PKEY_keygen");
    }
    key_.reset(raw);
}

std::vector<uint8_t> Ed25519Signer::Sign(const Hash256& digest) const {
    MdCtxPtr md(EVP_MD_CTX_new());
    if (!md) {
        ThrowSsl("EVP_MD_CTX_new");
    }
    // Ed25519 is a one-shot scheme: no separate message digest
    if (EVP_DigestSignInit(md.get(), nullptr, nullptr, nullptr, key_.get()) != 1) {
        ThrowSsl("EVP_DigestSignInit");
    }
    std::vector<uint8_t> sig(kEd25519SignatureSize);
    size_t sig_len = sig.size();
    if (EVP_DigestSign(md.get(), sig.data(), &sig_len, digest.data(), digest.size()) != 1) {
        ThrowSsl("EVP_DigestSign");
    }
    sig.resize(sig_len);
    return sig;
}

DecryptionProof Ed25519Signer::SignDecryption(RequestId request_id, const Cleartexts& cleartexts) const {
    DecryptionProof proof;
    proof.signature = Sign(DecryptionDigest(request_id, cleartexts));
    return proof;
}

std::vector<uint8_t> Ed25519Signer::PublicKey() const {
    std::vector<uint8_t> pub(kEd25519PublicKeySize);
    size_t len = pub.size();
    if (EVP_PKEY_get_raw_public_key(key_.get(), pub.data(), &len) != 1) {
        ThrowSsl("EVP_PKEY_get_raw_public_key");
    }
    pub.resize(len);
    return pub;
}

// ============================================================================
// SignatureProofVerifier
// ============================================================================

SignatureProofVerifier::SignatureProofVerifier(const std::vector<uint8_t>& public_key)
    : public_key_(public_key) {
    if (public_key.size() != kEd25519PublicKeySize) {
        throw std::invalid_argument("Ed25519 public key must be 32 bytes, got " +
                                    std::to_string(public_key.size()));
    }
    key_.reset(EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr,
                                           public_key.data(), public_key.size()));
    if (!key_) {
        throw std::invalid_argument("Invalid Ed25519 public key");
    }
}

bool SignatureProofVerifier::Verify(
    RequestId request_id,
    const Cleartexts& cleartexts,
    const DecryptionProof& proof
) const {
    return VerifyDigest(DecryptionDigest(request_id, cleartexts), proof.signature);
}

bool SignatureProofVerifier::VerifyDigest(const Hash256& digest,
                                          const std::vector<uint8_t>& signature) const {
    if (signature.size() != kEd25519SignatureSize) {
        return false;
    }
    MdCtxPtr md(EVP_MD_CTX_new());
    if (!md) {
        ThrowSsl("EVP_MD_CTX_new");
    }
    if (EVP_DigestVerifyInit(md.get(), nullptr, nullptr, nullptr, key_.get()) != 1) {
        ThrowSsl("EVP_DigestVerifyInit");
    }
    int rc = EVP_DigestVerify(md.get(), signature.data(), signature.size(),
                              digest.data(), digest.size());
    if (rc != 1) {
        // Bad signatures leave an entry on the error queue
        ERR_clear_error();
        return false;
    }
    return true;
}

} // namespace oracle
} // namespace lux::pathcaptcha
