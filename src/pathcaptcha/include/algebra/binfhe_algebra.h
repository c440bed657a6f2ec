// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2025, Lux Industries Inc
//
// BinFHE Algebra - CiphertextAlgebra backed by OpenFHE FHEW/TFHE gates
//
// Every gate is one bootstrapped EvalBinGate call. The context must hold a
// bootstrapping key (BTKeyGen) before gates are evaluated; the secret key
// itself never needs to live next to the evaluator.
//
// Also carries the client-side helpers used by ciphertext producers:
// encryption of bits and words, and binary (de)serialization.

#ifndef PATHCAPTCHA_ALGEBRA_BINFHE_ALGEBRA_H
#define PATHCAPTCHA_ALGEBRA_BINFHE_ALGEBRA_H

#include "algebra/ciphertext_algebra.h"
#include "binfhecontext.h"
#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace lux::pathcaptcha {
namespace algebra {

class BinFheAlgebra : public CiphertextAlgebra {
public:
    explicit BinFheAlgebra(
        lbcrypto::BINFHE_PARAMSET params = lbcrypto::STD128,
        lbcrypto::BINFHE_METHOD method = lbcrypto::GINX
    );
    ~BinFheAlgebra() override;

    // Non-copyable (owns the context and its evaluation keys)
    BinFheAlgebra(const BinFheAlgebra&) = delete;
    BinFheAlgebra& operator=(const BinFheAlgebra&) = delete;

    // ========================================================================
    // CiphertextAlgebra
    // ========================================================================

    std::string Name() const override;
    bool IsReady() const override;
    uint64_t GateCount() const override { return gates_.load(); }

    EncryptedBit And(const EncryptedBit& a, const EncryptedBit& b) override;
    EncryptedBit Or(const EncryptedBit& a, const EncryptedBit& b) override;
    EncryptedBit Xor(const EncryptedBit& a, const EncryptedBit& b) override;
    EncryptedBit Xnor(const EncryptedBit& a, const EncryptedBit& b) override;
    EncryptedBit Not(const EncryptedBit& a) override;
    EncryptedBit Constant(bool value) override;

    // ========================================================================
    // Client-side Encryption
    // ========================================================================

    /**
     * @brief Encrypt a bit with the public key
     */
    EncryptedBit EncryptBit(const lbcrypto::LWEPublicKey& pk, bool value) const;

    /**
     * @brief Encrypt a bit with a secret key (key owner / tests)
     */
    EncryptedBit EncryptBit(const lbcrypto::LWEPrivateKey& sk, bool value) const;

    /**
     * @brief Encrypt an unsigned value as `width` little-endian bits
     * @throws std::invalid_argument if value does not fit in width
     */
    EncryptedWord EncryptWord(const lbcrypto::LWEPublicKey& pk, uint64_t value, uint32_t width) const;
    EncryptedWord EncryptWord(const lbcrypto::LWEPrivateKey& sk, uint64_t value, uint32_t width) const;

    /**
     * @brief Decrypt a bit (key owner only)
     */
    bool DecryptBit(const lbcrypto::LWEPrivateKey& sk, const EncryptedBit& ct) const;

    // ========================================================================
    // Serialization
    // ========================================================================

    static std::vector<uint8_t> SerializeBit(const EncryptedBit& ct);
    static EncryptedBit DeserializeBit(const std::vector<uint8_t>& data);

    static std::vector<uint8_t> SerializePublicKey(const lbcrypto::LWEPublicKey& pk);

    // ========================================================================
    // Accessors
    // ========================================================================

    lbcrypto::BinFHEContext& GetContext() { return *cc_; }
    const lbcrypto::BinFHEContext& GetContext() const { return *cc_; }

private:
    EncryptedBit Gate(lbcrypto::BINGATE gate, const EncryptedBit& a, const EncryptedBit& b);

    static void CheckWidth(uint64_t value, uint32_t width);

    std::unique_ptr<lbcrypto::BinFHEContext> cc_;
    std::string params_name_;
    std::atomic<uint64_t> gates_{0};
};

// Parameter names as accepted in configuration ("STD128", "TOY", ...)
lbcrypto::BINFHE_PARAMSET ParamSetFromName(const std::string& name);
lbcrypto::BINFHE_METHOD MethodFromName(const std::string& name);

} // namespace algebra
} // namespace lux::pathcaptcha

#endif // PATHCAPTCHA_ALGEBRA_BINFHE_ALGEBRA_H
