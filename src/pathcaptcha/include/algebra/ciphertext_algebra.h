// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2025, Lux Industries Inc
//
// Ciphertext Algebra - Seam between the path verifier and the FHE backend
//
// The verifier only composes ciphertexts; it never decrypts them. Everything it
// needs is expressed here as boolean gates over encrypted bits plus a handful
// of word-level helpers built from those gates:
// - Equality (word == word, word == public constant)
// - Subtraction modulo 2^width (ripple borrow)
// - Zero / +-1 tests on a difference
// - AND / OR reductions
//
// A backend implements the gates. The word helpers are shared by all backends.

#ifndef PATHCAPTCHA_ALGEBRA_CIPHERTEXT_ALGEBRA_H
#define PATHCAPTCHA_ALGEBRA_CIPHERTEXT_ALGEBRA_H

#include "lwe-ciphertext.h"
#include <cstdint>
#include <string>
#include <vector>

namespace lux::pathcaptcha {
namespace algebra {

// One encrypted boolean
using EncryptedBit = lbcrypto::LWECiphertext;

// ============================================================================
// Encrypted Word
// ============================================================================

/**
 * @brief Unsigned integer encrypted bit by bit
 *
 * bits[0] is the least significant bit. Width is fixed by the producer and
 * is public.
 */
struct EncryptedWord {
    std::vector<EncryptedBit> bits;

    size_t Width() const { return bits.size(); }
    bool IsWellFormed() const;
};

// ============================================================================
// Algebra Interface - The Seam
// ============================================================================

class CiphertextAlgebra {
public:
    virtual ~CiphertextAlgebra() = default;

    // ========================================================================
    // Backend Info
    // ========================================================================

    virtual std::string Name() const = 0;

    // True once evaluation keys are loaded and gates can be evaluated
    virtual bool IsReady() const = 0;

    // Bootstrapped gates evaluated since construction (NOT is free)
    virtual uint64_t GateCount() const = 0;

    // ========================================================================
    // Boolean Gates
    // ========================================================================

    virtual EncryptedBit And(const EncryptedBit& a, const EncryptedBit& b) = 0;
    virtual EncryptedBit Or(const EncryptedBit& a, const EncryptedBit& b) = 0;
    virtual EncryptedBit Xor(const EncryptedBit& a, const EncryptedBit& b) = 0;
    virtual EncryptedBit Xnor(const EncryptedBit& a, const EncryptedBit& b) = 0;
    virtual EncryptedBit Not(const EncryptedBit& a) = 0;

    /**
     * @brief Inject a public constant as a (trivial) ciphertext
     */
    virtual EncryptedBit Constant(bool value) = 0;

    // ========================================================================
    // Reductions
    // ========================================================================

    /**
     * @brief AND of all inputs; encrypted true for an empty list
     */
    EncryptedBit AndAll(const std::vector<EncryptedBit>& bits);

    /**
     * @brief OR of all inputs; encrypted false for an empty list
     */
    EncryptedBit OrAll(const std::vector<EncryptedBit>& bits);

    // ========================================================================
    // Word Operations
    // ========================================================================

    /**
     * @brief Encrypted equality of two words of the same width
     */
    EncryptedBit Eq(const EncryptedWord& a, const EncryptedWord& b);

    /**
     * @brief Encrypted equality against a public constant
     *
     * Costs width - 1 gates (plus NOTs); the constant never becomes a
     * ciphertext.
     */
    EncryptedBit EqScalar(const EncryptedWord& a, uint64_t value);

    /**
     * @brief a - b modulo 2^width
     */
    EncryptedWord Sub(const EncryptedWord& a, const EncryptedWord& b);

    /**
     * @brief Encrypted 1 if every bit of d is zero
     */
    EncryptedBit IsZero(const EncryptedWord& d);

    /**
     * @brief Encrypted 1 if d is +1 or -1 modulo 2^width
     */
    EncryptedBit IsUnit(const EncryptedWord& d);

private:
    static void CheckSameWidth(const EncryptedWord& a, const EncryptedWord& b);
};

} // namespace algebra
} // namespace lux::pathcaptcha

#endif // PATHCAPTCHA_ALGEBRA_CIPHERTEXT_ALGEBRA_H
