// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2025, Lux Industries Inc
//
// Word-level operations composed from backend gates

#include "algebra/ciphertext_algebra.h"
#include <stdexcept>

namespace lux::pathcaptcha {
namespace algebra {

bool EncryptedWord::IsWellFormed() const {
    if (bits.empty()) {
        return false;
    }
    for (const auto& bit : bits) {
        if (bit == nullptr) {
            return false;
        }
    }
    return true;
}

void CiphertextAlgebra::CheckSameWidth(const EncryptedWord& a, const EncryptedWord& b) {
    if (a.Width() == 0 || a.Width() != b.Width()) {
        throw std::invalid_argument("EncryptedWord widths must match and be non-zero");
    }
}

// ============================================================================
// Reductions
// ============================================================================

EncryptedBit CiphertextAlgebra::AndAll(const std::vector<EncryptedBit>& bits) {
    if (bits.empty()) {
        return Constant(true);
    }
    EncryptedBit acc = bits[0];
    for (size_t i = 1; i < bits.size(); ++i) {
        acc = And(acc, bits[i]);
    }
    return acc;
}

EncryptedBit CiphertextAlgebra::OrAll(const std::vector<EncryptedBit>& bits) {
    if (bits.empty()) {
        return Constant(false);
    }
    EncryptedBit acc = bits[0];
    for (size_t i = 1; i < bits.size(); ++i) {
        acc = Or(acc, bits[i]);
    }
    return acc;
}

// ============================================================================
// Word Operations
// ============================================================================

EncryptedBit CiphertextAlgebra::Eq(const EncryptedWord& a, const EncryptedWord& b) {
    CheckSameWidth(a, b);

    std::vector<EncryptedBit> same;
    same.reserve(a.Width());
    for (size_t i = 0; i < a.Width(); ++i) {
        same.push_back(Xnor(a.bits[i], b.bits[i]));
    }
    return AndAll(same);
}

EncryptedBit CiphertextAlgebra::EqScalar(const EncryptedWord& a, uint64_t value) {
    if (a.Width() == 0) {
        throw std::invalid_argument("EncryptedWord width must be non-zero");
    }
    if (a.Width() < 64 && (value >> a.Width()) != 0) {
        // Not representable in this width
        return Constant(false);
    }

    std::vector<EncryptedBit> literals;
    literals.reserve(a.Width());
    for (size_t i = 0; i < a.Width(); ++i) {
        bool set = i < 64 && ((value >> i) & 1ULL);
        literals.push_back(set ? a.bits[i] : Not(a.bits[i]));
    }
    return AndAll(literals);
}

EncryptedWord CiphertextAlgebra::Sub(const EncryptedWord& a, const EncryptedWord& b) {
    CheckSameWidth(a, b);

    // diff_i   = a_i ^ b_i ^ borrow_i
    // borrow'  = (!a_i & b_i) | (!(a_i ^ b_i) & borrow_i)
    EncryptedWord diff;
    diff.bits.reserve(a.Width());

    EncryptedBit half = Xor(a.bits[0], b.bits[0]);
    diff.bits.push_back(half);
    if (a.Width() == 1) {
        return diff;
    }
    EncryptedBit borrow = And(Not(a.bits[0]), b.bits[0]);

    for (size_t i = 1; i < a.Width(); ++i) {
        half = Xor(a.bits[i], b.bits[i]);
        diff.bits.push_back(Xor(half, borrow));
        if (i + 1 < a.Width()) {
            EncryptedBit generate = And(Not(a.bits[i]), b.bits[i]);
            EncryptedBit propagate = And(Not(half), borrow);
            borrow = Or(generate, propagate);
        }
    }
    return diff;
}

EncryptedBit CiphertextAlgebra::IsZero(const EncryptedWord& d) {
    if (d.Width() == 0) {
        throw std::invalid_argument("EncryptedWord width must be non-zero");
    }
    std::vector<EncryptedBit> cleared;
    cleared.reserve(d.Width());
    for (const auto& bit : d.bits) {
        cleared.push_back(Not(bit));
    }
    return AndAll(cleared);
}

EncryptedBit CiphertextAlgebra::IsUnit(const EncryptedWord& d) {
    if (d.Width() == 0) {
        throw std::invalid_argument("EncryptedWord width must be non-zero");
    }
    // +1 is 0...01 and -1 is 1...11: both have the low bit set and a uniform
    // high part.
    if (d.Width() == 1) {
        return d.bits[0];
    }

    std::vector<EncryptedBit> high_clear;
    std::vector<EncryptedBit> high_set;
    for (size_t i = 1; i < d.Width(); ++i) {
        high_clear.push_back(Not(d.bits[i]));
        high_set.push_back(d.bits[i]);
    }
    EncryptedBit uniform = Or(AndAll(high_clear), AndAll(high_set));
    return And(d.bits[0], uniform);
}

} // namespace algebra
} // namespace lux::pathcaptcha
