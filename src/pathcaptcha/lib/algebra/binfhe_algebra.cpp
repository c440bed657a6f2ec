// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2025, Lux Industries Inc
//
// BinFHE Algebra Implementation

#include "algebra/binfhe_algebra.h"
#include "binfhecontext-ser.h"
#include <map>
#include <sstream>
#include <stdexcept>

using namespace lbcrypto;

namespace lux::pathcaptcha {
namespace algebra {

// ============================================================================
// Parameter Names
// ============================================================================

BINFHE_PARAMSET ParamSetFromName(const std::string& name) {
    static const std::map<std::string, BINFHE_PARAMSET> kParamSets = {
        {"TOY", TOY},
        {"MEDIUM", MEDIUM},
        {"STD128", STD128},
        {"STD128_AP", STD128_AP},
        {"STD128_LMKCDEY", STD128_LMKCDEY},
        {"STD128Q", STD128Q},
        {"STD128Q_LMKCDEY", STD128Q_LMKCDEY},
        {"STD192", STD192},
        {"STD192Q", STD192Q},
        {"STD256", STD256},
        {"STD256Q", STD256Q},
        {"LPF_STD128", LPF_STD128},
        {"LPF_STD128Q", LPF_STD128Q},
    };
    auto it = kParamSets.find(name);
    if (it == kParamSets.end()) {
        throw std::invalid_argument("Unknown BinFHE parameter set: " + name);
    }
    return it->second;
}

BINFHE_METHOD MethodFromName(const std::string& name) {
    if (name == "GINX") return GINX;
    if (name == "AP") return AP;
    if (name == "LMKCDEY") return LMKCDEY;
    throw std::invalid_argument("Unknown bootstrapping method: " + name);
}

// ============================================================================
// BinFheAlgebra
// ============================================================================

BinFheAlgebra::BinFheAlgebra(BINFHE_PARAMSET params, BINFHE_METHOD method) {
    cc_ = std::make_unique<BinFHEContext>();
    cc_->GenerateBinFHEContext(params, method);

    std::ostringstream oss;
    oss << "OpenFHE BinFHE (" << params << ", " << method << ")";
    params_name_ = oss.str();
}

BinFheAlgebra::~BinFheAlgebra() = default;

std::string BinFheAlgebra::Name() const {
    return params_name_;
}

bool BinFheAlgebra::IsReady() const {
    return cc_->GetRefreshKey() != nullptr;
}

EncryptedBit BinFheAlgebra::Gate(BINGATE gate, const EncryptedBit& a, const EncryptedBit& b) {
    if (a == nullptr || b == nullptr) {
        throw std::invalid_argument("BinFheAlgebra: null ciphertext");
    }
    // OpenFHE rejects the same ciphertext object on both inputs; refresh one
    // side so the gate sees independent ciphertexts.
    if (a == b) {
        auto fresh = cc_->Bootstrap(b);
        gates_ += 2;
        return cc_->EvalBinGate(gate, a, fresh);
    }
    ++gates_;
    return cc_->EvalBinGate(gate, a, b);
}

EncryptedBit BinFheAlgebra::And(const EncryptedBit& a, const EncryptedBit& b) {
    return Gate(AND, a, b);
}

EncryptedBit BinFheAlgebra::Or(const EncryptedBit& a, const EncryptedBit& b) {
    return Gate(OR, a, b);
}

EncryptedBit BinFheAlgebra::Xor(const EncryptedBit& a, const EncryptedBit& b) {
    return Gate(XOR, a, b);
}

EncryptedBit BinFheAlgebra::Xnor(const EncryptedBit& a, const EncryptedBit& b) {
    return Gate(XNOR, a, b);
}

EncryptedBit BinFheAlgebra::Not(const EncryptedBit& a) {
    if (a == nullptr) {
        throw std::invalid_argument("BinFheAlgebra: null ciphertext");
    }
    // Negation is linear, no bootstrap
    return cc_->EvalNOT(a);
}

EncryptedBit BinFheAlgebra::Constant(bool value) {
    return cc_->EvalConstant(value);
}

// ============================================================================
// Encryption / Decryption
// ============================================================================

void BinFheAlgebra::CheckWidth(uint64_t value, uint32_t width) {
    if (width == 0 || width > 64) {
        throw std::invalid_argument("Word width must be in [1, 64]");
    }
    if (width < 64 && (value >> width) != 0) {
        throw std::invalid_argument("Value does not fit in word width");
    }
}

EncryptedBit BinFheAlgebra::EncryptBit(const LWEPublicKey& pk, bool value) const {
    return cc_->Encrypt(pk, value ? 1 : 0);
}

EncryptedBit BinFheAlgebra::EncryptBit(const LWEPrivateKey& sk, bool value) const {
    return cc_->Encrypt(sk, value ? 1 : 0);
}

EncryptedWord BinFheAlgebra::EncryptWord(const LWEPublicKey& pk, uint64_t value, uint32_t width) const {
    CheckWidth(value, width);
    EncryptedWord word;
    word.bits.reserve(width);
    for (uint32_t i = 0; i < width; ++i) {
        word.bits.push_back(EncryptBit(pk, (value >> i) & 1ULL));
    }
    return word;
}

EncryptedWord BinFheAlgebra::EncryptWord(const LWEPrivateKey& sk, uint64_t value, uint32_t width) const {
    CheckWidth(value, width);
    EncryptedWord word;
    word.bits.reserve(width);
    for (uint32_t i = 0; i < width; ++i) {
        word.bits.push_back(EncryptBit(sk, (value >> i) & 1ULL));
    }
    return word;
}

bool BinFheAlgebra::DecryptBit(const LWEPrivateKey& sk, const EncryptedBit& ct) const {
    LWEPlaintext result;
    cc_->Decrypt(sk, ct, &result);
    return result != 0;
}

// ============================================================================
// Serialization
// ============================================================================

std::vector<uint8_t> BinFheAlgebra::SerializeBit(const EncryptedBit& ct) {
    std::stringstream ss;
    Serial::Serialize(ct, ss, SerType::BINARY);
    std::string str = ss.str();
    return std::vector<uint8_t>(str.begin(), str.end());
}

EncryptedBit BinFheAlgebra::DeserializeBit(const std::vector<uint8_t>& data) {
    std::string str(data.begin(), data.end());
    std::stringstream ss(str);
    LWECiphertext ct;
    try {
        Serial::Deserialize(ct, ss, SerType::BINARY);
    } catch (const std::exception& e) {
        throw std::invalid_argument(std::string("Invalid serialized ciphertext: ") + e.what());
    }
    if (ct == nullptr) {
        throw std::invalid_argument("Invalid serialized ciphertext");
    }
    return ct;
}

std::vector<uint8_t> BinFheAlgebra::SerializePublicKey(const LWEPublicKey& pk) {
    std::stringstream ss;
    Serial::Serialize(pk, ss, SerType::BINARY);
    std::string str = ss.str();
    return std::vector<uint8_t>(str.begin(), str.end());
}

} // namespace algebra
} // namespace lux::pathcaptcha
