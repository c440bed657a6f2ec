// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2025, Lux Industries Inc
//
// Shared helpers for the PathCaptcha unit tests

#ifndef PATHCAPTCHA_UNITTEST_TEST_HELPERS_H
#define PATHCAPTCHA_UNITTEST_TEST_HELPERS_H

#include "maze/errors.h"
#include "maze/types.h"
#include "oracle/decryption_oracle.h"
#include <functional>
#include <string>
#include <utility>
#include <vector>

// Fails unless `stmt` throws ProtocolError with the given code
#define EXPECT_PROTOCOL_ERROR(stmt, code)                                   \
    do {                                                                    \
        try {                                                               \
            stmt;                                                           \
            ADD_FAILURE() << "Expected "                                    \
                          << ::lux::pathcaptcha::ErrorCodeName(code);       \
        } catch (const ::lux::pathcaptcha::ProtocolError& e) {              \
            EXPECT_EQ(e.Code(), code) << e.what();                          \
        }                                                                   \
    } while (0)

namespace lux::pathcaptcha {
namespace test_util {

using BitEncryptor = std::function<EncryptedBit(bool)>;
using Cell = std::pair<uint64_t, uint64_t>;

/**
 * @brief Builds encrypted mazes and paths from plaintext layouts
 *
 * Layout rows use '#' for a wall and '.' for an open cell.
 */
class MazeEncoder {
public:
    MazeEncoder(BitEncryptor encrypt, uint32_t bits)
        : encrypt_(std::move(encrypt)), bits_(bits) {}

    EncryptedWord Word(uint64_t value) const {
        EncryptedWord word;
        for (uint32_t i = 0; i < bits_; ++i) {
            word.bits.push_back(encrypt_(((value >> i) & 1ULL) != 0));
        }
        return word;
    }

    EncryptedCoord Coord(uint64_t row, uint64_t col) const {
        return EncryptedCoord{Word(row), Word(col)};
    }

    EncryptedCoord Coord(const Cell& cell) const {
        return Coord(cell.first, cell.second);
    }

    std::vector<std::vector<EncryptedBit>> Grid(const std::vector<std::string>& layout) const {
        std::vector<std::vector<EncryptedBit>> grid;
        for (const auto& line : layout) {
            std::vector<EncryptedBit> row;
            for (char ch : line) {
                row.push_back(encrypt_(ch == '#'));
            }
            grid.push_back(std::move(row));
        }
        return grid;
    }

    std::vector<EncryptedCoord> Path(const std::vector<Cell>& cells) const {
        std::vector<EncryptedCoord> path;
        for (const auto& cell : cells) {
            path.push_back(Coord(cell));
        }
        return path;
    }

    uint32_t Bits() const { return bits_; }

private:
    BitEncryptor encrypt_;
    uint32_t bits_;
};

/**
 * @brief Oracle wrapper that records responses instead of delivering them
 *
 * Lets a test replay, tamper with, or drop the oracle's answer.
 */
class CapturingOracle : public oracle::DecryptionOracle {
public:
    struct Response {
        RequestId request_id;
        oracle::Cleartexts cleartexts;
        oracle::DecryptionProof proof;
    };

    explicit CapturingOracle(oracle::DecryptionOracle& inner) : inner_(inner) {}

    RequestId Request(const std::vector<EncryptedBit>& ciphertexts,
                      oracle::DecryptionCallback) override {
        return inner_.Request(ciphertexts,
            [this](RequestId id, const oracle::Cleartexts& cleartexts,
                   const oracle::DecryptionProof& proof) {
                responses.push_back(Response{id, cleartexts, proof});
            });
    }

    bool IsAvailable() const override { return inner_.IsAvailable(); }

    std::vector<Response> responses;

private:
    oracle::DecryptionOracle& inner_;
};

} // namespace test_util
} // namespace lux::pathcaptcha

#endif // PATHCAPTCHA_UNITTEST_TEST_HELPERS_H
