// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2025, Lux Industries Inc
//
// Protocol errors raised by the registries, the engine and the result store

#ifndef PATHCAPTCHA_MAZE_ERRORS_H
#define PATHCAPTCHA_MAZE_ERRORS_H

#include <cstdint>
#include <stdexcept>
#include <string>

namespace lux::pathcaptcha {

enum class ErrorCode : uint8_t {
    INVALID_DIMENSIONS = 1,     // Empty, ragged or oversized grid
    UNKNOWN_MAZE = 2,
    EMPTY_PATH = 3,
    UNKNOWN_SOLUTION = 4,
    ALREADY_VERIFIED = 5,       // Result already revealed
    ALREADY_PENDING = 6,        // Single-flight: a request is outstanding
    UNKNOWN_REQUEST = 7,        // Never issued, or abandoned
    INVALID_PROOF = 8,          // Oracle payload failed authentication
    MALFORMED_CIPHERTEXT = 9,   // Null ciphertext or wrong word width
};

std::string ErrorCodeName(ErrorCode code);

/**
 * @brief Synchronous failure of a protocol operation
 *
 * Thrown before any state is modified; the caller decides whether to retry.
 */
class ProtocolError : public std::runtime_error {
public:
    ProtocolError(ErrorCode code, const std::string& detail);

    ErrorCode Code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

} // namespace lux::pathcaptcha

#endif // PATHCAPTCHA_MAZE_ERRORS_H
