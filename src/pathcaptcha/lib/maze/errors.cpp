// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2025, Lux Industries Inc

#include "maze/errors.h"

namespace lux::pathcaptcha {

std::string ErrorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::INVALID_DIMENSIONS: return "InvalidDimensions";
        case ErrorCode::UNKNOWN_MAZE: return "UnknownMaze";
        case ErrorCode::EMPTY_PATH: return "EmptyPath";
        case ErrorCode::UNKNOWN_SOLUTION: return "UnknownSolution";
        case ErrorCode::ALREADY_VERIFIED: return "AlreadyVerified";
        case ErrorCode::ALREADY_PENDING: return "AlreadyPending";
        case ErrorCode::UNKNOWN_REQUEST: return "UnknownRequest";
        case ErrorCode::INVALID_PROOF: return "InvalidProof";
        case ErrorCode::MALFORMED_CIPHERTEXT: return "MalformedCiphertext";
        default: return "Unknown";
    }
}

ProtocolError::ProtocolError(ErrorCode code, const std::string& detail)
    : std::runtime_error(ErrorCodeName(code) + ": " + detail), code_(code) {}

} // namespace lux::pathcaptcha
