// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2025, Lux Industries Inc

#include "maze/types.h"

namespace lux::pathcaptcha {

std::string VerificationStateName(VerificationState state) {
    switch (state) {
        case VerificationState::SUBMITTED: return "submitted";
        case VerificationState::REQUEST_PENDING: return "pending";
        case VerificationState::REVEALED: return "revealed";
        default: return "unknown";
    }
}

} // namespace lux::pathcaptcha
