// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2025, Lux Industries Inc
//
// Verifier configuration (JSON via jsoncpp)
//
// {
//   "security": "STD128",
//   "method": "GINX",
//   "coordinate_bits": 8,
//   "max_grid_cells": 4096,
//   "single_flight": true,
//   "pending_expiry_seconds": 0,
//   "oracle_workers": 1,
//   "port": 8080,
//   "log_level": "INFO"
// }

#ifndef PATHCAPTCHA_CONFIG_VERIFIER_CONFIG_H
#define PATHCAPTCHA_CONFIG_VERIFIER_CONFIG_H

#include "maze/maze_registry.h"
#include "verify/verification_engine.h"
#include <json/json.h>
#include <trantor/utils/Logger.h>
#include <cstdint>
#include <string>

namespace lux::pathcaptcha {

struct VerifierConfig {
    std::string security = "STD128";
    std::string method = "GINX";
    uint32_t coordinate_bits = 8;
    uint64_t max_grid_cells = 4096;
    bool single_flight = true;
    uint64_t pending_expiry_seconds = 0;
    uint32_t oracle_workers = 1;
    uint16_t port = 8080;
    std::string log_level = "INFO";

    /**
     * @brief Overlay the keys present in `json` on the defaults
     *
     * Unknown keys are ignored. The result is validated.
     * @throws std::invalid_argument on a wrong type or out-of-range value
     */
    static VerifierConfig FromJson(const Json::Value& json);

    /**
     * @throws std::runtime_error if the file cannot be read
     * @throws std::invalid_argument on malformed JSON or invalid values
     */
    static VerifierConfig LoadFile(const std::string& path);

    Json::Value ToJson() const;

    // @throws std::invalid_argument
    void Validate() const;

    MazeLimits ToLimits() const;
    verify::EngineOptions ToEngineOptions() const;
};

// "TRACE", "DEBUG", "INFO", "WARN", "ERROR"
trantor::Logger::LogLevel LogLevelFromName(const std::string& name);

} // namespace lux::pathcaptcha

#endif // PATHCAPTCHA_CONFIG_VERIFIER_CONFIG_H
