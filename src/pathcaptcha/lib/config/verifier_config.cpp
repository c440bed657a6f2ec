// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2025, Lux Industries Inc

#include "config/verifier_config.h"
#include "algebra/binfhe_algebra.h"
#include <fstream>
#include <stdexcept>

namespace lux::pathcaptcha {

namespace {

constexpr uint32_t kMaxCoordinateBits = 16;
constexpr uint32_t kMaxOracleWorkers = 64;
// Ten years; keeps Clock arithmetic on pending requests in range
constexpr uint64_t kMaxPendingExpirySeconds = 10ULL * 365 * 24 * 60 * 60;

uint64_t ReadUnsigned(const Json::Value& json, const char* key, uint64_t fallback) {
    if (!json.isMember(key)) {
        return fallback;
    }
    const Json::Value& v = json[key];
    if (!v.isUInt64()) {
        throw std::invalid_argument(std::string("config: '") + key + "' must be a non-negative integer");
    }
    return v.asUInt64();
}

std::string ReadString(const Json::Value& json, const char* key, const std::string& fallback) {
    if (!json.isMember(key)) {
        return fallback;
    }
    const Json::Value& v = json[key];
    if (!v.isString()) {
        throw std::invalid_argument(std::string("config: '") + key + "' must be a string");
    }
    return v.asString();
}

bool ReadBool(const Json::Value& json, const char* key, bool fallback) {
    if (!json.isMember(key)) {
        return fallback;
    }
    const Json::Value& v = json[key];
    if (!v.isBool()) {
        throw std::invalid_argument(std::string("config: '") + key + "' must be a boolean");
    }
    return v.asBool();
}

} // anonymous namespace

VerifierConfig VerifierConfig::FromJson(const Json::Value& json) {
    if (!json.isObject()) {
        throw std::invalid_argument("config: top level must be a JSON object");
    }
    VerifierConfig cfg;
    cfg.security = ReadString(json, "security", cfg.security);
    cfg.method = ReadString(json, "method", cfg.method);

    uint64_t bits = ReadUnsigned(json, "coordinate_bits", cfg.coordinate_bits);
    if (bits > kMaxCoordinateBits) {
        throw std::invalid_argument("config: coordinate_bits must be in 1.." +
                                    std::to_string(kMaxCoordinateBits));
    }
    cfg.coordinate_bits = static_cast<uint32_t>(bits);

    cfg.max_grid_cells = ReadUnsigned(json, "max_grid_cells", cfg.max_grid_cells);
    cfg.single_flight = ReadBool(json, "single_flight", cfg.single_flight);
    cfg.pending_expiry_seconds = ReadUnsigned(json, "pending_expiry_seconds", cfg.pending_expiry_seconds);

    uint64_t workers = ReadUnsigned(json, "oracle_workers", cfg.oracle_workers);
    if (workers > kMaxOracleWorkers) {
        throw std::invalid_argument("config: oracle_workers must be at most " +
                                    std::to_string(kMaxOracleWorkers));
    }
    cfg.oracle_workers = static_cast<uint32_t>(workers);

    uint64_t port = ReadUnsigned(json, "port", cfg.port);
    if (port > 65535) {
        throw std::invalid_argument("config: port must be at most 65535");
    }
    cfg.port = static_cast<uint16_t>(port);

    cfg.log_level = ReadString(json, "log_level", cfg.log_level);

    cfg.Validate();
    return cfg;
}

VerifierConfig VerifierConfig::LoadFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("config: cannot open " + path);
    }
    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errors;
    if (!Json::parseFromStream(builder, in, &root, &errors)) {
        throw std::invalid_argument("config: " + path + ": " + errors);
    }
    return FromJson(root);
}

Json::Value VerifierConfig::ToJson() const {
    Json::Value json;
    json["security"] = security;
    json["method"] = method;
    json["coordinate_bits"] = coordinate_bits;
    json["max_grid_cells"] = static_cast<Json::UInt64>(max_grid_cells);
    json["single_flight"] = single_flight;
    json["pending_expiry_seconds"] = static_cast<Json::UInt64>(pending_expiry_seconds);
    json["oracle_workers"] = oracle_workers;
    json["port"] = port;
    json["log_level"] = log_level;
    return json;
}

void VerifierConfig::Validate() const {
    // Both throw std::invalid_argument on unknown names
    algebra::ParamSetFromName(security);
    algebra::MethodFromName(method);
    LogLevelFromName(log_level);

    if (coordinate_bits == 0 || coordinate_bits > kMaxCoordinateBits) {
        throw std::invalid_argument("config: coordinate_bits must be in 1.." +
                                    std::to_string(kMaxCoordinateBits));
    }
    if (max_grid_cells == 0) {
        throw std::invalid_argument("config: max_grid_cells must be positive");
    }
    if (pending_expiry_seconds > kMaxPendingExpirySeconds) {
        throw std::invalid_argument("config: pending_expiry_seconds must be at most " +
                                    std::to_string(kMaxPendingExpirySeconds));
    }
    if (oracle_workers == 0 || oracle_workers > kMaxOracleWorkers) {
        throw std::invalid_argument("config: oracle_workers must be in 1.." +
                                    std::to_string(kMaxOracleWorkers));
    }
    if (port == 0) {
        throw std::invalid_argument("config: port must be positive");
    }
}

MazeLimits VerifierConfig::ToLimits() const {
    MazeLimits limits;
    limits.coordinate_bits = coordinate_bits;
    limits.max_grid_cells = static_cast<size_t>(max_grid_cells);
    return limits;
}

verify::EngineOptions VerifierConfig::ToEngineOptions() const {
    verify::EngineOptions options;
    options.single_flight = single_flight;
    options.pending_expiry = std::chrono::seconds(pending_expiry_seconds);
    return options;
}

trantor::Logger::LogLevel LogLevelFromName(const std::string& name) {
    if (name == "TRACE") return trantor::Logger::kTrace;
    if (name == "DEBUG") return trantor::Logger::kDebug;
    if (name == "INFO") return trantor::Logger::kInfo;
    if (name == "WARN") return trantor::Logger::kWarn;
    if (name == "ERROR") return trantor::Logger::kError;
    throw std::invalid_argument("Unknown log level: " + name);
}

} // namespace lux::pathcaptcha
