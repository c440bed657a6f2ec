// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2025, Lux Industries Inc
//
// Verifier configuration tests

#include "gtest/gtest.h"
#include "config/verifier_config.h"

#include <chrono>
#include <cstdio>
#include <fstream>
#include <stdexcept>

using namespace lux::pathcaptcha;

TEST(ConfigTest, Defaults) {
    VerifierConfig cfg;
    EXPECT_NO_THROW(cfg.Validate());
    EXPECT_EQ(cfg.security, "STD128");
    EXPECT_EQ(cfg.method, "GINX");
    EXPECT_EQ(cfg.coordinate_bits, 8u);
    EXPECT_TRUE(cfg.single_flight);
    EXPECT_EQ(cfg.pending_expiry_seconds, 0u);

    MazeLimits limits = cfg.ToLimits();
    EXPECT_EQ(limits.coordinate_bits, 8u);
    EXPECT_EQ(limits.MaxDimension(), 255u);
    EXPECT_EQ(limits.max_grid_cells, 4096u);
}

TEST(ConfigTest, JsonOverlaysDefaults) {
    Json::Value json;
    json["security"] = "TOY";
    json["coordinate_bits"] = 4;
    json["single_flight"] = false;
    json["pending_expiry_seconds"] = 90;
    json["log_level"] = "DEBUG";
    json["unrelated"] = "ignored";

    VerifierConfig cfg = VerifierConfig::FromJson(json);
    EXPECT_EQ(cfg.security, "TOY");
    EXPECT_EQ(cfg.method, "GINX");
    EXPECT_EQ(cfg.coordinate_bits, 4u);
    EXPECT_EQ(cfg.port, 8080);

    verify::EngineOptions options = cfg.ToEngineOptions();
    EXPECT_FALSE(options.single_flight);
    EXPECT_EQ(options.pending_expiry, std::chrono::seconds(90));
    EXPECT_EQ(LogLevelFromName(cfg.log_level), trantor::Logger::kDebug);
}

TEST(ConfigTest, RoundTripThroughJson) {
    VerifierConfig cfg;
    cfg.security = "STD128_LMKCDEY";
    cfg.method = "LMKCDEY";
    cfg.oracle_workers = 4;
    cfg.port = 9000;

    VerifierConfig back = VerifierConfig::FromJson(cfg.ToJson());
    EXPECT_EQ(back.security, cfg.security);
    EXPECT_EQ(back.method, cfg.method);
    EXPECT_EQ(back.oracle_workers, 4u);
    EXPECT_EQ(back.port, 9000);
}

TEST(ConfigTest, RejectsInvalidValues) {
    auto with = [](const char* key, const Json::Value& value) {
        Json::Value json(Json::objectValue);
        json[key] = value;
        return json;
    };

    EXPECT_THROW(VerifierConfig::FromJson(with("security", "STD1024")), std::invalid_argument);
    EXPECT_THROW(VerifierConfig::FromJson(with("method", "CGGI")), std::invalid_argument);
    EXPECT_THROW(VerifierConfig::FromJson(with("coordinate_bits", 0)), std::invalid_argument);
    EXPECT_THROW(VerifierConfig::FromJson(with("coordinate_bits", 17)), std::invalid_argument);
    EXPECT_THROW(VerifierConfig::FromJson(with("coordinate_bits", -1)), std::invalid_argument);
    EXPECT_THROW(VerifierConfig::FromJson(with("max_grid_cells", 0)), std::invalid_argument);
    EXPECT_THROW(VerifierConfig::FromJson(with("oracle_workers", 0)), std::invalid_argument);
    EXPECT_THROW(VerifierConfig::FromJson(with("pending_expiry_seconds", Json::UInt64(315360001))),
                 std::invalid_argument);
    EXPECT_THROW(VerifierConfig::FromJson(with("pending_expiry_seconds", Json::UInt64(10000000000000ULL))),
                 std::invalid_argument);
    EXPECT_THROW(VerifierConfig::FromJson(with("port", 70000)), std::invalid_argument);
    EXPECT_THROW(VerifierConfig::FromJson(with("single_flight", "yes")), std::invalid_argument);
    EXPECT_THROW(VerifierConfig::FromJson(with("log_level", "LOUD")), std::invalid_argument);
    EXPECT_THROW(VerifierConfig::FromJson(Json::Value(3)), std::invalid_argument);
}

TEST(ConfigTest, LongestPendingExpiryStillExpires) {
    Json::Value json(Json::objectValue);
    json["pending_expiry_seconds"] = Json::UInt64(315360000);
    VerifierConfig cfg = VerifierConfig::FromJson(json);
    auto expiry = cfg.ToEngineOptions().pending_expiry;
    EXPECT_EQ(expiry.count(), 315360000);
    // Must survive conversion to the clock's tick without wrapping negative
    EXPECT_GT(std::chrono::duration_cast<std::chrono::system_clock::duration>(expiry).count(), 0);
}

TEST(ConfigTest, LoadFile) {
    std::string path = ::testing::TempDir() + "pathcaptcha_config_test.json";
    {
        std::ofstream out(path);
        out << R"({ "security": "TOY", "coordinate_bits": 5, "port": 8181 })";
    }
    VerifierConfig cfg = VerifierConfig::LoadFile(path);
    EXPECT_EQ(cfg.security, "TOY");
    EXPECT_EQ(cfg.coordinate_bits, 5u);
    EXPECT_EQ(cfg.port, 8181);

    {
        std::ofstream out(path);
        out << "{ \"security\": ";
    }
    EXPECT_THROW(VerifierConfig::LoadFile(path), std::invalid_argument);
    std::remove(path.c_str());

    EXPECT_THROW(VerifierConfig::LoadFile(path + ".missing"), std::runtime_error);
}

TEST(ConfigTest, LogLevelNames) {
    EXPECT_EQ(LogLevelFromName("TRACE"), trantor::Logger::kTrace);
    EXPECT_EQ(LogLevelFromName("WARN"), trantor::Logger::kWarn);
    EXPECT_EQ(LogLevelFromName("ERROR"), trantor::Logger::kError);
    EXPECT_THROW(LogLevelFromName("info"), std::invalid_argument);
}
