// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2025, Lux Industries Inc
//
//  PathCaptcha HTTP Server
//
//  Verifies encrypted maze solutions without decrypting them. Only the
//  single-bit verdict is ever revealed, through the decryption oracle.
//
//  Run:
//    ./pathcaptcha_server --config verifier.json --port 8080
//
//  Endpoints:
//    GET  /health                      - Health check
//    GET  /v1/status                   - Availability and statistics
//    GET  /v1/keys/public              - Encryption and verification keys
//    POST /v1/mazes                    - Register encrypted maze
//    GET  /v1/mazes/{id}               - Maze summary
//    GET  /v1/mazes/{id}/solutions     - Solutions for a maze
//    POST /v1/solutions                - Submit encrypted path
//    POST /v1/solutions/{id}/verify    - Evaluate circuit, request reveal
//    POST /v1/solutions/{id}/abandon   - Give up pending requests
//    GET  /v1/solutions/{id}/result    - Verification result
//    POST /v1/oracle/callback          - Oracle response delivery

#include <drogon/drogon.h>
#include "maze_controller.h"

#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>

using namespace drogon;
using pathcaptcha_server::VerifierManager;

int main(int argc, char* argv[])
{
    std::string configPath;
    std::string portArg;

    // Parse command line args
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        } else if (arg == "--port" && i + 1 < argc) {
            portArg = argv[++i];
        } else if (arg == "--help") {
            std::cout << "PathCaptcha Server\n"
                      << "Usage: pathcaptcha_server [options]\n"
                      << "Options:\n"
                      << "  --config PATH  JSON configuration file\n"
                      << "  --port PORT    Listen port (overrides config, default: 8080)\n"
                      << "  --help         Show this help\n";
            return 0;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            return 1;
        }
    }

    lux::pathcaptcha::VerifierConfig config;
    try {
        if (!configPath.empty()) {
            config = lux::pathcaptcha::VerifierConfig::LoadFile(configPath);
        }
        if (!portArg.empty()) {
            size_t consumed = 0;
            int port = std::stoi(portArg, &consumed);
            if (consumed != portArg.size() || port <= 0 || port > 65535) {
                throw std::invalid_argument("--port must be in 1..65535");
            }
            config.port = static_cast<uint16_t>(port);
        }
        trantor::Logger::setLogLevel(lux::pathcaptcha::LogLevelFromName(config.log_level));
        VerifierManager::instance().init(config);
    } catch (const std::exception& e) {
        std::cerr << "Startup failed: " << e.what() << "\n";
        return 1;
    }

    LOG_INFO << "Starting PathCaptcha Server on port " << config.port;
    LOG_INFO << "Endpoints:";
    LOG_INFO << "  GET  /health, /v1/status, /v1/keys/public";
    LOG_INFO << "  POST /v1/mazes";
    LOG_INFO << "  GET  /v1/mazes/{id}, /v1/mazes/{id}/solutions";
    LOG_INFO << "  POST /v1/solutions, /v1/solutions/{id}/{verify,abandon}";
    LOG_INFO << "  GET  /v1/solutions/{id}/result";
    LOG_INFO << "  POST /v1/oracle/callback";

    app()
        .setLogLevel(lux::pathcaptcha::LogLevelFromName(config.log_level))
        .addListener("0.0.0.0", config.port)
        .setThreadNum(std::thread::hardware_concurrency())
        .run();

    VerifierManager::instance().shutdown();
    return 0;
}
