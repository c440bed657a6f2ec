// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2025, Lux Industries Inc
//
// Maze Controller - HTTP endpoints for the PathCaptcha verifier

#pragma once

#include <drogon/HttpController.h>
#include <drogon/HttpAppFramework.h>
#include <drogon/utils/Utilities.h>

#include "algebra/binfhe_algebra.h"
#include "config/verifier_config.h"
#include "maze/errors.h"
#include "oracle/local_oracle.h"
#include "protocol/path_verifier.h"

#include <memory>
#include <mutex>
#include <stdexcept>

namespace pathcaptcha_server
{

using namespace drogon;
using namespace lux::pathcaptcha;

using algebra::BinFheAlgebra;
using oracle::LocalDecryptionOracle;

/**
 * @brief Owns the evaluator, the local oracle and the verifier
 *
 * The verifier serializes its own operations; the manager lock only guards
 * setup and teardown.
 */
class VerifierManager
{
  public:
    static VerifierManager& instance()
    {
        static VerifierManager inst;
        return inst;
    }

    void init(const VerifierConfig& config)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (verifier_) {
            throw std::logic_error("VerifierManager already initialized");
        }
        config_ = config;

        LOG_INFO << "Generating BinFHE context (" << config.security << ", "
                 << config.method << ")";
        algebra_ = std::make_unique<BinFheAlgebra>(
            algebra::ParamSetFromName(config.security),
            algebra::MethodFromName(config.method));

        LOG_INFO << "Generating oracle keys";
        oracle_ = std::make_unique<LocalDecryptionOracle>(*algebra_);
        verifier_ = std::make_unique<PathVerifier>(
            *algebra_, *oracle_, oracle_->Verifier(),
            config.ToLimits(), config.ToEngineOptions());

        oracle_->Start(config.oracle_workers);
    }

    void shutdown()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (oracle_) {
            oracle_->Stop();
            LOG_INFO << "Oracle stopped, " << oracle_->NumQueued()
                     << " request(s) left undelivered";
        }
        verifier_.reset();
        oracle_.reset();
        algebra_.reset();
    }

    PathVerifier& verifier() { return *verifier_; }
    LocalDecryptionOracle& oracle() { return *oracle_; }
    const VerifierConfig& config() const { return config_; }

    Json::Value publicKeys() const
    {
        auto pk = BinFheAlgebra::SerializePublicKey(oracle_->PublicKey());
        auto vk = oracle_->VerificationKey();

        Json::Value keys;
        keys["security"] = config_.security;
        keys["method"] = config_.method;
        keys["coordinate_bits"] = config_.coordinate_bits;
        keys["public_key"] = utils::base64Encode(pk.data(), pk.size());
        keys["verification_key"] = utils::base64Encode(vk.data(), vk.size());
        return keys;
    }

  private:
    VerifierManager() = default;

    std::mutex mutex_;
    VerifierConfig config_;
    std::unique_ptr<BinFheAlgebra> algebra_;
    std::unique_ptr<LocalDecryptionOracle> oracle_;
    std::unique_ptr<PathVerifier> verifier_;
};

// ============================================================================
// Wire Encoding
// ============================================================================

namespace wire
{

inline std::vector<uint8_t> decodeBytes(const Json::Value& v, const char* what)
{
    if (!v.isString()) {
        throw std::invalid_argument(std::string(what) + " must be a base64 string");
    }
    std::string raw = utils::base64Decode(v.asString());
    return std::vector<uint8_t>(raw.begin(), raw.end());
}

inline EncryptedBit decodeBit(const Json::Value& v)
{
    return BinFheAlgebra::DeserializeBit(decodeBytes(v, "ciphertext"));
}

inline EncryptedWord decodeWord(const Json::Value& v)
{
    if (!v.isArray()) {
        throw std::invalid_argument("encrypted word must be an array of ciphertexts");
    }
    EncryptedWord word;
    for (const auto& bit : v) {
        word.bits.push_back(decodeBit(bit));
    }
    return word;
}

inline EncryptedCoord decodeCoord(const Json::Value& v)
{
    if (!v.isObject() || !v.isMember("row") || !v.isMember("col")) {
        throw std::invalid_argument("coordinate must be {\"row\": [...], \"col\": [...]}");
    }
    return EncryptedCoord{decodeWord(v["row"]), decodeWord(v["col"])};
}

inline std::vector<std::vector<EncryptedBit>> decodeGrid(const Json::Value& v)
{
    if (!v.isArray()) {
        throw std::invalid_argument("grid must be an array of rows");
    }
    std::vector<std::vector<EncryptedBit>> grid;
    for (const auto& row : v) {
        if (!row.isArray()) {
            throw std::invalid_argument("grid row must be an array of ciphertexts");
        }
        std::vector<EncryptedBit> cells;
        for (const auto& cell : row) {
            cells.push_back(decodeBit(cell));
        }
        grid.push_back(std::move(cells));
    }
    return grid;
}

inline std::vector<EncryptedCoord> decodePath(const Json::Value& v)
{
    if (!v.isArray()) {
        throw std::invalid_argument("path must be an array of coordinates");
    }
    std::vector<EncryptedCoord> path;
    for (const auto& coord : v) {
        path.push_back(decodeCoord(coord));
    }
    return path;
}

inline MazeMetadata decodeMetadata(const Json::Value& v)
{
    MazeMetadata meta;
    if (v.isNull()) return meta;
    if (!v.isObject()) {
        throw std::invalid_argument("metadata must be an object");
    }
    if (v.isMember("difficulty")) {
        const Json::Value& d = v["difficulty"];
        if (!d.isUInt() || d.asUInt() > 255) {
            throw std::invalid_argument("metadata difficulty must be an integer in 0..255");
        }
        meta.difficulty = d.asUInt();
    }
    for (const char* key : {"description", "owner"}) {
        if (v.isMember(key) && !v[key].isString()) {
            throw std::invalid_argument(std::string("metadata ") + key + " must be a string");
        }
    }
    meta.description = v.get("description", "").asString();
    meta.owner = v.get("owner", "").asString();
    return meta;
}

inline Json::Int64 seconds(Timestamp t)
{
    return std::chrono::duration_cast<std::chrono::seconds>(t.time_since_epoch()).count();
}

inline Json::Value encodeResult(const VerificationResult& r, VerificationState state)
{
    Json::Value out;
    out["solution_id"] = static_cast<Json::UInt64>(r.solution_id);
    out["state"] = VerificationStateName(state);
    out["is_revealed"] = r.is_revealed;
    out["is_valid"] = r.is_valid;
    if (r.is_revealed) {
        out["revealed_at"] = seconds(r.revealed_at);
    }
    return out;
}

inline Json::Value encodeStatistics(const VerifierStatistics& s)
{
    Json::Value out;
    out["mazes"] = static_cast<Json::UInt64>(s.mazes);
    out["solutions"] = static_cast<Json::UInt64>(s.solutions);
    out["pending"] = static_cast<Json::UInt64>(s.pending);
    out["revealed"] = static_cast<Json::UInt64>(s.revealed);
    out["valid"] = static_cast<Json::UInt64>(s.valid);
    out["invalid"] = static_cast<Json::UInt64>(s.invalid);
    out["average_resolve_seconds"] = s.average_resolve_seconds;
    return out;
}

inline HttpStatusCode statusFor(ErrorCode code)
{
    switch (code) {
        case ErrorCode::UNKNOWN_MAZE:
        case ErrorCode::UNKNOWN_SOLUTION:
        case ErrorCode::UNKNOWN_REQUEST:
            return k404NotFound;
        case ErrorCode::ALREADY_VERIFIED:
        case ErrorCode::ALREADY_PENDING:
            return k409Conflict;
        case ErrorCode::INVALID_PROOF:
            return k403Forbidden;
        default:
            return k400BadRequest;
    }
}

}  // namespace wire

/**
 * @brief HTTP Controller for the maze verification protocol
 */
class MazeController : public HttpController<MazeController>
{
  public:
    using Callback = std::function<void(const HttpResponsePtr&)>;

    METHOD_LIST_BEGIN
    ADD_METHOD_TO(MazeController::health, "/health", Get);
    ADD_METHOD_TO(MazeController::status, "/v1/status", Get);
    ADD_METHOD_TO(MazeController::publicKeys, "/v1/keys/public", Get);
    ADD_METHOD_TO(MazeController::createMaze, "/v1/mazes", Post);
    ADD_METHOD_TO(MazeController::getMaze, "/v1/mazes/{1}", Get);
    ADD_METHOD_TO(MazeController::listSolutions, "/v1/mazes/{1}/solutions", Get);
    ADD_METHOD_TO(MazeController::submitSolution, "/v1/solutions", Post);
    ADD_METHOD_TO(MazeController::requestVerification, "/v1/solutions/{1}/verify", Post);
    ADD_METHOD_TO(MazeController::abandonVerification, "/v1/solutions/{1}/abandon", Post);
    ADD_METHOD_TO(MazeController::getResult, "/v1/solutions/{1}/result", Get);
    ADD_METHOD_TO(MazeController::oracleCallback, "/v1/oracle/callback", Post);
    METHOD_LIST_END

    void health(const HttpRequestPtr& req, Callback&& callback)
    {
        Json::Value resp;
        resp["status"] = "healthy";
        resp["service"] = "pathcaptcha";
        resp["version"] = "1.0.0";
        callback(HttpResponse::newHttpJsonResponse(resp));
    }

    void status(const HttpRequestPtr& req, Callback&& callback)
    {
        handle(std::move(callback), [] {
            auto& mgr = VerifierManager::instance();
            Json::Value resp;
            resp["available"] = mgr.verifier().IsAvailable();
            resp["statistics"] = wire::encodeStatistics(mgr.verifier().GetStatistics());

            Json::Value oracleStatus;
            oracleStatus["running"] = mgr.oracle().IsRunning();
            oracleStatus["queued"] = static_cast<Json::UInt64>(mgr.oracle().NumQueued());
            oracleStatus["delivered"] = static_cast<Json::UInt64>(mgr.oracle().NumDelivered());
            oracleStatus["callback_failures"] =
                static_cast<Json::UInt64>(mgr.oracle().NumCallbackFailures());
            resp["oracle"] = oracleStatus;

            auto circuit = mgr.verifier().LastCircuitStats();
            Json::Value last;
            last["steps"] = static_cast<Json::UInt64>(circuit.steps);
            last["lookups"] = static_cast<Json::UInt64>(circuit.lookups);
            last["cells_scanned"] = static_cast<Json::UInt64>(circuit.cells_scanned);
            last["gates"] = static_cast<Json::UInt64>(circuit.gates);
            resp["last_circuit"] = last;
            return resp;
        });
    }

    void publicKeys(const HttpRequestPtr& req, Callback&& callback)
    {
        handle(std::move(callback), [] { return VerifierManager::instance().publicKeys(); });
    }

    void createMaze(const HttpRequestPtr& req, Callback&& callback)
    {
        auto json = req->getJsonObject();
        if (!json || !json->isMember("grid") || !json->isMember("start") ||
            !json->isMember("end")) {
            badRequest(std::move(callback), "grid, start and end required");
            return;
        }
        handle(std::move(callback), [&json] {
            auto grid = wire::decodeGrid((*json)["grid"]);
            auto start = wire::decodeCoord((*json)["start"]);
            auto end = wire::decodeCoord((*json)["end"]);
            auto meta = wire::decodeMetadata((*json)["metadata"]);

            MazeId id = VerifierManager::instance().verifier().CreateMaze(grid, start, end, meta);
            Json::Value resp;
            resp["maze_id"] = static_cast<Json::UInt64>(id);
            return resp;
        });
    }

    void getMaze(const HttpRequestPtr& req, Callback&& callback, uint64_t mazeId)
    {
        handle(std::move(callback), [mazeId] {
            MazeSummary maze = VerifierManager::instance().verifier().GetMaze(mazeId);
            Json::Value resp;
            resp["maze_id"] = static_cast<Json::UInt64>(maze.id);
            resp["rows"] = maze.rows;
            resp["cols"] = maze.cols;
            resp["created_at"] = wire::seconds(maze.created_at);
            resp["num_solutions"] = static_cast<Json::UInt64>(maze.num_solutions);
            Json::Value meta;
            meta["difficulty"] = maze.metadata.difficulty;
            meta["description"] = maze.metadata.description;
            meta["owner"] = maze.metadata.owner;
            resp["metadata"] = meta;
            return resp;
        });
    }

    void listSolutions(const HttpRequestPtr& req, Callback&& callback, uint64_t mazeId)
    {
        handle(std::move(callback), [mazeId] {
            Json::Value ids(Json::arrayValue);
            for (SolutionId id : VerifierManager::instance().verifier().ListSolutions(mazeId)) {
                ids.append(static_cast<Json::UInt64>(id));
            }
            Json::Value resp;
            resp["maze_id"] = static_cast<Json::UInt64>(mazeId);
            resp["solutions"] = ids;
            return resp;
        });
    }

    void submitSolution(const HttpRequestPtr& req, Callback&& callback)
    {
        auto json = req->getJsonObject();
        if (!json || !json->isMember("maze_id") || !json->isMember("path")) {
            badRequest(std::move(callback), "maze_id and path required");
            return;
        }
        if (!(*json)["maze_id"].isUInt64()) {
            badRequest(std::move(callback), "maze_id must be an unsigned integer");
            return;
        }
        handle(std::move(callback), [&json] {
            MazeId mazeId = (*json)["maze_id"].asUInt64();
            auto path = wire::decodePath((*json)["path"]);
            std::string submitter = json->get("submitter", "").asString();

            SolutionId id =
                VerifierManager::instance().verifier().SubmitSolution(mazeId, path, submitter);
            Json::Value resp;
            resp["solution_id"] = static_cast<Json::UInt64>(id);
            resp["maze_id"] = static_cast<Json::UInt64>(mazeId);
            return resp;
        });
    }

    void requestVerification(const HttpRequestPtr& req, Callback&& callback, uint64_t solutionId)
    {
        handle(std::move(callback), [solutionId] {
            auto& verifier = VerifierManager::instance().verifier();
            RequestId rid = verifier.RequestVerification(solutionId);
            Json::Value resp;
            resp["solution_id"] = static_cast<Json::UInt64>(solutionId);
            resp["request_id"] = static_cast<Json::UInt64>(rid);
            resp["gates"] = static_cast<Json::UInt64>(verifier.LastCircuitStats().gates);
            return resp;
        });
    }

    void abandonVerification(const HttpRequestPtr& req, Callback&& callback, uint64_t solutionId)
    {
        handle(std::move(callback), [solutionId] {
            size_t n = VerifierManager::instance().verifier().AbandonVerification(solutionId);
            Json::Value resp;
            resp["solution_id"] = static_cast<Json::UInt64>(solutionId);
            resp["abandoned"] = static_cast<Json::UInt64>(n);
            return resp;
        });
    }

    void getResult(const HttpRequestPtr& req, Callback&& callback, uint64_t solutionId)
    {
        handle(std::move(callback), [solutionId] {
            auto status = VerifierManager::instance().verifier().GetVerificationStatus(solutionId);
            return wire::encodeResult(status.first, status.second);
        });
    }

    // External oracles deliver here; the local oracle calls the verifier directly
    void oracleCallback(const HttpRequestPtr& req, Callback&& callback)
    {
        auto json = req->getJsonObject();
        if (!json || !json->isMember("request_id") || !json->isMember("cleartexts") ||
            !json->isMember("signature")) {
            badRequest(std::move(callback), "request_id, cleartexts and signature required");
            return;
        }
        handle(std::move(callback), [&json] {
            const Json::Value& rid = (*json)["request_id"];
            const Json::Value& values = (*json)["cleartexts"];
            if (!rid.isUInt64() || !values.isArray()) {
                throw std::invalid_argument("request_id must be an integer, cleartexts an array");
            }
            oracle::Cleartexts cleartexts;
            for (const auto& v : values) {
                if (!v.isUInt64()) {
                    throw std::invalid_argument("cleartexts must be unsigned integers");
                }
                cleartexts.push_back(v.asUInt64());
            }
            oracle::DecryptionProof proof;
            proof.signature = wire::decodeBytes((*json)["signature"], "signature");

            auto& verifier = VerifierManager::instance().verifier();
            VerificationResult result = verifier.Resolve(rid.asUInt64(), cleartexts, proof);
            return wire::encodeResult(result, VerificationState::REVEALED);
        });
    }

  private:
    static void badRequest(Callback&& callback, const std::string& message)
    {
        Json::Value err;
        err["error"] = message;
        auto resp = HttpResponse::newHttpJsonResponse(err);
        resp->setStatusCode(k400BadRequest);
        callback(resp);
    }

    // Runs `body` and maps protocol and decoding errors onto HTTP status codes
    template <typename Body>
    static void handle(Callback&& callback, Body&& body)
    {
        Json::Value out;
        Json::Value err;
        HttpStatusCode code = k500InternalServerError;
        try {
            out = body();
        } catch (const ProtocolError& e) {
            err["error"] = ErrorCodeName(e.Code());
            err["detail"] = e.what();
            code = wire::statusFor(e.Code());
        } catch (const std::invalid_argument& e) {
            err["error"] = "BadRequest";
            err["detail"] = e.what();
            code = k400BadRequest;
        } catch (const std::exception& e) {
            LOG_ERROR << "Request failed: " << e.what();
            err["error"] = "Internal";
            err["detail"] = e.what();
        }
        if (err.isNull()) {
            callback(HttpResponse::newHttpJsonResponse(out));
            return;
        }
        auto resp = HttpResponse::newHttpJsonResponse(err);
        resp->setStatusCode(code);
        callback(resp);
    }
};

}  // namespace pathcaptcha_server
