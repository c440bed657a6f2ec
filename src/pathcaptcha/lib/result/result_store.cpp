// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2025, Lux Industries Inc
//
// Result Store Implementation

#include "result/result_store.h"
#include "maze/errors.h"
#include "oracle/transcript.h"
#include <trantor/utils/Logger.h>
#include <stdexcept>
#include <string>

namespace lux::pathcaptcha {

ResultStore::ResultStore(std::shared_ptr<const oracle::ProofVerifier> verifier, EventBus* events)
    : verifier_(std::move(verifier)), events_(events) {
    if (!verifier_) {
        throw std::invalid_argument("ResultStore needs a proof verifier");
    }
}

void ResultStore::Track(SolutionId solution_id, Timestamp submitted_at) {
    Entry entry;
    entry.result.solution_id = solution_id;
    entry.submitted_at = submitted_at;
    results_.emplace(solution_id, entry);
}

const ResultStore::Entry& ResultStore::GetEntry(SolutionId solution_id) const {
    auto it = results_.find(solution_id);
    if (it == results_.end()) {
        throw ProtocolError(ErrorCode::UNKNOWN_SOLUTION, "solution " + std::to_string(solution_id));
    }
    return it->second;
}

void ResultStore::AddPending(RequestId request_id, SolutionId solution_id, Timestamp now) {
    GetEntry(solution_id);
    if (request_id == kNoId || requests_.count(request_id) != 0) {
        throw std::invalid_argument("Oracle issued a duplicate request id " + std::to_string(request_id));
    }
    VerificationRequest request;
    request.request_id = request_id;
    request.solution_id = solution_id;
    request.requested_at = now;
    request.status = RequestStatus::PENDING;
    requests_.emplace(request_id, request);
}

std::vector<VerificationRequest> ResultStore::PendingFor(SolutionId solution_id) const {
    std::vector<VerificationRequest> pending;
    for (const auto& entry : requests_) {
        const auto& request = entry.second;
        if (request.solution_id == solution_id && request.status == RequestStatus::PENDING) {
            pending.push_back(request);
        }
    }
    return pending;
}

bool ResultStore::HasPendingFor(SolutionId solution_id) const {
    for (const auto& entry : requests_) {
        if (entry.second.solution_id == solution_id &&
            entry.second.status == RequestStatus::PENDING) {
            return true;
        }
    }
    return false;
}

bool ResultStore::Abandon(RequestId request_id, Timestamp now) {
    auto it = requests_.find(request_id);
    if (it == requests_.end() || it->second.status != RequestStatus::PENDING) {
        return false;
    }
    it->second.status = RequestStatus::ABANDONED;
    LOG_WARN << "Abandoned verification request " << request_id
             << " for solution " << it->second.solution_id;

    if (events_ != nullptr) {
        ProtocolEvent event{EventType::VERIFICATION_ABANDONED, now};
        event.solution_id = it->second.solution_id;
        event.request_id = request_id;
        events_->Publish(event);
    }
    return true;
}

size_t ResultStore::AbandonAllFor(SolutionId solution_id, Timestamp now) {
    size_t count = 0;
    for (const auto& request : PendingFor(solution_id)) {
        if (Abandon(request.request_id, now)) {
            count++;
        }
    }
    return count;
}

// ============================================================================
// Resolve
// ============================================================================

VerificationResult ResultStore::Resolve(
    RequestId request_id,
    const oracle::Cleartexts& cleartexts,
    const oracle::DecryptionProof& proof,
    Timestamp now
) {
    auto req_it = requests_.find(request_id);
    if (req_it == requests_.end() || req_it->second.status == RequestStatus::ABANDONED) {
        throw ProtocolError(ErrorCode::UNKNOWN_REQUEST, "request " + std::to_string(request_id));
    }
    VerificationRequest& request = req_it->second;

    auto res_it = results_.find(request.solution_id);
    if (res_it == results_.end()) {
        throw ProtocolError(ErrorCode::UNKNOWN_REQUEST,
            "request " + std::to_string(request_id) + " has no tracked solution");
    }
    Entry& entry = res_it->second;

    if (entry.result.is_revealed || request.status == RequestStatus::CONSUMED) {
        throw ProtocolError(ErrorCode::ALREADY_VERIFIED,
            "solution " + std::to_string(request.solution_id));
    }

    LOG_DEBUG << "Resolving request " << request_id << ", digest "
              << oracle::HashToHex(oracle::DecryptionDigest(request_id, cleartexts));

    if (!verifier_->Verify(request_id, cleartexts, proof)) {
        LOG_WARN << "Invalid decryption proof for request " << request_id
                 << " (solution " << request.solution_id << ")";
        throw ProtocolError(ErrorCode::INVALID_PROOF, "signature does not verify");
    }
    if (cleartexts.size() != 1 || cleartexts[0] > 1) {
        LOG_WARN << "Attested payload for request " << request_id << " is not a single boolean";
        throw ProtocolError(ErrorCode::INVALID_PROOF, "payload is not a boolean verdict");
    }

    // All checks passed; commit
    entry.result.is_valid = cleartexts[0] == 1;
    entry.result.is_revealed = true;
    entry.result.revealed_at = now;

    // Other outstanding requests for this solution can no longer reveal anything
    for (auto& other : requests_) {
        if (other.second.solution_id == request.solution_id &&
            other.second.status == RequestStatus::PENDING) {
            other.second.status = RequestStatus::CONSUMED;
        }
    }

    LOG_INFO << "Solution " << request.solution_id << " verified: "
             << (entry.result.is_valid ? "valid" : "invalid");

    if (events_ != nullptr) {
        ProtocolEvent event{EventType::VERIFICATION_COMPLETE, now};
        event.solution_id = request.solution_id;
        event.request_id = request_id;
        event.is_valid = entry.result.is_valid;
        events_->Publish(event);
    }
    return entry.result;
}

// ============================================================================
// Queries
// ============================================================================

VerificationResult ResultStore::GetResult(SolutionId solution_id) const {
    return GetEntry(solution_id).result;
}

VerificationState ResultStore::StateOf(SolutionId solution_id) const {
    const Entry& entry = GetEntry(solution_id);
    if (entry.result.is_revealed) {
        return VerificationState::REVEALED;
    }
    return HasPendingFor(solution_id) ? VerificationState::REQUEST_PENDING
                                      : VerificationState::SUBMITTED;
}

size_t ResultStore::PendingCount() const {
    size_t count = 0;
    for (const auto& entry : requests_) {
        if (entry.second.status == RequestStatus::PENDING) {
            count++;
        }
    }
    return count;
}

void ResultStore::FillStatistics(VerifierStatistics& stats) const {
    stats.pending = PendingCount();
    stats.revealed = 0;
    stats.valid = 0;
    stats.invalid = 0;

    double total_seconds = 0.0;
    for (const auto& item : results_) {
        const Entry& entry = item.second;
        if (!entry.result.is_revealed) {
            continue;
        }
        stats.revealed++;
        if (entry.result.is_valid) {
            stats.valid++;
        } else {
            stats.invalid++;
        }
        total_seconds += std::chrono::duration<double>(
            entry.result.revealed_at - entry.submitted_at).count();
    }
    stats.average_resolve_seconds =
        stats.revealed == 0 ? 0.0 : total_seconds / static_cast<double>(stats.revealed);
}

} // namespace lux::pathcaptcha
