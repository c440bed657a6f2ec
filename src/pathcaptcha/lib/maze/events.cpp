// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2025, Lux Industries Inc

#include "maze/events.h"
#include <trantor/utils/Logger.h>
#include <exception>

namespace lux::pathcaptcha {

std::string EventTypeName(EventType type) {
    switch (type) {
        case EventType::MAZE_CREATED: return "maze-created";
        case EventType::SOLUTION_SUBMITTED: return "solution-submitted";
        case EventType::VERIFICATION_REQUESTED: return "verification-requested";
        case EventType::VERIFICATION_COMPLETE: return "verification-complete";
        case EventType::VERIFICATION_ABANDONED: return "verification-abandoned";
        default: return "unknown";
    }
}

size_t EventBus::Subscribe(EventHandler handler) {
    size_t token = next_token_++;
    handlers_.emplace(token, std::move(handler));
    return token;
}

void EventBus::Unsubscribe(size_t token) {
    handlers_.erase(token);
}

void EventBus::Publish(const ProtocolEvent& event) const {
    for (const auto& entry : handlers_) {
        // State is already committed when events fire
        try {
            entry.second(event);
        } catch (const std::exception& e) {
            LOG_ERROR << "Event handler " << entry.first << " failed on "
                      << EventTypeName(event.type) << ": " << e.what();
        }
    }
}

} // namespace lux::pathcaptcha
