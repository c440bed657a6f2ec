// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2025, Lux Industries Inc
//
// Protocol events for dashboards and other observers

#ifndef PATHCAPTCHA_MAZE_EVENTS_H
#define PATHCAPTCHA_MAZE_EVENTS_H

#include "maze/types.h"
#include <functional>
#include <map>
#include <string>

namespace lux::pathcaptcha {

enum class EventType : uint8_t {
    MAZE_CREATED = 0,
    SOLUTION_SUBMITTED = 1,
    VERIFICATION_REQUESTED = 2,
    VERIFICATION_COMPLETE = 3,
    VERIFICATION_ABANDONED = 4,
};

std::string EventTypeName(EventType type);

struct ProtocolEvent {
    EventType type;
    Timestamp at;
    MazeId maze_id = kNoId;
    SolutionId solution_id = kNoId;
    RequestId request_id = kNoId;
    bool is_valid = false;      // VERIFICATION_COMPLETE only
};

using EventHandler = std::function<void(const ProtocolEvent&)>;

/**
 * @brief Synchronous fan-out to subscribers
 *
 * Handlers run on the publishing thread, inside the operation that emitted
 * the event. They must not call back into the verifier.
 */
class EventBus {
public:
    size_t Subscribe(EventHandler handler);
    void Unsubscribe(size_t token);
    void Publish(const ProtocolEvent& event) const;

    size_t NumSubscribers() const { return handlers_.size(); }

private:
    std::map<size_t, EventHandler> handlers_;
    size_t next_token_ = 1;
};

} // namespace lux::pathcaptcha

#endif // PATHCAPTCHA_MAZE_EVENTS_H
