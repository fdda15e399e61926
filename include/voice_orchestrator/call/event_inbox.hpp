#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

#include "voice_orchestrator/call/event.hpp"

namespace voice_orchestrator {

// Ordered multi-producer, single-consumer queue feeding one call actor.
class EventInbox {
public:
    // Returns false once the inbox is closed; the event is dropped.
    bool push(Event event);
    // Blocks until an event is available. Returns nullopt once the inbox is
    // closed and drained.
    std::optional<Event> pop();
    std::optional<Event> try_pop();
    void close();
    bool closed() const;
    std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Event> queue_;
    bool closed_ = false;
};

}
