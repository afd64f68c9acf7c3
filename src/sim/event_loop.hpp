#pragma once

#include "arqsim/types.hpp"
#include <functional>
#include <mutex>
#include <queue>
#include <unordered_set>
#include <vector>
#include <cstddef>

namespace arqsim {
namespace sim {

/**
 * EventLoop - time-ordered, cancellable action queue
 *
 * Logical-time scheduler for the discrete-event simulation:
 * - schedule() enqueues an action at an absolute simulated time
 * - advance() pops the earliest event and runs it to completion
 * - cancel() voids an event by id; firing it becomes a no-op
 *
 * Ordering is (time, id): earlier time first, then scheduling order.
 * No wall-clock pacing: callers pump the loop while pendingCount() > 0.
 *
 * Thread safety: schedule/cancel may race advance() from other threads.
 * The queue and the cancelled set have separate mutexes; advance() holds
 * both only for the pop-and-check step, never while the action runs, so
 * actions may schedule or cancel freely.
 */
class EventLoop {
public:
    using Action = std::function<void()>;

    EventLoop() = default;
    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    EventId schedule(SimTime time, Action action);

    // Idempotent; unknown or already-fired ids are ignored
    void cancel(EventId id);

    // Fire the earliest event. Returns false if the queue was empty.
    // A cancelled event is consumed without running and still returns true.
    bool advance();

    // Events not yet popped, including cancelled ones
    size_t pendingCount() const;

    // Queued events marked cancelled
    size_t cancelledCount() const;

    // Time of the most recently popped event
    SimTime now() const;

    // Time of the next queued event, or `fallback` when empty
    SimTime nextTime(SimTime fallback) const;

    // Drop everything (shutdown)
    void clear();

private:
    struct Event {
        SimTime time;
        EventId id;
        Action action;
    };

    // Min-heap on (time, id)
    struct Later {
        bool operator()(const Event& a, const Event& b) const {
            if (a.time != b.time) return a.time > b.time;
            return a.id > b.id;
        }
    };

    mutable std::mutex events_mutex_;
    std::priority_queue<Event, std::vector<Event>, Later> events_;
    std::unordered_set<EventId> queued_;
    EventId next_id_ = 0;
    SimTime now_ = 0.0;

    mutable std::mutex cancelled_mutex_;
    std::unordered_set<EventId> cancelled_;
};

} // namespace sim
} // namespace arqsim
