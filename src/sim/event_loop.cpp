#include "event_loop.hpp"
#include "arqsim/logging.hpp"

namespace arqsim {
namespace sim {

EventId EventLoop::schedule(SimTime time, Action action) {
    std::lock_guard<std::mutex> lock(events_mutex_);
    EventId id = next_id_++;
    events_.push(Event{time, id, std::move(action)});
    queued_.insert(id);
    LOG_SIM(TRACE, "EventLoop: scheduled id=%lld at t=%.6f (pending=%zu)",
            static_cast<long long>(id), time, events_.size());
    return id;
}

void EventLoop::cancel(EventId id) {
    // Only ids still in the queue are recorded; advance() erases them on pop
    std::lock_guard<std::mutex> events_lock(events_mutex_);
    if (queued_.count(id) == 0) {
        return;
    }
    std::lock_guard<std::mutex> cancelled_lock(cancelled_mutex_);
    cancelled_.insert(id);
}

bool EventLoop::advance() {
    Action action;
    bool was_cancelled = false;

    {
        // Lock order: events, then cancelled. Pop and cancellation check are atomic
        // with respect to cancel() racing the same id.
        std::lock_guard<std::mutex> events_lock(events_mutex_);
        std::lock_guard<std::mutex> cancelled_lock(cancelled_mutex_);

        if (events_.empty()) {
            return false;
        }

        // priority_queue::top() is const; the event is popped right after
        Event event = std::move(const_cast<Event&>(events_.top()));
        events_.pop();
        queued_.erase(event.id);

        if (event.time > now_) {
            now_ = event.time;
        }
        was_cancelled = cancelled_.erase(event.id) > 0;
        if (!was_cancelled) {
            action = std::move(event.action);
        }
    }

    if (!was_cancelled && action) {
        action();
    }
    return true;
}

size_t EventLoop::pendingCount() const {
    std::lock_guard<std::mutex> lock(events_mutex_);
    return events_.size();
}

size_t EventLoop::cancelledCount() const {
    std::lock_guard<std::mutex> lock(cancelled_mutex_);
    return cancelled_.size();
}

SimTime EventLoop::now() const {
    std::lock_guard<std::mutex> lock(events_mutex_);
    return now_;
}

SimTime EventLoop::nextTime(SimTime fallback) const {
    std::lock_guard<std::mutex> lock(events_mutex_);
    return events_.empty() ? fallback : events_.top().time;
}

void EventLoop::clear() {
    std::lock_guard<std::mutex> events_lock(events_mutex_);
    std::lock_guard<std::mutex> cancelled_lock(cancelled_mutex_);
    events_ = decltype(events_){};
    queued_.clear();
    cancelled_.clear();
}

} // namespace sim
} // namespace arqsim
