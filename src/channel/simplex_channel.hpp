#pragma once

#include "arqsim/types.hpp"
#include "frame.hpp"
#include "error_model.hpp"
#include "sim/event_loop.hpp"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

namespace arqsim {
namespace channel {

// A frame that reached the far end of a channel
struct Delivery {
    SimTime arrival_time = 0.0;
    Frame frame;
};

struct SendResult {
    double propagation_duration = 0.0;  // Transmission time: size_bits / bit_rate
    double round_trip_estimate = 0.0;   // Frame out + header-only reply back
};

/**
 * SimplexChannel - one-directional physical medium
 *
 * send() samples corruption over the frame's bits against the channel's
 * standing Markov state, then schedules the arrival on the EventLoop at
 *   now + size_bits/bit_rate + path_delay + processing_delay.
 * The arrival pushes the frame (or CORRUPTED) onto an unbounded queue that
 * a single consumer drains with receive().
 *
 * Lock-step mode: the arrival action does not return until the consumer has
 * taken the frame and come back to receive(). Everything the consumer
 * schedules in response is then queued before EventLoop::advance() returns,
 * which keeps the logical timeline ordered when consumers run on their own
 * threads. Off by default so single-threaded callers can pump and drain.
 */
class SimplexChannel {
public:
    SimplexChannel(sim::EventLoop& loop,
                   const PhysicalConfig& config,
                   double path_delay,
                   ErrorModelPtr error_model,
                   std::string name = "channel");
    ~SimplexChannel();

    SimplexChannel(const SimplexChannel&) = delete;
    SimplexChannel& operator=(const SimplexChannel&) = delete;

    // Throws std::logic_error for a CORRUPTED frame
    SendResult send(SimTime current_time, Frame frame);

    // Block until a delivery is available. The channel must stay open while a
    // consumer waits here; receiving from a closed, drained channel throws
    // std::logic_error.
    Delivery receive();

    // nullopt on timeout or once closed and drained
    std::optional<Delivery> receiveFor(std::chrono::milliseconds timeout);

    // Non-blocking
    std::optional<Delivery> tryReceive();

    void setLockstep(bool enabled);

    // Wake all waiters; later arrivals are dropped
    void close();
    bool isClosed() const;

    size_t queued() const;

    ChannelState state() const;
    ChannelStats errorStats() const;

    const std::string& name() const { return name_; }

private:
    void deliver(SimTime arrival_time, Frame frame);
    Delivery popLocked();
    void markConsumerIdleLocked();

    sim::EventLoop& loop_;
    PhysicalConfig config_;
    double path_delay_;
    std::string name_;

    // Markov state: one send at a time
    mutable std::mutex model_mutex_;
    ErrorModelPtr error_model_;

    // Delivery queue
    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::deque<Delivery> queue_;
    bool closed_ = false;
    bool lockstep_ = false;
    uint64_t delivered_ = 0;  // Arrivals pushed
    uint64_t taken_ = 0;      // Arrivals popped by the consumer
    uint64_t completed_ = 0;  // Arrivals whose consumer returned to receive()
};

} // namespace channel
} // namespace arqsim
