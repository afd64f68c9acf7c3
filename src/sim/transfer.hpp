#pragma once

#include "arqsim/types.hpp"
#include "channel/error_model.hpp"
#include "protocol/simplex_link.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>

namespace arqsim {
namespace sim {

struct TransferOptions {
    PhysicalConfig physical;
    GilbertElliotParams channel;
    ErrorModelKind error_model = ErrorModelKind::JUMP_AHEAD;
    uint64_t seed = 42;
    double sim_time_budget_s = 300.0;    // Simulated seconds
    double wall_time_budget_s = 60.0;    // Real seconds
};

struct TransferResult {
    bool completed = false;        // Every frame acknowledged
    bool timed_out = false;        // A budget ran out first
    bool payload_intact = false;   // Receiver output == input
    SimTime sim_time = 0.0;        // Time of the final ACK
    double wall_seconds = 0.0;
    uint64_t frames = 0;
    uint64_t bytes_delivered = 0;
    double goodput_bps = 0.0;
    uint64_t retransmissions = 0;
    protocol::LinkStats link;
    channel::ChannelStats forward;
    channel::ChannelStats reverse;
};

/**
 * Transfer - end-to-end event-driven run of one payload over one link
 *
 * Wires an EventLoop, a forward and a reverse SimplexChannel (lock-step
 * delivery) and a SimplexLink, then runs three threads:
 *   - pump (caller's thread): drains the EventLoop, idles 1 ms when empty
 *   - forward consumer: feeds the receiver, which answers RR/SREJ
 *   - reverse consumer: feeds the sender and refills the window
 * Stops when every frame is acknowledged, a budget runs out, or stop().
 */
class Transfer {
public:
    // Throws std::logic_error for window_size < 1 or frame_size == 0
    Transfer(SeqNum window_size, size_t frame_size,
             const TransferOptions& options = TransferOptions{});

    TransferResult run(const Bytes& payload);

    // Thread-safe; run() returns with timed_out set
    void stop() { stop_requested_ = true; }

private:
    SeqNum window_size_;
    size_t frame_size_;
    TransferOptions options_;
    std::atomic<bool> stop_requested_{false};
};

// Fire-and-forget entry point: runs the transfer and reports it via logging
void runTransfer(SeqNum window_size, size_t frame_size, const Bytes& payload);

} // namespace sim
} // namespace arqsim
