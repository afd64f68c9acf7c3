#pragma once

// Closed-form Selective Repeat ARQ simulation
//
// Advances a virtual clock over the transmitter without an event queue.
// Propagation and processing delays are deterministic, so a frame's fate is
// known the moment it is sent: it succeeds only if both the DATA frame and
// its header-only ACK get through their channels. The outcome becomes
// visible to the sender rtt * sweep_timeout_margin after transmission
// starts; failed frames are resent on the next pass over the window.
//
// Usage:
//   SweepOptions opts;
//   opts.seed = 7;
//   ArqResult r = simulateArq(16, 1024, opts);
//   printf("%.3f Mbps, %llu retx\n", r.goodput_bps / 1e6, r.retransmissions);

#include "arqsim/types.hpp"
#include <cstdint>

namespace arqsim {
namespace sim {

struct SweepOptions {
    PhysicalConfig physical;
    GilbertElliotParams channel;
    ErrorModelKind error_model = ErrorModelKind::JUMP_AHEAD;
    uint64_t file_size_bytes = 1000000;
    uint64_t seed = 42;
};

struct ArqResult {
    double goodput_bps = 0.0;         // Application bits / completion time
    uint64_t retransmissions = 0;
    double time_seconds = 0.0;
    uint64_t frames = 0;              // Distinct frames in the file
    uint64_t transmissions = 0;       // Frames put on the wire, including resends
};

// Throws std::logic_error for a zero window, payload or file size
ArqResult simulateArq(uint64_t window_size, uint64_t frame_payload_bytes,
                      const SweepOptions& options = SweepOptions{});

} // namespace sim
} // namespace arqsim
