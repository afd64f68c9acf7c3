#pragma once

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

namespace arqsim {

// Core types
using Bytes = std::vector<uint8_t>;            // Frame payload
using SeqNum = int64_t;                        // Non-wrapping sequence number
using EventId = int64_t;                       // EventLoop handle
using SimTime = double;                        // Simulated seconds

// Gilbert-Elliot channel state
enum class ChannelState : uint8_t {
    GOOD = 0,
    BAD = 1,
};

inline const char* channelStateToString(ChannelState state) {
    switch (state) {
        case ChannelState::GOOD: return "GOOD";
        case ChannelState::BAD:  return "BAD";
        default: return "UNKNOWN";
    }
}

// Which error model implementation drives a channel
enum class ErrorModelKind : uint8_t {
    JUMP_AHEAD = 0,  // Geometric inverse-CDF sojourn sampling (production)
    BIT_LOOP = 1,    // Per-bit draws (reference oracle)
};

inline const char* errorModelKindToString(ErrorModelKind kind) {
    switch (kind) {
        case ErrorModelKind::JUMP_AHEAD: return "jump_ahead";
        case ErrorModelKind::BIT_LOOP:   return "bit_loop";
        default: return "unknown";
    }
}

// Accepts "jump_ahead"/"jump" and "bit_loop"/"bitloop"; anything else is jump-ahead
inline ErrorModelKind parseErrorModelKind(const std::string& s) {
    if (s == "bit_loop" || s == "bitloop" || s == "bit") return ErrorModelKind::BIT_LOOP;
    return ErrorModelKind::JUMP_AHEAD;
}

// Two-state Markov bit error process parameters
struct GilbertElliotParams {
    double good_ber = 1e-6;         // Bit error rate in GOOD
    double bad_ber = 5e-3;          // Bit error rate in BAD
    double p_good_to_bad = 0.002;   // Per-bit GOOD -> BAD transition probability
    double p_bad_to_good = 0.05;    // Per-bit BAD -> GOOD transition probability

    double berFor(ChannelState s) const {
        return s == ChannelState::GOOD ? good_ber : bad_ber;
    }

    // Probability of leaving state s after one bit
    double exitProbability(ChannelState s) const {
        return s == ChannelState::GOOD ? p_good_to_bad : p_bad_to_good;
    }

    // Long-run fraction of bits spent in BAD
    double stationaryBadFraction() const {
        return p_good_to_bad / (p_good_to_bad + p_bad_to_good);
    }
};

// Physical-layer constants. Passed by value into each component so that
// concurrent simulations never share mutable parameters.
struct PhysicalConfig {
    double bit_rate = 10e6;                 // bits/s
    double forward_path_delay = 0.040;      // s, data direction
    double reverse_path_delay = 0.010;      // s, ACK/NAK direction
    double processing_delay = 0.002;        // s, per frame
    uint32_t frame_overhead_bytes = 24;     // Link header per frame
    size_t receiver_buffer_bytes = 256 * 1024;
    double timeout_multiplier = 2.5;        // Retransmission timer = RTT * multiplier
    double sweep_timeout_margin = 1.005;    // Closed-form sweep outcome delay = RTT * margin

    uint64_t overheadBits() const { return static_cast<uint64_t>(frame_overhead_bytes) * 8; }

    double transmissionTime(uint64_t bits) const {
        return static_cast<double>(bits) / bit_rate;
    }

    // Round trip of a frame with the given size and its header-only ACK
    double roundTrip(uint64_t frame_bits) const {
        return transmissionTime(frame_bits) + forward_path_delay + processing_delay +
               transmissionTime(overheadBits()) + reverse_path_delay + processing_delay;
    }
};

} // namespace arqsim
