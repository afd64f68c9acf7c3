#pragma once

// Gilbert-Elliot bit error models
//
// Both implementations answer the same question: "N bits leave the
// transmitter while the channel is in its current Markov state; was any
// bit corrupted, and which state is the channel in afterwards?"
//
//   BitLoopErrorModel    two draws per bit, error and transition (accuracy baseline)
//   JumpAheadErrorModel  geometric sojourn lengths via inverse CDF, one
//                        draw per chunk of bits spent in a single state
//
// Usage:
//   auto model = createErrorModel(ErrorModelKind::JUMP_AHEAD, params, seed);
//   auto outcome = model->transmit(frame_bits);
//   if (outcome.corrupted) { ... }

#include "arqsim/types.hpp"
#include <cstdint>
#include <memory>
#include <random>

namespace arqsim {
namespace channel {

struct TransmissionOutcome {
    bool corrupted = false;
    ChannelState final_state = ChannelState::GOOD;
};

struct ChannelStats {
    uint64_t bits = 0;
    uint64_t frames = 0;
    uint64_t corrupted_frames = 0;
    uint64_t bits_in_good = 0;
    uint64_t bits_in_bad = 0;
    uint64_t transitions = 0;

    double corruptionRate() const {
        return frames > 0 ? static_cast<double>(corrupted_frames) / frames : 0.0;
    }

    double badFraction() const {
        return bits > 0 ? static_cast<double>(bits_in_bad) / bits : 0.0;
    }
};

/**
 * Abstract error model. Owns the standing Markov state and its RNG.
 * Not thread-safe; SimplexChannel serializes access.
 */
class ErrorModel {
public:
    ErrorModel(const GilbertElliotParams& params, uint64_t seed, ChannelState initial);
    virtual ~ErrorModel() = default;

    virtual ErrorModelKind kind() const = 0;

    // Consume num_bits (> 0) of channel time. Throws std::logic_error for 0.
    virtual TransmissionOutcome transmit(uint64_t num_bits) = 0;

    // Convenience: true if the frame got through intact
    bool frameSuccess(uint64_t num_bits) { return !transmit(num_bits).corrupted; }

    ChannelState state() const { return state_; }
    const GilbertElliotParams& params() const { return params_; }

    const ChannelStats& stats() const { return stats_; }

protected:
    // Uniform on [0, 1)
    double uniform() { return unit_(rng_); }
    // Uniform on (0, 1), for logarithms
    double uniformOpen();

    void countBits(ChannelState s, uint64_t bits);
    void flipState();

    GilbertElliotParams params_;
    ChannelState state_;
    ChannelStats stats_;
    std::mt19937_64 rng_;
    std::uniform_real_distribution<double> unit_{0.0, 1.0};
};

using ErrorModelPtr = std::unique_ptr<ErrorModel>;

class BitLoopErrorModel : public ErrorModel {
public:
    explicit BitLoopErrorModel(const GilbertElliotParams& params = GilbertElliotParams{},
                               uint64_t seed = 42,
                               ChannelState initial = ChannelState::GOOD);

    ErrorModelKind kind() const override { return ErrorModelKind::BIT_LOOP; }
    TransmissionOutcome transmit(uint64_t num_bits) override;
};

class JumpAheadErrorModel : public ErrorModel {
public:
    explicit JumpAheadErrorModel(const GilbertElliotParams& params = GilbertElliotParams{},
                                 uint64_t seed = 42,
                                 ChannelState initial = ChannelState::GOOD);

    ErrorModelKind kind() const override { return ErrorModelKind::JUMP_AHEAD; }
    TransmissionOutcome transmit(uint64_t num_bits) override;

    uint64_t bitsUntilNextTransition() const { return bits_until_transition_; }

    // Geometric(p) on {1, 2, ...}: floor(ln r / ln(1-p)) + 1
    static uint64_t geometricSojourn(double p, double r);

private:
    uint64_t sampleSojourn();

    uint64_t bits_until_transition_ = 0;
};

ErrorModelPtr createErrorModel(ErrorModelKind kind,
                               const GilbertElliotParams& params = GilbertElliotParams{},
                               uint64_t seed = 42,
                               ChannelState initial = ChannelState::GOOD);

} // namespace channel
} // namespace arqsim
