#include "error_model.hpp"
#include "arqsim/logging.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace arqsim {
namespace channel {

// ============================================================================
// ErrorModel (shared bookkeeping)
// ============================================================================

ErrorModel::ErrorModel(const GilbertElliotParams& params, uint64_t seed, ChannelState initial)
    : params_(params)
    , state_(initial)
    , rng_(seed)
{
}

double ErrorModel::uniformOpen() {
    double r = 0.0;
    while (r <= 0.0) {
        r = unit_(rng_);
    }
    return r;
}

void ErrorModel::countBits(ChannelState s, uint64_t bits) {
    stats_.bits += bits;
    if (s == ChannelState::GOOD) {
        stats_.bits_in_good += bits;
    } else {
        stats_.bits_in_bad += bits;
    }
}

void ErrorModel::flipState() {
    state_ = (state_ == ChannelState::GOOD) ? ChannelState::BAD : ChannelState::GOOD;
    stats_.transitions++;
}

// ============================================================================
// BitLoopErrorModel
// ============================================================================

BitLoopErrorModel::BitLoopErrorModel(const GilbertElliotParams& params, uint64_t seed,
                                     ChannelState initial)
    : ErrorModel(params, seed, initial)
{
}

TransmissionOutcome BitLoopErrorModel::transmit(uint64_t num_bits) {
    if (num_bits == 0) {
        throw std::logic_error("BitLoopErrorModel: cannot transmit 0 bits");
    }

    bool corrupted = false;
    for (uint64_t i = 0; i < num_bits; i++) {
        // Separate draws for the error test and the transition test.
        // Both are consumed even once the frame is already corrupted.
        ChannelState s = state_;

        if (uniform() < params_.berFor(s)) {
            corrupted = true;
        }
        countBits(s, 1);

        if (uniform() < params_.exitProbability(s)) {
            flipState();
        }
    }

    stats_.frames++;
    if (corrupted) {
        stats_.corrupted_frames++;
    }
    return TransmissionOutcome{corrupted, state_};
}

// ============================================================================
// JumpAheadErrorModel
// ============================================================================

JumpAheadErrorModel::JumpAheadErrorModel(const GilbertElliotParams& params, uint64_t seed,
                                         ChannelState initial)
    : ErrorModel(params, seed, initial)
{
    bits_until_transition_ = sampleSojourn();
}

uint64_t JumpAheadErrorModel::geometricSojourn(double p, double r) {
    if (p >= 1.0) {
        return 1;
    }
    if (p <= 0.0) {
        return std::numeric_limits<uint64_t>::max();
    }

    double k = std::floor(std::log(r) / std::log1p(-p)) + 1.0;
    if (k >= static_cast<double>(std::numeric_limits<uint64_t>::max())) {
        return std::numeric_limits<uint64_t>::max();
    }
    return std::max<uint64_t>(1, static_cast<uint64_t>(k));
}

uint64_t JumpAheadErrorModel::sampleSojourn() {
    return geometricSojourn(params_.exitProbability(state_), uniformOpen());
}

TransmissionOutcome JumpAheadErrorModel::transmit(uint64_t num_bits) {
    if (num_bits == 0) {
        throw std::logic_error("JumpAheadErrorModel: cannot transmit 0 bits");
    }

    bool corrupted = false;
    uint64_t remaining = num_bits;

    while (remaining > 0) {
        uint64_t chunk = std::min(remaining, bits_until_transition_);

        if (!corrupted) {
            // P(at least one error in chunk) = 1 - (1 - ber)^chunk
            double ber = params_.berFor(state_);
            double p_error = -std::expm1(static_cast<double>(chunk) * std::log1p(-ber));
            if (uniform() < p_error) {
                corrupted = true;
            }
        }

        countBits(state_, chunk);
        remaining -= chunk;
        bits_until_transition_ -= chunk;

        if (bits_until_transition_ == 0) {
            flipState();
            bits_until_transition_ = sampleSojourn();
        }
    }

    stats_.frames++;
    if (corrupted) {
        stats_.corrupted_frames++;
    }
    return TransmissionOutcome{corrupted, state_};
}

// ============================================================================
// Factory
// ============================================================================

ErrorModelPtr createErrorModel(ErrorModelKind kind, const GilbertElliotParams& params,
                               uint64_t seed, ChannelState initial) {
    switch (kind) {
        case ErrorModelKind::BIT_LOOP:
            return std::make_unique<BitLoopErrorModel>(params, seed, initial);

        case ErrorModelKind::JUMP_AHEAD:
            return std::make_unique<JumpAheadErrorModel>(params, seed, initial);

        default:
            LOG_CHAN(WARN, "Unknown error model kind %d, using jump-ahead", static_cast<int>(kind));
            return std::make_unique<JumpAheadErrorModel>(params, seed, initial);
    }
}

} // namespace channel
} // namespace arqsim
