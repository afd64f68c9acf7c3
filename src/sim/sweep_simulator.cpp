#include "sweep_simulator.hpp"
#include "channel/error_model.hpp"
#include "arqsim/logging.hpp"

#include <algorithm>
#include <limits>
#include <map>
#include <set>
#include <stdexcept>

namespace arqsim {
namespace sim {

namespace {

struct PendingFrame {
    SimTime resolve_time;   // When the sender learns the outcome
    bool success;
};

// Reverse channel runs on its own stream, decorrelated from the forward one
constexpr uint64_t REVERSE_SEED_OFFSET = 0x9E3779B97F4A7C15ULL;

} // namespace

ArqResult simulateArq(uint64_t window_size, uint64_t frame_payload_bytes,
                      const SweepOptions& options) {
    if (window_size == 0) {
        throw std::logic_error("simulateArq: window size must be >= 1");
    }
    if (frame_payload_bytes == 0) {
        throw std::logic_error("simulateArq: frame payload must be >= 1 byte");
    }
    if (options.file_size_bytes == 0) {
        throw std::logic_error("simulateArq: file size must be >= 1 byte");
    }

    const PhysicalConfig& phy = options.physical;
    const uint64_t file_size = options.file_size_bytes;
    const uint64_t num_frames = (file_size + frame_payload_bytes - 1) / frame_payload_bytes;
    const uint64_t last_payload = file_size - frame_payload_bytes * (num_frames - 1);
    const uint64_t ack_bits = phy.overheadBits();

    auto fwd = channel::createErrorModel(options.error_model, options.channel, options.seed);
    auto rev = channel::createErrorModel(options.error_model, options.channel,
                                         options.seed + REVERSE_SEED_OFFSET);

    auto frameBits = [&](uint64_t seq) {
        uint64_t payload = (seq == num_frames - 1) ? last_payload : frame_payload_bytes;
        return payload * 8 + phy.overheadBits();
    };

    ArqResult result;
    result.frames = num_frames;

    uint64_t base = 0;
    SimTime clock = 0.0;
    std::map<uint64_t, PendingFrame> outstanding;
    std::set<uint64_t> acked;

    LOG_SIM(DEBUG, "Sweep run: W=%llu L=%llu frames=%llu seed=%llu model=%s",
            static_cast<unsigned long long>(window_size),
            static_cast<unsigned long long>(frame_payload_bytes),
            static_cast<unsigned long long>(num_frames),
            static_cast<unsigned long long>(options.seed),
            errorModelKindToString(options.error_model));

    while (base < num_frames) {
        const uint64_t window_end = std::min(num_frames, base + window_size);

        // Send every frame in the window that is neither in flight nor acknowledged
        for (uint64_t seq = base; seq < window_end; seq++) {
            if (outstanding.count(seq) > 0 || acked.count(seq) > 0) {
                continue;
            }

            uint64_t bits = frameBits(seq);
            bool success = fwd->frameSuccess(bits) && rev->frameSuccess(ack_bits);

            outstanding[seq] = PendingFrame{
                clock + phy.roundTrip(bits) * phy.sweep_timeout_margin, success};
            clock += phy.transmissionTime(bits);
            result.transmissions++;
        }

        // Resolve everything whose outcome is now known
        SimTime earliest = std::numeric_limits<double>::infinity();
        bool resolved = false;
        for (auto it = outstanding.begin(); it != outstanding.end();) {
            if (it->second.resolve_time > clock) {
                earliest = std::min(earliest, it->second.resolve_time);
                ++it;
                continue;
            }

            if (it->second.success) {
                acked.insert(it->first);
            } else {
                result.retransmissions++;
                LOG_SIM(TRACE, "Frame %llu failed, resend at t=%.6f",
                        static_cast<unsigned long long>(it->first), clock);
            }
            it = outstanding.erase(it);
            resolved = true;
        }

        while (!acked.empty() && *acked.begin() == base) {
            acked.erase(acked.begin());
            base++;
        }

        // Transmitter idle and nothing resolved: wait for the next outcome
        if (!resolved && base < num_frames && !outstanding.empty()) {
            clock = std::max(clock, earliest);
        }
    }

    result.time_seconds = clock;
    result.goodput_bps = clock > 0.0 ? static_cast<double>(file_size) * 8.0 / clock : 0.0;

    LOG_SIM(DEBUG, "Sweep done: W=%llu L=%llu goodput=%.3f Mbps retx=%llu time=%.4f s",
            static_cast<unsigned long long>(window_size),
            static_cast<unsigned long long>(frame_payload_bytes),
            result.goodput_bps / 1e6,
            static_cast<unsigned long long>(result.retransmissions), result.time_seconds);

    return result;
}

} // namespace sim
} // namespace arqsim
