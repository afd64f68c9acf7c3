#include "transfer.hpp"
#include "event_loop.hpp"
#include "channel/simplex_channel.hpp"
#include "arqsim/logging.hpp"

#include <algorithm>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

namespace arqsim {
namespace sim {

namespace {

constexpr uint64_t REVERSE_SEED_OFFSET = 0x9E3779B97F4A7C15ULL;
constexpr auto CONSUMER_POLL = std::chrono::milliseconds(10);
constexpr auto PUMP_IDLE = std::chrono::milliseconds(1);

std::vector<Bytes> splitPayload(const Bytes& payload, size_t frame_size) {
    std::vector<Bytes> chunks;
    chunks.reserve((payload.size() + frame_size - 1) / frame_size);
    for (size_t off = 0; off < payload.size(); off += frame_size) {
        size_t len = std::min(frame_size, payload.size() - off);
        chunks.emplace_back(payload.begin() + off, payload.begin() + off + len);
    }
    return chunks;
}

} // namespace

Transfer::Transfer(SeqNum window_size, size_t frame_size, const TransferOptions& options)
    : window_size_(window_size)
    , frame_size_(frame_size)
    , options_(options)
{
    if (window_size_ < 1) {
        throw std::logic_error("Transfer: window size must be >= 1");
    }
    if (frame_size_ == 0) {
        throw std::logic_error("Transfer: frame size must be >= 1 byte");
    }
}

TransferResult Transfer::run(const Bytes& payload) {
    TransferResult result;
    auto wall_start = std::chrono::steady_clock::now();

    const std::vector<Bytes> chunks = splitPayload(payload, frame_size_);
    const SeqNum num_frames = static_cast<SeqNum>(chunks.size());
    result.frames = chunks.size();

    if (chunks.empty()) {
        result.completed = true;
        result.payload_intact = true;
        return result;
    }

    const PhysicalConfig& phy = options_.physical;

    EventLoop loop;
    channel::SimplexChannel forward(
        loop, phy, phy.forward_path_delay,
        channel::createErrorModel(options_.error_model, options_.channel, options_.seed),
        "fwd");
    channel::SimplexChannel reverse(
        loop, phy, phy.reverse_path_delay,
        channel::createErrorModel(options_.error_model, options_.channel,
                                  options_.seed + REVERSE_SEED_OFFSET),
        "rev");
    forward.setLockstep(true);
    reverse.setLockstep(true);

    protocol::SimplexLink link(loop, forward, reverse, window_size_, phy);

    std::atomic<bool> running{true};
    std::atomic<bool> done{false};
    std::atomic<double> completion_time{0.0};

    // Next chunk to hand to the sender
    std::mutex fill_mutex;
    size_t next_chunk = 0;

    auto fillWindow = [&](SimTime now) {
        std::lock_guard<std::mutex> lock(fill_mutex);
        while (next_chunk < chunks.size()) {
            if (!link.sendData(now, chunks[next_chunk])) {
                break;  // Window full; the next ACK refills it
            }
            next_chunk++;
        }
    };

    Bytes received;
    received.reserve(payload.size());

    LOG_SIM(INFO, "Transfer start: %zu bytes, %lld frames of %zu bytes, W=%lld, model=%s",
            payload.size(), static_cast<long long>(num_frames), frame_size_,
            static_cast<long long>(window_size_), errorModelKindToString(options_.error_model));

    fillWindow(0.0);

    std::thread forward_consumer([&]() {
        while (running) {
            auto delivery = forward.receiveFor(CONSUMER_POLL);
            if (!delivery) {
                continue;
            }
            protocol::ReceiveResult rx = link.receiveFrame(*delivery);
            for (const Bytes& chunk : rx.delivered) {
                received.insert(received.end(), chunk.begin(), chunk.end());
            }
        }
    });

    std::thread reverse_consumer([&]() {
        while (running) {
            auto delivery = reverse.receiveFor(CONSUMER_POLL);
            if (!delivery) {
                continue;
            }
            link.handleResponse(*delivery);

            if (link.senderBase() >= num_frames) {
                if (!done.exchange(true)) {
                    completion_time = delivery->arrival_time;
                }
            } else {
                fillWindow(delivery->arrival_time);
            }
        }
    });

    auto wallElapsed = [&]() {
        return std::chrono::duration<double>(std::chrono::steady_clock::now() - wall_start).count();
    };

    // Pump
    while (!done) {
        uint64_t fired = 0;
        while (!done && !stop_requested_ && loop.pendingCount() > 0) {
            loop.advance();
            if (loop.now() > options_.sim_time_budget_s) {
                break;
            }
            if (++fired % 256 == 0 && wallElapsed() > options_.wall_time_budget_s) {
                break;
            }
        }

        if (done) {
            break;
        }
        if (loop.now() > options_.sim_time_budget_s) {
            LOG_SIM(WARN, "Transfer hit the simulated-time budget (%.1f s)",
                    options_.sim_time_budget_s);
            result.timed_out = true;
            break;
        }
        if (wallElapsed() > options_.wall_time_budget_s) {
            LOG_SIM(WARN, "Transfer hit the wall-clock budget (%.1f s)",
                    options_.wall_time_budget_s);
            result.timed_out = true;
            break;
        }
        if (stop_requested_) {
            LOG_SIM(INFO, "Transfer stopped at t=%.4f", loop.now());
            result.timed_out = true;
            break;
        }

        std::this_thread::sleep_for(PUMP_IDLE);
    }

    // Shutdown: closing releases any lock-step arrival still waiting
    running = false;
    forward.close();
    reverse.close();
    forward_consumer.join();
    reverse_consumer.join();
    link.cancelTimers();
    loop.clear();

    result.completed = done;
    result.sim_time = result.completed ? completion_time.load() : loop.now();
    result.wall_seconds = wallElapsed();
    result.link = link.stats();
    result.forward = forward.errorStats();
    result.reverse = reverse.errorStats();
    result.bytes_delivered = received.size();
    result.retransmissions = result.link.retransmissions;
    result.payload_intact = (received == payload);
    if (result.sim_time > 0.0) {
        result.goodput_bps = static_cast<double>(result.bytes_delivered) * 8.0 / result.sim_time;
    }

    LOG_SIM(INFO, "Transfer %s: %llu/%zu bytes in %.4f s sim (%.2f s wall), %.3f Mbps, "
            "retx=%llu (timeout %llu, srej %llu), intact=%s",
            result.completed ? "complete" : "incomplete",
            static_cast<unsigned long long>(result.bytes_delivered), payload.size(),
            result.sim_time, result.wall_seconds, result.goodput_bps / 1e6,
            static_cast<unsigned long long>(result.retransmissions),
            static_cast<unsigned long long>(result.link.retransmissions_timeout),
            static_cast<unsigned long long>(result.link.retransmissions_nak),
            result.payload_intact ? "yes" : "no");

    return result;
}

void runTransfer(SeqNum window_size, size_t frame_size, const Bytes& payload) {
    Transfer transfer(window_size, frame_size);
    TransferResult result = transfer.run(payload);
    if (!result.completed) {
        LOG_SIM(WARN, "run_transfer W=%lld frame=%zu did not complete",
                static_cast<long long>(window_size), frame_size);
    }
}

} // namespace sim
} // namespace arqsim
