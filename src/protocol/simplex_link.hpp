#pragma once

#include "arqsim/types.hpp"
#include "selective_repeat_arq.hpp"
#include "channel/simplex_channel.hpp"
#include "sim/event_loop.hpp"

#include <map>
#include <mutex>
#include <optional>

namespace arqsim {
namespace protocol {

// Combined sender + receiver counters for one link
struct LinkStats {
    uint64_t frames_sent = 0;
    uint64_t retransmissions = 0;
    uint64_t retransmissions_timeout = 0;
    uint64_t retransmissions_nak = 0;
    uint64_t naks_suppressed = 0;
    uint64_t acks_received = 0;
    uint64_t naks_received = 0;
    uint64_t frames_delivered = 0;
    uint64_t bytes_delivered = 0;
    uint64_t duplicates = 0;
    uint64_t out_of_order = 0;
    uint64_t buffer_drops = 0;
    uint64_t corrupted_received = 0;
};

/**
 * SimplexLink - Selective Repeat ARQ over a forward/reverse channel pair
 *
 * Data flows sender -> forward channel -> receiver; RR/SREJ flow back on
 * the reverse channel. The link owns both window states, each behind its
 * own mutex, and never holds either lock while calling into a channel.
 *
 * The transmitter is serial: a frame starts no earlier than the end of the
 * previous one. Every DATA transmission arms a retransmission timer at
 *   start + timeout_multiplier * round_trip_estimate
 * A firing timer retransmits and schedules a fresh timer event, so long
 * runs of retransmissions never nest.
 *
 * Typical wiring (see sim::Transfer):
 *   forward consumer:  link.receiveFrame(forward.receive())
 *   reverse consumer:  link.handleResponse(reverse.receive())
 *   sender:            while (link.canSend()) link.sendData(t, chunk)
 */
class SimplexLink {
public:
    SimplexLink(sim::EventLoop& loop,
                channel::SimplexChannel& forward,
                channel::SimplexChannel& reverse,
                SeqNum window_size,
                const PhysicalConfig& config);
    ~SimplexLink();

    SimplexLink(const SimplexLink&) = delete;
    SimplexLink& operator=(const SimplexLink&) = delete;

    // Returns the frame's transmission duration, or nullopt if the window is full
    std::optional<double> sendData(SimTime now, Bytes data);

    bool canSend() const;

    // Sender side: process a frame taken from the reverse channel
    void handleResponse(const channel::Delivery& delivery);
    void handleAck(SeqNum seq);
    void handleNak(SimTime now, SeqNum seq);

    // Receiver side: process a frame taken from the forward channel and send
    // its RR/SREJ on the reverse channel
    ReceiveResult receiveFrame(const channel::Delivery& delivery);

    // Cancel every armed timer (shutdown)
    void cancelTimers();

    SeqNum senderBase() const;
    SeqNum nextSeq() const;
    SeqNum receiverBase() const;
    size_t inFlight() const;
    size_t receiverBufferBytes() const;
    SimTime transmitterFreeAt() const;

    LinkStats stats() const;

private:
    // Put a DATA frame on the forward channel; returns {start, duration, rtt}
    struct Transmission {
        SimTime start;
        double duration;
        double rtt;
    };
    Transmission transmit(SimTime now, SeqNum seq, Bytes payload);

    void armTimer(SeqNum seq, SimTime start, double rtt);
    void onTimeout(SeqNum seq, SimTime fire_time);

    sim::EventLoop& loop_;
    channel::SimplexChannel& forward_;
    channel::SimplexChannel& reverse_;
    PhysicalConfig config_;

    mutable std::mutex sender_mutex_;
    SelectiveRepeatSender sender_;
    std::map<SeqNum, SimTime> last_tx_;   // Start of the latest transmission per seq
    uint64_t naks_suppressed_ = 0;

    mutable std::mutex receiver_mutex_;
    SelectiveRepeatReceiver receiver_;

    mutable std::mutex tx_mutex_;
    SimTime tx_free_at_ = 0.0;
};

} // namespace protocol
} // namespace arqsim
