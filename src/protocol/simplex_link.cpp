#include "simplex_link.hpp"
#include "arqsim/logging.hpp"
#include <algorithm>
#include <utility>

namespace arqsim {
namespace protocol {

using channel::Delivery;
using channel::Frame;
using channel::FrameKind;

SimplexLink::SimplexLink(sim::EventLoop& loop,
                         channel::SimplexChannel& forward,
                         channel::SimplexChannel& reverse,
                         SeqNum window_size,
                         const PhysicalConfig& config)
    : loop_(loop)
    , forward_(forward)
    , reverse_(reverse)
    , config_(config)
    , sender_(window_size)
    , receiver_(config.receiver_buffer_bytes)
{
    LOG_LINK(DEBUG, "Link up: window=%lld, rx buffer=%zu bytes, overhead=%u bytes",
             static_cast<long long>(window_size), config_.receiver_buffer_bytes,
             config_.frame_overhead_bytes);
}

SimplexLink::~SimplexLink() {
    cancelTimers();
}

// ============================================================================
// Sending side
// ============================================================================

bool SimplexLink::canSend() const {
    std::lock_guard<std::mutex> lock(sender_mutex_);
    return sender_.canSend();
}

std::optional<double> SimplexLink::sendData(SimTime now, Bytes data) {
    SeqNum seq;
    Bytes copy;
    {
        std::lock_guard<std::mutex> lock(sender_mutex_);
        if (!sender_.canSend()) {
            sender_.stats().window_full++;
            LOG_LINK(DEBUG, "Window full (base=%lld next=%lld), not sent",
                     static_cast<long long>(sender_.base()),
                     static_cast<long long>(sender_.nextSeq()));
            return std::nullopt;
        }
        copy = data;
        seq = sender_.sendFrame(std::move(data));
    }

    Transmission tx = transmit(now, seq, std::move(copy));
    armTimer(seq, tx.start, tx.rtt);
    return tx.duration;
}

SimplexLink::Transmission SimplexLink::transmit(SimTime now, SeqNum seq, Bytes payload) {
    Frame frame = Frame::makeData(seq, std::move(payload));

    // Holding tx_mutex_ across send() keeps the channel's Markov state
    // consumed in transmission order.
    std::lock_guard<std::mutex> tx_lock(tx_mutex_);
    SimTime start = std::max(now, tx_free_at_);
    channel::SendResult sent = forward_.send(start, std::move(frame));
    tx_free_at_ = start + sent.propagation_duration;

    {
        std::lock_guard<std::mutex> lock(sender_mutex_);
        last_tx_[seq] = start;
    }

    return Transmission{start, sent.propagation_duration, sent.round_trip_estimate};
}

void SimplexLink::armTimer(SeqNum seq, SimTime start, double rtt) {
    SimTime fire_time = start + config_.timeout_multiplier * rtt;
    EventId id = loop_.schedule(fire_time, [this, seq, fire_time]() {
        onTimeout(seq, fire_time);
    });

    std::optional<EventId> replaced;
    bool stale = false;
    {
        std::lock_guard<std::mutex> lock(sender_mutex_);
        if (sender_.isOutstanding(seq)) {
            replaced = sender_.takeTimer(seq);
            sender_.setTimer(seq, id);
        } else {
            stale = true;  // ACKed while the frame was on its way out
        }
    }

    if (replaced) {
        loop_.cancel(*replaced);
    }
    if (stale) {
        loop_.cancel(id);
        return;
    }

    LOG_LINK(TRACE, "Timer armed seq=%lld at t=%.6f", static_cast<long long>(seq), fire_time);
}

void SimplexLink::onTimeout(SeqNum seq, SimTime fire_time) {
    Bytes payload;
    {
        std::lock_guard<std::mutex> lock(sender_mutex_);
        sender_.takeTimer(seq);
        std::optional<Bytes> stored = sender_.frameForTimeout(seq);
        if (!stored) {
            return;  // Already acknowledged
        }
        payload = std::move(*stored);
        sender_.stats().retransmissions++;
        sender_.stats().retransmissions_timeout++;
    }

    LOG_LINK(DEBUG, "Timeout seq=%lld at t=%.6f, retransmitting",
             static_cast<long long>(seq), fire_time);

    Transmission tx = transmit(fire_time, seq, std::move(payload));
    armTimer(seq, tx.start, tx.rtt);
}

void SimplexLink::handleResponse(const Delivery& delivery) {
    const Frame& frame = delivery.frame;
    switch (frame.kind) {
        case FrameKind::RR:
            handleAck(frame.seq);
            break;

        case FrameKind::SREJ:
            handleNak(delivery.arrival_time, frame.seq);
            break;

        case FrameKind::CORRUPTED:
            // Lost ACK/NAK; the retransmission timer covers it
            LOG_LINK(DEBUG, "Corrupted response at t=%.6f dropped", delivery.arrival_time);
            break;

        case FrameKind::DATA:
            LOG_LINK(WARN, "DATA seq=%lld on the reverse channel, ignored",
                     static_cast<long long>(frame.seq));
            break;
    }
}

void SimplexLink::handleAck(SeqNum seq) {
    std::optional<EventId> timer;
    {
        std::lock_guard<std::mutex> lock(sender_mutex_);
        sender_.handleAck(seq);
        timer = sender_.takeTimer(seq);
        last_tx_.erase(seq);
    }

    if (timer) {
        loop_.cancel(*timer);
    }
}

void SimplexLink::handleNak(SimTime now, SeqNum seq) {
    Bytes payload;
    {
        std::lock_guard<std::mutex> lock(sender_mutex_);
        sender_.stats().naks_received++;

        std::optional<Bytes> stored = sender_.handleNak(seq);
        if (!stored) {
            return;
        }

        // Every out-of-order arrival repeats SREJ(base). Resend at most once
        // per round trip; later copies refer to the same hole.
        auto it = last_tx_.find(seq);
        uint64_t bits = static_cast<uint64_t>(stored->size()) * 8 + config_.overheadBits();
        if (it != last_tx_.end() && now - it->second < config_.roundTrip(bits)) {
            naks_suppressed_++;
            LOG_LINK(TRACE, "SREJ seq=%lld within one RTT of last send, ignored",
                     static_cast<long long>(seq));
            return;
        }

        payload = std::move(*stored);
        sender_.stats().retransmissions++;
        sender_.stats().retransmissions_nak++;
    }

    LOG_LINK(DEBUG, "SREJ seq=%lld at t=%.6f, retransmitting", static_cast<long long>(seq), now);

    Transmission tx = transmit(now, seq, std::move(payload));
    armTimer(seq, tx.start, tx.rtt);
}

// ============================================================================
// Receiving side
// ============================================================================

ReceiveResult SimplexLink::receiveFrame(const Delivery& delivery) {
    ReceiveResult result;
    {
        std::lock_guard<std::mutex> lock(receiver_mutex_);
        result = receiver_.receiveFrame(delivery.frame.seq, delivery.frame);
    }

    if (result.response) {
        reverse_.send(delivery.arrival_time, *result.response);
    }
    return result;
}

void SimplexLink::cancelTimers() {
    std::vector<EventId> ids;
    {
        std::lock_guard<std::mutex> lock(sender_mutex_);
        ids = sender_.takeAllTimers();
    }
    for (EventId id : ids) {
        loop_.cancel(id);
    }
}

// ============================================================================
// Accessors
// ============================================================================

SeqNum SimplexLink::senderBase() const {
    std::lock_guard<std::mutex> lock(sender_mutex_);
    return sender_.base();
}

SeqNum SimplexLink::nextSeq() const {
    std::lock_guard<std::mutex> lock(sender_mutex_);
    return sender_.nextSeq();
}

size_t SimplexLink::inFlight() const {
    std::lock_guard<std::mutex> lock(sender_mutex_);
    return sender_.inFlight();
}

SeqNum SimplexLink::receiverBase() const {
    std::lock_guard<std::mutex> lock(receiver_mutex_);
    return receiver_.base();
}

size_t SimplexLink::receiverBufferBytes() const {
    std::lock_guard<std::mutex> lock(receiver_mutex_);
    return receiver_.bufferSize();
}

SimTime SimplexLink::transmitterFreeAt() const {
    std::lock_guard<std::mutex> lock(tx_mutex_);
    return tx_free_at_;
}

LinkStats SimplexLink::stats() const {
    LinkStats out;
    {
        std::lock_guard<std::mutex> lock(sender_mutex_);
        const SenderStats& s = sender_.stats();
        out.frames_sent = s.frames_sent;
        out.retransmissions = s.retransmissions;
        out.retransmissions_timeout = s.retransmissions_timeout;
        out.retransmissions_nak = s.retransmissions_nak;
        out.acks_received = s.acks_received;
        out.naks_received = s.naks_received;
        out.naks_suppressed = naks_suppressed_;
    }
    {
        std::lock_guard<std::mutex> lock(receiver_mutex_);
        const ReceiverStats& r = receiver_.stats();
        out.frames_delivered = r.frames_delivered;
        out.bytes_delivered = r.bytes_delivered;
        out.duplicates = r.duplicates;
        out.out_of_order = r.out_of_order;
        out.buffer_drops = r.buffer_drops;
        out.corrupted_received = r.corrupted;
    }
    return out;
}

} // namespace protocol
} // namespace arqsim
