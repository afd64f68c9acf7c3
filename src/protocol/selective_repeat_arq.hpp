#pragma once

#include "arqsim/types.hpp"
#include "channel/frame.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <vector>

namespace arqsim {
namespace protocol {

// Sender statistics
struct SenderStats {
    uint64_t frames_sent = 0;              // First transmissions
    uint64_t retransmissions = 0;          // All causes
    uint64_t retransmissions_timeout = 0;
    uint64_t retransmissions_nak = 0;
    uint64_t acks_received = 0;
    uint64_t stale_acks = 0;               // ACK for a seq no longer outstanding
    uint64_t naks_received = 0;
    uint64_t window_full = 0;              // Rejected send attempts
};

// Receiver statistics
struct ReceiverStats {
    uint64_t frames_delivered = 0;
    uint64_t bytes_delivered = 0;
    uint64_t out_of_order = 0;             // Buffered ahead of base
    uint64_t buffer_drops = 0;             // Out-of-order frames over the buffer cap
    uint64_t duplicates = 0;               // seq < base, or already buffered
    uint64_t corrupted = 0;
    uint64_t unexpected_control = 0;       // RR/SREJ on the data path
    uint64_t acks_sent = 0;
    uint64_t naks_sent = 0;
};

/**
 * Selective Repeat ARQ - sending side
 *
 * Sliding window over non-wrapping sequence numbers:
 * - canSend() admits a new frame while next_seq < base + window_size
 * - handleAck() retires one frame; base then jumps to the oldest frame
 *   still outstanding, skipping everything already acknowledged
 * - handleNak() only looks the payload up; the caller retransmits
 *
 * Also holds the retransmission timer id of each in-flight frame so the
 * link can cancel it on ACK. Not thread-safe; SimplexLink guards it.
 */
class SelectiveRepeatSender {
public:
    // Throws std::logic_error for window_size < 1
    explicit SelectiveRepeatSender(SeqNum window_size);

    bool canSend() const { return next_seq_ < base_ + window_size_; }

    // Assign the next sequence number and keep the payload for retransmission.
    // The caller checks canSend() first.
    SeqNum sendFrame(Bytes data);

    // Returns true if seq was outstanding
    bool handleAck(SeqNum seq);

    std::optional<Bytes> handleNak(SeqNum seq) const;
    std::optional<Bytes> frameForTimeout(SeqNum seq) const { return handleNak(seq); }

    bool isOutstanding(SeqNum seq) const { return sent_frames_.count(seq) > 0; }

    // Timer bookkeeping (one per in-flight seq)
    void setTimer(SeqNum seq, EventId id) { timers_[seq] = id; }
    std::optional<EventId> takeTimer(SeqNum seq);
    std::vector<EventId> takeAllTimers();

    SeqNum base() const { return base_; }
    SeqNum nextSeq() const { return next_seq_; }
    SeqNum windowSize() const { return window_size_; }
    size_t inFlight() const { return sent_frames_.size(); }
    size_t availableSlots() const {
        return static_cast<size_t>(base_ + window_size_ - next_seq_);
    }
    size_t activeTimers() const { return timers_.size(); }

    SenderStats& stats() { return stats_; }
    const SenderStats& stats() const { return stats_; }

private:
    SeqNum base_ = 0;
    SeqNum next_seq_ = 0;
    SeqNum window_size_;
    std::map<SeqNum, Bytes> sent_frames_;
    std::map<SeqNum, EventId> timers_;
    SenderStats stats_;
};

struct ReceiveResult {
    std::optional<channel::Frame> response;   // RR / SREJ to send back
    std::vector<Bytes> delivered;             // In-order payloads released
};

/**
 * Selective Repeat ARQ - receiving side
 *
 * - seq == base: deliver, then drain every contiguous buffered frame
 * - seq > base:  buffer if it fits under the byte cap, else drop; SREJ(base)
 * - seq < base:  duplicate, RR(seq) so the sender can retire it
 * - CORRUPTED:   nothing; the sender's timer recovers the frame
 */
class SelectiveRepeatReceiver {
public:
    explicit SelectiveRepeatReceiver(size_t max_buffer_size = 256 * 1024);

    ReceiveResult receiveFrame(SeqNum seq, const channel::Frame& frame);

    SeqNum base() const { return base_; }
    size_t bufferSize() const { return buffer_size_; }
    size_t maxBufferSize() const { return max_buffer_size_; }
    size_t bufferedFrames() const { return buffer_.size(); }
    bool isBuffered(SeqNum seq) const { return buffer_.count(seq) > 0; }

    ReceiverStats& stats() { return stats_; }
    const ReceiverStats& stats() const { return stats_; }

private:
    void deliverInOrder(Bytes payload, ReceiveResult& result);

    SeqNum base_ = 0;
    std::map<SeqNum, Bytes> buffer_;
    size_t buffer_size_ = 0;
    size_t max_buffer_size_;
    ReceiverStats stats_;
};

} // namespace protocol
} // namespace arqsim
