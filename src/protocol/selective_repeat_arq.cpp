#include "selective_repeat_arq.hpp"
#include "arqsim/logging.hpp"
#include <stdexcept>
#include <utility>

namespace arqsim {
namespace protocol {

using channel::Frame;
using channel::FrameKind;

// ============================================================================
// Sender
// ============================================================================

SelectiveRepeatSender::SelectiveRepeatSender(SeqNum window_size)
    : window_size_(window_size)
{
    if (window_size_ < 1) {
        throw std::logic_error("SelectiveRepeatSender: window size must be >= 1");
    }
}

SeqNum SelectiveRepeatSender::sendFrame(Bytes data) {
    SeqNum seq = next_seq_;
    sent_frames_[seq] = std::move(data);
    next_seq_++;
    stats_.frames_sent++;

    LOG_LINK(TRACE, "SR-TX: stored seq=%lld window=[%lld,%lld) in_flight=%zu",
             static_cast<long long>(seq), static_cast<long long>(base_),
             static_cast<long long>(base_ + window_size_), sent_frames_.size());
    return seq;
}

bool SelectiveRepeatSender::handleAck(SeqNum seq) {
    auto it = sent_frames_.find(seq);
    if (it == sent_frames_.end()) {
        stats_.stale_acks++;
        LOG_LINK(TRACE, "SR-TX: ACK seq=%lld not outstanding (base=%lld)",
                 static_cast<long long>(seq), static_cast<long long>(base_));
        return false;
    }

    sent_frames_.erase(it);
    stats_.acks_received++;

    // Every outstanding seq lies in [base, next_seq), so the new base is the
    // smallest key left, or next_seq when the window is empty.
    SeqNum old_base = base_;
    base_ = sent_frames_.empty() ? next_seq_ : sent_frames_.begin()->first;

    if (base_ != old_base) {
        LOG_LINK(DEBUG, "SR-TX: ACK seq=%lld, base %lld -> %lld",
                 static_cast<long long>(seq), static_cast<long long>(old_base),
                 static_cast<long long>(base_));
    } else {
        LOG_LINK(DEBUG, "SR-TX: ACK seq=%lld retired ahead of base=%lld",
                 static_cast<long long>(seq), static_cast<long long>(base_));
    }
    return true;
}

std::optional<Bytes> SelectiveRepeatSender::handleNak(SeqNum seq) const {
    auto it = sent_frames_.find(seq);
    if (it == sent_frames_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<EventId> SelectiveRepeatSender::takeTimer(SeqNum seq) {
    auto it = timers_.find(seq);
    if (it == timers_.end()) {
        return std::nullopt;
    }
    EventId id = it->second;
    timers_.erase(it);
    return id;
}

std::vector<EventId> SelectiveRepeatSender::takeAllTimers() {
    std::vector<EventId> ids;
    ids.reserve(timers_.size());
    for (const auto& entry : timers_) {
        ids.push_back(entry.second);
    }
    timers_.clear();
    return ids;
}

// ============================================================================
// Receiver
// ============================================================================

SelectiveRepeatReceiver::SelectiveRepeatReceiver(size_t max_buffer_size)
    : max_buffer_size_(max_buffer_size)
{
}

ReceiveResult SelectiveRepeatReceiver::receiveFrame(SeqNum seq, const Frame& frame) {
    ReceiveResult result;

    switch (frame.kind) {
        case FrameKind::CORRUPTED:
            stats_.corrupted++;
            LOG_LINK(DEBUG, "SR-RX: corrupted frame dropped (base=%lld)",
                     static_cast<long long>(base_));
            return result;

        case FrameKind::RR:
        case FrameKind::SREJ:
            stats_.unexpected_control++;
            LOG_LINK(WARN, "SR-RX: %s seq=%lld on the data path, ignored",
                     channel::frameKindToString(frame.kind), static_cast<long long>(seq));
            return result;

        case FrameKind::DATA:
            break;
    }

    if (seq == base_) {
        deliverInOrder(frame.payload, result);
        result.response = Frame::makeRr(seq);
        stats_.acks_sent++;
    } else if (seq > base_) {
        stats_.out_of_order++;

        if (buffer_.count(seq) > 0) {
            stats_.duplicates++;
            LOG_LINK(DEBUG, "SR-RX: seq=%lld already buffered", static_cast<long long>(seq));
        } else if (buffer_size_ + frame.payload.size() <= max_buffer_size_) {
            buffer_size_ += frame.payload.size();
            buffer_.emplace(seq, frame.payload);
            LOG_LINK(DEBUG, "SR-RX: out-of-order seq=%lld buffered (expected %lld, buffer=%zu/%zu)",
                     static_cast<long long>(seq), static_cast<long long>(base_),
                     buffer_size_, max_buffer_size_);
        } else {
            stats_.buffer_drops++;
            LOG_LINK(INFO, "SR-RX: buffer full, dropped seq=%lld (%zu + %zu > %zu)",
                     static_cast<long long>(seq), buffer_size_, frame.payload.size(),
                     max_buffer_size_);
        }

        result.response = Frame::makeSrej(base_);
        stats_.naks_sent++;
    } else {
        stats_.duplicates++;
        LOG_LINK(DEBUG, "SR-RX: duplicate seq=%lld (base=%lld), re-ACK",
                 static_cast<long long>(seq), static_cast<long long>(base_));
        result.response = Frame::makeRr(seq);
        stats_.acks_sent++;
    }

    return result;
}

void SelectiveRepeatReceiver::deliverInOrder(Bytes payload, ReceiveResult& result) {
    stats_.frames_delivered++;
    stats_.bytes_delivered += payload.size();
    result.delivered.push_back(std::move(payload));
    base_++;

    // Release everything that is now contiguous
    auto it = buffer_.begin();
    while (it != buffer_.end() && it->first == base_) {
        buffer_size_ -= it->second.size();
        stats_.frames_delivered++;
        stats_.bytes_delivered += it->second.size();
        result.delivered.push_back(std::move(it->second));
        it = buffer_.erase(it);
        base_++;
    }

    LOG_LINK(TRACE, "SR-RX: delivered %zu frame(s), base=%lld, buffer=%zu",
             result.delivered.size(), static_cast<long long>(base_), buffer_size_);
}

} // namespace protocol
} // namespace arqsim
