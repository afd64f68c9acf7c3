#include "simplex_channel.hpp"
#include "arqsim/logging.hpp"
#include <stdexcept>
#include <utility>

namespace arqsim {
namespace channel {

SimplexChannel::SimplexChannel(sim::EventLoop& loop,
                               const PhysicalConfig& config,
                               double path_delay,
                               ErrorModelPtr error_model,
                               std::string name)
    : loop_(loop)
    , config_(config)
    , path_delay_(path_delay)
    , name_(std::move(name))
    , error_model_(std::move(error_model))
{
    if (!error_model_) {
        error_model_ = createErrorModel(ErrorModelKind::JUMP_AHEAD);
    }
}

SimplexChannel::~SimplexChannel() {
    close();
}

SendResult SimplexChannel::send(SimTime current_time, Frame frame) {
    if (frame.isCorrupted()) {
        throw std::logic_error("SimplexChannel: CORRUPTED frames cannot be transmitted");
    }

    const uint64_t size_bits = frame.sizeBits(config_.overheadBits());

    TransmissionOutcome outcome;
    {
        std::lock_guard<std::mutex> lock(model_mutex_);
        outcome = error_model_->transmit(size_bits);
    }

    SendResult result;
    result.propagation_duration = config_.transmissionTime(size_bits);
    result.round_trip_estimate = config_.roundTrip(size_bits);

    SimTime arrival = current_time + result.propagation_duration + path_delay_ +
                      config_.processing_delay;

    LOG_CHAN(TRACE, "%s: %s seq=%lld %llu bits at t=%.6f -> arrive t=%.6f%s (state=%s)",
             name_.c_str(), frameKindToString(frame.kind), static_cast<long long>(frame.seq),
             static_cast<unsigned long long>(size_bits), current_time, arrival,
             outcome.corrupted ? " CORRUPTED" : "", channelStateToString(outcome.final_state));

    Frame delivered = outcome.corrupted ? Frame::makeCorrupted() : std::move(frame);
    loop_.schedule(arrival, [this, arrival, f = std::move(delivered)]() mutable {
        deliver(arrival, std::move(f));
    });

    return result;
}

void SimplexChannel::deliver(SimTime arrival_time, Frame frame) {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    if (closed_) {
        return;
    }

    uint64_t ticket = ++delivered_;
    queue_.push_back(Delivery{arrival_time, std::move(frame)});
    queue_cv_.notify_all();

    if (lockstep_) {
        queue_cv_.wait(lock, [&] { return closed_ || completed_ >= ticket; });
    }
}

void SimplexChannel::markConsumerIdleLocked() {
    // Back in receive(): everything taken so far has been handled
    if (completed_ != taken_) {
        completed_ = taken_;
        queue_cv_.notify_all();
    }
}

Delivery SimplexChannel::popLocked() {
    Delivery d = std::move(queue_.front());
    queue_.pop_front();
    taken_++;
    return d;
}

Delivery SimplexChannel::receive() {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    markConsumerIdleLocked();
    queue_cv_.wait(lock, [&] { return closed_ || !queue_.empty(); });

    if (queue_.empty()) {
        throw std::logic_error("SimplexChannel: receive() on a closed channel");
    }
    return popLocked();
}

std::optional<Delivery> SimplexChannel::receiveFor(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    markConsumerIdleLocked();
    queue_cv_.wait_for(lock, timeout, [&] { return closed_ || !queue_.empty(); });

    if (queue_.empty()) {
        return std::nullopt;
    }
    return popLocked();
}

std::optional<Delivery> SimplexChannel::tryReceive() {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    markConsumerIdleLocked();
    if (queue_.empty()) {
        return std::nullopt;
    }
    return popLocked();
}

void SimplexChannel::setLockstep(bool enabled) {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    lockstep_ = enabled;
    queue_cv_.notify_all();
}

void SimplexChannel::close() {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    if (!closed_) {
        closed_ = true;
        LOG_CHAN(DEBUG, "%s: closed (delivered=%llu, queued=%zu)", name_.c_str(),
                 static_cast<unsigned long long>(delivered_), queue_.size());
    }
    queue_cv_.notify_all();
}

bool SimplexChannel::isClosed() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return closed_;
}

size_t SimplexChannel::queued() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return queue_.size();
}

ChannelState SimplexChannel::state() const {
    std::lock_guard<std::mutex> lock(model_mutex_);
    return error_model_->state();
}

ChannelStats SimplexChannel::errorStats() const {
    std::lock_guard<std::mutex> lock(model_mutex_);
    return error_model_->stats();
}

} // namespace channel
} // namespace arqsim
