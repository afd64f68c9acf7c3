#include "frame.hpp"
#include <stdexcept>
#include <utility>

namespace arqsim {
namespace channel {

const char* frameKindToString(FrameKind kind) {
    switch (kind) {
        case FrameKind::RR:        return "RR";
        case FrameKind::SREJ:      return "SREJ";
        case FrameKind::DATA:      return "DATA";
        case FrameKind::CORRUPTED: return "CORRUPTED";
        default: return "UNKNOWN";
    }
}

Frame Frame::makeRr(SeqNum seq) {
    Frame f;
    f.kind = FrameKind::RR;
    f.seq = seq;
    return f;
}

Frame Frame::makeSrej(SeqNum seq) {
    Frame f;
    f.kind = FrameKind::SREJ;
    f.seq = seq;
    return f;
}

Frame Frame::makeData(SeqNum seq, Bytes payload) {
    Frame f;
    f.kind = FrameKind::DATA;
    f.seq = seq;
    f.payload = std::move(payload);
    return f;
}

Frame Frame::makeCorrupted() {
    return Frame{};
}

uint64_t Frame::sizeBits(uint64_t overhead_bits) const {
    switch (kind) {
        case FrameKind::RR:
        case FrameKind::SREJ:
            return overhead_bits;
        case FrameKind::DATA:
            return static_cast<uint64_t>(payload.size()) * 8 + overhead_bits;
        case FrameKind::CORRUPTED:
        default:
            throw std::logic_error("Frame: size of a CORRUPTED frame is undefined");
    }
}

} // namespace channel
} // namespace arqsim
