#pragma once

#include "arqsim/types.hpp"
#include <cstdint>

namespace arqsim {
namespace channel {

enum class FrameKind : uint8_t {
    RR = 0,         // Receive Ready: positive ACK for seq
    SREJ = 1,       // Selective reject: NAK naming the oldest missing seq
    DATA = 2,       // Payload frame, seq in header
    CORRUPTED = 3,  // Receive-side outcome only, never transmitted
};

const char* frameKindToString(FrameKind kind);

/**
 * Link-layer frame as seen by the physical channel.
 *
 * RR/SREJ are header-only. DATA carries its sequence number in the header
 * plus the payload. CORRUPTED is what the channel delivers in place of a
 * frame the error model damaged; it has no sequence number and no size.
 */
struct Frame {
    FrameKind kind = FrameKind::CORRUPTED;
    SeqNum seq = -1;
    Bytes payload;

    static Frame makeRr(SeqNum seq);
    static Frame makeSrej(SeqNum seq);
    static Frame makeData(SeqNum seq, Bytes payload);
    static Frame makeCorrupted();

    bool isControl() const { return kind == FrameKind::RR || kind == FrameKind::SREJ; }
    bool isData() const { return kind == FrameKind::DATA; }
    bool isCorrupted() const { return kind == FrameKind::CORRUPTED; }

    // Size on the wire. Throws std::logic_error for CORRUPTED.
    uint64_t sizeBits(uint64_t overhead_bits) const;
};

} // namespace channel
} // namespace arqsim
