// test_selective_repeat.cpp - Selective Repeat ARQ sender/receiver and link tests
//
// Window-state tests drive SelectiveRepeatSender / SelectiveRepeatReceiver
// directly. Link tests run SimplexLink over real channels, pumping the
// EventLoop and draining both channels from a single thread.

#include "protocol/selective_repeat_arq.hpp"
#include "protocol/simplex_link.hpp"
#include "channel/simplex_channel.hpp"
#include "sim/event_loop.hpp"
#include <cmath>
#include <functional>
#include <iostream>
#include <stdexcept>
#include <vector>

using namespace arqsim;
using namespace arqsim::protocol;
using arqsim::channel::Delivery;
using arqsim::channel::Frame;
using arqsim::channel::FrameKind;
using arqsim::channel::SimplexChannel;
using arqsim::sim::EventLoop;

static int tests_run = 0;
static int tests_passed = 0;

#define TEST(name) \
    do { std::cout << "  Testing " << name << "... " << std::flush; tests_run++; } while(0)

#define PASS() \
    do { std::cout << "PASS\n"; tests_passed++; } while(0)

#define FAIL(msg) \
    do { std::cout << "FAIL: " << msg << "\n"; return false; } while(0)

static Bytes makePayload(size_t len, uint8_t tag) {
    Bytes b(len);
    for (size_t i = 0; i < len; i++) b[i] = static_cast<uint8_t>(tag + i);
    return b;
}

// ============================================================================
// Sender
// ============================================================================

bool test_sender_window_admission() {
    TEST("Sender admits exactly W frames");

    SelectiveRepeatSender tx(4);
    for (int i = 0; i < 4; i++) {
        if (!tx.canSend()) FAIL("window closed after " << i << " frames");
        SeqNum s = tx.sendFrame(makePayload(10, static_cast<uint8_t>(i)));
        if (s != i) FAIL("expected seq " << i << ", got " << s);
    }
    if (tx.canSend()) FAIL("5th frame admitted");
    if (tx.availableSlots() != 0) FAIL("availableSlots should be 0");
    if (tx.inFlight() != 4) FAIL("inFlight should be 4");

    PASS();
    return true;
}

bool test_sender_rejects_zero_window() {
    TEST("Window size 0 is rejected");

    bool threw = false;
    try {
        SelectiveRepeatSender tx(0);
    } catch (const std::logic_error&) {
        threw = true;
    }
    if (!threw) FAIL("constructor accepted W=0");

    PASS();
    return true;
}

bool test_sender_selective_ack() {
    TEST("Selective ACKs: base jumps over acknowledged frames");

    SelectiveRepeatSender tx(8);
    for (int i = 0; i < 5; i++) tx.sendFrame(makePayload(8, 0));

    tx.handleAck(2);
    tx.handleAck(3);
    if (tx.base() != 0) FAIL("base moved without ACK 0");

    tx.handleAck(0);
    if (tx.base() != 1) FAIL("base should be 1, got " << tx.base());

    tx.handleAck(1);
    if (tx.base() != 4) FAIL("base should jump to 4, got " << tx.base());
    if (tx.inFlight() != 1) FAIL("only seq 4 should remain");

    // Stale and repeated ACKs are harmless
    if (tx.handleAck(1)) FAIL("repeated ACK reported as new");
    if (tx.handleAck(100)) FAIL("unknown ACK reported as new");
    if (tx.base() != 4) FAIL("stale ACK moved base");
    if (tx.stats().stale_acks != 2) FAIL("stale_acks should be 2");

    tx.handleAck(4);
    if (tx.base() != 5 || tx.nextSeq() != 5) FAIL("empty window should sit at next_seq");

    PASS();
    return true;
}

bool test_sender_nak_lookup() {
    TEST("NAK lookup returns the stored payload without side effects");

    SelectiveRepeatSender tx(4);
    Bytes p0 = makePayload(20, 1);
    tx.sendFrame(p0);
    tx.sendFrame(makePayload(20, 2));

    auto got = tx.handleNak(0);
    if (!got || *got != p0) FAIL("payload for seq 0 not returned");
    if (tx.handleNak(7)) FAIL("unknown seq returned a payload");
    if (tx.inFlight() != 2 || tx.base() != 0) FAIL("NAK changed window state");

    tx.handleAck(0);
    if (tx.handleNak(0)) FAIL("acknowledged seq still retransmittable");

    PASS();
    return true;
}

bool test_sender_timer_bookkeeping() {
    TEST("Timer ids are stored and taken per seq");

    SelectiveRepeatSender tx(4);
    tx.sendFrame(makePayload(4, 0));
    tx.sendFrame(makePayload(4, 1));
    tx.setTimer(0, 10);
    tx.setTimer(1, 11);

    auto t0 = tx.takeTimer(0);
    if (!t0 || *t0 != 10) FAIL("wrong timer for seq 0");
    if (tx.takeTimer(0)) FAIL("timer taken twice");

    auto all = tx.takeAllTimers();
    if (all.size() != 1 || all[0] != 11) FAIL("takeAllTimers wrong");
    if (tx.activeTimers() != 0) FAIL("timers left behind");

    PASS();
    return true;
}

// ============================================================================
// Receiver
// ============================================================================

bool test_receiver_in_order() {
    TEST("In-order frames are delivered immediately with RR(seq)");

    SelectiveRepeatReceiver rx;
    for (SeqNum s = 0; s < 3; s++) {
        Bytes p = makePayload(16, static_cast<uint8_t>(s));
        ReceiveResult r = rx.receiveFrame(s, Frame::makeData(s, p));
        if (!r.response || r.response->kind != FrameKind::RR || r.response->seq != s)
            FAIL("expected RR(" << s << ")");
        if (r.delivered.size() != 1 || r.delivered[0] != p) FAIL("frame " << s << " not delivered");
    }
    if (rx.base() != 3) FAIL("base should be 3");

    PASS();
    return true;
}

bool test_receiver_out_of_order() {
    TEST("Gap: SREJ(base), buffer, then flush on fill");

    SelectiveRepeatReceiver rx;
    Bytes p0 = makePayload(32, 0), p1 = makePayload(32, 1), p2 = makePayload(32, 2);

    rx.receiveFrame(0, Frame::makeData(0, p0));

    ReceiveResult r2 = rx.receiveFrame(2, Frame::makeData(2, p2));
    if (!r2.response || r2.response->kind != FrameKind::SREJ || r2.response->seq != 1)
        FAIL("expected SREJ(1)");
    if (!r2.delivered.empty()) FAIL("frame 2 delivered early");
    if (!rx.isBuffered(2) || rx.bufferSize() != 32) FAIL("frame 2 not buffered");

    ReceiveResult r1 = rx.receiveFrame(1, Frame::makeData(1, p1));
    if (!r1.response || r1.response->kind != FrameKind::RR || r1.response->seq != 1)
        FAIL("expected RR(1)");
    if (r1.delivered.size() != 2) FAIL("expected 2 deliveries, got " << r1.delivered.size());
    if (r1.delivered[0] != p1 || r1.delivered[1] != p2) FAIL("flush out of order");
    if (rx.base() != 3 || rx.bufferSize() != 0) FAIL("buffer not drained");

    PASS();
    return true;
}

bool test_receiver_duplicate() {
    TEST("Duplicate below base is re-ACKed, not delivered");

    SelectiveRepeatReceiver rx;
    rx.receiveFrame(0, Frame::makeData(0, makePayload(8, 0)));

    ReceiveResult r = rx.receiveFrame(0, Frame::makeData(0, makePayload(8, 0)));
    if (!r.response || r.response->kind != FrameKind::RR || r.response->seq != 0)
        FAIL("expected RR(0)");
    if (!r.delivered.empty()) FAIL("duplicate delivered");
    if (rx.stats().duplicates != 1) FAIL("duplicate not counted");

    // Same seq buffered twice ahead of base counts once
    rx.receiveFrame(3, Frame::makeData(3, makePayload(8, 3)));
    rx.receiveFrame(3, Frame::makeData(3, makePayload(8, 3)));
    if (rx.bufferedFrames() != 1 || rx.bufferSize() != 8) FAIL("buffered twice");

    PASS();
    return true;
}

bool test_receiver_buffer_limit() {
    TEST("Buffer cap: third 100 KiB frame dropped, two flushed");

    SelectiveRepeatReceiver rx;
    if (rx.maxBufferSize() != 256 * 1024) FAIL("default cap should be 256 KiB");
    const size_t BIG = 100 * 1024;

    rx.receiveFrame(1, Frame::makeData(1, makePayload(BIG, 1)));
    rx.receiveFrame(2, Frame::makeData(2, makePayload(BIG, 2)));
    ReceiveResult r3 = rx.receiveFrame(3, Frame::makeData(3, makePayload(BIG, 3)));

    if (!r3.response || r3.response->kind != FrameKind::SREJ || r3.response->seq != 0)
        FAIL("dropped frame should still answer SREJ(0)");
    if (rx.isBuffered(3)) FAIL("frame 3 should have been dropped");
    if (rx.bufferSize() != 2 * BIG) FAIL("buffer should hold 2 frames");
    if (rx.stats().buffer_drops != 1) FAIL("drop not counted");

    ReceiveResult r0 = rx.receiveFrame(0, Frame::makeData(0, makePayload(10, 0)));
    if (r0.delivered.size() != 3) FAIL("expected frame 0 plus 2 flushed, got " << r0.delivered.size());
    if (r0.delivered[1].size() != BIG || r0.delivered[2].size() != BIG) FAIL("wrong frames flushed");
    if (rx.base() != 3) FAIL("base should stop at the dropped frame");
    if (rx.bufferSize() != 0) FAIL("buffer not empty");

    PASS();
    return true;
}

bool test_receiver_corrupted() {
    TEST("CORRUPTED and stray control frames produce nothing");

    SelectiveRepeatReceiver rx;
    ReceiveResult r = rx.receiveFrame(-1, Frame::makeCorrupted());
    if (r.response || !r.delivered.empty()) FAIL("CORRUPTED produced output");

    ReceiveResult c = rx.receiveFrame(0, Frame::makeRr(0));
    if (c.response || !c.delivered.empty()) FAIL("RR on data path produced output");
    if (rx.base() != 0) FAIL("base moved");

    PASS();
    return true;
}

// ============================================================================
// SimplexLink over real channels
// ============================================================================

struct LinkHarness {
    EventLoop loop;
    PhysicalConfig phy;
    SimplexChannel forward;
    SimplexChannel reverse;
    SimplexLink link;
    Bytes received;

    LinkHarness(SeqNum window, const GilbertElliotParams& fwd, const GilbertElliotParams& rev,
                uint64_t seed = 1)
        : forward(loop, phy, phy.forward_path_delay,
                  channel::createErrorModel(ErrorModelKind::JUMP_AHEAD, fwd, seed), "fwd")
        , reverse(loop, phy, phy.reverse_path_delay,
                  channel::createErrorModel(ErrorModelKind::JUMP_AHEAD, rev, seed + 1), "rev")
        , link(loop, forward, reverse, window, phy)
    {
    }

    // Fire one event and hand whatever arrived to the link
    bool step(const std::function<void(SimTime)>& on_response) {
        if (!loop.advance()) return false;
        while (auto d = forward.tryReceive()) {
            ReceiveResult r = link.receiveFrame(*d);
            for (const Bytes& b : r.delivered) received.insert(received.end(), b.begin(), b.end());
        }
        while (auto d = reverse.tryReceive()) {
            link.handleResponse(*d);
            if (on_response) on_response(d->arrival_time);
        }
        return true;
    }
};

static GilbertElliotParams clean() {
    GilbertElliotParams p;
    p.good_ber = 0.0;
    p.bad_ber = 0.0;
    return p;
}

static GilbertElliotParams broken() {
    GilbertElliotParams p;
    p.good_ber = 1.0;
    p.bad_ber = 1.0;
    return p;
}

bool test_link_window_full() {
    TEST("Link refuses sends beyond the window");

    LinkHarness h(2, clean(), clean());
    if (!h.link.sendData(0.0, makePayload(100, 0))) FAIL("first send refused");
    if (!h.link.sendData(0.0, makePayload(100, 1))) FAIL("second send refused");
    if (h.link.sendData(0.0, makePayload(100, 2))) FAIL("third send admitted");
    if (h.link.nextSeq() != 2) FAIL("nextSeq should be 2");

    // Serial transmitter: second frame starts when the first ends
    double tx = (100 * 8 + 192) / h.phy.bit_rate;
    if (std::abs(h.link.transmitterFreeAt() - 2 * tx) > 1e-12) FAIL("transmitter clock wrong");

    PASS();
    return true;
}

bool test_link_clean_transfer() {
    TEST("Clean channels: every frame ACKed, no retransmissions");

    LinkHarness h(4, clean(), clean());
    std::vector<Bytes> chunks;
    Bytes expected;
    for (int i = 0; i < 10; i++) {
        chunks.push_back(makePayload(500, static_cast<uint8_t>(i * 7)));
        expected.insert(expected.end(), chunks.back().begin(), chunks.back().end());
    }

    size_t next = 0;
    auto fill = [&](SimTime now) {
        while (next < chunks.size() && h.link.sendData(now, chunks[next])) next++;
    };
    fill(0.0);
    while (h.step(fill)) {}

    LinkStats s = h.link.stats();
    if (h.link.senderBase() != 10) FAIL("senderBase should be 10, got " << h.link.senderBase());
    if (h.link.receiverBase() != 10) FAIL("receiverBase should be 10");
    if (h.link.inFlight() != 0) FAIL("frames still in flight");
    if (s.retransmissions != 0) FAIL("unexpected retransmissions: " << s.retransmissions);
    if (s.frames_sent != 10 || s.acks_received != 10) FAIL("frame/ACK counts wrong");
    if (h.received != expected) FAIL("payload mismatch");

    PASS();
    return true;
}

bool test_link_timeout() {
    TEST("Lost frame is retransmitted at start + 2.5 * RTT");

    LinkHarness h(4, broken(), clean());
    h.link.sendData(0.0, makePayload(100, 0));

    double rtt = h.phy.roundTrip(100 * 8 + 192);
    for (int i = 0; i < 10 && h.link.stats().retransmissions_timeout == 0; i++) {
        h.step(nullptr);
    }

    LinkStats s = h.link.stats();
    if (s.retransmissions_timeout != 1) FAIL("expected 1 timeout retransmission");
    if (std::abs(h.loop.now() - 2.5 * rtt) > 1e-9)
        FAIL("timer fired at " << h.loop.now() << ", expected " << 2.5 * rtt);
    if (s.corrupted_received != 1) FAIL("receiver should have seen one CORRUPTED");
    if (h.link.receiverBase() != 0) FAIL("receiver advanced past a lost frame");

    h.link.cancelTimers();
    h.loop.clear();

    PASS();
    return true;
}

bool test_link_nak_holdoff() {
    TEST("SREJ within one RTT of the last send is ignored");

    LinkHarness h(4, clean(), clean());
    h.link.sendData(0.0, makePayload(200, 0));
    h.link.sendData(0.0, makePayload(200, 1));

    h.link.handleNak(0.001, 0);
    LinkStats s = h.link.stats();
    if (s.naks_suppressed != 1) FAIL("early SREJ not suppressed");
    if (s.retransmissions != 0) FAIL("early SREJ retransmitted");

    h.link.handleNak(1.0, 0);
    s = h.link.stats();
    if (s.retransmissions_nak != 1) FAIL("late SREJ not honoured");

    // Unknown seq: counted, nothing sent
    h.link.handleNak(1.0, 42);
    s = h.link.stats();
    if (s.naks_received != 3) FAIL("naks_received should be 3");
    if (s.retransmissions != 1) FAIL("unknown SREJ retransmitted");

    h.link.handleAck(0);
    h.link.handleAck(1);
    if (h.link.inFlight() != 0 || h.link.senderBase() != 2) FAIL("ACKs not applied");

    h.loop.clear();

    PASS();
    return true;
}

bool test_link_lossy_transfer() {
    TEST("Default Gilbert-Elliot channel: payload arrives intact");

    GilbertElliotParams ge;
    LinkHarness h(8, ge, ge, 5);

    std::vector<Bytes> chunks;
    Bytes expected;
    for (int i = 0; i < 200; i++) {
        chunks.push_back(makePayload(512, static_cast<uint8_t>(i)));
        expected.insert(expected.end(), chunks.back().begin(), chunks.back().end());
    }

    size_t next = 0;
    auto fill = [&](SimTime now) {
        while (next < chunks.size() && h.link.sendData(now, chunks[next])) next++;
    };
    fill(0.0);
    while (h.link.senderBase() < 200 && h.loop.now() < 300.0 && h.step(fill)) {}

    LinkStats s = h.link.stats();
    if (h.link.senderBase() != 200) FAIL("transfer stalled at base " << h.link.senderBase());
    if (h.received != expected) FAIL("payload mismatch (" << h.received.size() << " bytes)");
    if (s.retransmissions == 0) FAIL("lossy channel produced no retransmissions");
    if (s.frames_delivered != 200) FAIL("delivered " << s.frames_delivered << " frames");
    if (h.link.receiverBase() != 200 || h.link.receiverBufferBytes() != 0)
        FAIL("receiver left " << h.link.receiverBufferBytes() << " bytes buffered");

    h.link.cancelTimers();
    h.loop.clear();

    PASS();
    return true;
}

int main() {
    std::cout << "=== Selective Repeat ARQ Test Suite ===\n\n";

    std::cout << "Sender:\n";
    test_sender_window_admission();
    test_sender_rejects_zero_window();
    test_sender_selective_ack();
    test_sender_nak_lookup();
    test_sender_timer_bookkeeping();

    std::cout << "\nReceiver:\n";
    test_receiver_in_order();
    test_receiver_out_of_order();
    test_receiver_duplicate();
    test_receiver_buffer_limit();
    test_receiver_corrupted();

    std::cout << "\nLink:\n";
    test_link_window_full();
    test_link_clean_transfer();
    test_link_timeout();
    test_link_nak_holdoff();
    test_link_lossy_transfer();

    std::cout << "\n=== Results: " << tests_passed << "/" << tests_run << " tests passed ===\n";

    if (tests_passed == tests_run) {
        std::cout << "All tests PASSED!\n";
        return 0;
    } else {
        std::cout << "Some tests FAILED!\n";
        return 1;
    }
}
