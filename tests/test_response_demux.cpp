#include "etherstream/etherdream/ResponseDemux.hpp"

#include "TestSupport.hpp"

#include <future>
#include <stdexcept>
#include <string>
#include <thread>

using namespace etherstream::etherdream;
using Bytes = ResponseDemux::Bytes;

static Bytes pattern(std::uint8_t first, std::size_t size) {
    Bytes out(size);
    for (std::size_t i = 0; i < size; ++i) {
        out[i] = static_cast<std::uint8_t>(first + i);
    }
    return out;
}

static void testByteAtATime() {
    ResponseDemux demux;
    auto reply = demux.request('?', 22, [](const Bytes& raw) { return raw; });

    const auto wire = pattern(1, 22);
    for (std::size_t i = 0; i + 1 < wire.size(); ++i) {
        demux.feed(&wire[i], 1);
    }
    ASSERT_TRUE(reply.wait_for(std::chrono::seconds{0}) == std::future_status::timeout,
                "21 bytes do not complete a 22-byte reply");
    ASSERT_EQ(demux.bufferedBytes(), std::size_t{21}, "partial reply is buffered");

    demux.feed(&wire.back(), 1);
    ASSERT_TRUE(reply.wait_for(std::chrono::seconds{0}) == std::future_status::ready,
                "final byte completes the reply");
    ASSERT_TRUE(reply.get() == wire, "reply bytes arrive intact");
    ASSERT_EQ(demux.bufferedBytes(), std::size_t{0}, "nothing left over");
}

static void testCoalescedRepliesInOrder() {
    ResponseDemux demux;
    std::string order;
    demux.expect({'p', 4, [&](Bytes&& raw) { order += 'p'; ASSERT_EQ(raw[0], 10, "first slot gets first bytes"); }});
    demux.expect({'b', 4, [&](Bytes&& raw) { order += 'b'; ASSERT_EQ(raw[0], 14, "second slot gets next bytes"); }});
    ASSERT_EQ(demux.pendingCount(), std::size_t{2}, "two slots pending");

    // Both replies plus two stray bytes in a single chunk.
    const auto wire = pattern(10, 10);
    demux.feed(wire.data(), wire.size());

    ASSERT_TRUE(order == "pb", "replies delivered in registration order");
    ASSERT_EQ(demux.pendingCount(), std::size_t{0}, "both slots satisfied");
    ASSERT_EQ(demux.bufferedBytes(), std::size_t{2}, "surplus bytes kept for the next slot");

    Bytes tail;
    demux.expect({'?', 2, [&](Bytes&& raw) { tail = std::move(raw); }});
    ASSERT_EQ(tail.size(), std::size_t{2}, "buffered bytes satisfy a later slot");
    ASSERT_EQ(tail[0], 18, "later slot starts where the previous left off");
}

static void testBytesBeforeRegistration() {
    ResponseDemux demux;
    const auto wire = pattern(0, 22);
    demux.feed(wire.data(), wire.size());
    ASSERT_EQ(demux.bufferedBytes(), std::size_t{22}, "unsolicited bytes are kept");

    auto reply = demux.request('?', 22, [](const Bytes& raw) { return raw.size(); });
    ASSERT_EQ(reply.get(), std::size_t{22}, "greeting delivered once the slot exists");
}

static void testResetBreaksWaiters() {
    ResponseDemux demux;
    auto reply = demux.request('d', 22, [](const Bytes& raw) { return raw.size(); });
    const auto wire = pattern(0, 5);
    demux.feed(wire.data(), wire.size());

    demux.reset();
    ASSERT_EQ(demux.bufferedBytes(), std::size_t{0}, "reset drops buffered bytes");
    ASSERT_EQ(demux.pendingCount(), std::size_t{0}, "reset drops pending slots");

    bool broken = false;
    try {
        reply.get();
    } catch (const std::future_error& e) {
        broken = e.code() == std::future_errc::broken_promise;
    }
    ASSERT_TRUE(broken, "waiter observes broken_promise after reset");

    // Stale bytes must not leak into the next conversation.
    auto next = demux.request('?', 3, [](const Bytes& raw) { return raw; });
    const auto fresh = pattern(40, 3);
    demux.feed(fresh.data(), fresh.size());
    ASSERT_TRUE(next.get() == fresh, "post-reset reply is not contaminated");
}

static void testCompletionMayRegister() {
    ResponseDemux demux;
    int delivered = 0;
    demux.expect({'p', 2, [&](Bytes&&) {
        ++delivered;
        demux.expect({'b', 2, [&](Bytes&&) { ++delivered; }});
    }});
    const auto wire = pattern(0, 4);
    demux.feed(wire.data(), wire.size());
    ASSERT_EQ(delivered, 2, "slot registered from a completion is served by the same feed");
}

static void testThrowingCompletionDoesNotWedge() {
    ResponseDemux demux;
    demux.expect({'p', 2, [](Bytes&&) { throw std::runtime_error("handler failed"); }});

    const auto wire = pattern(0, 2);
    bool threw = false;
    try {
        demux.feed(wire.data(), wire.size());
    } catch (const std::runtime_error&) {
        threw = true;
    }
    ASSERT_TRUE(threw, "completion exception reaches the feeder");
    ASSERT_EQ(demux.pendingCount(), std::size_t{0}, "failed slot was consumed");

    int delivered = 0;
    demux.expect({'b', 2, [&](Bytes&&) { ++delivered; }});
    const auto more = pattern(2, 2);
    demux.feed(more.data(), more.size());
    ASSERT_EQ(delivered, 1, "later slot still served");
    ASSERT_EQ(demux.pendingCount(), std::size_t{0}, "nothing left pending");
    ASSERT_EQ(demux.bufferedBytes(), std::size_t{0}, "nothing left buffered");
}

static void testThrowingDecoderFailsOnlyItsFuture() {
    ResponseDemux demux;
    auto bad = demux.request('p', 2, [](const Bytes&) -> int { throw std::runtime_error("bad reply"); });
    auto good = demux.request('b', 2, [](const Bytes& raw) { return static_cast<int>(raw[0]); });

    const auto wire = pattern(10, 4);
    demux.feed(wire.data(), wire.size());

    bool rethrown = false;
    try {
        bad.get();
    } catch (const std::runtime_error&) {
        rethrown = true;
    }
    ASSERT_TRUE(rethrown, "decoder exception surfaces from get()");
    ASSERT_EQ(good.get(), 12, "next request decoded normally");
}

static void testConcurrentFeed() {
    ResponseDemux demux;
    constexpr int kReplies = 200;
    std::vector<std::future<std::uint8_t>> replies;
    for (int i = 0; i < kReplies; ++i) {
        replies.push_back(demux.request('d', 22, [](const Bytes& raw) { return raw[0]; }));
    }

    std::thread feeder([&] {
        for (int i = 0; i < kReplies; ++i) {
            Bytes reply(22, static_cast<std::uint8_t>(i));
            // Uneven splits, like a real socket.
            demux.feed(reply.data(), 7);
            demux.feed(reply.data() + 7, 15);
        }
    });
    feeder.join();

    bool ordered = true;
    for (int i = 0; i < kReplies; ++i) {
        ordered = ordered && replies[static_cast<std::size_t>(i)].get() == static_cast<std::uint8_t>(i);
    }
    ASSERT_TRUE(ordered, "every reply reaches its own request");
}

int main() {
    testByteAtATime();
    testCoalescedRepliesInOrder();
    testBytesBeforeRegistration();
    testResetBreaksWaiters();
    testCompletionMayRegister();
    testThrowingCompletionDoesNotWedge();
    testThrowingDecoderFailsOnlyItsFuture();
    testConcurrentFeed();
    return finishTests("ResponseDemux tests");
}
