#include <cyphal/transport/tx_queue.hpp>
#include <doctest/doctest.h>

using namespace cyphal;

namespace {

    FrameSequence transfer(Priority prio, PortId subject, usize size) {
        Fragmenter fragmenter{TransportConfig{}};
        dp::Vector<u8> payload(size, static_cast<u8>(subject));
        auto seq = fragmenter.fragment(TransferMetadata::message(prio, subject, NodeId{1}, 0), DataSpan(payload));
        REQUIRE(seq.is_ok());
        return std::move(seq.value());
    }

} // namespace

TEST_CASE("Tx queue - lower priority ordinal goes first") {
    TxQueue queue(16);
    REQUIRE(queue.enqueue(transfer(Priority::Slow, 1, 3)).is_ok());
    REQUIRE(queue.enqueue(transfer(Priority::Exceptional, 2, 3)).is_ok());
    REQUIRE(queue.enqueue(transfer(Priority::Nominal, 3, 3)).is_ok());

    CHECK(queue.pop_next()->port_id == 2);
    CHECK(queue.pop_next()->port_id == 3);
    CHECK(queue.pop_next()->port_id == 1);
    CHECK_FALSE(queue.pop_next().has_value());
}

TEST_CASE("Tx queue - equal priority keeps enqueue order") {
    TxQueue queue(16);
    REQUIRE(queue.enqueue(transfer(Priority::Nominal, 1, 10)).is_ok());
    REQUIRE(queue.enqueue(transfer(Priority::Nominal, 2, 10)).is_ok());

    dp::Vector<PortId> order;
    while (!queue.empty())
        order.push_back(queue.pop_next()->port_id);
    REQUIRE(order.size() == 4);
    CHECK(order[0] == 1);
    CHECK(order[1] == 1);
    CHECK(order[2] == 2);
    CHECK(order[3] == 2);
}

TEST_CASE("Tx queue - urgent transfer overtakes an unstarted one") {
    TxQueue queue(16);
    REQUIRE(queue.enqueue(transfer(Priority::Low, 5, 20)).is_ok());
    REQUIRE(queue.enqueue(transfer(Priority::Exceptional, 0, 20)).is_ok());

    for (int i = 0; i < 4; ++i) {
        auto f = queue.pop_next();
        REQUIRE(f.has_value());
        CHECK(f->port_id == 0);
    }
    for (int i = 0; i < 4; ++i) {
        CHECK(queue.pop_next()->port_id == 5);
    }
}

TEST_CASE("Tx queue - a started transfer is never split") {
    TxQueue queue(16);
    REQUIRE(queue.enqueue(transfer(Priority::Low, 5, 20)).is_ok());

    auto first = queue.pop_next();
    REQUIRE(first.has_value());
    CHECK(first->start_of_transfer);
    CHECK(queue.transfer_in_flight());

    REQUIRE(queue.enqueue(transfer(Priority::Exceptional, 0, 20)).is_ok());
    dp::Vector<PortId> order;
    while (!queue.empty())
        order.push_back(queue.pop_next()->port_id);
    REQUIRE(order.size() == 7);
    for (usize i = 0; i < 3; ++i)
        CHECK(order[i] == 5);
    for (usize i = 3; i < 7; ++i)
        CHECK(order[i] == 0);
    CHECK_FALSE(queue.transfer_in_flight());
}

TEST_CASE("Tx queue - peek does not remove") {
    TxQueue queue(4);
    CHECK(queue.peek() == nullptr);
    REQUIRE(queue.enqueue(transfer(Priority::Nominal, 9, 2)).is_ok());
    REQUIRE(queue.peek() != nullptr);
    CHECK(queue.peek()->port_id == 9);
    CHECK(queue.size() == 1);
}

TEST_CASE("Tx queue - backpressure") {
    TxQueue queue(5);
    REQUIRE(queue.enqueue(transfer(Priority::Nominal, 1, 20)).is_ok());
    CHECK(queue.free_slots() == 1);

    auto r = queue.enqueue(transfer(Priority::Nominal, 2, 10));
    REQUIRE(r.is_err());
    CHECK(r.error().code == ErrorCode::QueueFull);
    CHECK(queue.size() == 4);

    CHECK(queue.enqueue(transfer(Priority::Nominal, 3, 1)).is_ok());
    CHECK(queue.free_slots() == 0);
}

TEST_CASE("Tx queue - expired transfers are purged whole") {
    TxQueue queue(16);
    REQUIRE(queue.enqueue(transfer(Priority::Nominal, 1, 20), 1000).is_ok());
    REQUIRE(queue.enqueue(transfer(Priority::Nominal, 2, 20), 5000).is_ok());
    REQUIRE(queue.enqueue(transfer(Priority::Nominal, 3, 3)).is_ok());

    CHECK(queue.pop_next()->port_id == 1);
    CHECK(queue.purge_expired(2000) == 3);
    CHECK_FALSE(queue.transfer_in_flight());
    CHECK(queue.size() == 5);
    CHECK(queue.pop_next()->port_id == 2);

    CHECK(queue.purge_expired(10000) == 3);
    CHECK(queue.pop_next()->port_id == 3);
    CHECK(queue.empty());
}

TEST_CASE("Tx queue - tickets") {
    TxQueue queue(8);
    REQUIRE(queue.enqueue(transfer(Priority::Nominal, 1, 20), 1000).is_ok());

    SUBCASE("front leaves the frame queued until popped") {
        auto t = queue.front();
        REQUIRE(t.has_value());
        CHECK(t->frame.port_id == 1);
        CHECK(t->frame.start_of_transfer);
        CHECK(queue.size() == 4);
        CHECK(queue.pop(*t));
        CHECK(queue.size() == 3);
        CHECK(queue.transfer_in_flight());
        CHECK_FALSE(queue.pop(*t));
    }

    SUBCASE("a purged frame cannot be popped by a stale ticket") {
        auto t = queue.front();
        REQUIRE(t.has_value());
        CHECK(queue.purge_expired(2000) == 4);
        REQUIRE(queue.enqueue(transfer(Priority::Nominal, 2, 3)).is_ok());
        CHECK_FALSE(queue.pop(*t));
        CHECK(queue.size() == 1);
        CHECK(queue.front()->frame.port_id == 2);
    }
}

TEST_CASE("Tx queue - pre-built frame lists") {
    TxQueue queue(8);
    Fragmenter fragmenter{TransportConfig{}};
    dp::Vector<u8> payload(12, 1);
    auto frames = fragmenter.fragment_all(TransferMetadata::message(Priority::High, 4, NodeId{1}, 0), DataSpan(payload));
    REQUIRE(frames.is_ok());
    REQUIRE(queue.enqueue(frames.value()).is_ok());
    CHECK(queue.size() == 2);
    queue.clear();
    CHECK(queue.empty());
}
