#include <cyphal/transport/session.hpp>
#include <doctest/doctest.h>

using namespace cyphal;

static SessionKey message_key(NodeId source, PortId subject) {
    SessionKey k;
    k.source = source;
    k.kind = TransferKind::Message;
    k.port_id = subject;
    return k;
}

TEST_CASE("Session table - create and find") {
    SessionTable table(4, 64);
    CHECK(table.size() == 0);
    CHECK(table.capacity() == 4);

    auto r = table.lookup_or_create(message_key(1, 100), 1000);
    REQUIRE(r.is_ok());
    RxSession *s = r.value();
    CHECK(s->key == message_key(1, 100));
    CHECK(s->buffer.capacity() >= 64);
    CHECK(table.size() == 1);

    auto again = table.lookup_or_create(message_key(1, 100), 2000);
    REQUIRE(again.is_ok());
    CHECK(again.value() == s);
    CHECK(table.size() == 1);

    CHECK(table.find(message_key(1, 100)) == s);
    CHECK(table.find(message_key(2, 100)) == nullptr);
}

TEST_CASE("Session table - services keyed by destination") {
    SessionTable table(4, 16);
    SessionKey a;
    a.source = 5;
    a.kind = TransferKind::Request;
    a.port_id = 10;
    a.destination = 1;
    SessionKey b = a;
    b.destination = 2;

    REQUIRE(table.lookup_or_create(a, 0).is_ok());
    REQUIRE(table.lookup_or_create(b, 0).is_ok());
    CHECK(table.size() == 2);
    CHECK(table.find(a) != table.find(b));
}

TEST_CASE("Session table - full table evicts least recently updated") {
    SessionTable table(2, 16);
    dp::Vector<SessionKey> evicted;
    table.on_evict.subscribe([&](const SessionKey &k) { evicted.push_back(k); });

    REQUIRE(table.lookup_or_create(message_key(1, 1), 10).is_ok()); // A
    REQUIRE(table.lookup_or_create(message_key(2, 1), 20).is_ok()); // B
    REQUIRE(table.lookup_or_create(message_key(1, 1), 30).is_ok()); // touch A
    REQUIRE(table.lookup_or_create(message_key(3, 1), 40).is_ok()); // C replaces B

    CHECK(table.size() == 2);
    CHECK(table.find(message_key(1, 1)) != nullptr);
    CHECK(table.find(message_key(2, 1)) == nullptr);
    CHECK(table.find(message_key(3, 1)) != nullptr);
    REQUIRE(evicted.size() == 1);
    CHECK(evicted[0] == message_key(2, 1));
}

TEST_CASE("Session table - evicted slot starts clean") {
    SessionTable table(1, 16);
    auto first = table.lookup_or_create(message_key(1, 1), 0);
    REQUIRE(first.is_ok());
    first.value()->has_history = true;
    first.value()->buffer.push_back(0xAA);

    auto second = table.lookup_or_create(message_key(2, 1), 5);
    REQUIRE(second.is_ok());
    CHECK_FALSE(second.value()->has_history);
    CHECK(second.value()->buffer.empty());
    CHECK(second.value()->start_us == 5);
}

TEST_CASE("Session table - zero capacity") {
    SessionTable table(0, 16);
    auto r = table.lookup_or_create(message_key(1, 1), 0);
    REQUIRE(r.is_err());
    CHECK(r.error().code == ErrorCode::TableFull);
}

TEST_CASE("Session table - evict and prune") {
    SessionTable table(4, 16);
    REQUIRE(table.lookup_or_create(message_key(1, 1), 0).is_ok());
    REQUIRE(table.lookup_or_create(message_key(2, 1), 500).is_ok());
    REQUIRE(table.lookup_or_create(message_key(3, 1), 900).is_ok());

    SUBCASE("evict by key") {
        CHECK(table.evict(message_key(2, 1)));
        CHECK_FALSE(table.evict(message_key(2, 1)));
        CHECK(table.size() == 2);
    }

    SUBCASE("prune drops sessions older than the limit") {
        CHECK(table.prune(1000, 400) == 2);
        CHECK(table.size() == 1);
        CHECK(table.find(message_key(3, 1)) != nullptr);
    }

    SUBCASE("freed slots are reused") {
        table.clear();
        CHECK(table.size() == 0);
        for (NodeId n = 10; n < 14; ++n) {
            CHECK(table.lookup_or_create(message_key(n, 1), 0).is_ok());
        }
        CHECK(table.full());
    }
}
