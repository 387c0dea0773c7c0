#include <cyphal/core/config.hpp>
#include <doctest/doctest.h>

using namespace cyphal;

TEST_CASE("Transport config - defaults are valid") {
    TransportConfig config;
    CHECK(config.mtu == CAN_CLASSIC_MTU);
    CHECK(config.session_capacity == DEFAULT_SESSION_CAPACITY);
    CHECK(config.max_transfer_size == 446);
    CHECK(config.buffer_capacity() == 448);
    CHECK(config.frame_capacity() == 7);
    CHECK(config.initial_toggle);
    CHECK_FALSE(config.local_node_id.has_value());
    CHECK(validate_config(config).is_ok());
}

TEST_CASE("Transport config - fluent setters chain") {
    TransportConfig config;
    config.set_mtu(CAN_FD_MTU).set_session_capacity(8).set_node_id(42).set_initial_toggle(false);
    CHECK(config.mtu == 64);
    CHECK(config.max_transfer_size == max_transfer_size_for(64));
    CHECK(config.session_capacity == 8);
    REQUIRE(config.local_node_id.has_value());
    CHECK(*config.local_node_id == 42);
    CHECK_FALSE(config.initial_toggle);

    config.set_anonymous();
    CHECK_FALSE(config.local_node_id.has_value());
    CHECK(validate_config(config).is_ok());
}

TEST_CASE("Transport config - invalid values") {
    SUBCASE("zero session capacity reports table full") {
        TransportConfig config;
        config.set_session_capacity(0);
        auto r = validate_config(config);
        REQUIRE(r.is_err());
        CHECK(r.error().code == ErrorCode::TableFull);
    }

    SUBCASE("mtu below classic CAN") {
        TransportConfig config;
        config.set_mtu(4);
        CHECK(validate_config(config).error().code == ErrorCode::InvalidArgument);
    }

    SUBCASE("node id out of range") {
        TransportConfig config;
        config.set_node_id(128);
        CHECK(validate_config(config).error().code == ErrorCode::InvalidArgument);
    }

    SUBCASE("zero tx queue") {
        TransportConfig config;
        config.set_tx_queue_capacity(0);
        CHECK(validate_config(config).is_err());
    }
}
