#include <cyphal/transport/fragmentation.hpp>
#include <doctest/doctest.h>

using namespace cyphal;

TEST_CASE("Fragmentation - single frame carries no CRC") {
    TransportConfig config;
    Fragmenter fragmenter(config);
    dp::Vector<u8> payload = {1, 2, 3, 4, 5, 6, 7};
    auto meta = TransferMetadata::message(Priority::Nominal, 10, NodeId{1}, 4);

    auto seq = fragmenter.fragment(meta, DataSpan(payload));
    REQUIRE(seq.is_ok());
    CHECK(seq.value().total() == 1);

    auto f = seq.value().next();
    REQUIRE(f.has_value());
    CHECK(f->single_frame());
    CHECK(f->toggle);
    CHECK(f->payload_size == 7);
    CHECK(f->transfer_id == 4);
    CHECK(seq.value().done());
}

TEST_CASE("Fragmentation - multi-frame layout") {
    TransportConfig config;
    Fragmenter fragmenter(config);
    dp::Vector<u8> payload(20, 0x5A);
    auto meta = TransferMetadata::message(Priority::Fast, 300, NodeId{9}, 30);

    auto frames = fragmenter.fragment_all(meta, DataSpan(payload));
    REQUIRE(frames.is_ok());
    const auto &list = frames.value();
    REQUIRE(list.size() == 4);

    bool expected_toggle = true;
    for (usize i = 0; i < list.size(); ++i) {
        CHECK(list[i].start_of_transfer == (i == 0));
        CHECK(list[i].end_of_transfer == (i == list.size() - 1));
        CHECK(list[i].toggle == expected_toggle);
        CHECK(list[i].transfer_id == 30);
        CHECK(list[i].priority == Priority::Fast);
        expected_toggle = !expected_toggle;
    }
    CHECK(list[0].payload_size == 7);
    CHECK(list[3].payload_size == 1);

    TransferCrc acc;
    for (const auto &f : list)
        acc.add(f.data());
    CHECK(acc.residue_ok());
}

TEST_CASE("Fragmentation - CAN FD frames") {
    TransportConfig config;
    config.set_mtu(CAN_FD_MTU);
    Fragmenter fragmenter(config);
    dp::Vector<u8> payload(100, 1);
    auto seq = fragmenter.fragment(TransferMetadata::message(Priority::Nominal, 1, NodeId{1}, 0), DataSpan(payload));
    REQUIRE(seq.is_ok());
    CHECK(seq.value().total() == 2);
    CHECK(seq.value().next()->payload_size == 63);
    CHECK(seq.value().remaining() == 1);
}

TEST_CASE("Fragmentation - the sequence owns its bytes") {
    TransportConfig config;
    Fragmenter fragmenter(config);
    auto meta = TransferMetadata::message(Priority::Nominal, 1, NodeId{1}, 0);
    FrameSequence kept;
    {
        dp::Vector<u8> payload(10, 0x77);
        auto seq = fragmenter.fragment(meta, DataSpan(payload));
        REQUIRE(seq.is_ok());
        kept = std::move(seq.value());
    }
    auto f = kept.next();
    REQUIRE(f.has_value());
    CHECK(f->payload[0] == 0x77);
}

TEST_CASE("Fragmentation - rejections") {
    TransportConfig config;
    Fragmenter fragmenter(config);

    SUBCASE("payload too large") {
        dp::Vector<u8> payload(config.max_transfer_size + 1, 0);
        auto r = fragmenter.fragment(TransferMetadata::message(Priority::Nominal, 1, NodeId{1}, 0), DataSpan(payload));
        REQUIRE(r.is_err());
        CHECK(r.error().code == ErrorCode::PayloadTooLarge);
    }

    SUBCASE("largest payload still fits in the frame budget") {
        dp::Vector<u8> payload(config.max_transfer_size, 0);
        auto r = fragmenter.fragment(TransferMetadata::message(Priority::Nominal, 1, NodeId{1}, 0), DataSpan(payload));
        REQUIRE(r.is_ok());
        CHECK(r.value().total() == DEFAULT_MAX_FRAMES_PER_TRANSFER);
    }

    SUBCASE("anonymous transfer longer than one frame") {
        dp::Vector<u8> payload(8, 0);
        auto r = fragmenter.fragment(TransferMetadata::message(Priority::Nominal, 1, dp::nullopt, 0), DataSpan(payload));
        REQUIRE(r.is_err());
        CHECK(r.error().code == ErrorCode::InvalidArgument);
    }

    SUBCASE("service without a destination") {
        TransferMetadata meta;
        meta.kind = TransferKind::Request;
        meta.port_id = 5;
        meta.source = 1;
        dp::Vector<u8> payload(2, 0);
        CHECK(fragmenter.fragment(meta, DataSpan(payload)).error().code == ErrorCode::InvalidArgument);
    }
}
