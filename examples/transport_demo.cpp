#include <cyphal/transport/fragmentation.hpp>
#include <cyphal/transport/reassembly.hpp>
#include <cyphal/transport/tx_queue.hpp>
#include <echo/echo.hpp>

using namespace cyphal;

int main() {
    echo::info("=== Cyphal/CAN Transfer Engine Demo ===");

    TransportConfig config;
    config.set_node_id(42);
    if (auto valid = validate_config(config); !valid.is_ok()) {
        echo::error("bad config: ", valid.error().message);
        return 1;
    }

    Fragmenter fragmenter(config);
    TxQueue queue(config.tx_queue_capacity);
    Reassembler rx(config);

    rx.on_transfer.subscribe([](const Transfer &t) {
        echo::info("RX transfer: subject=", t.metadata.port_id, " src=", static_cast<u32>(*t.metadata.source),
                   " tid=", static_cast<u32>(t.metadata.transfer_id), " bytes=", t.size());
    });
    rx.on_discard.subscribe([](const SessionKey &key, DiscardReason why) {
        echo::warn("RX discard: src=", key.source, " port=", key.port_id, " reason=", to_string(why));
    });

    // --- Two transfers of different priority ---
    dp::Vector<u8> bulk(60);
    for (usize i = 0; i < bulk.size(); ++i)
        bulk[i] = static_cast<u8>(i);
    dp::Vector<u8> urgent = {0xDE, 0xAD};

    auto bulk_seq = fragmenter.fragment(TransferMetadata::message(Priority::Slow, 1000, NodeId{42}, 0), DataSpan(bulk));
    auto urgent_seq =
        fragmenter.fragment(TransferMetadata::message(Priority::Exceptional, 7, NodeId{42}, 0), DataSpan(urgent));
    if (!bulk_seq.is_ok() || !urgent_seq.is_ok()) {
        echo::error("fragmentation failed");
        return 1;
    }
    echo::info("bulk transfer: ", bulk_seq.value().total(), " frames");

    if (!queue.enqueue(std::move(bulk_seq.value())).is_ok() || !queue.enqueue(std::move(urgent_seq.value())).is_ok()) {
        echo::error("tx queue full");
        return 1;
    }

    // --- Loop frames back through the reassembler ---
    u64 now_us = 0;
    while (!queue.empty()) {
        auto frame = queue.pop_next();
        CanFrame raw = codec::encode(*frame);
        echo::trace("TX id=0x", raw.id.raw, " len=", static_cast<u32>(raw.length), " prio=",
                    static_cast<u32>(frame->priority));
        auto result = rx.accept(raw, 0, now_us);
        if (!result.is_ok()) {
            echo::warn("accept failed: ", result.error().message);
        }
        now_us += 250;
    }

    // --- Replay the urgent frame: rejected as a duplicate ---
    auto replay = fragmenter.fragment(TransferMetadata::message(Priority::Exceptional, 7, NodeId{42}, 0), DataSpan(urgent));
    if (replay.is_ok()) {
        auto frame = replay.value().next();
        (void)rx.accept(codec::encode(*frame), 1, now_us);
    }

    echo::info("--- Limits ---");
    echo::info("Classic CAN max transfer: ", max_transfer_size_for(CAN_CLASSIC_MTU), " bytes");
    echo::info("CAN FD max transfer:      ", max_transfer_size_for(CAN_FD_MTU), " bytes");
    echo::info("Active sessions:          ", rx.sessions().size());

    return 0;
}
