#include <cyphal/network/node.hpp>
#include <echo/echo.hpp>
#include <wirebit/can/can_endpoint.hpp>
#include <wirebit/can/socketcan_link.hpp>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <unistd.h>

using namespace cyphal;

static std::atomic<bool> running{true};

void signal_handler(int) { running = false; }

static u64 monotonic_us() {
    using namespace std::chrono;
    return static_cast<u64>(duration_cast<microseconds>(steady_clock::now().time_since_epoch()).count());
}

int main(int argc, char *argv[]) {
    echo::info("=== Cyphal SocketCAN Demo ===");

    dp::String interface = "vcan0";
    if (argc > 1)
        interface = argv[1];
    NodeId node_id = 42;
    if (argc > 2)
        node_id = static_cast<NodeId>(std::atoi(argv[2]));

    auto link_result = wirebit::SocketCanLink::create({.interface_name = interface, .create_if_missing = true});
    if (!link_result.is_ok()) {
        echo::error("Failed to create SocketCAN link on ", interface, ": ", link_result.error().message);
        echo::info("Usage: ", argv[0], " [interface] [node-id]");
        return 1;
    }
    auto link = std::make_shared<wirebit::SocketCanLink>(std::move(link_result.value()));
    echo::info("Opened CAN interface: ", interface);

    wirebit::CanEndpoint can(link, wirebit::CanConfig{.bitrate = 1000000}, 1);
    WirebitLink driver(can, 0);

    Node node(TransportConfig{}.set_node_id(node_id));
    if (auto valid = node.check_config(); !valid.is_ok()) {
        echo::error("bad config: ", valid.error().message);
        return 1;
    }
    if (auto added = node.add_interface(0, &driver); !added.is_ok()) {
        echo::error("cannot add interface: ", added.error().message);
        return 1;
    }

    node.on_transfer.subscribe([](const Transfer &t) {
        echo::info("RX: port=", t.metadata.port_id,
                   " src=", t.metadata.source.has_value() ? static_cast<i32>(*t.metadata.source) : -1,
                   " tid=", static_cast<u32>(t.metadata.transfer_id), " len=", t.size());
    });
    node.on_discard.subscribe([](DiscardReason why, InterfaceId iface) {
        echo::trace("discard on iface ", static_cast<u32>(iface), ": ", to_string(why));
    });

    constexpr PortId HEARTBEAT_SUBJECT = 7509;
    constexpr u64 HEARTBEAT_PERIOD_US = 1'000'000;

    signal(SIGINT, signal_handler);
    echo::info("Running... (Ctrl+C to stop)");

    u64 start_us = monotonic_us();
    u64 next_heartbeat_us = start_us;
    while (running) {
        u64 now_us = monotonic_us();
        if (now_us >= next_heartbeat_us) {
            u32 uptime_s = static_cast<u32>((now_us - start_us) / 1'000'000);
            dp::Vector<u8> heartbeat = {static_cast<u8>(uptime_s), static_cast<u8>(uptime_s >> 8),
                                        static_cast<u8>(uptime_s >> 16), static_cast<u8>(uptime_s >> 24),
                                        0x00, 0x00, 0x00};
            auto sent = node.publish(Priority::Nominal, HEARTBEAT_SUBJECT, DataSpan(heartbeat),
                                     now_us + HEARTBEAT_PERIOD_US);
            if (!sent.is_ok()) {
                echo::warn("heartbeat not queued: ", sent.error().message);
            }
            next_heartbeat_us += HEARTBEAT_PERIOD_US;
        }

        node.spin_once(now_us);
        node.prune(now_us, DEFAULT_TRANSFER_ID_TIMEOUT_US);

        usleep(1000);
    }

    echo::info("Done.");
    return 0;
}
