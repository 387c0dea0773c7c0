#pragma once

#include "constants.hpp"
#include "error.hpp"
#include "types.hpp"
#include <datapod/datapod.hpp>
#include <echo/echo.hpp>
#include <string>

namespace cyphal {

    // ─── Transport configuration ────────────────────────────────────────────────
    // All capacities are fixed when the engine is constructed; nothing grows later.
    struct TransportConfig {
        u8 mtu = CAN_CLASSIC_MTU;
        u32 session_capacity = DEFAULT_SESSION_CAPACITY;
        u32 tx_queue_capacity = DEFAULT_TX_QUEUE_CAPACITY;
        u32 max_transfer_size = max_transfer_size_for(CAN_CLASSIC_MTU);
        u64 transfer_id_timeout_us = DEFAULT_TRANSFER_ID_TIMEOUT_US;
        bool initial_toggle = DEFAULT_INITIAL_TOGGLE;
        dp::Optional<NodeId> local_node_id;

        // Fluent API
        TransportConfig &set_mtu(u8 m) {
            mtu = m;
            max_transfer_size = max_transfer_size_for(m);
            return *this;
        }
        TransportConfig &set_session_capacity(u32 n) {
            session_capacity = n;
            return *this;
        }
        TransportConfig &set_tx_queue_capacity(u32 n) {
            tx_queue_capacity = n;
            return *this;
        }
        TransportConfig &set_max_transfer_size(u32 bytes) {
            max_transfer_size = bytes;
            return *this;
        }
        TransportConfig &set_transfer_id_timeout(u64 us) {
            transfer_id_timeout_us = us;
            return *this;
        }
        TransportConfig &set_initial_toggle(bool t) {
            initial_toggle = t;
            return *this;
        }
        TransportConfig &set_node_id(NodeId id) {
            local_node_id = id;
            return *this;
        }
        TransportConfig &set_anonymous() {
            local_node_id = dp::nullopt;
            return *this;
        }

        // Payload bytes one frame can carry once the tail byte is reserved
        usize frame_capacity() const noexcept { return mtu > TAIL_BYTE_SIZE ? mtu - TAIL_BYTE_SIZE : 0; }

        // Reassembly buffer size per session: payload plus the trailing CRC
        usize buffer_capacity() const noexcept { return static_cast<usize>(max_transfer_size) + CRC_SIZE; }
    };

    // ─── Checks a config before any engine is built from it ─────────────────────
    inline Result<void> validate_config(const TransportConfig &config) {
        dp::String problem;
        if (config.mtu < CAN_CLASSIC_MTU || config.mtu > CAN_FD_MTU) {
            problem = "mtu must be within 8..64, got " + dp::String(std::to_string(config.mtu));
        } else if (config.tx_queue_capacity == 0) {
            problem = "tx queue capacity must be non-zero";
        } else if (config.max_transfer_size == 0) {
            problem = "max transfer size must be non-zero";
        } else if (config.local_node_id.has_value() && *config.local_node_id > NODE_ID_MAX) {
            problem = "node id out of range: " + dp::String(std::to_string(*config.local_node_id));
        }

        if (!problem.empty()) {
            echo::category("cyphal.config").error("invalid transport config: ", problem);
            return Result<void>::err(Error::invalid_argument(problem));
        }
        if (config.session_capacity == 0) {
            echo::category("cyphal.config").error("invalid transport config: session capacity is zero");
            return Result<void>::err(Error::table_full());
        }
        return {};
    }

} // namespace cyphal
