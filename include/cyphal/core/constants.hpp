#pragma once

#include "types.hpp"

namespace cyphal {

    // ─── Addressing limits (Cyphal/CAN v1.0) ─────────────────────────────────────
    inline constexpr NodeId NODE_ID_MAX = 127;
    inline constexpr PortId SUBJECT_ID_MAX = 8191;
    inline constexpr PortId SERVICE_ID_MAX = 511;

    // ─── Transfer-ID ─────────────────────────────────────────────────────────────
    inline constexpr u8 TRANSFER_ID_BITS = 5;
    inline constexpr u8 TRANSFER_ID_MODULO = 1U << TRANSFER_ID_BITS;
    inline constexpr TransferId TRANSFER_ID_MAX = TRANSFER_ID_MODULO - 1;

    // ─── Frame layout ────────────────────────────────────────────────────────────
    inline constexpr u8 CAN_CLASSIC_MTU = 8;
    inline constexpr u8 CAN_FD_MTU = 64;
    inline constexpr u8 MAX_MTU = CAN_FD_MTU;
    inline constexpr u8 TAIL_BYTE_SIZE = 1;
    inline constexpr u8 CRC_SIZE = 2;
    inline constexpr u32 CAN_EXT_ID_MASK = 0x1FFFFFFF;

    // ─── Defaults ────────────────────────────────────────────────────────────────
    inline constexpr u32 DEFAULT_MAX_FRAMES_PER_TRANSFER = 64;
    inline constexpr u32 DEFAULT_SESSION_CAPACITY = 64;
    inline constexpr u32 DEFAULT_TX_QUEUE_CAPACITY = 256;
    inline constexpr u64 DEFAULT_TRANSFER_ID_TIMEOUT_US = 2'000'000;
    inline constexpr bool DEFAULT_INITIAL_TOGGLE = true; // Cyphal v1 starts every transfer with toggle set

    // Largest payload a transfer may carry on a link with the given MTU (CRC excluded)
    inline constexpr u32 max_transfer_size_for(u8 mtu, u32 max_frames = DEFAULT_MAX_FRAMES_PER_TRANSFER) noexcept {
        if (mtu <= TAIL_BYTE_SIZE || max_frames == 0)
            return 0;
        u32 capacity = static_cast<u32>(mtu - TAIL_BYTE_SIZE) * max_frames;
        return capacity > CRC_SIZE ? capacity - CRC_SIZE : 0;
    }

} // namespace cyphal
