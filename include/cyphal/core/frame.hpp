#pragma once

#include "constants.hpp"
#include "identifier.hpp"
#include "types.hpp"
#include <datapod/datapod.hpp>

namespace cyphal {

    // ─── Raw link frame (Classic CAN or CAN FD, 29-bit identifier) ──────────────
    struct CanFrame {
        Identifier id;
        dp::Array<u8, MAX_MTU> data = {};
        u8 length = 0;
        u64 timestamp_us = 0;
        InterfaceId iface = 0;

        constexpr CanFrame() = default;

        CanFrame(u32 raw_id, const u8 *payload, usize len, u64 ts_us = 0, InterfaceId interface = 0)
            : id(raw_id), timestamp_us(ts_us), iface(interface) {
            length = static_cast<u8>(len > MAX_MTU ? MAX_MTU : len);
            for (u8 i = 0; i < length; ++i) {
                data[i] = payload[i];
            }
        }

        constexpr const u8 *begin() const noexcept { return data.data(); }
        constexpr const u8 *end() const noexcept { return data.data() + length; }

        constexpr bool empty() const noexcept { return length == 0; }

        constexpr TailByte tail() const noexcept { return length == 0 ? TailByte{} : TailByte(data[length - 1]); }
    };

} // namespace cyphal
