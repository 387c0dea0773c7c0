#pragma once

#include <datapod/datapod.hpp>

namespace cyphal {

    // ─── Numeric type aliases ────────────────────────────────────────────────────
    using dp::f32;
    using dp::f64;
    using dp::i16;
    using dp::i32;
    using dp::i64;
    using dp::i8;
    using dp::isize;
    using dp::u16;
    using dp::u32;
    using dp::u64;
    using dp::u8;
    using dp::usize;

    // ─── Domain-specific types ───────────────────────────────────────────────────
    using NodeId = u8;      // 7-bit node address
    using PortId = u16;     // subject id (messages) or service id (services)
    using TransferId = u8;  // 5-bit wrapping counter
    using InterfaceId = u8; // redundant physical interface index

    // ─── Priority (3-bit field in CAN identifier) ────────────────────────────────
    enum class Priority : u8 {
        Exceptional = 0,
        Immediate = 1,
        Fast = 2,
        High = 3,
        Nominal = 4,
        Low = 5,
        Slow = 6,
        Optional = 7
    };

    // ─── Transfer kind ───────────────────────────────────────────────────────────
    enum class TransferKind : u8 { Message = 0, Request = 1, Response = 2 };

    inline constexpr bool is_service(TransferKind kind) noexcept { return kind != TransferKind::Message; }

} // namespace cyphal
