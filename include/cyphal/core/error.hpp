#pragma once

#include "types.hpp"
#include <datapod/datapod.hpp>
#include <string>
#include <utility>

namespace cyphal {

    // ─── Error codes ─────────────────────────────────────────────────────────────
    enum class ErrorCode : u32 {
        Ok = 0,
        MalformedFrame,
        Discarded,
        TableFull,
        QueueFull,
        PayloadTooLarge,
        LinkBusy,
        InvalidArgument,
        NotConnected,
        DriverError,
    };

    // ─── Why a frame was dropped by the reassembler ──────────────────────────────
    enum class DiscardReason : u8 {
        None = 0,
        OutOfSequence,
        ToggleMismatch,
        Overflow,
        CrcMismatch,
        Duplicate,
    };

    inline constexpr const char *to_string(DiscardReason reason) noexcept {
        switch (reason) {
        case DiscardReason::None:
            return "none";
        case DiscardReason::OutOfSequence:
            return "out of sequence";
        case DiscardReason::ToggleMismatch:
            return "toggle mismatch";
        case DiscardReason::Overflow:
            return "overflow";
        case DiscardReason::CrcMismatch:
            return "crc mismatch";
        case DiscardReason::Duplicate:
            return "duplicate";
        }
        return "unknown";
    }

    // ─── Error type ──────────────────────────────────────────────────────────────
    struct Error : dp::Error {
        ErrorCode code = ErrorCode::Ok;
        DiscardReason reason = DiscardReason::None;

        Error() = default;
        Error(ErrorCode c, dp::String msg = "") : dp::Error{static_cast<dp::u32>(c), std::move(msg)}, code(c) {}

        static Error malformed(dp::String msg = "") noexcept {
            return Error(ErrorCode::MalformedFrame, std::move(msg));
        }
        static Error discarded(DiscardReason why) noexcept {
            Error e(ErrorCode::Discarded, dp::String("discarded: ") + to_string(why));
            e.reason = why;
            return e;
        }
        static Error table_full() noexcept { return Error(ErrorCode::TableFull, "session table full"); }
        static Error queue_full(usize needed, usize free) noexcept {
            return Error(ErrorCode::QueueFull, "tx queue full: need " + dp::String(std::to_string(needed)) +
                                                   " free " + dp::String(std::to_string(free)));
        }
        static Error payload_too_large(usize size, usize max) noexcept {
            return Error(ErrorCode::PayloadTooLarge, "payload too large: " + dp::String(std::to_string(size)) +
                                                         " > " + dp::String(std::to_string(max)));
        }
        static Error link_busy() noexcept { return Error(ErrorCode::LinkBusy, "link busy"); }
        static Error invalid_argument(dp::String msg = "") noexcept {
            return Error(ErrorCode::InvalidArgument, std::move(msg));
        }
        static Error not_connected() noexcept { return Error(ErrorCode::NotConnected, "not connected"); }
        static Error driver_error(dp::String msg = "") noexcept {
            return Error(ErrorCode::DriverError, std::move(msg));
        }

        bool is_discard(DiscardReason why) const noexcept { return code == ErrorCode::Discarded && reason == why; }
    };

    // ─── Result alias ────────────────────────────────────────────────────────────
    template <typename T> using Result = dp::Result<T, Error>;

} // namespace cyphal
