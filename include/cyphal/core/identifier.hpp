#pragma once

#include "constants.hpp"
#include "types.hpp"
#include "../util/bitfield.hpp"

namespace cyphal {

    // ─── Cyphal/CAN identifier (29-bit extended ID) ─────────────────────────────
    // Message: [Priority:3][Svc=0:1][Anon:1][R=0:1][R=11:2][Subject:13][R=0:1][Source:7]
    // Service: [Priority:3][Svc=1:1][Req:1][R=0:1][Service:9][Destination:7][Source:7]
    struct Identifier {
        u32 raw = 0;

        static constexpr u32 SERVICE_FLAG = 1UL << 25;
        static constexpr u32 ANONYMOUS_FLAG = 1UL << 24;
        static constexpr u32 REQUEST_FLAG = 1UL << 24;
        static constexpr u32 RESERVED_23 = 1UL << 23;
        static constexpr u32 MESSAGE_FIXED_BITS = 3UL << 21;
        static constexpr u32 RESERVED_07 = 1UL << 7;

        constexpr Identifier() = default;
        constexpr explicit Identifier(u32 id) : raw(id & CAN_EXT_ID_MASK) {}

        constexpr Priority priority() const noexcept { return static_cast<Priority>(bitfield::get_bits(raw, 26, 3)); }

        constexpr bool is_service() const noexcept { return (raw & SERVICE_FLAG) != 0; }

        constexpr bool is_message() const noexcept { return !is_service(); }

        constexpr bool is_anonymous() const noexcept { return is_message() && (raw & ANONYMOUS_FLAG) != 0; }

        constexpr bool is_request() const noexcept { return is_service() && (raw & REQUEST_FLAG) != 0; }

        constexpr TransferKind kind() const noexcept {
            if (is_message())
                return TransferKind::Message;
            return is_request() ? TransferKind::Request : TransferKind::Response;
        }

        constexpr PortId subject_id() const noexcept { return static_cast<PortId>(bitfield::get_bits(raw, 8, 13)); }

        constexpr PortId service_id() const noexcept { return static_cast<PortId>(bitfield::get_bits(raw, 14, 9)); }

        constexpr PortId port_id() const noexcept { return is_service() ? service_id() : subject_id(); }

        constexpr NodeId source() const noexcept { return static_cast<NodeId>(bitfield::get_bits(raw, 0, 7)); }

        constexpr NodeId destination() const noexcept { return static_cast<NodeId>(bitfield::get_bits(raw, 7, 7)); }

        // Reserved bits that a receiver must see cleared
        constexpr bool reserved_bits_valid() const noexcept {
            if ((raw & RESERVED_23) != 0)
                return false;
            if (is_message() && (raw & RESERVED_07) != 0)
                return false;
            return true;
        }

        static constexpr Identifier encode_message(Priority prio, PortId subject, NodeId source,
                                                   bool anonymous = false) noexcept {
            u32 id = 0;
            id |= (static_cast<u32>(prio) & 0x07) << 26;
            if (anonymous) {
                id |= ANONYMOUS_FLAG;
            }
            id |= MESSAGE_FIXED_BITS;
            id |= (static_cast<u32>(subject) & 0x1FFF) << 8;
            id |= static_cast<u32>(source) & 0x7F;
            return Identifier(id);
        }

        static constexpr Identifier encode_service(Priority prio, bool request, PortId service, NodeId destination,
                                                   NodeId source) noexcept {
            u32 id = SERVICE_FLAG;
            id |= (static_cast<u32>(prio) & 0x07) << 26;
            if (request) {
                id |= REQUEST_FLAG;
            }
            id |= (static_cast<u32>(service) & 0x1FF) << 14;
            id |= (static_cast<u32>(destination) & 0x7F) << 7;
            id |= static_cast<u32>(source) & 0x7F;
            return Identifier(id);
        }

        constexpr bool operator==(const Identifier &other) const noexcept { return raw == other.raw; }
        constexpr bool operator!=(const Identifier &other) const noexcept { return raw != other.raw; }
    };

    // ─── Tail byte (last payload byte of every frame) ───────────────────────────
    // Layout: [SOT:1][EOT:1][Toggle:1][TransferId:5]
    struct TailByte {
        u8 raw = 0;

        constexpr TailByte() = default;
        constexpr explicit TailByte(u8 b) : raw(b) {}

        constexpr bool start_of_transfer() const noexcept { return bitfield::get_bit(raw, 7); }
        constexpr bool end_of_transfer() const noexcept { return bitfield::get_bit(raw, 6); }
        constexpr bool toggle() const noexcept { return bitfield::get_bit(raw, 5); }
        constexpr TransferId transfer_id() const noexcept { return static_cast<TransferId>(raw & TRANSFER_ID_MAX); }

        static constexpr TailByte make(bool sot, bool eot, bool toggle, TransferId tid) noexcept {
            u8 b = static_cast<u8>(tid & TRANSFER_ID_MAX);
            if (sot)
                b |= 0x80;
            if (eot)
                b |= 0x40;
            if (toggle)
                b |= 0x20;
            return TailByte(b);
        }
    };

} // namespace cyphal
