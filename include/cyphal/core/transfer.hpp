#pragma once

#include "constants.hpp"
#include "types.hpp"
#include "../util/bitfield.hpp"
#include <datapod/datapod.hpp>
#include <utility>

namespace cyphal {

    // ─── Transfer metadata (transport-agnostic addressing) ──────────────────────
    struct TransferMetadata {
        Priority priority = Priority::Nominal;
        TransferKind kind = TransferKind::Message;
        PortId port_id = 0;
        dp::Optional<NodeId> source;      // nullopt for anonymous messages
        dp::Optional<NodeId> destination; // services only
        TransferId transfer_id = 0;

        static TransferMetadata message(Priority prio, PortId subject, dp::Optional<NodeId> src, TransferId tid) {
            TransferMetadata m;
            m.priority = prio;
            m.kind = TransferKind::Message;
            m.port_id = subject;
            m.source = src;
            m.transfer_id = tid;
            return m;
        }

        static TransferMetadata service(Priority prio, TransferKind kind, PortId service_id, NodeId src, NodeId dst,
                                        TransferId tid) {
            TransferMetadata m;
            m.priority = prio;
            m.kind = kind;
            m.port_id = service_id;
            m.source = src;
            m.destination = dst;
            m.transfer_id = tid;
            return m;
        }

        bool is_anonymous() const noexcept { return kind == TransferKind::Message && !source.has_value(); }
    };

    // ─── Complete application-level transfer ────────────────────────────────────
    struct Transfer {
        TransferMetadata metadata;
        dp::Vector<u8> payload;
        u64 timestamp_us = 0; // arrival of the first frame
        InterfaceId iface = 0; // interface of the frame that completed it

        Transfer() = default;

        Transfer(TransferMetadata meta, dp::Vector<u8> data, u64 ts_us = 0)
            : metadata(meta), payload(std::move(data)), timestamp_us(ts_us) {}

        usize size() const noexcept { return payload.size(); }

        u8 get_u8(usize offset) const noexcept {
            if (offset >= payload.size())
                return 0;
            return payload[offset];
        }

        u16 get_u16_le(usize offset) const noexcept {
            if (offset + 1 >= payload.size())
                return 0;
            return bitfield::unpack_u16_le(payload.data() + offset);
        }
    };

} // namespace cyphal
