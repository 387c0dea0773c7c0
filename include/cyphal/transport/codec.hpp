#pragma once

#include "../core/constants.hpp"
#include "../core/error.hpp"
#include "../core/frame.hpp"
#include "../core/identifier.hpp"
#include "../core/transfer.hpp"
#include "../util/crc.hpp"
#include "../util/data_span.hpp"
#include <datapod/datapod.hpp>
#include <echo/echo.hpp>
#include <string>

namespace cyphal {
    namespace transport {

        inline constexpr usize MAX_FRAME_PAYLOAD = MAX_MTU - TAIL_BYTE_SIZE;

        // ─── One frame, identifier and tail byte decoded ────────────────────────────
        // The payload excludes the tail byte. Instances meant for transmission come
        // from make_frame(), which enforces the address ranges; encode() trusts them.
        struct DecodedFrame {
            Priority priority = Priority::Nominal;
            TransferKind kind = TransferKind::Message;
            PortId port_id = 0;
            dp::Optional<NodeId> source;
            dp::Optional<NodeId> destination;
            TransferId transfer_id = 0;
            bool toggle = false;
            bool start_of_transfer = false;
            bool end_of_transfer = false;
            dp::Array<u8, MAX_FRAME_PAYLOAD> payload = {};
            u8 payload_size = 0;

            DataSpan data() const noexcept { return DataSpan(payload.data(), payload_size); }

            bool single_frame() const noexcept { return start_of_transfer && end_of_transfer; }

            bool is_anonymous() const noexcept { return kind == TransferKind::Message && !source.has_value(); }

            TailByte tail() const noexcept {
                return TailByte::make(start_of_transfer, end_of_transfer, toggle, transfer_id);
            }

            TransferMetadata metadata() const {
                TransferMetadata m;
                m.priority = priority;
                m.kind = kind;
                m.port_id = port_id;
                m.source = source;
                m.destination = destination;
                m.transfer_id = transfer_id;
                return m;
            }
        };

        namespace codec {

            // ─── Validates metadata against the wire's field widths ──────────────────
            inline Result<void> check_metadata(const TransferMetadata &meta) {
                if (meta.transfer_id > TRANSFER_ID_MAX) {
                    return Result<void>::err(
                        Error::invalid_argument("transfer id out of range: " + dp::String(std::to_string(meta.transfer_id))));
                }
                if (meta.source.has_value() && *meta.source > NODE_ID_MAX) {
                    return Result<void>::err(
                        Error::invalid_argument("source node out of range: " + dp::String(std::to_string(*meta.source))));
                }
                if (meta.kind == TransferKind::Message) {
                    if (meta.port_id > SUBJECT_ID_MAX) {
                        return Result<void>::err(
                            Error::invalid_argument("subject id out of range: " + dp::String(std::to_string(meta.port_id))));
                    }
                    return {};
                }
                if (meta.port_id > SERVICE_ID_MAX) {
                    return Result<void>::err(
                        Error::invalid_argument("service id out of range: " + dp::String(std::to_string(meta.port_id))));
                }
                if (!meta.source.has_value()) {
                    return Result<void>::err(Error::invalid_argument("service transfer needs a source node"));
                }
                if (!meta.destination.has_value()) {
                    return Result<void>::err(Error::invalid_argument("service transfer needs a destination node"));
                }
                if (*meta.destination > NODE_ID_MAX) {
                    return Result<void>::err(Error::invalid_argument("destination node out of range: " +
                                                                     dp::String(std::to_string(*meta.destination))));
                }
                if (*meta.destination == *meta.source) {
                    return Result<void>::err(Error::invalid_argument("service source equals destination"));
                }
                return {};
            }

            // Unchecked: the caller has already validated the metadata and chunk size
            inline DecodedFrame build_frame(const TransferMetadata &meta, bool sot, bool eot, bool toggle,
                                            DataSpan chunk) noexcept {
                DecodedFrame f;
                f.priority = meta.priority;
                f.kind = meta.kind;
                f.port_id = meta.port_id;
                f.source = meta.source;
                f.destination = meta.kind == TransferKind::Message ? dp::Optional<NodeId>{} : meta.destination;
                f.transfer_id = meta.transfer_id;
                f.toggle = toggle;
                f.start_of_transfer = sot;
                f.end_of_transfer = eot;
                for (usize i = 0; i < chunk.size(); ++i) {
                    f.payload[i] = chunk[i];
                }
                f.payload_size = static_cast<u8>(chunk.size());
                return f;
            }

            // ─── Builds a frame for transmission ─────────────────────────────────────
            inline Result<DecodedFrame> make_frame(const TransferMetadata &meta, bool sot, bool eot, bool toggle,
                                                   DataSpan chunk) {
                auto valid = check_metadata(meta);
                if (!valid.is_ok()) {
                    return Result<DecodedFrame>::err(valid.error());
                }
                if (chunk.size() > MAX_FRAME_PAYLOAD) {
                    return Result<DecodedFrame>::err(Error::payload_too_large(chunk.size(), MAX_FRAME_PAYLOAD));
                }
                if (meta.is_anonymous() && !(sot && eot)) {
                    return Result<DecodedFrame>::err(Error::invalid_argument("anonymous transfer must be single-frame"));
                }

                return Result<DecodedFrame>::ok(build_frame(meta, sot, eot, toggle, chunk));
            }

            // Anonymous senders put a pseudo node id derived from the payload in the source field
            inline NodeId pseudo_node_id(DataSpan payload) noexcept {
                return static_cast<NodeId>(crc::compute(payload) & NODE_ID_MAX);
            }

            inline Identifier make_identifier(const DecodedFrame &f) noexcept {
                switch (f.kind) {
                case TransferKind::Message:
                    if (f.source.has_value()) {
                        return Identifier::encode_message(f.priority, f.port_id, *f.source);
                    }
                    return Identifier::encode_message(f.priority, f.port_id, pseudo_node_id(f.data()), true);
                case TransferKind::Request:
                case TransferKind::Response:
                    break;
                }
                return Identifier::encode_service(f.priority, f.kind == TransferKind::Request, f.port_id,
                                                  f.destination.has_value() ? *f.destination : NodeId{0},
                                                  f.source.has_value() ? *f.source : NodeId{0});
            }

            // ─── DecodedFrame -> raw frame ───────────────────────────────────────────
            inline CanFrame encode(const DecodedFrame &f) noexcept {
                CanFrame out;
                out.id = make_identifier(f);
                for (u8 i = 0; i < f.payload_size; ++i) {
                    out.data[i] = f.payload[i];
                }
                out.data[f.payload_size] = f.tail().raw;
                out.length = static_cast<u8>(f.payload_size + TAIL_BYTE_SIZE);
                return out;
            }

            // ─── Raw identifier + payload -> DecodedFrame ────────────────────────────
            inline Result<DecodedFrame> decode(u32 raw_id, DataSpan raw_payload) {
                if (raw_id > CAN_EXT_ID_MASK) {
                    return Result<DecodedFrame>::err(Error::malformed("identifier wider than 29 bits"));
                }
                if (raw_payload.empty()) {
                    return Result<DecodedFrame>::err(Error::malformed("frame carries no tail byte"));
                }
                if (raw_payload.size() > MAX_MTU) {
                    return Result<DecodedFrame>::err(Error::malformed("frame longer than the largest MTU"));
                }

                Identifier id(raw_id);
                if (!id.reserved_bits_valid()) {
                    return Result<DecodedFrame>::err(Error::malformed("reserved identifier bit set"));
                }

                TailByte tail(raw_payload.back());
                DecodedFrame f;
                f.priority = id.priority();
                f.kind = id.kind();
                f.port_id = id.port_id();
                f.transfer_id = tail.transfer_id();
                f.toggle = tail.toggle();
                f.start_of_transfer = tail.start_of_transfer();
                f.end_of_transfer = tail.end_of_transfer();

                if (id.is_service()) {
                    if (id.source() == id.destination()) {
                        return Result<DecodedFrame>::err(Error::malformed("service source equals destination"));
                    }
                    f.source = id.source();
                    f.destination = id.destination();
                } else if (id.is_anonymous()) {
                    if (!f.single_frame()) {
                        return Result<DecodedFrame>::err(Error::malformed("anonymous transfer spans frames"));
                    }
                } else {
                    f.source = id.source();
                }

                DataSpan body = raw_payload.drop_back(TAIL_BYTE_SIZE);
                for (usize i = 0; i < body.size(); ++i) {
                    f.payload[i] = body[i];
                }
                f.payload_size = static_cast<u8>(body.size());
                return Result<DecodedFrame>::ok(f);
            }

            inline Result<DecodedFrame> decode(const CanFrame &frame) {
                return decode(frame.id.raw, DataSpan(frame.data.data(), frame.length));
            }

        } // namespace codec

    } // namespace transport
    using namespace transport;
} // namespace cyphal
