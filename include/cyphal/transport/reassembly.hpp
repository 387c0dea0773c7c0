#pragma once

#include "../core/config.hpp"
#include "../core/error.hpp"
#include "../core/frame.hpp"
#include "../core/transfer.hpp"
#include "../util/event.hpp"
#include "codec.hpp"
#include "session.hpp"
#include <datapod/datapod.hpp>
#include <echo/echo.hpp>

namespace cyphal {
    namespace transport {

        namespace rx {

            // ─── Transfer-ID ordering under modulo-32 wraparound ─────────────────────
            // Forward distance 1..15 is newer; 0 is the same transfer; 16..31 is older.
            constexpr u8 forward_distance(TransferId from, TransferId to) noexcept {
                return static_cast<u8>((to - from) & TRANSFER_ID_MAX);
            }

            constexpr bool is_newer(TransferId candidate, TransferId reference) noexcept {
                u8 d = forward_distance(reference, candidate);
                return d != 0 && d < TRANSFER_ID_MODULO / 2;
            }

            enum class Action : u8 {
                Begin,    // start a new transfer with this frame
                Continue, // append to the transfer in progress
                Drop,     // discard the frame, session untouched
                Reset,    // discard the frame and abandon the transfer in progress
            };

            struct Decision {
                Action action = Action::Drop;
                DiscardReason reason = DiscardReason::None;
            };

            struct Policy {
                bool initial_toggle = DEFAULT_INITIAL_TOGGLE;
                u64 transfer_id_timeout_us = DEFAULT_TRANSFER_ID_TIMEOUT_US;
            };

            // ─── Pure transition function: what should this frame do to the session ──
            // A transfer in progress belongs to the interface that delivered its start
            // frame. Other interfaces are ignored until that one has been silent for
            // longer than the transfer-ID timeout.
            inline Decision classify(const RxSession &s, const DecodedFrame &f, InterfaceId iface, u64 now_us,
                                     const Policy &policy) noexcept {
                if (s.accumulating()) {
                    bool stalled = now_us >= s.last_frame_us &&
                                   now_us - s.last_frame_us > policy.transfer_id_timeout_us;
                    if (iface != s.iface && !stalled) {
                        return {Action::Drop, DiscardReason::Duplicate};
                    }
                    if (iface == s.iface && f.transfer_id == s.transfer_id) {
                        if (f.toggle == s.expected_toggle && !f.start_of_transfer) {
                            return {Action::Continue, DiscardReason::None};
                        }
                        return {Action::Reset, DiscardReason::ToggleMismatch};
                    }
                }

                bool history_valid =
                    s.has_history && now_us >= s.last_transfer_us &&
                    now_us - s.last_transfer_us <= policy.transfer_id_timeout_us;
                if (history_valid && !is_newer(f.transfer_id, s.last_transfer_id)) {
                    return {Action::Drop, DiscardReason::Duplicate};
                }

                if (!f.start_of_transfer) {
                    return {s.accumulating() ? Action::Reset : Action::Drop, DiscardReason::OutOfSequence};
                }
                if (f.toggle != policy.initial_toggle) {
                    return {s.accumulating() ? Action::Reset : Action::Drop, DiscardReason::ToggleMismatch};
                }
                return {Action::Begin, DiscardReason::None};
            }

        } // namespace rx

        // ─── Reassembly engine ──────────────────────────────────────────────────────
        // Turns raw frames from any number of sources and interfaces into complete,
        // CRC-checked transfers. Each call processes exactly one frame and leaves the
        // affected session either advanced or reset.
        class Reassembler {
            TransportConfig config_;
            SessionTable sessions_;

          public:
            explicit Reassembler(const TransportConfig &config = {})
                : config_(config), sessions_(config.session_capacity, config.buffer_capacity()) {}

            // ─── Accept one frame ───────────────────────────────────────────────────
            // ok(transfer) when this frame completes a transfer, ok(nullopt) when more
            // frames are expected or the frame is not addressed to this node.
            Result<dp::Optional<Transfer>> accept(const CanFrame &raw, InterfaceId iface, u64 now_us) {
                using Out = Result<dp::Optional<Transfer>>;

                auto decoded = codec::decode(raw);
                if (!decoded.is_ok()) {
                    echo::category("cyphal.transport.rx")
                        .debug("malformed frame id=", raw.id.raw, ": ", decoded.error().message);
                    return Out::err(decoded.error());
                }
                const DecodedFrame &f = decoded.value();

                if (raw.length > config_.mtu) {
                    return Out::err(Error::malformed("frame longer than the link MTU"));
                }
                if (!f.end_of_transfer && raw.length < config_.mtu) {
                    return Out::err(Error::malformed("non-last frame does not fill the MTU"));
                }

                if (is_service(f.kind) && !addressed_to_us(f)) {
                    echo::category("cyphal.transport.rx")
                        .trace("service frame for node ", static_cast<u32>(*f.destination), " ignored");
                    return Out::ok(dp::nullopt);
                }

                if (f.is_anonymous()) {
                    return accept_anonymous(f, iface, now_us);
                }

                SessionKey key = SessionKey::from_frame(f);
                auto lookup = sessions_.lookup_or_create(key, now_us);
                if (!lookup.is_ok()) {
                    return Out::err(lookup.error());
                }
                RxSession &s = *lookup.value();

                rx::Decision decision = rx::classify(s, f, iface, now_us, policy());
                switch (decision.action) {
                case rx::Action::Drop:
                    return discard(s, decision.reason, false);
                case rx::Action::Reset:
                    return discard(s, decision.reason, true);
                case rx::Action::Begin:
                    begin(s, f, iface, now_us);
                    break;
                case rx::Action::Continue:
                    break;
                }

                usize limit = f.single_frame() ? config_.max_transfer_size : sessions_.buffer_capacity();
                if (s.buffer.size() + f.payload_size > limit) {
                    return discard(s, DiscardReason::Overflow, true);
                }

                DataSpan chunk = f.data();
                s.buffer.insert(s.buffer.end(), chunk.begin(), chunk.end());
                s.crc.add(chunk);
                s.expected_toggle = !s.expected_toggle;
                s.last_frame_us = now_us;

                if (!f.end_of_transfer) {
                    echo::category("cyphal.transport.rx")
                        .trace("frame absorbed: src=", key.source, " port=", key.port_id, " tid=",
                               static_cast<u32>(f.transfer_id), " bytes=", s.buffer.size());
                    return Out::ok(dp::nullopt);
                }
                return complete(s, f.single_frame());
            }

            Result<dp::Optional<Transfer>> accept(const CanFrame &raw) { return accept(raw, raw.iface, raw.timestamp_us); }

            usize prune(u64 now_us, u64 max_age_us) { return sessions_.prune(now_us, max_age_us); }

            SessionTable &sessions() noexcept { return sessions_; }
            const SessionTable &sessions() const noexcept { return sessions_; }
            const TransportConfig &config() const noexcept { return config_; }

            void set_local_node_id(dp::Optional<NodeId> id) noexcept { config_.local_node_id = id; }

            // ─── Events ──────────────────────────────────────────────────────────────
            Event<const Transfer &> on_transfer;
            Event<const SessionKey &, DiscardReason> on_discard;

          private:
            rx::Policy policy() const noexcept { return {config_.initial_toggle, config_.transfer_id_timeout_us}; }

            bool addressed_to_us(const DecodedFrame &f) const noexcept {
                return config_.local_node_id.has_value() && f.destination == config_.local_node_id;
            }

            void begin(RxSession &s, const DecodedFrame &f, InterfaceId iface, u64 now_us) {
                s.reset();
                s.phase = RxPhase::Accumulating;
                s.transfer_id = f.transfer_id;
                s.expected_toggle = config_.initial_toggle;
                s.priority = f.priority;
                s.iface = iface;
                s.start_us = now_us;
            }

            Result<dp::Optional<Transfer>> discard(RxSession &s, DiscardReason reason, bool reset) {
                echo::category("cyphal.transport.rx")
                    .debug("frame discarded (", to_string(reason), "): src=", s.key.source, " port=", s.key.port_id,
                           reset ? " transfer abandoned" : "");
                if (reset) {
                    s.reset();
                }
                on_discard.emit(s.key, reason);
                return Result<dp::Optional<Transfer>>::err(Error::discarded(reason));
            }

            Result<dp::Optional<Transfer>> complete(RxSession &s, bool single_frame) {
                usize payload_size = s.buffer.size();
                if (!single_frame) {
                    if (s.buffer.size() < CRC_SIZE || !s.crc.residue_ok()) {
                        return discard(s, DiscardReason::CrcMismatch, true);
                    }
                    payload_size -= CRC_SIZE;
                }

                Transfer transfer;
                transfer.metadata.priority = s.priority;
                transfer.metadata.kind = s.key.kind;
                transfer.metadata.port_id = s.key.port_id;
                transfer.metadata.source = s.key.source;
                transfer.metadata.destination = s.key.destination;
                transfer.metadata.transfer_id = s.transfer_id;
                transfer.timestamp_us = s.start_us;
                transfer.iface = s.iface;
                transfer.payload.insert(transfer.payload.end(), s.buffer.begin(),
                                        s.buffer.begin() + static_cast<isize>(payload_size));

                s.has_history = true;
                s.last_transfer_id = s.transfer_id;
                s.last_transfer_us = s.start_us;
                s.reset();

                echo::category("cyphal.transport.rx")
                    .debug("transfer complete: src=", s.key.source, " port=", s.key.port_id,
                           " tid=", static_cast<u32>(transfer.metadata.transfer_id), " bytes=", payload_size);
                on_transfer.emit(transfer);
                return Result<dp::Optional<Transfer>>::ok(std::move(transfer));
            }

            Result<dp::Optional<Transfer>> accept_anonymous(const DecodedFrame &f, InterfaceId iface, u64 now_us) {
                if (f.payload_size > config_.max_transfer_size) {
                    return Result<dp::Optional<Transfer>>::err(Error::discarded(DiscardReason::Overflow));
                }
                Transfer transfer;
                transfer.metadata = f.metadata();
                transfer.timestamp_us = now_us;
                transfer.iface = iface;
                DataSpan chunk = f.data();
                transfer.payload.insert(transfer.payload.end(), chunk.begin(), chunk.end());
                echo::category("cyphal.transport.rx")
                    .trace("anonymous transfer on subject ", f.port_id, " bytes=", chunk.size());
                on_transfer.emit(transfer);
                return Result<dp::Optional<Transfer>>::ok(std::move(transfer));
            }
        };

    } // namespace transport
    using namespace transport;
} // namespace cyphal
