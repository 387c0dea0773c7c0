#pragma once

#include "../core/constants.hpp"
#include "../core/error.hpp"
#include "../core/types.hpp"
#include "../util/crc.hpp"
#include "../util/event.hpp"
#include "codec.hpp"
#include <datapod/datapod.hpp>
#include <echo/echo.hpp>

namespace cyphal {
    namespace transport {

        // ─── Session key: one logical reassembly stream ──────────────────────────────
        // The interface a frame arrived on is deliberately not part of the key.
        struct SessionKey {
            NodeId source = 0;
            TransferKind kind = TransferKind::Message;
            PortId port_id = 0;
            dp::Optional<NodeId> destination; // services only

            static SessionKey from_frame(const DecodedFrame &f) {
                SessionKey k;
                k.source = f.source.has_value() ? *f.source : NodeId{0};
                k.kind = f.kind;
                k.port_id = f.port_id;
                k.destination = is_service(f.kind) ? f.destination : dp::Optional<NodeId>{};
                return k;
            }

            bool operator==(const SessionKey &other) const noexcept {
                return source == other.source && kind == other.kind && port_id == other.port_id &&
                       destination == other.destination;
            }
            bool operator!=(const SessionKey &other) const noexcept { return !(*this == other); }
        };

        // ─── Reassembly phase ────────────────────────────────────────────────────────
        enum class RxPhase : u8 { Idle, Accumulating };

        // ─── Per-key reassembly state ───────────────────────────────────────────────
        struct RxSession {
            SessionKey key;
            RxPhase phase = RxPhase::Idle;

            // Duplicate/stale detection
            bool has_history = false;
            TransferId last_transfer_id = 0;
            u64 last_transfer_us = 0;

            // Transfer in progress (meaningful while Accumulating)
            TransferId transfer_id = 0;
            bool expected_toggle = DEFAULT_INITIAL_TOGGLE;
            Priority priority = Priority::Nominal;
            InterfaceId iface = 0;   // interface that delivered the start frame
            u64 last_frame_us = 0;   // arrival of the last frame absorbed from `iface`
            TransferCrc crc;
            dp::Vector<u8> buffer; // reserved once, never grown past its capacity

            u64 start_us = 0;
            u64 updated_us = 0;

            usize bytes_received() const noexcept { return buffer.size(); }

            bool accumulating() const noexcept { return phase == RxPhase::Accumulating; }

            // Drop the in-progress transfer, keep the transfer-ID history
            void reset() noexcept {
                phase = RxPhase::Idle;
                buffer.clear();
                crc.reset();
            }

            void forget() noexcept {
                reset();
                has_history = false;
                last_transfer_id = 0;
                last_transfer_us = 0;
                start_us = 0;
                updated_us = 0;
                last_frame_us = 0;
            }
        };

        // ─── Fixed-capacity session table ───────────────────────────────────────────
        // Slots are allocated at construction. A new key takes a free slot, or the
        // least-recently-updated slot when none is free.
        class SessionTable {
            struct Slot {
                RxSession session;
                u64 touched = 0;
                bool used = false;
            };

            dp::Vector<Slot> slots_;
            dp::Vector<u32> free_;
            u64 touch_clock_ = 0;
            usize buffer_capacity_ = 0;

          public:
            SessionTable(usize capacity, usize buffer_capacity) : buffer_capacity_(buffer_capacity) {
                slots_.resize(capacity);
                free_.reserve(capacity);
                for (usize i = 0; i < capacity; ++i) {
                    slots_[i].session.buffer.reserve(buffer_capacity);
                    free_.push_back(static_cast<u32>(capacity - 1 - i));
                }
            }

            SessionTable(const SessionTable &) = delete;
            SessionTable &operator=(const SessionTable &) = delete;

            // ─── Fetch a session, creating (and possibly evicting) on first sight ────
            Result<RxSession *> lookup_or_create(const SessionKey &key, u64 now_us) {
                if (auto *slot = find_slot(key)) {
                    touch(*slot, now_us);
                    return Result<RxSession *>::ok(&slot->session);
                }
                if (slots_.empty()) {
                    echo::category("cyphal.session").error("session table has no capacity");
                    return Result<RxSession *>::err(Error::table_full());
                }

                u32 index = 0;
                if (!free_.empty()) {
                    index = free_.back();
                    free_.pop_back();
                } else {
                    index = least_recently_updated();
                    echo::category("cyphal.session")
                        .debug("evicting session: src=", slots_[index].session.key.source,
                               " port=", slots_[index].session.key.port_id);
                    on_evict.emit(slots_[index].session.key);
                }

                Slot &slot = slots_[index];
                slot.session.forget();
                slot.session.key = key;
                slot.session.start_us = now_us;
                slot.used = true;
                touch(slot, now_us);
                echo::category("cyphal.session").trace("session created: src=", key.source, " port=", key.port_id);
                return Result<RxSession *>::ok(&slot.session);
            }

            RxSession *find(const SessionKey &key) noexcept {
                auto *slot = find_slot(key);
                return slot ? &slot->session : nullptr;
            }

            const RxSession *find(const SessionKey &key) const noexcept {
                for (const auto &slot : slots_) {
                    if (slot.used && slot.session.key == key)
                        return &slot.session;
                }
                return nullptr;
            }

            bool evict(const SessionKey &key) {
                for (usize i = 0; i < slots_.size(); ++i) {
                    if (slots_[i].used && slots_[i].session.key == key) {
                        release(static_cast<u32>(i));
                        return true;
                    }
                }
                return false;
            }

            // ─── Drop sessions whose current transfer started too long ago ──────────
            usize prune(u64 now_us, u64 max_age_us) {
                usize removed = 0;
                for (usize i = 0; i < slots_.size(); ++i) {
                    Slot &slot = slots_[i];
                    if (!slot.used)
                        continue;
                    u64 start = slot.session.start_us;
                    if (now_us > start && now_us - start > max_age_us) {
                        echo::category("cyphal.session")
                            .debug("pruning stale session: src=", slot.session.key.source,
                                   " port=", slot.session.key.port_id, " age_us=", now_us - start);
                        release(static_cast<u32>(i));
                        ++removed;
                    }
                }
                return removed;
            }

            void clear() {
                free_.clear();
                for (usize i = slots_.size(); i > 0; --i) {
                    slots_[i - 1].used = false;
                    slots_[i - 1].session.forget();
                    free_.push_back(static_cast<u32>(i - 1));
                }
            }

            usize size() const noexcept { return slots_.size() - free_.size(); }
            usize capacity() const noexcept { return slots_.size(); }
            usize buffer_capacity() const noexcept { return buffer_capacity_; }
            bool full() const noexcept { return free_.empty(); }

            Event<const SessionKey &> on_evict;

          private:
            Slot *find_slot(const SessionKey &key) noexcept {
                for (auto &slot : slots_) {
                    if (slot.used && slot.session.key == key)
                        return &slot;
                }
                return nullptr;
            }

            void touch(Slot &slot, u64 now_us) noexcept {
                slot.touched = ++touch_clock_;
                slot.session.updated_us = now_us;
            }

            u32 least_recently_updated() const noexcept {
                u32 victim = 0;
                u64 oldest = ~static_cast<u64>(0);
                for (usize i = 0; i < slots_.size(); ++i) {
                    if (slots_[i].used && slots_[i].touched < oldest) {
                        oldest = slots_[i].touched;
                        victim = static_cast<u32>(i);
                    }
                }
                return victim;
            }

            void release(u32 index) {
                slots_[index].used = false;
                slots_[index].session.forget();
                free_.push_back(index);
            }
        };

    } // namespace transport
    using namespace transport;
} // namespace cyphal
