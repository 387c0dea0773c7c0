#pragma once

#include "../core/error.hpp"
#include "../core/types.hpp"
#include "codec.hpp"
#include "fragmentation.hpp"
#include <datapod/datapod.hpp>
#include <echo/echo.hpp>

namespace cyphal {
    namespace transport {

        // ─── Priority transmit queue ─────────────────────────────────────────────────
        // Bounded in frames. A transfer is admitted whole or not at all. Frames leave
        // in this order: the rest of a transfer already on the wire, then the lowest
        // priority ordinal, then enqueue order.
        class TxQueue {
            struct Entry {
                DecodedFrame frame;
                u64 transfer_seq = 0;
                u64 order = 0;
                u64 deadline_us = 0; // 0 = none
                bool used = false;
            };

            dp::Vector<Entry> slots_;
            dp::Vector<u32> free_;
            u64 next_transfer_ = 1;
            u64 next_order_ = 1;
            dp::Optional<u64> in_flight_;

          public:
            explicit TxQueue(usize capacity = DEFAULT_TX_QUEUE_CAPACITY) {
                slots_.resize(capacity);
                free_.reserve(capacity);
                for (usize i = capacity; i > 0; --i) {
                    free_.push_back(static_cast<u32>(i - 1));
                }
            }

            TxQueue(const TxQueue &) = delete;
            TxQueue &operator=(const TxQueue &) = delete;

            // ─── Enqueue ─────────────────────────────────────────────────────────────
            Result<void> enqueue(FrameSequence &&seq, u64 deadline_us = 0) {
                usize needed = seq.remaining();
                if (needed > free_.size()) {
                    return reject(needed, seq.metadata().port_id);
                }
                u64 transfer = next_transfer_++;
                while (!seq.done()) {
                    place(*seq.next(), transfer, deadline_us);
                }
                echo::category("cyphal.queue")
                    .trace("enqueued port=", seq.metadata().port_id, " frames=", needed, " free=", free_.size());
                return {};
            }

            Result<void> enqueue(const dp::Vector<DecodedFrame> &frames, u64 deadline_us = 0) {
                if (frames.size() > free_.size()) {
                    return reject(frames.size(), frames.empty() ? 0 : frames[0].port_id);
                }
                u64 transfer = next_transfer_++;
                for (const auto &f : frames) {
                    place(f, transfer, deadline_us);
                }
                return {};
            }

            // ─── Dequeue ─────────────────────────────────────────────────────────────
            // A copy of the next frame plus the slot it came from, so the caller can
            // hand the frame to a link without holding the queue.
            struct Ticket {
                u32 slot = 0;
                u64 order = 0;
                DecodedFrame frame;
            };

            const DecodedFrame *peek() const noexcept {
                dp::Optional<u32> idx = select();
                return idx.has_value() ? &slots_[*idx].frame : nullptr;
            }

            dp::Optional<Ticket> front() const {
                dp::Optional<u32> idx = select();
                if (!idx.has_value()) {
                    return dp::nullopt;
                }
                Ticket t;
                t.slot = *idx;
                t.order = slots_[*idx].order;
                t.frame = slots_[*idx].frame;
                return t;
            }

            // Removes the ticketed frame. False when it is gone already (purged or
            // cleared since front()).
            bool pop(const Ticket &t) {
                if (t.slot >= slots_.size()) {
                    return false;
                }
                Entry &e = slots_[t.slot];
                if (!e.used || e.order != t.order) {
                    return false;
                }
                if (e.frame.end_of_transfer) {
                    in_flight_ = dp::nullopt;
                } else {
                    in_flight_ = e.transfer_seq;
                }
                release(t.slot);
                return true;
            }

            dp::Optional<DecodedFrame> pop_next() {
                dp::Optional<Ticket> t = front();
                if (!t.has_value()) {
                    return dp::nullopt;
                }
                (void)pop(*t);
                return t->frame;
            }

            // Drops every frame whose transfer deadline has passed, including the
            // unsent remainder of the transfer on the wire.
            usize purge_expired(u64 now_us) {
                usize dropped = 0;
                for (usize i = 0; i < slots_.size(); ++i) {
                    Entry &e = slots_[i];
                    if (!e.used || e.deadline_us == 0 || e.deadline_us > now_us)
                        continue;
                    if (in_flight_.has_value() && *in_flight_ == e.transfer_seq) {
                        in_flight_ = dp::nullopt;
                    }
                    release(static_cast<u32>(i));
                    ++dropped;
                }
                if (dropped > 0) {
                    echo::category("cyphal.queue").debug("purged ", dropped, " expired frames");
                }
                return dropped;
            }

            void clear() {
                free_.clear();
                for (usize i = slots_.size(); i > 0; --i) {
                    slots_[i - 1].used = false;
                    free_.push_back(static_cast<u32>(i - 1));
                }
                in_flight_ = dp::nullopt;
            }

            usize size() const noexcept { return slots_.size() - free_.size(); }
            usize capacity() const noexcept { return slots_.size(); }
            usize free_slots() const noexcept { return free_.size(); }
            bool empty() const noexcept { return free_.size() == slots_.size(); }
            bool transfer_in_flight() const noexcept { return in_flight_.has_value(); }

          private:
            Result<void> reject(usize needed, PortId port) {
                echo::category("cyphal.queue")
                    .warn("tx queue full: port=", port, " need=", needed, " free=", free_.size());
                return Result<void>::err(Error::queue_full(needed, free_.size()));
            }

            void place(const DecodedFrame &f, u64 transfer, u64 deadline_us) {
                u32 idx = free_.back();
                free_.pop_back();
                Entry &e = slots_[idx];
                e.frame = f;
                e.transfer_seq = transfer;
                e.order = next_order_++;
                e.deadline_us = deadline_us;
                e.used = true;
            }

            void release(u32 idx) {
                slots_[idx].used = false;
                free_.push_back(idx);
            }

            dp::Optional<u32> select() const noexcept {
                dp::Optional<u32> best;
                for (usize i = 0; i < slots_.size(); ++i) {
                    const Entry &e = slots_[i];
                    if (!e.used)
                        continue;
                    if (!best.has_value() || before(e, slots_[*best])) {
                        best = static_cast<u32>(i);
                    }
                }
                return best;
            }

            bool before(const Entry &a, const Entry &b) const noexcept {
                if (in_flight_.has_value()) {
                    bool a_flight = a.transfer_seq == *in_flight_;
                    bool b_flight = b.transfer_seq == *in_flight_;
                    if (a_flight != b_flight)
                        return a_flight;
                }
                auto pa = static_cast<u8>(a.frame.priority);
                auto pb = static_cast<u8>(b.frame.priority);
                if (pa != pb)
                    return pa < pb;
                return a.order < b.order;
            }
        };

    } // namespace transport
    using namespace transport;
} // namespace cyphal
