#pragma once

#include "../core/config.hpp"
#include "../core/error.hpp"
#include "../core/transfer.hpp"
#include "../transport/codec.hpp"
#include "../transport/fragmentation.hpp"
#include "../transport/reassembly.hpp"
#include "../transport/tx_queue.hpp"
#include "../util/event.hpp"
#include "link.hpp"
#include <datapod/datapod.hpp>
#include <echo/echo.hpp>
#include <mutex>
#include <utility>

namespace cyphal {
    namespace network {

        // ─── Per-call counters reported by spin_once() ──────────────────────────────
        struct SpinStats {
            usize frames_received = 0;
            usize transfers = 0;
            usize discarded = 0;
            usize malformed = 0;
            usize errors = 0; // table full and other local failures
            usize frames_sent = 0;
            usize expired = 0;
        };

        // ─── Node: drives the transfer engine over one or more links ────────────────
        // Reception is accepted from every registered interface. Transmission goes out
        // on a single interface (the first one added unless changed).
        class Node {
            TransportConfig config_;
            transport::Reassembler rx_;
            transport::Fragmenter fragmenter_;
            transport::TxQueue queue_;

            dp::Map<InterfaceId, LinkDriver *> links_;
            dp::Optional<InterfaceId> tx_iface_;
            dp::Map<u32, TransferId> next_transfer_id_;

            mutable std::mutex mutex_;
            std::mutex tx_mutex_; // one flush() at a time

          public:
            explicit Node(const TransportConfig &config = {})
                : config_(config), rx_(config), fragmenter_(config), queue_(config.tx_queue_capacity) {
                echo::category("cyphal.node")
                    .info("node up: id=", config_.local_node_id.has_value() ? static_cast<i32>(*config_.local_node_id) : -1,
                          " mtu=", static_cast<u32>(config_.mtu), " sessions=", config_.session_capacity);
            }

            Result<void> check_config() const { return validate_config(config_); }

            // ─── Interfaces ─────────────────────────────────────────────────────────
            Result<void> add_interface(InterfaceId iface, LinkDriver *link) {
                if (!link) {
                    return Result<void>::err(Error::invalid_argument("null link driver"));
                }
                if (link->mtu() < config_.mtu) {
                    return Result<void>::err(Error::invalid_argument("link MTU below transport MTU"));
                }
                std::lock_guard<std::mutex> lock(mutex_);
                links_[iface] = link;
                if (!tx_iface_.has_value()) {
                    tx_iface_ = iface;
                }
                echo::category("cyphal.node").debug("interface ", static_cast<u32>(iface), " added");
                return {};
            }

            Result<void> set_tx_interface(InterfaceId iface) {
                std::lock_guard<std::mutex> lock(mutex_);
                if (links_.find(iface) == links_.end()) {
                    return Result<void>::err(Error::not_connected());
                }
                tx_iface_ = iface;
                return {};
            }

            // ─── Identity ───────────────────────────────────────────────────────────
            void set_node_id(dp::Optional<NodeId> id) {
                std::lock_guard<std::mutex> lock(mutex_);
                config_.local_node_id = id;
                rx_.set_local_node_id(id);
            }

            dp::Optional<NodeId> node_id() const {
                std::lock_guard<std::mutex> lock(mutex_);
                return config_.local_node_id;
            }

            // ─── Transmission ───────────────────────────────────────────────────────
            // Queues a transfer whose metadata is fully specified by the caller.
            Result<void> send(const TransferMetadata &meta, DataSpan payload, u64 deadline_us = 0) {
                std::lock_guard<std::mutex> lock(mutex_);
                return enqueue_locked(meta, payload, deadline_us);
            }

            Result<TransferId> publish(Priority priority, PortId subject, DataSpan payload, u64 deadline_us = 0) {
                std::lock_guard<std::mutex> lock(mutex_);
                u32 counter = counter_key(TransferKind::Message, subject, 0);
                auto meta = TransferMetadata::message(priority, subject, config_.local_node_id,
                                                      next_transfer_id_[counter]);
                return commit_locked(counter, meta, payload, deadline_us);
            }

            Result<TransferId> request(Priority priority, PortId service, NodeId server, DataSpan payload,
                                       u64 deadline_us = 0) {
                std::lock_guard<std::mutex> lock(mutex_);
                if (!config_.local_node_id.has_value()) {
                    return Result<TransferId>::err(Error::invalid_argument("anonymous node cannot send requests"));
                }
                u32 counter = counter_key(TransferKind::Request, service, server);
                auto meta = TransferMetadata::service(priority, TransferKind::Request, service, *config_.local_node_id,
                                                      server, next_transfer_id_[counter]);
                return commit_locked(counter, meta, payload, deadline_us);
            }

            // The response reuses the request's transfer-ID and goes back to its sender.
            Result<void> respond(const Transfer &req, DataSpan payload, u64 deadline_us = 0) {
                if (req.metadata.kind != TransferKind::Request || !req.metadata.source.has_value()) {
                    return Result<void>::err(Error::invalid_argument("respond() needs a received request"));
                }
                std::lock_guard<std::mutex> lock(mutex_);
                if (!config_.local_node_id.has_value()) {
                    return Result<void>::err(Error::invalid_argument("anonymous node cannot respond"));
                }
                auto meta = TransferMetadata::service(req.metadata.priority, TransferKind::Response, req.metadata.port_id,
                                                      *config_.local_node_id, *req.metadata.source,
                                                      req.metadata.transfer_id);
                return enqueue_locked(meta, payload, deadline_us);
            }

            // ─── Reception ──────────────────────────────────────────────────────────
            Result<dp::Optional<Transfer>> receive_frame(const CanFrame &frame, InterfaceId iface, u64 now_us) {
                Result<dp::Optional<Transfer>> result = [&] {
                    std::lock_guard<std::mutex> lock(mutex_);
                    return rx_.accept(frame, iface, now_us);
                }();

                if (result.is_ok()) {
                    if (result.value().has_value()) {
                        on_transfer.emit(*result.value());
                    }
                } else if (result.error().code == ErrorCode::Discarded) {
                    on_discard.emit(result.error().reason, iface);
                }
                return result;
            }

            // ─── Main loop step ─────────────────────────────────────────────────────
            // Drains every interface, drops expired outgoing transfers, then sends
            // until the queue is empty or the link pushes back.
            SpinStats spin_once(u64 now_us) {
                SpinStats stats;
                dp::Vector<std::pair<InterfaceId, LinkDriver *>> links;
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    for (auto &[iface, link] : links_) {
                        links.push_back({iface, link});
                    }
                }

                for (auto &entry : links) {
                    while (true) {
                        dp::Optional<CanFrame> frame = entry.second->receive();
                        if (!frame.has_value())
                            break;
                        CanFrame raw = *frame;
                        raw.timestamp_us = now_us;
                        ++stats.frames_received;
                        auto result = receive_frame(raw, entry.first, now_us);
                        if (result.is_ok()) {
                            if (result.value().has_value())
                                ++stats.transfers;
                        } else if (result.error().code == ErrorCode::Discarded) {
                            ++stats.discarded;
                        } else if (result.error().code == ErrorCode::MalformedFrame) {
                            ++stats.malformed;
                        } else {
                            ++stats.errors;
                        }
                    }
                }

                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    stats.expired = queue_.purge_expired(now_us);
                }

                auto sent = flush();
                if (sent.is_ok()) {
                    stats.frames_sent = sent.value();
                } else {
                    echo::category("cyphal.node").warn("flush failed: ", sent.error().message);
                }
                return stats;
            }

            // Sends queued frames; a busy link leaves the rest queued for the next call.
            // transmit() runs with the node unlocked, so a driver may feed frames back
            // through receive_frame(). It must not call flush() itself.
            Result<usize> flush() {
                std::lock_guard<std::mutex> tx_lock(tx_mutex_);
                usize sent = 0;
                while (true) {
                    dp::Optional<transport::TxQueue::Ticket> next;
                    LinkDriver *link = nullptr;
                    {
                        std::lock_guard<std::mutex> lock(mutex_);
                        next = queue_.front();
                        if (!next.has_value()) {
                            break;
                        }
                        link = tx_link_locked();
                    }
                    if (!link) {
                        return Result<usize>::err(Error::not_connected());
                    }

                    auto result = link->transmit(codec::encode(next->frame));
                    if (!result.is_ok()) {
                        if (result.error().code == ErrorCode::LinkBusy) {
                            echo::category("cyphal.node").trace("link busy, ", pending_frames(), " frames left queued");
                            break;
                        }
                        return Result<usize>::err(result.error());
                    }

                    std::lock_guard<std::mutex> lock(mutex_);
                    if (!queue_.pop(*next)) {
                        echo::category("cyphal.node").trace("sent frame was purged while on the wire");
                    }
                    ++sent;
                }
                return Result<usize>::ok(sent);
            }

            usize prune(u64 now_us, u64 max_age_us) {
                std::lock_guard<std::mutex> lock(mutex_);
                usize removed = rx_.prune(now_us, max_age_us);
                if (removed > 0) {
                    echo::category("cyphal.node").debug("pruned ", removed, " sessions");
                }
                return removed;
            }

            usize pending_frames() const {
                std::lock_guard<std::mutex> lock(mutex_);
                return queue_.size();
            }

            usize active_sessions() const {
                std::lock_guard<std::mutex> lock(mutex_);
                return rx_.sessions().size();
            }

            // ─── Events (emitted with the node unlocked) ─────────────────────────────
            Event<const Transfer &> on_transfer;
            Event<DiscardReason, InterfaceId> on_discard;

          private:
            static u32 counter_key(TransferKind kind, PortId port, NodeId peer) noexcept {
                return (static_cast<u32>(kind) << 24) | (static_cast<u32>(peer) << 16) | port;
            }

            Result<void> enqueue_locked(const TransferMetadata &meta, DataSpan payload, u64 deadline_us) {
                auto seq = fragmenter_.fragment(meta, payload);
                if (!seq.is_ok()) {
                    return Result<void>::err(seq.error());
                }
                return queue_.enqueue(std::move(seq.value()), deadline_us);
            }

            Result<TransferId> commit_locked(u32 counter, const TransferMetadata &meta, DataSpan payload,
                                             u64 deadline_us) {
                auto queued = enqueue_locked(meta, payload, deadline_us);
                if (!queued.is_ok()) {
                    return Result<TransferId>::err(queued.error());
                }
                next_transfer_id_[counter] = static_cast<TransferId>((meta.transfer_id + 1) & TRANSFER_ID_MAX);
                return Result<TransferId>::ok(meta.transfer_id);
            }

            LinkDriver *tx_link_locked() const {
                if (!tx_iface_.has_value()) {
                    return nullptr;
                }
                auto it = links_.find(*tx_iface_);
                return it == links_.end() ? nullptr : it->second;
            }
        };

    } // namespace network
    using namespace network;
} // namespace cyphal
