#pragma once

#include "../core/config.hpp"
#include "../core/error.hpp"
#include "../core/transfer.hpp"
#include "../util/bitfield.hpp"
#include "../util/crc.hpp"
#include "../util/data_span.hpp"
#include "codec.hpp"
#include <datapod/datapod.hpp>
#include <echo/echo.hpp>
#include <utility>

namespace cyphal {
    namespace transport {

        // ─── Lazy, single-pass sequence of frames for one transfer ──────────────────
        // Holds its own copy of the payload (plus CRC for multi-frame transfers) so
        // the caller's buffer may go away once fragment() returns.
        class FrameSequence {
            TransferMetadata meta_;
            dp::Vector<u8> bytes_;
            usize chunk_size_ = 0;
            usize offset_ = 0;
            u32 total_ = 0;
            u32 emitted_ = 0;
            bool toggle_ = DEFAULT_INITIAL_TOGGLE;

          public:
            FrameSequence() = default;

            FrameSequence(const TransferMetadata &meta, dp::Vector<u8> bytes, usize chunk_size, bool initial_toggle)
                : meta_(meta), bytes_(std::move(bytes)), chunk_size_(chunk_size), toggle_(initial_toggle) {
                total_ = bytes_.size() <= chunk_size_
                             ? 1
                             : static_cast<u32>((bytes_.size() + chunk_size_ - 1) / chunk_size_);
            }

            dp::Optional<DecodedFrame> next() {
                if (done()) {
                    return dp::nullopt;
                }
                DataSpan chunk = DataSpan(bytes_).subspan(offset_, chunk_size_);
                bool sot = emitted_ == 0;
                bool eot = emitted_ + 1 == total_;
                DecodedFrame f = codec::build_frame(meta_, sot, eot, toggle_, chunk);

                offset_ += chunk.size();
                toggle_ = !toggle_;
                ++emitted_;
                return f;
            }

            u32 total() const noexcept { return total_; }
            u32 remaining() const noexcept { return total_ - emitted_; }
            bool done() const noexcept { return emitted_ >= total_; }

            const TransferMetadata &metadata() const noexcept { return meta_; }
            Priority priority() const noexcept { return meta_.priority; }
        };

        // ─── Fragmentation engine ──────────────────────────────────────────────────
        class Fragmenter {
            TransportConfig config_;

          public:
            explicit Fragmenter(const TransportConfig &config = {}) : config_(config) {}

            // Payloads that fit in one frame go out bare; longer ones get the CRC
            // appended big-endian and are split across MTU-filling frames.
            Result<FrameSequence> fragment(const TransferMetadata &meta, DataSpan payload) const {
                if (payload.size() > config_.max_transfer_size) {
                    echo::category("cyphal.transport.tx")
                        .warn("payload too large: ", payload.size(), " > ", config_.max_transfer_size);
                    return Result<FrameSequence>::err(Error::payload_too_large(payload.size(), config_.max_transfer_size));
                }
                auto valid = codec::check_metadata(meta);
                if (!valid.is_ok()) {
                    echo::category("cyphal.transport.tx").warn("cannot fragment: ", valid.error().message);
                    return Result<FrameSequence>::err(valid.error());
                }

                usize chunk = config_.frame_capacity();
                bool single = payload.size() <= chunk;
                if (!single && meta.is_anonymous()) {
                    return Result<FrameSequence>::err(Error::invalid_argument("anonymous transfer must be single-frame"));
                }

                dp::Vector<u8> bytes;
                bytes.reserve(payload.size() + (single ? 0 : CRC_SIZE));
                bytes.insert(bytes.end(), payload.begin(), payload.end());
                if (!single) {
                    u8 trailer[CRC_SIZE];
                    bitfield::pack_u16_be(trailer, crc::compute(payload));
                    bytes.insert(bytes.end(), trailer, trailer + CRC_SIZE);
                }

                FrameSequence seq(meta, std::move(bytes), chunk, config_.initial_toggle);
                echo::category("cyphal.transport.tx")
                    .trace("fragmented port=", meta.port_id, " tid=", static_cast<u32>(meta.transfer_id),
                           " bytes=", payload.size(), " frames=", seq.total());
                return Result<FrameSequence>::ok(std::move(seq));
            }

            // Eager form for callers that want every frame at once
            Result<dp::Vector<DecodedFrame>> fragment_all(const TransferMetadata &meta, DataSpan payload) const {
                auto seq = fragment(meta, payload);
                if (!seq.is_ok()) {
                    return Result<dp::Vector<DecodedFrame>>::err(seq.error());
                }
                FrameSequence &frames_left = seq.value();
                dp::Vector<DecodedFrame> frames;
                frames.reserve(frames_left.total());
                while (!frames_left.done()) {
                    frames.push_back(*frames_left.next());
                }
                return Result<dp::Vector<DecodedFrame>>::ok(std::move(frames));
            }

            const TransportConfig &config() const noexcept { return config_; }
        };

    } // namespace transport
    using namespace transport;
} // namespace cyphal
