#pragma once

#include "../core/types.hpp"
#include "data_span.hpp"

namespace cyphal {
    namespace util {

        // ─── Transfer CRC: CRC-16/CCITT-FALSE ──────────────────────────────────────
        // poly 0x1021, init 0xFFFF, no reflection, no final xor.
        // Feeding a buffer followed by its own CRC (big-endian) yields a zero residue.
        namespace crc {

            inline constexpr u16 POLYNOMIAL = 0x1021;
            inline constexpr u16 INITIAL = 0xFFFF;
            inline constexpr u16 RESIDUE = 0x0000;

            constexpr u16 init() noexcept { return INITIAL; }

            constexpr u16 update(u16 acc, u8 byte) noexcept {
                acc = static_cast<u16>(acc ^ (static_cast<u16>(byte) << 8));
                for (u8 bit = 0; bit < 8; ++bit) {
                    acc = (acc & 0x8000) ? static_cast<u16>((acc << 1) ^ POLYNOMIAL) : static_cast<u16>(acc << 1);
                }
                return acc;
            }

            constexpr u16 update(u16 acc, const u8 *data, usize size) noexcept {
                for (usize i = 0; i < size; ++i) {
                    acc = update(acc, data[i]);
                }
                return acc;
            }

            constexpr u16 update(u16 acc, DataSpan bytes) noexcept { return update(acc, bytes.data(), bytes.size()); }

            constexpr u16 finalize(u16 acc) noexcept { return acc; }

            constexpr u16 compute(DataSpan bytes) noexcept { return finalize(update(init(), bytes)); }

        } // namespace crc

        // ─── Running accumulator for frame-by-frame use ─────────────────────────────
        class TransferCrc {
            u16 acc_ = crc::INITIAL;

          public:
            constexpr TransferCrc() = default;

            constexpr void reset() noexcept { acc_ = crc::init(); }

            constexpr TransferCrc &add(u8 byte) noexcept {
                acc_ = crc::update(acc_, byte);
                return *this;
            }

            constexpr TransferCrc &add(DataSpan bytes) noexcept {
                acc_ = crc::update(acc_, bytes);
                return *this;
            }

            constexpr u16 value() const noexcept { return crc::finalize(acc_); }

            constexpr bool residue_ok() const noexcept { return acc_ == crc::RESIDUE; }
        };

    } // namespace util
    using namespace util;
} // namespace cyphal
