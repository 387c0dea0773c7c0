#pragma once

#include "../core/types.hpp"
#include <type_traits>

namespace cyphal {
    namespace util {

        // ─── Bit-level access helpers ────────────────────────────────────────────────
        namespace bitfield {

            template <typename T>
            concept UnsignedInt = std::is_unsigned_v<T>;

            template <UnsignedInt T> constexpr T get_bits(T value, u8 start_bit, u8 length) noexcept {
                constexpr u8 bit_width = sizeof(T) * 8;
                if (length == 0 || start_bit >= bit_width) {
                    return 0;
                }
                if (length >= bit_width) {
                    return value >> start_bit;
                }
                T mask = (static_cast<T>(1) << length) - 1;
                return (value >> start_bit) & mask;
            }

            template <UnsignedInt T> constexpr bool get_bit(T value, u8 bit) noexcept {
                if (bit >= sizeof(T) * 8) {
                    return false;
                }
                return (value >> bit) & 0x01;
            }

            // The transfer CRC travels most-significant byte first
            inline constexpr u16 unpack_u16_be(const u8 *data) noexcept {
                return static_cast<u16>((static_cast<u16>(data[0]) << 8) | data[1]);
            }

            inline constexpr void pack_u16_be(u8 *data, u16 value) noexcept {
                data[0] = static_cast<u8>((value >> 8) & 0xFF);
                data[1] = static_cast<u8>(value & 0xFF);
            }

            inline constexpr u16 unpack_u16_le(const u8 *data) noexcept {
                return static_cast<u16>(data[0]) | static_cast<u16>(static_cast<u16>(data[1]) << 8);
            }

        } // namespace bitfield
    } // namespace util
    using namespace util;
} // namespace cyphal
