#pragma once

#include "../core/types.hpp"
#include <datapod/datapod.hpp>

namespace cyphal {
    namespace util {

        // ─── Read-only view over payload bytes (never owns) ─────────────────────────
        class DataSpan {
            const u8 *data_ = nullptr;
            usize size_ = 0;

          public:
            constexpr DataSpan() = default;
            constexpr DataSpan(const u8 *data, usize size) : data_(data), size_(size) {}
            DataSpan(const dp::Vector<u8> &vec) : data_(vec.data()), size_(vec.size()) {}

            template <usize N> constexpr DataSpan(const dp::Array<u8, N> &arr) : data_(arr.data()), size_(N) {}

            constexpr const u8 *data() const noexcept { return data_; }
            constexpr usize size() const noexcept { return size_; }
            constexpr bool empty() const noexcept { return size_ == 0; }

            constexpr u8 operator[](usize idx) const noexcept { return data_[idx]; }

            constexpr u8 back() const noexcept { return data_[size_ - 1]; }

            constexpr DataSpan subspan(usize offset, usize count = static_cast<usize>(-1)) const noexcept {
                if (offset >= size_)
                    return {};
                usize actual = (count > size_ - offset) ? (size_ - offset) : count;
                return DataSpan(data_ + offset, actual);
            }

            constexpr DataSpan first(usize count) const noexcept { return subspan(0, count); }

            // Everything except the trailing `count` bytes
            constexpr DataSpan drop_back(usize count) const noexcept {
                if (count >= size_)
                    return DataSpan(data_, 0);
                return DataSpan(data_, size_ - count);
            }

            constexpr const u8 *begin() const noexcept { return data_; }
            constexpr const u8 *end() const noexcept { return data_ + size_; }
        };

    } // namespace util
    using namespace util;
} // namespace cyphal
