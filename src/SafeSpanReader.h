#pragma once

#include <bit>
#include <concepts>
#include <cstdint>
#include <cstring>
#include <span>
#include <string>

#include "ParseTypes.h"

namespace Cil {

class SafeSpanReader {
public:
    explicit SafeSpanReader(std::span<const uint8_t> data)
        : mData(data), mOffset(0) {}

    // Read an integer or IEEE float stored little-endian
    template<typename T>
        requires std::integral<T> || std::floating_point<T>
    [[nodiscard]] ParseExpected<T> ReadLE() {
        if (!CanRead(sizeof(T))) {
            return Fail("Buffer underrun: need {} bytes at offset {}, but only {} bytes remain",
                        sizeof(T), mOffset, Remaining());
        }
        if constexpr (std::floating_point<T>) {
            using Bits = std::conditional_t<sizeof(T) == 4, uint32_t, uint64_t>;
            auto bits = ReadLE<Bits>();
            if (!bits) return std::unexpected(bits.error());
            return std::bit_cast<T>(*bits);
        } else {
            T value{};
            std::memcpy(&value, mData.data() + mOffset, sizeof(T));
            mOffset += sizeof(T);
            if constexpr (std::endian::native == std::endian::big && sizeof(T) > 1) {
                value = std::byteswap(value);
            }
            return value;
        }
    }

    // ECMA-335 II.23.2 compressed unsigned integer (1, 2 or 4 bytes, big-endian payload)
    [[nodiscard]] ParseExpected<uint32_t> ReadCompressedUInt() {
        const size_t start = mOffset;
        auto first = ReadLE<uint8_t>();
        if (!first) return std::unexpected(first.error());

        if ((*first & 0x80) == 0) {
            return static_cast<uint32_t>(*first);
        }

        if ((*first & 0xC0) == 0x80) {
            auto second = ReadLE<uint8_t>();
            if (!second) return std::unexpected(second.error());
            return (static_cast<uint32_t>(*first & 0x3F) << 8) | *second;
        }

        if ((*first & 0xE0) == 0xC0) {
            if (!CanRead(3)) {
                return Fail("Truncated compressed integer at offset {}: need 3 more bytes, {} remain",
                            start, Remaining());
            }
            uint32_t value = static_cast<uint32_t>(*first & 0x1F) << 24;
            value |= static_cast<uint32_t>(mData[mOffset]) << 16;
            value |= static_cast<uint32_t>(mData[mOffset + 1]) << 8;
            value |= static_cast<uint32_t>(mData[mOffset + 2]);
            mOffset += 3;
            return value;
        }

        mOffset = start;
        return Fail("Invalid compressed integer lead byte 0x{:02X} at offset {}", *first, start);
    }

    [[nodiscard]] ParseExpected<uint8_t> PeekByte() const {
        if (AtEnd()) {
            return Fail("Buffer underrun: cannot peek at offset {}, buffer size is {}", mOffset, mData.size());
        }
        return mData[mOffset];
    }

    // Read raw bytes into a string
    [[nodiscard]] ParseExpected<std::string> ReadString(size_t length) {
        if (!CanRead(length)) {
            return Fail("Buffer underrun: need {} bytes at offset {}, but only {} bytes remain",
                        length, mOffset, Remaining());
        }
        std::string result(reinterpret_cast<const char*>(mData.data() + mOffset), length);
        mOffset += length;
        return result;
    }

    // Get a subspan of remaining data without advancing
    [[nodiscard]] ParseExpected<std::span<const uint8_t>> PeekBytes(size_t length) const {
        if (!CanRead(length)) {
            return Fail("Buffer underrun: need {} bytes at offset {}, but only {} bytes remain",
                        length, mOffset, Remaining());
        }
        return mData.subspan(mOffset, length);
    }

    [[nodiscard]] bool CanRead(size_t bytes) const {
        return bytes <= Remaining();
    }

    [[nodiscard]] size_t Offset() const { return mOffset; }
    [[nodiscard]] size_t Size() const { return mData.size(); }
    [[nodiscard]] size_t Remaining() const { return mData.size() - mOffset; }
    [[nodiscard]] bool AtEnd() const { return mOffset >= mData.size(); }

    // Seek to absolute position
    [[nodiscard]] ParseExpected<void> Seek(size_t position) {
        if (position > mData.size()) {
            return Fail("Cannot seek to position {}: buffer size is {}", position, mData.size());
        }
        mOffset = position;
        return {};
    }

private:
    std::span<const uint8_t> mData;
    size_t mOffset;
};

} // namespace Cil
