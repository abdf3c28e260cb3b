#include "BlobHeap.h"

#include <print>

#include "SafeSpanReader.h"

namespace Cil {

    ParseExpected<BlobHeap> BlobHeap::FromBytes(std::span<const uint8_t> data) {
        if (data.empty()) {
            return Fail("Blob heap is empty");
        }
        if (data[0] != 0) {
            return Fail("Invalid blob heap: first byte must be 0x00, found 0x{:02X}", data[0]);
        }
        return BlobHeap(data);
    }

    ParseExpected<std::span<const uint8_t>> BlobHeap::Get(uint32_t index) const {
        if (index >= mData.size()) {
            return FailWith(ParseErrorKind::OutOfBounds,
                            "Blob index {} is out of bounds (heap size {})", index, mData.size());
        }

        SafeSpanReader reader(mData.subspan(index));
        auto length = reader.ReadCompressedUInt();
        if (!length) return std::unexpected(length.error());

        const size_t start = static_cast<size_t>(index) + reader.Offset();
        if (*length > mData.size() - start) {
            return FailWith(ParseErrorKind::OutOfBounds,
                            "Blob at index {} declares {} bytes but only {} remain",
                            index, *length, mData.size() - start);
        }
        return mData.subspan(start, *length);
    }

    std::vector<BlobEntry> BlobHeap::Entries() const {
        std::vector<BlobEntry> entries;
        size_t position = 1; // index 0 is the mandatory empty blob
        while (position < mData.size()) {
            const auto index = static_cast<uint32_t>(position);
            auto blob = Get(index);
            if (!blob) {
                std::println("[BlobHeap] Stopping at index {}: {}", index, blob.error().message);
                break;
            }

            const size_t payloadOffset = static_cast<size_t>(blob->data() - mData.data());
            entries.push_back(BlobEntry{index, *blob});
            position = payloadOffset + blob->size();
        }
        return entries;
    }

} // namespace Cil
