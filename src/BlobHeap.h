#pragma once

#include <cstdint>
#include <span>
#include <vector>

#include "ParseTypes.h"

namespace Cil {

    struct BlobEntry {
        uint32_t index = 0;
        std::span<const uint8_t> data{};
    };

    // Read-only view over a #Blob metadata heap. The heap does not own its bytes.
    class BlobHeap {
    public:
        [[nodiscard]] static ParseExpected<BlobHeap> FromBytes(std::span<const uint8_t> data);

        // Payload of the blob starting at `index` (compressed length prefix stripped).
        [[nodiscard]] ParseExpected<std::span<const uint8_t>> Get(uint32_t index) const;

        // Every decodable blob after the leading empty entry, in heap order.
        [[nodiscard]] std::vector<BlobEntry> Entries() const;

        [[nodiscard]] size_t Size() const { return mData.size(); }
        [[nodiscard]] std::span<const uint8_t> Data() const { return mData; }

    private:
        explicit BlobHeap(std::span<const uint8_t> data) : mData(data) {}

        std::span<const uint8_t> mData;
    };

} // namespace Cil
