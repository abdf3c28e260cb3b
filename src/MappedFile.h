#pragma once

#include <cstdint>
#include <filesystem>
#include <span>
#include <vector>

#include <mio/mmap.hpp>

#include "ParseTypes.h"

namespace io {

    // Read-only view of a whole file. Memory-mapped when possible, otherwise read into memory.
    class MappedFile {
    public:
        MappedFile() = default;
        MappedFile(const MappedFile&) = delete;
        MappedFile& operator=(const MappedFile&) = delete;
        MappedFile(MappedFile&&) noexcept = default;
        MappedFile& operator=(MappedFile&&) noexcept = default;
        ~MappedFile() = default;

        [[nodiscard]] ParseExpected<void> Open(const std::filesystem::path& path);
        void Close();

        // Valid until Close() or the next Open().
        [[nodiscard]] std::span<const uint8_t> View() const { return mSpan; }
        [[nodiscard]] bool IsOpen() const { return mIsOpen; }
        [[nodiscard]] bool IsMapped() const { return mMap.is_mapped(); }
        [[nodiscard]] const std::filesystem::path& Path() const { return mPath; }

    private:
        [[nodiscard]] ParseExpected<void> ReadFallback(size_t length);

        std::filesystem::path mPath;
        mio::mmap_source mMap;
        std::vector<uint8_t> mFallback;
        std::span<const uint8_t> mSpan{};
        bool mIsOpen = false;
    };

} // namespace io
