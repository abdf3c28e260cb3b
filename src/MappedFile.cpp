#include "MappedFile.h"

#include <fstream>
#include <system_error>

namespace io {

    ParseExpected<void> MappedFile::Open(const std::filesystem::path& path) {
        Close();

        std::error_code ec;
        const auto size = std::filesystem::file_size(path, ec);
        if (ec) {
            return Fail("Failed to stat {}: {}", path.string(), ec.message());
        }

        mPath = path;
        mIsOpen = true;

        // mio refuses zero-length mappings
        if (size == 0) {
            return {};
        }

        mMap.map(mPath.native(), ec);
        if (!ec && mMap.is_mapped()) {
            mSpan = std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(mMap.data()), mMap.length());
            return {};
        }

        if (mMap.is_mapped()) {
            mMap.unmap();
        }

        auto fallback = ReadFallback(static_cast<size_t>(size));
        if (!fallback) {
            Close();
            return std::unexpected(fallback.error());
        }
        return {};
    }

    void MappedFile::Close() {
        if (mMap.is_mapped()) {
            mMap.unmap();
        }
        mFallback.clear();
        mSpan = {};
        mIsOpen = false;
        mPath.clear();
    }

    ParseExpected<void> MappedFile::ReadFallback(size_t length) {
        std::ifstream file(mPath, std::ios::binary);
        if (!file) {
            return Fail("Failed to open {}", mPath.string());
        }

        mFallback.resize(length);
        file.read(reinterpret_cast<char*>(mFallback.data()), static_cast<std::streamsize>(length));
        if (!file) {
            mFallback.clear();
            return Fail("Failed to read {} bytes from {}", length, mPath.string());
        }

        mSpan = std::span<const uint8_t>(mFallback.data(), mFallback.size());
        return {};
    }

} // namespace io
