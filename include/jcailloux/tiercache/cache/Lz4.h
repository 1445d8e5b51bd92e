#ifndef JCX_TIERCACHE_CACHE_LZ4_H
#define JCX_TIERCACHE_CACHE_LZ4_H

#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>

#include <lz4.h>

namespace jcailloux::tiercache::cache::lz4 {

// LZ4 block framing used by the *Lz4 encodings:
//
//   [u32 little-endian uncompressed size][LZ4 block]
//
// The size prefix lets decompress() allocate once and reject bodies that
// claim more than kMaxDecompressedSize.

inline constexpr size_t kSizePrefix = 4;
inline constexpr size_t kMaxDecompressedSize = size_t{1} << 30;

/// Append the framed compression of `src` to `out`. Returns false when the
/// input is too large for a single LZ4 block or compression failed; `out`
/// is then left unchanged.
inline bool compress(std::string_view src, std::string& out) {
    if (src.size() > static_cast<size_t>(LZ4_MAX_INPUT_SIZE)) return false;

    const int src_size = static_cast<int>(src.size());
    const int bound = LZ4_compressBound(src_size);
    if (bound <= 0) return false;

    const size_t base = out.size();
    out.resize(base + kSizePrefix + static_cast<size_t>(bound));

    auto* prefix = reinterpret_cast<unsigned char*>(out.data() + base);
    const auto n = static_cast<uint32_t>(src.size());
    prefix[0] = static_cast<unsigned char>(n);
    prefix[1] = static_cast<unsigned char>(n >> 8);
    prefix[2] = static_cast<unsigned char>(n >> 16);
    prefix[3] = static_cast<unsigned char>(n >> 24);

    const int written = LZ4_compress_default(
        src.data(), out.data() + base + kSizePrefix, src_size, bound);
    if (written <= 0) {
        out.resize(base);
        return false;
    }
    out.resize(base + kSizePrefix + static_cast<size_t>(written));
    return true;
}

enum class DecompressStatus : uint8_t { Ok, Truncated, Corrupt };

/// Inverse of compress(). `framed` starts at the size prefix.
inline DecompressStatus decompress(std::string_view framed, std::string& out) {
    if (framed.size() < kSizePrefix) return DecompressStatus::Truncated;

    const auto* p = reinterpret_cast<const unsigned char*>(framed.data());
    const size_t size = static_cast<size_t>(p[0])
                      | static_cast<size_t>(p[1]) << 8
                      | static_cast<size_t>(p[2]) << 16
                      | static_cast<size_t>(p[3]) << 24;
    if (size > kMaxDecompressedSize) return DecompressStatus::Corrupt;

    auto body = framed.substr(kSizePrefix);
    if (body.empty()) return size == 0 ? DecompressStatus::Ok : DecompressStatus::Truncated;
    if (body.size() > static_cast<size_t>(std::numeric_limits<int>::max()))
        return DecompressStatus::Corrupt;

    out.resize(size);
    const int got = LZ4_decompress_safe(
        body.data(), out.data(), static_cast<int>(body.size()), static_cast<int>(size));
    if (got < 0 || static_cast<size_t>(got) != size) {
        out.clear();
        return DecompressStatus::Corrupt;
    }
    return DecompressStatus::Ok;
}

}  // namespace jcailloux::tiercache::cache::lz4

#endif  // JCX_TIERCACHE_CACHE_LZ4_H
