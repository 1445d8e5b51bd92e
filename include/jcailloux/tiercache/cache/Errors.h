#ifndef JCX_TIERCACHE_CACHE_ERRORS_H
#define JCX_TIERCACHE_CACHE_ERRORS_H

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace jcailloux::tiercache::cache {

/// A value could not be represented by any encoding. Thrown by the write
/// path (set, mset, CachedCall) before anything is stored.
class SerializationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Why a stored payload could not be turned back into a value. Returned,
/// never thrown: readers treat it as a miss.
struct DecodeError {
    enum class Kind : uint8_t {
        Empty,              ///< zero-length payload
        UnknownEncoding,    ///< leading byte is not an Encoding
        Truncated,          ///< compressed payload shorter than its size prefix
        Decompression,      ///< LZ4 rejected the body
        Parse               ///< glaze could not read the body into T
    };

    Kind kind = Kind::Parse;
    std::string message;
};

[[nodiscard]] constexpr std::string_view kindName(DecodeError::Kind kind) noexcept {
    switch (kind) {
        case DecodeError::Kind::Empty:           return "empty";
        case DecodeError::Kind::UnknownEncoding: return "unknown-encoding";
        case DecodeError::Kind::Truncated:       return "truncated";
        case DecodeError::Kind::Decompression:   return "decompression";
        case DecodeError::Kind::Parse:           return "parse";
    }
    return "unknown";
}

}  // namespace jcailloux::tiercache::cache

#endif  // JCX_TIERCACHE_CACHE_ERRORS_H
