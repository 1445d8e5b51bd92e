#ifndef JCX_TIERCACHE_CACHE_SERIALIZER_H
#define JCX_TIERCACHE_CACHE_SERIALIZER_H

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

#include <glaze/glaze.hpp>

#include "jcailloux/tiercache/cache/Errors.h"
#include "jcailloux/tiercache/cache/Lz4.h"

namespace jcailloux::tiercache::cache {

// =============================================================================
// Serializer — tagged byte encoding of cached values
//
// Every payload starts with one Encoding byte followed by the body:
//
//   Json     glz::write_json output
//   JsonLz4  lz4::compress(json)
//   Beve     glz::write_beve output
//   BeveLz4  lz4::compress(beve)
//
// JSON is the default so payloads stay readable with redis-cli; BEVE is the
// fallback when JSON cannot represent the value, or the first choice for
// types that opt in with prefer_binary. Bodies larger than the compression
// threshold are LZ4-compressed when that makes them smaller.
//
// Decoding never throws: it returns DecodeError and callers count a miss.
// =============================================================================

enum class Encoding : uint8_t {
    Json    = 0x01,
    JsonLz4 = 0x02,
    Beve    = 0x03,
    BeveLz4 = 0x04
};

[[nodiscard]] constexpr std::string_view encodingName(Encoding e) noexcept {
    switch (e) {
        case Encoding::Json:    return "json";
        case Encoding::JsonLz4: return "json+lz4";
        case Encoding::Beve:    return "beve";
        case Encoding::BeveLz4: return "beve+lz4";
    }
    return "unknown";
}

[[nodiscard]] constexpr bool isCompressed(Encoding e) noexcept {
    return e == Encoding::JsonLz4 || e == Encoding::BeveLz4;
}

/// Opt-in: encode T with BEVE directly instead of trying JSON first.
///   template<> inline constexpr bool prefer_binary<MyBlob> = true;
template<typename T>
inline constexpr bool prefer_binary = false;

/// Encoding of `payload`, read from its first byte without decoding.
[[nodiscard]] inline std::optional<Encoding> encodingOf(std::string_view payload) noexcept {
    if (payload.empty()) return std::nullopt;
    switch (static_cast<uint8_t>(payload.front())) {
        case 0x01: return Encoding::Json;
        case 0x02: return Encoding::JsonLz4;
        case 0x03: return Encoding::Beve;
        case 0x04: return Encoding::BeveLz4;
        default:   return std::nullopt;
    }
}

/// Result of encodeValue(): the tagged payload plus the size of the body
/// before compression (for the compression ratio metric).
struct EncodedValue {
    std::string bytes;
    Encoding encoding = Encoding::Json;
    size_t raw_size = 0;
};

namespace detail {

    template<typename T>
    bool writeJson(const T& value, std::string& body) {
        body.clear();
        if (glz::write_json(value, body)) {
            body.clear();
            return false;
        }
        return true;
    }

    template<typename T>
    bool writeBeve(const T& value, std::string& body) {
        body.clear();
        if (glz::write_beve(value, body)) {
            body.clear();
            return false;
        }
        return true;
    }

    inline Encoding compressedOf(Encoding e) noexcept {
        return e == Encoding::Json ? Encoding::JsonLz4 : Encoding::BeveLz4;
    }

}  // namespace detail

/// Encode `value`. Throws SerializationError when neither JSON nor BEVE can
/// represent it.
template<typename T>
[[nodiscard]] EncodedValue encodeValue(const T& value, size_t compression_threshold) {
    std::string body;
    Encoding base;

    if constexpr (prefer_binary<T>) {
        if (detail::writeBeve(value, body)) base = Encoding::Beve;
        else if (detail::writeJson(value, body)) base = Encoding::Json;
        else throw SerializationError("value is not representable as BEVE or JSON");
    } else {
        if (detail::writeJson(value, body)) base = Encoding::Json;
        else if (detail::writeBeve(value, body)) base = Encoding::Beve;
        else throw SerializationError("value is not representable as JSON or BEVE");
    }

    EncodedValue out;
    out.raw_size = body.size();

    if (body.size() > compression_threshold) {
        std::string packed;
        packed.reserve(body.size() / 2 + lz4::kSizePrefix + 1);
        packed.push_back(static_cast<char>(detail::compressedOf(base)));
        // Compression that does not shrink the body is discarded.
        if (lz4::compress(body, packed) && packed.size() < body.size() + 1) {
            out.encoding = detail::compressedOf(base);
            out.bytes = std::move(packed);
            return out;
        }
    }

    out.encoding = base;
    out.bytes.reserve(body.size() + 1);
    out.bytes.push_back(static_cast<char>(base));
    out.bytes.append(body);
    return out;
}

template<typename T>
[[nodiscard]] std::string encode(const T& value, size_t compression_threshold) {
    return encodeValue(value, compression_threshold).bytes;
}

template<typename T>
[[nodiscard]] std::expected<T, DecodeError> decode(std::string_view payload) {
    using Kind = DecodeError::Kind;

    if (payload.empty())
        return std::unexpected(DecodeError{Kind::Empty, "empty payload"});

    auto encoding = encodingOf(payload);
    if (!encoding)
        return std::unexpected(DecodeError{Kind::UnknownEncoding,
            "unknown encoding byte " + std::to_string(static_cast<uint8_t>(payload.front()))});

    std::string_view body = payload.substr(1);
    std::string inflated;

    if (isCompressed(*encoding)) {
        switch (lz4::decompress(body, inflated)) {
            case lz4::DecompressStatus::Ok:
                break;
            case lz4::DecompressStatus::Truncated:
                return std::unexpected(DecodeError{Kind::Truncated, "compressed body is truncated"});
            case lz4::DecompressStatus::Corrupt:
                return std::unexpected(DecodeError{Kind::Decompression, "lz4 rejected the body"});
        }
        body = inflated;
    }

    T value{};
    switch (*encoding) {
        case Encoding::Json:
        case Encoding::JsonLz4:
            if (auto ec = glz::read_json(value, body))
                return std::unexpected(DecodeError{Kind::Parse, glz::format_error(ec, body)});
            return value;
        case Encoding::Beve:
        case Encoding::BeveLz4:
            if (auto ec = glz::read_beve(value, body))
                return std::unexpected(DecodeError{Kind::Parse, "invalid BEVE body"});
            return value;
    }
    return std::unexpected(DecodeError{Kind::UnknownEncoding, "unreachable encoding"});
}

}  // namespace jcailloux::tiercache::cache

#endif  // JCX_TIERCACHE_CACHE_SERIALIZER_H
