#ifndef JCX_TIERCACHE_IO_REDIS_RESULT_H
#define JCX_TIERCACHE_IO_REDIS_RESULT_H

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "jcailloux/tiercache/io/redis/RespParser.h"

namespace jcailloux::tiercache::io {

// RedisResult — shared handle on a parsed RESP2 reply with typed accessors.
//
// The root result owns the parser; at(i) returns a view on an array element
// that shares the same parser, so element views stay valid as long as any
// handle is alive.

class RedisResult {
public:
    RedisResult() noexcept = default;

    explicit RedisResult(std::shared_ptr<const RespParser> parser) noexcept
        : parser_(std::move(parser)), index_(0) {}

    /// Parse a complete reply held in `wire`. Throws RedisProtocolError when
    /// the bytes are malformed or incomplete.
    static RedisResult fromWire(std::string_view wire) {
        auto parser = std::make_shared<RespParser>();
        if (parser->parse(wire.data(), wire.size()) == 0)
            throw RedisProtocolError("RESP: incomplete reply");
        return RedisResult(std::move(parser));
    }

    [[nodiscard]] bool valid() const noexcept { return parser_ != nullptr; }

    [[nodiscard]] bool isNil() const noexcept {
        return !parser_ || value().type == RespValue::Type::Nil;
    }

    [[nodiscard]] bool isString() const noexcept {
        if (!parser_) return false;
        auto t = value().type;
        return t == RespValue::Type::BulkString || t == RespValue::Type::SimpleString;
    }

    [[nodiscard]] bool isInteger() const noexcept {
        return parser_ && value().type == RespValue::Type::Integer;
    }

    [[nodiscard]] bool isArray() const noexcept {
        return parser_ && value().type == RespValue::Type::Array;
    }

    [[nodiscard]] bool isError() const noexcept {
        return parser_ && value().type == RespValue::Type::Error;
    }

    [[nodiscard]] std::string_view asStringView() const noexcept {
        if (!isString()) return {};
        return parser_->getString(value());
    }

    [[nodiscard]] std::string asString() const {
        return std::string(asStringView());
    }

    /// nullopt for Nil and non-string replies.
    [[nodiscard]] std::optional<std::string> asOptionalString() const {
        if (!isString()) return std::nullopt;
        return asString();
    }

    [[nodiscard]] int64_t asInteger() const noexcept {
        if (!isInteger()) return 0;
        return value().integer;
    }

    [[nodiscard]] std::string errorMessage() const {
        if (!isError()) return {};
        return std::string(parser_->getString(value()));
    }

    [[nodiscard]] size_t arraySize() const noexcept {
        if (!isArray()) return 0;
        return value().array_count;
    }

    [[nodiscard]] RedisResult at(size_t index) const noexcept {
        if (!isArray() || index >= value().array_count) return {};
        return RedisResult(parser_, value().array_offset + static_cast<uint32_t>(index));
    }

    /// Non-string elements become empty strings.
    [[nodiscard]] std::vector<std::string> asStringArray() const {
        std::vector<std::string> result;
        result.reserve(arraySize());
        for (size_t i = 0; i < arraySize(); ++i)
            result.push_back(at(i).asString());
        return result;
    }

private:
    RedisResult(std::shared_ptr<const RespParser> parser, uint32_t index) noexcept
        : parser_(std::move(parser)), index_(index) {}

    [[nodiscard]] const RespValue& value() const noexcept {
        return parser_->value(index_);
    }

    std::shared_ptr<const RespParser> parser_;
    uint32_t index_ = 0;
};

} // namespace jcailloux::tiercache::io

#endif // JCX_TIERCACHE_IO_REDIS_RESULT_H
