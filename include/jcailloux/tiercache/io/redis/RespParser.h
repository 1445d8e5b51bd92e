#ifndef JCX_TIERCACHE_IO_REDIS_RESP_PARSER_H
#define JCX_TIERCACHE_IO_REDIS_RESP_PARSER_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "jcailloux/tiercache/io/redis/RedisError.h"

namespace jcailloux::tiercache::io {

// RespValue — one node of a parsed RESP2 reply, stored in a flat vector.
// Strings are (offset, length) into the parser's arena; arrays are
// (first child index, count) into the same vector.

struct RespValue {
    enum class Type : uint8_t {
        Nil, SimpleString, Error, Integer, BulkString, Array
    };

    Type type = Type::Nil;
    int64_t integer = 0;
    uint32_t str_offset = 0;
    uint32_t str_len = 0;
    uint32_t array_offset = 0;
    uint32_t array_count = 0;
};

// RespParser — incremental parser for a single RESP2 reply.
//
// parse() returns the number of bytes consumed, or 0 when the buffer does
// not yet hold a complete reply (call again once more bytes arrived).
// Malformed input throws RedisProtocolError instead of waiting forever.

class RespParser {
public:
    size_t parse(const char* data, size_t len) {
        arena_.clear();
        values_.clear();
        const char* pos = data;
        if (!parseValue(pos, data + len, 0))
            return 0;
        return static_cast<size_t>(pos - data);
    }

    [[nodiscard]] bool empty() const noexcept { return values_.empty(); }
    [[nodiscard]] const RespValue& root() const noexcept { return values_[0]; }
    [[nodiscard]] const RespValue& value(uint32_t index) const noexcept { return values_[index]; }

    [[nodiscard]] std::string_view getString(const RespValue& v) const noexcept {
        return {arena_.data() + v.str_offset, v.str_len};
    }

    [[nodiscard]] const RespValue& arrayElement(const RespValue& v, size_t index) const noexcept {
        return values_[v.array_offset + index];
    }

    [[nodiscard]] size_t valueCount() const noexcept { return values_.size(); }

    void reset() {
        arena_.clear();
        values_.clear();
    }

private:
    static constexpr int kMaxDepth = 32;

    static const char* findCRLF(const char* pos, const char* end) noexcept {
        while (pos + 1 < end) {
            if (pos[0] == '\r' && pos[1] == '\n') return pos;
            ++pos;
        }
        return nullptr;
    }

    static int64_t parseInteger(const char* start, const char* eol) {
        bool neg = false;
        if (start < eol && *start == '-') { neg = true; ++start; }
        if (start == eol)
            throw RedisProtocolError("RESP: empty integer");
        int64_t val = 0;
        for (; start < eol; ++start) {
            if (*start < '0' || *start > '9')
                throw RedisProtocolError("RESP: invalid integer");
            val = val * 10 + (*start - '0');
        }
        return neg ? -val : val;
    }

    bool parseValue(const char*& pos, const char* end, int depth) {
        if (pos >= end) return false;
        if (depth > kMaxDepth)
            throw RedisProtocolError("RESP: nesting too deep");

        switch (*pos++) {
        case '+': return parseLine(pos, end, RespValue::Type::SimpleString);
        case '-': return parseLine(pos, end, RespValue::Type::Error);
        case ':': return parseIntegerType(pos, end);
        case '$': return parseBulkString(pos, end);
        case '*': return parseArray(pos, end, depth);
        default:
            throw RedisProtocolError("RESP: unknown type byte");
        }
    }

    // +<data>\r\n and -<error>\r\n
    bool parseLine(const char*& pos, const char* end, RespValue::Type type) {
        auto* eol = findCRLF(pos, end);
        if (!eol) return false;

        RespValue v;
        v.type = type;
        v.str_offset = static_cast<uint32_t>(arena_.size());
        v.str_len = static_cast<uint32_t>(eol - pos);
        arena_.append(pos, v.str_len);
        values_.push_back(v);

        pos = eol + 2;
        return true;
    }

    // :<integer>\r\n
    bool parseIntegerType(const char*& pos, const char* end) {
        auto* eol = findCRLF(pos, end);
        if (!eol) return false;

        RespValue v;
        v.type = RespValue::Type::Integer;
        v.integer = parseInteger(pos, eol);
        values_.push_back(v);

        pos = eol + 2;
        return true;
    }

    // $<len>\r\n<data>\r\n  or  $-1\r\n
    bool parseBulkString(const char*& pos, const char* end) {
        auto* eol = findCRLF(pos, end);
        if (!eol) return false;

        int64_t len = parseInteger(pos, eol);
        const char* body = eol + 2;

        if (len < 0) {
            values_.push_back({});
            pos = body;
            return true;
        }

        auto ulen = static_cast<size_t>(len);
        if (static_cast<size_t>(end - body) < ulen + 2) return false;

        RespValue v;
        v.type = RespValue::Type::BulkString;
        v.str_offset = static_cast<uint32_t>(arena_.size());
        v.str_len = static_cast<uint32_t>(ulen);
        arena_.append(body, ulen);
        values_.push_back(v);

        pos = body + ulen + 2;
        return true;
    }

    // *<count>\r\n<elements...>  or  *-1\r\n
    //
    // Children are parsed depth-first, so a nested array's children land
    // after the nested array node itself. To keep each array's direct
    // children contiguous, elements are parsed into a scratch parser and
    // spliced back.
    bool parseArray(const char*& pos, const char* end, int depth) {
        auto* eol = findCRLF(pos, end);
        if (!eol) return false;

        int64_t count = parseInteger(pos, eol);
        const char* cursor = eol + 2;

        if (count < 0) {
            values_.push_back({});
            pos = cursor;
            return true;
        }

        auto ucount = static_cast<uint32_t>(count);
        std::vector<RespParser> children(ucount);
        for (uint32_t i = 0; i < ucount; ++i) {
            if (!children[i].parseValue(cursor, end, depth + 1)) return false;
        }

        auto arrayIdx = static_cast<uint32_t>(values_.size());
        values_.push_back({});
        uint32_t childStart = static_cast<uint32_t>(values_.size());
        // Reserve one slot per direct child first, then append grandchildren.
        values_.resize(values_.size() + ucount);
        for (uint32_t i = 0; i < ucount; ++i)
            values_[childStart + i] = splice(children[i], 0);

        values_[arrayIdx].type = RespValue::Type::Array;
        values_[arrayIdx].array_offset = childStart;
        values_[arrayIdx].array_count = ucount;

        pos = cursor;
        return true;
    }

    // Copy node `index` of `other` (and its subtree) into this parser,
    // returning the rebased node. Direct children of arrays stay contiguous.
    RespValue splice(const RespParser& other, uint32_t index) {
        RespValue v = other.values_[index];
        if (v.type == RespValue::Type::Array) {
            uint32_t start = static_cast<uint32_t>(values_.size());
            values_.resize(values_.size() + v.array_count);
            for (uint32_t i = 0; i < v.array_count; ++i)
                values_[start + i] = splice(other, v.array_offset + i);
            v.array_offset = start;
        } else if (v.type != RespValue::Type::Integer && v.type != RespValue::Type::Nil) {
            auto sv = other.getString(v);
            v.str_offset = static_cast<uint32_t>(arena_.size());
            arena_.append(sv.data(), sv.size());
        }
        return v;
    }

    std::string arena_;
    std::vector<RespValue> values_;
};

} // namespace jcailloux::tiercache::io

#endif // JCX_TIERCACHE_IO_REDIS_RESP_PARSER_H
