#ifndef JCX_TIERCACHE_IO_REDIS_RESP_WRITER_H
#define JCX_TIERCACHE_IO_REDIS_RESP_WRITER_H

#include <charconv>
#include <cstddef>
#include <span>
#include <string>
#include <string_view>

namespace jcailloux::tiercache::io {

// RespWriter — serializes commands into RESP2 wire format.
//
//   *<argc>\r\n
//   $<len>\r\n<data>\r\n      (once per argument, binary-safe)
//
// Several commands may be written back to back (pipelining); the buffer is
// drained with data()/size()/consume() as the socket accepts bytes.

class RespWriter {
public:
    void writeCommand(std::span<const std::string_view> args) {
        size_t total = 1 + numDigits(args.size()) + 2;
        for (auto arg : args)
            total += 1 + numDigits(arg.size()) + 2 + arg.size() + 2;
        buf_.reserve(buf_.size() + total);

        buf_ += '*';
        appendNum(args.size());
        buf_ += "\r\n";

        for (auto arg : args) {
            buf_ += '$';
            appendNum(arg.size());
            buf_ += "\r\n";
            buf_.append(arg.data(), arg.size());
            buf_ += "\r\n";
        }
    }

    [[nodiscard]] const char* data() const noexcept { return buf_.data() + consumed_; }
    [[nodiscard]] size_t size() const noexcept { return buf_.size() - consumed_; }
    [[nodiscard]] bool empty() const noexcept { return size() == 0; }

    void consume(size_t n) noexcept {
        consumed_ += n;
        if (consumed_ == buf_.size()) {
            buf_.clear();
            consumed_ = 0;
        } else if (consumed_ > buf_.size() / 2 && consumed_ > 1024) {
            buf_.erase(0, consumed_);
            consumed_ = 0;
        }
    }

    void clear() noexcept {
        buf_.clear();
        consumed_ = 0;
    }

private:
    void appendNum(size_t n) {
        char tmp[20];
        auto [end, ec] = std::to_chars(tmp, tmp + sizeof(tmp), n);
        buf_.append(tmp, static_cast<size_t>(end - tmp));
    }

    static size_t numDigits(size_t n) noexcept {
        size_t d = 1;
        while (n >= 10) { ++d; n /= 10; }
        return d;
    }

    std::string buf_;
    size_t consumed_ = 0;
};

} // namespace jcailloux::tiercache::io

#endif // JCX_TIERCACHE_IO_REDIS_RESP_WRITER_H
