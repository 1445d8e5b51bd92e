#ifndef JCX_TIERCACHE_CONFIG_STORE_URL_H
#define JCX_TIERCACHE_CONFIG_STORE_URL_H

#include <charconv>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace jcailloux::tiercache::config {

// =============================================================================
// StoreUrl — parsed backing store location
//
//   redis://[[username]:password@]host[:port][/db]
//   unix:///path/to/redis.sock[?db=N]
//
// IPv6 hosts are written in brackets: redis://[::1]:6379
// =============================================================================

struct StoreUrl {
    enum class Scheme : uint8_t { Tcp, Unix };

    Scheme scheme = Scheme::Tcp;
    std::string host = "127.0.0.1";
    int port = 6379;
    std::string path;
    std::string username;
    std::string password;
    int database = 0;

    [[nodiscard]] bool isUnix() const noexcept { return scheme == Scheme::Unix; }

    /// Location without credentials, for log messages.
    [[nodiscard]] std::string redacted() const {
        std::string out = isUnix() ? "unix://" + path : "redis://" + host + ":" + std::to_string(port);
        if (database != 0) out += isUnix() ? "?db=" + std::to_string(database) : "/" + std::to_string(database);
        return out;
    }
};

struct StoreUrlError {
    std::string message;
};

namespace detail {

[[nodiscard]] inline bool parseNumber(std::string_view sv, int& out) noexcept {
    if (sv.empty()) return false;
    auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), out);
    return ec == std::errc{} && ptr == sv.data() + sv.size();
}

}  // namespace detail

[[nodiscard]] inline std::expected<StoreUrl, StoreUrlError> parseStoreUrl(std::string_view url) {
    StoreUrl out;
    auto fail = [&](std::string_view why) {
        return std::unexpected(StoreUrlError{std::string(why) + ": '" + std::string(url) + "'"});
    };

    if (url.starts_with("unix://")) {
        out.scheme = StoreUrl::Scheme::Unix;
        auto rest = url.substr(7);
        auto q = rest.find('?');
        out.path = std::string(rest.substr(0, q));
        if (out.path.empty() || out.path.front() != '/')
            return fail("unix store URL needs an absolute socket path");
        if (q != std::string_view::npos) {
            auto query = rest.substr(q + 1);
            if (!query.starts_with("db=") || !detail::parseNumber(query.substr(3), out.database))
                return fail("unsupported unix store URL query");
        }
        return out;
    }

    if (!url.starts_with("redis://"))
        return fail("store URL must start with redis:// or unix://");

    auto rest = url.substr(8);

    // Userinfo first: a password may contain '/'.
    if (auto at = rest.rfind('@'); at != std::string_view::npos) {
        auto userinfo = rest.substr(0, at);
        rest = rest.substr(at + 1);
        if (auto colon = userinfo.find(':'); colon != std::string_view::npos) {
            out.username = std::string(userinfo.substr(0, colon));
            out.password = std::string(userinfo.substr(colon + 1));
        } else {
            out.password = std::string(userinfo);
        }
    }

    if (auto slash = rest.find('/'); slash != std::string_view::npos) {
        auto db = rest.substr(slash + 1);
        if (!db.empty() && (!detail::parseNumber(db, out.database) || out.database < 0))
            return fail("invalid database index");
        rest = rest.substr(0, slash);
    }

    std::string_view port;
    if (rest.starts_with('[')) {
        auto close = rest.find(']');
        if (close == std::string_view::npos)
            return fail("unterminated IPv6 host");
        out.host = std::string(rest.substr(1, close - 1));
        auto after = rest.substr(close + 1);
        if (!after.empty()) {
            if (after.front() != ':') return fail("unexpected characters after host");
            port = after.substr(1);
        }
    } else if (auto colon = rest.rfind(':'); colon != std::string_view::npos) {
        out.host = std::string(rest.substr(0, colon));
        port = rest.substr(colon + 1);
    } else {
        out.host = std::string(rest);
    }

    if (out.host.empty())
        return fail("store URL has no host");
    if (!port.empty() && (!detail::parseNumber(port, out.port) || out.port <= 0 || out.port > 65535))
        return fail("invalid port");

    return out;
}

}  // namespace jcailloux::tiercache::config

#endif  // JCX_TIERCACHE_CONFIG_STORE_URL_H
