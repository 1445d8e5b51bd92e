#ifndef JCX_TIERCACHE_CACHED_CALL_H
#define JCX_TIERCACHE_CACHED_CALL_H

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

#include <glaze/glaze.hpp>
#include <xxhash.h>

#include "jcailloux/tiercache/CacheService.h"
#include "jcailloux/tiercache/cache/Errors.h"
#include "jcailloux/tiercache/io/Task.h"

namespace jcailloux::tiercache {

struct CachedCallOptions {
    std::string prefix;
    std::chrono::seconds ttl{0};        ///< zero: the service's default_ttl
    std::vector<std::string> tags;
    std::string ns;
};

namespace detail {

    template<typename T>
    struct task_value;

    template<typename T>
    struct task_value<io::Task<T>> { using type = T; };

    template<typename T>
    using task_value_t = typename task_value<std::remove_cvref_t<T>>::type;

    /// 16 lowercase hex digits of XXH3-64 over `data`.
    inline std::string hashHex(std::string_view data) {
        static constexpr char kDigits[] = "0123456789abcdef";
        uint64_t h = XXH3_64bits(data.data(), data.size());
        std::string out(16, '0');
        for (int i = 15; i >= 0; --i) {
            out[static_cast<size_t>(i)] = kDigits[h & 0xF];
            h >>= 4;
        }
        return out;
    }

}  // namespace detail

/// Default key: `prefix:` followed by the XXH3-64 of the arguments written
/// as a JSON array. Equal arguments give equal keys.
struct HashedArgsKey {
    std::string prefix;

    template<typename... Args>
    std::string operator()(const Args&... args) const {
        const auto tuple = std::make_tuple(args...);
        std::string json;
        if (glz::write_json(tuple, json))
            throw cache::SerializationError("cannot derive a cache key from the call arguments");
        return prefix + ':' + detail::hashHex(json);
    }
};

// =============================================================================
// CachedCall — memoize an async function through a CacheService
//
//   auto render = cachedCall(cache, [&](std::string id, int page) {
//       return renderPage(std::move(id), page);          // io::Task<Page>
//   }, {.prefix = "render", .ttl = 10min, .tags = {"pages"}});
//
//   Page p = co_await render("doc-7", 2);
//
// A call derives its key from the arguments, returns the cached value on a
// hit, and otherwise awaits the function, stores its result and returns it.
// Concurrent misses on the same key each call the function.
//
// The CachedCall object and the service must outlive every returned task.
// =============================================================================

template<typename Service, typename Fn, typename KeyFn = HashedArgsKey>
class CachedCall {
public:
    CachedCall(Service& service, Fn fn, CachedCallOptions options, KeyFn key_fn)
        : service_(&service)
        , fn_(std::move(fn))
        , options_(std::move(options))
        , key_fn_(std::move(key_fn)) {}

    template<typename... Args>
    auto operator()(Args... args)
        -> io::Task<detail::task_value_t<std::invoke_result_t<Fn&, Args&...>>>
    {
        using R = detail::task_value_t<std::invoke_result_t<Fn&, Args&...>>;

        auto key = std::invoke(key_fn_, std::as_const(args)...);
        if (auto hit = co_await service_->template get<R>(key, options_.ns))
            co_return std::move(*hit);

        R value = co_await std::invoke(fn_, args...);
        co_await service_->set(std::move(key), value, options_.ttl, options_.tags, options_.ns);
        co_return value;
    }

    [[nodiscard]] const CachedCallOptions& options() const noexcept { return options_; }

private:
    Service* service_;
    Fn fn_;
    CachedCallOptions options_;
    KeyFn key_fn_;
};

/// Memoize `fn` with keys derived from options.prefix and the hashed
/// arguments.
template<typename Service, typename Fn>
auto cachedCall(Service& service, Fn fn, CachedCallOptions options) {
    HashedArgsKey key_fn{options.prefix};
    return CachedCall<Service, Fn, HashedArgsKey>(
        service, std::move(fn), std::move(options), std::move(key_fn));
}

/// Memoize `fn` with keys computed by `key_fn(args...)`.
template<typename Service, typename Fn, typename KeyFn>
auto cachedCall(Service& service, Fn fn, KeyFn key_fn, CachedCallOptions options) {
    return CachedCall<Service, Fn, KeyFn>(
        service, std::move(fn), std::move(options), std::move(key_fn));
}

}  // namespace jcailloux::tiercache

#endif  // JCX_TIERCACHE_CACHED_CALL_H
