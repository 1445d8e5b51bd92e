#ifndef JCX_TIERCACHE_CACHE_TAG_INDEX_H
#define JCX_TIERCACHE_CACHE_TAG_INDEX_H

#include <algorithm>
#include <chrono>
#include <mutex>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include "jcailloux/tiercache/Log.h"
#include "jcailloux/tiercache/cache/RemoteCache.h"
#include "jcailloux/tiercache/io/Task.h"

namespace jcailloux::tiercache::cache {

// =============================================================================
// TagIndex — tag memberships and dependency edges of cached keys
//
// Two registries hold the same relations:
//
// - remote sets in the backing store, shared by every process:
//     <prefix>tag:<tag>  members: keys carrying the tag
//     <prefix>dep:<key>  members: keys that depend on <key>
//   Each set expires ttl + slack after its longest-lived member was added.
//
// - local maps, a process-local superset consulted together with the remote
//   sets and used alone while the store is unreachable.
//
// A key's own local registrations (its tags and the edges to what it depends
// on) expire with the TTL of its last set(); expired ones are swept at most
// once per kSweepInterval by the next registration or query. Edges pointing
// at a key belong to the dependents and expire with them.
//
// All keys here are full keys (prefix and namespace applied). The local maps
// are guarded by one mutex that is never held across a store call.
// =============================================================================

template<typename Clock = std::chrono::steady_clock>
class BasicTagIndex {
public:
    using time_point = typename Clock::time_point;

    static constexpr auto kSweepInterval = std::chrono::seconds(1);

    BasicTagIndex(std::string key_prefix, std::chrono::seconds tag_ttl_slack)
        : prefix_(std::move(key_prefix)), slack_(tag_ttl_slack) {}

    BasicTagIndex(const BasicTagIndex&) = delete;
    BasicTagIndex& operator=(const BasicTagIndex&) = delete;

    [[nodiscard]] std::string tagSetKey(std::string_view tag) const {
        std::string k;
        k.reserve(prefix_.size() + 4 + tag.size());
        k.append(prefix_).append("tag:").append(tag);
        return k;
    }

    [[nodiscard]] std::string depSetKey(std::string_view key) const {
        std::string k;
        k.reserve(prefix_.size() + 4 + key.size());
        k.append(prefix_).append("dep:").append(key);
        return k;
    }

    // =========================================================================
    // Registration
    // =========================================================================

    /// Record `key` under every tag, locally then in the store. Existing
    /// local registrations of `key` take the new `ttl` even when `tags` is
    /// empty.
    template<typename Rep, typename Period>
    io::Task<void> track(RemoteCache& remote, std::string key, std::vector<std::string> tags,
                         std::chrono::duration<Rep, Period> ttl) {
        {
            std::lock_guard lock(mutex_);
            const auto now = Clock::now();
            sweepIfDueLocked(now);
            if (tags.empty()) {
                if (auto it = expires_.find(key); it != expires_.end())
                    it->second = now + toClock(ttl);
                co_return;
            }
            expires_[key] = now + toClock(ttl);
            auto& own = key_tags_[key];
            for (const auto& tag : tags) {
                tag_keys_[tag].insert(key);
                own.insert(tag);
            }
        }

        const auto set_ttl = std::chrono::duration_cast<std::chrono::seconds>(ttl) + slack_;
        for (const auto& tag : tags) {
            if (!co_await remote.addToSet(tagSetKey(tag), {key}, set_ttl) && remote.attached())
                TIERCACHE_LOG_DEBUG << "TagIndex: tag " << tag << " for " << key
                                    << " recorded locally only";
        }
    }

    /// Record that `key` depends on each of `dependencies`: removing a
    /// dependency later removes `key` as well.
    template<typename Rep, typename Period>
    io::Task<void> dependOn(RemoteCache& remote, std::string key, std::vector<std::string> dependencies,
                            std::chrono::duration<Rep, Period> ttl) {
        std::erase(dependencies, key);
        if (dependencies.empty()) co_return;
        {
            std::lock_guard lock(mutex_);
            const auto now = Clock::now();
            sweepIfDueLocked(now);
            expires_[key] = now + toClock(ttl);
            auto& own = key_deps_[key];
            for (const auto& dep : dependencies) {
                dependents_[dep].insert(key);
                own.insert(dep);
            }
        }

        const auto set_ttl = std::chrono::duration_cast<std::chrono::seconds>(ttl) + slack_;
        for (const auto& dep : dependencies)
            co_await remote.addToSet(depSetKey(dep), {key}, set_ttl);
    }

    // =========================================================================
    // Queries
    // =========================================================================

    /// Keys carrying `tag`: remote members united with local ones, sorted.
    io::Task<std::vector<std::string>> members(RemoteCache& remote, std::string tag) {
        std::set<std::string> all;
        if (auto remote_members = co_await remote.setMembers(tagSetKey(tag)))
            all.insert(remote_members->begin(), remote_members->end());
        {
            std::lock_guard lock(mutex_);
            sweepIfDueLocked(Clock::now());
            if (auto it = tag_keys_.find(tag); it != tag_keys_.end())
                all.insert(it->second.begin(), it->second.end());
        }
        co_return std::vector<std::string>(all.begin(), all.end());
    }

    /// `roots` followed by every key that transitively depends on one of
    /// them. Each key appears once; cycles terminate.
    io::Task<std::vector<std::string>> cascade(RemoteCache& remote, std::vector<std::string> roots) {
        std::vector<std::string> order;
        std::unordered_set<std::string> visited;
        std::vector<std::string> frontier;

        for (auto& root : roots) {
            if (visited.insert(root).second) {
                order.push_back(root);
                frontier.push_back(std::move(root));
            }
        }

        while (!frontier.empty()) {
            std::vector<std::string> next;
            for (const auto& key : frontier) {
                std::vector<std::string> found;
                if (auto remote_deps = co_await remote.setMembers(depSetKey(key)))
                    found = std::move(*remote_deps);
                {
                    std::lock_guard lock(mutex_);
                    if (auto it = dependents_.find(key); it != dependents_.end())
                        found.insert(found.end(), it->second.begin(), it->second.end());
                }
                for (auto& dependent : found) {
                    if (visited.insert(dependent).second) {
                        order.push_back(dependent);
                        next.push_back(std::move(dependent));
                    }
                }
            }
            frontier = std::move(next);
        }
        co_return order;
    }

    [[nodiscard]] std::vector<std::string> localMembers(std::string_view tag) {
        std::lock_guard lock(mutex_);
        sweepIfDueLocked(Clock::now());
        auto it = tag_keys_.find(std::string(tag));
        if (it == tag_keys_.end()) return {};
        std::vector<std::string> out(it->second.begin(), it->second.end());
        std::sort(out.begin(), out.end());
        return out;
    }

    [[nodiscard]] std::vector<std::string> localTags(std::string_view key) {
        std::lock_guard lock(mutex_);
        sweepIfDueLocked(Clock::now());
        auto it = key_tags_.find(std::string(key));
        if (it == key_tags_.end()) return {};
        std::vector<std::string> out(it->second.begin(), it->second.end());
        std::sort(out.begin(), out.end());
        return out;
    }

    [[nodiscard]] std::vector<std::string> localDependents(std::string_view key) {
        std::lock_guard lock(mutex_);
        sweepIfDueLocked(Clock::now());
        auto it = dependents_.find(std::string(key));
        if (it == dependents_.end()) return {};
        std::vector<std::string> out(it->second.begin(), it->second.end());
        std::sort(out.begin(), out.end());
        return out;
    }

    // =========================================================================
    // Cleanup
    // =========================================================================

    /// After an invalidation pass: SREM exactly the enumerated `members` from
    /// the remote tag set, then drop them from the local entry of `tag`.
    /// Keys registered after the enumeration stay in both registries.
    io::Task<void> release(RemoteCache& remote, std::string tag, std::vector<std::string> members) {
        if (members.empty()) co_return;
        co_await remote.removeFromSet(tagSetKey(tag), members);

        std::lock_guard lock(mutex_);
        if (auto it = tag_keys_.find(tag); it != tag_keys_.end()) {
            for (const auto& m : members) it->second.erase(m);
            if (it->second.empty()) tag_keys_.erase(it);
        }
    }

    /// Drop all local bookkeeping of removed keys: their tag memberships,
    /// their edges to dependencies and their own dependents list.
    void forget(const std::vector<std::string>& keys) {
        std::lock_guard lock(mutex_);
        for (const auto& key : keys) forgetLocked(key);
    }

    void forget(const std::string& key) {
        std::lock_guard lock(mutex_);
        forgetLocked(key);
    }

    /// Forget every key starting with `prefix`.
    void forgetPrefix(std::string_view prefix) {
        std::lock_guard lock(mutex_);
        std::vector<std::string> doomed;
        auto collect = [&](const auto& map) {
            for (const auto& [key, _] : map)
                if (std::string_view(key).starts_with(prefix)) doomed.push_back(key);
        };
        collect(key_tags_);
        collect(key_deps_);
        collect(dependents_);
        collect(expires_);
        for (const auto& key : doomed) forgetLocked(key);
    }

    void clear() {
        std::lock_guard lock(mutex_);
        tag_keys_.clear();
        key_tags_.clear();
        dependents_.clear();
        key_deps_.clear();
        expires_.clear();
    }

    /// Number of keys holding local registrations of their own.
    [[nodiscard]] size_t localKeyCount() const {
        std::lock_guard lock(mutex_);
        return expires_.size();
    }

private:
    using StringSet = std::unordered_set<std::string>;
    using Relation = std::unordered_map<std::string, StringSet>;

    static void unlink(Relation& rel, const std::string& from, const std::string& to) {
        auto it = rel.find(from);
        if (it == rel.end()) return;
        it->second.erase(to);
        if (it->second.empty()) rel.erase(it);
    }

    template<typename Rep, typename Period>
    static typename Clock::duration toClock(std::chrono::duration<Rep, Period> ttl) {
        return std::chrono::duration_cast<typename Clock::duration>(ttl);
    }

    /// Tags of `key` and its edges to its dependencies.
    void dropOwnLocked(const std::string& key) {
        if (auto it = key_tags_.find(key); it != key_tags_.end()) {
            for (const auto& tag : it->second) unlink(tag_keys_, tag, key);
            key_tags_.erase(it);
        }
        if (auto it = key_deps_.find(key); it != key_deps_.end()) {
            for (const auto& dep : it->second) unlink(dependents_, dep, key);
            key_deps_.erase(it);
        }
        expires_.erase(key);
    }

    void sweepIfDueLocked(time_point now) {
        if (now < next_sweep_) return;
        next_sweep_ = now + kSweepInterval;

        std::vector<std::string> expired;
        for (const auto& [key, deadline] : expires_)
            if (now >= deadline) expired.push_back(key);
        for (const auto& key : expired) dropOwnLocked(key);

        if (!expired.empty())
            TIERCACHE_LOG_DEBUG << "TagIndex: dropped local registrations of "
                                << expired.size() << " expired keys";
    }

    void forgetLocked(const std::string& key) {
        dropOwnLocked(key);
        if (auto it = dependents_.find(key); it != dependents_.end()) {
            for (const auto& dependent : it->second) unlink(key_deps_, dependent, key);
            dependents_.erase(it);
        }
    }

    std::string prefix_;
    std::chrono::seconds slack_;

    mutable std::mutex mutex_;
    Relation tag_keys_;     // tag -> keys
    Relation key_tags_;     // key -> tags
    Relation dependents_;   // key -> keys depending on it
    Relation key_deps_;     // key -> keys it depends on
    std::unordered_map<std::string, time_point> expires_;  // key -> end of its own registrations
    time_point next_sweep_{};
};

using TagIndex = BasicTagIndex<>;

}  // namespace jcailloux::tiercache::cache

#endif  // JCX_TIERCACHE_CACHE_TAG_INDEX_H
