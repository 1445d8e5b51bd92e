#ifndef JCX_TIERCACHE_TEST_LOOP_ONLY_STORE_H
#define JCX_TIERCACHE_TEST_LOOP_ONLY_STORE_H

#include <jcailloux/tiercache/StoreProvider.h>
#include <jcailloux/tiercache/io/EpollIoContext.h>
#include <jcailloux/tiercache/io/redis/RedisResult.h>

#include <atomic>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace jcailloux::tiercache::test {

// LoopOnlyStore — a key/value store with no locking of its own
//
// Like a RedisClient, its state may only be touched from the event loop
// thread. Every call made from another thread is counted in off_loop_calls
// (the only atomic member). Understands SETEX, GET, PTTL and UNLINK; any
// other command is answered +OK.

struct LoopOnlyStore {
    explicit LoopOnlyStore(io::EpollIoContext& loop) : io(&loop) {}

    io::EpollIoContext* io;
    std::unordered_map<std::string, std::string> values;
    size_t commands = 0;
    std::atomic<int> off_loop_calls{0};

    io::RedisResult apply(const io::RedisCommand& cmd) {
        if (!io->runningInThisThread())
            off_loop_calls.fetch_add(1, std::memory_order_relaxed);
        ++commands;

        const auto& name = cmd.front();
        if (name == "SETEX" && cmd.size() == 4) {
            values[cmd[1]] = cmd[3];
            return io::RedisResult::fromWire("+OK\r\n");
        }
        if (name == "GET" && cmd.size() == 2) {
            auto it = values.find(cmd[1]);
            if (it == values.end()) return io::RedisResult::fromWire("$-1\r\n");
            return io::RedisResult::fromWire(
                "$" + std::to_string(it->second.size()) + "\r\n" + it->second + "\r\n");
        }
        if (name == "PTTL" && cmd.size() == 2)
            return io::RedisResult::fromWire(values.contains(cmd[1]) ? ":60000\r\n" : ":-2\r\n");
        if (name == "UNLINK" && cmd.size() == 2)
            return io::RedisResult::fromWire(values.erase(cmd[1]) ? ":1\r\n" : ":0\r\n");
        return io::RedisResult::fromWire("+OK\r\n");
    }

    static io::Task<io::RedisResult> exec(std::shared_ptr<LoopOnlyStore> self, io::RedisCommand cmd) {
        co_return self->apply(cmd);
    }

    static io::Task<std::vector<io::RedisResult>> pipeline(std::shared_ptr<LoopOnlyStore> self,
                                                           std::vector<io::RedisCommand> cmds) {
        std::vector<io::RedisResult> replies;
        replies.reserve(cmds.size());
        for (const auto& cmd : cmds) replies.push_back(self->apply(cmd));
        co_return replies;
    }

    /// Provider calling straight into the store, from whatever thread awaits.
    static StoreProvider direct(std::shared_ptr<LoopOnlyStore> self) {
        return StoreProvider(
            [self](io::RedisCommand cmd) { return exec(self, std::move(cmd)); },
            [self](std::vector<io::RedisCommand> cmds) { return pipeline(self, std::move(cmds)); });
    }
};

}  // namespace jcailloux::tiercache::test

#endif  // JCX_TIERCACHE_TEST_LOOP_ONLY_STORE_H
