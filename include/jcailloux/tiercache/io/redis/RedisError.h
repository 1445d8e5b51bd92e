#ifndef JCX_TIERCACHE_IO_REDIS_ERROR_H
#define JCX_TIERCACHE_IO_REDIS_ERROR_H

#include <stdexcept>
#include <string>

namespace jcailloux::tiercache::io {

/// Any failure talking to the backing store. RemoteCache catches this
/// family and degrades to a miss or a failed write.
class RedisError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// The store is unreachable: resolve/connect failed, the socket was closed,
/// or no connection is currently established.
class RedisConnectionError : public RedisError {
public:
    using RedisError::RedisError;
};

/// The server sent bytes that are not valid RESP2.
class RedisProtocolError : public RedisError {
public:
    using RedisError::RedisError;
};

} // namespace jcailloux::tiercache::io

#endif // JCX_TIERCACHE_IO_REDIS_ERROR_H
