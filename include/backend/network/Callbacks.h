#pragma once

#include <functional>
#include <memory>

namespace backend {
namespace network {

class Buffer;
class TcpConnection;

using TcpConnectionPtr = std::shared_ptr<TcpConnection>;

// Fired on connect and again on disconnect; check conn->connected().
using ConnectionCallback = std::function<void(const TcpConnectionPtr&)>;
// The buffer holds everything received and not yet consumed.
using MessageCallback = std::function<void(const TcpConnectionPtr&, Buffer*)>;
using CloseCallback = std::function<void(const TcpConnectionPtr&)>;

using TimerCallback = std::function<void()>;

} // namespace network
} // namespace backend
