#pragma once

#include "backend/common/noncopyable.h"
#include "backend/protocol/HttpServer.h"
#include "backend/responder/ResponderOptions.h"

#include <atomic>
#include <memory>
#include <string>

namespace backend {
namespace network {
class EventLoop;
} // namespace network

namespace protocol {
class HttpRequest;
class HttpResponse;
} // namespace protocol

namespace responder {

// A test backend: answers every GET with 200 and the fixed identifier as a
// plain-text body. Nothing is logged per request unless access logging is on.
class BackendResponder : backend::common::noncopyable {
public:
    BackendResponder(backend::network::EventLoop* loop, const ResponderOptions& options);
    ~BackendResponder();

    // Binds and listens. False (already logged) if the address is unusable.
    bool Start();

    // Fills the response for one parsed request. Safe to call from any I/O thread.
    void HandleRequest(const backend::protocol::HttpRequest& req, backend::protocol::HttpResponse* resp);

    uint64_t requestsServed() const { return requestsServed_.load(std::memory_order_relaxed); }
    const std::string& identifier() const { return identifier_; }
    // actual bound port (differs from options.port when that was 0); 0 if the
    // listen address was rejected
    uint16_t port() const;
    const ResponderOptions& options() const { return options_; }

private:
    const ResponderOptions options_;
    const std::string identifier_;
    std::unique_ptr<backend::protocol::HttpServer> server_;
    std::atomic<uint64_t> requestsServed_;
};

} // namespace responder
} // namespace backend
