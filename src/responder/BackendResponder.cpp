#include "backend/responder/BackendResponder.h"
#include "backend/network/EventLoop.h"
#include "backend/network/InetAddress.h"
#include "backend/protocol/HttpRequest.h"
#include "backend/protocol/HttpResponse.h"
#include "backend/common/Logger.h"

namespace backend {
namespace responder {

using backend::protocol::HttpRequest;
using backend::protocol::HttpResponse;

BackendResponder::BackendResponder(backend::network::EventLoop* loop, const ResponderOptions& options)
    : options_(options),
      identifier_(options.EffectiveIdentifier()),
      requestsServed_(0) {
    const auto addr = backend::network::InetAddress::Parse(options_.host, options_.port);
    if (!addr) {
        // No socket is opened; Start() reports the failure.
        LOG_ERROR << "Backend " << identifier_ << ": bad listen address " << options_.host;
        return;
    }
    server_.reset(new backend::protocol::HttpServer(
        loop, *addr, identifier_,
        options_.reusePort ? backend::network::TcpServer::kReusePort : backend::network::TcpServer::kNoReusePort));
    server_->setHttpCallback(
        std::bind(&BackendResponder::HandleRequest, this, std::placeholders::_1, std::placeholders::_2));
    server_->setThreadNum(options_.threads);
    server_->setMaxConnections(options_.maxConnections);
    if (options_.idleTimeoutSec > 0.0) {
        server_->setIdleTimeout(options_.idleTimeoutSec, options_.cleanupIntervalSec);
    }
    server_->setResponseDelay(options_.delayMs / 1000.0);
}

BackendResponder::~BackendResponder() = default;

uint16_t BackendResponder::port() const {
    return server_ ? server_->port() : 0;
}

bool BackendResponder::Start() {
    if (!server_ || !server_->start()) {
        return false;
    }
    LOG_INFO << "Backend " << identifier_ << " serving on " << server_->hostport()
             << (options_.threads > 0 ? " with " + std::to_string(options_.threads) + " I/O threads" : "");
    return true;
}

void BackendResponder::HandleRequest(const HttpRequest& req, HttpResponse* resp) {
    if (req.getMethod() == HttpRequest::kGet) {
        resp->setStatusCode(HttpResponse::k200Ok);
        if (!options_.healthPath.empty() && req.path() == options_.healthPath) {
            resp->setContentType("text/plain");
            resp->setBody("OK");
        } else {
            resp->setContentType(options_.contentType);
            resp->setBody(identifier_);
        }
    } else {
        resp->setStatusCode(HttpResponse::k501NotImplemented);
        resp->setContentType("text/plain");
        resp->setBody("Unsupported method ('" + req.methodString() + "')");
    }
    requestsServed_.fetch_add(1, std::memory_order_relaxed);

    if (options_.accessLog) {
        LOG_INFO << req.methodString() << " " << req.path() << req.query() << " -> " << resp->statusCode();
    }
}

} // namespace responder
} // namespace backend
