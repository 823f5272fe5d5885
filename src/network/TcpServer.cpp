#include "backend/network/TcpServer.h"
#include "backend/network/Acceptor.h"
#include "backend/network/EventLoop.h"
#include "backend/network/EventLoopThreadPool.h"
#include "backend/network/TcpConnection.h"
#include "backend/common/Logger.h"

#include <unistd.h>
#include <vector>

namespace backend {
namespace network {

TcpServer::TcpServer(EventLoop* loop, const InetAddress& listenAddr, const std::string& name,
                     Option option)
    : loop_(loop),
      name_(name),
      hostport_(listenAddr.toIpPort()),
      port_(listenAddr.toPort()),
      acceptor_(new Acceptor(loop, listenAddr, option == kReusePort)),
      workers_(new EventLoopThreadPool(loop, name)),
      started_(false),
      listening_(false),
      nextConnId_(1),
      maxConnections_(0),
      idleSec_(0.0),
      sweepIntervalSec_(1.0),
      sweepTimer_(0) {
    if (acceptor_->Bound()) {
        const InetAddress bound = acceptor_->LocalAddress();
        hostport_ = bound.toIpPort();
        port_ = bound.toPort();
    }
    acceptor_->SetNewConnectionCallback(
        [this](int fd, const InetAddress& peer) { OnNewConnection(fd, peer); });
}

TcpServer::~TcpServer() {
    if (sweepTimer_ != 0) {
        loop_->Cancel(sweepTimer_);
    }
    for (auto& entry : connections_) {
        TcpConnectionPtr conn = std::move(entry.second);
        conn->getLoop()->RunInLoop([conn]() { conn->ConnectDestroyed(); });
    }
    connections_.clear();
}

void TcpServer::SetThreadNum(int numThreads) {
    workers_->SetThreadNum(numThreads);
}

void TcpServer::SetIdleTimeout(double idleSec, double sweepIntervalSec) {
    idleSec_ = idleSec;
    sweepIntervalSec_ = sweepIntervalSec > 0.0 ? sweepIntervalSec : 1.0;
}

bool TcpServer::Start() {
    if (started_) {
        return listening_;
    }
    started_ = true;
    if (!acceptor_->Listen()) {
        LOG_ERROR << "TcpServer[" << name_ << "] cannot listen on " << hostport_;
        return false;
    }
    listening_ = true;
    workers_->Start();
    if (idleSec_ > 0.0) {
        sweepTimer_ = loop_->RunEvery(sweepIntervalSec_, [this]() { SweepIdle(); });
    }
    LOG_DEBUG << "TcpServer[" << name_ << "] listening on " << hostport_;
    return true;
}

void TcpServer::OnNewConnection(int fd, const InetAddress& peer) {
    if (maxConnections_ > 0 && connections_.size() >= static_cast<size_t>(maxConnections_)) {
        LOG_WARN << "TcpServer[" << name_ << "] at " << maxConnections_
                 << " connections, dropping " << peer.toIpPort();
        ::close(fd);
        return;
    }

    const std::string connName = name_ + "#" + std::to_string(nextConnId_++);
    EventLoop* ioLoop = workers_->GetNextLoop();
    TcpConnectionPtr conn = std::make_shared<TcpConnection>(ioLoop, connName, fd, peer);
    conn->SetConnectionCallback(onConnection_);
    conn->SetMessageCallback(onMessage_);
    conn->SetCloseCallback([this](const TcpConnectionPtr& c) { OnConnectionClosed(c); });
    connections_[connName] = conn;

    ioLoop->RunInLoop([conn]() { conn->ConnectEstablished(); });
}

// Runs on the connection's loop; the map belongs to the base loop. The erase
// is always queued so the connection outlives its own close callback.
void TcpServer::OnConnectionClosed(const TcpConnectionPtr& conn) {
    loop_->QueueInLoop([this, conn]() {
        connections_.erase(conn->name());
        conn->getLoop()->QueueInLoop([conn]() { conn->ConnectDestroyed(); });
    });
}

void TcpServer::SweepIdle() {
    const auto cutoff = std::chrono::steady_clock::now() -
        std::chrono::duration_cast<std::chrono::steady_clock::duration>(std::chrono::duration<double>(idleSec_));

    std::vector<TcpConnectionPtr> idle;
    for (const auto& entry : connections_) {
        if (entry.second->LastActiveTime() < cutoff) {
            idle.push_back(entry.second);
        }
    }
    for (const TcpConnectionPtr& conn : idle) {
        LOG_DEBUG << "TcpServer[" << name_ << "] closing idle " << conn->name();
        conn->ForceClose();
    }
}

} // namespace network
} // namespace backend
