#pragma once

// Blocking loopback client helpers shared by the integration tests.

#include <arpa/inet.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cassert>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <map>
#include <string>

namespace testing_support {

struct ParsedResponse {
    int status = 0;
    std::string reason;
    std::map<std::string, std::string> headers; // lower-case names
    std::string body;

    std::string header(const std::string& lowerName) const {
        auto it = headers.find(lowerName);
        return it == headers.end() ? std::string() : it->second;
    }
};

inline int connectTo(uint16_t port) {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    assert(fd >= 0);

    sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    assert(::inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr) == 1);

    int ret = ::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    assert(ret == 0);
    return fd;
}

inline void sendAll(int fd, const std::string& data) {
    size_t off = 0;
    while (off < data.size()) {
        ssize_t n = ::send(fd, data.data() + off, data.size() - off, MSG_NOSIGNAL);
        assert(n > 0);
        off += static_cast<size_t>(n);
    }
}

inline std::string recvUntilClose(int fd, int timeoutMs = 2000) {
    std::string out;
    pollfd pfd;
    pfd.fd = fd;
    pfd.events = POLLIN | POLLHUP | POLLERR;
    while (true) {
        int pret = ::poll(&pfd, 1, timeoutMs);
        assert(pret == 1);
        char buf[4096];
        ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
        if (n > 0) {
            out.append(buf, buf + n);
            continue;
        }
        break;
    }
    return out;
}

// Parses one response from the front of *raw (Content-Length framing) and
// removes it. Returns false if *raw does not yet hold a complete response.
inline bool takeResponse(std::string* raw, ParsedResponse* out) {
    const size_t headerEnd = raw->find("\r\n\r\n");
    if (headerEnd == std::string::npos) return false;

    const std::string head = raw->substr(0, headerEnd);
    size_t lineEnd = head.find("\r\n");
    const std::string statusLine = head.substr(0, lineEnd);
    // "HTTP/1.1 200 OK"
    if (statusLine.compare(0, 5, "HTTP/") != 0) return false;
    const size_t sp1 = statusLine.find(' ');
    const size_t sp2 = statusLine.find(' ', sp1 + 1);
    ParsedResponse resp;
    resp.status = std::atoi(statusLine.substr(sp1 + 1, sp2 - sp1 - 1).c_str());
    resp.reason = sp2 == std::string::npos ? std::string() : statusLine.substr(sp2 + 1);

    while (lineEnd != std::string::npos) {
        const size_t start = lineEnd + 2;
        lineEnd = head.find("\r\n", start);
        const std::string line = head.substr(start, lineEnd == std::string::npos ? std::string::npos : lineEnd - start);
        const size_t colon = line.find(':');
        if (colon == std::string::npos) continue;
        std::string name = line.substr(0, colon);
        for (auto& c : name) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        size_t v = colon + 1;
        while (v < line.size() && line[v] == ' ') ++v;
        resp.headers[name] = line.substr(v);
    }

    const size_t length = static_cast<size_t>(std::atol(resp.header("content-length").c_str()));
    if (raw->size() < headerEnd + 4 + length) return false;
    resp.body = raw->substr(headerEnd + 4, length);
    raw->erase(0, headerEnd + 4 + length);
    *out = resp;
    return true;
}

// Reads from fd until one complete response is available (or the peer closes).
inline ParsedResponse readResponse(int fd, std::string* pending, int timeoutMs = 2000) {
    ParsedResponse resp;
    while (!takeResponse(pending, &resp)) {
        pollfd pfd;
        pfd.fd = fd;
        pfd.events = POLLIN;
        int pret = ::poll(&pfd, 1, timeoutMs);
        assert(pret == 1);
        char buf[4096];
        ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
        assert(n > 0);
        pending->append(buf, buf + n);
    }
    return resp;
}

// One request on a fresh connection with "Connection: close".
inline ParsedResponse fetch(uint16_t port, const std::string& method, const std::string& target) {
    int fd = connectTo(port);
    sendAll(fd, method + " " + target + " HTTP/1.1\r\nHost: localhost\r\nConnection: close\r\n\r\n");
    std::string raw = recvUntilClose(fd);
    ::close(fd);
    ParsedResponse resp;
    const bool complete = takeResponse(&raw, &resp);
    assert(complete);
    (void)complete;
    return resp;
}

// True once the server has closed fd (EOF or reset) within timeoutMs.
inline bool waitForClose(int fd, int timeoutMs) {
    pollfd pfd;
    pfd.fd = fd;
    pfd.events = POLLIN | POLLHUP | POLLERR;
    int pret = ::poll(&pfd, 1, timeoutMs);
    if (pret != 1) return false;
    char buf[256];
    ssize_t n = ::recv(fd, buf, sizeof(buf), MSG_DONTWAIT);
    return n == 0 || (n < 0 && errno == ECONNRESET);
}

} // namespace testing_support
