#include "backend/protocol/HttpContext.h"
#include "backend/network/Buffer.h"
#include "backend/common/Logger.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace backend {
namespace protocol {

using backend::network::Buffer;

namespace {

std::string ToLowerCopy(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

std::string TrimCopy(const std::string& s) {
    size_t i = 0;
    size_t j = s.size();
    while (i < j && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
    while (j > i && std::isspace(static_cast<unsigned char>(s[j - 1]))) --j;
    return s.substr(i, j - i);
}

// One line at the front of buf. *end stops before the terminator, which is
// "\r\n" or a bare "\n"; *next points past it.
bool NextLine(const Buffer* buf, const char** end, const char** next) {
    const char* lf = buf->FindEOL();
    if (lf == nullptr) {
        return false;
    }
    *next = lf + 1;
    *end = (lf > buf->Peek() && lf[-1] == '\r') ? lf - 1 : lf;
    return true;
}

} // namespace

void HttpContext::reset() {
    state_ = kExpectRequestLine;
    HttpRequest dummy;
    request_.swap(dummy);
    headerBytes_ = 0;
    contentLength_.clear();
    sawContentLength_ = false;
    chunked_ = false;
    bodyRemaining_ = 0;
    chunkSize_ = 0;
    expectingChunkSize_ = true;
}

bool HttpContext::processRequestLine(const char* begin, const char* end) {
    const char* start = begin;
    const char* space = std::find(start, end, ' ');
    if (space == end || !request_.setMethod(start, space)) {
        return false;
    }

    start = space + 1;
    space = std::find(start, end, ' ');
    if (space == end || space == start) {
        return false;
    }
    const char* question = std::find(start, space, '?');
    request_.setPath(start, question);
    if (question != space) {
        request_.setQuery(question, space);
    }

    const std::string version(space + 1, end);
    if (version == "HTTP/1.1") {
        request_.setVersion(HttpRequest::kHttp11);
    } else if (version == "HTTP/1.0") {
        request_.setVersion(HttpRequest::kHttp10);
    } else {
        return false;
    }
    return true;
}

bool HttpContext::processHeaders(Buffer* buf, bool* hasMore) {
    const char* end = nullptr;
    const char* next = nullptr;
    if (!NextLine(buf, &end, &next)) {
        *hasMore = false;
        return headerBytes_ + buf->ReadableBytes() <= kMaxHeaderBytes;
    }
    headerBytes_ += next - buf->Peek();
    if (headerBytes_ > kMaxHeaderBytes) {
        return false;
    }

    if (end == buf->Peek()) {
        buf->RetrieveUntil(next);
        return beginBody();
    }

    const char* colon = std::find(buf->Peek(), end, ':');
    if (colon == end || colon == buf->Peek()) {
        return false;
    }
    if (HttpRequest::iequals(std::string(buf->Peek(), colon), "Content-Length")) {
        const std::string value = TrimCopy(std::string(colon + 1, end));
        if (sawContentLength_ && value != contentLength_) {
            LOG_DEBUG << "conflicting Content-Length: " << contentLength_ << " vs " << value;
            return false;
        }
        contentLength_ = value;
        sawContentLength_ = true;
    }
    request_.addHeader(buf->Peek(), colon, end);
    buf->RetrieveUntil(next);
    return true;
}

bool HttpContext::beginBody() {
    chunked_ = false;
    bodyRemaining_ = 0;
    chunkSize_ = 0;
    expectingChunkSize_ = true;

    const std::string te = request_.getHeader("Transfer-Encoding");
    if (!te.empty() && ToLowerCopy(te).find("chunked") != std::string::npos) {
        chunked_ = true;
    } else if (sawContentLength_) {
        char* endp = nullptr;
        const long long v = std::strtoll(contentLength_.c_str(), &endp, 10);
        if (contentLength_.empty() || *endp != '\0' || v < 0 ||
            static_cast<unsigned long long>(v) > kMaxBodyBytes) {
            return false;
        }
        bodyRemaining_ = static_cast<size_t>(v);
    }

    state_ = (chunked_ || bodyRemaining_ > 0) ? kExpectBody : kGotAll;
    return true;
}

void HttpContext::processFixedBody(Buffer* buf) {
    const size_t n = std::min(bodyRemaining_, buf->ReadableBytes());
    if (n > 0) {
        request_.appendBody(buf->Peek(), n);
        buf->Retrieve(n);
        bodyRemaining_ -= n;
    }
    if (bodyRemaining_ == 0) {
        state_ = kGotAll;
    }
}

// Consumes chunk-size lines and chunk data until the input runs out or the
// terminating zero-size chunk and its trailers have been read.
bool HttpContext::processChunkedBody(Buffer* buf) {
    const char* end = nullptr;
    const char* next = nullptr;
    while (state_ == kExpectBody) {
        if (expectingChunkSize_) {
            if (!NextLine(buf, &end, &next)) return true;
            std::string line(buf->Peek(), end);
            buf->RetrieveUntil(next);

            // Strip chunk extensions.
            auto semi = line.find(';');
            if (semi != std::string::npos) line.resize(semi);
            line = TrimCopy(line);
            if (line.empty()) return false;

            char* endp = nullptr;
            long long sz = std::strtoll(line.c_str(), &endp, 16);
            if (*endp != '\0' || sz < 0) return false;
            chunkSize_ = static_cast<size_t>(sz);
            if (request_.body().size() + chunkSize_ > kMaxBodyBytes) return false;
            expectingChunkSize_ = false;
        }

        if (chunkSize_ == 0) {
            // Trailer section: header lines up to an empty line.
            if (!NextLine(buf, &end, &next)) return true;
            const bool last = (end == buf->Peek());
            buf->RetrieveUntil(next);
            if (last) state_ = kGotAll;
            continue;
        }

        // Chunk data followed by its line ending.
        if (buf->ReadableBytes() < chunkSize_ + 1) return true;
        const char* tail = buf->Peek() + chunkSize_;
        size_t terminator = 0;
        if (tail[0] == '\n') {
            terminator = 1;
        } else if (tail[0] == '\r') {
            if (buf->ReadableBytes() < chunkSize_ + 2) return true;
            if (tail[1] != '\n') return false;
            terminator = 2;
        } else {
            return false;
        }
        request_.appendBody(buf->Peek(), chunkSize_);
        buf->Retrieve(chunkSize_ + terminator);
        expectingChunkSize_ = true;
    }
    return true;
}

bool HttpContext::parseRequest(Buffer* buf) {
    bool hasMore = true;
    const char* end = nullptr;
    const char* next = nullptr;
    while (hasMore && state_ != kGotAll) {
        if (state_ == kExpectRequestLine) {
            if (!NextLine(buf, &end, &next)) {
                return buf->ReadableBytes() <= kMaxHeaderBytes;
            }
            // Tolerate empty lines between pipelined requests.
            if (end == buf->Peek()) {
                buf->RetrieveUntil(next);
                continue;
            }
            if (!processRequestLine(buf->Peek(), end)) {
                LOG_DEBUG << "bad request line: " << std::string(buf->Peek(), end);
                return false;
            }
            headerBytes_ = next - buf->Peek();
            buf->RetrieveUntil(next);
            state_ = kExpectHeaders;
        } else if (state_ == kExpectHeaders) {
            if (!processHeaders(buf, &hasMore)) {
                return false;
            }
        } else if (state_ == kExpectBody) {
            if (chunked_) {
                if (!processChunkedBody(buf)) return false;
            } else {
                processFixedBody(buf);
            }
            hasMore = false;
        }
    }
    return true;
}

} // namespace protocol
} // namespace backend
