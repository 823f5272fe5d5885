#include "backend/network/Buffer.h"

#include <cerrno>
#include <cstring>
#include <sys/uio.h>

namespace backend {
namespace network {

namespace {

const size_t kSpillSize = 64 * 1024;

} // namespace

Buffer::Buffer(size_t initialSize)
    : storage_(initialSize),
      readPos_(0),
      writePos_(0) {
}

const char* Buffer::FindEOL() const {
    const void* eol = std::memchr(Peek(), '\n', ReadableBytes());
    return static_cast<const char*>(eol);
}

void Buffer::Retrieve(size_t len) {
    if (len >= ReadableBytes()) {
        RetrieveAll();
    } else {
        readPos_ += len;
    }
}

std::string Buffer::RetrieveAsString(size_t len) {
    if (len > ReadableBytes()) {
        len = ReadableBytes();
    }
    std::string out(Peek(), len);
    Retrieve(len);
    return out;
}

void Buffer::Append(const char* data, size_t len) {
    Reserve(len);
    std::memcpy(storage_.data() + writePos_, data, len);
    writePos_ += len;
}

void Buffer::Append(const char* str) {
    Append(str, std::strlen(str));
}

void Buffer::Reserve(size_t len) {
    if (storage_.size() - writePos_ >= len) {
        return;
    }
    const size_t readable = ReadableBytes();
    if (readPos_ > 0) {
        std::memmove(storage_.data(), Peek(), readable);
        readPos_ = 0;
        writePos_ = readable;
    }
    if (storage_.size() - writePos_ < len) {
        storage_.resize(writePos_ + len);
    }
}

ssize_t Buffer::ReadFd(int fd, int* savedErrno) {
    char spill[kSpillSize];
    const size_t room = storage_.size() - writePos_;

    struct iovec iov[2];
    iov[0].iov_base = storage_.data() + writePos_;
    iov[0].iov_len = room;
    iov[1].iov_base = spill;
    iov[1].iov_len = sizeof spill;

    const ssize_t n = ::readv(fd, iov, room < sizeof spill ? 2 : 1);
    if (n < 0) {
        *savedErrno = errno;
        return n;
    }
    const size_t got = static_cast<size_t>(n);
    if (got <= room) {
        writePos_ += got;
    } else {
        writePos_ = storage_.size();
        Append(spill, got - room);
    }
    return n;
}

} // namespace network
} // namespace backend
