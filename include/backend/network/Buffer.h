#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include <sys/types.h>

namespace backend {
namespace network {

// Byte queue used for socket input and output. Bytes are appended at the
// write position and consumed from the read position; consumed space is
// reclaimed lazily when more room is needed.
class Buffer {
public:
    static const size_t kInitialSize = 1024;

    explicit Buffer(size_t initialSize = kInitialSize);

    size_t ReadableBytes() const { return writePos_ - readPos_; }
    const char* Peek() const { return storage_.data() + readPos_; }

    // Position of the first '\n' in the readable bytes, or nullptr.
    const char* FindEOL() const;

    void Retrieve(size_t len);
    void RetrieveUntil(const char* end) { Retrieve(static_cast<size_t>(end - Peek())); }
    void RetrieveAll() { readPos_ = writePos_ = 0; }
    std::string RetrieveAsString(size_t len);
    std::string RetrieveAllAsString() { return RetrieveAsString(ReadableBytes()); }

    void Append(const char* data, size_t len);
    void Append(const std::string& str) { Append(str.data(), str.size()); }
    void Append(const char* str);

    // One readv(2) into the free space plus a stack overflow area.
    // Returns what read(2) would; errno is stored in *savedErrno on failure.
    ssize_t ReadFd(int fd, int* savedErrno);

private:
    void Reserve(size_t len);

    std::vector<char> storage_;
    size_t readPos_;
    size_t writePos_;
};

} // namespace network
} // namespace backend
