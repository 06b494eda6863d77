#include "common/byte_stream.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <thread>
#include <vector>
#include <unistd.h>

size_t ByteStream::drain(ByteStream& stream, std::string* kept, size_t keepLimit) {
    std::vector<char> buffer(64 * 1024);
    size_t total = 0;
    while (true) {
        size_t n = stream.read(buffer.data(), buffer.size());
        if (n == 0) {
            break;
        }
        total += n;
        if (kept && kept->size() < keepLimit) {
            size_t room = keepLimit - kept->size();
            kept->append(buffer.data(), std::min(n, room));
        }
    }
    return total;
}

FdByteStream::FdByteStream(int fd, bool ownsFd)
    : fd_(fd)
    , ownsFd_(ownsFd) {
}

FdByteStream::~FdByteStream() {
    close();
}

size_t FdByteStream::read(char* buffer, size_t size) {
    if (fd_ < 0) {
        return 0;
    }
    while (true) {
        ssize_t n = ::read(fd_, buffer, size);
        if (n >= 0) {
            return static_cast<size_t>(n);
        }
        if (errno == EINTR) {
            continue;
        }
        throw std::runtime_error(std::string("Failed to read from stream: ") + strerror(errno));
    }
}

void FdByteStream::close() {
    if (fd_ >= 0 && ownsFd_) {
        ::close(fd_);
    }
    fd_ = -1;
}

MemoryByteStream::MemoryByteStream(std::string data, size_t chunkSize, std::chrono::milliseconds delay)
    : data_(std::move(data))
    , chunkSize_(chunkSize)
    , delay_(delay) {
}

size_t MemoryByteStream::read(char* buffer, size_t size) {
    if (position_ >= data_.size()) {
        return 0;
    }
    if (delay_.count() > 0) {
        std::this_thread::sleep_for(delay_);
    }
    size_t n = std::min(size, data_.size() - position_);
    if (chunkSize_ > 0) {
        n = std::min(n, chunkSize_);
    }
    std::memcpy(buffer, data_.data() + position_, n);
    position_ += n;
    return n;
}
