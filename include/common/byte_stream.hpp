#pragma once

#include <chrono>
#include <cstddef>
#include <string>

// A readable byte source. Export data reaches the storage backends through this.
class ByteStream {
public:
    virtual ~ByteStream() = default;

    // Returns the number of bytes read, 0 at end of stream. Throws std::runtime_error on failure.
    virtual size_t read(char* buffer, size_t size) = 0;

    // Reads until end of stream. Keeps at most keepLimit bytes in kept (if given) and
    // returns the total number of bytes seen.
    static size_t drain(ByteStream& stream, std::string* kept = nullptr, size_t keepLimit = 64 * 1024);
};

// Reads from a file descriptor, typically one end of a pipe.
class FdByteStream : public ByteStream {
public:
    explicit FdByteStream(int fd, bool ownsFd = true);
    ~FdByteStream() override;

    FdByteStream(const FdByteStream&) = delete;
    FdByteStream& operator=(const FdByteStream&) = delete;

    size_t read(char* buffer, size_t size) override;
    void close();
    int fd() const { return fd_; }

private:
    int fd_;
    bool ownsFd_;
};

// In-memory source, optionally handing out data in chunks with a pause before each one.
class MemoryByteStream : public ByteStream {
public:
    explicit MemoryByteStream(std::string data,
                              size_t chunkSize = 0,
                              std::chrono::milliseconds delay = std::chrono::milliseconds(0));

    size_t read(char* buffer, size_t size) override;

private:
    std::string data_;
    size_t position_{0};
    size_t chunkSize_;
    std::chrono::milliseconds delay_;
};
