#pragma once

#include <chrono>
#include <cstddef>
#include <string>

namespace hpipe {
namespace client {

enum class SourceStatus { DATA, TIMEOUT, END_OF_FILE, FAILED };

struct SourceRead {
    SourceStatus status = SourceStatus::TIMEOUT;
    size_t bytes = 0;
    std::string error;  // Set when status == FAILED
};

/**
 * @brief Local input of a sending client (stdin in production)
 *
 * read() waits at most `timeout` for input so that the sender can end a
 * segment on an idle source.
 */
class ByteSource {
public:
    virtual ~ByteSource() = default;
    virtual SourceRead read(char *buffer, size_t capacity, std::chrono::milliseconds timeout) = 0;
};

// Local output of a receiving client (stdout in production)
class ByteSink {
public:
    virtual ~ByteSink() = default;
    virtual bool write(const char *data, size_t len, std::string &error) = 0;
    virtual bool flush(std::string &error) = 0;
};

// Non-owning wrapper around a readable file descriptor
class FdByteSource : public ByteSource {
public:
    explicit FdByteSource(int fd) : fd_(fd) {}
    SourceRead read(char *buffer, size_t capacity, std::chrono::milliseconds timeout) override;

private:
    int fd_;
};

// Non-owning wrapper around a writable file descriptor
class FdByteSink : public ByteSink {
public:
    explicit FdByteSink(int fd) : fd_(fd) {}
    bool write(const char *data, size_t len, std::string &error) override;
    bool flush(std::string &error) override;

private:
    int fd_;
};

}  // namespace client
}  // namespace hpipe
