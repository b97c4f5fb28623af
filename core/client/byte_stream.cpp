#include "byte_stream.hpp"

#include <poll.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace hpipe {
namespace client {

SourceRead FdByteSource::read(char *buffer, size_t capacity, std::chrono::milliseconds timeout) {
    SourceRead result;

    struct pollfd pfd;
    pfd.fd = fd_;
    pfd.events = POLLIN;
    pfd.revents = 0;

    int ready = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    if (ready < 0) {
        if (errno == EINTR) {
            return result;  // TIMEOUT: caller re-checks for shutdown
        }
        result.status = SourceStatus::FAILED;
        result.error = std::string("poll() failed: ") + std::strerror(errno);
        return result;
    }
    if (ready == 0) {
        return result;
    }

    // POLLHUP without POLLIN still needs a read() to observe end of file
    ssize_t n = ::read(fd_, buffer, capacity);
    if (n < 0) {
        if (errno == EINTR || errno == EAGAIN) {
            return result;
        }
        result.status = SourceStatus::FAILED;
        result.error = std::string("read() failed: ") + std::strerror(errno);
        return result;
    }
    if (n == 0) {
        result.status = SourceStatus::END_OF_FILE;
        return result;
    }

    result.status = SourceStatus::DATA;
    result.bytes = static_cast<size_t>(n);
    return result;
}

bool FdByteSink::write(const char *data, size_t len, std::string &error) {
    size_t written = 0;
    while (written < len) {
        ssize_t n = ::write(fd_, data + written, len - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            error = std::string("write() failed: ") + std::strerror(errno);
            return false;
        }
        written += static_cast<size_t>(n);
    }
    return true;
}

bool FdByteSink::flush(std::string &) {
    // Regular files and pipes need nothing; fsync() is meaningless on a pipe
    return true;
}

}  // namespace client
}  // namespace hpipe
