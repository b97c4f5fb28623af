#include "window_buffer.hpp"

#include <algorithm>
#include <cstring>
#include <stdexcept>

namespace hpipe {
namespace relay {

WindowBuffer::WindowBuffer(size_t capacity_bytes) : storage_(capacity_bytes) {
    if (capacity_bytes == 0) {
        throw std::invalid_argument("WindowBuffer capacity must be greater than zero");
    }
}

WindowBuffer::AppendResult WindowBuffer::append(const char *data, size_t len) {
    AppendResult result;
    result.begin = end_;
    result.end = end_;

    if (len == 0) {
        return result;
    }

    size_t n = std::min(len, free_space());
    if (n == 0) {
        result.error = RelayError::BUFFER_FULL;
        return result;
    }

    // Copy in at most two pieces (tail of ring, then wrap to front)
    const size_t cap = capacity();
    size_t pos = static_cast<size_t>(end_ % cap);
    size_t first = std::min(n, cap - pos);
    std::memcpy(storage_.data() + pos, data, first);
    if (n > first) {
        std::memcpy(storage_.data(), data + first, n - first);
    }

    end_ += n;
    result.end = end_;
    return result;
}

RelayError WindowBuffer::read(uint64_t from, uint64_t to, std::string &out) const {
    out.clear();

    if (from > to || to > end_) {
        return RelayError::RESUME_OFFSET_MISMATCH;
    }
    if (from < start_) {
        return RelayError::OFFSET_TOO_OLD;
    }

    size_t n = static_cast<size_t>(to - from);
    if (n == 0) {
        return RelayError::NONE;
    }

    out.resize(n);
    const size_t cap = capacity();
    size_t pos = static_cast<size_t>(from % cap);
    size_t first = std::min(n, cap - pos);
    std::memcpy(&out[0], storage_.data() + pos, first);
    if (n > first) {
        std::memcpy(&out[first], storage_.data(), n - first);
    }
    return RelayError::NONE;
}

size_t WindowBuffer::evict_until(uint64_t offset) {
    uint64_t target = std::min(offset, end_);
    if (target <= start_) {
        return 0;
    }
    size_t evicted = static_cast<size_t>(target - start_);
    start_ = target;
    return evicted;
}

size_t WindowBuffer::make_room(size_t needed, uint64_t pin) {
    if (free_space() >= needed) {
        return free_space();
    }

    // Only the shortfall is evicted; delivered bytes stay replayable as long as possible
    uint64_t shortfall = needed - free_space();
    uint64_t target = std::min(start_ + shortfall, pin);
    evict_until(target);
    return free_space();
}

}  // namespace relay
}  // namespace hpipe
