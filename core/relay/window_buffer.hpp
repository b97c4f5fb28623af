#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "relay_error.hpp"

namespace hpipe {
namespace relay {

/**
 * @brief Bounded window of the most recently relayed bytes
 *
 * Ring buffer addressed by absolute stream offset. The window always covers
 * [start_offset(), end_offset()) with end_offset() - start_offset() <= capacity().
 * end_offset() is the session's total offset: it only grows, and survives
 * eviction of older bytes.
 *
 * Byte at absolute offset o lives at ring index o % capacity, so any number of
 * readers can hold independent positions without pointers into the storage.
 *
 * Not thread-safe. Owned by a Session and only touched under the session lock.
 */
class WindowBuffer {
public:
    struct AppendResult {
        RelayError error = RelayError::NONE;
        uint64_t begin = 0;  // Offset of first appended byte
        uint64_t end = 0;    // One past the last appended byte
        size_t appended() const { return static_cast<size_t>(end - begin); }
    };

    explicit WindowBuffer(size_t capacity_bytes);

    // Non-copyable (large storage, owned by exactly one session)
    WindowBuffer(const WindowBuffer &) = delete;
    WindowBuffer &operator=(const WindowBuffer &) = delete;

    /**
     * @brief Append as many bytes as currently fit
     *
     * Never evicts. Returns BUFFER_FULL (with an empty range) when len > 0 and
     * no byte fits; a partial append is reported through the returned range.
     */
    AppendResult append(const char *data, size_t len);

    /**
     * @brief Copy [from, to) into out (replacing its contents)
     *
     * @return OFFSET_TOO_OLD if from < start_offset(),
     *         RESUME_OFFSET_MISMATCH if to > end_offset() or from > to
     */
    RelayError read(uint64_t from, uint64_t to, std::string &out) const;

    /**
     * @brief Drop retained bytes below offset (clamped to end_offset())
     * @return Number of bytes evicted
     */
    size_t evict_until(uint64_t offset);

    /**
     * @brief Evict oldest bytes, never at or above pin, until needed bytes are free
     * @return Free space after eviction (may still be less than needed)
     */
    size_t make_room(size_t needed, uint64_t pin);

    size_t capacity() const { return storage_.size(); }
    size_t size() const { return static_cast<size_t>(end_ - start_); }
    size_t free_space() const { return capacity() - size(); }
    bool empty() const { return start_ == end_; }
    uint64_t start_offset() const { return start_; }
    uint64_t end_offset() const { return end_; }
    bool contains(uint64_t offset) const { return offset >= start_ && offset <= end_; }

private:
    std::vector<char> storage_;
    uint64_t start_ = 0;
    uint64_t end_ = 0;
};

}  // namespace relay
}  // namespace hpipe
