#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace exomon {
namespace monitor {

/**
 * Fixed-capacity rolling window
 *
 * Pre-allocated ring buffer. push() overwrites the oldest slot once the
 * window is full; index 0 is always the oldest retained element.
 * Single writer, not thread-safe.
 */
template <typename T, size_t Capacity>
class RollingWindow {
public:
    static_assert(Capacity > 0, "Capacity must be non-zero");

    RollingWindow() : head_(0), size_(0), evicted_(0) {}

    void push(const T& value) {
        slots_[head_] = value;
        head_ = (head_ + 1) % Capacity;
        if (size_ < Capacity) {
            ++size_;
        } else {
            ++evicted_; // Oldest overwritten
        }
    }

    // 0 = oldest
    const T& operator[](size_t i) const { return slots_[(head_ + Capacity - size_ + i) % Capacity]; }

    const T& oldest() const { return (*this)[0]; }
    const T& newest() const { return (*this)[size_ - 1]; }

    // Oldest to newest
    template <typename Fn>
    void for_each(Fn&& fn) const {
        for (size_t i = 0; i < size_; ++i) {
            fn((*this)[i]);
        }
    }

    void clear() {
        head_ = 0;
        size_ = 0;
    }

    size_t size() const { return size_; }
    bool empty() const { return size_ == 0; }
    bool full() const { return size_ == Capacity; }
    static constexpr size_t capacity() { return Capacity; }

    // Total elements evicted since construction
    uint64_t evicted() const { return evicted_; }

private:
    std::array<T, Capacity> slots_{};
    size_t head_;     // Next slot to write
    size_t size_;
    uint64_t evicted_;
};

} // namespace monitor
} // namespace exomon
