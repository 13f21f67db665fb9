#pragma once

#include <cstddef>
#include <stdexcept>
#include <vector>

namespace quantpulse {

// Fixed-capacity sequence that overwrites its oldest element when full.
// Storage is allocated once; push never reallocates.
// Not thread-safe: the owner serializes access.
template<typename T>
class RingBuffer {
public:
    explicit RingBuffer(size_t capacity)
        : buffer_(capacity)
        , head_(0)
        , size_(0) {
        if (capacity == 0) {
            throw std::invalid_argument("RingBuffer capacity must be positive");
        }
    }

    void push(const T& value) {
        buffer_[head_] = value;
        head_ = (head_ + 1) % buffer_.size();
        if (size_ < buffer_.size()) {
            ++size_;
        }
    }

    // i = 0 is the oldest retained element
    const T& at(size_t i) const {
        if (i >= size_) {
            throw std::out_of_range("RingBuffer index out of range");
        }
        return buffer_[(head_ + buffer_.size() - size_ + i) % buffer_.size()];
    }

    const T& back() const { return at(size_ - 1); }

    // Copy of the newest `limit` elements, oldest first
    std::vector<T> tail(size_t limit) const {
        const size_t n = (limit < size_) ? limit : size_;
        std::vector<T> out;
        out.reserve(n);
        for (size_t i = size_ - n; i < size_; ++i) {
            out.push_back(at(i));
        }
        return out;
    }

    std::vector<T> toVector() const { return tail(size_); }

    size_t size() const { return size_; }
    size_t capacity() const { return buffer_.size(); }
    bool empty() const { return size_ == 0; }
    bool full() const { return size_ == buffer_.size(); }

    void clear() {
        head_ = 0;
        size_ = 0;
    }

private:
    std::vector<T> buffer_;
    size_t head_;
    size_t size_;
};

} // namespace quantpulse
