#pragma once

#include <cstddef>
#include <stdexcept>
#include <vector>

namespace quantscan {
namespace signal {

// Fixed-capacity ring buffer; pushing into a full buffer evicts the oldest
// element. Index 0 is the oldest element still held.
template<typename T>
class RingBuffer {
public:
    explicit RingBuffer(size_t capacity)
        : storage_(capacity), head_(0), size_(0) {
        if (capacity == 0) {
            throw std::invalid_argument("RingBuffer capacity must be positive");
        }
    }

    void push(const T& value) {
        storage_[(head_ + size_) % storage_.size()] = value;
        if (size_ < storage_.size()) {
            ++size_;
        } else {
            head_ = (head_ + 1) % storage_.size();
        }
    }

    size_t size() const { return size_; }
    size_t capacity() const { return storage_.size(); }
    bool empty() const { return size_ == 0; }
    bool full() const { return size_ == storage_.size(); }

    const T& operator[](size_t i) const {
        return storage_[(head_ + i) % storage_.size()];
    }

    const T& back() const {
        if (size_ == 0) {
            throw std::out_of_range("RingBuffer is empty");
        }
        return (*this)[size_ - 1];
    }

    // Newest `count` elements, oldest first.
    std::vector<T> tail(size_t count) const {
        if (count > size_) count = size_;
        std::vector<T> out;
        out.reserve(count);
        for (size_t i = size_ - count; i < size_; ++i) {
            out.push_back((*this)[i]);
        }
        return out;
    }

    std::vector<T> toVector() const { return tail(size_); }

    void clear() {
        head_ = 0;
        size_ = 0;
    }

private:
    std::vector<T> storage_;
    size_t head_;
    size_t size_;
};

} // namespace signal
} // namespace quantscan
