#pragma once
#include <cstddef>
#include <stdexcept>
#include <vector>

// Fixed-capacity ring buffer; pushing onto a full window evicts the oldest value.
template<typename T>
class RollingWindow {
private:
    std::vector<T> buffer_;
    std::size_t head_ = 0;      // next write slot
    std::size_t size_ = 0;

public:
    explicit RollingWindow(std::size_t capacity) : buffer_(capacity) {
        if (capacity == 0) throw std::invalid_argument("RollingWindow capacity must be positive");
    }

    void push(const T& item) {
        buffer_[head_] = item;
        head_ = (head_ + 1) % buffer_.size();
        if (size_ < buffer_.size()) ++size_;
    }

    // 0 is the oldest retained value
    const T& operator[](std::size_t i) const {
        return buffer_[(head_ + buffer_.size() - size_ + i) % buffer_.size()];
    }

    const T& newest() const { return (*this)[size_ - 1]; }
    const T& oldest() const { return (*this)[0]; }

    T sum() const {
        T s{};
        for (std::size_t i = 0; i < size_; ++i) s += (*this)[i];
        return s;
    }

    double mean() const { return size_ ? static_cast<double>(sum()) / size_ : 0.0; }

    bool empty() const { return size_ == 0; }
    bool full() const { return size_ == buffer_.size(); }
    std::size_t size() const { return size_; }
    std::size_t capacity() const { return buffer_.size(); }

    void clear() { head_ = 0; size_ = 0; }
};
