#pragma once

#include <cstddef>
#include <iterator>
#include <stdexcept>
#include <utility>
#include <vector>

namespace cellpaint {

// Fixed-capacity FIFO backed by a ring buffer. Iteration runs front (oldest)
// to back (newest). append() on a full queue and popFront() on an empty one
// throw; callers check isFull()/isEmpty() first.
template <typename T>
class BoundedQueue {
public:
    class const_iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = T;
        using difference_type = std::ptrdiff_t;
        using pointer = const T*;
        using reference = const T&;

        const_iterator(const BoundedQueue* queue, std::size_t offset) noexcept
            : queue_(queue), offset_(offset) {}

        reference operator*() const { return queue_->at(offset_); }
        pointer operator->() const { return &queue_->at(offset_); }

        const_iterator& operator++() noexcept {
            ++offset_;
            return *this;
        }
        const_iterator operator++(int) noexcept {
            const_iterator prev = *this;
            ++offset_;
            return prev;
        }

        bool operator==(const const_iterator& other) const noexcept {
            return queue_ == other.queue_ && offset_ == other.offset_;
        }
        bool operator!=(const const_iterator& other) const noexcept { return !(*this == other); }

    private:
        const BoundedQueue* queue_;
        std::size_t offset_;
    };

    explicit BoundedQueue(std::size_t capacity) : slots_(capacity) {
        if (capacity == 0) {
            throw std::invalid_argument("BoundedQueue capacity must be positive");
        }
    }

    std::size_t capacity() const noexcept { return slots_.size(); }
    std::size_t size() const noexcept { return count_; }
    bool isEmpty() const noexcept { return count_ == 0; }
    bool isFull() const noexcept { return count_ == slots_.size(); }

    void append(T item) {
        if (isFull()) {
            throw std::length_error("BoundedQueue is full");
        }
        slots_[slotIndex(count_)] = std::move(item);
        ++count_;
    }

    T popFront() {
        if (isEmpty()) {
            throw std::out_of_range("BoundedQueue is empty");
        }
        T item = std::move(slots_[front_]);
        slots_[front_] = T{};
        front_ = (front_ + 1) % slots_.size();
        --count_;
        return item;
    }

    const T& front() const {
        if (isEmpty()) {
            throw std::out_of_range("BoundedQueue is empty");
        }
        return slots_[front_];
    }

    // Element `offset` positions behind the front.
    const T& at(std::size_t offset) const {
        if (offset >= count_) {
            throw std::out_of_range("BoundedQueue index out of range");
        }
        return slots_[slotIndex(offset)];
    }

    // Reverses the logical order in place; the newest element becomes the front.
    void reverse() noexcept {
        if (count_ < 2) return;
        std::size_t lo = 0;
        std::size_t hi = count_ - 1;
        while (lo < hi) {
            std::swap(slots_[slotIndex(lo)], slots_[slotIndex(hi)]);
            ++lo;
            --hi;
        }
    }

    void clear() {
        for (auto& slot : slots_) slot = T{};
        front_ = 0;
        count_ = 0;
    }

    const_iterator begin() const noexcept { return const_iterator(this, 0); }
    const_iterator end() const noexcept { return const_iterator(this, count_); }

private:
    std::size_t slotIndex(std::size_t offset) const noexcept {
        return (front_ + offset) % slots_.size();
    }

    std::vector<T> slots_;
    std::size_t front_ = 0;
    std::size_t count_ = 0;
};

} // namespace cellpaint
