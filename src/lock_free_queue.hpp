// lock_free_queue.hpp
#pragma once

#include <atomic>
#include <cstddef>
#include <utility>
#include <vector>

namespace umpire {

// Bounded single-producer / single-consumer ring. The frame thread pushes
// ended deliveries, the finaliser thread pops them. Neither side blocks.
template<typename T>
class LockFreeQueue {
private:
    std::vector<T> buffer_;
    std::atomic<size_t> head_{0};
    std::atomic<size_t> tail_{0};
    const size_t capacity_;

public:
    explicit LockFreeQueue(size_t capacity)
        : buffer_(capacity + 1), capacity_(capacity + 1) {}

    // Returns false when full, leaving the item untouched.
    bool push(const T& item) {
        T copy(item);
        return push(std::move(copy));
    }

    bool push(T&& item) {
        size_t current_tail = tail_.load(std::memory_order_relaxed);
        size_t next_tail = (current_tail + 1) % capacity_;

        if (next_tail == head_.load(std::memory_order_acquire)) {
            return false;
        }

        buffer_[current_tail] = std::move(item);
        tail_.store(next_tail, std::memory_order_release);
        return true;
    }

    bool pop(T& item) {
        size_t current_head = head_.load(std::memory_order_relaxed);

        if (current_head == tail_.load(std::memory_order_acquire)) {
            return false;
        }

        item = std::move(buffer_[current_head]);
        buffer_[current_head] = T();
        head_.store((current_head + 1) % capacity_, std::memory_order_release);
        return true;
    }

    bool empty() const {
        return head_.load(std::memory_order_acquire) ==
               tail_.load(std::memory_order_acquire);
    }

    size_t size() const {
        size_t h = head_.load(std::memory_order_acquire);
        size_t t = tail_.load(std::memory_order_acquire);
        return (t >= h) ? (t - h) : (capacity_ - h + t);
    }

    size_t capacity() const { return capacity_ - 1; }
};

}  // namespace umpire
