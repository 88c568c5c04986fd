#ifndef JSTREAM_MEM_ELEMENT_BUFFER_POOL_H
#define JSTREAM_MEM_ELEMENT_BUFFER_POOL_H

#include <array>
#include <bit>
#include <cstddef>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

#include "../Assert.h"
#include "../Log.h"

namespace jstream::mem {

template <typename T>
class ElementBufferPool;

// Slot array borrowed from an ElementBufferPool. Elements live in the first
// size() slots; the rest is raw storage. The block goes back to its pool when
// the buffer is released or destroyed, after every element is destroyed.
template <typename T>
class PooledBuffer {
public:
    PooledBuffer() = default;
    PooledBuffer(const PooledBuffer &) = delete;
    PooledBuffer &operator=(const PooledBuffer &) = delete;

    PooledBuffer(PooledBuffer &&other) noexcept
        : pool_(std::exchange(other.pool_, nullptr)),
          slots_(std::exchange(other.slots_, nullptr)),
          size_(std::exchange(other.size_, 0)),
          capacity_(std::exchange(other.capacity_, 0)) {
    }

    PooledBuffer &operator=(PooledBuffer &&other) noexcept {
        if (this == &other) {
            return *this;
        }
        release();
        pool_ = std::exchange(other.pool_, nullptr);
        slots_ = std::exchange(other.slots_, nullptr);
        size_ = std::exchange(other.size_, 0);
        capacity_ = std::exchange(other.capacity_, 0);
        return *this;
    }

    ~PooledBuffer() {
        release();
    }

    [[nodiscard]] bool valid() const noexcept {
        return pool_ != nullptr;
    }

    [[nodiscard]] std::size_t size() const noexcept {
        return size_;
    }

    [[nodiscard]] std::size_t capacity() const noexcept {
        return capacity_;
    }

    [[nodiscard]] bool empty() const noexcept {
        return size_ == 0;
    }

    T &operator[](std::size_t index) noexcept {
        return slots_[index];
    }

    const T &operator[](std::size_t index) const noexcept {
        return slots_[index];
    }

    T *begin() noexcept {
        return slots_;
    }

    T *end() noexcept {
        return slots_ + size_;
    }

    void push_back(T value) {
        JSTREAM_ASSERT(pool_ != nullptr);
        if (size_ == capacity_) {
            pool_->grow(*this);
        }
        std::construct_at(slots_ + size_, std::move(value));
        ++size_;
    }

    void clear() noexcept {
        std::destroy_n(slots_, size_);
        size_ = 0;
    }

    void release() noexcept {
        if (!pool_) {
            return;
        }
        clear();
        pool_->return_block(slots_, capacity_);
        pool_ = nullptr;
        slots_ = nullptr;
        capacity_ = 0;
    }

private:
    friend class ElementBufferPool<T>;

    PooledBuffer(ElementBufferPool<T> *pool, T *slots, std::size_t capacity) noexcept
        : pool_(pool), slots_(slots), capacity_(capacity) {
    }

    ElementBufferPool<T> *pool_ = nullptr;
    T *slots_ = nullptr;
    std::size_t size_ = 0;
    std::size_t capacity_ = 0;
};

// Reuse cache for element slot arrays, bucketed by power-of-two capacity.
// Safe for concurrent acquire/release from independent streams; a borrowed
// buffer itself is owned by exactly one stream.
template <typename T>
class ElementBufferPool {
public:
    static constexpr std::size_t kClassCount = 21;
    static constexpr std::size_t kMaxCachedPerClass = 8;

    ElementBufferPool() {
        for (auto &list : free_lists_) {
            list.reserve(kMaxCachedPerClass);
        }
    }

    ~ElementBufferPool() {
        JSTREAM_ASSERT_MSG(outstanding_ == 0, "element buffer pool destroyed with borrowed buffers");
        std::allocator<T> alloc;
        for (std::size_t i = 0; i < kClassCount; ++i) {
            for (T *slots : free_lists_[i]) {
                alloc.deallocate(slots, std::size_t{1} << i);
            }
        }
    }

    ElementBufferPool(const ElementBufferPool &) = delete;
    ElementBufferPool &operator=(const ElementBufferPool &) = delete;
    ElementBufferPool(ElementBufferPool &&) = delete;
    ElementBufferPool &operator=(ElementBufferPool &&) = delete;

    [[nodiscard]] PooledBuffer<T> acquire(std::size_t min_capacity) {
        std::size_t capacity = std::bit_ceil(min_capacity == 0 ? std::size_t{1} : min_capacity);
        T *slots = take_block(capacity);
        return PooledBuffer<T>(this, slots, capacity);
    }

    // Doubles the capacity of `buffer`, moving its elements into the new block
    // and handing the old block back to the pool.
    void grow(PooledBuffer<T> &buffer) {
        JSTREAM_ASSERT(buffer.pool_ == this);
        std::size_t new_capacity = buffer.capacity_ == 0 ? 1 : buffer.capacity_ * 2;
        T *slots = take_block(new_capacity);
        for (std::size_t i = 0; i < buffer.size_; ++i) {
            std::construct_at(slots + i, std::move(buffer.slots_[i]));
            std::destroy_at(buffer.slots_ + i);
        }
        return_block(buffer.slots_, buffer.capacity_);
        buffer.slots_ = slots;
        buffer.capacity_ = new_capacity;
        log::debug("element buffer grown to {} slots", new_capacity);
    }

    [[nodiscard]] std::size_t outstanding() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return outstanding_;
    }

    [[nodiscard]] std::size_t cached() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::size_t total = 0;
        for (const auto &list : free_lists_) {
            total += list.size();
        }
        return total;
    }

    [[nodiscard]] std::size_t allocations() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return allocations_;
    }

    static ElementBufferPool &shared() {
        static ElementBufferPool pool;
        return pool;
    }

private:
    friend class PooledBuffer<T>;

    static std::size_t class_index(std::size_t capacity) noexcept {
        return static_cast<std::size_t>(std::countr_zero(capacity));
    }

    T *take_block(std::size_t capacity) {
        std::size_t index = class_index(capacity);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++outstanding_;
            if (index < kClassCount && !free_lists_[index].empty()) {
                T *slots = free_lists_[index].back();
                free_lists_[index].pop_back();
                return slots;
            }
            ++allocations_;
        }
        try {
            return std::allocator<T>{}.allocate(capacity);
        } catch (...) {
            std::lock_guard<std::mutex> lock(mutex_);
            --outstanding_;
            throw;
        }
    }

    void return_block(T *slots, std::size_t capacity) noexcept {
        if (!slots) {
            return;
        }
        std::size_t index = class_index(capacity);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            JSTREAM_ASSERT(outstanding_ > 0);
            --outstanding_;
            if (index < kClassCount && free_lists_[index].size() < kMaxCachedPerClass) {
                free_lists_[index].push_back(slots);
                return;
            }
        }
        std::allocator<T>{}.deallocate(slots, capacity);
    }

    mutable std::mutex mutex_;
    std::array<std::vector<T *>, kClassCount> free_lists_{};
    std::size_t outstanding_ = 0;
    std::size_t allocations_ = 0;
};

} // namespace jstream::mem

#endif // JSTREAM_MEM_ELEMENT_BUFFER_POOL_H
