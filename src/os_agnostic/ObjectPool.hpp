/**
 * @file ObjectPool.hpp
 * @brief Fixed-capacity arena of reusable visual objects.
 */

#pragma once

#include <cstddef>
#include <vector>

/**
 * @brief Fixed set of T objects handed out and returned explicitly.
 *
 * Storage is allocated once, so pointers stay valid for the pool's lifetime.
 * T must provide clear(), which release() calls before the object goes back
 * to the available list. An object is never handed to two users at once.
 */
template <typename T>
class ObjectPool {
public:
    explicit ObjectPool(std::size_t capacity)
        : items_(capacity), busy_(capacity, false) {
        free_.reserve(capacity);
        for (std::size_t i = capacity; i > 0; --i) free_.push_back(i - 1);
    }

    ObjectPool(const ObjectPool&) = delete;
    ObjectPool& operator=(const ObjectPool&) = delete;

    // nullptr when every object is in use.
    T* acquire() {
        if (free_.empty()) return nullptr;
        const std::size_t i = free_.back();
        free_.pop_back();
        busy_[i] = true;
        return &items_[i];
    }

    // false for a pointer this pool does not own, or one already released.
    bool release(T* item) {
        if (!item || items_.empty()) return false;
        if (item < items_.data() || item >= items_.data() + items_.size()) return false;

        const std::size_t i = static_cast<std::size_t>(item - items_.data());
        if (!busy_[i]) return false;

        item->clear();
        busy_[i] = false;
        free_.push_back(i);
        return true;
    }

    std::size_t capacity() const { return items_.size(); }
    std::size_t available() const { return free_.size(); }
    std::size_t inUse() const { return items_.size() - free_.size(); }

private:
    std::vector<T> items_;
    std::vector<bool> busy_;
    std::vector<std::size_t> free_;
};
