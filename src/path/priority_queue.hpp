#pragma once

#include "core/types.hpp"

#include <algorithm>
#include <functional>
#include <utility>
#include <vector>

namespace eldor::path {

/// Binary min-heap over item handles. `Compare(a, b)` returns true when `a`
/// should come out before `b`. Priorities usually live outside the queue
/// (in a search node table), so after changing one the caller must call
/// update_priority() for the affected item.
template <typename T, typename Compare = std::less<T>>
class PriorityQueue {
public:
    PriorityQueue() = default;
    explicit PriorityQueue(Compare cmp) : cmp_(std::move(cmp)) {}

    /// Does nothing if `item` is already queued.
    void enqueue(const T& item) {
        if (contains(item)) return;
        heap_.push_back(item);
        sift_up(heap_.size() - 1);
    }

    /// Removes and returns the minimum. Must not be called when empty.
    T dequeue() {
        T top = std::move(heap_.front());
        remove_at(0);
        return top;
    }

    const T& peek() const { return heap_.front(); }

    /// Re-positions `item` after its priority changed. Linear search for
    /// the item, then heap repair; an unqueued item is simply enqueued.
    void update_priority(const T& item) {
        auto it = std::find(heap_.begin(), heap_.end(), item);
        if (it != heap_.end())
            remove_at(static_cast<size_t>(it - heap_.begin()));
        enqueue(item);
    }

    bool contains(const T& item) const {
        return std::find(heap_.begin(), heap_.end(), item) != heap_.end();
    }

    void clear() { heap_.clear(); }
    size_t size() const { return heap_.size(); }
    bool empty() const { return heap_.empty(); }

private:
    void remove_at(size_t i) {
        size_t last = heap_.size() - 1;
        if (i != last) {
            std::swap(heap_[i], heap_[last]);
            heap_.pop_back();
            // The moved element may belong above or below its new slot.
            sift_down(i);
            sift_up(i);
        } else {
            heap_.pop_back();
        }
    }

    void sift_up(size_t i) {
        while (i > 0) {
            size_t parent = (i - 1) / 2;
            if (!cmp_(heap_[i], heap_[parent])) break;
            std::swap(heap_[i], heap_[parent]);
            i = parent;
        }
    }

    void sift_down(size_t i) {
        const size_t n = heap_.size();
        for (;;) {
            size_t best = i;
            size_t l = 2 * i + 1;
            size_t r = l + 1;
            if (l < n && cmp_(heap_[l], heap_[best])) best = l;
            if (r < n && cmp_(heap_[r], heap_[best])) best = r;
            if (best == i) return;
            std::swap(heap_[i], heap_[best]);
            i = best;
        }
    }

    std::vector<T> heap_;
    Compare cmp_;
};

} // namespace eldor::path
