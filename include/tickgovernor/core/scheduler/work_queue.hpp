#pragma once

#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

namespace TickGovernor {

/**
 * @class WorkQueue
 * @brief FIFO over an append-only vector plus a head index.
 *
 * pop() advances head_ instead of erasing the front, giving amortized O(1)
 * pop-front. Consumed slots are reclaimed by compaction once head_ reaches
 * COMPACT_MIN_HEAD and at least half of the backing array.
 */
template <typename T>
class WorkQueue {
public:
    static constexpr size_t COMPACT_MIN_HEAD = 32;

    void push(T item) {
        items_.push_back(std::move(item));
    }

    std::optional<T> pop() {
        if (head_ >= items_.size()) {
            return std::nullopt;
        }
        T item = std::move(items_[head_]);
        ++head_;
        if (head_ == items_.size()) {
            // Drained: reset without moving anything
            items_.clear();
            head_ = 0;
        } else {
            maybeCompact();
        }
        return item;
    }

    /**
     * @brief Scan live entries (head forward) for a match
     */
    template <typename Pred>
    bool containsIf(Pred pred) const {
        for (size_t i = head_; i < items_.size(); ++i) {
            if (pred(items_[i])) return true;
        }
        return false;
    }

    /**
     * @brief Move every live entry out, oldest first, leaving the queue empty
     */
    std::vector<T> takeAll() {
        std::vector<T> out;
        out.reserve(size());
        for (size_t i = head_; i < items_.size(); ++i) {
            out.push_back(std::move(items_[i]));
        }
        clear();
        return out;
    }

    size_t size() const { return items_.size() - head_; }
    bool empty() const { return head_ >= items_.size(); }

    // Backing storage length including consumed slots (for tests/diagnostics)
    size_t capacityUsed() const { return items_.size(); }
    size_t headIndex() const { return head_; }

    void clear() {
        items_.clear();
        head_ = 0;
    }

private:
    void maybeCompact() {
        if (head_ >= COMPACT_MIN_HEAD && head_ * 2 >= items_.size()) {
            items_.erase(items_.begin(), items_.begin() + static_cast<std::ptrdiff_t>(head_));
            head_ = 0;
        }
    }

    std::vector<T> items_;
    size_t head_ = 0;
};

} // namespace TickGovernor
