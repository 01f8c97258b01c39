#pragma once

#include <cstddef>
#include <vector>

namespace TickGovernor {

/**
 * @class CycleRingBuffer
 * @brief Fixed-capacity circular store of cycle durations (ms).
 *
 * Keeps a running sum in step with every insertion and eviction so the
 * mean is O(1). Once full, each push overwrites the oldest sample.
 */
class CycleRingBuffer {
public:
    static constexpr size_t DEFAULT_CAPACITY = 100;

    explicit CycleRingBuffer(size_t capacity = DEFAULT_CAPACITY);

    /**
     * @brief Append a sample, evicting the oldest when full
     * @return true if a sample was evicted
     */
    bool push(double sample_ms);

    double mean() const {
        return count_ > 0 ? sum_ / static_cast<double>(count_) : 0.0;
    }

    double sum() const { return sum_; }
    size_t size() const { return count_; }
    size_t capacity() const { return buffer_.size(); }
    bool full() const { return count_ == buffer_.size(); }

    // Copy of the live samples, oldest first
    std::vector<double> snapshot() const;

    void clear();

private:
    std::vector<double> buffer_;
    size_t head_ = 0;      // Next write slot
    size_t count_ = 0;
    double sum_ = 0.0;
};

} // namespace TickGovernor
