#include <tickgovernor/core/budget/cycle_ring_buffer.hpp>
#include <algorithm>
#include <cmath>
#include <numeric>

namespace TickGovernor {

CycleRingBuffer::CycleRingBuffer(size_t capacity)
    : buffer_(std::max<size_t>(1, capacity), 0.0) {}

bool CycleRingBuffer::push(double sample_ms) {
    bool evicted = false;
    if (count_ == buffer_.size()) {
        // Full: the slot under head_ is the oldest sample
        sum_ -= buffer_[head_];
        evicted = true;
    } else {
        ++count_;
    }

    buffer_[head_] = sample_ms;
    sum_ += sample_ms;
    head_ = (head_ + 1) % buffer_.size();

    // Rebuild from the live samples once per rotation, and whenever an
    // overflow has poisoned the running sum
    if (head_ == 0 || !std::isfinite(sum_)) {
        sum_ = std::accumulate(buffer_.begin(), buffer_.end(), 0.0);
    }
    // Guard accumulated floating error from driving the sum negative
    if (sum_ < 0.0) sum_ = 0.0;
    return evicted;
}

std::vector<double> CycleRingBuffer::snapshot() const {
    std::vector<double> out;
    out.reserve(count_);
    size_t tail = (head_ + buffer_.size() - count_) % buffer_.size();
    for (size_t i = 0; i < count_; ++i) {
        out.push_back(buffer_[(tail + i) % buffer_.size()]);
    }
    return out;
}

void CycleRingBuffer::clear() {
    std::fill(buffer_.begin(), buffer_.end(), 0.0);
    head_ = 0;
    count_ = 0;
    sum_ = 0.0;
}

} // namespace TickGovernor
