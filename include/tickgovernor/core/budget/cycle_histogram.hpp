#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <spdlog/spdlog.h>

namespace TickGovernor {

/**
 * @brief Cycle-time histogram over fixed latency buckets
 *
 * Bucket 0: [0, 5) ms
 * Bucket 1: [5, 10) ms
 * Bucket 2: [10, 15) ms
 * Bucket 3: [15, 20) ms
 * Bucket 4: [20, 30) ms
 * Bucket 5: [30, inf) ms
 *
 * Counts are cumulative since the last reset(); unlike the ring buffer they
 * never age out.
 */
class CycleHistogram {
public:
    static constexpr size_t NUM_BUCKETS = 6;
    using Counts = std::array<uint64_t, NUM_BUCKETS>;

    void record(double cycle_ms) {
        ++buckets_[bucketFor(cycle_ms)];
        ++total_count_;
    }

    uint64_t getTotalCount() const { return total_count_; }

    uint64_t getBucketCount(size_t bucket) const {
        if (bucket >= NUM_BUCKETS) return 0;
        return buckets_[bucket];
    }

    const Counts& counts() const { return buckets_; }

    /**
     * @brief Upper bound (exclusive) of a bucket in ms; 0 for the open bucket
     */
    static double bucketUpperMs(size_t bucket) {
        static constexpr std::array<double, NUM_BUCKETS - 1> bounds{5.0, 10.0, 15.0, 20.0, 30.0};
        return bucket < bounds.size() ? bounds[bucket] : 0.0;
    }

    static size_t bucketFor(double cycle_ms) {
        if (cycle_ms < 5.0) return 0;
        if (cycle_ms < 10.0) return 1;
        if (cycle_ms < 15.0) return 2;
        if (cycle_ms < 20.0) return 3;
        if (cycle_ms < 30.0) return 4;
        return 5;
    }

    void printDistribution() const {
        if (total_count_ == 0) {
            spdlog::info("Cycle Histogram: No samples recorded");
            return;
        }
        static constexpr const char* labels[NUM_BUCKETS] = {
            " <5 ms", "<10 ms", "<15 ms", "<20 ms", "<30 ms", ">=30 ms"
        };
        spdlog::info("╔════════════════════════════════════════╗");
        spdlog::info("║  CYCLE TIME DISTRIBUTION               ║");
        spdlog::info("╠════════════════════════════════════════╣");
        for (size_t b = 0; b < NUM_BUCKETS; ++b) {
            double pct = buckets_[b] * 100.0 / static_cast<double>(total_count_);
            spdlog::info("║  {:7}  {:10}  ({:5.1f}%)         ║", labels[b], buckets_[b], pct);
        }
        spdlog::info("╚════════════════════════════════════════╝");
    }

    void reset() {
        buckets_.fill(0);
        total_count_ = 0;
    }

private:
    Counts buckets_{};
    uint64_t total_count_ = 0;
};

} // namespace TickGovernor
