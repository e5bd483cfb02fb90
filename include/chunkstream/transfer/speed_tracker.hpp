#pragma once

#include <chrono>
#include <cstdint>
#include <deque>

namespace chunkstream::transfer {

// Rolling throughput estimate over the most recent chunk transfers.
class SpeedTracker {
public:
    static constexpr size_t DEFAULT_MAX_SAMPLES = 10;

    explicit SpeedTracker(size_t max_samples = DEFAULT_MAX_SAMPLES);

    void record(uint64_t bytes, std::chrono::milliseconds elapsed);

    // Sum of bytes over sum of elapsed time, 0 until the elapsed time is non-zero.
    uint64_t speed_bps() const;

    size_t sample_count() const { return samples_.size(); }
    void reset() { samples_.clear(); }

private:
    struct Sample {
        uint64_t bytes;
        std::chrono::milliseconds elapsed;
    };

    std::deque<Sample> samples_;
    size_t max_samples_;
};

} // namespace chunkstream::transfer
