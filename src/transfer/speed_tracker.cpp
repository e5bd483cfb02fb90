#include "chunkstream/transfer/speed_tracker.hpp"

namespace chunkstream::transfer {

SpeedTracker::SpeedTracker(size_t max_samples) : max_samples_(max_samples == 0 ? 1 : max_samples) {
}

void SpeedTracker::record(uint64_t bytes, std::chrono::milliseconds elapsed) {
    if (samples_.size() >= max_samples_) {
        samples_.pop_front();
    }
    samples_.push_back(Sample{bytes, elapsed});
}

uint64_t SpeedTracker::speed_bps() const {
    uint64_t total_bytes = 0;
    int64_t total_ms = 0;
    for (const auto& sample : samples_) {
        total_bytes += sample.bytes;
        total_ms += sample.elapsed.count();
    }

    if (total_ms <= 0) {
        return 0;
    }
    return total_bytes * 1000 / static_cast<uint64_t>(total_ms);
}

} // namespace chunkstream::transfer
