#pragma once

#include <chrono>
#include <cstdint>

namespace chunkstream::transfer {

// AIMD control of the number of chunks in flight, with an RTT estimate feeding the
// per-chunk retransmission timeout.
class WindowController {
public:
    static constexpr uint32_t W_MIN = 2;
    static constexpr uint32_t W_MAX = 32;
    static constexpr uint32_t W_INIT = 4;
    static constexpr double RTT_ALPHA = 0.125;
    static constexpr double RTT_BETA = 0.25;
    static constexpr std::chrono::milliseconds DEFAULT_MIN_TIMEOUT{2000};

    explicit WindowController(std::chrono::milliseconds min_timeout = DEFAULT_MIN_TIMEOUT);

    uint32_t window() const { return window_; }
    uint32_t consecutive_successes() const { return consecutive_successes_; }

    void on_success(std::chrono::microseconds rtt);
    void on_loss();

    // max(rtt_ema + 4 * rtt_var, min_timeout)
    std::chrono::milliseconds timeout() const;

    bool has_rtt_sample() const { return has_sample_; }
    std::chrono::microseconds rtt_estimate() const;
    std::chrono::microseconds rtt_variance() const;
    std::chrono::milliseconds min_timeout() const { return min_timeout_; }

private:
    uint32_t window_;
    uint32_t consecutive_successes_;
    std::chrono::milliseconds min_timeout_;

    // microseconds
    double rtt_ema_;
    double rtt_var_;
    bool has_sample_;

    void update_rtt(std::chrono::microseconds rtt);
};

} // namespace chunkstream::transfer
