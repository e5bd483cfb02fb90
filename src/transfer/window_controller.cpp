#include "chunkstream/transfer/window_controller.hpp"
#include <algorithm>
#include <cmath>

namespace chunkstream::transfer {

WindowController::WindowController(std::chrono::milliseconds min_timeout)
    : window_(W_INIT)
    , consecutive_successes_(0)
    , min_timeout_(min_timeout)
    , rtt_ema_(0.0)
    , rtt_var_(0.0)
    , has_sample_(false)
{
}

void WindowController::on_success(std::chrono::microseconds rtt) {
    update_rtt(rtt);

    consecutive_successes_++;
    if (consecutive_successes_ >= window_) {
        if (window_ < W_MAX) {
            window_++;
        }
        consecutive_successes_ = 0;
    }
}

void WindowController::on_loss() {
    // Multiplicative decrease
    window_ = std::max(W_MIN, window_ / 2);
    consecutive_successes_ = 0;
}

std::chrono::milliseconds WindowController::timeout() const {
    auto rto_us = rtt_ema_ + 4.0 * rtt_var_;
    auto rto = std::chrono::milliseconds(static_cast<int64_t>(std::ceil(rto_us / 1000.0)));
    return std::max(rto, min_timeout_);
}

std::chrono::microseconds WindowController::rtt_estimate() const {
    return std::chrono::microseconds(static_cast<int64_t>(rtt_ema_));
}

std::chrono::microseconds WindowController::rtt_variance() const {
    return std::chrono::microseconds(static_cast<int64_t>(rtt_var_));
}

void WindowController::update_rtt(std::chrono::microseconds rtt) {
    auto sample = static_cast<double>(std::max<int64_t>(rtt.count(), 0));

    if (!has_sample_) {
        rtt_ema_ = sample;
        rtt_var_ = sample / 2.0;
        has_sample_ = true;
        return;
    }

    // Variance uses the estimate from before this sample
    rtt_var_ = (1.0 - RTT_BETA) * rtt_var_ + RTT_BETA * std::abs(rtt_ema_ - sample);
    rtt_ema_ = (1.0 - RTT_ALPHA) * rtt_ema_ + RTT_ALPHA * sample;
}

} // namespace chunkstream::transfer
