#include "peerdrop/transfer/rate_controller.h"
#include "peerdrop/base/logger.h"
#include <algorithm>
#include <cmath>
#include <numeric>

namespace peerdrop {

namespace {

constexpr size_t SAMPLE_HISTORY = 15;
constexpr uint32_t STABLE_INSTABILITY_DELAY_MS = 5;
constexpr uint32_t CONGESTION_DELAY_MS = 10;
constexpr uint32_t DECLINE_DELAY_MS = 3;

bool usable(double value) {
    return std::isfinite(value) && value > 0.0;
}

} // anonymous namespace

std::string to_string(RatePhase phase) {
    switch (phase) {
        case RatePhase::Ramping: return "ramping";
        case RatePhase::Stable: return "stable";
        case RatePhase::Optimizing: return "optimizing";
    }
    return "ramping";
}

std::string to_string(CongestionLevel level) {
    switch (level) {
        case CongestionLevel::Normal: return "normal";
        case CongestionLevel::Moderate: return "moderate";
        case CongestionLevel::High: return "high";
    }
    return "normal";
}

RateController::RateController(const RateControlPolicy& policy)
    : policy_(policy) {
    reset();
}

void RateController::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    chunk_size_ = policy_.initial_chunk_size;
    base_delay_ms_ = policy_.initial_delay_ms;
    phase_ = RatePhase::Ramping;
    congestion_ = CongestionLevel::Normal;
    pressure_ = 0.0;
    upload_rate_ = 0.0;
    download_rate_ = 0.0;
    rtt_ms_ = 0.0;
    capacity_ = policy_.target_rate > 0.0 ? policy_.target_rate : 0.0;
    rate_limit_ = 0.0;
    download_samples_.clear();
    upload_samples_.clear();
    good_cycles_ = 0;
    stable_readings_ = 0;
    stable_failures_ = 0;
    stable_chunk_size_ = 0.0;
    stable_rate_ = 0.0;
    feedback_cycles_ = 0;
    clamp_locked();
}

void RateController::on_feedback(const RateFeedback& feedback) {
    std::lock_guard<std::mutex> lock(mutex_);
    feedback_cycles_++;

    if (usable(feedback.rtt_ms)) {
        rtt_ms_ = feedback.rtt_ms;
    }

    bool have_rate = usable(feedback.download_rate);
    if (have_rate) {
        download_rate_ = feedback.download_rate;
        record_sample_locked(download_samples_, feedback.download_rate);
        update_congestion_locked(download_samples_);
    }

    double level = std::isfinite(feedback.buffer_level_chunks) ? feedback.buffer_level_chunks : 0.0;
    pressure_ = std::clamp(level / policy_.buffer_capacity_chunks, 0.0, 1.0);

    step_locked(pressure_, trend_locked(), have_rate);
    clamp_locked();
}

void RateController::on_upload_sample(uint64_t bytes, std::chrono::milliseconds elapsed) {
    if (elapsed.count() <= 0 || bytes == 0) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    double rate = static_cast<double>(bytes) * 1000.0 / static_cast<double>(elapsed.count());
    upload_rate_ = rate;
    record_sample_locked(upload_samples_, rate);
    // Receiver reports take precedence once they exist
    if (download_samples_.empty()) {
        update_congestion_locked(upload_samples_);
    }
}

void RateController::on_buffer_pressure(PressureLevel level, double pressure) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (std::isfinite(pressure)) {
        pressure_ = std::max(pressure_, std::clamp(pressure, 0.0, 1.0));
    }

    switch (level) {
        case PressureLevel::Critical:
            chunk_size_ = policy_.min_chunk_size;
            congestion_ = CongestionLevel::High;
            base_delay_ms_ += CONGESTION_DELAY_MS;
            if (phase_ == RatePhase::Ramping) {
                phase_ = RatePhase::Stable;
                stable_readings_ = 0;
            }
            break;
        case PressureLevel::High:
            chunk_size_ *= policy_.instability_backoff;
            if (congestion_ == CongestionLevel::Normal) {
                congestion_ = CongestionLevel::Moderate;
            }
            break;
        case PressureLevel::Normal:
            break;
    }
    clamp_locked();
}

void RateController::on_rate_limit(double max_rate) {
    std::lock_guard<std::mutex> lock(mutex_);
    rate_limit_ = usable(max_rate) ? max_rate : 0.0;
}

void RateController::on_rtt(double rtt_ms) {
    if (!std::isfinite(rtt_ms) || rtt_ms < 0.0) return;
    std::lock_guard<std::mutex> lock(mutex_);
    rtt_ms_ = rtt_ms;
}

void RateController::on_local_backpressure() {
    std::lock_guard<std::mutex> lock(mutex_);
    base_delay_ms_ += STABLE_INSTABILITY_DELAY_MS;
    if (congestion_ == CongestionLevel::Normal) {
        congestion_ = CongestionLevel::Moderate;
    }
    clamp_locked();
}

void RateController::record_sample_locked(std::deque<double>& window, double rate) {
    window.push_back(rate);
    while (window.size() > SAMPLE_HISTORY) {
        window.pop_front();
    }

    if (policy_.target_rate > 0.0) {
        capacity_ = policy_.target_rate;
    } else {
        capacity_ = std::max(capacity_ * policy_.capacity_decay, rate);
    }
}

void RateController::update_congestion_locked(const std::deque<double>& window) {
    if (window.empty() || !usable(capacity_)) {
        return;
    }

    size_t n = std::min<size_t>(policy_.throughput_window, window.size());
    double sum = std::accumulate(window.end() - static_cast<std::ptrdiff_t>(n), window.end(), 0.0);
    double ratio = (sum / static_cast<double>(n)) / capacity_;

    CongestionLevel level = CongestionLevel::Normal;
    if (ratio < policy_.high_congestion_ratio) {
        level = CongestionLevel::High;
    } else if (ratio < policy_.moderate_congestion_ratio) {
        level = CongestionLevel::Moderate;
    }

    if (level != congestion_) {
        Logger::instance().debug("Congestion {} -> {} (throughput ratio {:.2f})",
                                 to_string(congestion_), to_string(level), ratio);
    }
    congestion_ = level;
}

double RateController::trend_locked() const {
    const auto& window = download_samples_.empty() ? upload_samples_ : download_samples_;
    if (window.size() < 3) {
        return 0.0;
    }
    double first = window[window.size() - 3];
    if (!usable(first)) {
        return 0.0;
    }
    double recent = (window[window.size() - 2] + window[window.size() - 1]) / 2.0;
    return (recent - first) / first;
}

void RateController::step_locked(double pressure, double trend, bool have_rate) {
    switch (phase_) {
        case RatePhase::Ramping:
            step_ramping_locked(pressure, trend);
            break;
        case RatePhase::Stable:
            step_stable_locked(pressure, trend, have_rate);
            break;
        case RatePhase::Optimizing:
            step_optimizing_locked(pressure, trend);
            break;
    }
}

void RateController::step_ramping_locked(double pressure, double trend) {
    if (pressure > policy_.congestion_pressure || trend < policy_.congestion_trend ||
        congestion_ == CongestionLevel::High) {
        chunk_size_ = std::max<double>(policy_.min_chunk_size, chunk_size_ * policy_.ramp_backoff);
        base_delay_ms_ += CONGESTION_DELAY_MS;
        phase_ = RatePhase::Stable;
        stable_readings_ = 0;
        stable_failures_ = 0;
        Logger::instance().debug("Ramping stopped by congestion, chunk {} bytes", chunk_size_locked());
        return;
    }

    if (pressure < policy_.ramp_pressure_ceiling && trend >= policy_.ramp_trend_floor) {
        good_cycles_++;
        if (good_cycles_ % policy_.ramp_interval_cycles == 0) {
            chunk_size_ = std::min<double>(policy_.max_chunk_size, chunk_size_ * policy_.ramp_factor);
            base_delay_ms_ = std::max<double>(policy_.min_delay_ms,
                                              base_delay_ms_ - policy_.ramp_delay_step_ms);
        }
    }

    if (chunk_size_ >= policy_.max_chunk_size) {
        phase_ = RatePhase::Stable;
        stable_readings_ = 0;
        stable_failures_ = 0;
        Logger::instance().debug("Ramping reached maximum chunk size");
    }
}

void RateController::step_stable_locked(double pressure, double trend, bool have_rate) {
    bool stable = pressure < policy_.stable_pressure_ceiling && trend >= policy_.stable_trend_floor &&
                  congestion_ != CongestionLevel::High;

    if (stable) {
        if (!have_rate) {
            return;
        }
        stable_failures_ = 0;
        stable_readings_++;
        if (stable_readings_ >= policy_.stable_readings_required) {
            stable_chunk_size_ = chunk_size_;
            stable_rate_ = download_rate_;
            phase_ = RatePhase::Optimizing;
            Logger::instance().debug("Stable baseline frozen: chunk {} bytes at {:.0f} B/s",
                                     chunk_size_locked(), stable_rate_);
        }
        return;
    }

    stable_readings_ = 0;
    stable_failures_++;
    chunk_size_ *= policy_.instability_backoff;
    base_delay_ms_ += STABLE_INSTABILITY_DELAY_MS;

    if (stable_failures_ >= policy_.stable_failure_limit ||
        chunk_size_ <= policy_.min_chunk_size * 1.5) {
        phase_ = RatePhase::Ramping;
        good_cycles_ = 0;
        stable_failures_ = 0;
        Logger::instance().debug("Stable phase unstable, ramping again from {} bytes",
                                 static_cast<uint32_t>(std::max<double>(policy_.min_chunk_size, chunk_size_)));
    }
}

void RateController::step_optimizing_locked(double pressure, double trend) {
    if (pressure > policy_.emergency_pressure) {
        chunk_size_ *= policy_.emergency_backoff;
        base_delay_ms_ += CONGESTION_DELAY_MS;
    } else if (trend < policy_.decline_trend || congestion_ == CongestionLevel::High) {
        chunk_size_ *= policy_.decline_backoff;
        base_delay_ms_ += DECLINE_DELAY_MS;
    } else if (pressure < policy_.headroom_pressure && trend >= 0.0) {
        double target = stable_chunk_size_ > 0.0 ? stable_chunk_size_ : policy_.max_chunk_size;
        if (chunk_size_ < target) {
            chunk_size_ = std::min(target, chunk_size_ * policy_.nudge_factor);
        }
        base_delay_ms_ = std::max<double>(policy_.min_delay_ms, base_delay_ms_ - 1.0);
    }
}

void RateController::clamp_locked() {
    chunk_size_ = std::clamp<double>(chunk_size_, policy_.min_chunk_size, policy_.max_chunk_size);
    base_delay_ms_ = std::clamp<double>(base_delay_ms_, policy_.min_delay_ms, policy_.max_delay_ms);
}

uint32_t RateController::chunk_size_locked() const {
    auto size = static_cast<uint32_t>(chunk_size_);
    return std::clamp(size, policy_.min_chunk_size, policy_.max_chunk_size);
}

uint32_t RateController::delay_ms_locked() const {
    double delay = base_delay_ms_;

    double paced_rate = 0.0;
    if (rate_limit_ > 0.0) {
        paced_rate = rate_limit_;
    } else if (congestion_ != CongestionLevel::Normal && usable(capacity_)) {
        paced_rate = capacity_ * policy_.target_rate_fraction;
    }
    if (usable(paced_rate)) {
        delay = std::max(delay, 1000.0 * chunk_size_ / paced_rate);
    }

    delay = std::clamp<double>(delay, policy_.min_delay_ms, policy_.max_delay_ms);
    if (rtt_ms_ > policy_.rtt_threshold_ms && policy_.rtt_delay_divisor > 0.0) {
        delay += rtt_ms_ / policy_.rtt_delay_divisor;
    }
    return static_cast<uint32_t>(std::lround(delay));
}

uint32_t RateController::chunk_size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return chunk_size_locked();
}

uint32_t RateController::delay_ms() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return delay_ms_locked();
}

CongestionLevel RateController::congestion_level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return congestion_;
}

RatePhase RateController::phase() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return phase_;
}

double RateController::trend() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return trend_locked();
}

RateControlState RateController::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    RateControlState s;
    s.chunk_size = chunk_size_locked();
    s.delay_ms = delay_ms_locked();
    s.congestion_level = congestion_;
    s.buffer_pressure = pressure_;
    s.measured_upload_rate = upload_rate_;
    s.measured_download_rate = download_rate_;
    s.rtt_ms = rtt_ms_;
    s.phase = phase_;
    s.stable_chunk_size = static_cast<uint32_t>(stable_chunk_size_);
    s.stable_rate = stable_rate_;
    s.rate_limit = rate_limit_;
    s.feedback_cycles = feedback_cycles_;
    return s;
}

} // namespace peerdrop
