#ifndef PEERDROP_TRANSFER_RATE_CONTROLLER_H
#define PEERDROP_TRANSFER_RATE_CONTROLLER_H

#include "peerdrop/base/config.h"
#include "peerdrop/protocol/control_message.h"
#include <chrono>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>

namespace peerdrop {

enum class RatePhase {
    Ramping,
    Stable,
    Optimizing
};

enum class CongestionLevel {
    Normal,
    Moderate,
    High
};

std::string to_string(RatePhase phase);
std::string to_string(CongestionLevel level);

// Remote receiver conditions as reported in a throughput-report
struct RateFeedback {
    double buffer_level_chunks = 0.0;
    double download_rate = 0.0;     // bytes/s
    double rtt_ms = 0.0;
};

// Snapshot of the controller
struct RateControlState {
    uint32_t chunk_size = 0;
    uint32_t delay_ms = 0;
    CongestionLevel congestion_level = CongestionLevel::Normal;
    double buffer_pressure = 0.0;       // [0, 1]
    double measured_upload_rate = 0.0;  // bytes/s
    double measured_download_rate = 0.0;
    double rtt_ms = 0.0;
    RatePhase phase = RatePhase::Ramping;
    uint32_t stable_chunk_size = 0;
    double stable_rate = 0.0;
    double rate_limit = 0.0;            // receiver-requested cap, 0 = none
    uint64_t feedback_cycles = 0;
};

// Adaptive chunk size and pacing for one remote peer.
// Never fails; every input only nudges chunk size and delay within the
// policy bounds. Thread-safe.
class RateController {
public:
    explicit RateController(const RateControlPolicy& policy = RateControlPolicy{});

    void on_feedback(const RateFeedback& feedback);
    void on_upload_sample(uint64_t bytes, std::chrono::milliseconds elapsed);
    void on_buffer_pressure(PressureLevel level, double pressure);
    void on_rate_limit(double max_rate);
    void on_rtt(double rtt_ms);

    // Local send buffer failed to drain in time
    void on_local_backpressure();

    uint32_t chunk_size() const;
    uint32_t delay_ms() const;
    CongestionLevel congestion_level() const;
    RatePhase phase() const;
    double trend() const;
    RateControlState state() const;

    const RateControlPolicy& policy() const { return policy_; }

    void reset();

private:
    void record_sample_locked(std::deque<double>& window, double rate);
    void update_congestion_locked(const std::deque<double>& window);
    double trend_locked() const;
    void step_locked(double pressure, double trend, bool have_rate);
    void step_ramping_locked(double pressure, double trend);
    void step_stable_locked(double pressure, double trend, bool have_rate);
    void step_optimizing_locked(double pressure, double trend);
    void clamp_locked();
    uint32_t chunk_size_locked() const;
    uint32_t delay_ms_locked() const;

    RateControlPolicy policy_;
    mutable std::mutex mutex_;

    double chunk_size_ = 0.0;
    double base_delay_ms_ = 0.0;
    RatePhase phase_ = RatePhase::Ramping;
    CongestionLevel congestion_ = CongestionLevel::Normal;
    double pressure_ = 0.0;
    double upload_rate_ = 0.0;
    double download_rate_ = 0.0;
    double rtt_ms_ = 0.0;
    double capacity_ = 0.0;
    double rate_limit_ = 0.0;

    std::deque<double> download_samples_;
    std::deque<double> upload_samples_;

    uint32_t good_cycles_ = 0;
    uint32_t stable_readings_ = 0;
    uint32_t stable_failures_ = 0;
    double stable_chunk_size_ = 0.0;
    double stable_rate_ = 0.0;
    uint64_t feedback_cycles_ = 0;
};

} // namespace peerdrop

#endif // PEERDROP_TRANSFER_RATE_CONTROLLER_H
