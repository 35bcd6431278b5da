#ifndef PEERDROP_BASE_CONFIG_H
#define PEERDROP_BASE_CONFIG_H

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace peerdrop {

// Log configuration
struct LogConfig {
    std::string level = "info";
    std::string output = "stdout";  // stdout, stderr, file
    std::string file_path = "";
};

// Node configuration
struct NodeConfig {
    std::string peer_id;             // generated when empty
    std::string bind_address = "0.0.0.0";
    uint16_t listen_port = 0;        // 0 disables the listener
};

// Tuning of the adaptive chunk size / pacing engine
struct RateControlPolicy {
    // Chunk bounds (bytes)
    uint32_t initial_chunk_size = 32 * 1024;
    uint32_t min_chunk_size = 8 * 1024;
    uint32_t max_chunk_size = 256 * 1024;

    // Inter-chunk delay (ms)
    uint32_t initial_delay_ms = 5;
    uint32_t min_delay_ms = 1;
    uint32_t max_delay_ms = 100;

    // Receiver buffer depth (chunks) that maps to pressure 1.0
    double buffer_capacity_chunks = 20.0;

    // Ramping
    double ramp_factor = 1.25;
    uint32_t ramp_interval_cycles = 3;   // grow every K good feedback cycles
    double ramp_pressure_ceiling = 0.3;
    double ramp_trend_floor = 0.0;
    double congestion_pressure = 0.7;    // leave ramping above this
    double congestion_trend = -0.2;
    double ramp_backoff = 0.8;
    uint32_t ramp_delay_step_ms = 2;

    // Stable
    double stable_pressure_ceiling = 0.6;
    double stable_trend_floor = -0.15;
    uint32_t stable_readings_required = 5;
    uint32_t stable_failure_limit = 3;   // consecutive unstable readings before re-ramping
    double instability_backoff = 0.9;

    // Optimizing
    double nudge_factor = 1.05;
    double headroom_pressure = 0.3;
    double emergency_pressure = 0.8;
    double emergency_backoff = 0.85;
    double decline_trend = -0.25;
    double decline_backoff = 0.9;

    // Congestion classification
    uint32_t throughput_window = 3;      // samples in the short moving average
    double high_congestion_ratio = 0.3;
    double moderate_congestion_ratio = 0.6;
    double capacity_decay = 0.995;       // per sample, for the observed-capacity peak
    double target_rate_fraction = 0.9;   // pacing target under congestion
    double target_rate = 0.0;            // bytes/s, 0 = use observed capacity

    // RTT addend: rtt / divisor once rtt exceeds the threshold
    double rtt_threshold_ms = 50.0;
    double rtt_delay_divisor = 25.0;
};

constexpr uint32_t MAX_RETRIES_LIMIT = 100;

// Transfer engine configuration
struct TransferConfig {
    RateControlPolicy rate;

    // Sender backpressure
    uint64_t buffer_high_water = 512 * 1024;
    uint32_t buffer_poll_interval_ms = 10;
    uint32_t buffer_poll_max_interval_ms = 100;
    uint32_t buffer_wait_timeout_ms = 2000;

    uint32_t checkpoint_interval_chunks = 100;
    uint32_t ack_interval_chunks = 10;   // 0 disables batched acks
    uint32_t ack_timeout_ms = 5000;

    // Receiver feedback
    uint32_t feedback_interval_chunks = 10;
    uint32_t feedback_interval_ms = 1000;
    double high_pressure_threshold = 0.6;
    double critical_pressure_threshold = 0.8;
    double rate_limit_fraction = 0.7;

    // Session management
    uint32_t handshake_timeout_ms = 30000;
    uint32_t max_retries = 3;
    uint32_t retry_base_delay_ms = 100;  // doubled per consecutive failure
    uint32_t retry_max_delay_ms = 5000;
    uint32_t max_concurrent_downloads = 1;
    bool accept_pushes = true;
    uint64_t checksum_max_bytes = 256ULL * 1024 * 1024;  // skip file checksum above this

    // Liveness
    uint32_t keepalive_interval_sec = 5;
    uint32_t ping_interval_sec = 10;
    uint32_t heartbeat_timeout_sec = 60;
};

// Resume checkpoint persistence
struct ResumeConfig {
    std::string checkpoint_dir = "/tmp/peerdrop/resume";
    uint32_t max_age_hours = 168;
    uint32_t gc_interval_sec = 3600;
};

// What the command-line node does once started
struct SessionConfig {
    std::vector<std::string> connect_addresses;  // host:port
    std::vector<std::string> share_paths;
    std::vector<std::string> fetch_ids;
    bool fetch_all = false;
    bool push = false;
    bool exit_when_done = false;
    std::string download_dir = ".";
};

// Global configuration
struct GlobalConfig {
    LogConfig log;
    NodeConfig node;
    TransferConfig transfer;
    ResumeConfig resume;
    SessionConfig session;
};

class Config {
public:
    static Config& instance();

    // Load configuration from an INI file
    bool load_from_file(const std::string& path);

    // Load configuration from environment variables
    bool load_from_env();

    // Parse command line arguments and override config
    bool parse_command_line(int argc, char* argv[]);

    // Get configuration
    const GlobalConfig& get() const { return config_; }
    GlobalConfig& get() { return config_; }

    const std::string& get_config_file() const { return config_file_; }

    // Check consistency of the loaded values
    bool validate() const;

    // Print configuration (for debugging)
    void print() const;

    // Restore defaults, used by tests
    void reset();

private:
    Config() = default;
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    void apply_sections(std::map<std::string, std::map<std::string, std::string>>& sections);
    void override_from_env();

    GlobalConfig config_;
    std::string config_file_;
};

// Validation shared by Config and the transfer engine
bool validate_policy(const RateControlPolicy& policy, std::string* error = nullptr);

} // namespace peerdrop

#endif // PEERDROP_BASE_CONFIG_H
