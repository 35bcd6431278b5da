#include "peerdrop/base/config.h"
#include "peerdrop/base/logger.h"
#include "CLI/CLI.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace peerdrop {

namespace {

std::string trim(const std::string& str) {
    auto start = std::find_if(str.begin(), str.end(), [](unsigned char c) { return !std::isspace(c); });
    auto end = std::find_if(str.rbegin(), str.rend(), [](unsigned char c) { return !std::isspace(c); }).base();
    return (start < end) ? std::string(start, end) : "";
}

// Simple INI-style parser for config files
bool parse_ini_file(const std::string& path, std::map<std::string, std::map<std::string, std::string>>& sections) {
    std::ifstream file(path);
    if (!file.is_open()) return false;

    std::string current_section;
    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#' || line[0] == ';') continue;

        if (line[0] == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.size() - 2));
            sections[current_section];
            continue;
        }

        auto pos = line.find('=');
        if (pos != std::string::npos) {
            std::string key = trim(line.substr(0, pos));
            std::string value = trim(line.substr(pos + 1));
            if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
                value = value.substr(1, value.size() - 2);
            }
            sections[current_section][key] = value;
        }
    }
    return true;
}

bool parse_bool(const std::string& value) {
    return value == "true" || value == "1" || value == "yes" || value == "on";
}

std::vector<std::string> split_list(const std::string& value) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= value.size()) {
        auto pos = value.find(',', start);
        if (pos == std::string::npos) pos = value.size();
        auto item = trim(value.substr(start, pos - start));
        if (!item.empty()) out.push_back(item);
        start = pos + 1;
    }
    return out;
}

template <typename T>
void set_uint(std::map<std::string, std::string>& s, const char* key, T& target) {
    if (s.count(key)) target = static_cast<T>(std::stoull(s[key]));
}

void set_double(std::map<std::string, std::string>& s, const char* key, double& target) {
    if (s.count(key)) target = std::stod(s[key]);
}

} // anonymous namespace

Config& Config::instance() {
    static Config instance;
    return instance;
}

void Config::reset() {
    config_ = GlobalConfig{};
    config_file_.clear();
}

bool Config::load_from_file(const std::string& path) {
    Logger::instance().info("Loading config from file: " + path);

    if (!std::filesystem::exists(path)) {
        Logger::instance().warning("Config file not found: " + path);
        return false;
    }

    std::map<std::string, std::map<std::string, std::string>> sections;
    if (!parse_ini_file(path, sections)) {
        Logger::instance().error("Failed to read config file: " + path);
        return false;
    }

    try {
        apply_sections(sections);
    } catch (const std::exception& e) {
        Logger::instance().error("Invalid value in config file " + path + ": " + e.what());
        return false;
    }

    config_file_ = path;
    Logger::instance().info("Config loaded successfully from: " + path);
    return true;
}

void Config::apply_sections(std::map<std::string, std::map<std::string, std::string>>& sections) {
    if (sections.count("log")) {
        auto& s = sections["log"];
        if (s.count("level")) config_.log.level = s["level"];
        if (s.count("output")) config_.log.output = s["output"];
        if (s.count("file_path")) config_.log.file_path = s["file_path"];
    }

    if (sections.count("node")) {
        auto& s = sections["node"];
        if (s.count("peer_id")) config_.node.peer_id = s["peer_id"];
        if (s.count("bind_address")) config_.node.bind_address = s["bind_address"];
        set_uint(s, "listen_port", config_.node.listen_port);
    }

    if (sections.count("transfer")) {
        auto& s = sections["transfer"];
        auto& t = config_.transfer;
        set_uint(s, "buffer_high_water", t.buffer_high_water);
        set_uint(s, "buffer_poll_interval_ms", t.buffer_poll_interval_ms);
        set_uint(s, "buffer_wait_timeout_ms", t.buffer_wait_timeout_ms);
        set_uint(s, "checkpoint_interval_chunks", t.checkpoint_interval_chunks);
        set_uint(s, "ack_interval_chunks", t.ack_interval_chunks);
        set_uint(s, "ack_timeout_ms", t.ack_timeout_ms);
        set_uint(s, "feedback_interval_chunks", t.feedback_interval_chunks);
        set_uint(s, "feedback_interval_ms", t.feedback_interval_ms);
        set_uint(s, "handshake_timeout_ms", t.handshake_timeout_ms);
        set_uint(s, "max_retries", t.max_retries);
        set_uint(s, "retry_base_delay_ms", t.retry_base_delay_ms);
        set_uint(s, "retry_max_delay_ms", t.retry_max_delay_ms);
        set_uint(s, "max_concurrent_downloads", t.max_concurrent_downloads);
        set_uint(s, "keepalive_interval_sec", t.keepalive_interval_sec);
        set_uint(s, "ping_interval_sec", t.ping_interval_sec);
        set_uint(s, "heartbeat_timeout_sec", t.heartbeat_timeout_sec);
        set_uint(s, "checksum_max_bytes", t.checksum_max_bytes);
        if (s.count("accept_pushes")) t.accept_pushes = parse_bool(s["accept_pushes"]);
    }

    if (sections.count("rate")) {
        auto& s = sections["rate"];
        auto& r = config_.transfer.rate;
        set_uint(s, "initial_chunk_size", r.initial_chunk_size);
        set_uint(s, "min_chunk_size", r.min_chunk_size);
        set_uint(s, "max_chunk_size", r.max_chunk_size);
        set_uint(s, "initial_delay_ms", r.initial_delay_ms);
        set_uint(s, "min_delay_ms", r.min_delay_ms);
        set_uint(s, "max_delay_ms", r.max_delay_ms);
        set_double(s, "buffer_capacity_chunks", r.buffer_capacity_chunks);
        set_double(s, "ramp_factor", r.ramp_factor);
        set_uint(s, "ramp_interval_cycles", r.ramp_interval_cycles);
        set_double(s, "ramp_backoff", r.ramp_backoff);
        set_uint(s, "stable_readings_required", r.stable_readings_required);
        set_double(s, "emergency_backoff", r.emergency_backoff);
        set_double(s, "target_rate", r.target_rate);
    }

    if (sections.count("resume")) {
        auto& s = sections["resume"];
        if (s.count("checkpoint_dir")) config_.resume.checkpoint_dir = s["checkpoint_dir"];
        set_uint(s, "max_age_hours", config_.resume.max_age_hours);
        set_uint(s, "gc_interval_sec", config_.resume.gc_interval_sec);
    }

    if (sections.count("session")) {
        auto& s = sections["session"];
        if (s.count("connect")) config_.session.connect_addresses = split_list(s["connect"]);
        if (s.count("share")) config_.session.share_paths = split_list(s["share"]);
        if (s.count("download_dir")) config_.session.download_dir = s["download_dir"];
    }
}

bool Config::load_from_env() {
    Logger::instance().debug("Loading config from environment variables");
    try {
        override_from_env();
    } catch (const std::exception& e) {
        Logger::instance().error("Invalid environment override: " + std::string(e.what()));
        return false;
    }
    return true;
}

void Config::override_from_env() {
    if (const char* val = std::getenv("PEERDROP_PEER_ID")) {
        config_.node.peer_id = val;
    }
    if (const char* val = std::getenv("PEERDROP_BIND_ADDRESS")) {
        config_.node.bind_address = val;
    }
    if (const char* val = std::getenv("PEERDROP_LISTEN_PORT")) {
        config_.node.listen_port = static_cast<uint16_t>(std::stoi(val));
    }
    if (const char* val = std::getenv("PEERDROP_LOG_LEVEL")) {
        config_.log.level = val;
    }
    if (const char* val = std::getenv("PEERDROP_CHECKPOINT_DIR")) {
        config_.resume.checkpoint_dir = val;
    }
    if (const char* val = std::getenv("PEERDROP_DOWNLOAD_DIR")) {
        config_.session.download_dir = val;
    }
    if (const char* val = std::getenv("PEERDROP_MAX_DOWNLOADS")) {
        config_.transfer.max_concurrent_downloads = static_cast<uint32_t>(std::stoul(val));
    }
    if (const char* val = std::getenv("PEERDROP_MAX_CHUNK_SIZE")) {
        config_.transfer.rate.max_chunk_size = static_cast<uint32_t>(std::stoul(val));
    }
}

bool Config::parse_command_line(int argc, char* argv[]) {
    CLI::App app{"PeerDrop - adaptive peer-to-peer file transfer"};

    // Processed first so later options override file values
    app.add_option_function<std::string>("-c,--config", [this](const std::string& path) {
        if (load_from_file(path)) {
            override_from_env();
        }
    }, "Path to configuration file");

    // Node options
    app.add_option("--peer-id", config_.node.peer_id, "Peer identifier");
    app.add_option("--bind-address", config_.node.bind_address, "Bind address");
    app.add_option("-p,--listen-port", config_.node.listen_port, "TCP listen port (0 disables)");

    // Log options
    app.add_option("--log-level", config_.log.level, "Log level (debug, info, warning, error)");
    app.add_option("--log-output", config_.log.output, "Log output (stdout, stderr, file)");
    app.add_option("--log-file", config_.log.file_path, "Log file path");

    // Transfer options
    app.add_option("--max-downloads", config_.transfer.max_concurrent_downloads, "Concurrent download sessions");
    app.add_option("--max-retries", config_.transfer.max_retries, "Retries per chunk before failing");
    app.add_option("--handshake-timeout", config_.transfer.handshake_timeout_ms, "Handshake timeout (ms)");
    app.add_option("--min-chunk", config_.transfer.rate.min_chunk_size, "Minimum chunk size (bytes)");
    app.add_option("--max-chunk", config_.transfer.rate.max_chunk_size, "Maximum chunk size (bytes)");
    app.add_option("--initial-chunk", config_.transfer.rate.initial_chunk_size, "Initial chunk size (bytes)");
    app.add_option("--target-rate", config_.transfer.rate.target_rate, "Target sending rate (bytes/s, 0=auto)");
    app.add_flag("--no-accept-pushes{false}", config_.transfer.accept_pushes, "Reject pushed files");

    // Resume options
    app.add_option("--checkpoint-dir", config_.resume.checkpoint_dir, "Resume checkpoint directory");
    app.add_option("--checkpoint-max-age", config_.resume.max_age_hours, "Checkpoint age limit (hours)");

    // Session options
    app.add_option("--connect", config_.session.connect_addresses, "Peer to connect to (host:port)");
    app.add_option("--share", config_.session.share_paths, "File to share")->check(CLI::ExistingFile);
    app.add_option("--fetch", config_.session.fetch_ids, "File id to download");
    app.add_flag("--fetch-all", config_.session.fetch_all, "Download every advertised file");
    app.add_flag("--push", config_.session.push, "Push shared files to all connected peers");
    app.add_flag("--exit-when-done", config_.session.exit_when_done, "Exit after requested transfers finish");
    app.add_option("-d,--download-dir", config_.session.download_dir, "Directory for received files");

    app.set_version_flag("-v,--version", "0.1.0");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        if (e.get_exit_code() == 0) {
            // --help or --version, already printed by CLI11
            app.exit(e);
            return false;
        }
        std::cerr << "Command line parse error: " << e.what() << std::endl;
        return false;
    }

    if (!config_.log.level.empty()) {
        Logger::instance().set_level(parse_log_level(config_.log.level));
    }
    if (config_.log.output == "stderr") {
        Logger::instance().set_output(LogOutput::Stderr);
    } else if (config_.log.output == "file" && !config_.log.file_path.empty()) {
        Logger::instance().set_file_output(config_.log.file_path);
    }

    return true;
}

bool validate_policy(const RateControlPolicy& policy, std::string* error) {
    auto fail = [error](const std::string& message) {
        if (error) *error = message;
        return false;
    };
    if (policy.min_chunk_size == 0) return fail("min_chunk_size must be positive");
    if (policy.min_chunk_size > policy.max_chunk_size) return fail("min_chunk_size exceeds max_chunk_size");
    if (policy.initial_chunk_size < policy.min_chunk_size || policy.initial_chunk_size > policy.max_chunk_size) {
        return fail("initial_chunk_size outside [min_chunk_size, max_chunk_size]");
    }
    if (policy.min_delay_ms > policy.max_delay_ms) return fail("min_delay_ms exceeds max_delay_ms");
    if (policy.buffer_capacity_chunks <= 0.0) return fail("buffer_capacity_chunks must be positive");
    if (policy.ramp_factor < 1.0) return fail("ramp_factor must be >= 1");
    if (policy.ramp_interval_cycles == 0) return fail("ramp_interval_cycles must be positive");
    if (policy.throughput_window == 0) return fail("throughput_window must be positive");
    for (double f : {policy.ramp_backoff, policy.instability_backoff, policy.emergency_backoff, policy.decline_backoff}) {
        if (f <= 0.0 || f > 1.0) return fail("backoff factors must be in (0, 1]");
    }
    return true;
}

bool Config::validate() const {
    std::string error;
    if (!validate_policy(config_.transfer.rate, &error)) {
        Logger::instance().error("Invalid rate policy: " + error);
        return false;
    }
    if (config_.transfer.max_concurrent_downloads == 0) {
        Logger::instance().error("max_concurrent_downloads must be at least 1");
        return false;
    }
    if (config_.transfer.max_retries > MAX_RETRIES_LIMIT) {
        Logger::instance().error("max_retries must not exceed " + std::to_string(MAX_RETRIES_LIMIT));
        return false;
    }
    if (config_.transfer.retry_max_delay_ms < config_.transfer.retry_base_delay_ms) {
        Logger::instance().error("retry_max_delay_ms must not be below retry_base_delay_ms");
        return false;
    }
    if (config_.transfer.buffer_high_water == 0) {
        Logger::instance().error("buffer_high_water must be positive");
        return false;
    }
    if (config_.session.connect_addresses.empty() && config_.node.listen_port == 0) {
        Logger::instance().error("Nothing to do: set --listen-port or --connect");
        return false;
    }
    return true;
}

void Config::print() const {
    Logger::instance().info("=== Configuration ===");
    Logger::instance().info("Peer ID: " + config_.node.peer_id);
    Logger::instance().info("Log Level: " + config_.log.level);
    Logger::instance().info("Listen Port: " + std::to_string(config_.node.listen_port));
    Logger::instance().info("Chunk Size: {} .. {} bytes (initial {})",
                            config_.transfer.rate.min_chunk_size,
                            config_.transfer.rate.max_chunk_size,
                            config_.transfer.rate.initial_chunk_size);
    Logger::instance().info("Max Downloads: " + std::to_string(config_.transfer.max_concurrent_downloads));
    Logger::instance().info("Checkpoint Dir: " + config_.resume.checkpoint_dir);
    Logger::instance().info("Download Dir: " + config_.session.download_dir);
}

} // namespace peerdrop
