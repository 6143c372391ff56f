#include "transferd/base/config.h"
#include "transferd/base/logger.h"
#include "CLI/CLI.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <map>
#include <sstream>
#include <type_traits>

namespace transferd {

namespace {

using Section = std::map<std::string, std::string>;

std::string trim(const std::string& str) {
    auto start = std::find_if(str.begin(), str.end(), [](unsigned char c) { return !std::isspace(c); });
    auto end = std::find_if(str.rbegin(), str.rend(), [](unsigned char c) { return !std::isspace(c); }).base();
    return (start < end) ? std::string(start, end) : "";
}

std::vector<std::string> split_list(const std::string& value) {
    std::vector<std::string> items;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = trim(item);
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

// Simple INI-style parser for config files
bool parse_ini_file(const std::string& path, std::map<std::string, Section>& sections) {
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
            // Remove quotes
            if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
                value.back() == value.front()) {
                value = value.substr(1, value.size() - 2);
            }
            sections[current_section][key] = value;
        }
    }
    return true;
}

template<typename T>
void assign_number(const Section& s, const std::string& key, T& target) {
    auto it = s.find(key);
    if (it == s.end()) return;
    try {
        if constexpr (std::is_floating_point_v<T>) {
            target = static_cast<T>(std::stod(it->second));
        } else {
            target = static_cast<T>(std::stoull(it->second));
        }
    } catch (const std::exception&) {
        Logger::instance().warning("Ignoring invalid value for {}: '{}'", key, it->second);
    }
}

void assign_string(const Section& s, const std::string& key, std::string& target) {
    auto it = s.find(key);
    if (it != s.end()) target = it->second;
}

template<typename T>
void env_number(const char* name, T& target) {
    const char* val = std::getenv(name);
    if (!val) return;
    try {
        if constexpr (std::is_floating_point_v<T>) {
            target = static_cast<T>(std::stod(val));
        } else {
            target = static_cast<T>(std::stoull(val));
        }
    } catch (const std::exception&) {
        Logger::instance().warning("Ignoring invalid value for {}: '{}'", name, val);
    }
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

    std::map<std::string, Section> sections;
    if (!parse_ini_file(path, sections)) {
        Logger::instance().error("Failed to read config file: " + path);
        return false;
    }
    config_file_ = path;

    if (sections.count("log")) {
        auto& s = sections["log"];
        assign_string(s, "level", config_.log.level);
        assign_string(s, "output", config_.log.output);
        assign_string(s, "file_path", config_.log.file_path);
    }

    if (sections.count("transfer")) {
        auto& s = sections["transfer"];
        assign_string(s, "download_dir", config_.transfer.download_dir);
        assign_string(s, "state_dir", config_.transfer.state_dir);
        assign_number(s, "max_concurrent", config_.transfer.max_concurrent);
        assign_number(s, "request_timeout_sec", config_.transfer.request_timeout_sec);
        assign_number(s, "max_attempts", config_.transfer.max_attempts);
        assign_number(s, "chunk_size_kb", config_.transfer.chunk_size_kb);
        assign_string(s, "auth_token", config_.transfer.auth_token);
        assign_string(s, "user_agent", config_.transfer.user_agent);
    }

    if (sections.count("retry")) {
        auto& s = sections["retry"];
        assign_number(s, "base_delay_ms", config_.retry.base_delay_ms);
        assign_number(s, "factor", config_.retry.factor);
        assign_number(s, "max_delay_ms", config_.retry.max_delay_ms);
        assign_number(s, "jitter_ratio", config_.retry.jitter_ratio);
    }

    if (sections.count("channel")) {
        auto& s = sections["channel"];
        assign_string(s, "url", config_.channel.url);
        assign_string(s, "auth_token", config_.channel.auth_token);
        assign_string(s, "user_id", config_.channel.user_id);
        assign_number(s, "heartbeat_interval_sec", config_.channel.heartbeat_interval_sec);
        assign_number(s, "pong_timeout_sec", config_.channel.pong_timeout_sec);
        assign_number(s, "auth_timeout_sec", config_.channel.auth_timeout_sec);
        assign_number(s, "reconnect_base_ms", config_.channel.reconnect_base_ms);
        assign_number(s, "reconnect_max_delay_ms", config_.channel.reconnect_max_delay_ms);
        assign_number(s, "max_reconnect_attempts", config_.channel.max_reconnect_attempts);
        if (s.count("subscriptions")) {
            config_.channel.subscriptions = split_list(s["subscriptions"]);
        }
    }

    if (sections.count("placement")) {
        assign_string(sections["placement"], "notify_url", config_.placement.notify_url);
    }

    Logger::instance().info("Config loaded successfully from: " + path);
    return true;
}

bool Config::load_from_env() {
    Logger::instance().debug("Loading config from environment variables");
    override_from_env();
    return true;
}

void Config::override_from_env() {
    // Log config
    if (const char* val = std::getenv("TRANSFERD_LOG_LEVEL")) {
        config_.log.level = val;
    }
    if (const char* val = std::getenv("TRANSFERD_LOG_FILE")) {
        config_.log.file_path = val;
        config_.log.output = "file";
    }

    // Transfer
    if (const char* val = std::getenv("TRANSFERD_DOWNLOAD_DIR")) {
        config_.transfer.download_dir = val;
    }
    if (const char* val = std::getenv("TRANSFERD_STATE_DIR")) {
        config_.transfer.state_dir = val;
    }
    env_number("TRANSFERD_MAX_CONCURRENT", config_.transfer.max_concurrent);
    env_number("TRANSFERD_REQUEST_TIMEOUT", config_.transfer.request_timeout_sec);
    env_number("TRANSFERD_MAX_ATTEMPTS", config_.transfer.max_attempts);
    if (const char* val = std::getenv("TRANSFERD_AUTH_TOKEN")) {
        config_.transfer.auth_token = val;
    }

    // Channel
    if (const char* val = std::getenv("TRANSFERD_CHANNEL_URL")) {
        config_.channel.url = val;
    }
    if (const char* val = std::getenv("TRANSFERD_CHANNEL_TOKEN")) {
        config_.channel.auth_token = val;
    }

    // Placement
    if (const char* val = std::getenv("TRANSFERD_PLACEMENT_URL")) {
        config_.placement.notify_url = val;
    }
}

void Config::add_command_line_options(CLI::App& app) {
    // Log options
    app.add_option("--log-level", config_.log.level, "Log level (debug, info, warning, error)");
    app.add_option("--log-output", config_.log.output, "Log output (stdout, stderr, file)");
    app.add_option("--log-file", config_.log.file_path, "Log file path");

    // Transfer options
    app.add_option("--download-dir", config_.transfer.download_dir, "Directory finished files are placed in");
    app.add_option("--state-dir", config_.transfer.state_dir, "Directory transfer records are persisted in");
    app.add_option("--max-concurrent", config_.transfer.max_concurrent, "Maximum simultaneous transfers");
    app.add_option("--request-timeout", config_.transfer.request_timeout_sec, "Per-request I/O timeout (seconds)");
    app.add_option("--max-attempts", config_.transfer.max_attempts, "Transient failures tolerated per transfer run");
    app.add_option("--chunk-size", config_.transfer.chunk_size_kb, "Read chunk size (KiB)");
    app.add_option("--auth-token", config_.transfer.auth_token, "Bearer token injected into transfer requests");

    // Retry options
    app.add_option("--retry-base-delay", config_.retry.base_delay_ms, "Retry base delay (ms)");
    app.add_option("--retry-factor", config_.retry.factor, "Retry delay growth factor");
    app.add_option("--retry-max-delay", config_.retry.max_delay_ms, "Retry delay cap (ms)");

    // Channel options
    app.add_option("--channel-url", config_.channel.url, "Notification channel WebSocket URL");
    app.add_option("--channel-token", config_.channel.auth_token, "Notification channel auth token");
    app.add_option("--channel-user", config_.channel.user_id, "User id sent in the auth handshake");
    app.add_option("--channel-heartbeat", config_.channel.heartbeat_interval_sec, "Heartbeat interval (seconds)");
    app.add_option("--channel-max-reconnects", config_.channel.max_reconnect_attempts, "Reconnect attempts before giving up");
    app.add_option("--channel-subscribe", config_.channel.subscriptions, "Channels to subscribe to")->delimiter(',');

    // Placement options
    app.add_option("--placement-url", config_.placement.notify_url, "URL notified when a transfer completes");
}

void Config::apply_logging() const {
    auto& logger = Logger::instance();
    logger.set_level(parse_log_level(config_.log.level));
    if (config_.log.output == "file" && !config_.log.file_path.empty()) {
        logger.set_file_output(config_.log.file_path);
    } else if (config_.log.output == "stderr") {
        logger.set_output(LogOutput::Stderr);
    } else {
        logger.set_output(LogOutput::Stdout);
    }
}

bool Config::validate() const {
    if (config_.transfer.max_concurrent == 0) {
        Logger::instance().error("transfer.max_concurrent must be at least 1");
        return false;
    }
    if (config_.transfer.max_attempts == 0) {
        Logger::instance().error("transfer.max_attempts must be at least 1");
        return false;
    }
    if (config_.transfer.chunk_size_kb == 0) {
        Logger::instance().error("transfer.chunk_size_kb must be at least 1");
        return false;
    }
    if (config_.transfer.state_dir.empty() || config_.transfer.download_dir.empty()) {
        Logger::instance().error("transfer.state_dir and transfer.download_dir are required");
        return false;
    }
    if (config_.retry.factor < 1.0) {
        Logger::instance().error("retry.factor must be >= 1.0");
        return false;
    }
    if (config_.retry.max_delay_ms < config_.retry.base_delay_ms) {
        Logger::instance().error("retry.max_delay_ms must be >= retry.base_delay_ms");
        return false;
    }
    if (config_.retry.jitter_ratio < 0.0 || config_.retry.jitter_ratio > 1.0) {
        Logger::instance().error("retry.jitter_ratio must be within [0, 1]");
        return false;
    }
    if (!config_.channel.url.empty() &&
        config_.channel.url.rfind("ws://", 0) != 0 && config_.channel.url.rfind("wss://", 0) != 0) {
        Logger::instance().error("channel.url must start with ws:// or wss://");
        return false;
    }
    if (!config_.channel.url.empty() && config_.channel.heartbeat_interval_sec == 0) {
        Logger::instance().error("channel.heartbeat_interval_sec must be at least 1");
        return false;
    }
    return true;
}

void Config::print() const {
    Logger::instance().info("=== Configuration ===");
    Logger::instance().info("Log Level: " + config_.log.level);
    Logger::instance().info("Download Dir: " + config_.transfer.download_dir);
    Logger::instance().info("State Dir: " + config_.transfer.state_dir);
    Logger::instance().info("Max Concurrent: " + std::to_string(config_.transfer.max_concurrent));
    Logger::instance().info("Max Attempts: " + std::to_string(config_.transfer.max_attempts));
    Logger::instance().info("Channel: " + (config_.channel.url.empty() ? std::string("disabled") : config_.channel.url));
    Logger::instance().info("Placement: " + (config_.placement.notify_url.empty() ? std::string("disabled") : config_.placement.notify_url));
}

} // namespace transferd
