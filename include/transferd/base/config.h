#ifndef TRANSFERD_BASE_CONFIG_H
#define TRANSFERD_BASE_CONFIG_H

#include <cstdint>
#include <string>
#include <vector>

namespace CLI {
class App;
}

namespace transferd {

// Log configuration
struct LogConfig {
    std::string level = "info";
    std::string output = "stdout";  // stdout, stderr, file
    std::string file_path = "";
};

// Transfer queue and worker configuration
struct TransferConfig {
    std::string download_dir = "./downloads";
    std::string state_dir = "./state";
    uint32_t max_concurrent = 3;
    uint32_t request_timeout_sec = 30;
    uint32_t max_attempts = 3;        // transient failures tolerated per run
    uint32_t chunk_size_kb = 64;
    std::string auth_token;           // injected as "Authorization: Bearer"
    std::string user_agent = "transferd/0.1.0";
};

// Backoff schedule shared by the worker and the notification channel
struct RetryConfig {
    uint64_t base_delay_ms = 1000;
    double factor = 2.0;
    uint64_t max_delay_ms = 60000;
    double jitter_ratio = 0.2;
};

// Notification channel configuration
struct ChannelConfig {
    std::string url;                   // ws:// or wss://, empty disables the channel
    std::string auth_token;
    std::string user_id = "transferd";
    uint32_t heartbeat_interval_sec = 30;
    uint32_t pong_timeout_sec = 10;
    uint32_t auth_timeout_sec = 10;
    uint64_t reconnect_base_ms = 5000;
    uint64_t reconnect_max_delay_ms = 300000;
    uint32_t max_reconnect_attempts = 5;
    std::vector<std::string> subscriptions = {"downloads"};
};

// Placement notifier configuration
struct PlacementConfig {
    std::string notify_url;            // empty disables the notifier
};

// Global configuration
struct GlobalConfig {
    LogConfig log;
    TransferConfig transfer;
    RetryConfig retry;
    ChannelConfig channel;
    PlacementConfig placement;
};

class Config {
public:
    static Config& instance();

    // Load configuration from an INI-style file
    bool load_from_file(const std::string& path);

    // Load configuration from TRANSFERD_* environment variables
    bool load_from_env();

    // Register command line options on a CLI11 app; values land in this config
    void add_command_line_options(CLI::App& app);

    // Apply settings that have side effects (log level, log file)
    void apply_logging() const;

    // Get configuration
    const GlobalConfig& get() const { return config_; }
    GlobalConfig& get() { return config_; }

    // Get config file path that was loaded
    const std::string& get_config_file() const { return config_file_; }

    // Restore defaults
    void reset();

    // Check ranges of configured values
    bool validate() const;

    // Print configuration (for debugging)
    void print() const;

private:
    Config() = default;
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    void override_from_env();

    GlobalConfig config_;
    std::string config_file_;
};

} // namespace transferd

#endif // TRANSFERD_BASE_CONFIG_H
