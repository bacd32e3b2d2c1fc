#pragma once

#include <string>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include "harmony/markers.h"

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

class Config {
public:
    Config();

    // Load configuration from $XDG_CONFIG_HOME/harmony-bridge/config.json
    // (or the path given with set_config_path). A missing file keeps defaults.
    void load();

    // Validation
    void validate() const;

    // Get user's home directory (HOME env var first, then passwd)
    static std::string get_home_directory();

    // Get default config path (XDG-compliant)
    static std::string get_default_config_path();

    // Set custom config file path (for command-line override)
    void set_config_path(const std::string& config_path) { custom_config_path_ = config_path; }

    // Set marker table from a preset name ("harmony", "bracket")
    void set_markers(const std::string& preset);

    // Set payload cap from a size string ("1M", "512K", "65536")
    void set_max_block_bytes(const std::string& size_str);

    // Public configuration variables
    std::string upstream_url;
    std::string host;
    int port;
    std::string format;                  // "xml" or "json"
    std::string markers_name;            // Preset name, or "custom"
    Harmony::MarkerTable markers;
    size_t max_block_bytes;
    bool strip_namespace;
    bool log_analysis;
    long timeout;                        // Upstream request timeout, seconds
    long connect_timeout;                // Upstream connect timeout, seconds
    std::string log_file;
    nlohmann::json json;                 // Parsed config file

    static size_t parse_size_string(const std::string& size_str);

private:
    std::string get_config_path() const;
    void set_defaults();

    std::string custom_config_path_;
};
