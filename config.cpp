#include "bridge.h"
#include "config.h"

#include <fstream>
#include <filesystem>
#include <cstdlib>
#include <pwd.h>
#include <unistd.h>
#include <algorithm>
#include <limits>

using json = nlohmann::json;

Config::Config() {
    set_defaults();
}

void Config::set_defaults() {
    upstream_url = "http://localhost:1234";  // LM Studio
    host = "0.0.0.0";
    port = 8000;
    format = "xml";
    markers_name = "harmony";
    markers = Harmony::MarkerTable::harmony();
    max_block_bytes = 1024 * 1024;
    strip_namespace = true;
    log_analysis = false;
    timeout = 600;
    connect_timeout = 10;
    log_file = "";
}

void Config::set_markers(const std::string& preset) {
    try {
        markers = Harmony::MarkerTable::from_preset(preset);
    } catch (const std::invalid_argument& e) {
        throw ConfigError(e.what());
    }
    markers_name = preset;
}

void Config::set_max_block_bytes(const std::string& size_str) {
    max_block_bytes = parse_size_string(size_str);
}

size_t Config::parse_size_string(const std::string& size_str) {
    if (size_str.empty()) {
        throw ConfigError("Empty size string");
    }

    // Plain byte count
    bool all_digits = std::all_of(size_str.begin(), size_str.end(),
                                  [](char c) { return isdigit(static_cast<unsigned char>(c)); });
    if (all_digits) {
        try {
            return std::stoull(size_str);
        } catch (const std::exception&) {
            throw ConfigError("Size out of range: " + size_str);
        }
    }

    // Number + suffix
    size_t pos = 0;
    while (pos < size_str.length() && (isdigit(static_cast<unsigned char>(size_str[pos])) || size_str[pos] == '.')) {
        pos++;
    }

    if (pos == 0) {
        throw ConfigError("Invalid size string (no number): " + size_str);
    }

    double value = 0;
    try {
        value = std::stod(size_str.substr(0, pos));
    } catch (const std::exception&) {
        throw ConfigError("Invalid size string: " + size_str);
    }
    std::string suffix = size_str.substr(pos);

    suffix.erase(std::remove_if(suffix.begin(), suffix.end(), ::isspace), suffix.end());
    std::transform(suffix.begin(), suffix.end(), suffix.begin(), ::toupper);

    size_t multiplier = 1;
    if (suffix.empty() || suffix == "B") {
        multiplier = 1;
    } else if (suffix == "K" || suffix == "KB") {
        multiplier = 1024;
    } else if (suffix == "M" || suffix == "MB") {
        multiplier = 1024 * 1024;
    } else if (suffix == "G" || suffix == "GB") {
        multiplier = 1024ULL * 1024 * 1024;
    } else {
        throw ConfigError("Invalid size suffix: " + suffix + " (use K, M, G, KB, MB or GB)");
    }

    double bytes = value * static_cast<double>(multiplier);
    if (bytes >= static_cast<double>(std::numeric_limits<size_t>::max())) {
        throw ConfigError("Size out of range: " + size_str);
    }
    return static_cast<size_t>(bytes);
}

std::string Config::get_home_directory() {
    // HOME first (respects user's explicit setting)
    const char* home = getenv("HOME");
    if (home && home[0] != '\0') {
        return std::string(home);
    }

    struct passwd* pw = getpwuid(getuid());
    if (pw && pw->pw_dir) {
        return std::string(pw->pw_dir);
    }

    throw ConfigError("Unable to determine home directory");
}

std::string Config::get_default_config_path() {
    std::string config_home;
    const char* xdg_config = getenv("XDG_CONFIG_HOME");
    if (xdg_config && xdg_config[0] != '\0') {
        config_home = xdg_config;
    } else {
        config_home = get_home_directory() + "/.config";
    }
    return config_home + "/harmony-bridge/config.json";
}

std::string Config::get_config_path() const {
    if (!custom_config_path_.empty()) {
        return custom_config_path_;
    }
    return get_default_config_path();
}

void Config::load() {
    std::string config_path = get_config_path();

    dout(1) << "Loading config from: " << config_path << std::endl;

    if (!std::filesystem::exists(config_path)) {
        // An explicit --config must exist
        if (!custom_config_path_.empty()) {
            throw ConfigError("Config file not found: " + config_path);
        }
        dout(1) << "Config file not found, using defaults: " << config_path << std::endl;
        return;
    }

    try {
        std::ifstream file(config_path);
        if (!file.is_open()) {
            throw ConfigError("Failed to open config file: " + config_path);
        }

        file >> json;

        if (!json.is_object()) {
            throw ConfigError("Config file must contain a JSON object: " + config_path);
        }

        if (json.contains("upstream_url")) {
            upstream_url = json["upstream_url"].get<std::string>();
        } else if (json.contains("lm_studio_url")) {
            upstream_url = json["lm_studio_url"].get<std::string>();
        }
        if (json.contains("host")) {
            host = json["host"].get<std::string>();
        }
        if (json.contains("port")) {
            port = json["port"].get<int>();
        }
        if (json.contains("format")) {
            format = json["format"].get<std::string>();
        }
        if (json.contains("markers")) {
            markers = Harmony::MarkerTable::from_json(json["markers"]);
            markers_name = json["markers"].is_string() ? json["markers"].get<std::string>() : "custom";
        }

        // Payload cap, as a byte count or a size string
        if (json.contains("max_block_bytes")) {
            if (json["max_block_bytes"].is_string()) {
                max_block_bytes = parse_size_string(json["max_block_bytes"].get<std::string>());
            } else {
                max_block_bytes = json["max_block_bytes"].get<size_t>();
            }
        }

        if (json.contains("strip_namespace")) {
            strip_namespace = json["strip_namespace"].get<bool>();
        }
        if (json.contains("log_analysis")) {
            log_analysis = json["log_analysis"].get<bool>();
        }
        if (json.contains("timeout")) {
            timeout = json["timeout"].get<long>();
        }
        if (json.contains("connect_timeout")) {
            connect_timeout = json["connect_timeout"].get<long>();
        }
        if (json.contains("log_file")) {
            log_file = json["log_file"].get<std::string>();
        }

        dout(1) << "Loaded configuration from: " << config_path << std::endl;

    } catch (const ConfigError&) {
        throw;
    } catch (const json::exception& e) {
        throw ConfigError("Invalid JSON in config file: " + std::string(e.what()));
    } catch (const std::exception& e) {
        throw ConfigError("Error loading config: " + std::string(e.what()));
    }
}

void Config::validate() const {
    if (upstream_url.empty()) {
        throw ConfigError("upstream_url cannot be empty");
    }
    if (upstream_url.rfind("http://", 0) != 0 && upstream_url.rfind("https://", 0) != 0) {
        throw ConfigError("upstream_url must start with http:// or https://: " + upstream_url);
    }
    if (host.empty()) {
        throw ConfigError("host cannot be empty");
    }
    if (port < 1 || port > 65535) {
        throw ConfigError("port must be between 1 and 65535");
    }
    if (format != "xml" && format != "json") {
        throw ConfigError("format must be xml or json, got: " + format);
    }
    if (markers.empty()) {
        throw ConfigError("markers table is empty");
    }
    if (max_block_bytes != 0 && max_block_bytes < 1024) {
        throw ConfigError("max_block_bytes must be 0 (unlimited) or at least 1K");
    }
    if (timeout < 0 || connect_timeout < 0) {
        throw ConfigError("timeouts cannot be negative");
    }

    dout(1) << "Configuration validation passed" << std::endl;
}
