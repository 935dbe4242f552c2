#include "Config.hpp"
#include <spdlog/spdlog.h>
#include <fstream>
#include <cstdlib>
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <utility>
#include <vector>

namespace kvmrpc {

namespace {

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

std::string toLower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

std::string toUpper(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return str;
}

bool parseBool(const std::string& value, bool& out) {
    std::string v = toLower(value);
    if (v == "true" || v == "1" || v == "yes" || v == "on") {
        out = true;
        return true;
    }
    if (v == "false" || v == "0" || v == "no" || v == "off") {
        out = false;
        return true;
    }
    return false;
}

bool parseUnsigned(const std::string& value, size_t& out) {
    if (value.empty() || value[0] == '-') {
        return false;
    }
    try {
        size_t pos = 0;
        unsigned long long parsed = std::stoull(value, &pos);
        if (pos != value.size()) {
            return false;
        }
        out = static_cast<size_t>(parsed);
        return true;
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}

// All known keys, used to look up environment overrides
const std::vector<std::pair<std::string, std::string>>& knownKeys() {
    static const std::vector<std::pair<std::string, std::string>> keys = {
        {"connection", "uri"},
        {"connection", "max_connections"},
        {"connection", "checkout_timeout_ms"},
        {"cache", "max_entries"},
        {"cache", "ttl"},
        {"cache", "enabled"},
        {"vm", "network"},
        {"vm", "network_mode"},
        {"vm", "emulator"},
        {"vm", "arch"},
        {"vm", "vnc_listen"},
        {"logging", "level"},
        {"logging", "file"},
        {"logging", "max_file_size_mb"},
        {"logging", "max_files"},
    };
    return keys;
}

}  // namespace

bool Config::set(const std::string& section, const std::string& key, const std::string& value) {
    size_t number = 0;
    bool flag = false;

    auto badValue = [&]() {
        spdlog::warn("Ignoring invalid value '{}' for {}.{}", value, section, key);
        return true;
    };

    if (section == "connection") {
        if (key == "uri") {
            connection.uri = value;
        } else if (key == "max_connections") {
            if (!parseUnsigned(value, number)) return badValue();
            connection.max_connections = number;
        } else if (key == "checkout_timeout_ms") {
            if (!parseUnsigned(value, number)) return badValue();
            connection.checkout_timeout = std::chrono::milliseconds(number);
        } else {
            return false;
        }
    }
    else if (section == "cache") {
        if (key == "max_entries") {
            if (!parseUnsigned(value, number)) return badValue();
            cache.max_entries = number;
        } else if (key == "ttl") {
            if (!parseUnsigned(value, number)) return badValue();
            cache.ttl = std::chrono::seconds(number);
        } else if (key == "enabled") {
            if (!parseBool(value, flag)) return badValue();
            cache.enabled = flag;
        } else {
            return false;
        }
    }
    else if (section == "vm") {
        if (key == "network") vm.network = value;
        else if (key == "network_mode") vm.network_mode = value;
        else if (key == "emulator") vm.emulator = value;
        else if (key == "arch") vm.arch = value;
        else if (key == "vnc_listen") vm.vnc_listen = value;
        else return false;
    }
    else if (section == "logging") {
        if (key == "level") {
            logging.level = value;
        } else if (key == "file") {
            logging.file = value;
        } else if (key == "max_file_size_mb") {
            if (!parseUnsigned(value, number)) return badValue();
            logging.max_file_size = number * 1024 * 1024;
        } else if (key == "max_files") {
            if (!parseUnsigned(value, number)) return badValue();
            logging.max_files = number;
        } else {
            return false;
        }
    }
    else {
        return false;
    }

    return true;
}

std::optional<Config> Config::loadFromFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }

    Config config;
    std::string line;
    std::string current_section;

    while (std::getline(file, line)) {
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        // Section header
        if (line[0] == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.size() - 2));
            continue;
        }

        // Key-value pair
        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        // Remove quotes if present
        if (value.size() >= 2 &&
            ((value.front() == '"' && value.back() == '"') ||
             (value.front() == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.size() - 2);
        }

        if (!config.set(current_section, key, value)) {
            spdlog::warn("Unknown configuration key '{}' in section [{}]", key, current_section);
        }
    }

    return config;
}

void Config::applyEnvOverrides() {
    for (const auto& [section, key] : knownKeys()) {
        std::string env_key = "KVM_RPC_" + toUpper(section) + "_" + toUpper(key);
        const char* env_value = std::getenv(env_key.c_str());
        if (!env_value) {
            continue;
        }
        spdlog::debug("Applying environment override {}", env_key);
        set(section, key, env_value);
    }
}

bool Config::validate() const {
    if (connection.uri.empty()) {
        spdlog::error("Hypervisor URI is required");
        return false;
    }

    if (cache.enabled && cache.ttl.count() <= 0) {
        spdlog::error("Cache TTL must be positive when caching is enabled");
        return false;
    }

    if (vm.network_mode != "network" && vm.network_mode != "bridge") {
        spdlog::error("Unknown network mode: {} (expected network or bridge)", vm.network_mode);
        return false;
    }

    if (spdlog::level::from_str(logging.level) == spdlog::level::off && logging.level != "off") {
        spdlog::error("Unknown log level: {}", logging.level);
        return false;
    }

    if (!logging.file.empty() && logging.max_files == 0) {
        spdlog::error("logging.max_files must be at least 1 when a log file is set");
        return false;
    }

    return true;
}

}  // namespace kvmrpc
