#pragma once

#include <string>
#include <chrono>
#include <cstddef>
#include <optional>
#include <filesystem>

namespace kvmrpc {

struct ConnectionConfig {
    std::string uri = "qemu:///system";
    size_t max_connections = 5;
    std::chrono::milliseconds checkout_timeout{30000};
};

struct CacheConfig {
    size_t max_entries = 50;
    std::chrono::seconds ttl{60};
    bool enabled = true;
};

struct VmConfig {
    std::string network = "default";
    std::string network_mode = "network";  // network, bridge
    std::string emulator = "/usr/bin/qemu-system-x86_64";
    std::string arch = "x86_64";
    std::string vnc_listen = "0.0.0.0";
};

struct LoggingConfig {
    std::string level = "info";
    std::string file;  // empty: stderr only
    size_t max_file_size = 10 * 1024 * 1024;  // 10 MB
    size_t max_files = 5;
};

struct Config {
    ConnectionConfig connection;
    CacheConfig cache;
    VmConfig vm;
    LoggingConfig logging;

    // Load from file
    static std::optional<Config> loadFromFile(const std::filesystem::path& path);

    // Override values from KVM_RPC_<SECTION>_<KEY> environment variables
    void applyEnvOverrides();

    // Validate configuration
    bool validate() const;

    // Apply one "section.key = value" setting; false if the key is unknown
    bool set(const std::string& section, const std::string& key, const std::string& value);
};

}  // namespace kvmrpc
