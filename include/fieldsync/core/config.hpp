#pragma once

#include "fieldsync/model/types.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace fieldsync {

struct ServerConfig {
    std::string host = "127.0.0.1";
    std::uint16_t port = 8080;
    std::string base_path = "/api/v1";
    std::string auth_token;
    std::chrono::milliseconds request_timeout{15000};
};

struct RetryConfig {
    std::chrono::milliseconds base_delay{1000};
    std::chrono::milliseconds max_delay{300000};
    std::chrono::milliseconds jitter{250};  ///< Clamped to base_delay by RetryPolicy
};

struct EngineConfig {
    std::size_t worker_count = 4;                       ///< Concurrent transport calls per phase (1..4)
    std::chrono::milliseconds online_debounce{2000};    ///< Delay before syncing after coming online
    std::size_t media_batch_limit = 64;
};

struct LoggingConfig {
    std::string level = "info";
    std::string pattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";
    std::string file;                                   ///< Empty = console only
};

/**
 * @brief Client configuration, loaded from a JSON document
 *
 * Every key is optional. A key with the wrong JSON type is a configuration
 * error and raises std::runtime_error naming the key.
 *
 * EXAMPLE:
 * {
 *   "data_dir": "/var/lib/fieldsync",
 *   "server": { "host": "collect.example.org", "port": 443, "request_timeout_ms": 10000 },
 *   "retry": { "base_delay_ms": 2000 },
 *   "sync_settings": { "syncOnWifiOnly": true }
 * }
 */
struct ClientConfig {
    std::filesystem::path data_dir = "fieldsync-data";
    ServerConfig server;
    RetryConfig retry;
    EngineConfig engine;
    LoggingConfig logging;
    SyncSettings default_settings;  ///< Used until settings were persisted once

    static ClientConfig defaults() { return ClientConfig{}; }

    static ClientConfig from_json_text(const std::string& text);
    static ClientConfig load_file(const std::filesystem::path& path);
};

} // namespace fieldsync
