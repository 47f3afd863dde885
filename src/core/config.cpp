#include "fieldsync/core/config.hpp"

#include "fieldsync/model/serializer.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace fieldsync {
using json = nlohmann::json;

namespace {

template<typename T>
void read_key(const json& object, const char* section, const char* key, T& out) {
    if (!object.contains(key)) {
        return;
    }
    try {
        out = object.at(key).get<T>();
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Invalid config key '") + section + "." + key + "': " + e.what());
    }
}

void read_millis(const json& object, const char* section, const char* key, std::chrono::milliseconds& out) {
    std::int64_t value = out.count();
    read_key(object, section, key, value);
    if (value < 0) {
        throw std::runtime_error(std::string("Config key '") + section + "." + key + "' must not be negative");
    }
    out = std::chrono::milliseconds(value);
}

const json& section_of(const json& root, const char* name) {
    static const json empty = json::object();
    if (!root.contains(name)) {
        return empty;
    }
    const auto& section = root.at(name);
    if (!section.is_object()) {
        throw std::runtime_error(std::string("Config section '") + name + "' must be an object");
    }
    return section;
}

} // namespace

ClientConfig ClientConfig::from_json_text(const std::string& text) {
    json root;
    try {
        root = json::parse(text);
    } catch (const json::parse_error& e) {
        throw std::runtime_error(std::string("Config is not valid JSON: ") + e.what());
    }
    if (!root.is_object()) {
        throw std::runtime_error("Config root must be a JSON object");
    }

    ClientConfig config = defaults();

    std::string data_dir = config.data_dir.string();
    read_key(root, "", "data_dir", data_dir);
    config.data_dir = data_dir;

    const auto& server = section_of(root, "server");
    read_key(server, "server", "host", config.server.host);
    read_key(server, "server", "port", config.server.port);
    read_key(server, "server", "base_path", config.server.base_path);
    read_key(server, "server", "auth_token", config.server.auth_token);
    read_millis(server, "server", "request_timeout_ms", config.server.request_timeout);

    const auto& retry = section_of(root, "retry");
    read_millis(retry, "retry", "base_delay_ms", config.retry.base_delay);
    read_millis(retry, "retry", "max_delay_ms", config.retry.max_delay);
    read_millis(retry, "retry", "jitter_ms", config.retry.jitter);

    const auto& engine = section_of(root, "engine");
    read_key(engine, "engine", "worker_count", config.engine.worker_count);
    config.engine.worker_count = std::clamp<std::size_t>(config.engine.worker_count, 1, 4);
    read_millis(engine, "engine", "online_debounce_ms", config.engine.online_debounce);
    read_key(engine, "engine", "media_batch_limit", config.engine.media_batch_limit);

    const auto& logging = section_of(root, "logging");
    read_key(logging, "logging", "level", config.logging.level);
    read_key(logging, "logging", "pattern", config.logging.pattern);
    read_key(logging, "logging", "file", config.logging.file);

    if (root.contains("sync_settings")) {
        try {
            config.default_settings = settings_patch_from_json(root.at("sync_settings")).apply_to(config.default_settings);
        } catch (const std::exception& e) {
            throw std::runtime_error(std::string("Invalid config section 'sync_settings': ") + e.what());
        }
        if (auto res = validate_settings(config.default_settings); res.is_error()) {
            throw std::runtime_error("Invalid config section 'sync_settings': " + res.error().message);
        }
    }

    return config;
}

ClientConfig ClientConfig::load_file(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input) {
        throw std::runtime_error("Failed to open config file: " + path.string());
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return from_json_text(buffer.str());
}

} // namespace fieldsync
