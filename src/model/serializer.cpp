#include "fieldsync/model/serializer.hpp"

#include <stdexcept>

namespace fieldsync {
using json = nlohmann::json;

namespace {

EntityType parse_entity(const json& j, const char* key) {
    const auto text = j.at(key).get<std::string>();
    auto type = TypeNames::entity_from_string(text);
    if (!type) {
        throw std::runtime_error(std::string("Unknown entity type '") + text + "' in key " + key);
    }
    return *type;
}

} // namespace

void to_json(json& j, const Record& record) {
    j = json{
        {"type", TypeNames::to_string(record.type)},
        {"id", record.id},
        {"payload", record.payload},
        {"synced", record.synced},
        {"updated_at", to_epoch_ms(record.updated_at)}
    };
}

void from_json(const json& j, Record& record) {
    record.type = parse_entity(j, "type");
    record.id = j.at("id").get<std::string>();
    record.payload = j.value("payload", json::object());
    record.synced = j.value("synced", false);
    record.updated_at = from_epoch_ms(j.value("updated_at", std::int64_t{0}));
}

void to_json(json& j, const QueueItem& item) {
    j = json{
        {"id", item.id},
        {"entity_type", TypeNames::to_string(item.entity_type)},
        {"direction", TypeNames::to_string(item.direction)},
        {"payload_ref", item.payload_ref},
        {"status", TypeNames::to_string(item.status)},
        {"attempt_count", item.attempt_count},
        {"next_attempt_at", to_epoch_ms(item.next_attempt_at)},
        {"seq", item.seq},
        {"last_error", item.last_error}
    };
}

void from_json(const json& j, QueueItem& item) {
    item.id = j.at("id").get<std::string>();
    item.entity_type = parse_entity(j, "entity_type");

    const auto direction_text = j.at("direction").get<std::string>();
    auto direction = TypeNames::direction_from_string(direction_text);
    if (!direction) {
        throw std::runtime_error("Unknown queue direction '" + direction_text + "'");
    }
    item.direction = *direction;

    const auto status_text = j.value("status", std::string("pending"));
    auto status = TypeNames::status_from_string(status_text);
    if (!status) {
        throw std::runtime_error("Unknown queue status '" + status_text + "'");
    }
    item.status = *status;

    item.payload_ref = j.value("payload_ref", item.id);
    item.attempt_count = j.value("attempt_count", std::uint32_t{0});
    item.next_attempt_at = from_epoch_ms(j.value("next_attempt_at", std::int64_t{0}));
    item.seq = j.value("seq", std::uint64_t{0});
    item.last_error = j.value("last_error", std::string());
}

void to_json(json& j, const SyncSettings& settings) {
    j = json{
        {"autoSync", settings.auto_sync},
        {"syncOnWifiOnly", settings.sync_on_wifi_only},
        {"syncIntervalMs", settings.sync_interval_ms},
        {"maxRetries", settings.max_retries}
    };
}

void from_json(const json& j, SyncSettings& settings) {
    settings = settings_patch_from_json(j).apply_to(SyncSettings{});
}

SyncSettingsPatch settings_patch_from_json(const json& j) {
    if (!j.is_object()) {
        throw std::runtime_error("Sync settings must be a JSON object");
    }
    SyncSettingsPatch patch;
    if (j.contains("autoSync")) patch.auto_sync = j.at("autoSync").get<bool>();
    if (j.contains("syncOnWifiOnly")) patch.sync_on_wifi_only = j.at("syncOnWifiOnly").get<bool>();
    if (j.contains("syncIntervalMs")) patch.sync_interval_ms = j.at("syncIntervalMs").get<std::int64_t>();
    if (j.contains("maxRetries")) {
        const auto& retries = j.at("maxRetries");
        if (retries.is_number_integer() && retries.get<std::int64_t>() < 0) {
            throw std::runtime_error("maxRetries must not be negative");
        }
        patch.max_retries = retries.get<std::uint32_t>();
    }
    return patch;
}

Result<void> validate_settings(const SyncSettings& settings) {
    if (settings.sync_interval_ms <= 0) {
        return Err<void>(ErrorKind::InvalidArgument, "syncIntervalMs must be positive");
    }
    return Ok();
}

Record record_from_remote(EntityType type, const json& document) {
    if (!document.is_object() || !document.contains("id")) {
        throw std::runtime_error(std::string("Remote ") + TypeNames::to_string(type) + " without id");
    }
    Record record;
    record.type = type;
    const auto& id = document.at("id");
    record.id = id.is_string() ? id.get<std::string>() : id.dump();
    record.payload = document;
    record.synced = true;
    return record;
}

bool is_valid_text(const json& value) {
    try {
        (void)value.dump();
        return true;
    } catch (const json::type_error&) {
        return false;
    }
}

bool is_valid_utf8(const std::string& text) {
    return is_valid_text(json(text));
}

} // namespace fieldsync
