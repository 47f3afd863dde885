#pragma once

/**
 * @file serializer.hpp
 * @brief JSON mapping for persisted and transmitted types
 *
 * The same representation is used on disk (records.json, queue.json,
 * state.json) and on the wire (record bodies sent to the server).
 * from_json throws std::runtime_error / nlohmann::json::exception on
 * malformed input; callers turn that into a Storage error.
 */

#include "fieldsync/core/result.hpp"
#include "fieldsync/model/types.hpp"

#include <nlohmann/json.hpp>

namespace fieldsync {

void to_json(nlohmann::json& j, const Record& record);
void from_json(const nlohmann::json& j, Record& record);

void to_json(nlohmann::json& j, const QueueItem& item);
void from_json(const nlohmann::json& j, QueueItem& item);

void to_json(nlohmann::json& j, const SyncSettings& settings);
void from_json(const nlohmann::json& j, SyncSettings& settings);

/**
 * @brief Parse a settings patch; only keys present in the object are set
 */
SyncSettingsPatch settings_patch_from_json(const nlohmann::json& j);

/// InvalidArgument naming the first out-of-range field
Result<void> validate_settings(const SyncSettings& settings);

/**
 * @brief Build a Record of the given type from a remote JSON document
 *
 * Remote documents carry their id under "id"; everything else is kept as the
 * record payload. Throws std::runtime_error when the id is missing.
 */
Record record_from_remote(EntityType type, const nlohmann::json& document);

/**
 * @brief True when every string in `value` (keys included) is valid UTF-8
 *
 * Documents that fail this check cannot be persisted or sent.
 */
bool is_valid_text(const nlohmann::json& value);
bool is_valid_utf8(const std::string& text);

} // namespace fieldsync
