#include "fieldsync/storage/local_store.hpp"

#include "fieldsync/model/serializer.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <optional>

namespace fieldsync::storage {
using json = nlohmann::json;

namespace {

constexpr int kFormatVersion = 1;

} // namespace

LocalStore::LocalStore(std::filesystem::path data_dir)
    : data_dir_(std::move(data_dir)),
      file_(data_dir_ / "records.json") {}

Result<void> LocalStore::load() {
    auto document = file_.read();
    if (document.is_error()) {
        return Err<void>(document.error());
    }

    std::unordered_map<std::string, Record> loaded;
    if (document.value().has_value()) {
        try {
            for (const auto& entry : document.value()->at("records")) {
                Record record = entry.get<Record>();
                loaded[make_key(record.type, record.id)] = std::move(record);
            }
        } catch (const std::exception& e) {
            return Err<void>(ErrorKind::Storage, std::string("Failed to decode records: ") + e.what());
        }
    }

    std::unique_lock lock(mutex_);
    records_ = std::move(loaded);
    spdlog::debug("LocalStore loaded {} records from {}", records_.size(), file_.path().string());
    return Ok();
}

Result<Record> LocalStore::get(EntityType type, const std::string& id) const {
    std::shared_lock lock(mutex_);
    auto it = records_.find(make_key(type, id));
    if (it == records_.end()) {
        return Err<Record>(ErrorKind::NotFound,
                           std::string("Record not found: ") + TypeNames::to_string(type) + "/" + id);
    }
    return Ok(it->second);
}

std::vector<Record> LocalStore::list(EntityType type) const {
    auto result = query([type](const Record& record) { return record.type == type; });
    std::sort(result.begin(), result.end(), [](const Record& lhs, const Record& rhs) {
        return lhs.id < rhs.id;
    });
    return result;
}

Result<Record> LocalStore::upsert(Record record) {
    if (record.id.empty()) {
        return Err<Record>(ErrorKind::InvalidArgument, "Record id must not be empty");
    }
    record.updated_at = Clock::now();

    std::unique_lock lock(mutex_);
    const auto key = make_key(record.type, record.id);

    std::optional<Record> previous;
    if (auto it = records_.find(key); it != records_.end()) {
        previous = it->second;
    }
    records_[key] = record;

    if (auto res = persist_locked(); res.is_error()) {
        if (previous) {
            records_[key] = std::move(*previous);
        } else {
            records_.erase(key);
        }
        return Err<Record>(res.error());
    }
    return Ok(std::move(record));
}

Result<bool> LocalStore::mark_synced(EntityType type, const std::string& id,
                                     std::optional<TimePoint> version) {
    std::unique_lock lock(mutex_);
    auto it = records_.find(make_key(type, id));
    if (it == records_.end()) {
        return Err<bool>(ErrorKind::NotFound,
                         std::string("Record not found: ") + TypeNames::to_string(type) + "/" + id);
    }
    if (version && it->second.updated_at != *version) {
        return Ok(false);
    }
    if (it->second.synced) {
        return Ok(true);
    }

    const Record previous = it->second;
    it->second.synced = true;

    if (auto res = persist_locked(); res.is_error()) {
        it->second = previous;
        return Err<bool>(res.error());
    }
    return Ok(true);
}

Result<void> LocalStore::remove(EntityType type, const std::string& id) {
    std::unique_lock lock(mutex_);
    auto it = records_.find(make_key(type, id));
    if (it == records_.end()) {
        return Err<void>(ErrorKind::NotFound,
                         std::string("Record not found: ") + TypeNames::to_string(type) + "/" + id);
    }

    Record removed = std::move(it->second);
    records_.erase(it);

    if (auto res = persist_locked(); res.is_error()) {
        records_.emplace(make_key(removed.type, removed.id), std::move(removed));
        return res;
    }
    return Ok();
}

Result<void> LocalStore::clear() {
    std::unique_lock lock(mutex_);
    auto previous = std::move(records_);
    records_.clear();

    if (auto res = persist_locked(); res.is_error()) {
        records_ = std::move(previous);
        return res;
    }
    return Ok();
}

std::size_t LocalStore::size() const {
    std::shared_lock lock(mutex_);
    return records_.size();
}

std::size_t LocalStore::data_size_bytes() const {
    std::shared_lock lock(mutex_);
    std::size_t total = 0;
    for (const auto& [key, record] : records_) {
        total += record.payload.dump(-1, ' ', false, json::error_handler_t::replace).size();
    }
    return total;
}

std::string LocalStore::make_key(EntityType type, const std::string& id) {
    return std::string(TypeNames::to_string(type)) + "/" + id;
}

Result<void> LocalStore::persist_locked() const {
    json records = json::array();
    for (const auto& [key, record] : records_) {
        records.push_back(record);
    }
    return file_.write(json{{"version", kFormatVersion}, {"records", std::move(records)}});
}

} // namespace fieldsync::storage
