#pragma once

#include "fieldsync/core/result.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <vector>

namespace fieldsync::storage {

/**
 * @brief One JSON document on disk, replaced atomically on every write
 *
 * Writes go to "<path>.tmp" first and are renamed over the target, so a
 * crash leaves either the old or the new document, never a torn one.
 */
class DurableFile {
public:
    explicit DurableFile(std::filesystem::path path);

    /**
     * @brief Read the document; std::nullopt when the file does not exist yet
     */
    Result<std::optional<nlohmann::json>> read() const;

    Result<void> write(const nlohmann::json& document) const;

    Result<void> remove() const;

    const std::filesystem::path& path() const noexcept { return path_; }

    static Result<void> write_bytes(const std::filesystem::path& path,
                                    const std::vector<std::uint8_t>& bytes);

private:
    static Result<void> ensure_parent_exists(const std::filesystem::path& path);
    static Result<void> replace_atomically(const std::filesystem::path& path, const std::string& contents);

    std::filesystem::path path_;
};

} // namespace fieldsync::storage
