#include "fieldsync/storage/durable_file.hpp"

#include <fstream>
#include <sstream>
#include <system_error>

namespace fieldsync::storage {
namespace fs = std::filesystem;
using json = nlohmann::json;

DurableFile::DurableFile(fs::path path) : path_(std::move(path)) {}

Result<std::optional<json>> DurableFile::read() const {
    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        return Ok(std::optional<json>{});
    }

    std::ifstream input(path_, std::ios::binary);
    if (!input) {
        return Err<std::optional<json>>(ErrorKind::Storage, "Failed to open " + path_.string());
    }

    std::ostringstream buffer;
    buffer << input.rdbuf();
    try {
        return Ok(std::optional<json>(json::parse(buffer.str())));
    } catch (const json::parse_error& e) {
        return Err<std::optional<json>>(ErrorKind::Storage,
                                        "Corrupt document " + path_.string() + ": " + e.what());
    }
}

Result<void> DurableFile::write(const json& document) const {
    std::string contents;
    try {
        contents = document.dump();
    } catch (const json::type_error& e) {
        // Strings that are not valid UTF-8 cannot be serialized
        return Err<void>(ErrorKind::Storage, "Cannot serialize " + path_.string() + ": " + e.what());
    }
    return replace_atomically(path_, contents);
}

Result<void> DurableFile::remove() const {
    std::error_code ec;
    fs::remove(path_, ec);
    if (ec) {
        return Err<void>(ErrorKind::Storage, "Failed to remove " + path_.string() + ": " + ec.message());
    }
    return Ok();
}

Result<void> DurableFile::write_bytes(const fs::path& path, const std::vector<std::uint8_t>& bytes) {
    return replace_atomically(path, std::string(bytes.begin(), bytes.end()));
}

Result<void> DurableFile::ensure_parent_exists(const fs::path& path) {
    const auto parent = path.parent_path();
    if (parent.empty()) {
        return Ok();
    }
    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec && !fs::exists(parent)) {
        return Err<void>(ErrorKind::Storage, "Failed to create directory: " + parent.string());
    }
    return Ok();
}

Result<void> DurableFile::replace_atomically(const fs::path& path, const std::string& contents) {
    if (auto res = ensure_parent_exists(path); res.is_error()) {
        return res;
    }

    fs::path staging = path;
    staging += ".tmp";

    {
        std::ofstream out(staging, std::ios::binary | std::ios::trunc);
        if (!out) {
            return Err<void>(ErrorKind::Storage, "Failed to open staging file: " + staging.string());
        }
        out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
        out.flush();
        if (!out) {
            return Err<void>(ErrorKind::Storage, "Failed to write staging file: " + staging.string());
        }
    }

    std::error_code ec;
    fs::rename(staging, path, ec);
    if (ec) {
        return Err<void>(ErrorKind::Storage, "Failed to replace " + path.string() + ": " + ec.message());
    }
    return Ok();
}

} // namespace fieldsync::storage
