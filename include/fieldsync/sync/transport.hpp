#pragma once

#include "fieldsync/core/result.hpp"
#include "fieldsync/model/types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace fieldsync::sync {

/**
 * @brief Server acknowledgement of an upload
 */
struct UploadAck {
    std::string remote_id;
};

/**
 * @brief The remote authority, as seen by the sync engine
 *
 * CONTRACT:
 * - Every call is bounded by a timeout; running out of time is
 *   ErrorKind::Timeout, never an indefinite block.
 * - Uploads are idempotent on the server, keyed by Record id. The engine
 *   relies on this after crash recovery.
 * - Errors carry the engine-facing taxonomy (Transient, Timeout, Rejected,
 *   Authentication). Implementations are called from several worker threads
 *   at once.
 */
class RemoteTransport {
public:
    virtual ~RemoteTransport() = default;

    virtual Result<UploadAck> upload_submission(const Record& record) = 0;
    virtual Result<UploadAck> upload_media(const Record& record) = 0;

    virtual Result<std::vector<Record>> fetch_new_forms(TimePoint since) = 0;
    virtual Result<std::vector<Record>> fetch_form_updates(TimePoint since) = 0;
    virtual Result<std::vector<Record>> fetch_projects(TimePoint since) = 0;

    /// One form by id, regardless of the metadata cursor
    virtual Result<Record> fetch_form(const std::string& id) = 0;

    virtual Result<std::vector<std::uint8_t>> fetch_media(const std::string& ref) = 0;
};

} // namespace fieldsync::sync
