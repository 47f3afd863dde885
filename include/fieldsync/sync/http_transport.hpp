#pragma once

#include "fieldsync/core/config.hpp"
#include "fieldsync/network/http_client.hpp"
#include "fieldsync/sync/transport.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace fieldsync::sync {

/**
 * @brief RemoteTransport over the collection server's JSON API
 *
 * ENDPOINTS (relative to ServerConfig::base_path):
 * POST /submissions            record JSON, Idempotency-Key: <record id>
 * POST /media                  record JSON, Idempotency-Key: <record id>
 * GET  /forms/new?since=<ms>   {"forms": [...]} or a bare array
 * GET  /forms/updates?since=<ms>
 * GET  /projects?since=<ms>    {"projects": [...]} or a bare array
 * GET  /forms/<id>             {"form": {...}} or a bare object
 * GET  /media/<ref>            raw body
 */
class HttpTransport : public RemoteTransport {
public:
    explicit HttpTransport(ServerConfig config);

    Result<UploadAck> upload_submission(const Record& record) override;
    Result<UploadAck> upload_media(const Record& record) override;

    Result<std::vector<Record>> fetch_new_forms(TimePoint since) override;
    Result<std::vector<Record>> fetch_form_updates(TimePoint since) override;
    Result<std::vector<Record>> fetch_projects(TimePoint since) override;
    Result<Record> fetch_form(const std::string& id) override;

    Result<std::vector<std::uint8_t>> fetch_media(const std::string& ref) override;

    /**
     * @brief Map a non-2xx status to the engine's error taxonomy
     *
     * 401/403 Authentication, 408/429/5xx Transient, other 4xx Rejected.
     * The server's {"message": ...} is used as the error text when present.
     */
    static Error classify_status(int status_code, const std::string& body);

private:
    Result<UploadAck> upload(const std::string& path, const Record& record);
    Result<std::vector<Record>> fetch_records(const std::string& path, const char* collection,
                                              EntityType type, TimePoint since);
    Result<network::HttpResponse> perform(network::HttpRequest request);

    std::string url(const std::string& path) const;

    ServerConfig config_;
    network::HttpClient client_;
};

} // namespace fieldsync::sync
