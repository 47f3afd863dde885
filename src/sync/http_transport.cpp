#include "fieldsync/sync/http_transport.hpp"

#include "fieldsync/model/serializer.hpp"

#include <spdlog/spdlog.h>

#include <cctype>

namespace fieldsync::sync {
using json = nlohmann::json;

namespace {

// Path segment encoding for media refs (RFC 3986 unreserved set passes through)
std::string encode_segment(const std::string& text) {
    static constexpr char kHex[] = "0123456789ABCDEF";
    std::string out;
    for (unsigned char c : text) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += kHex[c >> 4];
            out += kHex[c & 0x0F];
        }
    }
    return out;
}

} // namespace

HttpTransport::HttpTransport(ServerConfig config)
    : config_(std::move(config))
    , client_(config_.host, config_.port, config_.request_timeout) {
}

Result<UploadAck> HttpTransport::upload_submission(const Record& record) {
    return upload("/submissions", record);
}

Result<UploadAck> HttpTransport::upload_media(const Record& record) {
    return upload("/media", record);
}

Result<std::vector<Record>> HttpTransport::fetch_new_forms(TimePoint since) {
    return fetch_records("/forms/new", "forms", EntityType::Form, since);
}

Result<std::vector<Record>> HttpTransport::fetch_form_updates(TimePoint since) {
    return fetch_records("/forms/updates", "forms", EntityType::Form, since);
}

Result<std::vector<Record>> HttpTransport::fetch_projects(TimePoint since) {
    return fetch_records("/projects", "projects", EntityType::Project, since);
}

Result<Record> HttpTransport::fetch_form(const std::string& id) {
    const std::string path = "/forms/" + encode_segment(id);
    network::HttpRequest request;
    request.method = network::HttpMethod::GET;
    request.target = url(path);
    request.set_header("Accept", "application/json");

    auto response = perform(std::move(request));
    if (response.is_error()) {
        return Err<Record>(response.error());
    }

    const json body = json::parse(response.value().body_as_string(), nullptr, false);
    if (body.is_discarded()) {
        return Err<Record>(ErrorKind::Transient, "Malformed JSON from " + path);
    }
    const json& document = body.is_object() && body.contains("form") ? body["form"] : body;
    try {
        return Ok(record_from_remote(EntityType::Form, document));
    } catch (const std::exception& e) {
        return Err<Record>(ErrorKind::Rejected, std::string("Malformed form from ") + path + ": " + e.what());
    }
}

Result<std::vector<std::uint8_t>> HttpTransport::fetch_media(const std::string& ref) {
    network::HttpRequest request;
    request.method = network::HttpMethod::GET;
    request.target = url("/media/" + encode_segment(ref));
    request.set_header("Accept", "application/octet-stream");

    auto response = perform(std::move(request));
    if (response.is_error()) {
        return Err<std::vector<std::uint8_t>>(response.error());
    }
    return Ok(std::move(response.value().body));
}

Error HttpTransport::classify_status(int status_code, const std::string& body) {
    std::string message = "HTTP " + std::to_string(status_code);
    const json parsed = json::parse(body, nullptr, false);
    if (!parsed.is_discarded() && parsed.is_object() && parsed.contains("message") &&
        parsed["message"].is_string()) {
        message += ": " + parsed["message"].get<std::string>();
    }

    if (status_code == 401 || status_code == 403) {
        return Error{ErrorKind::Authentication, message};
    }
    if (status_code == 408 || status_code == 429 || status_code >= 500) {
        return Error{ErrorKind::Transient, message};
    }
    if (status_code >= 400) {
        return Error{ErrorKind::Rejected, message};
    }
    // 1xx/3xx are not expected from this API
    return Error{ErrorKind::Transient, message};
}

Result<UploadAck> HttpTransport::upload(const std::string& path, const Record& record) {
    network::HttpRequest request;
    request.method = network::HttpMethod::POST;
    request.target = url(path);
    request.set_header("Idempotency-Key", record.id);
    try {
        request.set_body(json(record).dump(), "application/json");
    } catch (const json::type_error& e) {
        return Err<UploadAck>(ErrorKind::Rejected, std::string("Record cannot be encoded: ") + e.what());
    }

    auto response = perform(std::move(request));
    if (response.is_error()) {
        return Err<UploadAck>(response.error());
    }

    UploadAck ack;
    ack.remote_id = record.id;
    const json body = json::parse(response.value().body_as_string(), nullptr, false);
    if (!body.is_discarded() && body.is_object() && body.contains("id") && body["id"].is_string()) {
        ack.remote_id = body["id"].get<std::string>();
    }
    return Ok(std::move(ack));
}

Result<std::vector<Record>> HttpTransport::fetch_records(const std::string& path, const char* collection,
                                                         EntityType type, TimePoint since) {
    network::HttpRequest request;
    request.method = network::HttpMethod::GET;
    request.target = url(path) + "?since=" + std::to_string(to_epoch_ms(since));
    request.set_header("Accept", "application/json");

    auto response = perform(std::move(request));
    if (response.is_error()) {
        return Err<std::vector<Record>>(response.error());
    }

    const json body = json::parse(response.value().body_as_string(), nullptr, false);
    if (body.is_discarded()) {
        return Err<std::vector<Record>>(ErrorKind::Transient, "Malformed JSON from " + path);
    }

    const json* items = &body;
    if (body.is_object() && body.contains(collection)) {
        items = &body[collection];
    }
    if (!items->is_array()) {
        return Err<std::vector<Record>>(ErrorKind::Transient,
                                        std::string("Expected an array of ") + collection + " from " + path);
    }

    std::vector<Record> records;
    records.reserve(items->size());
    for (const auto& document : *items) {
        try {
            records.push_back(record_from_remote(type, document));
        } catch (const std::exception& e) {
            spdlog::warn("Ignoring malformed {} from {}: {}", TypeNames::to_string(type), path, e.what());
        }
    }
    return Ok(std::move(records));
}

Result<network::HttpResponse> HttpTransport::perform(network::HttpRequest request) {
    if (!config_.auth_token.empty()) {
        request.set_header("Authorization", "Bearer " + config_.auth_token);
    }

    auto response = client_.send(request);
    if (response.is_error()) {
        spdlog::debug("{} failed: {}", request.target, describe(response.error()));
        return response;
    }

    const auto& value = response.value();
    if (!value.is_success()) {
        Error error = classify_status(value.status_code, value.body_as_string());
        spdlog::debug("{} answered {}", request.target, describe(error));
        return Err<network::HttpResponse>(std::move(error));
    }
    return response;
}

std::string HttpTransport::url(const std::string& path) const {
    std::string base = config_.base_path;
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    return base + path;
}

} // namespace fieldsync::sync
