#include "fieldsync/core/config.hpp"
#include "fieldsync/core/logging.hpp"
#include "fieldsync/events/components.hpp"
#include "fieldsync/events/event_bus.hpp"
#include "fieldsync/model/serializer.hpp"
#include "fieldsync/storage/local_store.hpp"
#include "fieldsync/storage/settings_store.hpp"
#include "fieldsync/sync/auto_sync_scheduler.hpp"
#include "fieldsync/sync/capture_service.hpp"
#include "fieldsync/sync/connectivity_monitor.hpp"
#include "fieldsync/sync/http_transport.hpp"
#include "fieldsync/sync/notification_sink.hpp"
#include "fieldsync/sync/retry_policy.hpp"
#include "fieldsync/sync/sync_engine.hpp"
#include "fieldsync/sync/sync_queue.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <iostream>
#include <optional>
#include <sstream>
#include <string>

using fieldsync::ClientConfig;
using fieldsync::QueueKey;
using fieldsync::TypeNames;
using json = nlohmann::json;

namespace {

void print_help() {
    std::cout << "Commands:\n"
              << "  online wifi|cellular     report the device online\n"
              << "  offline                  report the device offline\n"
              << "  submit <form> <json>     save a form submission\n"
              << "  media <json>             save a captured media file\n"
              << "  download <ref>           queue a server media file for download\n"
              << "  form <id>                keep a form for offline capture\n"
              << "  sync                     sync now\n"
              << "  status                   show sync status\n"
              << "  dead                     list dead-lettered items\n"
              << "  retry <id>               retry a dead-lettered upload\n"
              << "  discard <id>             discard a dead-lettered upload\n"
              << "  settings <json>          update sync settings\n"
              << "  clear                    clear all offline data\n"
              << "  quit\n";
}

void print_status(const fieldsync::StatusSnapshot& status, std::size_t data_size) {
    std::cout << "status:   " << TypeNames::to_string(status.status);
    if (status.issues > 0) {
        std::cout << " (completed with " << status.issues << " issues)";
    }
    std::cout << "\nprogress: " << status.progress << "%\n";
    if (status.last_sync_time) {
        std::cout << "last:     " << fieldsync::to_epoch_ms(*status.last_sync_time) << " ms\n";
    } else {
        std::cout << "last:     never\n";
    }
    std::cout << "pending:  uploads=" << status.pending.uploads
              << " downloads=" << status.pending.downloads
              << " failed=" << status.pending.failed
              << " dead=" << status.pending.dead << "\n";
    std::cout << "data:     " << data_size << " bytes\n";
    if (!status.last_error.empty()) {
        std::cout << "error:    " << status.last_error << "\n";
    }
}

std::optional<QueueKey> find_dead_letter(fieldsync::sync::SyncQueue& queue, const std::string& id) {
    for (const auto& item : queue.dead_letters()) {
        if (item.id == id) {
            return item.key();
        }
    }
    return std::nullopt;
}

} // namespace

int main(int argc, char* argv[]) {
    ClientConfig config = ClientConfig::defaults();
    try {
        if (argc > 1) {
            config = ClientConfig::load_file(argv[1]);
        }
    } catch (const std::exception& e) {
        std::cerr << "Invalid configuration: " << e.what() << "\n";
        return 1;
    }

    fieldsync::init_logging(config.logging);

    fieldsync::events::EventBus bus;
    fieldsync::events::LoggerComponent logger(bus);
    fieldsync::events::MetricsComponent metrics(bus);

    fieldsync::storage::LocalStore store(config.data_dir);
    fieldsync::storage::SettingsStore settings(config.data_dir, config.default_settings);
    fieldsync::sync::SyncQueue queue(config.data_dir);

    if (auto res = store.load(); res.is_error()) {
        spdlog::critical("Cannot load records: {}", fieldsync::describe(res.error()));
        return 1;
    }
    if (auto res = settings.load(); res.is_error()) {
        spdlog::critical("Cannot load settings: {}", fieldsync::describe(res.error()));
        return 1;
    }
    if (auto res = queue.load(); res.is_error()) {
        spdlog::critical("Cannot load sync queue: {}", fieldsync::describe(res.error()));
        return 1;
    }

    fieldsync::sync::ConnectivityMonitor monitor(bus);
    fieldsync::sync::HttpTransport transport(config.server);
    fieldsync::sync::LoggingNotificationSink notifications;
    fieldsync::sync::RetryPolicy retry_policy(config.retry, settings.settings().max_retries);

    fieldsync::sync::SyncEngine engine(store, queue, settings, monitor, transport, notifications,
                                       bus, retry_policy, config.engine);
    fieldsync::sync::CaptureService capture(store, queue, settings, engine);
    fieldsync::sync::AutoSyncScheduler scheduler(engine, bus, config.engine.online_debounce);
    scheduler.start();

    spdlog::info("FieldSync client ready, server {}:{}{}", config.server.host, config.server.port,
                 config.server.base_path);
    print_help();

    std::string line;
    while (std::cout << "> " << std::flush, std::getline(std::cin, line)) {
        std::istringstream input(line);
        std::string command;
        input >> command;
        std::string rest;
        std::getline(input >> std::ws, rest);

        try {
            if (command.empty()) {
                continue;
            } else if (command == "quit" || command == "exit") {
                break;
            } else if (command == "help") {
                print_help();
            } else if (command == "online") {
                fieldsync::sync::PlatformSignal signal;
                signal.connected = true;
                signal.internet_reachable = true;
                signal.kind = rest == "cellular" ? fieldsync::ConnectionKind::Cellular
                                                 : fieldsync::ConnectionKind::Wifi;
                monitor.on_platform_signal(signal);
            } else if (command == "offline") {
                monitor.on_platform_signal(fieldsync::sync::PlatformSignal{false, false,
                                                                            fieldsync::ConnectionKind::None});
            } else if (command == "submit") {
                std::istringstream args(rest);
                std::string form_id;
                args >> form_id;
                std::string data_text;
                std::getline(args >> std::ws, data_text);
                auto saved = capture.save_submission(form_id, json::parse(data_text.empty() ? "{}" : data_text));
                if (saved.is_error()) {
                    std::cout << "error: " << fieldsync::describe(saved.error()) << "\n";
                } else {
                    std::cout << "saved " << saved.value().id << "\n";
                }
            } else if (command == "media") {
                auto saved = capture.save_media_file(json::parse(rest.empty() ? "{}" : rest));
                if (saved.is_error()) {
                    std::cout << "error: " << fieldsync::describe(saved.error()) << "\n";
                } else {
                    std::cout << "saved " << saved.value().id << "\n";
                }
            } else if (command == "download") {
                auto queued = capture.request_media_download(rest);
                if (queued.is_error()) {
                    std::cout << "error: " << fieldsync::describe(queued.error()) << "\n";
                } else {
                    std::cout << "queued " << queued.value().id << "\n";
                }
            } else if (command == "form") {
                auto form = engine.download_form_for_offline(rest);
                if (form.is_error()) {
                    std::cout << "error: " << fieldsync::describe(form.error()) << "\n";
                } else {
                    std::cout << "form " << form.value().id << " available offline\n";
                }
            } else if (command == "sync") {
                const auto outcome = engine.force_sync();
                if (outcome == fieldsync::CycleOutcome::Ineligible) {
                    std::cout << "No Internet Connection: check your connection and try again.\n";
                } else {
                    std::cout << TypeNames::to_string(outcome) << "\n";
                }
            } else if (command == "status") {
                print_status(engine.status(), capture.offline_data_size());
            } else if (command == "dead") {
                for (const auto& item : queue.dead_letters()) {
                    std::cout << TypeNames::to_string(item.entity_type) << " " << item.id
                              << " attempts=" << item.attempt_count << " " << item.last_error << "\n";
                }
            } else if (command == "retry" || command == "discard") {
                auto key = find_dead_letter(queue, rest);
                if (!key) {
                    std::cout << "no dead-lettered item " << rest << "\n";
                    continue;
                }
                auto res = command == "retry" ? queue.retry_dead_letter(*key) : queue.discard_dead_letter(*key);
                std::cout << (res.is_ok() ? "ok" : "error: " + fieldsync::describe(res.error())) << "\n";
            } else if (command == "settings") {
                auto updated = engine.update_settings(fieldsync::settings_patch_from_json(json::parse(rest)));
                if (updated.is_error()) {
                    std::cout << "error: " << fieldsync::describe(updated.error()) << "\n";
                } else {
                    std::cout << json(updated.value()).dump() << "\n";
                }
            } else if (command == "clear") {
                auto res = capture.clear_offline_data();
                std::cout << (res.is_ok() ? "All offline data has been cleared."
                                          : "error: " + fieldsync::describe(res.error())) << "\n";
            } else {
                std::cout << "unknown command: " << command << "\n";
            }
        } catch (const std::exception& e) {
            // Malformed JSON on the command line
            std::cout << "error: " << e.what() << "\n";
        }
    }

    scheduler.stop();
    metrics.print_stats();
    fieldsync::shutdown_logging();
    return 0;
}
