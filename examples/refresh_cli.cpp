/**
 * @file refresh_cli.cpp
 * @brief Refresh the libraries named in a config file and drain the job queue
 *
 * USAGE:
 *   medialib_refresh <config.json> [--force] [--empty-trash] [--passes N]
 *
 * Runs against the in-memory catalog, so every invocation starts from an
 * empty catalog. The second pass shows that unchanged files are skipped.
 */

#include "medialib/catalog/memory_catalog.hpp"
#include "medialib/config/config.hpp"
#include "medialib/events/components.hpp"
#include "medialib/events/event_bus.hpp"
#include "medialib/jobs/dispatcher.hpp"
#include "medialib/jobs/job_queue.hpp"
#include "medialib/library/mime.hpp"
#include "medialib/library/service.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <string>
#include <vector>

using medialib::catalog::InMemoryCatalog;
using medialib::events::EventBus;
using medialib::events::LoggerComponent;
using medialib::events::MetricsComponent;
using medialib::jobs::DispatcherOptions;
using medialib::jobs::InMemoryJobQueue;
using medialib::jobs::JobDispatcher;
using medialib::library::CreateLibraryRequest;
using medialib::library::ExtensionMimeClassifier;
using medialib::library::LibraryService;
using medialib::library::RefreshOptions;

namespace {

void print_usage(const char* program) {
    spdlog::info("Usage: {} <config.json> [--force] [--empty-trash] [--passes N]", program);
}

struct Library {
    std::string id;
    std::string owner_id;
};

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    RefreshOptions options;
    int passes = 2;
    for (int i = 2; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--force") {
            options.force_refresh = true;
        } else if (arg == "--empty-trash") {
            options.empty_trash = true;
        } else if (arg == "--passes" && i + 1 < argc) {
            passes = std::atoi(argv[++i]);
            if (passes <= 0) {
                spdlog::error("Invalid pass count: {}", argv[i]);
                return 1;
            }
        } else {
            print_usage(argv[0]);
            return 1;
        }
    }

    auto config = medialib::config::load_config(argv[1]);
    if (config.is_error()) {
        spdlog::error("Config error: {}", medialib::to_string(config.error()));
        return 1;
    }
    spdlog::set_level(config.value().log_level);

    EventBus bus;
    LoggerComponent logger(bus);
    MetricsComponent metrics(bus);

    InMemoryCatalog catalog;
    InMemoryJobQueue queue;
    ExtensionMimeClassifier classifier;
    LibraryService service(catalog, queue, classifier, &bus);

    JobDispatcher dispatcher(queue,
        DispatcherOptions{config.value().worker_threads, config.value().max_attempts},
        &bus);
    service.register_handlers(dispatcher);

    std::vector<Library> libraries;
    for (const auto& entry : config.value().libraries) {
        auto created = service.create_library(entry.owner_id,
            CreateLibraryRequest{entry.name, entry.type, entry.is_visible});
        if (created.is_error()) {
            spdlog::error("Cannot create library '{}': {}", entry.name, medialib::to_string(created.error()));
            return 1;
        }

        if (entry.type == medialib::catalog::LibraryType::Import) {
            auto updated = service.set_import_paths(created.value().id, entry.import_paths);
            if (updated.is_error()) {
                spdlog::error("Cannot set import paths for '{}': {}", entry.name, medialib::to_string(updated.error()));
                return 1;
            }
        }
        libraries.push_back(Library{created.value().id, entry.owner_id});
    }

    int exit_code = 0;
    for (int pass = 1; pass <= passes; ++pass) {
        spdlog::info("════════════════════════════════════════════");
        spdlog::info("Refresh pass {}/{}", pass, passes);
        spdlog::info("════════════════════════════════════════════");

        for (const auto& library : libraries) {
            auto summary = service.refresh(library.owner_id, library.id, options);
            if (summary.is_error()) {
                spdlog::error("Refresh of library {} failed: {}", library.id, medialib::to_string(summary.error()));
                exit_code = 1;
            }
        }

        const auto dispatched = dispatcher.run_until_idle();
        spdlog::info("Dispatched {} job deliveries", dispatched);
    }

    const auto stats = dispatcher.stats();
    spdlog::info("Jobs: succeeded={} failed={} retried={} forwarded={}",
        stats.succeeded, stats.failed, stats.retried, stats.unhandled);
    for (const auto& failure : dispatcher.failures()) {
        spdlog::warn("  {} {} -> {}",
            medialib::jobs::JobNameUtils::to_string(failure.job.name),
            failure.job.payload.value("asset_path", std::string{}),
            medialib::to_string(failure.error));
    }

    metrics.print_stats();
    return exit_code;
}
