/// @file main.cpp
/// @brief Ingestion worker entry point.
///
/// Tails the game server log, turns matching lines into events and applies
/// them to the progression store until SIGINT/SIGTERM.

#include <chrono>
#include <cstdlib>
#include <iostream>

#include "fxp/foundation/config_manager.hpp"
#include "fxp/foundation/game_logger.hpp"
#include "fxp/service/ingest_service.hpp"
#include "fxp/service/service_runner.hpp"
#include "fxp/service/worker_settings.hpp"
#include "fxp/version.hpp"

int main(int argc, char* argv[]) {
    using namespace std::chrono_literals;

    auto cli = fxp::service::parseCommandLine(argc, argv);
    if (!cli) {
        std::cerr << cli.error().describe() << "\n" << fxp::service::usage(argv[0]);
        return EXIT_FAILURE;
    }
    if (cli.value().showHelp) {
        std::cout << fxp::service::usage(argv[0]);
        return EXIT_SUCCESS;
    }
    if (cli.value().showVersion) {
        std::cout << "fxp_ingest_worker " << fxp::Version::string << "\n";
        return EXIT_SUCCESS;
    }

    fxp::service::ShutdownSignal signals;

    auto configPath = fxp::service::resolveConfigPath(cli.value().configPath);
    fxp::foundation::ConfigManager config;
    if (auto loaded = config.load(configPath); !loaded) {
        std::cerr << "Failed to load config: " << loaded.error().describe() << "\n";
        return EXIT_FAILURE;
    }

    auto& logger = fxp::foundation::GameLogger::instance();
    auto levels = fxp::service::applyLogLevels(config, logger);
    if (!levels) {
        std::cerr << "Invalid logging section: " << levels.error().describe() << "\n";
        return EXIT_FAILURE;
    }

    auto settings = fxp::service::buildWorkerSettings(config);
    if (!settings) {
        std::cerr << "Invalid configuration: " << settings.error().describe() << "\n";
        return EXIT_FAILURE;
    }

    fxp::service::IngestService service(std::move(settings).value());
    auto startResult = service.start();
    if (!startResult) {
        std::cerr << "Failed to start ingestion worker: "
                  << startResult.error().describe() << "\n";
        return EXIT_FAILURE;
    }

    std::cout << "Ingestion worker " << fxp::Version::string
              << " started (config: " << configPath.string() << ")\n";

    constexpr auto kTick = 100ms;
    while (service.isRunning() && !signals.waitFor(kTick)) {
        service.tick(kTick);
    }

    std::cout << "Shutting down ingestion worker...\n";
    fxp::service::ShutdownSequence shutdown(10s);
    shutdown.add("ingest", [&service] { service.stop(); });
    shutdown.add("logger", [&logger] {
        if (auto flushed = logger.flush(); !flushed) {
            std::cerr << "Failed to flush logs: " << flushed.error().describe() << "\n";
        }
    });
    auto report = shutdown.run();

    auto counters = service.counters();
    std::cout << "Ingestion worker stopped (lines: " << counters.linesRead
              << ", events: " << counters.eventsApplied << ")\n";

    if (auto failure = service.workerError()) {
        std::cerr << "Worker failed: " << failure->describe() << "\n";
        return EXIT_FAILURE;
    }
    return report.failed.empty() ? EXIT_SUCCESS : EXIT_FAILURE;
}
