#include <iostream>
#include <memory>
#include <chrono>
#include <thread>
#include <string>
#include <exception>
#include <csignal>
#include <atomic>
#include <nlohmann/json.hpp>

#include "config_parser.h"
#include "gauge_logger.h"
#include "orchestrator.h"
#include "engines/EngineRegistry.hpp"

using json = nlohmann::json;

// Set from the signal handler, polled by the main loop
std::atomic<bool> interrupt_requested{false};

void signalHandler(int signum) {
    (void)signum;
    interrupt_requested = true;
}

static void printUsage(const char* program) {
    std::cerr << "Usage: " << program << " [--config FILE] [--write-config FILE] [--list] [ENGINE]" << std::endl;
    std::cerr << "  --config FILE        load settings from FILE (default config/edgegauge.json)" << std::endl;
    std::cerr << "  --write-config FILE  write the default settings to FILE and exit" << std::endl;
    std::cerr << "  --list               list the available engines and exit" << std::endl;
}

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signalHandler);   // Ctrl+C
    std::signal(SIGTERM, signalHandler);  // Termination
    std::signal(SIGPIPE, SIG_IGN);        // Ignore broken pipe

    // ======== COMMAND LINE ========

    std::string config_file = "config/edgegauge.json";
    std::string write_config_file;
    std::string engine_name;
    bool list_engines = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_file = argv[++i];
        } else if (arg == "--write-config" && i + 1 < argc) {
            write_config_file = argv[++i];
        } else if (arg == "--list") {
            list_engines = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << std::endl;
            printUsage(argv[0]);
            return 1;
        } else {
            engine_name = arg;
        }
    }

    if (list_engines) {
        for (const auto& entry : EngineRegistry::availableEngines()) {
            std::cout << entry.name << "\t" << entry.description << std::endl;
        }
        return 0;
    }

    if (!write_config_file.empty()) {
        if (!ConfigParser::saveConfig(write_config_file, ConfigParser::getDefaultConfig())) {
            std::cerr << "Failed to write " << write_config_file << std::endl;
            return 1;
        }
        return 0;
    }

    // ======== LOAD CONFIGURATION ========

    MeasurementConfig config = ConfigParser::getDefaultConfig();
    if (!ConfigParser::parseConfig(config_file, config)) {
        std::cerr << "Warning: Could not load config from " << config_file << ", using defaults" << std::endl;
        config = ConfigParser::getDefaultConfig();
    }

    GaugeLogger::getInstance().setGroupFilters(config.log_filters);

    if (engine_name.empty()) {
        engine_name = config.default_engine;
    }

    std::shared_ptr<MeasurementEngine> engine = EngineRegistry::create(engine_name, config);
    if (!engine) {
        std::cerr << "Unknown engine: " << engine_name << std::endl;
        printUsage(argv[0]);
        return 1;
    }

    // ======== RUN ========

    Orchestrator::Settings settings;
    settings.uiTick = std::chrono::milliseconds(config.ui_tick_ms);
    settings.windowTicks = static_cast<size_t>(config.window_ticks);
    settings.postLatencyPause = std::chrono::milliseconds(config.post_latency_pause_ms);
    settings.interPhasePause = std::chrono::milliseconds(config.inter_phase_pause_ms);

    Orchestrator orchestrator(settings);

    auto printResult = [](const UnifiedResult& result) {
        std::cout << result.toJson().dump() << std::endl;
    };

    if (!orchestrator.start(engine, printResult)) {
        std::cerr << "Failed to start " << engine_name << std::endl;
        return 1;
    }

    bool cancel_sent = false;
    while (orchestrator.isRunning()) {
        if (interrupt_requested && !cancel_sent) {
            GAUGE_LOG_INFO("cli", "Interrupted, cancelling the run");
            orchestrator.cancel();
            cancel_sent = true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    orchestrator.wait();

    // ======== EXIT STATUS ========

    UnifiedResult last = orchestrator.lastResult();
    if (last.hasError()) {
        return 1;
    }
    if (orchestrator.state() == Orchestrator::State::Cancelled) {
        return 130;
    }
    return 0;
}
