#include "config_parser.h"

#include <cstdio>
#include <iostream>
#include <string>

static int failures = 0;

static void check(bool ok, const std::string& label) {
    std::cout << label << ": " << (ok ? "PASS" : "FAIL") << std::endl;
    if (!ok) {
        failures++;
    }
}

void testDefaults() {
    std::cout << "\n--- Test 1: Default Configuration ---" << std::endl;

    MeasurementConfig config = ConfigParser::getDefaultConfig();
    check(config.default_engine == "edge-cache", "Default engine");
    check(config.engines.size() == 4, "Four engine blocks");
    check(!config.fallback_upload_url.empty(), "Fallback upload target present");

    EngineSettings edge = ConfigParser::settingsFor(config, "edge-cache");
    check(edge.require_ranges && edge.min_probe_bytes == 1024 * 1024, "Edge-cache discovery criteria");
    check(edge.candidate_urls.size() == 3, "Edge-cache candidates");

    EngineSettings persistent = ConfigParser::settingsFor(config, "persistent-edge");
    check(persistent.probe_with_get && !persistent.require_ranges, "Persistent-edge probes with GET");

    EngineSettings direct = ConfigParser::settingsFor(config, "direct-stream");
    check(direct.min_workers == 16 && !direct.download_url.empty(), "Direct-stream stream count and URL");

    EngineSettings best = ConfigParser::settingsFor(config, "best-server");
    check(!best.server_list_url.empty() && best.max_candidates == 10, "Best-server directory settings");
    check(best.download_files.size() == 6 && best.download_files.front() == "random350x350.jpg",
          "Best-server downloads start at the smallest image");

    EngineSettings unknown = ConfigParser::settingsFor(config, "no-such-engine");
    check(unknown.candidate_urls.empty() && unknown.phase_duration_sec == 15, "Unknown engine gets plain defaults");
}

void testOverlay() {
    std::cout << "\n--- Test 2: Engine Block Overlay ---" << std::endl;

    MeasurementConfig config = ConfigParser::getDefaultConfig();
    nlohmann::json j = {
        {"ui_tick_ms", 100},
        {"default_engine", "direct-stream"},
        {"engines", {
            {"edge-cache", {{"phase_duration_sec", 10}, {"max_workers", 12}}}
        }},
        {"log_filters", {{"transport", false}}}
    };

    check(ConfigParser::parseConfigJson(j, config), "Parse succeeds");
    check(config.ui_tick_ms == 100 && config.default_engine == "direct-stream", "Top-level values applied");

    EngineSettings edge = ConfigParser::settingsFor(config, "edge-cache");
    check(edge.phase_duration_sec == 10 && edge.max_workers == 12, "Overridden values applied");
    check(edge.candidate_urls.size() == 3 && edge.min_probe_bytes == 1024 * 1024,
          "Untouched values keep the engine defaults");
    check(config.log_filters.size() == 1 && !config.log_filters["transport"], "Log filters replaced");
}

void testValidation() {
    std::cout << "\n--- Test 3: Validation Clamps ---" << std::endl;

    MeasurementConfig config = ConfigParser::getDefaultConfig();
    nlohmann::json j = {
        {"ui_tick_ms", 5},
        {"window_ticks", 500},
        {"inter_phase_pause_ms", -10},
        {"fallback_upload_url", ""},
        {"engines", {
            {"direct-stream", {
                {"phase_duration_sec", 0},
                {"min_workers", 0},
                {"max_workers", -3},
                {"chunk_min_bytes", 10},
                {"fast_chunk_ms", 500},
                {"slow_chunk_ms", 400},
                {"upload_payload_bytes", 4096},
                {"upload_slice_bytes", 8192},
                {"max_candidates", 0}
            }}
        }}
    };

    check(ConfigParser::parseConfigJson(j, config), "Parse succeeds");
    check(config.ui_tick_ms == 200 && config.window_ticks == 15, "Tick settings reset");
    check(config.inter_phase_pause_ms == 0, "Negative pause clamped");
    check(!config.fallback_upload_url.empty(), "Fallback target restored");

    EngineSettings s = ConfigParser::settingsFor(config, "direct-stream");
    check(s.phase_duration_sec == 15, "Phase duration reset");
    check(s.min_workers == 1 && s.max_workers == 1, "Worker bounds clamped");
    check(s.chunk_min_bytes == 256 * 1024 && s.chunk_max_bytes >= s.chunk_min_bytes, "Chunk bounds fixed");
    check(s.slow_chunk_ms > s.fast_chunk_ms, "Slow threshold above fast threshold");
    check(s.upload_slice_bytes <= s.upload_payload_bytes, "Slice fits in the payload");
    check(s.max_candidates == 10, "Candidate limit reset");
}

void testMalformedInput() {
    std::cout << "\n--- Test 4: Malformed Input ---" << std::endl;

    MeasurementConfig config = ConfigParser::getDefaultConfig();
    check(!ConfigParser::parseConfigJson(nlohmann::json::array(), config), "Array rejected");
    check(!ConfigParser::parseConfigJson({{"ui_tick_ms", "fast"}}, config), "Wrong type rejected");
    check(!ConfigParser::parseConfig("/nonexistent/edgegauge.json", config), "Missing file reported");

    MeasurementConfig negative = ConfigParser::getDefaultConfig();
    check(!ConfigParser::parseConfigJson(nlohmann::json::parse(
              R"({"engines": {"edge-cache": {"chunk_min_bytes": -1}}})"), negative),
          "Negative chunk size rejected");
    check(negative.engines["edge-cache"].chunk_min_bytes == 256 * 1024, "Negative chunk size not stored");
    check(!ConfigParser::parseConfigJson(nlohmann::json::parse(
              R"({"engines": {"direct-stream": {"upload_slice_bytes": -16384}}})"), negative),
          "Negative slice size rejected");
    check(negative.engines["direct-stream"].upload_slice_bytes == 512 * 1024, "Negative slice size not stored");
}

void testSaveAndReload() {
    std::cout << "\n--- Test 5: Save and Reload ---" << std::endl;

    const std::string path = "test_config_parser_roundtrip.json";
    MeasurementConfig original = ConfigParser::getDefaultConfig();
    original.engines["edge-cache"].max_workers = 6;
    original.default_engine = "persistent-edge";

    check(ConfigParser::saveConfig(path, original), "Saved");

    MeasurementConfig loaded;
    check(ConfigParser::parseConfig(path, loaded), "Reloaded");
    check(loaded.default_engine == "persistent-edge", "Default engine preserved");
    check(loaded.engines.size() == 4, "Engine blocks preserved");
    check(loaded.engines["best-server"].download_files == original.engines["best-server"].download_files &&
          loaded.engines["best-server"].server_list_url == original.engines["best-server"].server_list_url,
          "Directory settings preserved");
    check(loaded.engines["edge-cache"].max_workers == 6, "Engine override preserved");
    check(loaded.engines["persistent-edge"].upload_urls == original.engines["persistent-edge"].upload_urls,
          "Upload targets preserved");

    std::remove(path.c_str());
}

int main() {
    std::cout << "Testing ConfigParser..." << std::endl;

    testDefaults();
    testOverlay();
    testValidation();
    testMalformedInput();
    testSaveAndReload();

    std::cout << "\n" << (failures == 0 ? "All tests passed" : std::to_string(failures) + " test(s) failed") << std::endl;
    return failures == 0 ? 0 : 1;
}
