#include "config_parser.h"
#include <algorithm>
#include <fstream>
#include <iostream>

namespace {

// Byte counts are unsigned; a negative value would wrap to a huge size
bool readByteCount(const nlohmann::json& j, const char* key, size_t& target) {
    if (!j.contains(key)) {
        return true;
    }
    const nlohmann::json& value = j[key];
    if (value.is_number() && value.get<double>() < 0) {
        std::cerr << "Error parsing config: " << key << " must not be negative" << std::endl;
        return false;
    }
    target = value.get<size_t>();
    return true;
}

} // namespace

bool ConfigParser::parseConfig(const std::string& config_file, MeasurementConfig& config) {
    try {
        std::ifstream file(config_file);
        if (!file.is_open()) {
            return false;
        }

        nlohmann::json json_config;
        file >> json_config;
        return parseConfigJson(json_config, config);

    } catch (const std::exception& e) {
        std::cerr << "Error parsing config file: " << e.what() << std::endl;
        return false;
    }
}

bool ConfigParser::parseConfigJson(const nlohmann::json& json_config, MeasurementConfig& config) {
    try {
        if (!json_config.is_object()) {
            std::cerr << "Error parsing config: top level must be an object" << std::endl;
            return false;
        }

        if (json_config.contains("ui_tick_ms")) {
            config.ui_tick_ms = json_config["ui_tick_ms"];
        }

        if (json_config.contains("window_ticks")) {
            config.window_ticks = json_config["window_ticks"];
        }

        if (json_config.contains("post_latency_pause_ms")) {
            config.post_latency_pause_ms = json_config["post_latency_pause_ms"];
        }

        if (json_config.contains("inter_phase_pause_ms")) {
            config.inter_phase_pause_ms = json_config["inter_phase_pause_ms"];
        }

        if (json_config.contains("fallback_upload_url")) {
            config.fallback_upload_url = json_config["fallback_upload_url"];
        }

        if (json_config.contains("default_engine")) {
            config.default_engine = json_config["default_engine"];
        }

        // Engine blocks overlay the defaults of the engine with the same name
        if (json_config.contains("engines")) {
            for (auto& [name, value] : json_config["engines"].items()) {
                EngineSettings settings = settingsFor(config, name);
                if (!parseEngineSettings(value, settings)) {
                    return false;
                }
                config.engines[name] = settings;
            }
        }

        if (json_config.contains("log_filters")) {
            config.log_filters.clear();
            for (auto& [key, value] : json_config["log_filters"].items()) {
                config.log_filters[key] = value.get<bool>();
            }
        }

        validateConfig(config);
        return true;

    } catch (const std::exception& e) {
        std::cerr << "Error parsing config: " << e.what() << std::endl;
        return false;
    }
}

bool ConfigParser::parseEngineSettings(const nlohmann::json& j, EngineSettings& s) {
    if (j.contains("phase_duration_sec")) s.phase_duration_sec = j["phase_duration_sec"];
    if (j.contains("min_workers")) s.min_workers = j["min_workers"];
    if (j.contains("max_workers")) s.max_workers = j["max_workers"];
    if (j.contains("ramp_step")) s.ramp_step = j["ramp_step"];
    if (j.contains("ramp_interval_ms")) s.ramp_interval_ms = j["ramp_interval_ms"];
    if (j.contains("worker_stagger_ms")) s.worker_stagger_ms = j["worker_stagger_ms"];

    if (!readByteCount(j, "chunk_min_bytes", s.chunk_min_bytes) ||
        !readByteCount(j, "chunk_max_bytes", s.chunk_max_bytes)) {
        return false;
    }
    if (j.contains("fast_chunk_ms")) s.fast_chunk_ms = j["fast_chunk_ms"];
    if (j.contains("slow_chunk_ms")) s.slow_chunk_ms = j["slow_chunk_ms"];

    if (j.contains("connect_timeout_ms")) s.connect_timeout_ms = j["connect_timeout_ms"];
    if (j.contains("request_timeout_ms")) s.request_timeout_ms = j["request_timeout_ms"];
    if (j.contains("probe_timeout_ms")) s.probe_timeout_ms = j["probe_timeout_ms"];

    if (j.contains("candidate_urls")) {
        s.candidate_urls = j["candidate_urls"].get<std::vector<std::string>>();
    }
    if (j.contains("require_ranges")) s.require_ranges = j["require_ranges"];
    if (!readByteCount(j, "min_probe_bytes", s.min_probe_bytes)) {
        return false;
    }
    if (j.contains("probe_with_get")) s.probe_with_get = j["probe_with_get"];

    if (j.contains("server_list_url")) s.server_list_url = j["server_list_url"];
    if (j.contains("preferred_country")) s.preferred_country = j["preferred_country"];
    if (j.contains("max_candidates")) s.max_candidates = j["max_candidates"];

    if (j.contains("latency_samples")) s.latency_samples = j["latency_samples"];
    if (j.contains("latency_interval_ms")) s.latency_interval_ms = j["latency_interval_ms"];

    if (j.contains("download_url")) s.download_url = j["download_url"];
    if (j.contains("download_files")) {
        s.download_files = j["download_files"].get<std::vector<std::string>>();
    }
    if (j.contains("upload_urls")) {
        s.upload_urls = j["upload_urls"].get<std::vector<std::string>>();
    }
    if (j.contains("upload_workers")) s.upload_workers = j["upload_workers"];
    if (!readByteCount(j, "upload_payload_bytes", s.upload_payload_bytes) ||
        !readByteCount(j, "upload_slice_bytes", s.upload_slice_bytes)) {
        return false;
    }
    if (j.contains("upload_probation_ms")) s.upload_probation_ms = j["upload_probation_ms"];
    return true;
}

nlohmann::json ConfigParser::engineSettingsToJson(const EngineSettings& s) {
    nlohmann::json j;
    j["phase_duration_sec"] = s.phase_duration_sec;
    j["min_workers"] = s.min_workers;
    j["max_workers"] = s.max_workers;
    j["ramp_step"] = s.ramp_step;
    j["ramp_interval_ms"] = s.ramp_interval_ms;
    j["worker_stagger_ms"] = s.worker_stagger_ms;
    j["chunk_min_bytes"] = s.chunk_min_bytes;
    j["chunk_max_bytes"] = s.chunk_max_bytes;
    j["fast_chunk_ms"] = s.fast_chunk_ms;
    j["slow_chunk_ms"] = s.slow_chunk_ms;
    j["connect_timeout_ms"] = s.connect_timeout_ms;
    j["request_timeout_ms"] = s.request_timeout_ms;
    j["probe_timeout_ms"] = s.probe_timeout_ms;
    j["candidate_urls"] = s.candidate_urls;
    j["require_ranges"] = s.require_ranges;
    j["min_probe_bytes"] = s.min_probe_bytes;
    j["probe_with_get"] = s.probe_with_get;
    j["server_list_url"] = s.server_list_url;
    j["preferred_country"] = s.preferred_country;
    j["max_candidates"] = s.max_candidates;
    j["latency_samples"] = s.latency_samples;
    j["latency_interval_ms"] = s.latency_interval_ms;
    j["download_url"] = s.download_url;
    j["download_files"] = s.download_files;
    j["upload_urls"] = s.upload_urls;
    j["upload_workers"] = s.upload_workers;
    j["upload_payload_bytes"] = s.upload_payload_bytes;
    j["upload_slice_bytes"] = s.upload_slice_bytes;
    j["upload_probation_ms"] = s.upload_probation_ms;
    return j;
}

bool ConfigParser::saveConfig(const std::string& config_file, const MeasurementConfig& config) {
    try {
        nlohmann::json json_config;

        json_config["ui_tick_ms"] = config.ui_tick_ms;
        json_config["window_ticks"] = config.window_ticks;
        json_config["post_latency_pause_ms"] = config.post_latency_pause_ms;
        json_config["inter_phase_pause_ms"] = config.inter_phase_pause_ms;
        json_config["fallback_upload_url"] = config.fallback_upload_url;
        json_config["default_engine"] = config.default_engine;

        json_config["engines"] = nlohmann::json::object();
        for (const auto& [name, settings] : config.engines) {
            json_config["engines"][name] = engineSettingsToJson(settings);
        }

        json_config["log_filters"] = config.log_filters;

        std::ofstream file(config_file);
        if (!file.is_open()) {
            return false;
        }

        file << json_config.dump(4);
        return true;

    } catch (const std::exception& e) {
        std::cerr << "Error saving config file: " << e.what() << std::endl;
        return false;
    }
}

MeasurementConfig ConfigParser::getDefaultConfig() {
    MeasurementConfig config;
    config.ui_tick_ms = 200;
    config.window_ticks = 15;
    config.post_latency_pause_ms = 400;
    config.inter_phase_pause_ms = 500;
    config.fallback_upload_url = "https://speed.cloudflare.com/__up";
    config.default_engine = "edge-cache";

    // Range-chunked download from a large cached object, tiered upload
    EngineSettings edge;
    edge.min_workers = 4;
    edge.max_workers = 8;
    edge.chunk_min_bytes = 256 * 1024;
    edge.chunk_max_bytes = 8 * 1024 * 1024;
    edge.candidate_urls = {
        "http://swcdn.apple.com/content/downloads/28/01/041-88407-A_T8D7833FO7/0y7xlyp38xrt816x5f14x13a69aoxr8p25/Safari15.6.1BigSurAuto.pkg",
        "http://ardownload2.adobe.com/pub/adobe/reader/win/AcroRdrDC2100120155_en_US.exe",
        "http://steamcdn-a.akamaihd.net/client/installer/SteamSetup.exe"
    };
    edge.require_ranges = true;
    edge.min_probe_bytes = 1024 * 1024;
    edge.upload_urls = {
        "https://www.icloud.com/",
        "https://gateway.icloud.com/"
    };
    edge.upload_workers = 4;
    edge.upload_payload_bytes = 256 * 1024;
    edge.upload_slice_bytes = 64 * 1024;
    config.engines["edge-cache"] = edge;

    // Keep-alive socket GETs of a small edge object
    EngineSettings persistent;
    persistent.min_workers = 4;
    persistent.max_workers = 4;
    persistent.worker_stagger_ms = 50;
    persistent.connect_timeout_ms = 8000;
    persistent.probe_timeout_ms = 6000;
    persistent.candidate_urls = {
        "https://static.xx.fbcdn.net/rsrc.php/v3/yO/r/Yh4kFx5D0Lq.png",
        "https://scontent.xx.fbcdn.net/v/t1.0-9/p720x720/placeholder.jpg"
    };
    persistent.require_ranges = false;
    persistent.probe_with_get = true;
    persistent.min_probe_bytes = 10000;
    persistent.upload_urls = {"https://graph.facebook.com/v19.0/me"};
    persistent.upload_workers = 3;
    persistent.upload_payload_bytes = 1024 * 1024;
    persistent.upload_slice_bytes = 16 * 1024;
    config.engines["persistent-edge"] = persistent;

    // Fixed-URL parallel streams
    EngineSettings direct;
    direct.min_workers = 16;
    direct.max_workers = 16;
    direct.worker_stagger_ms = 0;
    direct.download_url = "https://speed.cloudflare.com/__down?bytes=25000000";
    direct.upload_urls = {"https://speed.cloudflare.com/__up"};
    direct.upload_workers = 16;
    direct.upload_payload_bytes = 1024 * 1024;
    direct.upload_slice_bytes = 512 * 1024;
    config.engines["direct-stream"] = direct;

    // Lowest-ping server from a speed test directory, growing image downloads
    EngineSettings best;
    best.min_workers = 2;
    best.max_workers = 16;
    best.ramp_step = 2;
    best.worker_stagger_ms = 50;
    best.probe_timeout_ms = 3000;
    best.latency_samples = 10;
    best.latency_interval_ms = 100;
    best.server_list_url = "https://www.speedtest.net/api/js/servers?engine=js&limit=40";
    best.download_files = {"random350x350.jpg", "random750x750.jpg", "random1500x1500.jpg",
                           "random2000x2000.jpg", "random3000x3000.jpg", "random4000x4000.jpg"};
    best.upload_workers = 8;
    best.upload_payload_bytes = 256 * 1024;
    best.upload_slice_bytes = 64 * 1024;
    config.engines["best-server"] = best;

    // Default component logging configuration (all enabled by default)
    config.log_filters = {
        {"orchestrator", true},
        {"lifecycle", true},
        {"timer", true},
        {"transport", true},
        {"discovery", true},
        {"latency", true},
        {"download", true},
        {"upload", true},
        {"edge-cache", true},
        {"persistent-edge", true},
        {"direct-stream", true},
        {"best-server", true},
        {"cli", true}
    };

    return config;
}

EngineSettings ConfigParser::settingsFor(const MeasurementConfig& config, const std::string& engine_name) {
    auto it = config.engines.find(engine_name);
    if (it != config.engines.end()) {
        return it->second;
    }
    return EngineSettings{};
}

void ConfigParser::validateConfig(MeasurementConfig& config) {
    // The UI cadence must stay in a range a human can read
    if (config.ui_tick_ms < 50 || config.ui_tick_ms > 2000) {
        std::cerr << "Warning: Invalid ui_tick_ms " << config.ui_tick_ms << ", using default 200" << std::endl;
        config.ui_tick_ms = 200;
    }

    if (config.window_ticks < 1 || config.window_ticks > 63) {
        std::cerr << "Warning: Invalid window_ticks " << config.window_ticks << ", using default 15" << std::endl;
        config.window_ticks = 15;
    }

    if (config.post_latency_pause_ms < 0) {
        config.post_latency_pause_ms = 0;
    }

    if (config.inter_phase_pause_ms < 0) {
        config.inter_phase_pause_ms = 0;
    }

    if (config.fallback_upload_url.empty()) {
        config.fallback_upload_url = "https://speed.cloudflare.com/__up";
    }

    for (auto& [name, settings] : config.engines) {
        validateEngineSettings(name, settings);
    }
}

void ConfigParser::validateEngineSettings(const std::string& name, EngineSettings& s) {
    if (s.phase_duration_sec < 1 || s.phase_duration_sec > 300) {
        std::cerr << "Warning: " << name << ": invalid phase_duration_sec " << s.phase_duration_sec
                  << ", using default 15" << std::endl;
        s.phase_duration_sec = 15;
    }

    if (s.min_workers < 1) {
        std::cerr << "Warning: " << name << ": invalid min_workers " << s.min_workers
                  << ", using 1" << std::endl;
        s.min_workers = 1;
    }

    if (s.max_workers < s.min_workers) {
        std::cerr << "Warning: " << name << ": max_workers below min_workers, raising to "
                  << s.min_workers << std::endl;
        s.max_workers = s.min_workers;
    }

    if (s.ramp_step < 1) {
        s.ramp_step = 1;
    }

    if (s.ramp_interval_ms < 100) {
        s.ramp_interval_ms = 2000;
    }

    if (s.worker_stagger_ms < 0) {
        s.worker_stagger_ms = 0;
    }

    if (s.chunk_min_bytes < 1024) {
        std::cerr << "Warning: " << name << ": chunk_min_bytes too small, using 256 KiB" << std::endl;
        s.chunk_min_bytes = 256 * 1024;
    }

    if (s.chunk_max_bytes < s.chunk_min_bytes) {
        s.chunk_max_bytes = s.chunk_min_bytes;
    }

    if (s.fast_chunk_ms < 1) {
        s.fast_chunk_ms = 300;
    }

    if (s.slow_chunk_ms <= s.fast_chunk_ms) {
        std::cerr << "Warning: " << name << ": slow_chunk_ms must exceed fast_chunk_ms, using 5000" << std::endl;
        s.slow_chunk_ms = std::max(5000, s.fast_chunk_ms + 1);
    }

    if (s.connect_timeout_ms < 100) {
        s.connect_timeout_ms = 5000;
    }

    if (s.request_timeout_ms < 100) {
        s.request_timeout_ms = 10000;
    }

    if (s.probe_timeout_ms < 100) {
        s.probe_timeout_ms = 4000;
    }

    if (s.max_candidates < 1) {
        std::cerr << "Warning: " << name << ": invalid max_candidates " << s.max_candidates
                  << ", using 10" << std::endl;
        s.max_candidates = 10;
    }

    if (s.latency_samples < 1) {
        s.latency_samples = 15;
    }

    if (s.latency_interval_ms < 0) {
        s.latency_interval_ms = 50;
    }

    if (s.upload_workers < 1) {
        s.upload_workers = 1;
    }

    if (s.upload_payload_bytes == 0) {
        s.upload_payload_bytes = 1024 * 1024;
    }

    if (s.upload_slice_bytes == 0 || s.upload_slice_bytes > s.upload_payload_bytes) {
        s.upload_slice_bytes = std::min<size_t>(16 * 1024, s.upload_payload_bytes);
    }

    if (s.upload_probation_ms < 0) {
        s.upload_probation_ms = 4000;
    }
}
