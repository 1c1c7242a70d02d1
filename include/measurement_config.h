#ifndef MEASUREMENT_CONFIG_H
#define MEASUREMENT_CONFIG_H

#include <cstddef>
#include <map>
#include <string>
#include <vector>

// Per-engine tunables, one block per entry under "engines" in the config file
struct EngineSettings {
    int phase_duration_sec = 15;

    int min_workers = 4;
    int max_workers = 8;
    int ramp_step = 2;
    int ramp_interval_ms = 2000;
    int worker_stagger_ms = 150;

    size_t chunk_min_bytes = 256 * 1024;
    size_t chunk_max_bytes = 8 * 1024 * 1024;
    int fast_chunk_ms = 300;
    int slow_chunk_ms = 5000;

    int connect_timeout_ms = 5000;
    int request_timeout_ms = 10000;
    int probe_timeout_ms = 4000;

    // Discovery
    std::vector<std::string> candidate_urls;
    bool require_ranges = true;
    size_t min_probe_bytes = 0;
    bool probe_with_get = false;

    // Server directory (best-server)
    std::string server_list_url;
    std::string preferred_country;
    int max_candidates = 10;

    // Latency
    int latency_samples = 15;
    int latency_interval_ms = 50;

    // Transfer targets
    std::string download_url;
    std::vector<std::string> download_files;
    std::vector<std::string> upload_urls;
    int upload_workers = 4;
    size_t upload_payload_bytes = 1024 * 1024;
    size_t upload_slice_bytes = 16 * 1024;
    int upload_probation_ms = 4000;
};

struct MeasurementConfig {
    int ui_tick_ms = 200;
    int window_ticks = 15;
    int post_latency_pause_ms = 400;
    int inter_phase_pause_ms = 500;

    // Guaranteed upload target shared by every engine's last tier
    std::string fallback_upload_url;

    std::string default_engine;
    std::map<std::string, EngineSettings> engines;

    // Component logging filters (group -> enabled)
    std::map<std::string, bool> log_filters;
};

#endif // MEASUREMENT_CONFIG_H
