#include "EngineRegistry.hpp"
#include "BestServerEngine.hpp"
#include "DirectStreamEngine.hpp"
#include "EdgeCacheEngine.hpp"
#include "PersistentEdgeEngine.hpp"
#include "config_parser.h"

std::vector<EngineRegistry::Entry> EngineRegistry::availableEngines() {
    return {
        {"edge-cache", "Range-chunked download from a discovered CDN cache, tiered upload"},
        {"persistent-edge", "Keep-alive socket transfers against a discovered edge object"},
        {"direct-stream", "Parallel full-object streams against fixed URLs"},
        {"best-server", "Lowest-ping server from a speed test directory, growing downloads"}
    };
}

std::shared_ptr<MeasurementEngine> EngineRegistry::create(const std::string& name,
                                                          const MeasurementConfig& config) {
    EngineSettings settings = ConfigParser::settingsFor(config, name);

    if (name == "edge-cache") {
        return std::make_shared<EdgeCacheEngine>(settings, config.fallback_upload_url);
    }
    if (name == "persistent-edge") {
        return std::make_shared<PersistentEdgeEngine>(settings, config.fallback_upload_url);
    }
    if (name == "direct-stream") {
        return std::make_shared<DirectStreamEngine>(settings);
    }
    if (name == "best-server") {
        return std::make_shared<BestServerEngine>(settings, config.fallback_upload_url);
    }
    return nullptr;
}
