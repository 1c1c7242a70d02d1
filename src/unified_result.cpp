#include "unified_result.h"

#include <cmath>

namespace {

// Two decimals is what the result stream carries
double rounded(double value) {
    return std::round(value * 100.0) / 100.0;
}

} // namespace

json UnifiedResult::toJson() const {
    json j;
    j["download_mbps"] = rounded(downloadMbps);
    j["upload_mbps"] = rounded(uploadMbps);
    j["ping_ms"] = pingMs ? json(rounded(*pingMs)) : json(nullptr);
    j["jitter_ms"] = jitterMs ? json(rounded(*jitterMs)) : json(nullptr);
    j["done"] = done;
    j["error"] = error ? json(*error) : json(nullptr);
    j["status"] = status;
    j["phase"] = phase;
    j["metadata"] = metadata.is_object() ? metadata : json::object();
    return j;
}
