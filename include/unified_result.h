#ifndef UNIFIED_RESULT_H
#define UNIFIED_RESULT_H

#include <optional>
#include <string>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

// One record of the result stream. Built by the Orchestrator only.
struct UnifiedResult {
    double downloadMbps = 0.0;
    double uploadMbps = 0.0;
    std::optional<double> pingMs;
    std::optional<double> jitterMs;

    bool done = false;
    std::optional<std::string> error;
    std::string status;
    std::string phase; // "discovery", "latency", "download", "upload", "done", "cancelled"

    json metadata = json::object();

    bool hasError() const { return error.has_value(); }
    bool isTerminal() const { return done || error.has_value(); }

    json toJson() const;
};

#endif // UNIFIED_RESULT_H
