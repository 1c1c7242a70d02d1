#ifndef ENGINE_REGISTRY_H
#define ENGINE_REGISTRY_H

#include <memory>
#include <string>
#include <vector>

#include "measurement_config.h"
#include "measurement_engine.h"

class EngineRegistry {
public:
    struct Entry {
        std::string name;
        std::string description;
    };

    static std::vector<Entry> availableEngines();

    // nullptr for an unknown name
    static std::shared_ptr<MeasurementEngine> create(const std::string& name,
                                                     const MeasurementConfig& config);
};

#endif // ENGINE_REGISTRY_H
