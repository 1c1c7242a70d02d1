#ifndef CONFIG_PARSER_H
#define CONFIG_PARSER_H

#include <string>
#include <nlohmann/json.hpp>
#include "measurement_config.h"

class ConfigParser {
public:
    static bool parseConfig(const std::string& config_file, MeasurementConfig& config);
    static bool parseConfigJson(const nlohmann::json& json_config, MeasurementConfig& config);
    static bool saveConfig(const std::string& config_file, const MeasurementConfig& config);
    static MeasurementConfig getDefaultConfig();

    // Settings for `engine_name`, or plain EngineSettings defaults when the
    // configuration has no block for it
    static EngineSettings settingsFor(const MeasurementConfig& config, const std::string& engine_name);

    static nlohmann::json engineSettingsToJson(const EngineSettings& settings);

    // False (with a message on stderr) when a byte count is negative
    static bool parseEngineSettings(const nlohmann::json& json_settings, EngineSettings& settings);

private:
    static void validateConfig(MeasurementConfig& config);
    static void validateEngineSettings(const std::string& name, EngineSettings& settings);
};

#endif // CONFIG_PARSER_H
