#ifndef GAUGE_LOGGER_H
#define GAUGE_LOGGER_H

#include <string>
#include <map>
#include <iostream>
#include <mutex>

/**
 * Centralized component logging. Every message belongs to a component group
 * ("orchestrator", "lifecycle", "transport", engine names...) and groups can be
 * silenced from the "log_filters" block of the configuration file.
 *
 * Output goes to stderr; stdout is reserved for the result stream.
 */
class GaugeLogger {
public:
    static GaugeLogger& getInstance();

    // Configure logging filters from MeasurementConfig
    void setGroupFilters(const std::map<std::string, bool>& filters);

    // Check if logging is enabled for a specific component group
    bool isLoggingEnabled(const std::string& group) const;

    void log(const std::string& group, const std::string& message);
    void logInfo(const std::string& group, const std::string& message);
    void logWarning(const std::string& group, const std::string& message);
    void logError(const std::string& group, const std::string& message);

    // Redirect output (tests capture it, the CLI keeps stderr)
    void setOutput(std::ostream* out);

private:
    GaugeLogger() = default;
    ~GaugeLogger() = default;
    GaugeLogger(const GaugeLogger&) = delete;
    GaugeLogger& operator=(const GaugeLogger&) = delete;

    std::map<std::string, bool> group_filters_;
    std::ostream* out_ = &std::cerr;
    mutable std::mutex mutex_;
};

#define GAUGE_LOG(group, message) \
    GaugeLogger::getInstance().log(group, message)

#define GAUGE_LOG_INFO(group, message) \
    GaugeLogger::getInstance().logInfo(group, message)

#define GAUGE_LOG_WARNING(group, message) \
    GaugeLogger::getInstance().logWarning(group, message)

#define GAUGE_LOG_ERROR(group, message) \
    GaugeLogger::getInstance().logError(group, message)

#define IS_GAUGE_LOGGING_ENABLED(group) \
    GaugeLogger::getInstance().isLoggingEnabled(group)

#endif // GAUGE_LOGGER_H
