#include "gauge_logger.h"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

GaugeLogger& GaugeLogger::getInstance() {
    static GaugeLogger instance;
    return instance;
}

void GaugeLogger::setGroupFilters(const std::map<std::string, bool>& filters) {
    std::lock_guard<std::mutex> lock(mutex_);
    group_filters_ = filters;
}

bool GaugeLogger::isLoggingEnabled(const std::string& group) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = group_filters_.find(group);
    if (it != group_filters_.end()) {
        return it->second;
    }
    // Default to true if group not found in config
    return true;
}

void GaugeLogger::setOutput(std::ostream* out) {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ = out ? out : &std::cerr;
}

void GaugeLogger::log(const std::string& group, const std::string& message) {
    if (!isLoggingEnabled(group)) {
        return;
    }

    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm local_tm{};
    localtime_r(&time_t, &local_tm);

    std::ostringstream line;
    line << "[" << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S")
         << "." << std::setfill('0') << std::setw(3) << ms.count()
         << "] [" << group << "] " << message << "\n";

    // Workers log concurrently; one locked write keeps lines whole
    std::lock_guard<std::mutex> lock(mutex_);
    (*out_) << line.str() << std::flush;
}

void GaugeLogger::logInfo(const std::string& group, const std::string& message) {
    log(group, "[INFO] " + message);
}

void GaugeLogger::logWarning(const std::string& group, const std::string& message) {
    log(group, "[WARNING] " + message);
}

void GaugeLogger::logError(const std::string& group, const std::string& message) {
    log(group, "[ERROR] " + message);
}
