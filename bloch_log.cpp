#include "bloch_log.hpp"
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>

namespace bloch {

static std::mutex log_mutex;
static std::ofstream log_file;
static Logger::Level min_level = Logger::Level::Info;

bool Logger::init(Level level, const std::string& path) {
    std::lock_guard<std::mutex> lock(log_mutex);
    min_level = level;
    if (log_file.is_open()) log_file.close();
    if (path.empty()) return true;
    log_file.open(path, std::ios::trunc);
    return log_file.is_open();
}

void Logger::set_level(Level level) {
    std::lock_guard<std::mutex> lock(log_mutex);
    min_level = level;
}

Logger::Level Logger::level() {
    std::lock_guard<std::mutex> lock(log_mutex);
    return min_level;
}

void Logger::log(Level level, const std::string& message) {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (static_cast<int>(level) < static_cast<int>(min_level)) return;

    const char* tag = "[INFO]  ";
    switch (level) {
        case Level::Debug: tag = "[DEBUG] "; break;
        case Level::Info:  tag = "[INFO]  "; break;
        case Level::Warn:  tag = "[WARN]  "; break;
        case Level::Error: tag = "[ERROR] "; break;
    }

    const std::time_t now = std::time(nullptr);
    const std::tm tm = *std::localtime(&now);
    std::ostream& out = log_file.is_open() ? static_cast<std::ostream&>(log_file) : std::cerr;
    out << std::put_time(&tm, "[%H:%M:%S] ") << tag << message << '\n';
    out.flush();
}

void Logger::debug(const std::string& message) { log(Level::Debug, message); }
void Logger::info(const std::string& message)  { log(Level::Info, message); }
void Logger::warn(const std::string& message)  { log(Level::Warn, message); }
void Logger::error(const std::string& message) { log(Level::Error, message); }

}
