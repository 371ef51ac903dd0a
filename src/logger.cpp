#include "logger.hpp"
#include <iostream>
#include <iomanip>
#include <ctime>
#include <mutex>

namespace qrplay {

namespace {

std::mutex log_mutex;
std::ostream* log_stream = nullptr;
Logger::Level min_level = Logger::Level::INFO;

const char* level_tag(Logger::Level level) {
    switch (level) {
        case Logger::Level::DEBUG: return "[DEBUG] ";
        case Logger::Level::INFO:  return "[INFO]  ";
        case Logger::Level::WARN:  return "[WARN]  ";
        case Logger::Level::ERROR: return "[ERROR] ";
    }
    return "";
}

}

void Logger::set_level(Level level) {
    std::lock_guard<std::mutex> lock(log_mutex);
    min_level = level;
}

Logger::Level Logger::level() {
    std::lock_guard<std::mutex> lock(log_mutex);
    return min_level;
}

void Logger::set_output(std::ostream* stream) {
    std::lock_guard<std::mutex> lock(log_mutex);
    log_stream = stream;
}

void Logger::log(Level level, const std::string& message) {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (level < min_level) {
        return;
    }

    std::ostream& out = log_stream ? *log_stream : std::cerr;

    std::time_t now = std::time(nullptr);
    std::tm tm{};
    localtime_r(&now, &tm);

    out << std::put_time(&tm, "[%H:%M:%S] ") << level_tag(level) << message << '\n';
    out.flush();
}

void Logger::debug(const std::string& message) { log(Level::DEBUG, message); }
void Logger::info(const std::string& message) { log(Level::INFO, message); }
void Logger::warn(const std::string& message) { log(Level::WARN, message); }
void Logger::error(const std::string& message) { log(Level::ERROR, message); }

}
