#include "util/log.hpp"

#include <atomic>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <string>

#include "util/time.hpp"

namespace ragquery::log {
namespace {

std::mutex& log_mutex() {
    static std::mutex mutex;
    return mutex;
}

Level level_from_env() {
    const char* value = std::getenv("RAG_LOG_LEVEL");
    if (value == nullptr) {
        return Level::Info;
    }
    const std::string_view name{value};
    if (name == "debug" || name == "DEBUG") {
        return Level::Debug;
    }
    if (name == "warn" || name == "WARN") {
        return Level::Warn;
    }
    if (name == "error" || name == "ERROR") {
        return Level::Error;
    }
    return Level::Info;
}

std::atomic<Level>& threshold_ref() {
    static std::atomic<Level> level{level_from_env()};
    return level;
}

const char* to_string(Level level) {
    switch (level) {
        case Level::Debug:
            return "DEBUG";
        case Level::Info:
            return "INFO";
        case Level::Warn:
            return "WARN";
        case Level::Error:
            return "ERROR";
    }
    return "UNKNOWN";
}

}  // namespace

void set_threshold(Level level) { threshold_ref().store(level); }

Level threshold() { return threshold_ref().load(); }

bool enabled(Level level) { return static_cast<int>(level) >= static_cast<int>(threshold()); }

void write(Level level, std::string_view message) {
    if (!enabled(level)) {
        return;
    }
    const std::string timestamp = time::current_time_iso8601();
    auto& stream = (level == Level::Error || level == Level::Warn) ? std::cerr : std::cout;

    std::lock_guard<std::mutex> lock(log_mutex());
    stream << '[' << timestamp << "][" << to_string(level) << "] " << message << std::endl;
}

void debug(std::string_view message) { write(Level::Debug, message); }

void info(std::string_view message) { write(Level::Info, message); }

void warn(std::string_view message) { write(Level::Warn, message); }

void error(std::string_view message) { write(Level::Error, message); }

}  // namespace ragquery::log
