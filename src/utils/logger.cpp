/**
 * @file logger.cpp
 * @brief Line layout and sink dispatch.
 *
 * @copyright Copyright (c) 2025 psgui Contributors
 * @license MIT License
 */

#include "psgui/utils/logger.hpp"

#include <chrono>
#include <ctime>
#include <exception>
#include <iomanip>
#include <iostream>

namespace psgui {
namespace utils {

namespace {

const char* const kLevelNames[] = {"TRACE", "DEBUG", "INFO", "WARN", "ERROR", "FATAL", "OFF"};

const char* ansiColor(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "\033[90m";
        case LogLevel::DEBUG: return "\033[36m";
        case LogLevel::INFO:  return "\033[32m";
        case LogLevel::WARN:  return "\033[33m";
        case LogLevel::ERROR: return "\033[31m";
        case LogLevel::FATAL: return "\033[35;1m";
        default:              return "";
    }
}

// [YYYY-MM-DD HH:MM:SS.mmm] in local time
void appendTimestamp(std::ostringstream& out) {
    auto now = std::chrono::system_clock::now();
    std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;

    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &seconds);
#else
    localtime_r(&seconds, &local);
#endif
    out << '[' << std::put_time(&local, "%Y-%m-%d %H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << millis << "] ";
}

}  // namespace

std::string Logger::levelName(LogLevel level) {
    int index = static_cast<int>(level);
    if (index < 0 || index > static_cast<int>(LogLevel::OFF)) {
        return "UNKNOWN";
    }
    return kLevelNames[index];
}

LogLevel Logger::parseLevel(const std::string& name) {
    for (int i = 0; i <= static_cast<int>(LogLevel::OFF); ++i) {
        if (name == kLevelNames[i]) {
            return static_cast<LogLevel>(i);
        }
    }
    return LogLevel::INFO;
}

void Logger::setSink(LogSink sink) {
    std::shared_ptr<const LogSink> next;
    if (sink) {
        next = std::make_shared<const LogSink>(std::move(sink));
    }
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = std::move(next);
}

void Logger::write(LogLevel level, const std::string& component, const std::string& body) {
    std::shared_ptr<const LogSink> sink;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sink = sink_;
    }

    std::ostringstream line;
    appendTimestamp(line);

    std::string name = levelName(level);
    name.resize(5, ' ');
    if (!sink && color_.load(std::memory_order_relaxed)) {
        line << ansiColor(level) << '[' << name << "]\033[0m";
    } else {
        line << '[' << name << ']';
    }
    line << " [" << component << "] " << body;

    if (sink) {
        try {
            (*sink)(level, component, line.str());
            return;
        } catch (const std::exception& e) {
            std::lock_guard<std::mutex> lock(mutex_);
            std::cerr << "[logger] sink failed: " << e.what() << '\n';
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    std::cerr << line.str() << std::endl;
}

}  // namespace utils
}  // namespace psgui
