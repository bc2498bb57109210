/**
 * @file logger.hpp
 * @brief Process-wide leveled logger with component tags.
 *
 * Lines go to stderr unless the host installs a LogSink, in which case
 * the sink receives every line that passes the level filter.
 *
 * @copyright Copyright (c) 2025 psgui Contributors
 * @license MIT License
 */

#pragma once

#include "psgui/utils/export.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <utility>

namespace psgui {
namespace utils {

enum class LogLevel : int {
    TRACE = 0,
    DEBUG,
    INFO,
    WARN,
    ERROR,
    FATAL,
    OFF
};

/**
 * @brief Receives each formatted line in place of stderr.
 *
 * Called without the logger lock held. A sink that throws loses the
 * line to stderr instead.
 */
using LogSink = std::function<void(LogLevel level,
                                   const std::string& component,
                                   const std::string& line)>;

namespace detail {

// Substitutes "{}" placeholders left to right. Surplus arguments are
// dropped; surplus placeholders are printed literally.
inline void appendFormatted(std::ostringstream& out, const char* format) {
    out << format;
}

template<typename T, typename... Rest>
void appendFormatted(std::ostringstream& out, const char* format, T&& value, Rest&&... rest) {
    for (const char* p = format; *p; ++p) {
        if (p[0] == '{' && p[1] == '}') {
            out << value;
            appendFormatted(out, p + 2, std::forward<Rest>(rest)...);
            return;
        }
        out << *p;
    }
}

}  // namespace detail

/**
 * @class Logger
 * @brief Singleton logger shared by every psgui library.
 *
 * @code
 * LOG_INFO("Connection", "Connected to project {}", project_id);
 * @endcode
 */
class PSGUI_UTILS_API Logger {
public:
    static Logger& instance() {
        static Logger logger;
        return logger;
    }

    /// Upper-case level name, e.g. "WARN"
    static std::string levelName(LogLevel level);

    /**
     * @brief Parse an upper-case level name.
     * @return INFO when the name is not recognised.
     */
    static LogLevel parseLevel(const std::string& name);

    void setLevel(LogLevel level) {
        threshold_.store(static_cast<int>(level), std::memory_order_relaxed);
    }

    bool isEnabled(LogLevel level) const {
        return static_cast<int>(level) >= threshold_.load(std::memory_order_relaxed);
    }

    /// ANSI colouring of the level column on stderr. Sinks never see colour.
    void setColorEnabled(bool enabled) {
        color_.store(enabled, std::memory_order_relaxed);
    }

    /**
     * @brief Install a line sink, or pass nullptr to go back to stderr.
     */
    void setSink(LogSink sink);

    template<typename... Args>
    void log(LogLevel level, const std::string& component, const char* format, Args&&... args) {
        if (!isEnabled(level)) {
            return;
        }
        std::ostringstream body;
        detail::appendFormatted(body, format, std::forward<Args>(args)...);
        write(level, component, body.str());
    }

private:
    Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void write(LogLevel level, const std::string& component, const std::string& body);

    std::atomic<int> threshold_{static_cast<int>(LogLevel::INFO)};
    std::atomic<bool> color_{true};
    std::mutex mutex_;
    std::shared_ptr<const LogSink> sink_;
};

}  // namespace utils
}  // namespace psgui

// =============================================================================
// Macros
// =============================================================================

#define PSGUI_LOG(level, component, ...) \
    ::psgui::utils::Logger::instance().log(level, component, __VA_ARGS__)

#define LOG_TRACE(component, ...) PSGUI_LOG(::psgui::utils::LogLevel::TRACE, component, __VA_ARGS__)
#define LOG_DEBUG(component, ...) PSGUI_LOG(::psgui::utils::LogLevel::DEBUG, component, __VA_ARGS__)
#define LOG_INFO(component, ...)  PSGUI_LOG(::psgui::utils::LogLevel::INFO, component, __VA_ARGS__)
#define LOG_WARN(component, ...)  PSGUI_LOG(::psgui::utils::LogLevel::WARN, component, __VA_ARGS__)
#define LOG_ERROR(component, ...) PSGUI_LOG(::psgui::utils::LogLevel::ERROR, component, __VA_ARGS__)
#define LOG_FATAL(component, ...) PSGUI_LOG(::psgui::utils::LogLevel::FATAL, component, __VA_ARGS__)

// Arguments are not evaluated unless the condition holds and the level is on
#define LOG_IF(level, component, condition, ...) \
    do { \
        if ((condition) && ::psgui::utils::Logger::instance().isEnabled(level)) { \
            PSGUI_LOG(level, component, __VA_ARGS__); \
        } \
    } while (0)
