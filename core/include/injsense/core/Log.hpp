/**
 * @file Log.hpp
 * @brief Minimal logging façade with runtime severity filtering.
 *
 * Provides a static Log class backed by an injectable ILogger interface.
 * The default implementation writes to stderr.  A custom logger can be
 * installed via Log::setLogger() at startup.
 *
 * @author InjSense Team
 * @version 0.1.0
 * @date 2026-10-16
 * @copyright MIT License
 */
#pragma once

#ifndef INJSENSE_CORE_LOG_HPP
    #define INJSENSE_CORE_LOG_HPP

    #include "Types.hpp"

    #include <string_view>

namespace injsense::core {

/**
 * @brief Severity levels for log messages.
 */
enum class LogLevel : u8 {
    kDebug = 0,
    kInfo,
    kWarn,
    kError,
    kFatal
};

/**
 * @brief Abstract sink for log messages.
 */
class ILogger {
public:
    virtual ~ILogger() = default;

    /**
     * @brief Write a log entry.
     * @param level   Severity.
     * @param tag     Subsystem tag (e.g. "RiskEngine", "TrainedModel").
     * @param message Formatted message body.
     */
    virtual void write(LogLevel level, std::string_view tag, std::string_view message) = 0;
};

/**
 * @brief Static logging façade used throughout the library.
 *
 * Sink and level are meant to be configured once at startup; writes are
 * thread-safe provided the installed ILogger is thread-safe.
 */
class Log final {
public:
    Log() = delete;

    static void setLogger(ILogger *logger);
    static void setMinLevel(LogLevel level);
    [[nodiscard]] static LogLevel minLevel();

    static void debug(std::string_view tag, std::string_view msg);
    static void info (std::string_view tag, std::string_view msg);
    static void warn (std::string_view tag, std::string_view msg);
    static void error(std::string_view tag, std::string_view msg);
    static void fatal(std::string_view tag, std::string_view msg);

    static void debug(std::string_view msg) { debug("injsense", msg); }
    static void info (std::string_view msg) { info ("injsense", msg); }
    static void warn (std::string_view msg) { warn ("injsense", msg); }
    static void error(std::string_view msg) { error("injsense", msg); }
    static void fatal(std::string_view msg) { fatal("injsense", msg); }
};

} // namespace injsense::core

#endif // INJSENSE_CORE_LOG_HPP
