/**
 * @file Log.hpp
 * @brief Minimal logging façade with runtime severity filtering.
 *
 * Provides a static Log class backed by an injectable ILogger interface.
 * The default implementation writes to stderr.  A custom logger can be
 * installed via Log::setLogger() at engine startup (the host application
 * usually forwards to its own console or telemetry).
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef ORB_CORE_LOG_HPP
    #define ORB_CORE_LOG_HPP

    #include "Types.hpp"

    #include <string_view>

namespace orb::core {

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
     * @param tag     Subsystem tag (e.g. "ctx", "graph", "mode").
     * @param message Formatted message body.
     */
    virtual void write(LogLevel level, std::string_view tag, std::string_view message) = 0;
};

/**
 * @brief Static logging façade used throughout the engine.
 *
 * All methods are thread-safe provided the installed ILogger is thread-safe.
 * The render thread never logs.
 */
class Log final {
public:
    Log() = delete;

    /**
     * @brief Installs @p logger; null restores the stderr logger.
     * @return The logger that was active before.
     */
    static ILogger *setLogger(ILogger *logger);
    static void setMinLevel(LogLevel level);
    [[nodiscard]] static LogLevel minLevel();

    /** @brief True if a message at @p level would reach the logger. */
    [[nodiscard]] static bool enabled(LogLevel level);

    static void debug(std::string_view tag, std::string_view msg);
    static void info (std::string_view tag, std::string_view msg);
    static void warn (std::string_view tag, std::string_view msg);
    static void error(std::string_view tag, std::string_view msg);
    static void fatal(std::string_view tag, std::string_view msg);

    static void debug(std::string_view msg) { debug("orb", msg); }
    static void info (std::string_view msg) { info ("orb", msg); }
    static void warn (std::string_view msg) { warn ("orb", msg); }
    static void error(std::string_view msg) { error("orb", msg); }
    static void fatal(std::string_view msg) { fatal("orb", msg); }
};

} // namespace orb::core

#endif // ORB_CORE_LOG_HPP
