#pragma once

#include "Format.hpp"
#include "JournalEntry.hpp"

namespace Registrar::Journal {

class Sink;

/**
 * @class Archivist
 * @brief Process-wide router from RG_* calls to the installed sinks
 *
 * Entries below the minimum severity, or from a component whose filter is
 * off, are dropped before any sink sees them. A ConsoleSink is installed on
 * construction; tests swap it for capturing sinks.
 */
class REGISTRAR_API Archivist {

public:
    static Archivist& instance();

    /**
     * @brief Initialize the logging system.
     *
     * Applies REGISTRAR_LOG_LEVEL (case-insensitive severity name) to the
     * minimum severity. Safe to call more than once.
     */
    static void init();

    /**
     * @brief Flush every sink. Logging keeps working afterwards.
     */
    static void shutdown();

    /**
     * @brief Route one entry to every available sink
     *
     * Sinks are written in installation order; an exception thrown by a sink
     * propagates to the caller.
     */
    void scribe(Severity severity, Component component, Context context,
        std::string_view message,
        std::source_location location = std::source_location::current());

    /**
     * @brief scribe() without a source location; used by RG_PRINT
     */
    void scribe_simple(Severity severity, Component component, Context context,
        std::string_view message);

    /**
     * @brief Append a sink; null is ignored
     */
    void add_sink(std::unique_ptr<Sink> sink);

    /**
     * @brief Remove all sinks
     */
    void clear_sinks();

    /**
     * @brief Remove all sinks and reinstall the default ConsoleSink
     */
    void reset_sinks();

    /**
     * @brief Drop entries below min_sev. Severity::NONE silences everything.
     */
    void set_min_severity(Severity min_sev);

    [[nodiscard]] Severity min_severity() const;

    /**
     * @brief Mute or unmute one component (Registry, Discovery, Security, ...)
     */
    void set_component_filter(Component comp, bool enabled);

    Archivist(const Archivist&) = delete;
    Archivist& operator=(const Archivist&) = delete;
    Archivist(Archivist&&) = delete;
    Archivist& operator=(Archivist&&) = delete;

private:
    Archivist();
    ~Archivist();

    class Impl;
    std::unique_ptr<Impl> m_impl;
};

/**
 * @brief Target of the RG_TRACE .. RG_ERROR macros
 */
inline void scribe(Severity severity, Component component, Context context,
    std::source_location location, std::string_view message)
{
    Archivist::instance().scribe(severity, component, context, message, location);
}

/**
 * @brief Formatting overload; skips the formatting work for filtered severities
 */
template <typename... Args>
void scribe(Severity severity, Component component, Context context,
    std::source_location location, const char* msg_or_fmt, Args&&... args)
{
    if constexpr (sizeof...(Args) == 0) {
        Archivist::instance().scribe(severity, component, context,
            std::string_view(msg_or_fmt), location);
    } else {
        if (severity < Archivist::instance().min_severity()) {
            return;
        }
        auto msg = format_runtime(msg_or_fmt, std::forward<Args>(args)...);
        Archivist::instance().scribe(severity, component, context, msg, location);
    }
}

/**
 * @brief Target of RG_PRINT
 */
inline void print(Severity severity, Component component, Context context,
    std::string_view message)
{
    Archivist::instance().scribe_simple(severity, component, context, message);
}

template <typename... Args>
void print(Severity severity, Component component, Context context,
    const char* msg_or_fmt, Args&&... args)
{
    if constexpr (sizeof...(Args) == 0) {
        Archivist::instance().scribe_simple(severity, component, context,
            std::string_view(msg_or_fmt));
    } else {
        auto msg = format_runtime(msg_or_fmt, std::forward<Args>(args)...);
        Archivist::instance().scribe_simple(severity, component, context, msg);
    }
}

/**
 * @brief Log at ERROR, then throw ExceptionType carrying the same message
 *
 * For failures with no error channel, such as bad command-line arguments.
 */
template <typename ExceptionType = std::runtime_error, typename... Args>
[[noreturn]] void error(Component component, Context context,
    std::source_location location, const char* fmt_str, Args&&... args)
{
    if constexpr (sizeof...(Args) == 0) {
        Archivist::instance().scribe(Severity::ERROR, component, context,
            std::string_view(fmt_str), location);
        throw ExceptionType(std::string(fmt_str));
    } else {
        auto msg = format_runtime(fmt_str, std::forward<Args>(args)...);
        Archivist::instance().scribe(Severity::ERROR, component, context, msg, location);
        throw ExceptionType(msg);
    }
}

} // namespace Registrar::Journal

// ============================================================================
// CONVENIENCE MACROS
// ============================================================================

#define RG_TRACE(comp, ctx, ...)                                               \
    Registrar::Journal::scribe(Registrar::Journal::Severity::TRACE, comp, ctx, \
        std::source_location::current(), __VA_ARGS__)

#define RG_DEBUG(comp, ctx, ...)                                               \
    Registrar::Journal::scribe(Registrar::Journal::Severity::DEBUG, comp, ctx, \
        std::source_location::current(), __VA_ARGS__)

#define RG_INFO(comp, ctx, ...)                                               \
    Registrar::Journal::scribe(Registrar::Journal::Severity::INFO, comp, ctx, \
        std::source_location::current(), __VA_ARGS__)

#define RG_WARN(comp, ctx, ...)                                               \
    Registrar::Journal::scribe(Registrar::Journal::Severity::WARN, comp, ctx, \
        std::source_location::current(), __VA_ARGS__)

#define RG_ERROR(comp, ctx, ...)                                               \
    Registrar::Journal::scribe(Registrar::Journal::Severity::ERROR, comp, ctx, \
        std::source_location::current(), __VA_ARGS__)

// ============================================================================
// CONVENIENCE MACROS for SIMPLE PRINTING (no source-location)
// ============================================================================
#define RG_PRINT(comp, ctx, ...) \
    Registrar::Journal::print(Registrar::Journal::Severity::INFO, comp, ctx, __VA_ARGS__)
