#pragma once

#include "Registrar/EnumUtils.hpp"

#include "chrono"
#include "source_location"
#include "string_view"

#ifdef REGISTRAR_PLATFORM_WINDOWS
#ifdef ERROR
#undef ERROR
#endif // ERROR
#endif // REGISTRAR_PLATFORM_WINDOWS

namespace Registrar::Journal {

/**
 * @enum Log Severity
 * @brief Severity levels for log messages.
 */
enum class Severity : uint8_t {
    TRACE,
    DEBUG,
    INFO,
    WARN,
    ERROR,
    FATAL,
    NONE
};

/**
 * @enum Namespace Component
 * @brief Components of the system for categorizing log messages.
 */
enum class Component : uint8_t {
    API, ///< Registrar.hpp convenience wrappers
    Registry, ///< Registry store, handles, factories
    Discovery, ///< Name, type and capability queries
    Security, ///< Signature, review and supply chain validation
    Bootstrap, ///< Self-registration queue and global registry construction
    USER, ///< User code, plugins, demo
    Unknown
};

/**
 * @enum Context
 * @brief Execution contexts for log messages.
 *
 * Represents the operation during which a message was produced, so that a
 * noisy phase (e.g. bootstrap) can be told apart from steady-state lookups.
 */
enum class Context : uint8_t {
    // ============================================================================
    // LIFECYCLE CONTEXTS
    // ============================================================================

    Init, ///< Registry/global singleton initialization
    Shutdown, ///< Teardown and test cleanup
    Configuration, ///< Configuration and limit updates

    // ============================================================================
    // REGISTRY CONTEXTS
    // ============================================================================

    Registration, ///< register/unregister/clear
    Lookup, ///< has/get_metadata/list
    Construction, ///< Factory invocation and handle narrowing
    Discovery, ///< Query evaluation
    SecurityCheck, ///< Validation and audit

    // ============================================================================
    // SPECIAL CONTEXTS
    // ============================================================================

    UserCode, ///< Plugin or application code
    Runtime, ///< General runtime operations (default fallback)
    Testing, ///< Testing/benchmarking context
    Unknown ///< Unknown or unspecified context
};

/**
 * @brief A log entry structure to encapsulate log message details.
 */
struct JournalEntry {
    Severity severity;
    Component component;
    Context context;
    std::string_view message;
    std::source_location location;
    std::chrono::steady_clock::time_point timestamp;

    JournalEntry(Severity sev, Component comp, Context ctx,
        std::string_view msg,
        std::source_location loc = std::source_location::current())
        : severity(sev)
        , component(comp)
        , context(ctx)
        , message(msg)
        , location(loc)
        , timestamp(std::chrono::steady_clock::now())
    {
    }

    static inline std::string severity_to_string(Severity sev)
    {
        return std::string(Utils::enum_to_string(sev));
    }

    static inline std::string component_to_string(Component comp)
    {
        return std::string(Utils::enum_to_string(comp));
    }

    static inline std::string context_to_string(Context ctx)
    {
        return std::string(Utils::enum_to_string(ctx));
    }
};

}
