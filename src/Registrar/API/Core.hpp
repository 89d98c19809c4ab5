#pragma once

#include "Registrar/Journal/JournalEntry.hpp"
#include "Registrar/Registry/Discovery.hpp"

/**
 * @file Core.hpp
 * @brief Process-level entry points over the global registry
 *
 * Thin wrappers for applications that only ever use the process-wide
 * registry. Code that needs isolation (tests, embedded registries) should
 * construct a Registry::ModuleRegistry directly instead.
 */

namespace Registrar {

/**
 * @brief Initialize logging from the environment and build the global registry
 * @param log_level Minimum severity that overrides REGISTRAR_LOG_LEVEL; applied
 *        before the registry is built so bootstrap logging already honours it
 * @return The global registry, with every self-registered module inserted
 *
 * Safe to call more than once.
 */
REGISTRAR_API Registry::ModuleRegistry& Init(std::optional<Journal::Severity> log_level = std::nullopt);

/**
 * @brief Flush log sinks. The global registry stays valid until process exit.
 */
REGISTRAR_API void End();

/**
 * @brief Whether Init() has completed
 */
REGISTRAR_API bool is_initialized();

/**
 * @brief The global registry, building it on first use
 */
REGISTRAR_API Registry::ModuleRegistry& get_registry();

/**
 * @brief Construct the named module from the global registry as Interface
 */
template <typename Interface>
std::expected<std::unique_ptr<Interface>, Registry::RegistryError> create(std::string_view name)
{
    return get_registry().create<Interface>(name);
}

/**
 * @brief Names in the global registry, sorted
 */
REGISTRAR_API std::vector<std::string> list_modules();

/**
 * @brief Ranked discovery over the global registry
 */
REGISTRAR_API std::vector<std::string> discover(const Registry::DiscoveryQuery& query);

}
