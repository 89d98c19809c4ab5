#pragma once

#include "ModuleRegistry.hpp"

namespace Registrar::Registry::Registration {

/**
 * @brief Function that registers one or more modules into a registry
 *
 * Building block of an explicit composition root, see bootstrap().
 */
using RegisterFn = std::function<ModuleRegistry::Result(ModuleRegistry&)>;

/**
 * @brief Hand a record to the process-wide collection point
 *
 * Before ModuleRegistry::global() has been built the record is queued and
 * inserted when global() drains the queue; duplicates there are logged and
 * the first submission wins. Once the global registry exists the record is
 * registered into it directly and the result is returned to the caller.
 *
 * Safe to call during static initialization.
 */
REGISTRAR_API ModuleRegistry::Result submit(RegistrationRecord record);

/**
 * @brief Take every queued record and close the queue
 *
 * Called exactly once, by the global registry's construction. Later
 * submissions bypass the queue.
 */
REGISTRAR_API std::vector<RegistrationRecord> drain();

/**
 * @brief Number of records waiting for the global registry
 */
REGISTRAR_API size_t pending();

/**
 * @brief Run registration functions against a registry in order
 * @return The first error, after which the remaining functions are skipped
 *
 * Example:
 *   ModuleRegistry registry;
 *   auto result = Registration::bootstrap(registry, { register_text_plugins, register_storage });
 */
REGISTRAR_API ModuleRegistry::Result bootstrap(ModuleRegistry& registry, std::initializer_list<RegisterFn> functions);

/**
 * @brief Log a failed static submission and convert the result to bool
 */
REGISTRAR_API bool report_static_submission(const ModuleRegistry::Result& result, std::string_view name);

/**
 * @brief Submit Impl boxed as Interface from a static initializer
 * @return true when accepted; failures are logged since nothing can observe them
 *
 * Used through REGISTRAR_REGISTER_MODULE.
 */
template <typename Interface, typename Impl>
    requires ImplementationOf<Impl, Interface> && std::default_initializable<Impl>
bool submit_static(std::string_view name, std::string_view module_type,
    std::string_view struct_name,
    std::initializer_list<std::string_view> capabilities = {},
    std::source_location location = std::source_location::current())
{
    RegistrationRecord record {
        .name = std::string(name),
        .module_type = std::string(module_type),
        .factory = make_factory<Interface, Impl>(),
        .metadata = {},
    };
    record.metadata.struct_name = std::string(struct_name);
    for (auto tag : capabilities) {
        record.metadata.capabilities.emplace(tag);
    }
    record.metadata.module_path = format_source_location(location);

    return report_static_submission(submit(std::move(record)), name);
}

} // namespace Registrar::Registry::Registration

#define REGISTRAR_CONCAT_IMPL(a, b) a##b
#define REGISTRAR_CONCAT(a, b) REGISTRAR_CONCAT_IMPL(a, b)

/**
 * @brief Self-register Impl as Interface under name before main() runs
 *
 * Must be used at namespace scope in a source file. The record is picked up
 * by the first call to ModuleRegistry::global(). Any arguments after Impl
 * are capability tags stored in the metadata for Discovery.
 *
 * Example:
 *   REGISTRAR_REGISTER_MODULE("echo", "plugin", Plugin, EchoPlugin)
 *   REGISTRAR_REGISTER_MODULE("upper", "plugin", Plugin, UpperPlugin, "text", "transform")
 */
#define REGISTRAR_REGISTER_MODULE(name, type, Interface, Impl, ...)                        \
    namespace {                                                                            \
        [[maybe_unused]] const bool REGISTRAR_CONCAT(registrar_registered_, __COUNTER__) = \
            ::Registrar::Registry::Registration::submit_static<Interface, Impl>(          \
                name, type, #Impl, { __VA_ARGS__ });                                       \
    }
