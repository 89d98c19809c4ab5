#pragma once

namespace Registrar::Registry {

/**
 * @class Module
 * @brief Root of every capability interface served through the registry
 *
 * Applications derive their capability interfaces (Plugin, StorageBackend,
 * ...) from Module and register implementations of those interfaces. The
 * registry never inspects instance state; name() and module_type() exist for
 * the application's own diagnostics.
 *
 * Example:
 *   class TextProcessor : public Module {
 *   public:
 *       virtual std::string process(std::string_view input) = 0;
 *   };
 */
class REGISTRAR_API Module {
public:
    virtual ~Module() = default;

    /**
     * @brief Unique name the instance was registered under
     */
    [[nodiscard]] virtual std::string_view name() const = 0;

    /**
     * @brief Coarse type tag, e.g. "processor", "provider", "plugin"
     */
    [[nodiscard]] virtual std::string_view module_type() const = 0;
};

} // namespace Registrar::Registry
