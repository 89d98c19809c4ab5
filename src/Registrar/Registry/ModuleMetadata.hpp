#pragma once

#include "SecurityTypes.hpp"

namespace Registrar::Registry {

/**
 * @brief Descriptive, non-functional data stored next to each factory
 *
 * Never consulted by create(); used by Discovery, diagnostics and the
 * security catalog. Present if and only if the record is present.
 */
struct ModuleMetadata {
    std::string name;
    std::string module_type;
    std::string instantiate_fn_name { "factory" };
    std::string module_path; ///< "file:line" of the registration site
    std::string struct_name { "Module" };
    std::set<std::string> capabilities; ///< Tags matched by Discovery

    std::optional<ModuleSignature> signature;
    ModulePermissions permissions;
    ReviewStatus review_status;
    std::optional<SupplyChainInfo> supply_chain;
    SandboxConfig sandbox_config;

    [[nodiscard]] bool has_valid_signature() const { return signature.has_value(); }
    [[nodiscard]] bool is_approved() const { return review_status.is_approved(); }
    [[nodiscard]] bool has_supply_chain() const { return supply_chain.has_value(); }

    [[nodiscard]] bool has_capability(std::string_view tag) const
    {
        return capabilities.contains(std::string(tag));
    }

    /**
     * @brief One-line description for listings and logs
     */
    [[nodiscard]] std::string summary() const;
};

/**
 * @brief Render a source location as the "file:line" form used in module_path
 */
inline std::string format_source_location(const std::source_location& location)
{
    return std::string(location.file_name()) + ":" + std::to_string(location.line());
}

} // namespace Registrar::Registry
