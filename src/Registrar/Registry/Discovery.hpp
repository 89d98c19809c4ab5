#pragma once

#include "ModuleRegistry.hpp"

namespace Registrar::Registry {

/**
 * @brief Filter over registered modules; unset fields match everything
 */
struct DiscoveryQuery {
    std::optional<std::string> name_prefix;
    std::optional<std::string> name_pattern; ///< Glob: '*' any run, '?' one character
    std::optional<std::string> module_type;
    std::set<std::string> required_tags; ///< Every tag must be carried
    std::set<std::string> optional_tags; ///< Only affect ranking
};

/**
 * @brief One discovery hit
 */
struct DiscoveryMatch {
    ModuleMetadata metadata;
    size_t optional_matches {};
};

/**
 * @class Discovery
 * @brief Read-only queries over a ModuleRegistry's metadata
 *
 * Results are ranked by the number of optional tags a module carries
 * (most first), ties broken by name ascending. Queries run under the
 * registry's shared lock and never invoke factories.
 */
class REGISTRAR_API Discovery {
public:
    [[nodiscard]] static std::vector<DiscoveryMatch> find(const ModuleRegistry& registry, const DiscoveryQuery& query);

    /**
     * @brief Names of find() results, in ranking order
     */
    [[nodiscard]] static std::vector<std::string> find_names(const ModuleRegistry& registry, const DiscoveryQuery& query);

    [[nodiscard]] static std::vector<std::string> by_type(const ModuleRegistry& registry, std::string_view module_type);

    [[nodiscard]] static std::vector<std::string> by_prefix(const ModuleRegistry& registry, std::string_view prefix);

    [[nodiscard]] static std::vector<std::string> by_pattern(const ModuleRegistry& registry, std::string_view pattern);

    [[nodiscard]] static std::vector<std::string> with_capabilities(const ModuleRegistry& registry,
        std::set<std::string> required, std::set<std::string> optional = {});

    /**
     * @brief True when text matches the glob pattern in full
     */
    [[nodiscard]] static bool glob_match(std::string_view pattern, std::string_view text);

    /**
     * @brief Whether metadata passes every filter of query (ignores ranking)
     */
    [[nodiscard]] static bool matches(const ModuleMetadata& metadata, const DiscoveryQuery& query);
};

} // namespace Registrar::Registry
