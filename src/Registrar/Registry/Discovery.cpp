#include "Discovery.hpp"

#include "Registrar/Journal/Archivist.hpp"

namespace Registrar::Registry {

bool Discovery::glob_match(std::string_view pattern, std::string_view text)
{
    size_t p = 0;
    size_t t = 0;
    size_t star = std::string_view::npos;
    size_t resume = 0;

    while (t < text.size()) {
        if (p < pattern.size() && (pattern[p] == '?' || pattern[p] == text[t])) {
            ++p;
            ++t;
        } else if (p < pattern.size() && pattern[p] == '*') {
            star = p++;
            resume = t;
        } else if (star != std::string_view::npos) {
            p = star + 1;
            t = ++resume;
        } else {
            return false;
        }
    }

    while (p < pattern.size() && pattern[p] == '*') {
        ++p;
    }
    return p == pattern.size();
}

bool Discovery::matches(const ModuleMetadata& metadata, const DiscoveryQuery& query)
{
    if (query.name_prefix && !metadata.name.starts_with(*query.name_prefix)) {
        return false;
    }

    if (query.name_pattern && !glob_match(*query.name_pattern, metadata.name)) {
        return false;
    }

    if (query.module_type && metadata.module_type != *query.module_type) {
        return false;
    }

    return std::ranges::includes(metadata.capabilities, query.required_tags);
}

std::vector<DiscoveryMatch> Discovery::find(const ModuleRegistry& registry, const DiscoveryQuery& query)
{
    std::vector<DiscoveryMatch> results;

    registry.for_each_module([&](const ModuleMetadata& metadata) {
        if (!matches(metadata, query)) {
            return;
        }

        const auto optional_matches = static_cast<size_t>(std::ranges::count_if(query.optional_tags,
            [&metadata](const std::string& tag) { return metadata.capabilities.contains(tag); }));

        results.push_back({ metadata, optional_matches });
    });

    std::ranges::sort(results, [](const DiscoveryMatch& a, const DiscoveryMatch& b) {
        if (a.optional_matches != b.optional_matches) {
            return a.optional_matches > b.optional_matches;
        }
        return a.metadata.name < b.metadata.name;
    });

    RG_TRACE(Journal::Component::Discovery, Journal::Context::Discovery,
        "Discovery matched {} modules", results.size());

    return results;
}

std::vector<std::string> Discovery::find_names(const ModuleRegistry& registry, const DiscoveryQuery& query)
{
    std::vector<std::string> names;
    for (auto& match : find(registry, query)) {
        names.push_back(std::move(match.metadata.name));
    }
    return names;
}

std::vector<std::string> Discovery::by_type(const ModuleRegistry& registry, std::string_view module_type)
{
    return find_names(registry, DiscoveryQuery { .module_type = std::string(module_type) });
}

std::vector<std::string> Discovery::by_prefix(const ModuleRegistry& registry, std::string_view prefix)
{
    return find_names(registry, DiscoveryQuery { .name_prefix = std::string(prefix) });
}

std::vector<std::string> Discovery::by_pattern(const ModuleRegistry& registry, std::string_view pattern)
{
    return find_names(registry, DiscoveryQuery { .name_pattern = std::string(pattern) });
}

std::vector<std::string> Discovery::with_capabilities(const ModuleRegistry& registry,
    std::set<std::string> required, std::set<std::string> optional)
{
    return find_names(registry, DiscoveryQuery {
                                    .required_tags = std::move(required),
                                    .optional_tags = std::move(optional),
                                });
}

} // namespace Registrar::Registry
