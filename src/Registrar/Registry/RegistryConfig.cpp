#include "RegistryConfig.hpp"

#include "Registrar/Journal/Archivist.hpp"

#include <charconv>

namespace Registrar::Registry {

namespace {

    void apply_override(const char* variable, size_t& target)
    {
        const auto value = Platform::safe_getenv(variable);
        if (value.empty()) {
            return;
        }

        size_t parsed {};
        const auto* end = value.data() + value.size();
        auto [ptr, ec] = std::from_chars(value.data(), end, parsed);
        if (ec != std::errc {} || ptr != end || parsed == 0) {
            RG_WARN(Journal::Component::Registry, Journal::Context::Configuration,
                "Ignoring {}='{}': expected a positive integer", variable, value);
            return;
        }

        target = parsed;
    }

} // namespace

RegistryConfig RegistryConfig::from_environment()
{
    RegistryConfig config;
    apply_override("REGISTRAR_MAX_NAME_LENGTH", config.max_name_length);
    apply_override("REGISTRAR_MAX_TYPE_LENGTH", config.max_type_length);
    apply_override("REGISTRAR_MAX_PATH_LENGTH", config.max_path_length);
    return config;
}

} // namespace Registrar::Registry
