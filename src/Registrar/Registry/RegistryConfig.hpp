#pragma once

namespace Registrar::Registry {

/**
 * @brief Limits enforced on registration input
 *
 * Plain defaults cover normal use. from_environment() lets deployments raise
 * or lower them without recompiling.
 */
struct REGISTRAR_API RegistryConfig {
    size_t max_name_length { 256 };
    size_t max_type_length { 128 };
    size_t max_path_length { 4096 };

    /**
     * @brief Defaults overridden by REGISTRAR_MAX_NAME_LENGTH,
     *        REGISTRAR_MAX_TYPE_LENGTH and REGISTRAR_MAX_PATH_LENGTH
     *
     * Values that are not positive integers are ignored with a warning.
     */
    static RegistryConfig from_environment();
};

} // namespace Registrar::Registry
