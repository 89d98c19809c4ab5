#pragma once

namespace Registrar::Registry {

/**
 * @brief Default resource ceilings applied to modules without explicit permissions
 */
inline constexpr uint64_t DEFAULT_MEMORY_LIMIT_MB = 128;
inline constexpr uint8_t DEFAULT_CPU_LIMIT_PERCENT = 50;
inline constexpr uint64_t DEFAULT_TIMEOUT_SECONDS = 30;

/// One year. Older signatures fail verification.
inline constexpr uint64_t SIGNATURE_EXPIRY_SECONDS = 365ULL * 24 * 60 * 60;
inline constexpr std::string_view DEFAULT_SIGNATURE_ALGORITHM = "SHA256-RSA";

/**
 * @brief Cryptographic signature attached to a module at registration
 */
struct ModuleSignature {
    std::string code_hash; ///< SHA-256 of the module code
    std::string signature; ///< Signature over code_hash
    std::string public_key; ///< Key used for verification
    uint64_t timestamp {}; ///< Unix seconds when signed
    std::string algorithm { DEFAULT_SIGNATURE_ALGORITHM };
};

/**
 * @brief Capabilities a module may exercise once constructed
 */
enum class Permission : uint8_t {
    FilesystemAccess,
    NetworkAccess,
    ProcessSpawn,
    EnvAccess,
    SystemAccess
};

/**
 * @brief Parse the snake_case permission name (e.g. "network_access")
 * @return nullopt for unknown names
 */
std::optional<Permission> permission_from_string(std::string_view name);

/**
 * @brief snake_case name of a permission
 */
std::string_view permission_to_string(Permission permission);

struct ModulePermissions {
    bool filesystem_access {};
    bool network_access {};
    bool process_spawn {};
    bool env_access {};
    bool system_access {};
    uint64_t memory_limit_mb { DEFAULT_MEMORY_LIMIT_MB };
    uint8_t cpu_limit_percent { DEFAULT_CPU_LIMIT_PERCENT };
    uint64_t timeout_seconds { DEFAULT_TIMEOUT_SECONDS };

    [[nodiscard]] bool grants(Permission permission) const
    {
        switch (permission) {
        case Permission::FilesystemAccess:
            return filesystem_access;
        case Permission::NetworkAccess:
            return network_access;
        case Permission::ProcessSpawn:
            return process_spawn;
        case Permission::EnvAccess:
            return env_access;
        case Permission::SystemAccess:
            return system_access;
        }
        return false;
    }
};

/**
 * @brief Code review state of a module
 *
 * reviewer/timestamp are meaningful for Approved and Rejected, reason only
 * for Rejected.
 */
struct ReviewStatus {
    enum class State : uint8_t {
        Pending,
        InProgress,
        Approved,
        Rejected
    };

    State state { State::Pending };
    std::string reviewer;
    std::string reason;
    uint64_t timestamp {};

    static ReviewStatus approved(std::string reviewer, uint64_t timestamp)
    {
        return { .state = State::Approved, .reviewer = std::move(reviewer), .reason = {}, .timestamp = timestamp };
    }

    static ReviewStatus rejected(std::string reviewer, std::string reason, uint64_t timestamp)
    {
        return { .state = State::Rejected, .reviewer = std::move(reviewer), .reason = std::move(reason), .timestamp = timestamp };
    }

    [[nodiscard]] bool is_approved() const { return state == State::Approved; }
};

/**
 * @brief Provenance of the build that produced a module
 */
struct SupplyChainInfo {
    std::string source_url;
    std::string commit_hash;
    uint64_t build_timestamp {}; ///< Unix seconds
    std::map<std::string, std::string> dependencies; ///< name -> version
    std::string build_environment;
    std::optional<std::string> verifier_signature;
};

/**
 * @brief Isolation requested for a module's instances
 */
struct SandboxConfig {
    bool enabled { true };
    bool filesystem_isolation { true };
    bool network_isolation { true };
    bool process_isolation { true };
    bool read_only_fs { true };
    std::vector<std::string> allowed_paths;
    std::vector<std::string> denied_paths { "/etc", "/usr/bin", "/bin" };
};

} // namespace Registrar::Registry
