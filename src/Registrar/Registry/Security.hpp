#pragma once

#include "ModuleMetadata.hpp"

namespace Registrar::Registry {

enum class IssueSeverity : uint8_t {
    Low,
    Medium,
    High,
    Critical
};

enum class RiskLevel : uint8_t {
    None,
    Low,
    Medium,
    High,
    Critical
};

struct SecurityIssue {
    IssueSeverity severity;
    std::string message;
    std::string component; ///< "signature", "review", "supply_chain", "permissions"
};

struct SecurityWarning {
    std::string message;
    std::string component;
};

/**
 * @brief Outcome of SecurityValidator::comprehensive_check for one module
 */
struct REGISTRAR_API SecurityCheckResult {
    bool is_secure {};
    RiskLevel risk_level { RiskLevel::None };
    std::vector<SecurityIssue> issues;
    std::vector<SecurityWarning> warnings;
    uint64_t check_timestamp {};

    /**
     * @brief "Security check PASSED|FAILED: N issues, M warnings, risk level: <Level>"
     */
    [[nodiscard]] std::string summary() const;

    /**
     * @brief True for Medium, High and Critical risk
     */
    [[nodiscard]] bool has_security_risk() const;

    [[nodiscard]] std::vector<const SecurityIssue*> critical_issues() const;

    /**
     * @brief High and Critical issues
     */
    [[nodiscard]] std::vector<const SecurityIssue*> high_severity_issues() const;
};

/**
 * @brief Per-module security posture as reported by ModuleRegistry::security_report()
 */
struct SecurityReport {
    std::string name;
    bool has_signature {};
    bool signature_verified {};
    bool is_approved {};
    bool has_supply_chain {};
    bool supply_chain_verified {};
    ModulePermissions permissions;
    bool sandbox_enabled {};
};

/**
 * @class SecurityValidator
 * @brief Stateless checks over the security fields of ModuleMetadata
 *
 * Every check takes the current time explicitly (defaulting to the system
 * clock) so that expiry rules are reproducible in tests. No cryptography is
 * performed: a signature counts as valid when present, unexpired, made with
 * DEFAULT_SIGNATURE_ALGORITHM and carrying non-empty signature and key.
 */
class REGISTRAR_API SecurityValidator {
public:
    /**
     * @brief Seconds since the Unix epoch
     */
    static uint64_t unix_now();

    /**
     * @brief Signature present, not future-dated, younger than SIGNATURE_EXPIRY_SECONDS,
     *        DEFAULT_SIGNATURE_ALGORITHM, non-empty signature and public key
     */
    static bool verify_signature(const ModuleMetadata& metadata, uint64_t now = unix_now());

    static bool check_permission(const ModuleMetadata& metadata, Permission permission);

    /**
     * @brief String form; unknown permission names are never granted
     */
    static bool check_permission(const ModuleMetadata& metadata, std::string_view permission);

    static bool is_approved(const ModuleMetadata& metadata);

    /**
     * @brief Supply chain present with source URL, commit hash and a build time not in the future
     */
    static bool verify_supply_chain(const ModuleMetadata& metadata, uint64_t now = unix_now());

    /**
     * @brief Run every check and grade the findings
     *
     * Issues: failed signature (High), not approved (Medium), failed supply
     * chain (Medium), system access without sandbox (High).
     * Warnings: sandbox disabled, rejected review (with the reviewer's reason).
     */
    static SecurityCheckResult comprehensive_check(const ModuleMetadata& metadata, uint64_t now = unix_now());

    /**
     * @brief Highest issue severity mapped to a risk level; None without issues
     */
    static RiskLevel calculate_risk_level(const std::vector<SecurityIssue>& issues);
};

} // namespace Registrar::Registry
