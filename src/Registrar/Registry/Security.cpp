#include "Security.hpp"

#include "Registrar/EnumUtils.hpp"
#include "Registrar/Journal/Archivist.hpp"

namespace Registrar::Registry {

namespace {

    constexpr std::array<std::pair<Permission, std::string_view>, 5> PERMISSION_NAMES { {
        { Permission::FilesystemAccess, "filesystem_access" },
        { Permission::NetworkAccess, "network_access" },
        { Permission::ProcessSpawn, "process_spawn" },
        { Permission::EnvAccess, "env_access" },
        { Permission::SystemAccess, "system_access" },
    } };

} // namespace

std::optional<Permission> permission_from_string(std::string_view name)
{
    for (const auto& [permission, text] : PERMISSION_NAMES) {
        if (text == name) {
            return permission;
        }
    }
    return std::nullopt;
}

std::string_view permission_to_string(Permission permission)
{
    for (const auto& [candidate, text] : PERMISSION_NAMES) {
        if (candidate == permission) {
            return text;
        }
    }
    return "unknown";
}

// =========================================================================
// SecurityCheckResult
// =========================================================================

std::string SecurityCheckResult::summary() const
{
    return Journal::format("Security check {}: {} issues, {} warnings, risk level: {}",
        is_secure ? "PASSED" : "FAILED",
        issues.size(),
        warnings.size(),
        Utils::enum_to_string(risk_level));
}

bool SecurityCheckResult::has_security_risk() const
{
    return risk_level == RiskLevel::Medium
        || risk_level == RiskLevel::High
        || risk_level == RiskLevel::Critical;
}

std::vector<const SecurityIssue*> SecurityCheckResult::critical_issues() const
{
    std::vector<const SecurityIssue*> result;
    for (const auto& issue : issues) {
        if (issue.severity == IssueSeverity::Critical) {
            result.push_back(&issue);
        }
    }
    return result;
}

std::vector<const SecurityIssue*> SecurityCheckResult::high_severity_issues() const
{
    std::vector<const SecurityIssue*> result;
    for (const auto& issue : issues) {
        if (issue.severity == IssueSeverity::High || issue.severity == IssueSeverity::Critical) {
            result.push_back(&issue);
        }
    }
    return result;
}

// =========================================================================
// SecurityValidator
// =========================================================================

uint64_t SecurityValidator::unix_now()
{
    const auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(since_epoch).count());
}

bool SecurityValidator::verify_signature(const ModuleMetadata& metadata, uint64_t now)
{
    if (!metadata.signature) {
        return false;
    }

    const auto& sig = *metadata.signature;

    if (sig.timestamp > now || now - sig.timestamp > SIGNATURE_EXPIRY_SECONDS) {
        return false;
    }

    if (sig.algorithm != DEFAULT_SIGNATURE_ALGORITHM) {
        return false;
    }

    return !sig.signature.empty() && !sig.public_key.empty();
}

bool SecurityValidator::check_permission(const ModuleMetadata& metadata, Permission permission)
{
    return metadata.permissions.grants(permission);
}

bool SecurityValidator::check_permission(const ModuleMetadata& metadata, std::string_view permission)
{
    auto parsed = permission_from_string(permission);
    return parsed && check_permission(metadata, *parsed);
}

bool SecurityValidator::is_approved(const ModuleMetadata& metadata)
{
    return metadata.is_approved();
}

bool SecurityValidator::verify_supply_chain(const ModuleMetadata& metadata, uint64_t now)
{
    if (!metadata.supply_chain) {
        return false;
    }

    const auto& chain = *metadata.supply_chain;
    if (chain.source_url.empty() || chain.commit_hash.empty()) {
        return false;
    }

    return chain.build_timestamp <= now;
}

SecurityCheckResult SecurityValidator::comprehensive_check(const ModuleMetadata& metadata, uint64_t now)
{
    SecurityCheckResult result;
    result.check_timestamp = now;

    if (!verify_signature(metadata, now)) {
        result.issues.push_back({ IssueSeverity::High, "Module signature verification failed", "signature" });
    }

    if (!is_approved(metadata)) {
        result.issues.push_back({ IssueSeverity::Medium, "Module not approved by code review", "review" });
        if (metadata.review_status.state == ReviewStatus::State::Rejected) {
            result.warnings.push_back({ Journal::format("Rejected by {}: {}",
                                            metadata.review_status.reviewer, metadata.review_status.reason),
                "review" });
        }
    }

    if (!verify_supply_chain(metadata, now)) {
        result.issues.push_back({ IssueSeverity::Medium, "Supply chain verification failed", "supply_chain" });
    }

    if (metadata.permissions.system_access && !metadata.sandbox_config.enabled) {
        result.issues.push_back({ IssueSeverity::High, "System access granted without sandboxing", "permissions" });
    } else if (!metadata.sandbox_config.enabled) {
        result.warnings.push_back({ "Sandbox disabled", "sandbox" });
    }

    result.is_secure = result.issues.empty();
    result.risk_level = calculate_risk_level(result.issues);

    RG_DEBUG(Journal::Component::Security, Journal::Context::SecurityCheck,
        "{}: {}", metadata.name, result.summary());

    return result;
}

RiskLevel SecurityValidator::calculate_risk_level(const std::vector<SecurityIssue>& issues)
{
    auto any_of = [&issues](IssueSeverity severity) {
        return std::ranges::any_of(issues, [severity](const SecurityIssue& i) { return i.severity == severity; });
    };

    if (any_of(IssueSeverity::Critical)) {
        return RiskLevel::Critical;
    }
    if (any_of(IssueSeverity::High)) {
        return RiskLevel::High;
    }
    if (any_of(IssueSeverity::Medium)) {
        return RiskLevel::Medium;
    }
    if (!issues.empty()) {
        return RiskLevel::Low;
    }
    return RiskLevel::None;
}

} // namespace Registrar::Registry
