#include "ModuleRegistry.hpp"

#include "Registration.hpp"

#include "Registrar/Journal/Archivist.hpp"

namespace Registrar::Registry {

namespace {

    RegistryError internal_error(std::string_view name, std::string_view what)
    {
        return { ErrorCode::Internal, std::string(name),
            Journal::format("registry failure: {}", what), std::current_exception() };
    }

    RegistryError not_found(std::string_view name)
    {
        return { ErrorCode::NotFound, std::string(name), "no module registered under this name" };
    }

} // namespace

ModuleRegistry::ModuleRegistry(RegistryConfig config)
    : m_config(config)
{
}

ModuleRegistry::ModuleRegistry(GlobalTag)
    : m_config(RegistryConfig::from_environment())
{
    s_bootstrap_state.store(BootstrapState::Initializing);
    try {
        drain_registration_queue();
    } catch (...) {
        // global() retries construction on the next call
        s_bootstrap_state.store(BootstrapState::Uninitialized);
        throw;
    }
    s_bootstrap_state.store(BootstrapState::Ready);
}

ModuleRegistry& ModuleRegistry::global()
{
    static ModuleRegistry registry { GlobalTag {} };
    return registry;
}

BootstrapState ModuleRegistry::bootstrap_state()
{
    return s_bootstrap_state.load();
}

void ModuleRegistry::drain_registration_queue()
{
    auto records = Registration::drain();
    const size_t submitted = records.size();
    const size_t accepted = register_batch(std::move(records));

    RG_INFO(Journal::Component::Bootstrap, Journal::Context::Init,
        "Global registry ready with {} of {} submitted modules", accepted, submitted);
}

// =========================================================================
// Registration
// =========================================================================

ModuleRegistry::Result ModuleRegistry::register_module(std::string_view name, std::string_view module_type,
    ModuleFactory factory, ModuleMetadata metadata, std::source_location location)
{
    if (metadata.module_path.empty()) {
        metadata.module_path = format_source_location(location);
    }

    return register_module(RegistrationRecord {
        .name = std::string(name),
        .module_type = std::string(module_type),
        .factory = std::move(factory),
        .metadata = std::move(metadata),
    });
}

ModuleRegistry::Result ModuleRegistry::register_module(RegistrationRecord record)
{
    return insert(std::move(record));
}

size_t ModuleRegistry::register_batch(std::vector<RegistrationRecord> records)
{
    size_t accepted = 0;

    for (auto& record : records) {
        std::string name;
        try {
            name = record.name;
            auto result = insert(std::move(record));
            if (result) {
                ++accepted;
            } else if (result.error().is(ErrorCode::DuplicateName)) {
                RG_WARN(Journal::Component::Bootstrap, Journal::Context::Init,
                    "Ignoring duplicate registration of '{}'; the first submission wins", name);
            } else {
                RG_WARN(Journal::Component::Bootstrap, Journal::Context::Init,
                    "Registration rejected: {}", result.error().describe());
            }
        } catch (const std::exception& e) {
            RG_ERROR(Journal::Component::Bootstrap, Journal::Context::Init,
                "Registration of '{}' threw and was skipped: {}", name, e.what());
        }
    }

    return accepted;
}

ModuleRegistry::Result ModuleRegistry::register_secure(std::string_view name, std::string_view module_type,
    ModuleFactory factory,
    std::optional<ModuleSignature> signature,
    ModulePermissions permissions,
    std::optional<SupplyChainInfo> supply_chain,
    std::set<std::string> capabilities,
    std::source_location location)
{
    const bool signed_module = signature.has_value();
    const bool has_provenance = supply_chain.has_value();

    ModuleMetadata metadata;
    metadata.signature = std::move(signature);
    metadata.permissions = permissions;
    metadata.supply_chain = std::move(supply_chain);
    metadata.capabilities = std::move(capabilities);

    auto result = register_module(name, module_type, std::move(factory), std::move(metadata), location);
    if (result) {
        RG_INFO(Journal::Component::Security, Journal::Context::Registration,
            "Registered secure module '{}' (signature: {}, supply_chain: {})",
            name, signed_module, has_provenance);
    }
    return result;
}

ModuleRegistry::Result ModuleRegistry::validate(const RegistrationRecord& record) const
{
    auto invalid = [&record](std::string message) -> Result {
        RG_WARN(Journal::Component::Registry, Journal::Context::Registration,
            "Rejected registration of '{}': {}", record.name, message);
        return std::unexpected(RegistryError { ErrorCode::InvalidArgument, record.name, std::move(message) });
    };

    if (record.name.empty()) {
        return invalid("module name must not be empty");
    }
    if (record.name.size() > m_config.max_name_length) {
        return invalid(Journal::format("module name exceeds {} bytes", m_config.max_name_length));
    }
    if (record.module_type.empty()) {
        return invalid("module type must not be empty");
    }
    if (record.module_type.size() > m_config.max_type_length) {
        return invalid(Journal::format("module type exceeds {} bytes", m_config.max_type_length));
    }
    if (record.metadata.module_path.size() > m_config.max_path_length) {
        return invalid(Journal::format("module path exceeds {} bytes", m_config.max_path_length));
    }
    if (!record.factory) {
        return invalid("factory must not be empty");
    }

    return {};
}

ModuleRegistry::Result ModuleRegistry::insert(RegistrationRecord record)
{
    record.metadata.name = record.name;
    record.metadata.module_type = record.module_type;

    if (auto valid = validate(record); !valid) {
        return valid;
    }

    const std::string name = record.name;
    const std::string module_type = record.module_type;

    try {
        auto stored = std::make_shared<const RegistrationRecord>(std::move(record));

        std::unique_lock lock(m_mutex);
        const bool inserted = m_modules.try_emplace(name, std::move(stored)).second;
        if (!inserted) {
            lock.unlock();
            RG_WARN(Journal::Component::Registry, Journal::Context::Registration,
                "Module '{}' is already registered; keeping the existing record", name);
            return std::unexpected(RegistryError {
                ErrorCode::DuplicateName, name, "a module with this name is already registered" });
        }
    } catch (const std::system_error& e) {
        return std::unexpected(internal_error(name, e.what()));
    } catch (const std::bad_alloc& e) {
        return std::unexpected(internal_error(name, e.what()));
    }

    RG_DEBUG(Journal::Component::Registry, Journal::Context::Registration,
        "Registered module '{}' (type: {})", name, module_type);
    return {};
}

ModuleRegistry::Result ModuleRegistry::unregister_module(std::string_view name)
{
    size_t removed = 0;
    try {
        std::unique_lock lock(m_mutex);
        removed = m_modules.erase(std::string(name));
    } catch (const std::system_error& e) {
        return std::unexpected(internal_error(name, e.what()));
    }

    if (removed == 0) {
        return std::unexpected(not_found(name));
    }

    RG_DEBUG(Journal::Component::Registry, Journal::Context::Registration,
        "Unregistered module '{}'", name);
    return {};
}

void ModuleRegistry::clear()
{
    size_t dropped = 0;
    {
        std::unique_lock lock(m_mutex);
        dropped = m_modules.size();
        m_modules.clear();
    }

    RG_DEBUG(Journal::Component::Registry, Journal::Context::Registration,
        "Cleared {} modules", dropped);
}

// =========================================================================
// Queries
// =========================================================================

std::optional<ModuleMetadata> ModuleRegistry::get_metadata(std::string_view name) const
{
    std::shared_lock lock(m_mutex);
    auto it = m_modules.find(std::string(name));
    if (it == m_modules.end()) {
        return std::nullopt;
    }
    return it->second->metadata;
}

bool ModuleRegistry::has_module(std::string_view name) const
{
    std::shared_lock lock(m_mutex);
    return m_modules.contains(std::string(name));
}

std::vector<std::string> ModuleRegistry::list_modules() const
{
    std::vector<std::string> names;
    {
        std::shared_lock lock(m_mutex);
        names.reserve(m_modules.size());
        for (const auto& [name, record] : m_modules) {
            names.push_back(name);
        }
    }

    std::ranges::sort(names);
    return names;
}

size_t ModuleRegistry::count() const
{
    std::shared_lock lock(m_mutex);
    return m_modules.size();
}

void ModuleRegistry::for_each_module(const MetadataVisitor& visitor) const
{
    std::shared_lock lock(m_mutex);
    for (const auto& [name, record] : m_modules) {
        visitor(record->metadata);
    }
}

// =========================================================================
// Construction
// =========================================================================

std::expected<ModuleRegistry::Record, RegistryError> ModuleRegistry::require_record(std::string_view name) const
{
    try {
        std::shared_lock lock(m_mutex);
        auto it = m_modules.find(std::string(name));
        if (it != m_modules.end()) {
            return it->second;
        }
    } catch (const std::system_error& e) {
        return std::unexpected(internal_error(name, e.what()));
    }

    RG_DEBUG(Journal::Component::Registry, Journal::Context::Lookup,
        "Lookup of unknown module '{}'", name);
    return std::unexpected(not_found(name));
}

std::expected<ModuleHandle, RegistryError> ModuleRegistry::invoke(const Record& record) const
{
    FactoryResult produced;
    try {
        produced = record->factory();
    } catch (...) {
        produced = std::unexpected(FactoryError::from_exception(std::current_exception()));
    }

    if (!produced) {
        RG_ERROR(Journal::Component::Registry, Journal::Context::Construction,
            "Factory for '{}' failed: {}", record->name, produced.error().message);
        return std::unexpected(RegistryError {
            ErrorCode::FactoryFailed, record->name,
            "factory failed: " + produced.error().message,
            produced.error().cause });
    }

    if (produced->empty()) {
        RG_ERROR(Journal::Component::Registry, Journal::Context::Construction,
            "Factory for '{}' returned an empty handle", record->name);
        return std::unexpected(RegistryError {
            ErrorCode::FactoryFailed, record->name, "factory returned an empty handle" });
    }

    return std::move(*produced);
}

std::expected<ModuleHandle, RegistryError> ModuleRegistry::create_any(std::string_view name) const
{
    auto record = require_record(name);
    if (!record) {
        return std::unexpected(std::move(record.error()));
    }

    return invoke(*record);
}

void ModuleRegistry::log_type_mismatch(const RegistryError& error)
{
    RG_WARN(Journal::Component::Registry, Journal::Context::Construction,
        "{}", error.describe());
}

// =========================================================================
// Security
// =========================================================================

ModuleRegistry::Result ModuleRegistry::update_review_status(std::string_view name, ReviewStatus status)
{
    const auto state = status.state;
    try {
        std::unique_lock lock(m_mutex);
        auto it = m_modules.find(std::string(name));
        if (it == m_modules.end()) {
            return std::unexpected(not_found(name));
        }

        auto updated = std::make_shared<RegistrationRecord>(*it->second);
        updated->metadata.review_status = std::move(status);
        it->second = std::move(updated);
    } catch (const std::system_error& e) {
        return std::unexpected(internal_error(name, e.what()));
    } catch (const std::bad_alloc& e) {
        return std::unexpected(internal_error(name, e.what()));
    }

    RG_INFO(Journal::Component::Security, Journal::Context::SecurityCheck,
        "Review status of '{}' set to {}", name, Utils::enum_to_string(state));
    return {};
}

std::expected<bool, RegistryError> ModuleRegistry::verify_module_signature(std::string_view name) const
{
    auto record = require_record(name);
    if (!record) {
        return std::unexpected(std::move(record.error()));
    }
    return SecurityValidator::verify_signature((*record)->metadata);
}

std::expected<bool, RegistryError> ModuleRegistry::check_module_permission(std::string_view name, Permission permission) const
{
    auto record = require_record(name);
    if (!record) {
        return std::unexpected(std::move(record.error()));
    }
    return SecurityValidator::check_permission((*record)->metadata, permission);
}

std::expected<bool, RegistryError> ModuleRegistry::is_module_approved(std::string_view name) const
{
    auto record = require_record(name);
    if (!record) {
        return std::unexpected(std::move(record.error()));
    }
    return SecurityValidator::is_approved((*record)->metadata);
}

std::expected<bool, RegistryError> ModuleRegistry::verify_supply_chain(std::string_view name) const
{
    auto record = require_record(name);
    if (!record) {
        return std::unexpected(std::move(record.error()));
    }
    return SecurityValidator::verify_supply_chain((*record)->metadata);
}

std::expected<ModuleHandle, RegistryError> ModuleRegistry::create_secure(std::string_view name) const
{
    auto record = require_record(name);
    if (!record) {
        return std::unexpected(std::move(record.error()));
    }

    const auto& metadata = (*record)->metadata;

    auto violation = [&name](std::string_view check) -> std::expected<ModuleHandle, RegistryError> {
        RG_WARN(Journal::Component::Security, Journal::Context::SecurityCheck,
            "Refusing to create '{}': {}", name, check);
        return std::unexpected(RegistryError { ErrorCode::SecurityViolation, std::string(name), std::string(check) });
    };

    if (!SecurityValidator::verify_signature(metadata)) {
        return violation("signature verification failed");
    }
    if (!SecurityValidator::is_approved(metadata)) {
        return violation("module is not approved");
    }
    if (!SecurityValidator::verify_supply_chain(metadata)) {
        return violation("supply chain verification failed");
    }

    if (metadata.sandbox_config.enabled) {
        RG_DEBUG(Journal::Component::Security, Journal::Context::Construction,
            "Creating '{}' sandboxed (filesystem: {}, network: {}, process: {}, read-only: {})",
            name,
            metadata.sandbox_config.filesystem_isolation,
            metadata.sandbox_config.network_isolation,
            metadata.sandbox_config.process_isolation,
            metadata.sandbox_config.read_only_fs);
    }

    return invoke(*record);
}

std::map<std::string, SecurityReport> ModuleRegistry::security_report() const
{
    std::map<std::string, SecurityReport> report;

    for_each_module([&report](const ModuleMetadata& metadata) {
        report.emplace(metadata.name, SecurityReport {
                                          .name = metadata.name,
                                          .has_signature = metadata.has_valid_signature(),
                                          .signature_verified = SecurityValidator::verify_signature(metadata),
                                          .is_approved = metadata.is_approved(),
                                          .has_supply_chain = metadata.has_supply_chain(),
                                          .supply_chain_verified = SecurityValidator::verify_supply_chain(metadata),
                                          .permissions = metadata.permissions,
                                          .sandbox_enabled = metadata.sandbox_config.enabled,
                                      });
    });

    return report;
}

std::map<std::string, SecurityCheckResult> ModuleRegistry::security_audit() const
{
    std::map<std::string, SecurityCheckResult> audit;
    const auto now = SecurityValidator::unix_now();

    for_each_module([&audit, now](const ModuleMetadata& metadata) {
        audit.emplace(metadata.name, SecurityValidator::comprehensive_check(metadata, now));
    });

    const auto failing = std::ranges::count_if(audit, [](const auto& entry) { return !entry.second.is_secure; });
    RG_INFO(Journal::Component::Security, Journal::Context::SecurityCheck,
        "Security audit: {} of {} modules failed", failing, audit.size());

    return audit;
}

} // namespace Registrar::Registry
