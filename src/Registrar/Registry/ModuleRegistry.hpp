#pragma once

#include "RegistryConfig.hpp"
#include "RegistryTypes.hpp"
#include "Security.hpp"

namespace Registrar::Registry {

/**
 * @enum BootstrapState
 * @brief Progress of the process-wide registry construction
 */
enum class BootstrapState : uint8_t {
    Uninitialized, ///< global() has not been called yet
    Initializing, ///< Draining the registration queue
    Ready ///< Global registry usable; late submissions go straight in
};

/**
 * @class ModuleRegistry
 * @brief Thread-safe catalog mapping unique names to module factories
 *
 * Lets independently compiled units publish an implementation of a shared
 * capability interface under a string name, and lets unrelated call sites
 * obtain a freshly constructed instance by that name without knowing the
 * concrete type at compile time.
 *
 * Thread Safety:
 * All methods are thread-safe. Reads (lookups, listings, discovery and the
 * lookup phase of create) take a shared lock; register, unregister, clear and
 * review updates take the exclusive lock. Factories always run after the lock
 * has been released, so a slow or re-entrant factory never blocks writers.
 *
 * Lock failures: operations returning Result or std::expected report a
 * std::system_error from the lock as ErrorCode::Internal. clear() and the
 * plain queries (get_metadata, has_module, list_modules, count,
 * for_each_module) have no error channel and let it propagate.
 *
 * Records are immutable once stored. A name is held by at most one record;
 * registering an existing name is rejected with DuplicateName.
 *
 * Instances are independent: unregister or clear never affect handles that
 * were already produced.
 *
 * Example Usage:
 *
 * Registration:
 *   ModuleRegistry registry;
 *   registry.register_module("echo", "plugin", make_factory<Plugin, EchoPlugin>());
 *
 * Construction:
 *   auto plugin = registry.create<Plugin>("echo");
 *   if (plugin) {
 *       (*plugin)->execute("hello");
 *   } else {
 *       // plugin.error().code is NotFound, FactoryFailed or TypeMismatch
 *   }
 */
class REGISTRAR_API ModuleRegistry {
public:
    using Record = std::shared_ptr<const RegistrationRecord>;
    using Result = std::expected<void, RegistryError>;
    using MetadataVisitor = std::function<void(const ModuleMetadata&)>;

    explicit ModuleRegistry(RegistryConfig config = {});
    ~ModuleRegistry() = default;

    ModuleRegistry(const ModuleRegistry&) = delete;
    ModuleRegistry& operator=(const ModuleRegistry&) = delete;
    ModuleRegistry(ModuleRegistry&&) = delete;
    ModuleRegistry& operator=(ModuleRegistry&&) = delete;

    /**
     * @brief Get the process-wide registry
     * @return Reference to the global registry
     *
     * Thread-safe initialization via static local variable (C++11 guarantee).
     * The first call drains every record submitted through Registration and
     * inserts it; concurrent first callers block until that completes.
     * Configured from the environment (RegistryConfig::from_environment()).
     */
    static ModuleRegistry& global();

    /**
     * @brief Current stage of global() construction
     */
    static BootstrapState bootstrap_state();

    // =========================================================================
    // Registration
    // =========================================================================

    /**
     * @brief Register a factory under a unique name
     * @param name Unique, non-empty name
     * @param module_type Coarse type tag used for filtering
     * @param factory Zero-argument constructor, must not be empty
     * @param metadata Descriptive data; name and module_type are overwritten
     *        from the arguments, an empty module_path is set from location
     * @param location Registration site recorded in module_path
     * @return InvalidArgument, DuplicateName or success
     */
    Result register_module(std::string_view name, std::string_view module_type,
        ModuleFactory factory, ModuleMetadata metadata = {},
        std::source_location location = std::source_location::current());

    /**
     * @brief Register a prebuilt record
     *
     * The metadata name and type are synchronised with the record's own.
     */
    Result register_module(RegistrationRecord record);

    /**
     * @brief Register every record of a batch, continuing past failures
     * @return Number of records accepted
     *
     * Within the batch the first record for a name wins. A record that is
     * rejected, or whose registration throws, is logged and skipped.
     */
    size_t register_batch(std::vector<RegistrationRecord> records);

    /**
     * @brief Register with security metadata attached
     *
     * Review status starts Pending; call update_review_status() to approve.
     * Capability tags are stored in the metadata for Discovery.
     */
    Result register_secure(std::string_view name, std::string_view module_type,
        ModuleFactory factory,
        std::optional<ModuleSignature> signature,
        ModulePermissions permissions,
        std::optional<SupplyChainInfo> supply_chain,
        std::set<std::string> capabilities = {},
        std::source_location location = std::source_location::current());

    /**
     * @brief Remove a record
     * @return NotFound when no record carries this name
     */
    Result unregister_module(std::string_view name);

    /**
     * @brief Drop every record
     * @throws std::system_error if the lock cannot be acquired
     */
    void clear();

    // =========================================================================
    // Queries
    // =========================================================================

    /**
     * @brief Metadata of the named record
     * @throws std::system_error if the lock cannot be acquired, as do the other plain queries
     */
    [[nodiscard]] std::optional<ModuleMetadata> get_metadata(std::string_view name) const;

    [[nodiscard]] bool has_module(std::string_view name) const;

    /**
     * @brief Registered names, sorted lexically
     */
    [[nodiscard]] std::vector<std::string> list_modules() const;

    [[nodiscard]] size_t count() const;

    /**
     * @brief Visit every record's metadata under the shared lock
     *
     * The visitor must not call write operations on this registry.
     */
    void for_each_module(const MetadataVisitor& visitor) const;

    [[nodiscard]] const RegistryConfig& config() const { return m_config; }

    // =========================================================================
    // Construction
    // =========================================================================

    /**
     * @brief Construct a fresh instance of the named module
     * @return Type-erased handle, NotFound, or FactoryFailed carrying the cause
     *
     * The factory runs outside the registry lock; each call constructs a new
     * instance.
     */
    [[nodiscard]] std::expected<ModuleHandle, RegistryError> create_any(std::string_view name) const;

    /**
     * @brief Construct and narrow to Interface in one step
     * @return The instance, or NotFound / FactoryFailed / TypeMismatch
     */
    template <typename Interface>
    [[nodiscard]] std::expected<std::unique_ptr<Interface>, RegistryError> create(std::string_view name) const
    {
        auto handle = create_any(name);
        if (!handle) {
            return std::unexpected(std::move(handle.error()));
        }
        return narrow<Interface>(name, std::move(*handle));
    }

    // =========================================================================
    // Security
    // =========================================================================

    /**
     * @brief Replace the review status of a record (copy-on-write)
     */
    Result update_review_status(std::string_view name, ReviewStatus status);

    [[nodiscard]] std::expected<bool, RegistryError> verify_module_signature(std::string_view name) const;
    [[nodiscard]] std::expected<bool, RegistryError> check_module_permission(std::string_view name, Permission permission) const;
    [[nodiscard]] std::expected<bool, RegistryError> is_module_approved(std::string_view name) const;
    [[nodiscard]] std::expected<bool, RegistryError> verify_supply_chain(std::string_view name) const;

    /**
     * @brief create_any() gated on signature, review and supply chain checks
     * @return SecurityViolation naming the failed check, otherwise as create_any()
     */
    [[nodiscard]] std::expected<ModuleHandle, RegistryError> create_secure(std::string_view name) const;

    /**
     * @brief Security posture of every record, keyed by name
     */
    [[nodiscard]] std::map<std::string, SecurityReport> security_report() const;

    /**
     * @brief SecurityValidator::comprehensive_check() over every record, keyed by name
     */
    [[nodiscard]] std::map<std::string, SecurityCheckResult> security_audit() const;

private:
    struct GlobalTag { };

    /**
     * @brief Constructor used by global(): environment config plus queue drain
     */
    explicit ModuleRegistry(GlobalTag);

    void drain_registration_queue();

    [[nodiscard]] Result validate(const RegistrationRecord& record) const;
    Result insert(RegistrationRecord record);

    [[nodiscard]] std::expected<Record, RegistryError> require_record(std::string_view name) const;
    [[nodiscard]] std::expected<ModuleHandle, RegistryError> invoke(const Record& record) const;

    template <typename Interface>
    static std::expected<std::unique_ptr<Interface>, RegistryError> narrow(std::string_view name, ModuleHandle handle)
    {
        auto instance = std::move(handle).template take<Interface>();
        if (!instance) {
            auto error = std::move(instance.error());
            error.module_name = std::string(name);
            log_type_mismatch(error);
            return std::unexpected(std::move(error));
        }
        return instance;
    }

    static void log_type_mismatch(const RegistryError& error);

    RegistryConfig m_config;
    mutable std::shared_mutex m_mutex;
    std::unordered_map<std::string, Record> m_modules;

    inline static std::atomic<BootstrapState> s_bootstrap_state { BootstrapState::Uninitialized };
};

} // namespace Registrar::Registry
