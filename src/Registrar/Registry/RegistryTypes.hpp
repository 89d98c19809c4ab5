#pragma once

#include "ModuleHandle.hpp"
#include "ModuleMetadata.hpp"

namespace Registrar::Registry {

using FactoryResult = std::expected<ModuleHandle, FactoryError>;

/**
 * @brief Zero-argument constructor stored in the registry
 *
 * Must not touch the registry it is stored in through a write path; it may
 * perform arbitrary, possibly slow or fallible, construction work. Throwing
 * is allowed and is reported the same way as returning a FactoryError.
 */
using ModuleFactory = std::function<FactoryResult()>;

/**
 * @brief Immutable {name, module_type, factory, metadata} tuple
 *
 * Stored behind shared_ptr<const RegistrationRecord>; a record is never
 * modified after insertion, only replaced or removed.
 */
struct RegistrationRecord {
    std::string name;
    std::string module_type;
    ModuleFactory factory;
    ModuleMetadata metadata;
};

/**
 * @brief Build a factory that constructs a fresh Impl per call and boxes it as Interface
 * @tparam Interface Capability interface the instance is requested as
 * @tparam Impl Concrete implementation
 * @param args Constructor arguments, copied into the factory and copied again per call
 *
 * Example:
 *   registry.register_module("echo", "plugin", make_factory<Plugin, EchoPlugin>("echo", "1.0.0"));
 */
template <typename Interface, typename Impl, typename... Args>
    requires ImplementationOf<Impl, Interface>
ModuleFactory make_factory(Args... args)
{
    return [... captured = std::move(args)]() -> FactoryResult {
        return ModuleHandle::make<Interface>(std::make_unique<Impl>(captured...));
    };
}

} // namespace Registrar::Registry
