#include "ModuleMetadata.hpp"

#include "Registrar/Journal/Format.hpp"

namespace Registrar::Registry {

std::string ModuleMetadata::summary() const
{
    return Journal::format("Module: {} (type: {}) - signature: {}, approved: {}, supply_chain: {}, sandbox: {}",
        name,
        module_type,
        has_valid_signature(),
        is_approved(),
        has_supply_chain(),
        sandbox_config.enabled);
}

} // namespace Registrar::Registry
