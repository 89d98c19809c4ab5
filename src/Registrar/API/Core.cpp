#include "Core.hpp"

#include "Registrar/Journal/Archivist.hpp"

namespace Registrar {

namespace internal {
    std::atomic<bool> initialized { false };
}

Registry::ModuleRegistry& Init(std::optional<Journal::Severity> log_level)
{
    Journal::Archivist::init();
    if (log_level) {
        Journal::Archivist::instance().set_min_severity(*log_level);
    }

    auto& registry = Registry::ModuleRegistry::global();

    if (!internal::initialized.exchange(true)) {
        RG_INFO(Journal::Component::API, Journal::Context::Init,
            "Registrar initialized with {} modules", registry.count());
    }
    return registry;
}

void End()
{
    if (internal::initialized) {
        RG_DEBUG(Journal::Component::API, Journal::Context::Shutdown, "Registrar shutting down");
    }
    Journal::Archivist::shutdown();
}

bool is_initialized()
{
    return internal::initialized;
}

Registry::ModuleRegistry& get_registry()
{
    return Registry::ModuleRegistry::global();
}

std::vector<std::string> list_modules()
{
    return get_registry().list_modules();
}

std::vector<std::string> discover(const Registry::DiscoveryQuery& query)
{
    return Registry::Discovery::find_names(get_registry(), query);
}

}
