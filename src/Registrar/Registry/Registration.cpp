#include "Registration.hpp"

#include "Registrar/Journal/Archivist.hpp"

namespace Registrar::Registry::Registration {

namespace {

    /**
     * @brief Records submitted before the global registry exists
     *
     * Function-local so that submissions from other translation units' static
     * initializers never see an unconstructed queue.
     */
    struct RegistrationQueue {
        std::mutex mutex;
        std::vector<RegistrationRecord> records;
        bool drained {};
    };

    RegistrationQueue& queue()
    {
        static RegistrationQueue instance;
        return instance;
    }

} // namespace

ModuleRegistry::Result submit(RegistrationRecord record)
{
    auto& q = queue();
    {
        std::lock_guard lock(q.mutex);
        if (!q.drained) {
            q.records.push_back(std::move(record));
            return {};
        }
    }

    return ModuleRegistry::global().register_module(std::move(record));
}

std::vector<RegistrationRecord> drain()
{
    auto& q = queue();
    std::lock_guard lock(q.mutex);
    q.drained = true;
    return std::exchange(q.records, {});
}

size_t pending()
{
    auto& q = queue();
    std::lock_guard lock(q.mutex);
    return q.records.size();
}

ModuleRegistry::Result bootstrap(ModuleRegistry& registry, std::initializer_list<RegisterFn> functions)
{
    size_t step = 0;
    for (const auto& fn : functions) {
        ++step;
        if (auto result = fn(registry); !result) {
            RG_ERROR(Journal::Component::Bootstrap, Journal::Context::Init,
                "Registration step {} of {} failed: {}", step, functions.size(), result.error().describe());
            return result;
        }
    }

    RG_DEBUG(Journal::Component::Bootstrap, Journal::Context::Init,
        "Ran {} registration steps; registry holds {} modules", functions.size(), registry.count());
    return {};
}

bool report_static_submission(const ModuleRegistry::Result& result, std::string_view name)
{
    if (!result) {
        RG_WARN(Journal::Component::Bootstrap, Journal::Context::Registration,
            "Self-registration of '{}' failed: {}", name, result.error().describe());
        return false;
    }
    return true;
}

} // namespace Registrar::Registry::Registration
