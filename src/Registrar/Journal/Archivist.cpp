#include "Archivist.hpp"

#include "ConsoleSink.hpp"

namespace Registrar::Journal {

class Archivist::Impl {
public:
    Impl()
        : m_min_severity(Severity::INFO)
    {
        for (auto& filter : m_component_filters) {
            filter.store(true, std::memory_order_relaxed);
        }
        m_sinks.push_back(std::make_unique<ConsoleSink>());
    }

    void init()
    {
        auto level = Platform::safe_getenv("REGISTRAR_LOG_LEVEL");
        if (level.empty()) {
            return;
        }

        auto severity = Utils::string_to_enum_case_insensitive<Severity>(level);
        if (severity) {
            set_min_severity(*severity);
        } else {
            JournalEntry entry(Severity::WARN, Component::API, Context::Configuration,
                "Ignoring unknown REGISTRAR_LOG_LEVEL value", std::source_location {});
            scribe(entry);
        }
    }

    void flush()
    {
        std::lock_guard lock(m_mutex);
        for (auto& sink : m_sinks) {
            sink->flush();
        }
    }

    void scribe(const JournalEntry& entry)
    {
        if (!should_log(entry.severity, entry.component)) {
            return;
        }

        std::lock_guard lock(m_mutex);
        for (auto& sink : m_sinks) {
            if (sink->is_available()) {
                sink->write(entry);
            }
        }
    }

    void add_sink(std::unique_ptr<Sink> sink)
    {
        if (!sink) {
            return;
        }
        std::lock_guard lock(m_mutex);
        m_sinks.push_back(std::move(sink));
    }

    void clear_sinks()
    {
        std::lock_guard lock(m_mutex);
        m_sinks.clear();
    }

    void reset_sinks()
    {
        std::lock_guard lock(m_mutex);
        m_sinks.clear();
        m_sinks.push_back(std::make_unique<ConsoleSink>());
    }

    void set_min_severity(Severity sev)
    {
        m_min_severity.store(sev, std::memory_order_relaxed);
    }

    [[nodiscard]] Severity min_severity() const
    {
        return m_min_severity.load(std::memory_order_relaxed);
    }

    void set_component_filter(Component comp, bool enabled)
    {
        auto comp_idx = static_cast<size_t>(comp);
        if (comp_idx >= m_component_filters.size()) {
            return;
        }

        // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-constant-array-index)
        m_component_filters[comp_idx].store(enabled, std::memory_order_relaxed);
    }

private:
    [[nodiscard]] bool should_log(Severity severity, Component component) const
    {
        if (severity == Severity::NONE || severity < m_min_severity.load(std::memory_order_relaxed)) {
            return false;
        }

        auto comp_idx = static_cast<size_t>(component);
        if (comp_idx >= m_component_filters.size()) {
            return false;
        }

        // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-constant-array-index)
        return m_component_filters[comp_idx].load(std::memory_order_relaxed);
    }

    std::mutex m_mutex;
    std::atomic<Severity> m_min_severity;
    std::array<std::atomic<bool>, Utils::enum_count<Component>()> m_component_filters {};
    std::vector<std::unique_ptr<Sink>> m_sinks;
};

Archivist& Archivist::instance()
{
    static Archivist archivist;
    return archivist;
}

Archivist::Archivist()
    : m_impl(std::make_unique<Impl>())
{
}

Archivist::~Archivist() = default;

void Archivist::init()
{
    instance().m_impl->init();
}

void Archivist::shutdown()
{
    instance().m_impl->flush();
}

void Archivist::scribe(Severity severity, Component component, Context context,
    std::string_view message, std::source_location location)
{
    JournalEntry entry(severity, component, context, message, location);
    m_impl->scribe(entry);
}

void Archivist::scribe_simple(Severity severity, Component component, Context context,
    std::string_view message)
{
    JournalEntry entry(severity, component, context, message, std::source_location {});
    m_impl->scribe(entry);
}

void Archivist::add_sink(std::unique_ptr<Sink> sink)
{
    m_impl->add_sink(std::move(sink));
}

void Archivist::clear_sinks()
{
    m_impl->clear_sinks();
}

void Archivist::reset_sinks()
{
    m_impl->reset_sinks();
}

void Archivist::set_min_severity(Severity min_sev)
{
    m_impl->set_min_severity(min_sev);
}

Severity Archivist::min_severity() const
{
    return m_impl->min_severity();
}

void Archivist::set_component_filter(Component comp, bool enabled)
{
    m_impl->set_component_filter(comp, enabled);
}

} // namespace Registrar::Journal
