#pragma once

#include "Sink.hpp"

#include "Ansi.hpp"

namespace Registrar::Journal {

class REGISTRAR_API ConsoleSink : public Sink {
private:
    bool m_colors_enabled;

public:
    ConsoleSink()
    {
        m_colors_enabled = Platform::safe_getenv("NO_COLOR").empty()
            && AnsiColors::initialize_console_colors();
    }

    void write(const JournalEntry& entry) override
    {
        std::lock_guard lock(m_mutex);
        auto& os = entry.severity >= Severity::ERROR ? std::cerr : std::cout;
        write_to_stream(os, entry);
    }

    void flush() override
    {
        std::lock_guard lock(m_mutex);
        std::cout.flush();
        std::cerr.flush();
    }

    [[nodiscard]] bool is_available() const override
    {
        return std::cout.good();
    }

private:
    void write_to_stream(std::ostream& os, const JournalEntry& entry)
    {
        if (m_colors_enabled) {
            feed_severity(os, entry.severity);
        }

        os << "[" << Utils::enum_to_string(entry.severity) << "]";
        if (m_colors_enabled) {
            os << AnsiColors::Reset << AnsiColors::Magenta;
        }

        os << "[" << Utils::enum_to_string(entry.component) << "]";
        if (m_colors_enabled) {
            os << AnsiColors::Reset << AnsiColors::Cyan;
        }

        os << "[" << Utils::enum_to_string(entry.context) << "]";
        if (m_colors_enabled) {
            os << AnsiColors::Reset;
        }

        os << " " << entry.message;

        if (entry.location.file_name() != nullptr && entry.location.line() != 0) {
            if (m_colors_enabled) {
                os << AnsiColors::BrightBlue;
            }
            os << " (" << entry.location.file_name() << ":" << entry.location.line() << ")";
            if (m_colors_enabled) {
                os << AnsiColors::Reset;
            }
        }

        os << '\n';
    }

    static void feed_severity(std::ostream& os, Severity severity)
    {
        switch (severity) {
        case Severity::TRACE:
            os << AnsiColors::Cyan;
            break;
        case Severity::DEBUG:
            os << AnsiColors::Blue;
            break;
        case Severity::INFO:
            os << AnsiColors::Green;
            break;
        case Severity::WARN:
            os << AnsiColors::Yellow;
            break;
        case Severity::ERROR:
            os << AnsiColors::BrightRed;
            break;
        case Severity::FATAL:
            os << AnsiColors::BgRed << AnsiColors::White;
            break;
        case Severity::NONE:
        default:
            os << AnsiColors::Reset;
            break;
        }
    }

    std::mutex m_mutex;
};

} // namespace Registrar::Journal
