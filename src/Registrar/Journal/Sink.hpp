#pragma once

#include "JournalEntry.hpp"

namespace Registrar::Journal {

/**
 * @class Sink
 * @brief Abstract interface for log output destinations
 *
 * Allows pluggable log outputs (console, capture buffers in tests, etc.)
 * Entries reference caller-owned message storage: a sink must copy whatever
 * it keeps before write() returns.
 */
class REGISTRAR_API Sink {
public:
    virtual ~Sink() = default;

    /**
     * @brief Write a journal entry to this sink
     */
    virtual void write(const JournalEntry& entry) = 0;

    /**
     * @brief Flush any buffered writes
     */
    virtual void flush() = 0;

    /**
     * @brief Check if sink is available/healthy
     */
    [[nodiscard]] virtual bool is_available() const = 0;
};

} // namespace Registrar::Journal
