#pragma once

/**
 * @file Format.hpp
 * @brief Message formatting for log entries and error text
 *
 * Backed by std::format where the standard library ships it and by {fmt}
 * otherwise; config.h picks one. Everything else in Registrar formats
 * through the two functions below.
 */

#if REGISTRAR_USE_STD_FORMAT
#include <format>
namespace Registrar::Journal::backend {
using std::format;
using std::format_string;
using std::make_format_args;
using std::vformat;
}
#elif REGISTRAR_USE_FMT
#include <fmt/format.h>
namespace Registrar::Journal::backend {
using ::fmt::format;
using ::fmt::format_string;
using ::fmt::make_format_args;
using ::fmt::vformat;
}
#else
#error "No formatting library available. Either std::format or fmt is required."
#endif

namespace Registrar::Journal {

/**
 * @brief Format with a format string checked at compile time
 */
template <typename... Args>
inline std::string format(backend::format_string<Args...> fmt_str, Args&&... args)
{
    return backend::format(fmt_str, std::forward<Args>(args)...);
}

/**
 * @brief Format with a format string only known at run time (the RG_* macros)
 * @throws format_error of the backend on a malformed string
 */
template <typename... Args>
inline std::string format_runtime(std::string_view fmt_str, const Args&... args)
{
    return backend::vformat(fmt_str, backend::make_format_args(args...));
}

} // namespace Registrar::Journal
