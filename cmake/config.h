#pragma once
#include <version>
#include <cstdlib>
#include <string>

// Cross-platform definitions
#ifdef REGISTRAR_PLATFORM_WINDOWS
// wingdi.h defines ERROR, which collides with Journal::Severity::ERROR
#ifdef ERROR
#undef ERROR
#endif // ERROR
#endif

#define REGISTRAR_API

// C++20 std::format availability detection
// On macOS, and on standard libraries that ship <expected> without <format>,
// the fmt library is used instead.
#if defined(__APPLE__) && defined(__MACH__)
#define REGISTRAR_USE_FMT 1
#define REGISTRAR_USE_STD_FORMAT 0
#else
#if __has_include(<format>) && defined(__cpp_lib_format)
#define REGISTRAR_USE_STD_FORMAT 1
#define REGISTRAR_USE_FMT 0
#else
#define REGISTRAR_USE_FMT 1
#define REGISTRAR_USE_STD_FORMAT 0
#endif
#endif

namespace Registrar::Platform {

/**
 * @brief Read an environment variable without tripping MSVC's deprecation of getenv
 * @param var Variable name
 * @return Value, or an empty string when unset
 */
std::string safe_getenv(const char* var);

} // namespace Registrar::Platform
