#pragma once

#ifdef REGISTRAR_PLATFORM_WINDOWS
#include <windows.h>

#ifdef ERROR
#undef ERROR
#endif // ERROR

#endif // REGISTRAR_PLATFORM_WINDOWS

namespace Registrar::Journal::AnsiColors {
// Reset
static constexpr std::string_view Reset = "\033[0m";

// Regular colors
static constexpr std::string_view Green = "\033[32m";
static constexpr std::string_view Yellow = "\033[33m";
static constexpr std::string_view Blue = "\033[34m";
static constexpr std::string_view Magenta = "\033[35m";
static constexpr std::string_view Cyan = "\033[36m";
static constexpr std::string_view White = "\033[37m";

// Bright colors
static constexpr std::string_view BrightRed = "\033[91m";
static constexpr std::string_view BrightBlue = "\033[94m";

// Background colors
static constexpr std::string_view BgRed = "\033[41m";

static bool initialize_console_colors()
{
#ifdef REGISTRAR_PLATFORM_WINDOWS
    HANDLE hOut = GetStdHandle(STD_OUTPUT_HANDLE);
    if (hOut != INVALID_HANDLE_VALUE) {
        DWORD dwMode = 0;
        if (GetConsoleMode(hOut, &dwMode)) {
            return SetConsoleMode(hOut, dwMode | ENABLE_VIRTUAL_TERMINAL_PROCESSING);
        }
    }
    return false;
#else
    return true;
#endif
}

}
