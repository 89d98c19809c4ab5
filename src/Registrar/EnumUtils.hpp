#pragma once

#include "config.h"

#include "magic_enum/magic_enum.hpp"

namespace Registrar::Utils {

/**
 * @brief Universal enum to string converter using magic_enum (original case)
 * @tparam EnumType Any enum type
 * @param value Enum value to convert
 * @return String representation of the enum
 */
template <typename EnumType>
constexpr std::string_view enum_to_string(EnumType value) noexcept
{
    return magic_enum::enum_name(value);
}

/**
 * @brief Universal case-insensitive string to enum converter using magic_enum
 * @tparam EnumType Any enum type
 * @param str String to convert (case-insensitive)
 * @return Optional enum value if valid, nullopt otherwise
 */
template <typename EnumType>
std::optional<EnumType> string_to_enum_case_insensitive(std::string_view str) noexcept
{
    auto direct_result = magic_enum::enum_cast<EnumType>(str);
    if (direct_result.has_value()) {
        return direct_result;
    }

    return magic_enum::enum_cast<EnumType>(str, magic_enum::case_insensitive);
}

/**
 * @brief Get enum count
 */
template <typename EnumType>
constexpr size_t enum_count() noexcept
{
    return magic_enum::enum_count<EnumType>();
}

}
