#pragma once

#include "Registrar/EnumUtils.hpp"

namespace Registrar::Registry {

/**
 * @enum ErrorCode
 * @brief Distinct, matchable failure causes of registry operations
 */
enum class ErrorCode : uint8_t {
    NotFound, ///< No record under the requested name
    DuplicateName, ///< A record with this name already exists (registration is rejected)
    InvalidArgument, ///< Empty/oversized name, type or path, empty factory, empty handle
    FactoryFailed, ///< The factory returned an error or threw
    TypeMismatch, ///< The handle holds a different interface than the one requested
    SecurityViolation, ///< Signature, review or supply chain check failed
    Internal ///< Lock or allocation failure inside the registry
};

/**
 * @brief Error produced by a factory while constructing an instance
 */
struct FactoryError {
    std::string message;
    std::exception_ptr cause;

    FactoryError() = default;

    explicit FactoryError(std::string msg, std::exception_ptr origin = nullptr)
        : message(std::move(msg))
        , cause(std::move(origin))
    {
    }

    /**
     * @brief Wrap an in-flight exception, taking its what() as message
     */
    static FactoryError from_exception(std::exception_ptr origin)
    {
        FactoryError error("unknown exception", origin);
        try {
            if (origin) {
                std::rethrow_exception(origin);
            }
        } catch (const std::exception& e) {
            error.message = e.what();
        } catch (...) {
            // non-std exception: keep the generic message, cause stays attached
        }
        return error;
    }
};

/**
 * @brief Error returned by every fallible registry operation
 */
struct RegistryError {
    ErrorCode code { ErrorCode::Internal };
    std::string module_name;
    std::string message;
    std::exception_ptr cause;

    RegistryError() = default;

    RegistryError(ErrorCode c, std::string name, std::string msg, std::exception_ptr origin = nullptr)
        : code(c)
        , module_name(std::move(name))
        , message(std::move(msg))
        , cause(std::move(origin))
    {
    }

    /**
     * @brief "<Code>: <message> [<name>]"
     */
    [[nodiscard]] std::string describe() const
    {
        std::string text(Utils::enum_to_string(code));
        text += ": ";
        text += message;
        if (!module_name.empty()) {
            text += " [" + module_name + "]";
        }
        return text;
    }

    [[nodiscard]] bool is(ErrorCode c) const { return code == c; }
};

} // namespace Registrar::Registry
