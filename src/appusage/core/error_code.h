/// @file src/appusage/core/error_code.h
/// @brief Declarations for error code and its exception.

#ifndef APPUSAGE_CORE_ERROR_CODE_H
#define APPUSAGE_CORE_ERROR_CODE_H

#include <stdexcept>
#include <string>
#include "./error_domain.h"

namespace appusage
{
    namespace core
    {
        /// @brief Raw error value tagged with the domain it belongs to
        class ErrorCode final
        {
        private:
            ErrorDomain::CodeType mValue;
            const ErrorDomain *mDomain;

        public:
            /// @brief Constructor
            /// @param value Raw code inside the domain
            /// @param domain Owning domain, must outlive the code
            constexpr ErrorCode(
                ErrorDomain::CodeType value,
                const ErrorDomain &domain) noexcept : mValue{value}, mDomain{&domain}
            {
            }

            ErrorCode() = delete;

            constexpr ErrorDomain::CodeType Value() const noexcept
            {
                return mValue;
            }

            constexpr const ErrorDomain &Domain() const noexcept
            {
                return *mDomain;
            }

            /// @brief Get the domain message of the code
            std::string Message() const;

            /// @brief Format the code as "<domain>:<value> (<message>)"
            /// @returns Single-line description suitable for diagnostics
            std::string ToString() const;

            /// @brief Throw ErrorException carrying this code
            [[noreturn]] void ThrowAsException() const;

            constexpr bool operator==(const ErrorCode &other) const noexcept
            {
                return mValue == other.mValue && *mDomain == *other.mDomain;
            }

            constexpr bool operator!=(const ErrorCode &other) const noexcept
            {
                return !(*this == other);
            }
        };

        /// @brief Exception raised when an error result is accessed as a value
        class ErrorException final : public std::runtime_error
        {
        private:
            ErrorCode mError;

        public:
            /// @brief Constructor
            /// @param error Error code that caused the exception
            explicit ErrorException(ErrorCode error);

            /// @brief Get the carried error code
            const ErrorCode &Error() const noexcept;
        };
    }
}

#endif
