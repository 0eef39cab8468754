/// @file src/appusage/core/error_domain.h
/// @brief Declarations for error domain.

#ifndef APPUSAGE_CORE_ERROR_DOMAIN_H
#define APPUSAGE_CORE_ERROR_DOMAIN_H

#include <stdint.h>

namespace appusage
{
    /// @brief Error model, optional values and results shared by every cluster
    namespace core
    {
        /// @brief Named family of error codes
        /// @details Each cluster (workspace, usage) owns exactly one domain object
        ///          with static storage duration. Codes of different domains never
        ///          compare equal even if their raw values match.
        class ErrorDomain
        {
        public:
            using IdType = uint64_t;
            using CodeType = uint32_t;

        private:
            const IdType mId;
            const char *const mName;

        protected:
            /// @brief Constructor
            /// @param id Process-wide unique domain ID
            /// @param name Short domain name used as log prefix
            constexpr ErrorDomain(IdType id, const char *name) noexcept : mId{id},
                                                                          mName{name}
            {
            }

            ~ErrorDomain() noexcept = default;

        public:
            ErrorDomain(const ErrorDomain &) = delete;
            ErrorDomain &operator=(const ErrorDomain &) = delete;

            constexpr bool operator==(const ErrorDomain &other) const noexcept
            {
                return mId == other.mId;
            }

            constexpr bool operator!=(const ErrorDomain &other) const noexcept
            {
                return !(*this == other);
            }

            /// @brief Get the domain ID
            constexpr IdType Id() const noexcept
            {
                return mId;
            }

            /// @brief Get the domain name, e.g. "Workspace"
            constexpr const char *Name() const noexcept
            {
                return mName;
            }

            /// @brief Describe a raw code of this domain
            /// @param errorCode Raw code
            /// @returns Human readable message, never null
            virtual const char *Message(CodeType errorCode) const noexcept = 0;
        };
    }
}

#endif
