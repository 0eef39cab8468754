/// @file src/appusage/core/result.h
/// @brief Declarations for result.
/// @details A Result holds either a value or an error, never both. It is the
///          return type of every fallible operation in the daemon.

#ifndef APPUSAGE_CORE_RESULT_H
#define APPUSAGE_CORE_RESULT_H

#include <stdexcept>
#include <utility>
#include "./error_code.h"
#include "./optional.h"

namespace appusage
{
    namespace core
    {
        /// @brief A wrapper around the callee's possible returned value or error
        /// @tparam T Value type
        /// @tparam E Error type
        template <typename T, typename E = ErrorCode>
        class Result final
        {
        private:
            Optional<T> mValue;
            Optional<E> mError;

            Result() noexcept = default;

        public:
            /// @brief Value type alias
            using value_type = T;
            /// @brief Error type alias
            using error_type = E;

            /// @brief Constructor
            /// @param value Value to be copied into the result
            Result(const T &value) : mValue{value}
            {
            }

            /// @brief Constructor
            /// @param value Value to be moved into the result
            Result(T &&value) : mValue{std::move(value)}
            {
            }

            /// @brief Constructor
            /// @param error Error to be copied into the result
            explicit Result(const E &error) : mError{error}
            {
            }

            Result(const Result &other) = default;
            Result(Result &&other) = default;
            ~Result() noexcept = default;
            Result &operator=(const Result &other) = default;
            Result &operator=(Result &&other) = default;

            /// @brief Result factory by copying a value
            /// @param value Value to be copied
            /// @returns Result containing the value
            static Result FromValue(const T &value)
            {
                Result _result;
                _result.mValue = value;
                return _result;
            }

            /// @brief Result factory by moving a value
            /// @param value Value to be moved
            /// @returns Result containing the value
            static Result FromValue(T &&value)
            {
                Result _result;
                _result.mValue = std::move(value);
                return _result;
            }

            /// @brief Result factory by copying an error
            /// @param error Error to be copied
            /// @returns Result containing the error
            static Result FromError(const E &error)
            {
                Result _result;
                _result.mError = error;
                return _result;
            }

            /// @brief Check whether the result contains a value or not
            /// @returns True if the result contains a value, otherwise false
            bool HasValue() const noexcept
            {
                return mValue.HasValue();
            }

            explicit operator bool() const noexcept
            {
                return HasValue();
            }

            /// @brief Get the result value
            /// @returns Reference to the contained value
            /// @throws ErrorException Thrown if the result contains an error
            const T &Value() const &
            {
                if (!mValue.HasValue())
                {
                    mError.Value().ThrowAsException();
                }

                return mValue.Value();
            }

            /// @brief Move the value out of the result
            /// @returns Rvalue reference to the contained value
            T &&Value() &&
            {
                if (!mValue.HasValue())
                {
                    mError.Value().ThrowAsException();
                }

                return std::move(mValue.Value());
            }

            /// @brief Get the result error
            /// @returns Reference to the contained error
            /// @throws std::logic_error Thrown if the result contains a value
            const E &Error() const &
            {
                return mError.Value();
            }

            /// @brief Get the value or a default value if the result contains an error
            /// @tparam U Default value type convertible to T
            /// @param defaultValue Value returned in case of error
            /// @returns Contained value or the default value
            template <typename U>
            T ValueOr(U &&defaultValue) const
            {
                return mValue.ValueOr(std::forward<U>(defaultValue));
            }

            /// @brief Get the value as an optional, dropping a possible error
            /// @returns Optional value
            Optional<T> Ok() const
            {
                return mValue;
            }

            /// @brief Get the error as an optional, dropping a possible value
            /// @returns Optional error
            Optional<E> Err() const
            {
                return mError;
            }

            /// @brief Check whether the result contains a certain error
            /// @param error Error to compare against
            /// @returns True if the result contains an equal error, otherwise false
            bool CheckError(const E &error) const
            {
                return mError.HasValue() && mError.Value() == error;
            }
        };

        /// @brief Result specialization for operations that return no value
        /// @tparam E Error type
        template <typename E>
        class Result<void, E> final
        {
        private:
            Optional<E> mError;

            Result() noexcept = default;

        public:
            /// @brief Value type alias
            using value_type = void;
            /// @brief Error type alias
            using error_type = E;

            /// @brief Constructor
            /// @param error Error to be copied into the result
            explicit Result(const E &error) : mError{error}
            {
            }

            Result(const Result &other) = default;
            Result(Result &&other) = default;
            ~Result() noexcept = default;
            Result &operator=(const Result &other) = default;
            Result &operator=(Result &&other) = default;

            /// @brief Result factory for a successful operation
            /// @returns Result without an error
            static Result FromValue() noexcept
            {
                Result _result;
                return _result;
            }

            /// @brief Result factory by copying an error
            /// @param error Error to be copied
            /// @returns Result containing the error
            static Result FromError(const E &error)
            {
                Result _result;
                _result.mError = error;
                return _result;
            }

            /// @brief Check whether the operation succeeded or not
            /// @returns True if the result contains no error, otherwise false
            bool HasValue() const noexcept
            {
                return !mError.HasValue();
            }

            explicit operator bool() const noexcept
            {
                return HasValue();
            }

            /// @brief Throw the contained error, if any
            void Value() const
            {
                if (mError.HasValue())
                {
                    mError.Value().ThrowAsException();
                }
            }

            /// @brief Get the result error
            /// @returns Reference to the contained error
            /// @throws std::logic_error Thrown if the result contains no error
            const E &Error() const &
            {
                return mError.Value();
            }

            /// @brief Get the error as an optional
            /// @returns Optional error
            Optional<E> Err() const
            {
                return mError;
            }

            /// @brief Check whether the result contains a certain error
            /// @param error Error to compare against
            /// @returns True if the result contains an equal error, otherwise false
            bool CheckError(const E &error) const
            {
                return mError.HasValue() && mError.Value() == error;
            }
        };
    }
}

#endif
