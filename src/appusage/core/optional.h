/// @file src/appusage/core/optional.h
/// @brief C++14 optional value wrapper.
/// @details Models a value that may be absent without resorting to sentinel
///          values. Only the subset of std::optional used by the daemon is
///          provided.

#ifndef APPUSAGE_CORE_OPTIONAL_H
#define APPUSAGE_CORE_OPTIONAL_H

#include <new>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace appusage
{
    namespace core
    {
        /// @brief A wrapper around a value that may or may not be present
        /// @tparam T Contained value type
        template <typename T>
        class Optional final
        {
        private:
            bool mHasValue;
            union
            {
                char mEmpty;
                T mValue;
            };

            template <typename... Args>
            void construct(Args &&...args)
            {
                new (&mValue) T(std::forward<Args>(args)...);
                mHasValue = true;
            }

        public:
            /// @brief Constructs an empty optional
            Optional() noexcept : mHasValue{false}, mEmpty{0}
            {
            }

            /// @brief Constructs an optional holding a copy of the value
            /// @param value Value to be copied
            Optional(const T &value) : mHasValue{false}, mEmpty{0}
            {
                construct(value);
            }

            /// @brief Constructs an optional by moving the value in
            /// @param value Value to be moved
            Optional(T &&value) : mHasValue{false}, mEmpty{0}
            {
                construct(std::move(value));
            }

            Optional(const Optional &other) : mHasValue{false}, mEmpty{0}
            {
                if (other.mHasValue)
                {
                    construct(other.mValue);
                }
            }

            Optional(Optional &&other) noexcept(
                std::is_nothrow_move_constructible<T>::value)
                : mHasValue{false}, mEmpty{0}
            {
                if (other.mHasValue)
                {
                    construct(std::move(other.mValue));
                }
            }

            ~Optional() noexcept
            {
                Reset();
            }

            Optional &operator=(const Optional &other)
            {
                if (this != &other)
                {
                    if (other.mHasValue)
                    {
                        if (mHasValue)
                        {
                            mValue = other.mValue;
                        }
                        else
                        {
                            construct(other.mValue);
                        }
                    }
                    else
                    {
                        Reset();
                    }
                }

                return *this;
            }

            Optional &operator=(Optional &&other)
            {
                if (this != &other)
                {
                    if (other.mHasValue)
                    {
                        if (mHasValue)
                        {
                            mValue = std::move(other.mValue);
                        }
                        else
                        {
                            construct(std::move(other.mValue));
                        }
                    }
                    else
                    {
                        Reset();
                    }
                }

                return *this;
            }

            Optional &operator=(const T &value)
            {
                if (mHasValue)
                {
                    mValue = value;
                }
                else
                {
                    construct(value);
                }

                return *this;
            }

            Optional &operator=(T &&value)
            {
                if (mHasValue)
                {
                    mValue = std::move(value);
                }
                else
                {
                    construct(std::move(value));
                }

                return *this;
            }

            /// @brief Replace the contained value by an in-place constructed one
            /// @param args Constructor arguments of the value
            /// @returns Reference to the new contained value
            template <typename... Args>
            T &Emplace(Args &&...args)
            {
                Reset();
                construct(std::forward<Args>(args)...);
                return mValue;
            }

            /// @brief Destroy the contained value, if any
            void Reset() noexcept
            {
                if (mHasValue)
                {
                    mValue.~T();
                    mHasValue = false;
                }
            }

            /// @brief Indicate whether the optional contains a value or not
            /// @returns True if there is a value, otherwise false
            bool HasValue() const noexcept
            {
                return mHasValue;
            }

            explicit operator bool() const noexcept
            {
                return mHasValue;
            }

            /// @brief Get the contained value
            /// @returns Reference to the contained value
            /// @throws std::logic_error Thrown if the optional is empty
            const T &Value() const &
            {
                if (!mHasValue)
                {
                    throw std::logic_error("Optional does not contain a value.");
                }

                return mValue;
            }

            /// @copydoc Value() const &
            T &Value() &
            {
                if (!mHasValue)
                {
                    throw std::logic_error("Optional does not contain a value.");
                }

                return mValue;
            }

            /// @brief Get the contained value or a default value
            /// @tparam U Default value type convertible to T
            /// @param defaultValue Value returned if the optional is empty
            /// @returns Contained value or the default value
            template <typename U>
            T ValueOr(U &&defaultValue) const
            {
                if (mHasValue)
                {
                    return mValue;
                }

                return static_cast<T>(std::forward<U>(defaultValue));
            }

            const T &operator*() const &
            {
                return Value();
            }

            const T *operator->() const
            {
                return &Value();
            }
        };

        template <typename T>
        bool operator==(const Optional<T> &lhs, const Optional<T> &rhs)
        {
            if (lhs.HasValue() != rhs.HasValue())
            {
                return false;
            }

            return !lhs.HasValue() || lhs.Value() == rhs.Value();
        }

        template <typename T>
        bool operator!=(const Optional<T> &lhs, const Optional<T> &rhs)
        {
            return !(lhs == rhs);
        }
    }
}

#endif
