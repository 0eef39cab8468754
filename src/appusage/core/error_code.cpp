/// @file src/appusage/core/error_code.cpp
/// @brief Implementation for error code and its exception.

#include "./error_code.h"

namespace appusage
{
    namespace core
    {
        std::string ErrorCode::Message() const
        {
            return std::string{mDomain->Message(mValue)};
        }

        std::string ErrorCode::ToString() const
        {
            std::string _result{mDomain->Name()};
            _result += ':';
            _result += std::to_string(mValue);
            _result += " (";
            _result += Message();
            _result += ')';

            return _result;
        }

        void ErrorCode::ThrowAsException() const
        {
            throw ErrorException{*this};
        }

        ErrorException::ErrorException(ErrorCode error) : std::runtime_error{error.ToString()},
                                                          mError{error}
        {
        }

        const ErrorCode &ErrorException::Error() const noexcept
        {
            return mError;
        }
    }
}
