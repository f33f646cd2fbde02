////////////////////////////////////////////////////////////////////////////////
// FILE: RegException.hpp
// DESC: Exception class indicating errors with registry operations.
// AUTHOR: Giovanni Dicanio
////////////////////////////////////////////////////////////////////////////////

#ifndef REGBIND_REGEXCEPTION_HPP_INCLUDED
#define REGBIND_REGEXCEPTION_HPP_INCLUDED


#include <Windows.h>            // Windows API

#include <string>               // std::string
#include <system_error>         // std::system_error

#include "RegBind/RegResult.hpp"


namespace regbind
{

//------------------------------------------------------------------------------
// An exception representing an error with the registry operations.
//
// The native LSTATUS is available as code().value(), in the
// std::system_category(); Kind() classifies it.
//------------------------------------------------------------------------------
class RegException
    : public std::system_error
{
public:
    RegException(LSTATUS errorCode, const char* message);
    RegException(LSTATUS errorCode, const std::string& message);

    // Error category of the wrapped native code
    [[nodiscard]] RegErrorKind Kind() const noexcept;

    // The native code as a RegResult
    [[nodiscard]] RegResult Result() const noexcept;
};



//------------------------------------------------------------------------------
//                       RegException Inline Methods
//------------------------------------------------------------------------------

inline RegException::RegException(const LSTATUS errorCode, const char* const message)
    : std::system_error{ errorCode, std::system_category(), message }
{}


inline RegException::RegException(const LSTATUS errorCode, const std::string& message)
    : std::system_error{ errorCode, std::system_category(), message }
{}


inline RegErrorKind RegException::Kind() const noexcept
{
    return ClassifyRegError(static_cast<LSTATUS>(code().value()));
}


inline RegResult RegException::Result() const noexcept
{
    return RegResult{ static_cast<LSTATUS>(code().value()) };
}


} // namespace regbind

#endif // REGBIND_REGEXCEPTION_HPP_INCLUDED
