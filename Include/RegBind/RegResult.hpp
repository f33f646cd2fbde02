////////////////////////////////////////////////////////////////////////////////
// FILE: RegResult.hpp
// DESC: Wrapper of the LSTATUS codes returned by the Windows Registry APIs,
//       and their classification into RegBind error kinds.
// AUTHOR: Giovanni Dicanio
////////////////////////////////////////////////////////////////////////////////

#ifndef REGBIND_REGRESULT_HPP_INCLUDED
#define REGBIND_REGRESULT_HPP_INCLUDED

#include <Windows.h>            // Windows Platform SDK

#include <memory>               // std::unique_ptr
#include <string>               // std::wstring


namespace regbind
{

//------------------------------------------------------------------------------
// Error categories surfaced by RegBind.
//
// Each native LSTATUS maps to exactly one kind; the native code is always
// preserved alongside it (see RegResult::Code and RegException::code).
//------------------------------------------------------------------------------
enum class RegErrorKind
{
    None,           // ERROR_SUCCESS
    NotFound,       // the key or value does not exist
    AccessDenied,   // the caller lacks the requested access rights
    TypeMismatch,   // stored type can't be decoded as the requested type
    InvalidData,    // malformed byte length for a fixed-width type
    Os              // any other native failure
};


//------------------------------------------------------------------------------
// Map a Windows Registry API return code to a RegErrorKind
//------------------------------------------------------------------------------
[[nodiscard]] constexpr RegErrorKind ClassifyRegError(const LSTATUS code) noexcept
{
    switch (code)
    {
        case ERROR_SUCCESS:
            return RegErrorKind::None;

        case ERROR_FILE_NOT_FOUND:
        case ERROR_PATH_NOT_FOUND:
            return RegErrorKind::NotFound;

        case ERROR_ACCESS_DENIED:
            return RegErrorKind::AccessDenied;

        case ERROR_UNSUPPORTED_TYPE:
        case ERROR_DATATYPE_MISMATCH:
        case ERROR_BAD_FILE_TYPE:
            return RegErrorKind::TypeMismatch;

        case ERROR_INVALID_DATA:
            return RegErrorKind::InvalidData;

        default:
            return RegErrorKind::Os;
    }
}


//------------------------------------------------------------------------------
// Return a short description of the error kind
//------------------------------------------------------------------------------
[[nodiscard]] constexpr const char* RegErrorKindToString(const RegErrorKind kind) noexcept
{
    switch (kind)
    {
        case RegErrorKind::None:            return "None";
        case RegErrorKind::NotFound:        return "NotFound";
        case RegErrorKind::AccessDenied:    return "AccessDenied";
        case RegErrorKind::TypeMismatch:    return "TypeMismatch";
        case RegErrorKind::InvalidData:     return "InvalidData";
        case RegErrorKind::Os:              return "Os";
    }

    return "Unknown";
}


//------------------------------------------------------------------------------
// A tiny wrapper around LSTATUS return codes used by the Windows Registry API.
//------------------------------------------------------------------------------
class RegResult
{
public:

    // Initialize to success code (ERROR_SUCCESS)
    RegResult() noexcept = default;

    // Initialize with specific Windows Registry API LSTATUS return code
    explicit RegResult(LSTATUS result) noexcept;

    // Is the wrapped code a success code?
    [[nodiscard]] bool IsOk() const noexcept;

    // Is the wrapped error code a failure code?
    [[nodiscard]] bool Failed() const noexcept;

    // Is the wrapped code a success code?
    [[nodiscard]] explicit operator bool() const noexcept;

    // Get the wrapped Win32 code
    [[nodiscard]] LSTATUS Code() const noexcept;

    // Error category of the wrapped code
    [[nodiscard]] RegErrorKind Kind() const noexcept;

    // Return the system error message associated to the current error code
    [[nodiscard]] std::wstring ErrorMessage() const;

    // Return the system error message associated to the current error code,
    // using the given input language identifier
    [[nodiscard]] std::wstring ErrorMessage(DWORD languageId) const;

private:
    LSTATUS m_result{ ERROR_SUCCESS };
};


namespace details
{

// Releases buffers allocated by the system with LocalAlloc
// (e.g. by FormatMessage with FORMAT_MESSAGE_ALLOCATE_BUFFER)
struct LocalFreeDeleter
{
    void operator()(void* p) const noexcept
    {
        ::LocalFree(p);
    }
};

} // namespace details



//------------------------------------------------------------------------------
//                          RegResult Inline Methods
//------------------------------------------------------------------------------

inline RegResult::RegResult(const LSTATUS result) noexcept
    : m_result{ result }
{}


inline bool RegResult::IsOk() const noexcept
{
    return m_result == ERROR_SUCCESS;
}


inline bool RegResult::Failed() const noexcept
{
    return m_result != ERROR_SUCCESS;
}


inline RegResult::operator bool() const noexcept
{
    return IsOk();
}


inline LSTATUS RegResult::Code() const noexcept
{
    return m_result;
}


inline RegErrorKind RegResult::Kind() const noexcept
{
    return ClassifyRegError(m_result);
}


inline std::wstring RegResult::ErrorMessage() const
{
    return ErrorMessage(MAKELANGID(LANG_NEUTRAL, SUBLANG_DEFAULT));
}


inline std::wstring RegResult::ErrorMessage(const DWORD languageId) const
{
    wchar_t* buffer = nullptr;
    const DWORD length = ::FormatMessageW(
        FORMAT_MESSAGE_ALLOCATE_BUFFER |
        FORMAT_MESSAGE_FROM_SYSTEM |
        FORMAT_MESSAGE_IGNORE_INSERTS,
        nullptr,
        static_cast<DWORD>(m_result),
        languageId,
        reinterpret_cast<LPWSTR>(&buffer),
        0,
        nullptr
    );

    // Owns the system-allocated message buffer from here on
    std::unique_ptr<wchar_t, details::LocalFreeDeleter> message{ buffer };

    if (length == 0 || !message)
    {
        // FormatMessage failed: no message available
        return std::wstring{};
    }

    // Drop the trailing "\r\n" appended by FormatMessage
    std::wstring result{ message.get(), length };
    while (!result.empty() && (result.back() == L'\n' || result.back() == L'\r'))
    {
        result.pop_back();
    }

    return result;
}


} // namespace regbind

#endif // REGBIND_REGRESULT_HPP_INCLUDED
