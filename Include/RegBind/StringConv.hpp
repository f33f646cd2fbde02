////////////////////////////////////////////////////////////////////////////////
// FILE: StringConv.hpp
// DESC: UTF-8 <-> UTF-16 conversions and the string traits used at the
//       RegBind public interface.
// AUTHOR: Giovanni Dicanio
////////////////////////////////////////////////////////////////////////////////

#ifndef REGBIND_STRINGCONV_HPP_INCLUDED
#define REGBIND_STRINGCONV_HPP_INCLUDED


#include <Windows.h>    // Win32 Platform SDK

#include <limits>       // std::numeric_limits
#include <stdexcept>    // std::runtime_error, std::overflow_error
#include <string>       // std::string, std::wstring
#include <string_view>  // std::string_view, std::wstring_view
#include <vector>       // std::vector


namespace regbind::details
{

//------------------------------------------------------------------------------
// Represents an error during Unicode conversions
//------------------------------------------------------------------------------
class UnicodeConversionException
    : public std::runtime_error
{
public:

    enum class ConversionType
    {
        FromUtf16ToUtf8,
        FromUtf8ToUtf16
    };

    UnicodeConversionException(DWORD errorCode, ConversionType conversionType, const char* message)
        : std::runtime_error{ message }
        , m_errorCode{ errorCode }
        , m_conversionType{ conversionType }
    {}

    [[nodiscard]] DWORD GetErrorCode() const noexcept
    {
        return m_errorCode;
    }

    [[nodiscard]] ConversionType GetConversionType() const noexcept
    {
        return m_conversionType;
    }

private:
    DWORD m_errorCode;
    ConversionType m_conversionType;
};


//------------------------------------------------------------------------------
// Length of a string view as the int the Win32 conversion APIs expect.
// Throws std::overflow_error for strings longer than INT_MAX code units.
//------------------------------------------------------------------------------
[[nodiscard]] inline int SafeCastSizeToInt(const size_t s)
{
    if (s > static_cast<size_t>((std::numeric_limits<int>::max)()))
    {
        throw std::overflow_error(
            "Input size is too long: size_t-length doesn't fit into int.");
    }

    return static_cast<int>(s);
}


//------------------------------------------------------------------------------
// Convert from UTF-16 to UTF-8.
//
// With the default WC_ERR_INVALID_CHARS flag, invalid UTF-16 sequences make the
// conversion fail with UnicodeConversionException. Passing 0 as flags replaces
// them with U+FFFD instead (used for diagnostics).
//------------------------------------------------------------------------------
[[nodiscard]] inline std::string Utf16ToUtf8(std::wstring_view utf16,
                                             const DWORD flags = WC_ERR_INVALID_CHARS)
{
    if (utf16.empty())
    {
        return std::string{};
    }

    const int utf16Length = SafeCastSizeToInt(utf16.length());

    // First pass: get the length, in chars, of the UTF-8 result
    const int utf8Length = ::WideCharToMultiByte(CP_UTF8, flags,
                                                 utf16.data(), utf16Length,
                                                 nullptr, 0,
                                                 nullptr, nullptr);
    if (utf8Length == 0)
    {
        throw UnicodeConversionException(
            ::GetLastError(),
            UnicodeConversionException::ConversionType::FromUtf16ToUtf8,
            "Can't get result UTF-8 string length (WideCharToMultiByte failed).");
    }

    // Second pass: convert into a string of the proper size
    std::string utf8(static_cast<size_t>(utf8Length), '\0');
    const int result = ::WideCharToMultiByte(CP_UTF8, flags,
                                             utf16.data(), utf16Length,
                                             utf8.data(), utf8Length,
                                             nullptr, nullptr);
    if (result == 0)
    {
        throw UnicodeConversionException(
            ::GetLastError(),
            UnicodeConversionException::ConversionType::FromUtf16ToUtf8,
            "Can't convert from UTF-16 to UTF-8 string (WideCharToMultiByte failed).");
    }

    return utf8;
}


//------------------------------------------------------------------------------
// Convert from UTF-8 to UTF-16.
// Invalid UTF-8 sequences make the conversion fail with UnicodeConversionException.
//------------------------------------------------------------------------------
[[nodiscard]] inline std::wstring Utf8ToUtf16(std::string_view utf8)
{
    if (utf8.empty())
    {
        return std::wstring{};
    }

    constexpr DWORD kFlags = MB_ERR_INVALID_CHARS;

    const int utf8Length = SafeCastSizeToInt(utf8.length());

    const int utf16Length = ::MultiByteToWideChar(CP_UTF8, kFlags,
                                                  utf8.data(), utf8Length,
                                                  nullptr, 0);
    if (utf16Length == 0)
    {
        throw UnicodeConversionException(
            ::GetLastError(),
            UnicodeConversionException::ConversionType::FromUtf8ToUtf16,
            "Can't get result UTF-16 string length (MultiByteToWideChar failed).");
    }

    std::wstring utf16(static_cast<size_t>(utf16Length), L'\0');
    const int result = ::MultiByteToWideChar(CP_UTF8, kFlags,
                                             utf8.data(), utf8Length,
                                             utf16.data(), utf16Length);
    if (result == 0)
    {
        throw UnicodeConversionException(
            ::GetLastError(),
            UnicodeConversionException::ConversionType::FromUtf8ToUtf16,
            "Can't convert from UTF-8 to UTF-16 string (MultiByteToWideChar failed).");
    }

    return utf16;
}


//------------------------------------------------------------------------------
// Best-effort UTF-8 rendering of a UTF-16 string, for log records.
// Never throws a conversion error: invalid sequences become U+FFFD.
//------------------------------------------------------------------------------
[[nodiscard]] inline std::string ToLogString(std::wstring_view utf16)
{
    return Utf16ToUtf8(utf16, 0);
}

[[nodiscard]] inline std::string ToLogString(std::string_view utf8)
{
    return std::string{ utf8 };
}


//------------------------------------------------------------------------------
// String trait for UTF-8 std::string at the library interface.
// The Windows Registry API is always called with UTF-16 strings.
//------------------------------------------------------------------------------
struct StringTraitUtf8
{
    using StringType = std::string;

    static StringType ConstructFromUtf16(std::wstring_view sourceUtf16)
    {
        return Utf16ToUtf8(sourceUtf16);
    }

    static std::wstring ToUtf16(const StringType& sourceUtf8)
    {
        return Utf8ToUtf16(sourceUtf8);
    }
};


//------------------------------------------------------------------------------
// String trait for UTF-16 std::wstring at the library interface
// (conversions are just pass-through).
//------------------------------------------------------------------------------
struct StringTraitUtf16
{
    using StringType = std::wstring;

    static StringType ConstructFromUtf16(std::wstring_view sourceUtf16)
    {
        return StringType{ sourceUtf16 };
    }

    static std::wstring ToUtf16(const StringType& sourceUtf16)
    {
        return sourceUtf16;
    }
};


//------------------------------------------------------------------------------
// Convert a vector of UTF-16 strings into the string type of the given trait
//------------------------------------------------------------------------------
template <typename StringTraits>
[[nodiscard]] std::vector<typename StringTraits::StringType>
StringVectorFromUtf16(const std::vector<std::wstring>& utf16Strings)
{
    std::vector<typename StringTraits::StringType> result;
    result.reserve(utf16Strings.size());

    for (const auto& s : utf16Strings)
    {
        result.push_back(StringTraits::ConstructFromUtf16(s));
    }

    return result;
}


//------------------------------------------------------------------------------
// Convert a vector of strings of the given trait into UTF-16 strings
//------------------------------------------------------------------------------
template <typename StringTraits>
[[nodiscard]] std::vector<std::wstring>
StringVectorToUtf16(const std::vector<typename StringTraits::StringType>& strings)
{
    std::vector<std::wstring> result;
    result.reserve(strings.size());

    for (const auto& s : strings)
    {
        result.push_back(StringTraits::ToUtf16(s));
    }

    return result;
}


} // namespace regbind::details

#endif // REGBIND_STRINGCONV_HPP_INCLUDED
