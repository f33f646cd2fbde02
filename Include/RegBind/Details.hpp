////////////////////////////////////////////////////////////////////////////////
// FILE: Details.hpp
// DESC: Internal helper functions for the RegBind library:
//       size casts, byte order, multi-string layout, predefined keys.
// AUTHOR: Giovanni Dicanio
////////////////////////////////////////////////////////////////////////////////

#ifndef REGBIND_DETAILS_HPP_INCLUDED
#define REGBIND_DETAILS_HPP_INCLUDED


#include <Windows.h>        // Windows Platform SDK

#include <cstring>          // std::memcpy
#include <limits>           // std::numeric_limits
#include <stdexcept>        // std::overflow_error
#include <string>           // std::wstring
#include <utility>          // std::move
#include <vector>           // std::vector

#include "RegBind/RegExpected.hpp"
#include "RegBind/RegResult.hpp"


namespace regbind
{

//------------------------------------------------------------------------------
//                  Private Helper Classes and Functions
//------------------------------------------------------------------------------

namespace details
{

// Registry strings are stored as UTF-16 code units
static_assert(sizeof(wchar_t) == 2, "RegBind requires 16-bit wchar_t (UTF-16).");


//------------------------------------------------------------------------------
// Builds a RegExpected object that stores an error code
//------------------------------------------------------------------------------
template <typename T>
[[nodiscard]] inline RegExpected<T> MakeRegExpectedWithError(const LSTATUS retCode)
{
    return RegExpected<T>{ RegResult{ retCode } };
}


//------------------------------------------------------------------------------
// Safely cast a size_t value (usually from the STL)
// to a DWORD (usually for Win32 API calls).
// In case of overflow, throws an exception of type std::overflow_error.
//------------------------------------------------------------------------------
[[nodiscard]] inline DWORD SafeCastSizeToDword(const size_t size)
{
    // On 32-bit builds size_t and DWORD have the same width and this check
    // is always false; on 64-bit builds a size_t can exceed a DWORD.
    constexpr size_t kMaxDwordValue = static_cast<size_t>((std::numeric_limits<DWORD>::max)());

    if (size > kMaxDwordValue)
    {
        throw std::overflow_error(
            "Input size_t value is too big: size_t value doesn't fit into a DWORD.");
    }

    return static_cast<DWORD>(size);
}


//
// NOTE on the KEY_WOW64_64KEY flag
// ================================
//
// By default, a 32-bit application running on 64-bit Windows accesses the 32-bit registry view
// and a 64-bit application accesses the 64-bit registry view.
// Using this KEY_WOW64_64KEY flag, both 32-bit or 64-bit applications access the 64-bit
// registry view.
//
// If you want to use the default Windows API behavior, pass just KEY_READ | KEY_WRITE
// as the desired access.
//
constexpr REGSAM kDefaultDesiredAccess = KEY_READ | KEY_WRITE | KEY_WOW64_64KEY;


//------------------------------------------------------------------------------
// Expand the environment-variable references (e.g. %PATH%) of a
// REG_EXPAND_SZ string, with ExpandEnvironmentStringsW
//------------------------------------------------------------------------------
[[nodiscard]] inline RegExpected<std::wstring> TryExpandEnvironmentStrings(const std::wstring& source)
{
    // Size in wchar_ts, including the terminating NUL
    DWORD bufferLength = ::ExpandEnvironmentStringsW(source.c_str(), nullptr, 0);

    for (;;)
    {
        if (bufferLength == 0)
        {
            return MakeRegExpectedWithError<std::wstring>(static_cast<LSTATUS>(::GetLastError()));
        }

        std::wstring result(bufferLength, L'\0');
        const DWORD requiredLength = ::ExpandEnvironmentStringsW(source.c_str(),
                                                                 result.data(),
                                                                 bufferLength);
        if (requiredLength == 0)
        {
            return MakeRegExpectedWithError<std::wstring>(static_cast<LSTATUS>(::GetLastError()));
        }

        if (requiredLength <= bufferLength)
        {
            // Drop the terminating NUL
            result.resize(requiredLength - 1);
            return RegExpected<std::wstring>{ std::move(result) };
        }

        // An environment variable changed between the two calls: retry
        bufferLength = requiredLength;
    }
}


//------------------------------------------------------------------------------
// Is the input handle one of the predefined registry roots?
// https://learn.microsoft.com/en-us/windows/win32/sysinfo/predefined-keys
//
// The HKEY_PERFORMANCE_* keys are excluded: they must be closed with
// RegCloseKey, and RegQueryValueEx doesn't report their required data size.
//------------------------------------------------------------------------------
[[nodiscard]] inline bool IsPredefinedKey(const HKEY hKey) noexcept
{
    return (hKey == HKEY_CURRENT_USER)
        || (hKey == HKEY_LOCAL_MACHINE)
        || (hKey == HKEY_CLASSES_ROOT)
        || (hKey == HKEY_CURRENT_CONFIG)
        || (hKey == HKEY_CURRENT_USER_LOCAL_SETTINGS)
        || (hKey == HKEY_USERS);
}


//------------------------------------------------------------------------------
//                          Fixed-width integers
//------------------------------------------------------------------------------

enum class ByteOrder
{
    LittleEndian,   // REG_DWORD, REG_QWORD
    BigEndian       // REG_DWORD_BIG_ENDIAN
};


// Serialize an unsigned integer in the requested byte order,
// independently of the host byte order
template <typename UInt>
[[nodiscard]] std::vector<BYTE> UIntToBytes(const UInt value, const ByteOrder order)
{
    std::vector<BYTE> bytes(sizeof(UInt));

    for (size_t i = 0; i < sizeof(UInt); i++)
    {
        const BYTE b = static_cast<BYTE>((value >> (8 * i)) & 0xFF);
        if (order == ByteOrder::LittleEndian)
        {
            bytes[i] = b;
        }
        else
        {
            bytes[sizeof(UInt) - 1 - i] = b;
        }
    }

    return bytes;
}


// Deserialize an unsigned integer stored in the given byte order.
// The caller has checked that bytes.size() == sizeof(UInt).
template <typename UInt>
[[nodiscard]] UInt UIntFromBytes(const std::vector<BYTE>& bytes, const ByteOrder order) noexcept
{
    UInt value = 0;

    for (size_t i = 0; i < sizeof(UInt); i++)
    {
        const BYTE b = (order == ByteOrder::LittleEndian) ? bytes[i]
                                                          : bytes[sizeof(UInt) - 1 - i];
        value |= static_cast<UInt>(b) << (8 * i);
    }

    return value;
}


//------------------------------------------------------------------------------
//                          UTF-16 <-> raw bytes
//------------------------------------------------------------------------------

// Raw bytes of a sequence of wchar_ts, in native (little-endian) order
[[nodiscard]] inline std::vector<BYTE> WideCharsToBytes(const wchar_t* const data,
                                                        const size_t count)
{
    std::vector<BYTE> bytes(count * sizeof(wchar_t));
    if (count > 0)
    {
        std::memcpy(bytes.data(), data, bytes.size());
    }
    return bytes;
}


// wchar_ts stored in a raw byte buffer.
// A trailing odd byte can't form a UTF-16 code unit and is ignored.
[[nodiscard]] inline std::vector<wchar_t> WideCharsFromBytes(const std::vector<BYTE>& bytes)
{
    std::vector<wchar_t> chars(bytes.size() / sizeof(wchar_t));
    if (!chars.empty())
    {
        std::memcpy(chars.data(), bytes.data(), chars.size() * sizeof(wchar_t));
    }
    return chars;
}


// A REG_SZ / REG_EXPAND_SZ payload: the string without its NUL terminator(s)
[[nodiscard]] inline std::wstring StringFromWideChars(const std::vector<wchar_t>& chars)
{
    size_t length = chars.size();
    while (length > 0 && chars[length - 1] == L'\0')
    {
        length--;
    }
    return std::wstring(chars.data(), length);
}


//------------------------------------------------------------------------------
//                              Multi-strings
//------------------------------------------------------------------------------

//------------------------------------------------------------------------------
// Build a multi-string from a vector<wstring>.
//
// A multi-string is a sequence of contiguous NUL-terminated strings,
// that terminates with an additional NUL. E.g.:
//          Hello\0World\0\0
//
// The empty list is encoded as two NULs. Embedded empty strings are kept
// (just their NUL terminator is written).
//------------------------------------------------------------------------------
[[nodiscard]] inline std::vector<wchar_t> BuildMultiString(const std::vector<std::wstring>& data)
{
    if (data.empty())
    {
        return std::vector<wchar_t>(2, L'\0');
    }

    size_t totalLength = 1; // final NUL
    for (const auto& s : data)
    {
        totalLength += s.length() + 1;
    }

    std::vector<wchar_t> multiString;
    multiString.reserve(totalLength);

    for (const auto& s : data)
    {
        multiString.insert(multiString.end(), s.begin(), s.end());
        multiString.push_back(L'\0');
    }

    multiString.push_back(L'\0');

    return multiString;
}


//------------------------------------------------------------------------------
// Split a multi-string into its single strings.
//
// The final NUL (list terminator) and the NUL of the last string are
// dropped before splitting on the remaining NULs, so:
//
//      ""                  -> {}
//      "\0" or "\0\0"      -> {}
//      "a\0b\0\0"          -> {"a", "b"}
//      "a\0\0\0"           -> {"a", ""}
//      "a\0b\0" / "a\0b"   -> {"a", "b"}  (missing terminators are tolerated)
//
// Embedded empty strings are preserved: some system values (e.g.
// PendingFileRenameOperations) contain them, although the documented format
// doesn't allow it.
//------------------------------------------------------------------------------
[[nodiscard]] inline std::vector<std::wstring> ParseMultiString(const std::vector<wchar_t>& data)
{
    size_t length = data.size();

    // List terminator
    if (length > 0 && data[length - 1] == L'\0')
    {
        length--;
    }

    // Terminator of the last string
    if (length > 0 && data[length - 1] == L'\0')
    {
        length--;
    }

    std::vector<std::wstring> result;
    if (length == 0)
    {
        return result;
    }

    const wchar_t* currString = data.data();
    const wchar_t* const end  = data.data() + length;

    for (const wchar_t* p = currString; ; ++p)
    {
        if (p == end || *p == L'\0')
        {
            result.emplace_back(currString, static_cast<size_t>(p - currString));

            if (p == end)
            {
                break;
            }

            currString = p + 1;
        }
    }

    return result;
}


} // namespace details
} // namespace regbind

#endif // REGBIND_DETAILS_HPP_INCLUDED
