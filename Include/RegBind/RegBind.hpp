////////////////////////////////////////////////////////////////////////////////
// FILE: RegBind.hpp
// DESC: Public header of the RegBind library.
// AUTHOR: Giovanni Dicanio
////////////////////////////////////////////////////////////////////////////////

#ifndef REGBIND_REGBIND_HPP_INCLUDED
#define REGBIND_REGBIND_HPP_INCLUDED


////////////////////////////////////////////////////////////////////////////////
//
//      *** Type-Safe C++ Bindings for the Windows Registry C API ***
//
//               Copyright (C) by Giovanni Dicanio
//
// E-mail: <first name>.<last name> AT REMOVE_THIS gmail.com
//
// Registry key handles are safely and conveniently wrapped
// in the RegKeyT resource manager C++ template class.
//
// Registry values are read as RawRegValue (type code + bytes), and decoded
// into RegValue objects: a tagged union over the native C++ representations
// of the registry data types. RegValue::As<T>() converts to a native type,
// failing with a TypeMismatch error when the stored type doesn't match.
//
// Many methods are available in two forms:
//
// - One form that signals errors throwing exceptions
//   of class RegException (e.g. RegKeyT::Open)
//
// - Another form that returns RegResult objects (e.g. RegKeyT::TryOpen),
//   or RegExpected<T> objects for queries (e.g. RegKeyT::TryGetDwordValue).
//
// Both RegException and RegResult expose the native LSTATUS code, and its
// classification as a RegErrorKind (NotFound, AccessDenied, TypeMismatch,
// InvalidData, Os).
//
// Unicode UTF-16 strings are represented using the std::wstring class;
// Unicode UTF-8 strings are represented using std::string (RegKeyUtf8).
//
// Key lifecycle operations are logged at debug level with spdlog;
// the application owns the spdlog configuration.
//
// C++ Language Standard: C++17
//
// ===========================================================================
//
// The MIT License(MIT)
//
// Copyright(c) 2017-2024 by Giovanni Dicanio
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files(the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and / or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions :
//
// The above copyright notice and this permission notice shall be included in all
// copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT.IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
// SOFTWARE.
//
////////////////////////////////////////////////////////////////////////////////


#include <Windows.h>        // Windows Platform SDK
#include <crtdbg.h>         // _ASSERTE

#include <string>           // std::string, std::wstring
#include <string_view>      // std::string_view
#include <utility>          // std::swap, std::pair, std::move
#include <vector>           // std::vector

#include <spdlog/spdlog.h>  // Logging

#include "RegBind/Details.hpp"
#include "RegBind/RegEnum.hpp"
#include "RegBind/RegException.hpp"
#include "RegBind/RegExpected.hpp"
#include "RegBind/RegResult.hpp"
#include "RegBind/RegValue.hpp"
#include "RegBind/StringConv.hpp"


namespace regbind
{

//------------------------------------------------------------------------------
// Outcome of a key creation (RegCreateKeyEx disposition)
//------------------------------------------------------------------------------
enum class RegDisposition
{
    CreatedNewKey,      // REG_CREATED_NEW_KEY
    OpenedExistingKey   // REG_OPENED_EXISTING_KEY
};


//------------------------------------------------------------------------------
//
// Safe, efficient and convenient C++ wrapper around HKEY registry key handles.
//
// This class is movable but not copyable: it exclusively owns the wrapped
// handle, which is closed exactly once (by Close() or by the destructor).
// Predefined root keys (e.g. HKEY_CURRENT_USER) are wrapped but never closed.
//
// You can think of this class kind of like a std::unique_ptr for HKEYs.
//
// A RegKeyT must not be used concurrently from several threads without
// external synchronization; distinct RegKeyT objects are independent.
//
// RegKeyT is actually a class template that is specialized to use
// UTF-8 std::strings or UTF-16 std::wstrings at its public interface.
// Client code should use RegKey or RegKeyUtf8 instead of this RegKeyT template.
//
//------------------------------------------------------------------------------
template <typename StringTraits>
class RegKeyT
{
public:

    using StringType = typename StringTraits::StringType;

    using SubKeyRange    = RegEnumRange<StringTraits, details::SubKeyEnumPolicy>;
    using ValueNameRange = RegEnumRange<StringTraits, details::ValueEnumPolicy>;


    //
    // Construction/Destruction
    //

    // Initialize as an empty key handle
    RegKeyT() noexcept = default;

    // Take ownership of the input key handle
    explicit RegKeyT(HKEY hKey) noexcept;

    // Open the given registry key if it exists, else create a new key.
    // Uses default KEY_READ|KEY_WRITE|KEY_WOW64_64KEY access.
    // Throw RegException on failure.
    RegKeyT(HKEY hKeyParent, const StringType& subKey);

    // Open the given registry key if it exists, else create a new key,
    // with the desired access (e.g. KEY_READ|KEY_WOW64_64KEY for read-only access).
    // Throw RegException on failure.
    RegKeyT(HKEY hKeyParent, const StringType& subKey, REGSAM desiredAccess);

    // Take ownership of the input key handle.
    // The input key handle wrapper is reset to an empty state.
    RegKeyT(RegKeyT&& other) noexcept;

    // Move-assign from the input key handle.
    // Self-move-assign is safe and does nothing.
    RegKeyT& operator=(RegKeyT&& other) noexcept;

    // Ban copy
    RegKeyT(const RegKeyT&) = delete;
    RegKeyT& operator=(const RegKeyT&) = delete;

    // Safely close the wrapped key handle (if any)
    ~RegKeyT() noexcept;

    // Wrap one of the predefined root keys (e.g. HKEY_LOCAL_MACHINE).
    // No OS call is made. Throws RegException (ERROR_INVALID_HANDLE)
    // if the input handle is not a predefined key.
    [[nodiscard]] static RegKeyT Predefined(HKEY hKeyPredefined);


    //
    // Properties
    //

    // Access the wrapped raw HKEY handle
    [[nodiscard]] HKEY Get() const noexcept;

    // Is the wrapped HKEY handle valid?
    [[nodiscard]] bool IsValid() const noexcept;

    // Same as IsValid(), but allow a short "if (regKey)" syntax
    [[nodiscard]] explicit operator bool() const noexcept;

    // Is the wrapped handle a predefined handle (e.g. HKEY_CURRENT_USER)?
    [[nodiscard]] bool IsPredefined() const noexcept;


    //
    // Operations
    //

    // Close current HKEY handle.
    // If there's no valid handle, do nothing: calling Close() twice is fine.
    // This method doesn't close predefined HKEY handles (e.g. HKEY_CURRENT_USER).
    void Close() noexcept;

    // Transfer ownership of current HKEY to the caller.
    // Note that the caller is responsible for closing the key handle!
    [[nodiscard]] HKEY Detach() noexcept;

    // Take ownership of the input HKEY handle.
    // Safely close any previously open handle.
    // Input key handle can be nullptr.
    void Attach(HKEY hKey) noexcept;

    // Non-throwing swap;
    // Note: There's also a non-member swap overload
    void SwapWith(RegKeyT& other) noexcept;


    //
    // Open and Create
    //
    // On success, any previously wrapped handle is closed and the new one is owned.
    // On failure, the wrapped handle is left untouched.
    //

    // Wrapper around RegCreateKeyEx, that allows you to specify desired access
    void Create(
        HKEY hKeyParent,
        const StringType& subKey,
        REGSAM desiredAccess = details::kDefaultDesiredAccess
    );

    // Wrapper around RegCreateKeyEx.
    // If disposition is not nullptr, it receives whether the key was created or opened.
    void Create(
        HKEY hKeyParent,
        const StringType& subKey,
        REGSAM desiredAccess,
        DWORD options,
        SECURITY_ATTRIBUTES* securityAttributes,
        RegDisposition* disposition
    );

    // Wrapper around RegOpenKeyEx
    void Open(
        HKEY hKeyParent,
        const StringType& subKey,
        REGSAM desiredAccess = details::kDefaultDesiredAccess
    );

    [[nodiscard]] RegResult TryCreate(
        HKEY hKeyParent,
        const StringType& subKey,
        REGSAM desiredAccess = details::kDefaultDesiredAccess
    );

    [[nodiscard]] RegResult TryCreate(
        HKEY hKeyParent,
        const StringType& subKey,
        REGSAM desiredAccess,
        DWORD options,
        SECURITY_ATTRIBUTES* securityAttributes,
        RegDisposition* disposition
    );

    [[nodiscard]] RegResult TryOpen(
        HKEY hKeyParent,
        const StringType& subKey,
        REGSAM desiredAccess = details::kDefaultDesiredAccess
    );

    // Open a subkey of this key, as a new RegKeyT object
    [[nodiscard]] RegKeyT OpenSubKey(
        const StringType& subKey,
        REGSAM desiredAccess = details::kDefaultDesiredAccess
    ) const;

    // Open or create a subkey of this key, as a new RegKeyT object
    [[nodiscard]] RegKeyT CreateSubKey(
        const StringType& subKey,
        REGSAM desiredAccess = details::kDefaultDesiredAccess,
        RegDisposition* disposition = nullptr
    ) const;


    //
    // Raw and Decoded Values
    //

    // Read the type code and the undecoded bytes of a value (RegQueryValueEx)
    [[nodiscard]] RawRegValue GetRawValue(const StringType& valueName) const;
    [[nodiscard]] RegExpected<RawRegValue> TryGetRawValue(const StringType& valueName) const;

    // Write the bytes of a value under the given type code (RegSetValueEx)
    void SetRawValue(const StringType& valueName, const RawRegValue& value);
    [[nodiscard]] RegResult TrySetRawValue(const StringType& valueName, const RawRegValue& value);

    // Read and decode a value according to its stored type
    [[nodiscard]] RegValue GetValue(const StringType& valueName) const;
    [[nodiscard]] RegExpected<RegValue> TryGetValue(const StringType& valueName) const;

    // Encode a value and write it under its own type code
    void SetValue(const StringType& valueName, const RegValue& value);
    [[nodiscard]] RegResult TrySetValue(const StringType& valueName, const RegValue& value);

    // Read a value and convert it to a native type (see RegValue::As)
    template <typename T>
    [[nodiscard]] T GetValueAs(const StringType& valueName) const;

    template <typename T>
    [[nodiscard]] RegExpected<T> TryGetValueAs(const StringType& valueName) const;


    //
    // Registry Value Setters
    //

    void SetDwordValue(const StringType& valueName, DWORD data);
    void SetQwordValue(const StringType& valueName, const ULONGLONG& data);
    void SetStringValue(const StringType& valueName, const StringType& data);
    void SetExpandStringValue(const StringType& valueName, const StringType& data);
    void SetMultiStringValue(const StringType& valueName, const std::vector<StringType>& data);
    void SetBinaryValue(const StringType& valueName, const std::vector<BYTE>& data);
    void SetBinaryValue(const StringType& valueName, const void* data, DWORD dataSize);


    //
    // Registry Value Setters Returning RegResult
    // (instead of throwing RegException on error)
    //

    [[nodiscard]] RegResult TrySetDwordValue(const StringType& valueName, DWORD data);

    [[nodiscard]] RegResult TrySetQwordValue(const StringType& valueName,
                                             const ULONGLONG& data);

    [[nodiscard]] RegResult TrySetStringValue(const StringType& valueName,
                                              const StringType& data);

    [[nodiscard]] RegResult TrySetExpandStringValue(const StringType& valueName,
                                                    const StringType& data);

    [[nodiscard]] RegResult TrySetMultiStringValue(const StringType& valueName,
                                                   const std::vector<StringType>& data);

    [[nodiscard]] RegResult TrySetBinaryValue(const StringType& valueName,
                                              const std::vector<BYTE>& data);

    [[nodiscard]] RegResult TrySetBinaryValue(const StringType& valueName,
                                              const void* data,
                                              DWORD dataSize);


    //
    // Registry Value Getters
    //
    // GetQwordValue also accepts a stored REG_DWORD (widened to 64 bits).
    // GetStringValue accepts REG_SZ, REG_EXPAND_SZ (never expanded) and REG_LINK;
    // GetExpandStringValue requires REG_EXPAND_SZ.
    //

    [[nodiscard]] DWORD GetDwordValue(const StringType& valueName) const;
    [[nodiscard]] ULONGLONG GetQwordValue(const StringType& valueName) const;
    [[nodiscard]] StringType GetStringValue(const StringType& valueName) const;

    enum class ExpandStringOption
    {
        DontExpand,
        Expand
    };

    [[nodiscard]] StringType GetExpandStringValue(
        const StringType& valueName,
        ExpandStringOption expandOption = ExpandStringOption::DontExpand
    ) const;

    [[nodiscard]] std::vector<StringType> GetMultiStringValue(const StringType& valueName) const;
    [[nodiscard]] std::vector<BYTE> GetBinaryValue(const StringType& valueName) const;


    //
    // Registry Value Getters Returning RegExpected<T>
    // (instead of throwing RegException on error)
    //

    [[nodiscard]] RegExpected<DWORD> TryGetDwordValue(const StringType& valueName) const;
    [[nodiscard]] RegExpected<ULONGLONG> TryGetQwordValue(const StringType& valueName) const;
    [[nodiscard]] RegExpected<StringType> TryGetStringValue(const StringType& valueName) const;

    [[nodiscard]] RegExpected<StringType> TryGetExpandStringValue(
        const StringType& valueName,
        ExpandStringOption expandOption = ExpandStringOption::DontExpand
    ) const;

    [[nodiscard]] RegExpected<std::vector<StringType>>
            TryGetMultiStringValue(const StringType& valueName) const;

    [[nodiscard]] RegExpected<std::vector<BYTE>>
            TryGetBinaryValue(const StringType& valueName) const;


    //
    // Query Operations
    //

    // Information about a registry key (retrieved by QueryInfoKey)
    struct InfoKey
    {
        DWORD    NumberOfSubKeys;
        DWORD    NumberOfValues;
        FILETIME LastWriteTime;

        // Clear the structure fields
        InfoKey() noexcept
            : NumberOfSubKeys{0}
            , NumberOfValues{0}
        {
            LastWriteTime.dwHighDateTime = LastWriteTime.dwLowDateTime = 0;
        }

        InfoKey(DWORD numberOfSubKeys, DWORD numberOfValues, FILETIME lastWriteTime) noexcept
            : NumberOfSubKeys{ numberOfSubKeys }
            , NumberOfValues{ numberOfValues }
            , LastWriteTime{ lastWriteTime }
        {
        }
    };

    // Retrieve information about the registry key
    [[nodiscard]] InfoKey QueryInfoKey() const;

    // Return the DWORD type ID for the input registry value
    [[nodiscard]] DWORD QueryValueType(const StringType& valueName) const;

    // Check if the current key contains the specified value
    [[nodiscard]] bool ContainsValue(const StringType& valueName) const;

    // Check if the current key contains the specified sub-key
    [[nodiscard]] bool ContainsSubKey(const StringType& subKey) const;

    [[nodiscard]] RegExpected<InfoKey> TryQueryInfoKey() const;
    [[nodiscard]] RegExpected<DWORD> TryQueryValueType(const StringType& valueName) const;
    [[nodiscard]] RegExpected<bool> TryContainsValue(const StringType& valueName) const;
    [[nodiscard]] RegExpected<bool> TryContainsSubKey(const StringType& subKey) const;


    //
    // Enumeration
    //

    // Lazy sequence of the subkey names (RegEnumKeyEx at index 0, 1, 2, ...).
    // Each traversal starts again from index 0.
    // The returned range refers to this key's handle: it must not outlive it.
    // Traversing the range of a closed key throws RegException (ERROR_INVALID_HANDLE).
    [[nodiscard]] SubKeyRange EnumKeys() const noexcept;

    // Lazy sequence of the value names (RegEnumValue at index 0, 1, 2, ...)
    [[nodiscard]] ValueNameRange EnumValueNames() const noexcept;

    // All the subkey names
    [[nodiscard]] std::vector<StringType> EnumSubKeys() const;

    // All the values under the key: in each pair, the first item is the value name,
    // the second item is the value type.
    [[nodiscard]] std::vector<std::pair<StringType, DWORD>> EnumValues() const;

    [[nodiscard]] RegExpected<std::vector<StringType>> TryEnumSubKeys() const;
    [[nodiscard]] RegExpected<std::vector<std::pair<StringType, DWORD>>> TryEnumValues() const;


    //
    // Delete, Copy, Flush
    //

    void DeleteValue(const StringType& valueName);
    void DeleteKey(const StringType& subKey, REGSAM desiredAccess = KEY_WOW64_64KEY);
    void DeleteTree(const StringType& subKey);
    void CopyTree(const StringType& sourceSubKey, const RegKeyT& destKey);
    void FlushKey();

    [[nodiscard]] RegResult TryDeleteValue(const StringType& valueName);
    [[nodiscard]] RegResult TryDeleteKey(const StringType& subKey,
                                         REGSAM desiredAccess = KEY_WOW64_64KEY);
    [[nodiscard]] RegResult TryDeleteTree(const StringType& subKey);
    [[nodiscard]] RegResult TryCopyTree(const StringType& sourceSubKey,
                                        const RegKeyT& destKey);
    [[nodiscard]] RegResult TryFlushKey();


    // Return a string representation of Windows registry types
    [[nodiscard]] static StringType RegTypeToString(DWORD regType);


    //
    // Relational comparison operators are overloaded as non-members
    // ==, !=, <, <=, >, >=
    //


    //
    // Private Implementation
    //

private:
    // The wrapped registry key handle
    HKEY m_hKey{ nullptr };

    // Shared by the GetExpandStringValue overloads
    [[nodiscard]] RegExpected<std::wstring> TryGetExpandStringUtf16(
        const StringType& valueName,
        ExpandStringOption expandOption
    ) const;
};

// RegKey has UTF-16 strings at its public interface.
using RegKey = RegKeyT<details::StringTraitUtf16>;

// RegKeyUtf8 uses UTF-8 strings at the public interface
// (and converts to UTF-16 internally for Windows API calls).
using RegKeyUtf8 = RegKeyT<details::StringTraitUtf8>;



//------------------------------------------------------------------------------
//          Overloads of relational comparison operators for RegKeyT
//------------------------------------------------------------------------------

template <typename StringTraits>
inline bool operator==(const RegKeyT<StringTraits>& a, const RegKeyT<StringTraits>& b) noexcept
{
    return a.Get() == b.Get();
}

template <typename StringTraits>
inline bool operator!=(const RegKeyT<StringTraits>& a, const RegKeyT<StringTraits>& b) noexcept
{
    return a.Get() != b.Get();
}

template <typename StringTraits>
inline bool operator<(const RegKeyT<StringTraits>& a, const RegKeyT<StringTraits>& b) noexcept
{
    return a.Get() < b.Get();
}

template <typename StringTraits>
inline bool operator<=(const RegKeyT<StringTraits>& a, const RegKeyT<StringTraits>& b) noexcept
{
    return a.Get() <= b.Get();
}

template <typename StringTraits>
inline bool operator>(const RegKeyT<StringTraits>& a, const RegKeyT<StringTraits>& b) noexcept
{
    return a.Get() > b.Get();
}

template <typename StringTraits>
inline bool operator>=(const RegKeyT<StringTraits>& a, const RegKeyT<StringTraits>& b) noexcept
{
    return a.Get() >= b.Get();
}


template <typename StringTraits>
inline void swap(RegKeyT<StringTraits>& a, RegKeyT<StringTraits>& b) noexcept
{
    a.SwapWith(b);
}


//------------------------------------------------------------------------------
//                          RegKeyT Inline Methods
//------------------------------------------------------------------------------

template <typename StringTraits>
inline RegKeyT<StringTraits>::RegKeyT(const HKEY hKey) noexcept
    : m_hKey{ hKey }
{
}


template <typename StringTraits>
inline RegKeyT<StringTraits>::RegKeyT(const HKEY hKeyParent, const StringType& subKey)
{
    Create(hKeyParent, subKey);
}


template <typename StringTraits>
inline RegKeyT<StringTraits>::RegKeyT(const HKEY hKeyParent,
                                      const StringType& subKey,
                                      const REGSAM desiredAccess)
{
    Create(hKeyParent, subKey, desiredAccess);
}


template <typename StringTraits>
inline RegKeyT<StringTraits>::RegKeyT(RegKeyT&& other) noexcept
    : m_hKey{ other.m_hKey }
{
    // Other doesn't own the handle anymore
    other.m_hKey = nullptr;
}


template <typename StringTraits>
inline RegKeyT<StringTraits>& RegKeyT<StringTraits>::operator=(RegKeyT&& other) noexcept
{
    // Prevent self-move-assign
    if ((this != &other) && (m_hKey != other.m_hKey))
    {
        // Close current
        Close();

        // Move from other (i.e. take ownership of other's raw handle)
        m_hKey = other.m_hKey;
        other.m_hKey = nullptr;
    }
    return *this;
}


template <typename StringTraits>
inline RegKeyT<StringTraits>::~RegKeyT() noexcept
{
    // Release the owned handle (if any)
    Close();
}


template <typename StringTraits>
inline RegKeyT<StringTraits> RegKeyT<StringTraits>::Predefined(const HKEY hKeyPredefined)
{
    if (!details::IsPredefinedKey(hKeyPredefined))
    {
        throw RegException{ ERROR_INVALID_HANDLE, "Not a predefined registry key handle." };
    }

    return RegKeyT{ hKeyPredefined };
}


template <typename StringTraits>
inline HKEY RegKeyT<StringTraits>::Get() const noexcept
{
    return m_hKey;
}


template <typename StringTraits>
inline void RegKeyT<StringTraits>::Close() noexcept
{
    if (IsValid())
    {
        // Do not call RegCloseKey on predefined keys
        if (!IsPredefined())
        {
            spdlog::debug("RegBind: closing key handle {}", static_cast<const void*>(m_hKey));
            ::RegCloseKey(m_hKey);
        }

        // Avoid dangling references
        m_hKey = nullptr;
    }
}


template <typename StringTraits>
inline bool RegKeyT<StringTraits>::IsValid() const noexcept
{
    return m_hKey != nullptr;
}


template <typename StringTraits>
inline RegKeyT<StringTraits>::operator bool() const noexcept
{
    return IsValid();
}


template <typename StringTraits>
inline bool RegKeyT<StringTraits>::IsPredefined() const noexcept
{
    return details::IsPredefinedKey(m_hKey);
}


template <typename StringTraits>
inline HKEY RegKeyT<StringTraits>::Detach() noexcept
{
    HKEY hKey = m_hKey;

    // We don't own the HKEY handle anymore
    m_hKey = nullptr;

    // Transfer ownership to the caller
    return hKey;
}


template <typename StringTraits>
inline void RegKeyT<StringTraits>::Attach(const HKEY hKey) noexcept
{
    // Prevent self-attach
    if (m_hKey != hKey)
    {
        // Close any open registry handle
        Close();

        // Take ownership of the input hKey
        m_hKey = hKey;
    }
}


template <typename StringTraits>
inline void RegKeyT<StringTraits>::SwapWith(RegKeyT& other) noexcept
{
    using std::swap;
    swap(m_hKey, other.m_hKey);
}


template <typename StringTraits>
inline void RegKeyT<StringTraits>::Create(
    const HKEY          hKeyParent,
    const StringType&   subKey,
    const REGSAM        desiredAccess
)
{
    constexpr DWORD kDefaultOptions = REG_OPTION_NON_VOLATILE;

    Create(hKeyParent, subKey, desiredAccess, kDefaultOptions,
        nullptr, // no security attributes,
        nullptr  // no disposition
    );
}


template <typename StringTraits>
inline void RegKeyT<StringTraits>::Create(
    const HKEY                  hKeyParent,
    const StringType&           subKey,
    const REGSAM                desiredAccess,
    const DWORD                 options,
    SECURITY_ATTRIBUTES* const  securityAttributes,
    RegDisposition* const       disposition
)
{
    const RegResult retCode = TryCreate(hKeyParent, subKey, desiredAccess, options,
                                        securityAttributes, disposition);
    if (retCode.Failed())
    {
        throw RegException{ retCode.Code(), "RegCreateKeyExW failed." };
    }
}


template <typename StringTraits>
inline void RegKeyT<StringTraits>::Open(
    const HKEY          hKeyParent,
    const StringType&   subKey,
    const REGSAM        desiredAccess
)
{
    const RegResult retCode = TryOpen(hKeyParent, subKey, desiredAccess);
    if (retCode.Failed())
    {
        throw RegException{ retCode.Code(), "RegOpenKeyExW failed." };
    }
}


template <typename StringTraits>
inline RegResult RegKeyT<StringTraits>::TryCreate(
    const HKEY          hKeyParent,
    const StringType&   subKey,
    const REGSAM        desiredAccess
)
{
    constexpr DWORD kDefaultOptions = REG_OPTION_NON_VOLATILE;

    return TryCreate(hKeyParent, subKey, desiredAccess, kDefaultOptions,
        nullptr, // no security attributes,
        nullptr  // no disposition
    );
}


template <typename StringTraits>
inline RegResult RegKeyT<StringTraits>::TryCreate(
    const HKEY                  hKeyParent,
    const StringType&           subKey,
    const REGSAM                desiredAccess,
    const DWORD                 options,
    SECURITY_ATTRIBUTES* const  securityAttributes,
    RegDisposition* const       disposition
)
{
    HKEY hKey = nullptr;
    DWORD nativeDisposition = 0;
    RegResult retCode{ ::RegCreateKeyExW(
        hKeyParent,
        StringTraits::ToUtf16(subKey).c_str(),
        0,          // reserved
        nullptr,    // user-defined class type parameter not supported
        options,
        desiredAccess,
        securityAttributes,
        &hKey,
        &nativeDisposition
    ) };
    if (retCode.Failed())
    {
        spdlog::debug("RegBind: cannot create key \"{}\": {} (error {})",
                      details::ToLogString(subKey),
                      RegErrorKindToString(retCode.Kind()),
                      retCode.Code());
        return retCode;
    }

    if (disposition != nullptr)
    {
        *disposition = (nativeDisposition == REG_CREATED_NEW_KEY)
                            ? RegDisposition::CreatedNewKey
                            : RegDisposition::OpenedExistingKey;
    }

    spdlog::debug("RegBind: {} key \"{}\" (handle {})",
                  (nativeDisposition == REG_CREATED_NEW_KEY) ? "created" : "opened existing",
                  details::ToLogString(subKey),
                  static_cast<const void*>(hKey));

    // Safely close any previously opened key
    Close();

    // Take ownership of the newly created key
    m_hKey = hKey;

    _ASSERTE(retCode.IsOk());
    return retCode;
}


template <typename StringTraits>
inline RegResult RegKeyT<StringTraits>::TryOpen(
    const HKEY          hKeyParent,
    const StringType&   subKey,
    const REGSAM        desiredAccess
)
{
    HKEY hKey = nullptr;
    RegResult retCode{ ::RegOpenKeyExW(
        hKeyParent,
        StringTraits::ToUtf16(subKey).c_str(),
        0,                  // default options
        desiredAccess,
        &hKey
    ) };
    if (retCode.Failed())
    {
        spdlog::debug("RegBind: cannot open key \"{}\": {} (error {})",
                      details::ToLogString(subKey),
                      RegErrorKindToString(retCode.Kind()),
                      retCode.Code());
        return retCode;
    }

    spdlog::debug("RegBind: opened key \"{}\" (handle {})",
                  details::ToLogString(subKey),
                  static_cast<const void*>(hKey));

    // Safely close any previously opened key
    Close();

    // Take ownership of the newly opened key
    m_hKey = hKey;

    _ASSERTE(retCode.IsOk());
    return retCode;
}


template <typename StringTraits>
inline RegKeyT<StringTraits> RegKeyT<StringTraits>::OpenSubKey(
    const StringType&   subKey,
    const REGSAM        desiredAccess
) const
{
    _ASSERTE(IsValid());

    RegKeyT result;
    result.Open(m_hKey, subKey, desiredAccess);
    return result;
}


template <typename StringTraits>
inline RegKeyT<StringTraits> RegKeyT<StringTraits>::CreateSubKey(
    const StringType&       subKey,
    const REGSAM            desiredAccess,
    RegDisposition* const   disposition
) const
{
    _ASSERTE(IsValid());

    RegKeyT result;
    result.Create(m_hKey, subKey, desiredAccess, REG_OPTION_NON_VOLATILE, nullptr, disposition);
    return result;
}


template <typename StringTraits>
inline RawRegValue RegKeyT<StringTraits>::GetRawValue(const StringType& valueName) const
{
    return TryGetRawValue(valueName).ValueOrThrow(
        "Cannot get registry value: RegQueryValueExW failed.");
}


template <typename StringTraits>
inline RegExpected<RawRegValue>
RegKeyT<StringTraits>::TryGetRawValue(const StringType& valueName) const
{
    _ASSERTE(IsValid());

    const std::wstring valueNameUtf16 = StringTraits::ToUtf16(valueName);

    DWORD type = REG_NONE;
    DWORD dataSize = 0;         // size of the value data, in bytes
    std::vector<BYTE> data;

    // Get the size of the value data
    LSTATUS retCode = ::RegQueryValueExW(
        m_hKey,
        valueNameUtf16.c_str(),
        nullptr,    // reserved
        &type,
        nullptr,    // output buffer not needed now
        &dataSize
    );
    if (retCode != ERROR_SUCCESS)
    {
        return details::MakeRegExpectedWithError<RawRegValue>(retCode);
    }

    // The value may grow between the size query and the read: keep retrying
    for (;;)
    {
        data.resize(dataSize);

        // Zero-length data (e.g. an empty REG_BINARY): nothing more to read
        if (dataSize == 0)
        {
            return RegExpected<RawRegValue>{ RawRegValue{ type, std::move(data) } };
        }

        // Read the value data
        retCode = ::RegQueryValueExW(
            m_hKey,
            valueNameUtf16.c_str(),
            nullptr,    // reserved
            &type,
            data.data(),
            &dataSize
        );
        if (retCode != ERROR_MORE_DATA)
        {
            break;
        }

        // ERROR_MORE_DATA normally reports the required size.
        // When it doesn't, the buffer still has to grow.
        const DWORD currentSize = details::SafeCastSizeToDword(data.size());
        if (dataSize <= currentSize)
        {
            dataSize = details::SafeCastSizeToDword(data.size() * 2);
        }
    }

    if (retCode != ERROR_SUCCESS)
    {
        return details::MakeRegExpectedWithError<RawRegValue>(retCode);
    }

    // The value may also have shrunk
    data.resize(dataSize);

    return RegExpected<RawRegValue>{ RawRegValue{ type, std::move(data) } };
}


template <typename StringTraits>
inline void RegKeyT<StringTraits>::SetRawValue(const StringType& valueName,
                                               const RawRegValue& value)
{
    const RegResult retCode = TrySetRawValue(valueName, value);
    if (retCode.Failed())
    {
        throw RegException{ retCode.Code(), "Cannot write registry value: RegSetValueExW failed." };
    }
}


template <typename StringTraits>
inline RegResult RegKeyT<StringTraits>::TrySetRawValue(const StringType& valueName,
                                                       const RawRegValue& value)
{
    _ASSERTE(IsValid());

    // Total data size, in bytes
    const DWORD dataSize = details::SafeCastSizeToDword(value.Data.size());

    RegResult retCode{ ::RegSetValueExW(
        m_hKey,
        StringTraits::ToUtf16(valueName).c_str(),
        0, // reserved
        value.Type,
        value.Data.empty() ? nullptr : value.Data.data(),
        dataSize
    ) };

    spdlog::debug("RegBind: set value \"{}\" ({}, {} bytes): {}",
                  details::ToLogString(valueName),
                  RegTypeName(value.Type),
                  dataSize,
                  RegErrorKindToString(retCode.Kind()));

    return retCode;
}


template <typename StringTraits>
inline RegValue RegKeyT<StringTraits>::GetValue(const StringType& valueName) const
{
    return DecodeRegValue(GetRawValue(valueName));
}


template <typename StringTraits>
inline RegExpected<RegValue> RegKeyT<StringTraits>::TryGetValue(const StringType& valueName) const
{
    RegExpected<RawRegValue> raw = TryGetRawValue(valueName);
    if (!raw)
    {
        return details::MakeRegExpectedWithError<RegValue>(raw.GetError().Code());
    }

    return TryDecodeRegValue(raw.GetValue());
}


template <typename StringTraits>
inline void RegKeyT<StringTraits>::SetValue(const StringType& valueName, const RegValue& value)
{
    SetRawValue(valueName, EncodeRegValue(value));
}


template <typename StringTraits>
inline RegResult RegKeyT<StringTraits>::TrySetValue(const StringType& valueName,
                                                    const RegValue& value)
{
    return TrySetRawValue(valueName, EncodeRegValue(value));
}


template <typename StringTraits>
template <typename T>
inline T RegKeyT<StringTraits>::GetValueAs(const StringType& valueName) const
{
    return GetValue(valueName).template As<T>();
}


template <typename StringTraits>
template <typename T>
inline RegExpected<T> RegKeyT<StringTraits>::TryGetValueAs(const StringType& valueName) const
{
    RegExpected<RegValue> value = TryGetValue(valueName);
    if (!value)
    {
        return details::MakeRegExpectedWithError<T>(value.GetError().Code());
    }

    return value.GetValue().template TryAs<T>();
}


template <typename StringTraits>
inline void RegKeyT<StringTraits>::SetDwordValue(const StringType& valueName, const DWORD data)
{
    SetValue(valueName, RegValue::Dword(data));
}


template <typename StringTraits>
inline void RegKeyT<StringTraits>::SetQwordValue(const StringType& valueName,
                                                 const ULONGLONG& data)
{
    SetValue(valueName, RegValue::Qword(data));
}


template <typename StringTraits>
inline void RegKeyT<StringTraits>::SetStringValue(const StringType& valueName,
                                                  const StringType& data)
{
    SetValue(valueName, RegValue::String(StringTraits::ToUtf16(data)));
}


template <typename StringTraits>
inline void RegKeyT<StringTraits>::SetExpandStringValue(const StringType& valueName,
                                                        const StringType& data)
{
    SetValue(valueName, RegValue::ExpandString(StringTraits::ToUtf16(data)));
}


template <typename StringTraits>
inline void RegKeyT<StringTraits>::SetMultiStringValue(
    const StringType& valueName,
    const std::vector<StringType>& data
)
{
    SetValue(valueName, RegValue::MultiString(details::StringVectorToUtf16<StringTraits>(data)));
}


template <typename StringTraits>
inline void RegKeyT<StringTraits>::SetBinaryValue(const StringType& valueName,
                                                  const std::vector<BYTE>& data)
{
    SetValue(valueName, RegValue::Binary(data));
}


template <typename StringTraits>
inline void RegKeyT<StringTraits>::SetBinaryValue(
    const StringType& valueName,
    const void* const data,
    const DWORD dataSize
)
{
    const BYTE* const bytes = static_cast<const BYTE*>(data);
    SetValue(valueName, RegValue::Binary(std::vector<BYTE>(bytes, bytes + dataSize)));
}


template <typename StringTraits>
inline RegResult RegKeyT<StringTraits>::TrySetDwordValue(const StringType& valueName,
                                                         const DWORD data)
{
    return TrySetValue(valueName, RegValue::Dword(data));
}


template <typename StringTraits>
inline RegResult RegKeyT<StringTraits>::TrySetQwordValue(const StringType& valueName,
                                                         const ULONGLONG& data)
{
    return TrySetValue(valueName, RegValue::Qword(data));
}


template <typename StringTraits>
inline RegResult RegKeyT<StringTraits>::TrySetStringValue(const StringType& valueName,
                                                          const StringType& data)
{
    return TrySetValue(valueName, RegValue::String(StringTraits::ToUtf16(data)));
}


template <typename StringTraits>
inline RegResult RegKeyT<StringTraits>::TrySetExpandStringValue(const StringType& valueName,
                                                                const StringType& data)
{
    return TrySetValue(valueName, RegValue::ExpandString(StringTraits::ToUtf16(data)));
}


template <typename StringTraits>
inline RegResult RegKeyT<StringTraits>::TrySetMultiStringValue(
    const StringType& valueName,
    const std::vector<StringType>& data
)
{
    return TrySetValue(valueName,
                       RegValue::MultiString(details::StringVectorToUtf16<StringTraits>(data)));
}


template <typename StringTraits>
inline RegResult RegKeyT<StringTraits>::TrySetBinaryValue(const StringType& valueName,
                                                          const std::vector<BYTE>& data)
{
    return TrySetValue(valueName, RegValue::Binary(data));
}


template <typename StringTraits>
inline RegResult RegKeyT<StringTraits>::TrySetBinaryValue(
    const StringType& valueName,
    const void* const data,
    const DWORD dataSize
)
{
    const BYTE* const bytes = static_cast<const BYTE*>(data);
    return TrySetValue(valueName, RegValue::Binary(std::vector<BYTE>(bytes, bytes + dataSize)));
}


template <typename StringTraits>
inline DWORD RegKeyT<StringTraits>::GetDwordValue(const StringType& valueName) const
{
    return GetValueAs<DWORD>(valueName);
}


template <typename StringTraits>
inline ULONGLONG RegKeyT<StringTraits>::GetQwordValue(const StringType& valueName) const
{
    return GetValueAs<ULONGLONG>(valueName);
}


template <typename StringTraits>
inline typename RegKeyT<StringTraits>::StringType
RegKeyT<StringTraits>::GetStringValue(const StringType& valueName) const
{
    return StringTraits::ConstructFromUtf16(GetValueAs<std::wstring>(valueName));
}


template <typename StringTraits>
inline RegExpected<std::wstring> RegKeyT<StringTraits>::TryGetExpandStringUtf16(
    const StringType& valueName,
    const ExpandStringOption expandOption
) const
{
    RegExpected<RegValue> value = TryGetValue(valueName);
    if (!value)
    {
        return details::MakeRegExpectedWithError<std::wstring>(value.GetError().Code());
    }

    if (value.GetValue().Type() != REG_EXPAND_SZ)
    {
        return details::MakeRegExpectedWithError<std::wstring>(ERROR_UNSUPPORTED_TYPE);
    }

    RegExpected<std::wstring> data = value.GetValue().template TryAs<std::wstring>();
    if (!data || expandOption == ExpandStringOption::DontExpand)
    {
        return data;
    }

    return details::TryExpandEnvironmentStrings(data.GetValue());
}


template <typename StringTraits>
inline typename RegKeyT<StringTraits>::StringType RegKeyT<StringTraits>::GetExpandStringValue(
    const StringType& valueName,
    const ExpandStringOption expandOption
) const
{
    return StringTraits::ConstructFromUtf16(
        TryGetExpandStringUtf16(valueName, expandOption).ValueOrThrow(
            "Cannot get the expand string value."));
}


template <typename StringTraits>
inline std::vector<typename RegKeyT<StringTraits>::StringType>
RegKeyT<StringTraits>::GetMultiStringValue(const StringType& valueName) const
{
    return details::StringVectorFromUtf16<StringTraits>(
        GetValueAs<std::vector<std::wstring>>(valueName));
}


template <typename StringTraits>
inline std::vector<BYTE> RegKeyT<StringTraits>::GetBinaryValue(const StringType& valueName) const
{
    return GetValueAs<std::vector<BYTE>>(valueName);
}


template <typename StringTraits>
inline RegExpected<DWORD> RegKeyT<StringTraits>::TryGetDwordValue(const StringType& valueName) const
{
    return TryGetValueAs<DWORD>(valueName);
}


template <typename StringTraits>
inline RegExpected<ULONGLONG>
RegKeyT<StringTraits>::TryGetQwordValue(const StringType& valueName) const
{
    return TryGetValueAs<ULONGLONG>(valueName);
}


template <typename StringTraits>
inline RegExpected<typename RegKeyT<StringTraits>::StringType>
RegKeyT<StringTraits>::TryGetStringValue(const StringType& valueName) const
{
    using RegValueType = StringType;

    RegExpected<std::wstring> data = TryGetValueAs<std::wstring>(valueName);
    if (!data)
    {
        return details::MakeRegExpectedWithError<RegValueType>(data.GetError().Code());
    }

    return RegExpected<RegValueType>{ StringTraits::ConstructFromUtf16(data.GetValue()) };
}


template <typename StringTraits>
inline RegExpected<typename RegKeyT<StringTraits>::StringType>
RegKeyT<StringTraits>::TryGetExpandStringValue(
    const StringType& valueName,
    const ExpandStringOption expandOption
) const
{
    using RegValueType = StringType;

    RegExpected<std::wstring> data = TryGetExpandStringUtf16(valueName, expandOption);
    if (!data)
    {
        return details::MakeRegExpectedWithError<RegValueType>(data.GetError().Code());
    }

    return RegExpected<RegValueType>{ StringTraits::ConstructFromUtf16(data.GetValue()) };
}


template <typename StringTraits>
inline RegExpected<std::vector<typename RegKeyT<StringTraits>::StringType>>
RegKeyT<StringTraits>::TryGetMultiStringValue(const StringType& valueName) const
{
    using RegValueType = std::vector<StringType>;

    RegExpected<std::vector<std::wstring>> data =
        TryGetValueAs<std::vector<std::wstring>>(valueName);
    if (!data)
    {
        return details::MakeRegExpectedWithError<RegValueType>(data.GetError().Code());
    }

    return RegExpected<RegValueType>{
        details::StringVectorFromUtf16<StringTraits>(data.GetValue())
    };
}


template <typename StringTraits>
inline RegExpected<std::vector<BYTE>>
RegKeyT<StringTraits>::TryGetBinaryValue(const StringType& valueName) const
{
    return TryGetValueAs<std::vector<BYTE>>(valueName);
}


template <typename StringTraits>
inline typename RegKeyT<StringTraits>::InfoKey RegKeyT<StringTraits>::QueryInfoKey() const
{
    return TryQueryInfoKey().ValueOrThrow("RegQueryInfoKeyW failed.");
}


template <typename StringTraits>
inline RegExpected<typename RegKeyT<StringTraits>::InfoKey>
RegKeyT<StringTraits>::TryQueryInfoKey() const
{
    _ASSERTE(IsValid());

    InfoKey infoKey{};
    const LSTATUS retCode = ::RegQueryInfoKeyW(
        m_hKey,
        nullptr,    // no user-defined class
        nullptr,    // no user-defined class size
        nullptr,    // reserved
        &(infoKey.NumberOfSubKeys),
        nullptr,    // no subkey max length
        nullptr,    // no subkey class length
        &(infoKey.NumberOfValues),
        nullptr,    // no value name max length
        nullptr,    // no max value length
        nullptr,    // no security descriptor
        &(infoKey.LastWriteTime)
    );
    if (retCode != ERROR_SUCCESS)
    {
        return details::MakeRegExpectedWithError<InfoKey>(retCode);
    }

    return RegExpected<InfoKey>{ infoKey };
}


template <typename StringTraits>
inline DWORD RegKeyT<StringTraits>::QueryValueType(const StringType& valueName) const
{
    return TryQueryValueType(valueName).ValueOrThrow(
        "Cannot get the value type: RegQueryValueExW failed.");
}


template <typename StringTraits>
inline RegExpected<DWORD>
RegKeyT<StringTraits>::TryQueryValueType(const StringType& valueName) const
{
    _ASSERTE(IsValid());

    DWORD typeId = 0;     // will be returned by RegQueryValueEx

    const LSTATUS retCode = ::RegQueryValueExW(
        m_hKey,
        StringTraits::ToUtf16(valueName).c_str(),
        nullptr,    // reserved
        &typeId,
        nullptr,    // not interested
        nullptr     // not interested
    );
    if (retCode != ERROR_SUCCESS)
    {
        return details::MakeRegExpectedWithError<DWORD>(retCode);
    }

    return RegExpected<DWORD>{ typeId };
}


template <typename StringTraits>
inline bool RegKeyT<StringTraits>::ContainsValue(const StringType& valueName) const
{
    return TryContainsValue(valueName).ValueOrThrow(
        "RegQueryValueExW failed when checking if the current key contains the specified value.");
}


template <typename StringTraits>
inline RegExpected<bool> RegKeyT<StringTraits>::TryContainsValue(const StringType& valueName) const
{
    _ASSERTE(IsValid());

    // Just check if the value exists: neither type nor data are needed
    const LSTATUS retCode = ::RegQueryValueExW(
        m_hKey,
        StringTraits::ToUtf16(valueName).c_str(),
        nullptr,            // reserved
        nullptr,            // no type
        nullptr, nullptr    // no data
    );
    if (retCode == ERROR_SUCCESS)
    {
        return RegExpected<bool>{ true };
    }
    else if (retCode == ERROR_FILE_NOT_FOUND)
    {
        return RegExpected<bool>{ false };
    }
    else
    {
        return details::MakeRegExpectedWithError<bool>(retCode);
    }
}


template <typename StringTraits>
inline bool RegKeyT<StringTraits>::ContainsSubKey(const StringType& subKey) const
{
    return TryContainsSubKey(subKey).ValueOrThrow(
        "RegOpenKeyExW failed when checking if the current key contains the specified sub-key.");
}


template <typename StringTraits>
inline RegExpected<bool> RegKeyT<StringTraits>::TryContainsSubKey(const StringType& subKey) const
{
    _ASSERTE(IsValid());

    // Try and open the specified subKey: the return code of RegOpenKeyExW
    // tells if the subKey exists or not.
    HKEY hSubKey = nullptr;
    const LSTATUS retCode = ::RegOpenKeyExW(
        m_hKey,
        StringTraits::ToUtf16(subKey).c_str(),
        0,
        KEY_READ,
        &hSubKey
    );
    if (retCode == ERROR_SUCCESS)
    {
        // Don't forget to close the sub-key opened for this testing purpose!
        ::RegCloseKey(hSubKey);
        return RegExpected<bool>{ true };
    }
    else if ((retCode == ERROR_FILE_NOT_FOUND) || (retCode == ERROR_PATH_NOT_FOUND))
    {
        return RegExpected<bool>{ false };
    }
    else
    {
        return details::MakeRegExpectedWithError<bool>(retCode);
    }
}


template <typename StringTraits>
inline typename RegKeyT<StringTraits>::SubKeyRange RegKeyT<StringTraits>::EnumKeys() const noexcept
{
    return SubKeyRange{ m_hKey };
}


template <typename StringTraits>
inline typename RegKeyT<StringTraits>::ValueNameRange
RegKeyT<StringTraits>::EnumValueNames() const noexcept
{
    return ValueNameRange{ m_hKey };
}


template <typename StringTraits>
inline std::vector<typename RegKeyT<StringTraits>::StringType>
RegKeyT<StringTraits>::EnumSubKeys() const
{
    const SubKeyRange subKeys = EnumKeys();
    return std::vector<StringType>(subKeys.begin(), subKeys.end());
}


template <typename StringTraits>
inline std::vector<std::pair<typename RegKeyT<StringTraits>::StringType, DWORD>>
RegKeyT<StringTraits>::EnumValues() const
{
    return TryEnumValues().ValueOrThrow("Cannot enumerate values: RegEnumValueW failed.");
}


template <typename StringTraits>
inline RegExpected<std::vector<typename RegKeyT<StringTraits>::StringType>>
RegKeyT<StringTraits>::TryEnumSubKeys() const
{
    _ASSERTE(IsValid());

    using ReturnType = std::vector<StringType>;

    ReturnType subKeyNames;
    std::wstring name;

    for (DWORD index = 0; ; index++)
    {
        const LSTATUS retCode = details::EnumSubKeyAt(m_hKey, index, name);
        if (retCode == ERROR_NO_MORE_ITEMS)
        {
            break;
        }
        if (retCode != ERROR_SUCCESS)
        {
            return details::MakeRegExpectedWithError<ReturnType>(retCode);
        }

        subKeyNames.push_back(StringTraits::ConstructFromUtf16(name));
    }

    return RegExpected<ReturnType>{ std::move(subKeyNames) };
}


template <typename StringTraits>
inline RegExpected<std::vector<std::pair<typename RegKeyT<StringTraits>::StringType, DWORD>>>
RegKeyT<StringTraits>::TryEnumValues() const
{
    _ASSERTE(IsValid());

    using ReturnType = std::vector<std::pair<StringType, DWORD>>;

    ReturnType valueInfo;
    std::wstring name;

    for (DWORD index = 0; ; index++)
    {
        DWORD valueType = REG_NONE;
        const LSTATUS retCode = details::EnumValueAt(m_hKey, index, name, &valueType);
        if (retCode == ERROR_NO_MORE_ITEMS)
        {
            break;
        }
        if (retCode != ERROR_SUCCESS)
        {
            return details::MakeRegExpectedWithError<ReturnType>(retCode);
        }

        valueInfo.emplace_back(StringTraits::ConstructFromUtf16(name), valueType);
    }

    return RegExpected<ReturnType>{ std::move(valueInfo) };
}


template <typename StringTraits>
inline void RegKeyT<StringTraits>::DeleteValue(const StringType& valueName)
{
    const RegResult retCode = TryDeleteValue(valueName);
    if (retCode.Failed())
    {
        throw RegException{ retCode.Code(), "RegDeleteValueW failed." };
    }
}


template <typename StringTraits>
inline RegResult RegKeyT<StringTraits>::TryDeleteValue(const StringType& valueName)
{
    _ASSERTE(IsValid());

    RegResult retCode{ ::RegDeleteValueW(m_hKey, StringTraits::ToUtf16(valueName).c_str()) };

    spdlog::debug("RegBind: delete value \"{}\": {}",
                  details::ToLogString(valueName),
                  RegErrorKindToString(retCode.Kind()));

    return retCode;
}


template <typename StringTraits>
inline void RegKeyT<StringTraits>::DeleteKey(const StringType& subKey, const REGSAM desiredAccess)
{
    const RegResult retCode = TryDeleteKey(subKey, desiredAccess);
    if (retCode.Failed())
    {
        throw RegException{ retCode.Code(), "RegDeleteKeyExW failed." };
    }
}


template <typename StringTraits>
inline RegResult RegKeyT<StringTraits>::TryDeleteKey(const StringType& subKey,
                                                     const REGSAM desiredAccess)
{
    _ASSERTE(IsValid());

    RegResult retCode{ ::RegDeleteKeyExW(m_hKey,
                                         StringTraits::ToUtf16(subKey).c_str(),
                                         desiredAccess,
                                         0) }; // reserved

    spdlog::debug("RegBind: delete key \"{}\": {}",
                  details::ToLogString(subKey),
                  RegErrorKindToString(retCode.Kind()));

    return retCode;
}


template <typename StringTraits>
inline void RegKeyT<StringTraits>::DeleteTree(const StringType& subKey)
{
    const RegResult retCode = TryDeleteTree(subKey);
    if (retCode.Failed())
    {
        throw RegException{ retCode.Code(), "RegDeleteTreeW failed." };
    }
}


template <typename StringTraits>
inline RegResult RegKeyT<StringTraits>::TryDeleteTree(const StringType& subKey)
{
    _ASSERTE(IsValid());

    RegResult retCode{ ::RegDeleteTreeW(m_hKey, StringTraits::ToUtf16(subKey).c_str()) };

    spdlog::debug("RegBind: delete tree \"{}\": {}",
                  details::ToLogString(subKey),
                  RegErrorKindToString(retCode.Kind()));

    return retCode;
}


template <typename StringTraits>
inline void RegKeyT<StringTraits>::CopyTree(const StringType& sourceSubKey,
                                            const RegKeyT& destKey)
{
    const RegResult retCode = TryCopyTree(sourceSubKey, destKey);
    if (retCode.Failed())
    {
        throw RegException{ retCode.Code(), "RegCopyTreeW failed." };
    }
}


template <typename StringTraits>
inline RegResult RegKeyT<StringTraits>::TryCopyTree(const StringType& sourceSubKey,
                                                    const RegKeyT& destKey)
{
    _ASSERTE(IsValid());

    RegResult retCode{ ::RegCopyTreeW(m_hKey,
                                      StringTraits::ToUtf16(sourceSubKey).c_str(),
                                      destKey.Get()) };

    spdlog::debug("RegBind: copy tree \"{}\" to handle {}: {}",
                  details::ToLogString(sourceSubKey),
                  static_cast<const void*>(destKey.Get()),
                  RegErrorKindToString(retCode.Kind()));

    return retCode;
}


template <typename StringTraits>
inline void RegKeyT<StringTraits>::FlushKey()
{
    const RegResult retCode = TryFlushKey();
    if (retCode.Failed())
    {
        throw RegException{ retCode.Code(), "RegFlushKey failed." };
    }
}


template <typename StringTraits>
inline RegResult RegKeyT<StringTraits>::TryFlushKey()
{
    _ASSERTE(IsValid());

    RegResult retCode{ ::RegFlushKey(m_hKey) };

    spdlog::debug("RegBind: flush key handle {}: {}",
                  static_cast<const void*>(m_hKey),
                  RegErrorKindToString(retCode.Kind()));

    return retCode;
}


template <typename StringTraits>
inline typename RegKeyT<StringTraits>::StringType
RegKeyT<StringTraits>::RegTypeToString(const DWORD regType)
{
    // Type names are plain ASCII: widening each char is enough for UTF-16
    const std::string_view name = RegTypeName(regType);
    return StringType(name.begin(), name.end());
}


} // namespace regbind


#endif // REGBIND_REGBIND_HPP_INCLUDED
