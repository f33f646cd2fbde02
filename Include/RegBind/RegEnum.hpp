////////////////////////////////////////////////////////////////////////////////
// FILE: RegEnum.hpp
// DESC: Lazy enumeration of the subkey names and value names of a key.
// AUTHOR: Giovanni Dicanio
////////////////////////////////////////////////////////////////////////////////

#ifndef REGBIND_REGENUM_HPP_INCLUDED
#define REGBIND_REGENUM_HPP_INCLUDED


#include <Windows.h>        // Windows Platform SDK
#include <crtdbg.h>         // _ASSERTE

#include <cstddef>          // std::ptrdiff_t
#include <iterator>         // std::input_iterator_tag
#include <string>           // std::wstring
#include <utility>          // std::move

#include "RegBind/RegException.hpp"


namespace regbind
{

namespace details
{

//
// Registry element size limits, in wchar_ts, not including the terminating NUL.
// https://learn.microsoft.com/en-us/windows/win32/sysinfo/registry-element-size-limits
//
constexpr DWORD kMaxKeyNameLength   = 255;
constexpr DWORD kMaxValueNameLength = 16383;


//------------------------------------------------------------------------------
// Read the name of the subkey at the given index.
// Returns ERROR_NO_MORE_ITEMS past the last subkey.
//------------------------------------------------------------------------------
[[nodiscard]] inline LSTATUS EnumSubKeyAt(const HKEY hKey, const DWORD index, std::wstring& name)
{
    wchar_t nameBuffer[kMaxKeyNameLength + 1];
    DWORD nameLength = kMaxKeyNameLength + 1;

    const LSTATUS retCode = ::RegEnumKeyExW(
        hKey,
        index,
        nameBuffer,
        &nameLength,
        nullptr,    // reserved
        nullptr,    // no class
        nullptr,    // no class length
        nullptr     // no last write time
    );
    if (retCode == ERROR_SUCCESS)
    {
        // On success nameLength doesn't include the terminating NUL
        name.assign(nameBuffer, nameLength);
    }

    return retCode;
}


//------------------------------------------------------------------------------
// Read the name (and optionally the type) of the value at the given index.
// Returns ERROR_NO_MORE_ITEMS past the last value.
//
// Value names can be up to 16K wchar_ts: the name string is also the
// receiving buffer, so a caller enumerating several indices reuses its
// capacity instead of allocating it again for each value.
//------------------------------------------------------------------------------
[[nodiscard]] inline LSTATUS EnumValueAt(const HKEY hKey,
                                         const DWORD index,
                                         std::wstring& name,
                                         DWORD* const valueType = nullptr)
{
    name.resize(kMaxValueNameLength + 1);
    DWORD nameLength = kMaxValueNameLength + 1;

    const LSTATUS retCode = ::RegEnumValueW(
        hKey,
        index,
        name.data(),
        &nameLength,
        nullptr,    // reserved
        valueType,
        nullptr,    // no data
        nullptr     // no data size
    );

    // On success nameLength doesn't include the terminating NUL
    name.resize(retCode == ERROR_SUCCESS ? nameLength : 0);

    return retCode;
}


struct SubKeyEnumPolicy
{
    static LSTATUS NameAt(const HKEY hKey, const DWORD index, std::wstring& name)
    {
        return EnumSubKeyAt(hKey, index, name);
    }

    static constexpr const char* kErrorMessage = "Cannot enumerate subkeys: RegEnumKeyExW failed.";
};


struct ValueEnumPolicy
{
    static LSTATUS NameAt(const HKEY hKey, const DWORD index, std::wstring& name)
    {
        return EnumValueAt(hKey, index, name);
    }

    static constexpr const char* kErrorMessage = "Cannot enumerate values: RegEnumValueW failed.";
};

} // namespace details


//------------------------------------------------------------------------------
// Input iterator over the names of the subkeys or values of a key.
//
// Each increment asks the OS for the element at the next index; reaching
// ERROR_NO_MORE_ITEMS turns the iterator into the end iterator. Any other
// failure throws RegException, including a null (closed) key handle, which
// is reported as ERROR_INVALID_HANDLE.
//
// The iterator doesn't own the key handle, which must outlive it.
// Modifying the key while enumerating gives unspecified results
// (elements may be skipped or repeated), as with the native API.
//------------------------------------------------------------------------------
template <typename StringTraits, typename EnumPolicy>
class RegEnumIterator
{
public:

    using iterator_category = std::input_iterator_tag;
    using value_type        = typename StringTraits::StringType;
    using difference_type   = std::ptrdiff_t;
    using pointer           = const value_type*;
    using reference         = const value_type&;

    // The end iterator
    RegEnumIterator() = default;

    // Positioned on the element at the given index
    RegEnumIterator(HKEY hKey, DWORD index);

    [[nodiscard]] reference operator*() const noexcept
    {
        return m_name;
    }

    [[nodiscard]] pointer operator->() const noexcept
    {
        return &m_name;
    }

    RegEnumIterator& operator++();
    RegEnumIterator operator++(int);

    // Index of the current element
    [[nodiscard]] DWORD Index() const noexcept
    {
        return m_index;
    }

    friend bool operator==(const RegEnumIterator& a, const RegEnumIterator& b) noexcept
    {
        if (a.m_atEnd || b.m_atEnd)
        {
            return a.m_atEnd == b.m_atEnd;
        }
        return (a.m_hKey == b.m_hKey) && (a.m_index == b.m_index);
    }

    friend bool operator!=(const RegEnumIterator& a, const RegEnumIterator& b) noexcept
    {
        return !(a == b);
    }

private:
    void Fetch();

    HKEY            m_hKey{ nullptr };
    DWORD           m_index{ 0 };
    bool            m_atEnd{ true };
    value_type      m_name;

    // Receives the UTF-16 name from the OS; reused across increments
    std::wstring    m_buffer;
};


//------------------------------------------------------------------------------
// A lazy range of subkey names or value names.
//
// Each call to begin() starts a fresh enumeration from index 0,
// so the range can be traversed again.
//------------------------------------------------------------------------------
template <typename StringTraits, typename EnumPolicy>
class RegEnumRange
{
public:
    using iterator = RegEnumIterator<StringTraits, EnumPolicy>;

    explicit RegEnumRange(HKEY hKey) noexcept
        : m_hKey{ hKey }
    {}

    [[nodiscard]] iterator begin() const
    {
        return iterator{ m_hKey, 0 };
    }

    [[nodiscard]] iterator end() const noexcept
    {
        return iterator{};
    }

private:
    HKEY m_hKey;
};



//------------------------------------------------------------------------------
//                      RegEnumIterator Inline Methods
//------------------------------------------------------------------------------

template <typename StringTraits, typename EnumPolicy>
inline RegEnumIterator<StringTraits, EnumPolicy>::RegEnumIterator(const HKEY hKey,
                                                                  const DWORD index)
    : m_hKey{ hKey }
    , m_index{ index }
    , m_atEnd{ false }
{
    Fetch();
}


template <typename StringTraits, typename EnumPolicy>
inline RegEnumIterator<StringTraits, EnumPolicy>&
RegEnumIterator<StringTraits, EnumPolicy>::operator++()
{
    _ASSERTE(!m_atEnd);
    m_index++;
    Fetch();
    return *this;
}


template <typename StringTraits, typename EnumPolicy>
inline RegEnumIterator<StringTraits, EnumPolicy>
RegEnumIterator<StringTraits, EnumPolicy>::operator++(int)
{
    RegEnumIterator previous{ *this };
    ++(*this);
    return previous;
}


template <typename StringTraits, typename EnumPolicy>
inline void RegEnumIterator<StringTraits, EnumPolicy>::Fetch()
{
    if (m_hKey == nullptr)
    {
        throw RegException{ ERROR_INVALID_HANDLE, EnumPolicy::kErrorMessage };
    }

    const LSTATUS retCode = EnumPolicy::NameAt(m_hKey, m_index, m_buffer);
    if (retCode == ERROR_NO_MORE_ITEMS)
    {
        // Past the last element: become the end iterator
        m_atEnd = true;
        m_hKey = nullptr;
        m_index = 0;
        m_name = value_type{};
        return;
    }

    if (retCode != ERROR_SUCCESS)
    {
        throw RegException{ retCode, EnumPolicy::kErrorMessage };
    }

    m_name = StringTraits::ConstructFromUtf16(m_buffer);
}


} // namespace regbind

#endif // REGBIND_REGENUM_HPP_INCLUDED
