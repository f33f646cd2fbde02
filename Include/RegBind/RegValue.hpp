////////////////////////////////////////////////////////////////////////////////
// FILE: RegValue.hpp
// DESC: Tagged registry values and their encoding to/from the raw bytes
//       stored in the Windows Registry.
// AUTHOR: Giovanni Dicanio
////////////////////////////////////////////////////////////////////////////////

#ifndef REGBIND_REGVALUE_HPP_INCLUDED
#define REGBIND_REGVALUE_HPP_INCLUDED


#include <Windows.h>        // Windows Platform SDK

#include <string>           // std::wstring
#include <string_view>      // std::string_view
#include <type_traits>      // std::is_same_v
#include <utility>          // std::move
#include <variant>          // std::variant
#include <vector>           // std::vector

#include "RegBind/Details.hpp"
#include "RegBind/RegException.hpp"
#include "RegBind/RegExpected.hpp"
#include "RegBind/RegResult.hpp"


namespace regbind
{

//------------------------------------------------------------------------------
// A registry value exactly as stored: the type code and the undecoded bytes.
//------------------------------------------------------------------------------
struct RawRegValue
{
    DWORD               Type{ REG_NONE };
    std::vector<BYTE>   Data;

    RawRegValue() = default;

    RawRegValue(DWORD type, std::vector<BYTE> data)
        : Type{ type }
        , Data{ std::move(data) }
    {}
};

inline bool operator==(const RawRegValue& a, const RawRegValue& b)
{
    return (a.Type == b.Type) && (a.Data == b.Data);
}

inline bool operator!=(const RawRegValue& a, const RawRegValue& b)
{
    return !(a == b);
}


class RegValue;

[[nodiscard]] RawRegValue EncodeRegValue(const RegValue& value);
[[nodiscard]] RegExpected<RegValue> TryDecodeRegValue(const RawRegValue& raw);
[[nodiscard]] RegValue DecodeRegValue(const RawRegValue& raw);


//------------------------------------------------------------------------------
// A decoded registry value: a tagged union over the native representations
// of the registry data types.
//
//      REG_SZ, REG_EXPAND_SZ, REG_LINK     std::wstring
//      REG_DWORD, REG_DWORD_BIG_ENDIAN     DWORD
//      REG_QWORD                           ULONGLONG
//      REG_MULTI_SZ                        std::vector<std::wstring>
//      any other type code                 std::vector<BYTE>
//
// The tag is the on-disk type code and always agrees with the payload.
// Instances are built by the named factories or by DecodeRegValue.
//------------------------------------------------------------------------------
class RegValue
{
public:

    using Payload = std::variant<
        std::vector<BYTE>,
        DWORD,
        ULONGLONG,
        std::wstring,
        std::vector<std::wstring>
    >;

    // REG_NONE with no data
    RegValue() = default;

    [[nodiscard]] static RegValue String(std::wstring data);
    [[nodiscard]] static RegValue ExpandString(std::wstring data);
    [[nodiscard]] static RegValue Link(std::wstring target);
    [[nodiscard]] static RegValue Dword(DWORD data);
    [[nodiscard]] static RegValue DwordBigEndian(DWORD data);
    [[nodiscard]] static RegValue Qword(ULONGLONG data);
    [[nodiscard]] static RegValue MultiString(std::vector<std::wstring> data);
    [[nodiscard]] static RegValue Binary(std::vector<BYTE> data);

    // The registry type code (REG_SZ, REG_DWORD, ...)
    [[nodiscard]] DWORD Type() const noexcept;

    // The decoded data
    [[nodiscard]] const Payload& Data() const noexcept;

    // Does the payload hold a T alternative?
    template <typename T>
    [[nodiscard]] bool Holds() const noexcept;

    //
    // Conversion to a native type.
    //
    // The requested type must match the stored one; the only widening allowed
    // is DWORD -> ULONGLONG. Anything else (including narrowing a QWORD to a
    // DWORD) is a TypeMismatch, reported with ERROR_UNSUPPORTED_TYPE.
    //
    // Supported T: DWORD, ULONGLONG, std::wstring, std::vector<std::wstring>,
    // std::vector<BYTE>.
    //

    template <typename T>
    [[nodiscard]] T As() const;

    template <typename T>
    [[nodiscard]] RegExpected<T> TryAs() const;

    friend bool operator==(const RegValue& a, const RegValue& b)
    {
        return (a.m_type == b.m_type) && (a.m_payload == b.m_payload);
    }

    friend bool operator!=(const RegValue& a, const RegValue& b)
    {
        return !(a == b);
    }

private:
    RegValue(DWORD type, Payload payload);

    friend RegExpected<RegValue> TryDecodeRegValue(const RawRegValue& raw);

    DWORD   m_type{ REG_NONE };
    Payload m_payload;
};


//------------------------------------------------------------------------------
// Name of a registry type code (e.g. "REG_SZ")
//------------------------------------------------------------------------------
[[nodiscard]] constexpr std::string_view RegTypeName(const DWORD regType) noexcept
{
    switch (regType)
    {
        case REG_NONE:                          return "REG_NONE";
        case REG_SZ:                            return "REG_SZ";
        case REG_EXPAND_SZ:                     return "REG_EXPAND_SZ";
        case REG_BINARY:                        return "REG_BINARY";
        case REG_DWORD:                         return "REG_DWORD";
        case REG_DWORD_BIG_ENDIAN:              return "REG_DWORD_BIG_ENDIAN";
        case REG_LINK:                          return "REG_LINK";
        case REG_MULTI_SZ:                      return "REG_MULTI_SZ";
        case REG_RESOURCE_LIST:                 return "REG_RESOURCE_LIST";
        case REG_FULL_RESOURCE_DESCRIPTOR:      return "REG_FULL_RESOURCE_DESCRIPTOR";
        case REG_RESOURCE_REQUIREMENTS_LIST:    return "REG_RESOURCE_REQUIREMENTS_LIST";
        case REG_QWORD:                         return "REG_QWORD";

        default:                                return "Unknown/unsupported registry type";
    }
}



//------------------------------------------------------------------------------
//                          RegValue Inline Methods
//------------------------------------------------------------------------------

inline RegValue::RegValue(const DWORD type, Payload payload)
    : m_type{ type }
    , m_payload{ std::move(payload) }
{}


inline RegValue RegValue::String(std::wstring data)
{
    return RegValue{ REG_SZ, Payload{ std::move(data) } };
}


inline RegValue RegValue::ExpandString(std::wstring data)
{
    return RegValue{ REG_EXPAND_SZ, Payload{ std::move(data) } };
}


inline RegValue RegValue::Link(std::wstring target)
{
    return RegValue{ REG_LINK, Payload{ std::move(target) } };
}


inline RegValue RegValue::Dword(const DWORD data)
{
    return RegValue{ REG_DWORD, Payload{ data } };
}


inline RegValue RegValue::DwordBigEndian(const DWORD data)
{
    return RegValue{ REG_DWORD_BIG_ENDIAN, Payload{ data } };
}


inline RegValue RegValue::Qword(const ULONGLONG data)
{
    return RegValue{ REG_QWORD, Payload{ data } };
}


inline RegValue RegValue::MultiString(std::vector<std::wstring> data)
{
    return RegValue{ REG_MULTI_SZ, Payload{ std::move(data) } };
}


inline RegValue RegValue::Binary(std::vector<BYTE> data)
{
    return RegValue{ REG_BINARY, Payload{ std::move(data) } };
}


inline DWORD RegValue::Type() const noexcept
{
    return m_type;
}


inline const RegValue::Payload& RegValue::Data() const noexcept
{
    return m_payload;
}


template <typename T>
inline bool RegValue::Holds() const noexcept
{
    return std::holds_alternative<T>(m_payload);
}


template <typename T>
inline RegExpected<T> RegValue::TryAs() const
{
    static_assert(std::is_same_v<T, DWORD>
               || std::is_same_v<T, ULONGLONG>
               || std::is_same_v<T, std::wstring>
               || std::is_same_v<T, std::vector<std::wstring>>
               || std::is_same_v<T, std::vector<BYTE>>,
                  "Unsupported registry value conversion target.");

    if (const T* data = std::get_if<T>(&m_payload))
    {
        return RegExpected<T>{ *data };
    }

    if constexpr (std::is_same_v<T, ULONGLONG>)
    {
        // Lossless widening
        if (const DWORD* data = std::get_if<DWORD>(&m_payload))
        {
            return RegExpected<T>{ static_cast<ULONGLONG>(*data) };
        }
    }

    return details::MakeRegExpectedWithError<T>(ERROR_UNSUPPORTED_TYPE);
}


template <typename T>
inline T RegValue::As() const
{
    return TryAs<T>().ValueOrThrow("Registry value type doesn't match the requested type.");
}


//------------------------------------------------------------------------------
//                              Value Codec
//------------------------------------------------------------------------------

//------------------------------------------------------------------------------
// Encode a value into the bytes stored in the registry under its type code
//------------------------------------------------------------------------------
inline RawRegValue EncodeRegValue(const RegValue& value)
{
    const DWORD type = value.Type();
    const RegValue::Payload& payload = value.Data();

    if (const auto* data = std::get_if<std::wstring>(&payload))
    {
        // Symbolic link targets are stored without a terminating NUL
        const size_t length = (type == REG_LINK) ? data->length() : data->length() + 1;
        return RawRegValue{ type, details::WideCharsToBytes(data->c_str(), length) };
    }

    if (const auto* data = std::get_if<DWORD>(&payload))
    {
        const auto order = (type == REG_DWORD_BIG_ENDIAN) ? details::ByteOrder::BigEndian
                                                          : details::ByteOrder::LittleEndian;
        return RawRegValue{ type, details::UIntToBytes(*data, order) };
    }

    if (const auto* data = std::get_if<ULONGLONG>(&payload))
    {
        return RawRegValue{ type, details::UIntToBytes(*data, details::ByteOrder::LittleEndian) };
    }

    if (const auto* data = std::get_if<std::vector<std::wstring>>(&payload))
    {
        const std::vector<wchar_t> multiString = details::BuildMultiString(*data);
        return RawRegValue{ type, details::WideCharsToBytes(multiString.data(), multiString.size()) };
    }

    return RawRegValue{ type, std::get<std::vector<BYTE>>(payload) };
}


//------------------------------------------------------------------------------
// Decode the raw bytes of a registry value according to its type code.
// A REG_DWORD / REG_QWORD whose size isn't 4 / 8 bytes is InvalidData
// (ERROR_INVALID_DATA).
//------------------------------------------------------------------------------
inline RegExpected<RegValue> TryDecodeRegValue(const RawRegValue& raw)
{
    switch (raw.Type)
    {
        case REG_SZ:
        case REG_EXPAND_SZ:
        case REG_LINK:
        {
            std::wstring data = details::StringFromWideChars(details::WideCharsFromBytes(raw.Data));
            return RegExpected<RegValue>{ RegValue{ raw.Type, RegValue::Payload{ std::move(data) } } };
        }

        case REG_DWORD:
        case REG_DWORD_BIG_ENDIAN:
        {
            if (raw.Data.size() != sizeof(DWORD))
            {
                return details::MakeRegExpectedWithError<RegValue>(ERROR_INVALID_DATA);
            }

            const auto order = (raw.Type == REG_DWORD_BIG_ENDIAN) ? details::ByteOrder::BigEndian
                                                                  : details::ByteOrder::LittleEndian;
            const DWORD data = details::UIntFromBytes<DWORD>(raw.Data, order);
            return RegExpected<RegValue>{ RegValue{ raw.Type, RegValue::Payload{ data } } };
        }

        case REG_QWORD:
        {
            if (raw.Data.size() != sizeof(ULONGLONG))
            {
                return details::MakeRegExpectedWithError<RegValue>(ERROR_INVALID_DATA);
            }

            const ULONGLONG data = details::UIntFromBytes<ULONGLONG>(raw.Data,
                                                                     details::ByteOrder::LittleEndian);
            return RegExpected<RegValue>{ RegValue{ raw.Type, RegValue::Payload{ data } } };
        }

        case REG_MULTI_SZ:
        {
            std::vector<std::wstring> data = details::ParseMultiString(
                details::WideCharsFromBytes(raw.Data));
            return RegExpected<RegValue>{ RegValue{ raw.Type, RegValue::Payload{ std::move(data) } } };
        }

        default:
            // REG_BINARY, REG_NONE, resource lists, custom types:
            // keep the bytes untouched
            return RegExpected<RegValue>{ RegValue{ raw.Type, RegValue::Payload{ raw.Data } } };
    }
}


inline RegValue DecodeRegValue(const RawRegValue& raw)
{
    return TryDecodeRegValue(raw).ValueOrThrow("Cannot decode registry value: malformed data.");
}


} // namespace regbind

#endif // REGBIND_REGVALUE_HPP_INCLUDED
