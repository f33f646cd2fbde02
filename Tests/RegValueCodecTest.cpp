////////////////////////////////////////////////////////////////////////////////
// FILE: RegValueCodecTest.cpp
// DESC: Tests for the registry value codec (no registry access).
// AUTHOR: Giovanni Dicanio
////////////////////////////////////////////////////////////////////////////////

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "RegBind/RegValue.hpp"

using namespace regbind;


namespace
{

// Raw UTF-16LE bytes of the input wchar_ts
std::vector<BYTE> Utf16Bytes(const std::wstring& s)
{
    std::vector<BYTE> bytes;
    for (const wchar_t ch : s)
    {
        bytes.push_back(static_cast<BYTE>(ch & 0xFF));
        bytes.push_back(static_cast<BYTE>((ch >> 8) & 0xFF));
    }
    return bytes;
}

RegValue Reencode(const RegValue& value)
{
    return DecodeRegValue(EncodeRegValue(value));
}

} // namespace


TEST(RegValueCodecTest, DefaultValueIsEmptyNone)
{
    const RegValue value;
    EXPECT_EQ(value.Type(), static_cast<DWORD>(REG_NONE));
    ASSERT_TRUE(value.Holds<std::vector<BYTE>>());
    EXPECT_TRUE(value.As<std::vector<BYTE>>().empty());
}

TEST(RegValueCodecTest, StringIsWrittenWithTerminator)
{
    const RawRegValue raw = EncodeRegValue(RegValue::String(L"Hi"));
    EXPECT_EQ(raw.Type, static_cast<DWORD>(REG_SZ));
    EXPECT_EQ(raw.Data, (std::vector<BYTE>{ 'H', 0, 'i', 0, 0, 0 }));
}

TEST(RegValueCodecTest, StringDecodeStripsTrailingNuls)
{
    const RawRegValue raw{ REG_SZ, Utf16Bytes(std::wstring(L"abc\0\0\0", 6)) };
    EXPECT_EQ(DecodeRegValue(raw).As<std::wstring>(), L"abc");
}

TEST(RegValueCodecTest, StringDecodeIgnoresOddTrailingByte)
{
    std::vector<BYTE> bytes = Utf16Bytes(std::wstring(L"ab\0", 3));
    bytes.push_back(0x41);

    EXPECT_EQ(DecodeRegValue(RawRegValue{ REG_SZ, bytes }).As<std::wstring>(), L"ab");
}

TEST(RegValueCodecTest, StringWithoutTerminatorIsAccepted)
{
    const RawRegValue raw{ REG_SZ, Utf16Bytes(L"abc") };
    EXPECT_EQ(DecodeRegValue(raw).As<std::wstring>(), L"abc");
}

TEST(RegValueCodecTest, EmptyStringRoundTrips)
{
    const RegValue value = Reencode(RegValue::String(L""));
    EXPECT_EQ(value.Type(), static_cast<DWORD>(REG_SZ));
    EXPECT_TRUE(value.As<std::wstring>().empty());
}

TEST(RegValueCodecTest, ExpandStringKeepsItsType)
{
    const RegValue value = Reencode(RegValue::ExpandString(L"%TEMP%\\x"));
    EXPECT_EQ(value.Type(), static_cast<DWORD>(REG_EXPAND_SZ));
    EXPECT_EQ(value.As<std::wstring>(), L"%TEMP%\\x");
}

TEST(RegValueCodecTest, LinkDecodesAsString)
{
    // Link targets are stored without a terminating NUL
    const RawRegValue raw{ REG_LINK, Utf16Bytes(L"\\Registry\\A") };

    const RegValue value = DecodeRegValue(raw);
    EXPECT_EQ(value.Type(), static_cast<DWORD>(REG_LINK));
    EXPECT_EQ(value.As<std::wstring>(), L"\\Registry\\A");
    EXPECT_EQ(value, RegValue::Link(L"\\Registry\\A"));
}

TEST(RegValueCodecTest, LinkIsWrittenWithoutTerminator)
{
    const RawRegValue raw = EncodeRegValue(RegValue::Link(L"ab"));
    EXPECT_EQ(raw.Type, static_cast<DWORD>(REG_LINK));
    EXPECT_EQ(raw.Data, (std::vector<BYTE>{ 'a', 0, 'b', 0 }));
}

TEST(RegValueCodecTest, DwordIsLittleEndian)
{
    const RawRegValue raw = EncodeRegValue(RegValue::Dword(0x01020304));
    EXPECT_EQ(raw.Type, static_cast<DWORD>(REG_DWORD));
    EXPECT_EQ(raw.Data, (std::vector<BYTE>{ 0x04, 0x03, 0x02, 0x01 }));
}

TEST(RegValueCodecTest, DwordBigEndianIsBigEndian)
{
    const RawRegValue raw = EncodeRegValue(RegValue::DwordBigEndian(0x01020304));
    EXPECT_EQ(raw.Type, static_cast<DWORD>(REG_DWORD_BIG_ENDIAN));
    EXPECT_EQ(raw.Data, (std::vector<BYTE>{ 0x01, 0x02, 0x03, 0x04 }));

    const RegValue decoded = DecodeRegValue(raw);
    EXPECT_EQ(decoded.Type(), static_cast<DWORD>(REG_DWORD_BIG_ENDIAN));
    EXPECT_EQ(decoded.As<DWORD>(), 0x01020304u);
}

TEST(RegValueCodecTest, QwordIsLittleEndian)
{
    const RawRegValue raw = EncodeRegValue(RegValue::Qword(0x0102030405060708ULL));
    EXPECT_EQ(raw.Type, static_cast<DWORD>(REG_QWORD));
    EXPECT_EQ(raw.Data, (std::vector<BYTE>{ 0x08, 0x07, 0x06, 0x05, 0x04, 0x03, 0x02, 0x01 }));
    EXPECT_EQ(DecodeRegValue(raw).As<ULONGLONG>(), 0x0102030405060708ULL);
}

TEST(RegValueCodecTest, WrongDwordSizeIsInvalidData)
{
    const RawRegValue raw{ REG_DWORD, std::vector<BYTE>{ 1, 2, 3 } };

    const RegExpected<RegValue> value = TryDecodeRegValue(raw);
    ASSERT_FALSE(value);
    EXPECT_EQ(value.GetError().Code(), ERROR_INVALID_DATA);
    EXPECT_EQ(value.GetError().Kind(), RegErrorKind::InvalidData);

    try
    {
        (void)DecodeRegValue(raw);
        FAIL() << "Expected RegException";
    }
    catch (const RegException& e)
    {
        EXPECT_EQ(e.Kind(), RegErrorKind::InvalidData);
    }
}

TEST(RegValueCodecTest, WrongQwordSizeIsInvalidData)
{
    const RawRegValue raw{ REG_QWORD, std::vector<BYTE>{ 1, 2, 3, 4 } };

    const RegExpected<RegValue> value = TryDecodeRegValue(raw);
    ASSERT_FALSE(value);
    EXPECT_EQ(value.GetError().Kind(), RegErrorKind::InvalidData);
}

TEST(RegValueCodecTest, DwordWidensToQword)
{
    const RegValue value = RegValue::Dword(0xFFFFFFFF);
    EXPECT_EQ(value.As<ULONGLONG>(), 0xFFFFFFFFULL);
}

TEST(RegValueCodecTest, QwordDoesNotNarrowToDword)
{
    const RegValue value = RegValue::Qword(42);

    const RegExpected<DWORD> narrowed = value.TryAs<DWORD>();
    ASSERT_FALSE(narrowed);
    EXPECT_EQ(narrowed.GetError().Code(), ERROR_UNSUPPORTED_TYPE);
    EXPECT_EQ(narrowed.GetError().Kind(), RegErrorKind::TypeMismatch);

    EXPECT_THROW((void)value.As<DWORD>(), RegException);
}

TEST(RegValueCodecTest, StringIsNotAnInteger)
{
    const RegValue value = RegValue::String(L"42");

    const RegExpected<DWORD> number = value.TryAs<DWORD>();
    ASSERT_FALSE(number);
    EXPECT_EQ(number.GetError().Kind(), RegErrorKind::TypeMismatch);
}

TEST(RegValueCodecTest, MultiStringIsNotAString)
{
    const RegValue value = RegValue::MultiString({ L"a" });
    EXPECT_FALSE(value.TryAs<std::wstring>());
}

TEST(RegValueCodecTest, MultiStringLayout)
{
    const RawRegValue raw = EncodeRegValue(RegValue::MultiString({ L"a", L"bc" }));
    EXPECT_EQ(raw.Type, static_cast<DWORD>(REG_MULTI_SZ));
    EXPECT_EQ(raw.Data, Utf16Bytes(std::wstring(L"a\0bc\0\0", 6)));

    EXPECT_EQ(DecodeRegValue(raw).As<std::vector<std::wstring>>(),
              (std::vector<std::wstring>{ L"a", L"bc" }));
}

TEST(RegValueCodecTest, EmptyMultiStringIsDoubleNul)
{
    const RawRegValue raw = EncodeRegValue(RegValue::MultiString({}));
    EXPECT_EQ(raw.Data, (std::vector<BYTE>{ 0, 0, 0, 0 }));
    EXPECT_TRUE(DecodeRegValue(raw).As<std::vector<std::wstring>>().empty());
}

TEST(RegValueCodecTest, ZeroLengthMultiStringDecodesAsEmpty)
{
    const RegValue value = DecodeRegValue(RawRegValue{ REG_MULTI_SZ, {} });
    EXPECT_TRUE(value.As<std::vector<std::wstring>>().empty());
}

TEST(RegValueCodecTest, SingleEmptyStringIsIndistinguishableFromEmptyList)
{
    const RawRegValue single = EncodeRegValue(RegValue::MultiString({ L"" }));
    const RawRegValue empty = EncodeRegValue(RegValue::MultiString({}));

    EXPECT_EQ(single, empty);
    EXPECT_TRUE(DecodeRegValue(single).As<std::vector<std::wstring>>().empty());
}

TEST(RegValueCodecTest, EmbeddedEmptyStringsArePreserved)
{
    const std::vector<std::wstring> strings{ L"a", L"", L"b" };
    EXPECT_EQ(Reencode(RegValue::MultiString(strings)).As<std::vector<std::wstring>>(), strings);
}

TEST(RegValueCodecTest, MultiStringWithoutFinalTerminatorIsAccepted)
{
    const RawRegValue raw{ REG_MULTI_SZ, Utf16Bytes(std::wstring(L"a\0b", 3)) };
    EXPECT_EQ(DecodeRegValue(raw).As<std::vector<std::wstring>>(),
              (std::vector<std::wstring>{ L"a", L"b" }));
}

TEST(RegValueCodecTest, BinaryRoundTrips)
{
    const std::vector<BYTE> bytes{ 0x00, 0xFF, 0x10, 0x00 };
    const RegValue value = Reencode(RegValue::Binary(bytes));
    EXPECT_EQ(value.Type(), static_cast<DWORD>(REG_BINARY));
    EXPECT_EQ(value.As<std::vector<BYTE>>(), bytes);
}

TEST(RegValueCodecTest, EmptyBinaryRoundTrips)
{
    const RegValue value = Reencode(RegValue::Binary({}));
    EXPECT_EQ(value, RegValue::Binary({}));
}

TEST(RegValueCodecTest, UnknownTypeKeepsRawBytes)
{
    constexpr DWORD kCustomType = 0x1234;
    const RawRegValue raw{ kCustomType, std::vector<BYTE>{ 1, 2, 3 } };

    const RegValue value = DecodeRegValue(raw);
    EXPECT_EQ(value.Type(), kCustomType);
    EXPECT_EQ(value.As<std::vector<BYTE>>(), raw.Data);
    EXPECT_EQ(EncodeRegValue(value), raw);
}

TEST(RegValueCodecTest, TypeNames)
{
    EXPECT_EQ(RegTypeName(REG_SZ), "REG_SZ");
    EXPECT_EQ(RegTypeName(REG_DWORD_BIG_ENDIAN), "REG_DWORD_BIG_ENDIAN");
    EXPECT_EQ(RegTypeName(REG_QWORD), "REG_QWORD");
    EXPECT_EQ(RegTypeName(0x1234), "Unknown/unsupported registry type");
}
