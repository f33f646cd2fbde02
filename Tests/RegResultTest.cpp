////////////////////////////////////////////////////////////////////////////////
// FILE: RegResultTest.cpp
// DESC: Tests for the error types: RegResult, RegException, RegExpected.
// AUTHOR: Giovanni Dicanio
////////////////////////////////////////////////////////////////////////////////

#include <gtest/gtest.h>

#include <string>
#include <system_error>

#include "RegBind/RegException.hpp"
#include "RegBind/RegExpected.hpp"
#include "RegBind/RegResult.hpp"

using namespace regbind;


static_assert(ClassifyRegError(ERROR_SUCCESS) == RegErrorKind::None);
static_assert(ClassifyRegError(ERROR_FILE_NOT_FOUND) == RegErrorKind::NotFound);
static_assert(ClassifyRegError(ERROR_PATH_NOT_FOUND) == RegErrorKind::NotFound);
static_assert(ClassifyRegError(ERROR_ACCESS_DENIED) == RegErrorKind::AccessDenied);
static_assert(ClassifyRegError(ERROR_UNSUPPORTED_TYPE) == RegErrorKind::TypeMismatch);
static_assert(ClassifyRegError(ERROR_DATATYPE_MISMATCH) == RegErrorKind::TypeMismatch);
static_assert(ClassifyRegError(ERROR_BAD_FILE_TYPE) == RegErrorKind::TypeMismatch);
static_assert(ClassifyRegError(ERROR_INVALID_DATA) == RegErrorKind::InvalidData);
static_assert(ClassifyRegError(ERROR_INVALID_HANDLE) == RegErrorKind::Os);
static_assert(ClassifyRegError(ERROR_MORE_DATA) == RegErrorKind::Os);


TEST(RegResultTest, DefaultIsSuccess)
{
    const RegResult result;
    EXPECT_TRUE(result.IsOk());
    EXPECT_FALSE(result.Failed());
    EXPECT_TRUE(result);
    EXPECT_EQ(result.Code(), ERROR_SUCCESS);
    EXPECT_EQ(result.Kind(), RegErrorKind::None);
}

TEST(RegResultTest, FailureKeepsNativeCode)
{
    const RegResult result{ ERROR_ACCESS_DENIED };
    EXPECT_FALSE(result.IsOk());
    EXPECT_TRUE(result.Failed());
    EXPECT_FALSE(result);
    EXPECT_EQ(result.Code(), ERROR_ACCESS_DENIED);
    EXPECT_EQ(result.Kind(), RegErrorKind::AccessDenied);
}

TEST(RegResultTest, ErrorMessageIsTrimmed)
{
    const std::wstring message = RegResult{ ERROR_FILE_NOT_FOUND }.ErrorMessage();
    ASSERT_FALSE(message.empty());
    EXPECT_NE(message.back(), L'\n');
    EXPECT_NE(message.back(), L'\r');
}

TEST(RegResultTest, KindNames)
{
    EXPECT_STREQ(RegErrorKindToString(RegErrorKind::NotFound), "NotFound");
    EXPECT_STREQ(RegErrorKindToString(RegErrorKind::TypeMismatch), "TypeMismatch");
    EXPECT_STREQ(RegErrorKindToString(RegErrorKind::Os), "Os");
}

TEST(RegExceptionTest, IsSystemError)
{
    try
    {
        throw RegException{ ERROR_FILE_NOT_FOUND, "RegOpenKeyExW failed." };
    }
    catch (const std::system_error& e)
    {
        EXPECT_EQ(e.code().value(), ERROR_FILE_NOT_FOUND);
        EXPECT_EQ(e.code().category(), std::system_category());
        EXPECT_NE(std::string{ e.what() }.find("RegOpenKeyExW failed."), std::string::npos);
    }
}

TEST(RegExceptionTest, ExposesKindAndResult)
{
    const RegException e{ ERROR_INVALID_DATA, std::string{ "bad data" } };
    EXPECT_EQ(e.Kind(), RegErrorKind::InvalidData);
    EXPECT_EQ(e.Result().Code(), ERROR_INVALID_DATA);
}

TEST(RegExpectedTest, HoldsValue)
{
    RegExpected<std::wstring> expected{ std::wstring{ L"value" } };
    ASSERT_TRUE(expected);
    EXPECT_TRUE(expected.IsValid());
    EXPECT_EQ(expected.GetValue(), L"value");
    EXPECT_EQ(expected.TakeValue(), L"value");
}

TEST(RegExpectedTest, HoldsError)
{
    const RegExpected<DWORD> expected{ RegResult{ ERROR_FILE_NOT_FOUND } };
    ASSERT_FALSE(expected);
    EXPECT_EQ(expected.GetError().Code(), ERROR_FILE_NOT_FOUND);
    EXPECT_EQ(expected.GetError().Kind(), RegErrorKind::NotFound);
}

TEST(RegExpectedTest, ValueOrThrow)
{
    EXPECT_EQ(RegExpected<DWORD>{ DWORD{ 7 } }.ValueOrThrow("unused"), 7u);

    try
    {
        (void)RegExpected<DWORD>{ RegResult{ ERROR_ACCESS_DENIED } }.ValueOrThrow("denied");
        FAIL() << "Expected RegException";
    }
    catch (const RegException& e)
    {
        EXPECT_EQ(e.code().value(), ERROR_ACCESS_DENIED);
        EXPECT_EQ(e.Kind(), RegErrorKind::AccessDenied);
    }
}
