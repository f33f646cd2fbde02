////////////////////////////////////////////////////////////////////////////////
// FILE: RegEnumTest.cpp
// DESC: Tests for the lazy subkey and value name enumeration.
// AUTHOR: Giovanni Dicanio
////////////////////////////////////////////////////////////////////////////////

#include <gtest/gtest.h>

#include <algorithm>
#include <iterator>
#include <string>
#include <utility>
#include <vector>

#include "RegBind/RegBind.hpp"

using namespace regbind;


class RegEnumTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        m_key.Create(HKEY_CURRENT_USER, kTestKeyPath);
    }

    void TearDown() override
    {
        m_key.Close();

        RegKey root = RegKey::Predefined(HKEY_CURRENT_USER);
        const RegResult result = root.TryDeleteTree(kTestKeyPath);
        EXPECT_TRUE(result || result.Kind() == RegErrorKind::NotFound)
            << "Cannot remove the test key, error " << result.Code();
    }

    template <typename Range>
    static std::vector<std::wstring> Sorted(const Range& range)
    {
        std::vector<std::wstring> names(range.begin(), range.end());
        std::sort(names.begin(), names.end());
        return names;
    }

    const std::wstring kTestKeyPath = L"Software\\RegBindTests\\RegEnumTest";
    RegKey m_key;
};


TEST_F(RegEnumTest, EmptyKeyHasNoElements)
{
    EXPECT_TRUE(m_key.EnumKeys().begin() == m_key.EnumKeys().end());
    EXPECT_TRUE(m_key.EnumValueNames().begin() == m_key.EnumValueNames().end());
    EXPECT_TRUE(m_key.EnumSubKeys().empty());
    EXPECT_TRUE(m_key.EnumValues().empty());
}

TEST_F(RegEnumTest, CountsFollowCreateAndDelete)
{
    for (const wchar_t* name : { L"A", L"B", L"C" })
    {
        RegKey child = m_key.CreateSubKey(name);
        m_key.SetDwordValue(name, 1);
    }

    auto subKeys = m_key.EnumKeys();
    auto valueNames = m_key.EnumValueNames();
    EXPECT_EQ(std::distance(subKeys.begin(), subKeys.end()), 3);
    EXPECT_EQ(std::distance(valueNames.begin(), valueNames.end()), 3);

    m_key.DeleteKey(L"B");
    m_key.DeleteValue(L"C");

    EXPECT_EQ(Sorted(m_key.EnumKeys()), (std::vector<std::wstring>{ L"A", L"C" }));
    EXPECT_EQ(Sorted(m_key.EnumValueNames()), (std::vector<std::wstring>{ L"A", L"B" }));
}

TEST_F(RegEnumTest, RangeCanBeTraversedAgain)
{
    RegKey first = m_key.CreateSubKey(L"First");
    RegKey second = m_key.CreateSubKey(L"Second");

    const RegKey::SubKeyRange subKeys = m_key.EnumKeys();

    std::vector<std::wstring> pass1;
    for (const auto& name : subKeys)
    {
        pass1.push_back(name);
    }

    std::vector<std::wstring> pass2(subKeys.begin(), subKeys.end());

    EXPECT_EQ(pass1.size(), 2u);
    EXPECT_EQ(pass1, pass2);
}

TEST_F(RegEnumTest, IteratorIndexAdvances)
{
    RegKey child = m_key.CreateSubKey(L"Only");

    auto it = m_key.EnumKeys().begin();
    ASSERT_TRUE(it != RegKey::SubKeyRange::iterator{});
    EXPECT_EQ(it->length(), 4u);
    EXPECT_EQ(*it, L"Only");
    EXPECT_EQ(it.Index(), 0u);

    const auto previous = it++;
    EXPECT_EQ(*previous, L"Only");
    EXPECT_TRUE(it == RegKey::SubKeyRange::iterator{});
}

TEST_F(RegEnumTest, EnumValuesReportsTypes)
{
    m_key.SetDwordValue(L"Dword", 1);
    m_key.SetStringValue(L"String", L"text");
    m_key.SetBinaryValue(L"Binary", std::vector<BYTE>{ 1 });

    std::vector<std::pair<std::wstring, DWORD>> values = m_key.EnumValues();
    std::sort(values.begin(), values.end());

    const std::vector<std::pair<std::wstring, DWORD>> expected{
        { L"Binary", REG_BINARY },
        { L"Dword", REG_DWORD },
        { L"String", REG_SZ },
    };
    EXPECT_EQ(values, expected);

    const auto tried = m_key.TryEnumValues();
    ASSERT_TRUE(tried);
    EXPECT_EQ(tried.GetValue().size(), 3u);
}

TEST_F(RegEnumTest, EnumSubKeysMatchesTryForm)
{
    RegKey a = m_key.CreateSubKey(L"Alpha");
    RegKey b = m_key.CreateSubKey(L"Beta");

    std::vector<std::wstring> subKeys = m_key.EnumSubKeys();
    std::sort(subKeys.begin(), subKeys.end());
    EXPECT_EQ(subKeys, (std::vector<std::wstring>{ L"Alpha", L"Beta" }));

    RegExpected<std::vector<std::wstring>> tried = m_key.TryEnumSubKeys();
    ASSERT_TRUE(tried);
    std::vector<std::wstring> triedNames = tried.TakeValue();
    std::sort(triedNames.begin(), triedNames.end());
    EXPECT_EQ(triedNames, subKeys);
}

TEST_F(RegEnumTest, LongValueNamesAreEnumerated)
{
    const std::wstring longName(1000, L'v');
    m_key.SetDwordValue(longName, 1);

    EXPECT_EQ(Sorted(m_key.EnumValueNames()), std::vector<std::wstring>{ longName });
}

TEST_F(RegEnumTest, FailureOtherThanEndThrows)
{
    // A write-only handle can't enumerate
    RegKey writeOnly;
    writeOnly.Open(HKEY_CURRENT_USER, kTestKeyPath, KEY_SET_VALUE | KEY_WOW64_64KEY);
    writeOnly.SetDwordValue(L"Value", 1);

    try
    {
        const auto names = writeOnly.EnumValueNames();
        (void)std::distance(names.begin(), names.end());
        FAIL() << "Expected RegException";
    }
    catch (const RegException& e)
    {
        EXPECT_EQ(e.Kind(), RegErrorKind::AccessDenied);
    }
}

TEST_F(RegEnumTest, ClosedKeyEnumerationThrows)
{
    RegKey child = m_key.CreateSubKey(L"Child");
    RegKey grandChild = child.CreateSubKey(L"GrandChild");
    child.Close();

    try
    {
        const RegKey::SubKeyRange subKeys = child.EnumKeys();
        for (const auto& name : subKeys)
        {
            ADD_FAILURE() << "Unexpected subkey from a closed key";
            (void)name;
        }
        FAIL() << "Expected RegException";
    }
    catch (const RegException& e)
    {
        EXPECT_EQ(e.code().value(), ERROR_INVALID_HANDLE);
        EXPECT_EQ(e.Kind(), RegErrorKind::Os);
    }

    try
    {
        (void)child.EnumSubKeys();
        FAIL() << "Expected RegException";
    }
    catch (const RegException& e)
    {
        EXPECT_EQ(e.Kind(), RegErrorKind::Os);
    }

    EXPECT_THROW((void)child.EnumValueNames().begin(), RegException);
}

TEST_F(RegEnumTest, ValueNameBufferIsReused)
{
    const std::wstring longName(300, L'x');
    m_key.SetDwordValue(longName, 1);
    m_key.SetDwordValue(L"y", 2);

    std::vector<std::wstring> names;
    std::wstring name;
    for (DWORD index = 0; ; index++)
    {
        const LSTATUS retCode = details::EnumValueAt(m_key.Get(), index, name);
        if (retCode == ERROR_NO_MORE_ITEMS)
        {
            break;
        }
        ASSERT_EQ(retCode, ERROR_SUCCESS);
        names.push_back(name);
    }

    std::sort(names.begin(), names.end());
    EXPECT_EQ(names, (std::vector<std::wstring>{ longName, L"y" }));
    EXPECT_TRUE(name.empty());
}
