////////////////////////////////////////////////////////////////////////////////
// FILE: BasicUsage.cpp
// DESC: Walkthrough of the RegBind library: reading system values, writing
//       and reading back values, enumeration, and error handling.
// AUTHOR: Giovanni Dicanio
////////////////////////////////////////////////////////////////////////////////

#include "RegBind/RegBind.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <iostream>
#include <string>
#include <vector>

using std::wcout;
using std::wstring;
using std::vector;

using namespace regbind;


namespace
{

const wstring kExampleKeyPath = L"Software\\RegBindExample";


void PrintSystemInfo()
{
    const RegKey hklm = RegKey::Predefined(HKEY_LOCAL_MACHINE);
    const RegKey currentVersion = hklm.OpenSubKey(
        L"SOFTWARE\\Microsoft\\Windows\\CurrentVersion",
        KEY_READ | KEY_WOW64_64KEY);

    wcout << L"ProgramFilesDir: " << currentVersion.GetStringValue(L"ProgramFilesDir") << L'\n';

    // Stored as REG_EXPAND_SZ on most systems
    const RegExpected<wstring> commonFiles = currentVersion.TryGetExpandStringValue(
        L"CommonFilesDir", RegKey::ExpandStringOption::Expand);
    if (commonFiles)
    {
        wcout << L"CommonFilesDir: " << commonFiles.GetValue() << L'\n';
    }
    else
    {
        wcout << L"CommonFilesDir not available: " << commonFiles.GetError().ErrorMessage() << L'\n';
    }

    wcout << L"Subkeys of CurrentVersion: " << currentVersion.QueryInfoKey().NumberOfSubKeys << L'\n';
}


void WriteAndReadBack()
{
    RegDisposition disposition = RegDisposition::OpenedExistingKey;
    RegKey key;
    key.Create(HKEY_CURRENT_USER, kExampleKeyPath, KEY_READ | KEY_WRITE | KEY_WOW64_64KEY,
               REG_OPTION_NON_VOLATILE, nullptr, &disposition);

    wcout << (disposition == RegDisposition::CreatedNewKey ? L"Created " : L"Opened ")
          << L"HKCU\\" << kExampleKeyPath << L'\n';

    key.SetDwordValue(L"Counter", 42);
    key.SetStringValue(L"Greeting", L"Ciao");
    key.SetMultiStringValue(L"Colors", { L"red", L"green", L"blue" });
    key.SetValue(L"Raw", RegValue::Binary({ 0xCA, 0xFE }));

    // A DWORD can always be read as a QWORD
    wcout << L"Counter as QWORD: " << key.GetQwordValue(L"Counter") << L'\n';
    wcout << L"Greeting: " << key.GetStringValue(L"Greeting") << L'\n';

    for (const auto& color : key.GetMultiStringValue(L"Colors"))
    {
        wcout << L"  color: " << color << L'\n';
    }

    for (const auto& [name, type] : key.EnumValues())
    {
        wcout << L"  value " << name << L" (" << RegKey::RegTypeToString(type) << L")\n";
    }

    // A string can't be read as a number
    const RegExpected<DWORD> notANumber = key.TryGetDwordValue(L"Greeting");
    if (!notANumber)
    {
        wcout << L"Greeting as DWORD: "
              << RegErrorKindToString(notANumber.GetError().Kind()) << L'\n';
    }
}


void DeleteAndReopen()
{
    RegKey hkcu = RegKey::Predefined(HKEY_CURRENT_USER);
    hkcu.DeleteTree(kExampleKeyPath);

    RegKey key;
    const RegResult result = key.TryOpen(HKEY_CURRENT_USER, kExampleKeyPath);
    if (result.Kind() == RegErrorKind::NotFound)
    {
        wcout << L"Deleted key is gone: " << result.ErrorMessage() << L'\n';
    }
}

} // namespace


int main()
{
    // Show the library's own trace records
    spdlog::set_level(spdlog::level::debug);

    try
    {
        PrintSystemInfo();
        WriteAndReadBack();
        DeleteAndReopen();
    }
    catch (const RegException& e)
    {
        spdlog::error("Registry error ({}): {}", RegErrorKindToString(e.Kind()), e.what());
        return 1;
    }
    catch (const std::exception& e)
    {
        spdlog::error("Error: {}", e.what());
        return 1;
    }

    return 0;
}
