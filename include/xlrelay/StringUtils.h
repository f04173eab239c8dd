#pragma once
#include <string>
#include <string_view>
#include <codecvt>
#include <locale>
#include <algorithm>
#include <cctype>

namespace xlrelay
{
  /// <summary>
  /// Converts a UTF-16 wstring to a UTF-8 string
  /// </summary>
  inline std::string utf16ToUtf8(const std::wstring_view& str)
  {
    std::wstring_convert<std::codecvt_utf8_utf16<wchar_t>> converter;
    return converter.to_bytes(str.data(), str.data() + str.size());
  }

  /// <summary>
  /// Converts a UTF-8 string to a UTF-16 wstring
  /// </summary>
  inline std::wstring utf8ToUtf16(const std::string_view& str)
  {
    std::wstring_convert<std::codecvt_utf8_utf16<wchar_t>> converter;
    return converter.from_bytes(str.data(), str.data() + str.size());
  }

  /// <summary>
  /// ASCII lower-casing, sufficient for file extensions and command names
  /// </summary>
  inline std::string toLower(std::string str)
  {
    std::transform(str.begin(), str.end(), str.begin(),
      [](unsigned char c) { return (char)std::tolower(c); });
    return str;
  }

  inline std::string trim(const std::string_view& str)
  {
    const auto begin = str.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos)
      return std::string();
    const auto end = str.find_last_not_of(" \t\r\n");
    return std::string(str.substr(begin, end - begin + 1));
  }
}
