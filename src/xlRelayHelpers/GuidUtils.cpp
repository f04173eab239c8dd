#include "GuidUtils.h"
#include <cctype>
#include <mutex>
#include <random>

using std::string;

namespace xlrelay
{
  Guid createGuid()
  {
    static std::mutex theLock;
    static std::mt19937_64 theEngine(std::random_device{}());

    uint64_t hi, lo;
    {
      std::lock_guard<std::mutex> lock(theLock);
      hi = theEngine();
      lo = theEngine();
    }

    Guid guid;
    for (auto i = 0; i < 8; ++i)
    {
      guid[i] = (uint8_t)(hi >> (8 * (7 - i)));
      guid[8 + i] = (uint8_t)(lo >> (8 * (7 - i)));
    }

    // Version 4 in the high nibble of octet 6, RFC 4122 variant in octet 8
    guid[6] = (uint8_t)((guid[6] & 0x0F) | 0x40);
    guid[8] = (uint8_t)((guid[8] & 0x3F) | 0x80);
    return guid;
  }

  string guidToString(const Guid& guid, GuidToString mode)
  {
    constexpr char hexDigits[] = "0123456789abcdef";
    string result;
    switch (mode)
    {
    case GuidToString::HEX:
      result.reserve(32);
      for (auto b : guid)
      {
        result.push_back(hexDigits[b >> 4]);
        result.push_back(hexDigits[b & 0xF]);
      }
      break;
    case GuidToString::PUNCTUATED:
      result.reserve(38);
      result.push_back('{');
      for (auto i = 0u; i < guid.size(); ++i)
      {
        if (i == 4 || i == 6 || i == 8 || i == 10)
          result.push_back('-');
        result.push_back((char)std::toupper(hexDigits[guid[i] >> 4]));
        result.push_back((char)std::toupper(hexDigits[guid[i] & 0xF]));
      }
      result.push_back('}');
      break;
    }
    return result;
  }

  string newSessionToken()
  {
    return guidToString(createGuid(), GuidToString::HEX);
  }
}
