#pragma once
#include <array>
#include <cstdint>
#include <string>

namespace xlrelay
{
  using Guid = std::array<uint8_t, 16>;

  /// <summary>
  /// Creates a random (version 4) UUID as described in RFC 4122 §4.4.
  /// </summary>
  Guid createGuid();

  enum class GuidToString
  {
    HEX,
    PUNCTUATED
  };

  /// <summary>
  /// Writes the guid in a string of the form 
  /// 
  ///   * PUNCTUATED: '{V-W-X-Y-Z}' length 38
  ///   * HEX : 'VWXYZ' lowercase with length 32
  ///   
  /// </summary>
  std::string guidToString(const Guid& guid, GuidToString mode = GuidToString::PUNCTUATED);

  /// <summary>
  /// Returns a fresh opaque token: a random guid in HEX form
  /// </summary>
  std::string newSessionToken();
}
