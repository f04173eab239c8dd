#pragma once
#include <fmt/format.h>
#include <stdexcept>
#include <string>

/// <summary>
/// Throws an xlrelay::Exception. Accepts python format strings like the logging functions
/// e.g. XLR_THROW("Bad: {0} {1}", errCode, e.what()) 
/// </summary>
#define XLR_THROW(...) do { throw xlrelay::Exception<>(__FILE__, __LINE__, __func__, fmt::format(__VA_ARGS__)); } while(false)
#define XLR_THROW_TYPE(Type, ...) do { throw xlrelay::Exception<Type>(__FILE__, __LINE__, __func__, fmt::format(__VA_ARGS__)); } while(false)

namespace xlrelay
{
  void logException(
    const char* path,
    const int line,
    const char* func,
    const char* msg) noexcept;

  template<class TBase = std::runtime_error>
  class Exception : public TBase
  {
  public:
    Exception(
      const char* path, const int line, const char* func, const std::string& msg)
      : TBase(msg)
    {
      logException(path, line, func, TBase::what());
    }
  };
}
