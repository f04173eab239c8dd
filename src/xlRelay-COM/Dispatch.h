#pragma once
#include <xlrelay/Errors.h>
#include <comdef.h>
#include <string>
#include <vector>

namespace xlrelay
{
  namespace COM
  {
    /// <summary>
    /// Thin late-binding wrapper around IDispatch. Failed calls are thrown as
    /// xlrelay errors via throwComError.
    /// </summary>
    class Dispatch
    {
    public:
      Dispatch() = default;
      explicit Dispatch(IDispatchPtr ptr) : _ptr(std::move(ptr)) {}

      _variant_t get(const wchar_t* name, std::vector<_variant_t> args = {}) const;

      Dispatch getObject(const wchar_t* name, std::vector<_variant_t> args = {}) const;

      void put(const wchar_t* name, const _variant_t& value) const;

      _variant_t call(const wchar_t* name, std::vector<_variant_t> args = {}) const;

      /// <summary>
      /// Property get which reports failure as an HRESULT rather than throwing
      /// </summary>
      HRESULT tryGet(const wchar_t* name, _variant_t& result) const noexcept;

      bool valid() const noexcept { return _ptr != nullptr; }

      void release() noexcept { _ptr = nullptr; }

      IDispatch* ptr() const noexcept { return _ptr.GetInterfacePtr(); }

    private:
      _variant_t invoke(const wchar_t* name, WORD flags, std::vector<_variant_t>& args) const;

      IDispatchPtr _ptr;
    };

    /// <summary>
    /// An AutomationError which remembers the failing HRESULT
    /// </summary>
    class ComCallError : public AutomationError
    {
    public:
      explicit ComCallError(const std::string& msg)
        : AutomationError(msg)
      {}
      HRESULT hr = E_FAIL;
    };

    /// <summary>
    /// A VARIANT which marks an optional argument as omitted
    /// </summary>
    _variant_t missingArgument();

    /// <summary>
    /// True for HRESULTs which mean the automation server has gone away
    /// </summary>
    bool isDisconnected(HRESULT hr) noexcept;

    /// <summary>
    /// Throws HandleInvalidatedError if the server has gone away, otherwise
    /// ComCallError. `info` may be null; its strings are freed.
    /// </summary>
    [[noreturn]] void throwComError(HRESULT hr, EXCEPINFO* info, const std::wstring_view& what);

    /// <summary>
    /// Formats a `_com_error` in the same way as throwComError
    /// </summary>
    std::string describe(const _com_error& error);
  }
}
