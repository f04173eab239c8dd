#include "Dispatch.h"
#include <xlrelay/Errors.h>
#include <xlrelay/Log.h>
#include <xlrelay/StringUtils.h>
#include <xlrelay/Throw.h>

using std::string;
using std::wstring;
using std::vector;

namespace xlrelay
{
  namespace COM
  {
    namespace
    {
      /// The scode in EXCEPINFO is more specific than DISP_E_EXCEPTION
      HRESULT effectiveError(HRESULT hr, const EXCEPINFO* info)
      {
        if (hr == DISP_E_EXCEPTION && info && FAILED(info->scode))
          return info->scode;
        return hr;
      }

      string takeDescription(EXCEPINFO* info)
      {
        if (!info)
          return string();
        if (info->pfnDeferredFillIn)
          info->pfnDeferredFillIn(info);
        string description = info->bstrDescription 
          ? utf16ToUtf8(info->bstrDescription) : string();
        SysFreeString(info->bstrSource);
        SysFreeString(info->bstrDescription);
        SysFreeString(info->bstrHelpFile);
        info->bstrSource = info->bstrDescription = info->bstrHelpFile = nullptr;
        return description;
      }
    }

    bool isDisconnected(HRESULT hr) noexcept
    {
      switch ((unsigned long)hr)
      {
      case 0x80010108: // RPC_E_DISCONNECTED
      case 0x80010105: // RPC_E_SERVERFAULT
      case 0x800706BA: // RPC_S_SERVER_UNAVAILABLE
      case 0x800706BE: // RPC_S_CALL_FAILED
      case 0x800401FD: // CO_E_OBJNOTCONNECTED
        return true;
      default:
        return false;
      }
    }

    void throwComError(HRESULT hr, EXCEPINFO* info, const std::wstring_view& what)
    {
      auto description = takeDescription(info);
      hr = effectiveError(hr, info);
      if (description.empty())
        description = utf16ToUtf8(_com_error(hr).ErrorMessage());

      if (isDisconnected(hr))
        XLR_THROW_TYPE(HandleInvalidatedError,
          "Excel is no longer available ({} failed: {:#010x} {})", 
          utf16ToUtf8(what), (unsigned long)hr, description);

      Exception<ComCallError> error(__FILE__, __LINE__, __func__, fmt::format(
        "{} failed: {:#010x} {}", utf16ToUtf8(what), (unsigned long)hr, description));
      error.hr = hr;
      throw error;
    }

    string describe(const _com_error& error)
    {
      auto description = error.Description();
      return fmt::format("{:#010x} {}", (unsigned long)error.Error(),
        description.length() > 0 
          ? utf16ToUtf8((const wchar_t*)description) 
          : utf16ToUtf8(error.ErrorMessage()));
    }

    _variant_t missingArgument()
    {
      return _variant_t(DISP_E_PARAMNOTFOUND, VT_ERROR);
    }

    _variant_t Dispatch::invoke(const wchar_t* name, WORD flags, vector<_variant_t>& args) const
    {
      if (!_ptr)
        XLR_THROW_TYPE(HandleInvalidatedError, "Excel object has been released (calling {})", 
          utf16ToUtf8(name));

      DISPID dispid;
      auto names = const_cast<LPOLESTR>(name);
      auto hr = _ptr->GetIDsOfNames(IID_NULL, &names, 1, LOCALE_USER_DEFAULT, &dispid);
      if (FAILED(hr))
        throwComError(hr, nullptr, name);

      // IDispatch takes arguments in reverse order
      vector<VARIANTARG> reversed;
      reversed.reserve(args.size());
      for (auto i = args.rbegin(); i != args.rend(); ++i)
        reversed.push_back(*i);

      DISPID namedPut = DISPID_PROPERTYPUT;
      DISPPARAMS params = { reversed.data(), nullptr, (UINT)reversed.size(), 0 };
      if (flags & DISPATCH_PROPERTYPUT)
      {
        params.cNamedArgs = 1;
        params.rgdispidNamedArgs = &namedPut;
      }

      _variant_t result;
      EXCEPINFO info = {};
      UINT argError = 0;
      hr = _ptr->Invoke(dispid, IID_NULL, LOCALE_SYSTEM_DEFAULT, flags,
        &params, &result, &info, &argError);
      if (FAILED(hr))
        throwComError(hr, &info, name);
      return result;
    }

    _variant_t Dispatch::get(const wchar_t* name, vector<_variant_t> args) const
    {
      return invoke(name, DISPATCH_PROPERTYGET | DISPATCH_METHOD, args);
    }

    Dispatch Dispatch::getObject(const wchar_t* name, vector<_variant_t> args) const
    {
      auto result = get(name, std::move(args));
      if (result.vt != VT_DISPATCH || !result.pdispVal)
        XLR_THROW_TYPE(AutomationError, "{} did not return an object", utf16ToUtf8(name));
      return Dispatch(IDispatchPtr(result.pdispVal));
    }

    void Dispatch::put(const wchar_t* name, const _variant_t& value) const
    {
      vector<_variant_t> args{ value };
      invoke(name, DISPATCH_PROPERTYPUT, args);
    }

    _variant_t Dispatch::call(const wchar_t* name, vector<_variant_t> args) const
    {
      return invoke(name, DISPATCH_METHOD, args);
    }

    HRESULT Dispatch::tryGet(const wchar_t* name, _variant_t& result) const noexcept
    {
      if (!_ptr)
        return CO_E_OBJNOTCONNECTED;
      DISPID dispid;
      auto names = const_cast<LPOLESTR>(name);
      auto hr = _ptr->GetIDsOfNames(IID_NULL, &names, 1, LOCALE_USER_DEFAULT, &dispid);
      if (FAILED(hr))
        return hr;
      DISPPARAMS params = { nullptr, nullptr, 0, 0 };
      return _ptr->Invoke(dispid, IID_NULL, LOCALE_SYSTEM_DEFAULT, DISPATCH_PROPERTYGET,
        &params, &result, nullptr, nullptr);
    }
  }
}
