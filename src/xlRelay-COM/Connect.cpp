#include "Connect.h"
#include <xlrelay/Errors.h>
#include <xlrelay/Log.h>
#include <xlrelay/Throw.h>

namespace xlrelay
{
  namespace COM
  {
    namespace
    {
      // msoAutomationSecurityForceDisable
      constexpr long theAutomationSecurityForceDisable = 3;
    }

    ComApartment::ComApartment()
    {
      auto hr = CoInitializeEx(NULL, COINIT_APARTMENTTHREADED);
      if (hr == RPC_E_CHANGED_MODE)
        XLR_THROW_TYPE(AutomationError, "COM is already initialised on this thread in a multi-threaded apartment");
      // S_FALSE means already initialised; it still needs a balancing call
      _initialised = SUCCEEDED(hr);
    }

    ComApartment::~ComApartment()
    {
      if (_initialised)
        CoUninitialize();
    }

    Dispatch newApplicationObject()
    {
      CLSID clsid;
      auto hr = CLSIDFromProgID(L"Excel.Application", &clsid);
      if (FAILED(hr))
        XLR_THROW_TYPE(AutomationError, 
          "Microsoft Excel is not installed or not registered: {:#010x}", (unsigned long)hr);

      IDispatch* app = nullptr;
      hr = CoCreateInstance(clsid, NULL, CLSCTX_LOCAL_SERVER, IID_IDispatch, (void**)&app);
      if (FAILED(hr))
        XLR_THROW_TYPE(AutomationError, "Failed to start Excel: {:#010x}", (unsigned long)hr);

      auto application = Dispatch(IDispatchPtr(app, false));
      try
      {
        application.put(L"Visible", _variant_t(false));
        application.put(L"DisplayAlerts", _variant_t(false));
        application.put(L"ScreenUpdating", _variant_t(false));
        application.put(L"AutomationSecurity", _variant_t(theAutomationSecurityForceDisable));
      }
      catch (const std::exception&)
      {
        // Don't leave an invisible Excel running
        try
        {
          application.call(L"Quit");
        }
        catch (const std::exception& e)
        {
          XLR_WARN("Failed to quit Excel after a failed start: {}", e.what());
        }
        throw;
      }
      XLR_DEBUG("Started Excel instance");
      return application;
    }

    bool isApplicationAlive(const Dispatch& application) noexcept
    {
      _variant_t ready;
      return SUCCEEDED(application.tryGet(L"Ready", ready));
    }
  }
}
