#include "MessageFilter.h"
#include <xlrelay/Log.h>
#include <atomic>

namespace xlrelay
{
  namespace COM
  {
    namespace
    {
      class RetryingMessageFilter : public IMessageFilter
      {
      public:
        explicit RetryingMessageFilter(DWORD retryWindowMs)
          : _retryWindowMs(retryWindowMs)
        {}

        STDMETHOD(QueryInterface)(REFIID riid, void** ppv) override
        {
          if (riid == IID_IUnknown || riid == IID_IMessageFilter)
          {
            *ppv = static_cast<IMessageFilter*>(this);
            AddRef();
            return S_OK;
          }
          *ppv = nullptr;
          return E_NOINTERFACE;
        }

        STDMETHOD_(ULONG, AddRef)() override
        {
          return ++_refCount;
        }

        STDMETHOD_(ULONG, Release)() override
        {
          auto count = --_refCount;
          if (count == 0)
            delete this;
          return count;
        }

        STDMETHOD_(DWORD, HandleInComingCall)(
          DWORD, HTASK, DWORD, LPINTERFACEINFO) override
        {
          return SERVERCALL_ISHANDLED;
        }

        STDMETHOD_(DWORD, RetryRejectedCall)(
          HTASK, DWORD tickCount, DWORD rejectType) override
        {
          // Returning >= 100 means retry after that many ms; -1 cancels
          if (rejectType == SERVERCALL_RETRYLATER && tickCount < _retryWindowMs)
          {
            XLR_TRACE("Excel is busy, retrying call after {} ms", tickCount);
            return 100;
          }
          return (DWORD)-1;
        }

        STDMETHOD_(DWORD, MessagePending)(HTASK, DWORD, DWORD) override
        {
          return PENDINGMSG_WAITDEFPROCESS;
        }

      private:
        std::atomic<ULONG> _refCount{ 1 };
        DWORD _retryWindowMs;
      };
    }

    ScopedMessageFilter::ScopedMessageFilter(DWORD retryWindowMs)
      : _filter(new RetryingMessageFilter(retryWindowMs))
    {
      if (FAILED(CoRegisterMessageFilter(_filter, &_previous)))
      {
        XLR_WARN("Failed to register OLE message filter; busy Excel calls will not be retried");
        _filter->Release();
        _filter = nullptr;
      }
    }

    ScopedMessageFilter::~ScopedMessageFilter()
    {
      if (!_filter)
        return;
      IMessageFilter* ours = nullptr;
      CoRegisterMessageFilter(_previous, &ours);
      if (ours)
        ours->Release();
      if (_previous)
        _previous->Release();
      _filter->Release();
    }
  }
}
