#pragma once
#include <objidl.h>

namespace xlrelay
{
  namespace COM
  {
    /// <summary>
    /// Registers an OLE message filter on the current STA thread for its 
    /// lifetime. Excel rejects incoming calls with SERVERCALL_RETRYLATER 
    /// while it is busy (recalculating, showing a dialog); the filter retries
    /// them for up to `retryWindowMs` instead of failing immediately.
    /// </summary>
    class ScopedMessageFilter
    {
    public:
      explicit ScopedMessageFilter(DWORD retryWindowMs = 30000);
      ~ScopedMessageFilter();

      ScopedMessageFilter(const ScopedMessageFilter&) = delete;
      ScopedMessageFilter& operator=(const ScopedMessageFilter&) = delete;

    private:
      IMessageFilter* _filter = nullptr;
      IMessageFilter* _previous = nullptr;
    };
  }
}
