#pragma once
#include "Dispatch.h"

namespace xlrelay
{
  namespace COM
  {
    /// <summary>
    /// Initialises COM as a single-threaded apartment on the current thread
    /// for the object's lifetime
    /// </summary>
    class ComApartment
    {
    public:
      ComApartment();
      ~ComApartment();

      ComApartment(const ComApartment&) = delete;
      ComApartment& operator=(const ComApartment&) = delete;

    private:
      bool _initialised;
    };

    /// <summary>
    /// Starts a new, hidden Excel instance with alerts and macros disabled.
    /// Throws AutomationError if Excel is not installed or cannot be started.
    /// </summary>
    Dispatch newApplicationObject();

    /// <summary>
    /// Cheap call to check the application is still responding
    /// </summary>
    bool isApplicationAlive(const Dispatch& application) noexcept;
  }
}
