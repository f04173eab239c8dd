#pragma once
#include <stdexcept>
#include <string>
#include <string_view>

namespace xlrelay
{
  /// <summary>
  /// Classifies every failure which can cross the service boundary. The name
  /// of each kind is written to the `errorKind` field of a failure response.
  /// </summary>
  enum class ErrorKind
  {
    Internal,
    UnknownSession,
    HandleInvalidated,
    SaveConflict,
    IO,
    Timeout,
    ServiceUnavailable,
    Protocol,
    FileNotFound,
    AlreadyOpen,
    InvalidArgument,
    UnknownCommand,
    Automation
  };

  const char* errorKindName(ErrorKind kind) noexcept;

  /// <summary>
  /// Returns ErrorKind::Internal for unrecognised names
  /// </summary>
  ErrorKind errorKindFromName(std::string_view name) noexcept;

  class RelayError : public std::runtime_error
  {
  public:
    explicit RelayError(const std::string& msg)
      : std::runtime_error(msg)
    {}
    virtual ErrorKind kind() const noexcept = 0;
  };

#define XLR_DECLARE_ERROR(Name, Kind) \
  class Name : public RelayError \
  { \
  public: \
    explicit Name(const std::string& msg) : RelayError(msg) {} \
    ErrorKind kind() const noexcept override { return ErrorKind::Kind; } \
  }

  /// Session token not registered or already evicted
  XLR_DECLARE_ERROR(UnknownSessionError, UnknownSession);
  /// The native automation handle died; the session must be reopened
  XLR_DECLARE_ERROR(HandleInvalidatedError, HandleInvalidated);
  /// The workbook file is locked, read-only or was modified externally
  XLR_DECLARE_ERROR(SaveConflictError, SaveConflict);
  XLR_DECLARE_ERROR(WorkbookIOError, IO);
  XLR_DECLARE_ERROR(OperationTimeoutError, Timeout);
  XLR_DECLARE_ERROR(ServiceUnavailableError, ServiceUnavailable);
  XLR_DECLARE_ERROR(ProtocolError, Protocol);
  XLR_DECLARE_ERROR(FileNotFoundError, FileNotFound);
  XLR_DECLARE_ERROR(AlreadyOpenConflictError, AlreadyOpen);
  XLR_DECLARE_ERROR(ArgumentError, InvalidArgument);
  XLR_DECLARE_ERROR(UnknownCommandError, UnknownCommand);
  /// Any other failure reported by the native automation library
  XLR_DECLARE_ERROR(AutomationError, Automation);

#undef XLR_DECLARE_ERROR

  /// <summary>
  /// Returns the kind of a caught exception: RelayError reports its own,
  /// anything else is Internal.
  /// </summary>
  ErrorKind errorKindOf(const std::exception& e) noexcept;

  /// <summary>
  /// Throws the RelayError subclass matching `kind`. Used by clients to turn
  /// a failure response back into a typed exception.
  /// </summary>
  [[noreturn]] void throwError(ErrorKind kind, const std::string& message);
}
