#include <xlrelay/Errors.h>

namespace xlrelay
{
  namespace
  {
    struct KindName
    {
      ErrorKind kind;
      const char* name;
    };

    constexpr KindName theKindNames[] = {
      { ErrorKind::Internal, "Internal" },
      { ErrorKind::UnknownSession, "UnknownSession" },
      { ErrorKind::HandleInvalidated, "HandleInvalidated" },
      { ErrorKind::SaveConflict, "SaveConflict" },
      { ErrorKind::IO, "IO" },
      { ErrorKind::Timeout, "Timeout" },
      { ErrorKind::ServiceUnavailable, "ServiceUnavailable" },
      { ErrorKind::Protocol, "Protocol" },
      { ErrorKind::FileNotFound, "FileNotFound" },
      { ErrorKind::AlreadyOpen, "AlreadyOpen" },
      { ErrorKind::InvalidArgument, "InvalidArgument" },
      { ErrorKind::UnknownCommand, "UnknownCommand" },
      { ErrorKind::Automation, "Automation" },
    };
  }

  const char* errorKindName(ErrorKind kind) noexcept
  {
    for (auto& k : theKindNames)
      if (k.kind == kind)
        return k.name;
    return "Internal";
  }

  ErrorKind errorKindFromName(std::string_view name) noexcept
  {
    for (auto& k : theKindNames)
      if (name == k.name)
        return k.kind;
    return ErrorKind::Internal;
  }

  ErrorKind errorKindOf(const std::exception& e) noexcept
  {
    auto relayError = dynamic_cast<const RelayError*>(&e);
    return relayError ? relayError->kind() : ErrorKind::Internal;
  }

  void throwError(ErrorKind kind, const std::string& message)
  {
    switch (kind)
    {
    case ErrorKind::UnknownSession:     throw UnknownSessionError(message);
    case ErrorKind::HandleInvalidated:  throw HandleInvalidatedError(message);
    case ErrorKind::SaveConflict:       throw SaveConflictError(message);
    case ErrorKind::IO:                 throw WorkbookIOError(message);
    case ErrorKind::Timeout:            throw OperationTimeoutError(message);
    case ErrorKind::ServiceUnavailable: throw ServiceUnavailableError(message);
    case ErrorKind::Protocol:           throw ProtocolError(message);
    case ErrorKind::FileNotFound:       throw FileNotFoundError(message);
    case ErrorKind::AlreadyOpen:        throw AlreadyOpenConflictError(message);
    case ErrorKind::InvalidArgument:    throw ArgumentError(message);
    case ErrorKind::UnknownCommand:     throw UnknownCommandError(message);
    case ErrorKind::Automation:         throw AutomationError(message);
    default:
      throw std::runtime_error(message);
    }
  }
}
