#pragma once
#include <xlrelay/Workbook.h>
#include <memory>

namespace xlrelay
{
  /// <summary>
  /// Returns a factory which drives Microsoft Excel through COM automation.
  /// Each workbook gets its own hidden Excel instance, created in the 
  /// single-threaded apartment of the calling affinity thread.
  /// 
  /// Only available on Windows.
  /// </summary>
  std::shared_ptr<WorkbookFactory> makeComWorkbookFactory();
}
