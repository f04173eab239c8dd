#include <gtest/gtest.h>
#include "FakeWorkbook.h"
#include <xlrelay/Log.h>
#include <fstream>
#include <sstream>

using namespace xlrelay;
using std::string;

namespace Tests
{
  TEST(Log, RotatingFileSinkWritesMessages)
  {
    TempDirectory dir;
    auto logger = loggerInitialise("off", false);
    auto file = loggerAddRotatingFileSink(
      logger, (dir.path() / "logs" / "xlrelay.log").string(), "info", 16, 2);
    loggerSetFlush(logger, "info");

    logger->debug("not written");
    logger->info("session {} opened", "abc");

    std::ifstream in(file);
    std::stringstream content;
    content << in.rdbuf();
    EXPECT_NE(string::npos, content.str().find("session abc opened"));
    EXPECT_EQ(string::npos, content.str().find("not written"));
    EXPECT_EQ(spdlog::level::info, logger->level());
  }
}
