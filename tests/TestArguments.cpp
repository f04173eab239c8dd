#include <gtest/gtest.h>
#include <xlrelay/Arguments.h>
#include <xlrelay/Errors.h>

using namespace xlrelay;
using namespace std::chrono_literals;
using nlohmann::json;
using std::string;

namespace Tests
{
  TEST(Arguments, Strings)
  {
    json args = { { "name", "Sheet1" }, { "blank", "" }, { "number", 3 } };
    EXPECT_EQ("Sheet1", Args::requireString(args, "name"));
    EXPECT_THROW(Args::requireString(args, "missing"), ArgumentError);
    EXPECT_THROW(Args::requireString(args, "blank"), ArgumentError);
    EXPECT_THROW(Args::requireString(args, "number"), ArgumentError);

    EXPECT_EQ("", Args::optionalString(args, "blank", "x"));
    EXPECT_EQ("x", Args::optionalString(args, "missing", "x"));
    EXPECT_EQ("x", Args::optionalString(json(nullptr), "name", "x"));
  }

  TEST(Arguments, SecondsAreConvertedToMilliseconds)
  {
    EXPECT_FALSE(Args::optionalSeconds(json::object(), "timeoutSeconds").has_value());
    EXPECT_FALSE(Args::optionalSeconds({ { "timeoutSeconds", nullptr } }, "timeoutSeconds").has_value());
    EXPECT_EQ(2500ms, *Args::optionalSeconds({ { "timeoutSeconds", 2.5 } }, "timeoutSeconds"));
    EXPECT_EQ(1ms, *Args::optionalSeconds({ { "timeoutSeconds", 0.001 } }, "timeoutSeconds"));
  }

  TEST(Arguments, SecondsMustBePositive)
  {
    for (auto bad : { json(0), json(-1), json("10"), json(true), json::array() })
      EXPECT_THROW(Args::optionalSeconds({ { "timeoutSeconds", bad } }, "timeoutSeconds"), ArgumentError)
        << bad.dump();
  }

  TEST(Arguments, SecondsBelowOneMillisecondAreRejected)
  {
    try
    {
      Args::optionalSeconds({ { "timeoutSeconds", 0.0001 } }, "timeoutSeconds");
      FAIL() << "Expected ArgumentError";
    }
    catch (const ArgumentError& e)
    {
      EXPECT_NE(string::npos, string(e.what()).find("timeoutSeconds"));
    }
  }

  TEST(Arguments, HugeSecondsAreCapped)
  {
    const auto cap = std::chrono::seconds(Args::maxArgumentSeconds);
    EXPECT_EQ(cap, *Args::optionalSeconds({ { "timeoutSeconds", 1e303 } }, "timeoutSeconds"));
    EXPECT_EQ(cap, *Args::optionalSeconds({ { "timeoutSeconds", 1e12 } }, "timeoutSeconds"));
  }
}
