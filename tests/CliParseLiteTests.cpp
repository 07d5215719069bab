#include "cli/CliParse.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

static int g_failures = 0;

#define EXPECT_TRUE(cond)                                                                                            \
  do {                                                                                                               \
    if (!(cond)) {                                                                                                   \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_TRUE failed: " << #cond << "\n";                    \
    }                                                                                                                \
  } while (0)

#define EXPECT_FALSE(cond) EXPECT_TRUE(!(cond))

#define EXPECT_EQ(a, b)                                                                                              \
  do {                                                                                                               \
    const auto _a = (a);                                                                                             \
    const auto _b = (b);                                                                                             \
    if (!(_a == _b)) {                                                                                               \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_EQ failed: " << #a << " == " << #b << "\n";   \
    }                                                                                                                \
  } while (0)

#define EXPECT_NE(a, b)                                                                                              \
  do {                                                                                                               \
    const auto _a = (a);                                                                                             \
    const auto _b = (b);                                                                                             \
    if ((_a == _b)) {                                                                                                \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_NE failed: " << #a << " != " << #b << "\n";   \
    }                                                                                                                \
  } while (0)

#define ASSERT_TRUE(cond)                                                                                            \
  do {                                                                                                               \
    if (!(cond)) {                                                                                                   \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " ASSERT_TRUE failed: " << #cond << "\n";                    \
      return;                                                                                                        \
    }                                                                                                                \
  } while (0)

static fs::path MakeTempPath(const std::string& prefix)
{
  static std::uint64_t counter = 0;
  ++counter;

  std::error_code ec;
  fs::path root = fs::temp_directory_path(ec);
  if (ec || root.empty()) {
    root = fs::current_path(ec);
    if (ec || root.empty()) {
      root = fs::path(".");
    }
  }

  const auto stamp = static_cast<std::uint64_t>(
    std::chrono::high_resolution_clock::now().time_since_epoch().count());

  return root / (prefix + "_" + std::to_string(stamp) + "_" + std::to_string(counter));
}

static void TestParseI32()
{
  using namespace stopgrid::cli;

  int v = 0;
  EXPECT_TRUE(ParseI32("0", &v));
  EXPECT_EQ(v, 0);
  EXPECT_TRUE(ParseI32("-1", &v));
  EXPECT_EQ(v, -1);
  EXPECT_TRUE(ParseI32("+24", &v));
  EXPECT_EQ(v, 24);

  EXPECT_FALSE(ParseI32("1.0", &v));
  EXPECT_FALSE(ParseI32("1 ", &v));
  EXPECT_FALSE(ParseI32(" 1", &v));
  EXPECT_FALSE(ParseI32("", &v));
  EXPECT_FALSE(ParseI32("+", &v));
  EXPECT_FALSE(ParseI32("2147483648", &v));
}

static void TestParseF64()
{
  using namespace stopgrid::cli;

  double d = 0.0;
  EXPECT_TRUE(ParseF64("900", &d));
  EXPECT_EQ(d, 900.0);
  EXPECT_TRUE(ParseF64("-27.4698", &d));
  EXPECT_EQ(d, -27.4698);
  EXPECT_TRUE(ParseF64("1e3", &d));
  EXPECT_EQ(d, 1000.0);

  EXPECT_FALSE(ParseF64("nan", &d));
  EXPECT_FALSE(ParseF64("inf", &d));
  EXPECT_FALSE(ParseF64("1e309", &d));
  EXPECT_FALSE(ParseF64("12m", &d));
  EXPECT_FALSE(ParseF64("", &d));
}

static void TestParseF64List()
{
  using namespace stopgrid::cli;

  std::vector<double> v;
  EXPECT_TRUE(ParseF64List("500,1000,2000", &v));
  ASSERT_TRUE(v.size() == 3);
  EXPECT_EQ(v[0], 500.0);
  EXPECT_EQ(v[2], 2000.0);

  EXPECT_TRUE(ParseF64List(" 250 , 750 ", &v));
  ASSERT_TRUE(v.size() == 2);
  EXPECT_EQ(v[1], 750.0);

  EXPECT_TRUE(ParseF64List("42", &v));
  EXPECT_EQ(v.size(), static_cast<std::size_t>(1));

  // Failure leaves the output untouched.
  EXPECT_FALSE(ParseF64List("500,,2000", &v));
  EXPECT_FALSE(ParseF64List("500,", &v));
  EXPECT_FALSE(ParseF64List("", &v));
  EXPECT_FALSE(ParseF64List("a,b", &v));
  EXPECT_EQ(v.size(), static_cast<std::size_t>(1));
}

static void TestParseLatLon()
{
  using namespace stopgrid::cli;

  double lat = 0.0;
  double lon = 0.0;
  EXPECT_TRUE(ParseLatLon("-27.4698,153.0251", &lat, &lon));
  EXPECT_EQ(lat, -27.4698);
  EXPECT_EQ(lon, 153.0251);

  EXPECT_TRUE(ParseLatLon("90, -180", &lat, &lon));
  EXPECT_EQ(lat, 90.0);
  EXPECT_EQ(lon, -180.0);

  EXPECT_FALSE(ParseLatLon("91,0", &lat, &lon));
  EXPECT_FALSE(ParseLatLon("0,180.5", &lat, &lon));
  EXPECT_FALSE(ParseLatLon("1,2,3", &lat, &lon));
  EXPECT_FALSE(ParseLatLon("1", &lat, &lon));
  EXPECT_FALSE(ParseLatLon("nan,0", &lat, &lon));
}

static void TestHexU64()
{
  using namespace stopgrid::cli;

  EXPECT_EQ(HexU64(0u), std::string("0x0000000000000000"));
  EXPECT_EQ(HexU64(0xabcdefu), std::string("0x0000000000abcdef"));
}

static void TestEnsureParentDir()
{
  using namespace stopgrid::cli;

  std::error_code ec;
  const fs::path base = MakeTempPath("stopgrid_cli_parse_dirs");

  EXPECT_FALSE(EnsureParentDir(fs::path{}));
  EXPECT_TRUE(EnsureParentDir(fs::path("report.json")));

  const fs::path file = base / "c" / "d" / "out.ppm";
  EXPECT_TRUE(EnsureParentDir(file));
  EXPECT_TRUE(fs::exists(base / "c" / "d"));

  fs::remove_all(base, ec);
}

int main()
{
  TestParseI32();
  TestParseF64();
  TestParseF64List();
  TestParseLatLon();
  TestHexU64();
  TestEnsureParentDir();

  if (g_failures == 0) {
    std::cout << "stopgrid_cli_parse_tests: OK\n";
    return 0;
  }

  std::cerr << "stopgrid_cli_parse_tests: FAILED (" << g_failures << ")\n";
  return 1;
}
