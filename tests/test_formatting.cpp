#include "minitest.hpp"
#include "util/Formatting.hpp"
#include <chrono>

using cmdprof::util::format_ibytes;

TEST(ibytes_small_values) {
  ASSERT_EQ(format_ibytes(0), "0 B");
  ASSERT_EQ(format_ibytes(1023), "1023 B");
}

TEST(ibytes_units) {
  ASSERT_EQ(format_ibytes(1024), "1.0 KiB");
  ASSERT_EQ(format_ibytes(1536), "1.5 KiB");
  ASSERT_EQ(format_ibytes(10ull * 1024), "10 KiB");
  ASSERT_EQ(format_ibytes(79ull * 1024 * 1024), "79 MiB");
  ASSERT_EQ(format_ibytes(15ull * 1024 * 1024 * 1024), "15 GiB");
  ASSERT_EQ(format_ibytes(3ull * 1024 * 1024 * 1024 * 1024 / 2), "1.5 TiB");
}

TEST(ibytes_rounds_before_choosing_precision) {
  // 9.96 KiB rounds up to 10.0 and drops the decimal
  ASSERT_EQ(format_ibytes(10199), "10 KiB");
}

TEST(elapsed_millisecond_precision) {
  using namespace std::chrono;
  ASSERT_EQ(cmdprof::util::format_elapsed(milliseconds(1234)), "1.234s");
  ASSERT_EQ(cmdprof::util::format_elapsed(milliseconds(0)), "0.000s");
}

TEST(stamp_has_milliseconds) {
  auto s = cmdprof::util::format_stamp(std::chrono::system_clock::time_point(std::chrono::milliseconds(1700000000042)));
  ASSERT_TRUE(s.size() >= 19);
  ASSERT_EQ(s.substr(s.size() - 4), ".042");
}
