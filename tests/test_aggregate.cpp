#include "minitest.hpp"
#include "model/Aggregate.hpp"

using cmdprof::model::RunningAggregate;

TEST(aggregate_empty_has_no_summary) {
  RunningAggregate<double> a;
  ASSERT_FALSE(a.finalize().has_value());
  RunningAggregate<uint64_t> b;
  ASSERT_FALSE(b.finalize().has_value());
}

TEST(aggregate_min_max_avg) {
  RunningAggregate<double> a;
  const double values[] = {12.5, 80.0, 3.25, 40.0};
  for (double v : values) a.update(v);
  ASSERT_EQ(a.count, 4u);
  auto s = a.finalize();
  ASSERT_TRUE(s.has_value());
  ASSERT_NEAR(s->min, 3.25, 1e-12);
  ASSERT_NEAR(s->max, 80.0, 1e-12);
  ASSERT_NEAR(s->range, 76.75, 1e-12);
  ASSERT_NEAR(s->avg, (12.5 + 80.0 + 3.25 + 40.0) / 4.0, 1e-12);
  for (double v : values) ASSERT_TRUE(s->min <= v && v <= s->max);
}

TEST(aggregate_single_value) {
  RunningAggregate<double> a;
  a.update(0.0);
  auto s = a.finalize();
  ASSERT_TRUE(s.has_value());
  ASSERT_EQ(s->min, 0.0);
  ASSERT_EQ(s->max, 0.0);
  ASSERT_EQ(s->range, 0.0);
}

TEST(aggregate_bytes_avg_is_fractional) {
  RunningAggregate<uint64_t> a;
  a.update(1);
  a.update(2);
  auto s = a.finalize();
  ASSERT_TRUE(s.has_value());
  ASSERT_EQ(s->min, 1u);
  ASSERT_EQ(s->max, 2u);
  ASSERT_EQ(s->range, 1u);
  ASSERT_NEAR(s->avg, 1.5, 1e-12);
}
