#pragma once
#include <cstdint>
#include <limits>
#include <optional>

namespace cmdprof::model {

template <typename T>
struct AggregateSummary {
  T min{};
  T max{};
  T range{};
  double avg{};
};

// Running min/max/sum/count for one metric.
template <typename T>
struct RunningAggregate {
  T min{std::numeric_limits<T>::max()};
  T max{std::numeric_limits<T>::lowest()};
  T sum{};
  uint64_t count{0};

  void update(T value) {
    if (value < min) min = value;
    if (value > max) max = value;
    sum += value;
    ++count;
  }

  // Empty when nothing was recorded; callers report "no data".
  [[nodiscard]] std::optional<AggregateSummary<T>> finalize() const {
    if (count == 0) return std::nullopt;
    AggregateSummary<T> s{};
    s.min = min;
    s.max = max;
    s.range = max - min;
    s.avg = static_cast<double>(sum) / static_cast<double>(count);
    return s;
  }
};

struct SessionAggregates {
  RunningAggregate<double> cpu_pct{};
  RunningAggregate<uint64_t> mem_used{};
  RunningAggregate<double> gpu_pct{};
  uint64_t ticks{0};
};

} // namespace cmdprof::model
