#pragma once

#include <chrono>

namespace reclaim {

using TimePoint = std::chrono::system_clock::time_point;

// The zero time: tasks due at asap are eligible on the next pass.
inline constexpr TimePoint asap{};

namespace util {

class Clock {
public:
  virtual ~Clock() = default;
  virtual TimePoint now() const = 0;
};

class SystemClock final : public Clock {
public:
  TimePoint now() const override { return std::chrono::system_clock::now(); }
};

} // namespace util
} // namespace reclaim
