#pragma once

#include <atomic>
#include <cstdint>
#include <string>

namespace fitscore::core {

// Abstract clock interface for timestamp injection.
// Production code stamps results with system time; tests use fixed timestamps so that
// evaluations are bit-identical across calls.
// Following C++ Core Guidelines I.25: Prefer abstract classes as interfaces to class hierarchies.
class IClock {
 public:
  virtual ~IClock() = default;

  // Return current time as microseconds since the Unix epoch (UTC).
  // Contract: successive calls on one instance never return a smaller value.
  virtual std::int64_t now_unix_micros() = 0;

 protected:
  IClock() = default;
  IClock(const IClock&) = default;
  IClock& operator=(const IClock&) = default;
  IClock(IClock&&) = default;
  IClock& operator=(IClock&&) = default;
};

// Production clock: system time, forced strictly increasing so that two results produced
// within the same microsecond still carry ordered calculated_at values. Thread-safe.
class SystemClock final : public IClock {
 public:
  SystemClock() = default;
  ~SystemClock() override = default;

  // Not copyable or movable (contains atomic state)
  SystemClock(const SystemClock&) = delete;
  SystemClock& operator=(const SystemClock&) = delete;
  SystemClock(SystemClock&&) = delete;
  SystemClock& operator=(SystemClock&&) = delete;

  std::int64_t now_unix_micros() override;

 private:
  std::atomic<std::int64_t> last_{0};
};

// Fixed clock: returns a constant timestamp for deterministic tests/demos.
class FixedClock final : public IClock {
 public:
  explicit FixedClock(std::int64_t fixed_micros) : fixed_micros_(fixed_micros) {}
  ~FixedClock() override = default;

  FixedClock(const FixedClock&) = default;
  FixedClock& operator=(const FixedClock&) = default;
  FixedClock(FixedClock&&) = default;
  FixedClock& operator=(FixedClock&&) = default;

  std::int64_t now_unix_micros() override { return fixed_micros_; }

 private:
  std::int64_t fixed_micros_;
};

// Format microseconds since epoch as ISO 8601 UTC with second precision.
[[nodiscard]] std::string to_iso8601(std::int64_t unix_micros);

}  // namespace fitscore::core
