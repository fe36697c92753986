#pragma once

#include "sme/core/time.h"

#include <mutex>

namespace sme::core {

// Abstract clock interface for time injection.
// The eviction cache reads time only through this interface so tests can drive TTL
// expiry and entry ageing deterministically.
class IClock {
 public:
  virtual ~IClock() = default;

  [[nodiscard]] virtual Timestamp now() const = 0;

 protected:
  IClock() = default;
  IClock(const IClock&) = default;
  IClock& operator=(const IClock&) = default;
  IClock(IClock&&) = default;
  IClock& operator=(IClock&&) = default;
};

// Production clock: returns actual system time.
class SystemClock final : public IClock {
 public:
  SystemClock() = default;
  ~SystemClock() override = default;

  SystemClock(const SystemClock&) = default;
  SystemClock& operator=(const SystemClock&) = default;
  SystemClock(SystemClock&&) = default;
  SystemClock& operator=(SystemClock&&) = default;

  [[nodiscard]] Timestamp now() const override;
};

// Manual clock: time only moves when the owner says so.
// Thread-safe so one instance can back a cache shared between threads in tests.
class ManualClock final : public IClock {
 public:
  explicit ManualClock(Timestamp start = Timestamp{}) : now_(start) {}
  ~ManualClock() override = default;

  // Not copyable or movable (contains mutex)
  ManualClock(const ManualClock&) = delete;
  ManualClock& operator=(const ManualClock&) = delete;
  ManualClock(ManualClock&&) = delete;
  ManualClock& operator=(ManualClock&&) = delete;

  [[nodiscard]] Timestamp now() const override;

  void set(Timestamp ts);
  void advance(Millis delta);

 private:
  mutable std::mutex mutex_;
  Timestamp now_;
};

}  // namespace sme::core
