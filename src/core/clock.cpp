#include "sme/core/clock.h"

namespace sme::core {

Timestamp SystemClock::now() const {
  return now_utc();
}

Timestamp ManualClock::now() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return now_;
}

void ManualClock::set(const Timestamp ts) {
  std::lock_guard<std::mutex> lock(mutex_);
  now_ = ts;
}

void ManualClock::advance(const Millis delta) {
  std::lock_guard<std::mutex> lock(mutex_);
  now_ += delta;
}

}  // namespace sme::core
