#ifndef MESHLINK_UTIL_CLOCK_H
#define MESHLINK_UTIL_CLOCK_H

#include <stdint.h>

namespace meshlink {

// Time source. millis() is monotonic and drives timeouts; epochMillis() is
// wall-clock time used for message and contact timestamps.
class Clock {
 public:
  virtual ~Clock() {}
  virtual uint32_t millis() const = 0;
  virtual uint64_t epochMillis() const = 0;
};

class SystemClock : public Clock {
 public:
  uint32_t millis() const override;
  uint64_t epochMillis() const override;

  static SystemClock& instance();
};

// Signed distance from now to deadline; negative once the deadline passed.
inline int32_t millis_until(uint32_t deadline, uint32_t now) {
  return static_cast<int32_t>(deadline - now);
}

}  // namespace meshlink

#endif  // MESHLINK_UTIL_CLOCK_H
