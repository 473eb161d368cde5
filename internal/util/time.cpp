#include "time.hpp"

namespace streamledger::util {

TimePoint Now() {
  return Clock::now();
}

uint64_t ToUnixSeconds(TimePoint tp) {
  const auto secs = std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
  return secs < 0 ? 0 : static_cast<uint64_t>(secs);
}

uint64_t NowSeconds() {
  return ToUnixSeconds(Now());
}

} // namespace streamledger::util
