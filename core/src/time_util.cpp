#include "rlk/time_util.h"

#include <chrono>
#include <ctime>

namespace rlk {

namespace {
std::string format_utc(const char* fmt) {
  const auto tt = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm tm{};
  gmtime_r(&tt, &tm);
  char buf[32];
  const size_t len = std::strftime(buf, sizeof(buf), fmt, &tm);
  return std::string(buf, len);
}
} // namespace

std::string now_iso_utc() {
  return format_utc("%Y-%m-%dT%H:%M:%SZ");
}

std::string now_stamp() {
  return format_utc("%Y%m%d_%H%M%S");
}

} // namespace rlk
