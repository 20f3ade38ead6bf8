#include "time.hpp"

#include <cstdio>
#include <ctime>
#include <stdexcept>

namespace entitystore::util {

TimePoint Now() {
  return Clock::now();
}

std::string ToIsoString(TimePoint tp) {
  const auto secs   = std::chrono::time_point_cast<std::chrono::seconds>(tp);
  auto       micros = std::chrono::duration_cast<std::chrono::microseconds>(tp - secs).count();
  auto       t      = Clock::to_time_t(secs);
  if (micros < 0) {
    micros += 1000000;
    t -= 1;
  }

  std::tm utc{};
  gmtime_r(&t, &utc);

  char buffer[64];
  std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02d.%06lld+00:00", utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday,
                utc.tm_hour, utc.tm_min, utc.tm_sec, static_cast<long long>(micros));
  return buffer;
}

TimePoint FromIsoString(const std::string& text) {
  std::tm utc{};
  int     consumed = 0;
  if (std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n", &utc.tm_year, &utc.tm_mon, &utc.tm_mday, &utc.tm_hour, &utc.tm_min,
                  &utc.tm_sec, &consumed) != 6) {
    throw std::invalid_argument("invalid ISO-8601 timestamp: " + text);
  }
  utc.tm_year -= 1900;
  utc.tm_mon -= 1;

  std::size_t pos    = static_cast<std::size_t>(consumed);
  long long   micros = 0;
  if (pos < text.size() && text[pos] == '.') {
    ++pos;
    int digits = 0;
    while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
      if (digits < 6) {
        micros = micros * 10 + (text[pos] - '0');
        ++digits;
      }
      ++pos;
    }
    for (; digits < 6; ++digits)
      micros *= 10;
  }

  long offset_seconds = 0;
  if (pos < text.size()) {
    const char sign = text[pos];
    if (sign == 'Z') {
      ++pos;
    } else if (sign == '+' || sign == '-') {
      int hours = 0, minutes = 0;
      if (std::sscanf(text.c_str() + pos + 1, "%2d:%2d", &hours, &minutes) != 2) {
        throw std::invalid_argument("invalid ISO-8601 offset: " + text);
      }
      offset_seconds = (hours * 3600L + minutes * 60L) * (sign == '+' ? 1 : -1);
      pos += 6;
    }
  }
  if (pos != text.size()) {
    throw std::invalid_argument("trailing characters in ISO-8601 timestamp: " + text);
  }

  const std::time_t t = timegm(&utc) - offset_seconds;
  return Clock::from_time_t(t) + std::chrono::microseconds(micros);
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

} // namespace entitystore::util
