#include "payload_platform.hpp"

#include <cstdarg>
#include <cstdio>

namespace sat_payload {

void LogF(const PayloadPlatform& platform, LogLevel level, const char* fmt,
          ...) {
  char buf[201];
  va_list args;
  va_start(args, fmt);
  int n = vsnprintf(buf, sizeof(buf), fmt, args);
  va_end(args);
  if (n <= 0) return;
  size_t len = static_cast<size_t>(n) < sizeof(buf) - 1
                   ? static_cast<size_t>(n)
                   : sizeof(buf) - 1;
  platform.Log(level, std::string_view(buf, len));
}

}  // namespace sat_payload
