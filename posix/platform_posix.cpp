#include "platform_posix.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <utility>

namespace sat_payload {

namespace {

uint64_t MonotonicMs() noexcept {
  timespec ts{};
  clock_gettime(CLOCK_MONOTONIC, &ts);
  return static_cast<uint64_t>(ts.tv_sec) * 1000u +
         static_cast<uint64_t>(ts.tv_nsec) / 1000000u;
}

}  // namespace

PlatformPosix::PlatformPosix(std::string power_gpio_path)
    : power_gpio_path_(std::move(power_gpio_path)), start_ms_(MonotonicMs()) {}

// ─────────────────────────────────────────────────────────────────────────
// Время
// ─────────────────────────────────────────────────────────────────────────

uint32_t PlatformPosix::GetTimeMs() const noexcept {
  return static_cast<uint32_t>(MonotonicMs() - start_ms_);
}

uint32_t PlatformPosix::GetUnixTime() const noexcept {
  return static_cast<uint32_t>(std::time(nullptr));
}

void PlatformPosix::DelayMs(uint32_t ms) {
  timespec req{};
  req.tv_sec = static_cast<time_t>(ms / 1000);
  req.tv_nsec = static_cast<long>(ms % 1000) * 1000000L;
  while (nanosleep(&req, &req) != 0 && errno == EINTR) {
  }
}

// ─────────────────────────────────────────────────────────────────────────
// Логирование
// ─────────────────────────────────────────────────────────────────────────

void PlatformPosix::Log(LogLevel level, std::string_view msg) const {
  char tag = 'I';
  FILE* out = stdout;
  switch (level) {
    case LogLevel::Info:
      break;
    case LogLevel::Warning:
      tag = 'W';
      out = stderr;
      break;
    case LogLevel::Error:
      tag = 'E';
      out = stderr;
      break;
  }
  std::fprintf(out, "%c (%u) payload: %.*s\n", tag,
               static_cast<unsigned>(GetTimeMs()),
               static_cast<int>(std::min<size_t>(msg.size(), 1024)),
               msg.data());
  std::fflush(out);
}

// ─────────────────────────────────────────────────────────────────────────
// Питание
// ─────────────────────────────────────────────────────────────────────────

bool PlatformPosix::SetPayloadPower(bool on) {
  if (!power_gpio_path_.empty()) {
    int fd = open(power_gpio_path_.c_str(), O_WRONLY | O_CLOEXEC);
    if (fd < 0) {
      LogF(*this, LogLevel::Error, "open %s: %s", power_gpio_path_.c_str(),
           std::strerror(errno));
      return false;
    }
    const char value = on ? '1' : '0';
    const ssize_t n = write(fd, &value, 1);
    const int write_errno = errno;
    close(fd);
    if (n != 1) {
      LogF(*this, LogLevel::Error, "write %s: %s", power_gpio_path_.c_str(),
           std::strerror(write_errno));
      return false;
    }
  }

  powered_ = on;
  LogF(*this, LogLevel::Info, "Payload power %s", on ? "ON" : "OFF");
  return true;
}

}  // namespace sat_payload
