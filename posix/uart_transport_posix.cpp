#include "uart_transport_posix.hpp"

#include <fcntl.h>
#include <poll.h>
#include <termios.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <utility>

namespace sat_payload {

namespace {

constexpr int kWritePollMs = 20;

speed_t ToSpeed(uint32_t baud_rate) noexcept {
  switch (baud_rate) {
    case 9600:
      return B9600;
    case 19200:
      return B19200;
    case 38400:
      return B38400;
    case 57600:
      return B57600;
    case 115200:
      return B115200;
    case 230400:
      return B230400;
    case 460800:
      return B460800;
    case 921600:
      return B921600;
    default:
      return B0;
  }
}

}  // namespace

UartTransportPosix::UartTransportPosix(PayloadPlatform& platform,
                                       std::string device, uint32_t baud_rate)
    : PayloadTransport(platform),
      device_(std::move(device)),
      baud_rate_(baud_rate) {}

UartTransportPosix::~UartTransportPosix() { Close(); }

int UartTransportPosix::Init() {
  Close();

  const speed_t speed = ToSpeed(baud_rate_);
  if (speed == B0) {
    LogF(platform_, LogLevel::Error, "Unsupported baud rate %u",
         static_cast<unsigned>(baud_rate_));
    return -1;
  }

  int fd = open(device_.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK | O_CLOEXEC);
  if (fd < 0) {
    LogF(platform_, LogLevel::Error, "open %s: %s", device_.c_str(),
         std::strerror(errno));
    return -1;
  }

  termios tty{};
  if (tcgetattr(fd, &tty) != 0) {
    LogF(platform_, LogLevel::Error, "tcgetattr %s: %s", device_.c_str(),
         std::strerror(errno));
    close(fd);
    return -1;
  }

  cfmakeraw(&tty);
  cfsetispeed(&tty, speed);
  cfsetospeed(&tty, speed);

  // 8N1, без аппаратного управления потоком
  tty.c_cflag &= ~(PARENB | CSTOPB | CSIZE | CRTSCTS);
  tty.c_cflag |= CS8 | CLOCAL | CREAD;
  tty.c_cc[VMIN] = 0;
  tty.c_cc[VTIME] = 0;

  if (tcsetattr(fd, TCSANOW, &tty) != 0) {
    LogF(platform_, LogLevel::Error, "tcsetattr %s: %s", device_.c_str(),
         std::strerror(errno));
    close(fd);
    return -1;
  }
  tcflush(fd, TCIOFLUSH);

  fd_ = fd;
  LogF(platform_, LogLevel::Info, "UART %s opened at %u baud", device_.c_str(),
       static_cast<unsigned>(baud_rate_));
  return 0;
}

void UartTransportPosix::Close() {
  if (fd_ >= 0) {
    close(fd_);
    fd_ = -1;
  }
}

int UartTransportPosix::Write(const uint8_t* data, size_t len) {
  size_t written = 0;
  while (written < len) {
    const ssize_t n = write(fd_, data + written, len - written);
    if (n > 0) {
      written += static_cast<size_t>(n);
      continue;
    }
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      pollfd pfd{fd_, POLLOUT, 0};
      if (poll(&pfd, 1, kWritePollMs) > 0) {
        continue;
      }
      platform_.Log(LogLevel::Error, "UART write timeout");
      return -1;
    }
    LogF(platform_, LogLevel::Error, "UART write: %s", std::strerror(errno));
    return -1;
  }
  return 0;
}

int UartTransportPosix::ReadAvailable(uint8_t* buf, size_t max_len) {
  const ssize_t n = read(fd_, buf, max_len);
  if (n >= 0) {
    return static_cast<int>(n);
  }
  if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
    return 0;
  }
  LogF(platform_, LogLevel::Error, "UART read: %s", std::strerror(errno));
  return -1;
}

}  // namespace sat_payload
