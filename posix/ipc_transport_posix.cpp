#include "ipc_transport_posix.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <utility>

namespace sat_payload {

namespace {

bool EnsureFifo(const std::string& path) {
  if (mkfifo(path.c_str(), 0666) == 0) {
    return true;
  }
  return errno == EEXIST;
}

}  // namespace

IpcTransportPosix::IpcTransportPosix(PayloadPlatform& platform,
                                     std::string fifo_in, std::string fifo_out)
    : PayloadTransport(platform),
      fifo_in_(std::move(fifo_in)),
      fifo_out_(std::move(fifo_out)) {}

IpcTransportPosix::~IpcTransportPosix() { Close(); }

int IpcTransportPosix::Init() {
  Close();

  for (const std::string* path : {&fifo_in_, &fifo_out_}) {
    if (!EnsureFifo(*path)) {
      LogF(platform_, LogLevel::Error, "mkfifo %s: %s", path->c_str(),
           std::strerror(errno));
      return -1;
    }
  }

  read_fd_ = open(fifo_out_.c_str(), O_RDONLY | O_NONBLOCK | O_CLOEXEC);
  if (read_fd_ < 0) {
    LogF(platform_, LogLevel::Error, "open %s: %s", fifo_out_.c_str(),
         std::strerror(errno));
    return -1;
  }

  if (!OpenWriteSide()) {
    platform_.Log(LogLevel::Warning, "Payload IPC reader not attached yet");
  }
  platform_.Log(LogLevel::Info, "Payload IPC connected");
  return 0;
}

void IpcTransportPosix::Close() {
  if (read_fd_ >= 0) {
    close(read_fd_);
    read_fd_ = -1;
  }
  if (write_fd_ >= 0) {
    close(write_fd_);
    write_fd_ = -1;
  }
  line_buf_.clear();
  decoded_.clear();
}

bool IpcTransportPosix::OpenWriteSide() {
  if (write_fd_ >= 0) {
    return true;
  }
  // ENXIO, пока у FIFO нет читателя
  write_fd_ = open(fifo_in_.c_str(), O_WRONLY | O_NONBLOCK | O_CLOEXEC);
  return write_fd_ >= 0;
}

int IpcTransportPosix::Write(const uint8_t* data, size_t len) {
  if (!OpenWriteSide()) {
    LogF(platform_, LogLevel::Error, "open %s: %s", fifo_in_.c_str(),
         std::strerror(errno));
    return -1;
  }

  std::string line;
  line.reserve(len * 4 + 1);
  for (size_t i = 0; i < len; i++) {
    if (i > 0) line.push_back(' ');
    line += std::to_string(data[i]);
  }
  line.push_back('\n');

  size_t written = 0;
  while (written < line.size()) {
    const ssize_t n =
        write(write_fd_, line.data() + written, line.size() - written);
    if (n > 0) {
      written += static_cast<size_t>(n);
      continue;
    }
    if (n < 0 && errno == EINTR) {
      continue;
    }
    LogF(platform_, LogLevel::Error, "write %s: %s", fifo_in_.c_str(),
         std::strerror(errno));
    if (errno == EPIPE) {
      // Читатель ушёл; откроем заново при следующей отправке
      close(write_fd_);
      write_fd_ = -1;
    }
    return -1;
  }
  return 0;
}

int IpcTransportPosix::ReadAvailable(uint8_t* buf, size_t max_len) {
  std::array<char, config::IpcConfig::kLineBufferSize> raw{};
  const ssize_t n = read(read_fd_, raw.data(), raw.size());
  if (n > 0) {
    line_buf_.append(raw.data(), static_cast<size_t>(n));
    ParseLines();
  } else if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK &&
             errno != EINTR) {
    LogF(platform_, LogLevel::Error, "read %s: %s", fifo_out_.c_str(),
         std::strerror(errno));
    return -1;
  }

  const size_t count = std::min(max_len, decoded_.size());
  if (count == 0) {
    return 0;
  }
  std::copy_n(decoded_.begin(), count, buf);
  decoded_.erase(decoded_.begin(),
                 decoded_.begin() + static_cast<std::ptrdiff_t>(count));
  return static_cast<int>(count);
}

void IpcTransportPosix::ParseLines() {
  size_t eol;
  while ((eol = line_buf_.find('\n')) != std::string::npos) {
    const std::string line = line_buf_.substr(0, eol);
    line_buf_.erase(0, eol + 1);

    std::vector<uint8_t> bytes;
    const char* p = line.c_str();
    bool valid = true;
    while (*p != '\0') {
      if (*p == ' ' || *p == '\t' || *p == '\r') {
        p++;
        continue;
      }
      char* end = nullptr;
      const unsigned long value = std::strtoul(p, &end, 10);
      if (end == p || value > 0xFF) {
        valid = false;
        break;
      }
      bytes.push_back(static_cast<uint8_t>(value));
      p = end;
    }

    if (!valid) {
      LogF(platform_, LogLevel::Error, "Invalid IPC line dropped (%u chars)",
           static_cast<unsigned>(line.size()));
      continue;
    }
    decoded_.insert(decoded_.end(), bytes.begin(), bytes.end());
  }

  // Строка без перевода строки не может быть длиннее кадра в ASCII
  if (line_buf_.size() > config::IpcConfig::kLineBufferSize) {
    platform_.Log(LogLevel::Error, "IPC line overflow, dropping");
    line_buf_.clear();
  }
}

}  // namespace sat_payload
