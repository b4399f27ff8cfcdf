#pragma once

#include <string>

#include "config.hpp"
#include "payload_transport.hpp"

namespace sat_payload {

/**
 * Канал до payload через последовательный порт (termios).
 * 8N1, raw, неблокирующий режим.
 */
class UartTransportPosix : public PayloadTransport {
 public:
  UartTransportPosix(PayloadPlatform& platform, std::string device,
                     uint32_t baud_rate = config::UartConfig::kBaudRate);
  ~UartTransportPosix() override;

  UartTransportPosix(const UartTransportPosix&) = delete;
  UartTransportPosix& operator=(const UartTransportPosix&) = delete;

  int Init() override;
  [[nodiscard]] bool IsConnected() const override { return fd_ >= 0; }
  [[nodiscard]] const char* Name() const override { return device_.c_str(); }

  void Close();

 protected:
  int Write(const uint8_t* data, size_t len) override;
  int ReadAvailable(uint8_t* buf, size_t max_len) override;

 private:
  std::string device_;
  uint32_t baud_rate_;
  int fd_{-1};
};

}  // namespace sat_payload
