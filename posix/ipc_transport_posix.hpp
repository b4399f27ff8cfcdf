#pragma once

#include <string>
#include <vector>

#include "config.hpp"
#include "payload_transport.hpp"

namespace sat_payload {

/**
 * Канал до payload через именованные каналы (SIL на хосте).
 *
 * Каждый пакет передаётся одной строкой десятичных значений байт через
 * пробел, например "0 0 0 0 1 96\n". Сторона записи открывается лениво:
 * пока процесс payload не открыл свой FIFO на чтение, Send() возвращает -1.
 */
class IpcTransportPosix : public PayloadTransport {
 public:
  IpcTransportPosix(PayloadPlatform& platform,
                    std::string fifo_in = config::IpcConfig::kFifoIn,
                    std::string fifo_out = config::IpcConfig::kFifoOut);
  ~IpcTransportPosix() override;

  IpcTransportPosix(const IpcTransportPosix&) = delete;
  IpcTransportPosix& operator=(const IpcTransportPosix&) = delete;

  int Init() override;
  [[nodiscard]] bool IsConnected() const override { return read_fd_ >= 0; }
  [[nodiscard]] const char* Name() const override { return "ipc"; }

  void Close();

 protected:
  int Write(const uint8_t* data, size_t len) override;
  int ReadAvailable(uint8_t* buf, size_t max_len) override;

 private:
  bool OpenWriteSide();

  /** Разобрать накопленные полные строки в decoded_. */
  void ParseLines();

  std::string fifo_in_;   ///< payload читает, мы пишем
  std::string fifo_out_;  ///< payload пишет, мы читаем
  int read_fd_{-1};
  int write_fd_{-1};

  std::string line_buf_;
  std::vector<uint8_t> decoded_;
};

}  // namespace sat_payload
