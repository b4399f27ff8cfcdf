#include "payload_transport.hpp"

#include <cstring>

namespace sat_payload {

// ═══════════════════════════════════════════════════════════════════════════
// RxBuffer - реализация
// ═══════════════════════════════════════════════════════════════════════════

void RxBuffer::Consume(size_t n) noexcept {
  if (n == 0 || n > pos_) return;

  std::memmove(data_.data(), data_.data() + n, pos_ - n);
  pos_ -= n;
}

// ═══════════════════════════════════════════════════════════════════════════
// PayloadTransport - реализация
// ═══════════════════════════════════════════════════════════════════════════

int PayloadTransport::Send(std::span<const uint8_t> data) {
  if (!IsConnected()) {
    platform_.Log(LogLevel::Error, "Attempt to send while not connected");
    return -1;
  }
  return Write(data.data(), data.size());
}

void PayloadTransport::PumpRx() {
  auto available = rx_buffer_.Available();
  if (available.empty()) {
    return;
  }
  int n = ReadAvailable(available.data(), available.size());
  if (n > 0) {
    rx_buffer_.Advance(static_cast<size_t>(n));
  }
}

bool PayloadTransport::BodyWaitExpired() {
  const uint32_t now = platform_.GetTimeMs();
  if (!body_pending_) {
    body_pending_ = true;
    body_wait_start_ms_ = now;
    return false;
  }
  return now - body_wait_start_ms_ > config::TransportConfig::kDataBodyTimeoutMs;
}

RxPacket PayloadTransport::Receive() {
  RxPacket packet;
  if (!IsConnected()) {
    return packet;
  }

  PumpRx();

  auto data = rx_buffer_.Data();

  // Минимальный пакет: ACK (6 байт)
  if (data.size() < protocol::ACK_PACKET_SIZE) {
    return packet;
  }

  // Нулевой заголовок: мусор на линии, сбрасываем всё
  bool all_zero = true;
  for (size_t i = 0; i < protocol::HEADER_SIZE; i++) {
    if (data[i] != 0) {
      all_zero = false;
      break;
    }
  }
  if (all_zero) {
    platform_.Log(LogLevel::Warning, "Zero header on payload link, flushing");
    FlushRxBuffer();
    return packet;
  }

  // Размер пакета определяется полем len
  const uint16_t data_len = static_cast<uint16_t>((data[3] << 8) | data[4]);
  const size_t packet_size = (data_len == 1) ? protocol::ACK_PACKET_SIZE
                                             : protocol::DATA_PACKET_SIZE;

  if (data.size() < packet_size) {
    // Тело Data-пакета ещё не пришло
    if (BodyWaitExpired()) {
      LogF(platform_, LogLevel::Error,
           "Timeout waiting for data packet body: need %u bytes, have %u",
           static_cast<unsigned>(packet_size),
           static_cast<unsigned>(data.size()));
      rx_buffer_.Reset();
      body_pending_ = false;
    }
    return packet;
  }

  std::memcpy(packet.data.data(), data.data(), packet_size);
  packet.size = packet_size;
  rx_buffer_.Consume(packet_size);
  body_pending_ = false;
  return packet;
}

void PayloadTransport::FlushRxBuffer() {
  rx_buffer_.Reset();
  body_pending_ = false;

  if (!IsConnected()) {
    return;
  }

  // Вычитываем всё, что уже лежит в канале
  std::array<uint8_t, 256> scratch{};
  for (int i = 0; i < kMaxFlushReads; i++) {
    int n = ReadAvailable(scratch.data(), scratch.size());
    if (n <= 0) {
      break;
    }
  }
}

}  // namespace sat_payload
