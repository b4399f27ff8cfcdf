#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

#include "config.hpp"
#include "payload_platform.hpp"
#include "protocol.hpp"

namespace sat_payload {

// ═══════════════════════════════════════════════════════════════════════════
// Типы данных
// ═══════════════════════════════════════════════════════════════════════════

/** Принятый пакет: 6 байт (ACK) или 247 байт (Data). size == 0: пакета нет. */
struct RxPacket {
  std::array<uint8_t, protocol::DATA_PACKET_SIZE> data{};
  size_t size{0};

  [[nodiscard]] bool Empty() const noexcept { return size == 0; }

  [[nodiscard]] std::span<const uint8_t> Bytes() const noexcept {
    return std::span<const uint8_t>(data.data(), size);
  }
};

// ═══════════════════════════════════════════════════════════════════════════
// Буфер приёма
// ═══════════════════════════════════════════════════════════════════════════

/**
 * Линейный буфер приёма с управлением позицией записи.
 */
class RxBuffer {
 public:
  static constexpr size_t CAPACITY = config::TransportConfig::kRxBufferSize;

  RxBuffer() = default;

  /** Свободное место для записи новых данных. */
  [[nodiscard]] std::span<uint8_t> Available() noexcept {
    return std::span(data_.data() + pos_, CAPACITY - pos_);
  }

  /** Текущие данные в буфере. */
  [[nodiscard]] std::span<const uint8_t> Data() const noexcept {
    return std::span(data_.data(), pos_);
  }

  /**
   * Продвинуть позицию записи на n байт.
   * @param n Количество записанных байт
   */
  void Advance(size_t n) noexcept {
    pos_ += n;
    if (pos_ > CAPACITY) pos_ = CAPACITY;
  }

  /**
   * Потребить n байт из начала буфера.
   * @param n Количество байт для удаления
   */
  void Consume(size_t n) noexcept;

  void Reset() noexcept { pos_ = 0; }

 private:
  std::array<uint8_t, CAPACITY> data_{};
  size_t pos_{0};
};

// ═══════════════════════════════════════════════════════════════════════════
// Базовый класс транспорта до payload
// ═══════════════════════════════════════════════════════════════════════════

/**
 * Базовый класс канала связи с payload (UART на борту, FIFO в SIL).
 * Наследники реализуют Init(), IsConnected(), Write(), ReadAvailable().
 * Выделение пакетов из потока байт (6/247 байт по полю len) выполняется в базе.
 */
class PayloadTransport {
 public:
  virtual ~PayloadTransport() = default;

  /**
   * Инициализация канала.
   * @return 0 при успехе, -1 при ошибке
   */
  virtual int Init() = 0;

  /** Канал открыт и готов к обмену. */
  [[nodiscard]] virtual bool IsConnected() const = 0;

  /** Имя для логов. */
  [[nodiscard]] virtual const char* Name() const { return "transport"; }

  /**
   * Отправить команду.
   * @return 0 при успехе, -1 при ошибке или если канал закрыт
   */
  int Send(std::span<const uint8_t> data);

  /**
   * Принять следующий полный пакет (неблокирующий).
   * @return Пакет; пустой, если полного пакета пока нет
   */
  [[nodiscard]] RxPacket Receive();

  /**
   * Сбросить всё принятое, но не обработанное (устаревшие ответы).
   */
  void FlushRxBuffer();

 protected:
  explicit PayloadTransport(PayloadPlatform& platform) : platform_(platform) {}

  /**
   * Записать в канал (платформенная реализация).
   * @return 0 при успехе, -1 при ошибке
   */
  virtual int Write(const uint8_t* data, size_t len) = 0;

  /**
   * Прочитать доступные байты (неблокирующий, платформенная реализация).
   * @return Число прочитанных байт, 0 если нет данных, -1 при ошибке
   */
  virtual int ReadAvailable(uint8_t* buf, size_t max_len) = 0;

  PayloadPlatform& platform_;

 private:
  static constexpr int kMaxFlushReads = 64;

  RxBuffer rx_buffer_;
  bool body_pending_{false};
  uint32_t body_wait_start_ms_{0};

  /** Прочитать данные из канала в буфер приёма. */
  void PumpRx();

  /** Ожидание тела Data-пакета истекло, буфер нужно сбросить. */
  bool BodyWaitExpired();
};

}  // namespace sat_payload
