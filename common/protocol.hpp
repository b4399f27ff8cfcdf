#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <variant>

#include "payload_telemetry.hpp"

namespace sat_payload::protocol {

// ═══════════════════════════════════════════════════════════════════════════
// Константы протокола
// ═══════════════════════════════════════════════════════════════════════════

inline constexpr size_t HEADER_SIZE = 5;  // cmd_id(1) + seq(2) + len(2)
inline constexpr size_t CRC_SIZE = 2;
inline constexpr size_t MAX_DATA_LENGTH = 240;
inline constexpr size_t ACK_PACKET_SIZE = HEADER_SIZE + 1;  // без CRC
inline constexpr size_t DATA_PACKET_SIZE =
    HEADER_SIZE + MAX_DATA_LENGTH + CRC_SIZE;  // 247
inline constexpr size_t CRC_OFFSET = HEADER_SIZE + MAX_DATA_LENGTH;  // 245

// Пакет файла: поле len (2) + тело (240) образуют запись с префиксом длины
inline constexpr size_t FILE_RECORD_OFFSET = 3;
inline constexpr size_t FILE_RECORD_SIZE = 2 + MAX_DATA_LENGTH;  // 242

inline constexpr size_t SEND_BUFFER_SIZE = 32;
inline constexpr size_t RECV_BUFFER_SIZE = DATA_PACKET_SIZE;

inline constexpr uint8_t PING_VALUE = 0x60;

// ═══════════════════════════════════════════════════════════════════════════
// Идентификаторы команд
// ═══════════════════════════════════════════════════════════════════════════

enum class CommandId : uint8_t {
  PingAck = 0x00,
  Shutdown = 0x01,
  RequestTelemetry = 0x02,
  EnableCameras = 0x03,
  DisableCameras = 0x04,
  CaptureImages = 0x05,
  StartCaptureImagesPeriodically = 0x06,
  StopCaptureImages = 0x07,
  RequestStorageInfo = 0x08,
  RequestImage = 0x09,
  RequestNextFilePacket = 0x0A,
  ClearStorage = 0x0B,
  PingOdStatus = 0x0C,
  RunOd = 0x0D,
  RequestOdResult = 0x0E,
  SynchronizeTime = 0x0F,
  FullReset = 0x10,
  DebugDisplayCamera = 0x11,
  DebugStopDisplay = 0x12
};

inline constexpr uint8_t MAX_COMMAND_ID =
    static_cast<uint8_t>(CommandId::DebugStopDisplay);

[[nodiscard]] inline constexpr bool IsValidCommandId(uint8_t id) noexcept {
  return id <= MAX_COMMAND_ID;
}

/** Статус в ACK/NACK кадре. */
enum class AckStatus : uint8_t { Success = 0x0A, Error = 0x0B };

// ═══════════════════════════════════════════════════════════════════════════
// Коды результата (сторона бортового компьютера)
// ═══════════════════════════════════════════════════════════════════════════

enum class ErrorCode : uint8_t {
  NoResponse,
  Ok,
  InvalidCommand,
  CommandExecutionFailed,
  InvalidPacket,
  InvalidResponse,
  TimeoutShutdown,
  FileNotAvailable,
  NoMoreFilePacket,
  TimeoutBoot
};

[[nodiscard]] const char* ToString(ErrorCode code) noexcept;
[[nodiscard]] const char* ToString(CommandId id) noexcept;

// ═══════════════════════════════════════════════════════════════════════════
// Result type (альтернатива std::expected для C++23)
// ═══════════════════════════════════════════════════════════════════════════

template <typename T>
using Result = std::variant<T, ErrorCode>;

template <typename T>
[[nodiscard]] inline bool IsOk(const Result<T>& r) noexcept {
  return std::holds_alternative<T>(r);
}

template <typename T>
[[nodiscard]] inline bool IsError(const Result<T>& r) noexcept {
  return std::holds_alternative<ErrorCode>(r);
}

template <typename T>
[[nodiscard]] inline const T& GetValue(const Result<T>& r) noexcept {
  return std::get<T>(r);
}

template <typename T>
[[nodiscard]] inline ErrorCode GetError(const Result<T>& r) noexcept {
  return std::get<ErrorCode>(r);
}

// ═══════════════════════════════════════════════════════════════════════════
// Структуры данных
// ═══════════════════════════════════════════════════════════════════════════

/** Общий заголовок входящих кадров. */
struct FrameHeader {
  uint8_t cmd_id{0};
  uint16_t seq{0};
  uint16_t data_len{0};
};

/** Фрагмент файла (до 240 байт). */
struct FileChunk {
  std::array<uint8_t, MAX_DATA_LENGTH> data{};
  uint16_t size{0};

  [[nodiscard]] std::span<const uint8_t> Bytes() const noexcept {
    return std::span<const uint8_t>(data.data(), size);
  }
};

/**
 * Состояние хранилища payload (ответ на REQUEST_STORAGE_INFO).
 * Payload: 9 байт (nb_files:4 + dir_size:4 + disk_usage:1)
 */
struct StorageInfo {
  uint32_t nb_files{0};
  uint32_t dir_size{0};  // KB
  uint8_t disk_usage{0};  // %

  static constexpr size_t PAYLOAD_SIZE = 9;
};

/** Успешно разобранный ответ payload. */
struct DecodedResponse {
  CommandId cmd_id{CommandId::PingAck};
  uint16_t seq{0};
  std::variant<std::monostate, PayloadTelemetry, StorageInfo, FileChunk> body;
};

/**
 * Исходящая команда: cmd_id + аргументы фиксированной ширины.
 * Хранится на стеке, без выделения памяти в куче.
 */
class CommandFrame {
 public:
  explicit CommandFrame(CommandId id) noexcept {
    data_[0] = static_cast<uint8_t>(id);
    size_ = 1;
  }

  /** Добавить байт аргумента. @return false если буфер заполнен */
  bool Append(uint8_t value) noexcept;

  /** Добавить u16 (big-endian). */
  bool AppendU16(uint16_t value) noexcept;

  /** Добавить u32 (big-endian). */
  bool AppendU32(uint32_t value) noexcept;

  [[nodiscard]] CommandId Id() const noexcept {
    return static_cast<CommandId>(data_[0]);
  }

  [[nodiscard]] std::span<const uint8_t> Bytes() const noexcept {
    return std::span<const uint8_t>(data_.data(), size_);
  }

  [[nodiscard]] size_t Size() const noexcept { return size_; }

 private:
  std::array<uint8_t, SEND_BUFFER_SIZE> data_{};
  size_t size_{0};
};

// ═══════════════════════════════════════════════════════════════════════════
// Кодирование команд (бортовой компьютер → payload)
// ═══════════════════════════════════════════════════════════════════════════

/**
 * Сериализация команд. Кадр не оборачивается длиной/CRC:
 * это короткий вызов команды, обрамлением занимается транспорт.
 */
class Encoder {
 public:
  [[nodiscard]] static CommandFrame EncodePing() noexcept;
  [[nodiscard]] static CommandFrame EncodeShutdown() noexcept;
  [[nodiscard]] static CommandFrame EncodeRequestTelemetry() noexcept;
  [[nodiscard]] static CommandFrame EncodeEnableCameras() noexcept;
  [[nodiscard]] static CommandFrame EncodeDisableCameras() noexcept;
  [[nodiscard]] static CommandFrame EncodeCaptureImages() noexcept;

  /**
   * Периодическая съёмка.
   * @param period_s Период между снимками (s)
   * @param nb_images Количество снимков
   */
  [[nodiscard]] static CommandFrame EncodeStartCaptureImagesPeriodically(
      uint16_t period_s, uint16_t nb_images) noexcept;

  [[nodiscard]] static CommandFrame EncodeStopCaptureImages() noexcept;
  [[nodiscard]] static CommandFrame EncodeRequestStorageInfo() noexcept;
  [[nodiscard]] static CommandFrame EncodeRequestImage() noexcept;

  /**
   * Запрос следующего пакета файла.
   * @param packet_nb Номер пакета (нумерация payload начинается с 1)
   */
  [[nodiscard]] static CommandFrame EncodeRequestNextFilePacket(
      uint16_t packet_nb) noexcept;

  [[nodiscard]] static CommandFrame EncodeClearStorage() noexcept;
  [[nodiscard]] static CommandFrame EncodePingOdStatus() noexcept;
  [[nodiscard]] static CommandFrame EncodeRunOd() noexcept;
  [[nodiscard]] static CommandFrame EncodeRequestOdResult() noexcept;

  /**
   * Синхронизация времени payload.
   * @param unix_time Текущее время (s)
   */
  [[nodiscard]] static CommandFrame EncodeSynchronizeTime(
      uint32_t unix_time) noexcept;

  [[nodiscard]] static CommandFrame EncodeFullReset() noexcept;
  [[nodiscard]] static CommandFrame EncodeDebugDisplayCamera() noexcept;
  [[nodiscard]] static CommandFrame EncodeDebugStopDisplay() noexcept;

  /**
   * Произвольная команда без проверки семантики аргументов.
   * @return std::nullopt если аргументы не помещаются в буфер
   */
  [[nodiscard]] static std::optional<CommandFrame> EncodeWithArgs(
      CommandId id, std::span<const uint8_t> args) noexcept;
};

// ═══════════════════════════════════════════════════════════════════════════
// Построение кадров ответа (payload → бортовой компьютер)
// ═══════════════════════════════════════════════════════════════════════════

/**
 * Построитель входящих кадров в формате payload.
 * Используется в тестах и SIL-симуляторе payload.
 */
class ResponseFrameBuilder {
 public:
  /**
   * Построить ACK/NACK кадр (6 байт, без CRC).
   * @return Размер кадра или ErrorCode::InvalidPacket, если буфер мал
   */
  [[nodiscard]] static Result<size_t> BuildAck(std::span<uint8_t> buffer,
                                               uint8_t cmd_id, uint16_t seq,
                                               uint8_t status) noexcept;

  /**
   * Построить Data кадр (247 байт, payload дополняется нулями, CRC16).
   * @return Размер кадра или ErrorCode::InvalidPacket
   */
  [[nodiscard]] static Result<size_t> BuildData(
      std::span<uint8_t> buffer, uint8_t cmd_id, uint16_t seq,
      std::span<const uint8_t> payload) noexcept;

  /**
   * Сериализовать телеметрию (38 байт, big-endian).
   * @return Размер или ErrorCode::InvalidPacket, если буфер мал
   */
  [[nodiscard]] static Result<size_t> SerializeTelemetry(
      std::span<uint8_t> buffer, const PayloadTelemetry& tm) noexcept;
};

// ═══════════════════════════════════════════════════════════════════════════
// Разбор входящих кадров
// ═══════════════════════════════════════════════════════════════════════════

class FrameParser {
 public:
  /**
   * Разобрать 5-байтный заголовок.
   * @return Заголовок или ErrorCode::InvalidPacket
   */
  [[nodiscard]] static Result<FrameHeader> ParseHeader(
      std::span<const uint8_t> buffer) noexcept;

  /**
   * Проверить CRC Data кадра: CRC16 всего кадра вместе с хвостовым
   * полем CRC должна давать остаток 0x0000.
   */
  [[nodiscard]] static bool ValidateCrc(
      std::span<const uint8_t> frame) noexcept;
};

class Decoder {
 public:
  /**
   * Разобрать кадр ответа (6 байт ACK или 247 байт Data).
   * @param frame Полный кадр
   * @return Ответ или код ошибки (InvalidPacket, CommandExecutionFailed,
   *         FileNotAvailable, NoMoreFilePacket, ...)
   */
  [[nodiscard]] static Result<DecodedResponse> Decode(
      std::span<const uint8_t> frame) noexcept;

  /**
   * Разобрать запись телеметрии (без заголовка кадра).
   * @return Телеметрия или ErrorCode::InvalidResponse, если данных мало
   */
  [[nodiscard]] static Result<PayloadTelemetry> ParseTelemetry(
      std::span<const uint8_t> data) noexcept;

  /**
   * Снять внутренний 2-байтный префикс длины с 242-байтной записи
   * пакета файла и вернуть фрагмент.
   */
  [[nodiscard]] static Result<FileChunk> UnwrapFileRecord(
      std::span<const uint8_t> record) noexcept;

 private:
  static Result<DecodedResponse> DecodeAckOnly(
      const FrameHeader& hdr, std::span<const uint8_t> frame) noexcept;
  static Result<DecodedResponse> DecodePing(
      const FrameHeader& hdr, std::span<const uint8_t> frame) noexcept;
  static Result<DecodedResponse> DecodeRequestTelemetry(
      const FrameHeader& hdr, std::span<const uint8_t> frame) noexcept;
  static Result<DecodedResponse> DecodeRequestStorageInfo(
      const FrameHeader& hdr, std::span<const uint8_t> frame) noexcept;
  static Result<DecodedResponse> DecodeRequestImage(
      const FrameHeader& hdr, std::span<const uint8_t> frame) noexcept;
  static Result<DecodedResponse> DecodeRequestNextFilePacket(
      const FrameHeader& hdr, std::span<const uint8_t> frame) noexcept;
};

// ═══════════════════════════════════════════════════════════════════════════
// Утилиты
// ═══════════════════════════════════════════════════════════════════════════

/**
 * CRC16-CCITT: полином 0x1021, начальное значение 0xFFFF, MSB-first,
 * без финального XOR.
 */
[[nodiscard]] uint16_t CalculateCrc16(std::span<const uint8_t> data) noexcept;

}  // namespace sat_payload::protocol
