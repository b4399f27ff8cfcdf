#pragma once

#include <cstddef>
#include <cstdint>

namespace sat_payload::config {

/**
 * @brief Конфигурация контроллера полезной нагрузки (значения по умолчанию)
 */
struct PayloadConfig {
  static constexpr uint32_t kTelemetryPeriodMs =
      10000;  ///< Период запроса телеметрии (10 s)
  static constexpr uint32_t kBootTimeoutMs =
      120000;  ///< Таймаут загрузки payload (120 s)
  static constexpr uint32_t kShutdownTimeoutMs =
      10000;  ///< Таймаут штатного выключения (10 s)
  static constexpr uint32_t kResponseWindowMs =
      15;  ///< Окно ожидания ответа на команду
  static constexpr uint32_t kResponsePollMs = 1;  ///< Шаг опроса транспорта
  static constexpr uint8_t kMaxPacketRetries =
      3;  ///< Повторы одного пакета файла до пропуска
  static constexpr uint8_t kMaxBootAttempts =
      3;  ///< Повторные попытки загрузки после таймаута
};

/**
 * @brief Конфигурация транспорта (разбор пакетов)
 */
struct TransportConfig {
  static constexpr uint32_t kDataBodyTimeoutMs =
      50;  ///< Ожидание тела Data-пакета после заголовка
  static constexpr size_t kRxBufferSize = 1024;  ///< Размер буфера приёма
};

/**
 * @brief Конфигурация UART (POSIX)
 */
struct UartConfig {
  static constexpr uint32_t kBaudRate = 115200;
  static constexpr const char* kDefaultDevice = "/dev/ttyTHS1";
};

/**
 * @brief Конфигурация IPC через именованные каналы (SIL)
 */
struct IpcConfig {
  /// payload читает отсюда, бортовой компьютер пишет
  static constexpr const char* kFifoIn = "/tmp/payload_fifo_in";
  /// payload пишет сюда, бортовой компьютер читает
  static constexpr const char* kFifoOut = "/tmp/payload_fifo_out";
  static constexpr size_t kLineBufferSize = 2048;
};

/**
 * @brief Конфигурация хранилища данных
 */
struct StorageConfig {
  static constexpr const char* kImageTag = "img";
  static constexpr const char* kTelemetryTag = "payload_tm";
  static constexpr const char* kDefaultRoot = "./sd";
};

}  // namespace sat_payload::config
