#pragma once

#include <cstdint>

#include "config.hpp"

namespace sat_payload {

/**
 * @brief Параметры контроллера полезной нагрузки (runtime)
 *
 * Значения по умолчанию берутся из config::PayloadConfig. Позволяет
 * переопределить тайминги для SIL и наземных испытаний.
 */
struct PayloadControllerConfig {
  /** Период запроса телеметрии в состоянии Ready (мс). Диапазон: 100–3600000 */
  uint32_t telemetry_period_ms{config::PayloadConfig::kTelemetryPeriodMs};

  /** Таймаут загрузки payload (мс). Диапазон: 1000–600000 */
  uint32_t boot_timeout_ms{config::PayloadConfig::kBootTimeoutMs};

  /** Таймаут штатного выключения (мс). Диапазон: 100–120000 */
  uint32_t shutdown_timeout_ms{config::PayloadConfig::kShutdownTimeoutMs};

  /**
   * Окно ожидания ответа (мс). Контроллер блокирует вызывающую задачу на это
   * время в худшем случае. Диапазон: 1–1000
   */
  uint32_t response_window_ms{config::PayloadConfig::kResponseWindowMs};

  /** Шаг опроса транспорта внутри окна (мс). 1 ≤ шаг ≤ окно */
  uint32_t response_poll_ms{config::PayloadConfig::kResponsePollMs};

  /** Попыток на один пакет файла перед пропуском. Диапазон: 1–10 */
  uint8_t max_packet_retries{config::PayloadConfig::kMaxPacketRetries};

  /** Автоматических повторов загрузки после таймаута. Диапазон: 0–10 */
  uint8_t max_boot_attempts{config::PayloadConfig::kMaxBootAttempts};

  /**
   * @brief Проверить валидность конфигурации
   * @return true если все параметры в допустимых диапазонах
   */
  [[nodiscard]] bool IsValid() const noexcept {
    return telemetry_period_ms >= 100 && telemetry_period_ms <= 3600000 &&
           boot_timeout_ms >= 1000 && boot_timeout_ms <= 600000 &&
           shutdown_timeout_ms >= 100 && shutdown_timeout_ms <= 120000 &&
           response_window_ms >= 1 && response_window_ms <= 1000 &&
           response_poll_ms >= 1 && response_poll_ms <= response_window_ms &&
           max_packet_retries >= 1 && max_packet_retries <= 10 &&
           max_boot_attempts <= 10;
  }

  /**
   * @brief Сбросить к значениям по умолчанию
   */
  void Reset() noexcept {
    telemetry_period_ms = config::PayloadConfig::kTelemetryPeriodMs;
    boot_timeout_ms = config::PayloadConfig::kBootTimeoutMs;
    shutdown_timeout_ms = config::PayloadConfig::kShutdownTimeoutMs;
    response_window_ms = config::PayloadConfig::kResponseWindowMs;
    response_poll_ms = config::PayloadConfig::kResponsePollMs;
    max_packet_retries = config::PayloadConfig::kMaxPacketRetries;
    max_boot_attempts = config::PayloadConfig::kMaxBootAttempts;
  }

  /**
   * @brief Применить ограничения к параметрам
   */
  void Clamp() noexcept {
    if (telemetry_period_ms < 100) telemetry_period_ms = 100;
    if (telemetry_period_ms > 3600000) telemetry_period_ms = 3600000;
    if (boot_timeout_ms < 1000) boot_timeout_ms = 1000;
    if (boot_timeout_ms > 600000) boot_timeout_ms = 600000;
    if (shutdown_timeout_ms < 100) shutdown_timeout_ms = 100;
    if (shutdown_timeout_ms > 120000) shutdown_timeout_ms = 120000;
    if (response_window_ms < 1) response_window_ms = 1;
    if (response_window_ms > 1000) response_window_ms = 1000;
    if (response_poll_ms < 1) response_poll_ms = 1;
    if (response_poll_ms > response_window_ms) {
      response_poll_ms = response_window_ms;
    }
    if (max_packet_retries < 1) max_packet_retries = 1;
    if (max_packet_retries > 10) max_packet_retries = 10;
    if (max_boot_attempts > 10) max_boot_attempts = 10;
  }
};

}  // namespace sat_payload
