#pragma once

#include <cstdint>
#include <string_view>

namespace sat_payload {

/**
 * @brief Уровни логирования
 */
enum class LogLevel : uint8_t { Info = 0, Warning, Error };

/**
 * @brief Абстрактный интерфейс платформы для PayloadController
 *
 * Предоставляет HAL для управления питанием payload и платформенные сервисы
 * (время, задержка, логирование).
 *
 * Реализация предоставляется целевой платформой (бортовой компьютер,
 * POSIX-хост для SIL).
 *
 * @note Контроллер вызывается из одной кооперативной задачи, поэтому
 * потокобезопасность от реализаций не требуется.
 */
class PayloadPlatform {
 public:
  virtual ~PayloadPlatform() = default;

  // ─────────────────────────────────────────────────────────────────────────
  // Время
  // ─────────────────────────────────────────────────────────────────────────

  /**
   * @brief Текущее время в миллисекундах
   * @return Монотонное время с момента старта системы
   */
  [[nodiscard]] virtual uint32_t GetTimeMs() const noexcept = 0;

  /**
   * @brief Текущее время UTC (для синхронизации часов payload)
   * @return Unix time в секундах
   */
  [[nodiscard]] virtual uint32_t GetUnixTime() const noexcept = 0;

  /**
   * @brief Блокирующая задержка (ожидание ответа внутри одного тика)
   * @param ms Длительность в миллисекундах
   */
  virtual void DelayMs(uint32_t ms) = 0;

  // ─────────────────────────────────────────────────────────────────────────
  // Логирование
  // ─────────────────────────────────────────────────────────────────────────

  /**
   * @brief Вывод лог-сообщения
   * @param level Уровень важности
   * @param msg Текст сообщения (UTF-8)
   */
  virtual void Log(LogLevel level, std::string_view msg) const = 0;

  // ─────────────────────────────────────────────────────────────────────────
  // Питание payload
  // ─────────────────────────────────────────────────────────────────────────

  /**
   * @brief Включить/выключить линию питания payload
   * @param on true: подать питание
   * @return true при успехе
   */
  [[nodiscard]] virtual bool SetPayloadPower(bool on) = 0;

  /**
   * @brief Состояние линии питания payload
   * @return true, если питание подано
   */
  [[nodiscard]] virtual bool IsPayloadPowered() const noexcept = 0;
};

/**
 * @brief Форматированный вывод в лог через PayloadPlatform::Log
 *
 * Сообщение формируется в буфере на стеке (до 200 символов).
 */
void LogF(const PayloadPlatform& platform, LogLevel level, const char* fmt,
          ...) __attribute__((format(printf, 3, 4)));

}  // namespace sat_payload
