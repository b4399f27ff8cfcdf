#pragma once

#include <string>

#include "payload_platform.hpp"

namespace sat_payload {

/**
 * @brief Реализация PayloadPlatform для Linux-хоста
 *
 * - Время: CLOCK_MONOTONIC относительно момента создания
 * - Лог: stdout (Info) и stderr (Warning/Error)
 * - Питание: запись "1"/"0" в sysfs GPIO value, либо флаг в памяти (SIL)
 */
class PlatformPosix : public PayloadPlatform {
 public:
  /**
   * @param power_gpio_path Путь к /sys/class/gpio/gpioN/value; пустой:
   *        питание только моделируется
   */
  explicit PlatformPosix(std::string power_gpio_path = {});

  [[nodiscard]] uint32_t GetTimeMs() const noexcept override;
  [[nodiscard]] uint32_t GetUnixTime() const noexcept override;
  void DelayMs(uint32_t ms) override;

  void Log(LogLevel level, std::string_view msg) const override;

  [[nodiscard]] bool SetPayloadPower(bool on) override;
  [[nodiscard]] bool IsPayloadPowered() const noexcept override {
    return powered_;
  }

 private:
  std::string power_gpio_path_;
  uint64_t start_ms_{0};
  bool powered_{false};
};

}  // namespace sat_payload
