#pragma once

#include <cstdint>
#include <span>
#include <string_view>

#include "payload_telemetry.hpp"

namespace sat_payload {

/**
 * @brief Интерфейс хранилища данных (SD-карта бортового компьютера)
 *
 * Принимает фрагменты файлов от PayloadController и телеметрию payload.
 * Файловый процесс идентифицируется тегом (например, "img").
 */
class DataHandler {
 public:
  virtual ~DataHandler() = default;

  /**
   * @brief Существует ли файловый процесс с тегом
   */
  [[nodiscard]] virtual bool FileProcessExists(std::string_view tag) const = 0;

  /**
   * @brief Зарегистрировать файловый процесс
   * @return true при успехе (или если уже существует)
   */
  [[nodiscard]] virtual bool RegisterFileProcess(std::string_view tag) = 0;

  /**
   * @brief Дописать фрагмент в текущий файл процесса
   * @param tag Тег процесса
   * @param chunk Данные фрагмента
   */
  virtual void LogFile(std::string_view tag,
                       std::span<const uint8_t> chunk) = 0;

  /**
   * @brief Закрыть текущий файл процесса (следующий LogFile откроет новый)
   */
  virtual void FileCompleted(std::string_view tag) = 0;

  /**
   * @brief Сохранить снимок телеметрии payload
   */
  virtual void LogTelemetry(const PayloadTelemetry& tm) = 0;
};

}  // namespace sat_payload
