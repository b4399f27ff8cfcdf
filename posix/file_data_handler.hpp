#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <string>

#include "data_handler.hpp"
#include "payload_platform.hpp"

namespace sat_payload {

/**
 * @brief Хранилище данных в каталоге хоста
 *
 * Раскладка:
 * - <root>/<tag>/<tag>_<n>.bin: файлы процесса, n растёт после FileCompleted
 * - <root>/payload_tm.bin: записи телеметрии по 38 байт (big-endian)
 */
class FileDataHandler : public DataHandler {
 public:
  FileDataHandler(PayloadPlatform& platform, std::filesystem::path root);

  [[nodiscard]] bool FileProcessExists(std::string_view tag) const override;
  [[nodiscard]] bool RegisterFileProcess(std::string_view tag) override;
  void LogFile(std::string_view tag, std::span<const uint8_t> chunk) override;
  void FileCompleted(std::string_view tag) override;
  void LogTelemetry(const PayloadTelemetry& tm) override;

  /** Путь к текущему (или следующему) файлу процесса. */
  [[nodiscard]] std::filesystem::path CurrentFilePath(
      std::string_view tag) const;

 private:
  struct FileProcess {
    std::filesystem::path dir;
    uint32_t index{0};
    std::ofstream out;
  };

  PayloadPlatform& platform_;
  std::filesystem::path root_;
  std::map<std::string, FileProcess, std::less<>> processes_;
};

}  // namespace sat_payload
