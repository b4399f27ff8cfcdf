#include "file_data_handler.hpp"

#include <array>
#include <system_error>
#include <utility>

#include "config.hpp"
#include "protocol.hpp"

namespace sat_payload {

namespace fs = std::filesystem;

namespace {

std::string FileName(std::string_view tag, uint32_t index) {
  return std::string(tag) + "_" + std::to_string(index) + ".bin";
}

}  // namespace

FileDataHandler::FileDataHandler(PayloadPlatform& platform, fs::path root)
    : platform_(platform), root_(std::move(root)) {}

bool FileDataHandler::FileProcessExists(std::string_view tag) const {
  return processes_.find(tag) != processes_.end();
}

bool FileDataHandler::RegisterFileProcess(std::string_view tag) {
  if (FileProcessExists(tag)) {
    return true;
  }

  FileProcess process;
  process.dir = root_ / std::string(tag);
  std::error_code ec;
  fs::create_directories(process.dir, ec);
  if (ec) {
    LogF(platform_, LogLevel::Error, "Cannot create %s: %s",
         process.dir.c_str(), ec.message().c_str());
    return false;
  }

  // Не перезаписываем файлы предыдущих запусков
  while (fs::exists(process.dir / FileName(tag, process.index), ec)) {
    process.index++;
  }

  processes_.emplace(std::string(tag), std::move(process));
  return true;
}

void FileDataHandler::LogFile(std::string_view tag,
                              std::span<const uint8_t> chunk) {
  auto it = processes_.find(tag);
  if (it == processes_.end()) {
    LogF(platform_, LogLevel::Error, "LogFile: unknown file process '%.*s'",
         static_cast<int>(tag.size()), tag.data());
    return;
  }

  FileProcess& process = it->second;
  if (!process.out.is_open()) {
    const fs::path path = process.dir / FileName(tag, process.index);
    process.out.open(path, std::ios::binary | std::ios::app);
    if (!process.out) {
      LogF(platform_, LogLevel::Error, "Cannot open %s", path.c_str());
      process.out.clear();
      return;
    }
  }

  process.out.write(reinterpret_cast<const char*>(chunk.data()),
                    static_cast<std::streamsize>(chunk.size()));
  if (!process.out) {
    platform_.Log(LogLevel::Error, "File write failed");
    process.out.clear();
  }
}

void FileDataHandler::FileCompleted(std::string_view tag) {
  auto it = processes_.find(tag);
  if (it == processes_.end()) {
    return;
  }

  FileProcess& process = it->second;
  if (process.out.is_open()) {
    process.out.close();
    LogF(platform_, LogLevel::Info, "File %s closed",
         (process.dir / FileName(tag, process.index)).c_str());
    process.index++;
  }
}

void FileDataHandler::LogTelemetry(const PayloadTelemetry& tm) {
  std::array<uint8_t, PayloadTelemetry::PAYLOAD_SIZE> record{};
  const auto size =
      protocol::ResponseFrameBuilder::SerializeTelemetry(record, tm);
  if (protocol::IsError(size)) {
    platform_.Log(LogLevel::Error, "Telemetry serialization failed");
    return;
  }

  std::error_code ec;
  fs::create_directories(root_, ec);
  const fs::path path =
      root_ / (std::string(config::StorageConfig::kTelemetryTag) + ".bin");
  std::ofstream out(path, std::ios::binary | std::ios::app);
  out.write(reinterpret_cast<const char*>(record.data()),
            static_cast<std::streamsize>(protocol::GetValue(size)));
  if (!out) {
    LogF(platform_, LogLevel::Error, "Cannot append telemetry to %s",
         path.c_str());
  }
}

fs::path FileDataHandler::CurrentFilePath(std::string_view tag) const {
  auto it = processes_.find(tag);
  if (it == processes_.end()) {
    return {};
  }
  return it->second.dir / FileName(tag, it->second.index);
}

}  // namespace sat_payload
