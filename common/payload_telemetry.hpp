#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace sat_payload {

/**
 * Снимок телеметрии полезной нагрузки (ответ на REQUEST_TELEMETRY).
 * Payload: 38 байт, big-endian
 * (3×u32 + 4×u8 + 4×u8 + 4×u8 + 8×u8 + 3×u16).
 */
struct PayloadTelemetry {
  // Время
  uint32_t system_time{0};             // Unix time на стороне payload (s)
  uint32_t system_uptime{0};           // Время с загрузки (s)
  uint32_t last_executed_cmd_time{0};  // Unix time последней команды (s)

  // Состояние
  uint8_t last_executed_cmd_id{0};
  uint8_t payload_state{0};
  uint8_t active_cameras{0};
  uint8_t capture_mode{0};
  std::array<uint8_t, 4> cam_status{};  // По одному байту на камеру

  // Задачи и хранилище
  uint8_t imu_status{0};
  uint8_t tasks_in_execution{0};
  uint8_t disk_usage{0};  // %
  uint8_t latest_error{0};

  // tegrastats
  uint8_t tegrastats_process_status{0};
  uint8_t ram_usage{0};   // %
  uint8_t swap_usage{0};  // %
  uint8_t active_cores{0};
  uint8_t cpu_load{0};  // %
  uint8_t gpu_freq{0};  // %
  uint8_t cpu_temp{0};  // °C
  uint8_t gpu_temp{0};  // °C

  // Питание (mW)
  uint16_t vdd_in{0};
  uint16_t vdd_cpu_gpu_cv{0};
  uint16_t vdd_soc{0};

  static constexpr size_t PAYLOAD_SIZE = 38;

  /** Количество активных камер по битовой маске active_cameras. */
  [[nodiscard]] int ActiveCameraCount() const noexcept {
    int count = 0;
    for (int i = 0; i < 4; i++) {
      if (active_cameras & (1u << i)) count++;
    }
    return count;
  }
};

}  // namespace sat_payload
