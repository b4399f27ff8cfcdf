#pragma once

#include <cstdint>

#include "data_handler.hpp"
#include "file_transfer.hpp"
#include "payload_controller_config.hpp"
#include "payload_platform.hpp"
#include "payload_telemetry.hpp"
#include "payload_transport.hpp"
#include "protocol.hpp"

namespace sat_payload {

/**
 * @brief Состояние полезной нагрузки
 */
enum class PayloadState : uint8_t {
  Off = 0,     ///< Питание снято
  PoweringOn,  ///< Питание подано, ждём ответа на PING
  Ready,       ///< Payload отвечает, можно выполнять команды
  ShuttingDown ///< Отправлен SHUTDOWN, ждём подтверждения или таймаута
};

/**
 * @brief Внешний запрос к контроллеру (очередь глубиной 1)
 */
enum class ExternalRequest : uint8_t {
  NoAction = 0,
  TurnOn,
  TurnOff,
  Reboot,
  RequestImage,
  ClearStorage,
  ForcePowerOff
};

inline constexpr uint8_t MAX_EXTERNAL_REQUEST =
    static_cast<uint8_t>(ExternalRequest::ForcePowerOff);

[[nodiscard]] const char* ToString(PayloadState state) noexcept;
[[nodiscard]] const char* ToString(ExternalRequest request) noexcept;

/**
 * @brief Счётчики передачи файла
 *
 * Сбрасываются в начале и в конце каждой передачи.
 */
struct TransferStats {
  uint8_t packet_retry_count{0};  ///< Подряд неудачных попыток текущего пакета
  uint32_t crc_failure_count{0};  ///< Кадры с ошибкой CRC/формата
  uint32_t total_packets_received{0};
  uint32_t total_packets_retried{0};
  uint32_t packets_skipped_after_max_retries{0};

  void Reset() noexcept { *this = TransferStats{}; }
};

/**
 * @brief Контроллер полезной нагрузки (payload)
 *
 * Конечный автомат питания и обмена с вычислительным модулем payload по
 * полудуплексному последовательному каналу. Вызывается планировщиком раз в
 * период через Tick(); за один тик отправляется не более одной команды, ответ
 * ожидается внутри тика в ограниченном окне (response_window_ms).
 *
 * Переходы:
 * - Off → PoweringOn: запрос TurnOn (или повтор загрузки после таймаута)
 * - PoweringOn → Ready: успешный PING
 * - PoweringOn → Off: нет PING дольше boot_timeout_ms (must_re_attempt_boot)
 * - Ready → ShuttingDown: запрос TurnOff или Reboot
 * - ShuttingDown → Off: payload подтвердил SHUTDOWN или shutdown_timeout_ms
 * - любое → Off: запрос ForcePowerOff (немедленно)
 *
 * @example
 * @code
 * PayloadController pc(platform, uart, sd);
 * pc.AddRequest(ExternalRequest::TurnOn);
 * while (true) {
 *   pc.Tick();
 *   scheduler.Yield();
 * }
 * @endcode
 */
class PayloadController {
 public:
  PayloadController(PayloadPlatform& platform, PayloadTransport& transport,
                    DataHandler& data_handler,
                    const PayloadControllerConfig& config = {});

  PayloadController(const PayloadController&) = delete;
  PayloadController& operator=(const PayloadController&) = delete;

  /**
   * @brief Один шаг управления
   *
   * 1. Обработать ожидающий внешний запрос
   * 2. Выполнить логику текущего состояния (не более одной команды)
   * 3. Принять и применить ответ
   */
  void Tick();

  /**
   * @brief Поставить внешний запрос (заменяет предыдущий)
   * @return false для значения вне перечисления или NoAction
   */
  [[nodiscard]] bool AddRequest(ExternalRequest request);

  /**
   * @brief Отменить ожидающий запрос
   * @return false в состоянии Ready (запрос мог начать выполняться)
   */
  [[nodiscard]] bool CancelCurrentRequest();

  // ─────────────────────────────────────────────────────────────────────────
  // Состояние
  // ─────────────────────────────────────────────────────────────────────────

  [[nodiscard]] PayloadState GetState() const noexcept { return state_; }

  [[nodiscard]] bool FileTransferInProgress() const noexcept {
    return file_transfer_.InProgress();
  }

  [[nodiscard]] const FileTransfer& GetFileTransfer() const noexcept {
    return file_transfer_;
  }

  [[nodiscard]] const TransferStats& GetStats() const noexcept {
    return stats_;
  }

  [[nodiscard]] const PayloadTelemetry& GetTelemetry() const noexcept {
    return telemetry_;
  }

  [[nodiscard]] bool HasTelemetry() const noexcept { return has_telemetry_; }

  /** Время последней успешной телеметрии (мс платформы). */
  [[nodiscard]] uint32_t GetLastTelemetryTimeMs() const noexcept {
    return last_telemetry_ms_;
  }

  [[nodiscard]] protocol::ErrorCode GetLastError() const noexcept {
    return last_error_;
  }

  [[nodiscard]] protocol::CommandId GetLastCommandSent() const noexcept {
    return last_cmd_sent_;
  }

  /** Число неподтверждённых команд (0 или 1). */
  [[nodiscard]] uint8_t GetCommandsInFlight() const noexcept {
    return cmd_sent_;
  }

  [[nodiscard]] ExternalRequest GetPendingRequest() const noexcept {
    return pending_request_;
  }

  [[nodiscard]] bool MustReAttemptBoot() const noexcept {
    return must_re_attempt_boot_;
  }

  [[nodiscard]] bool IsAttemptingReboot() const noexcept {
    return attempting_reboot_;
  }

  [[nodiscard]] const PayloadControllerConfig& GetConfig() const noexcept {
    return config_;
  }

 private:
  // ─────────────────────────────────────────────────────────────────────────
  // Обработка запросов и состояний
  // ─────────────────────────────────────────────────────────────────────────

  void ServiceRequest(uint32_t now_ms);

  void TickOff(uint32_t now_ms);
  void TickPoweringOn(uint32_t now_ms);
  void TickReady(uint32_t now_ms);
  void TickShuttingDown(uint32_t now_ms);

  /** Единственное место смены state_. */
  void TransitionTo(PayloadState next, uint32_t now_ms);

  void StartBoot(uint32_t now_ms);
  void BeginShutdown(uint32_t now_ms, bool reboot);
  void ForcePowerOff(uint32_t now_ms);
  void PowerOff();

  // ─────────────────────────────────────────────────────────────────────────
  // Обмен с payload
  // ─────────────────────────────────────────────────────────────────────────

  /**
   * @brief Отправить команду, дождаться ответа и применить результат
   * @return false, если команда не была отправлена
   */
  bool ExecuteCommand(const protocol::CommandFrame& frame, uint32_t now_ms);

  /**
   * @brief Ожидать ответ на last_cmd_sent_ в пределах окна
   *
   * Кадры с чужим cmd_id отбрасываются. Ожидание заканчивается, когда
   * по часам платформы прошло response_window_ms или сделано
   * response_window_ms / response_poll_ms + 1 чтений.
   */
  protocol::Result<protocol::DecodedResponse> ReceiveResponse();

  void HandleResponse(protocol::CommandId cmd,
                      const protocol::Result<protocol::DecodedResponse>& result,
                      uint32_t now_ms);

  // ─────────────────────────────────────────────────────────────────────────
  // Передача файла
  // ─────────────────────────────────────────────────────────────────────────

  void StartImageTransfer();
  void HandleFilePacketResult(
      const protocol::Result<protocol::DecodedResponse>& result);
  void StoreFilePacket(const protocol::FileChunk& chunk);
  void HandleFilePacketFailure(protocol::ErrorCode cause);
  void FinishTransfer();
  void AbortTransfer(const char* reason);

  /** Итоговые счётчики передачи (в конце и при прерывании). */
  void LogTransferStats(LogLevel level, const char* tag,
                        const char* outcome) const;

  void RecordError(protocol::CommandId cmd, protocol::ErrorCode code);

  // ─────────────────────────────────────────────────────────────────────────
  // Члены класса
  // ─────────────────────────────────────────────────────────────────────────

  PayloadPlatform& platform_;
  PayloadTransport& transport_;
  DataHandler& data_handler_;
  PayloadControllerConfig config_;

  PayloadState state_{PayloadState::Off};
  ExternalRequest pending_request_{ExternalRequest::NoAction};

  FileTransfer file_transfer_;
  TransferStats stats_;

  PayloadTelemetry telemetry_;
  bool has_telemetry_{false};
  uint32_t last_telemetry_ms_{0};
  uint32_t last_telemetry_request_ms_{0};

  protocol::ErrorCode last_error_{protocol::ErrorCode::Ok};
  protocol::CommandId last_cmd_sent_{protocol::CommandId::PingAck};
  uint8_t cmd_sent_{0};
  bool command_issued_this_tick_{false};

  bool awaiting_telemetry_{false};
  bool awaiting_packet_{false};
  bool time_sync_pending_{false};

  // Питание
  uint32_t boot_start_ms_{0};
  uint32_t shutdown_start_ms_{0};
  uint8_t boot_attempts_{0};
  bool must_re_attempt_boot_{false};
  bool attempting_reboot_{false};
  bool shutdown_confirmed_{false};
};

}  // namespace sat_payload
