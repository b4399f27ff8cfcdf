#include "payload_controller.hpp"

#include <array>

namespace sat_payload {

using protocol::CommandFrame;
using protocol::CommandId;
using protocol::DecodedResponse;
using protocol::Decoder;
using protocol::Encoder;
using protocol::ErrorCode;
using protocol::Result;

namespace {

const char* TransferTag(TransferType type) noexcept {
  switch (type) {
    case TransferType::Image:
      return config::StorageConfig::kImageTag;
    case TransferType::None:
      break;
  }
  return "file";
}

}  // namespace

const char* ToString(PayloadState state) noexcept {
  switch (state) {
    case PayloadState::Off:
      return "OFF";
    case PayloadState::PoweringOn:
      return "POWERING_ON";
    case PayloadState::Ready:
      return "READY";
    case PayloadState::ShuttingDown:
      return "SHUTTING_DOWN";
  }
  return "UNKNOWN";
}

const char* ToString(ExternalRequest request) noexcept {
  switch (request) {
    case ExternalRequest::NoAction:
      return "NO_ACTION";
    case ExternalRequest::TurnOn:
      return "TURN_ON";
    case ExternalRequest::TurnOff:
      return "TURN_OFF";
    case ExternalRequest::Reboot:
      return "REBOOT";
    case ExternalRequest::RequestImage:
      return "REQUEST_IMAGE";
    case ExternalRequest::ClearStorage:
      return "CLEAR_STORAGE";
    case ExternalRequest::ForcePowerOff:
      return "FORCE_POWER_OFF";
  }
  return "UNKNOWN";
}

// ═══════════════════════════════════════════════════════════════════════════
// PayloadController - реализация
// ═══════════════════════════════════════════════════════════════════════════

PayloadController::PayloadController(PayloadPlatform& platform,
                                     PayloadTransport& transport,
                                     DataHandler& data_handler,
                                     const PayloadControllerConfig& config)
    : platform_(platform),
      transport_(transport),
      data_handler_(data_handler),
      config_(config) {
  if (!config_.IsValid()) {
    config_.Clamp();
    platform_.Log(LogLevel::Warning,
                  "Payload controller config out of range, clamped");
  }
}

void PayloadController::Tick() {
  const uint32_t now = platform_.GetTimeMs();
  command_issued_this_tick_ = false;

  ServiceRequest(now);

  switch (state_) {
    case PayloadState::Off:
      TickOff(now);
      break;
    case PayloadState::PoweringOn:
      TickPoweringOn(now);
      break;
    case PayloadState::Ready:
      TickReady(now);
      break;
    case PayloadState::ShuttingDown:
      TickShuttingDown(now);
      break;
  }
}

bool PayloadController::AddRequest(ExternalRequest request) {
  if (static_cast<uint8_t>(request) > MAX_EXTERNAL_REQUEST) {
    LogF(platform_, LogLevel::Warning, "Rejected unknown request %u",
         static_cast<unsigned>(request));
    return false;
  }
  if (request == ExternalRequest::NoAction) {
    return false;
  }
  if (pending_request_ != ExternalRequest::NoAction) {
    LogF(platform_, LogLevel::Warning, "Request %s replaced by %s",
         ToString(pending_request_), ToString(request));
  }
  pending_request_ = request;
  return true;
}

bool PayloadController::CancelCurrentRequest() {
  if (state_ == PayloadState::Ready) {
    return false;
  }
  pending_request_ = ExternalRequest::NoAction;
  return true;
}

// ─────────────────────────────────────────────────────────────────────────────
// Внешние запросы
// ─────────────────────────────────────────────────────────────────────────────

void PayloadController::ServiceRequest(uint32_t now_ms) {
  const ExternalRequest request = pending_request_;
  if (request == ExternalRequest::NoAction) {
    return;
  }

  // Аварийное выключение не ждёт ответа на предыдущую команду
  if (request == ExternalRequest::ForcePowerOff) {
    pending_request_ = ExternalRequest::NoAction;
    ForcePowerOff(now_ms);
    return;
  }

  if (cmd_sent_ != 0) {
    return;
  }

  switch (request) {
    case ExternalRequest::TurnOn:
      pending_request_ = ExternalRequest::NoAction;
      if (state_ == PayloadState::Off) {
        boot_attempts_ = 0;
        StartBoot(now_ms);
      } else {
        LogF(platform_, LogLevel::Warning, "TURN_ON ignored in state %s",
             ToString(state_));
      }
      break;

    case ExternalRequest::TurnOff:
      pending_request_ = ExternalRequest::NoAction;
      if (state_ == PayloadState::Ready) {
        BeginShutdown(now_ms, false);
      } else if (state_ == PayloadState::PoweringOn) {
        // ОС ещё не поднялась, штатное выключение невозможно
        must_re_attempt_boot_ = false;
        PowerOff();
        TransitionTo(PayloadState::Off, now_ms);
      } else {
        LogF(platform_, LogLevel::Warning, "TURN_OFF ignored in state %s",
             ToString(state_));
      }
      break;

    case ExternalRequest::Reboot:
      pending_request_ = ExternalRequest::NoAction;
      if (state_ == PayloadState::Ready) {
        BeginShutdown(now_ms, true);
      } else if (state_ == PayloadState::Off) {
        boot_attempts_ = 0;
        StartBoot(now_ms);
      } else {
        LogF(platform_, LogLevel::Warning, "REBOOT ignored in state %s",
             ToString(state_));
      }
      break;

    case ExternalRequest::RequestImage:
      // Ждёт в слоте до Ready и до завершения текущей передачи
      if (state_ != PayloadState::Ready || file_transfer_.InProgress()) {
        break;
      }
      pending_request_ = ExternalRequest::NoAction;
      ExecuteCommand(Encoder::EncodeRequestImage(), now_ms);
      break;

    case ExternalRequest::ClearStorage:
      if (state_ != PayloadState::Ready || file_transfer_.InProgress()) {
        break;
      }
      pending_request_ = ExternalRequest::NoAction;
      ExecuteCommand(Encoder::EncodeClearStorage(), now_ms);
      break;

    case ExternalRequest::NoAction:
    case ExternalRequest::ForcePowerOff:
      break;
  }
}

// ─────────────────────────────────────────────────────────────────────────────
// Обработчики состояний
// ─────────────────────────────────────────────────────────────────────────────

void PayloadController::TickOff(uint32_t now_ms) {
  if (attempting_reboot_) {
    attempting_reboot_ = false;
    platform_.Log(LogLevel::Info, "Payload reboot: powering on");
    StartBoot(now_ms);
    return;
  }

  if (!must_re_attempt_boot_) {
    return;
  }

  if (boot_attempts_ >= config_.max_boot_attempts) {
    LogF(platform_, LogLevel::Error, "Payload boot failed %u times, giving up",
         static_cast<unsigned>(boot_attempts_));
    must_re_attempt_boot_ = false;
    boot_attempts_ = 0;
    return;
  }

  boot_attempts_++;
  LogF(platform_, LogLevel::Warning, "Re-attempting payload boot (%u/%u)",
       static_cast<unsigned>(boot_attempts_),
       static_cast<unsigned>(config_.max_boot_attempts));
  StartBoot(now_ms);
}

void PayloadController::TickPoweringOn(uint32_t now_ms) {
  if (now_ms - boot_start_ms_ > config_.boot_timeout_ms) {
    LogF(platform_, LogLevel::Error, "Payload boot timeout after %u ms",
         static_cast<unsigned>(now_ms - boot_start_ms_));
    PowerOff();
    last_error_ = ErrorCode::TimeoutBoot;
    must_re_attempt_boot_ = true;
    TransitionTo(PayloadState::Off, now_ms);
    return;
  }

  if (command_issued_this_tick_ || !transport_.IsConnected()) {
    return;
  }

  // Ответ на PING переводит в Ready (HandleResponse)
  ExecuteCommand(Encoder::EncodePing(), now_ms);
}

void PayloadController::TickReady(uint32_t now_ms) {
  if (command_issued_this_tick_) {
    return;
  }

  if (time_sync_pending_) {
    time_sync_pending_ = false;
    const uint32_t unix_time = platform_.GetUnixTime();
    if (unix_time != 0) {
      ExecuteCommand(Encoder::EncodeSynchronizeTime(unix_time), now_ms);
      return;
    }
  }

  if (!file_transfer_.InProgress()) {
    if (!awaiting_telemetry_ &&
        now_ms - last_telemetry_request_ms_ >= config_.telemetry_period_ms) {
      awaiting_telemetry_ = true;
      last_telemetry_request_ms_ = now_ms;
      ExecuteCommand(Encoder::EncodeRequestTelemetry(), now_ms);
    }
    return;
  }

  if (awaiting_packet_) {
    return;
  }

  const uint32_t packet_nb = file_transfer_.PacketNb();
  if (packet_nb > UINT16_MAX) {
    last_error_ = ErrorCode::InvalidResponse;
    AbortTransfer("packet number overflow");
    return;
  }

  // Хвосты предыдущих ответов не должны попасть в новый пакет
  transport_.FlushRxBuffer();
  awaiting_packet_ = true;
  ExecuteCommand(
      Encoder::EncodeRequestNextFilePacket(static_cast<uint16_t>(packet_nb)),
      now_ms);
}

void PayloadController::TickShuttingDown(uint32_t now_ms) {
  if (shutdown_confirmed_) {
    platform_.Log(LogLevel::Info, "Payload confirmed shutdown, power off");
    PowerOff();
    TransitionTo(PayloadState::Off, now_ms);
    return;
  }

  if (now_ms - shutdown_start_ms_ > config_.shutdown_timeout_ms) {
    platform_.Log(LogLevel::Warning, "Payload shutdown timeout, forcing off");
    last_error_ = ErrorCode::TimeoutShutdown;
    PowerOff();
    TransitionTo(PayloadState::Off, now_ms);
  }
}

void PayloadController::TransitionTo(PayloadState next, uint32_t now_ms) {
  if (next != state_) {
    LogF(platform_, LogLevel::Info, "Payload state %s -> %s", ToString(state_),
         ToString(next));
  }
  state_ = next;

  switch (next) {
    case PayloadState::Off:
      awaiting_telemetry_ = false;
      awaiting_packet_ = false;
      if (file_transfer_.InProgress()) {
        AbortTransfer("payload powered off");
      }
      break;

    case PayloadState::PoweringOn:
      boot_start_ms_ = now_ms;
      break;

    case PayloadState::Ready:
      must_re_attempt_boot_ = false;
      attempting_reboot_ = false;
      boot_start_ms_ = 0;
      boot_attempts_ = 0;
      shutdown_confirmed_ = false;
      awaiting_telemetry_ = false;
      awaiting_packet_ = false;
      time_sync_pending_ = true;
      // Первая телеметрия на следующем тике
      last_telemetry_request_ms_ = now_ms - config_.telemetry_period_ms;
      break;

    case PayloadState::ShuttingDown:
      shutdown_start_ms_ = now_ms;
      shutdown_confirmed_ = false;
      break;
  }
}

// ─────────────────────────────────────────────────────────────────────────────
// Питание
// ─────────────────────────────────────────────────────────────────────────────

void PayloadController::StartBoot(uint32_t now_ms) {
  if (!platform_.SetPayloadPower(true)) {
    platform_.Log(LogLevel::Error, "Failed to enable payload power");
    last_error_ = ErrorCode::CommandExecutionFailed;
    return;
  }

  if (!transport_.IsConnected() && transport_.Init() != 0) {
    LogF(platform_, LogLevel::Warning, "Payload link %s not available yet",
         transport_.Name());
  }
  transport_.FlushRxBuffer();
  TransitionTo(PayloadState::PoweringOn, now_ms);
}

void PayloadController::BeginShutdown(uint32_t now_ms, bool reboot) {
  attempting_reboot_ = reboot;
  if (file_transfer_.InProgress()) {
    AbortTransfer("payload shutdown requested");
  }
  TransitionTo(PayloadState::ShuttingDown, now_ms);
  ExecuteCommand(Encoder::EncodeShutdown(), now_ms);
}

void PayloadController::ForcePowerOff(uint32_t now_ms) {
  platform_.Log(LogLevel::Warning, "Forced payload power off");
  if (file_transfer_.InProgress()) {
    AbortTransfer("forced power off");
  }
  cmd_sent_ = 0;
  must_re_attempt_boot_ = false;
  attempting_reboot_ = false;
  PowerOff();
  TransitionTo(PayloadState::Off, now_ms);
}

void PayloadController::PowerOff() {
  if (!platform_.SetPayloadPower(false)) {
    platform_.Log(LogLevel::Error, "Failed to disable payload power");
    last_error_ = ErrorCode::CommandExecutionFailed;
  }
}

// ─────────────────────────────────────────────────────────────────────────────
// Обмен командами
// ─────────────────────────────────────────────────────────────────────────────

bool PayloadController::ExecuteCommand(const CommandFrame& frame,
                                       uint32_t now_ms) {
  if (cmd_sent_ != 0) {
    LogF(platform_, LogLevel::Error, "%s blocked: %s still outstanding",
         protocol::ToString(frame.Id()), protocol::ToString(last_cmd_sent_));
    return false;
  }

  last_cmd_sent_ = frame.Id();
  command_issued_this_tick_ = true;

  if (transport_.Send(frame.Bytes()) != 0) {
    LogF(platform_, LogLevel::Error, "Failed to send %s",
         protocol::ToString(frame.Id()));
    HandleResponse(last_cmd_sent_, ErrorCode::NoResponse, now_ms);
    return false;
  }

  cmd_sent_ = 1;
  const auto result = ReceiveResponse();
  cmd_sent_ = 0;

  HandleResponse(last_cmd_sent_, result, now_ms);
  return true;
}

Result<DecodedResponse> PayloadController::ReceiveResponse() {
  // Окно ограничено и часами платформы, и числом чтений: поток чужих
  // кадров без пауз не должен удерживать тик
  const uint32_t start_ms = platform_.GetTimeMs();
  const uint32_t max_polls =
      config_.response_window_ms / config_.response_poll_ms;
  const auto expected = static_cast<uint8_t>(last_cmd_sent_);

  for (uint32_t polls = 0;; polls++) {
    const RxPacket packet = transport_.Receive();
    if (!packet.Empty()) {
      if (packet.data[0] == expected) {
        return Decoder::Decode(packet.Bytes());
      }
      LogF(platform_, LogLevel::Warning,
           "Discarding frame 0x%02X while waiting for %s",
           static_cast<unsigned>(packet.data[0]),
           protocol::ToString(last_cmd_sent_));
    }

    if (polls >= max_polls ||
        platform_.GetTimeMs() - start_ms >= config_.response_window_ms) {
      break;
    }
    if (packet.Empty()) {
      platform_.DelayMs(config_.response_poll_ms);
    }
  }

  return ErrorCode::NoResponse;
}

void PayloadController::HandleResponse(
    CommandId cmd, const Result<DecodedResponse>& result, uint32_t now_ms) {
  const ErrorCode code =
      protocol::IsOk(result) ? ErrorCode::Ok : protocol::GetError(result);

  switch (cmd) {
    case CommandId::PingAck:
      if (code == ErrorCode::Ok) {
        if (state_ == PayloadState::PoweringOn) {
          TransitionTo(PayloadState::Ready, now_ms);
        }
        return;
      }
      // Пока payload загружается, тишина на линии ожидаема
      if (state_ == PayloadState::PoweringOn && code == ErrorCode::NoResponse) {
        return;
      }
      break;

    case CommandId::RequestTelemetry:
      awaiting_telemetry_ = false;
      if (code == ErrorCode::Ok) {
        const auto& body = protocol::GetValue(result).body;
        if (const auto* tm = std::get_if<PayloadTelemetry>(&body)) {
          telemetry_ = *tm;
          has_telemetry_ = true;
          last_telemetry_ms_ = now_ms;
          data_handler_.LogTelemetry(telemetry_);
          return;
        }
        RecordError(cmd, ErrorCode::InvalidResponse);
        return;
      }
      break;

    case CommandId::RequestImage:
      if (code == ErrorCode::Ok) {
        StartImageTransfer();
        return;
      }
      break;

    case CommandId::RequestNextFilePacket:
      HandleFilePacketResult(result);
      return;

    case CommandId::Shutdown:
      if (code == ErrorCode::Ok) {
        shutdown_confirmed_ = true;
        return;
      }
      break;

    default:
      if (code == ErrorCode::Ok) {
        LogF(platform_, LogLevel::Info, "%s done", protocol::ToString(cmd));
        return;
      }
      break;
  }

  RecordError(cmd, code);
}

void PayloadController::RecordError(CommandId cmd, ErrorCode code) {
  last_error_ = code;
  LogF(platform_, LogLevel::Warning, "%s failed: %s", protocol::ToString(cmd),
       protocol::ToString(code));
}

// ─────────────────────────────────────────────────────────────────────────────
// Передача файла
// ─────────────────────────────────────────────────────────────────────────────

void PayloadController::StartImageTransfer() {
  const char* tag = config::StorageConfig::kImageTag;
  if (!data_handler_.FileProcessExists(tag) &&
      !data_handler_.RegisterFileProcess(tag)) {
    LogF(platform_, LogLevel::Error, "Cannot register file process '%s'", tag);
    last_error_ = ErrorCode::CommandExecutionFailed;
    return;
  }

  file_transfer_.StartTransfer(TransferType::Image);
  stats_.Reset();
  cmd_sent_ = 0;
  awaiting_packet_ = false;
  platform_.Log(LogLevel::Info, "Image transfer started");
}

void PayloadController::StoreFilePacket(const protocol::FileChunk& chunk) {
  data_handler_.LogFile(TransferTag(file_transfer_.Type()), chunk.Bytes());
  if (!file_transfer_.AckPacket()) {
    platform_.Log(LogLevel::Error, "Packet ack without active transfer");
    return;
  }
  stats_.packet_retry_count = 0;
  stats_.total_packets_received++;
}

void PayloadController::HandleFilePacketResult(
    const Result<DecodedResponse>& result) {
  awaiting_packet_ = false;
  if (!file_transfer_.InProgress()) {
    // Передача прервана, пока ждали ответ
    return;
  }

  const ErrorCode code =
      protocol::IsOk(result) ? ErrorCode::Ok : protocol::GetError(result);
  switch (code) {
    case ErrorCode::Ok: {
      const auto& body = protocol::GetValue(result).body;
      if (const auto* chunk = std::get_if<protocol::FileChunk>(&body)) {
        StoreFilePacket(*chunk);
      } else {
        HandleFilePacketFailure(ErrorCode::InvalidPacket);
      }
      break;
    }
    case ErrorCode::InvalidPacket:
    case ErrorCode::NoResponse:
      HandleFilePacketFailure(code);
      break;
    case ErrorCode::NoMoreFilePacket:
      FinishTransfer();
      break;
    default:
      RecordError(CommandId::RequestNextFilePacket, code);
      AbortTransfer(protocol::ToString(code));
      break;
  }
}

void PayloadController::HandleFilePacketFailure(ErrorCode cause) {
  stats_.packet_retry_count++;
  stats_.total_packets_retried++;
  if (cause == ErrorCode::InvalidPacket) {
    stats_.crc_failure_count++;
  }

  if (stats_.packet_retry_count < config_.max_packet_retries) {
    LogF(platform_, LogLevel::Warning, "Packet %u: %s, retry %u/%u",
         static_cast<unsigned>(file_transfer_.PacketNb()),
         protocol::ToString(cause),
         static_cast<unsigned>(stats_.packet_retry_count),
         static_cast<unsigned>(config_.max_packet_retries));
    return;
  }

  // Пакет потерян: заполнитель сохраняет смещения остальных данных
  const std::array<uint8_t, protocol::MAX_DATA_LENGTH> placeholder{};
  LogF(platform_, LogLevel::Error,
       "Packet %u skipped after %u retries, writing %u zero bytes",
       static_cast<unsigned>(file_transfer_.PacketNb()),
       static_cast<unsigned>(stats_.packet_retry_count),
       static_cast<unsigned>(placeholder.size()));
  data_handler_.LogFile(TransferTag(file_transfer_.Type()), placeholder);
  if (!file_transfer_.AckPacket()) {
    platform_.Log(LogLevel::Error, "Packet skip without active transfer");
  }
  stats_.packet_retry_count = 0;
  stats_.packets_skipped_after_max_retries++;
}

void PayloadController::FinishTransfer() {
  const char* tag = TransferTag(file_transfer_.Type());
  file_transfer_.StopTransfer();
  data_handler_.FileCompleted(tag);

  LogTransferStats(LogLevel::Info, tag, "complete");
  stats_.Reset();
}

void PayloadController::AbortTransfer(const char* reason) {
  const char* tag = TransferTag(file_transfer_.Type());
  LogF(platform_, LogLevel::Warning, "Transfer '%s' aborted at packet %u: %s",
       tag, static_cast<unsigned>(file_transfer_.PacketNb()), reason);
  file_transfer_.StopTransfer();
  data_handler_.FileCompleted(tag);
  awaiting_packet_ = false;

  LogTransferStats(LogLevel::Warning, tag, "aborted");
  stats_.Reset();
}

void PayloadController::LogTransferStats(LogLevel level, const char* tag,
                                         const char* outcome) const {
  LogF(platform_, level,
       "Transfer '%s' %s: received=%u retried=%u crc_fail=%u skipped=%u", tag,
       outcome, static_cast<unsigned>(stats_.total_packets_received),
       static_cast<unsigned>(stats_.total_packets_retried),
       static_cast<unsigned>(stats_.crc_failure_count),
       static_cast<unsigned>(stats_.packets_skipped_after_max_retries));
}

}  // namespace sat_payload
