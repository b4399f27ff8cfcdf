#include "protocol.hpp"

#include <cstring>

namespace sat_payload::protocol {

namespace {

uint16_t ReadU16(std::span<const uint8_t> buf, size_t pos) noexcept {
  return static_cast<uint16_t>((buf[pos] << 8) | buf[pos + 1]);
}

uint32_t ReadU32(std::span<const uint8_t> buf, size_t pos) noexcept {
  return (static_cast<uint32_t>(buf[pos]) << 24) |
         (static_cast<uint32_t>(buf[pos + 1]) << 16) |
         (static_cast<uint32_t>(buf[pos + 2]) << 8) |
         static_cast<uint32_t>(buf[pos + 3]);
}

void WriteU16(std::span<uint8_t> buf, size_t pos, uint16_t value) noexcept {
  buf[pos] = (value >> 8) & 0xFF;
  buf[pos + 1] = value & 0xFF;
}

void WriteU32(std::span<uint8_t> buf, size_t pos, uint32_t value) noexcept {
  buf[pos] = (value >> 24) & 0xFF;
  buf[pos + 1] = (value >> 16) & 0xFF;
  buf[pos + 2] = (value >> 8) & 0xFF;
  buf[pos + 3] = value & 0xFF;
}

bool IsAckFrame(std::span<const uint8_t> frame) noexcept {
  return frame.size() == ACK_PACKET_SIZE;
}

uint8_t AckStatusByte(std::span<const uint8_t> frame) noexcept {
  return frame[HEADER_SIZE];
}

DecodedResponse MakeResponse(const FrameHeader& hdr) noexcept {
  DecodedResponse resp;
  resp.cmd_id = static_cast<CommandId>(hdr.cmd_id);
  resp.seq = hdr.seq;
  return resp;
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Строковые представления (для логов)
// ═══════════════════════════════════════════════════════════════════════════

const char* ToString(ErrorCode code) noexcept {
  switch (code) {
    case ErrorCode::NoResponse:
      return "NO_RESPONSE";
    case ErrorCode::Ok:
      return "OK";
    case ErrorCode::InvalidCommand:
      return "INVALID_COMMAND";
    case ErrorCode::CommandExecutionFailed:
      return "COMMAND_ERROR_EXECUTION";
    case ErrorCode::InvalidPacket:
      return "INVALID_PACKET";
    case ErrorCode::InvalidResponse:
      return "INVALID_RESPONSE";
    case ErrorCode::TimeoutShutdown:
      return "TIMEOUT_SHUTDOWN";
    case ErrorCode::FileNotAvailable:
      return "FILE_NOT_AVAILABLE";
    case ErrorCode::NoMoreFilePacket:
      return "NO_MORE_FILE_PACKET";
    case ErrorCode::TimeoutBoot:
      return "TIMEOUT_BOOT";
  }
  return "UNKNOWN";
}

const char* ToString(CommandId id) noexcept {
  switch (id) {
    case CommandId::PingAck:
      return "PING_ACK";
    case CommandId::Shutdown:
      return "SHUTDOWN";
    case CommandId::RequestTelemetry:
      return "REQUEST_TELEMETRY";
    case CommandId::EnableCameras:
      return "ENABLE_CAMERAS";
    case CommandId::DisableCameras:
      return "DISABLE_CAMERAS";
    case CommandId::CaptureImages:
      return "CAPTURE_IMAGES";
    case CommandId::StartCaptureImagesPeriodically:
      return "START_CAPTURE_IMAGES_PERIODICALLY";
    case CommandId::StopCaptureImages:
      return "STOP_CAPTURE_IMAGES";
    case CommandId::RequestStorageInfo:
      return "REQUEST_STORAGE_INFO";
    case CommandId::RequestImage:
      return "REQUEST_IMAGE";
    case CommandId::RequestNextFilePacket:
      return "REQUEST_NEXT_FILE_PACKET";
    case CommandId::ClearStorage:
      return "CLEAR_STORAGE";
    case CommandId::PingOdStatus:
      return "PING_OD_STATUS";
    case CommandId::RunOd:
      return "RUN_OD";
    case CommandId::RequestOdResult:
      return "REQUEST_OD_RESULT";
    case CommandId::SynchronizeTime:
      return "SYNCHRONIZE_TIME";
    case CommandId::FullReset:
      return "FULL_RESET";
    case CommandId::DebugDisplayCamera:
      return "DEBUG_DISPLAY_CAMERA";
    case CommandId::DebugStopDisplay:
      return "DEBUG_STOP_DISPLAY";
  }
  return "UNKNOWN";
}

// ═══════════════════════════════════════════════════════════════════════════
// CommandFrame
// ═══════════════════════════════════════════════════════════════════════════

bool CommandFrame::Append(uint8_t value) noexcept {
  if (size_ >= SEND_BUFFER_SIZE) {
    return false;
  }
  data_[size_++] = value;
  return true;
}

bool CommandFrame::AppendU16(uint16_t value) noexcept {
  if (size_ + 2 > SEND_BUFFER_SIZE) {
    return false;
  }
  WriteU16(data_, size_, value);
  size_ += 2;
  return true;
}

bool CommandFrame::AppendU32(uint32_t value) noexcept {
  if (size_ + 4 > SEND_BUFFER_SIZE) {
    return false;
  }
  WriteU32(data_, size_, value);
  size_ += 4;
  return true;
}

// ═══════════════════════════════════════════════════════════════════════════
// Encoder
// ═══════════════════════════════════════════════════════════════════════════

CommandFrame Encoder::EncodePing() noexcept {
  return CommandFrame(CommandId::PingAck);
}

CommandFrame Encoder::EncodeShutdown() noexcept {
  return CommandFrame(CommandId::Shutdown);
}

CommandFrame Encoder::EncodeRequestTelemetry() noexcept {
  return CommandFrame(CommandId::RequestTelemetry);
}

CommandFrame Encoder::EncodeEnableCameras() noexcept {
  return CommandFrame(CommandId::EnableCameras);
}

CommandFrame Encoder::EncodeDisableCameras() noexcept {
  return CommandFrame(CommandId::DisableCameras);
}

CommandFrame Encoder::EncodeCaptureImages() noexcept {
  return CommandFrame(CommandId::CaptureImages);
}

CommandFrame Encoder::EncodeStartCaptureImagesPeriodically(
    uint16_t period_s, uint16_t nb_images) noexcept {
  CommandFrame frame(CommandId::StartCaptureImagesPeriodically);
  frame.AppendU16(period_s);
  frame.AppendU16(nb_images);
  return frame;
}

CommandFrame Encoder::EncodeStopCaptureImages() noexcept {
  return CommandFrame(CommandId::StopCaptureImages);
}

CommandFrame Encoder::EncodeRequestStorageInfo() noexcept {
  return CommandFrame(CommandId::RequestStorageInfo);
}

CommandFrame Encoder::EncodeRequestImage() noexcept {
  return CommandFrame(CommandId::RequestImage);
}

CommandFrame Encoder::EncodeRequestNextFilePacket(uint16_t packet_nb) noexcept {
  CommandFrame frame(CommandId::RequestNextFilePacket);
  frame.AppendU16(packet_nb);
  return frame;
}

CommandFrame Encoder::EncodeClearStorage() noexcept {
  return CommandFrame(CommandId::ClearStorage);
}

CommandFrame Encoder::EncodePingOdStatus() noexcept {
  return CommandFrame(CommandId::PingOdStatus);
}

CommandFrame Encoder::EncodeRunOd() noexcept {
  return CommandFrame(CommandId::RunOd);
}

CommandFrame Encoder::EncodeRequestOdResult() noexcept {
  return CommandFrame(CommandId::RequestOdResult);
}

CommandFrame Encoder::EncodeSynchronizeTime(uint32_t unix_time) noexcept {
  CommandFrame frame(CommandId::SynchronizeTime);
  frame.AppendU32(unix_time);
  return frame;
}

CommandFrame Encoder::EncodeFullReset() noexcept {
  return CommandFrame(CommandId::FullReset);
}

CommandFrame Encoder::EncodeDebugDisplayCamera() noexcept {
  return CommandFrame(CommandId::DebugDisplayCamera);
}

CommandFrame Encoder::EncodeDebugStopDisplay() noexcept {
  return CommandFrame(CommandId::DebugStopDisplay);
}

std::optional<CommandFrame> Encoder::EncodeWithArgs(
    CommandId id, std::span<const uint8_t> args) noexcept {
  if (args.size() > SEND_BUFFER_SIZE - 1) {
    return std::nullopt;
  }

  CommandFrame frame(id);
  for (uint8_t arg : args) {
    frame.Append(arg);
  }
  return frame;
}

// ═══════════════════════════════════════════════════════════════════════════
// ResponseFrameBuilder
// ═══════════════════════════════════════════════════════════════════════════

Result<size_t> ResponseFrameBuilder::BuildAck(std::span<uint8_t> buffer,
                                              uint8_t cmd_id, uint16_t seq,
                                              uint8_t status) noexcept {
  if (buffer.size() < ACK_PACKET_SIZE) {
    return ErrorCode::InvalidPacket;
  }

  buffer[0] = cmd_id;
  WriteU16(buffer, 1, seq);
  WriteU16(buffer, 3, 1);
  buffer[HEADER_SIZE] = status;
  return ACK_PACKET_SIZE;
}

Result<size_t> ResponseFrameBuilder::BuildData(
    std::span<uint8_t> buffer, uint8_t cmd_id, uint16_t seq,
    std::span<const uint8_t> payload) noexcept {
  if (buffer.size() < DATA_PACKET_SIZE || payload.size() > MAX_DATA_LENGTH) {
    return ErrorCode::InvalidPacket;
  }

  buffer[0] = cmd_id;
  WriteU16(buffer, 1, seq);
  WriteU16(buffer, 3, static_cast<uint16_t>(payload.size()));

  // Payload дополняется нулями до 240 байт
  std::memset(buffer.data() + HEADER_SIZE, 0, MAX_DATA_LENGTH);
  if (!payload.empty()) {
    std::memcpy(buffer.data() + HEADER_SIZE, payload.data(), payload.size());
  }

  // CRC от заголовка и payload, хранится big-endian
  uint16_t crc = CalculateCrc16(buffer.first(CRC_OFFSET));
  WriteU16(buffer, CRC_OFFSET, crc);

  return DATA_PACKET_SIZE;
}

Result<size_t> ResponseFrameBuilder::SerializeTelemetry(
    std::span<uint8_t> buffer, const PayloadTelemetry& tm) noexcept {
  if (buffer.size() < PayloadTelemetry::PAYLOAD_SIZE) {
    return ErrorCode::InvalidPacket;
  }

  WriteU32(buffer, 0, tm.system_time);
  WriteU32(buffer, 4, tm.system_uptime);
  WriteU32(buffer, 8, tm.last_executed_cmd_time);
  buffer[12] = tm.last_executed_cmd_id;
  buffer[13] = tm.payload_state;
  buffer[14] = tm.active_cameras;
  buffer[15] = tm.capture_mode;
  for (size_t i = 0; i < tm.cam_status.size(); i++) {
    buffer[16 + i] = tm.cam_status[i];
  }
  buffer[20] = tm.imu_status;
  buffer[21] = tm.tasks_in_execution;
  buffer[22] = tm.disk_usage;
  buffer[23] = tm.latest_error;
  buffer[24] = tm.tegrastats_process_status;
  buffer[25] = tm.ram_usage;
  buffer[26] = tm.swap_usage;
  buffer[27] = tm.active_cores;
  buffer[28] = tm.cpu_load;
  buffer[29] = tm.gpu_freq;
  buffer[30] = tm.cpu_temp;
  buffer[31] = tm.gpu_temp;
  WriteU16(buffer, 32, tm.vdd_in);
  WriteU16(buffer, 34, tm.vdd_cpu_gpu_cv);
  WriteU16(buffer, 36, tm.vdd_soc);

  return PayloadTelemetry::PAYLOAD_SIZE;
}

// ═══════════════════════════════════════════════════════════════════════════
// FrameParser
// ═══════════════════════════════════════════════════════════════════════════

Result<FrameHeader> FrameParser::ParseHeader(
    std::span<const uint8_t> buffer) noexcept {
  if (buffer.size() < HEADER_SIZE) {
    return ErrorCode::InvalidPacket;
  }

  FrameHeader hdr;
  hdr.cmd_id = buffer[0];
  hdr.seq = ReadU16(buffer, 1);
  hdr.data_len = ReadU16(buffer, 3);
  return hdr;
}

bool FrameParser::ValidateCrc(std::span<const uint8_t> frame) noexcept {
  if (frame.size() != DATA_PACKET_SIZE) {
    return false;
  }
  return CalculateCrc16(frame) == 0x0000;
}

// ═══════════════════════════════════════════════════════════════════════════
// Decoder
// ═══════════════════════════════════════════════════════════════════════════

Result<DecodedResponse> Decoder::Decode(
    std::span<const uint8_t> frame) noexcept {
  // Принимаются только кадры фиксированного размера
  if (frame.size() != ACK_PACKET_SIZE && frame.size() != DATA_PACKET_SIZE) {
    return ErrorCode::InvalidPacket;
  }

  auto hdr_result = FrameParser::ParseHeader(frame);
  if (IsError(hdr_result)) {
    return GetError(hdr_result);
  }
  const FrameHeader hdr = GetValue(hdr_result);

  if (IsAckFrame(frame)) {
    // ACK/NACK доверенный: без CRC
    if (hdr.data_len != 1) {
      return ErrorCode::InvalidPacket;
    }
  } else {
    if (hdr.data_len > MAX_DATA_LENGTH) {
      return ErrorCode::InvalidPacket;
    }
    if (!FrameParser::ValidateCrc(frame)) {
      return ErrorCode::InvalidPacket;
    }
  }

  if (!IsValidCommandId(hdr.cmd_id)) {
    return ErrorCode::InvalidCommand;
  }

  switch (static_cast<CommandId>(hdr.cmd_id)) {
    case CommandId::PingAck:
      return DecodePing(hdr, frame);
    case CommandId::RequestTelemetry:
      return DecodeRequestTelemetry(hdr, frame);
    case CommandId::RequestStorageInfo:
      return DecodeRequestStorageInfo(hdr, frame);
    case CommandId::RequestImage:
      return DecodeRequestImage(hdr, frame);
    case CommandId::RequestNextFilePacket:
      return DecodeRequestNextFilePacket(hdr, frame);
    default:
      return DecodeAckOnly(hdr, frame);
  }
}

Result<DecodedResponse> Decoder::DecodeAckOnly(
    const FrameHeader& hdr, std::span<const uint8_t> frame) noexcept {
  if (!IsAckFrame(frame)) {
    return ErrorCode::InvalidResponse;
  }

  const uint8_t status = AckStatusByte(frame);
  if (status == static_cast<uint8_t>(AckStatus::Error)) {
    return ErrorCode::CommandExecutionFailed;
  }
  if (status == static_cast<uint8_t>(AckStatus::Success)) {
    return MakeResponse(hdr);
  }
  return ErrorCode::InvalidResponse;
}

Result<DecodedResponse> Decoder::DecodePing(
    const FrameHeader& hdr, std::span<const uint8_t> frame) noexcept {
  if (!IsAckFrame(frame)) {
    return ErrorCode::InvalidResponse;
  }
  if (AckStatusByte(frame) != PING_VALUE) {
    return ErrorCode::InvalidResponse;
  }
  return MakeResponse(hdr);
}

Result<DecodedResponse> Decoder::DecodeRequestTelemetry(
    const FrameHeader& hdr, std::span<const uint8_t> frame) noexcept {
  if (IsAckFrame(frame)) {
    // Payload не смог собрать телеметрию
    if (AckStatusByte(frame) == static_cast<uint8_t>(AckStatus::Error)) {
      return ErrorCode::CommandExecutionFailed;
    }
    return ErrorCode::InvalidResponse;
  }

  auto tm_result = ParseTelemetry(frame.subspan(HEADER_SIZE, hdr.data_len));
  if (IsError(tm_result)) {
    return GetError(tm_result);
  }

  DecodedResponse resp = MakeResponse(hdr);
  resp.body = GetValue(tm_result);
  return resp;
}

Result<DecodedResponse> Decoder::DecodeRequestStorageInfo(
    const FrameHeader& hdr, std::span<const uint8_t> frame) noexcept {
  if (IsAckFrame(frame)) {
    if (AckStatusByte(frame) == static_cast<uint8_t>(AckStatus::Error)) {
      return ErrorCode::CommandExecutionFailed;
    }
    return ErrorCode::InvalidResponse;
  }

  if (hdr.data_len < StorageInfo::PAYLOAD_SIZE) {
    return ErrorCode::InvalidResponse;
  }

  StorageInfo info;
  info.nb_files = ReadU32(frame, HEADER_SIZE);
  info.dir_size = ReadU32(frame, HEADER_SIZE + 4);
  info.disk_usage = frame[HEADER_SIZE + 8];

  DecodedResponse resp = MakeResponse(hdr);
  resp.body = info;
  return resp;
}

Result<DecodedResponse> Decoder::DecodeRequestImage(
    const FrameHeader& hdr, std::span<const uint8_t> frame) noexcept {
  if (!IsAckFrame(frame)) {
    return ErrorCode::InvalidResponse;
  }

  const uint8_t status = AckStatusByte(frame);
  if (status == static_cast<uint8_t>(AckStatus::Success)) {
    return MakeResponse(hdr);
  }
  if (status == static_cast<uint8_t>(AckStatus::Error)) {
    return ErrorCode::FileNotAvailable;
  }
  return ErrorCode::InvalidResponse;
}

Result<DecodedResponse> Decoder::DecodeRequestNextFilePacket(
    const FrameHeader& hdr, std::span<const uint8_t> frame) noexcept {
  if (IsAckFrame(frame)) {
    // NACK: на стороне payload нет открытого файла
    if (AckStatusByte(frame) == static_cast<uint8_t>(AckStatus::Error)) {
      return ErrorCode::FileNotAvailable;
    }
    return ErrorCode::InvalidResponse;
  }

  // Пустой Data кадр: конец файла
  if (hdr.data_len == 0) {
    return ErrorCode::NoMoreFilePacket;
  }

  auto chunk_result =
      UnwrapFileRecord(frame.subspan(FILE_RECORD_OFFSET, FILE_RECORD_SIZE));
  if (IsError(chunk_result)) {
    return GetError(chunk_result);
  }

  DecodedResponse resp = MakeResponse(hdr);
  resp.body = GetValue(chunk_result);
  return resp;
}

Result<PayloadTelemetry> Decoder::ParseTelemetry(
    std::span<const uint8_t> data) noexcept {
  if (data.size() < PayloadTelemetry::PAYLOAD_SIZE) {
    return ErrorCode::InvalidResponse;
  }

  PayloadTelemetry tm;
  tm.system_time = ReadU32(data, 0);
  tm.system_uptime = ReadU32(data, 4);
  tm.last_executed_cmd_time = ReadU32(data, 8);
  tm.last_executed_cmd_id = data[12];
  tm.payload_state = data[13];
  tm.active_cameras = data[14];
  tm.capture_mode = data[15];
  for (size_t i = 0; i < tm.cam_status.size(); i++) {
    tm.cam_status[i] = data[16 + i];
  }
  tm.imu_status = data[20];
  tm.tasks_in_execution = data[21];
  tm.disk_usage = data[22];
  tm.latest_error = data[23];
  tm.tegrastats_process_status = data[24];
  tm.ram_usage = data[25];
  tm.swap_usage = data[26];
  tm.active_cores = data[27];
  tm.cpu_load = data[28];
  tm.gpu_freq = data[29];
  tm.cpu_temp = data[30];
  tm.gpu_temp = data[31];
  tm.vdd_in = ReadU16(data, 32);
  tm.vdd_cpu_gpu_cv = ReadU16(data, 34);
  tm.vdd_soc = ReadU16(data, 36);

  return tm;
}

Result<FileChunk> Decoder::UnwrapFileRecord(
    std::span<const uint8_t> record) noexcept {
  if (record.size() != FILE_RECORD_SIZE) {
    return ErrorCode::InvalidPacket;
  }

  const uint16_t length = ReadU16(record, 0);
  if (length > MAX_DATA_LENGTH) {
    return ErrorCode::InvalidPacket;
  }

  FileChunk chunk;
  chunk.size = length;
  std::memcpy(chunk.data.data(), record.data() + 2, length);
  return chunk;
}

// ═══════════════════════════════════════════════════════════════════════════
// CRC
// ═══════════════════════════════════════════════════════════════════════════

uint16_t CalculateCrc16(std::span<const uint8_t> data) noexcept {
  uint16_t crc = 0xFFFF;
  for (size_t i = 0; i < data.size(); i++) {
    crc ^= static_cast<uint16_t>(data[i] << 8);
    for (int j = 0; j < 8; j++) {
      if (crc & 0x8000) {
        crc = static_cast<uint16_t>((crc << 1) ^ 0x1021);
      } else {
        crc = static_cast<uint16_t>(crc << 1);
      }
    }
  }
  return crc;
}

}  // namespace sat_payload::protocol
