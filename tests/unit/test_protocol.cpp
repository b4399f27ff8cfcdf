#include <gtest/gtest.h>

#include <algorithm>
#include <array>
#include <string_view>
#include <variant>
#include <vector>

#include "protocol.hpp"
#include "test_helpers.hpp"

using namespace sat_payload;
using namespace sat_payload::protocol;
using namespace sat_payload::testing;

// ═══════════════════════════════════════════════════════════════════════════
// CRC16 Tests
// ═══════════════════════════════════════════════════════════════════════════

TEST(Crc16Test, CheckValue) {
  constexpr std::string_view kCheck = "123456789";
  std::vector<uint8_t> data(kCheck.begin(), kCheck.end());
  EXPECT_EQ(CalculateCrc16(data), 0x29B1)
      << "CRC16-CCITT (0x1021, init 0xFFFF) check value mismatch";
}

TEST(Crc16Test, EmptyInputReturnsInitialValue) {
  EXPECT_EQ(CalculateCrc16({}), 0xFFFF);
}

TEST(Crc16Test, FullFrameResidueIsZero) {
  const auto chunk = MakeChunk(100, 0x30);
  const Frame frame = MakeFilePacketFrame(chunk);

  EXPECT_EQ(CalculateCrc16(frame), 0x0000)
      << "CRC over frame with its own trailing CRC must be zero";
  EXPECT_TRUE(FrameParser::ValidateCrc(frame));
}

TEST(Crc16Test, CrcStoredBigEndian) {
  const auto chunk = MakeChunk(10);
  const Frame frame = MakeFilePacketFrame(chunk);

  const uint16_t crc =
      CalculateCrc16(std::span<const uint8_t>(frame.data(), CRC_OFFSET));
  EXPECT_EQ(frame[CRC_OFFSET], crc >> 8);
  EXPECT_EQ(frame[CRC_OFFSET + 1], crc & 0xFF);
}

TEST(Crc16Test, ValidateCrcRejectsWrongSize) {
  const Frame ack = MakeAck(CommandId::Shutdown, AckStatus::Success);
  EXPECT_FALSE(FrameParser::ValidateCrc(ack));
}

// Любая однобитная ошибка в Data кадре обнаруживается
TEST(Crc16Test, SingleBitFlipIsAlwaysDetected) {
  for (size_t size : {1u, 38u, 120u, 239u, 240u}) {
    const auto chunk = MakeChunk(size, static_cast<uint8_t>(size));
    const Frame good = MakeFilePacketFrame(chunk);
    ASSERT_TRUE(IsOk(Decoder::Decode(good))) << "size=" << size;

    for (size_t bit = 0; bit < good.size() * 8; bit++) {
      Frame bad = good;
      bad[bit / 8] ^= static_cast<uint8_t>(1u << (bit % 8));
      auto result = Decoder::Decode(bad);
      ASSERT_TRUE(IsError(result)) << "size=" << size << " bit=" << bit;
      ASSERT_EQ(GetError(result), ErrorCode::InvalidPacket)
          << "size=" << size << " bit=" << bit;
    }
  }
}

// ═══════════════════════════════════════════════════════════════════════════
// Frame Gate Tests
// ═══════════════════════════════════════════════════════════════════════════

TEST(DecoderTest, RejectsEveryOtherFrameSize) {
  std::vector<uint8_t> buffer(400, 0x0A);
  for (size_t size = 0; size <= buffer.size(); size++) {
    if (size == ACK_PACKET_SIZE || size == DATA_PACKET_SIZE) continue;
    auto result =
        Decoder::Decode(std::span<const uint8_t>(buffer.data(), size));
    ASSERT_TRUE(IsError(result)) << "size=" << size;
    EXPECT_EQ(GetError(result), ErrorCode::InvalidPacket) << "size=" << size;
  }
}

TEST(DecoderTest, AckWithWrongLengthFieldIsInvalidPacket) {
  Frame ack = MakeAck(CommandId::ClearStorage, AckStatus::Success);
  ack[4] = 2;  // len = 2

  auto result = Decoder::Decode(ack);
  ASSERT_TRUE(IsError(result));
  EXPECT_EQ(GetError(result), ErrorCode::InvalidPacket);
}

TEST(DecoderTest, DataLengthAbove240IsInvalidPacket) {
  Frame frame = MakeFilePacketFrame(MakeChunk(240));
  // len = 241 с пересчитанным CRC: отвергается по длине, а не по CRC
  frame[3] = 0x00;
  frame[4] = 0xF1;
  const uint16_t crc =
      CalculateCrc16(std::span<const uint8_t>(frame.data(), CRC_OFFSET));
  frame[CRC_OFFSET] = crc >> 8;
  frame[CRC_OFFSET + 1] = crc & 0xFF;
  ASSERT_TRUE(FrameParser::ValidateCrc(frame));

  auto result = Decoder::Decode(frame);
  ASSERT_TRUE(IsError(result));
  EXPECT_EQ(GetError(result), ErrorCode::InvalidPacket);
}

TEST(DecoderTest, UnknownCommandIsInvalidCommand) {
  auto ack_result = Decoder::Decode(MakeAck(static_cast<CommandId>(0x13),
                                            AckStatus::Success));
  ASSERT_TRUE(IsError(ack_result));
  EXPECT_EQ(GetError(ack_result), ErrorCode::InvalidCommand);

  const auto payload = MakeChunk(4);
  auto data_result = Decoder::Decode(MakeDataFrame(0x7F, payload));
  ASSERT_TRUE(IsError(data_result));
  EXPECT_EQ(GetError(data_result), ErrorCode::InvalidCommand);
}

TEST(DecoderTest, ParseHeaderReadsBigEndianFields) {
  const Frame ack = MakeAck(CommandId::RunOd, AckStatus::Success, 0x1234);
  auto result = FrameParser::ParseHeader(ack);
  ASSERT_TRUE(IsOk(result));
  EXPECT_EQ(GetValue(result).cmd_id, 0x0D);
  EXPECT_EQ(GetValue(result).seq, 0x1234);
  EXPECT_EQ(GetValue(result).data_len, 1);

  std::array<uint8_t, 4> short_buf{};
  EXPECT_TRUE(IsError(FrameParser::ParseHeader(short_buf)));
}

// ═══════════════════════════════════════════════════════════════════════════
// Ack-only Commands
// ═══════════════════════════════════════════════════════════════════════════

TEST(DecoderTest, AckOnlyCommandSuccess) {
  auto result = Decoder::Decode(
      MakeAck(CommandId::EnableCameras, AckStatus::Success, 7));
  ASSERT_TRUE(IsOk(result)) << "ACK.SUCCESS should decode as Ok";
  EXPECT_EQ(GetValue(result).cmd_id, CommandId::EnableCameras);
  EXPECT_EQ(GetValue(result).seq, 7);
  EXPECT_TRUE(std::holds_alternative<std::monostate>(GetValue(result).body));
}

TEST(DecoderTest, AckOnlyCommandNack) {
  auto result =
      Decoder::Decode(MakeAck(CommandId::CaptureImages, AckStatus::Error));
  ASSERT_TRUE(IsError(result));
  EXPECT_EQ(GetError(result), ErrorCode::CommandExecutionFailed);
}

TEST(DecoderTest, AckOnlyCommandUnknownStatus) {
  auto result = Decoder::Decode(MakeAck(CommandId::Shutdown, 0x42));
  ASSERT_TRUE(IsError(result));
  EXPECT_EQ(GetError(result), ErrorCode::InvalidResponse);
}

TEST(DecoderTest, AckOnlyCommandWithDataFrameIsInvalidResponse) {
  const auto payload = MakeChunk(3);
  auto result =
      Decoder::Decode(MakeDataFrame(CommandId::ClearStorage, payload));
  ASSERT_TRUE(IsError(result));
  EXPECT_EQ(GetError(result), ErrorCode::InvalidResponse);
}

// ═══════════════════════════════════════════════════════════════════════════
// Ping
// ═══════════════════════════════════════════════════════════════════════════

TEST(DecoderTest, PingReplyWithPingValue) {
  auto result = Decoder::Decode(MakePingReply());
  ASSERT_TRUE(IsOk(result));
  EXPECT_EQ(GetValue(result).cmd_id, CommandId::PingAck);
}

TEST(DecoderTest, PingReplyWithAckSuccessIsInvalidResponse) {
  auto result =
      Decoder::Decode(MakeAck(CommandId::PingAck, AckStatus::Success));
  ASSERT_TRUE(IsError(result));
  EXPECT_EQ(GetError(result), ErrorCode::InvalidResponse);
}

// ═══════════════════════════════════════════════════════════════════════════
// Telemetry
// ═══════════════════════════════════════════════════════════════════════════

TEST(DecoderTest, TelemetryFieldsDecoded) {
  const PayloadTelemetry sent = MakeSampleTelemetry();
  auto result = Decoder::Decode(MakeTelemetryFrame(sent, 3));
  ASSERT_TRUE(IsOk(result)) << "Telemetry frame should decode";

  const auto* tm = std::get_if<PayloadTelemetry>(&GetValue(result).body);
  ASSERT_NE(tm, nullptr) << "Body should carry telemetry";
  EXPECT_EQ(tm->system_time, 1700000000u);
  EXPECT_EQ(tm->system_uptime, 3600u);
  EXPECT_EQ(tm->last_executed_cmd_time, 1699999990u);
  EXPECT_EQ(tm->last_executed_cmd_id, 0x05);
  EXPECT_EQ(tm->active_cameras, 0b1011);
  EXPECT_EQ(tm->cam_status[2], 0);
  EXPECT_EQ(tm->cam_status[3], 1);
  EXPECT_EQ(tm->disk_usage, 37);
  EXPECT_EQ(tm->cpu_load, 42);
  EXPECT_EQ(tm->gpu_temp, 47);
  EXPECT_EQ(tm->vdd_in, 5120);
  EXPECT_EQ(tm->vdd_cpu_gpu_cv, 1850);
  EXPECT_EQ(tm->vdd_soc, 1430);
  EXPECT_EQ(tm->ActiveCameraCount(), 3);
}

TEST(DecoderTest, TelemetryWireLayoutIsBigEndian) {
  PayloadTelemetry tm;
  tm.system_time = 0x01020304;
  tm.vdd_soc = 0xA1B2;
  std::array<uint8_t, PayloadTelemetry::PAYLOAD_SIZE> buf{};
  auto size = ResponseFrameBuilder::SerializeTelemetry(buf, tm);
  ASSERT_TRUE(IsOk(size));
  EXPECT_EQ(GetValue(size), 38u);
  EXPECT_EQ(buf[0], 0x01);
  EXPECT_EQ(buf[3], 0x04);
  EXPECT_EQ(buf[36], 0xA1);
  EXPECT_EQ(buf[37], 0xB2);
}

TEST(DecoderTest, TelemetryTooShortIsInvalidResponse) {
  const auto payload = MakeChunk(PayloadTelemetry::PAYLOAD_SIZE - 1);
  auto result =
      Decoder::Decode(MakeDataFrame(CommandId::RequestTelemetry, payload));
  ASSERT_TRUE(IsError(result));
  EXPECT_EQ(GetError(result), ErrorCode::InvalidResponse);
}

TEST(DecoderTest, TelemetryNackIsCommandExecutionFailed) {
  auto result =
      Decoder::Decode(MakeAck(CommandId::RequestTelemetry, AckStatus::Error));
  ASSERT_TRUE(IsError(result));
  EXPECT_EQ(GetError(result), ErrorCode::CommandExecutionFailed);
}

// ═══════════════════════════════════════════════════════════════════════════
// Storage Info
// ═══════════════════════════════════════════════════════════════════════════

TEST(DecoderTest, StorageInfoDecoded) {
  const std::array<uint8_t, 9> payload{0x00, 0x00, 0x01, 0x2C,  // 300 files
                                       0x00, 0x10, 0x00, 0x00,  // 1048576 KB
                                       81};
  auto result =
      Decoder::Decode(MakeDataFrame(CommandId::RequestStorageInfo, payload));
  ASSERT_TRUE(IsOk(result));

  const auto* info = std::get_if<StorageInfo>(&GetValue(result).body);
  ASSERT_NE(info, nullptr);
  EXPECT_EQ(info->nb_files, 300u);
  EXPECT_EQ(info->dir_size, 1048576u);
  EXPECT_EQ(info->disk_usage, 81);
}

TEST(DecoderTest, StorageInfoTooShortIsInvalidResponse) {
  const auto payload = MakeChunk(8);
  auto result =
      Decoder::Decode(MakeDataFrame(CommandId::RequestStorageInfo, payload));
  ASSERT_TRUE(IsError(result));
  EXPECT_EQ(GetError(result), ErrorCode::InvalidResponse);
}

// ═══════════════════════════════════════════════════════════════════════════
// Image / File Packets
// ═══════════════════════════════════════════════════════════════════════════

TEST(DecoderTest, RequestImageAckAndNack) {
  // [cmd=0x09, seq=0,0, len=0,1, status=0x0A]
  const Frame ack{0x09, 0x00, 0x00, 0x00, 0x01, 0x0A};
  auto ok = Decoder::Decode(ack);
  ASSERT_TRUE(IsOk(ok));
  EXPECT_EQ(GetValue(ok).cmd_id, CommandId::RequestImage);

  auto nack =
      Decoder::Decode(MakeAck(CommandId::RequestImage, AckStatus::Error));
  ASSERT_TRUE(IsError(nack));
  EXPECT_EQ(GetError(nack), ErrorCode::FileNotAvailable);
}

TEST(DecoderTest, FilePacketUnwrapsInnerLengthPrefix) {
  const auto chunk = MakeChunk(17, 0xA0);
  auto result = Decoder::Decode(MakeFilePacketFrame(chunk, 5));
  ASSERT_TRUE(IsOk(result));

  const auto* file = std::get_if<FileChunk>(&GetValue(result).body);
  ASSERT_NE(file, nullptr) << "Body should carry a file chunk";
  ASSERT_EQ(file->size, 17);
  EXPECT_TRUE(std::equal(chunk.begin(), chunk.end(), file->Bytes().begin()));
}

TEST(DecoderTest, FilePacketFullChunk) {
  const auto chunk = MakeChunk(MAX_DATA_LENGTH, 0x11);
  auto result = Decoder::Decode(MakeFilePacketFrame(chunk));
  ASSERT_TRUE(IsOk(result));

  const auto* file = std::get_if<FileChunk>(&GetValue(result).body);
  ASSERT_NE(file, nullptr);
  EXPECT_EQ(file->size, MAX_DATA_LENGTH);
  EXPECT_EQ(file->data[0], 0x11);
  EXPECT_EQ(file->data[239], static_cast<uint8_t>(0x11 + 239));
}

TEST(DecoderTest, EmptyFilePacketSignalsEndOfFile) {
  auto result = Decoder::Decode(MakeEndOfFileFrame());
  ASSERT_TRUE(IsError(result));
  EXPECT_EQ(GetError(result), ErrorCode::NoMoreFilePacket);
}

TEST(DecoderTest, FilePacketNackIsFileNotAvailable) {
  auto result = Decoder::Decode(
      MakeAck(CommandId::RequestNextFilePacket, AckStatus::Error));
  ASSERT_TRUE(IsError(result));
  EXPECT_EQ(GetError(result), ErrorCode::FileNotAvailable);
}

TEST(DecoderTest, UnwrapFileRecordChecksSizeAndLength) {
  std::array<uint8_t, FILE_RECORD_SIZE> record{};
  record[0] = 0x00;
  record[1] = 0xF1;  // 241 > 240
  auto too_long = Decoder::UnwrapFileRecord(record);
  ASSERT_TRUE(IsError(too_long));
  EXPECT_EQ(GetError(too_long), ErrorCode::InvalidPacket);

  auto wrong_size = Decoder::UnwrapFileRecord(
      std::span<const uint8_t>(record.data(), FILE_RECORD_SIZE - 1));
  ASSERT_TRUE(IsError(wrong_size));
  EXPECT_EQ(GetError(wrong_size), ErrorCode::InvalidPacket);

  record[1] = 2;
  record[2] = 0xDE;
  record[3] = 0xAD;
  auto ok = Decoder::UnwrapFileRecord(record);
  ASSERT_TRUE(IsOk(ok));
  EXPECT_EQ(GetValue(ok).size, 2);
  EXPECT_EQ(GetValue(ok).data[1], 0xAD);
}

// ═══════════════════════════════════════════════════════════════════════════
// Encoder Tests
// ═══════════════════════════════════════════════════════════════════════════

TEST(EncoderTest, CommandWithoutArgsIsSingleByte) {
  const auto ping = Encoder::EncodePing();
  ASSERT_EQ(ping.Size(), 1u);
  EXPECT_EQ(ping.Bytes()[0], 0x00);

  const auto image = Encoder::EncodeRequestImage();
  ASSERT_EQ(image.Size(), 1u);
  EXPECT_EQ(image.Bytes()[0], 0x09);
  EXPECT_EQ(image.Id(), CommandId::RequestImage);

  EXPECT_EQ(Encoder::EncodeDebugStopDisplay().Bytes()[0], 0x12);
  EXPECT_EQ(Encoder::EncodeClearStorage().Bytes()[0], 0x0B);
}

TEST(EncoderTest, RequestNextFilePacketBigEndian) {
  const auto frame = Encoder::EncodeRequestNextFilePacket(0x0102);
  ASSERT_EQ(frame.Size(), 3u);
  EXPECT_EQ(frame.Bytes()[0], 0x0A);
  EXPECT_EQ(frame.Bytes()[1], 0x01);
  EXPECT_EQ(frame.Bytes()[2], 0x02);
}

TEST(EncoderTest, StartCaptureImagesPeriodicallyArgs) {
  const auto frame = Encoder::EncodeStartCaptureImagesPeriodically(2, 5);
  const std::vector<uint8_t> expected{0x06, 0x00, 0x02, 0x00, 0x05};
  ASSERT_EQ(frame.Size(), expected.size());
  EXPECT_TRUE(std::equal(expected.begin(), expected.end(),
                         frame.Bytes().begin()));
}

TEST(EncoderTest, SynchronizeTimeArgs) {
  const auto frame = Encoder::EncodeSynchronizeTime(0x65A1B2C3);
  const std::vector<uint8_t> expected{0x0F, 0x65, 0xA1, 0xB2, 0xC3};
  ASSERT_EQ(frame.Size(), expected.size());
  EXPECT_TRUE(std::equal(expected.begin(), expected.end(),
                         frame.Bytes().begin()));
}

TEST(EncoderTest, EncodeWithArgsRejectsOversizedArgs) {
  std::array<uint8_t, SEND_BUFFER_SIZE - 1> fits{};
  auto ok = Encoder::EncodeWithArgs(CommandId::RunOd, fits);
  ASSERT_TRUE(ok.has_value());
  EXPECT_EQ(ok->Size(), SEND_BUFFER_SIZE);

  std::array<uint8_t, SEND_BUFFER_SIZE> too_many{};
  EXPECT_FALSE(Encoder::EncodeWithArgs(CommandId::RunOd, too_many).has_value());
}

TEST(EncoderTest, CommandFrameAppendStopsAtCapacity) {
  CommandFrame frame(CommandId::FullReset);
  for (size_t i = 1; i < SEND_BUFFER_SIZE; i++) {
    ASSERT_TRUE(frame.Append(static_cast<uint8_t>(i)));
  }
  EXPECT_FALSE(frame.Append(0xFF)) << "Buffer full";
  EXPECT_FALSE(frame.AppendU16(0xFFFF));
  EXPECT_EQ(frame.Size(), SEND_BUFFER_SIZE);
}

// ═══════════════════════════════════════════════════════════════════════════
// ResponseFrameBuilder / ToString
// ═══════════════════════════════════════════════════════════════════════════

TEST(ResponseFrameBuilderTest, RejectsSmallBufferAndLongPayload) {
  std::array<uint8_t, 5> small{};
  EXPECT_TRUE(IsError(ResponseFrameBuilder::BuildAck(small, 0x01, 0, 0x0A)));

  std::array<uint8_t, DATA_PACKET_SIZE> frame{};
  std::array<uint8_t, MAX_DATA_LENGTH + 1> payload{};
  auto result = ResponseFrameBuilder::BuildData(frame, 0x02, 0, payload);
  ASSERT_TRUE(IsError(result));
  EXPECT_EQ(GetError(result), ErrorCode::InvalidPacket);
}

TEST(ResponseFrameBuilderTest, DataPayloadIsZeroPadded) {
  const std::array<uint8_t, 3> payload{1, 2, 3};
  const Frame frame = MakeDataFrame(CommandId::RequestOdResult, payload, 9);
  EXPECT_EQ(frame[0], 0x0E);
  EXPECT_EQ(frame[2], 9);
  EXPECT_EQ(frame[4], 3);
  EXPECT_EQ(frame[7], 3);
  for (size_t i = HEADER_SIZE + payload.size(); i < CRC_OFFSET; i++) {
    ASSERT_EQ(frame[i], 0) << "index " << i;
  }
}

TEST(ProtocolToStringTest, Names) {
  EXPECT_STREQ(ToString(ErrorCode::InvalidPacket), "INVALID_PACKET");
  EXPECT_STREQ(ToString(ErrorCode::NoMoreFilePacket), "NO_MORE_FILE_PACKET");
  EXPECT_STREQ(ToString(CommandId::RequestNextFilePacket),
               "REQUEST_NEXT_FILE_PACKET");
  EXPECT_STREQ(ToString(static_cast<CommandId>(0x40)), "UNKNOWN");
}
