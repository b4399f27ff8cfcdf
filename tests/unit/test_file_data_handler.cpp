#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

#include "file_data_handler.hpp"
#include "mock_platform.hpp"
#include "test_helpers.hpp"

using namespace sat_payload;
using namespace sat_payload::testing;

namespace fs = std::filesystem;

namespace {

std::vector<uint8_t> ReadAll(const fs::path& path) {
  std::ifstream in(path, std::ios::binary);
  return std::vector<uint8_t>(std::istreambuf_iterator<char>(in),
                              std::istreambuf_iterator<char>());
}

}  // namespace

class FileDataHandlerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    root_ = fs::temp_directory_path() /
            (std::string("sat_payload_") + info->name());
    fs::remove_all(root_);
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(root_, ec);
  }

  FakePlatform platform_;
  fs::path root_;
};

TEST_F(FileDataHandlerTest, RegisterCreatesDirectory) {
  FileDataHandler storage(platform_, root_);
  EXPECT_FALSE(storage.FileProcessExists("img"));

  ASSERT_TRUE(storage.RegisterFileProcess("img"));
  EXPECT_TRUE(storage.FileProcessExists("img"));
  EXPECT_TRUE(fs::is_directory(root_ / "img"));
  EXPECT_EQ(storage.CurrentFilePath("img"), root_ / "img" / "img_0.bin");
}

TEST_F(FileDataHandlerTest, ChunksAppendUntilCompleted) {
  FileDataHandler storage(platform_, root_);
  ASSERT_TRUE(storage.RegisterFileProcess("img"));

  const auto first = MakeChunk(240, 1);
  const auto second = MakeChunk(17, 50);
  storage.LogFile("img", first);
  storage.LogFile("img", second);
  storage.FileCompleted("img");

  std::vector<uint8_t> expected(first);
  expected.insert(expected.end(), second.begin(), second.end());
  EXPECT_EQ(ReadAll(root_ / "img" / "img_0.bin"), expected);
  EXPECT_EQ(storage.CurrentFilePath("img"), root_ / "img" / "img_1.bin")
      << "Next transfer goes to a new file";
}

TEST_F(FileDataHandlerTest, ExistingFilesAreNotOverwritten) {
  fs::create_directories(root_ / "img");
  std::ofstream(root_ / "img" / "img_0.bin") << "old";

  FileDataHandler storage(platform_, root_);
  ASSERT_TRUE(storage.RegisterFileProcess("img"));
  EXPECT_EQ(storage.CurrentFilePath("img"), root_ / "img" / "img_1.bin");
}

TEST_F(FileDataHandlerTest, UnknownProcessIsLogged) {
  FileDataHandler storage(platform_, root_);
  storage.LogFile("raw", MakeChunk(8));

  EXPECT_TRUE(platform_.HasLog(LogLevel::Error, "unknown file process"));
  EXPECT_FALSE(fs::exists(root_ / "raw"));
}

TEST_F(FileDataHandlerTest, TelemetryRecordsAppended) {
  FileDataHandler storage(platform_, root_);
  storage.LogTelemetry(MakeSampleTelemetry());
  storage.LogTelemetry(MakeSampleTelemetry());

  const auto bytes = ReadAll(root_ / "payload_tm.bin");
  ASSERT_EQ(bytes.size(), 2 * PayloadTelemetry::PAYLOAD_SIZE);
  // system_time = 1700000000 (0x6553F100), big-endian
  EXPECT_EQ(bytes[0], 0x65);
  EXPECT_EQ(bytes[3], 0x00);
}
