#include <gtest/gtest.h>
#include <trace/trace_writer.hpp>
#include <trace/trace_reader.hpp>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

using namespace cantrace;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

namespace {

core::Frame Data(uint32_t id, std::vector<uint8_t> bytes, core::FrameOptions opt = {}) {
  return core::Frame::MakeData(id, bytes, opt).Value();
}

std::string ReadAll(const fs::path& p) {
  std::ifstream in(p, std::ios::binary);
  std::ostringstream oss;
  oss << in.rdbuf();
  return oss.str();
}

std::vector<std::string> Lines(const std::string& text) {
  std::vector<std::string> out;
  std::istringstream in(text);
  std::string l;
  while (std::getline(in, l)) out.push_back(l);
  return out;
}

class TraceFiles : public ::testing::Test {
protected:
  void SetUp() override {
    dir_ = fs::temp_directory_path() /
           ("cantrace_writer_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) + "_" +
            ::testing::UnitTest::GetInstance()->current_test_info()->name());
    fs::remove_all(dir_);
    fs::create_directories(dir_);
  }
  void TearDown() override { fs::remove_all(dir_); }
  fs::path dir_;
};

} // namespace

TEST(TraceFormat, DataLinesMatchTheColumnLayout) {
  auto a = Data(0x123, {0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08});
  auto b = Data(0x456, {0xAA, 0xBB, 0xCC, 0xDD, 0xEE, 0xFF, 0x00, 0x11});
  EXPECT_EQ(trace::FormatLine(1, 0ms, a),
            "      1)      0.000 1  0123 Rx  d 8  01 02 03 04 05 06 07 08\n");
  EXPECT_EQ(trace::FormatLine(2, 100ms, b),
            "      2)      0.100 1  0456 Rx  d 8  AA BB CC DD EE FF 00 11\n");
}

TEST(TraceFormat, OffsetIsRoundedToMilliseconds) {
  auto f = Data(0x7FF, {});
  EXPECT_EQ(trace::FormatLine(3, std::chrono::nanoseconds(1234567890123LL), f),
            "      3)   1234.568 1  07FF Rx  d 0\n");
  EXPECT_EQ(trace::FormatLine(4, std::chrono::microseconds(499), f),
            "      4)      0.000 1  07FF Rx  d 0\n");
}

TEST(TraceFormat, TxExtendedAndFdFrames) {
  core::FrameOptions opt;
  opt.direction = core::Direction::kTx;
  opt.extended = true;
  EXPECT_EQ(trace::FormatLine(5, 2s, Data(0x18DB33F1, {0x02, 0x10, 0x03}, opt)),
            "      5)      2.000 1  18DB33F1 Tx  d 3  02 10 03\n");

  core::FrameOptions fd;
  fd.fd = true;
  std::vector<uint8_t> twelve(12, 0x5A);
  EXPECT_EQ(trace::FormatLine(6, 10ms, Data(0x100, twelve, fd)),
            "      6)      0.010 FD  0100 Rx  d 12  5A 5A 5A 5A 5A 5A 5A 5A 5A 5A 5A 5A\n");
}

TEST(TraceFormat, ErrorLinesCarryTheErrorToken) {
  auto e = core::Frame::MakeError(core::ErrorKind::kBusOff).Value();
  EXPECT_EQ(trace::FormatLine(7, 1500ms, e),
            "      7)      1.500 1  0000 Rx  e 0  BUSOFF\n");
}

TEST(TraceFormat, HeaderLayout) {
  const auto start = std::chrono::system_clock::now();
  auto lines = Lines(trace::FormatHeader(start));
  ASSERT_EQ(lines.size(), 5u);
  EXPECT_EQ(lines[0], ";$FILEVERSION=1.1");
  EXPECT_EQ(lines[1], ";   Start time: " + trace::FormatStartTime(start));
  EXPECT_EQ(lines[2], ";" + std::string(79, '-'));
  EXPECT_EQ(lines[3], ";   Message Number) Time Offset   Type   ID    Rx/Tx   d]  Data Bytes ...");
  EXPECT_EQ(lines[4], lines[2]);
}

TEST(TraceFormat, StartTimeAndFileNameUseLocalTime) {
  std::tm tm{};
  tm.tm_year = 2026 - 1900;
  tm.tm_mon = 9;
  tm.tm_mday = 19;
  tm.tm_hour = 14;
  tm.tm_min = 3;
  tm.tm_sec = 7;
  tm.tm_isdst = -1;
  const auto t = std::chrono::system_clock::from_time_t(std::mktime(&tm)) + 250ms;
  EXPECT_EQ(trace::FormatStartTime(t), "10/19/2026 14:03:07.250");
  EXPECT_EQ(trace::RecordingFileName(t), "2026-10-19T14-03-07.trc");

  auto parsed = trace::ParseStartTime("10/19/2026 14:03:07.250");
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(*parsed, t);
}

TEST(TraceFormat, WriteTraceNumbersFromOne) {
  std::vector<trace::TraceRecord> recs{
      {41, 0ms, Data(0x123, {0x01})},
      {42, 5ms, Data(0x124, {0x02})},
  };
  std::ostringstream out;
  ASSERT_TRUE(trace::WriteTrace(out, recs, std::chrono::system_clock::now()).HasValue());
  auto lines = Lines(out.str());
  ASSERT_EQ(lines.size(), 7u);
  EXPECT_EQ(lines[5], "      1)      0.000 1  0123 Rx  d 1  01");
  EXPECT_EQ(lines[6], "      2)      0.005 1  0124 Rx  d 1  02");
}

TEST(TraceFormat, WriteToAFailedStreamIsAnIoError) {
  std::ostringstream out;
  out.setstate(std::ios::badbit);
  auto r = trace::WriteTrace(out, {}, std::nullopt);
  ASSERT_FALSE(r.HasValue());
  EXPECT_EQ(r.Error().value, core::Errc::kIoError);
}

TEST_F(TraceFiles, SaveTraceWritesAReadableFile) {
  trace::TraceLog log;
  log.start_time = std::chrono::system_clock::now();
  log.records = {
      {1, 0ms, Data(0x123, {0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08})},
      {2, 100ms, Data(0x456, {0xAA, 0xBB, 0xCC, 0xDD, 0xEE, 0xFF, 0x00, 0x11})},
  };
  const auto file = dir_ / "out.trc";
  ASSERT_TRUE(trace::SaveTrace(file, log).HasValue());

  auto lines = Lines(ReadAll(file));
  ASSERT_EQ(lines.size(), 7u);
  EXPECT_EQ(lines[5], "      1)      0.000 1  0123 Rx  d 8  01 02 03 04 05 06 07 08");
  EXPECT_EQ(lines[6], "      2)      0.100 1  0456 Rx  d 8  AA BB CC DD EE FF 00 11");

  // no temp file is left behind
  std::size_t files = 0;
  for (const auto& e : fs::directory_iterator(dir_)) { (void)e; ++files; }
  EXPECT_EQ(files, 1u);
}

TEST_F(TraceFiles, SaveIntoAMissingDirectoryFailsCleanly) {
  auto r = trace::SaveTrace(dir_ / "nope" / "deeper" / "x.trc", trace::TraceLog{});
  ASSERT_FALSE(r.HasValue());
  EXPECT_EQ(r.Error().value, core::Errc::kIoError);
}

TEST_F(TraceFiles, StreamingWriterAppendsRecords) {
  trace::TraceFileWriter w;
  const auto file = dir_ / "rec.trc";
  ASSERT_TRUE(w.Open(file, std::chrono::system_clock::now()).HasValue());
  EXPECT_TRUE(w.IsOpen());
  ASSERT_TRUE(w.Append({1, 0ms, Data(0x10, {0x01})}).HasValue());
  ASSERT_TRUE(w.Append({2, 20ms, Data(0x11, {0x02})}).HasValue());
  EXPECT_EQ(w.MessagesInFile(), 2u);
  w.Close();
  EXPECT_FALSE(w.IsOpen());

  auto lines = Lines(ReadAll(file));
  ASSERT_EQ(lines.size(), 7u);
  EXPECT_EQ(lines[6], "      2)      0.020 1  0011 Rx  d 1  02");

  auto again = w.Append({3, 30ms, Data(0x12, {})});
  ASSERT_FALSE(again.HasValue());
  EXPECT_EQ(again.Error().value, core::Errc::kStateError);
}

TEST_F(TraceFiles, StreamingWriterRollsOverAtTheSizeLimit) {
  const auto start = std::chrono::system_clock::now();
  const std::size_t header = trace::FormatHeader(start).size();
  const std::size_t line = trace::FormatLine(1, 0ms, Data(0x10, {0x01})).size();

  // room for exactly two lines per file
  trace::TraceFileWriter w(header + 2 * line);
  const auto file = dir_ / "roll.trc";
  ASSERT_TRUE(w.Open(file, start).HasValue());
  for (int i = 0; i < 5; ++i) {
    ASSERT_TRUE(w.Append({static_cast<uint64_t>(i + 1), std::chrono::milliseconds(100 * i),
                          Data(0x10, {0x01})}).HasValue());
  }
  EXPECT_EQ(w.FileIndex(), 2u);
  EXPECT_EQ(w.CurrentPath(), dir_ / "roll_002.trc");
  w.Close();

  ASSERT_TRUE(fs::exists(dir_ / "roll.trc"));
  ASSERT_TRUE(fs::exists(dir_ / "roll_001.trc"));
  ASSERT_TRUE(fs::exists(dir_ / "roll_002.trc"));

  // every file restarts numbering and its own time origin
  auto second = trace::ReadTraceFile(dir_ / "roll_001.trc");
  ASSERT_TRUE(second.HasValue()) << second.Error().Describe();
  ASSERT_EQ(second->records.size(), 2u);
  EXPECT_EQ(second->records[0].sequence, 1u);
  EXPECT_EQ(second->records[0].offset, 0ms);
  EXPECT_EQ(second->records[1].offset, 100ms);

  auto last = trace::ReadTraceFile(dir_ / "roll_002.trc");
  ASSERT_TRUE(last.HasValue());
  EXPECT_EQ(last->records.size(), 1u);
}

TEST_F(TraceFiles, OpenTwiceIsAStateError) {
  trace::TraceFileWriter w;
  ASSERT_TRUE(w.Open(dir_ / "a.trc", std::chrono::system_clock::now()).HasValue());
  auto r = w.Open(dir_ / "b.trc", std::chrono::system_clock::now());
  ASSERT_FALSE(r.HasValue());
  EXPECT_EQ(r.Error().value, core::Errc::kStateError);
}
