#include "cloner/device_streamer.hpp"
#include "system/signals.hpp"
#include "testing.hpp"

#include <gtest/gtest.h>

#include <cerrno>
#include <fstream>
#include <string>
#include <vector>

namespace cloner {
namespace {

class MemoryWriter final : public IWriter {
  public:
    // fail_after: total bytes accepted before WriteAll starts failing.
    explicit MemoryWriter(size_t fail_after = SIZE_MAX) : fail_after_(fail_after) {}

    Result WriteAll(std::span<const std::uint8_t> in) override {
        ++write_calls;
        if (data.size() + in.size() > fail_after_) {
            return Result::Fail(ErrorKind::WriteError, EIO, "Write failed (Input/output error)");
        }
        data.insert(data.end(), in.begin(), in.end());
        return Result::Ok();
    }

    Result FsyncNow() override {
        ++fsyncs;
        return Result::Ok();
    }

    std::vector<std::uint8_t> data;
    int write_calls = 0;
    int fsyncs = 0;

  private:
    size_t fail_after_;
};

TEST(DeviceStreamerTest, CopiesWholeStream) {
    const auto payload = testutil::PatternBytes(3 * DeviceStreamer::kBlockSize + 17);
    testutil::MemoryReader src(payload);
    MemoryWriter dst;

    DeviceStreamer streamer;
    auto r = streamer.Copy(src, dst);
    ASSERT_TRUE(r.ok) << r.msg;
    EXPECT_EQ(dst.data, payload);
}

TEST(DeviceStreamerTest, FsyncsOnIntervalAndAtEnd) {
    const auto payload = testutil::PatternBytes(10 * 1000);
    testutil::MemoryReader src(payload, 1000);
    MemoryWriter dst;

    DeviceStreamer::Options opt;
    opt.fsync_interval_bytes = 4000;
    DeviceStreamer streamer(opt);
    ASSERT_TRUE(streamer.Copy(src, dst).ok);

    // After 4000 and 8000 bytes, plus the final one.
    EXPECT_EQ(dst.fsyncs, 3);
}

TEST(DeviceStreamerTest, ZeroIntervalOnlyFsyncsAtEnd) {
    testutil::MemoryReader src(testutil::PatternBytes(5000), 100);
    MemoryWriter dst;

    DeviceStreamer::Options opt;
    opt.fsync_interval_bytes = 0;
    ASSERT_TRUE(DeviceStreamer(opt).Copy(src, dst).ok);
    EXPECT_EQ(dst.fsyncs, 1);
}

TEST(DeviceStreamerTest, WriteFailureMidStreamStopsImmediately) {
    testutil::MemoryReader src(testutil::PatternBytes(10 * 1024), 1024);
    MemoryWriter dst(/*fail_after=*/4096);

    auto r = DeviceStreamer().Copy(src, dst);
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.kind, ErrorKind::WriteError);
    EXPECT_EQ(dst.data.size(), 4096U);
    EXPECT_EQ(dst.write_calls, 5);
}

TEST(DeviceStreamerTest, SourceFailureIsReadError) {
    testutil::FailingReader src(2048, EIO);
    MemoryWriter dst;

    auto r = DeviceStreamer().Copy(src, dst);
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.kind, ErrorKind::ReadError);
    EXPECT_EQ(r.err, EIO);
    EXPECT_EQ(dst.data.size(), 2048U);
}

// Raises the cancel flag from inside the first write, as a signal landing
// while a block is being written would.
class CancelOnWriteWriter final : public IWriter {
  public:
    Result WriteAll(std::span<const std::uint8_t> in) override {
        written += in.size();
        g_cancel.store(true, std::memory_order_relaxed);
        return Result::Ok();
    }

    Result FsyncNow() override { return Result::Ok(); }

    size_t written = 0;
};

class DeviceStreamerCancelTest : public ::testing::Test {
  protected:
    void SetUp() override { g_cancel.store(false); }
    void TearDown() override { g_cancel.store(false); }
};

TEST_F(DeviceStreamerCancelTest, FlagRaisedDuringWriteStopsCopy) {
    testutil::MemoryReader src(testutil::PatternBytes(8 * DeviceStreamer::kBlockSize));
    CancelOnWriteWriter dst;

    auto r = DeviceStreamer().Copy(src, dst);
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.kind, ErrorKind::Cancelled);
    EXPECT_EQ(r.err, ECANCELED);
    EXPECT_EQ(dst.written, DeviceStreamer::kBlockSize);
}

TEST_F(DeviceStreamerCancelTest, FlagSetBeforeStartWritesNothing) {
    testutil::MemoryReader src(testutil::PatternBytes(4096));
    MemoryWriter dst;
    g_cancel.store(true);

    auto r = DeviceStreamer().Copy(src, dst);
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.kind, ErrorKind::Cancelled);
    EXPECT_EQ(dst.write_calls, 0);
    EXPECT_EQ(dst.fsyncs, 0);
}

TEST_F(DeviceStreamerCancelTest, ReaderReportingCanceledIsCancelled) {
    testutil::FailingReader src(1024, ECANCELED);
    MemoryWriter dst;

    auto r = DeviceStreamer().Copy(src, dst);
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.kind, ErrorKind::Cancelled);
}

TEST(DeviceStreamerTest, StreamToDeviceWritesImageFile) {
    testutil::TemporaryDirectory tmp;
    const std::string path = tmp.Path() + "/disk.img";
    const auto payload = testutil::PatternBytes(70'000);
    testutil::MemoryReader src(payload);

    auto r = DeviceStreamer().StreamToDevice(src, path);
    ASSERT_TRUE(r.ok) << r.msg;

    std::ifstream is(path, std::ios::binary);
    const std::vector<std::uint8_t> got((std::istreambuf_iterator<char>(is)), std::istreambuf_iterator<char>());
    EXPECT_EQ(got, payload);
}

TEST(DeviceStreamerTest, StreamToDeviceOpenFailureIsWriteError) {
    testutil::TemporaryDirectory tmp;
    testutil::MemoryReader src(std::string("data"));

    auto r = DeviceStreamer().StreamToDevice(src, tmp.Path() + "/missing/disk.img");
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.kind, ErrorKind::WriteError);
}

} // namespace
} // namespace cloner
