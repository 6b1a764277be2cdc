#include "cloner/channel.hpp"
#include "io/named_pipe_reader.hpp"
#include "system/signals.hpp"
#include "testing.hpp"

#include <gtest/gtest.h>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <string>
#include <thread>

namespace cloner {
namespace {

void WriteToFifo(const std::string& path, const std::string& data) {
    const int fd = ::open(path.c_str(), O_WRONLY);
    if (fd < 0) return;
    size_t off = 0;
    while (off < data.size()) {
        const ssize_t n = ::write(fd, data.data() + off, data.size() - off);
        if (n <= 0) break;
        off += static_cast<size_t>(n);
    }
    ::close(fd);
}

class NamedPipeReaderTest : public ::testing::Test {
  protected:
    void SetUp() override {
        g_cancel.store(false);
        fifo_ = tmp_.Path() + "/pipe";
        ASSERT_EQ(::mkfifo(fifo_.c_str(), 0600), 0);
    }

    void TearDown() override { g_cancel.store(false); }

    testutil::TemporaryDirectory tmp_;
    std::string fifo_;
};

TEST_F(NamedPipeReaderTest, ReadsUntilWriterCloses) {
    const std::string payload(200'000, 'q');
    std::thread producer(WriteToFifo, fifo_, payload);

    NamedPipeReader reader;
    auto r = NamedPipeReader::Open(fifo_, reader);
    ASSERT_TRUE(r.ok) << r.msg;
    EXPECT_TRUE(reader.IsOpen());

    const std::string got = testutil::ReadAll(reader);
    producer.join();

    EXPECT_EQ(got, payload);
    reader.Close();
    EXPECT_FALSE(reader.IsOpen());
}

TEST_F(NamedPipeReaderTest, CancelFlagFailsReadWithBufferedData) {
    std::thread producer(WriteToFifo, fifo_, std::string("pending bytes"));

    NamedPipeReader reader;
    auto r = NamedPipeReader::Open(fifo_, reader);
    ASSERT_TRUE(r.ok) << r.msg;
    // The whole message sits in the pipe buffer once the writer is gone.
    producer.join();

    g_cancel.store(true);
    std::array<std::uint8_t, 64> buf{};
    errno = 0;
    EXPECT_EQ(reader.Read(std::span<std::uint8_t>(buf.data(), buf.size())), -1);
    EXPECT_EQ(errno, ECANCELED);

    g_cancel.store(false);
    EXPECT_EQ(testutil::ReadAll(reader), "pending bytes");
}

TEST_F(NamedPipeReaderTest, MissingPathIsChannelOpenError) {
    NamedPipeReader reader;
    auto r = NamedPipeReader::Open(tmp_.Path() + "/absent", reader);
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.kind, ErrorKind::ChannelOpenError);
    EXPECT_EQ(r.err, ENOENT);
}

TEST_F(NamedPipeReaderTest, ChannelOpensFreshHandleEachTime) {
    NamedPipeChannel channel(fifo_);
    EXPECT_EQ(channel.Name(), fifo_);

    for (const std::string msg : {"first session", "second session"}) {
        std::thread producer(WriteToFifo, fifo_, msg);
        std::unique_ptr<IReader> in;
        auto r = channel.Open(in);
        ASSERT_TRUE(r.ok) << r.msg;
        EXPECT_EQ(testutil::ReadAll(*in), msg);
        in.reset();
        producer.join();
    }
}

} // namespace
} // namespace cloner
