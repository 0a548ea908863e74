#include <gtest/gtest.h>
#include <cerrno>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <sstream>
#include <streambuf>
#include <thread>
#include "log_follower.h"

namespace fs = std::filesystem;

namespace {

// Unbuffered sink that can be read while another thread writes to it
class SharedBuffer : public std::streambuf {
public:
    std::string snapshot() {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_data;
    }

protected:
    std::streamsize xsputn(const char* s, std::streamsize n) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_data.append(s, static_cast<size_t>(n));
        return n;
    }

    int_type overflow(int_type ch) override {
        if (traits_type::eq_int_type(ch, traits_type::eof())) {
            return traits_type::not_eof(ch);
        }
        std::lock_guard<std::mutex> lock(m_mutex);
        m_data.push_back(traits_type::to_char_type(ch));
        return ch;
    }

private:
    std::mutex m_mutex;
    std::string m_data;
};

bool waitForOutput(SharedBuffer& buffer, const std::string& expected) {
    for (int i = 0; i < 200; ++i) {
        if (buffer.snapshot() == expected) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return false;
}

} // namespace

class LogFollowerTest : public ::testing::Test {
protected:
    void SetUp() override {
        const ::testing::TestInfo* info = ::testing::UnitTest::GetInstance()->current_test_info();
        m_directory = fs::temp_directory_path() / ("modelctl_log_test_" + std::string(info->name()));
        fs::remove_all(m_directory);
        fs::create_directories(m_directory);
        m_path = (m_directory / "server.log").string();
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(m_directory, ec);
    }

    void writeFile(const std::string& content) {
        std::ofstream file(m_path, std::ios::binary | std::ios::trunc);
        file << content;
    }

    void appendFile(const std::string& content) {
        std::ofstream file(m_path, std::ios::binary | std::ios::app);
        file << content;
    }

    std::string tail(int lastLines) {
        std::ostringstream out;
        std::string errorMessage;
        EXPECT_TRUE(LogReader::tail(m_path, lastLines, out, errorMessage)) << errorMessage;
        return out.str();
    }

    fs::path m_directory;
    std::string m_path;
};

TEST_F(LogFollowerTest, TailZeroShowsWholeFile) {
    writeFile("line1\nline2\nline3\n");
    EXPECT_EQ(tail(0), "line1\nline2\nline3\n");
}

TEST_F(LogFollowerTest, TailShowsLastLines) {
    writeFile("line1\nline2\nline3\n");
    EXPECT_EQ(tail(2), "line2\nline3\n");
    EXPECT_EQ(tail(1), "line3\n");
}

TEST_F(LogFollowerTest, TailLargerThanFile) {
    writeFile("line1\nline2\nline3\n");
    EXPECT_EQ(tail(10), "line1\nline2\nline3\n");
}

TEST_F(LogFollowerTest, TailEmptyFile) {
    writeFile("");
    EXPECT_EQ(tail(5), "");
}

TEST_F(LogFollowerTest, TailStripsCarriageReturns) {
    writeFile("a\r\nb\r\n");
    EXPECT_EQ(tail(0), "a\nb\n");
}

TEST_F(LogFollowerTest, TailEmitsUnterminatedLastLine) {
    writeFile("a\nb");
    EXPECT_EQ(tail(0), "a\nb\n");
}

TEST_F(LogFollowerTest, MissingFileIsAnError) {
    std::ostringstream out;
    std::string errorMessage;
    std::string missing = (m_directory / "missing.log").string();
    EXPECT_FALSE(LogReader::tail(missing, 0, out, errorMessage));
    EXPECT_NE(errorMessage.find("failed to open log file"), std::string::npos);
    EXPECT_NE(errorMessage.find(missing), std::string::npos);
    EXPECT_EQ(out.str(), "");
}

TEST_F(LogFollowerTest, DirectoryIsAnError) {
    std::ostringstream out;
    std::string errorMessage;
    EXPECT_FALSE(LogReader::tail(m_directory.string(), 0, out, errorMessage));
    EXPECT_NE(errorMessage.find("failed to open log file"), std::string::npos);
}

TEST_F(LogFollowerTest, FollowMissingFileFailsBeforeWatching) {
    CancellationToken cancel;
    std::ostringstream out;
    std::string errorMessage;
    EXPECT_FALSE(LogReader::follow(cancel, (m_directory / "missing.log").string(), 0, out, errorMessage,
                                   std::chrono::milliseconds(10)));
    EXPECT_NE(errorMessage.find("failed to open log file"), std::string::npos);
}

TEST_F(LogFollowerTest, FollowCancelledBeforeStartPrintsNothing) {
    writeFile("line1\n");
    CancellationToken cancel;
    cancel.cancel();

    std::ostringstream out;
    std::string errorMessage;
    EXPECT_TRUE(LogReader::follow(cancel, m_path, 0, out, errorMessage, std::chrono::milliseconds(10)));
    EXPECT_EQ(out.str(), "");
}

TEST_F(LogFollowerTest, FollowStreamsAppendedLines) {
    writeFile("line1\nline2\n");

    SharedBuffer buffer;
    std::ostream out(&buffer);
    CancellationToken cancel;
    std::string errorMessage;
    bool result = false;

    std::thread follower([&]() {
        result = LogReader::follow(cancel, m_path, 1, out, errorMessage, std::chrono::milliseconds(10));
    });

    EXPECT_TRUE(waitForOutput(buffer, "line2\n"));
    appendFile("line3\n");
    EXPECT_TRUE(waitForOutput(buffer, "line2\nline3\n"));

    cancel.cancel();
    follower.join();
    EXPECT_TRUE(result) << errorMessage;
    EXPECT_EQ(buffer.snapshot(), "line2\nline3\n");
}

TEST_F(LogFollowerTest, PartialLineWaitsForNewline) {
    writeFile("first\n");
    std::ostringstream out;
    std::string errorMessage;
    LogFollower follower(m_path, 0, out);

    ASSERT_TRUE(follower.start(errorMessage)) << errorMessage;
    EXPECT_EQ(follower.state(), LogFollower::State::Polling);
    EXPECT_EQ(out.str(), "first\n");

    appendFile("par");
    ASSERT_TRUE(follower.poll(errorMessage)) << errorMessage;
    EXPECT_EQ(out.str(), "first\n");
    EXPECT_EQ(follower.pendingFragment(), "par");

    appendFile("tial\nnext");
    ASSERT_TRUE(follower.poll(errorMessage)) << errorMessage;
    EXPECT_EQ(out.str(), "first\npartial\n");
    EXPECT_EQ(follower.pendingFragment(), "next");

    follower.stop();
    EXPECT_EQ(follower.state(), LogFollower::State::Done);
    EXPECT_EQ(follower.pendingFragment(), "");
    EXPECT_EQ(out.str(), "first\npartial\n");
}

TEST_F(LogFollowerTest, StartWithholdsUnterminatedLine) {
    writeFile("a\nb");
    std::ostringstream out;
    std::string errorMessage;
    LogFollower follower(m_path, 0, out);

    ASSERT_TRUE(follower.start(errorMessage)) << errorMessage;
    EXPECT_EQ(out.str(), "a\n");
    EXPECT_EQ(follower.pendingFragment(), "b");
    EXPECT_EQ(follower.offset(), 3u);
}

TEST_F(LogFollowerTest, TruncationRestartsFromBeginning) {
    writeFile("old line one\nold line two\n");
    std::ostringstream out;
    std::string errorMessage;
    LogFollower follower(m_path, 0, out);
    ASSERT_TRUE(follower.start(errorMessage)) << errorMessage;

    writeFile("new\n");
    ASSERT_TRUE(follower.poll(errorMessage)) << errorMessage;
    EXPECT_EQ(out.str(), "old line one\nold line two\nnew\n");
    EXPECT_EQ(follower.offset(), 4u);
}

TEST_F(LogFollowerTest, VanishedFileIsWaitedFor) {
    writeFile("one\n");
    std::ostringstream out;
    std::string errorMessage;
    LogFollower follower(m_path, 0, out);
    ASSERT_TRUE(follower.start(errorMessage)) << errorMessage;

    fs::remove(m_path);
    EXPECT_TRUE(follower.poll(errorMessage)) << errorMessage;
    EXPECT_EQ(follower.state(), LogFollower::State::Polling);

    // Comes back longer than the old offset
    writeFile("restarted server\n");
    ASSERT_TRUE(follower.poll(errorMessage)) << errorMessage;
    EXPECT_EQ(out.str(), "one\nrestarted server\n");
    EXPECT_EQ(follower.offset(), 17u);
}

TEST_F(LogFollowerTest, RecreatedEmptyFileIsReadFromStart) {
    writeFile("one\n");
    std::ostringstream out;
    std::string errorMessage;
    LogFollower follower(m_path, 0, out);
    ASSERT_TRUE(follower.start(errorMessage)) << errorMessage;

    fs::remove(m_path);
    ASSERT_TRUE(follower.poll(errorMessage)) << errorMessage;

    writeFile("");
    ASSERT_TRUE(follower.poll(errorMessage)) << errorMessage;
    EXPECT_EQ(follower.offset(), 0u);

    appendFile("two\n");
    ASSERT_TRUE(follower.poll(errorMessage)) << errorMessage;
    EXPECT_EQ(out.str(), "one\ntwo\n");
}

TEST_F(LogFollowerTest, PendingFragmentOfRemovedFileIsDropped) {
    writeFile("one\npart");
    std::ostringstream out;
    std::string errorMessage;
    LogFollower follower(m_path, 0, out);
    ASSERT_TRUE(follower.start(errorMessage)) << errorMessage;
    EXPECT_EQ(follower.pendingFragment(), "part");

    fs::remove(m_path);
    ASSERT_TRUE(follower.poll(errorMessage)) << errorMessage;

    writeFile("fresh start\n");
    ASSERT_TRUE(follower.poll(errorMessage)) << errorMessage;
    EXPECT_EQ(out.str(), "one\nfresh start\n");
    EXPECT_EQ(follower.pendingFragment(), "");
}

#ifndef _WIN32
TEST_F(LogFollowerTest, ReplacedFileIsReadFromStart) {
    writeFile("one\n");
    std::ostringstream out;
    std::string errorMessage;
    LogFollower follower(m_path, 0, out);
    ASSERT_TRUE(follower.start(errorMessage)) << errorMessage;

    // Swapped in between two polls, never seen missing
    std::string replacement = (m_directory / "server.log.new").string();
    {
        std::ofstream file(replacement, std::ios::binary);
        file << "rotated log line\n";
    }
    fs::rename(replacement, m_path);

    ASSERT_TRUE(follower.poll(errorMessage)) << errorMessage;
    EXPECT_EQ(out.str(), "one\nrotated log line\n");
}
#endif

TEST_F(LogFollowerTest, PollBeforeStartStarts) {
    writeFile("x\ny\n");
    std::ostringstream out;
    std::string errorMessage;
    LogFollower follower(m_path, 1, out);

    EXPECT_EQ(follower.state(), LogFollower::State::Init);
    ASSERT_TRUE(follower.poll(errorMessage)) << errorMessage;
    EXPECT_EQ(follower.state(), LogFollower::State::Polling);
    EXPECT_EQ(out.str(), "y\n");
}

TEST(LogReaderTest, OpenFailureMessage) {
    EXPECT_EQ(LogReader::openFailureMessage("/nonexistent/modelctl/server.log", ENOENT),
              "failed to open log file /nonexistent/modelctl/server.log: no such file or directory");
}
