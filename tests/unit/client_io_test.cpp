/**
 * @file client_io_test.cpp
 * @brief Unit tests for client-side helpers: pipe URLs, outcomes, fd streams
 */

#include <gtest/gtest.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <string>

#include "client/byte_stream.hpp"
#include "client/pipe_url.hpp"
#include "client/transport_loop.hpp"
#include "http/protocol.hpp"

using namespace hpipe;
using namespace hpipe::client;
using namespace std::chrono_literals;

// ----------------------------------------------------------------------------
// Pipe URL parsing
// ----------------------------------------------------------------------------

TEST(PipeUrlTest, SplitsBaseAndPath) {
    PipeUrl url;
    std::string error;

    ASSERT_TRUE(parse_pipe_url("http://relay.example:8080/backup", url, error)) << error;
    EXPECT_EQ(url.base, "http://relay.example:8080");
    EXPECT_EQ(url.path, "/backup");

    ASSERT_TRUE(parse_pipe_url("http://localhost/x", url, error)) << error;
    EXPECT_EQ(url.base, "http://localhost");
    EXPECT_EQ(url.path, "/x");
}

TEST(PipeUrlTest, StripsQueryAndFragment) {
    PipeUrl url;
    std::string error;

    ASSERT_TRUE(parse_pipe_url("http://h:1/p?offset=5#frag", url, error)) << error;
    EXPECT_EQ(url.path, "/p");
}

TEST(PipeUrlTest, RejectsHttps) {
    PipeUrl url;
    std::string error;

    EXPECT_FALSE(parse_pipe_url("https://h/p", url, error));
    EXPECT_NE(error.find("https"), std::string::npos);
}

TEST(PipeUrlTest, RejectsMalformed) {
    PipeUrl url;
    std::string error;

    EXPECT_FALSE(parse_pipe_url("ftp://h/p", url, error));
    EXPECT_FALSE(parse_pipe_url("http://h", url, error));
    EXPECT_FALSE(parse_pipe_url("http://h/", url, error));
    EXPECT_FALSE(parse_pipe_url("http:///p", url, error));
    EXPECT_FALSE(parse_pipe_url("http://h/a/b", url, error));
}

// ----------------------------------------------------------------------------
// Offsets and outcomes
// ----------------------------------------------------------------------------

TEST(ProtocolTest, ParseOffsetIsStrictDecimal) {
    uint64_t value = 0;

    EXPECT_TRUE(http::parse_offset("0", value));
    EXPECT_EQ(value, 0u);
    EXPECT_TRUE(http::parse_offset("18446744073709551615", value));
    EXPECT_EQ(value, UINT64_MAX);

    EXPECT_FALSE(http::parse_offset("", value));
    EXPECT_FALSE(http::parse_offset("-1", value));
    EXPECT_FALSE(http::parse_offset("+1", value));
    EXPECT_FALSE(http::parse_offset("12a", value));
    EXPECT_FALSE(http::parse_offset(" 1", value));
    EXPECT_FALSE(http::parse_offset("18446744073709551616", value));
}

TEST(TransferOutcomeTest, ExitCodes) {
    EXPECT_EQ(transfer_outcome_to_exit_code(TransferOutcome::SUCCESS), 0);
    EXPECT_EQ(transfer_outcome_to_exit_code(TransferOutcome::ROLE_CONFLICT), 2);
    EXPECT_EQ(transfer_outcome_to_exit_code(TransferOutcome::RESUME_OFFSET_MISMATCH), 3);
    EXPECT_EQ(transfer_outcome_to_exit_code(TransferOutcome::OFFSET_TOO_OLD), 4);
    EXPECT_EQ(transfer_outcome_to_exit_code(TransferOutcome::UPSTREAM_GONE), 5);
    EXPECT_EQ(transfer_outcome_to_exit_code(TransferOutcome::RETRY_BUDGET_EXHAUSTED), 6);
    EXPECT_EQ(transfer_outcome_to_exit_code(TransferOutcome::LOCAL_IO_ERROR), 7);
    EXPECT_EQ(transfer_outcome_to_string(TransferOutcome::UPSTREAM_GONE), "UPSTREAM_GONE");
}

// ----------------------------------------------------------------------------
// File descriptor streams
// ----------------------------------------------------------------------------

class FdStreamTest : public ::testing::Test {
protected:
    void SetUp() override { ASSERT_EQ(::pipe(fds), 0) << std::strerror(errno); }

    void TearDown() override {
        for (int &fd : fds) {
            if (fd >= 0) {
                ::close(fd);
                fd = -1;
            }
        }
    }

    void close_write_end() {
        ::close(fds[1]);
        fds[1] = -1;
    }

    int fds[2] = {-1, -1};
};

TEST_F(FdStreamTest, SinkWritesAndSourceReads) {
    FdByteSink sink(fds[1]);
    FdByteSource source(fds[0]);
    std::string error;

    ASSERT_TRUE(sink.write("123\n", 4, error)) << error;
    ASSERT_TRUE(sink.flush(error)) << error;

    char buffer[16];
    auto result = source.read(buffer, sizeof(buffer), 100ms);
    ASSERT_EQ(result.status, SourceStatus::DATA);
    EXPECT_EQ(std::string(buffer, result.bytes), "123\n");
}

TEST_F(FdStreamTest, SourceTimesOutWhenIdle) {
    FdByteSource source(fds[0]);
    char buffer[16];

    auto result = source.read(buffer, sizeof(buffer), 20ms);
    EXPECT_EQ(result.status, SourceStatus::TIMEOUT);
    EXPECT_EQ(result.bytes, 0u);
}

TEST_F(FdStreamTest, SourceReportsEndOfFile) {
    FdByteSource source(fds[0]);
    close_write_end();
    char buffer[16];

    EXPECT_EQ(source.read(buffer, sizeof(buffer), 100ms).status, SourceStatus::END_OF_FILE);
}

TEST_F(FdStreamTest, SinkFailsOnClosedDescriptor) {
    FdByteSink sink(-1);
    std::string error;

    EXPECT_FALSE(sink.write("x", 1, error));
    EXPECT_NE(error.find("write()"), std::string::npos);
}
