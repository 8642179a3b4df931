#include <gtest/gtest.h>
#include <string>
#include <fcntl.h>
#include <unistd.h>

#include "northstar/error.h"
#include "northstar/pipe.h"
#include "test_support.h"

namespace {

std::string frame_header(uint32_t size) {
    std::string header(4, '\0');
    header[0] = static_cast<char>((size >> 24) & 0xff);
    header[1] = static_cast<char>((size >> 16) & 0xff);
    header[2] = static_cast<char>((size >> 8) & 0xff);
    header[3] = static_cast<char>(size & 0xff);
    return header;
}

} // namespace

TEST(PipeTest, FramesSurviveThePipe) {
    Pipe pipe = make_pipe();
    json request = {{"id", 7}, {"request", "list"}};
    ASSERT_TRUE(send_frame(pipe.write.get(), request));
    ASSERT_TRUE(send_frame(pipe.write.get(), json{{"id", 8}, {"request", "shutdown"}}));
    pipe.write.reset();

    json received;
    ASSERT_TRUE(recv_frame(pipe.read.get(), received));
    EXPECT_EQ(request, received);
    ASSERT_TRUE(recv_frame(pipe.read.get(), received));
    EXPECT_EQ(8, received["id"].get<int>());
    EXPECT_FALSE(recv_frame(pipe.read.get(), received));
}

TEST(PipeTest, HeaderIsBigEndianLength) {
    Pipe pipe = make_pipe();
    ASSERT_TRUE(send_frame(pipe.write.get(), json{{"a", 1}}));
    pipe.write.reset();
    std::string raw;
    ASSERT_TRUE(read_to_end(pipe.read.get(), raw));
    const std::string body = json{{"a", 1}}.dump();
    EXPECT_EQ(frame_header(static_cast<uint32_t>(body.size())) + body, raw);
}

TEST(PipeTest, InvalidUtf8IsReplaced) {
    Pipe pipe = make_pipe();
    ASSERT_TRUE(send_frame(pipe.write.get(), json{{"message", std::string("bad \xff byte")}}));
    pipe.write.reset();

    json received;
    ASSERT_TRUE(recv_frame(pipe.read.get(), received));
    EXPECT_EQ("bad \xef\xbf\xbd byte", received["message"].get<std::string>());
}

TEST(PipeTest, OversizedFrameIsAProtocolError) {
    Pipe pipe = make_pipe();
    ASSERT_TRUE(write_all(pipe.write.get(), frame_header(MAX_FRAME_SIZE + 1)));
    json message;
    EXPECT_EQ(ErrorCode::ProtocolError, error_code_of([&] { recv_frame(pipe.read.get(), message); }));
}

TEST(PipeTest, EmptyFrameIsAProtocolError) {
    Pipe pipe = make_pipe();
    ASSERT_TRUE(write_all(pipe.write.get(), frame_header(0)));
    json message;
    EXPECT_EQ(ErrorCode::ProtocolError, error_code_of([&] { recv_frame(pipe.read.get(), message); }));
}

TEST(PipeTest, GarbageBodyIsAProtocolError) {
    Pipe pipe = make_pipe();
    const std::string body = "{not json";
    ASSERT_TRUE(write_all(pipe.write.get(), frame_header(static_cast<uint32_t>(body.size())) + body));
    json message;
    EXPECT_EQ(ErrorCode::ProtocolError, error_code_of([&] { recv_frame(pipe.read.get(), message); }));
}

TEST(PipeTest, TruncatedFrameIsAProtocolError) {
    Pipe pipe = make_pipe();
    ASSERT_TRUE(write_all(pipe.write.get(), frame_header(100) + "{\"id\":"));
    pipe.write.reset();
    json message;
    EXPECT_EQ(ErrorCode::ProtocolError, error_code_of([&] { recv_frame(pipe.read.get(), message); }));
}

TEST(PipeTest, UniqueFdTransfersOwnership) {
    Pipe pipe = make_pipe();
    const int fd = pipe.read.get();
    UniqueFd moved(std::move(pipe.read));
    EXPECT_FALSE(pipe.read.valid());
    EXPECT_EQ(fd, moved.get());

    UniqueFd assigned;
    assigned = std::move(moved);
    EXPECT_EQ(fd, assigned.get());
    assigned.reset();
    EXPECT_FALSE(assigned.valid());
    EXPECT_EQ(-1, fcntl(fd, F_GETFD));
}

TEST(PipeTest, ReadExactFailsOnShortInput) {
    Pipe pipe = make_pipe();
    ASSERT_TRUE(write_all(pipe.write.get(), "abc"));
    pipe.write.reset();
    char buffer[8];
    EXPECT_FALSE(read_exact(pipe.read.get(), buffer, sizeof(buffer)));
}
