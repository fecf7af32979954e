#include "io/FileLogger.hpp"
#include "io/LineChannel.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <cstring>
#include <fstream>
#include <sstream>
#include <string>
#include <sys/socket.h> // socketpair
#include <unistd.h>

namespace {
  std::string tempPath(const char* name) {
    return ::testing::TempDir() + name + std::to_string(::getpid());
  }

  std::string slurp(const std::string& path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
  }
} // namespace

TEST(line_channel, adopts_reads_writes_closes) {
  // the far end plays the host
  int fds[2];
  ASSERT_EQ(0, ::socketpair(AF_UNIX, SOCK_STREAM, 0, fds));
  const int hostFd = fds[1];

  salvage::io::LineChannel chan;
  ASSERT_TRUE(chan.adopt(fds[0]));
  ASSERT_TRUE(chan.isOpen());

  const char* msg = "PING\r\n";
  ASSERT_EQ(static_cast<ssize_t>(std::strlen(msg)), ::write(hostFd, msg, std::strlen(msg)));

  auto line = chan.readLine(std::chrono::milliseconds{ 100 });
  ASSERT_TRUE(line);
  EXPECT_EQ(*line, "PING");

  ASSERT_TRUE(chan.writeLine("PONG"));
  char buf[16] = { 0 };
  ASSERT_GT(::read(hostFd, buf, sizeof(buf) - 1), 0);
  EXPECT_STREQ(buf, "PONG\r\n");

  ::close(hostFd);
}

TEST(line_channel, splits_several_lines_from_one_read) {
  int fds[2];
  ASSERT_EQ(0, ::socketpair(AF_UNIX, SOCK_STREAM, 0, fds));
  salvage::io::LineChannel chan;
  ASSERT_TRUE(chan.adopt(fds[0]));

  const std::string burst = "one\r\ntwo\r\nthr";
  ASSERT_EQ(static_cast<ssize_t>(burst.size()), ::write(fds[1], burst.data(), burst.size()));

  EXPECT_EQ(chan.readLine(std::chrono::milliseconds{ 100 }), std::optional<std::string>("one"));
  EXPECT_EQ(chan.readLine(std::chrono::milliseconds{ 100 }), std::optional<std::string>("two"));
  // partial line: times out, stays buffered
  EXPECT_FALSE(chan.readLine(std::chrono::milliseconds{ 20 }));
  EXPECT_TRUE(chan.isOpen());

  ASSERT_EQ(4, ::write(fds[1], "ee\r\n", 4));
  EXPECT_EQ(chan.readLine(std::chrono::milliseconds{ 100 }), std::optional<std::string>("three"));

  ::close(fds[1]);
}

TEST(line_channel, host_hangup_closes_channel) {
  int fds[2];
  ASSERT_EQ(0, ::socketpair(AF_UNIX, SOCK_STREAM, 0, fds));
  salvage::io::LineChannel chan;
  ASSERT_TRUE(chan.adopt(fds[0]));

  ::close(fds[1]);

  EXPECT_FALSE(chan.readLine(std::chrono::milliseconds{ 100 }));
  EXPECT_FALSE(chan.isOpen());
  EXPECT_FALSE(chan.writeLine("late"));
}

TEST(line_channel, connect_to_missing_socket_fails) {
  salvage::io::LineChannel chan;
  EXPECT_FALSE(chan.connect(tempPath("no-such-host.sock")));
  EXPECT_FALSE(chan.isOpen());
}

TEST(line_channel, move_transfers_ownership) {
  int fds[2];
  ASSERT_EQ(0, ::socketpair(AF_UNIX, SOCK_STREAM, 0, fds));
  salvage::io::LineChannel a;
  ASSERT_TRUE(a.adopt(fds[0]));

  salvage::io::LineChannel b(std::move(a));

  EXPECT_FALSE(a.isOpen());
  EXPECT_TRUE(b.isOpen());
  ::close(fds[1]);
}

TEST(file_logger, appends_across_reopen) {
  const std::string path = tempPath("salvage-filelogger.csv");
  std::remove(path.c_str());

  {
    salvage::io::FileLogger log;
    ASSERT_TRUE(log.open(path));
    log.write("1,info,test,first\n");
    EXPECT_TRUE(log.flush());
  }
  {
    salvage::io::FileLogger log;
    ASSERT_TRUE(log.open(path));
    log.write("2,info,test,second\n");
  } // destructor flushes

  EXPECT_EQ(slurp(path), "1,info,test,first\n2,info,test,second\n");
  std::remove(path.c_str());
}

TEST(file_logger, open_fails_for_unwritable_path) {
  salvage::io::FileLogger log;
  EXPECT_FALSE(log.open("/nonexistent-dir/salvage.csv"));
  EXPECT_FALSE(log.isOpen());
}
