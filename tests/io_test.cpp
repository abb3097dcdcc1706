#include "io/FileLogger.hpp"
#include "io/SerialChannel.hpp"

#include <gtest/gtest.h>
#include <pty.h> // openpty
#include <unistd.h>

#include <chrono>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <utility>

using namespace std::chrono_literals;

namespace {

  // Pseudo-terminal pair standing in for a /dev/ttyUSB* instrument.
  struct Pty {
    int master{ -1 };
    int slave{ -1 };
    char name[64]{};

    Pty() { openpty(&master, &slave, name, nullptr, nullptr); }
    ~Pty() {
      if (master >= 0)
        ::close(master);
      if (slave >= 0)
        ::close(slave);
    }
    bool ok() const { return master >= 0 && slave >= 0; }
  };

} // namespace

TEST(serial_channel, opens_writes_closes) {
  // create a false ttyUSB0 "device"
  Pty pty;
  ASSERT_TRUE(pty.ok());

  // check that we can open a serial channel to slave dev
  labrun::io::SerialChannel chan;
  ASSERT_TRUE(chan.open(pty.name, B115200));
  EXPECT_TRUE(chan.isOpen());

  // Writer on master side
  const char* msg = "PING\r\n";
  ASSERT_EQ(write(pty.master, msg, strlen(msg)), static_cast<ssize_t>(strlen(msg)));

  auto line = chan.readLine(100ms);
  ASSERT_TRUE(line);
  EXPECT_EQ(*line, "PING");

  ASSERT_TRUE(chan.writeLine("PONG"));
  char buf[16] = { 0 };
  ASSERT_GT(read(pty.master, buf, sizeof(buf) - 1), 0);
  EXPECT_STREQ(buf, "PONG\r\n");

  chan.close();
  EXPECT_FALSE(chan.isOpen());
}

TEST(serial_channel, second_buffered_line_needs_no_new_input) {
  Pty pty;
  ASSERT_TRUE(pty.ok());

  labrun::io::SerialChannel chan;
  ASSERT_TRUE(chan.open(pty.name, B9600));

  const char* msg = "1.25\r\n2.50\r\n";
  ASSERT_EQ(write(pty.master, msg, strlen(msg)), static_cast<ssize_t>(strlen(msg)));

  auto first = chan.readLine(100ms);
  auto second = chan.readLine(10ms);
  ASSERT_TRUE(first);
  ASSERT_TRUE(second);
  EXPECT_EQ(*first, "1.25");
  EXPECT_EQ(*second, "2.50");
}

TEST(serial_channel, read_times_out_without_input) {
  Pty pty;
  ASSERT_TRUE(pty.ok());

  labrun::io::SerialChannel chan;
  ASSERT_TRUE(chan.open(pty.name, B115200));
  EXPECT_FALSE(chan.readLine(20ms));
}

TEST(serial_channel, closed_channel_refuses_io) {
  labrun::io::SerialChannel chan;
  EXPECT_FALSE(chan.isOpen());
  EXPECT_FALSE(chan.writeLine("PING"));
  EXPECT_FALSE(chan.readLine(1ms));
  EXPECT_FALSE(chan.open("/nonexistent/ttyUSB9", B115200));
}

TEST(serial_channel, move_transfers_the_descriptor) {
  Pty pty;
  ASSERT_TRUE(pty.ok());

  labrun::io::SerialChannel a;
  ASSERT_TRUE(a.open(pty.name, B115200));
  labrun::io::SerialChannel b(std::move(a));
  EXPECT_FALSE(a.isOpen());
  EXPECT_TRUE(b.isOpen());
}

TEST(serial_channel, maps_standard_baud_rates) {
  EXPECT_EQ(labrun::io::speedFromBaud(115200), std::optional<speed_t>(B115200));
  EXPECT_EQ(labrun::io::speedFromBaud(9600), std::optional<speed_t>(B9600));
  EXPECT_FALSE(labrun::io::speedFromBaud(12345));
}

TEST(file_logger, buffers_until_flush) {
  const auto path = (std::filesystem::temp_directory_path() / "labrun_file_logger.csv").string();

  {
    labrun::io::FileLogger log;
    ASSERT_TRUE(log.open(path));
    log.write("a,b\n");
    log.write("c,d\n");
    ASSERT_TRUE(log.flush());

    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    EXPECT_EQ(ss.str(), "a,b\nc,d\n");

    labrun::io::FileLogger moved(std::move(log));
    EXPECT_FALSE(log.isOpen());
    EXPECT_TRUE(moved.isOpen());
    moved.write("e,f\n");
  } // destructor flushes

  std::ifstream in(path);
  std::stringstream ss;
  ss << in.rdbuf();
  EXPECT_EQ(ss.str(), "a,b\nc,d\ne,f\n");
  std::remove(path.c_str());
}

TEST(file_logger, open_fails_on_missing_directory) {
  labrun::io::FileLogger log;
  EXPECT_FALSE(log.open("/nonexistent/labrun/log.csv"));
  EXPECT_FALSE(log.isOpen());
}
