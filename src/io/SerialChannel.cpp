/* @file SerialChannel.cpp
 * @brief line-framed tty I/O used by serial instrument operators - fd ownership, framing, RAII
 *
 * © 2025 Labrun — MIT-licensed.
 */

// STL headers
#include <cstddef>
#include <cstring> // for strerror
#include <iostream>
#include <utility>

// Linux headers
#include <errno.h> // Error integer and strerror() function
#include <fcntl.h> // Contains file controls like O_RDWR
#include <poll.h>
#include <unistd.h> // write(), read(), close()

// Labrun headers
#include "io/SerialChannel.hpp"

namespace {
  constexpr int kWriteStallMs = 1000;
}

using namespace labrun::io;

std::optional<speed_t> labrun::io::speedFromBaud(long baud) {
  switch (baud) {
  case 9600:
    return B9600;
  case 19200:
    return B19200;
  case 38400:
    return B38400;
  case 57600:
    return B57600;
  case 115200:
    return B115200;
  case 230400:
    return B230400;
  default:
    return std::nullopt;
  }
}

SerialChannel::~SerialChannel() { close(); }

SerialChannel::SerialChannel(SerialChannel&& other) noexcept
    : fd_(std::exchange(other.fd_, -1)), rx_buffer_(std::move(other.rx_buffer_)) {}

SerialChannel& SerialChannel::operator=(SerialChannel&& other) noexcept {
  if (this != &other) {
    close();
    fd_ = std::exchange(other.fd_, -1);
    rx_buffer_ = std::move(other.rx_buffer_);
  }
  return *this;
}

bool SerialChannel::open(const std::string& dev, speed_t baud) {
  close();
  rx_buffer_.clear();

  // open non-blocking, dont become ctrl-TTY
  fd_ = ::open(dev.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
  if (fd_ < 0) {
    std::cerr << "Error " << errno << " from open: " << strerror(errno) << "\n";
    return false;
  }

  // fetch current attrs
  struct termios tty;
  if (tcgetattr(fd_, &tty) != 0) {
    std::cerr << "Error " << errno << " from tcgetattr: " << strerror(errno) << "\n";
    close();
    return false;
  }

  cfmakeraw(&tty);
  tty.c_cflag &= ~CSIZE;
  tty.c_cflag |= CS8;
  tty.c_cflag &= ~CRTSCTS;
  tty.c_iflag &= ~(IXON | IXOFF | IXANY);

  cfsetispeed(&tty, baud);
  cfsetospeed(&tty, baud);

  if (tcsetattr(fd_, TCSANOW, &tty) != 0) {
    std::cerr << "Error " << errno << " from tcsetattr: " << strerror(errno) << "\n";
    close();
    return false;
  }
  return true;
}

bool SerialChannel::writeLine(const std::string& line) {

  if (fd_ < 0) {
    return false;
  }

  std::string out = line;
  if (!out.ends_with("\r\n")) {
    out += "\r\n";
  }

  // Good Pattern for POSIX write loop (required if the tty blocks for instance)
  std::size_t total = 0;
  while (total < out.size()) {
    ssize_t written = ::write(fd_, out.data() + total, out.size() - total);
    if (written > 0) {
      total += static_cast<std::size_t>(written);
    } else if (written == -1 && errno == EINTR) {
      continue; // try again
    } else if (written == -1 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      // tty output queue full: wait until it drains
      pollfd pfd{ fd_, POLLOUT, 0 };
      if (::poll(&pfd, 1, kWriteStallMs) == 0) {
        std::cerr << "Error: write stalled for " << kWriteStallMs << " ms\n";
        return false;
      }
      continue;
    } else {
      std::cerr << "Error: " << errno << " from write: " << strerror(errno) << "\n";
      return false;
    }
  }

  return true;
}

// -------------------------------------------------------------------
// SerialChannel::readLine
// Non-blocking line reader with timeout and internal buffer.
// Returns std::nullopt on timeout, disconnect, or error.
// -------------------------------------------------------------------
std::optional<std::string> SerialChannel::readLine(std::chrono::milliseconds timeout) {
  if (fd_ < 0)
    return std::nullopt;

  // a complete line may already be buffered from the previous read
  if (auto pos = rx_buffer_.find("\r\n"); pos != std::string::npos) {
    std::string line = rx_buffer_.substr(0, pos);
    rx_buffer_.erase(0, pos + 2);
    return line;
  }

  char temp[256];
  pollfd pfd{ fd_, POLLIN, 0 };

  const auto deadline = std::chrono::steady_clock::now() + timeout;

  while (std::chrono::steady_clock::now() < deadline) {

    auto ms_left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    int ms = static_cast<int>(ms_left.count());

    int rc = ::poll(&pfd, 1, ms);
    if (rc == -1) {
      if (errno == EINTR)
        continue; // interrupted → retry
      std::cerr << "poll: " << strerror(errno) << '\n';
      return std::nullopt;
    }
    if (rc == 0)
      break; // timeout

    if (pfd.revents & POLLIN) {
      ssize_t n = ::read(fd_, temp, sizeof(temp));
      if (n > 0) {
        rx_buffer_.append(temp, static_cast<std::size_t>(n));
      } else if (n == 0) { // EOF / disconnect
        close();
        return std::nullopt;
      } else if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
        continue; // transient → retry
      } else {
        std::cerr << "read: " << strerror(errno) << '\n';
        return std::nullopt;
      }

      // Check for complete line
      if (auto pos = rx_buffer_.find("\r\n"); pos != std::string::npos) {
        std::string line = rx_buffer_.substr(0, pos);
        rx_buffer_.erase(0, pos + 2); // remove line + CRLF
        return line;
      }
    }
  }
  return std::nullopt; // timeout/partial
}

void SerialChannel::close() {
  if (fd_ >= 0)
    ::close(fd_);
  fd_ = -1;
}

