#pragma once
/** @file  SerialChannel.hpp
 *  @brief Non-blocking UART line I/O wrapper (uses poll/termios under the hood).
 *
 *  © 2025 Labrun — MIT-licensed.
 */

#include <chrono>
#include <optional>
#include <string>

// Linux header
#include <termios.h> // for speed_t types e.g., B115200

namespace labrun {
  namespace io {

    /// Map a numeric baud rate to its termios constant; std::nullopt if unsupported.
    std::optional<speed_t> speedFromBaud(long baud);

    /**
 * @class SerialChannel
 * @brief RAII wrapper around a single /dev/tty* file descriptor.
 *
 *  * Frames I/O as ASCII lines (`\r\n`).
 *  * *Non-copyable*, but move-constructible.
 *  * Virtual I/O so operators can be tested against a fake port.
 */

    class SerialChannel {

    public:
      //---ctr / dtr--------------------------------------------
      SerialChannel() = default;
      virtual ~SerialChannel(); // close the /dev/tty fd at destruction

      //---public API-------------------------------------------
      virtual bool open(const std::string& dev, speed_t baud);
      virtual bool writeLine(const std::string& line); // returns false on EIO
      virtual std::optional<std::string> readLine(std::chrono::milliseconds timeout);
      virtual void close();
      virtual bool isOpen() const { return fd_ >= 0; }

      //---non-copyable-----------------------------------------
      SerialChannel(const SerialChannel&) = delete;
      SerialChannel& operator=(const SerialChannel&) = delete;

      //---mv and mv assign-------------------------------------
      SerialChannel(SerialChannel&& other) noexcept;
      SerialChannel& operator=(SerialChannel&& other) noexcept;

    private:
      int fd_{ -1 };            ///< POSIX fd (-1==closed)
      std::string rx_buffer_{}; ///< buffer to store readLine content
    };
  } // namespace io
} // namespace labrun
