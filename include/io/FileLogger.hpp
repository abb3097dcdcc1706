#pragma once
/** @file  FileLogger.hpp
 *  @brief Buffered CSV writer for run logs on the host FS.
 *
 *  © 2025 Labrun — MIT-licensed.
 */

#include <cstddef>
#include <cstdio>
#include <string>
#include <vector>

namespace labrun {
  namespace io {

    /**
 * @class FileLogger
 * @brief RAII wrapper that opens a file, buffers writes, and flushes on demand.
 *
 *  * Buffers up to `kChunk` bytes, then pushes them with one `std::fwrite`.
 *  * Not thread-safe; core::Logger serialises access.
 */
    class FileLogger {
    public:
      static constexpr std::size_t kChunk = 4096;

      FileLogger() = default;
      ~FileLogger(); ///< flush + fclose

      //---public API------------------------------------------------------
      /** Truncates \p path. @returns false if it cannot be opened writable. */
      bool open(const std::string& path);

      /** Queues one CSV line (caller includes trailing '\n'). */
      void write(const std::string& csv);

      /** Force-flush buffer to disk; returns true on success. */
      bool flush();

      void close();

      bool isOpen() const { return fp_ != nullptr; }

      //---non-copyable, move-enabled---------------------------------------
      FileLogger(const FileLogger&) = delete;
      FileLogger& operator=(const FileLogger&) = delete;
      FileLogger(FileLogger&& other) noexcept;
      FileLogger& operator=(FileLogger&& other) noexcept;

    private:
      FILE* fp_{ nullptr };
      std::vector<char> buffer_;
    };

  } // namespace io
} // namespace labrun
