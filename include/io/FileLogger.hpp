#pragma once
/** @file  FileLogger.hpp
 *  @brief Buffered CSV writer for the cycle journal.
 *
 *  © 2025 CubeCycle contributors — MIT-licensed.
 */

#include <cstdio>
#include <string>
#include <vector>

namespace cubecycle {
  namespace io {

    /**
 * @class FileLogger
 * @brief RAII wrapper that opens a file for appending, buffers writes, and
 *        flushes on demand.
 *
 *  * Buffer is pushed to disk once it passes kFlushThreshold bytes.
 *  * Uses `std::fwrite`; destructor flushes and closes.
 */
    class FileLogger {
    public:
      static constexpr std::size_t kFlushThreshold = 4096;

      FileLogger() = default;
      ~FileLogger(); ///< flush + fclose

      //---public API------------------------------------------------------
      /** @returns false if path cannot be opened writable. */
      bool open(const std::string& path);

      bool isOpen() const { return fp_ != nullptr; }

      /** Queues one CSV line (caller includes trailing '\n'). */
      void write(const std::string& csv);

      /** Force-flush buffer to disk; returns true on success. */
      bool flush();

      void close();

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
} // namespace cubecycle
