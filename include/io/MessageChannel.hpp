#pragma once
/** @file  MessageChannel.hpp
 *  @brief Line-framed I/O over a pair of pipe descriptors (poll under the hood).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <optional>
#include <string>

namespace tempo {
  namespace io {

    /**
 * @class MessageChannel
 * @brief RAII wrapper around one read fd and one write fd.
 *
 *  * Frames I/O as lines terminated by `\r\n`.
 *  * `readLine()` returns std::nullopt on timeout *and* on EOF; `isOpen()`
 *    tells the two apart (EOF or a hard read error closes the channel).
 *  * *Non-copyable*, but move-constructible.
 */
    class MessageChannel {

    public:
      //---ctr / dtr--------------------------------------------
      MessageChannel() = default;
      MessageChannel(int readFd, int writeFd); ///< takes ownership of both fds
      virtual ~MessageChannel();               // closes both fds

      //---public API-------------------------------------------
      virtual bool writeLine(const std::string& line); // returns false on EPIPE / EIO
      virtual std::optional<std::string> readLine(std::chrono::milliseconds timeout);
      virtual bool isOpen() const { return readFd_ >= 0; }
      void close();

      //---non-copyable-----------------------------------------
      MessageChannel(const MessageChannel&) = delete;
      MessageChannel& operator=(const MessageChannel&) = delete;

      //---mv and mv assign-------------------------------------
      MessageChannel(MessageChannel&& other) noexcept;
      MessageChannel& operator=(MessageChannel&& other) noexcept;

    private:
      std::optional<std::string> takeBufferedLine();

      int readFd_{ -1 };        ///< -1 == closed
      int writeFd_{ -1 };       ///< -1 == closed
      std::string rx_buffer_{}; ///< bytes received but not yet returned
    };
  } // namespace io
} // namespace tempo
