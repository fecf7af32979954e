#pragma once
/** @file  LineChannel.hpp
 *  @brief Non-blocking line I/O over a UNIX stream socket (poll under the hood).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <optional>
#include <string>

namespace salvage {
  namespace io {

    /**
 * @class LineChannel
 * @brief RAII wrapper around one connected stream-socket file descriptor.
 *
 *  * Frames I/O as text lines terminated by `\r\n`.
 *  * Either connects to a host socket path or adopts an already-connected fd
 *    (socketpair handed over by a launcher, or a test).
 *  * *Non-copyable*, but move-constructible.
 */

    class LineChannel {

    public:
      //---ctr / dtr--------------------------------------------
      LineChannel() = default;
      virtual ~LineChannel(); // close the socket at destruction

      //---public API-------------------------------------------
      virtual bool connect(const std::string& socketPath);
      bool adopt(int fd); // takes ownership of fd
      virtual bool writeLine(const std::string& line); // returns false on EIO / EPIPE
      virtual std::optional<std::string> readLine(std::chrono::milliseconds timeout);
      virtual bool isOpen() const { return fd_ >= 0; }
      void close();

      //---non-copyable-----------------------------------------
      LineChannel(const LineChannel&) = delete;
      LineChannel& operator=(const LineChannel&) = delete;

      //---mv and mv assign-------------------------------------
      LineChannel(LineChannel&& other) noexcept;
      LineChannel& operator=(LineChannel&& other) noexcept;

    private:
      bool makeNonBlocking();

      int fd_{ -1 };            ///< socket fd (-1==closed)
      std::string rx_buffer_{}; ///< bytes received but not yet returned as a line
    };
  } // namespace io
} // namespace salvage
