/* @file LineChannel.cpp
 * @brief IO abstraction layer that wraps the host socket - handles file descriptor, framing, line io and RAII - POSIX compliant
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstddef>
#include <cstring> // for strerror
#include <iostream>
#include <utility>

// Linux headers
#include <errno.h> // Error integer and strerror() function
#include <fcntl.h> // Contains file controls like O_NONBLOCK
#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h> // read(), close()

// salvage headers
#include "io/LineChannel.hpp"

using namespace salvage::io;

namespace {
  constexpr const char* kLineEnd = "\r\n";
  constexpr std::size_t kMaxBufferedBytes = 4 * 1024 * 1024; ///< guard against a host that never sends CRLF
} // namespace

LineChannel::~LineChannel() { close(); }

LineChannel::LineChannel(LineChannel&& other) noexcept
    : fd_(std::exchange(other.fd_, -1)), rx_buffer_(std::move(other.rx_buffer_)) {}

LineChannel& LineChannel::operator=(LineChannel&& other) noexcept {
  if (this != &other) {
    close();
    fd_ = std::exchange(other.fd_, -1);
    rx_buffer_ = std::move(other.rx_buffer_);
  }
  return *this;
}

bool LineChannel::connect(const std::string& socketPath) {
  close();

  sockaddr_un addr{};
  if (socketPath.size() >= sizeof(addr.sun_path)) {
    std::cerr << "Error: socket path too long: " << socketPath << "\n";
    return false;
  }
  addr.sun_family = AF_UNIX;
  std::memcpy(addr.sun_path, socketPath.c_str(), socketPath.size() + 1);

  fd_ = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
  if (fd_ < 0) {
    std::cerr << "Error " << errno << " from socket: " << strerror(errno) << "\n";
    return false;
  }

  // connect while still blocking, switch to non-blocking afterwards
  if (::connect(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
    std::cerr << "Error " << errno << " from connect: " << strerror(errno) << "\n";
    close();
    return false;
  }
  return makeNonBlocking();
}

bool LineChannel::adopt(int fd) {
  close();
  if (fd < 0)
    return false;
  fd_ = fd;
  return makeNonBlocking();
}

bool LineChannel::makeNonBlocking() {
  int flags = ::fcntl(fd_, F_GETFL, 0);
  if (flags == -1 || ::fcntl(fd_, F_SETFL, flags | O_NONBLOCK) == -1) {
    std::cerr << "Error " << errno << " from fcntl: " << strerror(errno) << "\n";
    close();
    return false;
  }
  return true;
}

bool LineChannel::writeLine(const std::string& line) {

  if (fd_ < 0) {
    return false;
  }

  std::string out = line;
  if (!out.ends_with(kLineEnd)) {
    out += kLineEnd;
  }

  std::size_t total = 0;
  while (total < out.size()) {
    // MSG_NOSIGNAL: a vanished host must surface as EPIPE, not SIGPIPE
    ssize_t written = ::send(fd_, out.data() + total, out.size() - total, MSG_NOSIGNAL);
    if (written > 0) {
      total += static_cast<std::size_t>(written);
    } else if (written == -1 && errno == EINTR) {
      continue; // try again
    } else if (written == -1 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      pollfd pfd{ fd_, POLLOUT, 0 };
      if (::poll(&pfd, 1, -1) == -1 && errno != EINTR) {
        std::cerr << "poll: " << strerror(errno) << '\n';
        return false;
      }
    } else {
      std::cerr << "Error: " << errno << " from send: " << strerror(errno) << "\n";
      return false;
    }
  }

  return true;
}

// -------------------------------------------------------------------
// LineChannel::readLine
// Non-blocking line reader with timeout and internal buffer.
// Returns std::nullopt on timeout, disconnect, or error.
// -------------------------------------------------------------------
std::optional<std::string> LineChannel::readLine(std::chrono::milliseconds timeout) {
  // a previous read may already hold a complete line
  if (auto pos = rx_buffer_.find(kLineEnd); pos != std::string::npos) {
    std::string line = rx_buffer_.substr(0, pos);
    rx_buffer_.erase(0, pos + 2);
    return line;
  }

  if (fd_ < 0)
    return std::nullopt;

  char temp[4096];
  pollfd pfd{ fd_, POLLIN, 0 };

  const auto deadline = std::chrono::steady_clock::now() + timeout;

  do {
    auto ms_left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    int ms = ms_left.count() > 0 ? static_cast<int>(ms_left.count()) : 0;

    int rc = ::poll(&pfd, 1, ms);
    if (rc == -1) {
      if (errno == EINTR)
        continue; // interrupted → retry
      std::cerr << "poll: " << strerror(errno) << '\n';
      return std::nullopt;
    }
    if (rc == 0)
      break; // timeout

    if (pfd.revents & (POLLIN | POLLHUP)) {
      ssize_t n = ::read(fd_, temp, sizeof(temp));
      if (n > 0) {
        rx_buffer_.append(temp, static_cast<std::size_t>(n));
      } else if (n == 0) { // EOF / host went away
        close();
        return std::nullopt;
      } else if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
        continue; // transient → retry
      } else {
        std::cerr << "read: " << strerror(errno) << '\n';
        close();
        return std::nullopt;
      }

      // Check for complete line
      if (auto pos = rx_buffer_.find(kLineEnd); pos != std::string::npos) {
        std::string line = rx_buffer_.substr(0, pos);
        rx_buffer_.erase(0, pos + 2); // remove line + CRLF
        return line;
      }
      if (rx_buffer_.size() > kMaxBufferedBytes) {
        std::cerr << "read: line exceeds " << kMaxBufferedBytes << " bytes, dropping link\n";
        close();
        return std::nullopt;
      }
    } else if (pfd.revents & (POLLERR | POLLNVAL)) {
      close();
      return std::nullopt;
    }
  } while (std::chrono::steady_clock::now() < deadline);

  return std::nullopt; // timeout/partial
}

void LineChannel::close() {
  if (fd_ >= 0)
    ::close(fd_);
  fd_ = -1;
  rx_buffer_.clear();
}
