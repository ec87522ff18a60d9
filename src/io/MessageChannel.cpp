/* @file MessageChannel.cpp
 * @brief IO abstraction layer that wraps a worker's pipes - handles file descriptors, framing, line io and RAII - POSIX compliant
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cstddef>
#include <cstring> // for strerror
#include <iostream>
#include <limits>
#include <utility>

// Linux headers
#include <errno.h> // Error integer and strerror() function
#include <poll.h>
#include <unistd.h> // write(), read(), close()

// Tempo headers
#include "io/MessageChannel.hpp"

using namespace tempo::io;

MessageChannel::MessageChannel(int readFd, int writeFd) : readFd_(readFd), writeFd_(writeFd) {}

MessageChannel::~MessageChannel() { close(); }

MessageChannel::MessageChannel(MessageChannel&& other) noexcept
    : readFd_(std::exchange(other.readFd_, -1)), writeFd_(std::exchange(other.writeFd_, -1)),
      rx_buffer_(std::move(other.rx_buffer_)) {}

MessageChannel& MessageChannel::operator=(MessageChannel&& other) noexcept {
  if (this != &other) {
    close();
    readFd_ = std::exchange(other.readFd_, -1);
    writeFd_ = std::exchange(other.writeFd_, -1);
    rx_buffer_ = std::move(other.rx_buffer_);
  }
  return *this;
}

bool MessageChannel::writeLine(const std::string& line) {

  if (writeFd_ < 0) {
    return false;
  }

  std::string out = line;
  if (!out.ends_with("\r\n")) {
    out += "\r\n";
  }

  std::size_t total = 0;
  while (total < out.size()) {
    ssize_t written = ::write(writeFd_, out.data() + total, out.size() - total);
    if (written > 0) {
      total += written;
    } else if (written == -1 && errno == EINTR) {
      continue; // try again
    } else if (written == -1 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      pollfd pfd{ writeFd_, POLLOUT, 0 };
      ::poll(&pfd, 1, 10);
      continue;
    } else {
      // EPIPE: the peer is gone, nothing more will ever be written
      if (errno != EPIPE)
        std::cerr << "Error: " << errno << " from write: " << strerror(errno) << "\n";
      ::close(writeFd_);
      writeFd_ = -1;
      return false;
    }
  }

  return true;
}

std::optional<std::string> MessageChannel::takeBufferedLine() {
  if (auto pos = rx_buffer_.find("\r\n"); pos != std::string::npos) {
    std::string line = rx_buffer_.substr(0, pos);
    rx_buffer_.erase(0, pos + 2); // remove line + CRLF
    return line;
  }
  return std::nullopt;
}

// -------------------------------------------------------------------
// MessageChannel::readLine
// Line reader with timeout and internal buffer.
// Returns std::nullopt on timeout, disconnect, or error.
// -------------------------------------------------------------------
std::optional<std::string> MessageChannel::readLine(std::chrono::milliseconds timeout) {
  if (auto line = takeBufferedLine())
    return line;
  if (readFd_ < 0)
    return std::nullopt;

  char temp[4096];
  pollfd pfd{ readFd_, POLLIN, 0 };

  const auto deadline = std::chrono::steady_clock::now() + timeout;

  while (true) {

    auto ms_left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    int ms = ms_left.count() > 0
                 ? static_cast<int>(std::min<long long>(ms_left.count(), std::numeric_limits<int>::max()))
                 : 0;

    int rc = ::poll(&pfd, 1, ms);
    if (rc == -1) {
      if (errno == EINTR)
        continue; // interrupted → retry
      std::cerr << "poll: " << strerror(errno) << '\n';
      close();
      return std::nullopt;
    }
    if (rc == 0)
      return std::nullopt; // timeout

    if (pfd.revents & (POLLIN | POLLHUP | POLLERR)) {
      ssize_t n = ::read(readFd_, temp, sizeof(temp));
      if (n > 0) {
        rx_buffer_.append(temp, n);
      } else if (n == 0) { // EOF / worker exited
        close();
        return std::nullopt;
      } else if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
        continue; // transient → retry
      } else {
        std::cerr << "read: " << strerror(errno) << '\n';
        close();
        return std::nullopt;
      }

      if (auto line = takeBufferedLine())
        return line;
    }
  }
}

void MessageChannel::close() {
  if (readFd_ >= 0)
    ::close(readFd_);
  if (writeFd_ >= 0)
    ::close(writeFd_);
  readFd_ = -1;
  writeFd_ = -1;
}
