#include "common/socket_io.hpp"

#include <cerrno>
#include <cstring>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace gsupbridge {

ssize_t read_exact(int fd, void* buffer, std::size_t length) {
  auto* out = static_cast<std::uint8_t*>(buffer);
  std::size_t total = 0;
  while (total < length) {
    ssize_t n = ::read(fd, out + total, length - total);
    if (n == 0) {
      return static_cast<ssize_t>(total);  // EOF
    }
    if (n < 0) {
      if (errno == EINTR) continue;
      return -1;
    }
    total += static_cast<std::size_t>(n);
  }
  return static_cast<ssize_t>(total);
}

ssize_t write_exact(int fd, const void* buffer, std::size_t length) {
  const auto* in = static_cast<const std::uint8_t*>(buffer);
  std::size_t total = 0;
  while (total < length) {
    ssize_t n = ::send(fd, in + total, length - total, MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EINTR) continue;
      return -1;
    }
    total += static_cast<std::size_t>(n);
  }
  return static_cast<ssize_t>(total);
}

ssize_t read_some(int fd, void* buffer, std::size_t length) {
  while (true) {
    ssize_t n = ::read(fd, buffer, length);
    if (n < 0 && errno == EINTR) continue;
    return n;
  }
}

bool set_nonblocking(int fd, std::string& error) {
  int flags = ::fcntl(fd, F_GETFL, 0);
  if (flags < 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
    error = std::string("fcntl: ") + std::strerror(errno);
    return false;
  }
  return true;
}

int connect_tcp(const std::string& host, std::uint16_t port,
                std::string& error) {
  int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) {
    error = std::string("socket: ") + std::strerror(errno);
    return -1;
  }
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  if (::inet_pton(AF_INET, host.c_str(), &addr.sin_addr) <= 0) {
    error = "invalid host: " + host;
    ::close(fd);
    return -1;
  }
  if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
    error = std::string("connect: ") + std::strerror(errno);
    ::close(fd);
    return -1;
  }
  return fd;
}

bool FdTransport::write(const std::uint8_t* data, std::size_t length,
                        std::string& error) {
  if (fd_ < 0) {
    error = "transport closed";
    return false;
  }
  ssize_t n = write_exact(fd_, data, length);
  if (n != static_cast<ssize_t>(length)) {
    error = std::string("failed to write full frame: ") + std::strerror(errno);
    return false;
  }
  return true;
}

bool QueuedTransport::write(const std::uint8_t* data, std::size_t length,
                            std::string& error) {
  if (overflowed_ || pending() + length > limit_) {
    overflowed_ = true;
    error = "outbound queue full (" + std::to_string(pending()) + " bytes)";
    return false;
  }
  queue_.insert(queue_.end(), data, data + length);
  return true;
}

bool QueuedTransport::flush(std::string& error) {
  while (sent_ < queue_.size()) {
    ssize_t n = ::send(fd_, queue_.data() + sent_, queue_.size() - sent_,
                       MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EINTR) continue;
      if (errno == EAGAIN || errno == EWOULDBLOCK) break;
      error = std::string("send: ") + std::strerror(errno);
      return false;
    }
    sent_ += static_cast<std::size_t>(n);
  }
  if (sent_ == queue_.size()) {
    queue_.clear();
    sent_ = 0;
  } else if (sent_ >= queue_.size() / 2) {
    queue_.erase(queue_.begin(),
                 queue_.begin() + static_cast<std::ptrdiff_t>(sent_));
    sent_ = 0;
  }
  return true;
}

}  // namespace gsupbridge
