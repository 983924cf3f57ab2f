#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include <sys/types.h>

#include "common/transport.hpp"

namespace gsupbridge {

// Low-level helpers for POSIX-style file descriptors.
// Returns total bytes read (0 means EOF) or -1 on unrecoverable error.
ssize_t read_exact(int fd, void* buffer, std::size_t length);
// Returns total bytes written or -1 on unrecoverable error.
ssize_t write_exact(int fd, const void* buffer, std::size_t length);
// One read(2), retried on EINTR only. Returns bytes read, 0 on EOF, -1 on error.
ssize_t read_some(int fd, void* buffer, std::size_t length);

// Put fd in O_NONBLOCK mode.
bool set_nonblocking(int fd, std::string& error);

// Connect a TCP socket to host:port. Returns the fd or -1 (error filled).
int connect_tcp(const std::string& host, std::uint16_t port, std::string& error);

// Transport writing to a socket fd. Does not own the fd.
class FdTransport : public Transport {
 public:
  explicit FdTransport(int fd) : fd_(fd) {}

  bool write(const std::uint8_t* data, std::size_t length,
             std::string& error) override;

  int fd() const { return fd_; }

 private:
  int fd_;
};

// Transport for a non-blocking socket. write() only queues whole frames;
// flush() sends what the socket accepts and keeps the rest. Once the queue
// would exceed `limit` bytes the transport is marked overflowed and refuses
// further frames. Does not own the fd.
class QueuedTransport : public Transport {
 public:
  QueuedTransport(int fd, std::size_t limit) : fd_(fd), limit_(limit) {}

  bool write(const std::uint8_t* data, std::size_t length,
             std::string& error) override;

  // Returns false on a socket error; a full socket is not an error.
  bool flush(std::string& error);

  std::size_t pending() const { return queue_.size() - sent_; }
  bool overflowed() const { return overflowed_; }
  int fd() const { return fd_; }

 private:
  int fd_;
  std::size_t limit_;
  std::vector<std::uint8_t> queue_;
  std::size_t sent_{0};
  bool overflowed_{false};
};

}  // namespace gsupbridge
