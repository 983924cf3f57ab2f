#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "common/ipa.hpp"
#include "common/processor.hpp"
#include "common/socket_io.hpp"

namespace gsupbridge::server {

class Connection;

// Replies a peer has not read yet. A peer that lets more pile up is dropped.
constexpr std::size_t kMaxOutboundBytes = 1024 * 1024;

// Single-threaded IPA/GSUP server. All sockets are non-blocking and
// multiplexed with poll(); each connection owns its reassembly buffer and
// outbound queue, and nothing is shared between connections except the
// processor.
class Server {
 public:
  Server(std::string host, std::uint16_t port, GsmProcessor& processor);
  ~Server();

  Server(const Server&) = delete;
  Server& operator=(const Server&) = delete;

  bool start();
  void stop();

  // Wait up to timeout_ms for socket activity and handle it.
  void poll_once(int timeout_ms);

  // Port actually bound (differs from the configured one when that is 0).
  std::uint16_t port() const { return port_; }
  std::size_t connection_count() const { return connections_.size(); }

 private:
  void accept_one();
  void close_all_connections();

  std::string host_;
  std::uint16_t port_;
  GsmProcessor& processor_;
  int listen_fd_{-1};
  std::vector<std::unique_ptr<Connection>> connections_;
};

class Connection {
 public:
  Connection(int fd, std::string peer, GsmProcessor& processor);
  ~Connection();

  Connection(const Connection&) = delete;
  Connection& operator=(const Connection&) = delete;

  // One read from the socket, fed to the IPA layer, then as much of the
  // reply queue as the socket takes. Returns false once the connection is
  // gone (EOF, error or overflowed queue); it is closed by then.
  bool on_readable();
  // Flush queued replies. Same return convention as on_readable().
  bool on_writable();
  void close(const std::string& reason);

  // Replies are waiting for the socket to drain.
  bool wants_write() const { return fd_ >= 0 && transport_.pending() > 0; }

  int fd() const { return fd_; }
  const std::string& peer() const { return peer_; }

 private:
  bool flush();

  int fd_;
  std::string peer_;
  QueuedTransport transport_;
  IpaProtocol protocol_;
};

}  // namespace gsupbridge::server
