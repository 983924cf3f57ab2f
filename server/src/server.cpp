#include "server/server.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <sstream>

#include <spdlog/spdlog.h>

namespace gsupbridge::server {

namespace {

constexpr std::size_t kReadChunk = 4096;

int create_listen_socket(const std::string& host, std::uint16_t port) {
  int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) {
    spdlog::error("socket: {}", std::strerror(errno));
    return -1;
  }
  int opt = 1;
  ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));
  std::string error;
  if (!set_nonblocking(fd, error)) {
    spdlog::error("listen socket: {}", error);
    ::close(fd);
    return -1;
  }

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  if (::inet_pton(AF_INET, host.c_str(), &addr.sin_addr) <= 0) {
    spdlog::error("invalid host: {}", host);
    ::close(fd);
    return -1;
  }
  if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
    spdlog::error("bind {}:{}: {}", host, port, std::strerror(errno));
    ::close(fd);
    return -1;
  }
  if (::listen(fd, 64) < 0) {
    spdlog::error("listen: {}", std::strerror(errno));
    ::close(fd);
    return -1;
  }
  return fd;
}

std::uint16_t bound_port(int fd) {
  sockaddr_in addr{};
  socklen_t len = sizeof(addr);
  if (::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) == 0) {
    return ntohs(addr.sin_port);
  }
  return 0;
}

std::string peer_addr(int fd) {
  sockaddr_in addr{};
  socklen_t len = sizeof(addr);
  if (::getpeername(fd, reinterpret_cast<sockaddr*>(&addr), &len) == 0) {
    char buf[64];
    ::inet_ntop(AF_INET, &addr.sin_addr, buf, sizeof(buf));
    std::ostringstream oss;
    oss << buf << ":" << ntohs(addr.sin_port);
    return oss.str();
  }
  return "unknown";
}

}  // namespace

Server::Server(std::string host, std::uint16_t port, GsmProcessor& processor)
    : host_(std::move(host)), port_(port), processor_(processor) {}

Server::~Server() {
  stop();
}

bool Server::start() {
  if (listen_fd_ >= 0) return true;
  listen_fd_ = create_listen_socket(host_, port_);
  if (listen_fd_ < 0) return false;
  port_ = bound_port(listen_fd_);
  spdlog::info("listening on {}:{}", host_, port_);
  return true;
}

void Server::stop() {
  if (listen_fd_ >= 0) {
    ::close(listen_fd_);
    listen_fd_ = -1;
  }
  close_all_connections();
}

void Server::poll_once(int timeout_ms) {
  if (listen_fd_ < 0) return;

  std::vector<pollfd> fds;
  fds.reserve(connections_.size() + 1);
  fds.push_back({listen_fd_, POLLIN, 0});
  for (const auto& conn : connections_) {
    const short events = conn->wants_write() ? (POLLIN | POLLOUT) : POLLIN;
    fds.push_back({conn->fd(), events, 0});
  }

  int ready = ::poll(fds.data(), fds.size(), timeout_ms);
  if (ready < 0) {
    if (errno != EINTR) spdlog::error("poll: {}", std::strerror(errno));
    return;
  }
  if (ready == 0) return;

  // Connections first, in the order they were polled; new peers are added
  // after so the indices above stay valid.
  std::vector<std::unique_ptr<Connection>> alive;
  alive.reserve(connections_.size());
  for (std::size_t i = 0; i < connections_.size(); ++i) {
    auto& conn = connections_[i];
    const short revents = fds[i + 1].revents;
    bool alive_conn = true;
    if (revents & POLLOUT) alive_conn = conn->on_writable();
    if (alive_conn && (revents & (POLLIN | POLLHUP | POLLERR))) {
      alive_conn = conn->on_readable();
    }
    if (!alive_conn) {
      spdlog::info("connection from {} closed", conn->peer());
      continue;
    }
    alive.push_back(std::move(conn));
  }
  connections_.swap(alive);

  if (fds[0].revents & POLLIN) accept_one();
}

void Server::accept_one() {
  sockaddr_in addr{};
  socklen_t len = sizeof(addr);
  int client_fd = ::accept(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &len);
  if (client_fd < 0) {
    if (errno != EINTR && errno != EAGAIN) {
      spdlog::error("accept: {}", std::strerror(errno));
    }
    return;
  }
  std::string error;
  if (!set_nonblocking(client_fd, error)) {
    spdlog::error("accept: {}", error);
    ::close(client_fd);
    return;
  }
  auto conn = std::make_unique<Connection>(client_fd, peer_addr(client_fd),
                                           processor_);
  spdlog::info("new connection from {}", conn->peer());
  connections_.push_back(std::move(conn));
}

void Server::close_all_connections() {
  for (auto& c : connections_) {
    if (c) c->close("");
  }
  connections_.clear();
}

Connection::Connection(int fd, std::string peer, GsmProcessor& processor)
    : fd_(fd),
      peer_(std::move(peer)),
      transport_(fd, kMaxOutboundBytes),
      protocol_(&processor) {
  protocol_.connection_made(transport_);
}

Connection::~Connection() {
  close("");
}

bool Connection::on_readable() {
  if (fd_ < 0) return false;
  std::array<std::uint8_t, kReadChunk> chunk{};
  ssize_t n = read_some(fd_, chunk.data(), chunk.size());
  if (n == 0) {
    close("");
    return false;
  }
  if (n < 0) {
    if (errno == EAGAIN || errno == EWOULDBLOCK) return true;
    close(std::strerror(errno));
    return false;
  }
  protocol_.data_received(chunk.data(), static_cast<std::size_t>(n));
  if (transport_.overflowed()) {
    spdlog::warn("{} is not reading its replies ({} bytes queued)", peer_,
                 transport_.pending());
    close("outbound queue full");
    return false;
  }
  return flush();
}

bool Connection::on_writable() {
  if (fd_ < 0) return false;
  return flush();
}

bool Connection::flush() {
  std::string error;
  if (!transport_.flush(error)) {
    close(error);
    return false;
  }
  return true;
}

void Connection::close(const std::string& reason) {
  if (fd_ < 0) return;
  protocol_.connection_lost(reason);
  ::shutdown(fd_, SHUT_RDWR);
  ::close(fd_);
  fd_ = -1;
}

}  // namespace gsupbridge::server
