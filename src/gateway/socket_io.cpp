#include "gateway/socket_io.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <utility>

#include "gateway/frame_channel.hpp"

namespace fleet_hub::gateway {

namespace {

constexpr std::size_t kReadChunk = 4096;

int remaining_ms(const std::chrono::steady_clock::time_point deadline) {
  const auto left =
      std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now()).count();
  return left > 0 ? static_cast<int>(left) : 0;
}

}  // namespace

SocketHandle::~SocketHandle() { reset(); }

SocketHandle::SocketHandle(SocketHandle&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}

SocketHandle& SocketHandle::operator=(SocketHandle&& other) noexcept {
  if (this != &other) {
    reset();
    fd_ = std::exchange(other.fd_, -1);
  }
  return *this;
}

void SocketHandle::shutdown() noexcept {
  if (fd_ >= 0) {
    ::shutdown(fd_, SHUT_RDWR);
  }
}

void SocketHandle::reset() noexcept {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

bool wait_readable(const int fd, const std::chrono::milliseconds timeout) {
  pollfd descriptor{.fd = fd, .events = POLLIN, .revents = 0};
  const int timeout_ms = timeout.count() > 0 ? static_cast<int>(timeout.count()) : 0;
  while (true) {
    const int ready = ::poll(&descriptor, 1, timeout_ms);
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      throw ChannelClosedError(std::string("poll failed: ") + std::strerror(errno));
    }
    if (ready == 0) {
      return false;
    }
    if ((descriptor.revents & POLLNVAL) != 0) {
      throw ChannelClosedError("socket closed");
    }
    return true;
  }
}

SendStatus send_all(const int fd, const char* data, const std::size_t length,
                    const std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  std::size_t total_sent = 0;
  while (total_sent < length) {
    const auto sent = ::send(fd, data + total_sent, length - total_sent, MSG_NOSIGNAL | MSG_DONTWAIT);
    if (sent > 0) {
      total_sent += static_cast<std::size_t>(sent);
      continue;
    }
    if (sent < 0 && errno == EINTR) {
      continue;
    }
    if (sent == 0 || (errno != EAGAIN && errno != EWOULDBLOCK)) {
      return SendStatus::CLOSED;
    }

    const int left = remaining_ms(deadline);
    if (left <= 0) {
      return SendStatus::TIMED_OUT;
    }
    pollfd descriptor{.fd = fd, .events = POLLOUT, .revents = 0};
    const int ready = ::poll(&descriptor, 1, left);
    if (ready < 0 && errno != EINTR) {
      return SendStatus::CLOSED;
    }
    if (ready > 0 && (descriptor.revents & (POLLERR | POLLHUP | POLLNVAL)) != 0) {
      return SendStatus::CLOSED;
    }
  }
  return SendStatus::SENT;
}

SocketReader::SocketReader(const int fd, const std::size_t max_message_bytes)
    : fd_(fd), max_message_bytes_(max_message_bytes) {}

bool SocketReader::fill(const std::chrono::steady_clock::time_point deadline) {
  if (!wait_readable(fd_, std::chrono::milliseconds(remaining_ms(deadline)))) {
    return false;
  }

  char chunk[kReadChunk];
  while (true) {
    const auto received = ::recv(fd_, chunk, sizeof(chunk), 0);
    if (received < 0 && errno == EINTR) {
      continue;
    }
    if (received < 0) {
      throw ChannelClosedError(std::string("recv failed: ") + std::strerror(errno));
    }
    if (received == 0) {
      throw ChannelClosedError("peer closed the connection");
    }
    buffer_.append(chunk, static_cast<std::size_t>(received));
    return true;
  }
}

std::optional<std::string> SocketReader::read_line(const std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (true) {
    const auto newline = buffer_.find('\n');
    if (newline != std::string::npos) {
      std::string line = buffer_.substr(0, newline);
      buffer_.erase(0, newline + 1);
      if (!line.empty() && line.back() == '\r') {
        line.pop_back();
      }
      return line;
    }
    if (buffer_.size() > max_message_bytes_) {
      throw ChannelClosedError("line exceeds " + std::to_string(max_message_bytes_) + " bytes");
    }
    if (!fill(deadline)) {
      return std::nullopt;
    }
  }
}

std::optional<std::string> SocketReader::read_length_prefixed(const std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (true) {
    if (buffer_.size() >= 4) {
      const auto* header = reinterpret_cast<const unsigned char*>(buffer_.data());
      const std::size_t length = (static_cast<std::size_t>(header[0]) << 24U) |
                                 (static_cast<std::size_t>(header[1]) << 16U) |
                                 (static_cast<std::size_t>(header[2]) << 8U) | static_cast<std::size_t>(header[3]);
      if (length > max_message_bytes_) {
        throw ChannelClosedError("frame of " + std::to_string(length) + " bytes exceeds limit");
      }
      if (buffer_.size() >= 4 + length) {
        std::string body = buffer_.substr(4, length);
        buffer_.erase(0, 4 + length);
        return body;
      }
    }
    if (!fill(deadline)) {
      return std::nullopt;
    }
  }
}

std::string encode_length_prefixed(const std::string& body) {
  const auto length = static_cast<std::uint32_t>(body.size());
  std::string encoded;
  encoded.reserve(4 + body.size());
  encoded.push_back(static_cast<char>((length >> 24U) & 0xFFU));
  encoded.push_back(static_cast<char>((length >> 16U) & 0xFFU));
  encoded.push_back(static_cast<char>((length >> 8U) & 0xFFU));
  encoded.push_back(static_cast<char>(length & 0xFFU));
  encoded += body;
  return encoded;
}

TcpListener::TcpListener(const std::string& bind_address, const std::uint16_t port) {
  SocketHandle server(::socket(AF_INET, SOCK_STREAM, IPPROTO_TCP));
  if (!server.valid()) {
    throw std::runtime_error(std::string("failed to create socket: ") + std::strerror(errno));
  }

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  if (bind_address.empty() || bind_address == "0.0.0.0") {
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
  } else if (::inet_pton(AF_INET, bind_address.c_str(), &addr.sin_addr) != 1) {
    throw std::runtime_error("invalid bind address: " + bind_address);
  }

  const int opt = 1;
  ::setsockopt(server.get(), SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

  if (::bind(server.get(), reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) < 0) {
    throw std::runtime_error("failed to bind " + bind_address + ":" + std::to_string(port) + ": " +
                             std::strerror(errno));
  }
  if (::listen(server.get(), SOMAXCONN) < 0) {
    throw std::runtime_error(std::string("failed to listen: ") + std::strerror(errno));
  }

  sockaddr_in bound{};
  socklen_t bound_len = sizeof(bound);
  if (::getsockname(server.get(), reinterpret_cast<sockaddr*>(&bound), &bound_len) == 0) {
    port_ = ntohs(bound.sin_port);
  } else {
    port_ = port;
  }
  socket_ = std::move(server);
}

std::optional<AcceptedSocket> TcpListener::accept(const std::chrono::milliseconds timeout) {
  try {
    if (!wait_readable(socket_.get(), timeout)) {
      return std::nullopt;
    }
  } catch (const ChannelClosedError&) {
    return std::nullopt;
  }

  sockaddr_in client_addr{};
  socklen_t addr_len = sizeof(client_addr);
  SocketHandle client(::accept(socket_.get(), reinterpret_cast<sockaddr*>(&client_addr), &addr_len));
  if (!client.valid()) {
    return std::nullopt;
  }

  const int nodelay = 1;
  ::setsockopt(client.get(), IPPROTO_TCP, TCP_NODELAY, &nodelay, sizeof(nodelay));

  std::string peer{"unknown"};
  char buffer[INET_ADDRSTRLEN] = {0};
  if (::inet_ntop(AF_INET, &client_addr.sin_addr, buffer, sizeof(buffer)) != nullptr) {
    peer = std::string(buffer) + ":" + std::to_string(ntohs(client_addr.sin_port));
  }
  return AcceptedSocket{.socket = std::move(client), .peer = std::move(peer)};
}

}  // namespace fleet_hub::gateway
