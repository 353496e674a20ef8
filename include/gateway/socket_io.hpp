#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "gateway/frame_channel.hpp"

namespace fleet_hub::gateway {

// Owns a socket descriptor. shutdown() unblocks readers without releasing the fd.
class SocketHandle {
 public:
  SocketHandle() = default;
  explicit SocketHandle(int fd) noexcept : fd_(fd) {}
  ~SocketHandle();

  SocketHandle(const SocketHandle&) = delete;
  SocketHandle& operator=(const SocketHandle&) = delete;
  SocketHandle(SocketHandle&& other) noexcept;
  SocketHandle& operator=(SocketHandle&& other) noexcept;

  [[nodiscard]] int get() const noexcept { return fd_; }
  [[nodiscard]] bool valid() const noexcept { return fd_ >= 0; }
  void shutdown() noexcept;
  void reset() noexcept;

 private:
  int fd_{-1};
};

// true when readable before the timeout. Throws ChannelClosedError on poll errors.
bool wait_readable(int fd, std::chrono::milliseconds timeout);
// Writes all of `data` before `timeout` elapses. A timeout may leave a partial
// message on the wire, so the caller must stop using the socket.
SendStatus send_all(int fd, const char* data, std::size_t length, std::chrono::milliseconds timeout);

// Buffered reads with deadlines. Partial data survives a timeout and is
// completed by the next call.
class SocketReader {
 public:
  SocketReader(int fd, std::size_t max_message_bytes);

  std::optional<std::string> read_line(std::chrono::milliseconds timeout);
  // 4-byte big-endian length prefix followed by the body.
  std::optional<std::string> read_length_prefixed(std::chrono::milliseconds timeout);

 private:
  bool fill(std::chrono::steady_clock::time_point deadline);

  int fd_;
  std::size_t max_message_bytes_;
  std::string buffer_{};
};

std::string encode_length_prefixed(const std::string& body);

struct AcceptedSocket {
  SocketHandle socket{};
  std::string peer{};
};

class TcpListener {
 public:
  TcpListener(const std::string& bind_address, std::uint16_t port);

  // nullopt on timeout or after shutdown().
  std::optional<AcceptedSocket> accept(std::chrono::milliseconds timeout);
  // Actual bound port, useful when constructed with port 0.
  [[nodiscard]] std::uint16_t port() const noexcept { return port_; }
  void shutdown() noexcept { socket_.shutdown(); }

 private:
  SocketHandle socket_{};
  std::uint16_t port_{0};
};

}  // namespace fleet_hub::gateway
