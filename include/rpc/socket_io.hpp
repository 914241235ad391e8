#pragma once

#include <chrono>
#include <cstddef>
#include <string>

namespace joule_gate::rpc {

// Owning file descriptor.
class UniqueFd {
 public:
  UniqueFd() = default;
  explicit UniqueFd(int fd) noexcept : fd_(fd) {}
  ~UniqueFd();

  UniqueFd(const UniqueFd&) = delete;
  UniqueFd& operator=(const UniqueFd&) = delete;
  UniqueFd(UniqueFd&& other) noexcept;
  UniqueFd& operator=(UniqueFd&& other) noexcept;

  [[nodiscard]] int get() const noexcept { return fd_; }
  [[nodiscard]] bool valid() const noexcept { return fd_ >= 0; }
  void reset(int fd = -1) noexcept;

 private:
  int fd_{-1};
};

constexpr std::size_t kMaxLineBytes = 64 * 1024;

// Connected AF_UNIX stream socket with send/receive timeouts, or an invalid fd.
UniqueFd connect_unix(const std::string& path, std::chrono::milliseconds timeout) noexcept;

// Listening AF_UNIX socket; removes a stale socket file first. Invalid fd on failure.
UniqueFd listen_unix(const std::string& path, int backlog = 16) noexcept;

bool set_io_timeout(int fd, std::chrono::milliseconds timeout) noexcept;

bool send_line(int fd, const std::string& line) noexcept;

// Reads up to the first '\n' (not included). False on EOF, timeout or overlong line.
bool recv_line(int fd, std::string& line) noexcept;

}  // namespace joule_gate::rpc
