#include "rpc/socket_io.hpp"

#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/time.h>
#include <sys/un.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace joule_gate::rpc {

namespace {

bool fill_address(const std::string& path, sockaddr_un& address) noexcept {
  std::memset(&address, 0, sizeof(address));
  address.sun_family = AF_UNIX;
  if (path.empty() || path.size() >= sizeof(address.sun_path)) {
    return false;
  }
  std::memcpy(address.sun_path, path.c_str(), path.size() + 1);
  return true;
}

}  // namespace

UniqueFd::~UniqueFd() { reset(); }

UniqueFd::UniqueFd(UniqueFd&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }

UniqueFd& UniqueFd::operator=(UniqueFd&& other) noexcept {
  if (this != &other) {
    reset(other.fd_);
    other.fd_ = -1;
  }
  return *this;
}

void UniqueFd::reset(const int fd) noexcept {
  if (fd_ >= 0) {
    ::close(fd_);
  }
  fd_ = fd;
}

bool set_io_timeout(const int fd, const std::chrono::milliseconds timeout) noexcept {
  timeval tv{};
  tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
  tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
  return ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) == 0 &&
         ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) == 0;
}

UniqueFd connect_unix(const std::string& path, const std::chrono::milliseconds timeout) noexcept {
  sockaddr_un address{};
  if (!fill_address(path, address)) {
    return UniqueFd{};
  }

  UniqueFd fd(::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0));
  if (!fd.valid()) {
    return UniqueFd{};
  }

  if (!set_io_timeout(fd.get(), timeout)) {
    return UniqueFd{};
  }

  if (::connect(fd.get(), reinterpret_cast<const sockaddr*>(&address), sizeof(address)) != 0) {
    return UniqueFd{};
  }
  return fd;
}

UniqueFd listen_unix(const std::string& path, const int backlog) noexcept {
  sockaddr_un address{};
  if (!fill_address(path, address)) {
    return UniqueFd{};
  }

  struct stat existing {};
  if (::lstat(path.c_str(), &existing) == 0 && S_ISSOCK(existing.st_mode)) {
    ::unlink(path.c_str());
  }

  UniqueFd fd(::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0));
  if (!fd.valid()) {
    return UniqueFd{};
  }

  if (::bind(fd.get(), reinterpret_cast<const sockaddr*>(&address), sizeof(address)) != 0) {
    return UniqueFd{};
  }

  if (::listen(fd.get(), backlog) != 0) {
    return UniqueFd{};
  }
  return fd;
}

bool send_line(const int fd, const std::string& line) noexcept {
  std::string framed = line;
  framed.push_back('\n');

  std::size_t sent = 0;
  while (sent < framed.size()) {
    const ssize_t written = ::send(fd, framed.data() + sent, framed.size() - sent, MSG_NOSIGNAL);
    if (written < 0) {
      if (errno == EINTR) {
        continue;
      }
      return false;
    }
    sent += static_cast<std::size_t>(written);
  }
  return true;
}

bool recv_line(const int fd, std::string& line) noexcept {
  line.clear();
  char chunk[512]{};

  while (line.size() < kMaxLineBytes) {
    const ssize_t received = ::recv(fd, chunk, sizeof(chunk), 0);
    if (received < 0) {
      if (errno == EINTR) {
        continue;
      }
      return false;
    }
    if (received == 0) {
      return false;
    }

    const auto* begin = chunk;
    const auto* end = chunk + received;
    const auto* newline = static_cast<const char*>(std::memchr(begin, '\n', static_cast<std::size_t>(received)));
    if (newline != nullptr) {
      line.append(begin, newline);
      return true;
    }
    line.append(begin, end);
  }
  return false;
}

}  // namespace joule_gate::rpc
