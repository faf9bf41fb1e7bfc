#include "tnsprobe/client/tcp_transport.hpp"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <utility>

namespace tnsprobe::client {

namespace {

timeval to_timeval(std::chrono::milliseconds ms) {
  timeval tv{};
  tv.tv_sec = static_cast<time_t>(ms.count() / 1000);
  tv.tv_usec = static_cast<suseconds_t>((ms.count() % 1000) * 1000);
  return tv;
}

std::error_code errno_to_error(int err) {
  if (err == EAGAIN || err == EWOULDBLOCK || err == ETIMEDOUT) {
    return make_error_code(TnsErrc::timeout);
  }
  if (err == ECONNRESET || err == EPIPE) {
    return make_error_code(TnsErrc::connection_closed);
  }
  return make_error_code(TnsErrc::io_error);
}

} // namespace

TcpTransport::TcpTransport()
  : logger_(utils::LogManager::instance().get_logger("tnsprobe.transport")) {}

TcpTransport::~TcpTransport() { close(); }

TcpTransport::TcpTransport(TcpTransport&& other) noexcept
  : fd_(std::exchange(other.fd_, -1)), logger_(std::move(other.logger_)) {}

TcpTransport& TcpTransport::operator=(TcpTransport&& other) noexcept {
  if (this != &other) {
    close();
    fd_ = std::exchange(other.fd_, -1);
    logger_ = std::move(other.logger_);
  }
  return *this;
}

void TcpTransport::close() noexcept {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

std::error_code TcpTransport::connect_one(const void* addr, unsigned addrlen, int family,
                                          std::chrono::milliseconds timeout) noexcept {
  int fd = ::socket(family, SOCK_STREAM, 0);
  if (fd < 0) return errno_to_error(errno);

  // 接続タイムアウトのため一時的にノンブロッキングにする
  int fl = ::fcntl(fd, F_GETFL, 0);
  if (fl < 0 || ::fcntl(fd, F_SETFL, fl | O_NONBLOCK) < 0) {
    ::close(fd);
    return make_error_code(TnsErrc::io_error);
  }

  int rc = ::connect(fd, static_cast<const sockaddr*>(addr), static_cast<socklen_t>(addrlen));
  if (rc < 0 && errno != EINPROGRESS) {
    int err = errno;
    ::close(fd);
    return errno_to_error(err);
  }
  if (rc < 0) {
    pollfd pfd{fd, POLLOUT, 0};
    int pr = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    if (pr == 0) {
      ::close(fd);
      return make_error_code(TnsErrc::timeout);
    }
    if (pr < 0) {
      ::close(fd);
      return make_error_code(TnsErrc::io_error);
    }
    int so_error = 0;
    socklen_t len = sizeof(so_error);
    if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) < 0 || so_error != 0) {
      ::close(fd);
      return errno_to_error(so_error != 0 ? so_error : errno);
    }
  }

  if (::fcntl(fd, F_SETFL, fl) < 0) {
    ::close(fd);
    return make_error_code(TnsErrc::io_error);
  }

  timeval tv = to_timeval(timeout);
  if (::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0
      || ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) < 0) {
    int err = errno;
    ::close(fd);
    return errno_to_error(err);
  }
  int one = 1;
  if (::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one)) < 0) {
    TNSPROBE_LOG_DEBUG(logger_, std::string("TCP_NODELAY not set: ") + std::strerror(errno));
  }

  fd_ = fd;
  return {};
}

std::error_code TcpTransport::connect(const std::string& host, uint16_t port,
                                      std::chrono::milliseconds timeout) noexcept {
  close();

  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo* res = nullptr;
  std::string port_str = std::to_string(port);
  int gai = ::getaddrinfo(host.c_str(), port_str.c_str(), &hints, &res);
  if (gai != 0 || res == nullptr) {
    TNSPROBE_LOG_WARNING(logger_, "resolve failed: " + host + " (" + ::gai_strerror(gai) + ")");
    return make_error_code(TnsErrc::io_error);
  }

  std::error_code last = make_error_code(TnsErrc::io_error);
  for (addrinfo* p = res; p != nullptr; p = p->ai_next) {
    last = connect_one(p->ai_addr, p->ai_addrlen, p->ai_family, timeout);
    if (!last) break;
  }
  ::freeaddrinfo(res);

  if (last) {
    TNSPROBE_LOG_WARNING(logger_, "connect failed: " + host + ":" + port_str + " (" + last.message() + ")");
    return last;
  }
  TNSPROBE_LOG_DEBUG(logger_, "connected: " + host + ":" + port_str);
  return {};
}

tnsprobe::Result<std::size_t> TcpTransport::read_some(std::span<std::uint8_t> out) noexcept {
  if (fd_ < 0) return make_error_code(TnsErrc::connection_closed);
  for (;;) {
    ssize_t n = ::recv(fd_, out.data(), out.size(), 0);
    if (n >= 0) return static_cast<std::size_t>(n);
    if (errno == EINTR) continue;
    return errno_to_error(errno);
  }
}

std::error_code TcpTransport::write_all(std::span<const std::uint8_t> data) noexcept {
  if (fd_ < 0) return make_error_code(TnsErrc::connection_closed);
  std::size_t sent = 0;
  while (sent < data.size()) {
    ssize_t n = ::send(fd_, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EINTR) continue;
      return errno_to_error(errno);
    }
    sent += static_cast<std::size_t>(n);
  }
  return {};
}

} // namespace tnsprobe::client
