#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <span>
#include <stop_token>
#include <string>
#include <utility>

#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include "common/errors.hpp"
#include "transport/tcp_socket_transport.hpp"

namespace kducer {

namespace {

std::string ErrnoText(const std::string &what, int error_number) {
  return what + ": " + std::strerror(error_number);
}

timeval ToTimeval(std::chrono::milliseconds duration) {
  timeval tv{};
  tv.tv_sec = static_cast<time_t>(duration.count() / 1000);
  tv.tv_usec = static_cast<suseconds_t>((duration.count() % 1000) * 1000);
  return tv;
}

bool SetBlocking(int fd, bool blocking) {
  int flags = ::fcntl(fd, F_GETFL, 0);
  if (flags < 0) {
    return false;
  }
  flags = blocking ? (flags & ~O_NONBLOCK) : (flags | O_NONBLOCK);
  return ::fcntl(fd, F_SETFL, flags) == 0;
}

}  // namespace

TcpSocketTransport::TcpSocketTransport(std::string host, uint16_t port, std::chrono::milliseconds exchange_timeout)
    : host_(std::move(host)),
      port_(port),
      exchange_timeout_(exchange_timeout) {}

TcpSocketTransport::~TcpSocketTransport() {
  Close();
}

void TcpSocketTransport::Connect(std::chrono::milliseconds timeout, std::stop_token stop) {
  if (fd_ >= 0) {
    return;
  }
  if (stop.stop_requested()) {
    throw Cancelled("Connect to " + host_ + " cancelled");
  }

  addrinfo hints{};
  hints.ai_family = AF_INET;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo *resolved = nullptr;
  const std::string port_text = std::to_string(port_);
  int gai_result = ::getaddrinfo(host_.c_str(), port_text.c_str(), &hints, &resolved);
  if (gai_result != 0 || resolved == nullptr) {
    throw TransportError("Cannot resolve " + host_ + ": " + ::gai_strerror(gai_result));
  }
  sockaddr_storage address{};
  const socklen_t address_length = resolved->ai_addrlen;
  std::memcpy(&address, resolved->ai_addr, resolved->ai_addrlen);
  ::freeaddrinfo(resolved);

  int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) {
    throw TransportError(ErrnoText("socket() failed", errno));
  }
  if (!SetBlocking(fd, false)) {
    int error_number = errno;
    ::close(fd);
    throw TransportError(ErrnoText("fcntl() failed", error_number));
  }

  if (::connect(fd, reinterpret_cast<sockaddr *>(&address), address_length) != 0) {
    if (errno != EINPROGRESS) {
      int error_number = errno;
      ::close(fd);
      throw TransportError(ErrnoText("Connect to " + host_ + " failed", error_number));
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
      if (stop.stop_requested()) {
        ::close(fd);
        throw Cancelled("Connect to " + host_ + " cancelled");
      }
      const auto now = std::chrono::steady_clock::now();
      if (now >= deadline) {
        ::close(fd);
        throw ConnectTimeout("Connect to " + host_ + ":" + port_text + " timed out after " +
                             std::to_string(timeout.count()) + " ms");
      }
      const auto slice = std::min(kConnectPollSlice,
                                  std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now) +
                                      std::chrono::milliseconds{1});
      pollfd pfd{fd, POLLOUT, 0};
      int ready = ::poll(&pfd, 1, static_cast<int>(slice.count()));
      if (ready < 0 && errno != EINTR) {
        int error_number = errno;
        ::close(fd);
        throw TransportError(ErrnoText("poll() failed", error_number));
      }
      if (ready > 0) {
        break;
      }
    }

    int socket_error = 0;
    socklen_t length = sizeof(socket_error);
    if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &socket_error, &length) != 0) {
      socket_error = errno;
    }
    if (socket_error != 0) {
      ::close(fd);
      throw TransportError(ErrnoText("Connect to " + host_ + " failed", socket_error));
    }
  }

  if (!SetBlocking(fd, true)) {
    int error_number = errno;
    ::close(fd);
    throw TransportError(ErrnoText("fcntl() failed", error_number));
  }
  fd_ = fd;
  ConfigureConnectedSocket();
}

void TcpSocketTransport::ConfigureConnectedSocket() {
  const timeval tv = ToTimeval(exchange_timeout_);
  int no_delay = 1;
  // Reset instead of lingering in TIME_WAIT; the controller accepts few sockets
  linger abortive_close{1, 0};
  if (::setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) != 0 ||
      ::setsockopt(fd_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) != 0 ||
      ::setsockopt(fd_, IPPROTO_TCP, TCP_NODELAY, &no_delay, sizeof(no_delay)) != 0 ||
      ::setsockopt(fd_, SOL_SOCKET, SO_LINGER, &abortive_close, sizeof(abortive_close)) != 0) {
    int error_number = errno;
    Close();
    throw TransportError(ErrnoText("setsockopt() failed", error_number));
  }
}

bool TcpSocketTransport::IsConnected() const {
  if (fd_ < 0) {
    return false;
  }
  uint8_t probe = 0;
  ssize_t n = ::recv(fd_, &probe, 1, MSG_PEEK | MSG_DONTWAIT);
  if (n == 0) {
    return false;  // orderly shutdown by the peer
  }
  if (n < 0) {
    return errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR;
  }
  return true;
}

void TcpSocketTransport::Close() {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

int TcpSocketTransport::Read(std::span<uint8_t> buffer) {
  if (fd_ < 0) {
    return -1;
  }
  while (true) {
    ssize_t n = ::recv(fd_, buffer.data(), buffer.size(), 0);
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n <= 0) {
      return n == 0 ? 0 : -1;
    }
    return static_cast<int>(n);
  }
}

int TcpSocketTransport::Write(std::span<const uint8_t> data) {
  if (fd_ < 0) {
    return -1;
  }
  while (true) {
    ssize_t n = ::send(fd_, data.data(), data.size(), MSG_NOSIGNAL);
    if (n < 0 && errno == EINTR) {
      continue;
    }
    return n < 0 ? -1 : static_cast<int>(n);
  }
}

}  // namespace kducer
