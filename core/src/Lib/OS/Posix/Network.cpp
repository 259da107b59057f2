#if !defined(_WIN32)

  #include <cerrno>       // errno, EINPROGRESS
  #include <fcntl.h>      // fcntl, FD_CLOEXEC
  #include <memory>       // std::unique_ptr
  #include <netdb.h>      // getaddrinfo, freeaddrinfo, getnameinfo, gai_strerror
  #include <netinet/in.h> // sockaddr_in, sockaddr_in6
  #include <poll.h>       // POLLIN, POLLOUT
  #include <sys/socket.h> // socket, connect, bind, listen, accept, send, recv, setsockopt
  #include <sys/time.h>   // timeval
  #include <unistd.h>     // close

  #include <Conduit++/Utils/Error.hpp>
  #include <Conduit++/Utils/Logging.hpp>

  #include "OS/Posix/Posix.hpp"
  #include "OS/Unix.hpp"

using namespace conduit::utils::types;
using enum conduit::utils::error::ErrorKind;
using conduit::network::Address;
using conduit::network::NativeSocket;
using conduit::network::OptionValue;
using conduit::network::Protocol;
using conduit::network::SocketOption;
using conduit::utils::error::ConduitError;

namespace unix_shared = conduit::os::unix_shared;

using unix_shared::FdGuard;

namespace {
  #ifdef MSG_NOSIGNAL
  constexpr int SendFlags = MSG_NOSIGNAL;
  #else
  constexpr int SendFlags = 0;
  #endif

  using AddrInfoPtr = std::unique_ptr<addrinfo, decltype([](addrinfo* info) { ::freeaddrinfo(info); })>;

  auto Resolve(const Address& address, const Protocol protocol, const bool passive) -> Result<AddrInfoPtr> {
    addrinfo hints {};
    hints.ai_family   = AF_UNSPEC;
    hints.ai_socktype = protocol == Protocol::Tcp ? SOCK_STREAM : SOCK_DGRAM;
    hints.ai_flags    = AI_NUMERICSERV | (passive ? AI_PASSIVE : 0);

    const String service = std::to_string(address.port);
    const char*  node    = address.host.empty() ? nullptr : address.host.c_str();

    addrinfo* found = nullptr;

    if (const int status = ::getaddrinfo(node, service.c_str(), &hints, &found); status != 0) {
      if (status == EAI_SYSTEM)
        ERR_ERRNO("getaddrinfo('{}')", address.host);

      const auto kind = status == EAI_NONAME ? NotFound : status == EAI_AGAIN ? ResourceBusy : PlatformError;

      return Err(ConduitError(kind, std::format("getaddrinfo('{}'): {}", address.host, ::gai_strerror(status)), static_cast<i64>(status)));
    }

    return AddrInfoPtr(found);
  }

  auto OpenSocket(const addrinfo& info) -> Result<FdGuard> {
    FdGuard sock(::socket(info.ai_family, info.ai_socktype, info.ai_protocol));

    if (!sock)
      ERR_ERRNO("socket");

    if (::fcntl(sock.get(), F_SETFD, FD_CLOEXEC) == -1)
      ERR_ERRNO("fcntl(FD_CLOEXEC)");

  #ifdef SO_NOSIGPIPE
    const int enabled = 1;
    if (::setsockopt(sock.get(), SOL_SOCKET, SO_NOSIGPIPE, &enabled, sizeof(enabled)) == -1)
      ERR_ERRNO("setsockopt(SO_NOSIGPIPE)");
  #endif

    return sock;
  }

  auto ConnectOne(const addrinfo& info, const Address& address, const Option<Millis> timeout) -> Result<FdGuard> {
    FdGuard sock = TRY(OpenSocket(info));

    if (!timeout) {
      if (unix_shared::RetryOnEintr([&] { return ::connect(sock.get(), info.ai_addr, info.ai_addrlen); }) == -1)
        ERR_ERRNO("connect({}:{})", address.host, address.port);

      return sock;
    }

    TRY_VOID(unix_shared::SetNonBlocking(sock.get(), true));

    if (::connect(sock.get(), info.ai_addr, info.ai_addrlen) == -1) {
      if (errno != EINPROGRESS && errno != EINTR)
        ERR_ERRNO("connect({}:{})", address.host, address.port);

      if (!TRY(unix_shared::PollFd(sock.get(), POLLOUT, timeout)))
        ERR_FMT(Timeout, "connect({}:{}) did not complete within {}ms", address.host, address.port, timeout->count());

      int       pending = 0;
      socklen_t len     = sizeof(pending);

      if (::getsockopt(sock.get(), SOL_SOCKET, SO_ERROR, &pending, &len) == -1)
        ERR_ERRNO("getsockopt(SO_ERROR)");

      if (pending != 0)
        return Err(conduit::utils::error::FromErrno(pending, std::format("connect({}:{})", address.host, address.port)));
    }

    TRY_VOID(unix_shared::SetNonBlocking(sock.get(), false));
    return sock;
  }

  auto PeerOf(const sockaddr_storage& storage, const socklen_t len) -> Address {
    Array<char, NI_MAXHOST> host {};
    Array<char, NI_MAXSERV> service {};

    if (::getnameinfo(reinterpret_cast<const sockaddr*>(&storage), len, host.data(), host.size(), service.data(), service.size(), NI_NUMERICHOST | NI_NUMERICSERV) != 0)
      return {};

    return { .host = String(host.data()), .port = static_cast<u16>(std::stoul(service.data())) };
  }

  auto SetIntOption(const int fd, const int name, const int value, const StringView label) -> Result<> {
    if (::setsockopt(fd, SOL_SOCKET, name, &value, sizeof(value)) == -1)
      ERR_ERRNO("setsockopt({})", label);

    return {};
  }
} // namespace

namespace conduit::os::posix {
  auto PosixSocketBackend::connect(const Address& address, const Protocol protocol, const Option<Millis> timeout) -> Result<NativeSocket> {
    const AddrInfoPtr candidates = TRY(Resolve(address, protocol, false));

    Option<ConduitError> lastError;

    for (const addrinfo* info = candidates.get(); info != nullptr; info = info->ai_next) {
      Result<FdGuard> connected = ConnectOne(*info, address, timeout);

      if (connected)
        return static_cast<NativeSocket>(connected->release());

      lastError = connected.error();
    }

    if (lastError)
      return Err(*lastError);

    ERR_FMT(NotFound, "'{}' resolved to no usable address", address.host);
  }

  auto PosixSocketBackend::listen(const Address& address, const i32 backlog) -> Result<Pair<NativeSocket, u16>> {
    const AddrInfoPtr candidates = TRY(Resolve(address, Protocol::Tcp, true));

    const addrinfo& info = *candidates;

    FdGuard sock = TRY(OpenSocket(info));

    TRY_VOID(SetIntOption(sock.get(), SO_REUSEADDR, 1, "SO_REUSEADDR"));

    if (::bind(sock.get(), info.ai_addr, info.ai_addrlen) == -1)
      ERR_ERRNO("bind({}:{})", address.host, address.port);

    if (::listen(sock.get(), backlog) == -1)
      ERR_ERRNO("listen({}:{})", address.host, address.port);

    sockaddr_storage bound {};
    socklen_t        len = sizeof(bound);

    if (::getsockname(sock.get(), reinterpret_cast<sockaddr*>(&bound), &len) == -1)
      ERR_ERRNO("getsockname");

    const u16 port = PeerOf(bound, len).port;

    return Pair(static_cast<NativeSocket>(sock.release()), port);
  }

  auto PosixSocketBackend::accept(const NativeSocket listener, const Option<Millis> timeout) -> Result<Pair<NativeSocket, Address>> {
    const int fd = static_cast<int>(listener);

    if (timeout && !TRY(unix_shared::PollFd(fd, POLLIN, timeout)))
      ERR_FMT(Timeout, "No connection within {}ms", timeout->count());

    sockaddr_storage peer {};
    socklen_t        len = sizeof(peer);

    FdGuard client(unix_shared::RetryOnEintr([&] { return ::accept(fd, reinterpret_cast<sockaddr*>(&peer), &len); }));

    if (!client)
      ERR_ERRNO("accept");

    if (::fcntl(client.get(), F_SETFD, FD_CLOEXEC) == -1)
      ERR_ERRNO("fcntl(FD_CLOEXEC)");

    const Address address = PeerOf(peer, len);

    return Pair(static_cast<NativeSocket>(client.release()), address);
  }

  auto PosixSocketBackend::send(const NativeSocket socket, const Span<const u8> data) -> Result<usize> {
    const ssize_t sent = unix_shared::RetryOnEintr([&] { return ::send(static_cast<int>(socket), data.data(), data.size(), SendFlags); });

    if (sent == -1) {
      // SO_SNDTIMEO expiry surfaces as EAGAIN.
      if (errno == EAGAIN || errno == EWOULDBLOCK)
        ERR(Timeout, "Nothing sent before the socket timeout");

      ERR_ERRNO("send");
    }

    return static_cast<usize>(sent);
  }

  auto PosixSocketBackend::receive(const NativeSocket socket, const Span<u8> buffer, const Option<Millis> timeout) -> Result<usize> {
    const int fd = static_cast<int>(socket);

    if (timeout && !TRY(unix_shared::PollFd(fd, POLLIN, timeout)))
      ERR_FMT(Timeout, "Nothing received within {}ms", timeout->count());

    const ssize_t count = unix_shared::RetryOnEintr([&] { return ::recv(fd, buffer.data(), buffer.size(), 0); });

    if (count == -1) {
      // SO_RCVTIMEO expiry surfaces as EAGAIN.
      if (errno == EAGAIN || errno == EWOULDBLOCK)
        ERR(Timeout, "Nothing received before the socket timeout");

      ERR_ERRNO("recv");
    }

    return static_cast<usize>(count);
  }

  auto PosixSocketBackend::setOption(const NativeSocket socket, const SocketOption option, const OptionValue& value) -> Result<> {
    const int fd = static_cast<int>(socket);

    switch (option) {
      case SocketOption::Timeout: {
        const Millis timeout = std::get<Millis>(value);

        timeval tv {};
        tv.tv_sec  = static_cast<time_t>(timeout.count() / 1000);
        tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);

        if (::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) == -1)
          ERR_ERRNO("setsockopt(SO_RCVTIMEO)");

        if (::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) == -1)
          ERR_ERRNO("setsockopt(SO_SNDTIMEO)");

        return {};
      }

      case SocketOption::KeepAlive:
        return SetIntOption(fd, SO_KEEPALIVE, std::get<bool>(value) ? 1 : 0, "SO_KEEPALIVE");

      case SocketOption::BufferSize: {
        const int size = static_cast<int>(std::get<i64>(value));
        TRY_VOID(SetIntOption(fd, SO_RCVBUF, size, "SO_RCVBUF"));
        return SetIntOption(fd, SO_SNDBUF, size, "SO_SNDBUF");
      }

      case SocketOption::ReceiveBufferSize:
        return SetIntOption(fd, SO_RCVBUF, static_cast<int>(std::get<i64>(value)), "SO_RCVBUF");

      case SocketOption::SendBufferSize:
        return SetIntOption(fd, SO_SNDBUF, static_cast<int>(std::get<i64>(value)), "SO_SNDBUF");
    }

    ERR(Unsupported, "Unknown socket option");
  }

  auto PosixSocketBackend::close(const NativeSocket socket) -> Result<> {
    return unix_shared::CloseFd(static_cast<int>(socket), "socket");
  }
} // namespace conduit::os::posix

#endif // !defined(_WIN32)
