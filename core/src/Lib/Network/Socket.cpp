#include <limits>  // std::numeric_limits
#include <utility> // std::exchange

#include <magic_enum/magic_enum.hpp> // magic_enum::enum_name

#include <Conduit++/Core/Dispatch.hpp>
#include <Conduit++/Core/Operations.hpp>
#include <Conduit++/Network/Socket.hpp>
#include <Conduit++/Utils/Error.hpp>
#include <Conduit++/Utils/Logging.hpp>

#include "Network/SocketBackend.hpp"

using namespace conduit::utils::types;
using enum conduit::utils::error::ErrorKind;
using conduit::core::Dispatch;
using conduit::core::capability::BackendId;

namespace ops = conduit::core::ops;

namespace {
  using conduit::network::OptionValue;
  using conduit::network::SocketOption;

  constexpr Array<Pair<StringView, SocketOption>, 5> OptionNames = {
    {
     { "timeout", SocketOption::Timeout },
     { "keep_alive", SocketOption::KeepAlive },
     { "buffer_size", SocketOption::BufferSize },
     { "receive_buffer_size", SocketOption::ReceiveBufferSize },
     { "send_buffer_size", SocketOption::SendBufferSize },
     }
  };

  auto OptionOperation(const SocketOption option) -> StringView {
    switch (option) {
      case SocketOption::Timeout:           return ops::NetOptionTimeout;
      case SocketOption::KeepAlive:         return ops::NetOptionKeepAlive;
      case SocketOption::BufferSize:        return ops::NetOptionBufferSize;
      case SocketOption::ReceiveBufferSize: return ops::NetOptionRecvBuffer;
      case SocketOption::SendBufferSize:    return ops::NetOptionSendBuffer;
    }

    return ops::NetOptionTimeout;
  }

  /**
   * @brief Checks the value type for an option and converts compatible spellings.
   * @details Timeouts accept Millis or a plain millisecond count; sizes accept a positive count.
   */
  auto NormalizeValue(const StringView name, const SocketOption option, const OptionValue& value) -> Result<OptionValue> {
    switch (option) {
      case SocketOption::Timeout: {
        Millis timeout { 0 };

        if (const auto* millis = std::get_if<Millis>(&value))
          timeout = *millis;
        else if (const auto* count = std::get_if<i64>(&value))
          timeout = Millis(*count);
        else
          ERR_FMT(InvalidArgument, "Option '{}' expects a duration", name);

        if (timeout.count() < 0)
          ERR_FMT(InvalidArgument, "Option '{}' cannot be negative", name);

        return OptionValue(timeout);
      }

      case SocketOption::KeepAlive:
        if (!std::holds_alternative<bool>(value))
          ERR_FMT(InvalidArgument, "Option '{}' expects a boolean", name);

        return value;

      case SocketOption::BufferSize:
      case SocketOption::ReceiveBufferSize:
      case SocketOption::SendBufferSize: {
        const auto* size = std::get_if<i64>(&value);

        if (size == nullptr)
          ERR_FMT(InvalidArgument, "Option '{}' expects a byte count", name);

        if (*size <= 0 || *size > std::numeric_limits<i32>::max())
          ERR_FMT(InvalidArgument, "Option '{}' must be between 1 and {} bytes", name, std::numeric_limits<i32>::max());

        return value;
      }
    }

    ERR_FMT(Unsupported, "Socket option '{}' is not in the portable set", name);
  }
} // namespace

namespace conduit::network {
  auto ParseSocketOption(const StringView name) -> Option<SocketOption> {
    for (const auto& [optionName, option] : OptionNames)
      if (optionName == name)
        return option;

    return None;
  }

  // ─────────────────────────────────────────────────────────────────────────────
  // Socket
  // ─────────────────────────────────────────────────────────────────────────────

  Socket::Socket(const core::Context& ctx, SocketBackend& backend, const NativeSocket handle, const Protocol protocol, Address peer)
    : m_ctx(&ctx), m_backend(&backend), m_handle(handle), m_protocol(protocol), m_peer(std::move(peer)) {}

  Socket::Socket(Socket&& other) noexcept
    : m_ctx(other.m_ctx),
      m_backend(other.m_backend),
      m_handle(std::exchange(other.m_handle, InvalidSocket)),
      m_protocol(other.m_protocol),
      m_peer(std::move(other.m_peer)),
      m_timeout(other.m_timeout) {}

  auto Socket::operator=(Socket&& other) noexcept -> Socket& {
    if (this != &other) {
      if (isOpen())
        if (Result<> closed = m_backend->close(m_handle); !closed)
          warn_at(closed.error());

      m_ctx      = other.m_ctx;
      m_backend  = other.m_backend;
      m_handle   = std::exchange(other.m_handle, InvalidSocket);
      m_protocol = other.m_protocol;
      m_peer     = std::move(other.m_peer);
      m_timeout  = other.m_timeout;
    }

    return *this;
  }

  Socket::~Socket() {
    if (!isOpen())
      return;

    if (Result<> closed = m_backend->close(m_handle); !closed)
      warn_at(closed.error());
  }

  auto Socket::requireOpen() const -> Result<> {
    if (!isOpen())
      ERR(InvalidArgument, "Socket is closed");

    return {};
  }

  auto Socket::send(const Span<const u8> data) -> Result<usize> {
    TRY_VOID(requireOpen());
    return m_backend->send(m_handle, data);
  }

  auto Socket::sendAll(Span<const u8> data) -> Result<> {
    TRY_VOID(requireOpen());

    while (!data.empty()) {
      const usize sent = TRY(m_backend->send(m_handle, data));

      if (sent == 0)
        ERR_FMT(PlatformError, "Send to {}:{} made no progress", m_peer.host, m_peer.port);

      data = data.subspan(sent);
    }

    return {};
  }

  auto Socket::sendAll(const StringView text) -> Result<> {
    return sendAll(Span<const u8>(reinterpret_cast<const u8*>(text.data()), text.size()));
  }

  auto Socket::receive(const Span<u8> buffer, const Option<Millis> timeout) -> Result<usize> {
    TRY_VOID(requireOpen());

    if (buffer.empty())
      ERR(InvalidArgument, "Receive buffer is empty");

    return m_backend->receive(m_handle, buffer, timeout ? timeout : m_timeout);
  }

  auto Socket::setOption(const StringView name, const OptionValue value) -> Result<> {
    TRY_VOID(requireOpen());

    const Option<SocketOption> option = ParseSocketOption(name);

    if (!option)
      ERR_FMT(Unsupported, "Socket option '{}' is not in the portable set", name);

    if (*option == SocketOption::KeepAlive && m_protocol == Protocol::Udp)
      ERR(Unsupported, "keep_alive applies to TCP sockets only");

    const OptionValue normalized = TRY(NormalizeValue(name, *option, value));

    TRY_VOID(Dispatch<void>(*m_ctx, OptionOperation(*option), { .native = [&](BackendId) -> Result<> {
      return m_backend->setOption(m_handle, *option, normalized);
    } }));

    if (*option == SocketOption::Timeout) {
      const Millis timeout = std::get<Millis>(normalized);
      m_timeout            = timeout.count() > 0 ? Option<Millis>(timeout) : None;
    }

    trace_log("Set socket option {} on {}:{}", name, m_peer.host, m_peer.port);
    return {};
  }

  auto Socket::close() -> Result<> {
    TRY_VOID(requireOpen());
    return m_backend->close(std::exchange(m_handle, InvalidSocket));
  }

  // ─────────────────────────────────────────────────────────────────────────────
  // Listener
  // ─────────────────────────────────────────────────────────────────────────────

  Listener::Listener(const core::Context& ctx, SocketBackend& backend, const NativeSocket handle, const u16 port)
    : m_ctx(&ctx), m_backend(&backend), m_handle(handle), m_port(port) {}

  Listener::Listener(Listener&& other) noexcept
    : m_ctx(other.m_ctx), m_backend(other.m_backend), m_handle(std::exchange(other.m_handle, InvalidSocket)), m_port(other.m_port) {}

  auto Listener::operator=(Listener&& other) noexcept -> Listener& {
    if (this != &other) {
      if (isOpen())
        if (Result<> closed = m_backend->close(m_handle); !closed)
          warn_at(closed.error());

      m_ctx     = other.m_ctx;
      m_backend = other.m_backend;
      m_handle  = std::exchange(other.m_handle, InvalidSocket);
      m_port    = other.m_port;
    }

    return *this;
  }

  Listener::~Listener() {
    if (!isOpen())
      return;

    if (Result<> closed = m_backend->close(m_handle); !closed)
      warn_at(closed.error());
  }

  auto Listener::accept(const Option<Millis> timeout) -> Result<Socket> {
    if (!isOpen())
      ERR(InvalidArgument, "Listener is closed");

    auto [handle, peer] = TRY(m_backend->accept(m_handle, timeout));

    debug_log("Accepted {}:{} on port {}", peer.host, peer.port, m_port);
    return Socket(*m_ctx, *m_backend, handle, Protocol::Tcp, std::move(peer));
  }

  auto Listener::close() -> Result<> {
    if (!isOpen())
      ERR(InvalidArgument, "Listener is closed");

    return m_backend->close(std::exchange(m_handle, InvalidSocket));
  }

  // ─────────────────────────────────────────────────────────────────────────────
  // Network
  // ─────────────────────────────────────────────────────────────────────────────

  Network::Network(const core::Context& ctx) : m_ctx(ctx) {}

  auto Network::connect(const Address& address, const Protocol protocol, const Option<Millis> timeout) -> Result<Socket> {
    if (address.host.empty())
      ERR(InvalidArgument, "Host is empty");

    if (address.port == 0)
      ERR(InvalidArgument, "Port 0 is not a valid destination");

    if (timeout && timeout->count() <= 0)
      ERR_FMT(InvalidArgument, "Connect timeout must be positive, got {}ms", timeout->count());

    return Dispatch<Socket>(m_ctx, ops::NetConnect, { .native = [&](const BackendId id) -> Result<Socket> {
      SocketBackend*     backend = TRY(GetSocketBackend(id));
      const NativeSocket handle  = TRY(backend->connect(address, protocol, timeout));

      debug_log_fields(Fields(field(protocol, magic_enum::enum_name(protocol))), "Connected to {}:{}", address.host, address.port);
      return Socket(m_ctx, *backend, handle, protocol, address);
    } });
  }

  auto Network::listen(const Address& address, const Protocol protocol, const i32 backlog) -> Result<Listener> {
    if (protocol != Protocol::Tcp)
      ERR(InvalidArgument, "Only TCP sockets can listen");

    if (backlog <= 0)
      ERR_FMT(InvalidArgument, "Listen backlog must be positive, got {}", backlog);

    return Dispatch<Listener>(m_ctx, ops::NetListen, { .native = [&](const BackendId id) -> Result<Listener> {
      SocketBackend* backend         = TRY(GetSocketBackend(id));
      const auto [handle, boundPort] = TRY(backend->listen(address, backlog));

      debug_log("Listening on {}:{}", address.host.empty() ? "*" : address.host, boundPort);
      return Listener(m_ctx, *backend, handle, boundPort);
    } });
  }
} // namespace conduit::network
