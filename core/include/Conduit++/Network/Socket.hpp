#pragma once

#include <variant> // std::variant

#include "../Core/Context.hpp"
#include "../Utils/Error.hpp"
#include "../Utils/Types.hpp"

namespace conduit::network {
  namespace types = ::conduit::utils::types;

  class SocketBackend;

  /// fd on POSIX, SOCKET on Windows.
  using NativeSocket = types::isize;

  inline constexpr NativeSocket InvalidSocket = -1;

  enum class Protocol : types::u8 {
    Tcp,
    Udp,
  };

  struct Address {
    types::String host; ///< Host name or numeric address.
    types::u16    port = 0;

    auto operator==(const Address&) const -> bool = default;
  };

  /**
   * @brief Value of a socket option: a flag, a byte count, or a duration.
   */
  using OptionValue = std::variant<bool, types::i64, types::Millis>;

  /**
   * @enum SocketOption
   * @brief The portable option subset accepted by Socket::setOption.
   *
   * Names accepted by setOption: "timeout" (Millis), "keep_alive" (bool),
   * "buffer_size" (bytes, both directions), "receive_buffer_size",
   * "send_buffer_size".
   */
  enum class SocketOption : types::u8 {
    Timeout,
    KeepAlive,
    BufferSize,
    ReceiveBufferSize,
    SendBufferSize,
  };

  /**
   * @brief Maps an option name to the portable subset.
   * @return None for unrecognized or platform-exclusive names.
   */
  auto ParseSocketOption(types::StringView name) -> types::Option<SocketOption>;

  /**
   * @class Socket
   * @brief Exclusively owned connected socket. Not safe for concurrent use without external locking.
   */
  class Socket {
   public:
    Socket() = default;
    Socket(const Socket&) = delete;
    Socket(Socket&& other) noexcept;
    auto operator=(const Socket&) -> Socket& = delete;
    auto operator=(Socket&& other) noexcept -> Socket&;
    ~Socket();

    /**
     * @brief Sends some of `data`; returns how many bytes were accepted.
     */
    auto send(types::Span<const types::u8> data) -> types::Result<types::usize>;

    auto sendAll(types::Span<const types::u8> data) -> types::Result<>;

    auto sendAll(types::StringView text) -> types::Result<>;

    /**
     * @brief Receives into `buffer`.
     * @param timeout  Overrides the socket's "timeout" option for this call; None uses it.
     * @return Bytes received; 0 means the peer closed the connection. Timeout if nothing arrived in time.
     */
    auto receive(types::Span<types::u8> buffer, types::Option<types::Millis> timeout = types::None) -> types::Result<types::usize>;

    /**
     * @brief Sets an option from the portable subset.
     * @return Unsupported for any other name (the socket is left untouched);
     *         InvalidArgument if the value has the wrong type or range.
     */
    auto setOption(types::StringView name, OptionValue value) -> types::Result<>;

    auto close() -> types::Result<>;

    [[nodiscard]] auto isOpen() const -> bool {
      return m_handle != InvalidSocket;
    }

    [[nodiscard]] auto protocol() const -> Protocol {
      return m_protocol;
    }

    [[nodiscard]] auto peer() const -> const Address& {
      return m_peer;
    }

   private:
    friend class Network;
    friend class Listener;

    Socket(const core::Context& ctx, SocketBackend& backend, NativeSocket handle, Protocol protocol, Address peer);

    auto requireOpen() const -> types::Result<>;

    const core::Context*         m_ctx      = nullptr;
    SocketBackend*               m_backend  = nullptr;
    NativeSocket                 m_handle   = InvalidSocket;
    Protocol                     m_protocol = Protocol::Tcp;
    Address                      m_peer;
    types::Option<types::Millis> m_timeout;
  };

  /**
   * @class Listener
   * @brief Exclusively owned listening TCP socket.
   */
  class Listener {
   public:
    Listener() = default;
    Listener(const Listener&) = delete;
    Listener(Listener&& other) noexcept;
    auto operator=(const Listener&) -> Listener& = delete;
    auto operator=(Listener&& other) noexcept -> Listener&;
    ~Listener();

    /**
     * @brief Accepts one connection.
     * @param timeout  None blocks; otherwise Timeout if no client connects in time.
     */
    auto accept(types::Option<types::Millis> timeout = types::None) -> types::Result<Socket>;

    /**
     * @brief The bound port (useful after listening on port 0).
     */
    [[nodiscard]] auto localPort() const -> types::u16 {
      return m_port;
    }

    auto close() -> types::Result<>;

    [[nodiscard]] auto isOpen() const -> bool {
      return m_handle != InvalidSocket;
    }

   private:
    friend class Network;

    Listener(const core::Context& ctx, SocketBackend& backend, NativeSocket handle, types::u16 port);

    const core::Context* m_ctx     = nullptr;
    SocketBackend*       m_backend = nullptr;
    NativeSocket         m_handle  = InvalidSocket;
    types::u16           m_port    = 0;
  };

  /**
   * @class Network
   * @brief Network access adapter.
   */
  class Network {
   public:
    explicit Network(const core::Context& ctx);

    /**
     * @brief Resolves `address` and connects.
     * @param timeout  Connection timeout; None uses the OS default.
     * @return NotFound if the host does not resolve or the peer refuses; Timeout if it does not answer.
     *
     * For Udp the socket is associated with the peer so send/receive use it implicitly.
     */
    auto connect(const Address& address, Protocol protocol = Protocol::Tcp, types::Option<types::Millis> timeout = types::None)
      -> types::Result<Socket>;

    /**
     * @brief Binds and listens. Port 0 picks a free port.
     * @return InvalidArgument for Udp, which has no listening state.
     */
    auto listen(const Address& address, Protocol protocol = Protocol::Tcp, types::i32 backlog = 16) -> types::Result<Listener>;

   private:
    const core::Context& m_ctx;
  };
} // namespace conduit::network
