#pragma once

#include <Conduit++/Core/Capability.hpp>
#include <Conduit++/Network/Socket.hpp>
#include <Conduit++/Utils/Types.hpp>

namespace conduit::network {
  namespace types = ::conduit::utils::types;

  class SocketBackend {
   public:
    SocketBackend()                                        = default;
    SocketBackend(const SocketBackend&)                    = delete;
    SocketBackend(SocketBackend&&)                         = delete;
    auto operator=(const SocketBackend&) -> SocketBackend& = delete;
    auto operator=(SocketBackend&&) -> SocketBackend&      = delete;
    virtual ~SocketBackend()                               = default;

    virtual auto connect(const Address& address, Protocol protocol, types::Option<types::Millis> timeout) -> types::Result<NativeSocket> = 0;

    /**
     * @brief Binds a TCP socket and starts listening. Returns the socket and the bound port.
     */
    virtual auto listen(const Address& address, types::i32 backlog) -> types::Result<types::Pair<NativeSocket, types::u16>> = 0;

    virtual auto accept(NativeSocket listener, types::Option<types::Millis> timeout) -> types::Result<types::Pair<NativeSocket, Address>> = 0;

    virtual auto send(NativeSocket socket, types::Span<const types::u8> data) -> types::Result<types::usize> = 0;

    virtual auto receive(NativeSocket socket, types::Span<types::u8> buffer, types::Option<types::Millis> timeout) -> types::Result<types::usize> = 0;

    /**
     * @brief Applies an already validated option value.
     */
    virtual auto setOption(NativeSocket socket, SocketOption option, const OptionValue& value) -> types::Result<> = 0;

    virtual auto close(NativeSocket socket) -> types::Result<> = 0;
  };

  auto GetSocketBackend(core::capability::BackendId id) -> types::Result<SocketBackend*>;
} // namespace conduit::network
