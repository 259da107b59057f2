#include <boost/ut.hpp>

#include <Conduit++/Core/Context.hpp>
#include <Conduit++/Network/Socket.hpp>

using namespace boost::ut;
using namespace conduit::network;
using namespace conduit::utils::types;

using conduit::core::Context;
using conduit::utils::error::ErrorKind;

namespace {
  constexpr StringView Loopback = "127.0.0.1";

  auto AsText(const Span<const u8> bytes) -> String {
    return { bytes.begin(), bytes.end() };
  }
} // namespace

auto main() -> int {
  const Result<UniquePointer<Context>> created = Context::create();

  if (!created)
    return 1;

  Network net(**created);

  "Option names map onto the portable subset"_test = [] -> void {
    expect(ParseSocketOption("timeout") == Some(SocketOption::Timeout));
    expect(ParseSocketOption("keep_alive") == Some(SocketOption::KeepAlive));
    expect(ParseSocketOption("buffer_size") == Some(SocketOption::BufferSize));
    expect(ParseSocketOption("send_buffer_size") == Some(SocketOption::SendBufferSize));
    expect(ParseSocketOption("reuse_port") == None);
    expect(ParseSocketOption("TIMEOUT") == None);
  };

  "Loopback round trip"_test = [&] -> void {
    Result<Listener> listener = net.listen({ .host = String(Loopback), .port = 0 });

    expect(listener.has_value());
    if (!listener)
      return;

    expect(listener->localPort() != 0);

    Result<Socket> client = net.connect({ .host = String(Loopback), .port = listener->localPort() }, Protocol::Tcp, Millis(2000));

    expect(client.has_value());
    if (!client)
      return;

    Result<Socket> server = listener->accept(Millis(2000));

    expect(server.has_value());
    if (!server)
      return;

    expect(client->protocol() == Protocol::Tcp);
    expect(client->peer().port == listener->localPort());
    expect(server->peer().host == String(Loopback));

    expect(client->sendAll("ping").has_value());

    Array<u8, 16> buffer {};

    const Result<usize> received = server->receive(buffer, Millis(2000));

    expect(received == usize(4));
    expect(received && AsText(Span<const u8>(buffer.data(), *received)) == String("ping"));

    expect(server->sendAll("pong!").has_value());

    usize total = 0;

    while (total < 5) {
      const Result<usize> chunk = client->receive(Span<u8>(buffer.data() + total, buffer.size() - total), Millis(2000));

      expect(chunk.has_value());
      if (!chunk || *chunk == 0)
        break;

      total += *chunk;
    }

    expect(AsText(Span<const u8>(buffer.data(), total)) == String("pong!"));

    expect(server->close().has_value());

    const Result<usize> eof = client->receive(buffer, Millis(2000));

    expect(eof == usize(0));
  };

  "Receive times out without data"_test = [&] -> void {
    Result<Listener> listener = net.listen({ .host = String(Loopback), .port = 0 });

    expect(listener.has_value());
    if (!listener)
      return;

    Result<Socket> client = net.connect({ .host = String(Loopback), .port = listener->localPort() });
    Result<Socket> server = listener->accept(Millis(2000));

    expect(client.has_value() && server.has_value());
    if (!client || !server)
      return;

    Array<u8, 8> buffer {};

    const Result<usize> explicitTimeout = client->receive(buffer, Millis(50));

    expect(!explicitTimeout && explicitTimeout.error().kind == ErrorKind::Timeout);

    expect(client->setOption("timeout", Millis(50)).has_value());

    const Result<usize> defaultTimeout = client->receive(buffer);

    expect(!defaultTimeout && defaultTimeout.error().kind == ErrorKind::Timeout);

    expect(client->receive(Span<u8>()).error().kind == ErrorKind::InvalidArgument);
  };

  "accept times out without a client"_test = [&] -> void {
    Result<Listener> listener = net.listen({ .host = String(Loopback), .port = 0 });

    expect(listener.has_value());
    if (!listener)
      return;

    const Result<Socket> accepted = listener->accept(Millis(50));

    expect(!accepted && accepted.error().kind == ErrorKind::Timeout);

    expect(listener->close().has_value());
    expect(!listener->isOpen());
    expect(listener->accept(Millis(50)).error().kind == ErrorKind::InvalidArgument);
  };

  "Socket options"_test = [&] -> void {
    Result<Listener> listener = net.listen({ .host = String(Loopback), .port = 0 });

    expect(listener.has_value());
    if (!listener)
      return;

    Result<Socket> client = net.connect({ .host = String(Loopback), .port = listener->localPort() });

    expect(client.has_value());
    if (!client)
      return;

    expect(client->setOption("timeout", Millis(100)).has_value());
    expect(client->setOption("timeout", i64(250)).has_value());
    expect(client->setOption("keep_alive", true).has_value());
    expect(client->setOption("buffer_size", i64(65536)).has_value());
    expect(client->setOption("receive_buffer_size", i64(32768)).has_value());
    expect(client->setOption("send_buffer_size", i64(32768)).has_value());

    expect(client->setOption("reuse_port", true).error().kind == ErrorKind::Unsupported);
    expect(client->setOption("timeout", true).error().kind == ErrorKind::InvalidArgument);
    expect(client->setOption("timeout", Millis(-1)).error().kind == ErrorKind::InvalidArgument);
    expect(client->setOption("keep_alive", i64(1)).error().kind == ErrorKind::InvalidArgument);
    expect(client->setOption("buffer_size", i64(0)).error().kind == ErrorKind::InvalidArgument);
    expect(client->setOption("buffer_size", Millis(10)).error().kind == ErrorKind::InvalidArgument);

    // Rejected options leave the connection usable.
    Result<Socket> server = listener->accept(Millis(2000));

    expect(server.has_value());
    if (!server)
      return;

    expect(client->sendAll("still here").has_value());

    Array<u8, 32>       buffer {};
    const Result<usize> got = server->receive(buffer, Millis(2000));

    expect(got.has_value());
    expect(got && AsText(Span<const u8>(buffer.data(), *got)) == String("still here"));

    expect(client->close().has_value());
    expect(!client->isOpen());
    expect(client->setOption("keep_alive", true).error().kind == ErrorKind::InvalidArgument);
    expect(client->sendAll("late").error().kind == ErrorKind::InvalidArgument);
  };

  "Sends that outlast the socket timeout are Timeout"_test = [&] -> void {
    Result<Listener> listener = net.listen({ .host = String(Loopback), .port = 0 });

    expect(listener.has_value());
    if (!listener)
      return;

    Result<Socket> client = net.connect({ .host = String(Loopback), .port = listener->localPort() });
    Result<Socket> server = listener->accept(Millis(2000));

    expect(client.has_value() && server.has_value());
    if (!client || !server)
      return;

    expect(client->setOption("send_buffer_size", i64(4096)).has_value());
    expect(client->setOption("timeout", Millis(50)).has_value());

    // The server never reads, so the socket buffers fill up.
    const Bytes chunk(64 * 1024, 0x5A);

    Result<usize> sent = usize(0);

    for (usize i = 0; i < 4096 && sent; ++i)
      sent = client->send(chunk);

    expect(!sent);
    expect(!sent && sent.error().kind == ErrorKind::Timeout);
  };

  "UDP sockets"_test = [&] -> void {
    const Result<Listener> listening = net.listen({ .host = String(Loopback), .port = 0 }, Protocol::Udp);

    expect(!listening && listening.error().kind == ErrorKind::InvalidArgument);

    Result<Socket> datagram = net.connect({ .host = String(Loopback), .port = 9 }, Protocol::Udp);

    expect(datagram.has_value());
    if (!datagram)
      return;

    expect(datagram->protocol() == Protocol::Udp);
    expect(datagram->setOption("keep_alive", true).error().kind == ErrorKind::Unsupported);
    expect(datagram->setOption("timeout", Millis(10)).has_value());
  };

  "Connect argument validation"_test = [&] -> void {
    expect(net.connect({ .host = String(Loopback), .port = 0 }).error().kind == ErrorKind::InvalidArgument);
    expect(net.connect({ .host = "", .port = 80 }).error().kind == ErrorKind::InvalidArgument);
    expect(net.connect({ .host = String(Loopback), .port = 80 }, Protocol::Tcp, Millis(0)).error().kind == ErrorKind::InvalidArgument);
    expect(net.listen({ .host = String(Loopback), .port = 0 }, Protocol::Tcp, 0).error().kind == ErrorKind::InvalidArgument);
  };

  "Connecting to a closed port is NotFound"_test = [&] -> void {
    u16 port = 0;

    {
      Result<Listener> listener = net.listen({ .host = String(Loopback), .port = 0 });

      expect(listener.has_value());
      if (!listener)
        return;

      port = listener->localPort();
    }

    const Result<Socket> refused = net.connect({ .host = String(Loopback), .port = port }, Protocol::Tcp, Millis(2000));

    expect(!refused && refused.error().kind == ErrorKind::NotFound);
  };

  return 0;
}
