#include <boost/ut.hpp>

#include <cctype>
#include <chrono>
#include <format>
#include <thread>

#include <Conduit++/Core/Context.hpp>
#include <Conduit++/Core/Platform.hpp>
#include <Conduit++/Files/FileSystem.hpp>
#include <Conduit++/Network/Http.hpp>
#include <Conduit++/Network/Socket.hpp>

using namespace boost::ut;
using namespace conduit::network;
using namespace conduit::network::http;
using namespace conduit::utils::types;

using conduit::core::Context;
using conduit::core::platform::Detect;
using conduit::core::platform::GetKnownDirectory;
using conduit::core::platform::KnownDirectory;
using conduit::files::FileSystem;
using conduit::utils::error::ErrorKind;

namespace {
  constexpr StringView Loopback = "127.0.0.1";

  struct Captured {
    String head;
    String body;
  };

  auto Lower(String text) -> String {
    for (char& chr : text)
      chr = static_cast<char>(std::tolower(static_cast<unsigned char>(chr)));

    return text;
  }

  /// Reads one request: the head up to the blank line plus a Content-Length body.
  auto ReadRequest(Socket& socket) -> Captured {
    String          raw;
    Array<u8, 4096> buffer {};
    usize           headEnd    = String::npos;
    usize           bodyLength = 0;

    while (true) {
      if (headEnd == String::npos) {
        headEnd = raw.find("\r\n\r\n");

        if (headEnd != String::npos) {
          const String lower = Lower(raw.substr(0, headEnd));

          if (const usize at = lower.find("content-length:"); at != String::npos)
            bodyLength = std::stoul(lower.substr(at + 15));
        }
      }

      if (headEnd != String::npos && raw.size() >= headEnd + 4 + bodyLength)
        break;

      const Result<usize> got = socket.receive(buffer, Millis(5000));

      if (!got || *got == 0)
        break;

      raw.append(buffer.begin(), buffer.begin() + static_cast<isize>(*got));
    }

    if (headEnd == String::npos)
      return { .head = raw, .body = {} };

    return { .head = raw.substr(0, headEnd), .body = raw.substr(headEnd + 4) };
  }

  /// Answers one connection per reply, in order, recording each request.
  auto Serve(Listener& listener, Vec<String> replies, Vec<Captured>& seen) -> std::jthread {
    return std::jthread([&listener, replies = std::move(replies), &seen] -> void {
      for (const String& reply : replies) {
        Result<Socket> client = listener.accept(Millis(5000));

        if (!client)
          return;

        seen.push_back(ReadRequest(*client));

        if (!client->sendAll(reply) || !client->close())
          return;
      }
    });
  }

  auto UrlFor(const Listener& listener, const StringView path) -> String {
    return std::format("http://{}:{}{}", Loopback, listener.localPort(), path);
  }

  auto ScratchRoot() -> String {
    const String temp  = GetKnownDirectory(Detect(), KnownDirectory::Temp).value_or("/tmp");
    const auto   stamp = std::chrono::steady_clock::now().time_since_epoch().count();

    return std::format("{}/conduit-http-{}", temp, stamp);
  }
} // namespace

auto main() -> int {
  const Result<UniquePointer<Context>> created = Context::create();

  if (!created)
    return 1;

  const Context& ctx = **created;
  Network        net(ctx);
  FileSystem     fs(ctx);
  const Client   client(ctx);
  const String   root = ScratchRoot();

  if (!fs.createDirectories(root))
    return 1;

  auto listen = [&net] -> Result<Listener> {
    return net.listen({ .host = String(Loopback), .port = 0 });
  };

  "URLs are split into host, port and target"_test = [] -> void {
    const Result<Url> plain = Url::parse("http://example.com");

    expect(plain.has_value());
    expect(plain && *plain == Url { .host = "example.com", .port = 80, .target = "/" });

    const Result<Url> full = Url::parse("HTTP://127.0.0.1:8080/a/b?x=1#section");

    expect(full && *full == Url { .host = "127.0.0.1", .port = 8080, .target = "/a/b?x=1" });

    const Result<Url> query = Url::parse("http://host?x=1");

    expect(query && query->target == String("/?x=1"));

    const Result<Url> ipv6 = Url::parse("http://[::1]:81/");

    expect(ipv6 && ipv6->host == String("::1") && ipv6->port == 81);
  };

  "Malformed and encrypted URLs are rejected"_test = [] -> void {
    expect(Url::parse("https://example.com").error().kind == ErrorKind::Unsupported);
    expect(Url::parse("ftp://example.com").error().kind == ErrorKind::Unsupported);
    expect(Url::parse("example.com").error().kind == ErrorKind::InvalidArgument);
    expect(Url::parse("http://:80/").error().kind == ErrorKind::InvalidArgument);
    expect(Url::parse("http://host:0/").error().kind == ErrorKind::InvalidArgument);
    expect(Url::parse("http://host:99999/").error().kind == ErrorKind::InvalidArgument);
    expect(Url::parse("http://host:/").error().kind == ErrorKind::InvalidArgument);
    expect(Url::parse("http://user@host/").error().kind == ErrorKind::InvalidArgument);
  };

  "Methods and form fields"_test = [] -> void {
    expect(ParseMethod("get") == Method::Get);
    expect(ParseMethod("POST") == Method::Post);
    expect(ParseMethod("PUT").error().kind == ErrorKind::InvalidArgument);

    expect(EncodeForm({ { "q", "a b" }, { "and", "1&2=3" } }) == String("and=1%262%3D3&q=a+b"));
    expect(EncodeForm({}).empty());
  };

  "Failed statuses map onto error kinds"_test = [] -> void {
    expect(StatusErrorKind(404) == ErrorKind::NotFound);
    expect(StatusErrorKind(403) == ErrorKind::PermissionDenied);
    expect(StatusErrorKind(401) == ErrorKind::PermissionDenied);
    expect(StatusErrorKind(504) == ErrorKind::Timeout);
    expect(StatusErrorKind(429) == ErrorKind::ResourceBusy);
    expect(StatusErrorKind(500) == ErrorKind::PlatformError);
  };

  "GET sends the query string and headers"_test = [&] -> void {
    Result<Listener> listener = listen();

    expect(listener.has_value());
    if (!listener)
      return;

    Vec<Captured>    seen;
    Result<Response> response;

    {
      std::jthread server = Serve(*listener, { "HTTP/1.1 200 OK\r\nContent-Type: text/plain\r\nContent-Length: 5\r\n\r\nhello" }, seen);

      response = client.fetch({
        .method  = Method::Get,
        .url     = UrlFor(*listener, "/api"),
        .params  = { { "page", "2" }, { "q", "a b" } },
        .headers = { { "X-Token", "abc" } },
        .body    = {},
        .timeout = Millis(5000),
      });
    }

    expect(response.has_value());
    if (!response || seen.size() != 1)
      return;

    expect(response->status == 200);
    expect(response->reason == String("OK"));
    expect(response->ok());
    expect(response->body == String("hello"));
    expect(response->header("Content-Type") == Some(String("text/plain")));
    expect(response->header("x-missing") == None);

    const String& head = seen[0].head;

    expect(head.starts_with("GET /api?page=2&q=a+b HTTP/1.1\r\n")) << head;
    expect(head.contains(std::format("Host: {}:{}\r\n", Loopback, listener->localPort())));
    expect(head.contains("X-Token: abc\r\n"));
    expect(head.contains("Connection: close"));
  };

  "POST sends params as a form and reads chunked bodies"_test = [&] -> void {
    Result<Listener> listener = listen();

    expect(listener.has_value());
    if (!listener)
      return;

    Vec<Captured>    seen;
    Result<Response> response;

    {
      std::jthread server = Serve(
        *listener,
        { "HTTP/1.1 201 Created\r\nTransfer-Encoding: chunked\r\n\r\n4\r\nWiki\r\n5;ext=1\r\npedia\r\n0\r\nX-Trailer: t\r\n\r\n" },
        seen
      );

      response = client.fetch({
        .method  = Method::Post,
        .url     = UrlFor(*listener, "/items"),
        .params  = { { "name", "conduit" } },
        .headers = {},
        .body    = {},
        .timeout = Millis(5000),
      });
    }

    expect(response.has_value());
    if (!response || seen.size() != 1)
      return;

    expect(response->status == 201);
    expect(response->body == String("Wikipedia"));

    expect(seen[0].head.starts_with("POST /items HTTP/1.1\r\n"));
    expect(seen[0].head.contains("Content-Type: application/x-www-form-urlencoded\r\n"));
    expect(seen[0].head.contains("Content-Length: 12\r\n"));
    expect(seen[0].body == String("name=conduit"));
  };

  "An explicit body wins over params"_test = [&] -> void {
    Result<Listener> listener = listen();

    expect(listener.has_value());
    if (!listener)
      return;

    Vec<Captured>    seen;
    Result<Response> response;

    {
      std::jthread server = Serve(*listener, { "HTTP/1.1 500 Internal Server Error\r\nContent-Length: 4\r\n\r\noops" }, seen);

      response = client.fetch({
        .method  = Method::Post,
        .url     = UrlFor(*listener, "/raw"),
        .params  = { { "ignored", "1" } },
        .headers = { { "Content-Type", "application/json" } },
        .body    = R"({"k":1})",
        .timeout = Millis(5000),
      });
    }

    // A failed status is still a response.
    expect(response.has_value());
    expect(response && response->status == 500 && !response->ok());
    expect(response && response->body == String("oops"));

    expect(seen.size() == 1_u);
    expect(!seen.empty() && seen[0].body == String(R"({"k":1})"));
    expect(!seen.empty() && !seen[0].head.contains("x-www-form-urlencoded"));
  };

  "GET follows redirects"_test = [&] -> void {
    Result<Listener> listener = listen();

    expect(listener.has_value());
    if (!listener)
      return;

    Vec<Captured>    seen;
    Result<Response> response;

    {
      std::jthread server = Serve(
        *listener,
        {
          "HTTP/1.1 302 Found\r\nLocation: /moved/here\r\nContent-Length: 0\r\n\r\n",
          "HTTP/1.1 301 Moved Permanently\r\nLocation: final?x=1\r\nContent-Length: 0\r\n\r\n",
          "HTTP/1.1 200 OK\r\n\r\ndone",
        },
        seen
      );

      response = client.fetch({ .method = Method::Get, .url = UrlFor(*listener, "/start"), .params = {}, .headers = {}, .body = {}, .timeout = Millis(5000) });
    }

    expect(response.has_value());
    expect(response && response->status == 200 && response->body == String("done"));

    expect(seen.size() == 3_u);
    if (seen.size() != 3)
      return;

    expect(seen[1].head.starts_with("GET /moved/here HTTP/1.1"));
    expect(seen[2].head.starts_with("GET /moved/final?x=1 HTTP/1.1"));
  };

  "Truncated bodies are errors"_test = [&] -> void {
    Result<Listener> listener = listen();

    expect(listener.has_value());
    if (!listener)
      return;

    Vec<Captured>    seen;
    Result<Response> response;

    {
      std::jthread server = Serve(*listener, { "HTTP/1.1 200 OK\r\nContent-Length: 10\r\n\r\nabc" }, seen);

      response = client.fetch({ .method = Method::Get, .url = UrlFor(*listener, "/"), .params = {}, .headers = {}, .body = {}, .timeout = Millis(5000) });
    }

    expect(!response.has_value());
    expect(!response && response.error().kind == ErrorKind::PlatformError);
  };

  "Silent servers hit the deadline"_test = [&] -> void {
    Result<Listener> listener = listen();

    expect(listener.has_value());
    if (!listener)
      return;

    Result<Response> response;

    {
      std::jthread silent([&listener](const std::stop_token& stop) -> void {
        Result<Socket> held = listener->accept(Millis(5000));

        while (held && !stop.stop_requested())
          std::this_thread::sleep_for(std::chrono::milliseconds(10));
      });

      const auto started = std::chrono::steady_clock::now();

      response = client.fetch({ .method = Method::Get, .url = UrlFor(*listener, "/"), .params = {}, .headers = {}, .body = {}, .timeout = Millis(200) });

      expect(std::chrono::steady_clock::now() - started < std::chrono::seconds(3));
    }

    expect(!response.has_value());
    expect(!response && response.error().kind == ErrorKind::Timeout);
  };

  "Downloads stream the body into a file"_test = [&] -> void {
    Result<Listener> listener = listen();

    expect(listener.has_value());
    if (!listener)
      return;

    String payload;

    for (usize i = 0; i < 100'000; ++i)
      payload += static_cast<char>('a' + (i % 26));

    const String destination = root + "/download.bin";

    Vec<Captured> seen;
    Result<u64>   written;

    {
      // No Content-Length: the body runs until the server closes.
      std::jthread server = Serve(*listener, { "HTTP/1.1 200 OK\r\n\r\n" + payload }, seen);

      written = client.download(UrlFor(*listener, "/blob"), destination, { { "v", "1" } }, Millis(5000));
    }

    expect(written == u64(payload.size()));
    expect(fs.readText(destination) == payload);
    expect(!seen.empty() && seen[0].head.starts_with("GET /blob?v=1 HTTP/1.1"));
  };

  "Failed downloads leave no file behind"_test = [&] -> void {
    Result<Listener> listener = listen();

    expect(listener.has_value());
    if (!listener)
      return;

    const String destination = root + "/missing.bin";

    Vec<Captured> seen;
    Result<u64>   missing;

    {
      std::jthread server = Serve(
        *listener,
        {
          "HTTP/1.1 404 Not Found\r\nContent-Length: 9\r\n\r\nnot found",
          "HTTP/1.1 200 OK\r\nContent-Length: 100\r\n\r\npartial",
        },
        seen
      );

      missing = client.download(UrlFor(*listener, "/gone"), destination, {}, Millis(5000));

      expect(!missing.has_value());
      expect(!missing && missing.error().kind == ErrorKind::NotFound);
      expect(fs.exists(destination) == false);

      const Result<u64> truncated = client.download(UrlFor(*listener, "/cut"), destination, {}, Millis(5000));

      expect(!truncated.has_value());
      expect(!truncated && truncated.error().kind == ErrorKind::PlatformError);
      expect(fs.exists(destination) == false);
    }
  };

  "Uploads send the file as multipart form data"_test = [&] -> void {
    Result<Listener> listener = listen();

    expect(listener.has_value());
    if (!listener)
      return;

    const String source = root + "/upload.txt";

    expect(fs.writeText(source, "file contents\n").has_value());

    Vec<Captured>    seen;
    Result<Response> response;

    {
      std::jthread server = Serve(*listener, { "HTTP/1.1 200 OK\r\nContent-Length: 2\r\n\r\nok" }, seen);

      response = client.upload(UrlFor(*listener, "/upload"), source, { { "user", "ada" } }, Millis(5000));
    }

    expect(response.has_value());
    expect(response && response->status == 200 && response->body == String("ok"));

    expect(seen.size() == 1_u);
    if (seen.empty())
      return;

    const String& head = seen[0].head;
    const String& body = seen[0].body;

    const usize  at       = head.find("boundary=");
    const String boundary = at == String::npos ? String() : head.substr(at + 9, head.find("\r\n", at) - at - 9);

    expect(head.starts_with("POST /upload HTTP/1.1"));
    expect(!boundary.empty());
    expect(body.starts_with("--" + boundary + "\r\n"));
    expect(body.contains("Content-Disposition: form-data; name=\"user\"\r\n\r\nada\r\n"));
    expect(body.contains("Content-Disposition: form-data; name=\"file\"; filename=\"upload.txt\""));
    expect(body.contains("\r\n\r\nfile contents\n\r\n"));
    expect(body.ends_with("--" + boundary + "--\r\n"));
  };

  "Uploading a missing file fails before connecting"_test = [&] -> void {
    const Result<Response> response = client.upload("http://127.0.0.1:9/upload", root + "/nope.txt", {}, Millis(1000));

    expect(!response.has_value());
    expect(!response && response.error().kind == ErrorKind::NotFound);
  };

  return fs.removeAll(root) ? 0 : 1;
}
