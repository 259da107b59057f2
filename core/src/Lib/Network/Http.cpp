#include <algorithm>  // std::min
#include <charconv>   // std::from_chars
#include <chrono>     // std::chrono::{steady_clock, duration_cast}
#include <format>     // std::format
#include <functional> // std::function

#include <Conduit++/Files/FileSystem.hpp>
#include <Conduit++/Files/Path.hpp>
#include <Conduit++/Network/Http.hpp>
#include <Conduit++/Network/Socket.hpp>
#include <Conduit++/Utils/Error.hpp>
#include <Conduit++/Utils/Logging.hpp>

using namespace conduit::utils::types;
using enum conduit::utils::error::ErrorKind;
using conduit::files::File;
using conduit::files::FileSystem;
using conduit::files::OpenMode;
using conduit::network::Address;
using conduit::network::Network;
using conduit::network::Protocol;
using conduit::network::Socket;
using conduit::network::http::Method;
using conduit::network::http::Response;
using conduit::network::http::Url;

namespace {
  constexpr usize      ChunkSize    = 8192;
  constexpr usize      MaxHeadBytes = 64 * 1024;
  constexpr u32        MaxRedirects = 5;
  constexpr StringView UserAgent    = "conduit";

  using Clock    = std::chrono::steady_clock;
  using BodySink = std::function<Result<>(StringView)>;

  auto ToLower(const StringView text) -> String {
    String lower(text);

    for (char& chr : lower)
      if (chr >= 'A' && chr <= 'Z')
        chr = static_cast<char>(chr - 'A' + 'a');

    return lower;
  }

  auto Trim(StringView text) -> StringView {
    while (!text.empty() && (text.front() == ' ' || text.front() == '\t'))
      text.remove_prefix(1);

    while (!text.empty() && (text.back() == ' ' || text.back() == '\t'))
      text.remove_suffix(1);

    return text;
  }

  auto PercentEncode(const StringView text) -> String {
    constexpr StringView Hex = "0123456789ABCDEF";

    String out;
    out.reserve(text.size());

    for (const char chr : text) {
      const auto byte = static_cast<unsigned char>(chr);

      if ((chr >= 'A' && chr <= 'Z') || (chr >= 'a' && chr <= 'z') || (chr >= '0' && chr <= '9') || chr == '-' || chr == '_' || chr == '.' || chr == '~')
        out += chr;
      else if (chr == ' ')
        out += '+';
      else {
        out += '%';
        out += Hex[byte >> 4];
        out += Hex[byte & 0x0F];
      }
    }

    return out;
  }

  template <typename T>
  auto ParseNumber(const StringView text, const int base = 10) -> Option<T> {
    T value {};

    const auto [end, errc] = std::from_chars(text.data(), text.data() + text.size(), value, base);

    if (errc != std::errc() || end != text.data() + text.size())
      return None;

    return value;
  }

  class Deadline {
   public:
    explicit Deadline(const Option<Millis> timeout) {
      if (timeout)
        m_until = Clock::now() + *timeout;
    }

    /**
     * @return None when there is no deadline; Timeout once it has passed.
     */
    [[nodiscard]] auto remaining() const -> Result<Option<Millis>> {
      if (!m_until)
        return None;

      const Millis left = std::chrono::duration_cast<Millis>(*m_until - Clock::now());

      if (left <= Millis(0))
        ERR(Timeout, "HTTP exchange did not finish before its deadline");

      return Some(left);
    }

   private:
    Option<Clock::time_point> m_until;
  };

  /**
   * @brief Buffered reader over the response side of a connection.
   */
  class Connection {
   public:
    Connection(Socket socket, const Deadline& deadline) : m_socket(std::move(socket)), m_deadline(&deadline) {}

    auto readLine() -> Result<String> {
      while (true) {
        if (const usize end = m_buffer.find("\r\n", m_pos); end != String::npos) {
          String line = m_buffer.substr(m_pos, end - m_pos);
          m_pos       = end + 2;
          return line;
        }

        if (m_buffer.size() - m_pos > MaxHeadBytes)
          ERR(PlatformError, "HTTP header line is too long");

        if (!TRY(fill()))
          ERR(PlatformError, "Connection closed in the middle of the response head");
      }
    }

    /**
     * @brief Up to `max` buffered or newly received bytes; empty once the peer has closed.
     */
    auto take(const usize max) -> Result<StringView> {
      if (m_pos == m_buffer.size() && !TRY(fill()))
        return StringView {};

      const usize      count = std::min(max, m_buffer.size() - m_pos);
      const StringView view  = StringView(m_buffer).substr(m_pos, count);

      m_pos += count;
      return view;
    }

    auto readExact(u64 count, const BodySink& sink) -> Result<> {
      while (count > 0) {
        const StringView piece = TRY(take(static_cast<usize>(std::min<u64>(count, ChunkSize))));

        if (piece.empty())
          ERR(PlatformError, "Connection closed before the response body was complete");

        TRY_VOID(sink(piece));
        count -= piece.size();
      }

      return {};
    }

   private:
    auto fill() -> Result<bool> {
      if (m_pos == m_buffer.size()) {
        m_buffer.clear();
        m_pos = 0;
      }

      Array<u8, ChunkSize> chunk {};

      const usize got = TRY(m_socket.receive(chunk, TRY(m_deadline->remaining())));

      m_buffer.append(chunk.begin(), chunk.begin() + static_cast<isize>(got));
      return got > 0;
    }

    Socket          m_socket;
    const Deadline* m_deadline;
    String          m_buffer;
    usize           m_pos = 0;
  };

  /**
   * @brief Request body: `leading`, then the contents of `file` (if any), then `trailing`.
   */
  struct Payload {
    String         leading;
    Option<String> file;
    u64            fileSize = 0;
    String         trailing;

    [[nodiscard]] auto size() const -> u64 {
      return leading.size() + fileSize + trailing.size();
    }
  };

  auto HostHeader(const Url& url) -> String {
    const String host = url.host.contains(':') ? std::format("[{}]", url.host) : url.host;

    return url.port == 80 ? host : std::format("{}:{}", host, url.port);
  }

  auto HasHeader(const Map<String, String>& headers, const StringView name) -> bool {
    for (const auto& [key, value] : headers)
      if (ToLower(key) == name)
        return true;

    return false;
  }

  auto IsRedirect(const u16 status) -> bool {
    return status == 301 || status == 302 || status == 303 || status == 307 || status == 308;
  }

  auto SendPayload(const conduit::core::Context& ctx, Socket& socket, const Payload& payload) -> Result<> {
    TRY_VOID(socket.sendAll(payload.leading));

    if (payload.file) {
      FileSystem fs(ctx);
      File       input = TRY(fs.open(*payload.file, OpenMode::Read));

      Bytes buffer(ChunkSize);
      u64   streamed = 0;

      while (true) {
        const usize count = TRY(input.read(buffer));

        if (count == 0)
          break;

        TRY_VOID(socket.sendAll(Span<const u8>(buffer.data(), count)));
        streamed += count;
      }

      TRY_VOID(input.close());

      if (streamed != payload.fileSize)
        ERR_FMT(ResourceBusy, "'{}' changed size while it was being uploaded", *payload.file);
    }

    return socket.sendAll(payload.trailing);
  }

  auto ReadHead(Connection& connection) -> Result<Response> {
    const String statusLine = TRY(connection.readLine());

    // HTTP/1.x SSS Reason
    if (!statusLine.starts_with("HTTP/1.") || statusLine.size() < 12 || statusLine[8] != ' ')
      ERR_FMT(PlatformError, "Malformed HTTP status line '{}'", statusLine);

    const Option<u16> status = ParseNumber<u16>(StringView(statusLine).substr(9, 3));

    if (!status || *status < 100 || *status > 599)
      ERR_FMT(PlatformError, "Malformed HTTP status line '{}'", statusLine);

    Response response;
    response.status = *status;
    response.reason = String(Trim(StringView(statusLine).substr(12)));

    while (true) {
      const String line = TRY(connection.readLine());

      if (line.empty())
        break;

      const usize colon = line.find(':');

      if (colon == String::npos || colon == 0)
        ERR_FMT(PlatformError, "Malformed HTTP header '{}'", line);

      const String     name  = ToLower(Trim(StringView(line).substr(0, colon)));
      const StringView value = Trim(StringView(line).substr(colon + 1));

      if (auto [iter, inserted] = response.headers.try_emplace(name, value); !inserted) {
        iter->second += ", ";
        iter->second += value;
      }
    }

    return response;
  }

  auto ReadChunked(Connection& connection, const BodySink& sink) -> Result<u64> {
    u64 total = 0;

    while (true) {
      const String     line    = TRY(connection.readLine());
      const StringView sizeHex = Trim(StringView(line).substr(0, line.find(';')));
      const Option<u64> size   = ParseNumber<u64>(sizeHex, 16);

      if (!size)
        ERR_FMT(PlatformError, "Malformed chunk size '{}'", line);

      if (*size == 0)
        break;

      TRY_VOID(connection.readExact(*size, sink));
      total += *size;

      if (!TRY(connection.readLine()).empty())
        ERR(PlatformError, "Chunk is not terminated by CRLF");
    }

    // Trailer fields are read and dropped.
    while (!TRY(connection.readLine()).empty()) {}

    return total;
  }

  auto ReadBody(Connection& connection, const Response& head, const BodySink& sink) -> Result<u64> {
    if (head.status < 200 || head.status == 204 || head.status == 304)
      return 0;

    if (const auto encoding = head.headers.find("transfer-encoding"); encoding != head.headers.end() && ToLower(encoding->second).contains("chunked"))
      return ReadChunked(connection, sink);

    if (const auto length = head.headers.find("content-length"); length != head.headers.end()) {
      const Option<u64> size = ParseNumber<u64>(length->second);

      if (!size)
        ERR_FMT(PlatformError, "Malformed Content-Length '{}'", length->second);

      TRY_VOID(connection.readExact(*size, sink));
      return *size;
    }

    u64 total = 0;

    while (true) {
      const StringView piece = TRY(connection.take(ChunkSize));

      if (piece.empty())
        return total;

      TRY_VOID(sink(piece));
      total += piece.size();
    }
  }

  /**
   * @brief Connects, sends one request and reads the response head.
   */
  auto Open(
    const conduit::core::Context& ctx,
    const Method                  method,
    const Url&                    url,
    const Map<String, String>&    headers,
    const Payload&                payload,
    const Deadline&               deadline
  ) -> Result<Pair<Connection, Response>> {
    Network network(ctx);

    Socket socket = TRY(network.connect(Address { .host = url.host, .port = url.port }, Protocol::Tcp, TRY(deadline.remaining())));

    if (const Option<Millis> left = TRY(deadline.remaining()))
      TRY_VOID(socket.setOption("timeout", *left));

    String head = std::format("{} {} HTTP/1.1\r\n", method == Method::Get ? "GET" : "POST", url.target);

    if (!HasHeader(headers, "host"))
      head += std::format("Host: {}\r\n", HostHeader(url));

    if (!HasHeader(headers, "user-agent"))
      head += std::format("User-Agent: {}\r\n", UserAgent);

    if (!HasHeader(headers, "accept"))
      head += "Accept: */*\r\n";

    for (const auto& [name, value] : headers) {
      const String lower = ToLower(name);

      if (lower == "connection" || lower == "content-length")
        continue;

      if (name.find_first_of("\r\n:") != String::npos || value.find_first_of("\r\n") != String::npos)
        ERR_FMT(InvalidArgument, "Header '{}' contains a line break or a misplaced ':'", name);

      head += std::format("{}: {}\r\n", name, value);
    }

    if (method == Method::Post || payload.size() > 0)
      head += std::format("Content-Length: {}\r\n", payload.size());

    head += "Connection: close\r\n\r\n";

    debug_log("HTTP {} http://{}{}", method == Method::Get ? "GET" : "POST", HostHeader(url), url.target);

    TRY_VOID(socket.sendAll(head));
    TRY_VOID(SendPayload(ctx, socket, payload));

    Connection connection(std::move(socket), deadline);
    Response   response = TRY(ReadHead(connection));

    return Pair<Connection, Response>(std::move(connection), std::move(response));
  }

  /**
   * @brief Resolves a Location header against the URL that produced it.
   */
  auto Follow(const Url& from, const StringView location) -> Result<Url> {
    if (location.contains("://"))
      return Url::parse(location);

    Url next = from;

    if (location.starts_with('/'))
      next.target = String(location);
    else {
      const StringView path = StringView(from.target).substr(0, from.target.find('?'));
      next.target           = std::format("{}{}", path.substr(0, path.rfind('/') + 1), location);
    }

    return next;
  }

  auto WithQuery(Url url, const Map<String, String>& params) -> Url {
    if (!params.empty())
      url.target += (url.target.contains('?') ? "&" : "?") + conduit::network::http::EncodeForm(params);

    return url;
  }

  /**
   * @brief GETs `url`, following redirects; `accept` sees the final head and returns where its body goes.
   */
  auto Get(
    const conduit::core::Context& ctx,
    Url                           url,
    const Map<String, String>&    headers,
    const Deadline&               deadline,
    const std::function<Result<BodySink>(const Response&)>& accept
  ) -> Result<Response> {
    for (u32 hop = 0;; ++hop) {
      auto [connection, response] = TRY(Open(ctx, Method::Get, url, headers, {}, deadline));

      if (IsRedirect(response.status) && hop < MaxRedirects) {
        if (const Option<String> location = response.header("location")) {
          url = TRY(Follow(url, *location));
          debug_log("Following {} redirect to {}", response.status, *location);
          continue;
        }
      }

      const BodySink sink = TRY(accept(response));

      TRY_VOID(ReadBody(connection, response, sink));
      return response;
    }
  }
} // namespace

namespace conduit::network::http {
  auto ParseMethod(const StringView name) -> Result<Method> {
    const String lower = ToLower(name);

    if (lower == "get")
      return Method::Get;

    if (lower == "post")
      return Method::Post;

    ERR_FMT(InvalidArgument, "Unsupported HTTP method '{}'", name);
  }

  auto Url::parse(const StringView text) -> Result<Url> {
    const usize schemeEnd = text.find("://");

    if (schemeEnd == StringView::npos)
      ERR_FMT(InvalidArgument, "URL '{}' has no scheme", text);

    const String scheme = ToLower(text.substr(0, schemeEnd));

    if (scheme == "https")
      ERR_FMT(Unsupported, "'{}' needs TLS, which is not available", text);

    if (scheme != "http")
      ERR_FMT(Unsupported, "URL scheme '{}' is not supported", scheme);

    StringView rest = text.substr(schemeEnd + 3);

    if (const usize fragment = rest.find('#'); fragment != StringView::npos)
      rest = rest.substr(0, fragment);

    const usize      authorityEnd = rest.find_first_of("/?");
    const StringView authority    = rest.substr(0, authorityEnd);

    Url url;

    if (authorityEnd != StringView::npos)
      url.target = rest[authorityEnd] == '?' ? std::format("/{}", rest.substr(authorityEnd)) : String(rest.substr(authorityEnd));

    if (authority.contains('@'))
      ERR_FMT(InvalidArgument, "URL '{}' carries credentials, which are not supported", text);

    StringView portText;

    if (authority.starts_with('[')) {
      const usize close = authority.find(']');

      if (close == StringView::npos)
        ERR_FMT(InvalidArgument, "URL '{}' has an unterminated IPv6 literal", text);

      url.host = String(authority.substr(1, close - 1));

      const StringView after = authority.substr(close + 1);

      if (!after.empty() && !after.starts_with(':'))
        ERR_FMT(InvalidArgument, "URL '{}' has trailing characters after the host", text);

      portText = after.empty() ? StringView {} : after.substr(1);

      if (!after.empty() && portText.empty())
        ERR_FMT(InvalidArgument, "URL '{}' has an empty port", text);
    } else if (const usize colon = authority.rfind(':'); colon != StringView::npos) {
      url.host = String(authority.substr(0, colon));
      portText = authority.substr(colon + 1);

      if (portText.empty())
        ERR_FMT(InvalidArgument, "URL '{}' has an empty port", text);
    } else
      url.host = String(authority);

    if (url.host.empty())
      ERR_FMT(InvalidArgument, "URL '{}' has no host", text);

    if (!portText.empty()) {
      const Option<u16> port = ParseNumber<u16>(portText);

      if (!port || *port == 0)
        ERR_FMT(InvalidArgument, "URL '{}' has an invalid port", text);

      url.port = *port;
    }

    return url;
  }

  auto EncodeForm(const Map<String, String>& fields) -> String {
    String out;

    for (const auto& [key, value] : fields) {
      if (!out.empty())
        out += '&';

      out += PercentEncode(key);
      out += '=';
      out += PercentEncode(value);
    }

    return out;
  }

  auto Response::header(const StringView name) const -> Option<String> {
    if (const auto iter = headers.find(ToLower(name)); iter != headers.end())
      return iter->second;

    return None;
  }

  auto StatusErrorKind(const u16 status) -> utils::error::ErrorKind {
    switch (status) {
      case 400:
      case 413:
      case 414:
      case 422: return InvalidArgument;
      case 401:
      case 403:
      case 407: return PermissionDenied;
      case 404:
      case 410: return NotFound;
      case 405:
      case 501:
      case 505: return Unsupported;
      case 408:
      case 504: return Timeout;
      case 409:
      case 423:
      case 429:
      case 503: return ResourceBusy;
      default:  return PlatformError;
    }
  }

  Client::Client(const core::Context& ctx) : m_ctx(ctx) {}

  auto Client::fetch(const Request& request) const -> Result<Response> {
    const Url      url = TRY(Url::parse(request.url));
    const Deadline deadline(request.timeout);

    if (request.method == Method::Get) {
      if (!request.body.empty())
        ERR(InvalidArgument, "GET requests carry no body; pass query fields in params");

      String body;

      Response response = TRY(Get(m_ctx, WithQuery(url, request.params), request.headers, deadline, [&body](const Response&) -> Result<BodySink> {
        return BodySink([&body](const StringView piece) -> Result<> {
          body += piece;
          return {};
        });
      }));

      response.body = std::move(body);
      return response;
    }

    Map<String, String> headers = request.headers;
    Payload             payload;

    if (request.body.empty() && !request.params.empty()) {
      payload.leading = EncodeForm(request.params);

      if (!HasHeader(headers, "content-type"))
        headers.emplace("Content-Type", "application/x-www-form-urlencoded");
    } else
      payload.leading = request.body;

    auto [connection, response] = TRY(Open(m_ctx, Method::Post, url, headers, payload, deadline));

    TRY_VOID(ReadBody(connection, response, [&response](const StringView piece) -> Result<> {
      response.body += piece;
      return {};
    }));

    return response;
  }

  auto Client::download(const StringView url, const StringView destination, const Map<String, String>& params, const Option<Millis> timeout) const
    -> Result<u64> {
    const Url      parsed = TRY(Url::parse(url));
    const Deadline deadline(timeout);

    FileSystem   fs(m_ctx);
    Option<File> output;
    u64          written = 0;

    Result<Response> response = Get(m_ctx, WithQuery(parsed, params), {}, deadline, [&](const Response& head) -> Result<BodySink> {
      if (!head.ok())
        ERR_FMT(StatusErrorKind(head.status), "GET {} returned {} {}", url, head.status, head.reason);

      output = TRY(fs.open(destination, OpenMode::Write | OpenMode::Create | OpenMode::Truncate));

      return BodySink([&](const StringView piece) -> Result<> {
        TRY_VOID(output->writeAll(piece));
        written += piece.size();
        return {};
      });
    });

    if (!response) {
      if (output) {
        if (Result<> closed = output->close(); !closed)
          debug_log("Closing partial download '{}' failed: {}", destination, closed.error().message);

        if (Result<> removed = fs.remove(destination); !removed)
          warn_log("Could not remove partial download '{}': {}", destination, removed.error().message);
      }

      return Err(response.error());
    }

    TRY_VOID(output->close());

    debug_log("Downloaded {} bytes from {} into '{}'", written, url, destination);
    return written;
  }

  auto Client::upload(const StringView url, const StringView file, const Map<String, String>& fields, const Option<Millis> timeout) const
    -> Result<Response> {
    const Url      parsed = TRY(Url::parse(url));
    const Deadline deadline(timeout);

    FileSystem           fs(m_ctx);
    const files::FileStat info = TRY(fs.stat(file));

    if (info.type == files::EntryType::Directory)
      ERR_FMT(InvalidArgument, "Cannot upload directory '{}'", file);

    const String boundary = std::format("----conduit-{:016x}", static_cast<u64>(Clock::now().time_since_epoch().count()));

    Payload payload { .leading = {}, .file = String(file), .fileSize = info.size, .trailing = std::format("\r\n--{}--\r\n", boundary) };

    for (const auto& [name, value] : fields)
      payload.leading += std::format("--{}\r\nContent-Disposition: form-data; name=\"{}\"\r\n\r\n{}\r\n", boundary, name, value);

    payload.leading += std::format(
      "--{}\r\nContent-Disposition: form-data; name=\"file\"; filename=\"{}\"\r\nContent-Type: application/octet-stream\r\n\r\n",
      boundary,
      files::path::FileName(file)
    );

    const Map<String, String> headers { { "Content-Type", std::format("multipart/form-data; boundary={}", boundary) } };

    auto [connection, response] = TRY(Open(m_ctx, Method::Post, parsed, headers, payload, deadline));

    TRY_VOID(ReadBody(connection, response, [&response](const StringView piece) -> Result<> {
      response.body += piece;
      return {};
    }));

    return response;
  }
} // namespace conduit::network::http
