/**
 * @file Http.hpp
 * @brief Plain HTTP/1.1 client built on the Network and FileSystem adapters.
 *
 * @details Requests are sent with `Connection: close`, so every call opens one
 * connection per hop. Responses may use Content-Length, chunked transfer
 * encoding or read-until-close bodies. GET requests follow up to five
 * redirects. Only the `http` scheme is available; `https` is Unsupported.
 */

#pragma once

#include "../Core/Context.hpp"
#include "../Utils/Error.hpp"
#include "../Utils/Types.hpp"

namespace conduit::network::http {
  namespace types = ::conduit::utils::types;

  enum class Method : types::u8 {
    Get,
    Post,
  };

  /**
   * @brief Parses a method name case-insensitively.
   * @return InvalidArgument for anything but GET and POST.
   */
  auto ParseMethod(types::StringView name) -> types::Result<Method>;

  struct Url {
    types::String host;
    types::u16    port = 80;
    types::String target = "/"; ///< Path and query, always starting with '/'.

    /**
     * @brief Parses `http://host[:port][/path][?query]`.
     * @return Unsupported for https; InvalidArgument for anything else malformed.
     */
    static auto parse(types::StringView text) -> types::Result<Url>;

    auto operator==(const Url&) const -> bool = default;
  };

  /**
   * @brief `application/x-www-form-urlencoded` encoding of `fields`, in key order.
   */
  auto EncodeForm(const types::Map<types::String, types::String>& fields) -> types::String;

  struct Request {
    Method                                    method = Method::Get;
    types::String                             url;
    types::Map<types::String, types::String>  params;  ///< Query string for GET, form body for POST without `body`.
    types::Map<types::String, types::String>  headers;
    types::String                             body;
    types::Option<types::Millis>              timeout = types::Millis(10'000); ///< Whole-exchange deadline; None waits forever.
  };

  struct Response {
    types::u16                               status = 0;
    types::String                            reason;
    types::Map<types::String, types::String> headers; ///< Names lower-cased.
    types::String                            body;

    [[nodiscard]] auto ok() const -> bool {
      return status >= 200 && status < 300;
    }

    [[nodiscard]] auto header(types::StringView name) const -> types::Option<types::String>;
  };

  /**
   * @brief The error kind a failed status maps to (404 NotFound, 401/403 PermissionDenied, ...).
   */
  auto StatusErrorKind(types::u16 status) -> utils::error::ErrorKind;

  /**
   * @class Client
   * @brief Stateless HTTP client; safe to share between threads.
   */
  class Client {
   public:
    explicit Client(const core::Context& ctx);

    /**
     * @brief Sends one request and returns the response whatever its status.
     */
    auto fetch(const Request& request) const -> types::Result<Response>;

    /**
     * @brief GETs `url` and streams the body into `destination` (created or truncated).
     * @return Bytes written. A non-2xx status fails with StatusErrorKind and leaves no file behind.
     */
    auto download(
      types::StringView                               url,
      types::StringView                               destination,
      const types::Map<types::String, types::String>& params  = {},
      types::Option<types::Millis>                    timeout = types::Millis(30'000)
    ) const -> types::Result<types::u64>;

    /**
     * @brief POSTs `file` as the multipart field "file", together with `fields`.
     */
    auto upload(
      types::StringView                               url,
      types::StringView                               file,
      const types::Map<types::String, types::String>& fields  = {},
      types::Option<types::Millis>                    timeout = types::Millis(30'000)
    ) const -> types::Result<Response>;

   private:
    const core::Context& m_ctx;
  };
} // namespace conduit::network::http
