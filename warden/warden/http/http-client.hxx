#pragma once

#include <string>
#include <cstdint>
#include <functional>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>
#include <boost/beast/ssl.hpp>

#include <warden/http/http-types.hxx>

namespace warden
{
  namespace asio  = boost::asio;
  namespace beast = boost::beast;
  namespace ssl   = boost::asio::ssl;

  // HTTP client options/configuration traits.
  //
  struct http_client_traits
  {
    // Connection timeout in milliseconds.
    //
    std::uint32_t connect_timeout = 30000;

    // Request timeout in milliseconds. For downloads this is the maximum
    // time between two chunks rather than for the whole transfer.
    //
    std::uint32_t request_timeout = 60000;

    // Maximum number of redirects to follow.
    //
    std::uint8_t max_redirects = 10;

    // Largest body we are prepared to buffer in memory (downloads are
    // streamed and not subject to this limit).
    //
    std::uint64_t body_limit = 16 * 1024 * 1024;

    // Whether to verify SSL certificates.
    //
    bool verify_ssl = true;

    // SSL certificate file path (empty = use system defaults).
    //
    std::string ssl_cert_file;

    std::string user_agent = "warden";
  };

  // HTTP client.
  //
  // Async GET and streaming downloads over plain TCP or TLS using
  // Boost.Beast and coroutines. Redirects are followed transparently.
  //
  // Transport failures (resolve, connect, TLS, timeouts) are reported as
  // network_error. HTTP error statuses are returned as is from get() and
  // thrown (as network_error) from download().
  //
  template <typename T = http_client_traits>
  class basic_http_client
  {
  public:
    using traits_type = T;

    // Progress callback: (bytes_transferred, total_bytes). The total may be
    // 0 if unknown.
    //
    using progress_callback =
      std::function<void (std::uint64_t, std::uint64_t)>;

    explicit
    basic_http_client (asio::io_context& ioc)
      : basic_http_client (ioc, traits_type ()) {}

    basic_http_client (asio::io_context& ioc, traits_type traits)
      : ioc_ (ioc),
        traits_ (std::move (traits)),
        ssl_ctx_ (ssl::context::tlsv12_client)
    {
      configure_ssl ();
    }

    basic_http_client (const basic_http_client&) = delete;
    basic_http_client& operator= (const basic_http_client&) = delete;

    asio::awaitable<http_response>
    request (http_method method,
             const std::string& url,
             const http_fields& headers = http_fields ());

    asio::awaitable<http_response>
    get (const std::string& url, const http_fields& headers = http_fields ())
    {
      return request (http_method::get, url, headers);
    }

    // Stream the response body into a file, truncating it first. The file
    // is only opened once the server has answered with 200.
    //
    // Returns the number of bytes written.
    //
    asio::awaitable<std::uint64_t>
    download (const std::string& url,
              const std::string& file,
              progress_callback progress = nullptr);

    const traits_type&
    traits () const noexcept
    {
      return traits_;
    }

    asio::io_context&
    io_context () noexcept
    {
      return ioc_;
    }

  private:
    void
    configure_ssl ();

    asio::awaitable<http_response>
    request_impl (http_method method,
                  std::string url,
                  const http_fields& headers,
                  std::uint8_t redirect_count);

    asio::awaitable<std::uint64_t>
    download_impl (std::string url,
                   const std::string& file,
                   progress_callback progress,
                   std::uint8_t redirect_count);

  private:
    asio::io_context& ioc_;
    traits_type traits_;
    ssl::context ssl_ctx_;
  };

  using http_client = basic_http_client<>;
}

#include <warden/http/http-client.txx>
