#include <limits>
#include <fstream>
#include <chrono>

#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/redirect_error.hpp>

#include <openssl/ssl.h>
#include <openssl/err.h>

#include <warden/warden-error.hxx>

namespace warden
{
  namespace http = beast::http;
  using tcp = asio::ip::tcp;

  // Resolve a Location header against the URL that produced it. We only
  // expect absolute URLs or absolute paths here.
  //
  inline std::string
  resolve_location (const std::string& base, const std::string& loc)
  {
    if (loc.empty () || loc.front () != '/')
      return loc;

    url_parts p (parse_url (base));
    return p.scheme + "://" + p.host + ':' + p.port + loc;
  }

  // Set the SNI hostname.
  //
  // Beast doesn't wrap this (it's a lower-level TLS feature), so we drop down
  // to the OpenSSL C API. Many servers (GitHub's CDN included) reject the
  // handshake without it.
  //
  template <typename S>
  inline void
  set_sni_hostname (S& s, const std::string& host)
  {
    if (!SSL_set_tlsext_host_name (s.native_handle (), host.c_str ()))
    {
      beast::error_code ec (static_cast<int> (::ERR_get_error ()),
                            asio::error::get_ssl_category ());
      throw beast::system_error (ec, "unable to set SNI hostname");
    }
  }

  template <typename T>
  void basic_http_client<T>::
  configure_ssl ()
  {
    if (!traits_.ssl_cert_file.empty ())
      ssl_ctx_.load_verify_file (traits_.ssl_cert_file);
    else
      ssl_ctx_.set_default_verify_paths ();

    ssl_ctx_.set_verify_mode (traits_.verify_ssl
                              ? ssl::verify_peer
                              : ssl::verify_none);

    ssl_ctx_.set_options (ssl::context::default_workarounds |
                          ssl::context::no_sslv2 |
                          ssl::context::no_sslv3 |
                          ssl::context::single_dh_use);
  }

  template <typename T>
  asio::awaitable<http_response> basic_http_client<T>::
  request (http_method m, const std::string& url, const http_fields& hs)
  {
    // Translate the transport-level failures into our taxonomy. Note that
    // we cannot co_await in a handler, but we don't need to.
    //
    try
    {
      co_return co_await request_impl (m, url, hs, 0);
    }
    catch (const boost::system::system_error& e)
    {
      throw network_error (to_string (m) + ' ' + url + ": " + e.what ());
    }
  }

  template <typename T>
  asio::awaitable<http_response> basic_http_client<T>::
  request_impl (http_method m,
                std::string url,
                const http_fields& hs,
                std::uint8_t rc)
  {
    using namespace std::chrono;

    if (rc > traits_.max_redirects)
      throw network_error ("maximum redirects exceeded for " + url);

    url_parts parts (parse_url (url));

    tcp::resolver rslv (ioc_);
    auto addrs (co_await rslv.async_resolve (parts.host,
                                             parts.port,
                                             asio::use_awaitable));

    // Common exchange logic for both SSL and TCP streams.
    //
    auto exchange = [&] (auto& s) -> asio::awaitable<http_response>
    {
      auto& layer (beast::get_lowest_layer (s));

      http::request<http::empty_body> br;
      br.method (http::verb::get);
      br.target (parts.target);
      br.version (11);
      br.set (http::field::host, parts.host);
      br.set (http::field::user_agent, traits_.user_agent);

      for (const auto& [k, v]: hs)
        br.set (k, v);

      layer.expires_after (milliseconds (traits_.request_timeout));
      co_await http::async_write (s, br, asio::use_awaitable);

      beast::flat_buffer b;
      http::response_parser<http::string_body> p;
      p.body_limit (traits_.body_limit);

      co_await http::async_read (s, b, p, asio::use_awaitable);

      const auto& res (p.get ());

      http_response r;
      r.status = static_cast<std::uint16_t> (res.result_int ());
      r.reason = std::string (res.reason ());

      for (const auto& f: res)
        r.headers[std::string (f.name_string ())] = std::string (f.value ());

      r.body = res.body ();
      co_return r;
    };

    http_response r;

    if (parts.scheme == "https")
    {
      beast::ssl_stream<beast::tcp_stream> s (ioc_, ssl_ctx_);
      set_sni_hostname (s, parts.host);

      auto& layer (beast::get_lowest_layer (s));
      layer.expires_after (milliseconds (traits_.connect_timeout));

      co_await layer.async_connect (addrs, asio::use_awaitable);
      co_await s.async_handshake (ssl::stream_base::client,
                                  asio::use_awaitable);

      r = co_await exchange (s);

      // Don't wait for the TLS shutdown: many servers never send
      // close_notify, and waiting for it blocks until the timeout.
      //
      beast::error_code ec;
      layer.socket ().shutdown (tcp::socket::shutdown_both, ec);
    }
    else
    {
      beast::tcp_stream s (ioc_);
      s.expires_after (milliseconds (traits_.connect_timeout));
      co_await s.async_connect (addrs, asio::use_awaitable);

      r = co_await exchange (s);

      beast::error_code ec;
      s.socket ().shutdown (tcp::socket::shutdown_both, ec);
    }

    if (r.is_redirection ())
    {
      if (auto loc = r.location ())
        co_return co_await request_impl (m,
                                         resolve_location (url, *loc),
                                         hs,
                                         rc + 1);
    }

    co_return r;
  }

  template <typename T>
  asio::awaitable<std::uint64_t> basic_http_client<T>::
  download (const std::string& url,
            const std::string& file,
            progress_callback progress)
  {
    try
    {
      co_return co_await download_impl (url, file, std::move (progress), 0);
    }
    catch (const boost::system::system_error& e)
    {
      throw network_error ("download " + url + ": " + e.what ());
    }
  }

  // Unlike request_impl () which buffers the whole response in memory, here
  // we stream the body to the file chunk by chunk.
  //
  template <typename T>
  asio::awaitable<std::uint64_t> basic_http_client<T>::
  download_impl (std::string url,
                 const std::string& file,
                 progress_callback progress,
                 std::uint8_t rc)
  {
    using namespace std::chrono;
    using parser_type = http::response_parser<http::buffer_body>;

    if (rc > traits_.max_redirects)
      throw network_error ("maximum redirects exceeded for " + url);

    url_parts parts (parse_url (url));

    tcp::resolver rslv (ioc_);
    auto addrs (co_await rslv.async_resolve (parts.host,
                                             parts.port,
                                             asio::use_awaitable));

    // Either the redirect target or the number of bytes written.
    //
    struct outcome
    {
      std::string location;
      std::uint64_t bytes = 0;
    };

    auto transfer = [&] (auto& s) -> asio::awaitable<outcome>
    {
      auto& layer (beast::get_lowest_layer (s));

      http::request<http::empty_body> br;
      br.method (http::verb::get);
      br.target (parts.target);
      br.version (11);
      br.set (http::field::host, parts.host);
      br.set (http::field::user_agent, traits_.user_agent);
      br.set (http::field::accept, "application/octet-stream");

      layer.expires_after (milliseconds (traits_.request_timeout));
      co_await http::async_write (s, br, asio::use_awaitable);

      beast::flat_buffer b;
      parser_type p;
      p.body_limit (std::numeric_limits<std::uint64_t>::max ());

      co_await http::async_read_header (s, b, p, asio::use_awaitable);

      unsigned status (p.get ().result_int ());

      if (status >= 300 && status < 400)
      {
        auto loc (p.get ()[http::field::location]);
        if (!loc.empty ())
          co_return outcome {std::string (loc), 0};
      }

      if (status != 200)
        throw network_error ("download " + url + " failed with status " +
                             std::to_string (status));

      std::ofstream ofs (file,
                         std::ios::binary | std::ios::out | std::ios::trunc);
      if (!ofs)
        throw io_error ("unable to open " + file + " for writing");

      std::uint64_t off (0);
      std::uint64_t tot (p.content_length () ? *p.content_length () : 0);

      char dbuf[8192];
      p.get ().body ().data = dbuf;
      p.get ().body ().size = sizeof (dbuf);

      while (!p.is_done ())
      {
        // Reset the timeout to keep the connection alive while data flows.
        //
        layer.expires_after (milliseconds (traits_.request_timeout));

        // Beast signals a full buffer with need_buffer, which is not an
        // error for us.
        //
        beast::error_code ec;
        co_await http::async_read (s, b, p,
                                   asio::redirect_error (asio::use_awaitable,
                                                         ec));

        if (ec && ec != http::error::need_buffer)
          throw beast::system_error (ec);

        std::size_t n (sizeof (dbuf) - p.get ().body ().size);

        if (n > 0)
        {
          ofs.write (dbuf, static_cast<std::streamsize> (n));
          if (!ofs)
            throw io_error ("unable to write " + file);

          off += n;

          if (progress)
            progress (off, tot);
        }

        p.get ().body ().data = dbuf;
        p.get ().body ().size = sizeof (dbuf);
      }

      ofs.close ();
      if (!ofs)
        throw io_error ("unable to write " + file);

      co_return outcome {std::string (), off};
    };

    outcome r;

    if (parts.scheme == "https")
    {
      beast::ssl_stream<beast::tcp_stream> s (ioc_, ssl_ctx_);
      set_sni_hostname (s, parts.host);

      auto& layer (beast::get_lowest_layer (s));
      layer.expires_after (milliseconds (traits_.connect_timeout));

      co_await layer.async_connect (addrs, asio::use_awaitable);
      co_await s.async_handshake (ssl::stream_base::client,
                                  asio::use_awaitable);

      r = co_await transfer (s);

      beast::error_code ec;
      layer.socket ().shutdown (tcp::socket::shutdown_both, ec);
    }
    else
    {
      beast::tcp_stream s (ioc_);
      s.expires_after (milliseconds (traits_.connect_timeout));
      co_await s.async_connect (addrs, asio::use_awaitable);

      r = co_await transfer (s);

      beast::error_code ec;
      s.socket ().shutdown (tcp::socket::shutdown_both, ec);
    }

    if (!r.location.empty ())
      co_return co_await download_impl (resolve_location (url, r.location),
                                        file,
                                        std::move (progress),
                                        rc + 1);

    co_return r.bytes;
  }
}
