#pragma once

#include <string>
#include <memory>
#include <cstdint>
#include <functional>
#include <filesystem>

#include <boost/asio.hpp>

#include <warden/http/http-types.hxx>
#include <warden/http/http-client.hxx>

namespace warden
{
  namespace fs = std::filesystem;
  namespace asio = boost::asio;

  class http_coordinator
  {
  public:
    using client_type = http_client;
    using response_type = http_response;

    // Progress callback for file downloads.
    //
    using progress_callback =
      std::function<void (std::uint64_t bytes_transferred,
                          std::uint64_t total_bytes)>;

    explicit
    http_coordinator (asio::io_context& ioc);

    http_coordinator (asio::io_context& ioc, const http_client_traits& traits);

    http_coordinator (const http_coordinator&) = delete;
    http_coordinator& operator= (const http_coordinator&) = delete;

    // GET request returning the body.
    //
    // Throws network_error on transport failure or a non-2xx status.
    //
    asio::awaitable<std::string>
    get (const std::string& url, const http_fields& headers = http_fields ());

    // Download a file to the specified path.
    //
    // Returns the number of bytes downloaded.
    //
    asio::awaitable<std::uint64_t>
    download_file (const std::string& url,
                   const fs::path& target,
                   progress_callback progress = nullptr);

    // Check if a URL answers a GET with a 2xx status.
    //
    // Any failure (including a timeout) means "not available".
    //
    asio::awaitable<bool>
    check_url (const std::string& url);

    client_type&
    client () noexcept
    {
      return *client_;
    }

  private:
    std::unique_ptr<client_type> client_;
  };

  // Format an HTTP error status as a message, with the start of the body
  // if there is one.
  //
  std::string
  format_http_error (const http_response&);
}
