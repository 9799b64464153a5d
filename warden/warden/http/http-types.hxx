#pragma once

#include <map>
#include <string>
#include <cstdint>
#include <ostream>
#include <optional>

namespace warden
{
  // HTTP method (verb).
  //
  // We only ever read from the network, so this is the subset we need.
  //
  enum class http_method
  {
    get
  };

  std::string
  to_string (http_method);

  inline std::ostream&
  operator<< (std::ostream& o, http_method m)
  {
    return o << to_string (m);
  }

  // Header fields, keyed by name as sent or received.
  //
  using http_fields = std::map<std::string, std::string>;

  // HTTP response.
  //
  struct http_response
  {
    std::uint16_t status = 0;
    std::string   reason;  // Status reason phrase.
    http_fields   headers;
    std::string   body;

    bool
    is_success () const noexcept
    {
      return status >= 200 && status < 300;
    }

    bool
    is_redirection () const noexcept
    {
      return status >= 300 && status < 400;
    }

    bool
    is_error () const noexcept
    {
      return status >= 400;
    }

    // Get a header field. The lookup is case-insensitive as per RFC 7230.
    //
    std::optional<std::string>
    header (const std::string& name) const;

    // Parse the Content-Length header.
    //
    std::optional<std::uint64_t>
    content_length () const;

    std::optional<std::string>
    location () const
    {
      return header ("Location");
    }
  };

  // URL parts.
  //
  struct url_parts
  {
    std::string scheme;
    std::string host;
    std::string port;
    std::string target;
  };

  // Parse a scheme://host:port/path URL into its components. The scheme
  // defaults to http, the port to the scheme's well-known port, and the
  // target to "/".
  //
  // Note that this doesn't handle IPv6 literals or user info.
  //
  url_parts
  parse_url (const std::string& url);
}
