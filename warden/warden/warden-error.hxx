#pragma once

#include <string>
#include <stdexcept>
#include <system_error>

namespace warden
{
  // Base of all the errors we throw.
  //
  // The derived types only exist so that callers can tell the failure
  // categories apart (e.g., a missing asset vs a network hiccup). They carry
  // no payload beyond the message.
  //
  class error: public std::runtime_error
  {
  public:
    explicit
    error (const std::string& what)
      : std::runtime_error (what) {}
  };

  // The host os/arch pair has no entry in the platform label table.
  //
  class unsupported_platform: public error
  {
  public:
    explicit
    unsupported_platform (const std::string& what): error (what) {}
  };

  // Empty release list, unmatched tag, or unmatched asset.
  //
  class not_found: public error
  {
  public:
    explicit
    not_found (const std::string& what): error (what) {}
  };

  class network_error: public error
  {
  public:
    explicit
    network_error (const std::string& what): error (what) {}
  };

  // Download, rename, permission, or file read/write failure.
  //
  class io_error: public error
  {
  public:
    explicit
    io_error (const std::string& what): error (what) {}
  };

  // The companion service never became reachable.
  //
  class startup_failed: public error
  {
  public:
    explicit
    startup_failed (const std::string& what): error (what) {}
  };

  // Spawn or kill failure.
  //
  class process_error: public error
  {
  public:
    explicit
    process_error (const std::string& what): error (what) {}
  };

  // Format a system error code as "<what>: <message>".
  //
  std::string
  describe (const std::string& what, const std::error_code&);
}
