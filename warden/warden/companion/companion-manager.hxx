#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include <cstddef>
#include <cstdint>

#include <boost/asio.hpp>

#include <warden/env/env-store.hxx>
#include <warden/process/process-child.hxx>

namespace warden
{
  namespace asio = boost::asio;

  // Local model server the worker talks to (ollama).
  //
  struct companion_config
  {
    std::string host = env_store::default_companion_host;
    std::string port = env_store::default_companion_port;

    std::string program = "ollama";
    std::vector<std::string> arguments {"serve"};

    // Variable through which the server is told where to listen.
    //
    std::string address_variable = "OLLAMA_HOST";

    // After spawning, how many times and how often to check whether the
    // server came up.
    //
    std::size_t retries = 10;
    std::chrono::milliseconds retry_interval {500};

    // Connect and request timeout of each liveness check, in milliseconds.
    //
    std::uint32_t check_timeout = 2000;

    std::string
    address () const {return host + ':' + port;}
  };

  // Companion configuration from the worker configuration.
  //
  companion_config
  make_companion_config (const env_store&);

  enum class companion_ownership
  {
    owned,    // We spawned it and must kill it on shutdown.
    not_owned // Somebody else runs it; leave it alone.
  };

  template <typename P>
  struct basic_companion_handle
  {
    companion_ownership ownership = companion_ownership::not_owned;
    std::shared_ptr<P> process; // Only set if owned.

    bool
    owned () const noexcept
    {
      return ownership == companion_ownership::owned && process != nullptr;
    }
  };

  // The launcher is a template argument so that a fake one can stand in
  // for spawning real processes.
  //
  template <typename L = process_launcher>
  class basic_companion_manager
  {
  public:
    using launcher_type = L;
    using process_type = typename launcher_type::process_type;
    using handle_type = basic_companion_handle<process_type>;

    basic_companion_manager (asio::io_context& ioc, launcher_type& l)
      : ioc_ (ioc), launcher_ (l) {}

    // True if the server answers a GET on its address with 2xx. Any failure,
    // including a timeout, means no.
    //
    asio::awaitable<bool>
    is_reachable (const companion_config&);

    // Start the server and wait for it to become reachable. If it never
    // does, kill it and throw startup_failed. Throws process_error if it
    // cannot be started at all.
    //
    asio::awaitable<std::shared_ptr<process_type>>
    spawn (const companion_config&);

    // Use the running server if there is one, start our own otherwise.
    //
    asio::awaitable<handle_type>
    ensure (const companion_config&);

  private:
    asio::io_context& ioc_;
    launcher_type& launcher_;
  };

  using companion_manager = basic_companion_manager<>;
}

#include <warden/companion/companion-manager.txx>
