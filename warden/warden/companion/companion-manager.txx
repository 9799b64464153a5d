#include <iostream>

#include <warden/warden-http.hxx>
#include <warden/warden-error.hxx>

namespace warden
{
  template <typename L>
  asio::awaitable<bool> basic_companion_manager<L>::
  is_reachable (const companion_config& c)
  {
    http_client_traits t;
    t.connect_timeout = c.check_timeout;
    t.request_timeout = c.check_timeout;
    t.max_redirects = 0;

    http_coordinator h (ioc_, t);
    co_return co_await h.check_url (c.address ());
  }

  template <typename L>
  asio::awaitable<std::shared_ptr<typename basic_companion_manager<L>::process_type>>
  basic_companion_manager<L>::
  spawn (const companion_config& c)
  {
    fs::path p (launcher_type::find_program (c.program));
    if (p.empty ())
      throw process_error ("unable to find " + c.program + " in PATH");

    launch_request r;
    r.program = p;
    r.arguments = c.arguments;
    r.environment[c.address_variable] = c.address ();
    r.quiet = true;

    std::shared_ptr<process_type> pr (launcher_.spawn (r));

    asio::steady_timer t (ioc_);

    for (std::size_t i (0); i != c.retries; ++i)
    {
      t.expires_after (c.retry_interval);
      co_await t.async_wait (asio::use_awaitable);

      // No point in waiting for a server that already died.
      //
      if (!pr->running ())
        break;

      if (co_await is_reachable (c))
        co_return pr;
    }

    try
    {
      pr->kill ();
    }
    catch (const process_error& e)
    {
      std::cerr << "warning: " << e.what () << "\n";
    }

    throw startup_failed (c.program + " did not become reachable at " +
                          c.address ());
  }

  template <typename L>
  asio::awaitable<typename basic_companion_manager<L>::handle_type>
  basic_companion_manager<L>::
  ensure (const companion_config& c)
  {
    handle_type h;

    if (co_await is_reachable (c))
    {
      h.ownership = companion_ownership::not_owned;
      co_return h;
    }

    h.process = co_await spawn (c);
    h.ownership = companion_ownership::owned;
    co_return h;
  }
}
