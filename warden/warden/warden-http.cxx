#include <warden/warden-http.hxx>

#include <sstream>
#include <system_error>

#include <warden/warden-error.hxx>

using namespace std;

namespace warden
{
  string
  format_http_error (const http_response& r)
  {
    ostringstream o;
    o << "HTTP " << r.status;

    if (!r.reason.empty ())
      o << ' ' << r.reason;

    // Cap the body length to avoid flooding the diagnostics with things like
    // full 404 HTML pages.
    //
    if (!r.body.empty ())
    {
      const size_t m (200);

      if (r.body.size () <= m)
        o << ": " << r.body;
      else
        o << ": " << r.body.substr (0, m) << "...";
    }

    return o.str ();
  }

  http_coordinator::
  http_coordinator (asio::io_context& i)
    : client_ (make_unique<client_type> (i))
  {
  }

  http_coordinator::
  http_coordinator (asio::io_context& i, const http_client_traits& t)
    : client_ (make_unique<client_type> (i, t))
  {
  }

  asio::awaitable<string> http_coordinator::
  get (const string& u, const http_fields& hs)
  {
    response_type r (co_await client_->get (u, hs));

    if (!r.is_success ())
      throw network_error ("GET " + u + ": " + format_http_error (r));

    co_return move (r.body);
  }

  asio::awaitable<uint64_t> http_coordinator::
  download_file (const string& u, const fs::path& t, progress_callback cb)
  {
    if (t.has_parent_path ())
    {
      error_code e;
      fs::create_directories (t.parent_path (), e);

      if (e)
        throw io_error (describe ("unable to create " +
                                  t.parent_path ().string (), e));
    }

    co_return co_await client_->download (u, t.string (), move (cb));
  }

  asio::awaitable<bool> http_coordinator::
  check_url (const string& u)
  {
    // Quick reachability test. Any failure here (refused connection,
    // timeout, garbage reply) simply means "not there".
    //
    try
    {
      response_type r (co_await client_->get (u));
      co_return r.is_success ();
    }
    catch (const exception&)
    {
      co_return false;
    }
  }
}
