#include <warden/warden-error.hxx>

namespace warden
{
  // Build the client traits from the API traits so that every request
  // carries the user agent GitHub insists on.
  //
  template <typename T>
  inline http_client_traits
  github_client_traits ()
  {
    http_client_traits r;
    r.user_agent = T::user_agent ();
    r.connect_timeout = 15000;
    r.request_timeout = 30000;
    return r;
  }

  template <typename T>
  github_api<T>::
  github_api (asio::io_context& ioc)
    : http_ (ioc, github_client_traits<T> ())
  {
  }

  template <typename T>
  asio::awaitable<typename github_api<T>::page> github_api<T>::
  fetch (const std::string& url)
  {
    http_fields hs {
      {"Accept", "application/vnd.github+json"},
      {"X-GitHub-Api-Version", traits_type::api_version ()}};

    http_response r (co_await http_.get (url, hs));

    boost::system::error_code ec;
    json::value jv (json::parse (r.body, ec));

    if (!r.is_success ())
    {
      // GitHub explains itself in the "message" field. Use that if the body
      // is what we expect, otherwise fall back to the status line.
      //
      std::string m ("HTTP " + std::to_string (r.status));

      if (!ec && jv.is_object ())
      {
        const auto& o (jv.as_object ());
        if (const json::value* v = o.if_contains ("message"))
        {
          if (v->is_string ())
            m += ": " + std::string (v->as_string ());
        }
      }

      throw network_error (url + ": " + m);
    }

    if (ec)
      throw network_error (url + ": invalid JSON reply: " + ec.message ());

    page p;
    p.body = std::move (jv);

    if (std::optional<std::string> l = r.header ("Link"))
      p.next = traits_type::next_page (*l);

    co_return p;
  }

  template <typename T>
  asio::awaitable<std::vector<typename github_api<T>::release_type>>
  github_api<T>::
  get_releases (const std::string& owner, const std::string& repo)
  {
    std::vector<release_type> r;
    std::string u (
      endpoint_type::repo_releases (owner, repo, traits_type::page_size));

    for (std::size_t i (0);; ++i)
    {
      if (i == traits_type::max_pages)
        throw network_error (u + ": more than " +
                             std::to_string (traits_type::max_pages) +
                             " pages of releases");

      page p (co_await fetch (u));

      for (release_type& x: traits_type::parse_releases (p.body))
        r.push_back (std::move (x));

      if (!p.next)
        break;

      u = std::move (*p.next);
    }

    co_return r;
  }
}
