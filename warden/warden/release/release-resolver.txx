#include <warden/warden-error.hxx>

namespace warden
{
  template <typename S>
  asio::awaitable<std::vector<release>> basic_release_resolver<S>::
  list_releases (const release_repository& repo)
  {
    std::vector<release> rs (co_await source_.list (repo));

    std::vector<release> r;
    r.reserve (rs.size ());

    for (release& x: rs)
    {
      if (!repo.excluded (x.version))
        r.push_back (std::move (x));
    }

    co_return r;
  }

  template <typename S>
  asio::awaitable<release> basic_release_resolver<S>::
  latest (const release_repository& repo)
  {
    std::vector<release> rs (co_await list_releases (repo));

    if (rs.empty ())
      throw not_found ("no releases in " + repo.slug ());

    co_return std::move (rs.front ());
  }

  template <typename S>
  asio::awaitable<release> basic_release_resolver<S>::
  find_by_tag (const release_repository& repo, const std::string& tag)
  {
    std::string v (version_from_tag (tag));
    std::vector<release> rs (co_await list_releases (repo));

    for (release& x: rs)
    {
      if (x.version == v)
        co_return std::move (x);
    }

    throw not_found ("no release " + tag + " in " + repo.slug ());
  }
}
