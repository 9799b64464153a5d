namespace warden
{
  template <typename A>
  asio::awaitable<std::vector<release>> basic_github_release_source<A>::
  list (const release_repository& repo)
  {
    std::vector<github_release> gs (
      co_await api_.get_releases (repo.owner, repo.name));

    std::vector<release> r;
    r.reserve (gs.size ());

    for (const github_release& g: gs)
    {
      if (!g.draft)
        r.push_back (to_release (g, repo));
    }

    co_return r;
  }
}
