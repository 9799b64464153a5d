#pragma once

#include <string>
#include <vector>

#include <boost/asio.hpp>

#include <warden/github/github-api.hxx>
#include <warden/github/github-types.hxx>
#include <warden/release/release-types.hxx>

namespace warden
{
  namespace asio = boost::asio;

  // Translate a GitHub release into our release model: the version is the
  // tag without the 'v' prefix, the artifact is the repository's, and each
  // asset gets its platform label parsed from the name.
  //
  release
  to_release (const github_release&, const release_repository&);

  // Release source backed by the GitHub releases API. Drafts are skipped.
  //
  template <typename A = github_api<>>
  class basic_github_release_source
  {
  public:
    using api_type = A;

    explicit
    basic_github_release_source (asio::io_context& ioc)
      : api_ (ioc) {}

    // All the releases, newest first.
    //
    asio::awaitable<std::vector<release>>
    list (const release_repository& repo);

    api_type&
    api () noexcept
    {
      return api_;
    }

  private:
    api_type api_;
  };

  using github_release_source = basic_github_release_source<>;
}

#include <warden/release/release-source.txx>
