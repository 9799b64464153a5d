#pragma once

#include <string>
#include <vector>
#include <utility>

#include <boost/asio.hpp>

#include <warden/release/release-types.hxx>
#include <warden/release/release-source.hxx>

namespace warden
{
  namespace asio = boost::asio;

  // Release discovery on top of a release source.
  //
  // The source is anything with
  //
  //   asio::awaitable<std::vector<release>> list (const release_repository&)
  //
  // returning the releases newest first. Nothing is cached: every call goes
  // back to the source.
  //
  template <typename S = github_release_source>
  class basic_release_resolver
  {
  public:
    using source_type = S;

    template <typename... A>
    explicit
    basic_release_resolver (A&&... a)
      : source_ (std::forward<A> (a)...) {}

    basic_release_resolver (const basic_release_resolver&) = delete;
    basic_release_resolver& operator= (const basic_release_resolver&) = delete;

    // List the releases of the repository minus the excluded versions. An
    // empty list is not an error.
    //
    asio::awaitable<std::vector<release>>
    list_releases (const release_repository& repo);

    // Newest release. Throws not_found if there are none.
    //
    asio::awaitable<release>
    latest (const release_repository& repo);

    // Release whose version is exactly the tag (with a leading 'v'
    // tolerated). Throws not_found if there is no such release.
    //
    asio::awaitable<release>
    find_by_tag (const release_repository& repo, const std::string& tag);

    release_asset
    resolve_asset (const release& r, const host_platform& h) const
    {
      return warden::resolve_asset (r, h);
    }

    source_type&
    source () noexcept
    {
      return source_;
    }

  private:
    source_type source_;
  };

  using release_resolver = basic_release_resolver<>;
}

#include <warden/release/release-resolver.txx>
