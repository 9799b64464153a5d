#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace warden
{
  // GitHub REST API data types.
  //
  // Only the subset of the release entities we actually consume. Unknown
  // fields in the API replies are ignored.
  //

  // GitHub release asset.
  //
  struct github_asset
  {
    std::uint64_t id = 0;
    std::string name;
    std::string content_type;
    std::uint64_t size = 0;
    std::string browser_download_url;

    github_asset () = default;

    github_asset (std::string n, std::string u, std::uint64_t s)
      : name (std::move (n)), size (s), browser_download_url (std::move (u)) {}

    bool
    empty () const {return name.empty ();}
  };

  // GitHub release.
  //
  struct github_release
  {
    using asset_type = github_asset;

    std::uint64_t id = 0;
    std::string tag_name;
    std::string name;
    bool draft = false;
    bool prerelease = false;
    std::vector<asset_type> assets;

    github_release () = default;

    github_release (std::string t, std::string n)
      : tag_name (std::move (t)), name (std::move (n)) {}

    bool
    empty () const {return tag_name.empty ();}
  };
}
