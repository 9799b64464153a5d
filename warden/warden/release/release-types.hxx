#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <ostream>
#include <optional>

namespace warden
{
  // Host os/architecture as the compiler sees it (e.g., linux/x86_64).
  //
  struct host_platform
  {
    std::string os;
    std::string arch;
  };

  // The platform we were built for.
  //
  host_platform
  current_host ();

  // Platform label as it appears in the release asset names.
  //
  struct platform_label
  {
    std::string os;        // linux, macOS, windows
    std::string arch;      // amd64, arm64
    std::string extension; // .exe or empty

    bool
    empty () const noexcept {return os.empty ();}
  };

  inline bool
  operator== (const platform_label& x, const platform_label& y) noexcept
  {
    return x.os == y.os && x.arch == y.arch && x.extension == y.extension;
  }

  inline bool
  operator!= (const platform_label& x, const platform_label& y) noexcept
  {
    return !(x == y);
  }

  inline std::ostream&
  operator<< (std::ostream& o, const platform_label& l)
  {
    return o << l.os << '-' << l.arch;
  }

  // Map the host platform through the label table. Return nullopt if either
  // the os or the architecture is not in the table.
  //
  std::optional<platform_label>
  to_platform_label (const host_platform&);

  // Asset name of an artifact for a platform:
  //
  // <artifact>-<os>-<arch><extension>
  //
  std::string
  asset_name (const std::string& artifact, const platform_label&);

  // Recover the platform label from an asset name. Return an empty label if
  // the name doesn't follow the artifact's naming scheme.
  //
  platform_label
  parse_asset_label (const std::string& artifact, const std::string& name);

  struct release_asset
  {
    std::string name;
    platform_label platform;
    std::string download_url;
    std::uint64_t size = 0;
  };

  // Release of one artifact.
  //
  // The version is opaque: we only ever compare it for equality.
  //
  struct release
  {
    std::string name;
    std::string version;
    std::string artifact;
    std::vector<release_asset> assets;

    bool
    empty () const noexcept {return version.empty ();}
  };

  // Upstream repository of an artifact.
  //
  struct release_repository
  {
    std::string owner;
    std::string name;
    std::string artifact;

    // Releases whose version starts with one of these are never offered.
    //
    std::vector<std::string> excluded_versions;

    std::string
    slug () const {return owner + '/' + name;}

    bool
    excluded (const std::string& version) const;
  };

  // The worker (compute node) and the launcher repositories.
  //
  release_repository
  worker_repository ();

  release_repository
  launcher_repository ();

  // Strip a single leading 'v' from a tag (v0.3.1 -> 0.3.1).
  //
  std::string
  version_from_tag (const std::string& tag);

  // Pick the asset of a release for the host platform.
  //
  // Throws unsupported_platform if the host has no label (even if the
  // release has no assets at all) and not_found if the release has no asset
  // for it.
  //
  release_asset
  resolve_asset (const release&, const host_platform&);
}
