#include <warden/release/release-types.hxx>

#include <warden/warden-error.hxx>

using namespace std;

namespace warden
{
  host_platform
  current_host ()
  {
    host_platform r;

#if defined(_WIN32)
    r.os = "windows";
#elif defined(__APPLE__)
    r.os = "macos";
#elif defined(__linux__)
    r.os = "linux";
#else
    r.os = "unknown";
#endif

#if defined(__x86_64__) || defined(_M_X64)
    r.arch = "x86_64";
#elif defined(__aarch64__) || defined(_M_ARM64)
    r.arch = "aarch64";
#elif defined(__arm__) || defined(_M_ARM)
    r.arch = "arm";
#elif defined(__i386__) || defined(_M_IX86)
    r.arch = "x86";
#else
    r.arch = "unknown";
#endif

    return r;
  }

  optional<platform_label>
  to_platform_label (const host_platform& h)
  {
    platform_label r;

    if      (h.os == "linux")   r.os = "linux";
    else if (h.os == "macos")   r.os = "macOS";
    else if (h.os == "windows") r.os = "windows";
    else
      return nullopt;

    if      (h.arch == "x86_64")                     r.arch = "amd64";
    else if (h.arch == "aarch64" || h.arch == "arm") r.arch = "arm64";
    else
      return nullopt;

    r.extension = h.os == "windows" ? ".exe" : "";
    return r;
  }

  string
  asset_name (const string& a, const platform_label& l)
  {
    return a + '-' + l.os + '-' + l.arch + l.extension;
  }

  platform_label
  parse_asset_label (const string& a, const string& n)
  {
    platform_label r;

    string p (a + '-');
    if (n.size () <= p.size () || n.compare (0, p.size (), p) != 0)
      return r;

    // What remains is <os>-<arch>[<extension>].
    //
    string s (n, p.size ());

    size_t d (s.find ('-'));
    if (d == string::npos || d == 0)
      return r;

    string os (s, 0, d);
    string arch (s, d + 1);

    size_t e (arch.find ('.'));
    if (e != string::npos)
    {
      r.extension = arch.substr (e);
      arch.resize (e);
    }

    if (arch.empty ())
      return platform_label ();

    r.os = move (os);
    r.arch = move (arch);
    return r;
  }

  bool release_repository::
  excluded (const string& v) const
  {
    for (const string& p: excluded_versions)
    {
      if (v.compare (0, p.size (), p) == 0)
        return true;
    }
    return false;
  }

  release_repository
  worker_repository ()
  {
    return release_repository {"firstbatchxyz",
                               "dkn-compute-node",
                               "dkn-compute-binary",
                               {}};
  }

  release_repository
  launcher_repository ()
  {
    // The 0.0.x launchers predate the current asset layout.
    //
    return release_repository {"firstbatchxyz",
                               "dkn-compute-launcher",
                               "dkn-compute-launcher",
                               {"0.0"}};
  }

  string
  version_from_tag (const string& t)
  {
    return !t.empty () && t.front () == 'v' ? t.substr (1) : t;
  }

  release_asset
  resolve_asset (const release& r, const host_platform& h)
  {
    optional<platform_label> l (to_platform_label (h));

    if (!l)
      throw unsupported_platform ("unsupported platform " + h.os + '/' +
                                  h.arch);

    string n (asset_name (r.artifact, *l));

    for (const release_asset& a: r.assets)
    {
      if (a.name == n)
        return a;
    }

    throw not_found ("no asset " + n + " in release " + r.version);
  }
}
