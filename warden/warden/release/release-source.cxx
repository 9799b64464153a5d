#include <warden/release/release-source.hxx>

#include <utility>

using namespace std;

namespace warden
{
  release
  to_release (const github_release& g, const release_repository& repo)
  {
    release r;
    r.name = g.name.empty () ? g.tag_name : g.name;
    r.version = version_from_tag (g.tag_name);
    r.artifact = repo.artifact;

    for (const github_asset& a: g.assets)
    {
      release_asset x;
      x.name = a.name;
      x.platform = parse_asset_label (repo.artifact, a.name);
      x.download_url = a.browser_download_url;
      x.size = a.size;
      r.assets.push_back (move (x));
    }

    return r;
  }
}
