#include <warden/github/github-api.hxx>

#include <warden/version.hxx>

using namespace std;

namespace warden
{
  string github_api_traits::
  user_agent ()
  {
    return "warden/" WARDEN_VERSION_ID;
  }

  optional<string> github_api_traits::
  next_page (const string& l)
  {
    // Comma-separated <url>; param; ... entries. The URL itself may contain
    // commas, so the entry only ends at the first comma after the '>'.
    //
    for (size_t b (0); b < l.size ();)
    {
      size_t o (l.find ('<', b));
      if (o == string::npos)
        break;

      size_t c (l.find ('>', o));
      if (c == string::npos)
        break;

      size_t e (l.find (',', c));
      if (e == string::npos)
        e = l.size ();

      if (string (l, c + 1, e - c - 1).find ("rel=\"next\"") != string::npos)
        return string (l, o + 1, c - o - 1);

      b = e;
    }

    return nullopt;
  }

  github_api_traits::asset_type github_api_traits::
  parse_asset (const json::value& jv)
  {
    asset_type a;

    if (jv.is_object ())
    {
      const auto& obj (jv.as_object ());

      if (obj.contains ("id"))
        a.id = json::value_to<uint64_t> (obj.at ("id"));

      if (obj.contains ("name"))
        a.name = json::value_to<string> (obj.at ("name"));

      if (obj.contains ("content_type"))
        a.content_type = json::value_to<string> (obj.at ("content_type"));

      if (obj.contains ("size"))
        a.size = json::value_to<uint64_t> (obj.at ("size"));

      if (obj.contains ("browser_download_url"))
        a.browser_download_url =
          json::value_to<string> (obj.at ("browser_download_url"));
    }

    return a;
  }

  github_api_traits::release_type github_api_traits::
  parse_release (const json::value& jv)
  {
    release_type r;

    if (jv.is_object ())
    {
      const auto& obj (jv.as_object ());

      if (obj.contains ("id"))
        r.id = json::value_to<uint64_t> (obj.at ("id"));

      if (obj.contains ("tag_name"))
        r.tag_name = json::value_to<string> (obj.at ("tag_name"));

      // Release name is nullable.
      //
      if (obj.contains ("name") && !obj.at ("name").is_null ())
        r.name = json::value_to<string> (obj.at ("name"));

      if (obj.contains ("draft"))
        r.draft = json::value_to<bool> (obj.at ("draft"));

      if (obj.contains ("prerelease"))
        r.prerelease = json::value_to<bool> (obj.at ("prerelease"));

      if (obj.contains ("assets") && obj.at ("assets").is_array ())
      {
        for (const auto& a: obj.at ("assets").as_array ())
          r.assets.push_back (parse_asset (a));
      }
    }

    return r;
  }

  vector<github_api_traits::release_type> github_api_traits::
  parse_releases (const json::value& jv)
  {
    vector<release_type> r;

    if (jv.is_array ())
    {
      for (const auto& v: jv.as_array ())
        r.push_back (parse_release (v));
    }

    return r;
  }
}
