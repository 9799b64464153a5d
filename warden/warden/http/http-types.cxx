#include <warden/http/http-types.hxx>

#include <cctype>
#include <charconv>

using namespace std;

namespace warden
{
  string
  to_string (http_method m)
  {
    switch (m)
    {
      case http_method::get: return "GET";
    }
    return "GET";
  }

  optional<string> http_response::
  header (const string& n) const
  {
    auto match = [&n] (const string& f)
    {
      if (f.size () != n.size ())
        return false;

      for (size_t i (0); i < n.size (); ++i)
      {
        if (tolower (static_cast<unsigned char> (f[i])) !=
            tolower (static_cast<unsigned char> (n[i])))
          return false;
      }
      return true;
    };

    for (const auto& [k, v]: headers)
    {
      if (match (k))
        return v;
    }

    return nullopt;
  }

  optional<uint64_t> http_response::
  content_length () const
  {
    optional<string> v (header ("Content-Length"));

    if (!v)
      return nullopt;

    uint64_t n (0);

    // Note that we use std::from_chars for locale-independent parsing.
    //
    auto r (from_chars (v->data (), v->data () + v->size (), n));

    if (r.ec == errc ())
      return n;

    return nullopt;
  }

  url_parts
  parse_url (const string& url)
  {
    url_parts r;
    size_t pos (0);

    size_t p (url.find ("://"));
    if (p != string::npos)
    {
      r.scheme = url.substr (0, p);
      pos = p + 3;
    }
    else
      r.scheme = "http";

    // The authority ends at the first slash (start of the path) or the end
    // of the string.
    //
    size_t end (url.find ('/', pos));
    if (end == string::npos)
      end = url.size ();

    string auth (url.substr (pos, end - pos));
    size_t colon (auth.find (':'));

    if (colon != string::npos)
    {
      r.host = auth.substr (0, colon);
      r.port = auth.substr (colon + 1);
    }
    else
    {
      r.host = auth;
      r.port = (r.scheme == "https") ? "443" : "80";
    }

    r.target = end < url.size () ? url.substr (end) : string ("/");
    return r;
  }
}
