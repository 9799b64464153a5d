#include <warden/env/env-store.hxx>

#include <set>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <algorithm>
#include <stdexcept>
#include <system_error>

#include <warden/warden-error.hxx>

using namespace std;

namespace warden
{
  env_store env_store::
  load_from_environment ()
  {
    env_store r;

    for (string_view k: keys)
    {
      string n (k);
      const char* v (getenv (n.c_str ()));

      if (v != nullptr && *v != '\0')
        r.entries_.emplace (move (n), v);
    }

    return r;
  }

  bool env_store::
  read_file (const fs::path& p)
  {
    error_code ec;
    if (!fs::exists (p, ec))
      return false;

    ifstream ifs (p, ios::binary);
    if (!ifs)
      throw io_error ("unable to read " + p.string ());

    std::set<string> seen;
    for (string l; getline (ifs, l); )
    {
      if (!l.empty () && l.back () == '\r')
        l.pop_back ();

      size_t eq (l.find ('='));
      if (eq == string::npos)
        continue;

      string k (l, 0, eq);
      if (!whitelisted (k) || !seen.insert (k).second)
        continue;

      string v (l, eq + 1);
      if (!v.empty ())
        entries_.emplace (move (k), move (v)); // No-op if already set.
    }

    if (ifs.bad ())
      throw io_error ("unable to read " + p.string ());

    return true;
  }

  bool env_store::
  whitelisted (string_view k) noexcept
  {
    return find (keys.begin (), keys.end (), k) != keys.end ();
  }

  optional<string> env_store::
  get (const string& k) const
  {
    auto i (entries_.find (k));
    return i != entries_.end () ? optional<string> (i->second) : nullopt;
  }

  void env_store::
  set (const string& k, string v)
  {
    if (!whitelisted (k))
      throw invalid_argument ("unknown configuration key " + k);

    entries_[k] = move (v);
    dirty_ = true;
  }

  string env_store::
  merge_into (const string& c) const
  {
    entries_type pending (entries_);

    string r;
    r.reserve (c.size ());

    // Go line by line. Note that a trailing newline terminates the last line
    // rather than starting an empty one.
    //
    for (size_t b (0); b < c.size (); )
    {
      size_t e (c.find ('\n', b));
      bool nl (e != string::npos);

      if (!nl)
        e = c.size ();

      string_view l (c.data () + b, e - b);

      // Keep the carriage return of a CRLF file on the lines we rewrite.
      //
      bool cr (!l.empty () && l.back () == '\r');

      bool replaced (false);
      size_t eq (l.find ('='));

      if (eq != string_view::npos)
      {
        auto i (pending.find (string (l.substr (0, eq))));

        if (i != pending.end ())
        {
          r += i->first;
          r += '=';
          r += i->second;

          if (cr)
            r += '\r';

          pending.erase (i);
          replaced = true;
        }
      }

      if (!replaced)
        r.append (l);

      if (nl)
        r += '\n';

      b = e + 1;
    }

    // Append whatever didn't have a line yet.
    //
    bool tnl (!c.empty () && c.back () == '\n');

    for (const auto& [k, v]: pending)
    {
      if (!r.empty () && r.back () != '\n')
        r += '\n';

      r += k;
      r += '=';
      r += v;

      if (tnl)
        r += '\n';
    }

    return r;
  }

  void env_store::
  save_to_file (const fs::path& p)
  {
    string c;
    {
      ifstream ifs (p, ios::binary);
      if (!ifs)
        throw io_error ("unable to read " + p.string ());

      ostringstream os;
      os << ifs.rdbuf ();

      if (ifs.bad ())
        throw io_error ("unable to read " + p.string ());

      c = os.str ();
    }

    string r (merge_into (c));

    ofstream ofs (p, ios::binary | ios::trunc);
    if (!ofs)
      throw io_error ("unable to open " + p.string () + " for writing");

    ofs << r;
    ofs.close ();

    if (!ofs)
      throw io_error ("unable to write " + p.string ());

    dirty_ = false;
  }

  string env_store::
  companion_host () const
  {
    return get ("OLLAMA_HOST").value_or (default_companion_host);
  }

  string env_store::
  companion_port () const
  {
    return get ("OLLAMA_PORT").value_or (default_companion_port);
  }

  bool env_store::
  companion_required () const
  {
    optional<string> ms (get ("DKN_MODELS"));

    if (!ms)
      return false;

    istringstream is (*ms);
    for (string m; getline (is, m, ','); )
    {
      if (m.find (':') != string::npos)
        return true;
    }

    return false;
  }

  fs::path
  default_env_path ()
  {
#ifdef _WIN32
    const char* h (getenv ("USERPROFILE"));
#else
    const char* h (getenv ("HOME"));
#endif

    if (h == nullptr || *h == '\0')
      return fs::current_path () / ".env";

    return fs::path (h) / ".dria" / "dkn-compute-launcher" / ".env";
  }

  bool
  secret_key (string_view k) noexcept
  {
    return k.find ("KEY") != string_view::npos;
  }
}
