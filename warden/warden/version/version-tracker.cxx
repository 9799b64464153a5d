#include <warden/version/version-tracker.hxx>

#include <fstream>
#include <sstream>
#include <system_error>

#include <warden/warden-error.hxx>

using namespace std;

namespace warden
{
  optional<string> version_tracker::
  read (const fs::path& d) const
  {
    ifstream ifs (path (d), ios::binary);
    if (!ifs)
      return nullopt;

    ostringstream os;
    os << ifs.rdbuf ();

    if (ifs.bad ())
      return nullopt;

    // Be lenient about a trailing newline added by an editor.
    //
    string v (os.str ());
    while (!v.empty () && (v.back () == '\n' ||
                           v.back () == '\r' ||
                           v.back () == ' '  ||
                           v.back () == '\t'))
      v.pop_back ();

    if (v.empty ())
      return nullopt;

    return v;
  }

  void version_tracker::
  write (const fs::path& d, const string& v) const
  {
    fs::path p (path (d));

    ofstream ofs (p, ios::binary | ios::trunc);
    if (!ofs)
      throw io_error ("unable to open " + p.string () + " for writing");

    ofs << v;
    ofs.close ();

    if (!ofs)
      throw io_error ("unable to write " + p.string ());
  }

  bool version_tracker::
  update_needed (const fs::path& d, const string& l, const string& b) const
  {
    optional<string> v (read (d));

    if (!v || *v != l)
      return true;

    error_code ec;
    return !fs::exists (d / b, ec);
  }
}
