#include <warden/version/version-tracker.hxx>

#include <cassert>
#include <fstream>
#include <sstream>
#include <filesystem>

#include <warden/warden-error.hxx>

using namespace std;
using namespace warden;

namespace fs = std::filesystem;

static string
read_file (const fs::path& p)
{
  ifstream ifs (p, ios::binary);
  ostringstream os;
  os << ifs.rdbuf ();
  return os.str ();
}

int
main ()
{
  fs::path d (fs::temp_directory_path () / "warden-version-tracker-test");
  fs::remove_all (d);
  fs::create_directories (d);

  version_tracker t;
  assert (t.path (d) == d / ".dkn-compute-version");

  // Nothing installed yet.
  //
  assert (!t.read (d));
  assert (t.update_needed (d, "0.3.1", "worker"));

  t.write (d, "9.9.9");
  assert (t.read (d) == "9.9.9");
  assert (read_file (t.path (d)) == "9.9.9");

  // Overwrite rather than append.
  //
  t.write (d, "0.3.1");
  assert (t.read (d) == "0.3.1");
  assert (read_file (t.path (d)) == "0.3.1");

  // Same version but the binary is gone.
  //
  assert (t.update_needed (d, "0.3.1", "worker"));

  ofstream (d / "worker", ios::binary) << "#!/bin/sh\n";

  assert (!t.update_needed (d, "0.3.1", "worker"));
  assert (t.update_needed (d, "0.3.2", "worker"));

  // Hand-edited file with a trailing newline.
  //
  ofstream (t.path (d), ios::binary) << "0.3.1\r\n";
  assert (t.read (d) == "0.3.1");
  assert (!t.update_needed (d, "0.3.1", "worker"));

  // Empty file is as good as none.
  //
  ofstream (t.path (d), ios::binary | ios::trunc);
  assert (!t.read (d));

  // Custom file name.
  //
  {
    version_tracker c ("version.txt");
    c.write (d, "1.0.0");
    assert (c.read (d) == "1.0.0");
    assert (!t.read (d));
  }

  // Writing into a missing directory fails.
  //
  {
    bool thrown (false);
    try
    {
      t.write (d / "missing", "1.0.0");
    }
    catch (const io_error&)
    {
      thrown = true;
    }
    assert (thrown);
  }

  fs::remove_all (d);
}
