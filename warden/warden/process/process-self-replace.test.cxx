#include <warden/process/process-self-replace.hxx>

#include <string>
#include <cassert>
#include <fstream>
#include <sstream>
#include <filesystem>

using namespace std;
using namespace warden;

namespace fs = std::filesystem;

static void
write_file (const fs::path& p, const string& s)
{
  ofstream (p, ios::binary) << s;
}

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
  fs::path d (fs::temp_directory_path () / "warden-self-replace-test");
  fs::remove_all (d);
  fs::create_directories (d);

  fs::path t (d / "warden");
  fs::path n (d / "warden-download");

  assert (self_replacer::staging_path (t) == d / "warden.new");
  assert (self_replacer::backup_path (t) == d / "warden.old");

  // Replace the target with the new binary.
  //
  {
    write_file (t, "launcher v1");
    write_file (n, "launcher v2");

    self_replacer s;
    self_replace_result r (s.replace (n, t));

    assert (r);
    assert (r.error_message.empty ());
    assert (r.installed_path == t);
    assert (read_file (t) == "launcher v2");
    assert (!fs::exists (self_replacer::staging_path (t)));

    // The new binary is the caller's to remove.
    //
    assert (fs::exists (n));

#ifndef _WIN32
    fs::perms ps (fs::status (t).permissions ());
    assert ((ps & fs::perms::owner_exec) != fs::perms::none);
    assert ((ps & fs::perms::others_write) == fs::perms::none);
    assert (r.backup_path.empty ());
#else
    assert (r.backup_path == self_replacer::backup_path (t));
    assert (read_file (r.backup_path) == "launcher v1");
#endif
  }

  // The new binary is gone: the target is left alone.
  //
  {
    fs::remove (n);

    self_replacer s;
    self_replace_result r (s.replace (n, t));

    assert (!r);
    assert (r.error_message.find ("unable to copy new binary") == 0);
    assert (read_file (t) == "launcher v2");
    assert (!fs::exists (self_replacer::staging_path (t)));
  }

#ifndef _WIN32
  // The final rename fails (the target is a non-empty directory): the
  // staged copy is cleaned up and the target is still there.
  //
  {
    fs::path bt (d / "busy");
    fs::create_directories (bt / "sub");
    write_file (n, "launcher v3");

    self_replacer s;
    self_replace_result r (s.replace (n, bt));

    assert (!r);
    assert (r.error_message.find ("unable to install new binary") == 0);
    assert (fs::is_directory (bt / "sub"));
    assert (!fs::exists (self_replacer::staging_path (bt)));
  }
#endif

  // Leftovers of an earlier replacement.
  //
  {
    write_file (self_replacer::backup_path (t), "old");
    write_file (self_replacer::staging_path (t), "new");

    self_replacer::remove_leftovers (t);

    assert (!fs::exists (self_replacer::backup_path (t)));
    assert (!fs::exists (self_replacer::staging_path (t)));
    assert (read_file (t) == "launcher v2");

    // Nothing to remove is fine too.
    //
    self_replacer::remove_leftovers (t);
  }

  fs::remove_all (d);
}
