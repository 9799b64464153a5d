#include <warden/process/process-self-replace.hxx>

#include <system_error>

#ifdef _WIN32
#  ifndef NOMINMAX
#    define NOMINMAX
#  endif
#  include <windows.h>
#endif

using namespace std;

namespace warden
{
  fs::path self_replacer::
  current_executable_path ()
  {
    error_code ec;

#ifdef _WIN32
    char b[MAX_PATH];
    DWORD l (GetModuleFileNameA (nullptr, b, MAX_PATH));
    if (l > 0 && l < MAX_PATH)
      return fs::path (b);
#else
    fs::path r (fs::read_symlink ("/proc/self/exe", ec));
    if (!ec)
      return r;
#endif

    return fs::current_path (ec);
  }

  fs::path self_replacer::
  backup_path (const fs::path& p)
  {
    return fs::path (p.string () + ".old");
  }

  fs::path self_replacer::
  staging_path (const fs::path& p)
  {
    return fs::path (p.string () + ".new");
  }

  void self_replacer::
  remove_leftovers (const fs::path& t) noexcept
  {
    error_code ec;
    fs::remove (backup_path (t), ec);
    fs::remove (staging_path (t), ec);
  }

  self_replace_result self_replacer::
  replace (const fs::path& nb, const fs::path& t)
  {
    self_replace_result r;
    r.installed_path = t;

    error_code ec;
    fs::path s (staging_path (t));

    // Copy the new binary to a .new file alongside the target.
    //
    fs::copy_file (nb, s, fs::copy_options::overwrite_existing, ec);
    if (ec)
    {
      r.error_message = "unable to copy new binary: " + ec.message ();
      return r;
    }

#ifndef _WIN32
    fs::permissions (s,
                     fs::perms::owner_all |
                     fs::perms::group_read | fs::perms::group_exec |
                     fs::perms::others_read | fs::perms::others_exec,
                     fs::perm_options::replace,
                     ec);
    if (ec)
    {
      r.error_message = "unable to make new binary executable: " +
                        ec.message ();
      fs::remove (s, ec);
      return r;
    }
#else
    // Move the running executable out of the way.
    //
    fs::path b (backup_path (t));

    if (fs::exists (t, ec))
    {
      fs::remove (b, ec);

      fs::rename (t, b, ec);
      if (ec)
      {
        r.error_message = "unable to move current executable aside: " +
                          ec.message ();
        fs::remove (s, ec);
        return r;
      }

      r.backup_path = b;
    }
#endif

    fs::rename (s, t, ec);
    if (ec)
    {
      r.error_message = "unable to install new binary: " + ec.message ();

      error_code e;
      fs::remove (s, e);

      if (!r.backup_path.empty ())
      {
        fs::rename (r.backup_path, t, e);
        r.backup_path.clear ();
      }

      return r;
    }

    r.success = true;
    return r;
  }
}
