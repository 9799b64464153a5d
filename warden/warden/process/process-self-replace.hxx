#pragma once

#include <string>
#include <filesystem>

namespace warden
{
  namespace fs = std::filesystem;

  struct self_replace_result
  {
    bool success = false;
    std::string error_message;
    fs::path installed_path;
    fs::path backup_path;

    explicit operator bool () const noexcept { return success; }
  };

  // Replace the (possibly running) launcher executable with a new binary.
  //
  // The new binary is first copied next to the target so that the final
  // step is a rename within the same directory. On POSIX that rename swaps
  // the directory entry atomically and the running process keeps its old
  // image. Windows won't let us overwrite a running executable but will let
  // us rename it, so there the current executable is moved aside to .old
  // first (and put back if installing the new one fails). The .old leftover
  // can only be removed once we are no longer running it, see
  // remove_leftovers().
  //
  // The new binary itself is left alone; removing it is up to the caller.
  //
  class self_replacer
  {
  public:
    self_replace_result
    replace (const fs::path& new_binary, const fs::path& target);

    // Remove the .old/.new files a previous replacement may have left next
    // to the target. Failures are ignored.
    //
    static void
    remove_leftovers (const fs::path& target) noexcept;

    static fs::path
    current_executable_path ();

    static fs::path
    backup_path (const fs::path&);

    static fs::path
    staging_path (const fs::path&);
  };
}
