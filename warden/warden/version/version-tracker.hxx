#pragma once

#include <string>
#include <optional>
#include <filesystem>

namespace warden
{
  namespace fs = std::filesystem;

  // Version of the worker binary installed in a directory.
  //
  // The version lives in a single-line text file next to the binary. A
  // missing or unreadable file means nothing was installed yet rather than
  // an error.
  //
  class version_tracker
  {
  public:
    static constexpr const char* default_file = ".dkn-compute-version";

    explicit
    version_tracker (std::string file = default_file)
      : file_ (std::move (file)) {}

    std::optional<std::string>
    read (const fs::path& dir) const;

    // Replace the file content with exactly the version. Throws io_error.
    //
    void
    write (const fs::path& dir, const std::string& version) const;

    // True if the recorded version differs from the latest or the binary it
    // refers to is gone (e.g., deleted by hand).
    //
    bool
    update_needed (const fs::path& dir,
                   const std::string& latest,
                   const std::string& binary) const;

    fs::path
    path (const fs::path& dir) const
    {
      return dir / file_;
    }

  private:
    std::string file_;
  };
}
