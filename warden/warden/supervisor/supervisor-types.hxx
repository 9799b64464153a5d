#pragma once

#include <chrono>
#include <string>
#include <vector>
#include <iosfwd>
#include <filesystem>

#include <warden/release/release-types.hxx>
#include <warden/companion/companion-manager.hxx>

namespace warden
{
  namespace fs = std::filesystem;

  enum class supervisor_state
  {
    starting,
    running,
    running_without_main, // Relaunch after an update failed.
    terminating,
    stopped
  };

  std::string
  to_string (supervisor_state);

  std::ostream&
  operator<< (std::ostream&, supervisor_state);

  // Variables through which the worker learns where its configuration is
  // and who started it.
  //
  constexpr const char* env_file_variable = "DKN_COMPUTE_ENV";
  constexpr const char* origin_variable = "DKN_EXEC_PLATFORM";

  // Name of the supervised (continuously updated) worker binary,
  // dkn-compute-node_latest, and of one pinned to a specific version,
  // dkn-compute-node_v<version>. Both with .exe on Windows.
  //
  std::string
  worker_binary_name ();

  std::string
  pinned_binary_name (const std::string& version);

  // Prefix shared by all the worker binary names.
  //
  constexpr const char* worker_binary_prefix = "dkn-compute-node";

  // Default DKN_EXEC_PLATFORM value.
  //
  std::string
  default_origin ();

  struct supervisor_config
  {
    // Worker installation: dir/binary, started in dir.
    //
    fs::path directory;
    std::string binary;
    std::vector<std::string> arguments;

    fs::path env_file;
    std::string origin = default_origin ();

    release_repository worker = worker_repository ();
    release_repository launcher = launcher_repository ();
    host_platform host = current_host ();

    bool check_updates = true;
    std::chrono::milliseconds update_interval {std::chrono::minutes (25)};

    bool self_update = true;
    std::chrono::milliseconds self_update_interval {std::chrono::minutes (25)};

    // Version and location of the running launcher.
    //
    std::string self_version;
    fs::path self_path;

    bool companion_required = false;
    companion_config companion;

    bool verbose = false;
    bool progress = false;
  };
}
