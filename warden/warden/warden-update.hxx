#pragma once

#include <memory>
#include <string>
#include <filesystem>

#include <boost/asio.hpp>

#include <warden/release/release-types.hxx>
#include <warden/release/release-resolver.hxx>
#include <warden/install/binary-installer.hxx>
#include <warden/version/version-tracker.hxx>
#include <warden/process/process-self-replace.hxx>

namespace warden
{
  namespace asio = boost::asio;
  namespace fs = std::filesystem;

  enum class update_status
  {
    up_to_date,
    updated,
    failed
  };

  std::string
  to_string (update_status);

  struct update_result
  {
    update_status status = update_status::failed;
    std::string version;
    fs::path installed_path;
    std::string error_message;

    explicit operator bool () const noexcept
    {
      return status != update_status::failed;
    }
  };

  // One-shot install and update operations.
  //
  // These are what runs before supervision starts (initial install) and
  // what the --update and --tag commands do. Failures are reported in the
  // result rather than thrown.
  //
  // The collaborators are shared so that the supervisor can reuse them once
  // it takes over. Note that the operations take their arguments by value
  // since they are normally started with co_spawn() and only run later.
  //
  class update_coordinator
  {
  public:
    using resolver_type = release_resolver;
    using installer_type = binary_installer;
    using tracker_type = version_tracker;
    using replacer_type = self_replacer;

    update_coordinator (asio::io_context&, host_platform, bool progress);

    update_coordinator (const update_coordinator&) = delete;
    update_coordinator& operator= (const update_coordinator&) = delete;

    // Install the latest worker as dir/binary unless the recorded version is
    // current and the binary is there. The version is recorded after a
    // successful install.
    //
    asio::awaitable<update_result>
    update_worker (fs::path dir, std::string binary);

    // Install the worker release with this tag next to the supervised one
    // under its own name (see pinned_binary_name()) unless it is already
    // there. The recorded version is not touched.
    //
    asio::awaitable<update_result>
    install_tag (fs::path dir, std::string tag);

    // Replace the launcher executable with the latest release unless that
    // is the current version.
    //
    asio::awaitable<update_result>
    update_self (fs::path executable, std::string current);

    const std::shared_ptr<resolver_type>&
    resolver () const noexcept {return resolver_;}

    const std::shared_ptr<installer_type>&
    installer () const noexcept {return installer_;}

    const std::shared_ptr<tracker_type>&
    tracker () const noexcept {return tracker_;}

    const std::shared_ptr<replacer_type>&
    replacer () const noexcept {return replacer_;}

  private:
    host_platform host_;
    bool progress_;

    std::shared_ptr<resolver_type> resolver_;
    std::shared_ptr<installer_type> installer_;
    std::shared_ptr<tracker_type> tracker_;
    std::shared_ptr<replacer_type> replacer_;
  };

  // Format an update result for display, for example:
  //
  // worker: updated to 0.3.1
  // launcher: failed: unable to ...
  //
  std::string
  format_update_result (const std::string& what, const update_result&);
}
