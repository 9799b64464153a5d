#pragma once

#include <deque>
#include <memory>
#include <string>
#include <cstdint>

#include <boost/asio.hpp>

#include <warden/version/version-tracker.hxx>
#include <warden/release/release-resolver.hxx>
#include <warden/install/binary-installer.hxx>
#include <warden/process/process-child.hxx>
#include <warden/process/process-self-replace.hxx>
#include <warden/process/process-cancellation.hxx>
#include <warden/companion/companion-manager.hxx>
#include <warden/supervisor/supervisor-types.hxx>

namespace warden
{
  namespace asio = boost::asio;

  // Collaborators of the supervisor.
  //
  struct supervisor_traits
  {
    using resolver_type = release_resolver;
    using installer_type = binary_installer;
    using tracker_type = version_tracker;
    using companion_type = companion_manager;
    using launcher_type = process_launcher;
    using replacer_type = self_replacer;
  };

  template <typename T>
  struct basic_supervisor_services
  {
    std::shared_ptr<typename T::resolver_type> resolver;
    std::shared_ptr<typename T::installer_type> installer;
    std::shared_ptr<typename T::tracker_type> tracker;
    std::shared_ptr<typename T::companion_type> companion;
    std::shared_ptr<typename T::launcher_type> launcher;
    std::shared_ptr<typename T::replacer_type> replacer;
  };

  // Keeps the worker running and up to date.
  //
  // After starting the companion (if required) and the worker, a single
  // event loop waits for the worker to exit, for cancellation, and for the
  // two update timers. Whichever of exit and cancellation comes first ends
  // the loop; we then kill the companion if we started it along with
  // whatever is left of the worker.
  //
  // Update checks run as coroutines of their own so that a slow download
  // never delays noticing exit or cancellation. There is at most one check
  // of each kind in flight (a tick that finds one running is dropped) and
  // after each suspension a check gives up quietly if we are shutting down.
  //
  // A worker update kills the worker, installs the new binary over the old
  // one, and restarts it. The recorded version only changes once the new
  // worker is running. If installing fails we restart the old binary. If
  // restarting fails we stay up without a worker (running_without_main)
  // and try again on the next update tick.
  //
  // Must be created with make_shared() and run on a single-threaded
  // io_context.
  //
  template <typename T = supervisor_traits>
  class basic_supervisor:
    public std::enable_shared_from_this<basic_supervisor<T>>
  {
  public:
    using traits_type = T;
    using services_type = basic_supervisor_services<T>;

    using launcher_type = typename T::launcher_type;
    using companion_type = typename T::companion_type;
    using process_type = typename launcher_type::process_type;
    using companion_handle = typename companion_type::handle_type;

    basic_supervisor (asio::io_context&,
                      supervisor_config,
                      services_type,
                      std::shared_ptr<cancellation_signal>);

    basic_supervisor (const basic_supervisor&) = delete;
    basic_supervisor& operator= (const basic_supervisor&) = delete;

    // Run until the worker exits or we are cancelled. Throws if the
    // companion or the worker cannot be started.
    //
    asio::awaitable<void>
    run ();

    supervisor_state
    state () const noexcept {return state_;}

    // Version of the launcher as of the last successful self-update.
    //
    const std::string&
    self_version () const noexcept {return self_version_;}

    const supervisor_config&
    config () const noexcept {return config_;}

  private:
    enum class event
    {
      main_exited,
      cancelled,
      main_update,
      self_update
    };

    void
    push (event);

    asio::awaitable<void>
    start ();

    void
    spawn_main ();

    bool
    relaunch_main ();

    void
    kill_main ();

    void
    stop_companion ();

    void
    main_exited (std::uint64_t generation, int code);

    void
    terminate ();

    asio::awaitable<void>
    tick (asio::steady_timer&, std::chrono::milliseconds, event);

    asio::awaitable<void>
    update_main ();

    asio::awaitable<void>
    update_self ();

    asio::awaitable<void>
    check_main ();

    asio::awaitable<void>
    check_self ();

    void
    trace (const std::string&) const;

  private:
    asio::io_context& ioc_;
    supervisor_config config_;
    services_type services_;
    std::shared_ptr<cancellation_signal> cancel_;
    cancellation_signal::subscription subscription_ = 0;

    supervisor_state state_ = supervisor_state::starting;
    bool stopping_ = false;

    std::shared_ptr<process_type> main_;
    std::uint64_t generation_ = 0;
    companion_handle companion_;

    std::deque<event> events_;
    asio::steady_timer wake_;
    asio::steady_timer main_timer_;
    asio::steady_timer self_timer_;

    bool main_busy_ = false;
    bool self_busy_ = false;

    std::string self_version_;
  };

  using supervisor = basic_supervisor<>;
}

#include <warden/supervisor/supervisor.txx>
