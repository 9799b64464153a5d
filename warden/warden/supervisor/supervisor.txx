#include <utility>
#include <iostream>
#include <exception>
#include <system_error>

#include <boost/asio/redirect_error.hpp>

#include <warden/warden-error.hxx>

namespace warden
{
  template <typename T>
  basic_supervisor<T>::
  basic_supervisor (asio::io_context& ioc,
                    supervisor_config c,
                    services_type s,
                    std::shared_ptr<cancellation_signal> cs)
    : ioc_ (ioc),
      config_ (std::move (c)),
      services_ (std::move (s)),
      cancel_ (std::move (cs)),
      wake_ (ioc),
      main_timer_ (ioc),
      self_timer_ (ioc),
      self_version_ (config_.self_version)
  {
  }

  template <typename T>
  asio::awaitable<void> basic_supervisor<T>::
  run ()
  {
    auto self (this->shared_from_this ());

    // Subscribe before starting so that a cancellation arriving while we
    // wait for the companion is not lost.
    //
    std::weak_ptr<basic_supervisor> w (self);
    subscription_ = cancel_->subscribe ([w] ()
    {
      if (auto s = w.lock ())
        s->push (event::cancelled);
    });

    try
    {
      co_await start ();
    }
    catch (const std::exception&)
    {
      cancel_->unsubscribe (subscription_);
      stopping_ = true;
      state_ = supervisor_state::stopped;
      throw;
    }

    state_ = supervisor_state::running;

    if (config_.check_updates)
      asio::co_spawn (ioc_,
                      [self] ()
                      {
                        return self->tick (self->main_timer_,
                                           self->config_.update_interval,
                                           event::main_update);
                      },
                      asio::detached);

    if (config_.self_update)
      asio::co_spawn (ioc_,
                      [self] ()
                      {
                        return self->tick (self->self_timer_,
                                           self->config_.self_update_interval,
                                           event::self_update);
                      },
                      asio::detached);

    while (!stopping_)
    {
      if (events_.empty ())
      {
        wake_.expires_at (asio::steady_timer::time_point::max ());

        boost::system::error_code ec;
        co_await wake_.async_wait (
          asio::redirect_error (asio::use_awaitable, ec));

        continue;
      }

      event e (events_.front ());
      events_.pop_front ();

      switch (e)
      {
      case event::main_exited:
      case event::cancelled:
        {
          terminate ();
          break;
        }
      case event::main_update:
        {
          if (main_busy_)
          {
            trace ("worker update check still in progress, skipping");
            break;
          }

          main_busy_ = true;
          asio::co_spawn (ioc_,
                          [self] () {return self->update_main ();},
                          asio::detached);
          break;
        }
      case event::self_update:
        {
          if (self_busy_)
          {
            trace ("launcher update check still in progress, skipping");
            break;
          }

          self_busy_ = true;
          asio::co_spawn (ioc_,
                          [self] () {return self->update_self ();},
                          asio::detached);
          break;
        }
      }
    }

    cancel_->unsubscribe (subscription_);
  }

  template <typename T>
  void basic_supervisor<T>::
  push (event e)
  {
    events_.push_back (e);
    wake_.cancel ();
  }

  template <typename T>
  asio::awaitable<void> basic_supervisor<T>::
  start ()
  {
    using namespace std;

    state_ = supervisor_state::starting;

    if (config_.companion_required)
    {
      trace ("looking for " + config_.companion.program + " at " +
             config_.companion.address ());

      companion_ = co_await services_.companion->ensure (config_.companion);

      if (companion_.owned ())
        cout << "started " << config_.companion.program << " at "
             << config_.companion.address () << "\n";
      else
        trace ("using the running " + config_.companion.program);
    }

    try
    {
      spawn_main ();
    }
    catch (const std::exception&)
    {
      stop_companion ();
      throw;
    }
  }

  template <typename T>
  void basic_supervisor<T>::
  spawn_main ()
  {
    launch_request r;
    r.program = config_.directory / config_.binary;
    r.arguments = config_.arguments;
    r.environment[env_file_variable] = config_.env_file.string ();
    r.environment[origin_variable] = config_.origin;
    r.working_directory = config_.directory;

    // Exits of a worker we have since killed or replaced are stale.
    //
    std::uint64_t g (++generation_);
    std::weak_ptr<basic_supervisor> w (this->weak_from_this ());

    main_ = services_.launcher->spawn (r, [w, g] (int c)
    {
      if (auto s = w.lock ())
        s->main_exited (g, c);
    });

    trace ("started " + r.program.string () + " (pid " +
           std::to_string (main_->pid ()) + ")");
  }

  template <typename T>
  bool basic_supervisor<T>::
  relaunch_main ()
  {
    try
    {
      spawn_main ();
      state_ = supervisor_state::running;
      return true;
    }
    catch (const process_error& e)
    {
      state_ = supervisor_state::running_without_main;

      std::cerr << "warning: unable to restart worker: " << e.what ()
                << ", will retry on the next update check" << "\n";
      return false;
    }
  }

  template <typename T>
  void basic_supervisor<T>::
  kill_main ()
  {
    // The exit handler runs later, on the io_context, and so it is enough to
    // invalidate the generation once the kill went through.
    //
    main_->kill ();
    main_.reset ();
    ++generation_;
  }

  template <typename T>
  void basic_supervisor<T>::
  stop_companion ()
  {
    if (!companion_.owned ())
      return;

    trace ("stopping " + config_.companion.program);

    try
    {
      companion_.process->kill ();
    }
    catch (const std::exception& e)
    {
      std::cerr << "warning: unable to stop " << config_.companion.program
                << ": " << e.what () << "\n";
    }

    companion_.process.reset ();
  }

  template <typename T>
  void basic_supervisor<T>::
  main_exited (std::uint64_t g, int c)
  {
    if (g != generation_ || stopping_)
      return;

    if (c == 0)
      std::cout << "worker exited" << "\n";
    else
      std::cerr << "warning: worker exited with code " << c << "\n";

    push (event::main_exited);
  }

  template <typename T>
  void basic_supervisor<T>::
  terminate ()
  {
    state_ = supervisor_state::terminating;
    stopping_ = true;

    main_timer_.cancel ();
    self_timer_.cancel ();

    stop_companion ();

    // The worker may well be exiting already (it sees the same signal as we
    // do).
    //
    if (main_)
    {
      try
      {
        kill_main ();
      }
      catch (const std::exception& e)
      {
        std::cerr << "warning: unable to stop worker: " << e.what () << "\n";
      }

      main_.reset ();
    }

    state_ = supervisor_state::stopped;
  }

  template <typename T>
  asio::awaitable<void> basic_supervisor<T>::
  tick (asio::steady_timer& t, std::chrono::milliseconds i, event e)
  {
    while (!stopping_)
    {
      t.expires_after (i);

      boost::system::error_code ec;
      co_await t.async_wait (asio::redirect_error (asio::use_awaitable, ec));

      if (stopping_ || ec == asio::error::operation_aborted)
        break;

      push (e);
    }
  }

  template <typename T>
  asio::awaitable<void> basic_supervisor<T>::
  update_main ()
  {
    try
    {
      co_await check_main ();
    }
    catch (const std::exception& e)
    {
      if (!stopping_)
        std::cerr << "warning: worker update failed: " << e.what () << "\n";
    }

    main_busy_ = false;
  }

  template <typename T>
  asio::awaitable<void> basic_supervisor<T>::
  update_self ()
  {
    try
    {
      co_await check_self ();
    }
    catch (const std::exception& e)
    {
      if (!stopping_)
        std::cerr << "warning: launcher update failed: " << e.what () << "\n";
    }

    self_busy_ = false;
  }

  template <typename T>
  asio::awaitable<void> basic_supervisor<T>::
  check_main ()
  {
    using namespace std;

    trace ("checking for worker updates");

    release r (co_await services_.resolver->latest (config_.worker));
    if (stopping_)
      co_return;

    if (!services_.tracker->update_needed (config_.directory,
                                           r.version,
                                           config_.binary))
    {
      trace ("worker " + r.version + " is up to date");

      if (state_ == supervisor_state::running_without_main)
        relaunch_main ();

      co_return;
    }

    // Make sure there is something for us to install before touching the
    // running worker.
    //
    release_asset a (services_.resolver->resolve_asset (r, config_.host));

    cout << "updating worker to " << r.version << "\n";

    if (main_)
      kill_main ();

    bool installed (false);
    try
    {
      co_await services_.installer->install (a,
                                             config_.directory,
                                             config_.binary,
                                             config_.progress);
      installed = true;
    }
    catch (const std::exception& e)
    {
      cerr << "warning: unable to install worker " << r.version << ": "
           << e.what () << "\n";
    }

    if (stopping_)
      co_return;

    // Either the new or (if installing failed) the old binary.
    //
    if (!relaunch_main () || !installed)
      co_return;

    services_.tracker->write (config_.directory, r.version);

    cout << "worker updated to " << r.version << "\n";
  }

  template <typename T>
  asio::awaitable<void> basic_supervisor<T>::
  check_self ()
  {
    using namespace std;

    trace ("checking for launcher updates");

    release r (co_await services_.resolver->latest (config_.launcher));
    if (stopping_)
      co_return;

    if (r.version == self_version_)
    {
      trace ("launcher " + r.version + " is up to date");
      co_return;
    }

    release_asset a (services_.resolver->resolve_asset (r, config_.host));

    cout << "updating launcher to " << r.version << "\n";

    // Download next to the executable so that replacing it doesn't cross
    // file systems.
    //
    const fs::path& t (config_.self_path);

    fs::path p (
      co_await services_.installer->install (a,
                                             t.parent_path (),
                                             ".tmp_" + t.filename ().string (),
                                             config_.progress));

    self_replace_result x;
    if (!stopping_)
      x = services_.replacer->replace (p, t);

    std::error_code ec;
    fs::remove (p, ec);

    if (stopping_)
      co_return;

    if (!x)
      throw io_error ("unable to replace " + t.string () + ": " +
                      x.error_message);

    self_version_ = r.version;

    cout << "launcher updated to " << r.version
         << ", restart to use the new version" << "\n";
  }

  template <typename T>
  void basic_supervisor<T>::
  trace (const std::string& m) const
  {
    if (config_.verbose)
      std::cout << m << "\n";
  }
}
