#include <warden/supervisor/supervisor.hxx>

#include <set>
#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include <cassert>
#include <fstream>
#include <utility>
#include <optional>
#include <algorithm>
#include <exception>
#include <functional>
#include <filesystem>
#include <system_error>

#include <boost/asio.hpp>

#include <warden/warden-error.hxx>

#include <warden/version.hxx>

using namespace std;
using namespace warden;

namespace asio = boost::asio;
namespace fs = std::filesystem;

using namespace std::chrono_literals;

using journal = vector<string>;

// Process that only exists in the journal.
//
struct fake_process
{
  string name;
  shared_ptr<journal> log;
  asio::io_context* ioc = nullptr;
  exit_handler handler;
  bool alive = true;
  int kills = 0;

  int
  pid () const noexcept {return 42;}

  bool
  running () const noexcept {return alive;}

  // Like the real thing, the exit of a killed process is still reported,
  // just later.
  //
  void
  kill ()
  {
    if (!alive)
      return;

    alive = false;
    ++kills;
    log->push_back ("kill " + name);

    if (handler)
      asio::post (*ioc, [h = move (handler)] {h (-9);});
  }

  // Exit on our own.
  //
  void
  exit (int code)
  {
    if (!alive)
      return;

    alive = false;
    log->push_back ("exit " + name);

    if (handler)
      handler (code);
  }
};

struct fake_launcher
{
  using process_type = fake_process;

  shared_ptr<journal> log;
  asio::io_context* ioc = nullptr;

  size_t spawns = 0;
  set<size_t> failing; // Spawn attempts (from 1) that fail.

  // Called for every spawn attempt with the process or null if it failed.
  // Should only schedule work.
  //
  function<void (size_t, fake_process*)> on_spawn;

  vector<shared_ptr<fake_process>> processes;
  vector<launch_request> requests;

  shared_ptr<fake_process>
  spawn (const launch_request& r, exit_handler h)
  {
    size_t n (++spawns);
    requests.push_back (r);

    if (failing.count (n) != 0)
    {
      log->push_back ("spawn failed");

      if (on_spawn)
        on_spawn (n, nullptr);

      throw process_error ("unable to start " + r.program.string ());
    }

    auto p (make_shared<fake_process> ());
    p->name = "worker#" + to_string (n);
    p->log = log;
    p->ioc = ioc;
    p->handler = move (h);

    log->push_back ("spawn " + p->name);
    processes.push_back (p);

    if (on_spawn)
      on_spawn (n, p.get ());

    return p;
  }
};

struct fake_resolver
{
  string worker_version = "1.0.0";
  string launcher_version = "0.1.0";

  // Simulate a slow network.
  //
  chrono::milliseconds delay {0};

  asio::awaitable<release>
  latest (const release_repository& repo)
  {
    if (delay.count () != 0)
    {
      asio::steady_timer t (co_await asio::this_coro::executor);
      t.expires_after (delay);
      co_await t.async_wait (asio::use_awaitable);
    }

    platform_label l {"linux", "amd64", ""};

    release r;
    r.artifact = repo.artifact;
    r.version = repo.name == launcher_repository ().name
                ? launcher_version
                : worker_version;
    r.name = "v" + r.version;

    release_asset a;
    a.name = asset_name (repo.artifact, l);
    a.platform = l;
    a.download_url = "https://example.org/" + repo.name + '/' + r.version;
    r.assets.push_back (move (a));

    co_return r;
  }

  release_asset
  resolve_asset (const release& r, const host_platform& h) const
  {
    return warden::resolve_asset (r, h);
  }
};

struct fake_installer
{
  shared_ptr<journal> log;
  bool fail = false;

  asio::awaitable<fs::path>
  install (const release_asset& a,
           const fs::path& d,
           const string& n,
           bool)
  {
    log->push_back ("install " + n);

    if (fail)
      throw network_error ("connection reset by peer");

    fs::path p (d / n);
    ofstream (p, ios::binary) << a.download_url;
    co_return p;
  }
};

struct fake_companion
{
  using process_type = fake_process;
  using handle_type = basic_companion_handle<fake_process>;

  shared_ptr<journal> log;
  bool already_running = false;
  bool fail = false;

  shared_ptr<fake_process> process;

  asio::awaitable<handle_type>
  ensure (const companion_config&)
  {
    if (fail)
      throw startup_failed ("ollama did not become reachable");

    handle_type h;

    if (already_running)
    {
      h.ownership = companion_ownership::not_owned;
      co_return h;
    }

    process = make_shared<fake_process> ();
    process->name = "companion";
    process->log = log;

    log->push_back ("spawn companion");

    h.ownership = companion_ownership::owned;
    h.process = process;
    co_return h;
  }
};

struct fake_replacer
{
  shared_ptr<journal> log;
  function<void ()> on_replace;

  self_replace_result
  replace (const fs::path&, const fs::path& t)
  {
    log->push_back ("replace " + t.filename ().string ());

    if (on_replace)
      on_replace ();

    self_replace_result r;
    r.success = true;
    r.installed_path = t;
    return r;
  }
};

struct test_traits
{
  using resolver_type = fake_resolver;
  using installer_type = fake_installer;
  using tracker_type = version_tracker;
  using companion_type = fake_companion;
  using launcher_type = fake_launcher;
  using replacer_type = fake_replacer;
};

using test_supervisor = basic_supervisor<test_traits>;

struct outcome
{
  bool finished = false;
  exception_ptr error;
};

// Installed worker 1.0.0 in a scratch directory with update checks off.
//
struct fixture
{
  asio::io_context ioc;
  fs::path dir;
  shared_ptr<journal> log;

  basic_supervisor_services<test_traits> services;
  shared_ptr<cancellation_signal> cancel;
  supervisor_config config;

  explicit
  fixture (const string& name)
    : dir (fs::temp_directory_path () / ("warden-supervisor-test-" + name)),
      log (make_shared<journal> ()),
      cancel (make_shared<cancellation_signal> (ioc.get_executor ()))
  {
    fs::remove_all (dir);
    fs::create_directories (dir);

    services.resolver = make_shared<fake_resolver> ();
    services.installer = make_shared<fake_installer> ();
    services.installer->log = log;
    services.tracker = make_shared<version_tracker> ();
    services.companion = make_shared<fake_companion> ();
    services.companion->log = log;
    services.launcher = make_shared<fake_launcher> ();
    services.launcher->log = log;
    services.launcher->ioc = &ioc;
    services.replacer = make_shared<fake_replacer> ();
    services.replacer->log = log;

    config.directory = dir;
    config.binary = "worker";
    config.env_file = dir / ".env";
    config.origin = "warden/test";
    config.host = host_platform {"linux", "x86_64"};
    config.check_updates = false;
    config.update_interval = 20ms;
    config.self_update = false;
    config.self_update_interval = 20ms;
    config.self_version = "0.1.0";
    config.self_path = dir / "warden";
    config.companion_required = false;

    ofstream (dir / "worker", ios::binary) << "1.0.0";
    services.tracker->write (dir, "1.0.0");
  }

  ~fixture ()
  {
    error_code ec;
    fs::remove_all (dir, ec);
  }

  shared_ptr<test_supervisor>
  make ()
  {
    return make_shared<test_supervisor> (ioc, config, services, cancel);
  }

  // Run until the supervisor is done or the deadline passes.
  //
  outcome
  run (const shared_ptr<test_supervisor>& s, chrono::milliseconds d = 5s)
  {
    outcome r;

    asio::steady_timer t (ioc);
    t.expires_after (d);
    t.async_wait ([this] (const boost::system::error_code& ec)
    {
      if (!ec)
        ioc.stop ();
    });

    asio::co_spawn (ioc,
                    s->run (),
                    [this, &r, &t] (exception_ptr e)
                    {
                      r.finished = true;
                      r.error = e;
                      t.cancel ();
                      ioc.stop ();
                    });

    ioc.run ();
    return r;
  }

  // Fire cancellation after a while (from the io_context).
  //
  void
  cancel_after (chrono::milliseconds d, function<void ()> before = nullptr)
  {
    auto t (make_shared<asio::steady_timer> (ioc, d));
    t->async_wait ([t, this, b = move (before)] (
                     const boost::system::error_code&)
    {
      if (b)
        b ();

      cancel->fire ();
    });
  }

  size_t
  count (const string& e) const
  {
    return static_cast<size_t> (std::count (log->begin (), log->end (), e));
  }

  // True if the journal has these entries in this order, one after the
  // other.
  //
  bool
  sequence (const journal& es) const
  {
    return search (log->begin (), log->end (), es.begin (), es.end ()) !=
      log->end ();
  }
};

template <typename E>
static bool
failed_with (const outcome& o)
{
  if (!o.error)
    return false;

  try
  {
    rethrow_exception (o.error);
  }
  catch (const E&)
  {
    return true;
  }
  catch (const std::exception&)
  {
  }

  return false;
}

// The worker exits by itself: we stop and take down the companion we
// started, exactly once.
//
static void
test_exit_owned_companion ()
{
  fixture f ("exit-owned");
  f.config.companion_required = true;

  f.services.launcher->on_spawn = [&f] (size_t, fake_process* p)
  {
    if (p != nullptr)
      asio::post (f.ioc, [p] {p->exit (0);});
  };

  auto s (f.make ());
  outcome o (f.run (s));

  assert (o.finished && !o.error);
  assert (s->state () == supervisor_state::stopped);

  assert (f.sequence ({"spawn companion", "spawn worker#1", "exit worker#1",
                       "kill companion"}));
  assert (f.count ("kill companion") == 1);
  assert (f.services.companion->process->kills == 1);
  assert (f.count ("kill worker#1") == 0);

  // The worker is started in the install directory and told where its
  // configuration is and who started it.
  //
  const launch_request& r (f.services.launcher->requests.front ());
  assert (r.program == f.dir / "worker");
  assert (r.working_directory == f.dir);
  assert (r.environment.at ("DKN_COMPUTE_ENV") == (f.dir / ".env").string ());
  assert (r.environment.at ("DKN_EXEC_PLATFORM") == "warden/test");
}

// Somebody else runs the companion: never touch it.
//
static void
test_exit_foreign_companion ()
{
  fixture f ("exit-foreign");
  f.config.companion_required = true;
  f.services.companion->already_running = true;

  f.services.launcher->on_spawn = [&f] (size_t, fake_process* p)
  {
    if (p != nullptr)
      asio::post (f.ioc, [p] {p->exit (1);});
  };

  auto s (f.make ());
  outcome o (f.run (s));

  assert (o.finished && !o.error);
  assert (s->state () == supervisor_state::stopped);
  assert (f.count ("spawn companion") == 0);
  assert (f.count ("kill companion") == 0);
}

// Cancellation while an update check hangs on the network.
//
static void
test_cancel_during_check ()
{
  fixture f ("cancel");
  f.config.check_updates = true;
  f.config.update_interval = 5ms;
  f.config.self_update = true;
  f.config.self_update_interval = 5ms;
  f.services.resolver->worker_version = "2.0.0";
  f.services.resolver->delay = 10s;

  auto s (f.make ());

  optional<supervisor_state> before;
  f.cancel_after (50ms, [&before, &s] {before = s->state ();});

  auto start (chrono::steady_clock::now ());
  outcome o (f.run (s));

  assert (o.finished && !o.error);
  assert (chrono::steady_clock::now () - start < 5s);
  assert (before == supervisor_state::running);
  assert (s->state () == supervisor_state::stopped);

  assert (f.count ("kill worker#1") == 1);
  assert (f.count ("install worker") == 0);
  assert (f.services.tracker->read (f.dir) == "1.0.0");
}

// Cancellation before we even got going.
//
static void
test_cancel_early ()
{
  fixture f ("cancel-early");
  f.config.companion_required = true;
  f.cancel->fire ();

  auto s (f.make ());
  outcome o (f.run (s));

  assert (o.finished && !o.error);
  assert (s->state () == supervisor_state::stopped);
  assert (f.sequence ({"spawn companion", "spawn worker#1", "kill companion",
                       "kill worker#1"}));
}

// Kill, install, relaunch, and only then record the new version.
//
static void
test_update ()
{
  fixture f ("update");
  f.config.check_updates = true;
  f.services.resolver->worker_version = "2.0.0";

  auto s (f.make ());

  optional<string> recorded;
  optional<supervisor_state> settled;

  f.services.launcher->on_spawn =
    [&f, &s, &recorded, &settled] (size_t n, fake_process*)
  {
    if (n != 2)
      return;

    recorded = f.services.tracker->read (f.dir);

    // Give the stale exit of the killed worker a chance to confuse us.
    //
    f.cancel_after (50ms, [&settled, &s] {settled = s->state ();});
  };

  outcome o (f.run (s));

  assert (o.finished && !o.error);
  assert (f.sequence ({"spawn worker#1", "kill worker#1", "install worker",
                       "spawn worker#2"}));

  assert (recorded == "1.0.0");
  assert (f.services.tracker->read (f.dir) == "2.0.0");

  assert (settled == supervisor_state::running);
  assert (s->state () == supervisor_state::stopped);
  assert (f.count ("kill worker#2") == 1);

  // Nothing to do on the following ticks.
  //
  assert (f.count ("install worker") == 1);

  // Same startup parameters.
  //
  const auto& rs (f.services.launcher->requests);
  assert (rs.size () == 2);
  assert (rs[0].program == rs[1].program);
  assert (rs[0].environment == rs[1].environment);
}

// Up to date: the worker is left alone.
//
static void
test_no_update ()
{
  fixture f ("no-update");
  f.config.check_updates = true;
  f.config.update_interval = 5ms;

  auto s (f.make ());
  f.cancel_after (60ms);

  outcome o (f.run (s));

  assert (o.finished && !o.error);
  assert (f.count ("spawn worker#1") == 1);
  assert (f.count ("install worker") == 0);
  assert (f.services.launcher->spawns == 1);
}

// Installing fails: the old binary is restarted and the version stays.
//
static void
test_install_failure ()
{
  fixture f ("install-failure");
  f.config.check_updates = true;
  f.services.resolver->worker_version = "2.0.0";
  f.services.installer->fail = true;

  auto s (f.make ());

  f.services.launcher->on_spawn = [&f] (size_t n, fake_process*)
  {
    if (n == 2)
      asio::post (f.ioc, [&f] {f.cancel->fire ();});
  };

  outcome o (f.run (s));

  assert (o.finished && !o.error);
  assert (f.sequence ({"spawn worker#1", "kill worker#1", "install worker",
                       "spawn worker#2"}));
  assert (f.services.tracker->read (f.dir) == "1.0.0");
  assert (s->state () == supervisor_state::stopped);
}

// Restarting fails: no worker, version unchanged, and we try again on the
// next tick.
//
static void
test_relaunch_failure ()
{
  fixture f ("relaunch-failure");
  f.config.check_updates = true;
  f.services.resolver->worker_version = "2.0.0";
  f.services.launcher->failing = {2};

  auto s (f.make ());

  optional<supervisor_state> stranded;
  optional<string> recorded;

  f.services.launcher->on_spawn =
    [&f, &s, &stranded, &recorded] (size_t n, fake_process*)
  {
    if (n == 2)
    {
      asio::post (f.ioc, [&f, &s, &stranded, &recorded]
      {
        stranded = s->state ();
        recorded = f.services.tracker->read (f.dir);
      });
    }
    else if (n == 3)
      asio::post (f.ioc, [&f] {f.cancel->fire ();});
  };

  outcome o (f.run (s));

  assert (o.finished && !o.error);

  assert (stranded == supervisor_state::running_without_main);
  assert (recorded == "1.0.0");

  // Recovered on the next tick.
  //
  assert (f.sequence ({"spawn worker#1", "kill worker#1", "install worker",
                       "spawn failed", "install worker", "spawn worker#3"}));
  assert (f.services.tracker->read (f.dir) == "2.0.0");
  assert (s->state () == supervisor_state::stopped);
}

// The worker cannot be started at all: give up, but not before stopping
// the companion we started for it.
//
static void
test_start_failure ()
{
  fixture f ("start-failure");
  f.config.companion_required = true;
  f.services.launcher->failing = {1};

  auto s (f.make ());
  outcome o (f.run (s));

  assert (o.finished);
  assert (failed_with<process_error> (o));
  assert (s->state () == supervisor_state::stopped);
  assert (f.count ("kill companion") == 1);
}

static void
test_companion_failure ()
{
  fixture f ("companion-failure");
  f.config.companion_required = true;
  f.services.companion->fail = true;

  auto s (f.make ());
  outcome o (f.run (s));

  assert (o.finished);
  assert (failed_with<startup_failed> (o));
  assert (s->state () == supervisor_state::stopped);
  assert (f.services.launcher->spawns == 0);
}

// Self-update replaces the launcher and never touches the worker.
//
static void
test_self_update ()
{
  fixture f ("self-update");
  f.config.self_update = true;
  f.services.resolver->launcher_version = "0.2.0";

  auto s (f.make ());

  optional<size_t> kills;
  f.services.replacer->on_replace = [&f, &kills]
  {
    kills = f.services.launcher->processes.front ()->kills;
    asio::post (f.ioc, [&f] {f.cancel->fire ();});
  };

  outcome o (f.run (s));

  assert (o.finished && !o.error);
  assert (f.sequence ({"spawn worker#1", "install .tmp_warden",
                       "replace warden"}));
  assert (kills == 0);
  assert (s->self_version () == "0.2.0");
  assert (!fs::exists (f.dir / ".tmp_warden"));
}

// What the worker gets told and how its binaries are called.
//
static void
test_defaults ()
{
  assert (default_origin () == string ("launcher/v") + WARDEN_VERSION_ID);
  assert (supervisor_config ().origin == default_origin ());

#ifdef _WIN32
  assert (worker_binary_name () == "dkn-compute-node_latest.exe");
  assert (pinned_binary_name ("0.3.1") == "dkn-compute-node_v0.3.1.exe");
#else
  assert (worker_binary_name () == "dkn-compute-node_latest");
  assert (pinned_binary_name ("0.3.1") == "dkn-compute-node_v0.3.1");
#endif
}

int
main ()
{
  test_defaults ();
  test_exit_owned_companion ();
  test_exit_foreign_companion ();
  test_cancel_during_check ();
  test_cancel_early ();
  test_update ();
  test_no_update ();
  test_install_failure ();
  test_relaunch_failure ();
  test_start_failure ();
  test_companion_failure ();
  test_self_update ();
}
