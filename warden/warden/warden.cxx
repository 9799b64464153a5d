#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include <fstream>
#include <utility>
#include <iostream>
#include <optional>
#include <exception>
#include <string_view>
#include <filesystem>
#include <system_error>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>

#include <warden/warden-error.hxx>
#include <warden/warden-update.hxx>
#include <warden/install/binary-installer.hxx>
#include <warden/warden-options.hxx>
#include <warden/env/env-store.hxx>
#include <warden/process/process-child.hxx>
#include <warden/process/process-limits.hxx>
#include <warden/process/process-signals.hxx>
#include <warden/process/process-self-replace.hxx>
#include <warden/process/process-cancellation.hxx>
#include <warden/companion/companion-manager.hxx>
#include <warden/supervisor/supervisor.hxx>

#include <warden/version.hxx>

using namespace std;
namespace fs = filesystem;
namespace asio = boost::asio;

namespace warden
{
  // Prompt the user for a Yes/No answer.
  //
  // We strictly require a 'y' or 'n' (case-insensitive) and treat a broken
  // or closed stdin as an error rather than as consent.
  //
  static bool
  confirm_action (const string& prompt, char def = '\0')
  {
    string a;
    do
    {
      cout << prompt << ' ';

      getline (cin, a);

      bool f (cin.fail ());
      bool e (cin.eof ());

      if (f || e)
        cout << endl;

      if (f)
        throw ios_base::failure ("unable to read y/n answer from stdin");

      // Only an actual empty line selects the default, not EOF.
      //
      if (a.empty () && def != '\0' && !e)
        a = def;

    } while (a != "y" && a != "Y" && a != "n" && a != "N");

    return a == "y" || a == "Y";
  }

  // Run a coroutine to completion on the context and return its result,
  // rethrowing its exception if any.
  //
  template <typename T>
  static T
  run_once (asio::io_context& ioc, asio::awaitable<T> a)
  {
    optional<T> r;
    exception_ptr x;

    asio::co_spawn (
      ioc,
      move (a),
      [&r, &x, &ioc] (exception_ptr e, T v)
      {
        if (e)
          x = e;
        else
          r = move (v);

        ioc.stop ();
      });

    ioc.restart ();
    ioc.run ();
    ioc.restart ();

    if (x)
      rethrow_exception (x);

    return move (*r);
  }

  static int
  print_info (const env_store& s,
              const fs::path& dir,
              const fs::path& env)
  {
    auto& o (cout);

    error_code ec;
    optional<string> v (version_tracker ().read (dir));

    o << "launcher:      " << WARDEN_VERSION_ID << "\n"
      << "directory:     " << dir.string () << "\n"
      << "configuration: " << env.string ()
      << (fs::exists (env, ec) ? "" : " (missing)") << "\n"
      << "worker:        " << (v ? *v : "not installed") << "\n"
      << "companion:     " << s.companion_host () << ':'
      << s.companion_port ()
      << (s.companion_required () ? "" : " (not required)") << "\n";

    o << "settings:" << "\n";

    for (string_view k: env_store::keys)
    {
      string n (k);
      optional<string> x (s.get (n));

      o << "  " << n << '=';

      if (x)
        o << (secret_key (n) ? "<set>" : *x);

      o << "\n";
    }

    return 0;
  }

  static int
  set_values (const vector<string>& as, env_store& s, const fs::path& f)
  {
    for (const string& a: as)
    {
      size_t p (a.find ('='));

      if (p == string::npos || p == 0)
      {
        cerr << "error: invalid assignment '" << a << "', expected "
             << "<key>=<value>" << "\n";
        return 1;
      }

      string k (a, 0, p);

      if (!env_store::whitelisted (k))
      {
        cerr << "error: unknown configuration key " << k << "\n"
             << "  info: run with --info to see the known keys" << "\n";
        return 1;
      }

      s.set (k, string (a, p + 1));
    }

    // Merging needs a file to merge into.
    //
    error_code ec;
    if (!fs::exists (f, ec))
    {
      if (f.has_parent_path ())
        fs::create_directories (f.parent_path (), ec);

      ofstream ofs (f, ios::binary);
      if (!ofs)
      {
        cerr << "error: unable to create " << f.string () << "\n";
        return 1;
      }
    }

    s.save_to_file (f);

    cout << "updated " << f.string () << "\n";
    return 0;
  }

  static int
  uninstall (const options& opt,
             const fs::path& dir,
             const fs::path& env,
             const fs::path& exe)
  {
    vector<fs::path> ps;

    auto add = [&ps] (fs::path p)
    {
      error_code ec;
      if (!fs::exists (p, ec))
        return;

      for (const fs::path& x: ps)
        if (x == p)
          return;

      ps.push_back (move (p));
    };

    // Worker binaries, plus whatever interrupted downloads left behind
    // here and next to the launcher.
    //
    auto scan = [&add] (const fs::path& d, bool workers)
    {
      error_code ec;
      for (const fs::directory_entry& e: fs::directory_iterator (d, ec))
      {
        string n (e.path ().filename ().string ());

        if ((workers && n.rfind (worker_binary_prefix, 0) == 0) ||
            n.rfind (binary_installer::temp_prefix, 0) == 0)
          add (e.path ());
      }
    };

    scan (dir, true);
    scan (exe.parent_path (), false);

    add (version_tracker ().path (dir));
    add (env);
    add (exe);

    if (ps.empty ())
    {
      cout << "nothing to remove" << "\n";
      return 0;
    }

    cout << "the following files will be removed:" << "\n";
    for (const fs::path& p: ps)
      cout << "  " << p.string () << "\n";

    if (!opt.yes () && !confirm_action ("continue? [y/N]", 'n'))
      return 0;

    int r (0);
    for (const fs::path& p: ps)
    {
      error_code ec;
      fs::remove (p, ec);

      if (ec)
      {
        cerr << "error: unable to remove " << p.string () << ": "
             << ec.message () << "\n";
        r = 1;
      }
    }

    self_replacer::remove_leftovers (exe);
    return r;
  }
}

int
main (int argc, char* argv[])
{
  using namespace std;
  using namespace warden;

  try
  {
    options opt (argc, argv);

    // Handle --version.
    //
    if (opt.version ())
    {
      auto& o (cout);

      o << "warden " << WARDEN_VERSION_ID << "\n";

      return 0;
    }

    // Handle --help.
    //
    if (opt.help ())
    {
      auto& o (cout);

      o << "usage: warden [options]" << "\n"
        << "options:"                << "\n";

      opt.print_usage (o);

      return 0;
    }

    if (opt.run () && !opt.tag_specified ())
    {
      cerr << "error: --run requires --tag" << "\n";
      return 1;
    }

    if (opt.update_interval () == 0 || opt.self_update_interval () == 0)
    {
      cerr << "error: update intervals must be positive" << "\n";
      return 1;
    }

    fs::path exe (self_replacer::current_executable_path ());

    fs::path dir (opt.dir_specified ()
                  ? fs::path (opt.dir ())
                  : exe.parent_path ());
    dir = fs::absolute (dir);

    fs::path env (opt.env_specified ()
                  ? fs::path (opt.env ())
                  : default_env_path ());
    env = fs::absolute (env);

    // Worker configuration: the environment first, then whatever else the
    // configuration file has.
    //
    env_store es (env_store::load_from_environment ());

    if (!es.read_file (env) && opt.verbose ())
      cout << "no configuration file at " << env.string () << "\n";

    if (opt.set_specified ())
      return set_values (opt.set (), es, env);

    if (opt.info ())
      return print_info (es, dir, env);

    if (opt.uninstall ())
      return uninstall (opt, dir, env, exe);

    self_replacer::remove_leftovers (exe);

    asio::io_context ioc;
    update_coordinator uc (ioc, current_host (), true);

    // Handle --update.
    //
    if (opt.update ())
    {
      update_result w (run_once (ioc, uc.update_worker (dir,
                                                        worker_binary_name ())));
      cout << format_update_result ("worker", w) << "\n";

      bool ok (static_cast<bool> (w));

      if (!opt.no_self_update ())
      {
        update_result l (run_once (ioc, uc.update_self (exe,
                                                        WARDEN_VERSION_ID)));
        cout << format_update_result ("launcher", l) << "\n";

        ok = ok && static_cast<bool> (l);
      }

      return ok ? 0 : 1;
    }

    string binary (worker_binary_name ());
    bool pinned (false);

    if (opt.tag_specified ())
    {
      update_result r (run_once (ioc, uc.install_tag (dir, opt.tag ())));

      if (!r)
      {
        cerr << "error: unable to install worker " << opt.tag () << ": "
             << r.error_message << "\n";
        return 1;
      }

      cout << format_update_result ("worker", r) << "\n";

      if (!opt.run ())
        return 0;

      binary = r.installed_path.filename ().string ();
      pinned = true;
    }
    else
    {
      error_code ec;
      bool present (fs::exists (dir / binary, ec));

      // Without update checks we still have to install something to run.
      //
      if (!present || !opt.no_update_check ())
      {
        update_result r (run_once (ioc, uc.update_worker (dir, binary)));

        if (!r)
        {
          if (!present)
          {
            cerr << "error: unable to install worker: " << r.error_message
                 << "\n";
            return 1;
          }

          cerr << "warning: unable to update worker: " << r.error_message
               << ", running the installed one" << "\n";
        }
        else if (r.status == update_status::updated)
          cout << format_update_result ("worker", r) << "\n";
      }
    }

    try
    {
      file_limits_result l (raise_file_limits ());

      if (l.changed ())
        cout << "raised open file limit from " << l.before.soft << " to "
             << l.after.soft << "\n";
    }
    catch (const process_error& e)
    {
      cerr << "warning: " << e.what () << "\n";
    }

    supervisor_config c;
    c.directory = dir;
    c.binary = binary;
    c.env_file = env;

    if (opt.origin_specified ())
      c.origin = opt.origin ();

    c.check_updates = !pinned && !opt.no_update_check ();
    c.update_interval = chrono::seconds (opt.update_interval ());
    c.self_update = !pinned && !opt.no_self_update ();
    c.self_update_interval = chrono::seconds (opt.self_update_interval ());
    c.self_version = WARDEN_VERSION_ID;
    c.self_path = exe;
    c.companion_required = es.companion_required ();
    c.companion = make_companion_config (es);
    c.verbose = opt.verbose ();
    c.progress = true;

    auto launcher (make_shared<process_launcher> (ioc));

    supervisor::services_type s;
    s.resolver = uc.resolver ();
    s.installer = uc.installer ();
    s.tracker = uc.tracker ();
    s.replacer = uc.replacer ();
    s.launcher = launcher;
    s.companion = make_shared<companion_manager> (ioc, *launcher);

    auto cancel (make_shared<cancellation_signal> (ioc.get_executor ()));

    termination_listener tl (ioc, *cancel);
    tl.start ();

    auto sv (make_shared<supervisor> (ioc, move (c), move (s), cancel));

    int exit_code (0);

    asio::co_spawn (
      ioc,
      sv->run (),
      [&exit_code, &ioc, &tl] (exception_ptr ex)
      {
        if (ex)
        {
          try { rethrow_exception (ex); }
          catch (const exception& e)
          {
            cerr << "error: " << e.what () << "\n";
            exit_code = 1;
          }
        }

        tl.stop ();
        ioc.stop ();
      });

    ioc.restart ();
    ioc.run ();
    return exit_code;
  }
  catch (const cli::exception& ex)
  {
    cerr << "error: " << ex.what () << "\n";
    return 1;
  }
  catch (const exception& ex)
  {
    cerr << "error: " << ex.what () << "\n";
    return 1;
  }
}
