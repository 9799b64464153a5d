#include <warden/process/process-child.hxx>

#include <system_error>

#include <warden/warden-error.hxx>

using namespace std;

namespace warden
{
  child_process::
  child_process (asio::io_context& ioc,
                 const launch_request& r,
                 exit_handler h)
    : state_ (make_shared<state> ())
  {
    state_->handler = move (h);

    // Start from a copy of our environment and apply the overrides to the
    // copy.
    //
    bp::environment env (boost::this_process::environment ());
    for (const auto& [k, v]: r.environment)
      env[k] = v;

    string wd (r.working_directory.empty ()
               ? fs::current_path ().string ()
               : r.working_directory.string ());

    // Note that the handler holds on to the shared state rather than to us
    // since the child may well outlive this object.
    //
    auto on_exit = [s = state_] (int code, const std::error_code&)
    {
      if (s->exited)
        return;

      s->exited = true;
      s->exit_code = code;

      if (s->handler)
        s->handler (code);
    };

    try
    {
      if (r.quiet)
        child_ = bp::child (bp::exe = r.program.string (),
                            bp::args = r.arguments,
                            env,
                            bp::start_dir = wd,
                            bp::std_in < bp::null,
                            bp::std_out > bp::null,
                            bp::std_err > bp::null,
                            bp::on_exit = on_exit,
                            ioc);
      else
        child_ = bp::child (bp::exe = r.program.string (),
                            bp::args = r.arguments,
                            env,
                            bp::start_dir = wd,
                            bp::on_exit = on_exit,
                            ioc);
    }
    catch (const bp::process_error& e)
    {
      throw process_error ("unable to start " + r.program.string () + ": " +
                           e.what ());
    }

    pid_ = static_cast<int> (child_.id ());
  }

  void child_process::
  kill ()
  {
    if (state_->exited)
      return;

    std::error_code ec;
    child_.terminate (ec);

    if (ec)
    {
      // Lost the race against a process exiting by itself.
      //
      if (state_->exited)
        return;

      throw process_error (describe ("unable to kill process " +
                                     std::to_string (pid_), ec));
    }

    state_->exited = true;
    state_->handler = nullptr;
  }

  fs::path process_launcher::
  find_program (const string& n)
  {
    boost::filesystem::path p (bp::search_path (n));
    return p.empty () ? fs::path () : fs::path (p.string ());
  }
}
