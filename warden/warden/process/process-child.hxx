#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>
#include <optional>
#include <functional>
#include <filesystem>

#include <boost/asio.hpp>
#include <boost/process.hpp>

namespace warden
{
  namespace asio = boost::asio;
  namespace bp = boost::process;
  namespace fs = std::filesystem;

  // What to run and how.
  //
  struct launch_request
  {
    fs::path program;
    std::vector<std::string> arguments;

    // Variables set on top of the inherited environment. Only the child
    // sees them: our own environment is never modified.
    //
    std::map<std::string, std::string> environment;

    // Empty means our current directory.
    //
    fs::path working_directory;

    // Discard the child's stdout/stderr (and give it no stdin).
    //
    bool quiet = false;
  };

  // Handler called on the io_context when the process exits by itself.
  //
  using exit_handler = std::function<void (int exit_code)>;

  // Running child process.
  //
  // Exit is observed asynchronously through the io_context the process was
  // spawned with. Destroying a still running child kills it.
  //
  class child_process
  {
  public:
    // Spawn the process. Throws process_error.
    //
    child_process (asio::io_context&, const launch_request&, exit_handler);

    child_process (const child_process&) = delete;
    child_process& operator= (const child_process&) = delete;

    int
    pid () const noexcept {return pid_;}

    bool
    running () const noexcept {return !state_->exited;}

    std::optional<int>
    exit_code () const noexcept {return state_->exit_code;}

    // Kill the process (SIGKILL on POSIX). A process that has already
    // exited is not an error. After this call the exit handler is no longer
    // invoked. Throws process_error.
    //
    void
    kill ();

  private:
    struct state
    {
      bool exited = false;
      std::optional<int> exit_code;
      exit_handler handler;
    };

    std::shared_ptr<state> state_;
    bp::child child_;
    int pid_ = 0;
  };

  // Spawns child processes on an io_context.
  //
  class process_launcher
  {
  public:
    using process_type = child_process;

    explicit
    process_launcher (asio::io_context& ioc): ioc_ (ioc) {}

    std::shared_ptr<process_type>
    spawn (const launch_request& r, exit_handler h = nullptr)
    {
      return std::make_shared<process_type> (ioc_, r, std::move (h));
    }

    // Look the program up in PATH. Return empty path if not found.
    //
    static fs::path
    find_program (const std::string& name);

  private:
    asio::io_context& ioc_;
  };
}
