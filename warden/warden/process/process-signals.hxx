#pragma once

#include <boost/asio.hpp>

#include <warden/process/process-cancellation.hxx>

namespace warden
{
  namespace asio = boost::asio;

  // Turn interrupt/termination requests (SIGINT, SIGTERM, and SIGQUIT on
  // POSIX; Ctrl-C and Ctrl-Break on Windows) into a cancellation.
  //
  class termination_listener
  {
  public:
    termination_listener (asio::io_context&, cancellation_signal&);

    void
    start ();

    void
    stop ();

  private:
    void
    wait ();

    asio::signal_set signals_;
    cancellation_signal& signal_;
    bool stopped_ = false;
  };
}
