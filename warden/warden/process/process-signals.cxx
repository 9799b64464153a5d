#include <warden/process/process-signals.hxx>

#include <csignal>
#include <iostream>

using namespace std;

namespace warden
{
  termination_listener::
  termination_listener (asio::io_context& ioc, cancellation_signal& s)
    : signals_ (ioc, SIGINT, SIGTERM),
      signal_ (s)
  {
#ifdef SIGQUIT
    signals_.add (SIGQUIT);
#endif
  }

  void termination_listener::
  start ()
  {
    stopped_ = false;
    wait ();
  }

  void termination_listener::
  stop ()
  {
    stopped_ = true;

    boost::system::error_code ec;
    signals_.cancel (ec);
  }

  void termination_listener::
  wait ()
  {
    signals_.async_wait ([this] (const boost::system::error_code& ec, int n)
    {
      if (ec || stopped_)
        return;

      if (signal_.fire ())
        cout << "received signal " << n << ", shutting down" << "\n";
      else
        cerr << "warning: already shutting down" << "\n";

      wait ();
    });
  }
}
