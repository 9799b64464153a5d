#include <warden/process/process-cancellation.hxx>

#include <algorithm>

using namespace std;

namespace warden
{
  bool cancellation_signal::
  fire ()
  {
    if (fired_.exchange (true))
      return false;

    vector<pair<subscription, handler_type>> hs;
    {
      lock_guard<mutex> l (mutex_);
      hs.swap (handlers_);
    }

    for (auto& h: hs)
      asio::post (ex_, move (h.second));

    return true;
  }

  cancellation_signal::subscription cancellation_signal::
  subscribe (handler_type h)
  {
    lock_guard<mutex> l (mutex_);

    subscription s (next_++);

    if (fired_.load ())
      asio::post (ex_, move (h));
    else
      handlers_.emplace_back (s, move (h));

    return s;
  }

  void cancellation_signal::
  unsubscribe (subscription s) noexcept
  {
    lock_guard<mutex> l (mutex_);

    handlers_.erase (remove_if (handlers_.begin (), handlers_.end (),
                                [s] (const auto& h) {return h.first == s;}),
                     handlers_.end ());
  }
}
