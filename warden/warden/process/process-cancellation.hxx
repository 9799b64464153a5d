#pragma once

#include <mutex>
#include <atomic>
#include <vector>
#include <cstddef>
#include <utility>
#include <functional>

#include <boost/asio.hpp>

namespace warden
{
  namespace asio = boost::asio;

  // One-shot cancellation signal.
  //
  // Can be fired from any thread (including a signal handler's completion)
  // and any number of times, but only the first call has an effect.
  // Subscribers are notified on the signal's executor. Subscribing to an
  // already fired signal notifies right away (that is, through the executor
  // rather than from within subscribe()).
  //
  class cancellation_signal
  {
  public:
    using handler_type = std::function<void ()>;
    using subscription = std::size_t;

    explicit
    cancellation_signal (asio::any_io_executor ex): ex_ (std::move (ex)) {}

    cancellation_signal (const cancellation_signal&) = delete;
    cancellation_signal& operator= (const cancellation_signal&) = delete;

    // Return true if this call fired the signal.
    //
    bool
    fire ();

    bool
    fired () const noexcept {return fired_.load ();}

    subscription
    subscribe (handler_type);

    // Unsubscribing an unknown (or already removed) subscription is a no-op.
    //
    void
    unsubscribe (subscription) noexcept;

  private:
    asio::any_io_executor ex_;
    std::atomic<bool> fired_ {false};

    std::mutex mutex_;
    subscription next_ = 0;
    std::vector<std::pair<subscription, handler_type>> handlers_;
  };
}
