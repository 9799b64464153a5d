#include <warden/process/process-cancellation.hxx>

#include <thread>
#include <cassert>

#include <boost/asio.hpp>

using namespace std;
using namespace warden;

namespace asio = boost::asio;

static void
test_fire_once ()
{
  asio::io_context ioc;
  cancellation_signal s (ioc.get_executor ());

  int a (0), b (0), c (0);

  s.subscribe ([&a] {++a;});
  cancellation_signal::subscription sb (s.subscribe ([&b] {++b;}));
  s.subscribe ([&c] {++c;});

  s.unsubscribe (sb);
  s.unsubscribe (sb);  // Already removed.
  s.unsubscribe (1234); // Never existed.

  assert (!s.fired ());
  assert (s.fire ());
  assert (s.fired ());
  assert (!s.fire ());
  assert (!s.fire ());

  // Notification goes through the executor.
  //
  assert (a == 0 && c == 0);

  ioc.run ();

  assert (a == 1);
  assert (b == 0);
  assert (c == 1);

  // Late subscribers still hear about it.
  //
  int d (0);
  s.subscribe ([&d] {++d;});
  assert (d == 0);

  ioc.restart ();
  ioc.run ();
  assert (d == 1);

  // And the earlier ones are not notified again.
  //
  assert (a == 1 && c == 1);
}

static void
test_other_thread ()
{
  asio::io_context ioc;
  auto g (asio::make_work_guard (ioc));

  cancellation_signal s (ioc.get_executor ());

  bool notified (false);
  s.subscribe ([&notified, &g] ()
  {
    notified = true;
    g.reset ();
  });

  thread t ([&s] {s.fire ();});

  ioc.run ();
  t.join ();

  assert (notified);
  assert (s.fired ());
}

int
main ()
{
  test_fire_once ();
  test_other_thread ();
}
