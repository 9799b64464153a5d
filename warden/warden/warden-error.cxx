#include <warden/warden-error.hxx>

#include <system_error>

using namespace std;

namespace warden
{
  string
  describe (const string& w, const error_code& ec)
  {
    string r (w);

    if (ec)
    {
      r += ": ";
      r += ec.message ();
    }

    return r;
  }
}
