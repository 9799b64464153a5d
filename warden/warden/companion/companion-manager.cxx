#include <warden/companion/companion-manager.hxx>

using namespace std;

namespace warden
{
  companion_config
  make_companion_config (const env_store& s)
  {
    companion_config r;
    r.host = s.companion_host ();
    r.port = s.companion_port ();
    return r;
  }
}
