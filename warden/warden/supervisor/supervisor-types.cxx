#include <warden/supervisor/supervisor-types.hxx>

#include <ostream>

#include <warden/version.hxx>

using namespace std;

namespace warden
{
  string
  to_string (supervisor_state s)
  {
    switch (s)
    {
    case supervisor_state::starting:             return "starting";
    case supervisor_state::running:              return "running";
    case supervisor_state::running_without_main: return "running without main";
    case supervisor_state::terminating:          return "terminating";
    case supervisor_state::stopped:              return "stopped";
    }

    return "unknown";
  }

  ostream&
  operator<< (ostream& o, supervisor_state s)
  {
    return o << to_string (s);
  }

  static inline const char*
  executable_extension ()
  {
#ifdef _WIN32
    return ".exe";
#else
    return "";
#endif
  }

  string
  worker_binary_name ()
  {
    return string (worker_binary_prefix) + "_latest" + executable_extension ();
  }

  string
  pinned_binary_name (const string& v)
  {
    return string (worker_binary_prefix) + "_v" + v + executable_extension ();
  }

  string
  default_origin ()
  {
    return "launcher/v" WARDEN_VERSION_ID;
  }
}
