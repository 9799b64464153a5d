#include <warden/process/process-limits.hxx>

#include <cerrno>
#include <system_error>

#ifndef _WIN32
#  include <sys/resource.h>
#endif

#include <warden/warden-error.hxx>

using namespace std;

namespace warden
{
  file_limits_result
  raise_file_limits ()
  {
    file_limits_result r;

#ifndef _WIN32
    rlimit l;
    if (getrlimit (RLIMIT_NOFILE, &l) != 0)
      throw process_error (
        describe ("unable to query open file limit",
                  error_code (errno, generic_category ())));

    r.before.soft = static_cast<uint64_t> (l.rlim_cur);
    r.before.hard = static_cast<uint64_t> (l.rlim_max);
    r.after = r.before;

    // An unlimited hard limit would make the target meaningless.
    //
    if (l.rlim_max == RLIM_INFINITY)
      return r;

    rlim_t t (l.rlim_max / 10);

    if (l.rlim_cur != RLIM_INFINITY && l.rlim_cur < t)
    {
      l.rlim_cur = t;

      if (setrlimit (RLIMIT_NOFILE, &l) != 0)
        throw process_error (
          describe ("unable to raise open file limit",
                    error_code (errno, generic_category ())));

      r.after.soft = static_cast<uint64_t> (t);
    }
#endif

    return r;
  }
}
