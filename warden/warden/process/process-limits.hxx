#pragma once

#include <cstdint>

namespace warden
{
  struct file_limits
  {
    std::uint64_t soft = 0;
    std::uint64_t hard = 0;
  };

  struct file_limits_result
  {
    file_limits before;
    file_limits after;

    bool
    changed () const noexcept {return before.soft != after.soft;}
  };

  // The worker keeps a lot of peer connections open and the default soft
  // limit on open files (1024 on most Linux systems) is too tight for it. If
  // the soft limit is below a tenth of the hard limit, raise it to that.
  // Children inherit the limit.
  //
  // Nothing to do on Windows. Throws process_error.
  //
  file_limits_result
  raise_file_limits ();
}
