#include <warden/install/install-progress.hxx>

#include <sstream>
#include <iomanip>

#include <ftxui/screen/screen.hpp>

using namespace std;
using namespace ftxui;

namespace warden
{
  void install_progress::
  update (uint64_t c, uint64_t t)
  {
    // With an unknown total we can't do a percentage, so redraw every
    // mebibyte instead.
    //
    int k (t != 0
           ? static_cast<int> (c * 100 / t)
           : static_cast<int> (c / (1024 * 1024)));

    if (k == last_)
      return;

    last_ = k;
    drawn_ = true;

    Element e (render (label_, c, t));

    Screen s (Screen::Create (Dimension::Full (), Dimension::Fit (e)));
    Render (s, e);

    os_ << reset_ << s.ToString () << flush;
    reset_ = s.ResetPosition ();
  }

  void install_progress::
  finish ()
  {
    if (drawn_)
      os_ << endl;

    reset_.clear ();
    drawn_ = false;
    last_ = -1;
  }

  Element install_progress::
  render (const string& l, uint64_t c, uint64_t t)
  {
    // Fixed widths so that the line doesn't jitter as the numbers change.
    //
    ostringstream b;
    b << right << setw (10) << format_bytes (c);

    if (t == 0)
      return hbox ({text (l), filler (), text (b.str ())});

    float p (static_cast<float> (c) / t);

    ostringstream pct;
    pct << right << setw (4) << static_cast<int> (p * 100) << "% ";

    return hbox ({
      text (l + ' '),
      text (pct.str ()),
      gauge (p) | flex,
      text (b.str ())
    });
  }

  string install_progress::
  format_bytes (uint64_t n)
  {
    ostringstream o;

    if (n < 1024)
      o << n << " B";
    else if (n < 1024 * 1024)
      o << fixed << setprecision (1) << (n / 1024.0) << " KiB";
    else if (n < 1024 * 1024 * 1024)
      o << fixed << setprecision (1) << (n / (1024.0 * 1024.0)) << " MiB";
    else
      o << fixed << setprecision (1)
        << (n / (1024.0 * 1024.0 * 1024.0)) << " GiB";

    return o.str ();
  }
}
