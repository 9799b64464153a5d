#pragma once

#include <string>
#include <cstdint>
#include <ostream>
#include <utility>

#include <ftxui/dom/elements.hpp>

namespace warden
{
  // Single-line download progress display.
  //
  // Redraws one line in place every time the rounded percentage changes:
  //
  // dkn-compute-binary-linux-amd64   48% <gauge>   12.3 MiB
  //
  // There is no interactive screen here (we may well be running under a
  // service manager); the line is rendered with the FTXUI DOM and written to
  // the stream as is.
  //
  class install_progress
  {
  public:
    install_progress (std::ostream& o, std::string label)
      : os_ (o), label_ (std::move (label)) {}

    // Report the bytes received so far. The total is 0 if unknown.
    //
    void
    update (std::uint64_t current, std::uint64_t total);

    // Terminate the line, if we drew anything.
    //
    void
    finish ();

    static ftxui::Element
    render (const std::string& label,
            std::uint64_t current,
            std::uint64_t total);

    static std::string
    format_bytes (std::uint64_t);

  private:
    std::ostream& os_;
    std::string label_;
    std::string reset_;
    int last_ = -1;
    bool drawn_ = false;
  };
}
