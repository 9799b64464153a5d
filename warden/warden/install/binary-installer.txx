#include <random>
#include <sstream>
#include <iomanip>
#include <iostream>
#include <optional>
#include <exception>
#include <system_error>

#include <warden/warden-error.hxx>
#include <warden/install/install-progress.hxx>

namespace warden
{
  template <typename F>
  fs::path basic_binary_installer<F>::
  temp_path (const fs::path& d, const std::string& n)
  {
    std::random_device rd;
    std::ostringstream o;
    o << temp_prefix << n << '-'
      << std::hex << std::setw (8) << std::setfill ('0') << rd ();
    return d / o.str ();
  }

  template <typename F>
  asio::awaitable<fs::path> basic_binary_installer<F>::
  install (const release_asset& a,
           const fs::path& d,
           const std::string& n,
           bool show)
  {
    if (a.download_url.empty ())
      throw not_found ("asset " + a.name + " has no download URL");

    std::error_code ec;
    fs::create_directories (d, ec);
    if (ec)
      throw io_error (describe ("unable to create " + d.string (), ec));

    temp_file t (temp_path (d, n));
    fs::path p (d / n);

    std::optional<install_progress> pg;
    if (show)
      pg.emplace (std::cerr, a.name);

    auto cb = [&pg] (std::uint64_t c, std::uint64_t tot)
    {
      if (pg)
        pg->update (c, tot);
    };

    try
    {
      std::uint64_t r (
        co_await fetcher_.download_file (a.download_url, t.path (), cb));

      if (pg)
        pg->finish ();

      // A connection that closes early without an error gives us a short
      // file that still looks like a successful transfer.
      //
      if (a.size != 0 && r != a.size)
        throw io_error ("download of " + a.name + " is truncated (" +
                        std::to_string (r) + " of " +
                        std::to_string (a.size) + " bytes)");
    }
    catch (const std::exception&)
    {
      if (pg)
        pg->finish ();

      throw;
    }

    fs::rename (t.path (), p, ec);
    if (ec)
      throw io_error (describe ("unable to move " + t.path ().string () +
                                " to " + p.string (), ec));

    t.release ();

    fs::permissions (p,
                     fs::perms::owner_all |
                     fs::perms::group_read | fs::perms::group_exec |
                     fs::perms::others_read | fs::perms::others_exec,
                     fs::perm_options::replace,
                     ec);
    if (ec)
      throw io_error (describe ("unable to set permissions on " +
                                p.string (), ec));

    co_return p;
  }
}
