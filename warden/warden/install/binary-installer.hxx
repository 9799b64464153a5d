#pragma once

#include <string>
#include <cstdint>
#include <utility>
#include <filesystem>
#include <system_error>

#include <boost/asio.hpp>

#include <warden/warden-http.hxx>
#include <warden/release/release-types.hxx>

namespace warden
{
  namespace asio = boost::asio;
  namespace fs = std::filesystem;

  // Temporary file that is removed when this object goes away unless it was
  // released first. That includes the destruction of a suspended coroutine
  // frame (for example, with its io_context), where no exception is thrown.
  //
  class temp_file
  {
  public:
    explicit
    temp_file (fs::path p): path_ (std::move (p)) {}

    ~temp_file ()
    {
      if (!path_.empty ())
      {
        std::error_code ec;
        fs::remove (path_, ec);
      }
    }

    temp_file (const temp_file&) = delete;
    temp_file& operator= (const temp_file&) = delete;

    const fs::path&
    path () const noexcept
    {
      return path_;
    }

    // Keep the file (it has been renamed into place).
    //
    void
    release () noexcept
    {
      path_.clear ();
    }

  private:
    fs::path path_;
  };

  // Atomic installation of a release asset.
  //
  // We never write to the destination directly. Instead the asset is
  // streamed into a private temporary file in the destination directory
  // (same file system, so the final rename is atomic) and only a complete
  // download is renamed over the destination. That way an interrupted
  // transfer leaves whatever was there before (nothing, or the previous
  // binary) intact and nobody ever observes a half-written executable.
  //
  // The fetcher is anything with
  //
  //   asio::awaitable<std::uint64_t>
  //   download_file (const std::string& url,
  //                  const fs::path& target,
  //                  std::function<void (std::uint64_t, std::uint64_t)>)
  //
  template <typename F = http_coordinator>
  class basic_binary_installer
  {
  public:
    using fetcher_type = F;

    static constexpr const char* temp_prefix = ".warden-download-";

    template <typename... A>
    explicit
    basic_binary_installer (A&&... a)
      : fetcher_ (std::forward<A> (a)...) {}

    basic_binary_installer (const basic_binary_installer&) = delete;
    basic_binary_installer& operator= (const basic_binary_installer&) = delete;

    // Install the asset as dir/name and make it executable. Show a progress
    // line on stderr if requested.
    //
    // Returns the installed path. Throws network_error or io_error, in which
    // case the destination is untouched and the temporary file is gone.
    //
    asio::awaitable<fs::path>
    install (const release_asset& asset,
             const fs::path& dir,
             const std::string& name,
             bool progress);

    // Fresh temporary path for installing name into dir.
    //
    static fs::path
    temp_path (const fs::path& dir, const std::string& name);

    fetcher_type&
    fetcher () noexcept
    {
      return fetcher_;
    }

  private:
    fetcher_type fetcher_;
  };

  using binary_installer = basic_binary_installer<>;
}

#include <warden/install/binary-installer.txx>
