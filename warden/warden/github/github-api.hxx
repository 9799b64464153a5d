#pragma once

#include <string>
#include <vector>
#include <cstddef>
#include <cstdint>
#include <utility>
#include <optional>

#include <boost/asio.hpp>
#include <boost/json.hpp>

#include <warden/http/http-client.hxx>
#include <warden/github/github-types.hxx>
#include <warden/github/github-endpoint.hxx>

namespace warden
{
  namespace asio = boost::asio;
  namespace json = boost::json;

  // GitHub API traits for customization.
  //
  struct github_api_traits
  {
    using client_type = http_client;
    using endpoint_type = github_endpoint;
    using release_type = github_release;
    using asset_type = github_asset;

    // Parse JSON response into typed object.
    //
    static release_type
    parse_release (const json::value& jv);

    static asset_type
    parse_asset (const json::value& jv);

    static std::vector<release_type>
    parse_releases (const json::value& jv);

    // Default User-Agent header. GitHub rejects requests without one.
    //
    static std::string
    user_agent ();

    // API version header.
    //
    static std::string
    api_version ()
    {
      return "2022-11-28";
    }

    // Releases per page (GitHub caps it at 100) and the most pages we are
    // prepared to walk for one listing.
    //
    static constexpr std::uint32_t page_size = 100;
    static constexpr std::size_t max_pages = 50;

    // Extract the rel="next" URL from a Link header:
    //
    // <https://api.github.com/...&page=2>; rel="next", <...>; rel="last"
    //
    static std::optional<std::string>
    next_page (const std::string& link);
  };

  // GitHub API client (releases only).
  //
  template <typename T = github_api_traits>
  class github_api
  {
  public:
    using traits_type = T;
    using client_type = typename traits_type::client_type;
    using endpoint_type = typename traits_type::endpoint_type;
    using release_type = typename traits_type::release_type;
    using asset_type = typename traits_type::asset_type;

    explicit
    github_api (asio::io_context& ioc);

    github_api (const github_api&) = delete;
    github_api& operator= (const github_api&) = delete;

    // List all the releases of a repository, newest first, following the
    // pagination links page by page.
    //
    asio::awaitable<std::vector<release_type>>
    get_releases (const std::string& owner, const std::string& repo);

    client_type&
    client () noexcept
    {
      return http_;
    }

  private:
    struct page
    {
      json::value body;
      std::optional<std::string> next;
    };

    // GET the URL and parse the reply as JSON. Throws network_error on a
    // transport failure, a non-2xx status, or a malformed body.
    //
    asio::awaitable<page>
    fetch (const std::string& url);

    client_type http_;
  };
}

#include <warden/github/github-api.txx>
