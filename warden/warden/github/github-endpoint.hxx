#pragma once

#include <string>
#include <sstream>
#include <cstdint>

namespace warden
{
  // GitHub API endpoint builder.
  //
  // Constructs GitHub REST API endpoint URLs following the pattern:
  // https://api.github.com/<path>
  //
  class github_endpoint
  {
  public:
    static constexpr const char* api_base = "https://api.github.com";

    static std::string
    repo_releases (const std::string& owner,
                   const std::string& repo,
                   std::uint32_t per_page = 0)
    {
      return per_page != 0
        ? build ("/repos/", owner, "/", repo, "/releases?per_page=", per_page)
        : build ("/repos/", owner, "/", repo, "/releases");
    }

  private:
    template <typename... Args>
    static std::string
    build (Args&&... args)
    {
      std::ostringstream os;
      os << api_base;
      (os << ... << args);
      return os.str ();
    }
  };
}
