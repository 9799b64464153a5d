#pragma once

#include <map>
#include <array>
#include <string>
#include <optional>
#include <filesystem>
#include <string_view>

namespace warden
{
  namespace fs = std::filesystem;

  // Worker configuration as KEY=VALUE pairs.
  //
  // Only a fixed set of keys is ever read from the environment or written to
  // the configuration file. Writing merges into the existing file: the
  // first line assigning each key is replaced and everything else (comments,
  // blank lines, unrelated keys, later assignments of the same key) is kept
  // byte for byte.
  //
  class env_store
  {
  public:
    using entries_type = std::map<std::string, std::string>;

    static constexpr std::array<std::string_view, 13> keys {
      "RUST_LOG",
      "DKN_WALLET_SECRET_KEY",
      "DKN_MODELS",
      "DKN_P2P_LISTEN_ADDR",
      "DKN_BATCH_SIZE",
      "OPENAI_API_KEY",
      "GEMINI_API_KEY",
      "OPENROUTER_API_KEY",
      "SERPER_API_KEY",
      "JINA_API_KEY",
      "OLLAMA_HOST",
      "OLLAMA_PORT",
      "OLLAMA_AUTO_PULL"};

    static constexpr const char* default_companion_host = "http://127.0.0.1";
    static constexpr const char* default_companion_port = "11434";

    env_store () = default;

    // Read the whitelisted keys from the process environment. Keys that are
    // unset or empty are left out.
    //
    static env_store
    load_from_environment ();

    // Add the whitelisted assignments found in the configuration file for
    // keys we don't have yet, so values from the environment take
    // precedence. As with merging, only the first assignment of a key counts
    // and empty values are skipped. Doesn't make the store dirty.
    //
    // Return false if there is no such file. Throws io_error.
    //
    bool
    read_file (const fs::path&);

    static bool
    whitelisted (std::string_view key) noexcept;

    std::optional<std::string>
    get (const std::string& key) const;

    // Throws std::invalid_argument if the key is not whitelisted.
    //
    void
    set (const std::string& key, std::string value);

    bool
    dirty () const noexcept {return dirty_;}

    const entries_type&
    entries () const noexcept {return entries_;}

    // Merge our entries into the configuration file content and return the
    // result. Entries without a matching line are appended in key order.
    // The input's trailing newline (or lack of it) is preserved.
    //
    std::string
    merge_into (const std::string& content) const;

    // Merge our entries into the file in place. The file must exist. Throws
    // io_error.
    //
    void
    save_to_file (const fs::path&);

    // Companion service address.
    //
    std::string
    companion_host () const;

    std::string
    companion_port () const;

    // True if one of the configured models is served locally by the
    // companion. Those use the name:tag form (llama3.1:8b) while hosted
    // models (gpt-4o, gemini-1.5-pro) don't.
    //
    bool
    companion_required () const;

  private:
    entries_type entries_;
    bool dirty_ = false;
  };

  // Default configuration file location: ~/.dria/dkn-compute-launcher/.env,
  // or .env in the current directory if there is no home.
  //
  fs::path
  default_env_path ();

  // True if the key's value should not be echoed back to the user.
  //
  bool
  secret_key (std::string_view key) noexcept;
}
