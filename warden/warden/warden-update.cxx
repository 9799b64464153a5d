#include <warden/warden-update.hxx>

#include <iostream>
#include <exception>
#include <system_error>

#include <warden/warden-error.hxx>
#include <warden/supervisor/supervisor-types.hxx>

using namespace std;

namespace warden
{
  string
  to_string (update_status s)
  {
    switch (s)
    {
    case update_status::up_to_date: return "up to date";
    case update_status::updated:    return "updated";
    case update_status::failed:     return "failed";
    }

    return "unknown";
  }

  update_coordinator::
  update_coordinator (asio::io_context& ioc, host_platform h, bool p)
    : host_ (move (h)),
      progress_ (p),
      resolver_ (make_shared<resolver_type> (ioc)),
      installer_ (make_shared<installer_type> (ioc)),
      tracker_ (make_shared<tracker_type> ()),
      replacer_ (make_shared<replacer_type> ())
  {
  }

  asio::awaitable<update_result> update_coordinator::
  update_worker (fs::path d, string b)
  {
    update_result r;
    r.installed_path = d / b;

    try
    {
      release l (co_await resolver_->latest (worker_repository ()));
      r.version = l.version;

      if (!tracker_->update_needed (d, l.version, b))
      {
        r.status = update_status::up_to_date;
        co_return r;
      }

      release_asset a (resolver_->resolve_asset (l, host_));

      cout << "installing worker " << l.version << "\n";

      r.installed_path = co_await installer_->install (a, d, b, progress_);
      tracker_->write (d, l.version);

      r.status = update_status::updated;
    }
    catch (const std::exception& e)
    {
      r.status = update_status::failed;
      r.error_message = e.what ();
    }

    co_return r;
  }

  asio::awaitable<update_result> update_coordinator::
  install_tag (fs::path d, string t)
  {
    update_result r;

    try
    {
      release l (co_await resolver_->find_by_tag (worker_repository (), t));
      r.version = l.version;

      string b (pinned_binary_name (l.version));
      r.installed_path = d / b;

      error_code ec;
      if (fs::exists (r.installed_path, ec))
      {
        r.status = update_status::up_to_date;
        co_return r;
      }

      release_asset a (resolver_->resolve_asset (l, host_));

      cout << "installing worker " << l.version << "\n";

      r.installed_path = co_await installer_->install (a, d, b, progress_);
      r.status = update_status::updated;
    }
    catch (const std::exception& e)
    {
      r.status = update_status::failed;
      r.error_message = e.what ();
    }

    co_return r;
  }

  asio::awaitable<update_result> update_coordinator::
  update_self (fs::path x, string cv)
  {
    update_result r;
    r.installed_path = x;

    fs::path p;

    try
    {
      release l (co_await resolver_->latest (launcher_repository ()));
      r.version = l.version;

      if (l.version == cv)
      {
        r.status = update_status::up_to_date;
        co_return r;
      }

      release_asset a (resolver_->resolve_asset (l, host_));

      cout << "installing launcher " << l.version << "\n";

      p = co_await installer_->install (a,
                                        x.parent_path (),
                                        ".tmp_" + x.filename ().string (),
                                        progress_);

      self_replace_result s (replacer_->replace (p, x));

      if (s)
        r.status = update_status::updated;
      else
      {
        r.status = update_status::failed;
        r.error_message = s.error_message;
      }
    }
    catch (const std::exception& e)
    {
      r.status = update_status::failed;
      r.error_message = e.what ();
    }

    if (!p.empty ())
    {
      error_code ec;
      fs::remove (p, ec);
    }

    co_return r;
  }

  string
  format_update_result (const string& w, const update_result& r)
  {
    string s (w + ": ");

    switch (r.status)
    {
    case update_status::up_to_date:
      s += "up to date";
      if (!r.version.empty ())
        s += " (" + r.version + ')';
      break;
    case update_status::updated:
      s += "updated to " + r.version;
      break;
    case update_status::failed:
      s += "failed: " + r.error_message;
      break;
    }

    return s;
  }
}
