#include "devtasks/cache/cache_oracle.hpp"

#include "devtasks/util/log.hpp"
#include "devtasks/util/time.hpp"

#include <glaze/json.hpp>

#include <unistd.h>

#include <chrono>
#include <format>
#include <fstream>
#include <iterator>
#include <map>
#include <string>
#include <system_error>

namespace devtasks {
namespace detail {

inline constexpr int kCacheFormatVersion = 1;

struct CacheDocument {
  int version{kCacheFormatVersion};
  std::map<std::string, std::int64_t> entries;
};

} // namespace detail
} // namespace devtasks

namespace glz {
template <> struct meta<devtasks::detail::CacheDocument> {
  using T = devtasks::detail::CacheDocument;
  static constexpr auto value =
      object("version", &T::version, "entries", &T::entries);
};
} // namespace glz

namespace devtasks {

namespace fs = std::filesystem;

auto FileCache::open(fs::path path) -> Result<std::shared_ptr<FileCache>> {
  if (path.empty()) {
    return fail(Error::InvalidArgument);
  }
  if (auto parent = path.parent_path(); !parent.empty()) {
    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec) {
      log::error("Cannot create cache directory {}: {}", parent.string(),
                 ec.message());
      return fail(Error::CacheUnavailable);
    }
  }

  auto cache = std::make_shared<FileCache>(PrivateTag{}, std::move(path));
  if (auto res = cache->load(); !res) {
    return fail(res.error());
  }
  return ok(std::move(cache));
}

FileCache::FileCache(PrivateTag, fs::path path) : path_(std::move(path)) {}

auto FileCache::load() -> Result<void> {
  std::error_code ec;
  if (!fs::exists(path_, ec)) {
    if (ec) {
      log::error("Cannot stat cache file {}: {}", path_.string(),
                 ec.message());
      return fail(Error::CacheUnavailable);
    }
    log::debug("Cache file {} does not exist yet", path_.string());
    return ok();
  }

  std::ifstream in(path_, std::ios::binary);
  if (!in) {
    log::error("Cannot read cache file {}", path_.string());
    return fail(Error::CacheUnavailable);
  }
  std::string text((std::istreambuf_iterator<char>(in)),
                   std::istreambuf_iterator<char>());

  detail::CacheDocument doc{};
  constexpr auto kOpts =
      glz::opts{.null_terminated = false, .error_on_unknown_keys = false};
  if (auto err = glz::read<kOpts>(doc, text); err) {
    log::warn("Discarding corrupt cache file {}: {}", path_.string(),
              glz::format_error(err, text));
    return ok();
  }
  if (doc.version != detail::kCacheFormatVersion) {
    log::warn("Discarding cache file {} with unsupported version {}",
              path_.string(), doc.version);
    return ok();
  }

  std::lock_guard lock(mutex_);
  entries_.clear();
  for (auto &[fingerprint, recorded_at] : doc.entries) {
    entries_.emplace(fingerprint, recorded_at);
  }
  log::debug("Loaded {} cache entries from {}", entries_.size(),
             path_.string());
  return ok();
}

auto FileCache::lookup(const Fingerprint &fingerprint) -> task<Result<bool>> {
  std::lock_guard lock(mutex_);
  co_return ok(entries_.contains(fingerprint.str()));
}

auto FileCache::record(const Fingerprint &fingerprint) -> Result<void> {
  std::lock_guard lock(mutex_);
  entries_.insert_or_assign(
      fingerprint.str(),
      util::to_unix_millis(std::chrono::system_clock::now()));
  return save_locked();
}

auto FileCache::size() const -> std::size_t {
  std::lock_guard lock(mutex_);
  return entries_.size();
}

auto FileCache::save_locked() const -> Result<void> {
  detail::CacheDocument doc{};
  for (const auto &[fingerprint, recorded_at] : entries_) {
    doc.entries.emplace(fingerprint, recorded_at);
  }
  auto json = glz::write_json(doc);
  if (!json) {
    return fail(Error::Unknown);
  }

  auto tmp = path_;
  tmp += std::format(".tmp.{}", ::getpid());
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out) {
      log::error("Cannot write cache file {}", tmp.string());
      return fail(Error::CacheUnavailable);
    }
    out << *json;
    if (!out.flush()) {
      log::error("Cannot write cache file {}", tmp.string());
      return fail(Error::CacheUnavailable);
    }
  }

  std::error_code ec;
  fs::rename(tmp, path_, ec);
  if (ec) {
    log::error("Cannot replace cache file {}: {}", path_.string(),
               ec.message());
    fs::remove(tmp, ec);
    return fail(Error::CacheUnavailable);
  }
  return ok();
}

} // namespace devtasks
