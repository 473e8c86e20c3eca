#include "devtasks/cache/cache_oracle.hpp"

namespace devtasks {

auto MemoryCache::lookup(const Fingerprint &fingerprint)
    -> task<Result<bool>> {
  co_return ok(contains(fingerprint));
}

auto MemoryCache::record(const Fingerprint &fingerprint) -> Result<void> {
  std::lock_guard lock(mutex_);
  entries_.insert(fingerprint);
  return ok();
}

auto MemoryCache::contains(const Fingerprint &fingerprint) const -> bool {
  std::lock_guard lock(mutex_);
  return entries_.contains(fingerprint);
}

auto MemoryCache::size() const -> std::size_t {
  std::lock_guard lock(mutex_);
  return entries_.size();
}

} // namespace devtasks
