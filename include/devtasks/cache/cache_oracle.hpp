#pragma once

#include "devtasks/core/coroutine.hpp"
#include "devtasks/core/error.hpp"
#include "devtasks/util/id.hpp"

#include <ankerl/unordered_dense.h>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>

namespace devtasks {

// Answers whether a fingerprint has already produced a successful result.
// The engine only looks up; callers record after a run.
class ICacheOracle {
public:
  virtual ~ICacheOracle() = default;

  [[nodiscard]] virtual auto lookup(const Fingerprint &fingerprint)
      -> task<Result<bool>> = 0;

  [[nodiscard]] virtual auto record(const Fingerprint &fingerprint)
      -> Result<void> = 0;
};

class MemoryCache final : public ICacheOracle {
public:
  [[nodiscard]] auto lookup(const Fingerprint &fingerprint)
      -> task<Result<bool>> override;
  [[nodiscard]] auto record(const Fingerprint &fingerprint)
      -> Result<void> override;

  [[nodiscard]] auto contains(const Fingerprint &fingerprint) const -> bool;
  [[nodiscard]] auto size() const -> std::size_t;

private:
  mutable std::mutex mutex_;
  ankerl::unordered_dense::set<Fingerprint> entries_;
};

inline constexpr std::string_view kDefaultCachePath = ".devtasks/cache.json";

// JSON document on disk: {"version":1,"entries":{"<fingerprint>":<ms>}}.
class FileCache final : public ICacheOracle {
  struct PrivateTag {};

public:
  // Creates the parent directory if needed. CacheUnavailable if the
  // directory cannot be created or an existing file cannot be read.
  [[nodiscard]] static auto open(std::filesystem::path path)
      -> Result<std::shared_ptr<FileCache>>;

  FileCache(PrivateTag, std::filesystem::path path);

  [[nodiscard]] auto lookup(const Fingerprint &fingerprint)
      -> task<Result<bool>> override;
  // Rewrites the whole document through a temporary file and a rename.
  [[nodiscard]] auto record(const Fingerprint &fingerprint)
      -> Result<void> override;

  [[nodiscard]] auto path() const noexcept -> const std::filesystem::path & {
    return path_;
  }
  [[nodiscard]] auto size() const -> std::size_t;

private:
  [[nodiscard]] auto load() -> Result<void>;
  [[nodiscard]] auto save_locked() const -> Result<void>;

  std::filesystem::path path_;
  mutable std::mutex mutex_;
  ankerl::unordered_dense::map<std::string, std::int64_t> entries_;
};

} // namespace devtasks
