#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string_view>

namespace devtasks::util {

// MurmurHash3 64-bit finalizer
[[nodiscard]] inline constexpr auto murmur3_mix64(std::uint64_t h) noexcept
    -> std::uint64_t {
  h ^= h >> 33;
  h *= 0xff51afd7ed558ccdULL;
  h ^= h >> 33;
  h *= 0xc4ceb9fe1a85ec53ULL;
  h ^= h >> 33;
  return h;
}

// Incremental FNV-1a. Unlike std::hash the result is stable across builds,
// so it is safe to persist.
class StableHasher {
public:
  auto update(std::string_view bytes) noexcept -> StableHasher & {
    for (unsigned char c : bytes) {
      state_ ^= c;
      state_ *= kPrime;
    }
    return *this;
  }

  // Length-prefixed field, so ("ab","c") and ("a","bc") differ.
  auto field(std::string_view bytes) noexcept -> StableHasher & {
    auto len = static_cast<std::uint64_t>(bytes.size());
    for (int i = 0; i < 8; ++i) {
      state_ ^= static_cast<unsigned char>(len >> (i * 8));
      state_ *= kPrime;
    }
    return update(bytes);
  }

  [[nodiscard]] auto digest() const noexcept -> std::uint64_t {
    return murmur3_mix64(state_);
  }

private:
  static constexpr std::uint64_t kOffset = 0xcbf29ce484222325ULL;
  static constexpr std::uint64_t kPrime = 0x100000001b3ULL;
  std::uint64_t state_{kOffset};
};

} // namespace devtasks::util
