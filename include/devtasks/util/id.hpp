#pragma once

#include <algorithm>
#include <cctype>
#include <compare>
#include <concepts>
#include <format>
#include <functional>
#include <string>
#include <string_view>

namespace devtasks {

[[nodiscard]] inline auto has_control_chars(std::string_view value) noexcept
    -> bool {
  return std::any_of(value.begin(), value.end(),
                     [](unsigned char ch) { return std::iscntrl(ch) != 0; });
}

[[nodiscard]] inline auto is_valid_id_text(std::string_view value) noexcept
    -> bool {
  return !value.empty() && !has_control_chars(value);
}

// Phantom type tags for type-safe ID disambiguation
struct TaskTag {};
struct FingerprintTag {};

// Strongly typed string identifier. The tag keeps task names and fingerprints
// from being mixed up at compile time.
template <typename Tag> class TypedId {
public:
  explicit TypedId(std::string value) : value_(std::move(value)) {}
  explicit TypedId(std::string_view value) : value_(value) {}
  explicit TypedId(const char *value) : value_(value ? value : "") {}

  TypedId() = default;

  [[nodiscard]] auto value() const noexcept -> std::string_view {
    return value_;
  }
  [[nodiscard]] auto str() const noexcept -> const std::string & {
    return value_;
  }

  [[nodiscard]] friend auto operator<=>(const TypedId &lhs,
                                        const TypedId &rhs) = default;
  [[nodiscard]] friend auto operator==(const TypedId &lhs, const TypedId &rhs)
      -> bool = default;

  [[nodiscard]] friend auto operator==(const TypedId &lhs,
                                       std::string_view rhs) noexcept -> bool {
    return lhs.value_ == rhs;
  }

  [[nodiscard]] auto empty() const noexcept -> bool { return value_.empty(); }
  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return value_.size();
  }

private:
  std::string value_;
};

using TaskName = TypedId<TaskTag>;
using Fingerprint = TypedId<FingerprintTag>;

} // namespace devtasks

// `is_avalanching` lets ankerl::unordered_dense::hash use this directly
// instead of hashing the object representation.
template <typename Tag> struct std::hash<devtasks::TypedId<Tag>> {
  using is_avalanching = void;
  auto operator()(const devtasks::TypedId<Tag> &id) const noexcept
      -> std::size_t {
    return std::hash<std::string_view>{}(id.value());
  }
};

template <typename Tag>
struct std::formatter<devtasks::TypedId<Tag>>
    : std::formatter<std::string_view> {
  auto format(const devtasks::TypedId<Tag> &id, auto &ctx) const {
    return std::formatter<std::string_view>::format(id.value(), ctx);
  }
};
