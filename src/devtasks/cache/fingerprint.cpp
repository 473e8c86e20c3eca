#include "devtasks/cache/fingerprint.hpp"

#include "devtasks/util/hash.hpp"
#include "devtasks/util/log.hpp"

#include <algorithm>
#include <array>
#include <filesystem>
#include <format>
#include <fstream>
#include <string>
#include <system_error>
#include <vector>

namespace devtasks {

namespace {

namespace fs = std::filesystem;

inline constexpr std::size_t kReadChunk = 64UZ * 1024;

auto hash_file(util::StableHasher &hasher, const fs::path &path) -> void {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    log::warn("Cannot read input {} for fingerprinting", path.string());
    hasher.field("<unreadable>");
    return;
  }
  hasher.field("<file>");
  std::array<char, kReadChunk> buffer{};
  while (in) {
    in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    auto got = static_cast<std::size_t>(in.gcount());
    if (got > 0) {
      hasher.update(std::string_view(buffer.data(), got));
    }
  }
}

auto hash_directory(util::StableHasher &hasher, const fs::path &root) -> void {
  std::vector<fs::path> files;
  std::error_code ec;
  for (auto it = fs::recursive_directory_iterator(root, ec);
       !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if (it->is_regular_file(ec)) {
      files.push_back(it->path());
    }
  }
  if (ec) {
    log::warn("Cannot walk input directory {}: {}", root.string(),
              ec.message());
    hasher.field("<unreadable>");
  }
  std::ranges::sort(files);

  hasher.field("<dir>");
  for (const auto &file : files) {
    hasher.field(file.lexically_relative(root).generic_string());
    hash_file(hasher, file);
  }
}

} // namespace

auto fingerprint_inputs(const TaskDefinition &definition)
    -> std::optional<Fingerprint> {
  if (definition.inputs.empty()) {
    return std::nullopt;
  }

  util::StableHasher hasher;
  hasher.field(definition.name.value());
  hasher.field(definition.command.value_or("<none>"));
  hasher.field(definition.working_dir);
  for (const auto &assignment : definition.env) {
    hasher.field(assignment);
  }

  for (const auto &input : definition.inputs) {
    fs::path path{input};
    if (path.is_relative() && !definition.working_dir.empty()) {
      path = fs::path{definition.working_dir} / path;
    }
    hasher.field(input);

    std::error_code ec;
    auto status = fs::status(path, ec);
    if (fs::is_regular_file(status)) {
      hash_file(hasher, path);
    } else if (fs::is_directory(status)) {
      hash_directory(hasher, path);
    } else {
      hasher.field("<missing>");
    }
  }

  auto fingerprint = Fingerprint{std::format("{:016x}", hasher.digest())};
  log::debug("Fingerprint of {}: {}", definition.name, fingerprint);
  return fingerprint;
}

} // namespace devtasks
