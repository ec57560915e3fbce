#include <sovereign/config/feature_flags.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <algorithm>

namespace sovereign::config {

using sovereign::schema::error_code;

feature_flags::feature_flags() : flags_{defaults()} {}

std::map<std::string, bool, std::less<>> feature_flags::defaults() {
  return {
      {std::string{kFlagUnifiedIdentity}, true},
      {std::string{kFlagTest}, false},
  };
}

sovereign::schema::status feature_flags::load(
    const std::vector<std::string>& entries) {
  auto lock = std::scoped_lock{mutex_};
  if (loaded_) {
    return sovereign::schema::make_status(
        error_code::feature_flags_already_loaded,
        "feature flags have already been loaded", std::string{kCodespace});
  }

  auto unknown = std::vector<std::string>{};
  auto updates = std::vector<std::pair<std::string, bool>>{};
  for (const auto& entry : entries) {
    auto enable = !entry.starts_with('-');
    auto name = enable ? std::string_view{entry}
                       : std::string_view{entry}.substr(1);
    if (!flags_.contains(name)) {
      unknown.push_back(entry);
      continue;
    }
    updates.emplace_back(std::string{name}, enable);
  }

  if (!unknown.empty()) {
    std::sort(std::begin(unknown), std::end(unknown));
    return sovereign::schema::make_status(
        error_code::unknown_feature_flag,
        fmt::format("unknown feature flag(s): [{}]", fmt::join(unknown, " ")),
        std::string{kCodespace});
  }

  // Disables apply after enables when both name the same flag.
  std::stable_partition(std::begin(updates), std::end(updates),
                        [](const auto& update) { return update.second; });
  for (const auto& [name, enabled] : updates) {
    flags_[name] = enabled;
  }
  loaded_ = true;

  for (const auto& [name, enabled] : flags_) {
    spdlog::debug("Feature flag {} is {}", name,
                  enabled ? "enabled" : "disabled");
  }
  return {};
}

sovereign::schema::status feature_flags::reset() {
  auto lock = std::scoped_lock{mutex_};
  if (!loaded_) {
    return sovereign::schema::make_status(
        error_code::feature_flags_not_loaded,
        "feature flags have not been loaded", std::string{kCodespace});
  }
  flags_ = defaults();
  loaded_ = false;
  return {};
}

bool feature_flags::is_set(const std::string_view name) const {
  auto lock = std::scoped_lock{mutex_};
  if (!loaded_) {
    return false;
  }
  auto it = flags_.find(name);
  return it != std::end(flags_) && it->second;
}

bool feature_flags::loaded() const {
  auto lock = std::scoped_lock{mutex_};
  return loaded_;
}

}  // namespace sovereign::config
