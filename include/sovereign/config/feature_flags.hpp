#pragma once

#include <sovereign/schema/result.hpp>

#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace sovereign::config {

inline constexpr auto kCodespace = std::string_view{"sovereign.config"};

inline constexpr auto kFlagUnifiedIdentity = std::string_view{"Unified-Identity"};
inline constexpr auto kFlagTest = std::string_view{"i_am_a_test_flag"};

/// Startup feature gate. Loaded once, read many times; every flag reads as
/// disabled until `load` succeeds.
class feature_flags final {
 public:
  feature_flags();
  feature_flags(const feature_flags&) = delete;
  feature_flags& operator=(const feature_flags&) = delete;

  /// Entries name a flag to enable, or `-Name` to disable it.
  sovereign::schema::status load(const std::vector<std::string>& entries);

  /// Restores defaults and allows another `load`. Test use only.
  sovereign::schema::status reset();

  bool is_set(std::string_view name) const;
  bool loaded() const;

 private:
  static std::map<std::string, bool, std::less<>> defaults();

  mutable std::mutex mutex_;
  std::map<std::string, bool, std::less<>> flags_;
  bool loaded_{false};
};

}  // namespace sovereign::config
