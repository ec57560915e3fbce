#pragma once

#include <sovereign/config/feature_flags.hpp>
#include <sovereign/nodeattestor/shim.hpp>

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace sovereign::nodeattestor {

using factory_t = std::function<std::unique_ptr<node_attestor>(
    const sovereign::config::feature_flags&)>;

/// Name to factory table, populated once at startup.
class registry final {
 public:
  bool add(std::string name, factory_t factory);

  std::unique_ptr<node_attestor> create(
      std::string_view name,
      const sovereign::config::feature_flags& flags) const;

  bool contains(std::string_view name) const;
  std::vector<std::string> names() const;

 private:
  std::map<std::string, factory_t, std::less<>> factories_;
};

/// Registry holding the built-in `unified_identity` strategy.
registry make_builtin_registry();

}  // namespace sovereign::nodeattestor
