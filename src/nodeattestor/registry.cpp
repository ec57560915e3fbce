#include <sovereign/nodeattestor/registry.hpp>

#include <spdlog/spdlog.h>

namespace sovereign::nodeattestor {

bool registry::add(std::string name, factory_t factory) {
  auto [it, inserted] = factories_.emplace(std::move(name), std::move(factory));
  if (!inserted) {
    spdlog::warn("Node attestor {} is already registered", it->first);
  }
  return inserted;
}

std::unique_ptr<node_attestor> registry::create(
    const std::string_view name,
    const sovereign::config::feature_flags& flags) const {
  auto it = factories_.find(name);
  if (it == std::end(factories_)) {
    spdlog::error("No node attestor named {}", name);
    return nullptr;
  }
  return it->second(flags);
}

bool registry::contains(const std::string_view name) const {
  return factories_.find(name) != std::end(factories_);
}

std::vector<std::string> registry::names() const {
  auto out = std::vector<std::string>{};
  for (const auto& [name, _] : factories_) {
    out.push_back(name);
  }
  return out;
}

registry make_builtin_registry() {
  auto builtins = registry{};
  builtins.add(std::string{kMarkerPayload},
               [](const sovereign::config::feature_flags& flags) {
                 return std::make_unique<shim>(flags);
               });
  return builtins;
}

}  // namespace sovereign::nodeattestor
