#include <credo/registry/registry_directory.hpp>
#include <spdlog/spdlog.h>

namespace credo::registry {

bool registry_directory::bind(const credo::schema::address_t& address,
                              subject_registry& registry) {
  if (credo::schema::is_null(address)) {
    spdlog::warn("Refusing to bind a subject registry at the null address");
    return false;
  }
  registries_.insert_or_assign(address, &registry);
  spdlog::debug("Bound subject registry at {}", credo::schema::to_hex(address));
  return true;
}

void registry_directory::unbind(const credo::schema::address_t& address) {
  if (registries_.erase(address) > 0) {
    spdlog::debug("Unbound subject registry at {}",
                  credo::schema::to_hex(address));
  }
}

subject_registry* registry_directory::find(
    const credo::schema::address_t& address) const {
  auto found = registries_.find(address);
  if (found == std::end(registries_)) {
    return nullptr;
  }
  return found->second;
}

std::size_t registry_directory::size() const {
  return registries_.size();
}

}  // namespace credo::registry
