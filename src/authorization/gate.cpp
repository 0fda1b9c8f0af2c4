#include <credo/authorization/gate.hpp>
#include <spdlog/spdlog.h>

#include <exception>

using namespace credo::schema;

namespace credo::authorization {

gate::gate(const credo::registry::registry_directory& registries)
    : registries_{registries} {}

authorization_status gate::authorize(const address_t& registry_address,
                                     const address_t& acting,
                                     const subject_id_t subject_id) {
  auto* registry = registries_.find(registry_address);
  if (registry == nullptr) {
    spdlog::debug("No subject registry bound at {}", to_hex(registry_address));
    return authorization_status::not_found;
  }

  try {
    auto owner = registry->owner_of(subject_id);
    if (!owner.has_value()) {
      return authorization_status::not_found;
    }
    if (acting == *owner) {
      return authorization_status::authorized;
    }
    if (registry->is_operator(*owner, acting)) {
      return authorization_status::authorized;
    }
    auto approved = registry->allowance(*owner, acting, subject_id);
    if (approved != 0 &&
        registry->consume_allowance(*owner, acting, subject_id)) {
      spdlog::debug("Consumed one-time approval {} of {} for subject {}",
                    approved.str(), to_hex(acting), subject_id);
      return authorization_status::authorized;
    }
  } catch (const std::exception& ex) {
    spdlog::warn("Subject registry {} failed resolving subject {}: {}",
                 to_hex(registry_address), subject_id, ex.what());
    return authorization_status::not_found;
  }

  return authorization_status::forbidden;
}

}  // namespace credo::authorization
