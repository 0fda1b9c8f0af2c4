#pragma once

#include <credo/registry/subject_registry.hpp>
#include <credo/schema/primitives.hpp>
#include <cstddef>
#include <map>

namespace credo::registry {

/// Resolves registry addresses to live registries.
///
/// Holds non-owning references: a bound registry must outlive its binding.
/// Instances only ever store the address, so rebinding or unbinding here
/// changes authorization outcomes immediately.
class registry_directory final {
 public:
  /// Bind `registry` at `address`. Returns false and binds nothing for the
  /// null address.
  bool bind(const credo::schema::address_t& address,
            subject_registry& registry);
  void unbind(const credo::schema::address_t& address);

  /// Registry bound at address, or nullptr.
  subject_registry* find(const credo::schema::address_t& address) const;

  std::size_t size() const;

 private:
  std::map<credo::schema::address_t, subject_registry*> registries_;
};

}  // namespace credo::registry
