#pragma once

#include <credo/registry/registry_directory.hpp>
#include <credo/schema/authorization_status.hpp>
#include <credo/schema/primitives.hpp>

namespace credo::authorization {

/// Decides whether an actor may act for a subject by asking the registry
/// bound at a given address.
///
/// Resolution order: owner, then standing operator, then one-time approval.
/// A one-time approval is consumed by the same call that accepts it, so
/// `authorize` is not a pure query.
class gate final {
 public:
  explicit gate(const credo::registry::registry_directory& registries);

  credo::schema::authorization_status authorize(
      const credo::schema::address_t& registry_address,
      const credo::schema::address_t& acting,
      credo::schema::subject_id_t subject_id);

 private:
  const credo::registry::registry_directory& registries_;
};

}  // namespace credo::authorization
