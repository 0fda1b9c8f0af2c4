#pragma once

#include <credo/instance/credential_instance.hpp>
#include <credo/registry/registry_directory.hpp>
#include <credo/schema/creation_result.hpp>
#include <credo/schema/primitives.hpp>
#include <credo/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace credo::factory {

inline constexpr std::string_view kCreateDomain{"credo.create.v1"};
inline constexpr std::string_view kDeterministicCreateDomain{
    "credo.create2.v1"};
inline constexpr std::string_view kCloneCodeDomain{"credo.clone.v1"};

inline constexpr std::string_view kTemplateField{"template"};
inline constexpr std::string_view kNonceField{"nonce"};

/// Code identity shared by every clone delegating to `template_address`.
credo::schema::hash32_t make_code_identity(
    const credo::schema::address_t& template_address);

/// Address of the `nonce`-th unsalted creation of a factory.
credo::schema::address_t make_create_address(
    const credo::schema::address_t& factory_address,
    uint64_t nonce);

/// Address of a salted creation: a pure function of factory, salt and code
/// identity.
credo::schema::address_t make_deterministic_address(
    const credo::schema::address_t& factory_address,
    const credo::schema::hash32_t& salt,
    const credo::schema::hash32_t& code_identity);

/// Deploy a factory cloning the template at `template_address`.
///
/// Fails with invalid_template unless a template is deployed there and with
/// address_occupied when `factory_address` is taken.
credo::schema::creation_result_t deploy_factory(
    const credo::storage::rocksdb_storage_t& storage,
    const credo::schema::address_t& factory_address,
    const credo::schema::address_t& template_address);

/// Stamps out credential instances from one template.
///
/// Every clone executes the template's logic against its own storage and is
/// initialized in the same batch that creates it, so no clone is ever
/// observable uninitialized. The factory remembers every creation, globally
/// and per creator, in creation order.
class instance_factory final {
 public:
  instance_factory(const credo::storage::rocksdb_storage_t& storage,
                   const credo::registry::registry_directory& registries,
                   const credo::schema::address_t& address);

  const credo::schema::address_t& address() const;
  bool exists() const;
  credo::schema::address_t template_address() const;
  credo::schema::hash32_t code_identity() const;

  /// Clone the template at a fresh address owned by `caller`.
  ///
  /// The address comes from the creation nonce. Nonces whose address is
  /// already occupied are skipped, so this never fails with
  /// address_occupied.
  credo::schema::creation_result_t create(
      const credo::schema::address_t& caller,
      const credo::schema::address_t& registry,
      const std::string& display_name);

  /// Clone the template at `predict_address(salt)`.
  ///
  /// Fails with address_occupied when that salt was used before.
  credo::schema::creation_result_t create_deterministic(
      const credo::schema::address_t& caller,
      const credo::schema::address_t& registry,
      const std::string& display_name,
      const credo::schema::hash32_t& salt);

  credo::schema::address_t predict_address(
      const credo::schema::hash32_t& salt) const;

  std::vector<credo::schema::address_t> all_instances() const;
  std::vector<credo::schema::address_t> instances_by_creator(
      const credo::schema::address_t& creator) const;
  uint64_t instance_count() const;
  uint64_t instance_count_by_creator(
      const credo::schema::address_t& creator) const;
  std::optional<credo::schema::address_t> instance_at(uint64_t index) const;

  /// Handle to a created (or any other) instance address.
  credo::instance::credential_instance instance(
      const credo::schema::address_t& address) const;

 private:
  credo::schema::creation_result_t create_at(
      const credo::schema::address_t& caller,
      const credo::schema::address_t& registry,
      const std::string& display_name,
      const std::optional<credo::schema::hash32_t>& salt);

  const credo::storage::rocksdb_storage_t& storage_;
  const credo::registry::registry_directory& registries_;
  credo::schema::address_t address_;
};

}  // namespace credo::factory
