#pragma once

#include <credo/authorization/gate.hpp>
#include <credo/registry/registry_directory.hpp>
#include <credo/schema/lifecycle_state.hpp>
#include <credo/schema/operation_result.hpp>
#include <credo/schema/primitives.hpp>
#include <credo/storage/rocksdb/storage.hpp>
#include <string>

namespace credo::instance {

/// Public read/write surface of the credential instance deployed at one
/// address.
///
/// The handle holds no state of its own: owner, registry binding, lifecycle
/// and all records live in the address's storage, so any number of handles
/// to the same address observe the same instance. Every mutating operation
/// takes the calling address first and commits all of its writes in one
/// batch, or none of them when it fails.
class credential_instance final {
 public:
  credential_instance(const credo::storage::rocksdb_storage_t& storage,
                      const credo::registry::registry_directory& registries,
                      const credo::schema::address_t& address);

  const credo::schema::address_t& address() const;

  /// False when nothing credential-shaped is deployed at the address.
  bool exists() const;
  credo::schema::lifecycle_state lifecycle() const;
  credo::schema::address_t owner() const;
  credo::schema::address_t registry() const;

  /// Address whose logic this instance executes: the template for clones,
  /// the instance itself otherwise.
  credo::schema::address_t implementation() const;

  /// Commit owner, registry and optional display name of a factory clone.
  ///
  /// Succeeds once per clone. Fails with already_initialized on an
  /// initialized instance and on the template, whoever calls.
  credo::schema::operation_result_t initialize(
      const credo::schema::address_t& caller,
      const credo::schema::address_t& registry,
      const credo::schema::address_t& owner,
      const std::string& display_name);

  /// Write subject metadata. The caller must be authorized for the subject
  /// by the bound registry.
  credo::schema::operation_result_t set_subject_metadata(
      const credo::schema::address_t& caller,
      credo::schema::subject_id_t subject_id,
      const std::string& key,
      const credo::schema::bytes_view_t& value);

  credo::schema::bytes_t get_subject_metadata(
      credo::schema::subject_id_t subject_id,
      const std::string& key) const;

  /// Record data about `reviewed_id` from `reviewer_id`. The caller must be
  /// authorized for the reviewer, not the reviewed subject.
  credo::schema::operation_result_t submit_review(
      const credo::schema::address_t& caller,
      credo::schema::subject_id_t reviewer_id,
      credo::schema::subject_id_t reviewed_id,
      const credo::schema::bytes_view_t& data);

  credo::schema::bytes_t get_review(
      credo::schema::subject_id_t reviewer_id,
      credo::schema::subject_id_t reviewed_id) const;

  credo::schema::operation_result_t set_instance_metadata(
      const credo::schema::address_t& caller,
      const std::string& key,
      const credo::schema::bytes_view_t& value);

  credo::schema::bytes_t get_instance_metadata(const std::string& key) const;

  credo::schema::operation_result_t set_registry(
      const credo::schema::address_t& caller,
      const credo::schema::address_t& registry);

  credo::schema::operation_result_t transfer_ownership(
      const credo::schema::address_t& caller,
      const credo::schema::address_t& new_owner);

  /// Give up ownership for good. Nothing can restore an owner afterwards.
  credo::schema::operation_result_t renounce_ownership(
      const credo::schema::address_t& caller);

  bool supports_interface(const credo::schema::interface_id_t& id) const;

 private:
  const credo::storage::rocksdb_storage_t& storage_;
  credo::authorization::gate gate_;
  credo::schema::address_t address_;
};

}  // namespace credo::instance
