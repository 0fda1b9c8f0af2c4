#include <credo/instance/credential_instance.hpp>
#include <credo/instance/layout.hpp>
#include <credo/schema/capability.hpp>
#include <credo/state/account.hpp>
#include <credo/state/write_set.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <optional>
#include <utility>

using namespace credo::schema;

namespace {

operation_result_t reject(const address_t& instance,
                          const error_code code,
                          std::string log) {
  spdlog::debug("Rejected operation on {}: {} ({})", to_hex(instance),
                to_string(code), log);
  auto result = operation_result_t{};
  result.code = code;
  result.log = std::move(log);
  return result;
}

std::optional<operation_result_t> require_deployed(
    const credo::state::account& account) {
  if (credo::instance::load_lifecycle(account) == lifecycle_state::absent) {
    return reject(account.address(), error_code::instance_missing,
                  "no instance deployed at address");
  }
  return std::nullopt;
}

std::optional<operation_result_t> require_owner(
    const credo::state::account& account,
    const address_t& caller) {
  if (auto missing = require_deployed(account)) {
    return missing;
  }
  auto owner =
      credo::instance::load_address(account, credo::instance::kOwnerField);
  if (is_null(owner) || owner != caller) {
    return reject(account.address(), error_code::not_owner,
                  "caller is not the instance owner");
  }
  return std::nullopt;
}

}  // namespace

namespace credo::instance {

credential_instance::credential_instance(
    const credo::storage::rocksdb_storage_t& storage,
    const credo::registry::registry_directory& registries,
    const address_t& address)
    : storage_{storage}, gate_{registries}, address_{address} {}

const address_t& credential_instance::address() const {
  return address_;
}

bool credential_instance::exists() const {
  return lifecycle() != lifecycle_state::absent;
}

lifecycle_state credential_instance::lifecycle() const {
  auto writes = credo::state::write_set{storage_};
  return load_lifecycle(credo::state::account{writes, address_});
}

address_t credential_instance::owner() const {
  auto writes = credo::state::write_set{storage_};
  return load_address(credo::state::account{writes, address_}, kOwnerField);
}

address_t credential_instance::registry() const {
  auto writes = credo::state::write_set{storage_};
  return load_address(credo::state::account{writes, address_},
                      kRegistryField);
}

address_t credential_instance::implementation() const {
  auto writes = credo::state::write_set{storage_};
  return load_address(credo::state::account{writes, address_},
                      kImplementationField);
}

operation_result_t credential_instance::initialize(
    const address_t& caller,
    const address_t& registry,
    const address_t& owner,
    const std::string& display_name) {
  auto writes = credo::state::write_set{storage_};
  auto account = credo::state::account{writes, address_};
  auto result = initialize_account(account, registry, owner, display_name);
  if (!result.ok()) {
    return reject(address_, result.code, std::move(result.log));
  }
  writes.commit();
  spdlog::info("Initialized instance {} for owner {} (called by {})",
               to_hex(address_), to_hex(owner), to_hex(caller));
  return result;
}

operation_result_t credential_instance::set_subject_metadata(
    const address_t& caller,
    const subject_id_t subject_id,
    const std::string& key,
    const bytes_view_t& value) {
  auto writes = credo::state::write_set{storage_};
  auto account = credo::state::account{writes, address_};
  if (auto missing = require_deployed(account)) {
    return *missing;
  }

  switch (gate_.authorize(load_address(account, kRegistryField), caller,
                          subject_id)) {
    case authorization_status::not_found:
      return reject(address_, error_code::agent_not_found,
                    "subject is not known to the bound registry");
    case authorization_status::forbidden:
      return reject(address_, error_code::not_authorized,
                    "caller may not act for subject");
    case authorization_status::authorized:
      break;
  }

  auto result = operation_result_t{};
  result.events.push_back(subject_metadata_store().set(
      account, credo::state::subject_metadata_key{subject_id, key}, value));
  writes.commit();
  return result;
}

bytes_t credential_instance::get_subject_metadata(
    const subject_id_t subject_id,
    const std::string& key) const {
  auto writes = credo::state::write_set{storage_};
  return subject_metadata_store().get(
      credo::state::account{writes, address_},
      credo::state::subject_metadata_key{subject_id, key});
}

operation_result_t credential_instance::submit_review(
    const address_t& caller,
    const subject_id_t reviewer_id,
    const subject_id_t reviewed_id,
    const bytes_view_t& data) {
  auto writes = credo::state::write_set{storage_};
  auto account = credo::state::account{writes, address_};
  if (auto missing = require_deployed(account)) {
    return *missing;
  }

  switch (gate_.authorize(load_address(account, kRegistryField), caller,
                          reviewer_id)) {
    case authorization_status::not_found:
      return reject(address_, error_code::reviewer_not_agent,
                    "reviewer is not known to the bound registry");
    case authorization_status::forbidden:
      return reject(address_, error_code::not_authorized,
                    "caller may not act for reviewer");
    case authorization_status::authorized:
      break;
  }

  auto result = operation_result_t{};
  result.events.push_back(review_store().set(
      account, credo::state::review_key{reviewer_id, reviewed_id}, data));
  writes.commit();
  return result;
}

bytes_t credential_instance::get_review(const subject_id_t reviewer_id,
                                        const subject_id_t reviewed_id) const {
  auto writes = credo::state::write_set{storage_};
  return review_store().get(credo::state::account{writes, address_},
                            credo::state::review_key{reviewer_id, reviewed_id});
}

operation_result_t credential_instance::set_instance_metadata(
    const address_t& caller,
    const std::string& key,
    const bytes_view_t& value) {
  auto writes = credo::state::write_set{storage_};
  auto account = credo::state::account{writes, address_};
  if (auto rejected = require_owner(account, caller)) {
    return *rejected;
  }

  auto result = operation_result_t{};
  result.events.push_back(instance_metadata_store().set(
      account, credo::state::instance_metadata_key{key}, value));
  writes.commit();
  return result;
}

bytes_t credential_instance::get_instance_metadata(
    const std::string& key) const {
  auto writes = credo::state::write_set{storage_};
  return instance_metadata_store().get(
      credo::state::account{writes, address_},
      credo::state::instance_metadata_key{key});
}

operation_result_t credential_instance::set_registry(
    const address_t& caller,
    const address_t& registry) {
  auto writes = credo::state::write_set{storage_};
  auto account = credo::state::account{writes, address_};
  if (auto rejected = require_owner(account, caller)) {
    return *rejected;
  }
  if (is_null(registry)) {
    return reject(address_, error_code::invalid_registry,
                  "registry must not be the null address");
  }

  auto result = operation_result_t{};
  result.events.push_back(replace_registry(account, registry));
  writes.commit();
  spdlog::info("Instance {} now resolves subjects through registry {}",
               to_hex(address_), to_hex(registry));
  return result;
}

operation_result_t credential_instance::transfer_ownership(
    const address_t& caller,
    const address_t& new_owner) {
  auto writes = credo::state::write_set{storage_};
  auto account = credo::state::account{writes, address_};
  if (auto rejected = require_owner(account, caller)) {
    return *rejected;
  }
  if (is_null(new_owner)) {
    return reject(address_, error_code::invalid_owner,
                  "new owner must not be the null address");
  }

  auto result = operation_result_t{};
  result.events.push_back(replace_owner(account, new_owner));
  writes.commit();
  spdlog::info("Instance {} ownership transferred to {}", to_hex(address_),
               to_hex(new_owner));
  return result;
}

operation_result_t credential_instance::renounce_ownership(
    const address_t& caller) {
  auto writes = credo::state::write_set{storage_};
  auto account = credo::state::account{writes, address_};
  if (auto rejected = require_owner(account, caller)) {
    return *rejected;
  }

  auto result = operation_result_t{};
  result.events.push_back(replace_owner(account, make_null_address()));
  writes.commit();
  spdlog::info("Instance {} ownership renounced", to_hex(address_));
  return result;
}

bool credential_instance::supports_interface(const interface_id_t& id) const {
  if (id == kInvalidInterfaceId) {
    return false;
  }
  return std::ranges::any_of(kCapabilityMappings, [&](const auto& mapping) {
    return make_interface_id(mapping.second) == id;
  });
}

}  // namespace credo::instance
