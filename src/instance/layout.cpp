#include <credo/blake3/hash.hpp>
#include <credo/common/critical.hpp>
#include <credo/instance/layout.hpp>
#include <credo/schema/key/namespaces.hpp>
#include <spdlog/spdlog.h>

#include <string>

using namespace credo::schema;

namespace credo::instance {

const address_t& default_registry_address() {
  static const auto address = credo::blake3::hash(kDefaultRegistryDomain);
  return address;
}

address_t resolve_registry(const address_t& requested) {
  if (is_null(requested)) {
    return default_registry_address();
  }
  return requested;
}

const credo::state::namespaced_store<credo::state::field_key>& core_store() {
  static const auto store =
      credo::state::namespaced_store<credo::state::field_key>{
          key::kInstanceCoreDomain, "core_changed"};
  return store;
}

const credo::state::namespaced_store<credo::state::subject_metadata_key>&
subject_metadata_store() {
  static const auto store =
      credo::state::namespaced_store<credo::state::subject_metadata_key>{
          key::kSubjectMetadataDomain, kMetadataChangedEvent};
  return store;
}

const credo::state::namespaced_store<credo::state::instance_metadata_key>&
instance_metadata_store() {
  static const auto store =
      credo::state::namespaced_store<credo::state::instance_metadata_key>{
          key::kInstanceMetadataDomain, kMetadataChangedEvent};
  return store;
}

const credo::state::namespaced_store<credo::state::review_key>&
review_store() {
  static const auto store =
      credo::state::namespaced_store<credo::state::review_key>{
          key::kReviewsDomain, kReviewSubmittedEvent, "data"};
  return store;
}

lifecycle_state load_lifecycle(const credo::state::account& account) {
  auto raw = core_store().get(
      account, credo::state::field_key{std::string{kLifecycleField}});
  if (raw.empty()) {
    return lifecycle_state::absent;
  }
  if (raw.size() != 1 ||
      raw[0] > static_cast<uint8_t>(lifecycle_state::initialized)) {
    credo::common::critical("stored lifecycle state is corrupt");
  }
  return static_cast<lifecycle_state>(raw[0]);
}

void store_lifecycle(credo::state::account& account,
                     const lifecycle_state state) {
  auto raw = bytes_t{static_cast<uint8_t>(state)};
  core_store().set(account,
                   credo::state::field_key{std::string{kLifecycleField}},
                   bytes_view_t{raw.data(), raw.size()});
}

address_t load_address(const credo::state::account& account,
                       const std::string_view field) {
  auto raw =
      core_store().get(account, credo::state::field_key{std::string{field}});
  if (raw.empty()) {
    return make_null_address();
  }
  return make_hash32(raw);
}

void store_address(credo::state::account& account,
                   const std::string_view field,
                   const address_t& value) {
  core_store().set(account, credo::state::field_key{std::string{field}},
                   bytes_view_t{value.data(), value.size()});
}

event_t replace_owner(credo::state::account& account, const address_t& owner) {
  auto previous = load_address(account, kOwnerField);
  store_address(account, kOwnerField, owner);
  return event_t{
      .type = std::string{kOwnershipTransferredEvent},
      .attributes = {
          event_attribute_t{.key = "previous_owner",
                            .value = to_hex(previous),
                            .index = true},
          event_attribute_t{
              .key = "new_owner", .value = to_hex(owner), .index = true}}};
}

event_t replace_registry(credo::state::account& account,
                         const address_t& registry) {
  auto previous = load_address(account, kRegistryField);
  store_address(account, kRegistryField, registry);
  return event_t{
      .type = std::string{kRegistryUpdatedEvent},
      .attributes = {event_attribute_t{.key = "previous_registry",
                                       .value = to_hex(previous),
                                       .index = true},
                     event_attribute_t{.key = "new_registry",
                                       .value = to_hex(registry),
                                       .index = true}}};
}

operation_result_t initialize_account(credo::state::account& account,
                                      const address_t& registry,
                                      const address_t& owner,
                                      const std::string_view display_name) {
  auto result = operation_result_t{};
  auto state = load_lifecycle(account);
  if (state != lifecycle_state::uninitialized) {
    spdlog::debug("Rejected initialize of {} in state {}",
                  to_hex(account.address()), to_string(state));
    result.code = state == lifecycle_state::absent
                      ? error_code::instance_missing
                      : error_code::already_initialized;
    result.log = state == lifecycle_state::absent
                     ? "no instance deployed at address"
                     : "instance cannot be initialized";
    return result;
  }
  if (is_null(owner)) {
    result.code = error_code::invalid_owner;
    result.log = "owner must not be the null address";
    return result;
  }

  result.events.push_back(replace_registry(account, resolve_registry(registry)));
  result.events.push_back(replace_owner(account, owner));
  if (!display_name.empty()) {
    auto name = make_bytes(display_name);
    result.events.push_back(instance_metadata_store().set(
        account,
        credo::state::instance_metadata_key{std::string{key::kDisplayNameKey}},
        bytes_view_t{name.data(), name.size()}));
  }
  store_lifecycle(account, lifecycle_state::initialized);
  result.events.push_back(event_t{
      .type = std::string{kInitializedEvent},
      .attributes = {event_attribute_t{.key = "version", .value = "1"}}});
  return result;
}

}  // namespace credo::instance
