#include <credo/blake3/hash.hpp>
#include <credo/common/critical.hpp>
#include <credo/factory/instance_factory.hpp>
#include <credo/instance/layout.hpp>
#include <credo/schema/encoding/scale/encoder.hpp>
#include <credo/schema/key/namespaces.hpp>
#include <credo/state/account.hpp>
#include <credo/state/namespaced_store.hpp>
#include <credo/state/write_set.hpp>
#include <spdlog/spdlog.h>

#include <iterator>
#include <tuple>
#include <utility>

using namespace credo::schema;

namespace {

using encoder_t = credo::schema::encoding::scale_encoder_t;

const credo::state::namespaced_store<credo::state::field_key>&
factory_core_store() {
  static const auto store =
      credo::state::namespaced_store<credo::state::field_key>{
          key::kFactoryCoreDomain, "factory_changed"};
  return store;
}

const credo::state::namespaced_store<credo::state::instance_list_key>&
instance_list_store() {
  static const auto store =
      credo::state::namespaced_store<credo::state::instance_list_key>{
          key::kFactoryInstancesDomain, "instance_listed", "instance"};
  return store;
}

const credo::state::namespaced_store<credo::state::instance_count_key>&
instance_count_store() {
  static const auto store =
      credo::state::namespaced_store<credo::state::instance_count_key>{
          key::kFactoryInstanceCountsDomain, "instance_counted", "count"};
  return store;
}

hash32_t hash_encoded(const bytes_t& material) {
  return credo::blake3::hash(bytes_view_t{material.data(), material.size()});
}

uint64_t load_counter(const bytes_t& raw) {
  if (raw.empty()) {
    return 0;
  }
  auto encoder = encoder_t{};
  return encoder.decode<uint64_t>(bytes_view_t{raw.data(), raw.size()});
}

void store_counter(credo::state::account& account,
                   const std::string_view field,
                   const uint64_t value) {
  auto encoder = encoder_t{};
  auto raw = encoder.encode(value);
  factory_core_store().set(account,
                           credo::state::field_key{std::string{field}},
                           bytes_view_t{raw.data(), raw.size()});
}

uint64_t count_for(const credo::state::account& account,
                   const address_t& creator) {
  return load_counter(instance_count_store().get(
      account, credo::state::instance_count_key{creator}));
}

std::optional<address_t> listed_at(const credo::state::account& account,
                                   const address_t& creator,
                                   const uint64_t index) {
  auto raw = instance_list_store().get(
      account, credo::state::instance_list_key{creator, index});
  if (raw.empty()) {
    return std::nullopt;
  }
  return make_hash32(raw);
}

/// Append `instance` to the list of `creator`; the null creator is the
/// global list.
void append(credo::state::account& account,
            const address_t& creator,
            const address_t& instance) {
  auto count = count_for(account, creator);
  instance_list_store().set(account,
                            credo::state::instance_list_key{creator, count},
                            bytes_view_t{instance.data(), instance.size()});
  auto encoder = encoder_t{};
  auto raw = encoder.encode(count + 1);
  instance_count_store().set(account, credo::state::instance_count_key{creator},
                             bytes_view_t{raw.data(), raw.size()});
}

std::vector<address_t> list_for(const credo::state::account& account,
                                 const address_t& creator) {
  auto count = count_for(account, creator);
  auto instances = std::vector<address_t>{};
  instances.reserve(count);
  for (uint64_t i = 0; i < count; ++i) {
    auto listed = listed_at(account, creator, i);
    if (!listed.has_value()) {
      credo::common::critical("factory instance list has a gap");
    }
    instances.push_back(*listed);
  }
  return instances;
}

creation_result_t reject(const address_t& factory,
                         const error_code code,
                         std::string log) {
  spdlog::debug("Rejected creation on factory {}: {} ({})", to_hex(factory),
                to_string(code), log);
  auto result = creation_result_t{};
  result.code = code;
  result.log = std::move(log);
  return result;
}

}  // namespace

namespace credo::factory {

hash32_t make_code_identity(const address_t& template_address) {
  auto encoder = encoder_t{};
  return hash_encoded(encoder.encode(
      std::tuple{std::string{kCloneCodeDomain}, template_address}));
}

address_t make_create_address(const address_t& factory_address,
                              const uint64_t nonce) {
  auto encoder = encoder_t{};
  return hash_encoded(encoder.encode(
      std::tuple{std::string{kCreateDomain}, factory_address, nonce}));
}

address_t make_deterministic_address(const address_t& factory_address,
                                     const hash32_t& salt,
                                     const hash32_t& code_identity) {
  auto encoder = encoder_t{};
  return hash_encoded(
      encoder.encode(std::tuple{std::string{kDeterministicCreateDomain},
                                factory_address, salt, code_identity}));
}

creation_result_t deploy_factory(
    const credo::storage::rocksdb_storage_t& storage,
    const address_t& factory_address,
    const address_t& template_address) {
  auto writes = credo::state::write_set{storage};
  auto template_account = credo::state::account{writes, template_address};
  if (credo::instance::load_lifecycle(template_account) !=
      lifecycle_state::template_body) {
    return reject(factory_address, error_code::invalid_template,
                  "no credential template deployed at template address");
  }

  auto factory = credo::state::account{writes, factory_address};
  if (factory.exists()) {
    return reject(factory_address, error_code::address_occupied,
                  "address is already occupied");
  }

  factory.mark_deployed();
  factory_core_store().set(
      factory, credo::state::field_key{std::string{kTemplateField}},
      bytes_view_t{template_address.data(), template_address.size()});
  store_counter(factory, kNonceField, 0);
  writes.commit();
  spdlog::info("Deployed instance factory at {} cloning template {}",
               to_hex(factory_address), to_hex(template_address));

  auto result = creation_result_t{};
  result.address = factory_address;
  return result;
}

instance_factory::instance_factory(
    const credo::storage::rocksdb_storage_t& storage,
    const credo::registry::registry_directory& registries,
    const address_t& address)
    : storage_{storage}, registries_{registries}, address_{address} {}

const address_t& instance_factory::address() const {
  return address_;
}

bool instance_factory::exists() const {
  return !is_null(template_address());
}

address_t instance_factory::template_address() const {
  auto writes = credo::state::write_set{storage_};
  auto raw = factory_core_store().get(
      credo::state::account{writes, address_},
      credo::state::field_key{std::string{kTemplateField}});
  if (raw.empty()) {
    return make_null_address();
  }
  return make_hash32(raw);
}

hash32_t instance_factory::code_identity() const {
  return make_code_identity(template_address());
}

creation_result_t instance_factory::create(const address_t& caller,
                                           const address_t& registry,
                                           const std::string& display_name) {
  return create_at(caller, registry, display_name, std::nullopt);
}

creation_result_t instance_factory::create_deterministic(
    const address_t& caller,
    const address_t& registry,
    const std::string& display_name,
    const hash32_t& salt) {
  return create_at(caller, registry, display_name, salt);
}

address_t instance_factory::predict_address(const hash32_t& salt) const {
  return make_deterministic_address(address_, salt, code_identity());
}

std::vector<address_t> instance_factory::all_instances() const {
  auto writes = credo::state::write_set{storage_};
  return list_for(credo::state::account{writes, address_},
                  make_null_address());
}

std::vector<address_t> instance_factory::instances_by_creator(
    const address_t& creator) const {
  if (is_null(creator)) {
    return {};
  }
  auto writes = credo::state::write_set{storage_};
  return list_for(credo::state::account{writes, address_}, creator);
}

uint64_t instance_factory::instance_count() const {
  auto writes = credo::state::write_set{storage_};
  return count_for(credo::state::account{writes, address_},
                   make_null_address());
}

uint64_t instance_factory::instance_count_by_creator(
    const address_t& creator) const {
  if (is_null(creator)) {
    return 0;
  }
  auto writes = credo::state::write_set{storage_};
  return count_for(credo::state::account{writes, address_}, creator);
}

std::optional<address_t> instance_factory::instance_at(
    const uint64_t index) const {
  auto writes = credo::state::write_set{storage_};
  return listed_at(credo::state::account{writes, address_},
                   make_null_address(), index);
}

credo::instance::credential_instance instance_factory::instance(
    const address_t& address) const {
  return credo::instance::credential_instance{storage_, registries_, address};
}

creation_result_t instance_factory::create_at(
    const address_t& caller,
    const address_t& registry,
    const std::string& display_name,
    const std::optional<hash32_t>& salt) {
  auto writes = credo::state::write_set{storage_};
  auto factory = credo::state::account{writes, address_};
  auto template_raw = factory_core_store().get(
      factory, credo::state::field_key{std::string{kTemplateField}});
  if (template_raw.empty()) {
    return reject(address_, error_code::instance_missing,
                  "no factory deployed at address");
  }
  auto template_address = make_hash32(template_raw);

  auto nonce = load_counter(factory_core_store().get(
      factory, credo::state::field_key{std::string{kNonceField}}));
  auto target = address_t{};
  if (salt.has_value()) {
    target = make_deterministic_address(address_, *salt,
                                        make_code_identity(template_address));
    if (credo::state::account{writes, target}.exists()) {
      return reject(address_, error_code::address_occupied,
                    "target address is already occupied");
    }
  } else {
    // Skip addresses something else was deployed to; the nonce ends past
    // them.
    target = make_create_address(address_, nonce);
    while (credo::state::account{writes, target}.exists()) {
      spdlog::warn("Factory {} skipping occupied address {} at nonce {}",
                   to_hex(address_), to_hex(target), nonce);
      ++nonce;
      target = make_create_address(address_, nonce);
    }
  }

  auto clone = credo::state::account{writes, target};
  clone.mark_deployed();
  credo::instance::store_address(clone, credo::instance::kImplementationField,
                                 template_address);
  credo::instance::store_lifecycle(clone, lifecycle_state::uninitialized);

  auto initialized = credo::instance::initialize_account(
      clone, registry, caller, display_name);
  if (!initialized.ok()) {
    return reject(address_, initialized.code, std::move(initialized.log));
  }

  append(factory, make_null_address(), target);
  append(factory, caller, target);
  if (!salt.has_value()) {
    store_counter(factory, kNonceField, nonce + 1);
  }

  auto result = creation_result_t{};
  result.address = target;
  result.events = std::move(initialized.events);
  result.events.push_back(event_t{
      .type = std::string{kInstanceCreatedEvent},
      .attributes = {
          event_attribute_t{
              .key = "instance", .value = to_hex(target), .index = true},
          event_attribute_t{.key = "registry",
                            .value = to_hex(credo::instance::resolve_registry(
                                registry)),
                            .index = true},
          event_attribute_t{.key = "name", .value = display_name},
          event_attribute_t{
              .key = "creator", .value = to_hex(caller), .index = true}}});
  writes.commit();

  spdlog::info("Factory {} created instance {} for {}{}", to_hex(address_),
               to_hex(target), to_hex(caller),
               salt.has_value() ? " (deterministic)" : "");
  return result;
}

}  // namespace credo::factory
