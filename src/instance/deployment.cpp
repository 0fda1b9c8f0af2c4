#include <credo/instance/deployment.hpp>
#include <credo/instance/layout.hpp>
#include <credo/state/account.hpp>
#include <credo/state/write_set.hpp>
#include <spdlog/spdlog.h>

using namespace credo::schema;

namespace {

creation_result_t occupied(const address_t& address) {
  spdlog::debug("Deployment target {} is already occupied", to_hex(address));
  auto result = creation_result_t{};
  result.code = error_code::address_occupied;
  result.log = "address is already occupied";
  return result;
}

}  // namespace

namespace credo::instance {

creation_result_t deploy_template(
    const credo::storage::rocksdb_storage_t& storage,
    const address_t& address) {
  auto writes = credo::state::write_set{storage};
  auto account = credo::state::account{writes, address};
  if (account.exists()) {
    return occupied(address);
  }

  account.mark_deployed();
  store_address(account, kImplementationField, address);
  store_lifecycle(account, lifecycle_state::template_body);
  writes.commit();
  spdlog::info("Deployed credential template at {}", to_hex(address));

  auto result = creation_result_t{};
  result.address = address;
  return result;
}

creation_result_t deploy_instance(
    const credo::storage::rocksdb_storage_t& storage,
    const address_t& address,
    const address_t& owner,
    const address_t& registry) {
  auto writes = credo::state::write_set{storage};
  auto account = credo::state::account{writes, address};
  if (account.exists()) {
    return occupied(address);
  }
  if (is_null(owner)) {
    auto result = creation_result_t{};
    result.code = error_code::invalid_owner;
    result.log = "owner must not be the null address";
    return result;
  }

  auto result = creation_result_t{};
  account.mark_deployed();
  store_address(account, kImplementationField, address);
  result.events.push_back(replace_registry(account, resolve_registry(registry)));
  result.events.push_back(replace_owner(account, owner));
  store_lifecycle(account, lifecycle_state::initialized);
  writes.commit();
  spdlog::info("Deployed credential instance at {} for owner {}",
               to_hex(address), to_hex(owner));

  result.address = address;
  return result;
}

}  // namespace credo::instance
