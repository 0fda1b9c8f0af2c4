#pragma once

#include <credo/schema/creation_result.hpp>
#include <credo/schema/primitives.hpp>
#include <credo/storage/rocksdb/storage.hpp>

namespace credo::instance {

/// Deploy the shared logic body at `address`.
///
/// The template is permanently barred from initialization; factories clone
/// it instead.
credo::schema::creation_result_t deploy_template(
    const credo::storage::rocksdb_storage_t& storage,
    const credo::schema::address_t& address);

/// Deploy an instance eagerly bound to `owner` and `registry`.
///
/// The instance starts initialized. A null registry binds the default
/// registry; a null owner is rejected with invalid_owner.
credo::schema::creation_result_t deploy_instance(
    const credo::storage::rocksdb_storage_t& storage,
    const credo::schema::address_t& address,
    const credo::schema::address_t& owner,
    const credo::schema::address_t& registry);

}  // namespace credo::instance
