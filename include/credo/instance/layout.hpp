#pragma once

#include <credo/schema/event.hpp>
#include <credo/schema/lifecycle_state.hpp>
#include <credo/schema/operation_result.hpp>
#include <credo/schema/primitives.hpp>
#include <credo/state/account.hpp>
#include <credo/state/namespaced_store.hpp>
#include <credo/state/store_keys.hpp>
#include <string_view>

// Storage layout shared by every credential instance, whether deployed
// directly, as the template, or as a factory clone. The region objects are
// built once per process and reused by every address.
namespace credo::instance {

inline constexpr std::string_view kDefaultRegistryDomain{
    "credo.registry.default"};

inline constexpr std::string_view kLifecycleField{"lifecycle"};
inline constexpr std::string_view kOwnerField{"owner"};
inline constexpr std::string_view kRegistryField{"registry"};
inline constexpr std::string_view kImplementationField{"implementation"};

/// Well-known registry used whenever the null address is supplied.
const credo::schema::address_t& default_registry_address();

/// `requested`, or the default registry when `requested` is null.
credo::schema::address_t resolve_registry(
    const credo::schema::address_t& requested);

const credo::state::namespaced_store<credo::state::field_key>& core_store();
const credo::state::namespaced_store<credo::state::subject_metadata_key>&
subject_metadata_store();
const credo::state::namespaced_store<credo::state::instance_metadata_key>&
instance_metadata_store();
const credo::state::namespaced_store<credo::state::review_key>& review_store();

credo::schema::lifecycle_state load_lifecycle(
    const credo::state::account& account);
void store_lifecycle(credo::state::account& account,
                     credo::schema::lifecycle_state state);

/// Address stored in a core field, or the null address when unset.
credo::schema::address_t load_address(const credo::state::account& account,
                                      std::string_view field);
void store_address(credo::state::account& account,
                   std::string_view field,
                   const credo::schema::address_t& value);

/// Replace the owner and return the ownership_transferred notification.
credo::schema::event_t replace_owner(credo::state::account& account,
                                     const credo::schema::address_t& owner);

/// Replace the registry binding and return the registry_updated
/// notification.
credo::schema::event_t replace_registry(
    credo::state::account& account,
    const credo::schema::address_t& registry);

/// The one initialization path for uninitialized instances.
///
/// Stages the owner, the registry (null maps to the default registry) and,
/// when non-empty, the display name. Rejects anything not in the
/// uninitialized state with already_initialized and a null owner with
/// invalid_owner, staging nothing in either case. Never commits.
credo::schema::operation_result_t initialize_account(
    credo::state::account& account,
    const credo::schema::address_t& registry,
    const credo::schema::address_t& owner,
    std::string_view display_name);

}  // namespace credo::instance
