#pragma once

#include <credo/blake3/hash.hpp>
#include <credo/schema/event.hpp>
#include <credo/schema/primitives.hpp>
#include <credo/state/account.hpp>
#include <credo/state/store_keys.hpp>
#include <iterator>
#include <string>
#include <string_view>
#include <utility>

namespace credo::state {

/// Namespace id of a region: blake3 of its domain string.
///
/// Depends on the domain alone, so every address executing the same logic
/// finds its region at the same slots.
inline credo::schema::hash32_t make_namespace_id(std::string_view domain) {
  return credo::blake3::hash(domain);
}

/// Isolated key/value region inside an account.
///
/// `Key` is one of the composite key shapes in store_keys.hpp. A value is
/// stored at blake3(namespace_id || encode_key(key)). Reads of a never
/// written key and of an explicitly empty value both return empty bytes.
/// There is no deletion and no history: the last write wins.
template <typename Key>
class namespaced_store final {
 public:
  namespaced_store(std::string_view domain,
                   std::string_view event_type,
                   std::string_view value_attribute = "value")
      : namespace_id_{make_namespace_id(domain)},
        event_type_{event_type},
        value_attribute_{value_attribute} {}

  const credo::schema::hash32_t& namespace_id() const { return namespace_id_; }

  credo::schema::hash32_t location(const Key& key) const {
    auto material = credo::schema::bytes_t{std::begin(namespace_id_),
                                           std::end(namespace_id_)};
    auto encoded = encode_key(key);
    material.insert(std::end(material), std::begin(encoded),
                    std::end(encoded));
    return credo::blake3::hash(
        credo::schema::bytes_view_t{material.data(), material.size()});
  }

  credo::schema::bytes_t get(const account& storage, const Key& key) const {
    return storage.load(location(key));
  }

  /// Overwrite the value at key and return the change notification.
  credo::schema::event_t set(account& storage,
                             const Key& key,
                             const credo::schema::bytes_view_t& value) const {
    storage.store(location(key), value);

    auto event = credo::schema::event_t{};
    event.type = event_type_;
    event.attributes = describe_key(key);
    event.attributes.push_back(credo::schema::event_attribute_t{
        .key = value_attribute_, .value = credo::schema::to_hex(value)});
    return event;
  }

 private:
  credo::schema::hash32_t namespace_id_;
  std::string event_type_;
  std::string value_attribute_;
};

}  // namespace credo::state
