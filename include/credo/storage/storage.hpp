#pragma once
#include <credo/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace credo::storage {

using key_value_entry_t =
    std::pair<credo::schema::bytes_t, credo::schema::bytes_t>;

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const credo::schema::bytes_view_t& key) const;

  /// Encode and persist value at key.
  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const credo::schema::bytes_view_t& key,
           const T& value) const;

  /// True when any value is stored at key.
  bool contains(const credo::schema::bytes_view_t& key) const;

  /// Atomically persist all raw entries, or none of them.
  void put_batch(const std::vector<key_value_entry_t>& entries) const;

  /// Return all raw key-value pairs that share the provided key prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const credo::schema::bytes_view_t& prefix) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
///
/// A read-only backend never creates the database and rejects writes.
template <typename Library>
storage<Library> make_storage(const std::string_view& path,
                              bool read_only = false);

}  // namespace credo::storage
