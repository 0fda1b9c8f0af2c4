#pragma once

#include <credo/schema/primitives.hpp>
#include <credo/storage/rocksdb/storage.hpp>
#include <cstddef>
#include <map>
#include <optional>

namespace credo::state {

/// Staged writes of one operation.
///
/// Reads see staged values first and fall back to storage. Nothing reaches
/// storage until `commit`, which persists every staged value in one atomic
/// batch. A write set that goes out of scope without `commit` leaves storage
/// untouched.
class write_set final {
 public:
  explicit write_set(const credo::storage::rocksdb_storage_t& storage);

  write_set(const write_set&) = delete;
  write_set& operator=(const write_set&) = delete;
  write_set(write_set&&) = delete;
  write_set& operator=(write_set&&) = delete;

  std::optional<credo::schema::bytes_t> get(
      const credo::schema::bytes_t& key) const;
  bool contains(const credo::schema::bytes_t& key) const;
  void put(credo::schema::bytes_t key, credo::schema::bytes_t value);

  std::size_t size() const;

  /// Persist all staged values atomically and clear the stage.
  void commit();

  const credo::storage::rocksdb_storage_t& storage() const;

 private:
  const credo::storage::rocksdb_storage_t& storage_;
  std::map<credo::schema::bytes_t, credo::schema::bytes_t> pending_;
};

}  // namespace credo::state
