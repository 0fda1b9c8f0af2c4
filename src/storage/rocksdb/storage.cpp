#include <credo/common/critical.hpp>
#include <credo/storage/rocksdb/storage.hpp>

namespace credo::storage {
template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path,
    const bool read_only) {
  auto store = storage<rocksdb_storage_tag>();

  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = !read_only;
  options.IncreaseParallelism();
  options.OptimizeLevelStyleCompaction();

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      read_only ? ROCKSDB_NAMESPACE::DB::OpenForReadOnly(
                      options, std::string{path}, &database)
                : ROCKSDB_NAMESPACE::DB::Open(options, std::string{path},
                                              &database);
  if (!status.ok()) {
    spdlog::error("Failed to open RocksDB at {}: {}", path, status.ToString());
    credo::common::critical("Failed to open RocksDB");
  }
  spdlog::info("Successfully opened RocksDB at {}{}", path,
               read_only ? " (read only)" : "");
  store.database.reset(database);

  return store;
}
}  // namespace credo::storage
