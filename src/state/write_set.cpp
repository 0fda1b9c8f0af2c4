#include <credo/schema/encoding/scale/encoder.hpp>
#include <credo/state/write_set.hpp>

#include <utility>
#include <vector>

namespace credo::state {

write_set::write_set(const credo::storage::rocksdb_storage_t& storage)
    : storage_{storage} {}

std::optional<credo::schema::bytes_t> write_set::get(
    const credo::schema::bytes_t& key) const {
  if (auto staged = pending_.find(key); staged != std::end(pending_)) {
    return staged->second;
  }
  auto encoder = credo::schema::encoding::scale_encoder_t{};
  return storage_.get<credo::schema::bytes_t>(
      encoder, credo::schema::bytes_view_t{key.data(), key.size()});
}

bool write_set::contains(const credo::schema::bytes_t& key) const {
  if (pending_.contains(key)) {
    return true;
  }
  return storage_.contains(
      credo::schema::bytes_view_t{key.data(), key.size()});
}

void write_set::put(credo::schema::bytes_t key, credo::schema::bytes_t value) {
  pending_.insert_or_assign(std::move(key), std::move(value));
}

std::size_t write_set::size() const {
  return pending_.size();
}

void write_set::commit() {
  auto encoder = credo::schema::encoding::scale_encoder_t{};
  auto entries = std::vector<credo::storage::key_value_entry_t>{};
  entries.reserve(pending_.size());
  for (const auto& [key, value] : pending_) {
    entries.emplace_back(key, encoder.encode(value));
  }
  storage_.put_batch(entries);
  spdlog::trace("Committed write set with {} entries", entries.size());
  pending_.clear();
}

const credo::storage::rocksdb_storage_t& write_set::storage() const {
  return storage_;
}

}  // namespace credo::state
