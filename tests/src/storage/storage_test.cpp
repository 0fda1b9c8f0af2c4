#include <credo/schema/encoding/scale/encoder.hpp>
#include <credo/storage/rocksdb/storage.hpp>
#include <credo/testing/common.hpp>
#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace {

using encoder_t = credo::schema::encoding::scale_encoder_t;

credo::schema::bytes_t make_key(const std::string& text) {
  return credo::schema::make_bytes(text);
}

}  // namespace

TEST(storage, missing_key_reads_as_nullopt) {
  auto db = credo::testing::make_db_path("credo_storage_missing");
  {
    auto storage =
        credo::storage::make_storage<credo::storage::rocksdb_storage_tag>(db);
    auto encoder = encoder_t{};
    auto key = make_key("absent");
    EXPECT_FALSE(storage.contains(key));
    EXPECT_FALSE(storage.get<credo::schema::bytes_t>(encoder, key).has_value());
  }
  credo::testing::remove_path(db);
}

TEST(storage, put_and_get_round_trip_encoded_values) {
  auto db = credo::testing::make_db_path("credo_storage_put");
  {
    auto storage =
        credo::storage::make_storage<credo::storage::rocksdb_storage_tag>(db);
    auto encoder = encoder_t{};
    auto key = make_key("counter");
    storage.put(encoder, key, uint64_t{42});

    EXPECT_TRUE(storage.contains(key));
    auto loaded = storage.get<uint64_t>(encoder, key);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(*loaded, 42u);
  }
  credo::testing::remove_path(db);
}

TEST(storage, put_batch_persists_every_entry) {
  auto db = credo::testing::make_db_path("credo_storage_batch");
  {
    auto storage =
        credo::storage::make_storage<credo::storage::rocksdb_storage_tag>(db);
    storage.put_batch({{make_key("p|a"), credo::schema::bytes_t{0x01}},
                       {make_key("p|b"), credo::schema::bytes_t{0x02}},
                       {make_key("q|a"), credo::schema::bytes_t{0x03}}});

    auto listed = storage.list_by_prefix(make_key("p|"));
    ASSERT_EQ(listed.size(), 2u);
    EXPECT_EQ(listed[0].first, make_key("p|a"));
    EXPECT_EQ(listed[0].second, credo::schema::bytes_t{0x01});
    EXPECT_EQ(listed[1].first, make_key("p|b"));
    EXPECT_TRUE(storage.contains(make_key("q|a")));
  }
  credo::testing::remove_path(db);
}

TEST(storage, empty_batch_is_a_no_op) {
  auto db = credo::testing::make_db_path("credo_storage_empty_batch");
  {
    auto storage =
        credo::storage::make_storage<credo::storage::rocksdb_storage_tag>(db);
    storage.put_batch({});
    EXPECT_TRUE(storage.list_by_prefix(make_key("")).empty());
  }
  credo::testing::remove_path(db);
}

TEST(storage, values_survive_reopen) {
  auto db = credo::testing::make_db_path("credo_storage_reopen");
  auto encoder = encoder_t{};
  {
    auto storage =
        credo::storage::make_storage<credo::storage::rocksdb_storage_tag>(db);
    storage.put(encoder, make_key("name"), std::string{"widget"});
  }
  {
    auto storage =
        credo::storage::make_storage<credo::storage::rocksdb_storage_tag>(db);
    auto loaded = storage.get<std::string>(encoder, make_key("name"));
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(*loaded, "widget");
  }
  credo::testing::remove_path(db);
}

TEST(storage, read_only_open_sees_committed_values) {
  auto db = credo::testing::make_db_path("credo_storage_read_only");
  auto encoder = encoder_t{};
  {
    auto storage =
        credo::storage::make_storage<credo::storage::rocksdb_storage_tag>(db);
    storage.put(encoder, make_key("count"), uint64_t{3});
  }
  {
    auto storage =
        credo::storage::make_storage<credo::storage::rocksdb_storage_tag>(
            db, true);
    auto loaded = storage.get<uint64_t>(encoder, make_key("count"));
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(*loaded, 3u);
  }
  credo::testing::remove_path(db);
}
