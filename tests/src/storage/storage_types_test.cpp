#include <steward/schema/encoding/scale/encoder.hpp>
#include <steward/storage/rocksdb/storage.hpp>
#include <steward/storage/storage.hpp>
#include <steward/testing/common.hpp>
#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <string_view>

namespace {

using storage_t =
    steward::storage::storage<steward::storage::rocksdb_storage_tag>;
using encoder_t = steward::schema::encoding::encoder<
    steward::schema::encoding::scale_encoder_tag>;

steward::schema::bytes_t make_key(const std::string_view value) {
  return steward::schema::make_bytes(value);
}

}  // namespace

TEST(storage_types, defaults_are_stable) {
  auto committed = steward::storage::committed_state{};
  EXPECT_EQ(committed.height, 0);
  EXPECT_EQ(committed.block_time, 0);

  auto entry = steward::storage::key_value_entry_t{};
  EXPECT_TRUE(entry.first.empty());
  EXPECT_TRUE(entry.second.empty());
}

TEST(storage_types, fresh_database_has_no_checkpoint) {
  auto db = steward::testing::make_db_path("steward_storage_fresh");
  {
    auto storage = steward::storage::make_storage<
        steward::storage::rocksdb_storage_tag>(db);
    EXPECT_FALSE(storage.load_committed_state().has_value());
    EXPECT_FALSE(
        storage.get(steward::schema::bytes_view_t{make_key("missing")})
            .has_value());
  }
  steward::testing::remove_path(db);
}

TEST(storage_types, commit_applies_writes_and_checkpoint_together) {
  auto db = steward::testing::make_db_path("steward_storage_commit");
  {
    auto storage = steward::storage::make_storage<
        steward::storage::rocksdb_storage_tag>(db);
    auto writes = steward::storage::write_set_t{};
    writes[make_key("A|1")] = steward::schema::bytes_t{1};
    writes[make_key("A|2")] = steward::schema::bytes_t{2};
    storage.commit(
        steward::storage::committed_state{
            .height = 42,
            .state_root = steward::testing::make_hash(10),
            .block_time = 1'700'000'123},
        writes);

    auto loaded = storage.load_committed_state();
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->height, 42);
    EXPECT_EQ(loaded->state_root, steward::testing::make_hash(10));
    EXPECT_EQ(loaded->block_time, 1'700'000'123);

    auto value = storage.get(steward::schema::bytes_view_t{make_key("A|2")});
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, steward::schema::bytes_t{2});
  }
  steward::testing::remove_path(db);
}

TEST(storage_types, checkpoint_survives_reopen) {
  auto db = steward::testing::make_db_path("steward_storage_reopen");
  {
    auto storage = steward::storage::make_storage<
        steward::storage::rocksdb_storage_tag>(db);
    storage.commit(
        steward::storage::committed_state{
            .height = 7, .state_root = steward::testing::make_hash(1)},
        {});
  }
  {
    auto storage = steward::storage::make_storage<
        steward::storage::rocksdb_storage_tag>(db);
    auto loaded = storage.load_committed_state();
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->height, 7);
  }
  steward::testing::remove_path(db);
}

TEST(storage_types, list_by_prefix_returns_matching_rows_in_key_order) {
  auto db = steward::testing::make_db_path("steward_storage_prefix");
  {
    auto encoder = encoder_t{};
    auto storage = steward::storage::make_storage<
        steward::storage::rocksdb_storage_tag>(db);
    storage.put(encoder, steward::schema::bytes_view_t{make_key("P|b")},
                uint32_t{2});
    storage.put(encoder, steward::schema::bytes_view_t{make_key("P|a")},
                uint32_t{1});
    storage.put(encoder, steward::schema::bytes_view_t{make_key("Q|a")},
                uint32_t{3});

    auto rows = storage.list_by_prefix(
        steward::schema::bytes_view_t{make_key("P|")});
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].first, make_key("P|a"));
    EXPECT_EQ(rows[1].first, make_key("P|b"));

    auto typed = storage.get<uint32_t>(
        encoder, steward::schema::bytes_view_t{make_key("Q|a")});
    ASSERT_TRUE(typed.has_value());
    EXPECT_EQ(*typed, 3u);
  }
  steward::testing::remove_path(db);
}
