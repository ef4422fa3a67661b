#include <batchstake/schema/encoding/scale/encoder.hpp>
#include <batchstake/storage/overlay.hpp>
#include <batchstake/storage/rocksdb/storage.hpp>
#include <batchstake/storage/storage.hpp>
#include <batchstake/testing/common.hpp>
#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <string_view>

namespace {

using storage_t =
    batchstake::storage::storage<batchstake::storage::rocksdb_storage_tag>;
using overlay_t =
    batchstake::storage::overlay<batchstake::storage::rocksdb_storage_tag>;
using encoder_t = batchstake::schema::encoding::scale_encoder_t;

batchstake::schema::bytes_t make_key(const std::string_view text) {
  return batchstake::schema::make_bytes(text);
}

batchstake::schema::bytes_view_t view(const batchstake::schema::bytes_t& key) {
  return batchstake::schema::make_bytes_view(key);
}

}  // namespace

TEST(storage_types, defaults_are_stable) {
  auto committed = batchstake::storage::committed_state{};
  EXPECT_EQ(committed.applied_operations, 0u);

  auto entry = batchstake::storage::key_value_entry_t{};
  EXPECT_TRUE(entry.first.empty());
  EXPECT_TRUE(entry.second.empty());
}

TEST(storage_types, committed_state_round_trips) {
  auto db = batchstake::testing::make_db_path("batchstake_storage_committed");
  {
    auto storage =
        batchstake::storage::make_storage<
            batchstake::storage::rocksdb_storage_tag>(db);
    EXPECT_FALSE(storage.load_committed_state().has_value());

    auto state = batchstake::storage::committed_state{
        .applied_operations = 42,
        .state_root = batchstake::testing::make_hash(10)};
    storage.save_committed_state(state);

    auto loaded = storage.load_committed_state();
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->applied_operations, state.applied_operations);
    EXPECT_EQ(loaded->state_root, state.state_root);
  }
  batchstake::testing::remove_path(db);
}

TEST(storage_types, put_get_erase_round_trip) {
  auto db = batchstake::testing::make_db_path("batchstake_storage_kv");
  {
    auto storage =
        batchstake::storage::make_storage<
            batchstake::storage::rocksdb_storage_tag>(db);
    auto encoder = encoder_t{};
    auto key = make_key("A|one");

    EXPECT_FALSE(storage.get<uint64_t>(encoder, view(key)).has_value());
    storage.put(encoder, view(key), uint64_t{7});
    EXPECT_EQ(storage.get<uint64_t>(encoder, view(key)), uint64_t{7});

    storage.erase(view(key));
    EXPECT_FALSE(storage.get_raw(view(key)).has_value());
    // Erasing a missing key is not an error.
    storage.erase(view(key));
  }
  batchstake::testing::remove_path(db);
}

TEST(storage_types, list_by_prefix_stops_at_keyspace_boundary) {
  auto db = batchstake::testing::make_db_path("batchstake_storage_prefix");
  {
    auto storage =
        batchstake::storage::make_storage<
            batchstake::storage::rocksdb_storage_tag>(db);
    auto encoder = encoder_t{};
    auto a1 = make_key("A|one");
    auto a2 = make_key("A|two");
    auto b1 = make_key("B|one");
    storage.put(encoder, view(a1), uint64_t{1});
    storage.put(encoder, view(a2), uint64_t{2});
    storage.put(encoder, view(b1), uint64_t{9});

    auto a_prefix = make_key("A|");
    auto rows = storage.list_by_prefix(view(a_prefix));
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].first, a1);
    EXPECT_EQ(rows[1].first, a2);
    EXPECT_EQ(encoder.decode<uint64_t>(view(rows[1].second)), 2u);

    auto c_prefix = make_key("C|");
    EXPECT_TRUE(storage.list_by_prefix(view(c_prefix)).empty());
  }
  batchstake::testing::remove_path(db);
}

TEST(storage_types, apply_writes_puts_and_deletes_together) {
  auto db = batchstake::testing::make_db_path("batchstake_storage_apply");
  {
    auto storage =
        batchstake::storage::make_storage<
            batchstake::storage::rocksdb_storage_tag>(db);
    auto encoder = encoder_t{};
    auto keep = make_key("K|keep");
    auto drop = make_key("K|drop");
    storage.put(encoder, view(drop), uint64_t{1});

    auto writes = batchstake::storage::write_set_t{};
    writes.emplace(keep, encoder.encode(uint64_t{5}));
    writes.emplace(drop, std::nullopt);
    storage.apply(writes);

    EXPECT_EQ(storage.get<uint64_t>(encoder, view(keep)), uint64_t{5});
    EXPECT_FALSE(storage.get_raw(view(drop)).has_value());
  }
  batchstake::testing::remove_path(db);
}

TEST(storage_overlay, reads_own_writes_before_base) {
  auto db = batchstake::testing::make_db_path("batchstake_overlay_reads");
  {
    auto storage =
        batchstake::storage::make_storage<
            batchstake::storage::rocksdb_storage_tag>(db);
    auto encoder = encoder_t{};
    auto key = make_key("O|value");
    storage.put(encoder, view(key), uint64_t{1});

    auto overlay = overlay_t{storage};
    EXPECT_EQ(overlay.get<uint64_t>(encoder, view(key)), uint64_t{1});
    overlay.put(encoder, view(key), uint64_t{2});
    EXPECT_EQ(overlay.get<uint64_t>(encoder, view(key)), uint64_t{2});
    EXPECT_EQ(storage.get<uint64_t>(encoder, view(key)), uint64_t{1});

    overlay.erase(view(key));
    EXPECT_FALSE(overlay.get_raw(view(key)).has_value());
    EXPECT_TRUE(storage.get_raw(view(key)).has_value());
  }
  batchstake::testing::remove_path(db);
}

TEST(storage_overlay, commit_applies_and_discard_drops) {
  auto db = batchstake::testing::make_db_path("batchstake_overlay_commit");
  {
    auto storage =
        batchstake::storage::make_storage<
            batchstake::storage::rocksdb_storage_tag>(db);
    auto encoder = encoder_t{};
    auto committed = make_key("O|committed");
    auto discarded = make_key("O|discarded");

    {
      auto overlay = overlay_t{storage};
      overlay.put(encoder, view(discarded), uint64_t{3});
      EXPECT_FALSE(overlay.empty());
      overlay.discard();
      EXPECT_TRUE(overlay.empty());
    }
    {
      // Dropping an overlay without commit leaves the store untouched.
      auto overlay = overlay_t{storage};
      overlay.put(encoder, view(discarded), uint64_t{4});
    }
    EXPECT_FALSE(storage.get_raw(view(discarded)).has_value());

    auto overlay = overlay_t{storage};
    overlay.put(encoder, view(committed), uint64_t{9});
    EXPECT_EQ(overlay.writes().size(), 1u);
    overlay.commit();
    EXPECT_TRUE(overlay.empty());
    EXPECT_EQ(storage.get<uint64_t>(encoder, view(committed)), uint64_t{9});
  }
  batchstake::testing::remove_path(db);
}
