#include <gtest/gtest.h>
#include "engine/metadata_store.hpp"
#include "test_helpers.hpp"

using namespace morgue::engine;
using morgue::test::TempDir;

namespace {

    std::vector<ChunkRecord> make_rows(uint64_t first, size_t n, const std::string& source, bool with_text = false) {
        std::vector<ChunkRecord> rows;
        for (size_t i = 0; i < n; ++i) {
            ChunkRecord r;
            r.global_id = first + i;
            r.article_id = "a" + std::to_string(first + i);
            r.article_title = "Title " + std::to_string(first + i);
            r.date = "1901-02-03";
            r.paper = "Deseret News";
            r.source_file = source;
            r.row_offset = static_cast<uint32_t>(i);
            if (with_text) r.text = "inline " + std::to_string(i);
            rows.push_back(r);
        }
        return rows;
    }

}

TEST(MetadataStoreTest, UpsertAndPointLookup) {
    TempDir dir;
    MetadataStore store;
    ASSERT_TRUE(store.open(dir / "meta.db"));

    ASSERT_TRUE(store.begin());
    ASSERT_TRUE(store.upsert_rows(make_rows(0, 3, "part0")));
    ASSERT_TRUE(store.upsert_rows(make_rows(3, 2, "part1", true)));
    ASSERT_TRUE(store.commit());

    auto r = store.get(1);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->article_id, "a1");
    EXPECT_EQ(r->source_file, "part0");
    EXPECT_EQ(r->row_offset, 1u);
    EXPECT_FALSE(r->text.has_value());

    auto lite = store.get(4);
    ASSERT_TRUE(lite.has_value());
    ASSERT_TRUE(lite->text.has_value());
    EXPECT_EQ(*lite->text, "inline 1");

    EXPECT_FALSE(store.get(99).has_value());
    EXPECT_EQ(store.row_count(), 5u);
}

TEST(MetadataStoreTest, UpsertReplacesExistingRow) {
    TempDir dir;
    MetadataStore store;
    ASSERT_TRUE(store.open(dir / "meta.db"));

    auto rows = make_rows(0, 1, "part0");
    ASSERT_TRUE(store.upsert_rows(rows));
    rows[0].article_title = "Replaced";
    ASSERT_TRUE(store.upsert_rows(rows));

    EXPECT_EQ(store.row_count(), 1u);
    EXPECT_EQ(store.get(0)->article_title, "Replaced");
}

TEST(MetadataStoreTest, RollbackDiscardsUncommittedRows) {
    TempDir dir;
    MetadataStore store;
    ASSERT_TRUE(store.open(dir / "meta.db"));

    ASSERT_TRUE(store.begin());
    ASSERT_TRUE(store.upsert_rows(make_rows(0, 4, "part0")));
    ASSERT_TRUE(store.record_source({"part0", 0, 4}));
    ASSERT_TRUE(store.rollback());

    EXPECT_EQ(store.row_count(), 0u);
    EXPECT_EQ(store.committed_count(), 0u);
}

TEST(MetadataStoreTest, CloseWithOpenTransactionRollsBack) {
    TempDir dir;
    {
        MetadataStore store;
        ASSERT_TRUE(store.open(dir / "meta.db"));
        ASSERT_TRUE(store.begin());
        ASSERT_TRUE(store.upsert_rows(make_rows(0, 2, "part0")));
    }
    MetadataStore reopened;
    ASSERT_TRUE(reopened.open(dir / "meta.db"));
    EXPECT_EQ(reopened.row_count(), 0u);
}

TEST(MetadataStoreTest, SourceRangesAndTruncation) {
    TempDir dir;
    MetadataStore store;
    ASSERT_TRUE(store.open(dir / "meta.db"));

    ASSERT_TRUE(store.begin());
    ASSERT_TRUE(store.upsert_rows(make_rows(0, 3, "part0")));
    ASSERT_TRUE(store.record_source({"part0", 0, 3}));
    ASSERT_TRUE(store.upsert_rows(make_rows(3, 3, "part1")));
    ASSERT_TRUE(store.record_source({"part1", 3, 3}));
    ASSERT_TRUE(store.upsert_rows(make_rows(6, 2, "part2")));
    ASSERT_TRUE(store.record_source({"part2", 6, 2}));
    ASSERT_TRUE(store.commit());

    EXPECT_EQ(store.committed_count(), 8u);
    auto ranges = store.sources();
    ASSERT_EQ(ranges.size(), 3u);
    EXPECT_EQ(ranges[1].name, "part1");
    EXPECT_EQ(ranges[1].end_id(), 6u);

    auto removed = store.truncate_from(4);
    ASSERT_TRUE(removed.has_value());
    EXPECT_EQ(*removed, (std::vector<std::string>{"part1", "part2"}));
    EXPECT_EQ(store.committed_count(), 3u);
    EXPECT_EQ(store.row_count(), 4u);
    EXPECT_FALSE(store.get(4).has_value());
    EXPECT_TRUE(store.get(3).has_value());
}

TEST(MetadataStoreTest, FailedTruncationReportsFailureAndKeepsRows) {
    TempDir dir;
    {
        MetadataStore store;
        ASSERT_TRUE(store.open(dir / "meta.db"));
        ASSERT_TRUE(store.begin());
        ASSERT_TRUE(store.upsert_rows(make_rows(0, 4, "part0")));
        ASSERT_TRUE(store.record_source({"part0", 0, 4}));
        ASSERT_TRUE(store.commit());
    }

    // Deletes are refused on a read-only connection
    MetadataStore ro;
    ASSERT_TRUE(ro.open(dir / "meta.db", true));
    EXPECT_FALSE(ro.truncate_from(2).has_value());
    EXPECT_EQ(ro.committed_count(), 4u);
    EXPECT_EQ(ro.row_count(), 4u);
    EXPECT_TRUE(ro.get(3).has_value());
}

TEST(MetadataStoreTest, SettingsPersistAndReadOnlyOpen) {
    TempDir dir;
    {
        MetadataStore store;
        ASSERT_TRUE(store.open(dir / "meta.db"));
        EXPECT_FALSE(store.get_setting("mode").has_value());
        ASSERT_TRUE(store.set_setting("mode", "exact"));
        ASSERT_TRUE(store.set_setting("mode", "compressed"));
        ASSERT_TRUE(store.upsert_rows(make_rows(0, 1, "part0")));
    }

    MetadataStore ro;
    ASSERT_TRUE(ro.open(dir / "meta.db", true));
    EXPECT_EQ(ro.get_setting("mode"), std::optional<std::string>("compressed"));
    EXPECT_TRUE(ro.get(0).has_value());
    EXPECT_FALSE(ro.upsert_rows(make_rows(1, 1, "part0")));
}

TEST(MetadataStoreTest, ReadOnlyOpenOfMissingFileFails) {
    TempDir dir;
    MetadataStore store;
    EXPECT_FALSE(store.open(dir / "absent.db", true));
    EXPECT_FALSE(store.is_open());
}
