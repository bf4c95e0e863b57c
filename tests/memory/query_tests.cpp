/**
 * @file query_tests.cpp
 * @brief Unit tests for shared filtering, ordering and archive eligibility
 */

#include <gtest/gtest.h>
#include <agentmem/memory/query.hpp>
#include <agentmem/core/utils.hpp>
#include <string>
#include <vector>

using namespace agentmem;

namespace {

WorkingMemory make_working(const std::string& key, int64_t created_at, int64_t expires_at,
                           const std::string& tag = "") {
    WorkingMemory m;
    m.agent_id = "agent";
    m.key = key;
    m.created_at = created_at;
    m.expires_at = expires_at;
    m.version = 1;
    if (!tag.empty()) {
        std::vector<std::string> tags(1, tag);
        m.metadata.set("tags", Json::from_strings(tags));
    }
    return m;
}

LongtermMemory make_longterm(const std::string& key, int importance, int64_t created_at,
                             const std::string& category = "general") {
    LongtermMemory m;
    m.agent_id = "agent";
    m.key = key;
    m.category = category;
    m.metadata.importance = importance;
    m.created_at = created_at;
    m.version = 1;
    return m;
}

} // namespace

// ============================================================================
// Working memory
// ============================================================================

TEST(QueryTest, TagsIntersect) {
    std::vector<std::string> entry;
    entry.push_back("a");
    entry.push_back("b");
    std::vector<std::string> filter;
    EXPECT_TRUE(tags_intersect(entry, filter));
    filter.push_back("z");
    EXPECT_FALSE(tags_intersect(entry, filter));
    filter.push_back("b");
    EXPECT_TRUE(tags_intersect(entry, filter));
}

TEST(QueryTest, WorkingDefaultOrderIsNewestFirst) {
    std::vector<WorkingMemory> items;
    items.push_back(make_working("old", 100, 0));
    items.push_back(make_working("new", 300, 0));
    items.push_back(make_working("mid", 200, 0));

    apply_filters(items, MemoryFilters());
    ASSERT_EQ(items.size(), 3u);
    EXPECT_EQ(items[0].key, "new");
    EXPECT_EQ(items[1].key, "mid");
    EXPECT_EQ(items[2].key, "old");
}

TEST(QueryTest, WorkingLiveAtDropsExpired) {
    std::vector<WorkingMemory> items;
    items.push_back(make_working("expired", 100, 500));
    items.push_back(make_working("boundary", 100, 1000));
    items.push_back(make_working("forever", 100, 0));

    MemoryFilters f;
    f.live_at = 1000;
    f.sort_by = "key";
    apply_filters(items, f);

    // Expiry is strict: an entry expiring exactly at live_at is still live
    ASSERT_EQ(items.size(), 2u);
    EXPECT_EQ(items[0].key, "boundary");
    EXPECT_EQ(items[1].key, "forever");
}

TEST(QueryTest, WorkingTagsWindowAndPaging) {
    std::vector<WorkingMemory> items;
    for (int i = 0; i < 10; ++i) {
        items.push_back(make_working("k" + std::to_string(i), 100 + i, 0, i % 2 ? "odd" : "even"));
    }

    MemoryFilters f;
    f.tags.push_back("even");
    f.after_time = 102;
    f.sort_by = "created_at";
    f.sort_desc = false;
    f.offset = 1;
    f.limit = 2;
    apply_filters(items, f);

    // even entries at or after 102: k2, k4, k6, k8 -> skip one, take two
    ASSERT_EQ(items.size(), 2u);
    EXPECT_EQ(items[0].key, "k4");
    EXPECT_EQ(items[1].key, "k6");
}

TEST(QueryTest, OffsetPastEndIsEmpty) {
    std::vector<WorkingMemory> items;
    items.push_back(make_working("only", 1, 0));
    MemoryFilters f;
    f.offset = 5;
    apply_filters(items, f);
    EXPECT_TRUE(items.empty());
}

// ============================================================================
// Long-term memory
// ============================================================================

TEST(QueryTest, LongtermDefaultOrderByImportanceThenRecency) {
    std::vector<LongtermMemory> items;
    items.push_back(make_longterm("low", 2, 300));
    items.push_back(make_longterm("high-old", 9, 100));
    items.push_back(make_longterm("high-new", 9, 200));

    apply_filters(items, MemoryFilters());
    ASSERT_EQ(items.size(), 3u);
    EXPECT_EQ(items[0].key, "high-new");
    EXPECT_EQ(items[1].key, "high-old");
    EXPECT_EQ(items[2].key, "low");
}

TEST(QueryTest, LongtermCategoryAndImportanceFilters) {
    std::vector<LongtermMemory> items;
    items.push_back(make_longterm("a", 3, 1, "facts"));
    items.push_back(make_longterm("b", 7, 2, "facts"));
    items.push_back(make_longterm("c", 8, 3, "prefs"));

    MemoryFilters f;
    f.category = "facts";
    f.min_importance = 5;
    apply_filters(items, f);
    ASSERT_EQ(items.size(), 1u);
    EXPECT_EQ(items[0].key, "b");
}

TEST(QueryTest, LongtermSortByKey) {
    std::vector<LongtermMemory> items;
    items.push_back(make_longterm("b", 5, 1));
    items.push_back(make_longterm("c", 5, 1));
    items.push_back(make_longterm("a", 5, 1));

    MemoryFilters f;
    f.sort_by = "key";
    f.sort_desc = true;
    apply_filters(items, f);
    ASSERT_EQ(items.size(), 3u);
    EXPECT_EQ(items[0].key, "c");
    EXPECT_EQ(items[2].key, "a");
}

// ============================================================================
// Snapshots
// ============================================================================

TEST(QueryTest, SnapshotsFilteredByTypeNewestFirst) {
    std::vector<StateSnapshot> items;
    for (int i = 0; i < 4; ++i) {
        StateSnapshot s;
        s.id = "s" + std::to_string(i);
        s.created_at = 1000 + i;
        s.snapshot_type = i % 2 ? SnapshotType::PERIODIC : SnapshotType::MANUAL;
        items.push_back(s);
    }

    SnapshotFilters f;
    f.snapshot_type = "periodic";
    apply_filters(items, f);
    ASSERT_EQ(items.size(), 2u);
    EXPECT_EQ(items[0].id, "s3");
    EXPECT_EQ(items[1].id, "s1");
}

// ============================================================================
// Archive eligibility
// ============================================================================

TEST(QueryTest, ArchiveEligibilityRequiresEveryBound) {
    int64_t now = 100 * MS_PER_DAY;
    LongtermMemory m = make_longterm("k", 3, now - 10 * MS_PER_DAY, "scratch");
    m.access_count = 2;

    ArchiveCriteria c;
    c.older_than_ms = 7 * MS_PER_DAY;
    c.max_access_count = 2;
    c.max_importance = 3;
    c.categories.push_back("scratch");
    EXPECT_TRUE(archive_eligible(m, c, now));

    ArchiveCriteria too_recent = c;
    too_recent.older_than_ms = 30 * MS_PER_DAY;
    EXPECT_FALSE(archive_eligible(m, too_recent, now));

    ArchiveCriteria too_accessed = c;
    too_accessed.max_access_count = 1;
    EXPECT_FALSE(archive_eligible(m, too_accessed, now));

    ArchiveCriteria too_important = c;
    too_important.max_importance = 2;
    EXPECT_FALSE(archive_eligible(m, too_important, now));

    ArchiveCriteria other_category = c;
    other_category.categories[0] = "facts";
    EXPECT_FALSE(archive_eligible(m, other_category, now));
}

TEST(QueryTest, ArchiveImportanceBoundary) {
    ArchiveCriteria c;
    c.max_importance = 3;
    int64_t now = current_timestamp_ms();

    EXPECT_TRUE(archive_eligible(make_longterm("two", 2, now), c, now));
    EXPECT_TRUE(archive_eligible(make_longterm("three", 3, now), c, now));
    EXPECT_FALSE(archive_eligible(make_longterm("four", 4, now), c, now));
}
