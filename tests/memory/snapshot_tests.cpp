/**
 * @file snapshot_tests.cpp
 * @brief Unit tests for snapshot capture, retention and restore
 */

#include <gtest/gtest.h>
#include <agentmem/memory/snapshot.hpp>
#include <agentmem/memory/working_memory.hpp>
#include <agentmem/memory/longterm_memory.hpp>
#include <agentmem/memory/in_memory_repository.hpp>
#include <agentmem/memory/sqlite_repository.hpp>
#include <agentmem/memory/errors.hpp>
#include <agentmem/core/task_dispatcher.hpp>
#include <agentmem/core/utils.hpp>
#include <cstdio>
#include <memory>
#include <string>
#include <vector>

using namespace agentmem;

class SnapshotTest : public ::testing::Test {
protected:
    SnapshotTest()
        : repo_(new InMemoryRepository())
        , dispatcher_(1, "test")
        , working_(repo_, dispatcher_)
        , longterm_(repo_, dispatcher_)
        , snapshots_(repo_)
    {}

    std::shared_ptr<InMemoryRepository> repo_;
    TaskDispatcher dispatcher_;
    WorkingMemoryManager working_;
    LongtermMemoryManager longterm_;
    SnapshotManager snapshots_;
};

// ============================================================================
// Create
// ============================================================================

TEST_F(SnapshotTest, CaptureContainsWorkingAndLongtermInventory) {
    working_.store("agent-1", "task", Json("pending"), 0);
    working_.store("agent-1", "step", Json(3), 0);
    longterm_.remember("agent-1", "fact-1", Json(1), "facts");
    longterm_.remember("agent-1", "fact-2", Json(2), "facts");
    longterm_.remember("agent-1", "pref", Json(3), "prefs");

    StateSnapshot s = snapshots_.create("agent-1", "manual", "checkpoint");

    EXPECT_FALSE(s.id.empty());
    EXPECT_EQ(s.snapshot_type, SnapshotType::MANUAL);
    EXPECT_EQ(s.metadata.reason, "checkpoint");
    EXPECT_EQ(s.metadata.trigger, "manual");
    EXPECT_EQ(s.metadata.size_bytes, static_cast<int64_t>(s.state.dump().size()));

    const std::vector<Json>& entries = s.state["working_memory"].as_array();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].get_string("key"), "step");
    EXPECT_EQ(entries[1].get_string("key"), "task");
    EXPECT_EQ(s.state["longterm_keys"].size(), 3u);
    EXPECT_EQ(s.state["longterm_categories"].get_int("facts"), 2);
    EXPECT_EQ(s.state.get_string("agent_id"), "agent-1");
}

TEST_F(SnapshotTest, RetentionDependsOnType) {
    StateSnapshot periodic = snapshots_.create("agent-1", "periodic");
    StateSnapshot manual = snapshots_.create("agent-1", "manual");
    StateSnapshot pre_update = snapshots_.create("agent-1", "pre-update");
    StateSnapshot pre_shutdown = snapshots_.create("agent-1", SnapshotType::PRE_SHUTDOWN, "stop");

    EXPECT_EQ(periodic.expires_at - periodic.created_at, 7 * MS_PER_DAY);
    EXPECT_EQ(manual.expires_at - manual.created_at, 30 * MS_PER_DAY);
    EXPECT_EQ(pre_update.expires_at - pre_update.created_at, 90 * MS_PER_DAY);
    EXPECT_EQ(pre_shutdown.expires_at - pre_shutdown.created_at, 90 * MS_PER_DAY);
}

TEST_F(SnapshotTest, UnknownTypeFallsBackToManual) {
    StateSnapshot s = snapshots_.create("agent-1", "hourly");
    EXPECT_EQ(s.snapshot_type, SnapshotType::MANUAL);
    EXPECT_EQ(s.expires_at - s.created_at, 30 * MS_PER_DAY);
    EXPECT_EQ(s.metadata.reason, "manual snapshot");

    StateSnapshot empty = snapshots_.create("agent-1", "");
    EXPECT_EQ(empty.snapshot_type, SnapshotType::MANUAL);
}

TEST_F(SnapshotTest, ChecksumRoundTrip) {
    working_.store("agent-1", "task", Json::parse("{\"ratio\":0.1,\"items\":[1,2,3]}"), 0);
    StateSnapshot created = snapshots_.create("agent-1");

    StateSnapshot loaded = snapshots_.get(created.id);
    EXPECT_EQ(loaded.checksum, created.checksum);
    EXPECT_EQ(compute_state_checksum(loaded.state), loaded.checksum);
    EXPECT_TRUE(SnapshotManager::verify(loaded));

    loaded.state.set("tampered", true);
    EXPECT_FALSE(SnapshotManager::verify(loaded));
}

TEST_F(SnapshotTest, ListFiltersAndOrders) {
    snapshots_.create("agent-1", "periodic");
    sleep_ms(2);
    snapshots_.create("agent-1", "manual");
    sleep_ms(2);
    StateSnapshot latest = snapshots_.create("agent-1", "periodic");
    snapshots_.create("agent-2", "periodic");

    std::vector<StateSnapshot> all = snapshots_.list("agent-1");
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].id, latest.id);

    SnapshotFilters f;
    f.snapshot_type = "periodic";
    EXPECT_EQ(snapshots_.list("agent-1", f).size(), 2u);
}

TEST_F(SnapshotTest, RemoveAndMissing) {
    StateSnapshot s = snapshots_.create("agent-1");
    snapshots_.remove(s.id);
    EXPECT_THROW(snapshots_.get(s.id), NotFoundError);
    EXPECT_THROW(snapshots_.remove(s.id), NotFoundError);
}

// ============================================================================
// Restore
// ============================================================================

TEST_F(SnapshotTest, RestoreReplacesWorkingMemory) {
    working_.store("agent-1", "task", Json("pending"), 0);
    longterm_.remember("agent-1", "fact", Json(1));
    StateSnapshot s = snapshots_.create("agent-1");

    working_.update("agent-1", "task", Json("done"), 1);
    working_.store("agent-1", "scratch", Json("later"), 0);
    longterm_.remember("agent-1", "fact-2", Json(2));

    RestoreReport report = snapshots_.restore("agent-1", s.id);
    EXPECT_EQ(report.restored, 1);
    EXPECT_EQ(report.skipped_expired, 0);

    WorkingMemory task = working_.retrieve("agent-1", "task");
    EXPECT_EQ(task.value.as_string(), "pending");
    // Above the captured version so stale writers conflict
    EXPECT_EQ(task.version, 2);
    EXPECT_THROW(working_.retrieve("agent-1", "scratch"), NotFoundError);

    // Long-term memory is untouched
    EXPECT_NO_THROW(longterm_.recall("agent-1", "fact-2"));
}

TEST_F(SnapshotTest, RestoreSkipsEntriesExpiredSinceCapture) {
    working_.store("agent-1", "short", Json(1), 200);
    working_.store("agent-1", "long", Json(2), 0);
    StateSnapshot s = snapshots_.create("agent-1");
    sleep_ms(250);

    RestoreReport report = snapshots_.restore("agent-1", s.id);
    EXPECT_EQ(report.restored, 1);
    EXPECT_EQ(report.skipped_expired, 1);
    EXPECT_THROW(working_.retrieve("agent-1", "short"), NotFoundError);
}

TEST_F(SnapshotTest, RestoreChecksOwnershipBeforeChanging) {
    working_.store("agent-1", "task", Json("a1"), 0);
    working_.store("agent-2", "task", Json("a2"), 0);
    StateSnapshot s = snapshots_.create("agent-1");

    EXPECT_THROW(snapshots_.restore("agent-2", s.id), OwnershipError);
    EXPECT_EQ(working_.retrieve("agent-2", "task").value.as_string(), "a2");
}

TEST_F(SnapshotTest, RestoreRefusesCorruptSnapshot) {
    StateSnapshot s;
    s.id = generate_uuid();
    s.agent_id = "agent-1";
    s.state = Json::object();
    s.checksum = "0000";
    s.created_at = current_timestamp_ms();
    ASSERT_EQ(repo_->create_snapshot(s), StoreStatus::OK);

    working_.store("agent-1", "task", Json("live"), 0);
    EXPECT_THROW(snapshots_.restore("agent-1", s.id), IntegrityError);
    EXPECT_EQ(working_.retrieve("agent-1", "task").value.as_string(), "live");
}

TEST_F(SnapshotTest, RestoreMissingSnapshot) {
    EXPECT_THROW(snapshots_.restore("agent-1", "no-such-id"), NotFoundError);
    EXPECT_THROW(snapshots_.restore("agent-1", ""), ValidationError);
}

// ============================================================================
// Durable store
// ============================================================================

TEST(SnapshotSqliteTest, ChecksumRoundTripThroughSqlite) {
    std::string path = testing::TempDir() + "agentmem_snapshot_" + generate_uuid() + ".db";
    {
        std::shared_ptr<SqliteRepository> repo(new SqliteRepository());
        ASSERT_TRUE(repo->open(path));
        ASSERT_TRUE(repo->ensure_schema());

        TaskDispatcher dispatcher(1, "test");
        WorkingMemoryManager working(repo, dispatcher);
        working.store("agent-1", "task", Json::parse("{\"pi\":3.141592653589793,\"tags\":[\"x\"]}"), 0);

        SnapshotManager snapshots(repo);
        StateSnapshot s = snapshots.create("agent-1", "pre-update", "upgrade");
        StateSnapshot loaded = snapshots.get(s.id);
        EXPECT_TRUE(SnapshotManager::verify(loaded));
        EXPECT_EQ(loaded.snapshot_type, SnapshotType::PRE_UPDATE);

        RestoreReport report = snapshots.restore("agent-1", s.id);
        EXPECT_EQ(report.restored, 1);
        dispatcher.wait_idle();
    }
    std::remove(path.c_str());
    std::remove((path + "-wal").c_str());
    std::remove((path + "-shm").c_str());
}
