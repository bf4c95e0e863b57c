/**
 * @file sync_coordinator_tests.cpp
 * @brief Unit tests for the per-instance sync coordinator
 */

#include <gtest/gtest.h>
#include <agentmem/sync/sync_coordinator.hpp>
#include <agentmem/memory/longterm_memory.hpp>
#include <agentmem/memory/working_memory.hpp>
#include <agentmem/memory/in_memory_repository.hpp>
#include <agentmem/memory/errors.hpp>
#include <agentmem/core/task_dispatcher.hpp>
#include <agentmem/core/utils.hpp>
#include <atomic>
#include <memory>

using namespace agentmem;

class SyncCoordinatorTest : public ::testing::Test {
protected:
    SyncCoordinatorTest()
        : repo_(new InMemoryRepository())
        , dispatcher_(1, "test")
        , longterm_(repo_, dispatcher_)
        , working_(repo_, dispatcher_)
        , node_a_(repo_, "node-a")
        , node_b_(repo_, "node-b")
    {}

    std::shared_ptr<InMemoryRepository> repo_;
    TaskDispatcher dispatcher_;
    LongtermMemoryManager longterm_;
    WorkingMemoryManager working_;
    SyncCoordinator node_a_;
    SyncCoordinator node_b_;
};

// ============================================================================
// Lifecycle
// ============================================================================

TEST_F(SyncCoordinatorTest, StartTwiceIsRejected) {
    node_a_.start_periodic_sync("agent-1", 50);
    EXPECT_TRUE(node_a_.is_running());
    EXPECT_THROW(node_a_.start_periodic_sync("agent-1", 50), AlreadyRunningError);
    node_a_.stop_periodic_sync();
    EXPECT_FALSE(node_a_.is_running());
}

TEST_F(SyncCoordinatorTest, StopWithoutStartIsRejected) {
    EXPECT_THROW(node_a_.stop_periodic_sync(), NotRunningError);
}

TEST_F(SyncCoordinatorTest, LoopCanBeRestarted) {
    node_a_.start_periodic_sync("agent-1", 50);
    node_a_.stop_periodic_sync();
    node_a_.start_periodic_sync("agent-1", 50);
    node_a_.stop_periodic_sync();
    EXPECT_THROW(node_a_.stop_periodic_sync(), NotRunningError);
}

TEST_F(SyncCoordinatorTest, StopReturnsWithinOneTick) {
    node_a_.start_periodic_sync("agent-1", 10 * MS_PER_SECOND);
    int64_t before = current_timestamp_ms();
    node_a_.stop_periodic_sync();
    EXPECT_LT(current_timestamp_ms() - before, 5 * MS_PER_SECOND);
}

TEST_F(SyncCoordinatorTest, PeriodicLoopRunsPasses) {
    node_a_.start_periodic_sync("agent-1", 20);
    sleep_ms(200);
    node_a_.stop_periodic_sync();

    SyncStatus status = node_a_.status("agent-1");
    EXPECT_GE(status.sync_version, 1);
    EXPECT_EQ(status.status, SyncState::SYNCED);
}

TEST_F(SyncCoordinatorTest, DestructorStopsRunningLoop) {
    std::unique_ptr<SyncCoordinator> node(new SyncCoordinator(repo_, "node-c"));
    node->start_periodic_sync("agent-1", 20);
    node.reset();
    SUCCEED();
}

TEST_F(SyncCoordinatorTest, InstanceIdAndStrategy) {
    SyncCoordinator anonymous(repo_);
    EXPECT_EQ(anonymous.instance_id().size(), 36u);
    EXPECT_EQ(node_a_.instance_id(), "node-a");

    EXPECT_EQ(node_a_.strategy(), ConflictStrategy::LAST_WRITE_WINS);
    node_a_.set_strategy(ConflictStrategy::VERSION_BASED);
    EXPECT_EQ(node_a_.strategy(), ConflictStrategy::VERSION_BASED);
}

TEST_F(SyncCoordinatorTest, FreshStatusIsSynced) {
    SyncStatus status = node_a_.status("agent-1");
    EXPECT_EQ(status.agent_id, "agent-1");
    EXPECT_EQ(status.instance_id, "node-a");
    EXPECT_EQ(status.status, SyncState::SYNCED);
    EXPECT_EQ(status.sync_version, 0);
    EXPECT_THROW(node_a_.status(""), ValidationError);
}

// ============================================================================
// Sync passes
// ============================================================================

TEST_F(SyncCoordinatorTest, EmptySyncSucceeds) {
    SyncResult result = node_a_.sync_agent("agent-1");
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.agent_id, "agent-1");
    EXPECT_TRUE(result.conflicts.empty());
    EXPECT_GE(result.duration_ms, 0);

    SyncStatus status = node_a_.status("agent-1");
    EXPECT_EQ(status.sync_version, 1);
    EXPECT_EQ(status.pending_changes, 0);
    EXPECT_GT(status.last_sync_at, 0);
}

TEST_F(SyncCoordinatorTest, StagedEditIsPushed) {
    longterm_.remember("agent-1", "fact", Json("v1"));

    node_a_.stage_change("agent-1", MemoryType::LONGTERM, "fact", Json("from a"));
    EXPECT_EQ(node_a_.pending_changes("agent-1"), 1);
    EXPECT_EQ(node_a_.status("agent-1").pending_changes, 1);

    SyncResult result = node_a_.sync_agent("agent-1");
    EXPECT_TRUE(result.success);
    EXPECT_GE(result.items_synced, 1);
    EXPECT_EQ(node_a_.pending_changes("agent-1"), 0);

    LongtermMemory stored = longterm_.recall("agent-1", "fact");
    EXPECT_EQ(stored.value.as_string(), "from a");
    EXPECT_EQ(stored.version, 2);

    SyncStatus status = node_a_.status("agent-1");
    EXPECT_EQ(status.status, SyncState::SYNCED);
    EXPECT_EQ(status.pending_changes, 0);
}

TEST_F(SyncCoordinatorTest, RestagingKeepsBaseVersion) {
    working_.store("agent-1", "task", Json("v1"), 0);
    node_a_.stage_change("agent-1", MemoryType::WORKING, "task", Json("draft"));
    node_a_.stage_change("agent-1", MemoryType::WORKING, "task", Json("final"));
    EXPECT_EQ(node_a_.pending_changes("agent-1"), 1);

    node_a_.sync_agent("agent-1");
    WorkingMemory stored = working_.retrieve("agent-1", "task");
    EXPECT_EQ(stored.value.as_string(), "final");
    EXPECT_EQ(stored.version, 2);
}

TEST_F(SyncCoordinatorTest, StagingUnknownKeyFails) {
    EXPECT_THROW(node_a_.stage_change("agent-1", MemoryType::LONGTERM, "ghost", Json(1)),
                 NotFoundError);
    EXPECT_THROW(node_a_.stage_change("agent-1", MemoryType::LONGTERM, "", Json(1)),
                 ValidationError);
}

TEST_F(SyncCoordinatorTest, ConcurrentEditsBecomeConflict) {
    longterm_.remember("agent-1", "fact", Json("v1"));

    node_a_.stage_change("agent-1", MemoryType::LONGTERM, "fact", Json("from a"));
    node_b_.stage_change("agent-1", MemoryType::LONGTERM, "fact", Json("from b"));

    EXPECT_TRUE(node_a_.sync_agent("agent-1").success);
    SyncResult result = node_b_.sync_agent("agent-1");

    ASSERT_EQ(result.conflicts.size(), 1u);
    const MemoryConflict& c = result.conflicts[0];
    EXPECT_EQ(c.key, "fact");
    EXPECT_EQ(c.memory_type, MemoryType::LONGTERM);
    EXPECT_EQ(c.local_version, 1);
    EXPECT_EQ(c.remote_version, 2);
    EXPECT_EQ(c.local_value.as_string(), "from b");
    EXPECT_EQ(c.remote_value.as_string(), "from a");

    SyncStatus status = node_b_.status("agent-1");
    EXPECT_EQ(status.status, SyncState::CONFLICT);
    EXPECT_EQ(status.pending_changes, 0);
    EXPECT_EQ(node_b_.detect_conflicts("agent-1").size(), 1u);

    // The other instance is unaffected
    EXPECT_EQ(node_a_.status("agent-1").status, SyncState::SYNCED);
    EXPECT_EQ(longterm_.recall("agent-1", "fact").value.as_string(), "from a");
}

TEST_F(SyncCoordinatorTest, ConflictForSameKeyIsReplaced) {
    longterm_.remember("agent-1", "fact", Json("v1"));
    node_b_.stage_change("agent-1", MemoryType::LONGTERM, "fact", Json("b1"));
    longterm_.update("agent-1", "fact", Json("v2"), 1);
    node_b_.sync_agent("agent-1");

    node_b_.stage_change("agent-1", MemoryType::LONGTERM, "fact", Json("b2"));
    longterm_.update("agent-1", "fact", Json("v3"), 2);
    SyncResult result = node_b_.sync_agent("agent-1");

    ASSERT_EQ(result.conflicts.size(), 1u);
    EXPECT_EQ(result.conflicts[0].local_value.as_string(), "b2");
    EXPECT_EQ(result.conflicts[0].remote_version, 3);
}

TEST_F(SyncCoordinatorTest, ResolveConflictsWithLocalWins) {
    longterm_.remember("agent-1", "fact", Json("v1"));
    node_a_.stage_change("agent-1", MemoryType::LONGTERM, "fact", Json("from a"));
    node_b_.stage_change("agent-1", MemoryType::LONGTERM, "fact", Json("from b"));
    node_a_.sync_agent("agent-1");
    node_b_.sync_agent("agent-1");

    node_b_.set_strategy(ConflictStrategy::LOCAL_WINS);
    EXPECT_EQ(node_b_.resolve_conflicts("agent-1"), 1);

    LongtermMemory stored = longterm_.recall("agent-1", "fact");
    EXPECT_EQ(stored.value.as_string(), "from b");
    EXPECT_EQ(stored.version, 3);

    SyncStatus status = node_b_.status("agent-1");
    EXPECT_TRUE(status.conflicts.empty());
    EXPECT_EQ(status.status, SyncState::SYNCED);

    // The resolved version is now this instance's base
    node_b_.stage_change("agent-1", MemoryType::LONGTERM, "fact", Json("follow-up"));
    EXPECT_TRUE(node_b_.sync_agent("agent-1").success);
    EXPECT_EQ(longterm_.recall("agent-1", "fact").version, 4);
}

TEST_F(SyncCoordinatorTest, ResolveConflictsWithRemoteWins) {
    longterm_.remember("agent-1", "fact", Json("v1"));
    node_b_.stage_change("agent-1", MemoryType::LONGTERM, "fact", Json("from b"));
    longterm_.update("agent-1", "fact", Json("elsewhere"), 1);
    node_b_.sync_agent("agent-1");

    node_b_.set_strategy(ConflictStrategy::REMOTE_WINS);
    EXPECT_EQ(node_b_.resolve_conflicts("agent-1"), 1);
    EXPECT_EQ(longterm_.recall("agent-1", "fact").value.as_string(), "elsewhere");
    EXPECT_EQ(longterm_.recall("agent-1", "fact").version, 2);
}

TEST_F(SyncCoordinatorTest, ManualStrategyKeepsConflictsOpen) {
    longterm_.remember("agent-1", "fact", Json("v1"));
    node_b_.stage_change("agent-1", MemoryType::LONGTERM, "fact", Json("from b"));
    longterm_.update("agent-1", "fact", Json("elsewhere"), 1);
    node_b_.sync_agent("agent-1");

    node_b_.set_strategy(ConflictStrategy::MANUAL);
    EXPECT_THROW(node_b_.resolve_conflicts("agent-1"), UnresolvedConflictsError);
    EXPECT_EQ(node_b_.detect_conflicts("agent-1").size(), 1u);
}

TEST_F(SyncCoordinatorTest, DeletedKeyIsDroppedWithError) {
    longterm_.remember("agent-1", "fact", Json("v1"));
    node_a_.stage_change("agent-1", MemoryType::LONGTERM, "fact", Json("edit"));
    longterm_.forget("agent-1", "fact");

    SyncResult result = node_a_.sync_agent("agent-1");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(node_a_.pending_changes("agent-1"), 0);

    SyncStatus status = node_a_.status("agent-1");
    EXPECT_EQ(status.status, SyncState::ERROR);
    EXPECT_EQ(status.pending_changes, 0);
}

TEST_F(SyncCoordinatorTest, SyncVersionIncrementsEveryPass) {
    node_a_.sync_agent("agent-1");
    node_a_.sync_agent("agent-1");
    node_a_.sync_agent("agent-1");
    EXPECT_EQ(node_a_.status("agent-1").sync_version, 3);
}

// ============================================================================
// Overrides
// ============================================================================

TEST_F(SyncCoordinatorTest, ForcePushOverwritesStore) {
    longterm_.remember("agent-1", "fact", Json("v1"));
    node_b_.stage_change("agent-1", MemoryType::LONGTERM, "fact", Json("from b"));
    longterm_.update("agent-1", "fact", Json("elsewhere"), 1);
    node_b_.sync_agent("agent-1");
    ASSERT_EQ(node_b_.detect_conflicts("agent-1").size(), 1u);

    SyncStatus status = node_b_.force_push("agent-1");
    EXPECT_TRUE(status.conflicts.empty());
    EXPECT_EQ(status.status, SyncState::SYNCED);
    EXPECT_EQ(status.pending_changes, 0);
    EXPECT_GT(status.metadata.get_int64("last_force_push"), 0);

    LongtermMemory stored = longterm_.recall("agent-1", "fact");
    EXPECT_EQ(stored.value.as_string(), "from b");
    EXPECT_EQ(stored.version, 3);
}

TEST_F(SyncCoordinatorTest, ForcePushWritesStagedEdits) {
    working_.store("agent-1", "task", Json("v1"), 0);
    node_a_.stage_change("agent-1", MemoryType::WORKING, "task", Json("mine"));
    working_.update("agent-1", "task", Json("theirs"), 1);

    node_a_.force_push("agent-1");
    EXPECT_EQ(working_.retrieve("agent-1", "task").value.as_string(), "mine");
    EXPECT_EQ(node_a_.pending_changes("agent-1"), 0);
}

TEST_F(SyncCoordinatorTest, ForcePullDiscardsLocalEdits) {
    longterm_.remember("agent-1", "fact", Json("v1"));
    node_b_.stage_change("agent-1", MemoryType::LONGTERM, "fact", Json("from b"));
    longterm_.update("agent-1", "fact", Json("elsewhere"), 1);
    node_b_.sync_agent("agent-1");
    node_b_.stage_change("agent-1", MemoryType::LONGTERM, "fact", Json("again"));

    int before = node_b_.status("agent-1").sync_version;
    SyncStatus status = node_b_.force_pull("agent-1");
    EXPECT_TRUE(status.conflicts.empty());
    EXPECT_EQ(status.status, SyncState::SYNCED);
    EXPECT_EQ(status.sync_version, before + 1);
    EXPECT_GT(status.metadata.get_int64("last_force_pull"), 0);
    EXPECT_EQ(node_b_.pending_changes("agent-1"), 0);

    EXPECT_EQ(longterm_.recall("agent-1", "fact").value.as_string(), "elsewhere");

    // After the pull this instance is based on the stored version
    node_b_.stage_change("agent-1", MemoryType::LONGTERM, "fact", Json("clean"));
    EXPECT_TRUE(node_b_.sync_agent("agent-1").success);
    EXPECT_EQ(longterm_.recall("agent-1", "fact").value.as_string(), "clean");
}

// ============================================================================
// Store failures
// ============================================================================

namespace {

// In-memory store that fails selected calls on demand
class FailingRepository : public InMemoryRepository {
public:
    FailingRepository() : update_failures_(0), list_longterm_fails_(false) {}

    void fail_next_updates(int n) { update_failures_.store(n); }
    void fail_longterm_listing(bool on) { list_longterm_fails_.store(on); }

    StoreStatus update_longterm(const LongtermMemory& memory, int expected_version) override {
        if (update_failures_.fetch_sub(1) > 0) return StoreStatus::FAILED;
        update_failures_.store(0);
        return InMemoryRepository::update_longterm(memory, expected_version);
    }

    StoreStatus list_longterm(const std::string& agent_id, const MemoryFilters& filters,
                              std::vector<LongtermMemory>& out) override {
        if (list_longterm_fails_.load()) return StoreStatus::FAILED;
        return InMemoryRepository::list_longterm(agent_id, filters, out);
    }

private:
    std::atomic<int> update_failures_;
    std::atomic<bool> list_longterm_fails_;
};

} // namespace

class SyncCoordinatorFailureTest : public ::testing::Test {
protected:
    SyncCoordinatorFailureTest()
        : repo_(new FailingRepository())
        , dispatcher_(1, "test")
        , longterm_(repo_, dispatcher_)
        , node_(repo_, "node-a")
    {}

    std::shared_ptr<FailingRepository> repo_;
    TaskDispatcher dispatcher_;
    LongtermMemoryManager longterm_;
    SyncCoordinator node_;
};

TEST_F(SyncCoordinatorFailureTest, FailedPushIsRestagedAndPassStillCounts) {
    longterm_.remember("agent-1", "fact", Json("v1"));
    node_.stage_change("agent-1", MemoryType::LONGTERM, "fact", Json("mine"));
    repo_->fail_next_updates(1);

    SyncResult result = node_.sync_agent("agent-1");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(node_.pending_changes("agent-1"), 1);

    SyncStatus status = node_.status("agent-1");
    EXPECT_EQ(status.status, SyncState::ERROR);
    EXPECT_EQ(status.sync_version, 1);
    EXPECT_EQ(status.pending_changes, 0);
    EXPECT_EQ(longterm_.recall("agent-1", "fact").value.as_string(), "v1");

    // The next pass delivers it
    EXPECT_TRUE(node_.sync_agent("agent-1").success);
    EXPECT_EQ(longterm_.recall("agent-1", "fact").value.as_string(), "mine");
    EXPECT_EQ(node_.status("agent-1").status, SyncState::SYNCED);
    EXPECT_EQ(node_.status("agent-1").sync_version, 2);
}

TEST_F(SyncCoordinatorFailureTest, FailedPullMarksErrorAndBumpsVersion) {
    repo_->fail_longterm_listing(true);
    SyncResult result = node_.sync_agent("agent-1");
    EXPECT_FALSE(result.success);

    SyncStatus status = node_.status("agent-1");
    EXPECT_EQ(status.status, SyncState::ERROR);
    EXPECT_EQ(status.sync_version, 1);
}

TEST_F(SyncCoordinatorFailureTest, PeriodicLoopKeepsTickingThroughFailures) {
    repo_->fail_longterm_listing(true);
    node_.start_periodic_sync("agent-1", 20);
    sleep_ms(200);

    SyncStatus failing = node_.status("agent-1");
    EXPECT_TRUE(node_.is_running());
    EXPECT_EQ(failing.status, SyncState::ERROR);
    EXPECT_GE(failing.sync_version, 2);

    repo_->fail_longterm_listing(false);
    sleep_ms(200);
    node_.stop_periodic_sync();

    SyncStatus recovered = node_.status("agent-1");
    EXPECT_EQ(recovered.status, SyncState::SYNCED);
    EXPECT_GT(recovered.sync_version, failing.sync_version);
}

TEST_F(SyncCoordinatorFailureTest, FailedForcePushKeepsStagedEdits) {
    longterm_.remember("agent-1", "fact", Json("v1"));
    node_.stage_change("agent-1", MemoryType::LONGTERM, "fact", Json("mine"));
    repo_->fail_next_updates(1);

    EXPECT_THROW(node_.force_push("agent-1"), RepositoryError);
    EXPECT_EQ(node_.pending_changes("agent-1"), 1);
    EXPECT_EQ(longterm_.recall("agent-1", "fact").value.as_string(), "v1");

    SyncStatus status = node_.force_push("agent-1");
    EXPECT_EQ(status.status, SyncState::SYNCED);
    EXPECT_EQ(node_.pending_changes("agent-1"), 0);
    EXPECT_EQ(longterm_.recall("agent-1", "fact").value.as_string(), "mine");
}
