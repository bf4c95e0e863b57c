/**
 * @file memory_service_tests.cpp
 * @brief Integration tests for the memory service facade
 */

#include <gtest/gtest.h>
#include <agentmem/service/memory_service.hpp>
#include <agentmem/memory/in_memory_repository.hpp>
#include <agentmem/memory/errors.hpp>
#include <agentmem/core/config.hpp>
#include <agentmem/core/utils.hpp>
#include <cstdio>
#include <memory>
#include <string>

using namespace agentmem;

namespace {

MemorySettings memory_settings() {
    MemorySettings s;
    s.backend = "memory";
    s.instance_id = "node-test";
    s.log_level = LogLevel::WARN;
    return s;
}

} // namespace

// ============================================================================
// End-to-end
// ============================================================================

TEST(MemoryServiceTest, WorkingMemoryScenario) {
    MemoryService service(memory_settings());

    WorkingMemory created = service.working().store("agent-1", "task", Json("pending"), MS_PER_HOUR);
    EXPECT_EQ(created.version, 1);

    WorkingMemory updated = service.working().update("agent-1", "task", Json("in_progress"), 1);
    EXPECT_EQ(updated.version, 2);

    EXPECT_THROW(service.working().update("agent-1", "task", Json("stale"), 1), VersionConflictError);
    EXPECT_EQ(service.working().retrieve("agent-1", "task").value.as_string(), "in_progress");
}

TEST(MemoryServiceTest, SnapshotRestoreAcrossManagers) {
    MemoryService service(memory_settings());
    service.working().store("agent-1", "task", Json("pending"), 0);
    service.longterm().remember("agent-1", "fact", Json("keep"), "facts");

    StateSnapshot s = service.snapshots().create("agent-1", "pre-update", "upgrade");
    service.working().clear("agent-1");

    RestoreReport report = service.snapshots().restore("agent-1", s.id);
    EXPECT_EQ(report.restored, 1);
    EXPECT_EQ(service.working().retrieve("agent-1", "task").value.as_string(), "pending");
}

TEST(MemoryServiceTest, SyncUsesConfiguredInstanceAndStrategy) {
    MemorySettings settings = memory_settings();
    settings.sync_strategy = ConflictStrategy::REMOTE_WINS;
    MemoryService service(settings);

    EXPECT_EQ(service.sync().instance_id(), "node-test");
    EXPECT_EQ(service.sync().strategy(), ConflictStrategy::REMOTE_WINS);

    SyncResult result = service.sync().sync_agent("agent-1");
    EXPECT_TRUE(result.success);
}

TEST(MemoryServiceTest, ResolvedConflictBecomesTheInstanceBase) {
    MemoryService service(memory_settings());
    service.longterm().remember("agent-1", "fact", Json("v1"));
    service.sync().stage_change("agent-1", MemoryType::LONGTERM, "fact", Json("local"));
    service.longterm().update("agent-1", "fact", Json("remote"), 1);
    ASSERT_EQ(service.sync().sync_agent("agent-1").conflicts.size(), 1u);

    service.sync().set_strategy(ConflictStrategy::LOCAL_WINS);
    EXPECT_EQ(service.sync().resolve_conflicts("agent-1"), 1);
    EXPECT_EQ(service.longterm().recall("agent-1", "fact").value.as_string(), "local");

    // A follow-up edit pushes cleanly instead of conflicting again
    service.sync().stage_change("agent-1", MemoryType::LONGTERM, "fact", Json("next"));
    SyncResult result = service.sync().sync_agent("agent-1");
    EXPECT_TRUE(result.success);
    EXPECT_TRUE(result.conflicts.empty());
    EXPECT_EQ(service.longterm().recall("agent-1", "fact").value.as_string(), "next");
    EXPECT_EQ(service.sync().status("agent-1").status, SyncState::SYNCED);
}

// ============================================================================
// Maintenance
// ============================================================================

TEST(MemoryServiceTest, StatsCountsEverything) {
    MemoryService service(memory_settings());
    service.working().store("agent-1", "a", Json("x"), 0);
    service.working().store("agent-1", "b", Json("y"), 0);
    service.longterm().remember("agent-1", "fact", Json("z"));
    StateSnapshot s = service.snapshots().create("agent-1");
    service.sync().sync_agent("agent-1");
    service.working().store("agent-2", "other", Json(1), 0);

    MemoryStats stats = service.stats("agent-1");
    EXPECT_EQ(stats.agent_id, "agent-1");
    EXPECT_EQ(stats.working_memory_count, 2);
    EXPECT_EQ(stats.longterm_memory_count, 1);
    EXPECT_EQ(stats.snapshot_count, 1);
    EXPECT_GT(stats.working_memory_size_bytes, 0);
    EXPECT_GT(stats.longterm_memory_size_bytes, 0);
    EXPECT_EQ(stats.total_size_bytes,
              stats.working_memory_size_bytes + stats.longterm_memory_size_bytes + s.metadata.size_bytes);
    EXPECT_EQ(stats.last_snapshot_at, s.created_at);
    EXPECT_GT(stats.last_sync_at, 0);

    EXPECT_THROW(service.stats(""), ValidationError);
}

TEST(MemoryServiceTest, CleanupRemovesExpiredEntries) {
    MemoryService service(memory_settings());
    service.working().store("agent-1", "flash", Json(1), 1);
    service.working().store("agent-1", "durable", Json(2), 0);
    sleep_ms(10);

    EXPECT_EQ(service.cleanup_expired(), 1);
    EXPECT_EQ(service.cleanup_expired(), 0);
    EXPECT_EQ(service.stats("agent-1").working_memory_count, 1);
}

TEST(MemoryServiceTest, ShutdownStopsLoopAndIsIdempotent) {
    MemoryService service(memory_settings());
    service.sync().start_periodic_sync("agent-1", 20);
    service.shutdown();
    EXPECT_FALSE(service.sync().is_running());
    service.shutdown();
}

TEST(MemoryServiceTest, InjectedRepository) {
    std::shared_ptr<MemoryRepository> repo(new InMemoryRepository());
    MemoryService service(repo, memory_settings());
    service.longterm().remember("agent-1", "fact", Json(1));

    LongtermMemory stored;
    EXPECT_EQ(repo->get_longterm("agent-1", "fact", stored), StoreStatus::OK);
    EXPECT_EQ(&service.repository(), repo.get());
}

TEST(MemoryServiceTest, NullRepositoryIsRejected) {
    EXPECT_THROW(MemoryService(std::shared_ptr<MemoryRepository>(), memory_settings()),
                 ValidationError);
}

// ============================================================================
// Configuration-driven SQLite service
// ============================================================================

TEST(MemoryServiceTest, SqliteBackendFromConfig) {
    std::string path = testing::TempDir() + "agentmem_service_" + generate_uuid() + ".db";
    Config cfg;
    ASSERT_TRUE(cfg.load_string("{\"backend\":\"sqlite\",\"db_path\":\"" + path + "\","
                                "\"log_level\":\"warn\",\"sync\":{\"instance_id\":\"node-sql\"}}"));
    MemorySettings settings = MemorySettings::from_config(cfg);
    {
        MemoryService service(settings);
        EXPECT_EQ(service.repository().backend(), "sqlite");
        service.longterm().remember("agent-1", "fact", Json("durable"), "facts");
        service.sync().sync_agent("agent-1");
    }
    {
        MemoryService reopened(settings);
        EXPECT_EQ(reopened.longterm().recall("agent-1", "fact").value.as_string(), "durable");
        EXPECT_EQ(reopened.sync().status("agent-1").sync_version, 1);
    }
    std::remove(path.c_str());
    std::remove((path + "-wal").c_str());
    std::remove((path + "-shm").c_str());
}

TEST(MemoryServiceTest, UnopenableDatabaseFails) {
    MemorySettings settings;
    settings.backend = "sqlite";
    settings.db_path = "/nonexistent-dir/agentmem.db";
    EXPECT_THROW(MemoryService service(settings), RepositoryError);
}
