#include <gtest/gtest.h>
#include "snapshot/snapshot_registry.hpp"
#include "snapshot/snapshot_tracker.hpp"
#include "snapshot/lvm_snapshot_provider.hpp"
#include "snapshot/snapshot_provider_factory.hpp"
#include "test_utils.hpp"
#include <fstream>
#include <iterator>

using namespace std::chrono;

TEST(SnapshotRegistryTest, MissingFileIsEmpty) {
    TempDirectory temp;
    SnapshotRegistry registry((temp.path() / "none.snapshots.json").string());
    EXPECT_TRUE(registry.load().success);
    EXPECT_TRUE(registry.getEntries().empty());
}

TEST(SnapshotRegistryTest, PersistsEntriesCaseInsensitively) {
    TempDirectory temp;
    std::string path = (temp.path() / "cfg.snapshots.json").string();

    Snapshot snapshot;
    snapshot.shadowId = "vg0/data_robocurse_20240101";
    snapshot.sourceVolume = "/dev/vg0/data";
    snapshot.serverName = "Local";
    snapshot.createdAt = system_clock::now();

    SnapshotRegistry registry(path);
    registry.add(snapshot);
    registry.add(snapshot);
    ASSERT_TRUE(registry.save().success);

    SnapshotRegistry reloaded(path);
    ASSERT_TRUE(reloaded.load().success);
    ASSERT_EQ(reloaded.getEntries().size(), 1u);
    EXPECT_TRUE(reloaded.contains("VG0/DATA_robocurse_20240101", "local"));
    EXPECT_FALSE(reloaded.contains(snapshot.shadowId, "otherhost"));
    EXPECT_EQ(reloaded.entriesForVolume("/dev/vg0/data", "Local").size(), 1u);

    auto stored = duration_cast<milliseconds>(reloaded.getEntries()[0].createdAt.time_since_epoch());
    auto original = duration_cast<milliseconds>(snapshot.createdAt.time_since_epoch());
    EXPECT_EQ(stored.count(), original.count());

    EXPECT_TRUE(reloaded.remove(snapshot.shadowId, "LOCAL"));
    EXPECT_FALSE(reloaded.remove(snapshot.shadowId, "Local"));
}

TEST(SnapshotRegistryTest, WrongVersionIsError) {
    TempDirectory temp;
    std::string path = (temp.path() / "cfg.snapshots.json").string();
    {
        std::ofstream file(path);
        file << R"({"Version":"9.9","Snapshots":[]})";
    }
    SnapshotRegistry registry(path);
    OperationResult result = registry.load();
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.kind, ErrorKind::SnapshotError);
}

TEST(SnapshotRegistryTest, FailedLoadBlocksSave) {
    TempDirectory temp;
    std::string path = (temp.path() / "cfg.snapshots.json").string();
    const std::string original = R"({"Version":"1.1","Snapshots":[{"ShadowId":"vg0/old"}]})";
    {
        std::ofstream file(path);
        file << original;
    }

    SnapshotRegistry registry(path);
    EXPECT_FALSE(registry.load().success);
    EXPECT_TRUE(registry.isLoadFailed());

    Snapshot snapshot;
    snapshot.shadowId = "vg0/new";
    snapshot.sourceVolume = "/dev/vg0/data";
    snapshot.serverName = "Local";
    snapshot.createdAt = system_clock::now();
    registry.add(snapshot);

    OperationResult saved = registry.save();
    EXPECT_FALSE(saved.success);
    EXPECT_EQ(saved.kind, ErrorKind::SnapshotError);

    std::ifstream file(path);
    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    EXPECT_EQ(content, original);

    // A later good load clears the block
    {
        std::ofstream rewrite(path, std::ios::trunc);
        rewrite << R"({"Version":"1.0","Snapshots":[]})";
    }
    ASSERT_TRUE(registry.load().success);
    EXPECT_FALSE(registry.isLoadFailed());
    registry.add(snapshot);
    EXPECT_TRUE(registry.save().success);
}

TEST(SnapshotTrackerTest, TrackAndUntrack) {
    TempDirectory temp;
    SnapshotTracker tracker((temp.path() / "cfg.tracking.json").string());

    Snapshot snapshot;
    snapshot.shadowId = "vg0/tmp_robocurse_1";
    snapshot.sourceVolume = "/dev/vg0/tmp";
    ASSERT_TRUE(tracker.track(snapshot).success);

    snapshot.exposedPath = "/mnt/snap";
    ASSERT_TRUE(tracker.track(snapshot).success);

    auto tracked = tracker.getTracked();
    ASSERT_EQ(tracked.size(), 1u);
    EXPECT_EQ(tracked[0].exposedPath, "/mnt/snap");
    EXPECT_EQ(tracked[0].ownerPid, ::getpid());

    ASSERT_TRUE(tracker.untrack(snapshot.shadowId, snapshot.serverName).success);
    EXPECT_TRUE(tracker.getTracked().empty());
}

TEST(SnapshotTrackerTest, CleanupRemovesOnlyOrphans) {
    TempDirectory temp;
    std::string path = (temp.path() / "cfg.tracking.json").string();

    FakeSnapshotProvider provider;
    Snapshot orphan = provider.addExisting("/dev/vg0/a", system_clock::now());
    Snapshot live = provider.addExisting("/dev/vg0/a", system_clock::now());
    {
        std::ofstream file(path);
        file << R"({"Snapshots":[)"
             << R"({"ShadowId":")" << orphan.shadowId << R"(","Volume":"/dev/vg0/a","ServerName":"Local","ExposedPath":"","OwnerPid":0},)"
             << R"({"ShadowId":")" << live.shadowId << R"(","Volume":"/dev/vg0/a","ServerName":"Local","ExposedPath":"","OwnerPid":)"
             << ::getpid() << "}]}";
    }

    SnapshotTracker tracker(path);
    OrphanCleanupResult result = tracker.cleanupOrphans(
        [&provider](const std::string&) -> SnapshotProvider* { return &provider; });

    EXPECT_EQ(result.deletedCount, 1);
    EXPECT_EQ(result.skippedCount, 1);
    EXPECT_TRUE(result.errors.empty());
    EXPECT_FALSE(provider.exists(orphan.shadowId));
    EXPECT_TRUE(provider.exists(live.shadowId));

    auto remaining = tracker.getTracked();
    ASSERT_EQ(remaining.size(), 1u);
    EXPECT_EQ(remaining[0].shadowId, live.shadowId);
}

TEST(SnapshotTrackerTest, CleanupWithoutProviderKeepsEntry) {
    TempDirectory temp;
    std::string path = (temp.path() / "cfg.tracking.json").string();
    {
        std::ofstream file(path);
        file << R"({"Snapshots":[{"ShadowId":"vg/x","Volume":"v","ServerName":"gone","OwnerPid":0}]})";
    }

    SnapshotTracker tracker(path);
    OrphanCleanupResult result = tracker.cleanupOrphans(
        [](const std::string&) -> SnapshotProvider* { return nullptr; });
    EXPECT_EQ(result.deletedCount, 0);
    EXPECT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(tracker.getTracked().size(), 1u);
}

TEST(LvmSnapshotProviderTest, ParsesLvTime) {
    system_clock::time_point utc;
    ASSERT_TRUE(LvmSnapshotProvider::parseLvTime("2024-01-31 18:02:11 +0000", utc));
    EXPECT_EQ(system_clock::to_time_t(utc), 1706724131);

    system_clock::time_point offset;
    ASSERT_TRUE(LvmSnapshotProvider::parseLvTime("  2024-01-31 19:02:11 +0100", offset));
    EXPECT_EQ(offset, utc);

    system_clock::time_point ignored;
    EXPECT_FALSE(LvmSnapshotProvider::parseLvTime("yesterday", ignored));
}

TEST(SnapshotProviderFactoryTest, SelectsProviderByPath) {
    EXPECT_EQ(createSnapshotProvider("/srv/data")->getServerName(), "Local");
    EXPECT_EQ(createSnapshotProvider("backup01:/srv/data")->getServerName(), "backup01");
    EXPECT_EQ(createSnapshotProvider("//nas02/share/data")->getServerName(), "nas02");
    EXPECT_EQ(createSnapshotProvider("D:/data")->getServerName(), "Local");
}
