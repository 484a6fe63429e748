#include <gtest/gtest.h>
#include "replication/checkpoint_manager.hpp"
#include "replication/orchestration_state.hpp"
#include "test_utils.hpp"
#include <fstream>

class CheckpointManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        manager_ = std::make_unique<CheckpointManager>(temp_.str());
    }

    Chunk makeChunk(int id, const std::string& path) {
        Chunk chunk;
        chunk.chunkId = id;
        chunk.sourcePath = path;
        chunk.destinationPath = "/dst" + path;
        return chunk;
    }

    void writeRaw(const std::string& content) {
        std::ofstream file(manager_->getCheckpointPath(), std::ios::binary | std::ios::trunc);
        file << content;
    }

    TempDirectory temp_;
    std::unique_ptr<CheckpointManager> manager_;
};

TEST_F(CheckpointManagerTest, PathIsInsideConfiguredDirectory) {
    EXPECT_EQ(manager_->getCheckpointPath(), (temp_.path() / "robocurse-checkpoint.json").string());
}

TEST_F(CheckpointManagerTest, SaveWithoutStateIsError) {
    OperationResult result = manager_->save(nullptr);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.kind, ErrorKind::CheckpointError);
    EXPECT_FALSE(std::filesystem::exists(manager_->getCheckpointPath()));
}

TEST_F(CheckpointManagerTest, MissingFileLoadsAsAbsent) {
    EXPECT_FALSE(manager_->load().has_value());
}

TEST_F(CheckpointManagerTest, RoundTripPreservesPaths) {
    OrchestrationState state;
    std::string longPath = "/data/" + std::string(300, 'd') + "/leaf";
    std::string unicodePath = "/data/\xc3\xa9t\xc3\xa9/\xe6\x97\xa5\xe6\x9c\xac";
    state.chunkCompleted(makeChunk(1, "/data/Projects"));
    state.chunkCompleted(makeChunk(2, longPath));
    state.chunkCompleted(makeChunk(3, unicodePath));

    ASSERT_TRUE(manager_->save(&state).success);
    auto checkpoint = manager_->load();
    ASSERT_TRUE(checkpoint.has_value());
    EXPECT_EQ(checkpoint->version, "1.0");
    EXPECT_EQ(checkpoint->sessionId, state.getSessionId());
    EXPECT_EQ(checkpoint->completedCount, 3u);
    EXPECT_FALSE(checkpoint->savedAt.empty());

    EXPECT_TRUE(CheckpointManager::isChunkCompleted(makeChunk(9, "/DATA/projects"), checkpoint));
    EXPECT_TRUE(CheckpointManager::isChunkCompleted(makeChunk(9, longPath), checkpoint));
    EXPECT_TRUE(CheckpointManager::isChunkCompleted(makeChunk(9, unicodePath), checkpoint));
    EXPECT_FALSE(CheckpointManager::isChunkCompleted(makeChunk(9, "/data/Projects2"), checkpoint));
    EXPECT_FALSE(CheckpointManager::isChunkCompleted(makeChunk(9, "/data/Project"), checkpoint));
}

TEST_F(CheckpointManagerTest, NonUtf8PathStillMatchesOnResume) {
    OrchestrationState state;
    std::string latin1Path = "/data/caf\xe9/menu";
    state.chunkCompleted(makeChunk(1, latin1Path));

    ASSERT_TRUE(manager_->save(&state).success);
    auto checkpoint = manager_->load();
    ASSERT_TRUE(checkpoint.has_value());
    ASSERT_EQ(checkpoint->completedChunkPaths.size(), 1u);

    EXPECT_TRUE(CheckpointManager::isChunkCompleted(makeChunk(2, latin1Path), checkpoint));
    EXPECT_TRUE(CheckpointManager::isChunkCompleted(makeChunk(2, "/DATA/CAF\xe9/Menu"), checkpoint));
    EXPECT_FALSE(CheckpointManager::isChunkCompleted(makeChunk(2, "/data/cafe/menu"), checkpoint));
}

TEST_F(CheckpointManagerTest, CarriedOverPathsSurviveAnotherSave) {
    OrchestrationState state;
    state.setCarriedOverPaths({"/data/a", "/data/B"});
    state.chunkCompleted(makeChunk(3, "/data/b"));
    state.chunkCompleted(makeChunk(4, "/data/c"));

    ASSERT_TRUE(manager_->save(&state).success);
    auto checkpoint = manager_->load();
    ASSERT_TRUE(checkpoint.has_value());
    EXPECT_EQ(checkpoint->completedChunkPaths.size(), 3u);
    EXPECT_TRUE(CheckpointManager::isChunkCompleted(makeChunk(1, "/data/a"), checkpoint));
    EXPECT_TRUE(CheckpointManager::isChunkCompleted(makeChunk(2, "/data/b"), checkpoint));
}

TEST_F(CheckpointManagerTest, VersionMismatchLoadsAsAbsent) {
    writeRaw(R"({"Version":"2.0","SessionId":"x","CompletedChunkPaths":["/a"],"CompletedCount":1})");
    EXPECT_FALSE(manager_->load().has_value());
}

TEST_F(CheckpointManagerTest, InvalidContentLoadsAsAbsent) {
    writeRaw("{ this is not json");
    EXPECT_FALSE(manager_->load().has_value());

    writeRaw("[1, 2, 3]");
    EXPECT_FALSE(manager_->load().has_value());

    writeRaw(R"({"Version":"1.0","CompletedChunkPaths":"/a"})");
    EXPECT_FALSE(manager_->load().has_value());

    writeRaw("");
    EXPECT_FALSE(manager_->load().has_value());
}

TEST_F(CheckpointManagerTest, NonStringEntriesAreIgnored) {
    writeRaw(R"({"Version":"1.0","SessionId":"s","CompletedChunkPaths":["/a",null,7,""],"CompletedCount":4})");
    auto checkpoint = manager_->load();
    ASSERT_TRUE(checkpoint.has_value());
    EXPECT_EQ(checkpoint->completedChunkPaths.size(), 2u);
    EXPECT_TRUE(CheckpointManager::isChunkCompleted(makeChunk(1, "/a"), checkpoint));
    EXPECT_FALSE(CheckpointManager::isChunkCompleted(makeChunk(2, ""), checkpoint));
}

TEST_F(CheckpointManagerTest, SequentialSavesKeepLatestCount) {
    OrchestrationState state;
    for (int i = 1; i <= 10; ++i) {
        state.chunkCompleted(makeChunk(i, "/data/chunk" + std::to_string(i)));
        ASSERT_TRUE(manager_->save(&state).success);
    }

    auto checkpoint = manager_->load();
    ASSERT_TRUE(checkpoint.has_value());
    EXPECT_EQ(checkpoint->completedCount, 10u);
    EXPECT_EQ(checkpoint->completedChunkPaths.size(), 10u);

    // No temporary files left behind
    size_t files = 0;
    for (const auto& entry : std::filesystem::directory_iterator(temp_.path())) {
        (void)entry;
        files++;
    }
    EXPECT_EQ(files, 1u);
}

TEST_F(CheckpointManagerTest, RemoveReportsPresence) {
    EXPECT_FALSE(manager_->remove());

    OrchestrationState state;
    state.chunkCompleted(makeChunk(1, "/data/a"));
    ASSERT_TRUE(manager_->save(&state).success);

    EXPECT_TRUE(manager_->remove(true));
    EXPECT_TRUE(std::filesystem::exists(manager_->getCheckpointPath()));

    EXPECT_TRUE(manager_->remove());
    EXPECT_FALSE(std::filesystem::exists(manager_->getCheckpointPath()));
    EXPECT_FALSE(manager_->load().has_value());
}

TEST(IsChunkCompletedTest, TruthTable) {
    Chunk chunk;
    chunk.sourcePath = "/data/Reports";

    EXPECT_FALSE(CheckpointManager::isChunkCompleted(chunk, std::nullopt));

    Checkpoint empty;
    EXPECT_FALSE(CheckpointManager::isChunkCompleted(chunk, empty));

    Checkpoint checkpoint;
    checkpoint.completedChunkPaths = {"", "/data/other", "/DATA/reports"};
    EXPECT_TRUE(CheckpointManager::isChunkCompleted(chunk, checkpoint));

    Chunk unnamed;
    EXPECT_FALSE(CheckpointManager::isChunkCompleted(unnamed, checkpoint));

    checkpoint.completedChunkPaths = {"/data/Reports/2024"};
    EXPECT_FALSE(CheckpointManager::isChunkCompleted(chunk, checkpoint));
}
