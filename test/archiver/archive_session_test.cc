#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <vector>

#include "archiver/archive_session.h"
#include "common/errors.h"
#include "common/interrupt.h"
#include "lineage/naming.h"
#include "remote/local_directory_store.h"
#include "transfer/test_tools.h"

using namespace Skyvault;
using namespace Skyvault::testing_tools;
using ::testing::_;
using ::testing::ByMove;
using ::testing::Return;

namespace {

class MockRemoteStore : public RemoteStore {
public:
    MOCK_METHOD((absl::flat_hash_set<std::string>), List, (const std::string& container, const std::string& prefix), (override));
    MOCK_METHOD(bool, ContainerExists, (const std::string& container), (override));
    MOCK_METHOD(std::unique_ptr<UploadProgress>, Upload, (const fs::path& file, const std::string& container), (override));
};

// Reports one segment and never acknowledges the object.
class UnacknowledgedSession : public UploadSession {
public:
    std::optional<UploadEvent> NextEvent() override {
        if (sent_) {
            return std::nullopt;
        }
        sent_ = true;
        return UploadEvent{UploadEvent::Kind::SEGMENT_DONE, 1};
    }

private:
    bool sent_ = false;
};

// Raises the interrupt flag the first time a message contains trigger.
class InterruptingEventSink : public RecordingEventSink {
public:
    explicit InterruptingEventSink(std::string trigger) : trigger_(std::move(trigger)) {}

    void Emit(EventLevel level, const std::string& message) override {
        RecordingEventSink::Emit(level, message);
        if (message.find(trigger_) != std::string::npos) {
            RequestInterrupt();
        }
    }

private:
    std::string trigger_;
};

} // namespace

class ArchiveSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        ClearInterrupt();
        tools_dir_ = tmp_.path() / "tools";
        dest_dir_ = tmp_.path() / "dest";
        store_root_ = tmp_.path() / "store";
        fs::create_directories(tools_dir_);
        fs::create_directories(dest_dir_);
        fs::create_directories(tmp_.path() / "snapshots");
        fs::create_directories(store_root_ / "backups");

        transfer_options_.tools.serializer = WriteFakeSerializer(tools_dir_).string();
        transfer_options_.tools.encryptor = WriteFakeEncryptor(tools_dir_).string();
        transfer_options_.tools.meter = WriteFakeMeter(tools_dir_).string();
        transfer_options_.metering = true;

        for (int i = 0; i < 3; ++i) {
            Snapshot s;
            s.lineage_id = "uuid";
            s.relative_path = "snapshots/" + std::to_string(i);
            s.absolute_path = (tmp_.path() / "snapshots" / std::to_string(i)).string();
            s.creation_time = i;
            WriteFile(s.absolute_path, "s" + std::to_string(i));
            lineage_.push_back(s);
        }

        session_options_.container = "backups";
        session_options_.destination_dir = dest_dir_;
    }

    void TearDown() override {
        ClearInterrupt();
    }

    SessionReport RunWith(RemoteStore& store) {
        TransferPipeline pipeline(transfer_options_, sink_);
        ArchiveSession session(session_options_, pipeline, store, sink_);
        return session.Run(lineage_);
    }

    SessionReport RunLocal() {
        LocalDirectoryStore store(store_root_, 4);
        return RunWith(store);
    }

    fs::path ObjectPath(const Snapshot& snapshot) const {
        return store_root_ / "backups" / StorageName(snapshot);
    }

    TempDir tmp_;
    fs::path tools_dir_;
    fs::path dest_dir_;
    fs::path store_root_;
    TransferOptions transfer_options_;
    SessionOptions session_options_;
    RecordingEventSink sink_;
    std::vector<Snapshot> lineage_;
};

TEST_F(ArchiveSessionTest, EmptyArchiveUploadsFullThenIncrementals) {
    SessionReport report = RunLocal();

    EXPECT_EQ(report.snapshots, 3u);
    EXPECT_EQ(report.already_archived, 0u);
    EXPECT_EQ(report.units_archived, 3u);
    ASSERT_EQ(report.uploaded_objects.size(), 3u);
    EXPECT_EQ(report.uploaded_objects[0], StorageName(lineage_[0]));

    EXPECT_EQ(ReadFile(ObjectPath(lineage_[0])), "s0");
    EXPECT_EQ(ReadFile(ObjectPath(lineage_[1])), "delta:s0:s1");
    EXPECT_EQ(ReadFile(ObjectPath(lineage_[2])), "delta:s1:s2");

    // Artifacts are removed once uploaded.
    EXPECT_TRUE(fs::is_empty(dest_dir_));
    EXPECT_TRUE(sink_.Contains(EventLevel::INFO, "snapshots/0... not in cloud"));
    EXPECT_TRUE(sink_.Contains(EventLevel::INFO, "42 B 0:00:01"));
}

TEST_F(ArchiveSessionTest, PartialArchiveUploadsOnlyTheMissingSuffix) {
    WriteFile(ObjectPath(lineage_[0]), "s0");

    SessionReport report = RunLocal();
    EXPECT_EQ(report.already_archived, 1u);
    EXPECT_EQ(report.units_archived, 2u);
    EXPECT_EQ(ReadFile(ObjectPath(lineage_[1])), "delta:s0:s1");
    EXPECT_TRUE(sink_.Contains(EventLevel::INFO, "snapshots/0... in cloud"));
    EXPECT_TRUE(sink_.Contains(EventLevel::INFO, "snapshots/1... not in cloud"));
}

TEST_F(ArchiveSessionTest, FullyArchivedLineageDoesNothing) {
    for (const auto& s : lineage_) {
        WriteFile(ObjectPath(s), "stored");
    }
    SessionReport report = RunLocal();
    EXPECT_EQ(report.units_archived, 0u);
    EXPECT_TRUE(sink_.Contains(EventLevel::INFO, "Everything is already archived"));
    EXPECT_EQ(ReadFile(ObjectPath(lineage_[2])), "stored");
}

TEST_F(ArchiveSessionTest, DryRunOnlyPlans) {
    session_options_.dry_run = true;
    WriteFile(ObjectPath(lineage_[0]), "s0");

    SessionReport report = RunLocal();
    EXPECT_EQ(report.units_archived, 0u);
    ASSERT_EQ(report.planned.size(), 2u);
    EXPECT_EQ(report.planned[0], ArchivalUnit(IncrementalUnit{lineage_[0], lineage_[1]}));
    EXPECT_EQ(report.planned[1], ArchivalUnit(IncrementalUnit{lineage_[1], lineage_[2]}));
    EXPECT_FALSE(fs::exists(ObjectPath(lineage_[1])));
    EXPECT_TRUE(fs::is_empty(dest_dir_));
    EXPECT_TRUE(sink_.Contains(EventLevel::INFO, "Would archive changes between"));
}

TEST_F(ArchiveSessionTest, KeptArtifactsStayInDestination) {
    session_options_.keep_artifacts = true;
    RunLocal();
    for (const auto& s : lineage_) {
        EXPECT_TRUE(fs::exists(dest_dir_ / StorageName(s)));
    }
}

TEST_F(ArchiveSessionTest, EncryptedArtifactsAreUploaded) {
    session_options_.crypto_recipient = "age1recipient";
    RunLocal();
    EXPECT_EQ(ReadFile(ObjectPath(lineage_[0])), "enc(age1recipient):s0");
}

TEST_F(ArchiveSessionTest, FailureStopsLaterUnits) {
    // Full sends work, incremental sends fail.
    transfer_options_.tools.serializer = WriteScript(tools_dir_ / "no-delta-send",
        "[ \"$2\" = -p ] && exit 1\ncat \"$2\"\n").string();

    EXPECT_THROW(RunLocal(), PipelineFailure);
    EXPECT_TRUE(fs::exists(ObjectPath(lineage_[0])));
    EXPECT_FALSE(fs::exists(ObjectPath(lineage_[1])));
    EXPECT_FALSE(fs::exists(ObjectPath(lineage_[2])));
    // The failed artifact is left for inspection, the next one never started.
    EXPECT_TRUE(fs::exists(dest_dir_ / StorageName(lineage_[1])));
    EXPECT_FALSE(fs::exists(dest_dir_ / StorageName(lineage_[2])));
}

TEST_F(ArchiveSessionTest, DivergedArchiveIsReportedNotRepaired) {
    WriteFile(ObjectPath(lineage_[1]), "orphan");
    EXPECT_THROW(RunLocal(), InconsistentLayout);
    EXPECT_FALSE(fs::exists(ObjectPath(lineage_[0])));
    EXPECT_TRUE(fs::is_empty(dest_dir_));
}

TEST_F(ArchiveSessionTest, MissingContainerFailsBeforePreparing) {
    session_options_.container = "absent";
    EXPECT_THROW(RunLocal(), UploadFailure);
    EXPECT_TRUE(fs::is_empty(dest_dir_));
}

TEST_F(ArchiveSessionTest, EmptyLineageIsReported) {
    lineage_.clear();
    SessionReport report = RunLocal();
    EXPECT_EQ(report.snapshots, 0u);
    EXPECT_TRUE(sink_.Contains(EventLevel::INFO, "No read-only snapshots to archive"));
}

TEST_F(ArchiveSessionTest, InterruptStopsBeforeNextUnit) {
    RequestInterrupt();
    EXPECT_THROW(RunLocal(), OperationCancelled);
    EXPECT_TRUE(fs::is_empty(dest_dir_));
}

TEST_F(ArchiveSessionTest, InterruptDuringPreparationCancelsPromptly) {
    transfer_options_.tools.serializer = WriteScript(tools_dir_ / "slow-send", "exec sleep 30\n").string();
    InterruptingEventSink sink("args:");
    LocalDirectoryStore store(store_root_, 4);
    TransferPipeline pipeline(transfer_options_, sink);
    ArchiveSession session(session_options_, pipeline, store, sink);

    const auto start = std::chrono::steady_clock::now();
    EXPECT_THROW(session.Run(lineage_), OperationCancelled);
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(10));
    EXPECT_TRUE(fs::is_empty(store_root_ / "backups"));
    EXPECT_FALSE(sink.Contains(EventLevel::INFO, "Uploading"));
}

TEST_F(ArchiveSessionTest, ListUsesCommonPrefixOfStorageNames) {
    MockRemoteStore store;
    EXPECT_CALL(store, ContainerExists("backups")).WillOnce(Return(true));
    absl::flat_hash_set<std::string> everything;
    for (const auto& s : lineage_) {
        everything.insert(StorageName(s));
    }
    EXPECT_CALL(store, List("backups", "uuid\\x2fsnapshots\\x2f")).WillOnce(Return(everything));
    EXPECT_CALL(store, Upload(_, _)).Times(0);

    SessionReport report = RunWith(store);
    EXPECT_EQ(report.already_archived, 3u);
}

TEST_F(ArchiveSessionTest, UnacknowledgedUploadFailsAndKeepsArtifact) {
    MockRemoteStore store;
    EXPECT_CALL(store, ContainerExists("backups")).WillOnce(Return(true));
    EXPECT_CALL(store, List("backups", _)).WillOnce(Return(absl::flat_hash_set<std::string>{}));
    auto progress = std::make_unique<UploadProgress>(std::make_unique<UnacknowledgedSession>(),
                                                     StorageName(lineage_[0]));
    EXPECT_CALL(store, Upload(dest_dir_ / StorageName(lineage_[0]), "backups"))
        .WillOnce(Return(ByMove(std::move(progress))));

    EXPECT_THROW(RunWith(store), UploadFailure);
    EXPECT_TRUE(fs::exists(dest_dir_ / StorageName(lineage_[0])));
    EXPECT_FALSE(fs::exists(dest_dir_ / StorageName(lineage_[1])));
}
