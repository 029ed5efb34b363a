#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <fstream>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <utility>

#include "archive_index.hpp"
#include "test_support.hpp"
#include "tree_hasher.hpp"
#include "upload_coordinator.hpp"
#include "upload_errors.hpp"
#include "upload_journal.hpp"

using namespace GlacierUpload;
using Hashing::TreeHasher;

class UploadCoordinatorTest : public TempDirTest {
   protected:
    void SetUp() override {
        TempDirTest::SetUp();
        config = testConfig();
        openJournal();
    }

    void TearDown() override {
        coordinator.reset();
        index.reset();
        journal.reset();
        TempDirTest::TearDown();
    }

    // (Re)open the journal and index as a restarted process would.
    void openJournal() {
        coordinator.reset();
        journal = std::make_unique<Journal::UploadJournal>(config.journalPath());
        index = std::make_unique<Index::TsvArchiveIndex>(config.archiveIndexPath());
    }

    UploadCoordinator& makeCoordinator() {
        coordinator = std::make_unique<UploadCoordinator>(config, store, *journal, *index);
        return *coordinator;
    }

    std::vector<std::string> chunkStatuses(const std::string& job_id, size_t chunk_index) const {
        std::vector<std::string> statuses;
        for (const auto& entry : journal->entries(job_id)) {
            if (entry.entity == Journal::Entity::Chunk && entry.chunk_index == chunk_index) {
                statuses.push_back(entry.status);
            }
        }
        return statuses;
    }

    std::vector<std::string> jobStatuses(const std::string& job_id) const {
        std::vector<std::string> statuses;
        for (const auto& entry : journal->entries(job_id)) {
            if (entry.entity == Journal::Entity::Job) {
                statuses.push_back(entry.status);
            }
        }
        return statuses;
    }

    static std::string sourceHash(const fs::path& file) {
        return TreeHasher::toHex(TreeHasher::fileTreeHash(file));
    }

    Config::UploadConfig config;
    FaultyRemoteStore store;
    std::unique_ptr<Journal::UploadJournal> journal;
    std::unique_ptr<Index::TsvArchiveIndex> index;
    std::unique_ptr<UploadCoordinator> coordinator;
};

TEST_F(UploadCoordinatorTest, UploadsTenMegabytesInFourMebibyteParts) {
    config.chunk_size = 4 * Config::MIB;
    std::vector<char> content = makeContent(10000000);
    fs::path file = createFile("source.bin", content);
    UploadCoordinator& uc = makeCoordinator();

    Job started = uc.start(file, config.chunk_size, "backups", "ten megabytes");
    std::vector<Chunks::ChunkRecord> chunks = uc.chunks(started.job_id);
    ASSERT_EQ(chunks.size(), 3u);
    EXPECT_EQ(chunks[0].range.size(), 4194304u);
    EXPECT_EQ(chunks[1].range.size(), 4194304u);
    EXPECT_EQ(chunks[2].range.size(), 1611392u);

    uc.uploadAll(started.job_id);
    Job done = uc.finalize(started.job_id);

    EXPECT_EQ(done.status, JobStatus::Completed);
    EXPECT_EQ(done.tree_hash, sourceHash(file));
    EXPECT_EQ(store.archive(done.archive_id), content);
    EXPECT_EQ(store.uploadPartCalls(), 3u);
    EXPECT_EQ(store.completeCalls(), 1u);

    EXPECT_EQ(jobStatuses(done.job_id), (std::vector<std::string>{"initiated", "in_progress", "completed"}));
    auto rows = index->lookup(fs::absolute(file).string());
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0].archive_id, done.archive_id);
    EXPECT_EQ(rows[0].description, "ten megabytes");
    EXPECT_EQ(rows[0].job_id, done.job_id);
    EXPECT_TRUE(journal->findResumable().empty());
}

TEST_F(UploadCoordinatorTest, RejectsEmptyFileBeforeContactingVault) {
    fs::path file = createFile("empty.bin", std::vector<char>());
    UploadCoordinator& uc = makeCoordinator();

    EXPECT_THROW(uc.start(file, Config::MIB, "backups", ""), Errors::EmptyInput);
    EXPECT_EQ(store.initiateCalls(), 0u);
    EXPECT_TRUE(journal->jobIds().empty());
}

TEST_F(UploadCoordinatorTest, ValidatesChunkSize) {
    fs::path file = createFile("source.bin", 3 * Config::MIB);
    fs::path tiny = createFile("tiny.bin", 1000);
    UploadCoordinator& uc = makeCoordinator();

    EXPECT_THROW(uc.start(file, 3 * Config::MIB, "backups", ""), Errors::InvalidChunkSize);
    EXPECT_THROW(uc.start(file, 0, "backups", ""), Errors::InvalidChunkSize);
    // Cannot shrink below 1 MiB to fit
    EXPECT_THROW(uc.start(tiny, Config::MIB, "backups", ""), Errors::InvalidChunkSize);
    EXPECT_EQ(store.initiateCalls(), 0u);

    Job fitted = uc.start(file, 16 * Config::MIB, "backups", "");
    EXPECT_EQ(fitted.chunk_size, 2 * Config::MIB);
    EXPECT_EQ(uc.chunks(fitted.job_id).size(), 2u);
}

TEST_F(UploadCoordinatorTest, FitChunkSizeHalvesToFile) {
    EXPECT_EQ(UploadCoordinator::fitChunkSize(10 * Config::MIB, 16 * Config::MIB), 8 * Config::MIB);
    EXPECT_EQ(UploadCoordinator::fitChunkSize(10 * Config::MIB, 4 * Config::MIB), 4 * Config::MIB);
    EXPECT_EQ(UploadCoordinator::fitChunkSize(100, 16 * Config::MIB), Config::MIB);
}

TEST_F(UploadCoordinatorTest, MissingSourceFile) {
    UploadCoordinator& uc = makeCoordinator();
    EXPECT_THROW(uc.start(test_dir / "missing.bin", Config::MIB, "backups", ""), std::runtime_error);
}

TEST_F(UploadCoordinatorTest, InitiateFailureLeavesNoJob) {
    fs::path file = createFile("source.bin", Config::MIB);
    store.failInitiate();
    UploadCoordinator& uc = makeCoordinator();

    EXPECT_THROW(uc.start(file, Config::MIB, "backups", ""), Errors::RemoteInitError);
    EXPECT_TRUE(journal->jobIds().empty());
}

TEST_F(UploadCoordinatorTest, UploadsNextPendingChunkInOrder) {
    fs::path file = createFile("source.bin", 3 * Config::MIB);
    UploadCoordinator& uc = makeCoordinator();
    Job job = uc.start(file, Config::MIB, "backups", "");

    EXPECT_EQ(uc.uploadNextPendingChunk(job.job_id), std::optional<size_t>(0));
    EXPECT_EQ(uc.uploadNextPendingChunk(job.job_id), std::optional<size_t>(1));
    EXPECT_EQ(uc.uploadNextPendingChunk(job.job_id), std::optional<size_t>(2));
    EXPECT_FALSE(uc.uploadNextPendingChunk(job.job_id).has_value());
    EXPECT_EQ(store.uploadPartCalls(), 3u);
}

TEST_F(UploadCoordinatorTest, NextPendingChunkPicksUpFailedChunk) {
    fs::path file = createFile("source.bin", 2 * Config::MIB);
    store.failPart(0, 1);
    UploadCoordinator& uc = makeCoordinator();
    Job job = uc.start(file, Config::MIB, "backups", "");

    EXPECT_THROW(uc.uploadNextPendingChunk(job.job_id), Errors::RemotePartError);
    EXPECT_EQ(uc.chunks(job.job_id)[0].status, Chunks::ChunkStatus::Failed);

    EXPECT_EQ(uc.uploadNextPendingChunk(job.job_id), std::optional<size_t>(0));
    EXPECT_EQ(uc.uploadNextPendingChunk(job.job_id), std::optional<size_t>(1));
    EXPECT_FALSE(uc.uploadNextPendingChunk(job.job_id).has_value());
    EXPECT_EQ(store.attempts(0), 2);
    EXPECT_EQ(chunkStatuses(job.job_id, 0), (std::vector<std::string>{"failed", "uploaded"}));
    EXPECT_EQ(uc.finalize(job.job_id).status, JobStatus::Completed);
}

TEST_F(UploadCoordinatorTest, UploadedChunkIsNotSentAgain) {
    fs::path file = createFile("source.bin", 2 * Config::MIB);
    UploadCoordinator& uc = makeCoordinator();
    Job job = uc.start(file, Config::MIB, "backups", "");

    uc.uploadChunk(job.job_id, 1);
    const size_t calls = store.uploadPartCalls();

    try {
        uc.uploadChunk(job.job_id, 1);
        FAIL() << "expected AlreadyUploaded";
    } catch (const Errors::AlreadyUploaded& e) {
        EXPECT_EQ(e.index, 1u);
    }
    EXPECT_EQ(store.uploadPartCalls(), calls);
    EXPECT_THROW(uc.uploadChunk(job.job_id, 2), std::out_of_range);
}

TEST_F(UploadCoordinatorTest, RetriesTransientFailures) {
    config.max_retries = 3;
    fs::path file = createFile("source.bin", 3 * Config::MIB);
    store.failPart(0, 2);
    UploadCoordinator& uc = makeCoordinator();

    Job job = uc.start(file, Config::MIB, "backups", "");
    uc.uploadAll(job.job_id);

    EXPECT_EQ(store.attempts(0), 3);
    EXPECT_EQ(chunkStatuses(job.job_id, 0), (std::vector<std::string>{"failed", "failed", "uploaded"}));
    EXPECT_EQ(uc.chunks(job.job_id)[0].attempts, 2u);

    Job done = uc.finalize(job.job_id);
    EXPECT_EQ(done.tree_hash, sourceHash(file));
}

TEST_F(UploadCoordinatorTest, ExhaustedRetriesFailTheJob) {
    config.max_retries = 2;
    fs::path file = createFile("source.bin", 2 * Config::MIB);
    store.failPart(Config::MIB, 10);
    UploadCoordinator& uc = makeCoordinator();

    Job job = uc.start(file, Config::MIB, "backups", "");
    EXPECT_THROW(uc.uploadAll(job.job_id), Errors::RemotePartError);

    EXPECT_EQ(store.attempts(Config::MIB), 3);
    EXPECT_EQ(uc.job(job.job_id).status, JobStatus::Failed);
    EXPECT_EQ(jobStatuses(job.job_id).back(), "failed");
    EXPECT_TRUE(journal->findResumable().empty());
    EXPECT_THROW(uc.uploadAll(job.job_id), Errors::InvalidTransition);
    EXPECT_THROW(uc.resume(job.job_id), Errors::InvalidTransition);
}

TEST_F(UploadCoordinatorTest, WithoutRetryPolicyFailureIsLeftToCaller) {
    fs::path file = createFile("source.bin", 3 * Config::MIB);
    store.failPart(Config::MIB, 1);
    UploadCoordinator& uc = makeCoordinator();

    Job job = uc.start(file, Config::MIB, "backups", "");
    EXPECT_THROW(uc.uploadAll(job.job_id), Errors::RemotePartError);
    EXPECT_EQ(store.attempts(Config::MIB), 1);
    EXPECT_EQ(uc.job(job.job_id).status, JobStatus::InProgress);
    EXPECT_EQ(uc.chunks(job.job_id)[1].status, Chunks::ChunkStatus::Failed);
    EXPECT_EQ(uc.chunks(job.job_id)[1].last_error, "connection reset");

    // Dispatching again picks the failed chunk up
    uc.uploadAll(job.job_id);
    EXPECT_EQ(uc.finalize(job.job_id).status, JobStatus::Completed);
}

TEST_F(UploadCoordinatorTest, RejectedPartFailsTheJob) {
    config.max_retries = 5;
    fs::path file = createFile("source.bin", 2 * Config::MIB);
    store.rejectPart(0);
    UploadCoordinator& uc = makeCoordinator();

    Job job = uc.start(file, Config::MIB, "backups", "");
    EXPECT_THROW(uc.uploadAll(job.job_id), Errors::RemoteRejected);
    EXPECT_EQ(store.attempts(0), 1);
    EXPECT_EQ(uc.job(job.job_id).status, JobStatus::Failed);
}

TEST_F(UploadCoordinatorTest, FinalizeRequiresEveryChunk) {
    fs::path file = createFile("source.bin", 3 * Config::MIB);
    UploadCoordinator& uc = makeCoordinator();
    Job job = uc.start(file, Config::MIB, "backups", "");
    uc.uploadChunk(job.job_id, 0);
    uc.uploadChunk(job.job_id, 2);

    EXPECT_THROW(uc.finalize(job.job_id), Errors::IncompleteUpload);
    EXPECT_EQ(store.completeCalls(), 0u);
    EXPECT_EQ(uc.job(job.job_id).status, JobStatus::InProgress);

    uc.uploadChunk(job.job_id, 1);
    EXPECT_EQ(uc.finalize(job.job_id).status, JobStatus::Completed);
}

TEST_F(UploadCoordinatorTest, VaultHashDisagreementIsFatal) {
    fs::path file = createFile("source.bin", 2 * Config::MIB);
    store.reportCompletionHash(std::string(64, '0'));
    UploadCoordinator& uc = makeCoordinator();

    Job job = uc.start(file, Config::MIB, "backups", "");
    uc.uploadAll(job.job_id);
    try {
        uc.finalize(job.job_id);
        FAIL() << "expected HashMismatch";
    } catch (const Errors::HashMismatch& e) {
        EXPECT_EQ(e.expected, sourceHash(file));
        EXPECT_EQ(e.actual, std::string(64, '0'));
    }

    EXPECT_EQ(uc.job(job.job_id).status, JobStatus::Failed);
    EXPECT_EQ(jobStatuses(job.job_id).back(), "failed");
    EXPECT_TRUE(index->rows().empty());
    EXPECT_THROW(uc.finalize(job.job_id), Errors::InvalidTransition);
}

TEST_F(UploadCoordinatorTest, SourceChangedSinceUploadIsDetected) {
    fs::path file = createFile("source.bin", 2 * Config::MIB, 1);
    UploadCoordinator& uc = makeCoordinator();
    Job job = uc.start(file, Config::MIB, "backups", "");
    uc.uploadAll(job.job_id);

    createFile("source.bin", 2 * Config::MIB, 2);
    EXPECT_THROW(uc.finalize(job.job_id), Errors::HashMismatch);
    EXPECT_EQ(store.completeCalls(), 0u);
    EXPECT_EQ(uc.job(job.job_id).status, JobStatus::Failed);
}

TEST_F(UploadCoordinatorTest, ResumeAfterRestartSendsOnlyMissingChunks) {
    fs::path file = createFile("source.bin", 5 * Config::MIB + 17);
    std::string job_id;
    {
        UploadCoordinator& uc = makeCoordinator();
        job_id = uc.start(file, Config::MIB, "backups", "interrupted").job_id;
        uc.uploadChunk(job_id, 0);
        uc.uploadChunk(job_id, 3);
    }
    openJournal();
    EXPECT_EQ(journal->findResumable(), std::vector<std::string>{job_id});

    UploadCoordinator& uc = makeCoordinator();
    Job resumed = uc.resume(job_id);
    EXPECT_EQ(resumed.status, JobStatus::InProgress);
    EXPECT_EQ(resumed.chunk_size, Config::MIB);

    const size_t calls_before = store.uploadPartCalls();
    uc.uploadAll(job_id);
    EXPECT_EQ(store.uploadPartCalls() - calls_before, 4u);

    Job done = uc.finalize(job_id);
    EXPECT_EQ(done.tree_hash, sourceHash(file));

    // Same bytes uploaded without interruption give the same hash
    Job straight = uc.upload(file, "backups", "straight");
    EXPECT_EQ(straight.tree_hash, done.tree_hash);
}

TEST_F(UploadCoordinatorTest, ResumeChecksChunkSizeAndState) {
    fs::path file = createFile("source.bin", 2 * Config::MIB);
    UploadCoordinator& uc = makeCoordinator();
    Job job = uc.start(file, Config::MIB, "backups", "");

    EXPECT_THROW(uc.resume(job.job_id, 2 * Config::MIB), Errors::ChunkSizeMismatch);
    EXPECT_NO_THROW(uc.resume(job.job_id, Config::MIB));
    EXPECT_THROW(uc.resume("no-such-job"), Errors::JobNotFound);

    Job done = uc.resumeAndComplete(job.job_id);
    EXPECT_EQ(done.status, JobStatus::Completed);
    EXPECT_THROW(uc.resume(job.job_id), Errors::InvalidTransition);
}

TEST_F(UploadCoordinatorTest, ResumeIsRefusedWhileCompleting) {
    fs::path file = createFile("source.bin", 2 * Config::MIB);
    UploadCoordinator& uc = makeCoordinator();
    Job job = uc.start(file, Config::MIB, "backups", "");
    uc.uploadAll(job.job_id);

    // A second request arrives while the vault assembles the archive
    bool resume_refused = false;
    store.onComplete([&](const std::string& job_id) {
        EXPECT_EQ(uc.job(job_id).status, JobStatus::Completing);
        try {
            uc.resume(job_id);
        } catch (const Errors::InvalidTransition&) {
            resume_refused = true;
        }
        EXPECT_THROW(uc.abort(job_id), Errors::InvalidTransition);
    });
    Job done = uc.finalize(job.job_id);
    store.onComplete(nullptr);

    EXPECT_TRUE(resume_refused);
    EXPECT_EQ(done.status, JobStatus::Completed);
    EXPECT_EQ(uc.job(job.job_id).status, JobStatus::Completed);
    EXPECT_EQ(uc.job(job.job_id).archive_id, done.archive_id);
    EXPECT_THROW(uc.abort(job.job_id), Errors::InvalidTransition);
    EXPECT_THROW(uc.resume(job.job_id), Errors::InvalidTransition);
    EXPECT_THROW(uc.finalize(job.job_id), Errors::InvalidTransition);
    EXPECT_EQ(store.completeCalls(), 1u);
    EXPECT_EQ(store.abortCalls(), 0u);
    EXPECT_EQ(jobStatuses(job.job_id), (std::vector<std::string>{"initiated", "in_progress", "completed"}));
}

TEST_F(UploadCoordinatorTest, SecondDispatchIsRefusedWhileUploading) {
    fs::path file = createFile("source.bin", 3 * Config::MIB);
    UploadCoordinator& uc = makeCoordinator();
    Job job = uc.start(file, Config::MIB, "backups", "");

    std::atomic<int> refused{0};
    store.onPartStored([&](const std::string& job_id, uint64_t) {
        try {
            uc.uploadAll(job_id);
        } catch (const Errors::InvalidTransition&) {
            ++refused;
        }
        try {
            uc.resume(job_id);
        } catch (const Errors::InvalidTransition&) {
            ++refused;
        }
    });
    uc.uploadAll(job.job_id);
    store.onPartStored(nullptr);

    EXPECT_EQ(refused.load(), 6);
    EXPECT_EQ(store.uploadPartCalls(), 3u);
    EXPECT_EQ(uc.finalize(job.job_id).status, JobStatus::Completed);
}

TEST_F(UploadCoordinatorTest, ResumeKeepsTheLiveJob) {
    fs::path file = createFile("source.bin", 2 * Config::MIB);
    UploadCoordinator& uc = makeCoordinator();
    Job job = uc.start(file, Config::MIB, "backups", "");
    uc.uploadChunk(job.job_id, 0);

    Job resumed = uc.resume(job.job_id);
    EXPECT_EQ(resumed.status, JobStatus::InProgress);
    EXPECT_EQ(uc.chunks(job.job_id)[0].status, Chunks::ChunkStatus::Uploaded);

    uc.abort(job.job_id);
    EXPECT_THROW(uc.resume(job.job_id), Errors::InvalidTransition);
    EXPECT_EQ(uc.job(job.job_id).status, JobStatus::Aborted);
}

TEST_F(UploadCoordinatorTest, ResumeRefusesChangedSource) {
    fs::path file = createFile("source.bin", 2 * Config::MIB);
    UploadCoordinator& uc = makeCoordinator();
    Job job = uc.start(file, Config::MIB, "backups", "");

    createFile("source.bin", 3 * Config::MIB);
    EXPECT_THROW(uc.resume(job.job_id), Errors::InvalidTransition);
}

TEST_F(UploadCoordinatorTest, AbortStopsTheJob) {
    fs::path file = createFile("source.bin", 2 * Config::MIB);
    UploadCoordinator& uc = makeCoordinator();
    Job job = uc.start(file, Config::MIB, "backups", "");
    uc.uploadChunk(job.job_id, 0);

    uc.abort(job.job_id);
    EXPECT_EQ(store.abortCalls(), 1u);
    EXPECT_FALSE(store.hasUpload(job.job_id));
    EXPECT_EQ(uc.job(job.job_id).status, JobStatus::Aborted);
    EXPECT_EQ(jobStatuses(job.job_id).back(), "aborted");
    EXPECT_TRUE(journal->findResumable().empty());

    EXPECT_THROW(uc.uploadChunk(job.job_id, 1), Errors::InvalidTransition);
    EXPECT_THROW(uc.finalize(job.job_id), Errors::InvalidTransition);
    EXPECT_THROW(uc.abort(job.job_id), Errors::InvalidTransition);
}

TEST_F(UploadCoordinatorTest, AcknowledgmentArrivingAfterAbortIsDropped) {
    fs::path file = createFile("source.bin", 2 * Config::MIB);
    UploadCoordinator& uc = makeCoordinator();
    Job job = uc.start(file, Config::MIB, "backups", "");

    // The job is aborted while part 0 is on the wire
    store.onPartStored([&](const std::string& job_id, uint64_t) { uc.abort(job_id); });
    uc.uploadChunk(job.job_id, 0);
    store.onPartStored(nullptr);

    EXPECT_TRUE(chunkStatuses(job.job_id, 0).empty());
    EXPECT_EQ(uc.chunks(job.job_id)[0].status, Chunks::ChunkStatus::Pending);
    EXPECT_EQ(uc.job(job.job_id).status, JobStatus::Aborted);
    EXPECT_EQ(jobStatuses(job.job_id), (std::vector<std::string>{"initiated", "in_progress", "aborted"}));

    openJournal();
    JobState replayed = journal->replay(job.job_id);
    EXPECT_EQ(replayed.job.status, JobStatus::Aborted);
    EXPECT_EQ(replayed.chunks.at(0).status, Chunks::ChunkStatus::Pending);
}

TEST_F(UploadCoordinatorTest, CompletedJobCannotBeAborted) {
    fs::path file = createFile("source.bin", Config::MIB);
    UploadCoordinator& uc = makeCoordinator();
    Job done = uc.upload(file, "backups", "");

    EXPECT_THROW(uc.abort(done.job_id), Errors::InvalidTransition);
    EXPECT_EQ(store.abortCalls(), 0u);
}

TEST_F(UploadCoordinatorTest, CancelStopsAfterInFlightChunk) {
    config.max_concurrent_uploads = 1;
    UploadCoordinator* target = nullptr;
    config.on_progress = [&](const std::string& job_id, size_t uploaded, size_t) {
        if (uploaded == 1 && target) {
            target->cancel(job_id);
        }
    };
    fs::path file = createFile("source.bin", 4 * Config::MIB);
    UploadCoordinator& uc = makeCoordinator();
    target = &uc;

    Job job = uc.start(file, Config::MIB, "backups", "");
    EXPECT_THROW(uc.uploadAll(job.job_id), Errors::UploadCancelled);
    EXPECT_EQ(store.uploadPartCalls(), 1u);
    EXPECT_EQ(uc.job(job.job_id).status, JobStatus::InProgress);

    uc.uploadAll(job.job_id);
    EXPECT_EQ(uc.finalize(job.job_id).status, JobStatus::Completed);
}

TEST_F(UploadCoordinatorTest, JobsUploadSideBySide) {
    config.max_concurrent_uploads = 1;
    config.max_parallel_jobs = 2;
    fs::path first_file = createFile("first.bin", 2 * Config::MIB, 1);
    fs::path second_file = createFile("second.bin", 2 * Config::MIB, 2);
    UploadCoordinator& uc = makeCoordinator();
    Job first = uc.start(first_file, Config::MIB, "backups", "");
    Job second = uc.start(second_file, Config::MIB, "backups", "");

    // The first job's worker holds its part until the second job has stored one
    std::promise<void> second_stored;
    std::shared_future<void> stored = second_stored.get_future().share();
    std::atomic<bool> signalled{false};
    std::atomic<bool> overlapped{false};
    store.onPartStored([&](const std::string& job_id, uint64_t) {
        if (job_id == second.job_id) {
            if (!signalled.exchange(true)) {
                second_stored.set_value();
            }
        } else if (stored.wait_for(std::chrono::seconds(5)) == std::future_status::ready) {
            overlapped = true;
        }
    });

    std::thread first_upload([&]() { EXPECT_NO_THROW(uc.uploadAll(first.job_id)); });
    uc.uploadAll(second.job_id);
    first_upload.join();
    store.onPartStored(nullptr);

    EXPECT_TRUE(overlapped.load());
    EXPECT_EQ(uc.finalize(first.job_id).tree_hash, sourceHash(first_file));
    EXPECT_EQ(uc.finalize(second.job_id).tree_hash, sourceHash(second_file));
}

TEST_F(UploadCoordinatorTest, ReportsProgress) {
    std::vector<std::pair<size_t, size_t>> reports;
    std::mutex reports_mutex;
    config.on_progress = [&](const std::string&, size_t uploaded, size_t total) {
        std::lock_guard<std::mutex> lock(reports_mutex);
        reports.emplace_back(uploaded, total);
    };
    fs::path file = createFile("source.bin", 3 * Config::MIB);
    UploadCoordinator& uc = makeCoordinator();
    uc.upload(file, "backups", "");

    ASSERT_EQ(reports.size(), 3u);
    size_t max_uploaded = 0;
    for (const auto& report : reports) {
        EXPECT_EQ(report.second, 3u);
        max_uploaded = std::max(max_uploaded, report.first);
    }
    EXPECT_EQ(max_uploaded, 3u);
}

TEST_F(UploadCoordinatorTest, ReconcilesIndexFromJournal) {
    fs::path file = createFile("source.bin", Config::MIB);
    Job done = makeCoordinator().upload(file, "backups", "kept");

    // A crash between the journal write and the index append loses the row
    coordinator.reset();
    fs::remove(config.archiveIndexPath());
    index = std::make_unique<Index::TsvArchiveIndex>(config.archiveIndexPath());

    UploadCoordinator& uc = makeCoordinator();
    EXPECT_EQ(uc.reconcileIndex(), 1u);
    EXPECT_EQ(uc.reconcileIndex(), 0u);

    auto rows = index->rows();
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0].job_id, done.job_id);
    EXPECT_EQ(rows[0].archive_id, done.archive_id);
    EXPECT_EQ(rows[0].description, "kept");
    EXPECT_FALSE(rows[0].timestamp.empty());
}

TEST_F(UploadCoordinatorTest, UnknownJob) {
    UploadCoordinator& uc = makeCoordinator();
    EXPECT_THROW(uc.job("nope"), Errors::JobNotFound);
    EXPECT_THROW(uc.uploadAll("nope"), Errors::JobNotFound);
    EXPECT_THROW(uc.abort("nope"), Errors::JobNotFound);
}
