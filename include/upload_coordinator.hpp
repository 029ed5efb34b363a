// include/upload_coordinator.hpp
#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "upload_config.hpp"
#include "upload_errors.hpp"
#include "upload_job.hpp"
#include "chunk.hpp"
#include "chunker.hpp"
#include "tree_hasher.hpp"
#include "upload_journal.hpp"
#include "remote_store.hpp"
#include "archive_index.hpp"
#include "thread_pool.hpp"

namespace GlacierUpload
{

    // Drives multi-part uploads:
    //   Initiated -> InProgress -> (Completing -> Completed) | Aborted | Failed
    // Every durable transition goes through the journal first, so any job that was
    // interrupted can be picked up again with resume().
    class UploadCoordinator
    {
    public:
        UploadCoordinator(Config::UploadConfig config,
                          Remote::RemoteStore &remote,
                          Journal::UploadJournal &journal,
                          Index::ArchiveIndex &index);

        // Plan the chunks, initiate the remote upload and journal the new job.
        // A zero-length file is rejected with EmptyInput. If chunk_size exceeds the
        // file it is halved to fit, but never below 1 MiB.
        Job start(const std::filesystem::path &file,
                  uint64_t chunk_size,
                  const std::string &vault,
                  const std::string &description);

        // Upload the lowest-index chunk that is Pending or Failed and not already
        // being sent. Returns its index, or nullopt if there is nothing to send.
        // Remote failures are journaled as a Failed chunk and rethrown.
        std::optional<size_t> uploadNextPendingChunk(const std::string &job_id);

        // Upload one chunk by index. Throws AlreadyUploaded, without contacting the
        // remote store, if the chunk is already uploaded.
        void uploadChunk(const std::string &job_id, size_t chunk_index);

        // Send every remaining chunk over the worker pool, retrying per the
        // configured policy. Returns once all chunks are uploaded. At most
        // max_concurrent_uploads parts of the job are in flight; only one call
        // per job may run at a time.
        void uploadAll(const std::string &job_id);

        // Compute the aggregate tree hash, complete the remote upload and record the
        // archive. Throws IncompleteUpload if any chunk is not uploaded and
        // HashMismatch if the store disagrees with the local hash.
        Job finalize(const std::string &job_id);

        // Rebuild a job from the journal so uploading can continue. Throws
        // ChunkSizeMismatch if chunk_size differs from the journaled value and
        // InvalidTransition while the job is still uploading, completing or no
        // longer resumable in this process.
        Job resume(const std::string &job_id, std::optional<uint64_t> chunk_size = std::nullopt);

        // Abort the remote upload (best-effort) and journal the job as Aborted.
        void abort(const std::string &job_id);

        // Ask a running uploadAll() to stop after the chunks already in flight.
        // Workers of the job that have not started yet are dropped from the pool.
        void cancel(const std::string &job_id);

        // start + uploadAll + finalize with the configured chunk size.
        Job upload(const std::filesystem::path &file, const std::string &vault, const std::string &description);

        // resume + uploadAll + finalize.
        Job resumeAndComplete(const std::string &job_id);

        // Record index rows for journaled Completed jobs the index is missing
        // (a crash between the two writes). Returns the number of rows added.
        size_t reconcileIndex();

        Job job(const std::string &job_id) const;
        std::vector<Chunks::ChunkRecord> chunks(const std::string &job_id) const;

        const Config::UploadConfig &configuration() const { return config; }

        // Halve requested until it is no larger than total_size, stopping at 1 MiB.
        static uint64_t fitChunkSize(uint64_t total_size, uint64_t requested);

    private:
        struct ActiveJob
        {
            std::mutex mtx; // Guards state and in_flight; held for journal writes, never across remote calls
            JobState state;
            std::set<size_t> in_flight;
            bool uploading = false; // An uploadAll() call is dispatching this job
            std::atomic<bool> cancelled{false};
        };

        struct UploadRun;

        Config::UploadConfig config;
        Remote::RemoteStore &remote;
        Journal::UploadJournal &journal;
        Index::ArchiveIndex &index;
        Concurrency::ThreadPool pool;

        mutable std::mutex jobs_mutex;
        mutable std::map<std::string, std::shared_ptr<ActiveJob>> jobs; // Filled lazily from the journal

        // The in-memory job, loaded from the journal on first use. Throws JobNotFound.
        std::shared_ptr<ActiveJob> active(const std::string &job_id) const;

        // Claim the lowest sendable chunk, skipping those in `skip`. Caller must hold job.mtx.
        std::optional<size_t> claimNext(ActiveJob &job, const std::set<size_t> &skip);

        // Read, hash and send one claimed chunk, then journal the outcome.
        void sendChunk(ActiveJob &job, size_t chunk_index);

        // Journal a job transition and apply it. Caller must hold job.mtx.
        void transition(ActiveJob &job, JobStatus status, const std::string &error = "");

        void runWorker(const std::shared_ptr<ActiveJob> &job, UploadRun &run);

        static void requireUploading(const Job &job);
    };

} // namespace GlacierUpload
