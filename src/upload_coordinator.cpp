// src/upload_coordinator.cpp
#include "upload_coordinator.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <future>
#include <thread>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace GlacierUpload
{

    namespace
    {
        // Releases a claimed chunk when the send attempt ends, however it ends.
        class InFlightGuard
        {
        public:
            InFlightGuard(std::mutex &mtx, std::set<size_t> &in_flight, size_t index)
                : mtx(mtx), in_flight(in_flight), index(index)
            {
            }
            ~InFlightGuard()
            {
                std::lock_guard<std::mutex> lock(mtx);
                in_flight.erase(index);
            }

        private:
            std::mutex &mtx;
            std::set<size_t> &in_flight;
            size_t index;
        };

        // Clears ActiveJob::uploading when an uploadAll() call returns.
        class UploadingFlag
        {
        public:
            UploadingFlag(std::mutex &mtx, bool &flag) : mtx(mtx), flag(flag) {}
            ~UploadingFlag()
            {
                std::lock_guard<std::mutex> lock(mtx);
                flag = false;
            }

        private:
            std::mutex &mtx;
            bool &flag;
        };

        size_t uploadedCount(const JobState &state)
        {
            return static_cast<size_t>(std::count_if(state.chunks.begin(), state.chunks.end(),
                                                     [](const auto &entry)
                                                     { return entry.second.status == Chunks::ChunkStatus::Uploaded; }));
        }
    } // namespace

    // Shared by the workers of one uploadAll() call.
    struct UploadCoordinator::UploadRun
    {
        std::mutex mtx;
        std::set<size_t> given_up;       // Chunks this run stopped trying
        std::exception_ptr first_error;
        std::exception_ptr fatal_error;
        bool job_failed = false;         // Retries exhausted or a part was rejected
        std::string failure;
        std::atomic<bool> stop{false};

        void giveUp(size_t index, std::exception_ptr error, bool fatal, const std::string &reason)
        {
            std::lock_guard<std::mutex> lock(mtx);
            given_up.insert(index);
            if (!first_error)
            {
                first_error = error;
            }
            if (fatal && !job_failed)
            {
                job_failed = true;
                failure = reason;
                fatal_error = error;
            }
            if (fatal)
            {
                stop = true;
            }
        }
    };

    UploadCoordinator::UploadCoordinator(Config::UploadConfig config,
                                         Remote::RemoteStore &remote,
                                         Journal::UploadJournal &journal,
                                         Index::ArchiveIndex &index)
        : config(std::move(config)),
          remote(remote),
          journal(journal),
          index(index),
          pool(this->config.workerThreads(), this->config.max_concurrent_uploads, "uploads")
    {
        spdlog::info("UploadCoordinator ready: {} concurrent uploads per job, {} jobs in parallel, retries {}",
                     this->config.max_concurrent_uploads, this->config.max_parallel_jobs,
                     this->config.max_retries ? std::to_string(*this->config.max_retries) : std::string("manual"));
    }

    uint64_t UploadCoordinator::fitChunkSize(uint64_t total_size, uint64_t requested)
    {
        while (requested > total_size && requested > Config::MIN_CHUNK_SIZE)
        {
            requested /= 2;
        }
        return requested;
    }

    std::shared_ptr<UploadCoordinator::ActiveJob> UploadCoordinator::active(const std::string &job_id) const
    {
        std::lock_guard<std::mutex> lock(jobs_mutex);
        auto it = jobs.find(job_id);
        if (it != jobs.end())
        {
            return it->second;
        }

        auto job = std::make_shared<ActiveJob>();
        job->state = journal.replay(job_id);
        jobs.emplace(job_id, job);
        return job;
    }

    void UploadCoordinator::requireUploading(const Job &job)
    {
        if (job.status == JobStatus::Initiated)
        {
            throw Errors::InvalidTransition("Job " + job.job_id + " is initiated but not running; resume it first");
        }
        if (job.status != JobStatus::InProgress)
        {
            throw Errors::InvalidTransition("Job " + job.job_id + " is " + toString(job.status) +
                                            "; no further parts can be uploaded");
        }
    }

    void UploadCoordinator::transition(ActiveJob &job, JobStatus status, const std::string &error)
    {
        Journal::JournalEntry entry = Journal::JournalEntry::forJob(job.state.job, status);
        if (!error.empty())
        {
            entry.error = error;
        }
        journal.append(entry);
        job.state.job.status = status;
    }

    Job UploadCoordinator::start(const fs::path &file,
                                 uint64_t chunk_size,
                                 const std::string &vault,
                                 const std::string &description)
    {
        if (!fs::exists(file))
        {
            throw std::runtime_error("Input file not found: " + file.string());
        }
        const uint64_t total_size = fs::file_size(file);
        if (total_size == 0)
        {
            throw Errors::EmptyInput("Refusing to archive empty file " + file.string());
        }
        if (!Config::isValidChunkSize(chunk_size))
        {
            throw Errors::InvalidChunkSize("Chunk size must be a power of two between 1 MiB and 4 GiB, got " +
                                           std::to_string(chunk_size));
        }

        const uint64_t effective_chunk_size = fitChunkSize(total_size, chunk_size);
        if (effective_chunk_size != chunk_size)
        {
            spdlog::warn("Chunk size {} exceeds {} ({} bytes), using {}",
                         chunk_size, file.string(), total_size, effective_chunk_size);
        }
        Chunks::Chunker chunker(total_size, effective_chunk_size);

        std::string job_id;
        try
        {
            job_id = remote.initiateUpload(vault, description, total_size, effective_chunk_size);
        }
        catch (const Errors::RemoteInitError &e)
        {
            spdlog::error("Could not initiate upload of {} to vault {}: {}", file.string(), vault, e.what());
            throw;
        }

        auto job = std::make_shared<ActiveJob>();
        Job &record = job->state.job;
        record.job_id = job_id;
        record.file_path = fs::absolute(file).string();
        record.total_size = total_size;
        record.chunk_size = effective_chunk_size;
        record.vault = vault;
        record.description = description;
        record.status = JobStatus::Initiated;

        for (const auto &planned : chunker)
        {
            Chunks::ChunkRecord chunk;
            chunk.job_id = job_id;
            chunk.index = planned.first;
            chunk.range = planned.second;
            job->state.chunks.emplace(planned.first, chunk);
        }

        {
            std::lock_guard<std::mutex> lock(job->mtx);
            journal.append(Journal::JournalEntry::forJob(record, JobStatus::Initiated));
            transition(*job, JobStatus::InProgress);
        }
        {
            std::lock_guard<std::mutex> lock(jobs_mutex);
            jobs[job_id] = job;
        }

        spdlog::info("Started upload {} of {} ({} bytes, {} parts of {} bytes) to vault {}",
                     job_id, record.file_path, total_size, chunker.count(), effective_chunk_size, vault);
        return record;
    }

    std::optional<size_t> UploadCoordinator::claimNext(ActiveJob &job, const std::set<size_t> &skip)
    {
        for (const auto &entry : job.state.chunks)
        {
            const Chunks::ChunkRecord &chunk = entry.second;
            if (chunk.status == Chunks::ChunkStatus::Uploaded || job.in_flight.count(chunk.index) ||
                skip.count(chunk.index))
            {
                continue;
            }
            job.in_flight.insert(chunk.index);
            return chunk.index;
        }
        return std::nullopt;
    }

    void UploadCoordinator::sendChunk(ActiveJob &job, size_t chunk_index)
    {
        std::string file_path;
        Chunks::ChunkRecord record;
        {
            std::lock_guard<std::mutex> lock(job.mtx);
            file_path = job.state.job.file_path;
            record = job.state.chunks.at(chunk_index);
        }

        Chunks::Chunk chunk = Chunks::Chunk::read(file_path, chunk_index, record.range);
        record.hash = chunk.hash;

        try
        {
            Remote::PartAck ack = remote.uploadPart(record.job_id, record.range, chunk.data, chunk.hash);
            if (ack.checksum != chunk.hash)
            {
                throw Errors::RemoteRejected("Store acknowledged part " + std::to_string(chunk_index) +
                                             " with checksum " + ack.checksum + ", expected " + chunk.hash);
            }
        }
        catch (const Errors::RemoteError &e)
        {
            record.status = Chunks::ChunkStatus::Failed;
            record.last_error = e.what();
            std::lock_guard<std::mutex> lock(job.mtx);
            if (job.state.job.status == JobStatus::InProgress)
            {
                journal.append(Journal::JournalEntry::forChunk(record));
                ++record.attempts;
                job.state.chunks[chunk_index] = record;
            }
            throw;
        }

        record.status = Chunks::ChunkStatus::Uploaded;
        record.last_error.clear();

        size_t uploaded = 0;
        size_t total = 0;
        {
            std::lock_guard<std::mutex> lock(job.mtx);
            if (job.state.job.status != JobStatus::InProgress)
            {
                // Aborted while the part was on the wire; the job record is frozen
                spdlog::debug("Dropping late acknowledgment of part {} for {} job {}",
                              chunk_index, toString(job.state.job.status), record.job_id);
                return;
            }
            journal.append(Journal::JournalEntry::forChunk(record));
            job.state.chunks[chunk_index] = record;
            uploaded = uploadedCount(job.state);
            total = job.state.chunks.size();
        }

        spdlog::debug("Job {}: part {} ({}-{}) uploaded, hash {}",
                      record.job_id, chunk_index, record.range.start, record.range.end, record.hash);
        spdlog::info("Job {}: uploaded {}/{} parts", record.job_id, uploaded, total);
        if (config.on_progress)
        {
            config.on_progress(record.job_id, uploaded, total);
        }
    }

    std::optional<size_t> UploadCoordinator::uploadNextPendingChunk(const std::string &job_id)
    {
        auto job = active(job_id);
        std::optional<size_t> claimed;
        {
            std::lock_guard<std::mutex> lock(job->mtx);
            requireUploading(job->state.job);
            claimed = claimNext(*job, {});
        }
        if (!claimed)
        {
            return std::nullopt;
        }

        InFlightGuard guard(job->mtx, job->in_flight, *claimed);
        sendChunk(*job, *claimed);
        return claimed;
    }

    void UploadCoordinator::uploadChunk(const std::string &job_id, size_t chunk_index)
    {
        auto job = active(job_id);
        {
            std::lock_guard<std::mutex> lock(job->mtx);
            requireUploading(job->state.job);
            auto it = job->state.chunks.find(chunk_index);
            if (it == job->state.chunks.end())
            {
                throw std::out_of_range("Job " + job_id + " has no chunk " + std::to_string(chunk_index));
            }
            if (it->second.status == Chunks::ChunkStatus::Uploaded)
            {
                throw Errors::AlreadyUploaded(job_id, chunk_index);
            }
            if (job->in_flight.count(chunk_index))
            {
                throw Errors::InvalidTransition("Chunk " + std::to_string(chunk_index) + " of job " + job_id +
                                                " is already being uploaded");
            }
            job->in_flight.insert(chunk_index);
        }

        InFlightGuard guard(job->mtx, job->in_flight, chunk_index);
        sendChunk(*job, chunk_index);
    }

    void UploadCoordinator::runWorker(const std::shared_ptr<ActiveJob> &job, UploadRun &run)
    {
        for (;;)
        {
            if (job->cancelled || run.stop)
            {
                return;
            }

            std::optional<size_t> claimed;
            {
                std::lock_guard<std::mutex> run_lock(run.mtx);
                std::lock_guard<std::mutex> lock(job->mtx);
                if (job->state.job.status != JobStatus::InProgress)
                {
                    return;
                }
                claimed = claimNext(*job, run.given_up);
            }
            if (!claimed)
            {
                return;
            }

            InFlightGuard guard(job->mtx, job->in_flight, *claimed);
            int failures = 0;
            auto delay = config.initial_backoff;
            for (;;)
            {
                try
                {
                    sendChunk(*job, *claimed);
                    break;
                }
                catch (const Errors::RemotePartError &e)
                {
                    ++failures;
                    if (!config.max_retries)
                    {
                        spdlog::warn("Job {}: part {} failed: {}", job->state.job.job_id, *claimed, e.what());
                        run.giveUp(*claimed, std::current_exception(), false, "");
                        break;
                    }
                    if (failures > *config.max_retries)
                    {
                        spdlog::error("Job {}: part {} failed {} times, giving up: {}",
                                      job->state.job.job_id, *claimed, failures, e.what());
                        run.giveUp(*claimed, std::current_exception(), true,
                                   "part " + std::to_string(*claimed) + " failed after " +
                                       std::to_string(failures) + " attempts: " + e.what());
                        break;
                    }
                    if (job->cancelled)
                    {
                        run.giveUp(*claimed, std::current_exception(), false, "");
                        break;
                    }
                    spdlog::warn("Job {}: part {} failed (attempt {}), retrying in {} ms: {}",
                                 job->state.job.job_id, *claimed, failures, delay.count(), e.what());
                    std::this_thread::sleep_for(delay);
                    delay = config.backoff ? config.backoff(delay) : delay;
                }
                catch (const Errors::RemoteRejected &e)
                {
                    spdlog::error("Job {}: part {} rejected: {}", job->state.job.job_id, *claimed, e.what());
                    run.giveUp(*claimed, std::current_exception(), true,
                               "part " + std::to_string(*claimed) + " rejected: " + e.what());
                    break;
                }
                catch (const std::exception &e)
                {
                    // Local failures (source unreadable, journal write) stop the run without failing the job
                    spdlog::error("Job {}: part {} could not be sent: {}", job->state.job.job_id, *claimed, e.what());
                    run.giveUp(*claimed, std::current_exception(), false, "");
                    run.stop = true;
                    break;
                }
            }
        }
    }

    void UploadCoordinator::uploadAll(const std::string &job_id)
    {
        auto job = active(job_id);
        size_t remaining = 0;
        {
            std::lock_guard<std::mutex> lock(job->mtx);
            requireUploading(job->state.job);
            if (job->uploading)
            {
                throw Errors::InvalidTransition("Job " + job_id + " is already being uploaded");
            }
            remaining = job->state.chunks.size() - uploadedCount(job->state);
            if (remaining == 0)
            {
                return;
            }
            job->uploading = true;
        }
        UploadingFlag uploading(job->mtx, job->uploading);
        job->cancelled = false;

        UploadRun run;
        const size_t workers = std::min(remaining, config.max_concurrent_uploads);
        std::vector<std::future<void>> results;
        results.reserve(workers);
        for (size_t i = 0; i < workers; ++i)
        {
            results.push_back(pool.submit(job_id, [this, job, &run]()
                                          { runWorker(job, run); }));
        }

        // Barrier: every worker has returned before the outcome is judged
        for (auto &result : results)
        {
            try
            {
                result.get();
            }
            catch (const std::future_error &e)
            {
                // Dropped from the queue by cancel() or abort() before it claimed a chunk
                spdlog::debug("Job {}: queued worker dropped: {}", job_id, e.what());
            }
            catch (const std::exception &)
            {
                std::lock_guard<std::mutex> lock(run.mtx);
                if (!run.first_error)
                {
                    run.first_error = std::current_exception();
                }
            }
        }

        if (job->cancelled.exchange(false))
        {
            spdlog::info("Upload {} cancelled; resume it to continue", job_id);
            throw Errors::UploadCancelled("Upload " + job_id + " was cancelled");
        }

        if (run.job_failed)
        {
            std::lock_guard<std::mutex> lock(job->mtx);
            if (job->state.job.status == JobStatus::InProgress)
            {
                transition(*job, JobStatus::Failed, run.failure);
            }
            spdlog::error("Upload {} failed: {}", job_id, run.failure);
            std::rethrow_exception(run.fatal_error);
        }
        if (run.first_error)
        {
            std::rethrow_exception(run.first_error);
        }
    }

    Job UploadCoordinator::finalize(const std::string &job_id)
    {
        auto job = active(job_id);
        std::vector<Hashing::Digest> digests;
        Job snapshot;
        {
            std::lock_guard<std::mutex> lock(job->mtx);
            if (job->state.job.status != JobStatus::InProgress)
            {
                throw Errors::InvalidTransition("Cannot finalize job " + job_id + " in state " +
                                                toString(job->state.job.status));
            }
            for (const auto &entry : job->state.chunks)
            {
                if (entry.second.status != Chunks::ChunkStatus::Uploaded || job->in_flight.count(entry.first))
                {
                    throw Errors::IncompleteUpload("Job " + job_id + " cannot be finalized: part " +
                                                   std::to_string(entry.first) + " is " +
                                                   Chunks::toString(entry.second.status));
                }
                digests.push_back(Hashing::TreeHasher::fromHex(entry.second.hash));
            }
            job->state.job.status = JobStatus::Completing;
            snapshot = job->state.job;
        }

        auto fail = [&](const std::string &reason)
        {
            std::lock_guard<std::mutex> lock(job->mtx);
            job->state.job.status = JobStatus::InProgress;
            transition(*job, JobStatus::Failed, reason);
        };

        std::string aggregate;
        try
        {
            aggregate = Hashing::TreeHasher::toHex(Hashing::TreeHasher::treeHash(digests));
            if (config.verify_source)
            {
                const std::string source_hash =
                    Hashing::TreeHasher::toHex(Hashing::TreeHasher::fileTreeHash(snapshot.file_path));
                if (source_hash != aggregate)
                {
                    Errors::HashMismatch mismatch("Part hashes of job " + job_id + " do not add up to the tree hash of " +
                                                      snapshot.file_path,
                                                  aggregate, source_hash);
                    spdlog::critical("INTEGRITY FAILURE: {}", mismatch.what());
                    fail(mismatch.what());
                    throw mismatch;
                }
            }
        }
        catch (const Errors::HashMismatch &)
        {
            throw;
        }
        catch (const std::exception &)
        {
            std::lock_guard<std::mutex> lock(job->mtx);
            job->state.job.status = JobStatus::InProgress;
            throw;
        }

        Remote::CompletionResult result;
        try
        {
            result = remote.completeUpload(job_id, snapshot.total_size, aggregate);
        }
        catch (const Errors::RemoteError &e)
        {
            spdlog::error("Completing upload {} failed: {}", job_id, e.what());
            std::lock_guard<std::mutex> lock(job->mtx);
            job->state.job.status = JobStatus::InProgress;
            throw;
        }

        if (result.tree_hash != aggregate)
        {
            Errors::HashMismatch mismatch("Vault reports a different tree hash for job " + job_id +
                                              " (archive " + result.archive_id + ")",
                                          aggregate, result.tree_hash);
            spdlog::critical("INTEGRITY FAILURE: {}", mismatch.what());
            fail(mismatch.what());
            throw mismatch;
        }

        Index::ArchiveIndexRow row;
        {
            std::lock_guard<std::mutex> lock(job->mtx);
            job->state.job.status = JobStatus::InProgress;
            job->state.job.archive_id = result.archive_id;
            job->state.job.tree_hash = aggregate;
            transition(*job, JobStatus::Completed);
            snapshot = job->state.job;
        }

        row.file_path = snapshot.file_path;
        row.description = snapshot.description;
        row.archive_id = snapshot.archive_id;
        row.timestamp = Journal::currentTimestamp();
        row.job_id = job_id;
        index.record(row);

        spdlog::info("Upload {} completed: archive {} tree hash {}", job_id, snapshot.archive_id, snapshot.tree_hash);
        return snapshot;
    }

    Job UploadCoordinator::resume(const std::string &job_id, std::optional<uint64_t> chunk_size)
    {
        JobState state = journal.replay(job_id);
        if (chunk_size && *chunk_size != state.job.chunk_size)
        {
            throw Errors::ChunkSizeMismatch("Job " + job_id + " was started with chunk size " +
                                            std::to_string(state.job.chunk_size) + ", not " +
                                            std::to_string(*chunk_size));
        }
        if (!isResumable(state.job.status))
        {
            throw Errors::InvalidTransition("Job " + job_id + " is " + toString(state.job.status) +
                                            " and cannot be resumed");
        }
        if (!fs::exists(state.job.file_path) || fs::file_size(state.job.file_path) != state.job.total_size)
        {
            throw Errors::InvalidTransition("Source " + state.job.file_path + " of job " + job_id +
                                            " is missing or changed size since the upload started");
        }

        // A job already loaded in this process is refreshed in place, so callers
        // holding it keep seeing the one live record.
        std::shared_ptr<ActiveJob> job;
        {
            std::lock_guard<std::mutex> lock(jobs_mutex);
            auto it = jobs.find(job_id);
            if (it != jobs.end())
            {
                job = it->second;
                std::lock_guard<std::mutex> job_lock(job->mtx);
                const JobStatus current = job->state.job.status;
                if (!isResumable(current))
                {
                    throw Errors::InvalidTransition("Job " + job_id + " is " + toString(current) +
                                                    " and cannot be resumed");
                }
                if (job->uploading || !job->in_flight.empty())
                {
                    throw Errors::InvalidTransition("Job " + job_id + " is still uploading");
                }
                job->state = std::move(state);
            }
            else
            {
                job = std::make_shared<ActiveJob>();
                job->state = std::move(state);
                jobs.emplace(job_id, job);
            }
        }

        Job snapshot;
        size_t uploaded = 0;
        {
            std::lock_guard<std::mutex> lock(job->mtx);
            if (job->state.job.status == JobStatus::Initiated)
            {
                transition(*job, JobStatus::InProgress);
            }
            uploaded = uploadedCount(job->state);
            snapshot = job->state.job;
        }

        spdlog::info("Resumed upload {} of {}: {}/{} parts already uploaded",
                     job_id, snapshot.file_path, uploaded, job->state.chunks.size());
        return snapshot;
    }

    void UploadCoordinator::abort(const std::string &job_id)
    {
        auto job = active(job_id);
        {
            std::lock_guard<std::mutex> lock(job->mtx);
            const JobStatus status = job->state.job.status;
            if (status == JobStatus::Completed || status == JobStatus::Completing)
            {
                throw Errors::InvalidTransition("Job " + job_id + " is " + toString(status) + " and cannot be aborted");
            }
            if (status == JobStatus::Aborted)
            {
                throw Errors::InvalidTransition("Job " + job_id + " is already aborted");
            }
        }
        job->cancelled = true;
        pool.dropQueued(job_id);

        try
        {
            remote.abortUpload(job_id);
        }
        catch (const std::exception &e)
        {
            spdlog::warn("Remote abort of upload {} failed: {}", job_id, e.what());
        }

        {
            std::lock_guard<std::mutex> lock(job->mtx);
            transition(*job, JobStatus::Aborted);
        }
        spdlog::info("Upload {} aborted", job_id);
    }

    void UploadCoordinator::cancel(const std::string &job_id)
    {
        active(job_id)->cancelled = true;
        if (size_t dropped = pool.dropQueued(job_id))
        {
            spdlog::debug("Job {}: {} workers had not started", job_id, dropped);
        }
    }

    Job UploadCoordinator::upload(const fs::path &file, const std::string &vault, const std::string &description)
    {
        Job started = start(file, config.chunk_size, vault, description);
        uploadAll(started.job_id);
        return finalize(started.job_id);
    }

    Job UploadCoordinator::resumeAndComplete(const std::string &job_id)
    {
        resume(job_id);
        uploadAll(job_id);
        return finalize(job_id);
    }

    size_t UploadCoordinator::reconcileIndex()
    {
        size_t added = 0;
        for (const auto &job_id : journal.jobIds())
        {
            JobState state = journal.replay(job_id);
            if (state.job.status != JobStatus::Completed || index.contains(job_id))
            {
                continue;
            }

            std::string completed_at;
            for (const auto &entry : journal.entries(job_id))
            {
                if (entry.entity == Journal::Entity::Job && entry.status == toString(JobStatus::Completed))
                {
                    completed_at = entry.timestamp;
                }
            }

            Index::ArchiveIndexRow row;
            row.file_path = state.job.file_path;
            row.description = state.job.description;
            row.archive_id = state.job.archive_id;
            row.timestamp = completed_at;
            row.job_id = job_id;
            index.record(row);
            spdlog::warn("Archive index was missing completed job {}; recorded archive {}", job_id, row.archive_id);
            ++added;
        }
        return added;
    }

    Job UploadCoordinator::job(const std::string &job_id) const
    {
        auto job = active(job_id);
        std::lock_guard<std::mutex> lock(job->mtx);
        return job->state.job;
    }

    std::vector<Chunks::ChunkRecord> UploadCoordinator::chunks(const std::string &job_id) const
    {
        auto job = active(job_id);
        std::lock_guard<std::mutex> lock(job->mtx);
        std::vector<Chunks::ChunkRecord> out;
        out.reserve(job->state.chunks.size());
        for (const auto &entry : job->state.chunks)
        {
            out.push_back(entry.second);
        }
        return out;
    }

} // namespace GlacierUpload
