// include/upload_job.hpp
#pragma once

#include <cstdint>
#include <map>
#include <string>

#include "chunk.hpp"

namespace GlacierUpload
{

    enum class JobStatus
    {
        Initiated,
        InProgress,
        Completing, // in-memory only, never journaled
        Completed,
        Aborted,
        Failed
    };

    std::string toString(JobStatus status);
    JobStatus jobStatusFromString(const std::string &name);

    // Initiated or InProgress.
    bool isResumable(JobStatus status);

    class Job
    {
    public:
        std::string job_id; // Issued by the remote store
        std::string file_path;
        uint64_t total_size = 0;
        uint64_t chunk_size = 0;
        std::string vault;
        std::string description;
        JobStatus status = JobStatus::Initiated;

        // Set once Completed
        std::string archive_id;
        std::string tree_hash;
    };

    // Job plus its chunk records keyed by index, as rebuilt from the journal.
    struct JobState
    {
        Job job;
        std::map<size_t, Chunks::ChunkRecord> chunks;
    };

} // namespace GlacierUpload
