// include/journal_entry.hpp
#pragma once

#include <string>
#include <optional>
#include <cstdint>

#include <nlohmann/json.hpp>

#include "upload_job.hpp"

namespace GlacierUpload {
namespace Journal {

enum class Entity {
    Job,
    Chunk
};

// Current UTC time as YYYY-MM-DDTHH:MM:SSZ
std::string currentTimestamp();

// One state transition of a job or of one of its chunks.
class JournalEntry {
public:
    uint64_t seq = 0;          // Assigned by UploadJournal::append
    std::string timestamp;     // ISO 8601, assigned by append when empty
    std::string job_id;
    Entity entity = Entity::Job;
    std::optional<size_t> chunk_index;
    std::string status;        // JobStatus or ChunkStatus name
    std::optional<std::string> hash;
    std::optional<std::string> error;

    // Carried by the Initiated entry so replay can rebuild the job
    std::optional<Job> job;

    // Carried by chunk entries
    std::optional<Chunks::ByteRange> range;

    std::optional<std::string> archive_id;

    static JournalEntry forJob(const Job& job, JobStatus status);
    static JournalEntry forChunk(const Chunks::ChunkRecord& record);

    nlohmann::json toJson() const;
    static JournalEntry fromJson(const nlohmann::json& j);
};

} // namespace Journal
} // namespace GlacierUpload
