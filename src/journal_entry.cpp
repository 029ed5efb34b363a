// src/journal_entry.cpp
#include "journal_entry.hpp"

#include <chrono> // For timestamps
#include <ctime>
#include <stdexcept>

namespace GlacierUpload {
namespace Journal {

std::string currentTimestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t now_c = std::chrono::system_clock::to_time_t(now);
    std::tm utc{};
    gmtime_r(&now_c, &utc);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return buf;
}

JournalEntry JournalEntry::forJob(const Job& job, JobStatus status) {
    JournalEntry entry;
    entry.job_id = job.job_id;
    entry.entity = Entity::Job;
    entry.status = toString(status);
    if (status == JobStatus::Initiated) {
        entry.job = job;
        entry.job->status = JobStatus::Initiated;
    }
    if (status == JobStatus::Completed) {
        entry.archive_id = job.archive_id;
        entry.hash = job.tree_hash;
    }
    return entry;
}

JournalEntry JournalEntry::forChunk(const Chunks::ChunkRecord& record) {
    JournalEntry entry;
    entry.job_id = record.job_id;
    entry.entity = Entity::Chunk;
    entry.chunk_index = record.index;
    entry.status = toString(record.status);
    entry.range = record.range;
    if (!record.hash.empty()) {
        entry.hash = record.hash;
    }
    if (record.status == Chunks::ChunkStatus::Failed && !record.last_error.empty()) {
        entry.error = record.last_error;
    }
    return entry;
}

nlohmann::json JournalEntry::toJson() const {
    nlohmann::json j{
        {"seq", seq},
        {"ts", timestamp},
        {"job_id", job_id},
        {"entity", entity == Entity::Job ? "job" : "chunk"},
        {"status", status}
    };
    if (chunk_index) j["key"] = *chunk_index;
    if (hash) j["hash"] = *hash;
    if (error) j["error"] = *error;
    if (archive_id) j["archive_id"] = *archive_id;
    if (range) {
        j["start"] = range->start;
        j["end"] = range->end;
    }
    if (job) {
        j["file_path"] = job->file_path;
        j["total_size"] = job->total_size;
        j["chunk_size"] = job->chunk_size;
        j["vault"] = job->vault;
        j["description"] = job->description;
    }
    return j;
}

JournalEntry JournalEntry::fromJson(const nlohmann::json& j) {
    JournalEntry entry;
    j.at("seq").get_to(entry.seq);
    j.at("ts").get_to(entry.timestamp);
    j.at("job_id").get_to(entry.job_id);
    j.at("status").get_to(entry.status);

    const std::string entity = j.at("entity").get<std::string>();
    if (entity == "job") {
        entry.entity = Entity::Job;
    } else if (entity == "chunk") {
        entry.entity = Entity::Chunk;
        entry.chunk_index = j.at("key").get<size_t>();
    } else {
        throw std::invalid_argument("Unknown journal entity: " + entity);
    }

    if (j.contains("hash")) entry.hash = j.at("hash").get<std::string>();
    if (j.contains("error")) entry.error = j.at("error").get<std::string>();
    if (j.contains("archive_id")) entry.archive_id = j.at("archive_id").get<std::string>();
    if (j.contains("start") && j.contains("end")) {
        entry.range = Chunks::ByteRange{j.at("start").get<uint64_t>(), j.at("end").get<uint64_t>()};
    }
    if (j.contains("file_path")) {
        Job job;
        job.job_id = entry.job_id;
        j.at("file_path").get_to(job.file_path);
        j.at("total_size").get_to(job.total_size);
        j.at("chunk_size").get_to(job.chunk_size);
        j.at("vault").get_to(job.vault);
        j.at("description").get_to(job.description);
        job.status = jobStatusFromString(entry.status);
        entry.job = job;
    }
    return entry;
}

} // namespace Journal
} // namespace GlacierUpload
