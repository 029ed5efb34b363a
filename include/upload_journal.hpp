// include/upload_journal.hpp
#pragma once

#include <string>
#include <vector>
#include <mutex>
#include <filesystem>
#include <functional>
#include <cstdint>

#include "journal_entry.hpp"
#include "upload_job.hpp"

namespace GlacierUpload
{
    namespace Journal
    {

        // Append-only log of job and chunk transitions, stored as JSON lines.
        // It is the single source of truth for crash recovery; entries are never
        // rewritten or deleted.
        class UploadJournal
        {
        public:
            explicit UploadJournal(std::filesystem::path journal_path);

            // Persist one entry (fsync'd) before returning. Assigns seq and, when
            // empty, the timestamp. Returns the stored entry. Throws JournalError.
            JournalEntry append(JournalEntry entry);

            // Rebuild a job and its chunk records from its entries in append order.
            // Throws JobNotFound if the job was never initiated.
            JobState replay(const std::string &job_id) const;

            // All entries of a job, oldest first.
            std::vector<JournalEntry> entries(const std::string &job_id) const;

            // Jobs whose last recorded status is Initiated or InProgress.
            std::vector<std::string> findResumable() const;

            // Every job id in order of first appearance.
            std::vector<std::string> jobIds() const;

            const std::filesystem::path &path() const { return journal_path; }

        private:
            std::filesystem::path journal_path;
            mutable std::mutex mtx; // Serializes appends and keeps seq monotonic
            uint64_t next_seq = 1;

            // Stream entries in file order. A torn final line is skipped.
            void forEachEntry(const std::function<void(const JournalEntry &)> &visit) const;

            // Cut off a final line that was never completed by a crashed append.
            void dropTornTail();

            static void applyEntry(JobState &state, const JournalEntry &entry);
        };

    } // namespace Journal
} // namespace GlacierUpload
