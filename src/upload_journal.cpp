// src/upload_journal.cpp
#include "upload_journal.hpp"
#include "chunker.hpp"
#include "upload_errors.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <iterator>
#include <map>
#include <memory>
#include <unordered_set>
#include <utility>

#include <unistd.h> // For fsync

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace GlacierUpload
{
    namespace Journal
    {

        namespace
        {
            struct FileCloser
            {
                void operator()(std::FILE *f) const
                {
                    if (f)
                    {
                        std::fclose(f);
                    }
                }
            };

            using FileHandle = std::unique_ptr<std::FILE, FileCloser>;

            std::string errnoText()
            {
                return std::strerror(errno);
            }
        } // namespace

        UploadJournal::UploadJournal(fs::path journal_path) : journal_path(std::move(journal_path))
        {
            if (this->journal_path.has_parent_path())
            {
                fs::create_directories(this->journal_path.parent_path());
            }

            dropTornTail();

            uint64_t last_seq = 0;
            size_t count = 0;
            forEachEntry([&](const JournalEntry &entry)
                         {
                             last_seq = std::max(last_seq, entry.seq);
                             ++count;
                         });
            next_seq = last_seq + 1;
            spdlog::debug("Journal {} opened with {} entries", this->journal_path.string(), count);
        }

        void UploadJournal::dropTornTail()
        {
            if (!fs::exists(journal_path) || fs::file_size(journal_path) == 0)
            {
                return;
            }

            std::ifstream ifs(journal_path, std::ios::binary);
            if (!ifs.is_open())
            {
                throw Errors::JournalError("Failed to open journal for reading: " + journal_path.string());
            }
            std::string contents((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
            ifs.close();

            if (contents.back() == '\n')
            {
                return;
            }

            // A crash mid-append leaves a line without its newline; it never became an entry.
            size_t keep = contents.find_last_of('\n');
            keep = (keep == std::string::npos) ? 0 : keep + 1;
            spdlog::warn("Journal {} ends with an incomplete entry ({} bytes), truncating it",
                         journal_path.string(), contents.size() - keep);
            fs::resize_file(journal_path, keep);
        }

        JournalEntry UploadJournal::append(JournalEntry entry)
        {
            std::lock_guard<std::mutex> lock(mtx);

            entry.seq = next_seq;
            if (entry.timestamp.empty())
            {
                entry.timestamp = currentTimestamp();
            }
            const std::string line = entry.toJson().dump() + "\n";

            FileHandle file(std::fopen(journal_path.c_str(), "a"));
            if (!file)
            {
                throw Errors::JournalError("Failed to open journal " + journal_path.string() + ": " + errnoText());
            }
            if (std::fwrite(line.data(), 1, line.size(), file.get()) != line.size())
            {
                throw Errors::JournalError("Failed to write journal entry to " + journal_path.string() + ": " + errnoText());
            }
            if (std::fflush(file.get()) != 0 || ::fsync(::fileno(file.get())) != 0)
            {
                throw Errors::JournalError("Failed to sync journal " + journal_path.string() + ": " + errnoText());
            }

            ++next_seq;
            return entry;
        }

        void UploadJournal::forEachEntry(const std::function<void(const JournalEntry &)> &visit) const
        {
            if (!fs::exists(journal_path))
            {
                return;
            }

            std::ifstream ifs(journal_path);
            if (!ifs.is_open())
            {
                throw Errors::JournalError("Failed to open journal for reading: " + journal_path.string());
            }

            std::string line;
            std::string torn_line;
            size_t line_number = 0;
            while (std::getline(ifs, line))
            {
                ++line_number;
                if (line.empty())
                {
                    continue;
                }
                if (!torn_line.empty())
                {
                    // A bad line followed by more entries is corruption, not a torn tail.
                    throw Errors::JournalError("Corrupt journal entry at line " + std::to_string(line_number - 1) +
                                               " of " + journal_path.string());
                }

                JournalEntry entry;
                try
                {
                    entry = JournalEntry::fromJson(nlohmann::json::parse(line));
                }
                catch (const std::exception &e)
                {
                    torn_line = e.what();
                    continue;
                }
                visit(entry);
            }

            if (!torn_line.empty())
            {
                spdlog::warn("Skipping incomplete final journal line in {}: {}", journal_path.string(), torn_line);
            }
        }

        void UploadJournal::applyEntry(JobState &state, const JournalEntry &entry)
        {
            if (entry.entity == Entity::Job)
            {
                state.job.status = jobStatusFromString(entry.status);
                if (entry.archive_id)
                {
                    state.job.archive_id = *entry.archive_id;
                }
                if (entry.hash && state.job.status == JobStatus::Completed)
                {
                    state.job.tree_hash = *entry.hash;
                }
                return;
            }

            auto it = state.chunks.find(*entry.chunk_index);
            if (it == state.chunks.end())
            {
                throw Errors::JournalError("Journal references chunk " + std::to_string(*entry.chunk_index) +
                                           " outside the plan of job " + entry.job_id);
            }

            Chunks::ChunkRecord &record = it->second;
            record.status = Chunks::chunkStatusFromString(entry.status);
            if (entry.hash)
            {
                record.hash = *entry.hash;
            }
            if (record.status == Chunks::ChunkStatus::Failed)
            {
                ++record.attempts;
                record.last_error = entry.error.value_or("");
            }
        }

        JobState UploadJournal::replay(const std::string &job_id) const
        {
            JobState state;
            bool initiated = false;
            size_t applied = 0;

            forEachEntry([&](const JournalEntry &entry)
                         {
                             if (entry.job_id != job_id)
                             {
                                 return;
                             }
                             if (!initiated)
                             {
                                 if (!entry.job)
                                 {
                                     throw Errors::JournalError("Job " + job_id + " has entries before its initiation");
                                 }
                                 state.job = *entry.job;
                                 Chunks::Chunker chunker(state.job.total_size, state.job.chunk_size);
                                 for (const auto &planned : chunker)
                                 {
                                     Chunks::ChunkRecord record;
                                     record.job_id = job_id;
                                     record.index = planned.first;
                                     record.range = planned.second;
                                     state.chunks.emplace(planned.first, record);
                                 }
                                 initiated = true;
                             }
                             applyEntry(state, entry);
                             ++applied;
                         });

            if (!initiated)
            {
                throw Errors::JobNotFound(job_id);
            }
            spdlog::debug("Replayed {} journal entries for job {}", applied, job_id);
            return state;
        }

        std::vector<JournalEntry> UploadJournal::entries(const std::string &job_id) const
        {
            std::vector<JournalEntry> out;
            forEachEntry([&](const JournalEntry &entry)
                         {
                             if (entry.job_id == job_id)
                             {
                                 out.push_back(entry);
                             }
                         });
            return out;
        }

        std::vector<std::string> UploadJournal::findResumable() const
        {
            std::vector<std::string> order;
            std::map<std::string, JobStatus> last_status;
            forEachEntry([&](const JournalEntry &entry)
                         {
                             if (entry.entity != Entity::Job)
                             {
                                 return;
                             }
                             if (last_status.find(entry.job_id) == last_status.end())
                             {
                                 order.push_back(entry.job_id);
                             }
                             last_status[entry.job_id] = jobStatusFromString(entry.status);
                         });

            std::vector<std::string> resumable;
            for (const auto &job_id : order)
            {
                if (isResumable(last_status[job_id]))
                {
                    resumable.push_back(job_id);
                }
            }
            return resumable;
        }

        std::vector<std::string> UploadJournal::jobIds() const
        {
            std::vector<std::string> order;
            std::unordered_set<std::string> seen;
            forEachEntry([&](const JournalEntry &entry)
                         {
                             if (seen.insert(entry.job_id).second)
                             {
                                 order.push_back(entry.job_id);
                             }
                         });
            return order;
        }

    } // namespace Journal
} // namespace GlacierUpload
