// include/memory_remote_store.hpp
#pragma once

#include <atomic>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "remote_store.hpp"

namespace GlacierUpload
{
    namespace Remote
    {

        // Keeps uploads and finished archives in memory. Used for dry runs and tests.
        class MemoryRemoteStore : public RemoteStore
        {
        public:
            std::string initiateUpload(const std::string &vault,
                                       const std::string &description,
                                       uint64_t total_size,
                                       uint64_t chunk_size) override;

            PartAck uploadPart(const std::string &job_id,
                               const Chunks::ByteRange &range,
                               const std::vector<char> &bytes,
                               const std::string &chunk_hash) override;

            CompletionResult completeUpload(const std::string &job_id,
                                            uint64_t total_size,
                                            const std::string &aggregate_hash) override;

            void abortUpload(const std::string &job_id) override;

            // Assembled bytes of a completed archive. Throws std::out_of_range.
            std::vector<char> archive(const std::string &archive_id) const;

            bool hasUpload(const std::string &job_id) const;
            size_t partCount(const std::string &job_id) const;

            size_t initiateCalls() const { return initiate_calls; }
            size_t uploadPartCalls() const { return upload_part_calls; }
            size_t completeCalls() const { return complete_calls; }
            size_t abortCalls() const { return abort_calls; }

        private:
            struct Upload
            {
                std::string vault;
                std::string description;
                uint64_t total_size = 0;
                uint64_t chunk_size = 0;
                std::map<uint64_t, std::vector<char>> parts; // keyed by range start
            };

            mutable std::mutex mtx;
            std::map<std::string, Upload> uploads;
            std::map<std::string, std::vector<char>> archives;

            std::atomic<size_t> initiate_calls{0};
            std::atomic<size_t> upload_part_calls{0};
            std::atomic<size_t> complete_calls{0};
            std::atomic<size_t> abort_calls{0};
        };

    } // namespace Remote
} // namespace GlacierUpload
