// src/memory_remote_store.cpp
#include "memory_remote_store.hpp"
#include "tree_hasher.hpp"
#include "upload_errors.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace GlacierUpload
{
    namespace Remote
    {

        std::string MemoryRemoteStore::initiateUpload(const std::string &vault,
                                                      const std::string &description,
                                                      uint64_t total_size,
                                                      uint64_t chunk_size)
        {
            ++initiate_calls;
            if (vault.empty())
            {
                throw Errors::RemoteInitError("Vault name is required");
            }
            if (chunk_size == 0)
            {
                throw Errors::RemoteInitError("Part size must be positive");
            }

            Upload upload;
            upload.vault = vault;
            upload.description = description;
            upload.total_size = total_size;
            upload.chunk_size = chunk_size;

            std::string job_id = generateId();
            std::lock_guard<std::mutex> lock(mtx);
            uploads.emplace(job_id, std::move(upload));
            return job_id;
        }

        PartAck MemoryRemoteStore::uploadPart(const std::string &job_id,
                                              const Chunks::ByteRange &range,
                                              const std::vector<char> &bytes,
                                              const std::string &chunk_hash)
        {
            ++upload_part_calls;
            uint64_t total_size = 0;
            uint64_t chunk_size = 0;
            {
                std::lock_guard<std::mutex> lock(mtx);
                auto it = uploads.find(job_id);
                if (it == uploads.end())
                {
                    throw Errors::RemoteRejected("No upload in progress with id " + job_id);
                }
                total_size = it->second.total_size;
                chunk_size = it->second.chunk_size;
            }

            std::string checksum = validatePart(total_size, chunk_size, range, bytes, chunk_hash);

            std::lock_guard<std::mutex> lock(mtx);
            auto it = uploads.find(job_id);
            if (it == uploads.end())
            {
                throw Errors::RemoteRejected("Upload " + job_id + " was aborted");
            }
            it->second.parts[range.start] = bytes;
            return PartAck{job_id, range, checksum};
        }

        CompletionResult MemoryRemoteStore::completeUpload(const std::string &job_id,
                                                           uint64_t total_size,
                                                           const std::string &aggregate_hash)
        {
            ++complete_calls;
            std::lock_guard<std::mutex> lock(mtx);
            auto it = uploads.find(job_id);
            if (it == uploads.end())
            {
                throw Errors::RemoteCompleteError("No upload in progress with id " + job_id);
            }
            if (total_size != it->second.total_size)
            {
                throw Errors::RemoteCompleteError("Archive size " + std::to_string(total_size) +
                                                  " does not match initiated size " +
                                                  std::to_string(it->second.total_size));
            }

            std::vector<char> assembled;
            assembled.reserve(static_cast<size_t>(total_size));
            for (const auto &part : it->second.parts)
            {
                if (part.first != assembled.size())
                {
                    throw Errors::RemoteCompleteError("Missing part at offset " + std::to_string(assembled.size()));
                }
                assembled.insert(assembled.end(), part.second.begin(), part.second.end());
            }
            if (assembled.size() != total_size)
            {
                throw Errors::RemoteCompleteError("Uploaded parts cover " + std::to_string(assembled.size()) +
                                                  " of " + std::to_string(total_size) + " bytes");
            }

            std::vector<Hashing::Digest> leaves;
            for (size_t offset = 0; offset < assembled.size(); offset += Hashing::TREE_HASH_BLOCK_SIZE)
            {
                size_t length = std::min(Hashing::TREE_HASH_BLOCK_SIZE, assembled.size() - offset);
                leaves.push_back(Hashing::TreeHasher::sha256(assembled.data() + offset, length));
            }
            const std::string tree_hash = leaves.empty()
                                              ? Hashing::TreeHasher::toHex(Hashing::TreeHasher::sha256(nullptr, 0))
                                              : Hashing::TreeHasher::toHex(Hashing::TreeHasher::treeHash(leaves));
            if (tree_hash != aggregate_hash)
            {
                spdlog::warn("Upload {} completed with checksum {} but the archive hashes to {}",
                             job_id, aggregate_hash, tree_hash);
            }

            std::string archive_id = generateId(138);
            archives.emplace(archive_id, std::move(assembled));
            uploads.erase(it);
            return CompletionResult{archive_id, tree_hash};
        }

        void MemoryRemoteStore::abortUpload(const std::string &job_id)
        {
            ++abort_calls;
            std::lock_guard<std::mutex> lock(mtx);
            uploads.erase(job_id);
        }

        std::vector<char> MemoryRemoteStore::archive(const std::string &archive_id) const
        {
            std::lock_guard<std::mutex> lock(mtx);
            return archives.at(archive_id);
        }

        bool MemoryRemoteStore::hasUpload(const std::string &job_id) const
        {
            std::lock_guard<std::mutex> lock(mtx);
            return uploads.count(job_id) > 0;
        }

        size_t MemoryRemoteStore::partCount(const std::string &job_id) const
        {
            std::lock_guard<std::mutex> lock(mtx);
            auto it = uploads.find(job_id);
            return it == uploads.end() ? 0 : it->second.parts.size();
        }

    } // namespace Remote
} // namespace GlacierUpload
