// include/upload_config.hpp
#pragma once

#include <string>
#include <cstddef>    // For size_t
#include <cstdint>
#include <chrono>
#include <functional>
#include <optional>
#include <filesystem> // For std::filesystem::path

#include <nlohmann/json.hpp>

namespace GlacierUpload
{
    namespace Config
    {

        using Backoff = std::function<std::chrono::milliseconds(std::chrono::milliseconds)>;

        // Called after every uploaded part: (job_id, uploaded parts, total parts).
        using ProgressCallback = std::function<void(const std::string &, size_t, size_t)>;

        constexpr uint64_t MIB = 1024ull * 1024ull;
        constexpr uint64_t MIN_CHUNK_SIZE = MIB;
        constexpr uint64_t MAX_CHUNK_SIZE = 4096ull * MIB;
        constexpr size_t MAX_CONCURRENT_UPLOADS = 64;
        constexpr size_t MAX_PARALLEL_JOBS = 16;

        // Power of two between 1 MiB and 4 GiB.
        bool isValidChunkSize(uint64_t chunk_size);

        // Doubles the previous delay, capped at max_delay.
        Backoff exponentialBackoff(double multiplier = 2.0,
                                   std::chrono::milliseconds max_delay = std::chrono::seconds(30));

        class UploadConfig
        {
        public:
            // Requested part size for new uploads (16 MiB)
            uint64_t chunk_size = 16 * MIB;

            // Upper bound on parts in flight for one job
            size_t max_concurrent_uploads = 4;

            // Jobs that can upload side by side; the worker pool holds
            // max_concurrent_uploads * max_parallel_jobs threads
            size_t max_parallel_jobs = 2;

            // Unset: no automatic retry, the caller retries by dispatching again.
            // Set: up to max_retries further attempts after a part's first failure.
            std::optional<int> max_retries;
            std::chrono::milliseconds initial_backoff{500};
            Backoff backoff = exponentialBackoff();

            // Cross-check the aggregate hash against the whole source file before completing
            bool verify_source = true;

            std::filesystem::path data_dir = "glacier-data";
            std::filesystem::path journal_file;       // defaults to <data_dir>/journal.jsonl
            std::filesystem::path archive_index_file; // defaults to <data_dir>/archives.tsv
            std::filesystem::path vault_root;         // defaults to <data_dir>/vaults

            // "local_vault" or "memory"
            std::string remote_backend = "local_vault";
            int port = 8080;

            ProgressCallback on_progress;

            std::filesystem::path journalPath() const;
            std::filesystem::path archiveIndexPath() const;
            std::filesystem::path vaultRootPath() const;

            size_t workerThreads() const { return max_concurrent_uploads * max_parallel_jobs; }

            // Throws InvalidChunkSize or std::invalid_argument (concurrency outside
            // 1..MAX_CONCURRENT_UPLOADS, parallel jobs outside 1..MAX_PARALLEL_JOBS,
            // negative retries, port outside 1..65535).
            void validate() const;

            // Create data, vault and journal/index parent directories.
            void ensureDirectories() const;

            // Override fields from GLACIER_UPLOAD_* environment variables.
            void applyEnvironment();

            static UploadConfig fromJson(const nlohmann::json &j);
            static UploadConfig loadFromFile(const std::filesystem::path &path);

        private:
            static std::filesystem::path ensureDirectoryExists(const std::filesystem::path &dir_path);
        };

    } // namespace Config
} // namespace GlacierUpload
