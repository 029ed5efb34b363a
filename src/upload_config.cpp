// src/upload_config.cpp
#include "upload_config.hpp"
#include "upload_errors.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <stdexcept> // For std::runtime_error
#include <type_traits>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace GlacierUpload
{
    namespace Config
    {

        namespace
        {
            std::optional<std::string> getEnv(const char *key)
            {
                if (const char *v = std::getenv(key))
                {
                    return std::string(v);
                }
                return std::nullopt;
            }

            template <typename T>
            T parseNumber(const std::string &key, const std::string &value)
            {
                try
                {
                    size_t used = 0;
                    long long parsed = std::stoll(value, &used);
                    if (used != value.size())
                    {
                        throw std::invalid_argument("trailing characters");
                    }
                    if (std::is_unsigned<T>::value && parsed < 0)
                    {
                        throw std::out_of_range("negative");
                    }
                    if (std::is_signed<T>::value &&
                        (parsed < static_cast<long long>(std::numeric_limits<T>::min()) ||
                         parsed > static_cast<long long>(std::numeric_limits<T>::max())))
                    {
                        throw std::out_of_range("out of range");
                    }
                    return static_cast<T>(parsed);
                }
                catch (const std::exception &)
                {
                    throw std::runtime_error("Invalid value for " + key + ": '" + value + "'");
                }
            }

            // nlohmann converts a negative integer to an unsigned type by wrapping
            template <typename T>
            T readUnsigned(const nlohmann::json &j, const std::string &key)
            {
                const nlohmann::json &value = j.at(key);
                if (!value.is_number_unsigned())
                {
                    throw std::invalid_argument(key + " must be a non-negative integer, got " + value.dump());
                }
                const uint64_t parsed = value.get<uint64_t>();
                if (parsed > std::numeric_limits<T>::max())
                {
                    throw std::invalid_argument(key + " is out of range: " + value.dump());
                }
                return static_cast<T>(parsed);
            }
        } // namespace

        bool isValidChunkSize(uint64_t chunk_size)
        {
            if (chunk_size < MIN_CHUNK_SIZE || chunk_size > MAX_CHUNK_SIZE)
            {
                return false;
            }
            return (chunk_size & (chunk_size - 1)) == 0;
        }

        Backoff exponentialBackoff(double multiplier, std::chrono::milliseconds max_delay)
        {
            return [multiplier, max_delay](std::chrono::milliseconds previous)
            {
                auto next = std::chrono::milliseconds(
                    static_cast<std::chrono::milliseconds::rep>(previous.count() * multiplier));
                return std::min(next, max_delay);
            };
        }

        fs::path UploadConfig::journalPath() const
        {
            return journal_file.empty() ? data_dir / "journal.jsonl" : journal_file;
        }

        fs::path UploadConfig::archiveIndexPath() const
        {
            return archive_index_file.empty() ? data_dir / "archives.tsv" : archive_index_file;
        }

        fs::path UploadConfig::vaultRootPath() const
        {
            return vault_root.empty() ? data_dir / "vaults" : vault_root;
        }

        void UploadConfig::validate() const
        {
            if (!isValidChunkSize(chunk_size))
            {
                throw Errors::InvalidChunkSize("Chunk size must be a power of two between 1 MiB and 4 GiB, got " +
                                               std::to_string(chunk_size));
            }
            if (max_concurrent_uploads == 0 || max_concurrent_uploads > MAX_CONCURRENT_UPLOADS)
            {
                throw std::invalid_argument("max_concurrent_uploads must be between 1 and " +
                                            std::to_string(MAX_CONCURRENT_UPLOADS) + ", got " +
                                            std::to_string(max_concurrent_uploads));
            }
            if (max_retries && *max_retries < 0)
            {
                throw std::invalid_argument("max_retries cannot be negative");
            }
            if (max_parallel_jobs == 0 || max_parallel_jobs > MAX_PARALLEL_JOBS)
            {
                throw std::invalid_argument("max_parallel_jobs must be between 1 and " +
                                            std::to_string(MAX_PARALLEL_JOBS) + ", got " +
                                            std::to_string(max_parallel_jobs));
            }
            if (port < 1 || port > 65535)
            {
                throw std::invalid_argument("port must be between 1 and 65535, got " + std::to_string(port));
            }
            if (remote_backend != "local_vault" && remote_backend != "memory")
            {
                throw std::invalid_argument("Unknown remote backend: " + remote_backend);
            }
        }

        fs::path UploadConfig::ensureDirectoryExists(const fs::path &dir_path)
        {
            if (dir_path.empty())
            {
                return dir_path;
            }
            try
            {
                if (!fs::exists(dir_path))
                {
                    if (fs::create_directories(dir_path))
                    {
                        spdlog::info("Created directory: {}", dir_path.string());
                    }
                    else if (!fs::exists(dir_path))
                    {
                        throw std::runtime_error("Failed to create directory: " + dir_path.string());
                    }
                }
            }
            catch (const fs::filesystem_error &e)
            {
                throw std::runtime_error("Filesystem error creating directory " + dir_path.string() + ": " + e.what());
            }
            return dir_path;
        }

        void UploadConfig::ensureDirectories() const
        {
            ensureDirectoryExists(data_dir);
            ensureDirectoryExists(vaultRootPath());
            ensureDirectoryExists(journalPath().parent_path());
            ensureDirectoryExists(archiveIndexPath().parent_path());
        }

        void UploadConfig::applyEnvironment()
        {
            if (auto v = getEnv("GLACIER_UPLOAD_DATA_DIR"))
                data_dir = *v;
            if (auto v = getEnv("GLACIER_UPLOAD_CHUNK_SIZE"))
                chunk_size = parseNumber<uint64_t>("GLACIER_UPLOAD_CHUNK_SIZE", *v);
            if (auto v = getEnv("GLACIER_UPLOAD_MAX_CONCURRENT"))
                max_concurrent_uploads = parseNumber<size_t>("GLACIER_UPLOAD_MAX_CONCURRENT", *v);
            if (auto v = getEnv("GLACIER_UPLOAD_MAX_PARALLEL_JOBS"))
                max_parallel_jobs = parseNumber<size_t>("GLACIER_UPLOAD_MAX_PARALLEL_JOBS", *v);
            if (auto v = getEnv("GLACIER_UPLOAD_MAX_RETRIES"))
                max_retries = parseNumber<int>("GLACIER_UPLOAD_MAX_RETRIES", *v);
            if (auto v = getEnv("GLACIER_UPLOAD_PORT"))
                port = parseNumber<int>("GLACIER_UPLOAD_PORT", *v);
            if (auto v = getEnv("GLACIER_UPLOAD_REMOTE"))
                remote_backend = *v;
        }

        UploadConfig UploadConfig::fromJson(const nlohmann::json &j)
        {
            UploadConfig config;
            if (j.contains("chunk_size"))
                config.chunk_size = readUnsigned<uint64_t>(j, "chunk_size");
            if (j.contains("max_concurrent_uploads"))
                config.max_concurrent_uploads = readUnsigned<size_t>(j, "max_concurrent_uploads");
            if (j.contains("max_parallel_jobs"))
                config.max_parallel_jobs = readUnsigned<size_t>(j, "max_parallel_jobs");
            if (j.contains("max_retries") && !j.at("max_retries").is_null())
                config.max_retries = j.at("max_retries").get<int>();
            if (j.contains("initial_backoff_ms"))
                config.initial_backoff = std::chrono::milliseconds(j.at("initial_backoff_ms").get<int64_t>());
            if (j.contains("backoff_multiplier") || j.contains("max_backoff_ms"))
            {
                double multiplier = j.value("backoff_multiplier", 2.0);
                auto max_delay = std::chrono::milliseconds(j.value("max_backoff_ms", int64_t{30000}));
                config.backoff = exponentialBackoff(multiplier, max_delay);
            }
            if (j.contains("verify_source"))
                j.at("verify_source").get_to(config.verify_source);
            if (j.contains("data_dir"))
                config.data_dir = j.at("data_dir").get<std::string>();
            if (j.contains("journal_file"))
                config.journal_file = j.at("journal_file").get<std::string>();
            if (j.contains("archive_index_file"))
                config.archive_index_file = j.at("archive_index_file").get<std::string>();
            if (j.contains("vault_root"))
                config.vault_root = j.at("vault_root").get<std::string>();
            if (j.contains("remote_backend"))
                j.at("remote_backend").get_to(config.remote_backend);
            if (j.contains("port"))
                j.at("port").get_to(config.port);
            return config;
        }

        UploadConfig UploadConfig::loadFromFile(const fs::path &path)
        {
            if (!fs::exists(path))
            {
                throw std::runtime_error("Config file not found: " + path.string());
            }

            std::ifstream ifs(path);
            if (!ifs.is_open())
            {
                throw std::runtime_error("Failed to open config file for reading: " + path.string());
            }

            nlohmann::json j;
            try
            {
                ifs >> j;
                return fromJson(j);
            }
            catch (const nlohmann::json::exception &e)
            {
                throw std::runtime_error("Error parsing config file " + path.string() + ": " + e.what());
            }
        }

    } // namespace Config
} // namespace GlacierUpload
