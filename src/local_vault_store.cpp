// src/local_vault_store.cpp
#include "local_vault_store.hpp"
#include "journal_entry.hpp" // For currentTimestamp
#include "tree_hasher.hpp"
#include "upload_errors.hpp"

#include <fstream>
#include <map>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace GlacierUpload
{
    namespace Remote
    {

        namespace
        {
            const char *UPLOAD_INFO_FILE = "upload.json";

            void writeFile(const fs::path &path, const char *data, size_t size)
            {
                // Write beside the target and rename so readers never see half a file
                fs::path tmp = path;
                tmp += ".tmp";
                std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
                if (!ofs.is_open())
                {
                    throw std::runtime_error("Failed to open file for writing: " + tmp.string());
                }
                ofs.write(data, static_cast<std::streamsize>(size));
                ofs.close();
                if (!ofs.good())
                {
                    throw std::runtime_error("Failed to write all data to file: " + tmp.string());
                }
                fs::rename(tmp, path);
            }

            void writeJson(const fs::path &path, const nlohmann::json &j)
            {
                const std::string text = j.dump(4);
                writeFile(path, text.data(), text.size());
            }
        } // namespace

        LocalVaultStore::LocalVaultStore(fs::path root) : root(std::move(root))
        {
            fs::create_directories(this->root);
        }

        fs::path LocalVaultStore::findUploadDir(const std::string &job_id) const
        {
            if (!fs::exists(root))
            {
                return {};
            }
            for (const auto &vault_dir : fs::directory_iterator(root))
            {
                fs::path candidate = vault_dir.path() / "uploads" / job_id;
                if (fs::exists(candidate / UPLOAD_INFO_FILE))
                {
                    return candidate;
                }
            }
            return {};
        }

        nlohmann::json LocalVaultStore::readUploadInfo(const fs::path &upload_dir)
        {
            std::ifstream ifs(upload_dir / UPLOAD_INFO_FILE);
            if (!ifs.is_open())
            {
                throw std::runtime_error("Failed to open upload description in " + upload_dir.string());
            }
            return nlohmann::json::parse(ifs);
        }

        fs::path LocalVaultStore::partPath(const fs::path &upload_dir, const Chunks::ByteRange &range)
        {
            return upload_dir / (std::to_string(range.start) + "-" + std::to_string(range.end) + ".part");
        }

        std::string LocalVaultStore::initiateUpload(const std::string &vault,
                                                    const std::string &description,
                                                    uint64_t total_size,
                                                    uint64_t chunk_size)
        {
            if (vault.empty() || vault.find('/') != std::string::npos || vault == "." || vault == "..")
            {
                throw Errors::RemoteInitError("Invalid vault name: '" + vault + "'");
            }
            if (chunk_size == 0)
            {
                throw Errors::RemoteInitError("Part size must be positive");
            }

            std::lock_guard<std::mutex> lock(mtx);
            std::string job_id = generateId();
            fs::path upload_dir = root / vault / "uploads" / job_id;
            try
            {
                fs::create_directories(upload_dir);
                fs::create_directories(root / vault / "archives");
                writeJson(upload_dir / UPLOAD_INFO_FILE, nlohmann::json{
                                                             {"vault", vault},
                                                             {"description", description},
                                                             {"total_size", total_size},
                                                             {"chunk_size", chunk_size},
                                                             {"created_at", Journal::currentTimestamp()}});
            }
            catch (const std::exception &e)
            {
                throw Errors::RemoteInitError("Failed to initiate upload in vault " + vault + ": " + e.what());
            }
            spdlog::debug("Vault {} initiated upload {}", vault, job_id);
            return job_id;
        }

        PartAck LocalVaultStore::uploadPart(const std::string &job_id,
                                            const Chunks::ByteRange &range,
                                            const std::vector<char> &bytes,
                                            const std::string &chunk_hash)
        {
            fs::path upload_dir;
            nlohmann::json info;
            {
                std::lock_guard<std::mutex> lock(mtx);
                upload_dir = findUploadDir(job_id);
                if (upload_dir.empty())
                {
                    throw Errors::RemoteRejected("No upload in progress with id " + job_id);
                }
                try
                {
                    info = readUploadInfo(upload_dir);
                }
                catch (const std::exception &e)
                {
                    throw Errors::RemotePartError("Failed to read upload " + job_id + ": " + e.what());
                }
            }

            std::string checksum = validatePart(info.at("total_size").get<uint64_t>(),
                                                info.at("chunk_size").get<uint64_t>(),
                                                range, bytes, chunk_hash);
            try
            {
                writeFile(partPath(upload_dir, range), bytes.data(), bytes.size());
            }
            catch (const std::exception &e)
            {
                throw Errors::RemotePartError("Failed to store part " + std::to_string(range.start) + "-" +
                                              std::to_string(range.end) + ": " + e.what());
            }
            return PartAck{job_id, range, checksum};
        }

        CompletionResult LocalVaultStore::completeUpload(const std::string &job_id,
                                                         uint64_t total_size,
                                                         const std::string &aggregate_hash)
        {
            std::lock_guard<std::mutex> lock(mtx);
            fs::path upload_dir = findUploadDir(job_id);
            if (upload_dir.empty())
            {
                throw Errors::RemoteCompleteError("No upload in progress with id " + job_id);
            }

            try
            {
                nlohmann::json info = readUploadInfo(upload_dir);
                if (info.at("total_size").get<uint64_t>() != total_size)
                {
                    throw Errors::RemoteCompleteError("Archive size " + std::to_string(total_size) +
                                                      " does not match initiated size " +
                                                      std::to_string(info.at("total_size").get<uint64_t>()));
                }

                // Parts ordered by start offset
                std::map<uint64_t, std::pair<uint64_t, fs::path>> parts;
                for (const auto &entry : fs::directory_iterator(upload_dir))
                {
                    if (entry.path().extension() != ".part")
                    {
                        continue;
                    }
                    const std::string stem = entry.path().stem().string();
                    const size_t dash = stem.find('-');
                    uint64_t start = std::stoull(stem.substr(0, dash));
                    uint64_t end = std::stoull(stem.substr(dash + 1));
                    parts[start] = {end, entry.path()};
                }

                uint64_t covered = 0;
                for (const auto &part : parts)
                {
                    if (part.first != covered)
                    {
                        throw Errors::RemoteCompleteError("Missing part at offset " + std::to_string(covered));
                    }
                    covered = part.second.first;
                }
                if (covered != total_size)
                {
                    throw Errors::RemoteCompleteError("Uploaded parts cover " + std::to_string(covered) +
                                                      " of " + std::to_string(total_size) + " bytes");
                }

                fs::path vault_dir = upload_dir.parent_path().parent_path();
                std::string archive_id = generateId(138);
                fs::path archive_path = vault_dir / "archives" / archive_id;
                fs::path tmp_path = archive_path;
                tmp_path += ".tmp";

                {
                    std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
                    if (!out.is_open())
                    {
                        throw std::runtime_error("Failed to create archive file " + tmp_path.string());
                    }
                    for (const auto &part : parts)
                    {
                        std::ifstream in(part.second.second, std::ios::binary);
                        if (!in.is_open())
                        {
                            throw std::runtime_error("Failed to read part " + part.second.second.string());
                        }
                        out << in.rdbuf();
                    }
                    out.close();
                    if (!out.good())
                    {
                        throw std::runtime_error("Failed to write archive file " + tmp_path.string());
                    }
                }

                const std::string tree_hash = Hashing::TreeHasher::toHex(Hashing::TreeHasher::fileTreeHash(tmp_path));
                fs::rename(tmp_path, archive_path);
                writeJson(fs::path(archive_path.string() + ".json"), nlohmann::json{
                                                                         {"archive_id", archive_id},
                                                                         {"description", info.value("description", "")},
                                                                         {"size", total_size},
                                                                         {"tree_hash", tree_hash},
                                                                         {"client_checksum", aggregate_hash},
                                                                         {"created_at", Journal::currentTimestamp()}});
                fs::remove_all(upload_dir);
                spdlog::debug("Vault {} stored archive {}", vault_dir.filename().string(), archive_id);
                return CompletionResult{archive_id, tree_hash};
            }
            catch (const Errors::RemoteCompleteError &)
            {
                throw;
            }
            catch (const std::exception &e)
            {
                throw Errors::RemoteCompleteError("Failed to complete upload " + job_id + ": " + e.what());
            }
        }

        void LocalVaultStore::abortUpload(const std::string &job_id)
        {
            std::lock_guard<std::mutex> lock(mtx);
            fs::path upload_dir = findUploadDir(job_id);
            if (upload_dir.empty())
            {
                return;
            }
            fs::remove_all(upload_dir);
            spdlog::debug("Removed upload directory {}", upload_dir.string());
        }

        fs::path LocalVaultStore::archivePath(const std::string &archive_id) const
        {
            std::lock_guard<std::mutex> lock(mtx);
            if (!fs::exists(root))
            {
                return {};
            }
            for (const auto &vault_dir : fs::directory_iterator(root))
            {
                fs::path candidate = vault_dir.path() / "archives" / archive_id;
                if (fs::exists(candidate))
                {
                    return candidate;
                }
            }
            return {};
        }

    } // namespace Remote
} // namespace GlacierUpload
