// include/local_vault_store.hpp
#pragma once

#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "remote_store.hpp"

namespace GlacierUpload
{
    namespace Remote
    {

        // A vault kept on a local or mounted filesystem:
        //   <root>/<vault>/uploads/<job_id>/upload.json      upload parameters
        //   <root>/<vault>/uploads/<job_id>/<start>-<end>.part
        //   <root>/<vault>/archives/<archive_id>             assembled archive
        //   <root>/<vault>/archives/<archive_id>.json        archive description
        class LocalVaultStore : public RemoteStore
        {
        public:
            explicit LocalVaultStore(std::filesystem::path root);

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

            // Path of a completed archive, empty when unknown.
            std::filesystem::path archivePath(const std::string &archive_id) const;

        private:
            std::filesystem::path root;
            mutable std::mutex mtx;

            // Locate the upload directory of a job across vaults, empty if none.
            std::filesystem::path findUploadDir(const std::string &job_id) const;
            static nlohmann::json readUploadInfo(const std::filesystem::path &upload_dir);
            static std::filesystem::path partPath(const std::filesystem::path &upload_dir,
                                                  const Chunks::ByteRange &range);
        };

    } // namespace Remote
} // namespace GlacierUpload
