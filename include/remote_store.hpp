// include/remote_store.hpp
#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "chunker.hpp"

namespace GlacierUpload
{
    namespace Remote
    {

        struct PartAck
        {
            std::string job_id;
            Chunks::ByteRange range;
            std::string checksum; // Tree hash the store computed for the part
        };

        struct CompletionResult
        {
            std::string archive_id;
            std::string tree_hash; // Tree hash the store computed for the whole archive
        };

        // Random opaque identifier, e.g. for upload and archive ids.
        std::string generateId(size_t length = 48);

        // Store-side checks on an incoming part: the range starts on a part boundary,
        // has the negotiated size (only the final part may be shorter), matches the
        // byte count, and the checksum matches the bytes. Throws RemoteRejected;
        // returns the checksum the store computed.
        std::string validatePart(uint64_t total_size,
                                 uint64_t chunk_size,
                                 const Chunks::ByteRange &range,
                                 const std::vector<char> &bytes,
                                 const std::string &chunk_hash);

        // The archival store as seen by the coordinator. Implementations report
        // failures with the Errors::Remote* exceptions named on each call.
        class RemoteStore
        {
        public:
            virtual ~RemoteStore() = default;

            // Throws RemoteInitError.
            virtual std::string initiateUpload(const std::string &vault,
                                               const std::string &description,
                                               uint64_t total_size,
                                               uint64_t chunk_size) = 0;

            // Throws RemotePartError (transient) or RemoteRejected (bad range or checksum).
            virtual PartAck uploadPart(const std::string &job_id,
                                       const Chunks::ByteRange &range,
                                       const std::vector<char> &bytes,
                                       const std::string &chunk_hash) = 0;

            // Throws RemoteCompleteError.
            virtual CompletionResult completeUpload(const std::string &job_id,
                                                    uint64_t total_size,
                                                    const std::string &aggregate_hash) = 0;

            // Best-effort; callers log failures and carry on.
            virtual void abortUpload(const std::string &job_id) = 0;
        };

    } // namespace Remote
} // namespace GlacierUpload
