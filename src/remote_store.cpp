// src/remote_store.cpp
#include "remote_store.hpp"
#include "tree_hasher.hpp"
#include "upload_errors.hpp"

#include <random>

namespace GlacierUpload
{
    namespace Remote
    {

        std::string generateId(size_t length)
        {
            static const char *k = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";
            static thread_local std::mt19937_64 rng{std::random_device{}()};
            std::uniform_int_distribution<int> pick(0, 63);

            std::string id(length, 'A');
            for (auto &c : id)
            {
                c = k[pick(rng)];
            }
            return id;
        }

        std::string validatePart(uint64_t total_size,
                                 uint64_t chunk_size,
                                 const Chunks::ByteRange &range,
                                 const std::vector<char> &bytes,
                                 const std::string &chunk_hash)
        {
            const std::string where = "bytes " + std::to_string(range.start) + "-" + std::to_string(range.end);
            if (range.end <= range.start || range.end > total_size)
            {
                throw Errors::RemoteRejected("Range " + where + " is outside the archive of " +
                                             std::to_string(total_size) + " bytes");
            }
            if (range.start % chunk_size != 0)
            {
                throw Errors::RemoteRejected("Range " + where + " does not start on a part boundary");
            }
            if (range.size() != chunk_size && range.end != total_size)
            {
                throw Errors::RemoteRejected("Range " + where + " does not match the part size " +
                                             std::to_string(chunk_size));
            }
            if (bytes.size() != range.size())
            {
                throw Errors::RemoteRejected("Body of " + std::to_string(bytes.size()) + " bytes does not match " + where);
            }

            const std::string computed = Hashing::TreeHasher::toHex(Hashing::TreeHasher::chunkHash(bytes));
            if (computed != chunk_hash)
            {
                throw Errors::RemoteRejected("Checksum mismatch for " + where + ": sent " + chunk_hash +
                                             ", computed " + computed);
            }
            return computed;
        }

    } // namespace Remote
} // namespace GlacierUpload
