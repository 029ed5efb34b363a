// include/tree_hasher.hpp
#pragma once

#include <array>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace GlacierUpload
{
    namespace Hashing
    {

        // Raw SHA-256 output.
        using Digest = std::array<unsigned char, 32>;

        // Glacier's tree hash is built over 1 MiB leaves.
        constexpr size_t TREE_HASH_BLOCK_SIZE = 1024 * 1024;

        class TreeHasher
        {
        public:
            static Digest sha256(const char *data, size_t size);
            static Digest sha256(const std::vector<char> &data_buffer);

            // Glacier part checksum: tree hash of the 1 MiB blocks of the chunk.
            // A chunk of at most 1 MiB hashes to its plain SHA-256; the empty
            // chunk hashes to SHA-256("").
            static Digest chunkHash(const std::vector<char> &data_buffer);

            // Pairs adjacent digests and hashes their concatenation, level by level,
            // until one digest remains. An odd digest at the end of a level is carried
            // up unchanged. Order is significant. Throws EmptyInput for an empty list.
            static Digest treeHash(const std::vector<Digest> &digests);

            // Tree hash of a whole file read in 1 MiB blocks.
            static Digest fileTreeHash(const std::filesystem::path &path);

            static std::string toHex(const Digest &digest);

            // Throws std::invalid_argument unless given 64 hex characters.
            static Digest fromHex(const std::string &hex);
        };

    } // namespace Hashing
} // namespace GlacierUpload
