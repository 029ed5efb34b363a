// src/tree_hasher.cpp
#include "tree_hasher.hpp"
#include "upload_errors.hpp"

#include <algorithm>
#include <fstream>
#include <iomanip>   // For std::hex, std::setw, std::setfill
#include <sstream>   // For std::stringstream
#include <stdexcept> // For std::runtime_error

// Link against OpenSSL::Crypto
#include <openssl/sha.h>

static_assert(SHA256_DIGEST_LENGTH == 32, "Digest is sized for SHA-256");

namespace GlacierUpload
{
    namespace Hashing
    {

        Digest TreeHasher::sha256(const char *data, size_t size)
        {
            Digest hash;
            SHA256_CTX sha256;

            if (!SHA256_Init(&sha256))
            {
                throw std::runtime_error("Failed to initialize SHA256 context.");
            }
            if (size > 0 && !SHA256_Update(&sha256, data, size))
            {
                throw std::runtime_error("Failed to update SHA256 context with data.");
            }
            if (!SHA256_Final(hash.data(), &sha256))
            {
                throw std::runtime_error("Failed to finalize SHA256 hash calculation.");
            }
            return hash;
        }

        Digest TreeHasher::sha256(const std::vector<char> &data_buffer)
        {
            return sha256(data_buffer.data(), data_buffer.size());
        }

        Digest TreeHasher::chunkHash(const std::vector<char> &data_buffer)
        {
            if (data_buffer.size() <= TREE_HASH_BLOCK_SIZE)
            {
                return sha256(data_buffer);
            }

            std::vector<Digest> leaves;
            leaves.reserve((data_buffer.size() + TREE_HASH_BLOCK_SIZE - 1) / TREE_HASH_BLOCK_SIZE);
            for (size_t offset = 0; offset < data_buffer.size(); offset += TREE_HASH_BLOCK_SIZE)
            {
                size_t length = std::min(TREE_HASH_BLOCK_SIZE, data_buffer.size() - offset);
                leaves.push_back(sha256(data_buffer.data() + offset, length));
            }
            return treeHash(leaves);
        }

        Digest TreeHasher::treeHash(const std::vector<Digest> &digests)
        {
            if (digests.empty())
            {
                throw Errors::EmptyInput("Tree hash needs at least one digest");
            }

            std::vector<Digest> level = digests;
            std::array<char, 64> joined;
            while (level.size() > 1)
            {
                std::vector<Digest> next;
                next.reserve((level.size() + 1) / 2);
                for (size_t i = 0; i + 1 < level.size(); i += 2)
                {
                    std::copy(level[i].begin(), level[i].end(), joined.begin());
                    std::copy(level[i + 1].begin(), level[i + 1].end(), joined.begin() + 32);
                    next.push_back(sha256(joined.data(), joined.size()));
                }
                if (level.size() % 2 == 1)
                {
                    next.push_back(level.back());
                }
                level.swap(next);
            }
            return level.front();
        }

        Digest TreeHasher::fileTreeHash(const std::filesystem::path &path)
        {
            std::ifstream ifs(path, std::ios::binary);
            if (!ifs.is_open())
            {
                throw std::runtime_error("Failed to open file for hashing: " + path.string());
            }

            std::vector<Digest> leaves;
            std::vector<char> buffer(TREE_HASH_BLOCK_SIZE);
            while (ifs.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) || ifs.gcount() > 0)
            {
                leaves.push_back(sha256(buffer.data(), static_cast<size_t>(ifs.gcount())));
            }
            if (ifs.bad())
            {
                throw std::runtime_error("Read error while hashing " + path.string());
            }

            if (leaves.empty())
            {
                return sha256(nullptr, 0);
            }
            return treeHash(leaves);
        }

        std::string TreeHasher::toHex(const Digest &digest)
        {
            std::stringstream ss;
            for (unsigned char byte : digest)
            {
                ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
            }
            return ss.str();
        }

        Digest TreeHasher::fromHex(const std::string &hex)
        {
            if (hex.size() != 64)
            {
                throw std::invalid_argument("Expected 64 hex characters, got " + std::to_string(hex.size()));
            }

            auto nibble = [&hex](char c) -> unsigned char
            {
                if (c >= '0' && c <= '9')
                    return static_cast<unsigned char>(c - '0');
                if (c >= 'a' && c <= 'f')
                    return static_cast<unsigned char>(c - 'a' + 10);
                if (c >= 'A' && c <= 'F')
                    return static_cast<unsigned char>(c - 'A' + 10);
                throw std::invalid_argument("Invalid hex digest: " + hex);
            };

            Digest digest;
            for (size_t i = 0; i < digest.size(); ++i)
            {
                digest[i] = static_cast<unsigned char>((nibble(hex[2 * i]) << 4) | nibble(hex[2 * i + 1]));
            }
            return digest;
        }

    } // namespace Hashing
} // namespace GlacierUpload
