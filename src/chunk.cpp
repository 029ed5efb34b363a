// src/chunk.cpp
#include "chunk.hpp"
#include "tree_hasher.hpp"

#include <fstream>

namespace fs = std::filesystem;

namespace GlacierUpload
{
    namespace Chunks
    {

        std::string toString(ChunkStatus status)
        {
            switch (status)
            {
            case ChunkStatus::Pending:
                return "pending";
            case ChunkStatus::Uploaded:
                return "uploaded";
            case ChunkStatus::Failed:
                return "failed";
            }
            return "unknown";
        }

        ChunkStatus chunkStatusFromString(const std::string &name)
        {
            if (name == "pending")
                return ChunkStatus::Pending;
            if (name == "uploaded")
                return ChunkStatus::Uploaded;
            if (name == "failed")
                return ChunkStatus::Failed;
            throw std::invalid_argument("Unknown chunk status: " + name);
        }

        std::vector<char> Chunk::loadData(const fs::path &source, const ByteRange &range)
        {
            std::ifstream ifs(source, std::ios::binary);
            if (!ifs.is_open())
            {
                throw std::runtime_error("Failed to open source file for reading: " + source.string());
            }

            std::vector<char> buffer(static_cast<size_t>(range.size()));
            ifs.seekg(static_cast<std::streamoff>(range.start));
            if (!ifs.good())
            {
                throw std::runtime_error("Failed to seek to offset " + std::to_string(range.start) +
                                         " in " + source.string());
            }
            if (!ifs.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) ||
                static_cast<uint64_t>(ifs.gcount()) != range.size())
            {
                throw std::runtime_error("Short read of bytes " + std::to_string(range.start) + "-" +
                                         std::to_string(range.end) + " from " + source.string());
            }
            return buffer;
        }

        Chunk Chunk::read(const fs::path &source, size_t index, const ByteRange &range)
        {
            Chunk chunk;
            chunk.index = index;
            chunk.range = range;
            chunk.data = loadData(source, range);
            chunk.hash = Hashing::TreeHasher::toHex(Hashing::TreeHasher::chunkHash(chunk.data));
            return chunk;
        }

    } // namespace Chunks
} // namespace GlacierUpload
