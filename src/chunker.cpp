// src/chunker.cpp
#include "chunker.hpp"
#include "upload_errors.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace GlacierUpload
{
    namespace Chunks
    {

        Chunker::Chunker(uint64_t total_size, uint64_t chunk_size)
            : total_size(total_size), chunk_size(chunk_size), chunk_count(0)
        {
            if (chunk_size == 0)
            {
                throw Errors::InvalidChunkSize("Chunk size must be positive");
            }
            if (total_size > 0 && chunk_size > total_size)
            {
                throw Errors::InvalidChunkSize("Chunk size " + std::to_string(chunk_size) +
                                               " exceeds file size " + std::to_string(total_size));
            }
            chunk_count = static_cast<size_t>((total_size + chunk_size - 1) / chunk_size);
        }

        ByteRange Chunker::rangeAt(size_t index) const
        {
            if (index >= chunk_count)
            {
                throw std::out_of_range("Chunk index " + std::to_string(index) + " out of range (" +
                                        std::to_string(chunk_count) + " chunks)");
            }
            uint64_t start = static_cast<uint64_t>(index) * chunk_size;
            return ByteRange{start, std::min(start + chunk_size, total_size)};
        }

        std::vector<PlannedChunk> Chunker::plan() const
        {
            std::vector<PlannedChunk> out;
            out.reserve(chunk_count);
            std::copy(begin(), end(), std::back_inserter(out));
            return out;
        }

        Chunker::Iterator::Iterator(const Chunker *owner, size_t index)
            : owner(owner), index(index)
        {
            load();
        }

        void Chunker::Iterator::load()
        {
            if (owner && index < owner->count())
            {
                current = PlannedChunk(index, owner->rangeAt(index));
            }
        }

        Chunker::Iterator &Chunker::Iterator::operator++()
        {
            ++index;
            load();
            return *this;
        }

        Chunker::Iterator Chunker::Iterator::operator++(int)
        {
            Iterator previous = *this;
            ++(*this);
            return previous;
        }

    } // namespace Chunks
} // namespace GlacierUpload
