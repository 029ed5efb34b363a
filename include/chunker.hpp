// include/chunker.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <utility>
#include <vector>

namespace GlacierUpload
{
    namespace Chunks
    {

        // Half-open byte range [start, end) of the source file.
        struct ByteRange
        {
            uint64_t start = 0;
            uint64_t end = 0;

            uint64_t size() const { return end - start; }

            bool operator==(const ByteRange &other) const
            {
                return start == other.start && end == other.end;
            }
            bool operator!=(const ByteRange &other) const { return !(*this == other); }
        };

        using PlannedChunk = std::pair<size_t, ByteRange>;

        // Splits [0, total_size) into chunk_size ranges; only the last range may be shorter.
        // Iteration computes ranges on the fly and can be restarted with begin().
        class Chunker
        {
        public:
            class Iterator
            {
            public:
                using iterator_category = std::forward_iterator_tag;
                using value_type = PlannedChunk;
                using difference_type = std::ptrdiff_t;
                using pointer = const PlannedChunk *;
                using reference = const PlannedChunk &;

                Iterator() = default;
                Iterator(const Chunker *owner, size_t index);

                reference operator*() const { return current; }
                pointer operator->() const { return &current; }
                Iterator &operator++();
                Iterator operator++(int);

                bool operator==(const Iterator &other) const { return index == other.index; }
                bool operator!=(const Iterator &other) const { return index != other.index; }

            private:
                const Chunker *owner = nullptr;
                size_t index = 0;
                PlannedChunk current;

                void load();
            };

            // Throws InvalidChunkSize when chunk_size is 0, or larger than a non-empty file.
            Chunker(uint64_t total_size, uint64_t chunk_size);

            Iterator begin() const { return Iterator(this, 0); }
            Iterator end() const { return Iterator(this, chunk_count); }

            size_t count() const { return chunk_count; }
            uint64_t totalSize() const { return total_size; }
            uint64_t chunkSize() const { return chunk_size; }

            ByteRange rangeAt(size_t index) const;

            // Materialise the whole plan.
            std::vector<PlannedChunk> plan() const;

        private:
            uint64_t total_size;
            uint64_t chunk_size;
            size_t chunk_count;
        };

    } // namespace Chunks
} // namespace GlacierUpload
