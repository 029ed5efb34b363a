// include/chunk.hpp
#pragma once

#include <vector>
#include <string>
#include <filesystem>
#include <stdexcept>

#include "chunker.hpp"

namespace GlacierUpload {
namespace Chunks {

enum class ChunkStatus {
    Pending,
    Uploaded,
    Failed
};

std::string toString(ChunkStatus status);
ChunkStatus chunkStatusFromString(const std::string& name);

// Progress of one part of an upload job.
struct ChunkRecord {
    std::string job_id;
    size_t index = 0;
    ByteRange range;
    std::string hash;       // Hex tree hash, empty until the part has been read
    ChunkStatus status = ChunkStatus::Pending;
    size_t attempts = 0;    // Failed attempts seen so far
    std::string last_error;
};

class Chunk {
public:
    size_t index = 0;
    ByteRange range;
    std::vector<char> data; // The bytes of the range
    std::string hash;       // Glacier tree hash of data (hex)

    // Read the range from the source and hash it. Each call opens its own
    // read-only handle, so workers never share a file cursor.
    static Chunk read(const std::filesystem::path& source, size_t index, const ByteRange& range);

    // Raw bytes of a range of a file.
    static std::vector<char> loadData(const std::filesystem::path& source, const ByteRange& range);
};

} // namespace Chunks
} // namespace GlacierUpload
