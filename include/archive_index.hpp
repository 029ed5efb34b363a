// include/archive_index.hpp
#pragma once

#include <string>
#include <vector>
#include <mutex>
#include <filesystem>

namespace GlacierUpload {
namespace Index {

// One completed upload. Column order in persisted form is fixed:
// file_path, description, archive_id, timestamp, job_id
class ArchiveIndexRow {
public:
    std::string file_path;
    std::string description;
    std::string archive_id;
    std::string timestamp; // ISO 8601 completion time
    std::string job_id;

    bool operator==(const ArchiveIndexRow& other) const {
        return file_path == other.file_path && description == other.description &&
               archive_id == other.archive_id && timestamp == other.timestamp && job_id == other.job_id;
    }
};

// Append-only record of completed uploads. Rows are never updated or removed.
class ArchiveIndex {
public:
    virtual ~ArchiveIndex() = default;

    // Throws DuplicateJob if the job already has a row.
    virtual void record(const ArchiveIndexRow& row) = 0;

    // Rows for a file, oldest first.
    virtual std::vector<ArchiveIndexRow> lookup(const std::string& file_path) const = 0;

    virtual bool contains(const std::string& job_id) const = 0;

    virtual std::vector<ArchiveIndexRow> rows() const = 0;
};

// Tab-separated file with a header line. Tabs, newlines and backslashes inside
// fields are written as \t, \n and \\.
class TsvArchiveIndex : public ArchiveIndex {
public:
    static const std::vector<std::string> COLUMNS;

    explicit TsvArchiveIndex(std::filesystem::path index_path);

    void record(const ArchiveIndexRow& row) override;
    std::vector<ArchiveIndexRow> lookup(const std::string& file_path) const override;
    bool contains(const std::string& job_id) const override;
    std::vector<ArchiveIndexRow> rows() const override;

    const std::filesystem::path& path() const { return index_path; }

    static std::string escapeField(const std::string& field);
    static std::string unescapeField(const std::string& field);

private:
    std::filesystem::path index_path;
    mutable std::mutex mtx;

    std::vector<ArchiveIndexRow> readRows() const;

    // Truncate a final row left without its newline.
    void dropTornTail();
};

} // namespace Index
} // namespace GlacierUpload
