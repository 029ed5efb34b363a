// src/archive_index.cpp
#include "archive_index.hpp"
#include "upload_errors.hpp"

#include <cstdio>
#include <fstream>
#include <iterator>
#include <memory>
#include <sstream>

#include <unistd.h> // For fsync

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace GlacierUpload {
namespace Index {

const std::vector<std::string> TsvArchiveIndex::COLUMNS = {
    "file_path", "description", "archive_id", "timestamp", "job_id"
};

namespace {

struct FileCloser {
    void operator()(std::FILE* f) const {
        if (f) std::fclose(f);
    }
};

std::vector<std::string> splitTabs(const std::string& line) {
    std::vector<std::string> fields;
    size_t start = 0;
    for (;;) {
        size_t tab = line.find('\t', start);
        fields.push_back(line.substr(start, tab == std::string::npos ? std::string::npos : tab - start));
        if (tab == std::string::npos) break;
        start = tab + 1;
    }
    return fields;
}

std::string headerLine() {
    std::string header;
    for (size_t i = 0; i < TsvArchiveIndex::COLUMNS.size(); ++i) {
        if (i > 0) header += '\t';
        header += TsvArchiveIndex::COLUMNS[i];
    }
    return header;
}

} // namespace

TsvArchiveIndex::TsvArchiveIndex(fs::path index_path) : index_path(std::move(index_path)) {
    if (this->index_path.has_parent_path()) {
        fs::create_directories(this->index_path.parent_path());
    }
    dropTornTail();
    if (!fs::exists(this->index_path) || fs::file_size(this->index_path) == 0) {
        std::ofstream ofs(this->index_path, std::ios::trunc);
        if (!ofs.is_open()) {
            throw std::runtime_error("Failed to create archive index: " + this->index_path.string());
        }
        ofs << headerLine() << '\n';
        if (!ofs.good()) {
            throw std::runtime_error("Failed to write archive index header: " + this->index_path.string());
        }
    }
}

void TsvArchiveIndex::dropTornTail() {
    if (!fs::exists(index_path) || fs::file_size(index_path) == 0) return;

    std::ifstream ifs(index_path, std::ios::binary);
    if (!ifs.is_open()) {
        throw std::runtime_error("Failed to open archive index for reading: " + index_path.string());
    }
    std::string contents((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    ifs.close();
    if (contents.back() == '\n') return;

    // A row cut off by a crash was never recorded; the next append would be glued onto it
    size_t keep = contents.find_last_of('\n');
    keep = (keep == std::string::npos) ? 0 : keep + 1;
    spdlog::warn("Archive index {} ends with an incomplete row ({} bytes), truncating it",
                 index_path.string(), contents.size() - keep);
    fs::resize_file(index_path, keep);
}

std::string TsvArchiveIndex::escapeField(const std::string& field) {
    std::string out;
    out.reserve(field.size());
    for (char c : field) {
        switch (c) {
        case '\\': out += "\\\\"; break;
        case '\t': out += "\\t"; break;
        case '\n': out += "\\n"; break;
        case '\r': out += "\\r"; break;
        default: out += c;
        }
    }
    return out;
}

std::string TsvArchiveIndex::unescapeField(const std::string& field) {
    std::string out;
    out.reserve(field.size());
    for (size_t i = 0; i < field.size(); ++i) {
        if (field[i] != '\\' || i + 1 == field.size()) {
            out += field[i];
            continue;
        }
        char next = field[++i];
        switch (next) {
        case 't': out += '\t'; break;
        case 'n': out += '\n'; break;
        case 'r': out += '\r'; break;
        default: out += next;
        }
    }
    return out;
}

std::vector<ArchiveIndexRow> TsvArchiveIndex::readRows() const {
    std::vector<ArchiveIndexRow> out;
    std::ifstream ifs(index_path);
    if (!ifs.is_open()) {
        throw std::runtime_error("Failed to open archive index for reading: " + index_path.string());
    }

    std::string line;
    bool header = true;
    while (std::getline(ifs, line)) {
        if (header) {
            header = false;
            continue;
        }
        if (line.empty()) continue;

        std::vector<std::string> fields = splitTabs(line);
        if (fields.size() != COLUMNS.size()) {
            spdlog::warn("Skipping malformed archive index row in {}: {} columns", index_path.string(), fields.size());
            continue;
        }
        ArchiveIndexRow row;
        row.file_path = unescapeField(fields[0]);
        row.description = unescapeField(fields[1]);
        row.archive_id = unescapeField(fields[2]);
        row.timestamp = unescapeField(fields[3]);
        row.job_id = unescapeField(fields[4]);
        out.push_back(std::move(row));
    }
    return out;
}

void TsvArchiveIndex::record(const ArchiveIndexRow& row) {
    std::lock_guard<std::mutex> lock(mtx);
    for (const auto& existing : readRows()) {
        if (existing.job_id == row.job_id) {
            throw Errors::DuplicateJob("Archive index already has a row for job " + row.job_id);
        }
    }

    std::ostringstream line;
    line << escapeField(row.file_path) << '\t'
         << escapeField(row.description) << '\t'
         << escapeField(row.archive_id) << '\t'
         << escapeField(row.timestamp) << '\t'
         << escapeField(row.job_id) << '\n';
    const std::string text = line.str();

    std::unique_ptr<std::FILE, FileCloser> file(std::fopen(index_path.c_str(), "a"));
    if (!file) {
        throw std::runtime_error("Failed to open archive index for writing: " + index_path.string());
    }
    if (std::fwrite(text.data(), 1, text.size(), file.get()) != text.size() ||
        std::fflush(file.get()) != 0 || ::fsync(::fileno(file.get())) != 0) {
        throw std::runtime_error("Failed to append to archive index: " + index_path.string());
    }
    spdlog::debug("Recorded archive {} for {}", row.archive_id, row.file_path);
}

std::vector<ArchiveIndexRow> TsvArchiveIndex::lookup(const std::string& file_path) const {
    std::lock_guard<std::mutex> lock(mtx);
    std::vector<ArchiveIndexRow> matches;
    for (auto& row : readRows()) {
        if (row.file_path == file_path) {
            matches.push_back(std::move(row));
        }
    }
    return matches;
}

bool TsvArchiveIndex::contains(const std::string& job_id) const {
    std::lock_guard<std::mutex> lock(mtx);
    for (const auto& row : readRows()) {
        if (row.job_id == job_id) return true;
    }
    return false;
}

std::vector<ArchiveIndexRow> TsvArchiveIndex::rows() const {
    std::lock_guard<std::mutex> lock(mtx);
    return readRows();
}

} // namespace Index
} // namespace GlacierUpload
