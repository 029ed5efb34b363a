// main.cpp
#include <iostream>
#include <vector>
#include <string>
#include <filesystem>
#include <memory> // For std::make_shared

// Crow includes
#include <crow.h>

#include <spdlog/spdlog.h>

// Our project includes
#include "upload_coordinator.hpp"
#include "upload_config.hpp"
#include "local_vault_store.hpp"
#include "memory_remote_store.hpp"

namespace fs = std::filesystem;
using namespace GlacierUpload;

namespace {

crow::json::wvalue jobToJson(const Job& job) {
    crow::json::wvalue out;
    out["job_id"] = job.job_id;
    out["file_path"] = job.file_path;
    out["total_size"] = job.total_size;
    out["chunk_size"] = job.chunk_size;
    out["vault"] = job.vault;
    out["description"] = job.description;
    out["status"] = toString(job.status);
    if (!job.archive_id.empty()) {
        out["archive_id"] = job.archive_id;
        out["tree_hash"] = job.tree_hash;
    }
    return out;
}

crow::json::wvalue rowToJson(const Index::ArchiveIndexRow& row) {
    crow::json::wvalue out;
    out["file_path"] = row.file_path;
    out["description"] = row.description;
    out["archive_id"] = row.archive_id;
    out["timestamp"] = row.timestamp;
    out["job_id"] = row.job_id;
    return out;
}

// Map the upload error taxonomy onto HTTP status codes.
crow::response errorResponse(const std::exception& e) {
    int code = 500;
    if (dynamic_cast<const Errors::JobNotFound*>(&e)) {
        code = 404;
    } else if (dynamic_cast<const Errors::DuplicateJob*>(&e) ||
               dynamic_cast<const Errors::AlreadyUploaded*>(&e) ||
               dynamic_cast<const Errors::InvalidTransition*>(&e) ||
               dynamic_cast<const Errors::IncompleteUpload*>(&e) ||
               dynamic_cast<const Errors::UploadCancelled*>(&e)) {
        code = 409;
    } else if (dynamic_cast<const Errors::InvalidChunkSize*>(&e) ||
               dynamic_cast<const Errors::EmptyInput*>(&e) ||
               dynamic_cast<const Errors::ChunkSizeMismatch*>(&e)) {
        code = 400;
    } else if (dynamic_cast<const Errors::RemoteError*>(&e)) {
        code = 502;
    }

    if (code >= 500) {
        spdlog::error("Request failed: {}", e.what());
    }
    crow::json::wvalue body;
    body["error"] = e.what();
    return crow::response(code, body);
}

void printUsage(const char* argv0) {
    std::cout << "Usage:\n"
              << "  " << argv0 << " [--config <file.json>] [--verbose]\n"
              << "Environment: GLACIER_UPLOAD_DATA_DIR, GLACIER_UPLOAD_CHUNK_SIZE, GLACIER_UPLOAD_MAX_CONCURRENT,\n"
              << "             GLACIER_UPLOAD_MAX_RETRIES, GLACIER_UPLOAD_PORT, GLACIER_UPLOAD_REMOTE\n";
}

} // namespace

int main(int argc, char** argv) {
    fs::path config_path;
    bool verbose = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--verbose") {
            verbose = true;
        } else {
            printUsage(argv[0]);
            return 1;
        }
    }
    spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);

    Config::UploadConfig config;
    try {
        if (!config_path.empty()) {
            config = Config::UploadConfig::loadFromFile(config_path);
        }
        config.applyEnvironment();
        config.validate();
        config.ensureDirectories();
    } catch (const std::exception& e) {
        std::cerr << "Fatal: " << e.what() << std::endl;
        return 2;
    }

    std::unique_ptr<Remote::RemoteStore> remote;
    std::unique_ptr<Journal::UploadJournal> journal_ptr;
    std::unique_ptr<Index::TsvArchiveIndex> index_ptr;
    std::shared_ptr<UploadCoordinator> coordinator;
    try {
        if (config.remote_backend == "memory") {
            spdlog::warn("Using the in-memory remote store; archives will not outlive this process");
            remote = std::make_unique<Remote::MemoryRemoteStore>();
        } else {
            remote = std::make_unique<Remote::LocalVaultStore>(config.vaultRootPath());
        }
        journal_ptr = std::make_unique<Journal::UploadJournal>(config.journalPath());
        index_ptr = std::make_unique<Index::TsvArchiveIndex>(config.archiveIndexPath());
        coordinator = std::make_shared<UploadCoordinator>(config, *remote, *journal_ptr, *index_ptr);
    } catch (const std::exception& e) {
        std::cerr << "Fatal: " << e.what() << std::endl;
        return 2;
    }
    Journal::UploadJournal& journal = *journal_ptr;
    Index::TsvArchiveIndex& archive_index = *index_ptr;

    try {
        if (size_t added = coordinator->reconcileIndex()) {
            spdlog::warn("Recovered {} archive index rows from the journal", added);
        }
    } catch (const std::exception& e) {
        spdlog::error("Archive index reconciliation failed: {}", e.what());
    }
    for (const auto& job_id : journal.findResumable()) {
        spdlog::info("Upload {} was interrupted; POST /uploads/{}/resume to continue", job_id, job_id);
    }

    crow::SimpleApp app;

    CROW_ROUTE(app, "/health")
    ([]() {
        return crow::response(200, "ok");
    });

    // --- POST /uploads: archive a file ---
    // JSON body: {"file_path": ..., "vault": ..., "description": ..., "chunk_size": ...}
    CROW_ROUTE(app, "/uploads").methods("POST"_method)
    ([coordinator](const crow::request& req) {
        auto body = crow::json::load(req.body);
        if (!body || !body.has("file_path") || !body.has("vault")) {
            return crow::response(400, "Bad Request: expected JSON with file_path and vault.");
        }

        const std::string file_path = body["file_path"].s();
        const std::string vault = body["vault"].s();
        const std::string description = body.has("description") ? std::string(body["description"].s()) : "";
        const uint64_t chunk_size = body.has("chunk_size") ? static_cast<uint64_t>(body["chunk_size"].i())
                                                           : coordinator->configuration().chunk_size;

        try {
            Job started = coordinator->start(file_path, chunk_size, vault, description);
            coordinator->uploadAll(started.job_id);
            Job done = coordinator->finalize(started.job_id);
            return crow::response(201, jobToJson(done));
        } catch (const std::exception& e) {
            return errorResponse(e);
        }
    });

    CROW_ROUTE(app, "/uploads/resumable")
    ([&journal]() {
        try {
            std::vector<std::string> ids = journal.findResumable();
            crow::json::wvalue out;
            out["jobs"] = crow::json::wvalue::list(ids.begin(), ids.end());
            return crow::response(200, out);
        } catch (const std::exception& e) {
            return errorResponse(e);
        }
    });

    // --- GET /uploads/<job_id>: job state as recorded in the journal ---
    CROW_ROUTE(app, "/uploads/<string>")
    ([&journal](std::string job_id) {
        try {
            JobState state = journal.replay(job_id);
            crow::json::wvalue out = jobToJson(state.job);
            size_t uploaded = 0, failed = 0;
            for (const auto& entry : state.chunks) {
                if (entry.second.status == Chunks::ChunkStatus::Uploaded) ++uploaded;
                if (entry.second.status == Chunks::ChunkStatus::Failed) ++failed;
            }
            out["parts_total"] = state.chunks.size();
            out["parts_uploaded"] = uploaded;
            out["parts_failed"] = failed;
            return crow::response(200, out);
        } catch (const std::exception& e) {
            return errorResponse(e);
        }
    });

    CROW_ROUTE(app, "/uploads/<string>/resume").methods("POST"_method)
    ([coordinator](std::string job_id) {
        try {
            return crow::response(200, jobToJson(coordinator->resumeAndComplete(job_id)));
        } catch (const std::exception& e) {
            return errorResponse(e);
        }
    });

    CROW_ROUTE(app, "/uploads/<string>").methods("DELETE"_method)
    ([coordinator](std::string job_id) {
        try {
            coordinator->abort(job_id);
            return crow::response(204);
        } catch (const std::exception& e) {
            return errorResponse(e);
        }
    });

    // --- GET /archives?file_path=...: archive index lookup ---
    CROW_ROUTE(app, "/archives")
    ([&archive_index](const crow::request& req) {
        try {
            const char* file_path = req.url_params.get("file_path");
            std::vector<Index::ArchiveIndexRow> rows =
                file_path ? archive_index.lookup(file_path) : archive_index.rows();
            std::vector<crow::json::wvalue> items;
            for (const auto& row : rows) {
                items.push_back(rowToJson(row));
            }
            crow::json::wvalue out;
            out["archives"] = std::move(items);
            return crow::response(200, out);
        } catch (const std::exception& e) {
            return errorResponse(e);
        }
    });

    spdlog::info("Starting glacier upload service on http://0.0.0.0:{}", config.port);
    app.port(static_cast<uint16_t>(config.port)).multithreaded().run();

    return 0;
}
