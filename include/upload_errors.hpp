// include/upload_errors.hpp
#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

namespace GlacierUpload
{
    namespace Errors
    {

        // Base for every error raised by the upload pipeline.
        class UploadError : public std::runtime_error
        {
        public:
            using std::runtime_error::runtime_error;
        };

        class InvalidChunkSize : public UploadError
        {
        public:
            using UploadError::UploadError;
        };

        class EmptyInput : public UploadError
        {
        public:
            using UploadError::UploadError;
        };

        // --- Remote store failures ---

        class RemoteError : public UploadError
        {
        public:
            using UploadError::UploadError;
        };

        class RemoteInitError : public RemoteError
        {
        public:
            using RemoteError::RemoteError;
        };

        // Transient, the same part may be sent again.
        class RemotePartError : public RemoteError
        {
        public:
            using RemoteError::RemoteError;
        };

        // The store refused the part (bad range or checksum). Fatal for that chunk.
        class RemoteRejected : public RemoteError
        {
        public:
            using RemoteError::RemoteError;
        };

        class RemoteCompleteError : public RemoteError
        {
        public:
            using RemoteError::RemoteError;
        };

        // --- State machine failures ---

        class AlreadyUploaded : public UploadError
        {
        public:
            AlreadyUploaded(const std::string &job_id, size_t chunk_index)
                : UploadError("Chunk " + std::to_string(chunk_index) + " of job " + job_id + " is already uploaded"),
                  index(chunk_index)
            {
            }

            size_t index;
        };

        class ChunkSizeMismatch : public UploadError
        {
        public:
            using UploadError::UploadError;
        };

        // Local aggregate and remote (or source) tree hash disagree. Never retried.
        class HashMismatch : public UploadError
        {
        public:
            HashMismatch(const std::string &message, std::string expected_hash, std::string actual_hash)
                : UploadError(message + " (expected " + expected_hash + ", got " + actual_hash + ")"),
                  expected(std::move(expected_hash)),
                  actual(std::move(actual_hash))
            {
            }

            std::string expected;
            std::string actual;
        };

        class DuplicateJob : public UploadError
        {
        public:
            using UploadError::UploadError;
        };

        // finalize() called before every chunk is uploaded.
        class IncompleteUpload : public UploadError
        {
        public:
            using UploadError::UploadError;
        };

        class JobNotFound : public UploadError
        {
        public:
            explicit JobNotFound(const std::string &job_id)
                : UploadError("Unknown upload job: " + job_id)
            {
            }
        };

        class InvalidTransition : public UploadError
        {
        public:
            using UploadError::UploadError;
        };

        class JournalError : public UploadError
        {
        public:
            using UploadError::UploadError;
        };

        class UploadCancelled : public UploadError
        {
        public:
            using UploadError::UploadError;
        };

    } // namespace Errors
} // namespace GlacierUpload
