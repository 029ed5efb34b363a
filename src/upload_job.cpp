// src/upload_job.cpp
#include "upload_job.hpp"

#include <stdexcept>

namespace GlacierUpload
{

    std::string toString(JobStatus status)
    {
        switch (status)
        {
        case JobStatus::Initiated:
            return "initiated";
        case JobStatus::InProgress:
            return "in_progress";
        case JobStatus::Completing:
            return "completing";
        case JobStatus::Completed:
            return "completed";
        case JobStatus::Aborted:
            return "aborted";
        case JobStatus::Failed:
            return "failed";
        }
        return "unknown";
    }

    JobStatus jobStatusFromString(const std::string &name)
    {
        if (name == "initiated")
            return JobStatus::Initiated;
        if (name == "in_progress")
            return JobStatus::InProgress;
        if (name == "completing")
            return JobStatus::Completing;
        if (name == "completed")
            return JobStatus::Completed;
        if (name == "aborted")
            return JobStatus::Aborted;
        if (name == "failed")
            return JobStatus::Failed;
        throw std::invalid_argument("Unknown job status: " + name);
    }

    bool isResumable(JobStatus status)
    {
        return status == JobStatus::Initiated || status == JobStatus::InProgress;
    }

} // namespace GlacierUpload
