#include "service/job_repository.hpp"

#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace allocsim {
namespace service {

std::string to_string(JobStatus status) {
    switch (status) {
        case JobStatus::PENDING: return "pending";
        case JobStatus::RUNNING: return "running";
        case JobStatus::DONE: return "done";
        case JobStatus::ERROR: return "error";
    }
    return "unknown";
}

std::string InMemoryJobRepository::create_job() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ostringstream id;
    id << "job-" << std::setw(6) << std::setfill('0') << next_id_++;

    JobRecord record;
    record.job_id = id.str();
    jobs_[record.job_id] = record;
    return record.job_id;
}

void InMemoryJobRepository::mark_running(const std::string& job_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    get_open_job(job_id).status = JobStatus::RUNNING;
}

void InMemoryJobRepository::complete(const std::string& job_id, const nlohmann::json& result) {
    std::lock_guard<std::mutex> lock(mutex_);
    JobRecord& job = get_open_job(job_id);
    job.status = JobStatus::DONE;
    job.result = result;
}

void InMemoryJobRepository::fail(const std::string& job_id,
                                 const std::string& error_kind,
                                 const std::string& error_message) {
    std::lock_guard<std::mutex> lock(mutex_);
    JobRecord& job = get_open_job(job_id);
    job.status = JobStatus::ERROR;
    job.error_kind = error_kind;
    job.error_message = error_message;
}

std::optional<JobRecord> InMemoryJobRepository::find(const std::string& job_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(job_id);
    if (it == jobs_.end()) return std::nullopt;
    return it->second;
}

size_t InMemoryJobRepository::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.size();
}

// Caller holds mutex_.
JobRecord& InMemoryJobRepository::get_open_job(const std::string& job_id) {
    auto it = jobs_.find(job_id);
    if (it == jobs_.end()) {
        throw std::invalid_argument("Unknown job id: " + job_id);
    }
    if (it->second.is_terminal()) {
        throw std::runtime_error("Job " + job_id + " already finished with status " +
                                 to_string(it->second.status));
    }
    return it->second;
}

} // namespace service
} // namespace allocsim
