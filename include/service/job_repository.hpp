#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace allocsim {
namespace service {

enum class JobStatus {
    PENDING,
    RUNNING,
    DONE,
    ERROR
};

std::string to_string(JobStatus status);

/**
 * @struct JobRecord
 * @brief State of one submitted backtest.
 *
 * A job moves PENDING -> RUNNING -> DONE | ERROR. Terminal jobs carry
 * either the serialized report or the error kind and message.
 */
struct JobRecord {
    std::string job_id;
    JobStatus status = JobStatus::PENDING;
    nlohmann::json result;       // report JSON when DONE
    std::string error_kind;      // to_string(ErrorKind) when ERROR
    std::string error_message;

    bool is_terminal() const { return status == JobStatus::DONE || status == JobStatus::ERROR; }
};

/**
 * @class JobRepository
 * @brief Storage for job status and results.
 *
 * Every job receives exactly one terminal write; a second one is an error.
 * Implementations must be safe to call from worker threads.
 */
class JobRepository {
public:
    virtual ~JobRepository() = default;

    // Returns the id of a new PENDING job.
    virtual std::string create_job() = 0;

    virtual void mark_running(const std::string& job_id) = 0;
    virtual void complete(const std::string& job_id, const nlohmann::json& result) = 0;
    virtual void fail(const std::string& job_id,
                      const std::string& error_kind,
                      const std::string& error_message) = 0;

    virtual std::optional<JobRecord> find(const std::string& job_id) const = 0;
    virtual size_t size() const = 0;
};

class InMemoryJobRepository : public JobRepository {
public:
    InMemoryJobRepository() = default;

    std::string create_job() override;
    void mark_running(const std::string& job_id) override;
    void complete(const std::string& job_id, const nlohmann::json& result) override;
    void fail(const std::string& job_id,
              const std::string& error_kind,
              const std::string& error_message) override;

    std::optional<JobRecord> find(const std::string& job_id) const override;
    size_t size() const override;

private:
    JobRecord& get_open_job(const std::string& job_id);

    mutable std::mutex mutex_;
    std::map<std::string, JobRecord> jobs_;
    int next_id_ = 1;
};

} // namespace service
} // namespace allocsim
