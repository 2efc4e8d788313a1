#pragma once

#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "backtest/backtest_config.hpp"
#include "data/market_data.hpp"
#include "report/result_assembler.hpp"
#include "service/job_repository.hpp"

namespace allocsim {
namespace service {

/**
 * @class BacktestService
 * @brief Runs independent backtests on worker threads.
 *
 * All jobs share one immutable MarketData snapshot; each job builds its own
 * engine and portfolio, so runs never observe each other. Results and
 * failures land in the JobRepository: a BacktestError becomes an ERROR job
 * carrying its kind and message.
 *
 * The destructor waits for every outstanding job.
 */
class BacktestService {
public:
    BacktestService(std::shared_ptr<const MarketData> market_data,
                    std::shared_ptr<JobRepository> repository);

    ~BacktestService();

    BacktestService(const BacktestService&) = delete;
    BacktestService& operator=(const BacktestService&) = delete;

    // Run synchronously on the calling thread. Throws BacktestError.
    report::BacktestReport run(const backtest::BacktestParams& params) const;

    // Queue a run on a worker thread and return its job id.
    std::string submit(const backtest::BacktestParams& params);

    std::vector<std::string> submit_all(const std::vector<backtest::BacktestParams>& batch);

    // Block until the job has reached a terminal status.
    JobRecord wait(const std::string& job_id);
    void wait_all();

    const JobRepository& repository() const { return *repository_; }

private:
    void execute(const std::string& job_id, const backtest::BacktestParams& params) const;

    std::shared_ptr<const MarketData> market_data_;
    std::shared_ptr<JobRepository> repository_;

    std::mutex futures_mutex_;
    std::map<std::string, std::future<void>> futures_;
};

} // namespace service
} // namespace allocsim
