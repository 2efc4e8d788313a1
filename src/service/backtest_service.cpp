#include "service/backtest_service.hpp"
#include "backtest/backtest_engine.hpp"
#include "backtest/errors.hpp"

#include <stdexcept>
#include <utility>

namespace allocsim {
namespace service {

BacktestService::BacktestService(std::shared_ptr<const MarketData> market_data,
                                 std::shared_ptr<JobRepository> repository)
    : market_data_(std::move(market_data)), repository_(std::move(repository)) {
    if (!market_data_) throw std::invalid_argument("BacktestService requires market data");
    if (!repository_) throw std::invalid_argument("BacktestService requires a job repository");
}

BacktestService::~BacktestService() {
    std::lock_guard<std::mutex> lock(futures_mutex_);
    for (auto& entry : futures_) {
        if (entry.second.valid()) entry.second.wait();
    }
}

report::BacktestReport BacktestService::run(const backtest::BacktestParams& params) const {
    backtest::BacktestEngine engine(params);
    backtest::BacktestResult result = engine.run(*market_data_);
    return report::ResultAssembler(params).assemble(result);
}

std::string BacktestService::submit(const backtest::BacktestParams& params) {
    std::string job_id = repository_->create_job();
    auto future = std::async(std::launch::async, [this, job_id, params]() {
        execute(job_id, params);
    });

    std::lock_guard<std::mutex> lock(futures_mutex_);
    futures_.emplace(job_id, std::move(future));
    return job_id;
}

std::vector<std::string> BacktestService::submit_all(const std::vector<backtest::BacktestParams>& batch) {
    std::vector<std::string> ids;
    ids.reserve(batch.size());
    for (const auto& params : batch) ids.push_back(submit(params));
    return ids;
}

JobRecord BacktestService::wait(const std::string& job_id) {
    std::future<void> future;
    {
        std::lock_guard<std::mutex> lock(futures_mutex_);
        auto it = futures_.find(job_id);
        if (it != futures_.end()) {
            future = std::move(it->second);
            futures_.erase(it);
        }
    }
    if (future.valid()) future.get();

    auto record = repository_->find(job_id);
    if (!record) throw std::invalid_argument("Unknown job id: " + job_id);
    return *record;
}

void BacktestService::wait_all() {
    std::map<std::string, std::future<void>> pending;
    {
        std::lock_guard<std::mutex> lock(futures_mutex_);
        pending.swap(futures_);
    }
    for (auto& entry : pending) entry.second.get();
}

void BacktestService::execute(const std::string& job_id, const backtest::BacktestParams& params) const {
    repository_->mark_running(job_id);
    try {
        report::BacktestReport report = run(params);
        repository_->complete(job_id, report.to_json());
    } catch (const backtest::BacktestError& e) {
        repository_->fail(job_id, backtest::to_string(e.kind()), e.what());
    } catch (const std::exception& e) {
        repository_->fail(job_id, "internal_error", e.what());
    }
}

} // namespace service
} // namespace allocsim
