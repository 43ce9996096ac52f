#include "scheduler.h"

#include <algorithm>
#include <atomic>
#include <exception>
#include <iostream>
#include <thread>

namespace runbox
{
    void SlotLease::Release()
    {
        if (pool_ == nullptr) return;
        pool_->Return();
        pool_ = nullptr;
    }

    SlotPool::SlotPool(int size)
        : size_(size > 0 ? size : 1)
    {
    }

    SlotLease SlotPool::Acquire()
    {
        std::unique_lock<std::mutex> lock(mutex_);
        const std::uint64_t ticket = next_ticket_++;
        cv_.wait(lock, [this, ticket] { return ticket == now_serving_ && in_use_ < size_; });
        ++now_serving_;
        ++in_use_;
        high_water_ = std::max(high_water_, in_use_);
        // 下一个票号的持有者可能也能立即拿到槽位
        cv_.notify_all();
        return SlotLease(this);
    }

    void SlotPool::Return()
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            --in_use_;
        }
        cv_.notify_all();
    }

    int SlotPool::in_use() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return in_use_;
    }

    int SlotPool::high_water_mark() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return high_water_;
    }

    BatchScheduler::BatchScheduler(int worker_limit)
        : worker_limit_(worker_limit > 0 ? worker_limit : 1)
    {
    }

    std::vector<RunResult> BatchScheduler::Run(std::size_t count,
                                               const std::function<RunResult(std::size_t)>& run_one) const
    {
        std::vector<RunResult> results(count);
        if (count == 0) return results;

        std::atomic<std::size_t> next{0};
        auto worker = [&]() {
            for (;;) {
                std::size_t i = next.fetch_add(1);
                if (i >= count) break;
                try {
                    results[i] = run_one(i);
                } catch (const std::exception& e) {
                    // 单个任务的异常只影响它自己的结果
                    std::cerr << "[Scheduler] task " << i << " failed: " << e.what() << std::endl;
                    RunResult failed;
                    failed.termination = Termination::LAUNCH_FAILED;
                    failed.exit_code = EXIT_CODE_LAUNCH_FAILED;
                    failed.error = std::string("Internal error: ") + e.what();
                    results[i] = std::move(failed);
                }
            }
        };

        std::size_t workers = std::min(count, static_cast<std::size_t>(worker_limit_));
        std::vector<std::thread> threads;
        threads.reserve(workers);
        for (std::size_t w = 0; w < workers; ++w) {
            threads.emplace_back(worker);
        }
        for (auto& t : threads) {
            t.join();
        }
        return results;
    }
}
