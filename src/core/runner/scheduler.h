#ifndef RUNBOX_SCHEDULER_H
#define RUNBOX_SCHEDULER_H

#include "sandbox.h"

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <vector>

namespace runbox
{
    class SlotPool;

    /**
     * @brief 一个沙箱槽位的占用凭证
     * 只能移动; 析构或 Release() 时归还槽位, 重复归还为空操作
     */
    class SlotLease
    {
    public:
        SlotLease() = default;
        explicit SlotLease(SlotPool* pool) : pool_(pool) {}
        ~SlotLease() { Release(); }

        SlotLease(const SlotLease&) = delete;
        SlotLease& operator=(const SlotLease&) = delete;
        SlotLease(SlotLease&& other) noexcept : pool_(other.pool_) { other.pool_ = nullptr; }
        SlotLease& operator=(SlotLease&& other) noexcept
        {
            if (this != &other) {
                Release();
                pool_ = other.pool_;
                other.pool_ = nullptr;
            }
            return *this;
        }

        void Release();
        bool held() const { return pool_ != nullptr; }

    private:
        SlotPool* pool_ = nullptr;
    };

    /**
     * @brief 全局沙箱槽位池 (单任务 / archive / 批量请求共享)
     * 按到达顺序 (FIFO 票号) 分配, 同时运行的沙箱数不超过 size
     */
    class SlotPool
    {
    public:
        explicit SlotPool(int size);

        SlotPool(const SlotPool&) = delete;
        SlotPool& operator=(const SlotPool&) = delete;

        // 阻塞直到轮到本次请求且有空闲槽位
        SlotLease Acquire();

        int size() const { return size_; }
        int in_use() const;
        // 运行以来同时占用槽位的最大值
        int high_water_mark() const;

    private:
        friend class SlotLease;
        void Return();

        const int size_;
        mutable std::mutex mutex_;
        std::condition_variable cv_;
        int in_use_ = 0;
        int high_water_ = 0;
        std::uint64_t next_ticket_ = 0;
        std::uint64_t now_serving_ = 0;
    };

    /**
     * @brief 批量调度器
     * 启动 min(n, worker_limit) 个工作线程, 按下标领取任务, 结果按输入顺序返回。
     * 单个任务的失败不影响其它任务。
     */
    class BatchScheduler
    {
    public:
        explicit BatchScheduler(int worker_limit);

        /**
         * @param count 任务数
         * @param run_one 执行第 i 个任务的完整流水线
         * @return 长度为 count 的结果, results[i] 对应第 i 个任务
         */
        std::vector<RunResult> Run(std::size_t count,
                                   const std::function<RunResult(std::size_t)>& run_one) const;

    private:
        int worker_limit_;
    };
}

#endif // RUNBOX_SCHEDULER_H
