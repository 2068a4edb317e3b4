#ifndef CORTEXLIB_SHARD_WORKER_POOL_H
#define CORTEXLIB_SHARD_WORKER_POOL_H

#include <condition_variable>
#include <cstdint>
#include <exception>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace cortexlib {

// Fixed set of threads that run indexed shard tasks to completion. A pool of one runs
// every task inline, in index order, on the calling thread.
class ShardWorkerPool {
public:
    explicit ShardWorkerPool(size_t worker_count, bool pin_threads = false);
    ~ShardWorkerPool();

    ShardWorkerPool(const ShardWorkerPool&) = delete;
    ShardWorkerPool& operator=(const ShardWorkerPool&) = delete;

    // Blocks until task(0) .. task(task_count - 1) have all returned; rethrows the first failure
    void run(size_t task_count, const std::function<void(size_t)>& task);

    size_t worker_count() const { return worker_count_; }

private:
    void worker_loop(size_t worker_index);
    static void pin_to_core(size_t worker_index);

    size_t worker_count_;
    std::vector<std::thread> threads_;
    std::mutex mutex_;
    std::condition_variable work_cv_;
    std::condition_variable done_cv_;
    const std::function<void(size_t)>* task_;
    size_t task_count_;
    size_t next_task_;
    size_t pending_;
    uint64_t generation_;
    bool stopping_;
    std::exception_ptr first_error_;
};

} // namespace cortexlib

#endif // CORTEXLIB_SHARD_WORKER_POOL_H
