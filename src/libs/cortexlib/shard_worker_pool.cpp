#include "shard_worker_pool.h"
#include <pthread.h>
#include <sched.h>
#include <cstring>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace cortexlib {

ShardWorkerPool::ShardWorkerPool(size_t worker_count, bool pin_threads)
    : worker_count_(worker_count == 0 ? 1 : worker_count),
      task_(nullptr), task_count_(0), next_task_(0), pending_(0), generation_(0), stopping_(false) {
    if (worker_count_ == 1) {
        return;
    }
    for (size_t i = 0; i < worker_count_; ++i) {
        threads_.emplace_back([this, i, pin_threads]() {
            if (pin_threads) {
                pin_to_core(i);
            }
            worker_loop(i);
        });
    }
    spdlog::info("Started {} shard worker threads", worker_count_);
}

ShardWorkerPool::~ShardWorkerPool() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    work_cv_.notify_all();
    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

void ShardWorkerPool::run(size_t task_count, const std::function<void(size_t)>& task) {
    if (task_count == 0) {
        return;
    }
    if (threads_.empty()) {
        for (size_t i = 0; i < task_count; ++i) {
            task(i);
        }
        return;
    }

    std::unique_lock<std::mutex> lock(mutex_);
    task_ = &task;
    task_count_ = task_count;
    next_task_ = 0;
    pending_ = task_count;
    first_error_ = nullptr;
    ++generation_;
    work_cv_.notify_all();

    done_cv_.wait(lock, [this]() { return pending_ == 0; });
    task_ = nullptr;

    if (first_error_) {
        std::exception_ptr error = first_error_;
        first_error_ = nullptr;
        std::rethrow_exception(error);
    }
}

void ShardWorkerPool::worker_loop(size_t worker_index) {
    uint64_t seen_generation = 0;
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        work_cv_.wait(lock, [&]() {
            return stopping_ || (generation_ != seen_generation && next_task_ < task_count_);
        });
        if (stopping_) {
            return;
        }

        while (next_task_ < task_count_) {
            size_t index = next_task_++;
            const std::function<void(size_t)>* task = task_;
            lock.unlock();
            std::exception_ptr error;
            try {
                (*task)(index);
            } catch (...) {
                error = std::current_exception();
            }
            lock.lock();
            if (error && !first_error_) {
                spdlog::error("Shard task {} failed on worker {}", index, worker_index);
                first_error_ = error;
            }
            if (--pending_ == 0) {
                done_cv_.notify_one();
            }
        }
        seen_generation = generation_;
    }
}

void ShardWorkerPool::pin_to_core(size_t worker_index) {
    unsigned int cores = std::thread::hardware_concurrency();
    if (cores == 0) {
        return;
    }
    cpu_set_t cpuset;
    CPU_ZERO(&cpuset);
    CPU_SET(static_cast<int>(worker_index % cores), &cpuset);

    int result = pthread_setaffinity_np(pthread_self(), sizeof(cpu_set_t), &cpuset);
    if (result != 0) {
        spdlog::warn("Failed to pin shard worker {} to core {}: {}", worker_index,
                     worker_index % cores, strerror(result));
    } else {
        spdlog::debug("Shard worker {} pinned to core {}", worker_index, worker_index % cores);
    }
}

} // namespace cortexlib
