#include "intake_queue.h"
#include <stdexcept>
#include <utility>

namespace cortexlib {

IntakeQueue::IntakeQueue(size_t capacity) : capacity_(capacity), dropped_(0) {
    if (capacity == 0) {
        throw std::invalid_argument("Intake queue capacity must be positive");
    }
}

bool IntakeQueue::push(const SensoryInput& input) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue_.size() >= capacity_) {
            ++dropped_;
            return false;
        }
        queue_.push_back(input);
    }
    available_.notify_one();
    return true;
}

size_t IntakeQueue::push_batch(const std::vector<SensoryInput>& inputs) {
    size_t accepted = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& input : inputs) {
            if (queue_.size() >= capacity_) {
                ++dropped_;
                continue;
            }
            queue_.push_back(input);
            ++accepted;
        }
    }
    if (accepted > 0) {
        available_.notify_one();
    }
    return accepted;
}

std::vector<SensoryInput> IntakeQueue::poll(size_t max_items, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (queue_.empty() && timeout.count() > 0) {
        available_.wait_for(lock, timeout, [this]() { return !queue_.empty(); });
    }

    std::vector<SensoryInput> items;
    while (!queue_.empty() && items.size() < max_items) {
        items.push_back(std::move(queue_.front()));
        queue_.pop_front();
    }
    return items;
}

size_t IntakeQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

bool IntakeQueue::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.empty();
}

uint64_t IntakeQueue::dropped_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}

} // namespace cortexlib
