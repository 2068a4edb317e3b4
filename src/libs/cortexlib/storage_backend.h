#ifndef CORTEXLIB_STORAGE_BACKEND_H
#define CORTEXLIB_STORAGE_BACKEND_H

#include <array>
#include <vector>
#include <cstddef>
#include <limits>

#ifndef CORTEXLIB_FIXED_NEURON_CAPACITY
#define CORTEXLIB_FIXED_NEURON_CAPACITY 4096
#endif

#ifndef CORTEXLIB_FIXED_SYNAPSE_CAPACITY
#define CORTEXLIB_FIXED_SYNAPSE_CAPACITY 32768
#endif

#ifndef CORTEXLIB_LINEAR_MEMORY_MAX_PAGES
#define CORTEXLIB_LINEAR_MEMORY_MAX_PAGES 256
#endif

namespace cortexlib {

// Heap-backed column, grows without bound
template <typename U>
class DynamicBuffer {
public:
    bool push_back(const U& value) {
        data_.push_back(value);
        return true;
    }

    size_t size() const { return data_.size(); }
    size_t capacity() const { return std::numeric_limits<size_t>::max(); }
    bool full() const { return false; }

    U& operator[](size_t index) { return data_[index]; }
    const U& operator[](size_t index) const { return data_[index]; }

    U* data() { return data_.data(); }
    const U* data() const { return data_.data(); }

    void clear() { data_.clear(); }

private:
    std::vector<U> data_;
};

// Inline column with a compile-time capacity; never allocates
template <typename U, size_t N>
class FixedBuffer {
public:
    FixedBuffer() : size_(0) {}

    bool push_back(const U& value) {
        if (size_ == N) {
            return false;
        }
        data_[size_++] = value;
        return true;
    }

    size_t size() const { return size_; }
    size_t capacity() const { return N; }
    bool full() const { return size_ == N; }

    U& operator[](size_t index) { return data_[index]; }
    const U& operator[](size_t index) const { return data_[index]; }

    U* data() { return data_.data(); }
    const U* data() const { return data_.data(); }

    void clear() { size_ = 0; }

private:
    std::array<U, N> data_{};
    size_t size_;
};

// Contiguous region that grows in 64 KiB pages up to a page limit, the way a
// wasm32 module's linear memory grows.
template <typename U>
class LinearMemoryBuffer {
public:
    static constexpr size_t PAGE_SIZE = 65536;
    static constexpr size_t ELEMENTS_PER_PAGE = PAGE_SIZE / sizeof(U) > 0 ? PAGE_SIZE / sizeof(U) : 1;

    explicit LinearMemoryBuffer(size_t max_pages = CORTEXLIB_LINEAR_MEMORY_MAX_PAGES)
        : max_pages_(max_pages), pages_(0), size_(0) {}

    bool push_back(const U& value) {
        if (size_ == pages_ * ELEMENTS_PER_PAGE) {
            if (pages_ == max_pages_) {
                return false;
            }
            grow_pages(1);
        }
        memory_[size_++] = value;
        return true;
    }

    size_t size() const { return size_; }
    size_t capacity() const { return max_pages_ * ELEMENTS_PER_PAGE; }
    bool full() const { return size_ == capacity(); }
    size_t pages() const { return pages_; }

    U& operator[](size_t index) { return memory_[index]; }
    const U& operator[](size_t index) const { return memory_[index]; }

    U* data() { return memory_.data(); }
    const U* data() const { return memory_.data(); }

    void clear() { size_ = 0; }

private:
    void grow_pages(size_t count) {
        pages_ += count;
        memory_.resize(pages_ * ELEMENTS_PER_PAGE);
    }

    std::vector<U> memory_;
    size_t max_pages_;
    size_t pages_;
    size_t size_;
};

struct DynamicStorage {
    template <typename U> using NeuronBuffer = DynamicBuffer<U>;
    template <typename U> using SynapseBuffer = DynamicBuffer<U>;
    static constexpr const char* NAME = "dynamic";
    static constexpr size_t NEURON_CAPACITY = std::numeric_limits<size_t>::max();
    static constexpr size_t SYNAPSE_CAPACITY = std::numeric_limits<size_t>::max();
};

struct FixedStorage {
    template <typename U> using NeuronBuffer = FixedBuffer<U, CORTEXLIB_FIXED_NEURON_CAPACITY>;
    template <typename U> using SynapseBuffer = FixedBuffer<U, CORTEXLIB_FIXED_SYNAPSE_CAPACITY>;
    static constexpr const char* NAME = "fixed";
    // Scratch that scales with the network is sized from these once, up front
    static constexpr size_t NEURON_CAPACITY = CORTEXLIB_FIXED_NEURON_CAPACITY;
    static constexpr size_t SYNAPSE_CAPACITY = CORTEXLIB_FIXED_SYNAPSE_CAPACITY;
};

struct LinearMemoryStorage {
    template <typename U> using NeuronBuffer = LinearMemoryBuffer<U>;
    template <typename U> using SynapseBuffer = LinearMemoryBuffer<U>;
    static constexpr const char* NAME = "linear";
    static constexpr size_t NEURON_CAPACITY = std::numeric_limits<size_t>::max();
    static constexpr size_t SYNAPSE_CAPACITY = std::numeric_limits<size_t>::max();
};

#if defined(CORTEXLIB_STORAGE_FIXED)
using ActiveStorage = FixedStorage;
#elif defined(CORTEXLIB_STORAGE_LINEAR)
using ActiveStorage = LinearMemoryStorage;
#else
using ActiveStorage = DynamicStorage;
#endif

} // namespace cortexlib

#endif // CORTEXLIB_STORAGE_BACKEND_H
