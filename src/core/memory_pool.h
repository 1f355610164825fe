#pragma once
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <type_traits>
#include <vector>

namespace cnum {

// ======================================================================================
//                              CACHING ALLOCATOR
// ======================================================================================
// Blocks are 64-byte aligned and rounded up to a multiple of 64 bytes so that
// SIMD kernels never straddle the end of an allocation. Released blocks are
// cached by padded size and handed out again.

class MemoryPool {
private:
    std::map<size_t, std::vector<void*>> cache;
    std::mutex pool_mutex;

public:
    static const size_t ALIGNMENT = 64;

    static MemoryPool& instance();

    MemoryPool() = default;
    MemoryPool(const MemoryPool&) = delete;
    MemoryPool& operator=(const MemoryPool&) = delete;
    ~MemoryPool();

    void* allocate(size_t nbytes);
    void deallocate(void* ptr, size_t nbytes);

    // Number of cached (free) blocks, all sizes.
    size_t cached_blocks();
    void release_cached();

    static size_t padded_size(size_t nbytes) {
        return (nbytes + ALIGNMENT - 1) & ~(ALIGNMENT - 1);
    }
};

// ----------------- Buffer -----------------
// Reference-counted flat allocation of `capacity` zero-initialized elements.
template <typename T>
struct Buffer {
    std::shared_ptr<T> data;
    size_t capacity = 0;

    static Buffer allocate(size_t n) {
        static_assert(std::is_trivially_copyable<T>::value, "Buffer: element type must be trivially copyable");
        Buffer b;
        b.capacity = n;
        size_t nbytes = n * sizeof(T);
        void* p = MemoryPool::instance().allocate(nbytes);
        // Deleter captures nbytes so the block goes back under its padded size
        b.data = std::shared_ptr<T>(static_cast<T*>(p), [nbytes](T* ptr) {
            MemoryPool::instance().deallocate(ptr, nbytes);
        });
        return b;
    }

    T* get() const { return data.get(); }
    long use_count() const { return data.use_count(); }
};

} // namespace cnum
