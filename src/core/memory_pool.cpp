#include "memory_pool.h"
#include <cstdlib>
#include <cstring>
#include <new>

namespace cnum {

MemoryPool& MemoryPool::instance() {
    static MemoryPool pool;
    return pool;
}

MemoryPool::~MemoryPool() {
    release_cached();
}

void* MemoryPool::allocate(size_t nbytes) {
    if (nbytes == 0) return nullptr;

    size_t padded = padded_size(nbytes);
    void* ptr = nullptr;
    {
        std::lock_guard<std::mutex> lock(pool_mutex);
        auto it = cache.find(padded);
        if (it != cache.end() && !it->second.empty()) {
            ptr = it->second.back();
            it->second.pop_back();
        }
    }

    if (!ptr) {
#if defined(_MSC_VER)
        ptr = _aligned_malloc(padded, ALIGNMENT);
#else
        if (posix_memalign(&ptr, ALIGNMENT, padded) != 0) {
            ptr = nullptr;
        }
#endif
        if (!ptr) throw std::bad_alloc();
    }

    std::memset(ptr, 0, padded);
    return ptr;
}

void MemoryPool::deallocate(void* ptr, size_t nbytes) {
    if (!ptr) return;

    // Return under the PADDED size key
    size_t padded = padded_size(nbytes);

    std::lock_guard<std::mutex> lock(pool_mutex);
    cache[padded].push_back(ptr);
}

size_t MemoryPool::cached_blocks() {
    std::lock_guard<std::mutex> lock(pool_mutex);
    size_t n = 0;
    for (const auto& entry : cache) n += entry.second.size();
    return n;
}

void MemoryPool::release_cached() {
    std::lock_guard<std::mutex> lock(pool_mutex);
    for (auto& entry : cache) {
        for (void* p : entry.second) {
#if defined(_MSC_VER)
            _aligned_free(p);
#else
            std::free(p);
#endif
        }
        entry.second.clear();
    }
    cache.clear();
}

} // namespace cnum
