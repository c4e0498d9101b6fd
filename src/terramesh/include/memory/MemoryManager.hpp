#pragma once
#include "memory/AlignedAlloc.hpp"
#include <cstddef>
#include <mutex>
#include <unordered_map>

/**
 * @defgroup memory Memory Subsystem
 * @brief Ownership of the large flat arrays a mesh hands to solvers.
 *
 * - **64‑byte host alignment** (cache‑/SIMD‑friendly) for unknown-slot storage.
 * - One ownership point with leak‑free lifetime: every block is tracked in a registry
 *   and freed on \c release or at shutdown.
 *
 * @note All raw pointers returned by this layer are **owned** by the MemoryManager.
 * Non‑owning views (e.g. \c std::span over a slot array) expose typed access
 * without taking ownership.
 */

/**
 * @file MemoryManager.hpp
 * @ingroup memory
 * @brief Singleton RAII owner of aligned host buffers.
 *
 * ### Thread‑safety
 * All public methods are thread‑safe. The registry is protected by a mutex, so
 * concurrent mesh builds may allocate independently.
 *
 * ### Typical use
 * @rst
 *.. code-block:: cpp
 *
 *   auto& mm = MemoryManager::instance();
 *   double* slots = mm.allocate<double>(5 * node_count);
 *   // ...
 *   mm.release(slots);
 * @endrst
 *
 * @warning Pointers are invalid after \c release. Views must not outlive the block.
 */

namespace terramesh::memory
{

struct Block
{
    void* host = nullptr;
    std::size_t bytes = 0;
};

class MemoryManager
{
  public:
    static MemoryManager& instance();

    template <class T> T* allocate(std::size_t n);

    void release(void* host_ptr) noexcept;

    bool owns(const void* host_ptr) const noexcept;
    std::size_t bytes_of(const void* host_ptr) const noexcept;

    // Introspection for tests
    std::size_t debug_count() const noexcept;

    ~MemoryManager();

  private:
    MemoryManager() = default;
    MemoryManager(const MemoryManager&) = delete;
    MemoryManager& operator=(const MemoryManager&) = delete;

    mutable std::mutex mtx_;
    std::unordered_map<const void*, Block> registry_; // keyed by host pointer
};

// ---- template implementation ----

template <class T> T* MemoryManager::allocate(std::size_t n)
{
    const std::size_t bytes = n * sizeof(T);
    Block blk{};
    blk.host = aligned_malloc(bytes);
    blk.bytes = bytes;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        registry_.emplace(blk.host, blk);
    }
    return static_cast<T*>(blk.host);
}

} // namespace terramesh::memory
