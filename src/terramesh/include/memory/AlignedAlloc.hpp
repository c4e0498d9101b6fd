#pragma once
#include <cstddef>
#include <cstdlib>
#include <new>

/**
 * @file AlignedAlloc.hpp
 * @ingroup memory
 * @brief Low‑level aligned allocation helpers for host memory.
 *
 * Provides \c aligned_malloc(bytes, alignment) and \c aligned_free(ptr) used by the
 * memory subsystem to satisfy cache‑line/SIMD alignment (≥64 B by default) for the
 * per-node unknown arrays handed to solvers.
 */

namespace terramesh::memory
{

inline constexpr std::size_t HW_ALIGN = 64;

inline void* aligned_malloc(std::size_t bytes, std::size_t alignment = HW_ALIGN)
{
#if defined(_MSC_VER)
    void* p = _aligned_malloc(bytes, alignment);
    if (!p)
        throw std::bad_alloc{};
    return p;
#else
    // std::aligned_alloc requires size multiple of alignment
    if (alignment == 0 || (alignment & (alignment - 1)) != 0)
        alignment = HW_ALIGN;
    std::size_t padded = ((bytes + alignment - 1) / alignment) * alignment;
    if (padded == 0)
        padded = alignment;
    void* p = std::aligned_alloc(alignment, padded);
    if (!p)
        throw std::bad_alloc{};
    return p;
#endif
}

inline void aligned_free(void* p) noexcept
{
#if defined(_MSC_VER)
    _aligned_free(p);
#else
    std::free(p);
#endif
}

} // namespace terramesh::memory
