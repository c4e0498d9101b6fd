#pragma once
#include <cstddef>
#include <cstdint>

/**
 * @file Layout.hpp
 * @ingroup memory
 * @brief Indexing utilities for layered shell meshes.
 *
 * Provides \c layout::NodeIndexer which maps ( \p layer, \p vertex ) to the flattened
 * global node ID used as the row index in solver state vectors, and
 * \c layout::SlotIndexer which maps ( \p node, \p slot ) to an offset inside the unknown
 * storage. Both are trivially inlinable.
 *
 * @rst
 *.. code-block:: cpp
 *
 *   // layer-major, vertex fastest
 *   inline std::int64_t id(int layer, int vertex) const noexcept {
 *     return std::int64_t(layer) * nvert + vertex;
 *   }
 * @endrst
 *
 * Two slot strategies share one API: interleaved records (all slots of a node adjacent)
 * and planar arrays (one contiguous array per slot, SoA).
 */

namespace terramesh::layout
{

using NodeId = std::int64_t;

struct NodeIndexer
{
    std::int64_t nvert{};

    inline NodeId operator()(int layer, std::int32_t vertex) const noexcept
    {
        return static_cast<NodeId>(layer) * nvert + vertex;
    }
    inline int layer_of(NodeId n) const noexcept { return static_cast<int>(n / nvert); }
    inline std::int32_t vertex_of(NodeId n) const noexcept
    {
        return static_cast<std::int32_t>(n % nvert);
    }
};

enum class SlotLayout
{
    Interleaved, // offset = node * nslots + slot
    Planar       // offset = slot * nnodes + node
};

struct SlotIndexer
{
    std::int64_t nnodes{};
    int nslots{};
    SlotLayout kind = SlotLayout::Interleaved;

    inline std::size_t operator()(NodeId n, int slot) const noexcept
    {
        return kind == SlotLayout::Interleaved
                   ? static_cast<std::size_t>(n * nslots + slot)
                   : static_cast<std::size_t>(static_cast<std::int64_t>(slot) * nnodes + n);
    }
    // Distance (in elements) between consecutive nodes of the same slot
    inline std::size_t node_stride() const noexcept
    {
        return kind == SlotLayout::Interleaved ? static_cast<std::size_t>(nslots) : 1;
    }
    inline std::size_t size() const noexcept
    {
        return static_cast<std::size_t>(nnodes) * static_cast<std::size_t>(nslots);
    }
};

} // namespace terramesh::layout
