#pragma once
#include "mesh/IcosahedralLayer.hpp"
#include "mesh/Layout.hpp"
#include <array>
#include <cstdint>
#include <ranges>
#include <span>
#include <vector>

/**
 * @file MeshIndex.hpp
 * @brief Lookup structures over the assembled layered node set.
 *
 * @details
 * - **Global IDs**: ``node = layer * N + vertex`` (see :cpp:struct:`layout::NodeIndexer`).
 * - **Horizontal neighbors**: one CSR table over vertex IDs, built from the triangle set
 *   (two vertices are neighbors iff they share a triangle). Lists are deduplicated, free of
 *   self-references and sorted ascending. All layers share the table; a node's list is the
 *   vertex list shifted by its layer offset.
 * - **Radial neighbors**: inward first, then outward. Boundary layers have one, interior
 *   layers two, a single-layer mesh none.
 *
 * @rst
 * .. code-block:: cpp
 *
 *   MeshIndex idx(layer, nlayers);
 *   for (NodeId nb : idx.horizontal_neighbors(n)) { ... }
 *   for (NodeId nb : idx.radial_neighbors(n).span()) { ... }
 * @endrst
 */

namespace terramesh::mesh
{

using layout::NodeId;

struct RadialNeighbors
{
    std::array<NodeId, 2> ids{-1, -1};
    int count = 0;

    std::span<const NodeId> span() const noexcept
    {
        return {ids.data(), static_cast<std::size_t>(count)};
    }
};

class MeshIndex
{
  public:
    MeshIndex() = default;
    MeshIndex(const IcosahedralLayer& layer, int nlayers);

    std::int64_t vertices_per_layer() const noexcept { return nodes_.nvert; }
    int layer_count() const noexcept { return nlayers_; }
    std::int64_t node_count() const noexcept { return nodes_.nvert * nlayers_; }

    NodeId node_id(int layer, VertexId v) const noexcept { return nodes_(layer, v); }
    int layer_of(NodeId n) const noexcept { return nodes_.layer_of(n); }
    VertexId vertex_of(NodeId n) const noexcept { return nodes_.vertex_of(n); }
    const layout::NodeIndexer& indexer() const noexcept { return nodes_; }

    std::span<const VertexId> vertex_neighbors(VertexId v) const noexcept
    {
        const auto b = offsets_[static_cast<std::size_t>(v)];
        const auto e = offsets_[static_cast<std::size_t>(v) + 1];
        return {adjacency_.data() + b, static_cast<std::size_t>(e - b)};
    }

    // Lazily shifted view of vertex_neighbors(); yields NodeId.
    auto horizontal_neighbors(NodeId n) const noexcept
    {
        const NodeId base = n - vertex_of(n);
        return vertex_neighbors(vertex_of(n)) |
               std::views::transform([base](VertexId w) { return base + w; });
    }

    std::size_t horizontal_degree(NodeId n) const noexcept
    {
        return vertex_neighbors(vertex_of(n)).size();
    }

    RadialNeighbors radial_neighbors(NodeId n) const noexcept;

    // Raw CSR (offsets has N+1 entries)
    std::span<const std::int64_t> offsets() const noexcept { return offsets_; }
    std::span<const VertexId> adjacency() const noexcept { return adjacency_; }

  private:
    layout::NodeIndexer nodes_{};
    int nlayers_ = 0;
    std::vector<std::int64_t> offsets_;
    std::vector<VertexId> adjacency_;
};

} // namespace terramesh::mesh
