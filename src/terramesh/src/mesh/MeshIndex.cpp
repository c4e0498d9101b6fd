#include "mesh/MeshIndex.hpp"
#include "mesh/Errors.hpp"

#include <algorithm>

namespace terramesh::mesh
{

MeshIndex::MeshIndex(const IcosahedralLayer& layer, int nlayers)
    : nodes_{static_cast<std::int64_t>(layer.vertex_count())}, nlayers_(nlayers)
{
    if (nlayers < 1)
        throw InvalidResolutionError("MeshIndex: at least one layer is required");

    const auto nv = static_cast<std::ptrdiff_t>(layer.vertex_count());

    // Each triangle contributes its two other corners to every corner (upper bound).
    std::vector<std::int64_t> start(static_cast<std::size_t>(nv) + 1, 0);
    for (const Triangle& tri : layer.triangles)
        for (VertexId v : tri)
            start[static_cast<std::size_t>(v) + 1] += 2;
    for (std::ptrdiff_t v = 0; v < nv; ++v)
        start[v + 1] += start[v];

    std::vector<VertexId> scratch(static_cast<std::size_t>(start[nv]));
    std::vector<std::int64_t> fill(start.begin(), start.end() - 1);
    for (const Triangle& tri : layer.triangles)
        for (int e = 0; e < 3; ++e)
        {
            const VertexId v = tri[e];
            scratch[fill[v]++] = tri[(e + 1) % 3];
            scratch[fill[v]++] = tri[(e + 2) % 3];
        }

    std::vector<std::int64_t> degree(static_cast<std::size_t>(nv), 0);

#pragma omp parallel for schedule(static)
    for (std::ptrdiff_t v = 0; v < nv; ++v)
    {
        auto b = scratch.begin() + start[v];
        auto e = scratch.begin() + start[v + 1];
        std::sort(b, e);
        auto last = std::unique(b, e);
        last = std::remove(b, last, static_cast<VertexId>(v));
        degree[v] = last - b;
    }

    offsets_.assign(static_cast<std::size_t>(nv) + 1, 0);
    for (std::ptrdiff_t v = 0; v < nv; ++v)
        offsets_[v + 1] = offsets_[v] + degree[v];
    adjacency_.resize(static_cast<std::size_t>(offsets_[nv]));

#pragma omp parallel for schedule(static)
    for (std::ptrdiff_t v = 0; v < nv; ++v)
        std::copy_n(scratch.begin() + start[v], degree[v], adjacency_.begin() + offsets_[v]);
}

RadialNeighbors MeshIndex::radial_neighbors(NodeId n) const noexcept
{
    RadialNeighbors r;
    const int layer = layer_of(n);
    if (layer > 0)
        r.ids[r.count++] = n - nodes_.nvert;
    if (layer + 1 < nlayers_)
        r.ids[r.count++] = n + nodes_.nvert;
    return r;
}

} // namespace terramesh::mesh
