#include "mesh/IcosahedralLayer.hpp"
#include "log/Log.hpp"
#include "mesh/Errors.hpp"

#include <algorithm>
#include <exception>
#include <sstream>
#include <unordered_map>

namespace terramesh::mesh
{

namespace
{

// Unordered endpoint pair -> 64-bit key (lower ID in the high word).
inline std::uint64_t edge_key(VertexId a, VertexId b) noexcept
{
    const auto lo = static_cast<std::uint32_t>(std::min(a, b));
    const auto hi = static_cast<std::uint32_t>(std::max(a, b));
    return (static_cast<std::uint64_t>(lo) << 32) | hi;
}

void refine_once(IcosahedralLayer& layer)
{
    const auto nt = static_cast<std::ptrdiff_t>(layer.triangles.size());

    // Midpoints per triangle, edge order v0v1, v1v2, v2v0. Shared edges are evaluated
    // twice; the sum a+b is symmetric so both evaluations are bitwise identical.
    std::vector<std::array<Vec3, 3>> mids(static_cast<std::size_t>(nt));
    std::exception_ptr err;

#pragma omp parallel for schedule(static)
    for (std::ptrdiff_t t = 0; t < nt; ++t)
    {
        try
        {
            const Triangle& tri = layer.triangles[t];
            mids[t] = geometry::subdivide_triangle(layer.vertices[tri[0]], layer.vertices[tri[1]],
                                                   layer.vertices[tri[2]])
                          .midpoints;
        }
        catch (...)
        {
#pragma omp critical(terramesh_refine_error)
            {
                if (!err)
                    err = std::current_exception();
            }
        }
    }
    if (err)
        std::rethrow_exception(err);

    // Deterministic merge: IDs follow triangle order, then edge order.
    std::unordered_map<std::uint64_t, VertexId> midpoint_of;
    midpoint_of.reserve(static_cast<std::size_t>(nt) * 3 / 2);
    layer.vertices.reserve(layer.vertices.size() + static_cast<std::size_t>(nt) * 3 / 2);

    std::vector<Triangle> next;
    next.reserve(static_cast<std::size_t>(nt) * 4);

    for (std::ptrdiff_t t = 0; t < nt; ++t)
    {
        const Triangle tri = layer.triangles[t];
        std::array<VertexId, 3> m{};
        for (int e = 0; e < 3; ++e)
        {
            const VertexId a = tri[e];
            const VertexId b = tri[(e + 1) % 3];
            const auto candidate = static_cast<VertexId>(layer.vertices.size());
            auto [it, inserted] = midpoint_of.try_emplace(edge_key(a, b), candidate);
            if (inserted)
                layer.vertices.push_back(mids[t][e]);
            m[e] = it->second;
        }
        next.push_back({tri[0], m[0], m[2]});
        next.push_back({tri[1], m[1], m[0]});
        next.push_back({tri[2], m[2], m[1]});
        next.push_back({m[0], m[1], m[2]});
    }

    layer.triangles = std::move(next);
    ++layer.level;
}

} // namespace

IcosahedralLayer build_layer(int k, const geometry::BaseTable& base)
{
    if (k < 0 || k > kMaxRefinement)
    {
        std::ostringstream msg;
        msg << "build_layer: refinement level " << k << " outside [0, " << kMaxRefinement << "]";
        throw InvalidResolutionError(msg.str());
    }

    IcosahedralLayer layer;
    layer.vertices.reserve(static_cast<std::size_t>(expected_vertex_count(k)));
    for (const Vec3& p : base.vertices)
        layer.vertices.push_back(geometry::normalize(p));

    const auto nbase = static_cast<VertexId>(base.vertices.size());
    for (const Triangle& f : base.faces)
    {
        for (VertexId v : f)
            if (v < 0 || v >= nbase)
                throw DegenerateInputError("build_layer: base face references vertex " +
                                           std::to_string(v));
        layer.triangles.push_back(f);
    }

    for (int pass = 1; pass <= k; ++pass)
    {
        refine_once(layer);
        LOGD(Mesh, "refinement pass %d/%d: vertices=%zu triangles=%zu\n", pass, k,
             layer.vertex_count(), layer.triangle_count());
    }

    const auto nv = static_cast<std::int64_t>(layer.vertex_count());
    const auto ntri = static_cast<std::int64_t>(layer.triangle_count());
    if (nv != expected_vertex_count(k) || ntri != expected_triangle_count(k))
    {
        std::ostringstream msg;
        msg << "build_layer: level " << k << " produced " << nv << " vertices and " << ntri
            << " triangles, expected " << expected_vertex_count(k) << " and "
            << expected_triangle_count(k);
        throw InvariantViolationError(msg.str());
    }
    return layer;
}

} // namespace terramesh::mesh
