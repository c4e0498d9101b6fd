#pragma once
#include "geometry/Icosahedron.hpp"
#include "geometry/Sphere.hpp"
#include <cstddef>
#include <cstdint>
#include <vector>

/**
 * @file IcosahedralLayer.hpp
 * @brief One horizontal layer: the k-times bisected icosahedron on the unit sphere.
 *
 * @details
 * Vertices and triangles live in flat arrays indexed by integer ID. Each refinement pass
 * bisects every triangle into three corner triangles and one centre triangle; an edge's
 * midpoint maps to exactly one new vertex through an edge-key lookup that exists only for
 * the duration of that pass.
 *
 * ID order is deterministic: the 12 base vertices, then the midpoints of pass 1, pass 2,
 * ... in triangle order and, within a triangle, edge order (v0v1, v1v2, v2v0). A level k
 * layer therefore starts with the full vertex set of level k-1.
 *
 * Closed-form sizes for m = 2^k:
 *
 * - vertices  N(k) = 2 + 10 m^2
 * - triangles T(k) = 20 m^2
 *
 * @rst
 * .. code-block:: cpp
 *
 *   auto layer = terramesh::mesh::build_layer(3);   // 642 vertices, 1280 triangles
 * @endrst
 */

namespace terramesh::mesh
{

using geometry::Triangle;
using geometry::Vec3;
using geometry::VertexId;

// Keeps N(k) representable as a 32-bit VertexId.
inline constexpr int kMaxRefinement = 13;

inline constexpr std::int64_t subdivisions_per_edge(int k) noexcept
{
    return std::int64_t{1} << k;
}

inline constexpr std::int64_t expected_vertex_count(int k) noexcept
{
    const std::int64_t m = subdivisions_per_edge(k);
    return 2 + 10 * m * m;
}

inline constexpr std::int64_t expected_triangle_count(int k) noexcept
{
    const std::int64_t m = subdivisions_per_edge(k);
    return 20 * m * m;
}

struct IcosahedralLayer
{
    int level = 0;
    std::vector<Vec3> vertices;     // unit sphere
    std::vector<Triangle> triangles; // counter-clockwise seen from outside

    std::size_t vertex_count() const noexcept { return vertices.size(); }
    std::size_t triangle_count() const noexcept { return triangles.size(); }
};

/// Refine @p base @p k times. Throws InvalidResolutionError for k outside
/// [0, kMaxRefinement], DegenerateInputError for malformed base geometry and
/// InvariantViolationError when the result does not have the closed-form sizes.
IcosahedralLayer build_layer(int k, const geometry::BaseTable& base = geometry::icosahedron());

} // namespace terramesh::mesh
