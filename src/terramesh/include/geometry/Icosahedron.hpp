#pragma once
#include "geometry/Sphere.hpp"
#include <array>
#include <cstdint>

/**
 * @file Icosahedron.hpp
 * @brief Fixed base geometry of the regular icosahedron.
 *
 * @details
 * The 12 vertices are the cyclic permutations of (0, ±1, ±φ) before normalization.
 * Faces are listed counter-clockwise seen from outside, so every refined triangle
 * inherits an outward normal. The table is constant data, read through const references only.
 *
 * Antipodal pairs (never adjacent): 0–3, 1–2, 4–7, 5–6, 8–11, 9–10.
 */

namespace terramesh::geometry
{

using VertexId = std::int32_t;
using Triangle = std::array<VertexId, 3>;

struct BaseTable
{
    std::array<Vec3, 12> vertices; // not normalized
    std::array<Triangle, 20> faces;
};

inline constexpr double kGoldenRatio = 1.6180339887498948482;

inline constexpr BaseTable kIcosahedron{
    {{{-1.0, kGoldenRatio, 0.0},
      {1.0, kGoldenRatio, 0.0},
      {-1.0, -kGoldenRatio, 0.0},
      {1.0, -kGoldenRatio, 0.0},
      {0.0, -1.0, kGoldenRatio},
      {0.0, 1.0, kGoldenRatio},
      {0.0, -1.0, -kGoldenRatio},
      {0.0, 1.0, -kGoldenRatio},
      {kGoldenRatio, 0.0, -1.0},
      {kGoldenRatio, 0.0, 1.0},
      {-kGoldenRatio, 0.0, -1.0},
      {-kGoldenRatio, 0.0, 1.0}}},
    {{{0, 11, 5},
      {0, 5, 1},
      {0, 1, 7},
      {0, 7, 10},
      {0, 10, 11},
      {1, 5, 9},
      {5, 11, 4},
      {11, 10, 2},
      {10, 7, 6},
      {7, 1, 8},
      {3, 9, 4},
      {3, 4, 2},
      {3, 2, 6},
      {3, 6, 8},
      {3, 8, 9},
      {4, 9, 5},
      {2, 4, 11},
      {6, 2, 10},
      {8, 6, 7},
      {9, 8, 1}}}};

inline constexpr const BaseTable& icosahedron() noexcept
{
    return kIcosahedron;
}

} // namespace terramesh::geometry
