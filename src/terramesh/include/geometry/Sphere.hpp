#pragma once
#include <array>
#include <cmath>

/**
 * @file Sphere.hpp
 * @brief Unit-sphere primitives used to build the icosahedral layer.
 *
 * @details
 * Points are plain ``std::array<double,3>`` in Cartesian coordinates. All functions are
 * pure; the only failure mode is degenerate input (zero vector, antipodal pair), which
 * raises :cpp:class:`terramesh::mesh::DegenerateInputError`.
 *
 * Geographic coordinates follow the TERRA convention: longitude in degrees in
 * (-180, 180], latitude in degrees in [-90, 90], +z towards the north pole.
 *
 * @rst
 * .. code-block:: cpp
 *
 *   using namespace terramesh::geometry;
 *   Vec3 a = normalize({1, 0, 0});
 *   Vec3 b = normalize({0, 1, 0});
 *   Vec3 m = slerp_midpoint(a, b);          // (1/sqrt2, 1/sqrt2, 0)
 *   auto sub = subdivide_triangle(a, b, normalize({0, 0, 1}));
 * @endrst
 */

namespace terramesh::geometry
{

using Vec3 = std::array<double, 3>;

// Below this |a + b| two unit vectors are treated as antipodal.
inline constexpr double kAntipodalTol = 1e-12;

inline constexpr double dot(const Vec3& a, const Vec3& b) noexcept
{
    return a[0] * b[0] + a[1] * b[1] + a[2] * b[2];
}

inline constexpr Vec3 cross(const Vec3& a, const Vec3& b) noexcept
{
    return {a[1] * b[2] - a[2] * b[1], a[2] * b[0] - a[0] * b[2], a[0] * b[1] - a[1] * b[0]};
}

inline constexpr Vec3 add(const Vec3& a, const Vec3& b) noexcept
{
    return {a[0] + b[0], a[1] + b[1], a[2] + b[2]};
}

inline constexpr Vec3 sub(const Vec3& a, const Vec3& b) noexcept
{
    return {a[0] - b[0], a[1] - b[1], a[2] - b[2]};
}

inline constexpr Vec3 scaled(const Vec3& a, double s) noexcept
{
    return {a[0] * s, a[1] * s, a[2] * s};
}

inline double norm(const Vec3& a) noexcept
{
    return std::sqrt(dot(a, a));
}

/// Project @p p onto the unit sphere. Throws DegenerateInputError for the zero vector.
Vec3 normalize(const Vec3& p);

/// Great-circle midpoint of unit vectors @p a and @p b. Throws DegenerateInputError if
/// they are antipodal.
Vec3 slerp_midpoint(const Vec3& a, const Vec3& b);

/// Central angle between two unit vectors (radians), robust near 0 and pi.
double great_circle_distance(const Vec3& a, const Vec3& b) noexcept;

/// True when (a, b, c) winds counter-clockwise seen from outside the sphere.
bool is_counter_clockwise(const Vec3& a, const Vec3& b, const Vec3& c) noexcept;

// One bisection of a spherical triangle. Corner i keeps v_i; children keep the parent's
// winding:
//   corner[0] = (v0, m01, m20)   corner[1] = (v1, m12, m01)   corner[2] = (v2, m20, m12)
//   center    = (m01, m12, m20)
struct Subdivision
{
    std::array<Vec3, 3> midpoints{}; // m01, m12, m20
    std::array<std::array<Vec3, 3>, 4> children{};
};

Subdivision subdivide_triangle(const Vec3& v0, const Vec3& v1, const Vec3& v2);

struct Geographic
{
    double lon = 0.0; // degrees
    double lat = 0.0; // degrees
};

Geographic to_geographic(const Vec3& p);
Vec3 from_geographic(double lon_deg, double lat_deg) noexcept;

} // namespace terramesh::geometry
