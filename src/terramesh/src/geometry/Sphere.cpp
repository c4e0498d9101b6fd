#include "geometry/Sphere.hpp"
#include "mesh/Errors.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>
#include <sstream>

namespace terramesh::geometry
{

using terramesh::mesh::DegenerateInputError;

Vec3 normalize(const Vec3& p)
{
    const double n = norm(p);
    if (!(n > 0.0) || !std::isfinite(n))
    {
        std::ostringstream msg;
        msg << "normalize: cannot project (" << p[0] << ", " << p[1] << ", " << p[2]
            << ") onto the unit sphere";
        throw DegenerateInputError(msg.str());
    }
    return scaled(p, 1.0 / n);
}

Vec3 slerp_midpoint(const Vec3& a, const Vec3& b)
{
    // For unit vectors the chord midpoint lies on the bisector of the great-circle arc.
    const Vec3 s = add(a, b);
    if (norm(s) < kAntipodalTol)
        throw DegenerateInputError("slerp_midpoint: antipodal endpoints, midpoint undefined");
    return normalize(s);
}

double great_circle_distance(const Vec3& a, const Vec3& b) noexcept
{
    return std::atan2(norm(cross(a, b)), dot(a, b));
}

bool is_counter_clockwise(const Vec3& a, const Vec3& b, const Vec3& c) noexcept
{
    const Vec3 n = cross(sub(b, a), sub(c, a));
    return dot(n, add(add(a, b), c)) > 0.0;
}

Subdivision subdivide_triangle(const Vec3& v0, const Vec3& v1, const Vec3& v2)
{
    Subdivision s;
    const Vec3 m01 = slerp_midpoint(v0, v1);
    const Vec3 m12 = slerp_midpoint(v1, v2);
    const Vec3 m20 = slerp_midpoint(v2, v0);
    s.midpoints = {m01, m12, m20};
    s.children[0] = {v0, m01, m20};
    s.children[1] = {v1, m12, m01};
    s.children[2] = {v2, m20, m12};
    s.children[3] = {m01, m12, m20};
    return s;
}

Geographic to_geographic(const Vec3& p)
{
    const Vec3 u = normalize(p);
    constexpr double deg = 180.0 / std::numbers::pi;
    Geographic g;
    g.lat = std::asin(std::clamp(u[2], -1.0, 1.0)) * deg;
    g.lon = std::atan2(u[1], u[0]) * deg;
    if (g.lon <= -180.0)
        g.lon += 360.0;
    return g;
}

Vec3 from_geographic(double lon_deg, double lat_deg) noexcept
{
    constexpr double rad = std::numbers::pi / 180.0;
    const double lon = lon_deg * rad;
    const double lat = lat_deg * rad;
    const double c = std::cos(lat);
    return {c * std::cos(lon), c * std::sin(lon), std::sin(lat)};
}

} // namespace terramesh::geometry
