#include "mesh/RadialStack.hpp"
#include "mesh/Errors.hpp"
#include "mesh/IcosahedralLayer.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <numbers>
#include <sstream>

namespace terramesh::mesh
{

RadiusDistribution uniform_spacing()
{
    return [](int i, int count, double r_in, double r_out)
    { return r_in + static_cast<double>(i) * (r_out - r_in) / static_cast<double>(count - 1); };
}

RadiusDistribution boundary_refined_spacing()
{
    return [](int i, int count, double r_in, double r_out)
    {
        const double s = static_cast<double>(i) / static_cast<double>(count - 1);
        return r_in + 0.5 * (1.0 - std::cos(std::numbers::pi * s)) * (r_out - r_in);
    };
}

RadiusDistribution distribution_from_name(const std::string& name)
{
    std::string v = name;
    for (auto& c : v)
        c = (char) std::tolower((unsigned char) c);
    if (v == "uniform")
        return uniform_spacing();
    if (v == "boundary" || v == "boundary_refined")
        return boundary_refined_spacing();
    throw InvalidResolutionError("unknown radial spacing: " + name);
}

int layer_count(int k)
{
    if (k < 0 || k > kMaxRefinement)
        throw InvalidResolutionError("layer_count: refinement level " + std::to_string(k) +
                                     " out of range");
    return static_cast<int>(subdivisions_per_edge(k) / 2) + 1;
}

static bool near(double a, double b) noexcept
{
    return std::abs(a - b) <= 1e-12 * std::max(std::abs(a), std::abs(b));
}

std::vector<double> compute_radii(int count, double r_in, double r_out,
                                  const RadiusDistribution& dist)
{
    if (count < 1)
        throw InvalidResolutionError("compute_radii: layer count must be >= 1");
    if (!std::isfinite(r_in) || !std::isfinite(r_out) || !(r_in > 0.0))
    {
        std::ostringstream msg;
        msg << "compute_radii: radii must be finite and positive (r_in=" << r_in
            << ", r_out=" << r_out << ")";
        throw InvalidResolutionError(msg.str());
    }

    if (count == 1)
    {
        // A single layer cannot span a radial range.
        if (r_in != r_out)
            throw InvalidResolutionError(
                "compute_radii: a single layer requires inner_radius == outer_radius");
        return {r_out};
    }

    if (!(r_out > r_in))
    {
        std::ostringstream msg;
        msg << "compute_radii: " << count << " layers need outer_radius > inner_radius (r_in="
            << r_in << ", r_out=" << r_out << ")";
        throw InvalidResolutionError(msg.str());
    }

    const RadiusDistribution& f = dist ? dist : uniform_spacing();
    std::vector<double> radii(static_cast<std::size_t>(count));
    for (int i = 0; i < count; ++i)
    {
        const double r = f(i, count, r_in, r_out);
        if (!std::isfinite(r))
            throw InvalidResolutionError("compute_radii: distribution returned a non-finite "
                                         "radius for layer " +
                                         std::to_string(i));
        radii[i] = r;
    }

    if (!near(radii.front(), r_in) || !near(radii.back(), r_out))
        throw InvalidResolutionError(
            "compute_radii: distribution must start at inner_radius and end at outer_radius");
    radii.front() = r_in;
    radii.back() = r_out;

    for (int i = 1; i < count; ++i)
    {
        if (!(radii[i] > radii[i - 1]))
        {
            std::ostringstream msg;
            msg << "compute_radii: radii not strictly increasing at layer " << i << " ("
                << radii[i - 1] << " -> " << radii[i] << ")";
            throw InvalidResolutionError(msg.str());
        }
    }
    return radii;
}

} // namespace terramesh::mesh
