#pragma once
#include <functional>
#include <string>
#include <vector>

/**
 * @file RadialStack.hpp
 * @brief Layer count and radius placement between the inner and outer shell boundary.
 *
 * @details
 * A refinement level k (m = 2^k) carries L = m/2 + 1 layers, with integer division, so
 * k = 0 yields a single layer. The radius of layer i is supplied by a
 * :cpp:type:`RadiusDistribution` strategy; the horizontal topology is never touched.
 *
 * Rules enforced by :cpp:func:`compute_radii` (violations raise InvalidResolutionError):
 *
 * - ``L == 1``: inner and outer radius must coincide; the layer sits at the outer radius.
 * - ``L > 1``: ``0 < r_in < r_out``; radii are finite, strictly increasing, and start and
 *   end on the boundaries (pinned exactly after a relative 1e-12 check).
 *
 * @rst
 * .. code-block:: cpp
 *
 *   auto r = compute_radii(layer_count(4), 3480.0, 6370.0, boundary_refined_spacing());
 * @endrst
 */

namespace terramesh::mesh
{

/// radius(i, count, r_in, r_out) for layer i in [0, count).
using RadiusDistribution = std::function<double(int, int, double, double)>;

RadiusDistribution uniform_spacing();

/// Gauss–Lobatto (cosine) clustering towards both boundary layers.
RadiusDistribution boundary_refined_spacing();

/// "uniform" | "boundary". Throws InvalidResolutionError for other names.
RadiusDistribution distribution_from_name(const std::string& name);

int layer_count(int k);

std::vector<double> compute_radii(int count, double r_in, double r_out,
                                  const RadiusDistribution& dist = {});

} // namespace terramesh::mesh
