#pragma once
#include "mesh/IcosahedralLayer.hpp"
#include "mesh/Layout.hpp"
#include "mesh/MeshIndex.hpp"
#include "mesh/RadialStack.hpp"
#include "mesh/Unknowns.hpp"
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

/**
 * @file Mesh.hpp
 * @brief The layered icosahedral shell mesh handed to solver and I/O collaborators.
 *
 * @details
 * A :cpp:class:`Mesh` is produced by :cpp:func:`build_mesh` and is immutable afterwards:
 * horizontal topology, layer radii, node positions and neighbor tables expose only const
 * accessors. The only mutable part is the unknown-slot storage, which belongs to the
 * solver. Transformations such as :cpp:func:`coarsen` return a new mesh.
 *
 * @rst
 * Sizes for refinement level k (m = 2^k):
 *
 * ============================  ===========================
 * vertices per layer            2 + 10 m^2
 * triangles per layer           20 m^2
 * layers                        m/2 + 1 (integer division)
 * nodes                         vertices * layers
 * unknown scalars               5 * nodes
 * ============================  ===========================
 *
 * .. code-block:: cpp
 *
 *   using namespace terramesh::mesh;
 *   Mesh mesh = build_mesh({.refinement = 4, .inner_radius = 3480.0,
 *                           .outer_radius = 6370.0});
 *   for (NodeId n = 0; n < mesh.node_count(); ++n)
 *       for (NodeId nb : mesh.horizontal_neighbors(n)) { ... }
 *   mesh.unknowns()(n, Unknown::Temperature) = 1600.0;
 * @endrst
 *
 * @note A built mesh may be shared read-only between threads without locking; writes to
 * the unknown storage are the caller's to synchronize.
 */

namespace terramesh::mesh
{

struct ShellParams
{
    int refinement = 0;
    double inner_radius = 1.0;
    double outer_radius = 1.0;
    RadiusDistribution radii{}; // empty = uniform_spacing()
    layout::SlotLayout slots = layout::SlotLayout::Interleaved;
};

struct Layer
{
    int index = 0;
    double radius = 0.0;
};

class Mesh
{
  public:
    Mesh(Mesh&&) noexcept = default;
    Mesh& operator=(Mesh&&) = default;
    Mesh(const Mesh&) = delete;
    Mesh& operator=(const Mesh&) = delete;

    const ShellParams& params() const noexcept { return params_; }
    int refinement() const noexcept { return layer_->level; }

    // ---- layers ----
    int layer_count() const noexcept { return static_cast<int>(radii_.size()); }
    Layer layer(int i) const { return {i, radii_.at(static_cast<std::size_t>(i))}; }
    double radius(int i) const { return radii_.at(static_cast<std::size_t>(i)); }
    std::span<const double> radii() const noexcept { return radii_; }
    double inner_radius() const noexcept { return radii_.front(); }
    double outer_radius() const noexcept { return radii_.back(); }

    // ---- horizontal topology (shared by all layers) ----
    const IcosahedralLayer& horizontal() const noexcept { return *layer_; }
    std::shared_ptr<const IcosahedralLayer> shared_horizontal() const noexcept { return layer_; }
    std::int64_t vertices_per_layer() const noexcept { return index_.vertices_per_layer(); }
    std::int64_t triangle_count() const noexcept
    {
        return static_cast<std::int64_t>(layer_->triangle_count());
    }
    std::span<const Triangle> triangles() const noexcept { return layer_->triangles; }

    // ---- nodes ----
    std::int64_t node_count() const noexcept { return index_.node_count(); }
    NodeId node_id(int layer, VertexId v) const noexcept { return index_.node_id(layer, v); }
    int layer_of(NodeId n) const noexcept { return index_.layer_of(n); }
    VertexId vertex_of(NodeId n) const noexcept { return index_.vertex_of(n); }
    const Vec3& position(NodeId n) const noexcept
    {
        return positions_[static_cast<std::size_t>(n)];
    }
    std::span<const Vec3> positions() const noexcept { return positions_; }

    // ---- neighbors ----
    const MeshIndex& index() const noexcept { return index_; }
    std::span<const VertexId> vertex_neighbors(VertexId v) const noexcept
    {
        return index_.vertex_neighbors(v);
    }
    auto horizontal_neighbors(NodeId n) const noexcept { return index_.horizontal_neighbors(n); }
    RadialNeighbors radial_neighbors(NodeId n) const noexcept
    {
        return index_.radial_neighbors(n);
    }

    // ---- unknown slots (owned by the mesh, populated by solvers) ----
    UnknownStore& unknowns() noexcept { return unknowns_; }
    const UnknownStore& unknowns() const noexcept { return unknowns_; }

    // ---- lookups ----
    std::vector<geometry::Geographic> lateral_points() const;
    VertexId nearest_vertex(double lon_deg, double lat_deg) const noexcept;
    int nearest_layer(double r) const noexcept;
    NodeId nearest_node(double lon_deg, double lat_deg, double r) const noexcept
    {
        return node_id(nearest_layer(r), nearest_vertex(lon_deg, lat_deg));
    }

    /// Value of unknown ``u`` at the node nearest to (lon, lat, r). No interpolation.
    double evaluate(double lon_deg, double lat_deg, double r, Unknown u) const noexcept
    {
        return unknowns_(nearest_node(lon_deg, lat_deg, r), u);
    }
    /// Same, by long or short unknown name; throws FieldNameError.
    double evaluate(double lon_deg, double lat_deg, double r, std::string_view name) const;

  private:
    Mesh() = default;
    friend Mesh build_mesh(const ShellParams& p);

    ShellParams params_{};
    std::shared_ptr<const IcosahedralLayer> layer_;
    std::vector<double> radii_;
    std::vector<Vec3> positions_;
    MeshIndex index_;
    UnknownStore unknowns_;
};

/// Validates all parameters before any construction; throws InvalidResolutionError,
/// DegenerateInputError or InvariantViolationError. Never returns a partial mesh.
Mesh build_mesh(const ShellParams& p);

Mesh build_mesh(int k, double inner_radius, double outer_radius, RadiusDistribution radii = {});

/// New mesh one refinement level down with the same radius range, spacing and slot layout.
Mesh coarsen(const Mesh& mesh);

/// Multi-line human-readable summary.
std::string describe(const Mesh& mesh);

} // namespace terramesh::mesh
