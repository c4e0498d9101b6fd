#include "mesh/Mesh.hpp"
#include "log/Log.hpp"
#include "mesh/Errors.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <utility>

namespace terramesh::mesh
{

Mesh build_mesh(const ShellParams& p)
{
    // Reject bad parameters before any construction work.
    const int nlayers = layer_count(p.refinement);
    std::vector<double> radii = compute_radii(nlayers, p.inner_radius, p.outer_radius, p.radii);

    Mesh mesh;
    mesh.params_ = p;
    mesh.layer_ = std::make_shared<const IcosahedralLayer>(build_layer(p.refinement));
    mesh.radii_ = std::move(radii);
    mesh.index_ = MeshIndex(*mesh.layer_, nlayers);

    const auto nv = mesh.index_.vertices_per_layer();
    const auto nn = mesh.index_.node_count();
    mesh.positions_.resize(static_cast<std::size_t>(nn));

    const auto& unit = mesh.layer_->vertices;
#pragma omp parallel for schedule(static)
    for (std::ptrdiff_t n = 0; n < static_cast<std::ptrdiff_t>(nn); ++n)
    {
        const double r = mesh.radii_[static_cast<std::size_t>(n / nv)];
        mesh.positions_[n] = geometry::scaled(unit[static_cast<std::size_t>(n % nv)], r);
    }

    mesh.unknowns_ = UnknownStore(nn, p.slots);

    LOGI(Mesh, "k=%d | vertices/layer=%lld triangles/layer=%lld | layers=%d r=[%g, %g] | "
         "nodes=%lld unknowns=%zu\n",
         p.refinement, (long long) nv, (long long) mesh.triangle_count(), nlayers,
         mesh.radii_.front(), mesh.radii_.back(), (long long) nn, mesh.unknowns_.size());
    return mesh;
}

Mesh build_mesh(int k, double inner_radius, double outer_radius, RadiusDistribution radii)
{
    return build_mesh(ShellParams{.refinement = k,
                                  .inner_radius = inner_radius,
                                  .outer_radius = outer_radius,
                                  .radii = std::move(radii)});
}

Mesh coarsen(const Mesh& mesh)
{
    if (mesh.refinement() == 0)
        throw InvalidResolutionError("coarsen: mesh is already at refinement level 0");
    ShellParams p = mesh.params();
    p.refinement -= 1;
    return build_mesh(p);
}

std::vector<geometry::Geographic> Mesh::lateral_points() const
{
    std::vector<geometry::Geographic> out;
    out.reserve(layer_->vertex_count());
    for (const Vec3& v : layer_->vertices)
        out.push_back(geometry::to_geographic(v));
    return out;
}

VertexId Mesh::nearest_vertex(double lon_deg, double lat_deg) const noexcept
{
    // Largest dot product == smallest central angle; first hit wins ties.
    const Vec3 q = geometry::from_geographic(lon_deg, lat_deg);
    const auto& verts = layer_->vertices;
    VertexId best = 0;
    double best_dot = -2.0;
    for (std::size_t v = 0; v < verts.size(); ++v)
    {
        const double d = geometry::dot(q, verts[v]);
        if (d > best_dot)
        {
            best_dot = d;
            best = static_cast<VertexId>(v);
        }
    }
    return best;
}

int Mesh::nearest_layer(double r) const noexcept
{
    auto it = std::lower_bound(radii_.begin(), radii_.end(), r);
    if (it == radii_.begin())
        return 0;
    if (it == radii_.end())
        return layer_count() - 1;
    const auto hi = static_cast<int>(it - radii_.begin());
    return (r - radii_[hi - 1] <= radii_[hi] - r) ? hi - 1 : hi;
}

double Mesh::evaluate(double lon_deg, double lat_deg, double r, std::string_view name) const
{
    return evaluate(lon_deg, lat_deg, r, unknown_from_name(name));
}

// Shortest round-trip form, always with a decimal point: 1000 -> "1000.0".
static std::string format_radius(double r)
{
    char buf[64];
    const auto res = std::to_chars(buf, buf + sizeof(buf), r);
    std::string s(buf, res.ptr);
    if (s.find_first_of(".eEn") == std::string::npos)
        s += ".0";
    return s;
}

std::string describe(const Mesh& mesh)
{
    std::ostringstream os;
    os << "TerraMesh:\n"
       << std::setw(26) << "refinement level" << ": " << mesh.refinement() << "\n"
       << std::setw(26) << "number of radii" << ": " << mesh.layer_count() << "\n"
       << std::setw(26) << "radius limits" << ": (" << format_radius(mesh.inner_radius())
       << ", " << format_radius(mesh.outer_radius()) << ")\n"
       << std::setw(26) << "number of lateral points" << ": " << mesh.vertices_per_layer()
       << "\n"
       << std::setw(26) << "number of nodes" << ": " << mesh.node_count() << "\n"
       << std::setw(26) << "unknowns" << ": [";
    for (std::size_t i = 0; i < kAllUnknowns.size(); ++i)
        os << (i ? ", " : "") << unknown_name(kAllUnknowns[i]);
    os << "]";
    return os.str();
}

} // namespace terramesh::mesh
