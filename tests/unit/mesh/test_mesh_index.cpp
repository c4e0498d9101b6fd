#include "mesh/Errors.hpp"
#include "mesh/IcosahedralLayer.hpp"
#include "mesh/MeshIndex.hpp"
#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <vector>

using namespace terramesh::mesh;

TEST_CASE("Node IDs are layer-major and invertible", "[mesh][index]")
{
    const auto layer = build_layer(1); // 42 vertices
    const MeshIndex idx(layer, 2);

    REQUIRE(idx.vertices_per_layer() == 42);
    REQUIRE(idx.layer_count() == 2);
    REQUIRE(idx.node_count() == 84);

    REQUIRE(idx.node_id(0, 0) == 0);
    REQUIRE(idx.node_id(0, 41) == 41);
    REQUIRE(idx.node_id(1, 0) == 42);
    REQUIRE(idx.node_id(1, 41) == 83);

    for (NodeId n = 0; n < idx.node_count(); ++n)
    {
        CAPTURE(n);
        REQUIRE(idx.node_id(idx.layer_of(n), idx.vertex_of(n)) == n);
    }
}

TEST_CASE("Horizontal valence is 5 at base corners and 6 elsewhere", "[mesh][index]")
{
    const auto layer = build_layer(3);
    const MeshIndex idx(layer, 1);

    REQUIRE(idx.offsets().size() == layer.vertex_count() + 1);
    for (VertexId v = 0; v < (VertexId) layer.vertex_count(); ++v)
    {
        CAPTURE(v);
        REQUIRE(idx.vertex_neighbors(v).size() == (v < 12 ? 5u : 6u));
    }
    // sum of degrees = 2E = 3T
    REQUIRE(idx.adjacency().size() == 3 * layer.triangle_count());
}

TEST_CASE("Horizontal neighbor lists are sorted, unique and symmetric", "[mesh][index]")
{
    const auto layer = build_layer(2);
    const MeshIndex idx(layer, 1);

    for (VertexId v = 0; v < (VertexId) layer.vertex_count(); ++v)
    {
        const auto nb = idx.vertex_neighbors(v);
        CAPTURE(v);
        REQUIRE(std::is_sorted(nb.begin(), nb.end()));
        REQUIRE(std::adjacent_find(nb.begin(), nb.end()) == nb.end());
        REQUIRE(std::find(nb.begin(), nb.end(), v) == nb.end());
        for (VertexId w : nb)
        {
            const auto back = idx.vertex_neighbors(w);
            REQUIRE(std::binary_search(back.begin(), back.end(), v));
        }
    }
}

TEST_CASE("Horizontal neighbors of a node stay in its layer", "[mesh][index]")
{
    const auto layer = build_layer(2);
    const MeshIndex idx(layer, 3);

    for (NodeId n = 0; n < idx.node_count(); ++n)
    {
        const int l = idx.layer_of(n);
        std::vector<NodeId> got;
        for (NodeId m : idx.horizontal_neighbors(n))
            got.push_back(m);
        REQUIRE(got.size() == idx.horizontal_degree(n));

        const auto nb = idx.vertex_neighbors(idx.vertex_of(n));
        for (std::size_t i = 0; i < got.size(); ++i)
        {
            REQUIRE(idx.layer_of(got[i]) == l);
            REQUIRE(idx.vertex_of(got[i]) == nb[i]);
        }
    }
}

TEST_CASE("Radial neighbors list inward before outward", "[mesh][index]")
{
    const auto layer = build_layer(1);
    const MeshIndex idx(layer, 3);
    const NodeId nv = idx.vertices_per_layer();

    SECTION("innermost layer has only an outward neighbor")
    {
        const auto r = idx.radial_neighbors(idx.node_id(0, 7));
        REQUIRE(r.count == 1);
        REQUIRE(r.span()[0] == idx.node_id(1, 7));
    }
    SECTION("interior layer has both")
    {
        const NodeId n = idx.node_id(1, 7);
        const auto r = idx.radial_neighbors(n);
        REQUIRE(r.count == 2);
        REQUIRE(r.ids[0] == n - nv);
        REQUIRE(r.ids[1] == n + nv);
    }
    SECTION("outermost layer has only an inward neighbor")
    {
        const auto r = idx.radial_neighbors(idx.node_id(2, 7));
        REQUIRE(r.count == 1);
        REQUIRE(r.span()[0] == idx.node_id(1, 7));
    }
    SECTION("single layer has none")
    {
        const MeshIndex flat(layer, 1);
        REQUIRE(flat.radial_neighbors(5).count == 0);
        REQUIRE(flat.radial_neighbors(5).span().empty());
    }
}

TEST_CASE("Index needs at least one layer", "[mesh][index][errors]")
{
    const auto layer = build_layer(0);
    REQUIRE_THROWS_AS(MeshIndex(layer, 0), InvalidResolutionError);
}
