#include "io/NullWriter.hpp"
#include "io/WriterConfig.hpp"
#include "io/XdmfHdf5Writer.hpp"
#include "mesh/Errors.hpp"
#include "mesh/Mesh.hpp"
#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <hdf5.h>

#include <array>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace terramesh::io;
using namespace terramesh::mesh;
namespace fs = std::filesystem;
using Catch::Approx;

static std::vector<hsize_t> h5_dims(hid_t d)
{
    hid_t sp = H5Dget_space(d);
    REQUIRE(sp >= 0);
    const int nd = H5Sget_simple_extent_ndims(sp);
    std::vector<hsize_t> dims(std::size_t(nd > 0 ? nd : 0));
    H5Sget_simple_extent_dims(sp, dims.data(), nullptr);
    H5Sclose(sp);
    return dims;
}

template <class T>
static std::vector<T> h5_read(const std::string& file, const std::string& dset, hid_t mem_type,
                              std::vector<hsize_t>& dims, bool* is_f32 = nullptr)
{
    hid_t f = H5Fopen(file.c_str(), H5F_ACC_RDONLY, H5P_DEFAULT);
    REQUIRE(f >= 0);
    hid_t d = H5Dopen2(f, dset.c_str(), H5P_DEFAULT);
    REQUIRE(d >= 0);
    dims = h5_dims(d);

    if (is_f32)
    {
        hid_t t = H5Dget_type(d);
        *is_f32 = H5Tequal(t, H5T_IEEE_F32LE) > 0;
        H5Tclose(t);
    }

    std::size_t n = 1;
    for (auto x : dims)
        n *= std::size_t(x);
    std::vector<T> out(n);
    REQUIRE(H5Dread(d, mem_type, H5S_ALL, H5S_ALL, H5P_DEFAULT, out.data()) >= 0);

    H5Dclose(d);
    H5Fclose(f);
    return out;
}

static std::string slurp(const std::string& path)
{
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

TEST_CASE("XDMF/HDF5 writer stores geometry, prisms and unknowns", "[io][xdmf]")
{
    Mesh m = build_mesh(1, 1.0, 2.0); // 42 vertices, 80 triangles, 2 layers
    for (NodeId n = 0; n < m.node_count(); ++n)
    {
        m.unknowns()(n, Unknown::Temperature) = 1000.0 + double(n);
        m.unknowns()(n, Unknown::VelocityZ) = -0.5 * double(n);
    }

    WriterConfig cfg;
    cfg.backend = WriterConfig::Backend::XDMF;
    fs::path outdir = fs::temp_directory_path() / "terramesh_xdmf_rt";
    fs::create_directories(outdir);
    cfg.path = outdir.string();

    XdmfHdf5Writer W(cfg);
    W.open_case("shell_k1");
    W.write(m);
    W.close();

    const std::string h5 = (outdir / "shell_k1.h5").string();
    REQUIRE(W.h5_path() == h5);
    std::vector<hsize_t> dims;

    auto xyz = h5_read<double>(h5, "/Mesh/coordinates", H5T_NATIVE_DOUBLE, dims);
    REQUIRE(dims == std::vector<hsize_t>{84, 3});
    for (NodeId n = 0; n < m.node_count(); ++n)
        for (int c = 0; c < 3; ++c)
            REQUIRE(xyz[std::size_t(n) * 3 + c] == m.position(n)[c]);

    auto radii = h5_read<double>(h5, "/Mesh/radii", H5T_NATIVE_DOUBLE, dims);
    REQUIRE(radii == std::vector<double>{1.0, 2.0});

    auto tris = h5_read<std::int32_t>(h5, "/Mesh/triangles", H5T_NATIVE_INT32, dims);
    REQUIRE(dims == std::vector<hsize_t>{80, 3});
    REQUIRE(tris[0] == m.triangles()[0][0]);

    auto cells = h5_read<std::int64_t>(h5, "/Mesh/cells", H5T_NATIVE_INT64, dims);
    REQUIRE(dims == std::vector<hsize_t>{80, 6});
    for (std::size_t t = 0; t < 80; ++t)
    {
        const auto& tri = m.triangles()[t];
        const int order[3] = {0, 2, 1};
        for (int c = 0; c < 3; ++c)
        {
            REQUIRE(cells[t * 6 + c] == m.node_id(0, tri[order[c]]));
            REQUIRE(cells[t * 6 + 3 + c] == m.node_id(1, tri[order[c]]));
        }
    }

    // wedge base normal points away from the top face (positive VTK wedge volume)
    for (std::size_t t = 0; t < 80; ++t)
    {
        CAPTURE(t);
        std::array<std::array<double, 3>, 6> p{};
        for (int c = 0; c < 6; ++c)
            for (int d = 0; d < 3; ++d)
                p[c][d] = xyz[std::size_t(cells[t * 6 + c]) * 3 + d];

        std::array<double, 3> e1{}, e2{}, up{};
        for (int d = 0; d < 3; ++d)
        {
            e1[d] = p[1][d] - p[0][d];
            e2[d] = p[2][d] - p[0][d];
            up[d] = (p[3][d] + p[4][d] + p[5][d] - p[0][d] - p[1][d] - p[2][d]) / 3.0;
        }
        const std::array<double, 3> n{e1[1] * e2[2] - e1[2] * e2[1],
                                      e1[2] * e2[0] - e1[0] * e2[2],
                                      e1[0] * e2[1] - e1[1] * e2[0]};
        REQUIRE(n[0] * up[0] + n[1] * up[1] + n[2] * up[2] < 0.0);
    }

    auto T = h5_read<double>(h5, "/Unknowns/Temperature", H5T_NATIVE_DOUBLE, dims);
    REQUIRE(dims == std::vector<hsize_t>{84});
    for (std::size_t n = 0; n < T.size(); ++n)
        REQUIRE(T[n] == 1000.0 + double(n));

    auto w = h5_read<double>(h5, "/Unknowns/Velocity_z", H5T_NATIVE_DOUBLE, dims);
    REQUIRE(w[10] == -5.0);

    const std::string xmf = slurp((outdir / "shell_k1.xmf").string());
    CHECK(xmf.find("Version=\"3.0\"") != std::string::npos);
    CHECK(xmf.find("TopologyType=\"Wedge\"") != std::string::npos);
    CHECK(xmf.find("NumberOfElements=\"80\"") != std::string::npos);
    CHECK(xmf.find("shell_k1.h5:/Mesh/coordinates") != std::string::npos);
    CHECK(xmf.find("Name=\"Pressure\"") != std::string::npos);
    CHECK(xmf.find("shell_k1.h5:/Unknowns/Temperature") != std::string::npos);
}

TEST_CASE("XDMF/HDF5 writer casts to float32 and filters fields", "[io][xdmf]")
{
    Mesh m = build_mesh({.refinement = 1,
                         .inner_radius = 1.0,
                         .outer_radius = 2.0,
                         .slots = terramesh::layout::SlotLayout::Planar});
    for (NodeId n = 0; n < m.node_count(); ++n)
        m.unknowns()(n, Unknown::Pressure) = 0.25 * double(n);

    WriterConfig cfg;
    fs::path outdir = fs::temp_directory_path() / "terramesh_xdmf_f32";
    fs::create_directories(outdir);
    cfg.path = outdir.string();
    cfg.precision = WriterConfig::Precision::Float32;
    cfg.xdmf_version = WriterConfig::XdmfVersion::V2;
    cfg.fields = {"p"};

    XdmfHdf5Writer W(cfg);
    W.open_case("shell_f32");
    W.write(m);
    W.close();

    const std::string h5 = (outdir / "shell_f32.h5").string();
    std::vector<hsize_t> dims;
    bool f32 = false;
    auto P = h5_read<double>(h5, "/Unknowns/Pressure", H5T_NATIVE_DOUBLE, dims, &f32);
    REQUIRE(f32);
    for (std::size_t n = 0; n < P.size(); ++n)
        REQUIRE(P[n] == Approx(0.25 * double(n)).margin(1e-6));

    // only the selected unknown was written
    hid_t f = H5Fopen(h5.c_str(), H5F_ACC_RDONLY, H5P_DEFAULT);
    REQUIRE(f >= 0);
    CHECK(H5Lexists(f, "/Unknowns/Pressure", H5P_DEFAULT) > 0);
    CHECK(H5Lexists(f, "/Unknowns/Temperature", H5P_DEFAULT) == 0);
    H5Fclose(f);

    const std::string xmf = slurp((outdir / "shell_f32.xmf").string());
    CHECK(xmf.find("Version=\"2.0\"") != std::string::npos);
    CHECK(xmf.find("Precision=\"4\"") != std::string::npos);
    CHECK(xmf.find("Name=\"Temperature\"") == std::string::npos);
}

TEST_CASE("Single-layer meshes are written as triangles", "[io][xdmf]")
{
    const Mesh m = build_mesh(0, 6370.0, 6370.0);

    WriterConfig cfg;
    fs::path outdir = fs::temp_directory_path() / "terramesh_xdmf_surface";
    fs::create_directories(outdir);
    cfg.path = outdir.string();

    XdmfHdf5Writer W(cfg);
    W.open_case("surface");
    W.write(m);
    W.close();

    std::vector<hsize_t> dims;
    auto cells = h5_read<std::int64_t>((outdir / "surface.h5").string(), "/Mesh/cells",
                                       H5T_NATIVE_INT64, dims);
    REQUIRE(dims == std::vector<hsize_t>{20, 3});

    const std::string xmf = slurp((outdir / "surface.xmf").string());
    CHECK(xmf.find("TopologyType=\"Triangle\"") != std::string::npos);
}

TEST_CASE("Writer rejects unknown field names and misuse", "[io][xdmf][errors]")
{
    const Mesh m = build_mesh(0, 1.0, 1.0);

    WriterConfig cfg;
    fs::path outdir = fs::temp_directory_path() / "terramesh_xdmf_bad";
    fs::create_directories(outdir);
    cfg.path = outdir.string();
    cfg.fields = {"Viscosity"};

    XdmfHdf5Writer W(cfg);
    REQUIRE_THROWS_AS(W.write(m), std::logic_error);
    W.open_case("bad");
    REQUIRE_THROWS_AS(W.write(m), FieldNameError);
    W.close();

    NullWriter N;
    N.open_case("nothing");
    N.write(m);
    N.close();
}
