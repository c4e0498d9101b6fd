#include "io/XdmfHdf5Writer.hpp"
#include "log/Log.hpp"
#include "mesh/Unknowns.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <hdf5.h>

namespace terramesh::io
{
namespace fs = std::filesystem;

/// \cond DOXYGEN_EXCLUDE

struct XdmfHdf5Writer::Impl
{
    hid_t file = -1;

    std::string h5_path;
    std::string xmf_path;

    bool opened = false;
};

static hid_t h5_float_type(WriterConfig::Precision p)
{
    return p == WriterConfig::Precision::Float32 ? H5T_IEEE_F32LE : H5T_IEEE_F64LE;
}

static int precision_bytes(WriterConfig::Precision p)
{
    return p == WriterConfig::Precision::Float32 ? 4 : 8;
}

// HDF5 converts mem_type → file_type on write (double→float when requested).
static void write_dataset(hid_t loc, const char* name, hid_t file_type, hid_t mem_type,
                          std::vector<hsize_t> dims, const void* data)
{
    hid_t space = H5Screate_simple((int) dims.size(), dims.data(), nullptr);
    if (space < 0)
        throw std::runtime_error(std::string("HDF5: cannot create dataspace for ") + name);
    hid_t dset = H5Dcreate2(loc, name, file_type, space, H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
    if (dset < 0)
    {
        H5Sclose(space);
        throw std::runtime_error(std::string("HDF5: cannot create dataset ") + name);
    }
    const herr_t st = H5Dwrite(dset, mem_type, H5S_ALL, H5S_ALL, H5P_DEFAULT, data);
    H5Dclose(dset);
    H5Sclose(space);
    if (st < 0)
        throw std::runtime_error(std::string("HDF5: write failed for ") + name);
}

static void write_int_attribute(hid_t loc, const char* name, int value)
{
    hid_t space = H5Screate(H5S_SCALAR);
    hid_t attr = H5Acreate2(loc, name, H5T_STD_I32LE, space, H5P_DEFAULT, H5P_DEFAULT);
    if (attr < 0)
    {
        H5Sclose(space);
        throw std::runtime_error(std::string("HDF5: cannot create attribute ") + name);
    }
    const herr_t st = H5Awrite(attr, H5T_NATIVE_INT, &value);
    H5Aclose(attr);
    H5Sclose(space);
    if (st < 0)
        throw std::runtime_error(std::string("HDF5: attribute write failed for ") + name);
}

// Gather one unknown from (possibly interleaved) storage into a contiguous buffer.
static void pack_strided(double* __restrict d, const double* __restrict s, std::int64_t n,
                         std::size_t stride)
{
    for (std::int64_t i = 0; i < n; ++i)
        d[i] = s[std::size_t(i) * stride];
}

static std::vector<mesh::Unknown> select_unknowns(const std::vector<std::string>& names)
{
    if (names.empty())
        return {mesh::kAllUnknowns.begin(), mesh::kAllUnknowns.end()};
    std::vector<mesh::Unknown> out;
    out.reserve(names.size());
    for (const auto& n : names)
        out.push_back(mesh::unknown_from_name(n)); // throws FieldNameError
    return out;
}

/// \endcond

XdmfHdf5Writer::XdmfHdf5Writer(WriterConfig cfg) : cfg_(std::move(cfg)), impl_(new Impl) {}
XdmfHdf5Writer::~XdmfHdf5Writer()
{
    close();
}

const std::string& XdmfHdf5Writer::h5_path() const noexcept
{
    return impl_->h5_path;
}
const std::string& XdmfHdf5Writer::xmf_path() const noexcept
{
    return impl_->xmf_path;
}

void XdmfHdf5Writer::open_case(const std::string& case_name)
{
    close();
    fs::create_directories(cfg_.path);
    impl_->h5_path = cfg_.path + "/" + case_name + ".h5";
    impl_->xmf_path = cfg_.path + "/" + case_name + ".xmf";

    impl_->file = H5Fcreate(impl_->h5_path.c_str(), H5F_ACC_TRUNC, H5P_DEFAULT, H5P_DEFAULT);
    if (impl_->file < 0)
        throw std::runtime_error("HDF5: cannot create " + impl_->h5_path);
    impl_->opened = true;
    LOGD(Io, "opened %s\n", impl_->h5_path.c_str());
}

void XdmfHdf5Writer::write(const mesh::Mesh& m)
{
    if (!impl_->opened)
        throw std::logic_error("XdmfHdf5Writer::write called before open_case");

    // Resolve field names first so a bad name leaves no partial file content behind.
    const auto selected = select_unknowns(cfg_.fields);

    const hid_t ftype = h5_float_type(cfg_.precision);
    const auto nn = m.node_count();
    const auto nt = m.triangle_count();
    const int nl = m.layer_count();

    // ---- /Mesh ----
    hid_t g = H5Gcreate2(impl_->file, "Mesh", H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
    if (g < 0)
        throw std::runtime_error("HDF5: cannot create group /Mesh");
    try
    {
        write_int_attribute(g, "refinement", m.refinement());
        write_int_attribute(g, "layers", nl);

        write_dataset(g, "coordinates", ftype, H5T_NATIVE_DOUBLE, {(hsize_t) nn, 3},
                      m.positions().data()->data());
        write_dataset(g, "radii", H5T_IEEE_F64LE, H5T_NATIVE_DOUBLE, {(hsize_t) nl},
                      m.radii().data());
        write_dataset(g, "triangles", H5T_STD_I32LE, H5T_NATIVE_INT32, {(hsize_t) nt, 3},
                      m.triangles().data()->data());

        // Prisms between consecutive layers; a single layer degenerates to its triangles.
        // Layer triangles are CCW seen from outside, so both faces are written as (t0, t2, t1)
        // and the wedge base normal points away from the top face.
        const auto tris = m.triangles();
        if (nl > 1)
        {
            std::vector<std::int64_t> cells;
            cells.reserve(std::size_t(nl - 1) * std::size_t(nt) * 6);
            for (int l = 0; l + 1 < nl; ++l)
                for (const auto& t : tris)
                    for (int s = l; s <= l + 1; ++s)
                    {
                        cells.push_back(m.node_id(s, t[0]));
                        cells.push_back(m.node_id(s, t[2]));
                        cells.push_back(m.node_id(s, t[1]));
                    }
            write_dataset(g, "cells", H5T_STD_I64LE, H5T_NATIVE_INT64,
                          {(hsize_t) (nl - 1) * (hsize_t) nt, 6}, cells.data());
        }
        else
        {
            std::vector<std::int64_t> cells;
            cells.reserve(std::size_t(nt) * 3);
            for (const auto& t : tris)
                for (int c = 0; c < 3; ++c)
                    cells.push_back(m.node_id(0, t[c]));
            write_dataset(g, "cells", H5T_STD_I64LE, H5T_NATIVE_INT64, {(hsize_t) nt, 3},
                          cells.data());
        }
    }
    catch (...)
    {
        H5Gclose(g);
        throw;
    }
    H5Gclose(g);

    // ---- /Unknowns ----
    g = H5Gcreate2(impl_->file, "Unknowns", H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
    if (g < 0)
        throw std::runtime_error("HDF5: cannot create group /Unknowns");
    try
    {
        const auto& store = m.unknowns();
        std::vector<double> staging((std::size_t) nn);
        for (auto u : selected)
        {
            pack_strided(staging.data(), store.slot_data(u), nn, store.node_stride());
            write_dataset(g, mesh::unknown_name(u), ftype, H5T_NATIVE_DOUBLE, {(hsize_t) nn},
                          staging.data());
        }
    }
    catch (...)
    {
        H5Gclose(g);
        throw;
    }
    H5Gclose(g);
    H5Fflush(impl_->file, H5F_SCOPE_GLOBAL);

    // ---- XDMF index ----
    const bool v2 = (cfg_.xdmf_version == WriterConfig::XdmfVersion::V2);
    const auto version_str = v2 ? "2.0" : "3.0";
    const auto h5name = fs::path(impl_->h5_path).filename().string();
    const int fbytes = precision_bytes(cfg_.precision);
    const long long ncell = nl > 1 ? (long long) (nl - 1) * nt : (long long) nt;
    const int nper = nl > 1 ? 6 : 3;

    std::ofstream xmf(impl_->xmf_path, std::ios::trunc);
    if (!xmf)
        throw std::runtime_error("cannot open " + impl_->xmf_path);
    xmf << R"(<?xml version="1.0" ?>)" << "\n<Xdmf Version=\"" << version_str
        << "\">\n  <Domain>\n"
        << "    <Grid Name=\"Shell\" GridType=\"Uniform\">\n"
        << "      <Topology TopologyType=\"" << (nl > 1 ? "Wedge" : "Triangle")
        << "\" NumberOfElements=\"" << ncell << "\">\n"
        << "        <DataItem Dimensions=\"" << ncell << " " << nper
        << "\" NumberType=\"Int\" Precision=\"8\" Format=\"HDF\">" << h5name
        << ":/Mesh/cells</DataItem>\n"
        << "      </Topology>\n"
        << "      <Geometry GeometryType=\"XYZ\">\n"
        << "        <DataItem Dimensions=\"" << nn << " 3\" NumberType=\"Float\" Precision=\""
        << fbytes << "\" Format=\"HDF\">" << h5name << ":/Mesh/coordinates</DataItem>\n"
        << "      </Geometry>\n";
    for (auto u : selected)
    {
        const char* name = mesh::unknown_name(u);
        xmf << "      <Attribute Name=\"" << name
            << "\" AttributeType=\"Scalar\" Center=\"Node\">\n"
            << "        <DataItem Dimensions=\"" << nn << "\" NumberType=\"Float\" Precision=\""
            << fbytes << "\" Format=\"HDF\">" << h5name << ":/Unknowns/" << name
            << "</DataItem>\n"
            << "      </Attribute>\n";
    }
    xmf << "    </Grid>\n  </Domain>\n</Xdmf>\n";
    xmf.close();

    LOGI(Io, "wrote %s (%lld nodes, %lld cells, %zu unknowns)\n", impl_->h5_path.c_str(),
         (long long) nn, ncell, selected.size());
}

void XdmfHdf5Writer::close()
{
    if (impl_ && impl_->file >= 0)
    {
        H5Fclose(impl_->file);
        impl_->file = -1;
    }
    if (impl_)
        impl_->opened = false;
}

} // namespace terramesh::io
