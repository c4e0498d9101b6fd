#pragma once
#include "io/IWriter.hpp"
#include "io/WriterConfig.hpp"
#include <memory>
#include <string>

/**
 * @file XdmfHdf5Writer.hpp
 * @brief HDF5 datasets for a shell mesh + XDMF XML index.
 *
 * @details
 * Layout of ``<path>/<case>.h5``:
 *
 * - ``/Mesh/coordinates``  node_count x 3 (Cartesian, scaled by layer radius)
 * - ``/Mesh/radii``        layer_count
 * - ``/Mesh/triangles``    triangles x 3, vertex IDs of the shared horizontal layer
 * - ``/Mesh/cells``        (layers-1)·triangles x 6 node IDs (prisms between consecutive
 *   layers, bottom triangle then top triangle, both wound (t0, t2, t1) so the base faces
 *   inward as a VTK wedge expects); triangles x 3 node IDs for a single layer
 * - ``/Unknowns/<name>``   node_count, one dataset per selected unknown
 *
 * ``<path>/<case>.xmf`` references those datasets with a ``Wedge`` (or ``Triangle``)
 * topology and node-centred attributes, so ParaView/VisIt can open the mesh directly.
 */

namespace terramesh::io
{

class XdmfHdf5Writer : public IWriter
{
  public:
    explicit XdmfHdf5Writer(WriterConfig cfg);
    ~XdmfHdf5Writer() override;

    void open_case(const std::string& case_name) override;
    void write(const mesh::Mesh& mesh) override;
    void close() override;

    const std::string& h5_path() const noexcept;
    const std::string& xmf_path() const noexcept;

  private:
    WriterConfig cfg_;

    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace terramesh::io
