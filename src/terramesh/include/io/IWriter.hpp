#pragma once
#include "mesh/Mesh.hpp"
#include <string>

/**
 * @file IWriter.hpp
 * @brief Output abstraction for finished meshes.
 *
 * @details
 * Writers only use the public accessors of :cpp:class:`terramesh::mesh::Mesh`; the mesh
 * library itself performs no I/O.
 *
 * @rst
 * .. code-block:: cpp
 *
 *   using terramesh::io::IWriter;
 *   struct CountingWriter : IWriter {
 *     int writes = 0;
 *     void open_case(const std::string&) override {}
 *     void write(const terramesh::mesh::Mesh&) override { ++writes; }
 *     void close() override {}
 *   };
 * @endrst
 */

namespace terramesh::io
{

class IWriter
{
  public:
    virtual ~IWriter() = default;

    virtual void open_case(const std::string& case_name) = 0;
    virtual void write(const mesh::Mesh& mesh) = 0; // blocking
    virtual void close() = 0;
};

} // namespace terramesh::io
