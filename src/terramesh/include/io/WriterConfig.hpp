#pragma once
#include <string>
#include <vector>

/**
 * @file WriterConfig.hpp
 * @brief Configuration for mesh writers (backend selection, precision, field selection).
 *
 * @rst
 * .. code-block:: cpp
 *
 *   WriterConfig cfg;
 *   cfg.backend   = WriterConfig::Backend::XDMF;
 *   cfg.precision = WriterConfig::Precision::Float32;
 *   cfg.path      = "out/mantle";
 *   cfg.fields    = {"Temperature"};
 * @endrst
 */

namespace terramesh::io
{

struct WriterConfig
{
    enum class Backend
    {
        XDMF,
        Null
    };
    Backend backend = Backend::XDMF;

    std::string path = "output";     // case directory
    std::vector<std::string> fields; // unknown names to write (empty = all)

    // Casting on write for coordinates and unknowns (double→float)
    enum class Precision
    {
        Float32,
        Float64
    };
    Precision precision = Precision::Float64;

    // XDMF XML version selector (affects only the XML index; HDF5 stays the same)
    enum class XdmfVersion
    {
        V2,
        V3
    };
    XdmfVersion xdmf_version = XdmfVersion::V3;
};

} // namespace terramesh::io
