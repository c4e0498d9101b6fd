#pragma once
#include "log/Log.hpp"
#include "mesh/Layout.hpp"
#include <cctype>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

/**
 * @file   ConfigYAML.hpp
 * @brief  YAML → AppConfig loader and schema for the mesh generator app.
 *
 * @details
 * @rst
 * The **YAML configuration** drives ``terramesh_meshgen``. It selects the shell
 * resolution and radius range, the unknown-slot layout, the writer and the log level.
 *
 * **Schema (v0)**
 *
 * .. code-block:: yaml
 *
 *    case: <string>                 # case name (used for writer artifacts)
 *
 *    mesh:
 *      refinement: 4                # k; m = 2^k, layers = m/2 + 1
 *      inner_radius: 3480.0         # same unit as outer_radius
 *      outer_radius: 6370.0
 *      radial_spacing: uniform      # uniform | boundary
 *
 *    unknowns:
 *      layout: interleaved          # interleaved | planar
 *
 *    io:
 *      backend: xdmf                # xdmf | null
 *      path: out                    # output directory
 *      precision: native            # native | float64 | float32
 *      xdmf_version: v3             # v2 | v3
 *      fields: [Temperature]        # unknowns to write (empty = all five)
 *
 *    log:
 *      level: info                  # quiet | error | warn | info | debug
 *      rank0_only: true
 *
 * **Semantics**
 *
 * - Missing keys keep the defaults of :cpp:struct:`AppConfig`.
 * - ``precision: native`` writes doubles; ``float32`` requests a cast on write.
 * - Parameter validation (radius ordering, refinement range) happens in
 *   :cpp:func:`terramesh::mesh::build_mesh`, not here.
 * @endrst
 */

namespace terramesh::io
{

struct AppConfig
{
    std::string case_name = "shell";

    // mesh
    int refinement = 4;
    double inner_radius = 3480.0;
    double outer_radius = 6370.0;
    std::string radial_spacing = "uniform";

    // unknowns
    layout::SlotLayout slot_layout = layout::SlotLayout::Interleaved;

    // io
    enum class Backend
    {
        Null,
        Xdmf
    };
    enum class Precision
    {
        Native,
        F32,
        F64
    };
    struct IO
    {
        Backend backend = Backend::Null;
        std::string path = "out";
        Precision precision = Precision::Native;
        std::string xdmf_version = "v3";
        std::vector<std::string> fields{}; // empty = all unknowns
    } io;

    // log
    logx::Level log_level = logx::Level::Info;
    bool log_rank0_only = true;
};

static inline std::string to_lower(std::string s)
{
    for (auto& c : s)
        c = (char) std::tolower((unsigned char) c);
    return s;
}
static inline AppConfig::Backend parse_backend(const std::string& s)
{
    auto v = to_lower(s);
    if (v == "xdmf")
        return AppConfig::Backend::Xdmf;
    return AppConfig::Backend::Null;
}
static inline AppConfig::Precision parse_precision(const std::string& s)
{
    auto v = to_lower(s);
    if (v == "float32" || v == "f32")
        return AppConfig::Precision::F32;
    if (v == "float64" || v == "f64")
        return AppConfig::Precision::F64;
    return AppConfig::Precision::Native;
}
static inline layout::SlotLayout parse_slot_layout(const std::string& s)
{
    auto v = to_lower(s);
    if (v == "planar" || v == "soa")
        return layout::SlotLayout::Planar;
    return layout::SlotLayout::Interleaved;
}

inline AppConfig load_config_from_yaml(const std::string& path)
{
    AppConfig cfg;
    YAML::Node root = YAML::LoadFile(path);

    if (auto n = root["case"])
        cfg.case_name = n.as<std::string>();

    if (auto m = root["mesh"])
    {
        if (auto n = m["refinement"])
            cfg.refinement = n.as<int>();
        if (auto n = m["inner_radius"])
            cfg.inner_radius = n.as<double>();
        if (auto n = m["outer_radius"])
            cfg.outer_radius = n.as<double>();
        if (auto n = m["radial_spacing"])
            cfg.radial_spacing = to_lower(n.as<std::string>());
    }

    if (auto u = root["unknowns"])
    {
        if (auto n = u["layout"])
            cfg.slot_layout = parse_slot_layout(n.as<std::string>());
    }

    if (auto I = root["io"])
    {
        if (auto n = I["backend"])
            cfg.io.backend = parse_backend(n.as<std::string>());
        if (auto n = I["path"])
            cfg.io.path = n.as<std::string>();
        if (auto n = I["precision"])
            cfg.io.precision = parse_precision(n.as<std::string>());
        if (auto n = I["xdmf_version"])
        {
            auto v = to_lower(n.as<std::string>());
            // accept only v2 or v3; keep default otherwise
            if (v == "v2" || v == "2")
                cfg.io.xdmf_version = "v2";
            else if (v == "v3" || v == "3")
                cfg.io.xdmf_version = "v3";
        }
        if (auto n = I["fields"])
            cfg.io.fields = n.as<std::vector<std::string>>();
    }

    if (auto L = root["log"])
    {
        if (auto n = L["level"])
            cfg.log_level = logx::level_from_string(n.as<std::string>());
        if (auto n = L["rank0_only"])
            cfg.log_rank0_only = n.as<bool>();
    }

    return cfg;
}

} // namespace terramesh::io
