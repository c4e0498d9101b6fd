#include "io/ConfigYAML.hpp" // AppConfig + load_config_from_yaml()
#include "io/NullWriter.hpp"
#include "io/WriterConfig.hpp"
#include "io/XdmfHdf5Writer.hpp"
#include "log/Log.hpp"
#include "memory/MemoryManager.hpp"
#include "mesh/Mesh.hpp"

#include <cstdlib>
#include <exception>
#include <memory>
#include <string>

#include <mpi.h>
#include <omp.h>

using terramesh::io::AppConfig;
using terramesh::io::IWriter;
using terramesh::io::NullWriter;
using terramesh::io::WriterConfig;
using terramesh::io::XdmfHdf5Writer;
namespace mesh = terramesh::mesh;
namespace logx = terramesh::logx;

// ---- MPI once-only lifetime -------------------------------------------------
// Initializes MPI (FUNNELED) exactly once; finalizes only if we were the owner.
struct MpiOnce
{
    bool mpi_owner{false};

    MpiOnce(int& argc, char**& argv)
    {
        int inited = 0;
        MPI_Initialized(&inited);
        if (!inited)
        {
            int provided = MPI_THREAD_SINGLE;
            MPI_Init_thread(&argc, &argv, MPI_THREAD_FUNNELED, &provided);
            mpi_owner = true;
        }
    }
    ~MpiOnce()
    {
        int mfin = 0;
        MPI_Finalized(&mfin);
        if (!mfin)
        {
            int minit = 0;
            MPI_Initialized(&minit);
            if (minit && mpi_owner)
                MPI_Finalize();
        }
    }
};

// Map AppConfig backend → WriterConfig backend
static inline WriterConfig::Backend to_writer_backend(AppConfig::Backend b)
{
    using B = AppConfig::Backend;
    using WB = WriterConfig::Backend;
    switch (b)
    {
    case B::Xdmf:
        return WB::XDMF;
    default:
        return WB::Null;
    }
}

static inline WriterConfig::Precision to_writer_precision(AppConfig::Precision p)
{
    return p == AppConfig::Precision::F32 ? WriterConfig::Precision::Float32
                                          : WriterConfig::Precision::Float64;
}

static std::unique_ptr<IWriter> make_writer(const AppConfig& cfg)
{
    WriterConfig wcfg;
    wcfg.backend = to_writer_backend(cfg.io.backend);
    wcfg.path = cfg.io.path;
    wcfg.precision = to_writer_precision(cfg.io.precision);
    wcfg.fields = cfg.io.fields;
    wcfg.xdmf_version = (cfg.io.xdmf_version == "v2") ? WriterConfig::XdmfVersion::V2
                                                      : WriterConfig::XdmfVersion::V3;
    if (wcfg.backend == WriterConfig::Backend::XDMF)
        return std::make_unique<XdmfHdf5Writer>(wcfg);
    return std::make_unique<NullWriter>();
}

static int run(const std::string& cfg_path)
{
    int rank = 0, size = 1;
    MPI_Comm_rank(MPI_COMM_WORLD, &rank);
    MPI_Comm_size(MPI_COMM_WORLD, &size);

    // 1) Parse YAML config
    const AppConfig cfg = terramesh::io::load_config_from_yaml(cfg_path);
    logx::init({cfg.log_level, cfg.log_rank0_only});
    LOGI(Run, "mpi=%d | omp=%d | config=%s\n", size, omp_get_max_threads(), cfg_path.c_str());

    // 2) Build the shell (every rank holds the full mesh)
    mesh::ShellParams p;
    p.refinement = cfg.refinement;
    p.inner_radius = cfg.inner_radius;
    p.outer_radius = cfg.outer_radius;
    p.radii = mesh::distribution_from_name(cfg.radial_spacing);
    p.slots = cfg.slot_layout;
    mesh::Mesh m = mesh::build_mesh(p);

    LOGI(Run, "%s\n", mesh::describe(m).c_str());
    LOGD(Mem, "tracked blocks=%zu\n", terramesh::memory::MemoryManager::instance().debug_count());

    // 3) Output (rank 0 only; the mesh is replicated)
    if (rank == 0)
    {
        auto writer = make_writer(cfg);
        writer->open_case(cfg.case_name);
        writer->write(m);
        writer->close();
    }
    MPI_Barrier(MPI_COMM_WORLD);
    return EXIT_SUCCESS;
}

int main(int argc, char** argv)
{
    MpiOnce runtime(argc, argv);
    logx::init({logx::Level::Info, /*rank0_only*/ true});

    const std::string cfg_path = (argc > 1) ? argv[1] : "mesh.yaml";
    try
    {
        return run(cfg_path);
    }
    catch (const std::exception& e)
    {
        LOGE(Run, "terramesh_meshgen: %s\n", e.what());
        MPI_Abort(MPI_COMM_WORLD, EXIT_FAILURE);
        return EXIT_FAILURE;
    }
}
