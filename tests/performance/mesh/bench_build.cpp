#include "log/Log.hpp"
#include "mesh/Mesh.hpp"
#include "simple_bench.hpp"

#include <cstdlib>
#include <string>

// Usage: bench_build [max_refinement]  (default 6)
int main(int argc, char** argv)
{
    terramesh::logx::init({terramesh::logx::Level::Warn, false});
    const int kmax = (argc > 1) ? std::atoi(argv[1]) : 6;

    for (int k = 2; k <= kmax; ++k)
    {
        const int iters = k >= 6 ? 3 : 10;
        auto s = bench::run([&] { auto m = terramesh::mesh::build_mesh(k, 3480.0, 6370.0); },
                            iters);
        const double nodes = double(terramesh::mesh::expected_vertex_count(k)) *
                             terramesh::mesh::layer_count(k);
        bench::report("build_mesh_k" + std::to_string(k), s, nodes);
    }
    return 0;
}
