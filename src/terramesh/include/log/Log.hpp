#pragma once
#include <atomic>
#include <cctype>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <mpi.h>
#include <string>

/**
 * @file Log.hpp
 * @brief Leveled, channel-tagged printf logging for the mesh generator.
 *
 * @details
 * Every line carries a level tag and the channel of the code that emitted it:
 *
 * - ``mesh``: one DEBUG line per bisection pass of the layer builder (vertex and triangle
 *   counts after the pass) and one INFO summary per :cpp:func:`build_mesh` (refinement,
 *   vertices and triangles per layer, layer count, radius range, node and unknown counts).
 * - ``io``: DEBUG when a case file is opened, INFO with node/cell/unknown counts once the
 *   HDF5 and XDMF files are written.
 * - ``mem``: DEBUG count of tracked aligned blocks.
 * - ``run``: the app's MPI/OpenMP setup, the mesh description and ERROR lines for any
 *   failure that ends the run with a non-zero status.
 *
 * Verbosity comes from :cpp:struct:`Config` or, when the caller leaves it at ``Info``,
 * from the ``TERRAMESH_LOG`` environment variable (``quiet|error|warn|info|debug``).
 * Under MPI every rank builds the same mesh, so INFO/DEBUG can be gated to rank 0.
 * Output goes to ``stderr`` unless :cpp:func:`set_sink` redirects it.
 *
 * @rst
 * .. code-block:: cpp
 *
 *   terramesh::logx::init({terramesh::logx::Level::Info, true});
 *   LOGI(Mesh, "k=%d layers=%d\n", k, L);   // "[info ] [mesh] k=4 layers=9"
 * @endrst
 */

namespace terramesh::logx
{

enum class Level : int
{
    Quiet = 0,
    Error = 1,
    Warn = 2,
    Info = 3,
    Debug = 4
};

enum class Channel : int
{
    Run,
    Mesh,
    Io,
    Mem
};

struct Config
{
    Level level = Level::Info; // overridden by TERRAMESH_LOG if left at Info
    bool rank0_only = false;   // gate INFO/DEBUG to rank 0
};

inline int g_rank = 0;
inline std::atomic<Level> g_level{Level::Info};
inline std::atomic<bool> g_rank0_only{false};
inline std::atomic<std::FILE*> g_sink{nullptr}; // nullptr = stderr

inline Level level_from_string(std::string s, Level fallback = Level::Info)
{
    for (auto& c : s)
        c = static_cast<char>(::tolower(static_cast<unsigned char>(c)));
    if (s == "quiet")
        return Level::Quiet;
    if (s == "error")
        return Level::Error;
    if (s == "warn" || s == "warning")
        return Level::Warn;
    if (s == "info")
        return Level::Info;
    if (s == "debug" || s == "full")
        return Level::Debug;
    return fallback;
}

inline Level level_from_env()
{
    const char* v = std::getenv("TERRAMESH_LOG");
    return v ? level_from_string(v) : Level::Info;
}

inline void init(const Config& cfg = {})
{
    int inited = 0;
    MPI_Initialized(&inited);
    if (inited)
        MPI_Comm_rank(MPI_COMM_WORLD, &g_rank);

    g_level.store(cfg.level == Level::Info ? level_from_env() : cfg.level);
    g_rank0_only.store(cfg.rank0_only);
}

inline void set_sink(std::FILE* f) noexcept
{
    g_sink.store(f);
}

inline const char* level_tag(Level L)
{
    switch (L)
    {
    case Level::Error:
        return "[error] ";
    case Level::Warn:
        return "[warn ] ";
    case Level::Info:
        return "[info ] ";
    case Level::Debug:
        return "[debug] ";
    default:
        return "";
    }
}

inline const char* channel_tag(Channel c)
{
    switch (c)
    {
    case Channel::Mesh:
        return "[mesh] ";
    case Channel::Io:
        return "[io  ] ";
    case Channel::Mem:
        return "[mem ] ";
    default:
        return "[run ] ";
    }
}

/// True when a message at level L is suppressed on this rank.
inline bool gate(Level L)
{
    if (L == Level::Quiet || L > g_level.load())
        return true;
    return g_rank0_only.load() && g_rank != 0 && L >= Level::Info;
}

inline void vprint(Level L, Channel c, const char* fmt, va_list ap)
{
    if (gate(L))
        return;
    std::FILE* out = g_sink.load();
    if (!out)
        out = stderr;
    std::fputs(level_tag(L), out);
    if (g_rank != 0 && L >= Level::Info)
        std::fprintf(out, "[r%d] ", g_rank);
    std::fputs(channel_tag(c), out);
    std::vfprintf(out, fmt, ap);
    std::fflush(out);
}

inline void print(Level L, Channel c, const char* fmt, ...)
{
    va_list ap;
    va_start(ap, fmt);
    vprint(L, c, fmt, ap);
    va_end(ap);
}

#define TERRAMESH_LOG_AT(lvl, ch, ...)                                                    \
    ::terramesh::logx::print(::terramesh::logx::Level::lvl, ::terramesh::logx::Channel::ch, \
                             __VA_ARGS__)
#define LOGD(ch, ...) TERRAMESH_LOG_AT(Debug, ch, __VA_ARGS__)
#define LOGI(ch, ...) TERRAMESH_LOG_AT(Info, ch, __VA_ARGS__)
#define LOGW(ch, ...) TERRAMESH_LOG_AT(Warn, ch, __VA_ARGS__)
#define LOGE(ch, ...) TERRAMESH_LOG_AT(Error, ch, __VA_ARGS__)

} // namespace terramesh::logx
