#include "mesh/Unknowns.hpp"
#include "memory/MemoryManager.hpp"
#include "mesh/Errors.hpp"

#include <string>
#include <utility>

namespace terramesh::mesh
{

const char* unknown_name(Unknown u) noexcept
{
    switch (u)
    {
    case Unknown::Pressure:
        return "Pressure";
    case Unknown::VelocityX:
        return "Velocity_x";
    case Unknown::VelocityY:
        return "Velocity_y";
    case Unknown::VelocityZ:
        return "Velocity_z";
    case Unknown::Temperature:
        return "Temperature";
    }
    return "";
}

Unknown unknown_from_name(std::string_view name)
{
    static constexpr std::array<std::string_view, kUnknownsPerNode> short_keys{"p", "u_x", "u_y",
                                                                             "u_z", "t"};
    for (Unknown u : kAllUnknowns)
    {
        if (name == unknown_name(u) || name == short_keys[static_cast<int>(u)])
            return u;
    }
    throw FieldNameError("Unknown field: " + std::string(name));
}

template <class T> static void parallel_fill(T* p, std::size_t n, T val)
{
#pragma omp parallel for schedule(static)
    for (std::ptrdiff_t i = 0; i < static_cast<std::ptrdiff_t>(n); ++i)
        p[i] = val;
}

UnknownStore::UnknownStore(std::int64_t nnodes, layout::SlotLayout kind)
    : idx_{nnodes, kUnknownsPerNode, kind}
{
    auto& mm = memory::MemoryManager::instance();
    data_ = mm.allocate<double>(idx_.size());
    parallel_fill(data_, idx_.size(), 0.0);
}

UnknownStore::~UnknownStore()
{
    memory::MemoryManager::instance().release(data_);
}

UnknownStore::UnknownStore(UnknownStore&& other) noexcept
    : data_(std::exchange(other.data_, nullptr)), idx_(std::exchange(other.idx_, {}))
{
}

UnknownStore& UnknownStore::operator=(UnknownStore&& other) noexcept
{
    if (this != &other)
    {
        memory::MemoryManager::instance().release(data_);
        data_ = std::exchange(other.data_, nullptr);
        idx_ = std::exchange(other.idx_, {});
    }
    return *this;
}

} // namespace terramesh::mesh
