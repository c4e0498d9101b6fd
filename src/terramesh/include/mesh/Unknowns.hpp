#pragma once
#include "mesh/Layout.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

/**
 * @file Unknowns.hpp
 * @brief Per-node unknown slots: pressure, three velocity components, temperature.
 *
 * @details
 * :cpp:class:`UnknownStore` owns one aligned block of ``5 * node_count`` doubles obtained
 * from the :cpp:class:`terramesh::memory::MemoryManager`, zero-initialized at construction
 * and released on destruction. The mesh generator never writes to it afterwards; solver
 * collaborators populate it through a non-const Mesh.
 *
 * Slot names follow the TERRA output variable names: ``Pressure``, ``Velocity_x``,
 * ``Velocity_y``, ``Velocity_z``, ``Temperature``.
 */

namespace terramesh::mesh
{

using layout::NodeId;

enum class Unknown : int
{
    Pressure = 0,
    VelocityX = 1,
    VelocityY = 2,
    VelocityZ = 3,
    Temperature = 4
};

inline constexpr int kUnknownsPerNode = 5;

inline constexpr std::array<Unknown, kUnknownsPerNode> kAllUnknowns{
    Unknown::Pressure, Unknown::VelocityX, Unknown::VelocityY, Unknown::VelocityZ,
    Unknown::Temperature};

const char* unknown_name(Unknown u) noexcept;

/// Accepts the variable names above and the short field keys p, u_x, u_y, u_z, t.
/// Throws FieldNameError otherwise.
Unknown unknown_from_name(std::string_view name);

class UnknownStore
{
  public:
    UnknownStore() = default;
    UnknownStore(std::int64_t nnodes, layout::SlotLayout kind);
    ~UnknownStore();

    UnknownStore(UnknownStore&& other) noexcept;
    UnknownStore& operator=(UnknownStore&& other) noexcept;
    UnknownStore(const UnknownStore&) = delete;
    UnknownStore& operator=(const UnknownStore&) = delete;

    inline double& operator()(NodeId n, Unknown u) noexcept
    {
        return data_[idx_(n, static_cast<int>(u))];
    }
    inline const double& operator()(NodeId n, Unknown u) const noexcept
    {
        return data_[idx_(n, static_cast<int>(u))];
    }

    // First element of slot u; consecutive nodes are node_stride() elements apart.
    double* slot_data(Unknown u) noexcept { return data_ + idx_(0, static_cast<int>(u)); }
    const double* slot_data(Unknown u) const noexcept
    {
        return data_ + idx_(0, static_cast<int>(u));
    }
    std::size_t node_stride() const noexcept { return idx_.node_stride(); }

    std::span<double> raw() noexcept { return {data_, idx_.size()}; }
    std::span<const double> raw() const noexcept { return {data_, idx_.size()}; }

    std::int64_t node_count() const noexcept { return idx_.nnodes; }
    std::size_t size() const noexcept { return idx_.size(); }
    layout::SlotLayout slot_layout() const noexcept { return idx_.kind; }
    const layout::SlotIndexer& indexer() const noexcept { return idx_; }

  private:
    double* data_ = nullptr; // owned via MemoryManager
    layout::SlotIndexer idx_{};
};

} // namespace terramesh::mesh
