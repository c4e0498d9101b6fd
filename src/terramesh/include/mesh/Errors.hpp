#pragma once
#include <stdexcept>
#include <string>

/**
 * @file Errors.hpp
 * @brief Exception types raised by mesh generation.
 *
 * @details
 * All errors are raised at the point of violation; no partially built mesh is ever
 * returned.
 *
 * - :cpp:class:`DegenerateInputError`: zero vector or antipodal pair handed to the
 *   geometry kernel.
 * - :cpp:class:`InvariantViolationError`: vertex/triangle counts do not match the
 *   closed-form values after subdivision (edge deduplication defect).
 * - :cpp:class:`InvalidResolutionError`: rejected build parameters (refinement level,
 *   radius range, radius distribution). Raised before any construction work.
 * - :cpp:class:`FieldNameError`: lookup of an unknown slot by an unrecognised name.
 */

namespace terramesh::mesh
{

class MeshError : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

class DegenerateInputError : public MeshError
{
  public:
    using MeshError::MeshError;
};

class InvariantViolationError : public MeshError
{
  public:
    using MeshError::MeshError;
};

class InvalidResolutionError : public MeshError
{
  public:
    using MeshError::MeshError;
};

class FieldNameError : public MeshError
{
  public:
    using MeshError::MeshError;
};

} // namespace terramesh::mesh
