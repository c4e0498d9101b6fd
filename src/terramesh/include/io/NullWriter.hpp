#pragma once
#include "io/IWriter.hpp"

namespace terramesh::io
{

/// No-op writer (dry runs and smoke tests)
class NullWriter final : public IWriter
{
  public:
    void open_case(const std::string&) override {}
    void write(const mesh::Mesh&) override {}
    void close() override {}
};

} // namespace terramesh::io
