#include "memory/AlignedAlloc.hpp"
#include "memory/MemoryManager.hpp"
#include <catch2/catch_all.hpp>
#include <cstdint>

using terramesh::memory::MemoryManager;

TEMPLATE_TEST_CASE("Aligned allocations respect HW boundary", "[memory][alignment]", float, double,
                   int64_t)
{
    auto& mm = MemoryManager::instance();
    const std::size_t N = 257; // an odd count
    TestType* ptr = mm.allocate<TestType>(N);
    REQUIRE(reinterpret_cast<uintptr_t>(ptr) % terramesh::memory::HW_ALIGN == 0);
    REQUIRE(mm.owns(ptr));
    REQUIRE(mm.bytes_of(ptr) == N * sizeof(TestType));

    mm.release(ptr);
    REQUIRE_FALSE(mm.owns(ptr));
}

TEST_CASE("Releasing foreign or null pointers is a no-op", "[memory]")
{
    auto& mm = MemoryManager::instance();
    const auto before = mm.debug_count();
    int on_stack = 0;
    mm.release(nullptr);
    mm.release(&on_stack);
    REQUIRE(mm.debug_count() == before);
    REQUIRE(mm.bytes_of(&on_stack) == 0);
}
