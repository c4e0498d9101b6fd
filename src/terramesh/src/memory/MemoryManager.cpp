#include "memory/MemoryManager.hpp"
#include "memory/AlignedAlloc.hpp"

namespace terramesh::memory
{

MemoryManager& MemoryManager::instance()
{
    static MemoryManager mgr;
    return mgr;
}

std::size_t MemoryManager::debug_count() const noexcept
{
    std::lock_guard<std::mutex> lock(mtx_);
    return registry_.size();
}

bool MemoryManager::owns(const void* p) const noexcept
{
    std::lock_guard<std::mutex> lock(mtx_);
    return registry_.find(p) != registry_.end();
}

std::size_t MemoryManager::bytes_of(const void* p) const noexcept
{
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = registry_.find(p);
    return it == registry_.end() ? 0 : it->second.bytes;
}

MemoryManager::~MemoryManager()
{
    for (auto& [ptr, blk] : registry_)
    {
        aligned_free(blk.host);
    }
}

void MemoryManager::release(void* p) noexcept
{
    if (!p)
        return;
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = registry_.find(p);
    if (it != registry_.end())
    {
        aligned_free(p);
        registry_.erase(it);
    }
}

} // namespace terramesh::memory
