/// @file default_index.cpp
/// @brief Lock-guarded cache of the most recently requested BrickIndex.

#include "tiling/default_index.hpp"

#include "core/logger.hpp"

#include <mutex>

namespace skybricks::tiling
{

namespace
{

struct IndexCache
{
    std::mutex mutex;
    std::shared_ptr<const BrickIndex> index;
};

IndexCache& cache()
{
    static IndexCache s_cache;
    return s_cache;
}

} // anonymous namespace

std::shared_ptr<const BrickIndex> default_index(f64 brick_size_deg)
{
    IndexCache& c = cache();
    std::lock_guard lock(c.mutex);

    if (!c.index || c.index->brick_size_deg() != brick_size_deg)
    {
        SKB_CORE_DEBUG("default_index: building index for brick size {}°", brick_size_deg);
        c.index = std::make_shared<const BrickIndex>(TilingConfig{.brick_size_deg = brick_size_deg});
    }
    return c.index;
}

std::string brickname(f64 ra, f64 dec, f64 brick_size_deg)
{
    return default_index(brick_size_deg)->name(ra, dec);
}

std::vector<std::string> bricknames(std::span<const f64> ras, std::span<const f64> decs, f64 brick_size_deg)
{
    return default_index(brick_size_deg)->names(ras, decs);
}

} // namespace skybricks::tiling
