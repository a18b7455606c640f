#ifndef CHUNK_ROUTER_HPP
#define CHUNK_ROUTER_HPP

#include "accumulation/entity_key.hpp"
#include "spatial_index.hpp"

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace routing {

struct RoutedGridpoint {
  GridpointKey gridpoint;
  accumulation::EntityKey entity;
  size_t offset = 0; // position inside the chunk window
};

/**
 * Accumulator targets of one grid window: every gridpoint of the window and,
 * for each region touching the window, the member gridpoints that fall
 * inside it (as indices into `gridpoints`).
 */
struct RoutePlan {
  GridRange range;
  std::vector<RoutedGridpoint> gridpoints;
  std::map<RegionKey, std::vector<size_t>> region_members;

  size_t target_count() const {
    return gridpoints.size() + region_members.size();
  }
};

/**
 * Maps chunk windows onto accumulator keys by pure lookup in a SpatialIndex.
 * Plans are cached per window so repeated chunks over the same window (other
 * times, other variables) reuse the first lookup. Safe to share between
 * worker threads.
 */
class ChunkRouter {
public:
  // Throws core::ConfigurationError for a null index
  explicit ChunkRouter(std::shared_ptr<const SpatialIndex> index);

  std::shared_ptr<const RoutePlan> route(const GridRange &range) const;

  std::optional<GridpointKey>
  route_station(const std::string &station_id) const;

  accumulation::EntityKey gridpoint_entity(const GridpointKey &gridpoint) const;

  size_t cached_plan_count() const;

private:
  std::shared_ptr<RoutePlan> build_plan(const GridRange &range) const;

  std::shared_ptr<const SpatialIndex> index_;
  mutable std::mutex cache_mutex_;
  mutable std::map<GridRange, std::shared_ptr<const RoutePlan>> plan_cache_;
};

} // namespace routing

#endif // CHUNK_ROUTER_HPP
