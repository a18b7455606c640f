#include "chunk_router.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"

#include <utility>

namespace routing {

ChunkRouter::ChunkRouter(std::shared_ptr<const SpatialIndex> index)
    : index_(std::move(index)) {
  if (!index_)
    throw core::ConfigurationError("chunk router needs a spatial index");
}

std::shared_ptr<const RoutePlan>
ChunkRouter::route(const GridRange &range) const {
  {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    auto it = plan_cache_.find(range);
    if (it != plan_cache_.end())
      return it->second;
  }

  // Built outside the lock; two threads racing on the same window produce
  // identical plans and the first one wins.
  std::shared_ptr<const RoutePlan> plan = build_plan(range);

  std::lock_guard<std::mutex> lock(cache_mutex_);
  auto inserted = plan_cache_.emplace(range, plan);
  return inserted.first->second;
}

std::shared_ptr<RoutePlan> ChunkRouter::build_plan(const GridRange &range) const {
  auto plan = std::make_shared<RoutePlan>();
  plan->range = range;
  plan->gridpoints.reserve(range.cell_count());

  for (int32_t j = range.j_start; j < range.j_end; ++j) {
    for (int32_t i = range.i_start; i < range.i_end; ++i) {
      GridpointKey gp{i, j};
      const size_t index = plan->gridpoints.size();
      plan->gridpoints.push_back({gp, gridpoint_entity(gp), range.offset_of(gp)});
      for (const auto &region : index_->regions_for(gp))
        plan->region_members[region].push_back(index);
    }
  }

  LOG(LogLevel::DEBUG, LogComponent::ROUTING,
      "Routed window i[" << range.i_start << "," << range.i_end << ") j["
                         << range.j_start << "," << range.j_end << ") to "
                         << plan->gridpoints.size() << " gridpoints and "
                         << plan->region_members.size() << " regions");
  return plan;
}

std::optional<GridpointKey>
ChunkRouter::route_station(const std::string &station_id) const {
  return index_->nearest_gridpoint(station_id);
}

accumulation::EntityKey
ChunkRouter::gridpoint_entity(const GridpointKey &gridpoint) const {
  GeoPoint location = index_->gridpoint_location(gridpoint).value_or(GeoPoint{});
  return accumulation::EntityKey::gridpoint(gridpoint.i, gridpoint.j,
                                            location.lat, location.lon);
}

size_t ChunkRouter::cached_plan_count() const {
  std::lock_guard<std::mutex> lock(cache_mutex_);
  return plan_cache_.size();
}

} // namespace routing
