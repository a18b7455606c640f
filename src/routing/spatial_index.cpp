#include "spatial_index.hpp"
#include "core/errors.hpp"

namespace routing {

void StaticSpatialIndex::set_location(const GridpointKey &gridpoint,
                                      GeoPoint location) {
  locations_[gridpoint] = location;
}

void StaticSpatialIndex::assign_region(const GridpointKey &gridpoint,
                                       const RegionKey &region) {
  auto &by_type = gridpoint_regions_[gridpoint];
  auto it = by_type.find(region.region_type);
  if (it != by_type.end()) {
    if (it->second == region)
      return;
    throw core::ConfigurationError(
        "gridpoint (" + std::to_string(gridpoint.i) + "," +
        std::to_string(gridpoint.j) + ") already in " +
        it->second.region_type + "/" + it->second.region_id +
        ", cannot also assign " + region.region_id);
  }
  by_type.emplace(region.region_type, region);
  region_gridpoints_[region].push_back(gridpoint);
}

void StaticSpatialIndex::map_station(const std::string &station_id,
                                     const GridpointKey &gridpoint) {
  station_to_gridpoint_[station_id] = gridpoint;
}

std::vector<RegionKey>
StaticSpatialIndex::regions_for(const GridpointKey &gridpoint) const {
  std::vector<RegionKey> result;
  auto it = gridpoint_regions_.find(gridpoint);
  if (it == gridpoint_regions_.end())
    return result;
  result.reserve(it->second.size());
  for (const auto &entry : it->second)
    result.push_back(entry.second);
  return result;
}

std::optional<GridpointKey>
StaticSpatialIndex::nearest_gridpoint(const std::string &station_id) const {
  auto it = station_to_gridpoint_.find(station_id);
  if (it == station_to_gridpoint_.end())
    return std::nullopt;
  return it->second;
}

std::optional<GeoPoint>
StaticSpatialIndex::gridpoint_location(const GridpointKey &gridpoint) const {
  auto it = locations_.find(gridpoint);
  if (it == locations_.end())
    return std::nullopt;
  return it->second;
}

std::vector<GridpointKey>
StaticSpatialIndex::gridpoints_for(const RegionKey &region) const {
  auto it = region_gridpoints_.find(region);
  if (it == region_gridpoints_.end())
    return {};
  return it->second;
}

std::vector<RegionKey> StaticSpatialIndex::regions() const {
  std::vector<RegionKey> result;
  result.reserve(region_gridpoints_.size());
  for (const auto &entry : region_gridpoints_)
    result.push_back(entry.first);
  return result;
}

} // namespace routing
