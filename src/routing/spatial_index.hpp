#ifndef SPATIAL_INDEX_HPP
#define SPATIAL_INDEX_HPP

#include "accumulation/entity_key.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

namespace routing {

using accumulation::GridpointKey;
using accumulation::RegionKey;

// Half-open index window [i_start, i_end) x [j_start, j_end)
struct GridRange {
  int32_t i_start = 0;
  int32_t i_end = 0;
  int32_t j_start = 0;
  int32_t j_end = 0;

  size_t ni() const { return i_end > i_start ? size_t(i_end - i_start) : 0; }
  size_t nj() const { return j_end > j_start ? size_t(j_end - j_start) : 0; }
  size_t cell_count() const { return ni() * nj(); }

  bool contains(const GridpointKey &gp) const {
    return gp.i >= i_start && gp.i < i_end && gp.j >= j_start && gp.j < j_end;
  }

  // Row-major offset of `gp` inside the window, j outer
  size_t offset_of(const GridpointKey &gp) const {
    return size_t(gp.j - j_start) * ni() + size_t(gp.i - i_start);
  }

  bool operator<(const GridRange &other) const {
    return std::tie(i_start, i_end, j_start, j_end) <
           std::tie(other.i_start, other.i_end, other.j_start, other.j_end);
  }
  bool operator==(const GridRange &other) const {
    return i_start == other.i_start && i_end == other.i_end &&
           j_start == other.j_start && j_end == other.j_end;
  }
};

struct GeoPoint {
  double lat = 0.0;
  double lon = 0.0;
};

/**
 * Read-only spatial lookups the router depends on. Geometry (polygon
 * containment, nearest-neighbour search) is resolved by whoever builds the
 * index, never during chunk processing.
 */
class SpatialIndex {
public:
  virtual ~SpatialIndex() = default;

  // Regions containing the gridpoint, at most one per region type
  virtual std::vector<RegionKey>
  regions_for(const GridpointKey &gridpoint) const = 0;

  virtual std::optional<GridpointKey>
  nearest_gridpoint(const std::string &station_id) const = 0;

  virtual std::optional<GeoPoint>
  gridpoint_location(const GridpointKey &gridpoint) const = 0;
};

/**
 * In-memory index filled once from precomputed assignments and then shared
 * read-only (as shared_ptr<const>) by every worker.
 */
class StaticSpatialIndex : public SpatialIndex {
public:
  void set_location(const GridpointKey &gridpoint, GeoPoint location);

  // Throws core::ConfigurationError when the gridpoint already belongs to
  // another region of the same type.
  void assign_region(const GridpointKey &gridpoint, const RegionKey &region);

  void map_station(const std::string &station_id,
                   const GridpointKey &gridpoint);

  std::vector<RegionKey>
  regions_for(const GridpointKey &gridpoint) const override;
  std::optional<GridpointKey>
  nearest_gridpoint(const std::string &station_id) const override;
  std::optional<GeoPoint>
  gridpoint_location(const GridpointKey &gridpoint) const override;

  std::vector<GridpointKey> gridpoints_for(const RegionKey &region) const;
  std::vector<RegionKey> regions() const;
  size_t station_count() const { return station_to_gridpoint_.size(); }

private:
  std::map<GridpointKey, GeoPoint> locations_;
  std::map<GridpointKey, std::map<std::string, RegionKey>> gridpoint_regions_;
  std::map<RegionKey, std::vector<GridpointKey>> region_gridpoints_;
  std::map<std::string, GridpointKey> station_to_gridpoint_;
};

} // namespace routing

#endif // SPATIAL_INDEX_HPP
