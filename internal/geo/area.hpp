#pragma once

#include <memory>
#include <string>

#include "internal/geo/envelope.hpp"

class OGRGeometry;

namespace lidar::geo {

/*
  Validated polygon (or multipolygon) parsed from WKT.

  Immutable and cheap to copy. Coordinates are taken as given; all footprints
  and request areas share one reference system (EPSG:4326 by default).
*/
class Area {
 public:
  // Throws util::ValidationError on empty, unparsable, non-polygonal or
  // invalid (e.g. self-intersecting) geometry.
  static Area FromWkt(const std::string& wkt);

  const std::string& Wkt() const {
    return wkt_;
  }

  const Envelope& GetEnvelope() const {
    return envelope_;
  }

  bool Intersects(const Area& other) const;

  // Rectangle helper used by seeding and tests.
  static Area FromEnvelope(const Envelope& envelope);

 private:
  Area(std::shared_ptr<const OGRGeometry> geometry, std::string wkt, Envelope envelope);

  std::shared_ptr<const OGRGeometry> geometry_;
  std::string                        wkt_;
  Envelope                           envelope_;
};

} // namespace lidar::geo
