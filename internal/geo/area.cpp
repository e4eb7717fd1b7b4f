#include "internal/geo/area.hpp"

#include <ogr_geometry.h>

#include <cstdio>
#include <utility>

#include "internal/util/errors.hpp"

namespace lidar::geo {

Area::Area(std::shared_ptr<const OGRGeometry> geometry, std::string wkt, Envelope envelope)
    : geometry_(std::move(geometry)), wkt_(std::move(wkt)), envelope_(envelope) {
}

Area Area::FromWkt(const std::string& wkt) {
  if (wkt.find_first_not_of(" \t\r\n") == std::string::npos) {
    throw util::ValidationError("area geometry is empty");
  }

  OGRGeometry* raw = nullptr;
  const OGRErr err = OGRGeometryFactory::createFromWkt(wkt.c_str(), nullptr, &raw);
  OGRGeometryUniquePtr geometry(raw);
  if (err != OGRERR_NONE || !geometry) {
    throw util::ValidationError("area geometry is not valid WKT");
  }

  const auto type = wkbFlatten(geometry->getGeometryType());
  if (type != wkbPolygon && type != wkbMultiPolygon) {
    throw util::ValidationError(std::string("area geometry must be a polygon, got ") + geometry->getGeometryName());
  }
  if (geometry->IsEmpty()) {
    throw util::ValidationError("area geometry is empty");
  }
  if (!geometry->IsValid()) {
    throw util::ValidationError("area geometry is invalid (self-intersecting or malformed ring)");
  }

  OGREnvelope ogr_envelope;
  geometry->getEnvelope(&ogr_envelope);
  Envelope envelope{ogr_envelope.MinX, ogr_envelope.MinY, ogr_envelope.MaxX, ogr_envelope.MaxY};

  return Area(std::shared_ptr<const OGRGeometry>(geometry.release(), OGRGeometryUniquePtrDeleter()), wkt, envelope);
}

Area Area::FromEnvelope(const Envelope& e) {
  char buffer[256];
  std::snprintf(buffer, sizeof(buffer), "POLYGON((%.9g %.9g, %.9g %.9g, %.9g %.9g, %.9g %.9g, %.9g %.9g))", e.min_x, e.min_y, e.max_x, e.min_y,
                e.max_x, e.max_y, e.min_x, e.max_y, e.min_x, e.min_y);
  return FromWkt(buffer);
}

bool Area::Intersects(const Area& other) const {
  if (!envelope_.Intersects(other.envelope_)) {
    return false;
  }
  return geometry_->Intersects(other.geometry_.get());
}

} // namespace lidar::geo
