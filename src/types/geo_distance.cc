/*
 * Licensed to the Apache Software Foundation (ASF) under one
 * or more contributor license agreements.  See the NOTICE file
 * distributed with this work for additional information
 * regarding copyright ownership.  The ASF licenses this file
 * to you under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in compliance
 * with the License.  You may obtain a copy of the License at
 *
 *   http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing,
 * software distributed under the License is distributed on an
 * "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY
 * KIND, either express or implied.  See the License for the
 * specific language governing permissions and limitations
 * under the License.
 *
 */

#include "geo_distance.h"

#include <algorithm>
#include <cmath>

#include "string_util.h"

namespace geo {

constexpr double D_R = M_PI / 180.0;

static inline double deg_rad(double ang) { return ang * D_R; }

double EarthRadius(DistanceUnit unit) {
  switch (unit) {
    case kDistanceMeter:
      return EARTH_RADIUS_IN_METERS;
    case kDistanceKilometers:
      return EARTH_RADIUS_IN_METERS / 1000;
    case kDistanceMiles:
      return EARTH_RADIUS_IN_MILES;
    case kDistanceFeet:
      return EARTH_RADIUS_IN_METERS / METERS_PER_FOOT;
  }
  return EARTH_RADIUS_IN_METERS;
}

double GetUnitConversion(DistanceUnit unit) {
  double conversion = 1;
  switch (unit) {
    case kDistanceMeter:
      conversion = 1;
      break;
    case kDistanceKilometers:
      conversion = 1000;
      break;
    case kDistanceFeet:
      conversion = METERS_PER_FOOT;
      break;
    case kDistanceMiles:
      conversion = METERS_PER_MILE;
      break;
  }
  return conversion;
}

StatusOr<DistanceUnit> ParseDistanceUnit(const std::string &unit) {
  auto lower = util::ToLower(unit);
  if (lower == "m") return kDistanceMeter;
  if (lower == "km") return kDistanceKilometers;
  if (lower == "mi") return kDistanceMiles;
  if (lower == "ft") return kDistanceFeet;
  return {Status::InvalidArgument, "unsupported unit provided. please use M, KM, FT, MI"};
}

const char *DistanceUnitName(DistanceUnit unit) {
  switch (unit) {
    case kDistanceMeter:
      return "m";
    case kDistanceKilometers:
      return "km";
    case kDistanceMiles:
      return "mi";
    case kDistanceFeet:
      return "ft";
  }
  return "m";
}

double AngularDistance(const GeoPoint &a, const GeoPoint &b) {
  double lat1r = deg_rad(a.latitude);
  double lat2r = deg_rad(b.latitude);
  double u = std::sin(deg_rad(b.latitude - a.latitude) / 2);
  double v = std::sin(deg_rad(b.longitude - a.longitude) / 2);

  double h = std::clamp(u * u + std::cos(lat1r) * std::cos(lat2r) * v * v, 0.0, 1.0);
  return 2.0 * std::atan2(std::sqrt(h), std::sqrt(1 - h));
}

double Haversine(const GeoPoint &a, const GeoPoint &b, DistanceUnit unit) {
  return EarthRadius(unit) * AngularDistance(a, b);
}

bool GetDistanceIfInRadius(const GeoPoint &a, const GeoPoint &b, double radius, DistanceUnit unit, double *distance) {
  *distance = Haversine(a, b, unit);
  return *distance <= radius;
}

}  // namespace geo
