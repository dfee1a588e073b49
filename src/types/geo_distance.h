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

#pragma once

#include <string>

#include "geohash.h"
#include "status.h"

namespace geo {

enum DistanceUnit {
  kDistanceMeter,
  kDistanceKilometers,
  kDistanceMiles,
  kDistanceFeet,
};

constexpr double EARTH_RADIUS_IN_METERS = 6371000.0;
constexpr double EARTH_RADIUS_IN_MILES = 3958.8;
constexpr double METERS_PER_MILE = 1609.344;
constexpr double METERS_PER_FOOT = 0.3048;

// Earth's radius expressed in the given unit
double EarthRadius(DistanceUnit unit);

// Meters in one unit
double GetUnitConversion(DistanceUnit unit);

inline double MilesToMeters(double miles) { return miles * METERS_PER_MILE; }
inline double MetersToMiles(double meters) { return meters / METERS_PER_MILE; }

StatusOr<DistanceUnit> ParseDistanceUnit(const std::string &unit);
const char *DistanceUnitName(DistanceUnit unit);

/* Central angle in radians between two points, computed with the haversine
 * formula. The haversine term is clamped to [0, 1] so that rounding near
 * coincident or antipodal points can not produce NaN. */
double AngularDistance(const GeoPoint &a, const GeoPoint &b);

double Haversine(const GeoPoint &a, const GeoPoint &b, DistanceUnit unit);
inline double HaversineMiles(const GeoPoint &a, const GeoPoint &b) { return Haversine(a, b, kDistanceMiles); }
inline double HaversineMeters(const GeoPoint &a, const GeoPoint &b) { return Haversine(a, b, kDistanceMeter); }

// Returns true and fills *distance (in unit) if b is within radius of a
bool GetDistanceIfInRadius(const GeoPoint &a, const GeoPoint &b, double radius, DistanceUnit unit, double *distance);

}  // namespace geo
