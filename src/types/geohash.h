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

#include <stddef.h>
#include <stdint.h>

#include <string>
#include <string_view>
#include <vector>

#include "status.h"

namespace geo {

constexpr uint8_t GEO_PRECISION_MIN = 1;
constexpr uint8_t GEO_PRECISION_MAX = 12;
constexpr uint8_t GEO_BITS_PER_CHAR = 5;

constexpr double GEO_LAT_MIN = -90;
constexpr double GEO_LAT_MAX = 90;
constexpr double GEO_LONG_MIN = -180;
constexpr double GEO_LONG_MAX = 180;

constexpr std::string_view GEO_ALPHABET = "0123456789bcdefghjkmnpqrstuvwxyz";

// Sorts after every character of the alphabet, so [hash, hash + sentinel)
// covers exactly the hashes that start with `hash`.
constexpr char GEO_RANGE_SENTINEL = '~';

struct GeoPoint {
  double latitude = 0;
  double longitude = 0;

  GeoPoint() = default;
  GeoPoint(double lat, double lng) : latitude(lat), longitude(lng) {}

  bool IsValid() const;
};

struct GeoHashRange {
  double min = 0;
  double max = 0;

  double Mid() const { return (min + max) / 2; }
};

struct GeoArea {
  GeoHashRange latitude;
  GeoHashRange longitude;

  GeoPoint Center() const { return {latitude.Mid(), longitude.Mid()}; }
};

struct CellDegrees {
  double lat = 0;
  double lng = 0;
};

enum GeoDirection {
  GEOHASH_NORTH = 0,
  GEOHASH_NORTH_EAST,
  GEOHASH_EAST,
  GEOHASH_SOUTH_EAST,
  GEOHASH_SOUTH,
  GEOHASH_SOUTH_WEST,
  GEOHASH_WEST,
  GEOHASH_NORTH_WEST,
};

/*
 * Encode bisects the longitude and latitude ranges alternately, longitude
 * first. Each step appends 1 if the value is in the upper half, else 0, and
 * every 5 bits become one character of GEO_ALPHABET, MSB first.
 *
 * Fails with InvalidArgument if precision is not in [1, 12] and with
 * InvalidCoordinates if the point is out of range.
 */
StatusOr<std::string> Encode(double latitude, double longitude, int precision);
StatusOr<std::string> Encode(const GeoPoint &point, int precision);

// DecodeArea replays the bisection and returns the bounds of the cell.
// Upper case input is accepted.
StatusOr<GeoArea> DecodeArea(std::string_view hash);

// Decode returns the center of the cell.
StatusOr<GeoPoint> Decode(std::string_view hash);

bool IsValidHash(std::string_view hash);

// CellSize gives the angular size of a cell, using the same bit split as
// Encode: longitude takes ceil(bits / 2), latitude floor(bits / 2).
CellDegrees CellSize(int precision);

// Neighbors returns the adjacent cells in compass order starting from north,
// without the input cell and without duplicates. Latitude is clamped at the
// poles and longitude wraps at the antimeridian, so polar cells have fewer
// than 8 neighbors.
std::vector<std::string> Neighbors(std::string_view hash);

// NeighborsWithCenter returns the sorted union of the cell and its neighbors.
std::vector<std::string> NeighborsWithCenter(std::string_view hash);

}  // namespace geo
