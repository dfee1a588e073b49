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

#include "geohash.h"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <cmath>

#include "string_util.h"

namespace geo {

static inline int charIndex(char c) {
  auto pos = GEO_ALPHABET.find(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  return pos == std::string_view::npos ? -1 : static_cast<int>(pos);
}

static inline double normalizeLongitude(double longitude) {
  constexpr double span = GEO_LONG_MAX - GEO_LONG_MIN;
  while (longitude < GEO_LONG_MIN) longitude += span;
  while (longitude >= GEO_LONG_MAX) longitude -= span;
  return longitude;
}

static inline double clampLatitude(double latitude) { return std::clamp(latitude, GEO_LAT_MIN, GEO_LAT_MAX); }

bool GeoPoint::IsValid() const {
  return latitude >= GEO_LAT_MIN && latitude <= GEO_LAT_MAX && longitude >= GEO_LONG_MIN &&
         longitude <= GEO_LONG_MAX;
}

StatusOr<std::string> Encode(double latitude, double longitude, int precision) {
  if (precision < GEO_PRECISION_MIN || precision > GEO_PRECISION_MAX) {
    return {Status::InvalidArgument,
            fmt::format("geohash precision {} is out of range [{}, {}]", precision, GEO_PRECISION_MIN,
                        GEO_PRECISION_MAX)};
  }
  if (!GeoPoint(latitude, longitude).IsValid()) {
    return {Status::InvalidCoordinates, fmt::format("invalid latitude,longitude pair {},{}", latitude, longitude)};
  }

  GeoHashRange lat_range{GEO_LAT_MIN, GEO_LAT_MAX};
  GeoHashRange long_range{GEO_LONG_MIN, GEO_LONG_MAX};

  std::string hash;
  hash.reserve(precision);

  bool is_long = true;
  unsigned bits = 0;
  unsigned bit_count = 0;
  while (hash.size() < static_cast<size_t>(precision)) {
    GeoHashRange &range = is_long ? long_range : lat_range;
    double value = is_long ? longitude : latitude;
    double mid = range.Mid();

    bits <<= 1;
    if (value >= mid) {
      bits |= 1;
      range.min = mid;
    } else {
      range.max = mid;
    }
    is_long = !is_long;

    if (++bit_count == GEO_BITS_PER_CHAR) {
      hash.push_back(GEO_ALPHABET[bits]);
      bits = 0;
      bit_count = 0;
    }
  }
  return hash;
}

StatusOr<std::string> Encode(const GeoPoint &point, int precision) {
  return Encode(point.latitude, point.longitude, precision);
}

StatusOr<GeoArea> DecodeArea(std::string_view hash) {
  if (hash.empty() || hash.size() > GEO_PRECISION_MAX) {
    return {Status::InvalidArgument, fmt::format("geohash length {} is out of range [{}, {}]", hash.size(),
                                                 GEO_PRECISION_MIN, GEO_PRECISION_MAX)};
  }

  GeoArea area;
  area.latitude = {GEO_LAT_MIN, GEO_LAT_MAX};
  area.longitude = {GEO_LONG_MIN, GEO_LONG_MAX};

  bool is_long = true;
  for (char c : hash) {
    int idx = charIndex(c);
    if (idx < 0) {
      return {Status::InvalidArgument, fmt::format("invalid geohash character '{}' in '{}'", c, hash)};
    }

    for (int i = GEO_BITS_PER_CHAR - 1; i >= 0; i--) {
      GeoHashRange &range = is_long ? area.longitude : area.latitude;
      double mid = range.Mid();
      if ((idx >> i) & 1) {
        range.min = mid;
      } else {
        range.max = mid;
      }
      is_long = !is_long;
    }
  }
  return area;
}

StatusOr<GeoPoint> Decode(std::string_view hash) {
  auto area = GET_OR_RET(DecodeArea(hash));
  return area.Center();
}

bool IsValidHash(std::string_view hash) {
  if (hash.empty() || hash.size() > GEO_PRECISION_MAX) return false;
  return std::all_of(hash.begin(), hash.end(), [](char c) { return charIndex(c) >= 0; });
}

CellDegrees CellSize(int precision) {
  int total_bits = precision * GEO_BITS_PER_CHAR;
  int long_bits = (total_bits + 1) / 2;
  int lat_bits = total_bits / 2;

  CellDegrees cell;
  cell.lat = (GEO_LAT_MAX - GEO_LAT_MIN) / std::ldexp(1.0, lat_bits);
  cell.lng = (GEO_LONG_MAX - GEO_LONG_MIN) / std::ldexp(1.0, long_bits);
  return cell;
}

std::vector<std::string> Neighbors(std::string_view hash) {
  auto center = Decode(hash);
  if (!center) return {};

  int precision = static_cast<int>(hash.size());
  CellDegrees cell = CellSize(precision);
  std::string self = util::ToLower(std::string(hash));

  // {lat, lng} steps, indexed by GeoDirection
  const double offsets[][2] = {
      {1, 0},    // north
      {1, 1},    // north east
      {0, 1},    // east
      {-1, 1},   // south east
      {-1, 0},   // south
      {-1, -1},  // south west
      {0, -1},   // west
      {1, -1},   // north west
  };

  std::vector<std::string> neighbors;
  neighbors.reserve(GEOHASH_NORTH_WEST + 1);
  for (int dir = GEOHASH_NORTH; dir <= GEOHASH_NORTH_WEST; dir++) {
    double lat = clampLatitude(center->latitude + offsets[dir][0] * cell.lat);
    double lng = normalizeLongitude(center->longitude + offsets[dir][1] * cell.lng);

    auto neighbor = Encode(lat, lng, precision);
    if (!neighbor) continue;
    if (*neighbor == self) continue;
    if (std::find(neighbors.begin(), neighbors.end(), *neighbor) != neighbors.end()) continue;
    neighbors.emplace_back(std::move(*neighbor));
  }
  return neighbors;
}

std::vector<std::string> NeighborsWithCenter(std::string_view hash) {
  if (!IsValidHash(hash)) return {};

  auto cells = Neighbors(hash);
  cells.emplace_back(util::ToLower(std::string(hash)));
  std::sort(cells.begin(), cells.end());
  cells.erase(std::unique(cells.begin(), cells.end()), cells.end());
  return cells;
}

}  // namespace geo
