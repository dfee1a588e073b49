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

#include <cstdint>
#include <vector>

namespace geo {

// Hashes are stored at this precision and queried at a shorter one, so a
// query range prefix always matches the stored value.
constexpr int kStoragePrecision = 9;
constexpr int kMaxQueryPrecision = 6;
static_assert(kStoragePrecision > kMaxQueryPrecision, "storage precision must be finer than any query precision");

constexpr uint32_t kMaxCandidatesTotal = 2000;
constexpr uint32_t kPerRangeLimit = 200;
constexpr double kMaxRadiusMiles = 100.0;
constexpr int kMaxDateWindowDays = 30;

constexpr double kDefaultRadiusMiles = 25.0;
constexpr int kDefaultDateWindowDays = 30;

// Bounds on the cost of one search. The orchestrator enforces them.
struct SearchLimits {
  uint32_t max_candidates_total = kMaxCandidatesTotal;
  uint32_t per_range_limit = kPerRangeLimit;
  double max_radius_miles = kMaxRadiusMiles;
  int max_date_window_days = kMaxDateWindowDays;
};

struct CellSizeMiles {
  double width = 0;
  double height = 0;
};

struct PrecisionTier {
  double max_radius_miles;  // exclusive, infinite for the last tier
  int precision;
  CellSizeMiles cell;
};

/*
 * QueryPrecision picks the geohash length for a radius so that the 3x3 block
 * of cells (center plus 8 neighbors) spans at least twice the radius in the
 * common case:
 *
 *   radius < 1mi   -> 6  (~3mi coverage)
 *   radius < 5mi   -> 5  (~15mi coverage)
 *   radius < 50mi  -> 4  (~120mi coverage)
 *   radius < 150mi -> 3  (~450mi coverage)
 *   otherwise      -> 2
 *
 * A center close to the edge of its cell can still leave part of the circle
 * outside the 3x3 block, and those records are not returned.
 */
int QueryPrecision(double radius_miles);
int QueryPrecisionForMeters(double radius_meters);

// Approximate cell size at the equator; cells get narrower towards the poles.
CellSizeMiles ApproximateCellSizeMiles(int precision);

const std::vector<PrecisionTier> &PrecisionTiers();

}  // namespace geo
